//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/talus/Optimizer.hpp
// Purpose: Stable façade exposing the block optimizer entry point.
// Key invariants: Mirrors select::Optimizer public API only.
// Ownership/Lifetime: Callers own blocks, baselines and returned sequences.
// Links: DESIGN.md
#pragma once

#include "select/Optimizer.hpp"

/// @file include/talus/Optimizer.hpp
/// @brief Public forwarding header so downstream compilers can call
///        Optimizer::optimize without including src/select paths.
