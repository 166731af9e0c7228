//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/talus/Training.hpp
// Purpose: Stable façade exposing offline training and checkpoint storage.
// Key invariants: Mirrors train::TrainingWorker and checkpoint::CheckpointStore.
// Ownership/Lifetime: Callers own stores, logs and generator handles.
// Links: DESIGN.md
#pragma once

#include "checkpoint/CheckpointStore.hpp"
#include "train/TrainingWorker.hpp"

/// @file include/talus/Training.hpp
/// @brief Public forwarding header for the background trainer.
