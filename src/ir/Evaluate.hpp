//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Evaluate.hpp
// Purpose: Reference interpreter defining the meaning of a block.
// Key invariants: Nodes execute in index order; the first failing node stops
//                 evaluation and no partial result is returned.
// Ownership/Lifetime: Results are returned by value.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "field/Goldilocks.hpp"
#include "ir/BasicBlock.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace talus::ir
{

/// @brief Observable effect of running a block.
struct EvalResult
{
    std::vector<field::Goldilocks> outputs;  ///< Output values, first output first.
    std::vector<field::Goldilocks> ioWrites; ///< Words written to public output.
    size_t ioReads = 0;                      ///< Public input words consumed.
};

/// @brief Apply the operator of a computing node to concrete operands.
/// @return Empty when the operation fails (u32 domain, inverse of zero).
/// @pre @p kind is one of the pure or u32 computing kinds.
std::optional<field::Goldilocks> evalOp(NodeKind kind, field::Goldilocks lhs,
                                        field::Goldilocks rhs = {});

/// @brief Run @p block.
/// @param inputs Entry inputs; inputs[0] is slot 0 (top of stack).
/// @param ioIn Public input words available to read_io nodes.
/// @return "execution-error" naming the failing node on failure.
support::Expected<EvalResult> evaluate(const BasicBlock &block,
                                       std::span<const field::Goldilocks> inputs,
                                       std::span<const field::Goldilocks> ioIn = {});

} // namespace talus::ir
