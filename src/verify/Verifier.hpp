//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: verify/Verifier.hpp
// Purpose: Interface of the equivalence checker consulted before a candidate
//          may replace the baseline.
// Key invariants: Only Verified permits a replacement.
// Ownership/Lifetime: Implementations must be safe to call concurrently.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/BasicBlock.hpp"
#include "tasm/Instr.hpp"

namespace talus::verify
{

/// @brief Outcome of one equivalence check.
enum class Verdict
{
    Verified,
    Refuted,
    Inconclusive,
    Timeout
};

const char *toString(Verdict v);

/// @brief Decides whether a sequence implements a block.
class EquivalenceVerifier
{
  public:
    virtual ~EquivalenceVerifier() = default;

    /// @brief Check @p instrs against the meaning of @p block.
    virtual Verdict verify(const ir::BasicBlock &block, const tasm::InstrSeq &instrs) const = 0;
};

} // namespace talus::verify
