//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: verify/DifferentialVerifier.hpp
// Purpose: Reference verifier comparing the block interpreter against the
//          stack machine on seeded random inputs.
// Key invariants: Guard words placed beneath the inputs must survive every
//                 trial unchanged; a trial where both sides fail agrees.
// Ownership/Lifetime: Immutable after construction; safe to share.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "verify/Verifier.hpp"

#include <cstdint>

namespace talus::verify
{

/// @brief Number of guard words beneath the block inputs.
constexpr uint32_t kGuardWords = 3;

class DifferentialVerifier final : public EquivalenceVerifier
{
  public:
    explicit DifferentialVerifier(uint64_t seed = 0, uint32_t trials = 16)
        : seed_(seed), trials_(trials)
    {
    }

    /// @brief Verified when every trial agrees and at least one trial ran the
    ///        block to completion; Inconclusive when every trial failed on
    ///        both sides; Refuted on the first disagreement.
    Verdict verify(const ir::BasicBlock &block, const tasm::InstrSeq &instrs) const override;

    uint32_t trials() const
    {
        return trials_;
    }

  private:
    uint64_t seed_;
    uint32_t trials_;
};

} // namespace talus::verify
