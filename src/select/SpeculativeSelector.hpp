//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/SpeculativeSelector.hpp
// Purpose: Chooses between the baseline lowering and verified generator
//          candidates for one basic block.
// Key invariants: The chosen sequence is either the caller's baseline or a
//                 candidate that verified against the same block, and its
//                 cost never exceeds the baseline cost.
// Ownership/Lifetime: Borrows the oracle, pool, trace sink and cache, which
//                     must outlive the selector; shares ownership of the
//                     verifier with in-flight verification tasks.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "encode/BlockEncoder.hpp"
#include "gen/CandidateGenerator.hpp"
#include "ir/BasicBlock.hpp"
#include "select/OutcomeRecord.hpp"
#include "support/diag_expected.hpp"
#include "support/trace.hpp"
#include "tasm/CostModel.hpp"
#include "verify/VerificationPool.hpp"
#include "verify/Verifier.hpp"

#include <chrono>
#include <cstddef>
#include <memory>

namespace talus::select
{

class VerdictCache;

/// @brief Per-block selection limits.
struct SelectorConfig
{
    /// @brief Candidates requested from the generator (K).
    size_t candidatesPerBlock = 32;

    /// @brief Wait per candidate verification, applied with or without a
    ///        pool; zero waits indefinitely.
    std::chrono::milliseconds verifyTimeout{0};

    /// @brief Wall-clock cap on candidate generation; zero means no cap.
    std::chrono::milliseconds generationBudget{0};
};

/// @brief Classify a win by comparing the chosen and baseline profiles.
/// @details CliffJump is checked first: the tallest table is unchanged and the
///          cost fell by more than its height did, so the trim crossed a
///          power-of-two boundary. TableRebalance when the tallest table
///          changed; StackScheduling for any other win.
DecisionReason classifyWin(const tasm::CostProfile &baseline, const tasm::CostProfile &chosen);

class SpeculativeSelector
{
  public:
    /// @param pool Optional; checks run inline on the caller when null.
    /// @param trace Optional sink for decision and candidate lines.
    /// @param cache Optional verdict memo shared across calls.
    SpeculativeSelector(const tasm::CostOracle &oracle,
                        std::shared_ptr<const verify::EquivalenceVerifier> verifier,
                        SelectorConfig config,
                        verify::VerificationPool *pool = nullptr,
                        support::TraceSink *trace = nullptr,
                        VerdictCache *cache = nullptr);

    /// @brief Encode @p block and run the selection.
    /// @return The encoder's diagnostic when the block cannot be encoded.
    support::Expected<OutcomeRecord> select(const ir::BasicBlock &block,
                                            const tasm::InstrSeq &baseline,
                                            const ir::MachineState &state,
                                            std::shared_ptr<const gen::CandidateGenerator> generator) const;

    /// @brief Selection core over an already encoded block.
    /// @pre @p tensor encodes @p block.
    OutcomeRecord selectEncoded(const ir::BasicBlock &block,
                                const encode::FeatureTensor &tensor,
                                const tasm::InstrSeq &baseline,
                                std::shared_ptr<const gen::CandidateGenerator> generator) const;

    const SelectorConfig &config() const
    {
        return config_;
    }

  private:
    verify::Verdict check(const ir::BasicBlock &block,
                          uint64_t blockDigest,
                          const tasm::InstrSeq &instrs) const;

    const tasm::CostOracle &oracle_;
    std::shared_ptr<const verify::EquivalenceVerifier> verifier_;
    SelectorConfig config_;
    verify::VerificationPool *pool_;
    support::TraceSink *trace_;
    VerdictCache *cache_;
};

} // namespace talus::select
