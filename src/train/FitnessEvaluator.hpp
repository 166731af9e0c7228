//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: train/FitnessEvaluator.hpp
// Purpose: Score parameter vectors by replaying recorded blocks through the
//          selection core.
// Key invariants: Fitness is -sum(chosen cost) over the batch, so it can
//                 never beat the sum of verified candidate costs; verdicts
//                 are shared across members through one cache.
// Ownership/Lifetime: Borrows the oracle; owns its verdict cache.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "encode/BlockEncoder.hpp"
#include "gen/GeneratorParams.hpp"
#include "ir/BasicBlock.hpp"
#include "select/OutcomeRecord.hpp"
#include "select/SpeculativeSelector.hpp"
#include "select/VerdictCache.hpp"
#include "tasm/CostModel.hpp"
#include "tasm/Instr.hpp"
#include "verify/Verifier.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace talus::train
{

/// @brief One recorded block ready for replay.
struct TrainingSample
{
    ir::BasicBlock block;
    encode::FeatureTensor tensor{};
    tasm::InstrSeq baseline;
};

/// @brief Turn outcome records back into replayable samples.
/// @details Records whose tensor no longer decodes are skipped.
std::vector<TrainingSample> samplesFromRecords(const std::vector<select::OutcomeRecord> &records);

class FitnessEvaluator
{
  public:
    /// @param candidatesPerBlock K used while replaying.
    /// @param seed Seed of the generators built for each member.
    /// @param verifyTimeout Per-candidate verification wait; zero waits indefinitely.
    FitnessEvaluator(const tasm::CostOracle &oracle,
                     std::shared_ptr<const verify::EquivalenceVerifier> verifier,
                     size_t candidatesPerBlock,
                     uint64_t seed,
                     std::chrono::milliseconds verifyTimeout = std::chrono::milliseconds(0));

    /// @brief Fitness of @p params over @p batch.
    int64_t fitness(const gen::GeneratorParams &params, const std::vector<TrainingSample> &batch) const;

    /// @brief Score every entry of @p params on up to @p threads threads.
    /// @param threads Zero selects the hardware concurrency.
    std::vector<int64_t> fitnessAll(const std::vector<gen::GeneratorParams> &params,
                                    const std::vector<TrainingSample> &batch,
                                    size_t threads) const;

    const select::VerdictCache &cache() const
    {
        return cache_;
    }

  private:
    uint64_t seed_;
    mutable select::VerdictCache cache_;
    select::SpeculativeSelector selector_;
};

} // namespace talus::train
