//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: train/PopulationTrainer.hpp
// Purpose: One offline training session: evolve a population on recent
//          replay records and promote the winner only if it beats the active
//          parameters on held-out records.
// Key invariants: Promotion is save, then setActive, then a handle swap; a
//                 cancelled or non-improving session leaves the store's
//                 active pointer and the live generator untouched.
// Ownership/Lifetime: Borrows the store, the live handle and the trace sink.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "checkpoint/CheckpointStore.hpp"
#include "gen/CandidateGenerator.hpp"
#include "select/OutcomeRecord.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"
#include "support/snapshot_handle.hpp"
#include "support/trace.hpp"
#include "tasm/CostModel.hpp"
#include "train/ConvergenceTracker.hpp"
#include "train/FitnessEvaluator.hpp"
#include "verify/Verifier.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace talus::train
{

/// @brief Summary of one session.
struct SessionResult
{
    bool promoted = false;
    bool cancelled = false;
    std::string parentHash;   ///< Active hash the session started from; empty for defaults.
    std::string promotedHash; ///< Set only when promoted.
    uint64_t generations = 0;
    int64_t bestFitness = 0;
    int64_t bestValidationFitness = 0;
    int64_t activeValidationFitness = 0;
    TrainingStatus status = TrainingStatus::Improving;
};

/// @brief Split of usable samples into a training and a validation batch.
struct SampleSplit
{
    std::vector<TrainingSample> training;
    std::vector<TrainingSample> validation;
};

/// @brief Hold out the most recent samples for validation.
/// @details At most half the samples are held out so the training batch is
///          never empty; the training batch keeps the @p batchSize samples
///          immediately before the validation batch.
SampleSplit splitSamples(std::vector<TrainingSample> samples, size_t batchSize, size_t validationSize);

class PopulationTrainer
{
  public:
    using GeneratorHandle = support::SnapshotHandle<gen::CandidateGenerator>;

    /// @param live Handle swapped on promotion; may be null.
    PopulationTrainer(checkpoint::CheckpointStore &store,
                      const support::Options &opts,
                      std::shared_ptr<const verify::EquivalenceVerifier> verifier,
                      GeneratorHandle *live = nullptr,
                      support::TraceSink *trace = nullptr);

    /// @brief Train on @p records, checking @p cancel before each generation.
    /// @return "no-training-data" when fewer than two records decode; store
    ///         errors other than a missing ACTIVE pointer are passed through.
    support::Expected<SessionResult> run(const std::vector<select::OutcomeRecord> &records,
                                         const std::atomic<bool> &cancel);

  private:
    support::Expected<void> promote(const gen::GeneratorParams &best, SessionResult &result);

    checkpoint::CheckpointStore &store_;
    support::Options opts_;
    std::shared_ptr<const verify::EquivalenceVerifier> verifier_;
    GeneratorHandle *live_;
    support::TraceSink *trace_;
    tasm::CostOracle oracle_;
};

} // namespace talus::train
