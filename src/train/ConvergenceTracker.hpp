//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: train/ConvergenceTracker.hpp
// Purpose: Classify training progress from a sliding window of
//          generation-best fitness values.
// Key invariants: Until the window fills the status is Improving.
// Ownership/Lifetime: Value type.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace talus::train
{

enum class TrainingStatus
{
    Improving,
    Plateaued,
    Converged
};

const char *toString(TrainingStatus status);

class ConvergenceTracker
{
  public:
    /// @param window Generations compared end to end.
    /// @param thresholdPermille Relative gain over the window, in thousandths,
    ///        below which the window counts as a plateau.
    /// @param plateauLimit Consecutive plateaus before Converged.
    explicit ConvergenceTracker(size_t window = 50, int64_t thresholdPermille = 1,
                                uint32_t plateauLimit = 3);

    /// @brief Record the best fitness of one generation.
    TrainingStatus record(int64_t bestFitness);

    TrainingStatus status() const
    {
        return status_;
    }

  private:
    size_t window_;
    int64_t thresholdPermille_;
    uint32_t plateauLimit_;
    uint32_t plateaus_ = 0;
    std::deque<int64_t> history_;
    TrainingStatus status_ = TrainingStatus::Improving;
};

} // namespace talus::train
