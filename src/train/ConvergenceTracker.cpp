//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: train/ConvergenceTracker.cpp
// Purpose: Window bookkeeping and the plateau test.
//
//===----------------------------------------------------------------------===//

#include "train/ConvergenceTracker.hpp"

#include <algorithm>

namespace talus::train
{

const char *toString(TrainingStatus status)
{
    switch (status)
    {
        case TrainingStatus::Improving:
            return "improving";
        case TrainingStatus::Plateaued:
            return "plateaued";
        case TrainingStatus::Converged:
            return "converged";
    }
    return "";
}

ConvergenceTracker::ConvergenceTracker(size_t window, int64_t thresholdPermille,
                                       uint32_t plateauLimit)
    : window_(std::max<size_t>(window, 2)), thresholdPermille_(thresholdPermille),
      plateauLimit_(plateauLimit)
{
}

TrainingStatus ConvergenceTracker::record(int64_t bestFitness)
{
    history_.push_back(bestFitness);
    if (history_.size() > window_)
        history_.pop_front();
    if (history_.size() < window_)
        return status_ = TrainingStatus::Improving;

    // Fitness is a negated cost, so the magnitude of the oldest value is the
    // cost the window started from.
    const int64_t oldest = history_.front();
    const int64_t gain = history_.back() - oldest;
    const int64_t scale = oldest < 0 ? -oldest : oldest;
    const bool stalled = gain <= 0 || (scale > 0 && gain * 1000 < scale * thresholdPermille_);

    if (!stalled)
    {
        plateaus_ = 0;
        return status_ = TrainingStatus::Improving;
    }
    ++plateaus_;
    status_ = plateaus_ >= plateauLimit_ ? TrainingStatus::Converged : TrainingStatus::Plateaued;
    return status_;
}

} // namespace talus::train
