//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/SelectionReport.hpp
// Purpose: Aggregate views over outcome records: a per-run report and the
//          replay-log health statistics.
// Key invariants: Totals only ever grow; rates are zero over an empty set.
// Ownership/Lifetime: Value types.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "select/OutcomeRecord.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace talus::select
{

/// @brief Running summary of the decisions made in one compilation.
class SelectionReport
{
  public:
    void add(const OutcomeRecord &record);

    size_t blocks() const
    {
        return blocks_;
    }

    /// @brief Blocks that ended with a verified candidate.
    size_t wins() const
    {
        return wins_;
    }

    size_t count(DecisionReason reason) const
    {
        return reasons_[static_cast<size_t>(reason)];
    }

    uint64_t totalBaselineCost() const
    {
        return baselineCost_;
    }

    uint64_t totalChosenCost() const
    {
        return chosenCost_;
    }

    /// @brief Percentage of baseline cost saved across all blocks.
    double improvementPct() const;

    /// @brief Fraction of blocks that fell back to the baseline.
    double fallbackRate() const;

    /// @brief Multi-line human readable summary.
    std::string formatReport() const;

  private:
    size_t blocks_ = 0;
    size_t wins_ = 0;
    uint64_t baselineCost_ = 0;
    uint64_t chosenCost_ = 0;
    std::array<size_t, kNumDecisionReasons> reasons_{};
};

/// @brief Health of the optimizer as seen through a replay log.
struct ReplayStats
{
    size_t records = 0;
    double validityRate = 0.0;    ///< Verified records over all records.
    double improvementRate = 0.0; ///< Strictly cheaper among verified records.
    double fallbackRate = 0.0;    ///< Fallback records over all records.
};

ReplayStats computeReplayStats(const std::vector<OutcomeRecord> &records);

} // namespace talus::select
