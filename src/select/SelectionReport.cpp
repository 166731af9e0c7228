//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/SelectionReport.cpp
// Purpose: Counting and formatting for selection summaries.
//
//===----------------------------------------------------------------------===//

#include "select/SelectionReport.hpp"

#include <iomanip>
#include <sstream>

namespace talus::select
{

void SelectionReport::add(const OutcomeRecord &record)
{
    ++blocks_;
    if (record.state == SelectionState::Selected)
        ++wins_;
    ++reasons_[static_cast<size_t>(record.reason)];
    baselineCost_ += record.baselineCost;
    chosenCost_ += record.chosenCost;
}

double SelectionReport::improvementPct() const
{
    if (baselineCost_ == 0)
        return 0.0;
    return (1.0 - static_cast<double>(chosenCost_) / static_cast<double>(baselineCost_)) * 100.0;
}

double SelectionReport::fallbackRate() const
{
    if (blocks_ == 0)
        return 0.0;
    return static_cast<double>(blocks_ - wins_) / static_cast<double>(blocks_);
}

std::string SelectionReport::formatReport() const
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(1);
    os << "Selection report: " << wins_ << "/" << blocks_ << " blocks improved\n";
    os << "  cost: " << chosenCost_ << " (baseline: " << baselineCost_
       << ", saved: " << improvementPct() << "%)\n";
    os << "  fallback rate: " << fallbackRate() * 100.0 << "%\n";
    for (size_t r = 0; r < kNumDecisionReasons; ++r)
    {
        if (reasons_[r] == 0)
            continue;
        os << "  " << std::left << std::setw(18) << toString(static_cast<DecisionReason>(r))
           << std::right << reasons_[r] << "\n";
    }
    return os.str();
}

ReplayStats computeReplayStats(const std::vector<OutcomeRecord> &records)
{
    ReplayStats stats;
    stats.records = records.size();
    if (records.empty())
        return stats;

    size_t verified = 0;
    size_t improved = 0;
    size_t fallback = 0;
    for (const auto &r : records)
    {
        if (r.verified)
        {
            ++verified;
            if (r.chosenCost < r.baselineCost)
                ++improved;
        }
        if (r.state == SelectionState::Fallback)
            ++fallback;
    }
    const double total = static_cast<double>(records.size());
    stats.validityRate = static_cast<double>(verified) / total;
    stats.improvementRate = verified == 0 ? 0.0 : static_cast<double>(improved) / verified;
    stats.fallbackRate = static_cast<double>(fallback) / total;
    return stats;
}

} // namespace talus::select
