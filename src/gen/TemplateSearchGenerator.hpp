//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: gen/TemplateSearchGenerator.hpp
// Purpose: Learned template search: scores scheduler knobs from a block
//          summary and lowers the most promising knob subsets.
// Key invariants: At most 256 schedules are attempted per call; ranking ties
//                 are broken by a seed-keyed hash, never by iteration order.
// Ownership/Lifetime: Owns a copy of its parameters.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "gen/CandidateGenerator.hpp"
#include "gen/GeneratorParams.hpp"
#include "gen/StackScheduler.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace talus::gen
{

/// @brief Number of knob subsets.
constexpr size_t kNumKnobSubsets = size_t{1} << kNumKnobs;

/// @name Summary feature positions after the per-kind counts.
/// @{
constexpr size_t kSummaryInputs = 16;
constexpr size_t kSummaryOutputs = 17;
constexpr size_t kSummaryNodes = 18;
constexpr size_t kSummaryMaxLiveSpan = 19;
constexpr size_t kSummaryOccupancy = 20;
constexpr size_t kSummaryLiveSlots = 21;
/// @}

/// @brief Integer-valued summary of an encoded block.
Summary summarize(const encode::FeatureTensor &tensor);

/// @brief A knob subset with its distance from the preferred set.
struct RankedSubset
{
    KnobSet knobs = kNoKnobs;
    int64_t distance = 0; ///< Scaled fixed-point margin distance.
    uint64_t tie = 0;     ///< Seed-keyed tie breaker.
};

class TemplateSearchGenerator final : public CandidateGenerator
{
  public:
    explicit TemplateSearchGenerator(GeneratorParams params, uint64_t seed = 0);

    std::vector<Candidate> propose(const encode::FeatureTensor &tensor, size_t k) const override;

    std::string version() const override
    {
        return version_;
    }

    const GeneratorParams &params() const
    {
        return params_;
    }

    /// @brief Knobs whose score is strictly positive for @p summary.
    KnobSet preferred(const Summary &summary) const;

    /// @brief All knob subsets in the order propose() tries them.
    std::vector<RankedSubset> rankSubsets(const Summary &summary) const;

  private:
    GeneratorParams params_;
    uint64_t seed_;
    std::string version_;
};

} // namespace talus::gen
