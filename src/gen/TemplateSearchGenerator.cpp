//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: gen/TemplateSearchGenerator.cpp
// Purpose: Block summarisation, knob ranking and candidate lowering.
//
//===----------------------------------------------------------------------===//

#include "gen/TemplateSearchGenerator.hpp"

#include "support/hash.hpp"

#include <algorithm>
#include <utility>

namespace talus::gen
{
using encode::FeatureTensor;
using field::Fixed;

namespace
{
int64_t magnitude(Fixed f)
{
    const int64_t s = f.toScaled();
    return s < 0 ? -s : s;
}
} // namespace

Summary summarize(const FeatureTensor &t)
{
    Summary s{};
    const size_t nodes = static_cast<size_t>(t[0].toScaled() / static_cast<int64_t>(field::kScale));
    const size_t n = nodes < ir::kMaxNodes ? nodes : ir::kMaxNodes;

    int64_t maxSpan = 0;
    for (size_t i = 0; i < n; ++i)
    {
        const size_t base = encode::kHeaderWords + i * encode::kWordsPerNode;
        for (size_t kind = 0; kind < ir::kNumNodeKinds; ++kind)
            s[kind] = s[kind].add(t[base + encode::kKindOffset + kind]);
        const int64_t span = t[base + encode::kLiveEndOffset].toScaled() -
                             t[base + encode::kLiveStartOffset].toScaled();
        maxSpan = span > maxSpan ? span : maxSpan;
    }
    s[kSummaryInputs] = t[1];
    s[kSummaryOutputs] = s[static_cast<size_t>(ir::NodeKind::Output)];
    s[kSummaryNodes] = t[0];
    s[kSummaryMaxLiveSpan] = Fixed::fromScaled(maxSpan);
    for (size_t slot = 0; slot < tasm::kStackWindow; ++slot)
    {
        s[kSummaryOccupancy] = s[kSummaryOccupancy].add(t[encode::kContextOffset + slot]);
        s[kSummaryLiveSlots] =
            s[kSummaryLiveSlots].add(t[encode::kContextOffset + tasm::kStackWindow + slot]);
    }
    return s;
}

TemplateSearchGenerator::TemplateSearchGenerator(GeneratorParams params, uint64_t seed)
    : params_(std::move(params)), seed_(seed), version_(params_.hash())
{
}

KnobSet TemplateSearchGenerator::preferred(const Summary &summary) const
{
    KnobSet set = kNoKnobs;
    for (size_t k = 0; k < kNumKnobs; ++k)
    {
        const Fixed score = params_.score(static_cast<Knob>(k), summary);
        if (!score.isNegative() && score != Fixed::zero())
            set = static_cast<KnobSet>(set | knobBit(static_cast<Knob>(k)));
    }
    return set;
}

std::vector<RankedSubset> TemplateSearchGenerator::rankSubsets(const Summary &summary) const
{
    std::array<int64_t, kNumKnobs> margin{};
    KnobSet pref = kNoKnobs;
    for (size_t k = 0; k < kNumKnobs; ++k)
    {
        const Fixed score = params_.score(static_cast<Knob>(k), summary);
        margin[k] = magnitude(score);
        if (!score.isNegative() && score != Fixed::zero())
            pref = static_cast<KnobSet>(pref | knobBit(static_cast<Knob>(k)));
    }

    std::vector<RankedSubset> ranked;
    ranked.reserve(kNumKnobSubsets);
    for (size_t mask = 0; mask < kNumKnobSubsets; ++mask)
    {
        RankedSubset r;
        r.knobs = static_cast<KnobSet>(mask);
        const KnobSet diff = static_cast<KnobSet>(r.knobs ^ pref);
        for (size_t k = 0; k < kNumKnobs; ++k)
        {
            if (diff & knobBit(static_cast<Knob>(k)))
                r.distance += margin[k];
        }
        r.tie = support::mix64(seed_ ^ (mask * 0x9E3779B97F4A7C15ULL));
        ranked.push_back(r);
    }
    std::sort(ranked.begin(), ranked.end(), [](const RankedSubset &a, const RankedSubset &b) {
        if (a.distance != b.distance)
            return a.distance < b.distance;
        return a.tie < b.tie;
    });
    return ranked;
}

std::vector<Candidate> TemplateSearchGenerator::propose(const FeatureTensor &tensor, size_t k) const
{
    std::vector<Candidate> out;
    if (k == 0)
        return out;
    auto decoded = encode::decode(tensor);
    if (!decoded)
        return out;

    const ir::BasicBlock &block = decoded.value().block;
    for (const auto &subset : rankSubsets(summarize(tensor)))
    {
        auto seq = StackScheduler(subset.knobs).schedule(block);
        if (!seq)
            continue;
        const bool duplicate = std::any_of(out.begin(), out.end(), [&](const Candidate &c) {
            return c.instrs == *seq;
        });
        if (duplicate)
            continue;
        out.push_back(Candidate{std::move(*seq), Fixed::fromScaled(-subset.distance)});
        if (out.size() == k)
            break;
    }
    return out;
}

} // namespace talus::gen
