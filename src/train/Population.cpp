//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: train/Population.cpp
// Purpose: Seeded crossover, perturbation and the adaptive mutation rate.
// Key invariants: Integer arithmetic only; the rate stays within
//                 [base / 2, base * 10].
//
//===----------------------------------------------------------------------===//

#include "train/Population.hpp"

#include "support/hash.hpp"

#include <algorithm>
#include <utility>

namespace talus::train
{
using field::Fixed;
using gen::GeneratorParams;

namespace
{
constexpr uint64_t kPpm = 1'000'000;
constexpr uint64_t kStep = 6364136223846793005ULL;
} // namespace

void mutate(GeneratorParams &params, uint64_t ratePpm, uint64_t seed)
{
    for (size_t i = 0; i < gen::kParamCount; ++i)
    {
        const uint64_t h = support::mix64(seed + i);
        if (h % kPpm >= ratePpm)
            continue;
        const uint64_t span = static_cast<uint64_t>(2 * kMaxPerturbation + 1);
        const int64_t delta = static_cast<int64_t>(support::mix64(h + 42) % span) - kMaxPerturbation;
        params.set(i, Fixed::fromScaled(params.weight(i).toScaled() + delta));
    }
}

GeneratorParams crossover(const GeneratorParams &a, const GeneratorParams &b, uint64_t seed)
{
    GeneratorParams child = a;
    for (size_t i = 0; i < gen::kParamCount; ++i)
    {
        if (support::mix64(seed + i) & 1)
            child.set(i, b.weight(i));
    }
    return child;
}

Population::Population(const GeneratorParams &base, uint64_t seed, size_t size)
{
    members_.reserve(size);
    members_.push_back({base, kUnscored});
    for (size_t i = 1; i < size; ++i)
    {
        GeneratorParams p = base;
        mutate(p, kSeedMutationPpm, seed + i);
        members_.push_back({p, kUnscored});
    }
}

size_t Population::survivors() const
{
    return std::max<size_t>(1, members_.size() / 4);
}

const Member &Population::best() const
{
    const Member *top = &members_.front();
    for (const auto &m : members_)
    {
        if (m.fitness > top->fitness)
            top = &m;
    }
    return *top;
}

void Population::evolve(uint64_t seed)
{
    std::stable_sort(members_.begin(), members_.end(),
                     [](const Member &a, const Member &b) { return a.fitness > b.fitness; });

    const int64_t currentBest = members_.front().fitness;
    if (currentBest > bestFitness_)
    {
        bestFitness_ = currentBest;
        stale_ = 0;
        mutationPpm_ = std::max(mutationPpm_ * 9 / 10, kBaseMutationPpm / 2);
    }
    else
    {
        ++stale_;
        if (stale_ >= kStaleLimit)
            mutationPpm_ = std::min(mutationPpm_ * 13 / 10, kBaseMutationPpm * 10);
    }

    const size_t keep = survivors();
    std::vector<GeneratorParams> parents;
    parents.reserve(keep);
    for (size_t i = 0; i < keep; ++i)
        parents.push_back(members_[i].params);

    std::vector<Member> next;
    next.reserve(members_.size());
    next.push_back({parents.front(), kUnscored});
    for (size_t i = 1; i < members_.size(); ++i)
    {
        const uint64_t childSeed = seed * kStep + i;
        const auto &a = parents[support::mix64(childSeed) % keep];
        const auto &b = parents[support::mix64(childSeed + 1) % keep];
        GeneratorParams child = crossover(a, b, childSeed);
        mutate(child, mutationPpm_, childSeed + 2);
        next.push_back({child, kUnscored});
    }
    members_ = std::move(next);
    ++generation_;
}

} // namespace talus::train
