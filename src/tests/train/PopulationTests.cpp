//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/train/PopulationTests.cpp
// Purpose: Seeding, elitism and the adaptive mutation rate of the population,
//          plus plateau detection in the convergence tracker.
// Key invariants: The elite survives every generation unchanged; mutation
//                 never pushes a weight past the weight bound.
// Ownership/Lifetime: Pure value tests.
// Links: src/train/Population.hpp, src/train/ConvergenceTracker.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "train/ConvergenceTracker.hpp"
#include "train/Population.hpp"

using namespace talus::train;
using talus::field::Fixed;
using talus::gen::GeneratorParams;
using talus::gen::kParamCount;

namespace
{
void scoreAll(Population &pop, int64_t base)
{
    int64_t f = base;
    for (auto &m : pop.members())
        m.fitness = f--;
}

void scoreFlat(Population &pop, int64_t value)
{
    for (auto &m : pop.members())
        m.fitness = value;
}
} // namespace

TEST(PopulationTest, SeedsAroundTheBase)
{
    const GeneratorParams base = GeneratorParams::defaults();
    Population pop(base, 7);
    ASSERT_EQ(pop.members().size(), kDefaultPopulation);
    EXPECT_EQ(pop.members()[0].params, base);
    EXPECT_EQ(pop.members()[0].fitness, kUnscored);

    size_t differing = 0;
    for (size_t i = 1; i < pop.members().size(); ++i)
        differing += pop.members()[i].params == base ? 0 : 1;
    EXPECT_GT(differing, 0u);

    Population again(base, 7);
    for (size_t i = 0; i < pop.members().size(); ++i)
        EXPECT_EQ(pop.members()[i].params, again.members()[i].params) << i;
}

TEST(PopulationTest, MutationRespectsTheWeightBound)
{
    GeneratorParams p = GeneratorParams::zeros();
    for (size_t i = 0; i < kParamCount; ++i)
        p.set(i, Fixed::fromInt(i % 2 ? 256 : -256));

    mutate(p, 1'000'000, 3);
    for (size_t i = 0; i < kParamCount; ++i)
    {
        EXPECT_LE(p.weight(i).toScaled(), Fixed::fromInt(256).toScaled()) << i;
        EXPECT_GE(p.weight(i).toScaled(), Fixed::fromInt(-256).toScaled()) << i;
    }

    GeneratorParams untouched = GeneratorParams::defaults();
    mutate(untouched, 0, 3);
    EXPECT_EQ(untouched, GeneratorParams::defaults());
}

TEST(PopulationTest, CrossoverPicksEachWeightFromAParent)
{
    GeneratorParams a = GeneratorParams::zeros();
    GeneratorParams b = GeneratorParams::zeros();
    for (size_t i = 0; i < kParamCount; ++i)
    {
        a.set(i, Fixed::fromInt(1));
        b.set(i, Fixed::fromInt(2));
    }
    const GeneratorParams child = crossover(a, b, 99);
    size_t fromA = 0;
    for (size_t i = 0; i < kParamCount; ++i)
    {
        const Fixed w = child.weight(i);
        EXPECT_TRUE(w == Fixed::fromInt(1) || w == Fixed::fromInt(2)) << i;
        fromA += w == Fixed::fromInt(1) ? 1 : 0;
    }
    EXPECT_GT(fromA, 0u);
    EXPECT_LT(fromA, kParamCount);
}

TEST(PopulationTest, SurvivorsAreTheTopQuarter)
{
    EXPECT_EQ(Population(GeneratorParams::defaults(), 1, 16).survivors(), 4u);
    EXPECT_EQ(Population(GeneratorParams::defaults(), 1, 2).survivors(), 1u);
}

TEST(PopulationTest, EliteSurvivesEvolution)
{
    Population pop(GeneratorParams::defaults(), 5, 8);
    scoreAll(pop, -1000);
    pop.members()[5].fitness = -10;
    pop.members()[6].fitness = -10;
    const GeneratorParams elite = pop.members()[5].params;
    EXPECT_EQ(&pop.best(), &pop.members()[5]);

    pop.evolve(17);
    EXPECT_EQ(pop.generation(), 1u);
    EXPECT_EQ(pop.bestFitness(), -10);
    ASSERT_EQ(pop.members().size(), 8u);
    EXPECT_EQ(pop.members()[0].params, elite);
    for (const auto &m : pop.members())
        EXPECT_EQ(m.fitness, kUnscored);
}

TEST(PopulationTest, MutationRateAdaptsToProgress)
{
    Population pop(GeneratorParams::defaults(), 2, 4);
    scoreAll(pop, -500);
    pop.evolve(1);
    EXPECT_EQ(pop.mutationRatePpm(), 9000u);
    EXPECT_EQ(pop.staleGenerations(), 0u);

    for (uint64_t g = 0; g < kStaleLimit - 1; ++g)
    {
        scoreFlat(pop, -500);
        pop.evolve(2 + g);
    }
    EXPECT_EQ(pop.staleGenerations(), kStaleLimit - 1);
    EXPECT_EQ(pop.mutationRatePpm(), 9000u);

    scoreFlat(pop, -500);
    pop.evolve(10);
    EXPECT_EQ(pop.staleGenerations(), kStaleLimit);
    EXPECT_EQ(pop.mutationRatePpm(), 11700u);

    scoreFlat(pop, -400);
    pop.evolve(11);
    EXPECT_EQ(pop.staleGenerations(), 0u);
    EXPECT_EQ(pop.mutationRatePpm(), 10530u);
}

TEST(PopulationTest, MutationRateHasAFloor)
{
    Population pop(GeneratorParams::defaults(), 4, 4);
    for (int64_t g = 0; g < 12; ++g)
    {
        scoreFlat(pop, -1000 + g);
        pop.evolve(static_cast<uint64_t>(g));
    }
    EXPECT_EQ(pop.mutationRatePpm(), kBaseMutationPpm / 2);
    EXPECT_EQ(pop.bestFitness(), -989);
}

TEST(ConvergenceTrackerTest, ImprovingUntilTheWindowFills)
{
    ConvergenceTracker tracker(4, 1, 2);
    EXPECT_EQ(tracker.record(-1000), TrainingStatus::Improving);
    EXPECT_EQ(tracker.record(-1000), TrainingStatus::Improving);
    EXPECT_EQ(tracker.record(-1000), TrainingStatus::Improving);
    EXPECT_EQ(tracker.record(-900), TrainingStatus::Improving);
}

TEST(ConvergenceTrackerTest, FlatWindowsPlateauThenConverge)
{
    ConvergenceTracker tracker(4, 1, 2);
    for (int64_t f : {-1000, -900, -800, -700, -700, -700})
        EXPECT_EQ(tracker.record(f), TrainingStatus::Improving) << f;
    EXPECT_EQ(tracker.record(-700), TrainingStatus::Plateaued);
    EXPECT_EQ(tracker.record(-700), TrainingStatus::Converged);
    EXPECT_EQ(tracker.status(), TrainingStatus::Converged);
    EXPECT_STREQ(toString(tracker.status()), "converged");

    EXPECT_EQ(tracker.record(-100), TrainingStatus::Improving);
}

TEST(ConvergenceTrackerTest, NegligibleGainCountsAsStalled)
{
    ConvergenceTracker tracker(2, 1, 3);
    EXPECT_EQ(tracker.record(-100000), TrainingStatus::Improving);
    EXPECT_EQ(tracker.record(-99950), TrainingStatus::Plateaued);
    EXPECT_EQ(tracker.record(-90000), TrainingStatus::Improving);
    EXPECT_STREQ(toString(TrainingStatus::Plateaued), "plateaued");
    EXPECT_STREQ(toString(TrainingStatus::Improving), "improving");
}

TEST(ConvergenceTrackerTest, WindowHasAMinimumOfTwo)
{
    ConvergenceTracker tracker(1);
    EXPECT_EQ(tracker.record(5), TrainingStatus::Improving);
    EXPECT_EQ(tracker.record(5), TrainingStatus::Plateaued);
}
