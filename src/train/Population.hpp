//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: train/Population.hpp
// Purpose: Fixed-size population of generator parameter vectors evolved by
//          truncation selection, uniform crossover and bounded perturbation.
// Key invariants: The best member of a generation survives unchanged into the
//                 next; every weight stays within the weight bound; all
//                 randomness is a pure function of the supplied seeds.
// Ownership/Lifetime: Value type living for one training session.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "gen/GeneratorParams.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace talus::train
{

/// @brief Default population size.
constexpr size_t kDefaultPopulation = 16;

/// @brief Base per-weight mutation probability, in parts per million.
constexpr uint64_t kBaseMutationPpm = 10'000;

/// @brief Mutation probability used to spread the initial population.
constexpr uint64_t kSeedMutationPpm = 50'000;

/// @brief Largest perturbation applied to one weight, in scaled units (0.05).
constexpr int64_t kMaxPerturbation = static_cast<int64_t>(field::kScale) / 20;

/// @brief Stale generations before the mutation rate grows.
constexpr uint32_t kStaleLimit = 5;

/// @brief Fitness of a member that has not been scored yet.
constexpr int64_t kUnscored = std::numeric_limits<int64_t>::min();

struct Member
{
    gen::GeneratorParams params;
    int64_t fitness = kUnscored;
};

/// @brief Perturb each weight of @p params with probability @p ratePpm.
/// @details Perturbations are uniform in [-0.05, 0.05] and clamped to the
///          weight bound.
void mutate(gen::GeneratorParams &params, uint64_t ratePpm, uint64_t seed);

/// @brief Uniform crossover: each weight comes from @p a or @p b.
gen::GeneratorParams crossover(const gen::GeneratorParams &a,
                               const gen::GeneratorParams &b,
                               uint64_t seed);

class Population
{
  public:
    /// @brief Member 0 is @p base itself; the rest are perturbed copies.
    /// @pre size >= 2
    Population(const gen::GeneratorParams &base, uint64_t seed, size_t size = kDefaultPopulation);

    std::vector<Member> &members()
    {
        return members_;
    }

    const std::vector<Member> &members() const
    {
        return members_;
    }

    /// @brief Members kept each generation: the top quarter, at least one.
    size_t survivors() const;

    /// @brief Highest-fitness member; the first wins ties.
    const Member &best() const;

    /// @brief Replace the population with the offspring of its survivors.
    /// @pre Every member has been scored.
    void evolve(uint64_t seed);

    uint64_t generation() const
    {
        return generation_;
    }

    int64_t bestFitness() const
    {
        return bestFitness_;
    }

    uint64_t mutationRatePpm() const
    {
        return mutationPpm_;
    }

    uint32_t staleGenerations() const
    {
        return stale_;
    }

  private:
    std::vector<Member> members_;
    uint64_t generation_ = 0;
    int64_t bestFitness_ = kUnscored;
    uint64_t mutationPpm_ = kBaseMutationPpm;
    uint32_t stale_ = 0;
};

} // namespace talus::train
