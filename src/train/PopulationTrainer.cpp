//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: train/PopulationTrainer.cpp
// Purpose: Session loop, validation gate and promotion.
//
//===----------------------------------------------------------------------===//

#include "train/PopulationTrainer.hpp"

#include "gen/TemplateSearchGenerator.hpp"
#include "support/hash.hpp"
#include "train/Population.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

namespace talus::train
{
using support::Expected;
using support::makeError;

SampleSplit splitSamples(std::vector<TrainingSample> samples, size_t batchSize, size_t validationSize)
{
    SampleSplit split;
    const size_t held = std::min(validationSize, samples.size() / 2);
    const size_t trainEnd = samples.size() - held;
    const size_t trainBegin = trainEnd > batchSize ? trainEnd - batchSize : 0;
    for (size_t i = trainBegin; i < trainEnd; ++i)
        split.training.push_back(std::move(samples[i]));
    for (size_t i = trainEnd; i < samples.size(); ++i)
        split.validation.push_back(std::move(samples[i]));
    return split;
}

PopulationTrainer::PopulationTrainer(checkpoint::CheckpointStore &store,
                                     const support::Options &opts,
                                     std::shared_ptr<const verify::EquivalenceVerifier> verifier,
                                     GeneratorHandle *live,
                                     support::TraceSink *trace)
    : store_(store), opts_(opts), verifier_(std::move(verifier)), live_(live), trace_(trace)
{
}

Expected<SessionResult> PopulationTrainer::run(const std::vector<select::OutcomeRecord> &records,
                                               const std::atomic<bool> &cancel)
{
    const auto &cfg = opts_.training;
    SampleSplit split =
        splitSamples(samplesFromRecords(records), cfg.batchSize, cfg.validationSize);
    if (split.training.empty() || split.validation.empty())
        return makeError("no-training-data", "training needs at least two decodable records");

    SessionResult result;
    gen::GeneratorParams base = gen::GeneratorParams::defaults();
    auto active = store_.active();
    if (active)
    {
        auto loaded = store_.load(active.value());
        if (!loaded)
            return loaded.error();
        base = loaded.value();
        result.parentHash = active.value();
    }
    else if (active.error().code != "checkpoint-not-found")
    {
        return active.error();
    }

    FitnessEvaluator evaluator(oracle_, verifier_, opts_.candidatesPerBlock, opts_.seed,
                               std::chrono::milliseconds(opts_.verifyTimeoutMs));
    Population population(base, opts_.seed, std::max<size_t>(cfg.populationSize, 2));
    ConvergenceTracker tracker(std::max<size_t>(cfg.generations / 4, 2));

    for (size_t g = 0; g < cfg.generations; ++g)
    {
        if (cancel.load())
        {
            result.cancelled = true;
            if (trace_)
                trace_->decision("train", "session cancelled before generation " + std::to_string(g));
            return result;
        }

        std::vector<gen::GeneratorParams> params;
        params.reserve(population.members().size());
        for (const auto &m : population.members())
            params.push_back(m.params);
        const std::vector<int64_t> scores =
            evaluator.fitnessAll(params, split.training, cfg.evalThreads);
        for (size_t i = 0; i < scores.size(); ++i)
            population.members()[i].fitness = scores[i];

        result.bestFitness = population.best().fitness;
        result.status = tracker.record(result.bestFitness);
        result.generations = g + 1;
        if (trace_)
        {
            trace_->decision("train", "generation " + std::to_string(g) + " best " +
                                          std::to_string(result.bestFitness) + " " +
                                          toString(result.status));
        }
        if (g + 1 < cfg.generations)
            population.evolve(support::mix64(opts_.seed + g));
    }

    if (cancel.load())
    {
        result.cancelled = true;
        return result;
    }
    if (result.generations == 0)
        return result;

    const gen::GeneratorParams best = population.best().params;
    result.bestValidationFitness = evaluator.fitness(best, split.validation);
    result.activeValidationFitness = evaluator.fitness(base, split.validation);
    if (trace_)
    {
        trace_->decision("train", "validation best " + std::to_string(result.bestValidationFitness) +
                                      " active " + std::to_string(result.activeValidationFitness));
    }

    if (result.bestValidationFitness - result.activeValidationFitness <= cfg.promotionMargin)
        return result;

    auto promoted = promote(best, result);
    if (!promoted)
        return promoted.error();
    return result;
}

Expected<void> PopulationTrainer::promote(const gen::GeneratorParams &best, SessionResult &result)
{
    auto hash = store_.save(best);
    if (!hash)
        return hash.error();

    checkpoint::CheckpointMeta meta;
    meta.generation = result.generations;
    meta.fitness = result.bestFitness;
    meta.validationFitness = result.bestValidationFitness;
    meta.parent = result.parentHash;
    auto written = store_.saveMeta(hash.value(), meta);
    if (!written)
        return written.error();

    auto activated = store_.setActive(hash.value());
    if (!activated)
        return activated.error();

    if (live_)
        live_->store(std::make_shared<const gen::TemplateSearchGenerator>(best, opts_.seed));
    result.promoted = true;
    result.promotedHash = hash.value();
    if (trace_)
        trace_->decision("train", "promoted " + hash.value());
    return {};
}

} // namespace talus::train
