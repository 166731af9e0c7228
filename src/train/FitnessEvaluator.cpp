//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: train/FitnessEvaluator.cpp
// Purpose: Sample reconstruction and the member scoring loop.
// Key invariants: Results do not depend on the thread count.
//
//===----------------------------------------------------------------------===//

#include "train/FitnessEvaluator.hpp"

#include "gen/TemplateSearchGenerator.hpp"

#include <algorithm>
#include <limits>
#include <thread>
#include <utility>

namespace talus::train
{

namespace
{
int64_t saturatingSub(int64_t acc, uint64_t cost)
{
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
    if (cost > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) ||
        acc < kMin + static_cast<int64_t>(cost))
        return kMin;
    return acc - static_cast<int64_t>(cost);
}
} // namespace

std::vector<TrainingSample> samplesFromRecords(const std::vector<select::OutcomeRecord> &records)
{
    std::vector<TrainingSample> out;
    out.reserve(records.size());
    for (const auto &rec : records)
    {
        auto decoded = encode::decode(rec.tensor);
        if (!decoded)
            continue;
        out.push_back({std::move(decoded.value().block), rec.tensor, rec.baseline});
    }
    return out;
}

FitnessEvaluator::FitnessEvaluator(const tasm::CostOracle &oracle,
                                   std::shared_ptr<const verify::EquivalenceVerifier> verifier,
                                   size_t candidatesPerBlock,
                                   uint64_t seed,
                                   std::chrono::milliseconds verifyTimeout)
    : seed_(seed),
      selector_(oracle, std::move(verifier),
                select::SelectorConfig{candidatesPerBlock, verifyTimeout, {}}, nullptr, nullptr,
                &cache_)
{
}

int64_t FitnessEvaluator::fitness(const gen::GeneratorParams &params,
                                  const std::vector<TrainingSample> &batch) const
{
    auto generator = std::make_shared<const gen::TemplateSearchGenerator>(params, seed_);
    int64_t total = 0;
    for (const auto &sample : batch)
    {
        const select::OutcomeRecord rec =
            selector_.selectEncoded(sample.block, sample.tensor, sample.baseline, generator);
        total = saturatingSub(total, rec.chosenCost);
    }
    return total;
}

std::vector<int64_t> FitnessEvaluator::fitnessAll(const std::vector<gen::GeneratorParams> &params,
                                                  const std::vector<TrainingSample> &batch,
                                                  size_t threads) const
{
    std::vector<int64_t> out(params.size(), 0);
    if (threads == 0)
        threads = std::max<size_t>(1, std::thread::hardware_concurrency());
    threads = std::min(threads, params.size());
    if (threads <= 1)
    {
        for (size_t i = 0; i < params.size(); ++i)
            out[i] = fitness(params[i], batch);
        return out;
    }

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (size_t t = 0; t < threads; ++t)
    {
        workers.emplace_back([&, t] {
            for (size_t i = t; i < params.size(); i += threads)
                out[i] = fitness(params[i], batch);
        });
    }
    for (auto &w : workers)
        w.join();
    return out;
}

} // namespace talus::train
