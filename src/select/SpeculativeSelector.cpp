//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/SpeculativeSelector.cpp
// Purpose: Generation under a budget, candidate filtering and ordered
//          verification.
// Key invariants: Candidates are verified cheapest first, ties in generator
//                 order; verification stops at the first Verified verdict.
//
//===----------------------------------------------------------------------===//

#include "select/SpeculativeSelector.hpp"

#include "select/VerdictCache.hpp"
#include "support/hash.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace talus::select
{
using support::Expected;
using tasm::CostOracle;
using tasm::CostProfile;
using verify::Verdict;

namespace
{
enum class GenStatus
{
    Ok,
    Error,
    Timeout
};

struct Generated
{
    GenStatus status = GenStatus::Ok;
    std::vector<gen::Candidate> candidates;
    std::string error;
};

/// Run the generator, abandoning it once @p budget elapses.
/// The task owns copies of its inputs, so an abandoned run finishes on its own
/// thread without touching caller state.
Generated runGenerator(std::shared_ptr<const gen::CandidateGenerator> generator,
                       const encode::FeatureTensor &tensor,
                       size_t k,
                       std::chrono::milliseconds budget)
{
    Generated out;
    if (budget.count() == 0)
    {
        try
        {
            out.candidates = generator->propose(tensor, k);
        }
        catch (const std::exception &e)
        {
            out.status = GenStatus::Error;
            out.error = e.what();
        }
        return out;
    }

    auto task = std::make_shared<std::packaged_task<std::vector<gen::Candidate>()>>(
        [generator = std::move(generator), tensor, k] { return generator->propose(tensor, k); });
    std::future<std::vector<gen::Candidate>> result = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    if (result.wait_for(budget) == std::future_status::timeout)
    {
        out.status = GenStatus::Timeout;
        return out;
    }
    try
    {
        out.candidates = result.get();
    }
    catch (const std::exception &e)
    {
        out.status = GenStatus::Error;
        out.error = e.what();
    }
    return out;
}

/// Verify on a detached thread, abandoning the check once @p timeout elapses.
/// The task owns copies of its inputs so an abandoned check cannot outlive them.
Verdict verifyWithDeadline(std::shared_ptr<const verify::EquivalenceVerifier> verifier,
                           const ir::BasicBlock &block,
                           const tasm::InstrSeq &instrs,
                           std::chrono::milliseconds timeout)
{
    auto task = std::make_shared<std::packaged_task<Verdict()>>(
        [verifier = std::move(verifier), block, instrs] { return verifier->verify(block, instrs); });
    std::future<Verdict> result = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    if (result.wait_for(timeout) == std::future_status::timeout)
        return Verdict::Timeout;
    return result.get();
}

struct Ranked
{
    const gen::Candidate *candidate;
    CostProfile profile;
    uint64_t cost;
};

std::string blockTag(uint64_t digest)
{
    return "block " + support::toHex(digest).substr(0, 8);
}
} // namespace

DecisionReason classifyWin(const CostProfile &baseline, const CostProfile &chosen)
{
    const bool sameTallest = baseline.dominantTable() == chosen.dominantTable();
    const uint64_t baseHeight = baseline.maxHeight();
    const uint64_t chosenHeight = chosen.maxHeight();
    const uint64_t baseCost = tasm::pow2Ceil(baseHeight);
    const uint64_t chosenCost = tasm::pow2Ceil(chosenHeight);
    // Trimming the tallest table back under a boundary saves more cost than rows.
    if (sameTallest && chosenHeight < baseHeight && chosenCost < baseCost &&
        baseHeight - chosenHeight < baseCost - chosenCost)
        return DecisionReason::CliffJump;
    if (!sameTallest)
        return DecisionReason::TableRebalance;
    return DecisionReason::StackScheduling;
}

SpeculativeSelector::SpeculativeSelector(const CostOracle &oracle,
                                         std::shared_ptr<const verify::EquivalenceVerifier> verifier,
                                         SelectorConfig config,
                                         verify::VerificationPool *pool,
                                         support::TraceSink *trace,
                                         VerdictCache *cache)
    : oracle_(oracle), verifier_(std::move(verifier)), config_(config), pool_(pool), trace_(trace),
      cache_(cache)
{
}

Expected<OutcomeRecord> SpeculativeSelector::select(
    const ir::BasicBlock &block,
    const tasm::InstrSeq &baseline,
    const ir::MachineState &state,
    std::shared_ptr<const gen::CandidateGenerator> generator) const
{
    auto tensor = encode::encode(block, state);
    if (!tensor)
        return tensor.error();
    return selectEncoded(block, tensor.value(), baseline, std::move(generator));
}

Verdict SpeculativeSelector::check(const ir::BasicBlock &block,
                                   uint64_t blockDigest,
                                   const tasm::InstrSeq &instrs) const
{
    if (cache_)
    {
        if (auto memo = cache_->lookup(blockDigest, instrs))
            return *memo;
    }

    Verdict verdict = Verdict::Inconclusive;
    try
    {
        if (pool_)
        {
            std::future<Verdict> pending = pool_->submit(verifier_, block, instrs);
            if (config_.verifyTimeout.count() > 0 &&
                pending.wait_for(config_.verifyTimeout) == std::future_status::timeout)
                verdict = Verdict::Timeout;
            else
                verdict = pending.get();
        }
        else if (config_.verifyTimeout.count() > 0)
        {
            verdict = verifyWithDeadline(verifier_, block, instrs, config_.verifyTimeout);
        }
        else
        {
            verdict = verifier_->verify(block, instrs);
        }
    }
    catch (const std::exception &e)
    {
        if (trace_)
            trace_->decision("select", blockTag(blockDigest) + " verifier error: " + e.what());
        verdict = Verdict::Inconclusive;
    }

    if (cache_)
        cache_->store(blockDigest, instrs, verdict);
    return verdict;
}

OutcomeRecord SpeculativeSelector::selectEncoded(
    const ir::BasicBlock &block,
    const encode::FeatureTensor &tensor,
    const tasm::InstrSeq &baseline,
    std::shared_ptr<const gen::CandidateGenerator> generator) const
{
    const uint64_t digest = encode::tensorDigest(tensor);
    const CostProfile baseProfile = oracle_.profile(baseline);

    OutcomeRecord rec;
    rec.tensor = tensor;
    rec.baseline = baseline;
    rec.baselineCost = CostOracle::cost(baseProfile);
    rec.chosen = baseline;
    rec.chosenCost = rec.baselineCost;
    rec.state = SelectionState::Encoded;

    auto finish = [&](SelectionState state, DecisionReason reason) {
        rec.state = state;
        rec.reason = reason;
        if (trace_)
        {
            trace_->decision("select", blockTag(digest) + " " + toString(state) + " " +
                                           toString(reason) + " cost " +
                                           std::to_string(rec.baselineCost) + " -> " +
                                           std::to_string(rec.chosenCost));
        }
        return rec;
    };

    if (!generator)
        return finish(SelectionState::Fallback, DecisionReason::NoCandidate);
    rec.generatorVersion = generator->version();

    Generated generated =
        runGenerator(generator, tensor, config_.candidatesPerBlock, config_.generationBudget);
    if (generated.status == GenStatus::Timeout)
        return finish(SelectionState::Fallback, DecisionReason::GeneratorTimeout);
    if (generated.status == GenStatus::Error)
    {
        if (trace_)
            trace_->decision("select", blockTag(digest) + " generator error: " + generated.error);
        return finish(SelectionState::Fallback, DecisionReason::GeneratorError);
    }
    if (generated.candidates.size() > config_.candidatesPerBlock)
        generated.candidates.resize(config_.candidatesPerBlock);
    rec.state = SelectionState::Proposed;
    if (generated.candidates.empty())
        return finish(SelectionState::Fallback, DecisionReason::NoCandidate);

    std::vector<Ranked> ranked;
    for (const auto &cand : generated.candidates)
    {
        auto wellFormed = tasm::checkWellFormed(cand.instrs, block.inputCount);
        if (!wellFormed)
        {
            if (trace_)
                trace_->verbose("select", blockTag(digest) + " skip malformed candidate: " +
                                              wellFormed.error().message);
            continue;
        }
        CostProfile profile = oracle_.profile(cand.instrs);
        const uint64_t cost = CostOracle::cost(profile);
        if (cost >= rec.baselineCost)
            continue;
        ranked.push_back({&cand, profile, cost});
    }
    if (ranked.empty())
        return finish(SelectionState::Fallback, DecisionReason::NoImprovement);

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Ranked &a, const Ranked &b) { return a.cost < b.cost; });

    rec.state = SelectionState::Verifying;
    for (const auto &r : ranked)
    {
        const Verdict verdict = check(block, digest, r.candidate->instrs);
        if (trace_)
        {
            trace_->verbose("select", blockTag(digest) + " candidate cost " + std::to_string(r.cost) +
                                          " " + verify::toString(verdict));
        }
        if (verdict == Verdict::Timeout && trace_)
            trace_->decision("select", blockTag(digest) + " verification timeout");
        if (verdict != Verdict::Verified)
            continue;

        // Re-derive the cost from the sequence actually being returned.
        const CostProfile chosenProfile = oracle_.profile(r.candidate->instrs);
        if (CostOracle::cost(chosenProfile) > rec.baselineCost)
            break;
        rec.chosen = r.candidate->instrs;
        rec.chosenCost = CostOracle::cost(chosenProfile);
        rec.verified = true;
        return finish(SelectionState::Selected, classifyWin(baseProfile, chosenProfile));
    }
    return finish(SelectionState::Fallback, DecisionReason::FailedVerify);
}

} // namespace talus::select
