//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/Optimizer.cpp
// Purpose: Wiring of the optimizer components and the per-block entry point.
//
//===----------------------------------------------------------------------===//

#include "select/Optimizer.hpp"

#include "checkpoint/CheckpointStore.hpp"
#include "gen/GeneratorParams.hpp"
#include "gen/TemplateSearchGenerator.hpp"
#include "verify/DifferentialVerifier.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

namespace talus::select
{
using support::Expected;

namespace
{
std::unique_ptr<support::TraceSink> makeSink(const support::TraceConfig &cfg, std::ostream *os)
{
    if (os)
        return std::make_unique<support::TraceSink>(cfg, *os);
    return std::make_unique<support::TraceSink>(cfg);
}

SelectorConfig selectorConfig(const support::Options &opts)
{
    SelectorConfig cfg;
    cfg.candidatesPerBlock = opts.candidatesPerBlock;
    cfg.verifyTimeout = std::chrono::milliseconds(opts.verifyTimeoutMs);
    cfg.generationBudget = std::chrono::milliseconds(opts.generationBudgetMs);
    return cfg;
}
} // namespace

Expected<std::unique_ptr<Optimizer>> Optimizer::create(
    const support::Options &opts,
    std::shared_ptr<const verify::EquivalenceVerifier> verifier,
    std::ostream *traceStream)
{
    gen::GeneratorParams params = gen::GeneratorParams::defaults();
    if (!opts.checkpointDir.empty())
    {
        checkpoint::CheckpointStore store(opts.checkpointDir);
        auto hash = store.active();
        if (!hash)
            return hash.error();
        auto loaded = store.load(hash.value());
        if (!loaded)
            return loaded.error();
        params = loaded.value();
    }

    std::unique_ptr<ReplayLog> log;
    if (!opts.replayLogPath.empty())
    {
        auto opened = ReplayLog::open(opts.replayLogPath);
        if (!opened)
            return opened.error();
        log = std::move(opened.value());
    }

    if (!verifier)
        verifier = std::make_shared<verify::DifferentialVerifier>(opts.seed, opts.verifyTrials);
    auto generator = std::make_shared<const gen::TemplateSearchGenerator>(params, opts.seed);
    return std::make_unique<Optimizer>(opts, std::move(generator), std::move(verifier),
                                       std::move(log), traceStream);
}

Optimizer::Optimizer(const support::Options &opts,
                     std::shared_ptr<const gen::CandidateGenerator> generator,
                     std::shared_ptr<const verify::EquivalenceVerifier> verifier,
                     std::unique_ptr<ReplayLog> log,
                     std::ostream *traceStream)
    : opts_(opts), trace_(makeSink(opts.trace, traceStream)),
      pool_(opts.verifyWorkers > 0 ? std::make_unique<verify::VerificationPool>(opts.verifyWorkers)
                                   : nullptr),
      cache_(opts.verdictCacheCapacity),
      selector_(oracle_, std::move(verifier), selectorConfig(opts), pool_.get(), trace_.get(),
                &cache_),
      generator_(std::move(generator)), log_(std::move(log))
{
}

Optimizer::~Optimizer()
{
    if (log_)
        log_->close();
    if (pool_)
        pool_->shutdown();
}

Expected<OptimizeResult> Optimizer::optimize(const ir::BasicBlock &block,
                                             const tasm::InstrSeq &baseline,
                                             const ir::MachineState &state)
{
    const uint64_t ordinal = ++blocksSeen_;
    auto record = selector_.select(block, baseline, state, generator_.load());
    if (!record)
    {
        support::Diag diag = record.error();
        diag.loc.block = ordinal;
        note(diag);
        return record.error();
    }

    OptimizeResult result;
    result.record = std::move(record.value());
    result.instrs = result.record.chosen;

    if (log_)
        log_->append(result.record);

    double fallbackRate = 0.0;
    {
        std::lock_guard<std::mutex> lock(reportMutex_);
        report_.add(result.record);
        fallbackRate = report_.fallbackRate();
    }
    if (result.record.reason == DecisionReason::GeneratorError ||
        result.record.reason == DecisionReason::GeneratorTimeout)
    {
        support::Diag diag{support::Severity::Warning, "generator-failure",
                           std::string("block kept its baseline: ") + toString(result.record.reason),
                           {}};
        diag.loc.block = ordinal;
        note(diag);
    }
    if (result.record.state == SelectionState::Fallback && trace_->config().enabled())
    {
        std::ostringstream os;
        os << "fallback rate " << std::fixed << std::setprecision(1) << fallbackRate * 100.0 << "%";
        trace_->decision("optimize", os.str());
    }
    return result;
}

void Optimizer::note(const support::Diag &diag)
{
    {
        std::lock_guard<std::mutex> lock(reportMutex_);
        diags_.report(diag);
    }
    if (!trace_->config().enabled())
        return;
    std::ostringstream os;
    support::printDiag(diag, os);
    std::string line = os.str();
    if (!line.empty() && line.back() == '\n')
        line.pop_back();
    trace_->decision("optimize", line);
}

support::DiagnosticEngine Optimizer::diagnostics() const
{
    std::lock_guard<std::mutex> lock(reportMutex_);
    return diags_;
}

SelectionReport Optimizer::report() const
{
    std::lock_guard<std::mutex> lock(reportMutex_);
    return report_;
}

Expected<void> Optimizer::flushLog()
{
    if (!log_)
        return {};
    return log_->flush();
}

} // namespace talus::select
