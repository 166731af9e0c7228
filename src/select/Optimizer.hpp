//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/Optimizer.hpp
// Purpose: Compiler-facing entry point that replaces a block's baseline
//          lowering with a cheaper verified sequence when one is found.
// Key invariants: Every successful optimize call yields exactly one outcome
//                 record; the live generator is swapped only through the
//                 snapshot handle, and a call keeps the snapshot it started
//                 with.
// Ownership/Lifetime: Owns the verification pool, trace sink, verdict cache
//                     and replay log; destruction flushes the log.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "gen/CandidateGenerator.hpp"
#include "ir/BasicBlock.hpp"
#include "select/OutcomeRecord.hpp"
#include "select/ReplayLog.hpp"
#include "select/SelectionReport.hpp"
#include "select/SpeculativeSelector.hpp"
#include "select/VerdictCache.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"
#include "support/snapshot_handle.hpp"
#include "support/trace.hpp"
#include "tasm/CostModel.hpp"
#include "verify/VerificationPool.hpp"
#include "verify/Verifier.hpp"

#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>

namespace talus::select
{

/// @brief Sequence to emit for a block plus the record explaining it.
struct OptimizeResult
{
    tasm::InstrSeq instrs;
    OutcomeRecord record;
};

class Optimizer
{
  public:
    using GeneratorHandle = support::SnapshotHandle<gen::CandidateGenerator>;

    /// @brief Build an optimizer from @p opts.
    /// @details With a checkpoint directory the active parameters drive the
    ///          generator and a missing ACTIVE pointer is fatal; without one
    ///          the default parameters are used. A null @p verifier selects
    ///          the differential verifier.
    /// @return "checkpoint-not-found", "checkpoint-corrupt" or "io-error".
    static support::Expected<std::unique_ptr<Optimizer>> create(
        const support::Options &opts,
        std::shared_ptr<const verify::EquivalenceVerifier> verifier = nullptr,
        std::ostream *traceStream = nullptr);

    /// @param traceStream Destination of trace lines; std::cerr when null.
    Optimizer(const support::Options &opts,
              std::shared_ptr<const gen::CandidateGenerator> generator,
              std::shared_ptr<const verify::EquivalenceVerifier> verifier,
              std::unique_ptr<ReplayLog> log = nullptr,
              std::ostream *traceStream = nullptr);

    ~Optimizer();

    Optimizer(const Optimizer &) = delete;
    Optimizer &operator=(const Optimizer &) = delete;

    /// @brief Choose the sequence to emit for @p block.
    /// @param baseline Caller's own lowering of @p block; returned unchanged
    ///        unless a cheaper candidate verifies.
    /// @return The encoder's diagnostic when @p block cannot be encoded.
    support::Expected<OptimizeResult> optimize(const ir::BasicBlock &block,
                                               const tasm::InstrSeq &baseline,
                                               const ir::MachineState &state);

    /// @brief Handle through which training publishes new generators.
    GeneratorHandle &generatorHandle()
    {
        return generator_;
    }

    /// @brief Snapshot of the running report.
    SelectionReport report() const;

    /// @brief Rejected blocks (errors) and generator failures (warnings),
    ///        located by the ordinal of the optimize call, starting at 1.
    support::DiagnosticEngine diagnostics() const;

    /// @brief Flush the replay log, if any.
    support::Expected<void> flushLog();

    const tasm::CostOracle &oracle() const
    {
        return oracle_;
    }

    const support::Options &options() const
    {
        return opts_;
    }

  private:
    void note(const support::Diag &diag);

    support::Options opts_;
    tasm::CostOracle oracle_;
    std::unique_ptr<support::TraceSink> trace_;
    std::unique_ptr<verify::VerificationPool> pool_;
    VerdictCache cache_;
    SpeculativeSelector selector_;
    GeneratorHandle generator_;
    mutable std::mutex reportMutex_;
    SelectionReport report_;
    support::DiagnosticEngine diags_;
    std::atomic<uint64_t> blocksSeen_{0};
    std::unique_ptr<ReplayLog> log_;
};

} // namespace talus::select
