//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: train/TrainingWorker.hpp
// Purpose: Run a training session on a background thread while compilation
//          continues against the live generator.
// Key invariants: At most one session runs at a time; destruction cancels
//                 and joins the running session.
// Ownership/Lifetime: Borrows the store, handle and trace sink, which must
//                     outlive the worker.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "train/PopulationTrainer.hpp"

#include <atomic>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace talus::train
{

class TrainingWorker
{
  public:
    TrainingWorker(checkpoint::CheckpointStore &store,
                   const support::Options &opts,
                   std::shared_ptr<const verify::EquivalenceVerifier> verifier,
                   PopulationTrainer::GeneratorHandle *live = nullptr,
                   support::TraceSink *trace = nullptr);

    ~TrainingWorker();

    TrainingWorker(const TrainingWorker &) = delete;
    TrainingWorker &operator=(const TrainingWorker &) = delete;

    /// @brief Begin a session over @p records.
    /// @return False when a session is already in flight.
    bool start(std::vector<select::OutcomeRecord> records);

    /// @brief Begin a session over the records of the replay log at @p path.
    /// @return "io-error" when the log cannot be read, or "training-busy".
    support::Expected<void> startFromLog(const std::string &path);

    /// @brief Ask the running session to stop before its next generation.
    void cancel();

    /// @brief Wait for the current session and return its result.
    /// @return "training-idle" when no session was started.
    support::Expected<SessionResult> wait();

    bool running() const
    {
        return thread_.joinable();
    }

  private:
    PopulationTrainer trainer_;
    std::atomic<bool> cancel_{false};
    std::future<support::Expected<SessionResult>> result_;
    std::thread thread_;
};

} // namespace talus::train
