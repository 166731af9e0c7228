//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: train/TrainingWorker.cpp
// Purpose: Background thread management for training sessions.
//
//===----------------------------------------------------------------------===//

#include "train/TrainingWorker.hpp"

#include "select/ReplayLog.hpp"

#include <utility>

namespace talus::train
{
using support::Expected;
using support::makeError;

TrainingWorker::TrainingWorker(checkpoint::CheckpointStore &store,
                               const support::Options &opts,
                               std::shared_ptr<const verify::EquivalenceVerifier> verifier,
                               PopulationTrainer::GeneratorHandle *live,
                               support::TraceSink *trace)
    : trainer_(store, opts, std::move(verifier), live, trace)
{
}

TrainingWorker::~TrainingWorker()
{
    cancel();
    if (thread_.joinable())
        thread_.join();
}

bool TrainingWorker::start(std::vector<select::OutcomeRecord> records)
{
    if (thread_.joinable())
        return false;
    cancel_.store(false);
    std::packaged_task<Expected<SessionResult>()> task(
        [this, records = std::move(records)] { return trainer_.run(records, cancel_); });
    result_ = task.get_future();
    thread_ = std::thread(std::move(task));
    return true;
}

Expected<void> TrainingWorker::startFromLog(const std::string &path)
{
    auto contents = select::ReplayLog::readAll(path);
    if (!contents)
        return contents.error();
    if (!start(std::move(contents.value().records)))
        return makeError("training-busy", "a training session is already running");
    return {};
}

void TrainingWorker::cancel()
{
    cancel_.store(true);
}

Expected<SessionResult> TrainingWorker::wait()
{
    if (!thread_.joinable())
        return makeError("training-idle", "no training session was started");
    thread_.join();
    return result_.get();
}

} // namespace talus::train
