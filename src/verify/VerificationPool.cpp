//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: verify/VerificationPool.cpp
// Purpose: Worker loop and task submission for the verification pool.
//
//===----------------------------------------------------------------------===//

#include "verify/VerificationPool.hpp"

#include <utility>

namespace talus::verify
{

VerificationPool::VerificationPool(size_t workers)
{
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i)
        workers_.emplace_back([this] { workerLoop(); });
}

VerificationPool::~VerificationPool()
{
    shutdown();
}

std::future<Verdict> VerificationPool::submit(std::shared_ptr<const EquivalenceVerifier> verifier,
                                              ir::BasicBlock block,
                                              tasm::InstrSeq instrs)
{
    std::packaged_task<Verdict()> task(
        [verifier = std::move(verifier), block = std::move(block), instrs = std::move(instrs)] {
            return verifier->verify(block, instrs);
        });
    std::future<Verdict> result = task.get_future();

    if (workers_.empty())
    {
        task();
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_)
        {
            // Pool is draining; run on the caller so the future still resolves.
            task();
            return result;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return result;
}

void VerificationPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto &w : workers_)
    {
        if (w.joinable())
            w.join();
    }
}

void VerificationPool::workerLoop()
{
    while (true)
    {
        std::packaged_task<Verdict()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            if (stop_ && queue_.empty())
                return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}

} // namespace talus::verify
