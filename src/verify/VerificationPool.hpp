//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: verify/VerificationPool.hpp
// Purpose: Fixed-size worker pool running equivalence checks off the
//          compiling thread.
// Key invariants: Each submitted check runs exactly once; tasks hold their
//                 own copies of the block and sequence, so a caller that stops
//                 waiting never leaves a task with dangling inputs.
// Ownership/Lifetime: The pool owns its threads and joins them on destruction
//                     after draining queued work.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "verify/Verifier.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace talus::verify
{

class VerificationPool
{
  public:
    /// @brief Start @p workers threads; zero runs every check inline.
    explicit VerificationPool(size_t workers);

    ~VerificationPool();

    VerificationPool(const VerificationPool &) = delete;
    VerificationPool &operator=(const VerificationPool &) = delete;

    /// @brief Queue a check of @p instrs against @p block.
    /// @details Exceptions thrown by the verifier are delivered through the
    ///          returned future.
    std::future<Verdict> submit(std::shared_ptr<const EquivalenceVerifier> verifier,
                                ir::BasicBlock block,
                                tasm::InstrSeq instrs);

    size_t workerCount() const
    {
        return workers_.size();
    }

    /// @brief Stop accepting work, finish queued checks and join the workers.
    void shutdown();

  private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::packaged_task<Verdict()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

} // namespace talus::verify
