//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/snapshot_handle.hpp
// Purpose: Atomically swappable handle to an immutable, reference-counted
//          snapshot shared between compiler threads and the trainer.
// Key invariants: Readers always observe a whole snapshot, old or new, never a
//                 mix; a loaded snapshot stays alive while a reader holds it.
// Ownership/Lifetime: The handle shares ownership of the current snapshot.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <mutex>
#include <utility>

namespace talus::support
{

/// @brief Single synchronisation point for publishing immutable state.
/// @tparam T Snapshot type; only ever exposed as const.
template <typename T> class SnapshotHandle
{
  public:
    SnapshotHandle() = default;

    explicit SnapshotHandle(std::shared_ptr<const T> initial) : current_(std::move(initial)) {}

    SnapshotHandle(const SnapshotHandle &) = delete;
    SnapshotHandle &operator=(const SnapshotHandle &) = delete;

    /// @brief Take a reference to the current snapshot.
    std::shared_ptr<const T> load() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    /// @brief Publish @p next; in-flight readers keep the snapshot they loaded.
    void store(std::shared_ptr<const T> next)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_.swap(next);
    }

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<const T> current_;
};

} // namespace talus::support
