//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/VerdictCache.hpp
// Purpose: Bounded memo of verification verdicts keyed by block and sequence
//          digest.
// Key invariants: Timeouts are never cached; a later attempt may finish. A
//                 hit requires the stored sequence to equal the queried one,
//                 so a digest collision is a miss. At most capacity() entries
//                 are held; the least recently used is evicted first.
// Ownership/Lifetime: Shared by reference between selector calls; internally
//                     synchronised.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tasm/Instr.hpp"
#include "verify/Verifier.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace talus::select
{

/// @brief Entries held by a default-constructed cache.
inline constexpr size_t kDefaultVerdictCapacity = 4096;

/// @brief Stable 64-bit digest of an instruction sequence.
uint64_t sequenceDigest(const tasm::InstrSeq &seq);

class VerdictCache
{
  public:
    using Key = std::pair<uint64_t, uint64_t>;

    /// @param capacity Entry bound; zero is treated as one.
    explicit VerdictCache(size_t capacity = kDefaultVerdictCapacity);

    /// @brief Cached verdict for @p seq on the block with @p blockDigest.
    std::optional<verify::Verdict> lookup(uint64_t blockDigest, const tasm::InstrSeq &seq);

    /// @brief Remember @p verdict; Timeout is dropped.
    void store(uint64_t blockDigest, const tasm::InstrSeq &seq, verify::Verdict verdict);

    size_t size() const;

    size_t capacity() const
    {
        return capacity_;
    }

    /// @brief Lookups answered from the memo.
    size_t hits() const;

  private:
    struct Entry
    {
        tasm::InstrSeq seq;
        verify::Verdict verdict;
        std::list<Key>::iterator recency;
    };

    mutable std::mutex mutex_;
    size_t capacity_;
    std::map<Key, Entry> verdicts_;
    std::list<Key> recency_; ///< Most recently used first.
    size_t hits_ = 0;
};

} // namespace talus::select
