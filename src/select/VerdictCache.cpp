//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: select/VerdictCache.cpp
// Purpose: Sequence digests and the locked, least-recently-used verdict map.
//
//===----------------------------------------------------------------------===//

#include "select/VerdictCache.hpp"

#include "support/hash.hpp"

namespace talus::select
{

uint64_t sequenceDigest(const tasm::InstrSeq &seq)
{
    support::Fnv1a h;
    h.u64(seq.size());
    for (const auto &in : seq)
    {
        h.u64(static_cast<uint64_t>(in.op));
        h.u64(in.arg);
    }
    return h.digest();
}

VerdictCache::VerdictCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

std::optional<verify::Verdict> VerdictCache::lookup(uint64_t blockDigest, const tasm::InstrSeq &seq)
{
    const Key key{blockDigest, sequenceDigest(seq)};
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = verdicts_.find(key);
    if (it == verdicts_.end() || it->second.seq != seq)
        return std::nullopt;
    recency_.splice(recency_.begin(), recency_, it->second.recency);
    ++hits_;
    return it->second.verdict;
}

void VerdictCache::store(uint64_t blockDigest, const tasm::InstrSeq &seq, verify::Verdict verdict)
{
    if (verdict == verify::Verdict::Timeout)
        return;
    const Key key{blockDigest, sequenceDigest(seq)};
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = verdicts_.find(key);
    if (it != verdicts_.end())
    {
        it->second.seq = seq;
        it->second.verdict = verdict;
        recency_.splice(recency_.begin(), recency_, it->second.recency);
        return;
    }
    if (verdicts_.size() >= capacity_)
    {
        verdicts_.erase(recency_.back());
        recency_.pop_back();
    }
    recency_.push_front(key);
    verdicts_.emplace(key, Entry{seq, verdict, recency_.begin()});
}

size_t VerdictCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return verdicts_.size();
}

size_t VerdictCache::hits() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

} // namespace talus::select
