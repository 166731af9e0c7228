//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/hash.cpp
// Purpose: Implement FNV-1a digests and the seeded mixer.
//
//===----------------------------------------------------------------------===//

#include "support/hash.hpp"

namespace talus::support
{

namespace
{
/// Offset basis of the second digest lane.
constexpr uint64_t kSecondLaneBasis = 0x84222325cbf29ce4ULL;
} // namespace

uint64_t fnv1a(std::string_view data)
{
    Fnv1a h;
    h.bytes(data.data(), data.size());
    return h.digest();
}

std::string contentHash(std::string_view data)
{
    Fnv1a lo;
    Fnv1a hi(kSecondLaneBasis);
    lo.bytes(data.data(), data.size());
    hi.bytes(data.data(), data.size());
    hi.u64(data.size());
    return toHex(hi.digest()) + toHex(lo.digest());
}

std::string toHex(uint64_t v)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i)
    {
        out[static_cast<size_t>(i)] = kDigits[v & 0xF];
        v >>= 4;
    }
    return out;
}

uint64_t mix64(uint64_t x)
{
    x = x * 6364136223846793005ULL + 1442695040888963407ULL;
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33;
    return x;
}

} // namespace talus::support
