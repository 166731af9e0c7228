//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/hash.hpp
// Purpose: FNV-1a digests used for content addressing and record checksums,
//          plus the seeded mixer shared by the generator and trainer.
// Key invariants: All functions are pure and platform independent.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace talus::support
{

inline constexpr uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
inline constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

/// @brief Incremental 64-bit FNV-1a hasher.
class Fnv1a
{
  public:
    explicit Fnv1a(uint64_t basis = kFnvOffset) : state_(basis) {}

    void bytes(const void *data, size_t size)
    {
        const auto *p = static_cast<const unsigned char *>(data);
        for (size_t i = 0; i < size; ++i)
        {
            state_ ^= p[i];
            state_ *= kFnvPrime;
        }
    }

    /// @brief Feed @p v as eight little-endian bytes.
    void u64(uint64_t v)
    {
        for (int i = 0; i < 8; ++i)
        {
            state_ ^= static_cast<unsigned char>(v >> (8 * i));
            state_ *= kFnvPrime;
        }
    }

    uint64_t digest() const
    {
        return state_;
    }

  private:
    uint64_t state_;
};

/// @brief One-shot FNV-1a of a byte string.
uint64_t fnv1a(std::string_view data);

/// @brief 128-bit content digest rendered as 32 lowercase hex characters.
/// @details Two FNV-1a lanes with distinct offset bases over the same bytes.
std::string contentHash(std::string_view data);

/// @brief Render @p v as 16 lowercase hex characters.
std::string toHex(uint64_t v);

/// @brief Deterministic 64-bit mixer for seeded pseudo-random decisions.
uint64_t mix64(uint64_t x);

} // namespace talus::support
