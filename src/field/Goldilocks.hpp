//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: field/Goldilocks.hpp
// Purpose: Arithmetic in the target machine's prime field p = 2^64 - 2^32 + 1.
// Key invariants: Stored values are always canonical (strictly below p).
// Ownership/Lifetime: Trivially copyable value type.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>

namespace talus::field
{

/// @brief Field modulus of the target machine.
inline constexpr uint64_t kModulus = 0xFFFFFFFF00000001ULL;

/// @brief Largest canonical value treated as non-negative by signed views.
inline constexpr uint64_t kHalfModulus = kModulus / 2;

/// @brief Element of the Goldilocks prime field.
class Goldilocks
{
  public:
    constexpr Goldilocks() = default;

    /// @brief Build from any 64-bit value, reducing modulo p.
    static constexpr Goldilocks fromU64(uint64_t v)
    {
        return Goldilocks(v >= kModulus ? v - kModulus : v);
    }

    /// @brief Build the field image of a signed integer (negatives wrap).
    static constexpr Goldilocks fromI64(int64_t v)
    {
        if (v >= 0)
            return fromU64(static_cast<uint64_t>(v));
        const uint64_t mag = static_cast<uint64_t>(-(v + 1)) + 1;
        return fromU64(mag).neg();
    }

    /// @brief Canonical representative in [0, p).
    constexpr uint64_t value() const
    {
        return v_;
    }

    constexpr Goldilocks add(Goldilocks rhs) const
    {
        // Both operands are < p < 2^64, so the sum fits in 65 bits; detect the
        // carry and fold it back in as 2^64 mod p = 2^32 - 1.
        const uint64_t sum = v_ + rhs.v_;
        if (sum < v_)
            return fromU64(sum + 0xFFFFFFFFULL);
        return fromU64(sum);
    }

    constexpr Goldilocks neg() const
    {
        return Goldilocks(v_ == 0 ? 0 : kModulus - v_);
    }

    constexpr Goldilocks sub(Goldilocks rhs) const
    {
        return add(rhs.neg());
    }

    Goldilocks mul(Goldilocks rhs) const;

    /// @brief Raise to @p exp by square-and-multiply.
    Goldilocks pow(uint64_t exp) const;

    /// @brief Multiplicative inverse by Fermat; empty for zero.
    std::optional<Goldilocks> inverse() const;

    constexpr bool isZero() const
    {
        return v_ == 0;
    }

    friend constexpr bool operator==(Goldilocks a, Goldilocks b)
    {
        return a.v_ == b.v_;
    }

    friend constexpr bool operator!=(Goldilocks a, Goldilocks b)
    {
        return a.v_ != b.v_;
    }

  private:
    constexpr explicit Goldilocks(uint64_t canonical) : v_(canonical) {}

    uint64_t v_ = 0;
};

} // namespace talus::field
