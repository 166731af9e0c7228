//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: field/Fixed.hpp
// Purpose: Deterministic fixed-point numbers encoded as Goldilocks elements.
// Key invariants: A Fixed holding raw r represents r / S for r <= p/2 and
//                 -(p - r) / S above the half-point; S = 2^16.
// Ownership/Lifetime: Trivially copyable value type.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "field/Goldilocks.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace talus::field
{

/// @brief Bits of fractional resolution.
inline constexpr unsigned kScaleBits = 16;

/// @brief Scale factor S.
inline constexpr uint64_t kScale = uint64_t{1} << kScaleBits;

/// @brief Longest dot product accepted by the fused accumulator.
/// @details With weights bounded by kMaxWeightMagnitude and integer features
///          bounded by kMaxFeatureMagnitude, 64 terms stay far below the
///          2^47 real headroom left above the fixed-point range.
inline constexpr size_t kMaxDotLength = 64;

/// @brief Largest real magnitude allowed for a learned weight.
inline constexpr int64_t kMaxWeightMagnitude = 256;

/// @brief Largest real magnitude allowed for an encoded feature.
inline constexpr int64_t kMaxFeatureMagnitude = 1 << 16;

/// @brief Largest signed scaled magnitude; beyond it values alias the other sign.
inline constexpr int64_t kMaxScaled = static_cast<int64_t>(kHalfModulus);

/// @brief Largest integer magnitude fromInt() encodes exactly.
inline constexpr int64_t kMaxFixedInt = kMaxScaled / static_cast<int64_t>(kScale);

/// @brief Fixed-point value with 16 fractional bits in the Goldilocks field.
/// @details The constructors saturate at +/-kMaxScaled instead of wrapping.
class Fixed
{
  public:
    constexpr Fixed() = default;

    /// @brief Encode a real number, rounding to the nearest 1/S.
    /// @details Magnitudes past the headroom saturate; NaN encodes as zero.
    static Fixed fromReal(double v);

    /// @brief Encode an integer exactly when |v| <= kMaxFixedInt, else saturate.
    static constexpr Fixed fromInt(int64_t v)
    {
        if (v > kMaxFixedInt)
            return fromScaled(kMaxScaled);
        if (v < -kMaxFixedInt)
            return fromScaled(-kMaxScaled);
        return Fixed(Goldilocks::fromI64(v * static_cast<int64_t>(kScale)));
    }

    /// @brief Encode a signed scaled integer (real value * S), saturating at
    ///        +/-kMaxScaled.
    static constexpr Fixed fromScaled(int64_t scaled)
    {
        if (scaled > kMaxScaled)
            scaled = kMaxScaled;
        else if (scaled < -kMaxScaled)
            scaled = -kMaxScaled;
        return Fixed(Goldilocks::fromI64(scaled));
    }

    /// @brief Wrap an already scaled field element.
    static constexpr Fixed fromRaw(Goldilocks g)
    {
        return Fixed(g);
    }

    static constexpr Fixed zero()
    {
        return Fixed();
    }

    static constexpr Fixed one()
    {
        return fromInt(1);
    }

    /// @brief Decode to a real number; the upper half of the field is negative.
    double toReal() const;

    /// @brief Signed scaled integer view used for deterministic ordering.
    int64_t toScaled() const;

    constexpr Goldilocks raw() const
    {
        return g_;
    }

    /// @brief Field addition; no rescale.
    constexpr Fixed add(Fixed rhs) const
    {
        return Fixed(g_.add(rhs.g_));
    }

    /// @brief Field subtraction; no rescale.
    constexpr Fixed sub(Fixed rhs) const
    {
        return Fixed(g_.sub(rhs.g_));
    }

    constexpr Fixed neg() const
    {
        return Fixed(g_.neg());
    }

    /// @brief Field multiply followed by one rescale by S^-1.
    Fixed mul(Fixed rhs) const;

    /// @brief Reciprocal such that x.mul(x.inv()) == one(); empty for zero.
    std::optional<Fixed> inv() const;

    /// @brief Keep the value when it lies at or below the half-point, else zero.
    Fixed relu() const;

    /// @brief Sign test against the canonical half-point.
    bool isNegative() const
    {
        return g_.value() > kHalfModulus;
    }

    /// @brief Clamp to [-limit, limit] in real units.
    Fixed clamp(int64_t limit) const;

    friend constexpr bool operator==(Fixed a, Fixed b)
    {
        return a.g_ == b.g_;
    }

    friend constexpr bool operator!=(Fixed a, Fixed b)
    {
        return a.g_ != b.g_;
    }

  private:
    constexpr explicit Fixed(Goldilocks g) : g_(g) {}

    Goldilocks g_{};
};

/// @brief Raw accumulator for fused dot products.
/// @details Sums raw products without per-term rescaling; finish() applies
///          S^-1 once.
class RawAccum
{
  public:
    /// @brief Accumulate a.raw * b.raw.
    void addProduct(Fixed a, Fixed b)
    {
        acc_ = acc_.add(a.raw().mul(b.raw()));
    }

    /// @brief Accumulate a bias already in fixed-point scale.
    void addBias(Fixed bias)
    {
        acc_ = acc_.add(bias.raw().mul(Goldilocks::fromU64(kScale)));
    }

    /// @brief Apply the single rescale and return the fixed-point sum.
    Fixed finish() const;

  private:
    Goldilocks acc_{};
};

/// @brief Fused dot product of two equally sized fixed-point vectors.
template <size_t N> Fixed dot(const std::array<Fixed, N> &a, const std::array<Fixed, N> &b)
{
    static_assert(N <= kMaxDotLength, "dot product exceeds the accumulation bound");
    RawAccum acc;
    for (size_t i = 0; i < N; ++i)
        acc.addProduct(a[i], b[i]);
    return acc.finish();
}

/// @brief Fused affine form dot(a, b) + bias with a single rescale.
template <size_t N>
Fixed affine(const std::array<Fixed, N> &a, const std::array<Fixed, N> &b, Fixed bias)
{
    static_assert(N < kMaxDotLength, "affine form exceeds the accumulation bound");
    RawAccum acc;
    acc.addBias(bias);
    for (size_t i = 0; i < N; ++i)
        acc.addProduct(a[i], b[i]);
    return acc.finish();
}

} // namespace talus::field
