//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: field/Fixed.cpp
// Purpose: Rescaling operations and real-number conversion for Fixed.
// Key invariants: Only fromReal/toReal touch floating point; everything the
//                 generator and trainer compute stays in the field.
//
//===----------------------------------------------------------------------===//

#include "field/Fixed.hpp"

#include <cmath>

namespace talus::field
{

namespace
{
/// @brief S^-1 mod p, computed once.
Goldilocks invScale()
{
    static const Goldilocks inv = *Goldilocks::fromU64(kScale).inverse();
    return inv;
}

/// @brief S^2 as a field element.
Goldilocks scaleSquared()
{
    static const Goldilocks s2 = Goldilocks::fromU64(kScale).mul(Goldilocks::fromU64(kScale));
    return s2;
}
} // namespace

Fixed Fixed::fromReal(double v)
{
    if (std::isnan(v))
        return Fixed();
    const double limit = static_cast<double>(kMaxScaled);
    const double scaled = std::round(v * static_cast<double>(kScale));
    if (scaled >= limit)
        return fromScaled(kMaxScaled);
    if (scaled <= -limit)
        return fromScaled(-kMaxScaled);
    if (scaled >= 0.0)
        return Fixed(Goldilocks::fromU64(static_cast<uint64_t>(scaled)));
    return Fixed(Goldilocks::fromU64(static_cast<uint64_t>(-scaled)).neg());
}

double Fixed::toReal() const
{
    const uint64_t r = g_.value();
    if (r <= kHalfModulus)
        return static_cast<double>(r) / static_cast<double>(kScale);
    return -static_cast<double>(kModulus - r) / static_cast<double>(kScale);
}

int64_t Fixed::toScaled() const
{
    const uint64_t r = g_.value();
    if (r <= kHalfModulus)
        return static_cast<int64_t>(r);
    return -static_cast<int64_t>(kModulus - r);
}

Fixed Fixed::mul(Fixed rhs) const
{
    return Fixed(g_.mul(rhs.g_).mul(invScale()));
}

std::optional<Fixed> Fixed::inv() const
{
    // x encodes v as v*S; 1/v must encode as S/v = S^2 * (v*S)^-1.
    auto raw = g_.inverse();
    if (!raw)
        return std::nullopt;
    return Fixed(raw->mul(scaleSquared()));
}

Fixed Fixed::relu() const
{
    return isNegative() ? Fixed() : *this;
}

Fixed Fixed::clamp(int64_t limit) const
{
    const int64_t bound = limit * static_cast<int64_t>(kScale);
    const int64_t s = toScaled();
    if (s > bound)
        return fromScaled(bound);
    if (s < -bound)
        return fromScaled(-bound);
    return *this;
}

Fixed RawAccum::finish() const
{
    return Fixed::fromRaw(acc_.mul(invScale()));
}

} // namespace talus::field
