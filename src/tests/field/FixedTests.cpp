//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/field/FixedTests.cpp
// Purpose: Fixed-point encode/decode, arithmetic and fused accumulation.
// Key invariants: Round trips are exact to within one unit of 1/S across the
//                 whole usable range, including values near the headroom edge.
// Ownership/Lifetime: Pure value tests.
// Links: src/field/Fixed.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "field/Fixed.hpp"

#include <array>
#include <cmath>
#include <limits>

using talus::field::Fixed;
using talus::field::kMaxFixedInt;
using talus::field::kMaxScaled;
using talus::field::kScale;

namespace
{
constexpr double kUlp = 1.0 / static_cast<double>(kScale);
}

TEST(FixedTest, RoundTripSweep)
{
    for (double v = -40000.0; v <= 40000.0; v += 137.03125)
        EXPECT_NEAR(Fixed::fromReal(v).toReal(), v, kUlp) << v;
    for (double v = -1.0; v <= 1.0; v += 0.0078125)
        EXPECT_NEAR(Fixed::fromReal(v).toReal(), v, kUlp) << v;
}

TEST(FixedTest, RoundTripNearHeadroom)
{
    // Magnitudes up to 2^46 remain below the half-point of the field.
    const int64_t big = int64_t{1} << 46;
    EXPECT_EQ(Fixed::fromInt(big).toScaled(), big * static_cast<int64_t>(kScale));
    EXPECT_EQ(Fixed::fromInt(-big).toScaled(), -big * static_cast<int64_t>(kScale));
    EXPECT_FALSE(Fixed::fromInt(big).isNegative());
    EXPECT_TRUE(Fixed::fromInt(-big).isNegative());
    EXPECT_DOUBLE_EQ(Fixed::fromInt(big - 1).toReal(), static_cast<double>(big - 1));
}

TEST(FixedTest, HeadroomBoundarySaturates)
{
    const int64_t s = static_cast<int64_t>(kScale);
    EXPECT_EQ(Fixed::fromInt(kMaxFixedInt).toScaled(), kMaxFixedInt * s);
    EXPECT_EQ(Fixed::fromInt(-kMaxFixedInt).toScaled(), -kMaxFixedInt * s);
    EXPECT_EQ(Fixed::fromInt(kMaxFixedInt + 1).toScaled(), kMaxScaled);
    EXPECT_EQ(Fixed::fromInt(-kMaxFixedInt - 1).toScaled(), -kMaxScaled);
    EXPECT_EQ(Fixed::fromInt(std::numeric_limits<int64_t>::max()).toScaled(), kMaxScaled);
    EXPECT_EQ(Fixed::fromInt(std::numeric_limits<int64_t>::min()).toScaled(), -kMaxScaled);

    EXPECT_EQ(Fixed::fromScaled(kMaxScaled).toScaled(), kMaxScaled);
    EXPECT_EQ(Fixed::fromScaled(kMaxScaled + 1).toScaled(), kMaxScaled);
    EXPECT_FALSE(Fixed::fromScaled(kMaxScaled).isNegative());
    EXPECT_TRUE(Fixed::fromScaled(-kMaxScaled).isNegative());
}

TEST(FixedTest, OutOfRangeRealsSaturate)
{
    const double edge = static_cast<double>(kMaxFixedInt);
    EXPECT_DOUBLE_EQ(Fixed::fromReal(edge).toReal(), edge);
    EXPECT_FALSE(Fixed::fromReal(1.5e14).isNegative());
    EXPECT_EQ(Fixed::fromReal(1.5e14).toScaled(), kMaxScaled);
    EXPECT_EQ(Fixed::fromReal(1e15).toScaled(), kMaxScaled);
    EXPECT_EQ(Fixed::fromReal(-1e15).toScaled(), -kMaxScaled);
    EXPECT_EQ(Fixed::fromReal(std::numeric_limits<double>::infinity()).toScaled(), kMaxScaled);
    EXPECT_EQ(Fixed::fromReal(std::nan("")), Fixed::zero());
}

TEST(FixedTest, MultiplyRescalesOnce)
{
    EXPECT_EQ(Fixed::fromInt(3).mul(Fixed::fromInt(-4)), Fixed::fromInt(-12));
    EXPECT_EQ(Fixed::fromReal(0.5).mul(Fixed::fromReal(0.5)), Fixed::fromReal(0.25));
    EXPECT_EQ(Fixed::fromInt(7).mul(Fixed::one()), Fixed::fromInt(7));
    EXPECT_EQ(Fixed::fromInt(2).add(Fixed::fromInt(5)).sub(Fixed::fromInt(1)), Fixed::fromInt(6));
}

TEST(FixedTest, InverseProducesOne)
{
    EXPECT_FALSE(Fixed::zero().inv().has_value());
    for (int64_t v : {1, 2, 4, -8, 1000})
    {
        auto inv = Fixed::fromInt(v).inv();
        ASSERT_TRUE(inv.has_value());
        EXPECT_EQ(Fixed::fromInt(v).mul(*inv), Fixed::one()) << v;
    }
    EXPECT_EQ(*Fixed::fromInt(4).inv(), Fixed::fromReal(0.25));
}

TEST(FixedTest, ReluAndClamp)
{
    EXPECT_EQ(Fixed::fromInt(-3).relu(), Fixed::zero());
    EXPECT_EQ(Fixed::fromInt(3).relu(), Fixed::fromInt(3));
    EXPECT_EQ(Fixed::fromInt(1000).clamp(256), Fixed::fromInt(256));
    EXPECT_EQ(Fixed::fromInt(-1000).clamp(256), Fixed::fromInt(-256));
    EXPECT_EQ(Fixed::fromReal(1.5).clamp(256), Fixed::fromReal(1.5));
}

TEST(FixedTest, FusedDotAndAffine)
{
    const std::array<Fixed, 3> w{Fixed::fromInt(1), Fixed::fromInt(-2), Fixed::fromReal(0.5)};
    const std::array<Fixed, 3> x{Fixed::fromInt(4), Fixed::fromInt(5), Fixed::fromInt(6)};
    EXPECT_EQ(talus::field::dot(w, x), Fixed::fromInt(-3));
    EXPECT_EQ(talus::field::affine(w, x, Fixed::fromInt(10)), Fixed::fromInt(7));
}
