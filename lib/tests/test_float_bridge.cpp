// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_float_bridge.cpp
 * @brief Unit tests for exact decomposition and reconstruction of IEEE 754 values
 *
 * Key concepts tested:
 *   - Normal numbers decompose to significand * 2^(exponent - bias - mantissaBits)
 *   - Subnormals use the denominator 2^(bias - 1 + mantissaBits)
 *   - Infinities and NaN payloads map to 1/0, -1/0 and 0/0
 *   - Reconstruction returns every representable value unchanged, including tiny normals
 *     and subnormals, and rounds everything else to the nearest value
 */

#include <cmath>
#include <limits>
#include <catch2/catch_test_macros.hpp>
#include <exact/Rational.hpp>
#include "Utils.hpp"

TEST_CASE("Double decomposition", "[float]")
{
    REQUIRE(exact::Rational::fromDouble(M_PI) == exact::Rational{exact::BigInt{"884279719003555"}, exact::BigInt{"281474976710656"}});
    REQUIRE(exact::Rational::fromDouble(0.1) == exact::Rational{exact::BigInt{"3602879701896397"}, exact::BigInt{"36028797018963968"}});
    REQUIRE(exact::Rational::fromDouble(-0.375) == exact::Rational{-3, 8});
    REQUIRE(exact::Rational::fromDouble(1024.0) == exact::Rational{1024});
    REQUIRE(exact::Rational::fromDouble(0.0).isZero());
    REQUIRE(exact::Rational::fromDouble(-0.0).isZero());
}

TEST_CASE("Float decomposition", "[float]")
{
    REQUIRE(exact::Rational::fromFloat(static_cast<float>(M_E)) == exact::Rational{2'850'325, 1'048'576});
    REQUIRE(exact::Rational::fromFloat(0.1f) == exact::Rational{13'421'773, 134'217'728});
    REQUIRE(exact::Rational::fromFloat(-2.5f) == exact::Rational{-5, 2});
}

TEST_CASE("Half decomposition", "[float]")
{
    REQUIRE(exact::Rational::fromHalf(exact::Half::fromBits(0x3C00)) == exact::Rational{1});
    REQUIRE(exact::Rational::fromHalf(exact::Half::fromBits(0x3555)) == exact::Rational{1365, 4096});
    REQUIRE(exact::Rational::fromHalf(exact::Half::fromBits(0x7BFF)) == exact::Rational{65504});
    REQUIRE(exact::Rational::fromHalf(exact::Half::fromBits(0xC000)) == exact::Rational{-2});
}

TEST_CASE("Subnormal decomposition", "[float]")
{
    auto const smallestDouble = exact::Rational::fromDouble(std::numeric_limits<double>::denorm_min());
    REQUIRE(smallestDouble.numerator() == 1);
    REQUIRE(smallestDouble.denominator() == exact::tests::pow2(1074));

    auto const smallestFloat = exact::Rational::fromFloat(std::numeric_limits<float>::denorm_min());
    REQUIRE(smallestFloat.numerator() == 1);
    REQUIRE(smallestFloat.denominator() == exact::tests::pow2(149));

    auto const smallestHalf = exact::Rational::fromHalf(exact::Half::fromBits(0x0001));
    REQUIRE(smallestHalf == exact::Rational{exact::BigInt{1}, exact::tests::pow2(24)});

    auto const negativeHalf = exact::Rational::fromHalf(exact::Half::fromBits(0x8003));
    REQUIRE(negativeHalf == exact::Rational{exact::BigInt{-3}, exact::tests::pow2(24)});
}

TEST_CASE("Non-finite decomposition", "[float]")
{
    REQUIRE(exact::Rational::fromDouble(std::numeric_limits<double>::infinity()).isPositiveInfinity());
    REQUIRE(exact::Rational::fromDouble(-std::numeric_limits<double>::infinity()).isNegativeInfinity());
    REQUIRE(exact::Rational::fromDouble(std::numeric_limits<double>::quiet_NaN()).isNaN());
    REQUIRE(exact::Rational::fromFloat(std::numeric_limits<float>::infinity()).isPositiveInfinity());
    REQUIRE(exact::Rational::fromFloat(std::numeric_limits<float>::quiet_NaN()).isNaN());
    REQUIRE(exact::Rational::fromHalf(exact::Half::fromBits(0xFC00)).isNegativeInfinity());
    REQUIRE(exact::Rational::fromHalf(exact::Half::fromBits(0x7E01)).isNaN());
}

TEST_CASE("Largest finite values decompose exactly", "[float]")
{
    auto const maxDouble = exact::Rational::fromDouble(std::numeric_limits<double>::max());
    REQUIRE(maxDouble.isInteger());
    REQUIRE(maxDouble.numerator() == exact::BigInt{exact::tests::pow2(1024) - exact::tests::pow2(971)});

    auto const maxFloat = exact::Rational::fromFloat(std::numeric_limits<float>::max());
    REQUIRE(maxFloat.numerator() == exact::BigInt{exact::tests::pow2(128) - exact::tests::pow2(104)});
}

TEST_CASE("Double reconstruction", "[float]")
{
    REQUIRE(exact::Rational{1, 3}.toDouble() == 1.0 / 3.0);
    REQUIRE(exact::Rational{-7, 2}.toDouble() == -3.5);
    REQUIRE(exact::Rational::fromDouble(M_PI).toDouble() == M_PI);
    REQUIRE(exact::Rational::fromDouble(0.1).toDouble() == 0.1);
    REQUIRE(static_cast<double>(exact::Rational{5, 4}) == 1.25);
}

TEST_CASE("Float reconstruction", "[float]")
{
    REQUIRE(exact::Rational{1, 10}.toFloat() == 0.1f);
    REQUIRE(exact::Rational::fromFloat(static_cast<float>(M_E)).toFloat() == static_cast<float>(M_E));
    REQUIRE(static_cast<float>(exact::Rational{-1, 4}) == -0.25f);
}

TEST_CASE("Half reconstruction", "[float]")
{
    REQUIRE(exact::Rational{1, 3}.toHalf().bits() == 0x3555);
    REQUIRE(exact::Rational{65504}.toHalf().bits() == 0x7BFF);
    REQUIRE(exact::Rational{-1, 2}.toHalf().bits() == 0xB800);
    REQUIRE(exact::Rational{100'000}.toHalf().isInfinity());
    REQUIRE(exact::Rational::nan().toHalf().isNaN());
}

TEST_CASE("Tiny and subnormal values survive reconstruction", "[float]")
{
    auto const doubles = {1e-300,
        -1e-300,
        1e-310,
        std::numeric_limits<double>::min(),
        std::numeric_limits<double>::denorm_min(),
        -std::numeric_limits<double>::denorm_min(),
        std::numeric_limits<double>::max(),
        std::nextafter(1.0, 2.0)};
    for (auto const value : doubles)
    {
        INFO(value);
        REQUIRE(exact::Rational::fromDouble(value).toDouble() == value);
    }

    auto const floats = {1e-38f,
        -1e-38f,
        1e-40f,
        std::numeric_limits<float>::min(),
        std::numeric_limits<float>::denorm_min(),
        std::numeric_limits<float>::max(),
        std::nextafter(1.0f, 2.0f)};
    for (auto const value : floats)
    {
        INFO(value);
        REQUIRE(exact::Rational::fromFloat(value).toFloat() == value);
    }

    REQUIRE(exact::Rational::fromHalf(exact::Half::fromBits(0x0001)).toHalf().bits() == 0x0001);
    REQUIRE(exact::Rational::fromHalf(exact::Half::fromBits(0x0400)).toHalf().bits() == 0x0400);
}

TEST_CASE("Reconstruction rounds to nearest", "[float]")
{
    // 1 + 2^-53 is halfway between 1 and the next double; the tie goes to the even significand.
    auto const tie = exact::Rational{exact::BigInt{exact::tests::pow2(53) + 1}, exact::tests::pow2(53)};
    REQUIRE(tie.toDouble() == 1.0);

    // Just above the tie rounds up.
    auto const aboveTie = exact::Rational{exact::BigInt{exact::tests::pow2(1000) * (exact::tests::pow2(53) + 1) + 1}, exact::tests::pow2(1053)};
    REQUIRE(aboveTie.toDouble() == std::nextafter(1.0, 2.0));

    // Past the largest finite value the result saturates.
    REQUIRE(exact::Rational{exact::tests::pow2(1024)}.toDouble() == std::numeric_limits<double>::infinity());
    REQUIRE(exact::Rational{exact::BigInt{-exact::tests::pow2(128)}}.toFloat() == -std::numeric_limits<float>::infinity());
}

TEST_CASE("Huge denominators are rescaled", "[float]")
{
    // 3 / 2^1100 is below the smallest subnormal after rescaling to 512 bits.
    auto const tiny = exact::Rational{exact::BigInt{3}, exact::tests::pow2(1100)};
    REQUIRE(tiny.toDouble() == 0.0);

    // A value with a 1100-bit denominator but a large integer part keeps its integer part.
    auto const mixed = exact::Rational{exact::BigInt{exact::tests::pow2(1100) * 5 + 1}, exact::tests::pow2(1100)};
    REQUIRE(mixed.toDouble() == 5.0);

    auto const smallFloat = exact::Rational{exact::BigInt{1}, exact::tests::pow2(200)};
    REQUIRE(smallFloat.toFloat() == 0.0f);
}

TEST_CASE("Non-finite reconstruction", "[float]")
{
    REQUIRE(std::isnan(exact::Rational::nan().toDouble()));
    REQUIRE(exact::Rational::positiveInfinity().toDouble() == std::numeric_limits<double>::infinity());
    REQUIRE(exact::Rational::negativeInfinity().toFloat() == -std::numeric_limits<float>::infinity());
    REQUIRE(exact::Rational::negativeInfinity().toHalf().bits() == 0xFC00);
}
