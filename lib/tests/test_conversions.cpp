// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_conversions.cpp
 * @brief Unit tests for integer, decimal and complex conversions
 */

#include <complex>
#include <cstdint>
#include <limits>
#include <catch2/catch_test_macros.hpp>
#include <exact/Decimal.hpp>
#include <exact/Rational.hpp>
#include "Utils.hpp"

using namespace exact::tests;

TEST_CASE("Integer conversion truncates toward zero", "[conversions]")
{
    REQUIRE(exact::Rational{7, 2}.toInteger<int>() == 3);
    REQUIRE(exact::Rational{-7, 2}.toInteger<int>() == -3);
    REQUIRE(exact::Rational{1, 3}.toInteger<std::int64_t>() == 0);
    REQUIRE(exact::Rational{pow10(30), exact::BigInt{7}}.toBigInt() == exact::BigInt{"142857142857142857142857142857"});

    auto const largest = std::numeric_limits<std::int64_t>::max();
    REQUIRE(exact::Rational{largest}.toInteger<std::int64_t>() == largest);
    auto const smallest = std::numeric_limits<std::int64_t>::min();
    REQUIRE(exact::Rational{smallest}.toInteger<std::int64_t>() == smallest);
    auto const unsignedLargest = std::numeric_limits<std::uint64_t>::max();
    REQUIRE(exact::Rational{unsignedLargest}.toInteger<std::uint64_t>() == unsignedLargest);
}

TEST_CASE("Out of range integer conversions", "[conversions]")
{
    auto const big = exact::Rational{300};

    REQUIRE(thrownStatus([&] { (void)big.toInteger<std::int8_t>(); }) == EXACT_ERR_OVERFLOW);
    REQUIRE_FALSE(big.tryToInteger<std::int8_t>().has_value());
    REQUIRE(big.toIntegerSaturating<std::int8_t>() == 127);
    REQUIRE((-big).toIntegerSaturating<std::int8_t>() == -128);

    auto const negative = exact::Rational{-1};
    REQUIRE_FALSE(negative.tryToInteger<unsigned>().has_value());
    REQUIRE(negative.toIntegerSaturating<unsigned>() == 0U);

    auto const beyond = exact::Rational{pow2(64)};
    REQUIRE(thrownStatus([&] { (void)beyond.toInteger<std::uint64_t>(); }) == EXACT_ERR_OVERFLOW);
    REQUIRE(beyond.toIntegerSaturating<std::uint64_t>() == std::numeric_limits<std::uint64_t>::max());
}

TEST_CASE("Non-finite integer conversions", "[conversions]")
{
    auto const nan = exact::Rational::nan();
    auto const inf = exact::Rational::positiveInfinity();
    auto const minusInf = exact::Rational::negativeInfinity();

    REQUIRE(thrownStatus([&] { (void)nan.toBigInt(); }) == EXACT_ERR_DIVIDE_BY_ZERO);
    REQUIRE(thrownStatus([&] { (void)inf.toInteger<int>(); }) == EXACT_ERR_DIVIDE_BY_ZERO);
    REQUIRE_FALSE(minusInf.tryToInteger<int>().has_value());

    REQUIRE(nan.toIntegerSaturating<int>() == 0);
    REQUIRE(inf.toIntegerSaturating<int>() == std::numeric_limits<int>::max());
    REQUIRE(minusInf.toIntegerSaturating<int>() == std::numeric_limits<int>::min());
}

TEST_CASE("Decimal to rational", "[conversions][decimal]")
{
    REQUIRE(exact::Rational::fromDecimal(exact::Decimal{125, 0, 0, false, 2}) == exact::Rational{5, 4});
    REQUIRE(exact::Rational::fromDecimal(exact::Decimal::fromInt64(-7)) == exact::Rational{-7});
    REQUIRE(exact::Rational::fromDecimal(exact::Decimal{}).isZero());
    REQUIRE(exact::Rational::fromDecimal(exact::Decimal{1, 0, 0, false, 28}) == exact::Rational{exact::BigInt{1}, pow10(28)});

    // 2^96 - 1 at the maximum scale
    auto const all = exact::Decimal{0xFFFF'FFFFU, 0xFFFF'FFFFU, 0xFFFF'FFFFU, true, 28};
    REQUIRE(exact::Rational::fromDecimal(all) == exact::Rational{exact::BigInt{-(pow2(96) - 1)}, pow10(28)});
}

TEST_CASE("Rational to decimal", "[conversions][decimal]")
{
    SECTION("Repeating fractions use the largest scale that fits")
    {
        REQUIRE(exact::Rational{1, 3}.toDecimal().toString() == "0.3333333333333333333333333333");
        REQUIRE(exact::Rational{2, 3}.toDecimal().toString() == "0.6666666666666666666666666667");
        REQUIRE(exact::Rational{-2, 3}.toDecimal().toString() == "-0.6666666666666666666666666667");

        auto const hundredThirds = exact::Rational{100, 3}.toDecimal();
        REQUIRE(hundredThirds.scale() == 27);
        REQUIRE(hundredThirds.toString() == "33.333333333333333333333333333");
    }

    SECTION("Trailing zeros are stripped")
    {
        auto const quarter = exact::Rational{-1, 4}.toDecimal();
        REQUIRE(quarter.scale() == 2);
        REQUIRE(quarter.toString() == "-0.25");
        REQUIRE(exact::Rational{42}.toDecimal() == exact::Decimal::fromInt64(42));
        REQUIRE(exact::Rational{42}.toDecimal().scale() == 0);
    }

    SECTION("Ties round to even")
    {
        auto const unit = exact::BigInt{pow10(28) * 2};
        REQUIRE(exact::Rational{exact::BigInt{1}, unit}.toDecimal().isZero());
        REQUIRE(exact::Rational{exact::BigInt{3}, unit}.toDecimal().toString() == "0.0000000000000000000000000002");
        REQUIRE(exact::Rational{exact::BigInt{5}, unit}.toDecimal().toString() == "0.0000000000000000000000000002");
        REQUIRE(exact::Rational{exact::BigInt{7}, unit}.toDecimal().toString() == "0.0000000000000000000000000004");
    }

    SECTION("Range limits")
    {
        auto const largest = exact::BigInt{pow2(96) - 1};
        REQUIRE(exact::Rational{largest}.toDecimal().toString() == "79228162514264337593543950335");
        REQUIRE(thrownStatus([] { (void)exact::Rational{pow2(96)}.toDecimal(); }) == EXACT_ERR_OVERFLOW);
        REQUIRE(thrownStatus([] { (void)exact::Rational::nan().toDecimal(); }) == EXACT_ERR_OVERFLOW);
        REQUIRE(thrownStatus([] { (void)exact::Rational::negativeInfinity().toDecimal(); }) == EXACT_ERR_OVERFLOW);
    }
}

TEST_CASE("Decimal value type", "[conversions][decimal]")
{
    REQUIRE(thrownStatus([] { (void)exact::Decimal{1, 0, 0, false, 29}; }) == EXACT_ERR_INVALID_ARG);
    REQUIRE(exact::Decimal{10, 0, 0, false, 1} == exact::Decimal{1, 0, 0, false, 0});
    REQUIRE(exact::Decimal{5, 0, 0, false, 3}.toString() == "0.005");
    REQUIRE(exact::Decimal::fromInt64(std::numeric_limits<std::int64_t>::min()).toString() == "-9223372036854775808");
}

TEST_CASE("Complex conversions", "[conversions]")
{
    REQUIRE(exact::Rational::fromComplex({0.5, 0.0}) == exact::Rational::half());
    REQUIRE(thrownStatus([] { (void)exact::Rational::fromComplex({1.0, 1.0}); }) == EXACT_ERR_INVALID_ARG);

    auto const value = exact::Rational{1, 4}.toComplex();
    REQUIRE(value.real() == 0.25);
    REQUIRE(value.imag() == 0.0);

    REQUIRE(static_cast<double>(exact::Rational{-3, 8}) == -0.375);
    REQUIRE(static_cast<float>(exact::Rational{3, 4}) == 0.75f);
}
