// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_options.cpp
 * @brief Unit tests for JSON formatting options
 */

#include <catch2/catch_test_macros.hpp>
#include <exact/Options.hpp>
#include <exact/Rational.hpp>
#include "Utils.hpp"

using namespace exact::tests;

TEST_CASE("Default options", "[options]")
{
    auto const options = exact::Options{};
    REQUIRE(options.defaultFormat() == "F");
    REQUIRE(options.decimalDigits() == 15U);

    auto const empty = exact::Options{std::string{}};
    REQUIRE(empty.defaultFormat() == "F");
    REQUIRE(empty.decimalDigits() == 15U);

    REQUIRE(exact::Rational{1, 3}.toString(options) == "1/3");
}

TEST_CASE("Options from JSON text", "[options]")
{
    auto const options = exact::Options{R"({"defaultFormat": "W", "unknown": true})"};
    REQUIRE(options.defaultFormat() == "W");
    REQUIRE(options.decimalDigits() == 15U);
    REQUIRE(exact::Rational{7, 2}.toString(options) == "3 1/2");

    auto const digits = exact::Options{R"({"defaultFormat": "D", "decimalDigits": 4})"};
    REQUIRE(exact::Rational{1, 3}.toString(digits) == "0.3333");

    // An explicit digit count in the specifier wins over decimalDigits.
    auto const explicitDigits = exact::Options{R"({"defaultFormat": "D2", "decimalDigits": 4})"};
    REQUIRE(exact::Rational{1, 3}.toString(explicitDigits) == "0.33");
}

TEST_CASE("Invalid options are rejected", "[options]")
{
    auto const reject = [](std::string const& json) { return thrownStatus([&] { (void)exact::Options{json}; }); };

    REQUIRE(reject("{") == EXACT_ERR_INVALID_ARG);
    REQUIRE(reject("[1, 2]") == EXACT_ERR_INVALID_ARG);
    REQUIRE(reject(R"({"decimalDigits": "ten"})") == EXACT_ERR_INVALID_ARG);
    REQUIRE(reject(R"({"decimalDigits": -1})") == EXACT_ERR_INVALID_ARG);
    REQUIRE(reject(R"({"decimalDigits": 2.5})") == EXACT_ERR_INVALID_ARG);
    REQUIRE(reject(R"({"decimalDigits": 10001})") == EXACT_ERR_INVALID_ARG);
    REQUIRE(reject(R"({"defaultFormat": 3})") == EXACT_ERR_INVALID_ARG);
    REQUIRE(reject(R"({"defaultFormat": "X"})") == EXACT_ERR_INVALID_ARG);
}

TEST_CASE("Options from a data file", "[options]")
{
    auto const options = exact::Options::fromFile("data/decimal_options.json");
    REQUIRE(options.defaultFormat() == "D");
    REQUIRE(options.decimalDigits() == 30U);

    // The file content and the string constructor agree.
    auto const fromText = exact::Options{readFile("data/decimal_options.json")};
    REQUIRE(fromText.defaultFormat() == options.defaultFormat());
    REQUIRE(fromText.decimalDigits() == options.decimalDigits());

    REQUIRE(exact::Rational{1, 7}.toString(options) == "0.142857142857142857142857142857");
}

TEST_CASE_METHOD(TempFileFixture, "Options from a temporary file", "[options]")
{
    write(R"({"defaultFormat": "D3"})");
    auto const options = exact::Options::fromFile(file);
    // Decimal digits are truncated, not rounded.
    REQUIRE(exact::Rational{2, 3}.toString(options) == "0.666");

    write("not json");
    REQUIRE(thrownStatus([&] { (void)exact::Options::fromFile(file); }) == EXACT_ERR_INVALID_ARG);
}

TEST_CASE("Missing options file", "[options]")
{
    REQUIRE(thrownStatus([] { (void)exact::Options::fromFile("data/does_not_exist.json"); }) == EXACT_ERR_INVALID_ARG);
}
