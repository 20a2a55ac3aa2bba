// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file BigIntUtils.hpp
 * @brief Helpers on top of boost::multiprecision::cpp_int shared by the numeric code
 */

#pragma once

#include <cstddef>
#include <string_view>
#include <exact/Rational.hpp>

namespace exact::detail
{
    /**
     * A numerator/denominator pair that has not been normalized yet.
     * Every producer (float bridge, parser, arithmetic) builds one of these and hands it
     * to the Rational constructor.
     */
    struct RawFraction
    {
        BigInt numerator;
        BigInt denominator;
    };

    /** 10^in_exponent. */
    BigInt pow10(unsigned in_exponent);

    /** 2^in_exponent. */
    BigInt pow2(unsigned in_exponent);

    /**
     * Convert a string of decimal digits to an integer.
     *
     * The input must be non-empty and contain only '0'..'9'. Leading zeros are plain
     * decimal digits (unlike cpp_int's own string constructor, which reads them as octal).
     */
    BigInt parseDigits(std::string_view in_digits);

    /** Index of the most significant set bit of a positive value, i.e. floor(log2(value)). */
    std::size_t floorLog2(BigInt const& in_value);

    /** Natural logarithm of a value as a double; -inf for zero and NaN for negative values. */
    double naturalLog(BigInt const& in_value);
}
