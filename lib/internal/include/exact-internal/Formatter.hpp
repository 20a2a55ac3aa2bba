// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Formatter.hpp
 * @brief Text rendering of canonical numerator/denominator pairs
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include "exact-internal/BigIntUtils.hpp"

namespace exact::detail
{
    /** Upper bound on the number of fractional digits the "D" format renders. */
    constexpr auto MAX_DECIMAL_DIGITS = 10'000U;

    /** Digits rendered by a bare "D" when no options say otherwise. */
    constexpr auto DEFAULT_DECIMAL_DIGITS = 15U;

    struct FormatSpec
    {
        enum class Kind
        {
            Fraction, ///< "F" or empty: n/d
            Decimal,  ///< "D<n>": truncated decimal notation
            Mixed,    ///< "W": whole part followed by the proper fraction
        };

        Kind kind = Kind::Fraction;
        unsigned digits = DEFAULT_DECIMAL_DIGITS;
    };

    /**
     * Decode a format specifier.
     *
     * @param in_defaultDigits Digit count used by a bare "D".
     * @return std::nullopt for unknown specifiers and digit counts above MAX_DECIMAL_DIGITS
     */
    std::optional<FormatSpec> parseFormatSpec(std::string_view in_format, unsigned in_defaultDigits) noexcept;

    /** Render a canonical pair according to in_spec. */
    std::string formatFraction(BigInt const& in_numerator, BigInt const& in_denominator, FormatSpec const& in_spec);
}
