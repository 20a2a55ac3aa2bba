// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file NumberGrammar.hpp
 * @brief Non-throwing recognizer for the textual forms of a rational number
 *
 * Accepted forms, tried in this order after trimming surrounding whitespace:
 *
 * | Form        | Shape                                   | Example      |
 * |-------------|-----------------------------------------|--------------|
 * | Integer     | [+-]?digits                             | -42          |
 * | Fraction    | [+-]?digits/digits                      | 3/4          |
 * | Decimal     | [+-]?digits(.digits*)?([eE][+-]?digits)? | 1.234e-100   |
 * | Mixed       | [+-]?digits whitespace digits/digits    | 3 1/2        |
 *
 * The recognizer never throws for malformed input; it returns std::nullopt instead.
 */

#pragma once

#include <optional>
#include <string_view>
#include "exact-internal/BigIntUtils.hpp"

namespace exact::detail
{
    /** Which grammar matched. */
    enum class NumberForm
    {
        Integer,
        Fraction,
        Decimal,
        Mixed,
    };

    struct ParsedNumber
    {
        NumberForm form;
        RawFraction value;
    };

    /**
     * Recognize in_text as one of the accepted forms.
     *
     * @return the matched form and its un-normalized fraction, or std::nullopt
     */
    std::optional<ParsedNumber> parseNumber(std::string_view in_text);

    /** in_text without leading and trailing whitespace. */
    std::string_view trimWhitespace(std::string_view in_text) noexcept;
}
