// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

#include "exact-internal/NumberGrammar.hpp"
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace exact::detail
{
    namespace
    {
        bool isDigit(char c) noexcept
        {
            return (c >= '0') && (c <= '9');
        }

        bool isSpace(char c) noexcept
        {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        /** Forward-only scanner over the trimmed input. */
        class Cursor
        {
        public:
            explicit Cursor(std::string_view in_text) noexcept
                : _text{in_text}
            {}

            [[nodiscard]]
            bool atEnd() const noexcept
            {
                return _pos == _text.size();
            }

            /** Consume in_c if it is next. */
            bool accept(char in_c) noexcept
            {
                if (!atEnd() && (_text[_pos] == in_c))
                {
                    ++_pos;
                    return true;
                }
                return false;
            }

            /** Consume an optional '+' or '-'; true when it was '-'. */
            bool sign() noexcept
            {
                if (accept('-'))
                {
                    return true;
                }
                accept('+');
                return false;
            }

            /** Consume a (possibly empty) run of digits. */
            std::string_view digits() noexcept
            {
                auto const start = _pos;
                while (!atEnd() && isDigit(_text[_pos]))
                {
                    ++_pos;
                }
                return _text.substr(start, _pos - start);
            }

            /** Consume a (possibly empty) run of whitespace; true when any was consumed. */
            bool spaces() noexcept
            {
                auto const start = _pos;
                while (!atEnd() && isSpace(_text[_pos]))
                {
                    ++_pos;
                }
                return _pos != start;
            }

        private:
            std::string_view _text;
            std::size_t _pos = 0;
        };

        BigInt signedValue(bool in_negative, std::string_view in_digits)
        {
            auto value = parseDigits(in_digits);
            if (in_negative)
            {
                value = -value;
            }
            return value;
        }

        std::optional<RawFraction> parseInteger(std::string_view in_text)
        {
            auto cursor = Cursor{in_text};
            auto const negative = cursor.sign();
            auto const whole = cursor.digits();
            if (whole.empty() || !cursor.atEnd())
            {
                return std::nullopt;
            }
            return RawFraction{signedValue(negative, whole), BigInt{1}};
        }

        std::optional<RawFraction> parseFraction(std::string_view in_text)
        {
            auto cursor = Cursor{in_text};
            auto const negative = cursor.sign();
            auto const numerator = cursor.digits();
            if (numerator.empty() || !cursor.accept('/'))
            {
                return std::nullopt;
            }
            auto const denominator = cursor.digits();
            if (denominator.empty() || !cursor.atEnd())
            {
                return std::nullopt;
            }
            return RawFraction{signedValue(negative, numerator), parseDigits(denominator)};
        }

        /** Exponent digits must fit a 32-bit signed integer. */
        std::optional<std::int64_t> parseExponent(bool in_negative, std::string_view in_digits) noexcept
        {
            constexpr auto limit = static_cast<std::int64_t>(std::numeric_limits<std::int32_t>::max());

            auto value = std::int64_t{0};
            for (auto const c : in_digits)
            {
                value = value * 10 + (c - '0');
                if (value > limit + 1)
                {
                    return std::nullopt;
                }
            }
            if (!in_negative && (value > limit))
            {
                return std::nullopt;
            }
            return in_negative ? -value : value;
        }

        std::optional<RawFraction> parseDecimal(std::string_view in_text)
        {
            auto cursor = Cursor{in_text};
            auto const negative = cursor.sign();
            auto const whole = cursor.digits();
            if (whole.empty())
            {
                return std::nullopt;
            }

            auto fraction = std::string_view{};
            if (cursor.accept('.'))
            {
                fraction = cursor.digits();
            }

            auto exponent = -static_cast<std::int64_t>(fraction.size());
            if (cursor.accept('e') || cursor.accept('E'))
            {
                auto const negativeExponent = cursor.sign();
                auto const exponentDigits = cursor.digits();
                if (exponentDigits.empty())
                {
                    return std::nullopt;
                }
                auto const parsed = parseExponent(negativeExponent, exponentDigits);
                if (!parsed)
                {
                    return std::nullopt;
                }
                // The exponent applies to the concatenated digit string.
                exponent = *parsed;
            }

            if (!cursor.atEnd())
            {
                return std::nullopt;
            }

            auto digits = std::string{whole};
            digits.append(fraction);
            auto numerator = signedValue(negative, digits);

            if (exponent > 0)
            {
                numerator *= pow10(static_cast<unsigned>(exponent));
                return RawFraction{numerator, BigInt{1}};
            }
            return RawFraction{numerator, pow10(static_cast<unsigned>(-exponent))};
        }

        std::optional<RawFraction> parseMixed(std::string_view in_text)
        {
            auto cursor = Cursor{in_text};
            auto const negative = cursor.sign();
            auto const whole = cursor.digits();
            if (whole.empty() || !cursor.spaces())
            {
                return std::nullopt;
            }
            auto const numerator = cursor.digits();
            if (numerator.empty() || !cursor.accept('/'))
            {
                return std::nullopt;
            }
            auto const denominator = cursor.digits();
            if (denominator.empty() || !cursor.atEnd())
            {
                return std::nullopt;
            }

            auto const d = parseDigits(denominator);
            auto value = BigInt{parseDigits(whole) * d + parseDigits(numerator)};
            if (negative)
            {
                value = -value;
            }
            return RawFraction{value, d};
        }
    }

    std::string_view trimWhitespace(std::string_view in_text) noexcept
    {
        while (!in_text.empty() && isSpace(in_text.front()))
        {
            in_text.remove_prefix(1);
        }
        while (!in_text.empty() && isSpace(in_text.back()))
        {
            in_text.remove_suffix(1);
        }
        return in_text;
    }

    std::optional<ParsedNumber> parseNumber(std::string_view in_text)
    {
        auto const text = trimWhitespace(in_text);
        if (text.empty())
        {
            return std::nullopt;
        }

        if (auto value = parseInteger(text); value)
        {
            return ParsedNumber{NumberForm::Integer, std::move(*value)};
        }
        if (auto value = parseFraction(text); value)
        {
            return ParsedNumber{NumberForm::Fraction, std::move(*value)};
        }
        if (auto value = parseDecimal(text); value)
        {
            return ParsedNumber{NumberForm::Decimal, std::move(*value)};
        }
        if (auto value = parseMixed(text); value)
        {
            return ParsedNumber{NumberForm::Mixed, std::move(*value)};
        }
        return std::nullopt;
    }
}
