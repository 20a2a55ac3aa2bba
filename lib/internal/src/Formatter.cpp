// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

#include "exact-internal/Formatter.hpp"
#include <fmt/format.h>

namespace exact::detail
{
    namespace
    {
        /** Name of a non-finite value in the "D" and "W" formats. */
        std::string nonFiniteName(BigInt const& in_numerator)
        {
            if (in_numerator > 0)
            {
                return "Infinity";
            }
            if (in_numerator < 0)
            {
                return "-Infinity";
            }
            return "NaN";
        }

        /** Whole part with a '-' kept even when the truncated integer is zero. */
        std::string wholePart(BigInt const& in_numerator, BigInt const& in_whole)
        {
            if ((in_numerator < 0) && in_whole.is_zero())
            {
                return "-0";
            }
            return in_whole.str();
        }

        std::string formatDecimal(BigInt const& in_numerator, BigInt const& in_denominator, unsigned in_digits)
        {
            auto const whole = BigInt{in_numerator / in_denominator};
            if (in_digits == 0)
            {
                return wholePart(in_numerator, whole);
            }

            auto const remainder = BigInt{abs(in_numerator) % in_denominator};
            auto const fraction = BigInt{remainder * pow10(in_digits) / in_denominator};
            return fmt::format("{}.{:0>{}}", wholePart(in_numerator, whole), fraction.str(), in_digits);
        }

        std::string formatMixed(BigInt const& in_numerator, BigInt const& in_denominator)
        {
            auto const whole = BigInt{in_numerator / in_denominator};
            auto const remainder = BigInt{abs(in_numerator) % in_denominator};
            return fmt::format("{} {}/{}", wholePart(in_numerator, whole), remainder.str(), in_denominator.str());
        }
    }

    std::optional<FormatSpec> parseFormatSpec(std::string_view in_format, unsigned in_defaultDigits) noexcept
    {
        if (in_format.empty() || (in_format == "F"))
        {
            return FormatSpec{FormatSpec::Kind::Fraction, in_defaultDigits};
        }
        if (in_format == "W")
        {
            return FormatSpec{FormatSpec::Kind::Mixed, in_defaultDigits};
        }
        if (in_format.front() != 'D')
        {
            return std::nullopt;
        }

        auto const digits = in_format.substr(1);
        if (digits.empty())
        {
            return FormatSpec{FormatSpec::Kind::Decimal, in_defaultDigits};
        }

        auto count = 0U;
        for (auto const c : digits)
        {
            if ((c < '0') || (c > '9'))
            {
                return std::nullopt;
            }
            count = count * 10U + static_cast<unsigned>(c - '0');
            if (count > MAX_DECIMAL_DIGITS)
            {
                return std::nullopt;
            }
        }
        return FormatSpec{FormatSpec::Kind::Decimal, count};
    }

    std::string formatFraction(BigInt const& in_numerator, BigInt const& in_denominator, FormatSpec const& in_spec)
    {
        switch (in_spec.kind)
        {
            case FormatSpec::Kind::Fraction: return fmt::format("{}/{}", in_numerator.str(), in_denominator.str());
            case FormatSpec::Kind::Decimal:
                return in_denominator.is_zero() ? nonFiniteName(in_numerator) : formatDecimal(in_numerator, in_denominator, in_spec.digits);
            case FormatSpec::Kind::Mixed:
                return in_denominator.is_zero() ? nonFiniteName(in_numerator) : formatMixed(in_numerator, in_denominator);
        }
        return {};
    }
}
