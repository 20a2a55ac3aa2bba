// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Arithmetic.cpp
 * @brief Operators and elementary functions on exact::Rational
 *
 * All operators use the plain cross-product formulas and let the normalizing constructor
 * sort out the result, including the non-finite cases:
 * - Infinity + 1 = (1 * 1 + 1 * 0) / (0 * 1) = 1/0 = Infinity
 * - Infinity - Infinity = (1 * 0 - 1 * 0) / 0 = 0/0 = NaN
 * - Infinity * 0 = 0/0 = NaN
 */

#include <exact/Rational.hpp>
#include <cmath>
#include <limits>
#include "exact-internal/BigIntUtils.hpp"

namespace exact
{
    Rational& Rational::operator++()
    {
        *this = Rational{BigInt{_numerator + _denominator}, _denominator};
        return *this;
    }

    Rational Rational::operator++(int)
    {
        auto const previous = *this;
        ++*this;
        return previous;
    }

    Rational& Rational::operator--()
    {
        *this = Rational{BigInt{_numerator - _denominator}, _denominator};
        return *this;
    }

    Rational Rational::operator--(int)
    {
        auto const previous = *this;
        --*this;
        return previous;
    }

    Rational& Rational::operator+=(Rational const& in_other)
    {
        *this = *this + in_other;
        return *this;
    }

    Rational& Rational::operator-=(Rational const& in_other)
    {
        *this = *this - in_other;
        return *this;
    }

    Rational& Rational::operator*=(Rational const& in_other)
    {
        *this = *this * in_other;
        return *this;
    }

    Rational& Rational::operator/=(Rational const& in_other)
    {
        *this = *this / in_other;
        return *this;
    }

    Rational& Rational::operator%=(Rational const& in_other)
    {
        *this = *this % in_other;
        return *this;
    }

    Rational operator+(Rational const& in_value)
    {
        return in_value;
    }

    Rational operator-(Rational const& in_value)
    {
        return Rational{BigInt{-in_value.numerator()}, in_value.denominator()};
    }

    Rational operator+(Rational const& lhs, Rational const& rhs)
    {
        return Rational{BigInt{lhs.numerator() * rhs.denominator() + rhs.numerator() * lhs.denominator()},
            BigInt{lhs.denominator() * rhs.denominator()}};
    }

    Rational operator-(Rational const& lhs, Rational const& rhs)
    {
        return Rational{BigInt{lhs.numerator() * rhs.denominator() - rhs.numerator() * lhs.denominator()},
            BigInt{lhs.denominator() * rhs.denominator()}};
    }

    Rational operator*(Rational const& lhs, Rational const& rhs)
    {
        return Rational{BigInt{lhs.numerator() * rhs.numerator()}, BigInt{lhs.denominator() * rhs.denominator()}};
    }

    Rational operator/(Rational const& lhs, Rational const& rhs)
    {
        return Rational{BigInt{lhs.numerator() * rhs.denominator()}, BigInt{lhs.denominator() * rhs.numerator()}};
    }

    Rational operator%(Rational const& lhs, Rational const& rhs)
    {
        return lhs - rhs * truncate(lhs / rhs);
    }

    bool operator==(Rational const& lhs, Rational const& rhs) noexcept
    {
        return lhs.equals(rhs);
    }

    bool operator!=(Rational const& lhs, Rational const& rhs) noexcept
    {
        return !lhs.equals(rhs);
    }

    bool operator<(Rational const& lhs, Rational const& rhs)
    {
        return lhs.compareTo(rhs) < 0;
    }

    bool operator<=(Rational const& lhs, Rational const& rhs)
    {
        return lhs.compareTo(rhs) <= 0;
    }

    bool operator>(Rational const& lhs, Rational const& rhs)
    {
        return lhs.compareTo(rhs) > 0;
    }

    bool operator>=(Rational const& lhs, Rational const& rhs)
    {
        return lhs.compareTo(rhs) >= 0;
    }

    Rational inverse(Rational const& in_value)
    {
        return Rational{in_value.denominator(), in_value.numerator()};
    }

    Rational abs(Rational const& in_value)
    {
        return in_value.isNegative() ? -in_value : in_value;
    }

    Rational negate(Rational const& in_value)
    {
        return -in_value;
    }

    Rational floor(Rational const& in_value)
    {
        if (!in_value.isFinite() || in_value.isInteger())
        {
            return in_value;
        }

        // Truncating division rounds toward zero; step down once for negative values.
        auto whole = BigInt{in_value.numerator() / in_value.denominator()};
        if (in_value.isNegative())
        {
            --whole;
        }
        return Rational{whole};
    }

    Rational ceiling(Rational const& in_value)
    {
        if (!in_value.isFinite() || in_value.isInteger())
        {
            return in_value;
        }

        auto whole = BigInt{in_value.numerator() / in_value.denominator()};
        if (in_value.isPositive())
        {
            ++whole;
        }
        return Rational{whole};
    }

    Rational round(Rational const& in_value)
    {
        return floor(in_value + Rational::half());
    }

    Rational truncate(Rational const& in_value)
    {
        if (!in_value.isFinite())
        {
            return in_value;
        }
        return Rational{BigInt{in_value.numerator() / in_value.denominator()}};
    }

    Rational modulo(Rational const& lhs, Rational const& rhs)
    {
        return lhs - rhs * floor(lhs / rhs);
    }

    Rational min(Rational const& lhs, Rational const& rhs)
    {
        return (lhs.compareTo(rhs) < 0) ? lhs : rhs;
    }

    Rational max(Rational const& lhs, Rational const& rhs)
    {
        return (lhs.compareTo(rhs) > 0) ? lhs : rhs;
    }

    namespace
    {
        /** Sign of |lhs| - |rhs|, using the cross products so that infinities order above every finite value. */
        int compareMagnitude(Rational const& lhs, Rational const& rhs)
        {
            auto const left = BigInt{abs(lhs.numerator()) * rhs.denominator()};
            auto const right = BigInt{abs(rhs.numerator()) * lhs.denominator()};
            return (left > right) - (left < right);
        }
    }

    Rational maxMagnitude(Rational const& lhs, Rational const& rhs)
    {
        return (compareMagnitude(lhs, rhs) < 0) ? rhs : lhs;
    }

    Rational minMagnitude(Rational const& lhs, Rational const& rhs)
    {
        return (compareMagnitude(lhs, rhs) > 0) ? rhs : lhs;
    }

    Rational maxMagnitudeNumber(Rational const& lhs, Rational const& rhs)
    {
        if (lhs.isNaN())
        {
            return rhs;
        }
        if (rhs.isNaN())
        {
            return lhs;
        }
        return maxMagnitude(lhs, rhs);
    }

    Rational minMagnitudeNumber(Rational const& lhs, Rational const& rhs)
    {
        if (lhs.isNaN())
        {
            return rhs;
        }
        if (rhs.isNaN())
        {
            return lhs;
        }
        return minMagnitude(lhs, rhs);
    }

    Rational pow(Rational const& in_value, std::int64_t in_exponent)
    {
        if (in_value.isNaN() || (in_exponent == 1))
        {
            return in_value;
        }
        if (in_exponent == 0)
        {
            return Rational::one();
        }

        // Negating INT64_MIN overflows; take the magnitude in unsigned arithmetic.
        auto const magnitude = (in_exponent < 0) ? (~static_cast<std::uint64_t>(in_exponent) + 1U) : static_cast<std::uint64_t>(in_exponent);
        if (magnitude > std::numeric_limits<unsigned>::max())
        {
            throw Exception::overflow("Exponent {} is too large", in_exponent);
        }

        auto const base = (in_exponent < 0) ? inverse(in_value) : in_value;
        auto const power = static_cast<unsigned>(magnitude);
        return Rational{BigInt{boost::multiprecision::pow(base.numerator(), power)}, BigInt{boost::multiprecision::pow(base.denominator(), power)}};
    }

    double log(Rational const& in_value)
    {
        return detail::naturalLog(in_value.numerator()) - detail::naturalLog(in_value.denominator());
    }

    double log(Rational const& in_value, double in_base)
    {
        return log(in_value) / std::log(in_base);
    }

    double log(Rational const& in_value, Rational const& in_base)
    {
        return log(in_value) / log(in_base);
    }
}
