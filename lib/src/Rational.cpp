// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Rational.cpp
 * @brief Canonical construction, named constants, text and comparison of exact::Rational
 *
 * Every value enters through the two-argument constructor, which enforces:
 * - a non-negative denominator (the sign lives in the numerator)
 * - coprime parts whenever the denominator is greater than 1
 * - a numerator in {-1, 0, 1} whenever the denominator is 0
 */

#include <exact/Rational.hpp>
#include <ostream>
#include <utility>
#include <boost/container_hash/hash.hpp>
#include <exact/Options.hpp>
#include "exact-internal/Formatter.hpp"
#include "exact-internal/Logging.hpp"
#include "exact-internal/NumberGrammar.hpp"

namespace exact
{
    Rational::Rational()
        : _numerator{0}
        , _denominator{1}
    {}

    Rational::Rational(BigInt in_integer)
        : _numerator{std::move(in_integer)}
        , _denominator{1}
    {}

    Rational::Rational(BigInt in_numerator, BigInt in_denominator)
        : _numerator{std::move(in_numerator)}
        , _denominator{std::move(in_denominator)}
    {
        if (_denominator < 0)
        {
            _numerator = -_numerator;
            _denominator = -_denominator;
        }

        if (_denominator.is_zero())
        {
            // NaN, +Infinity or -Infinity: only the sign of the numerator survives.
            _numerator = _numerator.sign();
            return;
        }

        if (_denominator > 1)
        {
            // gcd(0, d) = d, so a zero numerator collapses to 0/1 here.
            auto const divisor = BigInt{gcd(BigInt{abs(_numerator)}, _denominator)};
            if (divisor > 1)
            {
                _numerator /= divisor;
                _denominator /= divisor;
            }
        }
    }

    Rational const& Rational::zero()
    {
        static auto const value = Rational{};
        return value;
    }

    Rational const& Rational::one()
    {
        static auto const value = Rational{1};
        return value;
    }

    Rational const& Rational::minusOne()
    {
        static auto const value = Rational{-1};
        return value;
    }

    Rational const& Rational::half()
    {
        static auto const value = Rational{1, 2};
        return value;
    }

    Rational const& Rational::minusHalf()
    {
        static auto const value = Rational{-1, 2};
        return value;
    }

    Rational const& Rational::nan()
    {
        static auto const value = Rational{0, 0};
        return value;
    }

    Rational const& Rational::positiveInfinity()
    {
        static auto const value = Rational{1, 0};
        return value;
    }

    Rational const& Rational::negativeInfinity()
    {
        static auto const value = Rational{-1, 0};
        return value;
    }

    int Rational::sign() const noexcept
    {
        return _numerator.sign();
    }

    bool Rational::isZero() const noexcept
    {
        return _numerator.is_zero() && !_denominator.is_zero();
    }

    bool Rational::isNaN() const noexcept
    {
        return _numerator.is_zero() && _denominator.is_zero();
    }

    bool Rational::isInfinity() const noexcept
    {
        return _denominator.is_zero() && !_numerator.is_zero();
    }

    bool Rational::isPositiveInfinity() const noexcept
    {
        return _denominator.is_zero() && (_numerator.sign() > 0);
    }

    bool Rational::isNegativeInfinity() const noexcept
    {
        return _denominator.is_zero() && (_numerator.sign() < 0);
    }

    bool Rational::isFinite() const noexcept
    {
        return !_denominator.is_zero();
    }

    bool Rational::isInteger() const noexcept
    {
        return _denominator == 1;
    }

    bool Rational::isNegative() const noexcept
    {
        return _numerator.sign() < 0;
    }

    bool Rational::isPositive() const noexcept
    {
        return _numerator.sign() > 0;
    }

    bool Rational::isEvenInteger() const noexcept
    {
        return isInteger() && !bit_test(_numerator, 0);
    }

    bool Rational::isOddInteger() const noexcept
    {
        return isInteger() && bit_test(_numerator, 0);
    }

    Rational Rational::parse(std::string_view in_text)
    {
        auto parsed = detail::parseNumber(in_text);
        if (!parsed)
        {
            throw Exception::format("'{}' is not an integer, fraction, decimal or mixed number", in_text);
        }
        return Rational{std::move(parsed->value.numerator), std::move(parsed->value.denominator)};
    }

    bool Rational::tryParse(std::string_view in_text, Rational& out_value) noexcept
    {
        try
        {
            if (auto parsed = detail::parseNumber(in_text); parsed)
            {
                out_value = Rational{std::move(parsed->value.numerator), std::move(parsed->value.denominator)};
                return true;
            }
            EXACT_DEBUG("Rejected number text '{}'", in_text);
        }
        catch (std::exception const& e)
        {
            EXACT_ERROR("Failed to parse '{}': {}", in_text, e.what());
        }

        out_value = nan();
        return false;
    }

    std::string Rational::toString(std::string_view in_format) const
    {
        auto const spec = detail::parseFormatSpec(in_format, detail::DEFAULT_DECIMAL_DIGITS);
        if (!spec)
        {
            throw Exception::format("Unknown format specifier '{}'", in_format);
        }
        return detail::formatFraction(_numerator, _denominator, *spec);
    }

    std::string Rational::toString(Options const& in_options) const
    {
        auto const spec = detail::parseFormatSpec(in_options.defaultFormat(), in_options.decimalDigits());
        if (!spec)
        {
            throw Exception::format("Unknown format specifier '{}'", in_options.defaultFormat());
        }
        return detail::formatFraction(_numerator, _denominator, *spec);
    }

    int Rational::compareTo(Rational const& in_other) const
    {
        if (isNaN())
        {
            return in_other.isNaN() ? 0 : -1;
        }
        if (in_other.isNaN())
        {
            return 1;
        }

        // Cross-multiplying two infinities gives 0 * 0; their order is the order of their signs.
        if (_denominator.is_zero() && in_other._denominator.is_zero())
        {
            return (_numerator > in_other._numerator) - (_numerator < in_other._numerator);
        }

        auto const lhs = BigInt{_numerator * in_other._denominator};
        auto const rhs = BigInt{in_other._numerator * _denominator};
        auto const result = lhs.compare(rhs);
        return (result > 0) - (result < 0);
    }

    int Rational::compareTo(BigInt const& in_other) const
    {
        if (isNaN())
        {
            return -1;
        }
        if (_denominator.is_zero())
        {
            return _numerator.sign();
        }

        auto const result = _numerator.compare(BigInt{in_other * _denominator});
        return (result > 0) - (result < 0);
    }

    bool Rational::equals(Rational const& in_other) const noexcept
    {
        if (isNaN() || in_other.isNaN())
        {
            return false;
        }
        return (_numerator == in_other._numerator) && (_denominator == in_other._denominator);
    }

    bool Rational::equals(BigInt const& in_other) const noexcept
    {
        return (_denominator == 1) && (_numerator == in_other);
    }

    std::size_t Rational::hash() const
    {
        auto seed = std::size_t{0};
        boost::hash_combine(seed, _numerator);
        boost::hash_combine(seed, _denominator);
        return seed;
    }

    std::ostream& operator<<(std::ostream& os, Rational const& in_value)
    {
        return os << in_value.toString();
    }
}
