// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Rational.hpp
 * @brief Exact arbitrary-precision rational number
 *
 * A Rational is a numerator/denominator pair of arbitrary-precision integers that is
 * always held in canonical form:
 * - the denominator is never negative
 * - numerator and denominator are coprime whenever the denominator is greater than 1
 * - a zero denominator encodes a non-finite value: 0/0 is NaN, 1/0 is +Infinity and
 *   -1/0 is -Infinity
 *
 * Every constructor runs the same normalization, so no instance ever observes a
 * non-canonical pair. Instances are immutable; every operation returns a new value.
 *
 * Equality and ordering differ on NaN:
 * - operator== / equals() follow IEEE 754: NaN is not equal to anything, itself included.
 * - compareTo() and the ordering operators define a total order in which NaN sorts
 *   before every other value (including -Infinity) and compares equal to NaN.
 */

#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>
#include <exact/Decimal.hpp>
#include <exact/Exception.hpp>
#include <exact/Half.hpp>
#include <exact/platform.h>

namespace exact
{
    /** Arbitrary-precision signed integer used for both parts of a Rational. */
    using BigInt = boost::multiprecision::cpp_int;

    class Options;

    class EXACT_EXPORT Rational
    {
    public:
        /** Zero (0/1). */
        Rational();

        /** The integer value in_integer / 1. */
        Rational(BigInt in_integer);

        /** Any native integer, exactly. */
        template<typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
        Rational(T in_integer)
            : Rational(BigInt{in_integer})
        {}

        /**
         * The value in_numerator / in_denominator, reduced to canonical form.
         * A zero denominator yields NaN, +Infinity or -Infinity depending on the
         * sign of the numerator.
         */
        Rational(BigInt in_numerator, BigInt in_denominator);

        //
        // Named constants, initialized once on first use.
        //
        static Rational const& zero();
        static Rational const& one();
        static Rational const& minusOne();
        static Rational const& half();
        static Rational const& minusHalf();
        static Rational const& nan();
        static Rational const& positiveInfinity();
        static Rational const& negativeInfinity();

        [[nodiscard]]
        BigInt const& numerator() const noexcept
        {
            return _numerator;
        }

        [[nodiscard]]
        BigInt const& denominator() const noexcept
        {
            return _denominator;
        }

        /** -1, 0 or 1 following the sign of the numerator (0 for NaN). */
        [[nodiscard]]
        int sign() const noexcept;

        [[nodiscard]]
        bool isZero() const noexcept;
        [[nodiscard]]
        bool isNaN() const noexcept;
        [[nodiscard]]
        bool isInfinity() const noexcept;
        [[nodiscard]]
        bool isPositiveInfinity() const noexcept;
        [[nodiscard]]
        bool isNegativeInfinity() const noexcept;
        [[nodiscard]]
        bool isFinite() const noexcept;
        /** True when the denominator is 1. */
        [[nodiscard]]
        bool isInteger() const noexcept;
        [[nodiscard]]
        bool isNegative() const noexcept;
        [[nodiscard]]
        bool isPositive() const noexcept;
        [[nodiscard]]
        bool isEvenInteger() const noexcept;
        [[nodiscard]]
        bool isOddInteger() const noexcept;

        //
        // Text
        //

        /**
         * Parse one of the accepted textual forms (surrounding whitespace is ignored):
         * - integer:          "-42"
         * - fraction:         "3/4"
         * - decimal:          "1.25", "-0.5", "1.234e-100"
         * - mixed number:     "3 1/2"
         *
         * @throws exact::Exception (EXACT_ERR_FORMAT) if the text matches none of them
         */
        [[nodiscard]]
        static Rational parse(std::string_view in_text);

        /**
         * Non-throwing variant of parse().
         *
         * @param[out] out_value The parsed value, or NaN when parsing fails.
         * @return true on success.
         */
        static bool tryParse(std::string_view in_text, Rational& out_value) noexcept;

        /**
         * Render the value.
         *
         * - "F" (or empty): "numerator/denominator"
         * - "D<n>":         decimal notation with n fractional digits (default 15), truncated
         * - "W":            mixed number "whole numerator/denominator"
         *
         * @throws exact::Exception (EXACT_ERR_FORMAT) for any other specifier
         */
        [[nodiscard]]
        std::string toString(std::string_view in_format = "F") const;

        /** Render using the default format and digit count of in_options. */
        [[nodiscard]]
        std::string toString(Options const& in_options) const;

        //
        // Comparison
        //

        /** Total order: negative, zero or positive. NaN sorts first and equals NaN. */
        [[nodiscard]]
        int compareTo(Rational const& in_other) const;

        [[nodiscard]]
        int compareTo(BigInt const& in_other) const;

        /** IEEE-style equality: false whenever either side is NaN. */
        [[nodiscard]]
        bool equals(Rational const& in_other) const noexcept;

        [[nodiscard]]
        bool equals(BigInt const& in_other) const noexcept;

        /** Hash consistent with equals(). */
        [[nodiscard]]
        std::size_t hash() const;

        //
        // Conversions
        //

        [[nodiscard]]
        static Rational fromHalf(Half in_value);
        [[nodiscard]]
        static Rational fromFloat(float in_value);
        [[nodiscard]]
        static Rational fromDouble(double in_value);
        [[nodiscard]]
        static Rational fromDecimal(Decimal const& in_value);

        /**
         * Real-axis value of a complex number.
         *
         * @throws exact::Exception (EXACT_ERR_INVALID_ARG) if the imaginary part is not zero
         */
        [[nodiscard]]
        static Rational fromComplex(std::complex<double> const& in_value);

        /**
         * The value truncated toward zero.
         *
         * @throws exact::Exception (EXACT_ERR_DIVIDE_BY_ZERO) for NaN and the infinities
         */
        [[nodiscard]]
        BigInt toBigInt() const;

        /**
         * The value truncated toward zero, range checked against T.
         *
         * @throws exact::Exception (EXACT_ERR_DIVIDE_BY_ZERO) for NaN and the infinities
         * @throws exact::Exception (EXACT_ERR_OVERFLOW) if the truncated value does not fit in T
         */
        template<typename T>
        [[nodiscard]]
        T toInteger() const
        {
            static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>, "toInteger requires an integer type");
            auto const truncated = toBigInt();
            if (!fitsIn<T>(truncated))
            {
                throw Exception::overflow("Value {} is outside the range [{}, {}]",
                    truncated.str(),
                    std::numeric_limits<T>::min(),
                    std::numeric_limits<T>::max());
            }
            return narrow<T>(truncated);
        }

        /** Non-throwing variant of toInteger(): std::nullopt when the conversion would fail. */
        template<typename T>
        [[nodiscard]]
        std::optional<T> tryToInteger() const noexcept
        {
            static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>, "tryToInteger requires an integer type");
            if (!isFinite())
            {
                return std::nullopt;
            }
            auto const truncated = BigInt{_numerator / _denominator};
            if (!fitsIn<T>(truncated))
            {
                return std::nullopt;
            }
            return narrow<T>(truncated);
        }

        /**
         * The value truncated toward zero and clamped to the range of T.
         * NaN maps to 0, +Infinity to the maximum and -Infinity to the minimum of T.
         */
        template<typename T>
        [[nodiscard]]
        T toIntegerSaturating() const noexcept
        {
            static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>, "toIntegerSaturating requires an integer type");
            if (isNaN())
            {
                return T{0};
            }
            if (isInfinity())
            {
                return isNegative() ? std::numeric_limits<T>::min() : std::numeric_limits<T>::max();
            }
            auto const truncated = BigInt{_numerator / _denominator};
            if (truncated < BigInt{std::numeric_limits<T>::min()})
            {
                return std::numeric_limits<T>::min();
            }
            if (truncated > BigInt{std::numeric_limits<T>::max()})
            {
                return std::numeric_limits<T>::max();
            }
            return narrow<T>(truncated);
        }

        /** Nearest binary16 value; precision loss and overflow to Infinity are accepted. */
        [[nodiscard]]
        Half toHalf() const;
        /** Nearest float; precision loss and overflow to Infinity are accepted. */
        [[nodiscard]]
        float toFloat() const;
        /** Nearest double; precision loss and overflow to Infinity are accepted. */
        [[nodiscard]]
        double toDouble() const;

        /**
         * Closest 128-bit decimal (round half to even at the largest scale that fits).
         *
         * @throws exact::Exception (EXACT_ERR_OVERFLOW) if the value is non-finite or its
         *         integer part needs more than 96 bits
         */
        [[nodiscard]]
        Decimal toDecimal() const;

        /** Embedding on the real axis: {toDouble(), 0}. */
        [[nodiscard]]
        std::complex<double> toComplex() const;

        explicit operator double() const
        {
            return toDouble();
        }

        explicit operator float() const
        {
            return toFloat();
        }

        //
        // Increment / decrement (add or subtract the denominator to the numerator)
        //
        Rational& operator++();
        Rational operator++(int);
        Rational& operator--();
        Rational operator--(int);

        Rational& operator+=(Rational const& in_other);
        Rational& operator-=(Rational const& in_other);
        Rational& operator*=(Rational const& in_other);
        Rational& operator/=(Rational const& in_other);
        Rational& operator%=(Rational const& in_other);

    private:
        template<typename T>
        static bool fitsIn(BigInt const& in_value) noexcept
        {
            return (in_value >= BigInt{std::numeric_limits<T>::min()}) && (in_value <= BigInt{std::numeric_limits<T>::max()});
        }

        template<typename T>
        static T narrow(BigInt const& in_value) noexcept
        {
            if constexpr (std::is_signed_v<T>)
            {
                return static_cast<T>(in_value.convert_to<long long>());
            }
            else
            {
                return static_cast<T>(in_value.convert_to<unsigned long long>());
            }
        }

        BigInt _numerator;
        BigInt _denominator;
    };

    //
    // Operators. Every result is produced by the normalizing constructor.
    //
    EXACT_EXPORT Rational operator+(Rational const& in_value);
    EXACT_EXPORT Rational operator-(Rational const& in_value);

    EXACT_EXPORT Rational operator+(Rational const& lhs, Rational const& rhs);
    EXACT_EXPORT Rational operator-(Rational const& lhs, Rational const& rhs);
    EXACT_EXPORT Rational operator*(Rational const& lhs, Rational const& rhs);
    EXACT_EXPORT Rational operator/(Rational const& lhs, Rational const& rhs);
    /** Truncating remainder: lhs - rhs * truncate(lhs / rhs). */
    EXACT_EXPORT Rational operator%(Rational const& lhs, Rational const& rhs);

    EXACT_EXPORT bool operator==(Rational const& lhs, Rational const& rhs) noexcept;
    EXACT_EXPORT bool operator!=(Rational const& lhs, Rational const& rhs) noexcept;
    EXACT_EXPORT bool operator<(Rational const& lhs, Rational const& rhs);
    EXACT_EXPORT bool operator<=(Rational const& lhs, Rational const& rhs);
    EXACT_EXPORT bool operator>(Rational const& lhs, Rational const& rhs);
    EXACT_EXPORT bool operator>=(Rational const& lhs, Rational const& rhs);

    /** Writes the "F" form. */
    EXACT_EXPORT std::ostream& operator<<(std::ostream& os, Rational const& in_value);

    //
    // Elementary functions
    //

    /** 1 / in_value (swaps numerator and denominator). */
    EXACT_EXPORT Rational inverse(Rational const& in_value);
    EXACT_EXPORT Rational abs(Rational const& in_value);
    EXACT_EXPORT Rational negate(Rational const& in_value);

    /** Largest integer <= in_value. Non-finite values are returned unchanged. */
    EXACT_EXPORT Rational floor(Rational const& in_value);
    /** Smallest integer >= in_value. Non-finite values are returned unchanged. */
    EXACT_EXPORT Rational ceiling(Rational const& in_value);
    /** floor(in_value + 1/2). */
    EXACT_EXPORT Rational round(Rational const& in_value);
    /** Integer part, rounding toward zero. Non-finite values are returned unchanged. */
    EXACT_EXPORT Rational truncate(Rational const& in_value);

    /** Floored modulo: lhs - rhs * floor(lhs / rhs). Differs from operator% on mixed signs. */
    EXACT_EXPORT Rational modulo(Rational const& lhs, Rational const& rhs);

    EXACT_EXPORT Rational min(Rational const& lhs, Rational const& rhs);
    EXACT_EXPORT Rational max(Rational const& lhs, Rational const& rhs);

    /** Operand with the larger absolute value. */
    EXACT_EXPORT Rational maxMagnitude(Rational const& lhs, Rational const& rhs);
    /** Operand with the smaller absolute value. */
    EXACT_EXPORT Rational minMagnitude(Rational const& lhs, Rational const& rhs);
    /** As maxMagnitude(), but a NaN operand is ignored in favour of the other one. */
    EXACT_EXPORT Rational maxMagnitudeNumber(Rational const& lhs, Rational const& rhs);
    /** As minMagnitude(), but a NaN operand is ignored in favour of the other one. */
    EXACT_EXPORT Rational minMagnitudeNumber(Rational const& lhs, Rational const& rhs);

    /** in_value raised to an integer power. NaN stays NaN; x^0 is 1. */
    EXACT_EXPORT Rational pow(Rational const& in_value, std::int64_t in_exponent);

    /** Natural logarithm, computed in double precision as log(numerator) - log(denominator). */
    EXACT_EXPORT double log(Rational const& in_value);
    EXACT_EXPORT double log(Rational const& in_value, double in_base);
    EXACT_EXPORT double log(Rational const& in_value, Rational const& in_base);
}

namespace std
{
    template<>
    struct hash<exact::Rational>
    {
        std::size_t operator()(exact::Rational const& value) const
        {
            return value.hash();
        }
    };
}

/**
 * @brief fmt::formatter specialization for exact::Rational
 *
 * The format specification is forwarded to Rational::toString(), so "{}" prints
 * "n/d", "{:D5}" five decimal digits and "{:W}" the mixed-number form.
 */
namespace fmt
{
    template<>
    struct formatter<exact::Rational>
    {
        std::string spec;

        auto parse(format_parse_context& ctx)
        {
            auto it = ctx.begin();
            while ((it != ctx.end()) && (*it != '}'))
            {
                spec.push_back(*it);
                ++it;
            }
            return it;
        }

        template<typename Context>
        auto format(exact::Rational const& value, Context& ctx) const
        {
            return fmt::format_to(ctx.out(), "{}", value.toString(spec));
        }
    };
}
