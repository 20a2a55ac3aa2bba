// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Conversions.cpp
 * @brief Conversions between exact::Rational and native, decimal and complex numbers
 */

#include <exact/Rational.hpp>
#include <cstring>
#include <utility>
#include "exact-internal/FloatLayout.hpp"

namespace exact
{
    namespace
    {
        template<typename Bits, typename Native>
        Bits bitsOf(Native in_value) noexcept
        {
            static_assert(sizeof(Bits) == sizeof(Native), "bit pattern size mismatch");
            auto bits = Bits{};
            std::memcpy(&bits, &in_value, sizeof(bits));
            return bits;
        }

        Rational fromRaw(detail::RawFraction in_raw)
        {
            return Rational{std::move(in_raw.numerator), std::move(in_raw.denominator)};
        }
    }

    Rational Rational::fromHalf(Half in_value)
    {
        return fromRaw(detail::decompose<detail::Binary16Layout>(in_value.bits()));
    }

    Rational Rational::fromFloat(float in_value)
    {
        return fromRaw(detail::decompose<detail::Binary32Layout>(bitsOf<std::uint32_t>(in_value)));
    }

    Rational Rational::fromDouble(double in_value)
    {
        return fromRaw(detail::decompose<detail::Binary64Layout>(bitsOf<std::uint64_t>(in_value)));
    }

    Rational Rational::fromDecimal(Decimal const& in_value)
    {
        return fromRaw(detail::decomposeDecimal(in_value));
    }

    Rational Rational::fromComplex(std::complex<double> const& in_value)
    {
        if (in_value.imag() != 0.0)
        {
            throw Exception::invalidArgument("Complex value ({}, {}) has a non-zero imaginary part", in_value.real(), in_value.imag());
        }
        return fromDouble(in_value.real());
    }

    BigInt Rational::toBigInt() const
    {
        if (_denominator.is_zero())
        {
            throw Exception::divideByZero("{} has no integer value", toString());
        }
        return _numerator / _denominator;
    }

    Half Rational::toHalf() const
    {
        // Binary16 is reconstructed in float precision, then rounded once more.
        return Half{detail::reconstruct<detail::Binary16Layout>(_numerator, _denominator)};
    }

    float Rational::toFloat() const
    {
        return detail::reconstruct<detail::Binary32Layout>(_numerator, _denominator);
    }

    double Rational::toDouble() const
    {
        return detail::reconstruct<detail::Binary64Layout>(_numerator, _denominator);
    }

    Decimal Rational::toDecimal() const
    {
        return detail::reconstructDecimal(_numerator, _denominator);
    }

    std::complex<double> Rational::toComplex() const
    {
        return {toDouble(), 0.0};
    }
}
