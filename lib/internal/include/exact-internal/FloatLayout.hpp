// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file FloatLayout.hpp
 * @brief Bit-exact bridge between IEEE 754 binary formats and exact fractions
 *
 * Each supported format is described by a layout traits struct:
 * - Bits:         unsigned integer type holding the bit pattern
 * - Compute:      native type the reconstruction is carried out in
 * - ExponentBits, MantissaBits, Bias: the IEEE 754 parameters
 *
 * Decomposition is exact. Reconstruction rescales the fraction by a power of two so
 * that a single integer division yields the significand of Compute plus a guard bit
 * and a sticky bit, then rounds once to Compute. Every value Compute can represent
 * comes back unchanged; anything else is rounded to nearest.
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <exact/Decimal.hpp>
#include "exact-internal/BigIntUtils.hpp"
#include "exact-internal/Logging.hpp"

namespace exact::detail
{
    struct Binary16Layout
    {
        using Bits = std::uint16_t;
        using Compute = float;

        static constexpr unsigned ExponentBits = 5;
        static constexpr unsigned MantissaBits = 10;
        static constexpr int Bias = 15;
    };

    struct Binary32Layout
    {
        using Bits = std::uint32_t;
        using Compute = float;

        static constexpr unsigned ExponentBits = 8;
        static constexpr unsigned MantissaBits = 23;
        static constexpr int Bias = 127;
    };

    struct Binary64Layout
    {
        using Bits = std::uint64_t;
        using Compute = double;

        static constexpr unsigned ExponentBits = 11;
        static constexpr unsigned MantissaBits = 52;
        static constexpr int Bias = 1023;
    };

    /**
     * Split a bit pattern into an exact (numerator, denominator) pair.
     *
     * - exponent field 0:       zero, or the subnormal mantissa / 2^(Bias - 1 + MantissaBits)
     * - exponent field all ones: +-1/0 for the infinities, 0/0 for any NaN payload
     * - otherwise:              (mantissa + 2^MantissaBits) * 2^(exponent - Bias - MantissaBits)
     */
    template<typename Layout>
    RawFraction decompose(typename Layout::Bits in_bits)
    {
        using Bits = typename Layout::Bits;

        constexpr auto mantissaMask = static_cast<Bits>((Bits{1} << Layout::MantissaBits) - 1U);
        constexpr auto exponentMask = static_cast<Bits>((Bits{1} << Layout::ExponentBits) - 1U);

        auto const negative = ((in_bits >> (Layout::ExponentBits + Layout::MantissaBits)) & 1U) != 0;
        auto const exponent = static_cast<Bits>((in_bits >> Layout::MantissaBits) & exponentMask);
        auto const mantissa = static_cast<Bits>(in_bits & mantissaMask);

        if (exponent == 0)
        {
            if (mantissa == 0)
            {
                return {BigInt{0}, BigInt{1}};
            }
            auto const numerator = BigInt{mantissa};
            return {negative ? BigInt{-numerator} : numerator, pow2(static_cast<unsigned>(Layout::Bias - 1) + Layout::MantissaBits)};
        }

        if (exponent == exponentMask)
        {
            if (mantissa == 0)
            {
                return {BigInt{negative ? -1 : 1}, BigInt{0}};
            }
            return {BigInt{0}, BigInt{0}};
        }

        auto significand = BigInt{mantissa} + pow2(Layout::MantissaBits);
        if (negative)
        {
            significand = -significand;
        }

        auto const power = static_cast<int>(exponent) - Layout::Bias - static_cast<int>(Layout::MantissaBits);
        if (power < 0)
        {
            return {significand, pow2(static_cast<unsigned>(-power))};
        }
        return {BigInt{significand << power}, BigInt{1}};
    }

    /**
     * Nearest value of Layout::Compute to in_numerator / in_denominator.
     *
     * The inputs must be canonical. A zero denominator yields the native NaN or infinity.
     * Results beyond the range of Compute saturate to infinity or underflow to zero.
     */
    template<typename Layout>
    typename Layout::Compute reconstruct(BigInt const& in_numerator, BigInt const& in_denominator)
    {
        using Compute = typename Layout::Compute;

        if (in_denominator.is_zero())
        {
            if (in_numerator > 0)
            {
                return std::numeric_limits<Compute>::infinity();
            }
            if (in_numerator < 0)
            {
                return -std::numeric_limits<Compute>::infinity();
            }
            return std::numeric_limits<Compute>::quiet_NaN();
        }
        if (in_numerator.is_zero())
        {
            return Compute{0};
        }

        auto const negative = in_numerator < 0;
        auto numerator = BigInt{abs(in_numerator)};
        auto denominator = in_denominator;

        // Scale so that the quotient has the significand width of Compute plus one guard bit.
        constexpr auto quotientBits = static_cast<long long>(std::numeric_limits<Compute>::digits) + 1;
        auto const shift = static_cast<long long>(floorLog2(denominator)) - static_cast<long long>(floorLog2(numerator)) + quotientBits;
        if (shift > 0)
        {
            numerator <<= static_cast<std::size_t>(shift);
        }
        else if (shift < 0)
        {
            denominator <<= static_cast<std::size_t>(-shift);
        }

        auto quotient = BigInt{};
        auto remainder = BigInt{};
        boost::multiprecision::divide_qr(numerator, denominator, quotient, remainder);

        // Sticky bit: a non-zero tail must never look like an exact tie.
        quotient <<= 1;
        if (!remainder.is_zero())
        {
            quotient |= 1;
            EXACT_TRACE("Inexact quotient at scale 2^{}, rounding to nearest", -(shift + 1));
        }

        // The quotient has at most digits + 3 bits, so the native conversion rounds exactly once.
        auto const significand = static_cast<Compute>(quotient.convert_to<unsigned long long>());
        auto const exponent = std::clamp(-(shift + 1), static_cast<long long>(std::numeric_limits<int>::min() / 2),
            static_cast<long long>(std::numeric_limits<int>::max() / 2));
        auto const result = std::ldexp(significand, static_cast<int>(exponent));
        return negative ? -result : result;
    }

    /** Exact fraction of a 128-bit decimal: +-integer / 10^scale. */
    RawFraction decomposeDecimal(Decimal const& in_value);

    /**
     * Closest decimal to in_numerator / in_denominator: round half to even at the largest
     * scale (at most 28) whose scaled integer fits in 96 bits, then drop trailing zeros.
     *
     * @throws exact::Exception (EXACT_ERR_OVERFLOW) for non-finite values and values whose
     *         integer part does not fit in 96 bits
     */
    Decimal reconstructDecimal(BigInt const& in_numerator, BigInt const& in_denominator);
}
