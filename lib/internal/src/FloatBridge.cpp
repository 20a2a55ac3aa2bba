// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file FloatBridge.cpp
 * @brief Decimal side of the float bridge
 *
 * The binary formats are handled by the templates in FloatLayout.hpp. The 128-bit
 * decimal format scales by powers of ten instead of two, so it gets its own pair of
 * functions here.
 */

#include <cstdint>
#include <exact/Exception.hpp>
#include "exact-internal/FloatLayout.hpp"

namespace exact::detail
{
    namespace
    {
        constexpr auto WORD_BITS = 32U;
        constexpr auto DECIMAL_INTEGER_BITS = 96U;

        BigInt const& maxDecimalInteger()
        {
            static auto const value = BigInt{pow2(DECIMAL_INTEGER_BITS) - 1};
            return value;
        }

        std::uint32_t word(BigInt const& in_value, unsigned in_index)
        {
            auto const shifted = BigInt{in_value >> (in_index * WORD_BITS)};
            return static_cast<std::uint32_t>(shifted.convert_to<unsigned long long>() & 0xFFFF'FFFFULL);
        }
    }

    RawFraction decomposeDecimal(Decimal const& in_value)
    {
        auto integer = BigInt{in_value.hi()};
        integer <<= WORD_BITS;
        integer |= in_value.mid();
        integer <<= WORD_BITS;
        integer |= in_value.lo();

        if (in_value.isNegative())
        {
            integer = -integer;
        }
        return {integer, pow10(in_value.scale())};
    }

    Decimal reconstructDecimal(BigInt const& in_numerator, BigInt const& in_denominator)
    {
        if (in_denominator.is_zero())
        {
            throw Exception::overflow("A non-finite value has no decimal representation");
        }

        auto const negative = in_numerator < 0;
        auto const magnitude = BigInt{abs(in_numerator)};

        if (BigInt{magnitude / in_denominator} > maxDecimalInteger())
        {
            throw Exception::overflow("Integer part of {}/{} does not fit in 96 bits", in_numerator.str(), in_denominator.str());
        }

        for (auto scale = static_cast<int>(Decimal::MaxScale); scale >= 0; --scale)
        {
            auto quotient = BigInt{};
            auto remainder = BigInt{};
            boost::multiprecision::divide_qr(BigInt{magnitude * pow10(static_cast<unsigned>(scale))}, in_denominator, quotient, remainder);

            // Round half to even.
            auto const twice = BigInt{remainder * 2};
            if ((twice > in_denominator) || ((twice == in_denominator) && bit_test(quotient, 0)))
            {
                ++quotient;
            }

            if (quotient > maxDecimalInteger())
            {
                continue;
            }

            auto finalScale = static_cast<unsigned>(scale);
            while ((finalScale > 0) && (quotient % 10 == 0) && !quotient.is_zero())
            {
                quotient /= 10;
                --finalScale;
            }
            if (quotient.is_zero())
            {
                return Decimal{};
            }

            return Decimal{word(quotient, 0), word(quotient, 1), word(quotient, 2), negative, static_cast<std::uint8_t>(finalScale)};
        }

        // Only reachable when rounding at scale 0 carries past 2^96 - 1.
        throw Exception::overflow("{}/{} rounds outside the decimal range", in_numerator.str(), in_denominator.str());
    }
}
