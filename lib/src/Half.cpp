// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Half.cpp
 * @brief binary16 <-> binary32 bit conversions
 */

#include <exact/Half.hpp>
#include <cstring>

namespace exact
{
    namespace
    {
        std::uint32_t floatBits(float in_value) noexcept
        {
            auto bits = std::uint32_t{};
            std::memcpy(&bits, &in_value, sizeof(bits));
            return bits;
        }

        float floatFromBits(std::uint32_t in_bits) noexcept
        {
            auto value = 0.0f;
            std::memcpy(&value, &in_bits, sizeof(value));
            return value;
        }

        /** Shift in_value right by in_shift bits, rounding to nearest, ties to even. */
        std::uint32_t shiftRoundEven(std::uint32_t in_value, unsigned in_shift) noexcept
        {
            auto const kept = in_value >> in_shift;
            auto const dropped = in_value & ((1U << in_shift) - 1U);
            auto const halfway = 1U << (in_shift - 1U);
            if ((dropped > halfway) || ((dropped == halfway) && ((kept & 1U) != 0)))
            {
                return kept + 1U;
            }
            return kept;
        }

        std::uint16_t floatToHalfBits(float in_value) noexcept
        {
            auto const bits = floatBits(in_value);

            auto const sign = static_cast<std::uint16_t>((bits >> 16) & 0x8000U);
            auto const floatExponent = static_cast<int>((bits >> 23) & 0xFFU);
            auto const floatMantissa = bits & 0x7F'FFFFU;

            if (floatExponent == 0xFF)
            {
                // Infinity, or a quiet NaN keeping the top payload bits.
                auto const payload = (floatMantissa == 0) ? 0U : (0x200U | (floatMantissa >> 13));
                return static_cast<std::uint16_t>(sign | 0x7C00U | payload);
            }

            // Rebias exponent
            auto const exponent = floatExponent - 127 + 15;
            if (exponent >= 31)
            {
                return static_cast<std::uint16_t>(sign | 0x7C00U);
            }

            if (exponent <= 0)
            {
                // Below half of the smallest subnormal everything rounds to zero.
                if (exponent < -10)
                {
                    return sign;
                }
                // Subnormal: the result may carry into the smallest normal, which is the correct encoding.
                auto const significand = floatMantissa | 0x80'0000U;
                auto const mantissa = shiftRoundEven(significand, static_cast<unsigned>(14 - exponent));
                return static_cast<std::uint16_t>(sign | mantissa);
            }

            // A carry out of the mantissa bumps the exponent, up to Infinity.
            auto const rounded = shiftRoundEven((static_cast<std::uint32_t>(exponent) << 23) | floatMantissa, 13);
            return static_cast<std::uint16_t>(sign | rounded);
        }

        float halfBitsToFloat(std::uint16_t in_bits) noexcept
        {
            auto const sign = static_cast<std::uint32_t>(in_bits & 0x8000U) << 16;
            auto exponent = static_cast<std::uint32_t>((in_bits >> 10) & 0x1FU);
            auto mantissa = static_cast<std::uint32_t>(in_bits & 0x3FFU);

            if (exponent == 0)
            {
                if (mantissa == 0)
                {
                    return floatFromBits(sign);
                }

                // Denormalized number - normalize it
                exponent = 1;
                while ((mantissa & 0x400U) == 0)
                {
                    mantissa <<= 1;
                    --exponent;
                }
                mantissa &= 0x3FFU;
                return floatFromBits(sign | ((exponent + 127U - 15U) << 23) | (mantissa << 13));
            }

            if (exponent == 31)
            {
                return floatFromBits(sign | 0x7F80'0000U | (mantissa << 13));
            }

            return floatFromBits(sign | ((exponent + 127U - 15U) << 23) | (mantissa << 13));
        }
    }

    Half::Half(float value) noexcept
        : _bits{floatToHalfBits(value)}
    {}

    float Half::toFloat() const noexcept
    {
        return halfBitsToFloat(_bits);
    }

    bool operator==(Half lhs, Half rhs) noexcept
    {
        if (lhs.isNaN() || rhs.isNaN())
        {
            return false;
        }
        // +0 and -0
        if (((lhs.bits() | rhs.bits()) & 0x7FFFU) == 0)
        {
            return true;
        }
        return lhs.bits() == rhs.bits();
    }

    bool operator!=(Half lhs, Half rhs) noexcept
    {
        return !(lhs == rhs);
    }
}
