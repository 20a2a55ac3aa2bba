// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Half.hpp
 * @brief IEEE 754 binary16 storage type
 *
 * Format: 1 sign bit, 5 exponent bits (bias 15), 10 mantissa bits.
 *
 * The library never computes in binary16. Half only carries the bit pattern so that
 * values can be decomposed into an exact Rational and rebuilt from one. Conversions
 * from float round to nearest, ties to even, and overflow to Infinity.
 */

#pragma once

#include <cstdint>
#include <exact/platform.h>

namespace exact
{
    class EXACT_EXPORT Half
    {
    public:
        /** Positive zero. */
        constexpr Half() noexcept = default;

        /** Round a float to the nearest binary16 value. */
        explicit Half(float value) noexcept;

        [[nodiscard]]
        static constexpr Half fromBits(std::uint16_t bits) noexcept
        {
            auto result = Half{};
            result._bits = bits;
            return result;
        }

        [[nodiscard]]
        constexpr std::uint16_t bits() const noexcept
        {
            return _bits;
        }

        /** Widening conversion, always exact. */
        [[nodiscard]]
        float toFloat() const noexcept;

        explicit operator float() const noexcept
        {
            return toFloat();
        }

        [[nodiscard]]
        constexpr bool isNaN() const noexcept
        {
            return ((_bits & 0x7C00U) == 0x7C00U) && ((_bits & 0x03FFU) != 0);
        }

        [[nodiscard]]
        constexpr bool isInfinity() const noexcept
        {
            return (_bits & 0x7FFFU) == 0x7C00U;
        }

    private:
        std::uint16_t _bits = 0;
    };

    /** Bitwise equality. +0 and -0 compare equal, NaN never does. */
    EXACT_EXPORT
    bool operator==(Half lhs, Half rhs) noexcept;

    EXACT_EXPORT
    bool operator!=(Half lhs, Half rhs) noexcept;
}
