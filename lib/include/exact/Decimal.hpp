// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Decimal.hpp
 * @brief 128-bit scaled decimal storage type
 *
 * Layout (same as the common 128-bit "decimal" interchange format):
 * - lo, mid, hi: the three 32-bit words of an unsigned 96-bit integer
 * - scale:       power of ten dividing the integer, 0..28
 * - negative:    sign flag
 *
 * value = (negative ? -1 : 1) * integer / 10^scale
 *
 * Several encodings denote the same value (1.0 and 1.00); equality compares values.
 */

#pragma once

#include <cstdint>
#include <string>
#include <exact/platform.h>

namespace exact
{
    class EXACT_EXPORT Decimal
    {
    public:
        /** Largest scale the format can express. */
        static constexpr std::uint8_t MaxScale = 28;

        /** Zero with scale 0. */
        constexpr Decimal() noexcept = default;

        /**
         * Build a decimal from its parts.
         *
         * @throws exact::Exception (EXACT_ERR_INVALID_ARG) if scale exceeds MaxScale
         */
        Decimal(std::uint32_t lo, std::uint32_t mid, std::uint32_t hi, bool negative, std::uint8_t scale);

        /** Exact conversion from a 64-bit integer. */
        static Decimal fromInt64(std::int64_t value) noexcept;

        [[nodiscard]]
        constexpr std::uint32_t lo() const noexcept
        {
            return _lo;
        }

        [[nodiscard]]
        constexpr std::uint32_t mid() const noexcept
        {
            return _mid;
        }

        [[nodiscard]]
        constexpr std::uint32_t hi() const noexcept
        {
            return _hi;
        }

        [[nodiscard]]
        constexpr std::uint8_t scale() const noexcept
        {
            return _scale;
        }

        [[nodiscard]]
        constexpr bool isNegative() const noexcept
        {
            return _negative;
        }

        [[nodiscard]]
        constexpr bool isZero() const noexcept
        {
            return (_lo == 0) && (_mid == 0) && (_hi == 0);
        }

        /** Plain decimal notation, e.g. "-12.50". Trailing zeros of the scale are kept. */
        [[nodiscard]]
        std::string toString() const;

    private:
        std::uint32_t _lo = 0;
        std::uint32_t _mid = 0;
        std::uint32_t _hi = 0;
        std::uint8_t _scale = 0;
        bool _negative = false;
    };

    EXACT_EXPORT
    bool operator==(Decimal const& lhs, Decimal const& rhs);

    EXACT_EXPORT
    bool operator!=(Decimal const& lhs, Decimal const& rhs);
}
