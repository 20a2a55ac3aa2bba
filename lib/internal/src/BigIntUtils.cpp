// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

#include "exact-internal/BigIntUtils.hpp"
#include <cmath>
#include <cstdint>
#include <limits>

namespace exact::detail
{
    namespace
    {
        // 10^18 is the largest power of ten that fits a 64-bit chunk.
        constexpr auto DIGITS_PER_CHUNK = std::size_t{18};

        // Below this bit length a BigInt converts to double without overflowing.
        constexpr auto DIRECT_LOG_BITS = std::size_t{1000};
    }

    BigInt pow10(unsigned in_exponent)
    {
        return boost::multiprecision::pow(BigInt{10}, in_exponent);
    }

    BigInt pow2(unsigned in_exponent)
    {
        return BigInt{1} << in_exponent;
    }

    BigInt parseDigits(std::string_view in_digits)
    {
        auto result = BigInt{0};

        // The first chunk takes the remainder so that every later chunk is full.
        auto const leading = in_digits.size() % DIGITS_PER_CHUNK;
        auto pos = std::size_t{0};
        auto chunkLength = (leading == 0) ? DIGITS_PER_CHUNK : leading;
        while (pos < in_digits.size())
        {
            auto chunk = std::uint64_t{0};
            auto scale = std::uint64_t{1};
            for (auto i = std::size_t{0}; i < chunkLength; ++i)
            {
                chunk = chunk * 10U + static_cast<std::uint64_t>(in_digits[pos + i] - '0');
                scale *= 10U;
            }

            result *= scale;
            result += chunk;

            pos += chunkLength;
            chunkLength = DIGITS_PER_CHUNK;
        }
        return result;
    }

    std::size_t floorLog2(BigInt const& in_value)
    {
        return boost::multiprecision::msb(in_value);
    }

    double naturalLog(BigInt const& in_value)
    {
        if (in_value.is_zero())
        {
            return -std::numeric_limits<double>::infinity();
        }
        if (in_value < 0)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        auto const bits = floorLog2(in_value);
        if (bits < DIRECT_LOG_BITS)
        {
            return std::log(in_value.convert_to<double>());
        }

        // log(v) = log(v >> s) + s * log(2), keeping 64 significant bits.
        auto const shift = bits - 63U;
        auto const head = BigInt{in_value >> shift};
        return std::log(head.convert_to<double>()) + static_cast<double>(shift) * std::log(2.0);
    }
}
