// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

#include <exact/Decimal.hpp>
#include <exact/Exception.hpp>
#include "exact-internal/FloatLayout.hpp"

namespace exact
{
    Decimal::Decimal(std::uint32_t lo, std::uint32_t mid, std::uint32_t hi, bool negative, std::uint8_t scale)
        : _lo{lo}
        , _mid{mid}
        , _hi{hi}
        , _scale{scale}
        , _negative{negative}
    {
        if (scale > MaxScale)
        {
            throw Exception::invalidArgument("Decimal scale {} exceeds the maximum of {}", scale, MaxScale);
        }
    }

    Decimal Decimal::fromInt64(std::int64_t value) noexcept
    {
        // Two's complement magnitude, valid for INT64_MIN as well.
        auto const magnitude = (value < 0) ? (~static_cast<std::uint64_t>(value) + 1U) : static_cast<std::uint64_t>(value);

        auto result = Decimal{};
        result._lo = static_cast<std::uint32_t>(magnitude & 0xFFFF'FFFFU);
        result._mid = static_cast<std::uint32_t>(magnitude >> 32);
        result._negative = value < 0;
        return result;
    }

    std::string Decimal::toString() const
    {
        auto const fraction = detail::decomposeDecimal(*this);
        auto digits = BigInt{abs(fraction.numerator)}.str();

        if (_scale > 0)
        {
            if (digits.size() <= _scale)
            {
                digits.insert(0, _scale + 1U - digits.size(), '0');
            }
            digits.insert(digits.size() - _scale, 1, '.');
        }
        if (_negative && !isZero())
        {
            digits.insert(0, 1, '-');
        }
        return digits;
    }

    bool operator==(Decimal const& lhs, Decimal const& rhs)
    {
        auto const left = detail::decomposeDecimal(lhs);
        auto const right = detail::decomposeDecimal(rhs);
        return BigInt{left.numerator * right.denominator} == BigInt{right.numerator * left.denominator};
    }

    bool operator!=(Decimal const& lhs, Decimal const& rhs)
    {
        return !(lhs == rhs);
    }
}
