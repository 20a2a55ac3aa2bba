// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

#include <exact/ContinuedFraction.hpp>
#include <utility>

namespace exact
{
    ContinuedFraction::iterator::iterator(Rational const& in_value)
    {
        // NaN and the infinities have no expansion.
        if (!in_value.isFinite())
        {
            return;
        }

        _remainder = in_value;
        _done = false;
        advance();
    }

    void ContinuedFraction::iterator::advance()
    {
        auto const& current = *_remainder;
        _term = current.numerator() / current.denominator();

        auto const fractional = current - Rational{_term};
        if (fractional.isZero())
        {
            _remainder.reset();
        }
        else
        {
            _remainder = inverse(fractional);
        }
    }

    ContinuedFraction::iterator& ContinuedFraction::iterator::operator++()
    {
        if (_remainder)
        {
            advance();
        }
        else
        {
            _done = true;
        }
        return *this;
    }

    ContinuedFraction::iterator ContinuedFraction::iterator::operator++(int)
    {
        auto previous = *this;
        ++*this;
        return previous;
    }

    ContinuedFraction::ContinuedFraction(Rational in_value)
        : _value{std::move(in_value)}
    {}

    ContinuedFraction::iterator ContinuedFraction::begin() const
    {
        return iterator{_value};
    }

    ContinuedFraction::iterator ContinuedFraction::end() const noexcept
    {
        return iterator{};
    }

    Rational const& ContinuedFraction::value() const noexcept
    {
        return _value;
    }

    ContinuedFraction toContinuedForm(Rational const& in_value)
    {
        return ContinuedFraction{in_value};
    }
}
