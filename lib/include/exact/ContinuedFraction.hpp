// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ContinuedFraction.hpp
 * @brief Simple continued fraction expansion of a Rational
 *
 * x = a0 + 1 / (a1 + 1 / (a2 + ...))
 *
 * The expansion of a finite rational is finite. Terms are produced lazily: take the
 * integer part (truncated toward zero), subtract it and invert the remainder, until the
 * remainder is zero. Every term of a negative value is zero or negative.
 *
 * @code
 *     for (auto const& term : exact::toContinuedForm(exact::Rational{415, 93}))
 *     {
 *         // 4, 2, 6, 7
 *     }
 * @endcode
 */

#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <vector>
#include <exact/Rational.hpp>
#include <exact/platform.h>

namespace exact
{
    /**
     * Restartable range over the terms of a continued fraction.
     *
     * Every call to begin() starts a fresh expansion of the stored value. Zero expands to
     * the single term 0; NaN and the infinities expand to an empty range.
     */
    class EXACT_EXPORT ContinuedFraction
    {
    public:
        class EXACT_EXPORT iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = BigInt;
            using difference_type = std::ptrdiff_t;
            using pointer = BigInt const*;
            using reference = BigInt const&;

            /** The end sentinel. */
            iterator() = default;

            explicit iterator(Rational const& in_value);

            reference operator*() const noexcept
            {
                return _term;
            }

            pointer operator->() const noexcept
            {
                return &_term;
            }

            iterator& operator++();
            iterator operator++(int);

            friend bool operator==(iterator const& lhs, iterator const& rhs) noexcept
            {
                return lhs._done == rhs._done;
            }

            friend bool operator!=(iterator const& lhs, iterator const& rhs) noexcept
            {
                return !(lhs == rhs);
            }

        private:
            void advance();

            /** Fractional part still to expand; empty once the expansion terminated. */
            std::optional<Rational> _remainder;
            BigInt _term;
            bool _done = true;
        };

        explicit ContinuedFraction(Rational in_value);

        [[nodiscard]]
        iterator begin() const;

        [[nodiscard]]
        iterator end() const noexcept;

        /** The value being expanded. */
        [[nodiscard]]
        Rational const& value() const noexcept;

    private:
        Rational _value;
    };

    /** Lazy continued fraction expansion of in_value. */
    [[nodiscard]]
    EXACT_EXPORT ContinuedFraction toContinuedForm(Rational const& in_value);

    /**
     * Fold the terms [in_first, in_last) back into a Rational.
     *
     * Evaluates right to left starting from +Infinity, so an empty range decodes to
     * +Infinity and the last term contributes term + 1/Infinity = term. Single-pass
     * iterators, such as those of ContinuedFraction, are buffered first.
     */
    template<typename InputIt>
    [[nodiscard]]
    Rational fromContinuedForm(InputIt in_first, InputIt in_last)
    {
        using Category = typename std::iterator_traits<InputIt>::iterator_category;
        if constexpr (std::is_base_of_v<std::bidirectional_iterator_tag, Category>)
        {
            auto result = Rational::positiveInfinity();
            while (in_last != in_first)
            {
                --in_last;
                result = Rational{BigInt{*in_last}} + inverse(result);
            }
            return result;
        }
        else
        {
            auto const terms = std::vector<BigInt>(in_first, in_last);
            return fromContinuedForm(terms.begin(), terms.end());
        }
    }

    /**
     * Fold a range of terms (anything with std::begin/std::end) back into a Rational.
     *
     * fromContinuedForm(toContinuedForm(x)) == x for every finite x.
     */
    template<typename Range>
    [[nodiscard]]
    Rational fromContinuedForm(Range const& in_terms)
    {
        return fromContinuedForm(std::begin(in_terms), std::end(in_terms));
    }
}
