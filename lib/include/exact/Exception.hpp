// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
//
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.hpp
 * @brief Exception type thrown by the throwing entry points of the library
 *
 * ERROR HANDLING STRATEGY:
 * - Throwing entry points (Rational::parse, Rational::toInteger, Decimal construction, ...)
 *   raise exact::Exception carrying an exactStatus code.
 * - Non-throwing variants (Rational::tryParse, Rational::tryToInteger) never raise; they
 *   report failure through their return value instead.
 *
 * USAGE PATTERN:
 * ```cpp
 * try
 * {
 *     auto const value = exact::Rational::parse(text);
 * }
 * catch (exact::Exception const& e)
 * {
 *     if (e.status() == EXACT_ERR_FORMAT) { ... }
 * }
 * ```
 */

#pragma once

#include <exception>
#include <string>
#include <utility>
#include <fmt/format.h>
#include <exact/exact.h>

namespace exact
{
    /**
     * @class Exception
     * @brief Base exception class of the library
     *
     * The factory methods use fmt::format for type-safe message formatting:
     * - format() for EXACT_ERR_FORMAT
     * - overflow() for EXACT_ERR_OVERFLOW
     * - divideByZero() for EXACT_ERR_DIVIDE_BY_ZERO
     * - invalidArgument() for EXACT_ERR_INVALID_ARG
     */
    class EXACT_EXPORT Exception : public std::exception
    {
    public:
        Exception(std::string msg, exactStatus status);

        /** \brief Make any type of exception.
         */
        template<typename... T>
        static Exception make(exactStatus status, fmt::format_string<T...> fmt, T&&... args)
        {
            return Exception(fmt::format(fmt, std::forward<T>(args)...), status);
        }

        /** \brief Make an EXACT_ERR_FORMAT exception.
         */
        template<typename... T>
        static Exception format(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(EXACT_ERR_FORMAT, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an EXACT_ERR_OVERFLOW exception.
         */
        template<typename... T>
        static Exception overflow(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(EXACT_ERR_OVERFLOW, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an EXACT_ERR_DIVIDE_BY_ZERO exception.
         */
        template<typename... T>
        static Exception divideByZero(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(EXACT_ERR_DIVIDE_BY_ZERO, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an EXACT_ERR_INVALID_ARG exception.
         */
        template<typename... T>
        static Exception invalidArgument(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(EXACT_ERR_INVALID_ARG, fmt, std::forward<T>(args)...);
        }

        /** \brief Return the status code that describes the condition
         * that led to the exception being thrown.
         */
        [[nodiscard]]
        exactStatus status() const noexcept;

        /** \brief Implements std::exception, returns a descriptive string about the error.
         */
        [[nodiscard]]
        char const* what() const noexcept override;

    private:
        std::string _msg;
        exactStatus _status;
    };
}
