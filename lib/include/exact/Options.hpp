// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Options.hpp
 * @brief Formatting defaults loaded from JSON
 *
 * Example options JSON:
 * {
 *   "defaultFormat": "D",     // specifier used by Rational::toString(Options const&)
 *   "decimalDigits": 40       // digits rendered by a bare "D" specifier
 * }
 *
 * Both fields are optional. Unknown fields are ignored.
 *
 * Design:
 * - Immutable after construction (thread-safe for reads)
 * - Validated during parsing (throws on invalid values)
 */

#pragma once

#include <filesystem>
#include <string>
#include <exact/platform.h>

namespace exact
{
    class EXACT_EXPORT Options
    {
    public:
        /** Defaults: format "F", 15 decimal digits. */
        Options() = default;

        /**
         * Parse a JSON string of options. An empty string yields the defaults.
         *
         * @throws exact::Exception (EXACT_ERR_INVALID_ARG) if the JSON is malformed, the root is
         *         not an object, a field has the wrong type, "decimalDigits" is outside 0..10000
         *         or "defaultFormat" is not a known specifier
         */
        explicit Options(std::string const& in_json);

        /**
         * Read and parse an options file.
         *
         * @throws exact::Exception (EXACT_ERR_INVALID_ARG) if the file cannot be read or its
         *         content is rejected by the JSON constructor
         */
        [[nodiscard]]
        static Options fromFile(std::filesystem::path const& in_path);

        [[nodiscard]]
        std::string const& defaultFormat() const noexcept;

        [[nodiscard]]
        unsigned decimalDigits() const noexcept;

    private:
        std::string _defaultFormat = "F";
        unsigned _decimalDigits = 15;
    };
}
