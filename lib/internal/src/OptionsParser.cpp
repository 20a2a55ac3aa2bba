// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file OptionsParser.cpp
 * @brief Parses formatting options from JSON
 *
 * Example JSON:
 * @code
 * {
 *   "defaultFormat": "W",
 *   "decimalDigits": 30
 * }
 * @endcode
 */

#include <exact/Options.hpp>
#include <fstream>
#include <iterator>
#include <picojson/picojson.h>
#include <exact/Exception.hpp>
#include "exact-internal/Formatter.hpp"
#include "exact-internal/Logging.hpp"

namespace exact
{
    /**
     * @brief Parse options from a JSON string
     *
     * Empty strings are treated as "no options" and result in all defaults being used.
     *
     * Validation rules:
     * - decimalDigits: integral number in 0..10000
     * - defaultFormat: "F", "W", "D" or "D<n>"
     */
    Options::Options(std::string const& in_json)
    {
        // Empty options string means use all defaults
        if (in_json.empty())
        {
            return;
        }

        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, in_json);
        if (!err.empty())
        {
            throw Exception::invalidArgument("Invalid JSON options. {}", err);
        }

        if (!jsonValue.is<picojson::object>())
        {
            throw Exception::invalidArgument("Expected a JSON object");
        }
        auto const& root = jsonValue.get<picojson::object>();

        //
        // Extract decimalDigits (optional)
        //
        if (auto const it = root.find("decimalDigits"); it != root.end())
        {
            if (!it->second.is<double>())
            {
                throw Exception::invalidArgument("decimalDigits must be a number.");
            }

            auto const v = it->second.get<double>();
            if ((v < 0) || (v > detail::MAX_DECIMAL_DIGITS) || (v != static_cast<double>(static_cast<unsigned>(v))))
            {
                throw Exception::invalidArgument("decimalDigits must be an integer between 0 and {}.", detail::MAX_DECIMAL_DIGITS);
            }
            _decimalDigits = static_cast<unsigned>(v);
        }

        //
        // Extract defaultFormat (optional)
        //
        if (auto const it = root.find("defaultFormat"); it != root.end())
        {
            if (!it->second.is<std::string>())
            {
                throw Exception::invalidArgument("defaultFormat must be a string.");
            }

            auto const& format = it->second.get<std::string>();
            if (!detail::parseFormatSpec(format, _decimalDigits))
            {
                throw Exception::invalidArgument("defaultFormat '{}' is not a known format specifier.", format);
            }
            _defaultFormat = format;
        }

        EXACT_DEBUG("Options parsed: defaultFormat={}, decimalDigits={}", _defaultFormat, _decimalDigits);
    }

    Options Options::fromFile(std::filesystem::path const& in_path)
    {
        auto file = std::ifstream{in_path};
        if (!file)
        {
            throw Exception::invalidArgument("Cannot open options file {}", in_path.string());
        }

        auto const content = std::string{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
        return Options{content};
    }

    std::string const& Options::defaultFormat() const noexcept
    {
        return _defaultFormat;
    }

    unsigned Options::decimalDigits() const noexcept
    {
        return _decimalDigits;
    }
}
