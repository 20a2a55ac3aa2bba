// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.cpp
 * @brief Runtime configuration of the library logger
 *
 * The logging macros are defined in Logging.hpp. This translation unit applies the
 * EXACT_LOG_LEVEL environment variable ("trace", "debug", "info", "warn", "error",
 * "critical" or "off") to the default spdlog logger, once per process. When the
 * variable is unset or names no known level, the level chosen by the host application
 * is left untouched.
 */

#include "exact-internal/Logging.hpp"
#include <cstdlib>
#include <exception>
#include <mutex>
#include <string>

namespace exact::detail
{
    namespace
    {
        std::once_flag loggingInitFlag;
    }

    void initializeLogging() noexcept
    {
        try
        {
            std::call_once(loggingInitFlag,
                []()
                {
                    auto const env = std::getenv("EXACT_LOG_LEVEL");
                    if (env == nullptr)
                    {
                        return;
                    }

                    // from_str() maps unknown names to "off"; only accept names it knows.
                    auto const requested = spdlog::level::from_str(env);
                    if ((requested != spdlog::level::off) || (std::string{env} == "off"))
                    {
                        spdlog::set_level(requested);
                    }
                });
        }
        catch (std::exception const&)
        {
            // Configuration failed; spdlog keeps its built-in level.
        }
    }
}
