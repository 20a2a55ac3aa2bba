// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.hpp
 * @brief Exception-safe logging macros for internal diagnostics of the exact library
 *
 * Thin wrapper around spdlog:
 * - All macros wrap log calls in try/catch so a logging failure never escapes a numeric operation
 * - In debug builds (NDEBUG not defined), TRACE and DEBUG logs are compiled in
 * - In release builds, TRACE and DEBUG calls compile to nothing
 * - Runtime log level is controlled by the EXACT_LOG_LEVEL environment variable
 */

#pragma once

// In debug mode we keep all log statements.
// In release mode we only consider info and up.
// See : https://github.com/gabime/spdlog/wiki/0.-FAQ#how-to-remove-all-debug-statements-at-compile-time-
//
// Actual logging levels can be configured through the EXACT_LOG_LEVEL environment variable
#ifndef SPDLOG_ACTIVE_LEVEL
#   ifndef NDEBUG
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#   else
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#   endif
#endif

#include <spdlog/spdlog.h>

namespace exact::detail
{
    /**
     * Apply the EXACT_LOG_LEVEL environment variable to the default spdlog logger.
     * Runs once per process; later calls return immediately.
     */
    void initializeLogging() noexcept;
}

/**
 * EXACT_TRACE: Most verbose logging, e.g. every rescaling step of a float reconstruction.
 * Only compiled in debug builds.
 */
#define EXACT_TRACE(...)                     \
    do                                       \
    {                                        \
        try                                  \
        {                                    \
            ::exact::detail::initializeLogging(); \
            SPDLOG_TRACE(__VA_ARGS__);       \
        }                                    \
        catch (...)                          \
        {}                                   \
    }                                        \
    while (false)

/**
 * EXACT_DEBUG: Debug-level logging, e.g. rejected parse input or saturated conversions.
 * Only compiled in debug builds.
 */
#define EXACT_DEBUG(...)                     \
    do                                       \
    {                                        \
        try                                  \
        {                                    \
            ::exact::detail::initializeLogging(); \
            SPDLOG_DEBUG(__VA_ARGS__);       \
        }                                    \
        catch (...)                          \
        {}                                   \
    }                                        \
    while (false)

/**
 * EXACT_INFO: Informational logging. Compiled in all builds.
 */
#define EXACT_INFO(...)                      \
    do                                       \
    {                                        \
        try                                  \
        {                                    \
            ::exact::detail::initializeLogging(); \
            SPDLOG_INFO(__VA_ARGS__);        \
        }                                    \
        catch (...)                          \
        {}                                   \
    }                                        \
    while (false)

/**
 * EXACT_WARN: Recoverable problems such as an options file that could not be applied.
 */
#define EXACT_WARN(...)                      \
    do                                       \
    {                                        \
        try                                  \
        {                                    \
            ::exact::detail::initializeLogging(); \
            SPDLOG_WARN(__VA_ARGS__);        \
        }                                    \
        catch (...)                          \
        {}                                   \
    }                                        \
    while (false)

/**
 * EXACT_ERROR: Operation failures reported to the caller through an exception or status.
 */
#define EXACT_ERROR(...)                     \
    do                                       \
    {                                        \
        try                                  \
        {                                    \
            ::exact::detail::initializeLogging(); \
            SPDLOG_ERROR(__VA_ARGS__);       \
        }                                    \
        catch (...)                          \
        {}                                   \
    }                                        \
    while (false)

/**
 * EXACT_CRITICAL: Unrecoverable internal failures.
 */
#define EXACT_CRITICAL(...)                  \
    do                                       \
    {                                        \
        try                                  \
        {                                    \
            ::exact::detail::initializeLogging(); \
            SPDLOG_CRITICAL(__VA_ARGS__);    \
        }                                    \
        catch (...)                          \
        {}                                   \
    }                                        \
    while (false)
