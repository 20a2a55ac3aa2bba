// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file exact.h
 * @brief Status codes and version query for the exact library.
 *
 * The numeric API itself is C++ (see <exact/Rational.hpp>), but the status
 * codes and version information are plain C so they can cross a C ABI
 * boundary unchanged.  Every exact::Exception carries one of the
 * exactStatus values defined here.
 *
 * Typical usage:
 * @code
 *     exactVersionType version;
 *     if (exactGetVersion(&version) == EXACT_STATUS_OK)
 *     {
 *         printf("exact %s\n", version.full);
 *     }
 * @endcode
 */

#pragma once

#ifdef __cplusplus
#   include <cstdint>
#else
#   include <stdint.h>
#endif

#include <exact/platform.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * Status codes reported by the exact library.
     *
     * Any value other than EXACT_STATUS_OK indicates that the operation did
     * not produce a result.
     */
    typedef enum exactStatus
    {
        EXACT_STATUS_OK,          /**< Success. */
        EXACT_ERR_UNKNOWN,        /**< An unexpected internal error occurred. */
        EXACT_ERR_FORMAT,         /**< Text did not match any accepted grammar, or a format specifier is unknown. */
        EXACT_ERR_OVERFLOW,       /**< The target type cannot represent the value. */
        EXACT_ERR_DIVIDE_BY_ZERO, /**< A non-finite value (denominator 0) was converted to an exact integer. */
        EXACT_ERR_INVALID_ARG,    /**< An argument is outside the accepted domain. */
    } exactStatus;

    /**
     * Semantic-versioning information for the library.
     * The `full` string is owned by the library and must NOT be freed.
     */
    typedef struct exactVersionType
    {
        uint16_t    major;
        uint16_t    minor;
        uint16_t    bugfix;
        char const* full; /**< Human-readable version string, e.g. "1.2.0". */
    } exactVersionType;

    /**
     * Retrieve the version of the library that is currently linked.
     *
     * @param[out] out_version Filled with the version information. Must not be NULL.
     * @return EXACT_STATUS_OK on success,
     *         EXACT_ERR_INVALID_ARG if \p out_version is NULL.
     */
    EXACT_EXPORT
    exactStatus exactGetVersion(exactVersionType* out_version);

    /**
     * Return a static, human-readable name for a status code.
     * Unknown values map to "EXACT_ERR_UNKNOWN".
     */
    EXACT_EXPORT
    char const* exactStatusToString(exactStatus in_status);

#ifdef __cplusplus
}
#endif
