// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

#include "exact/exact.h"

// Provided by the build system.
#ifndef EXACT_VERSION_MAJOR
#   define EXACT_VERSION_MAJOR 0
#endif
#ifndef EXACT_VERSION_MINOR
#   define EXACT_VERSION_MINOR 0
#endif
#ifndef EXACT_VERSION_PATCH
#   define EXACT_VERSION_PATCH 0
#endif
#ifndef EXACT_VERSION_FULL
#   define EXACT_VERSION_FULL "0.0.0"
#endif

extern "C"
EXACT_EXPORT
exactStatus exactGetVersion(exactVersionType* out_version)
{
    if (out_version == nullptr)
    {
        return EXACT_ERR_INVALID_ARG;
    }

    out_version->major = EXACT_VERSION_MAJOR;
    out_version->minor = EXACT_VERSION_MINOR;
    out_version->bugfix = EXACT_VERSION_PATCH;
    out_version->full = EXACT_VERSION_FULL;
    return EXACT_STATUS_OK;
}

extern "C"
EXACT_EXPORT
char const* exactStatusToString(exactStatus in_status)
{
    switch (in_status)
    {
        case EXACT_STATUS_OK:          return "EXACT_STATUS_OK";
        case EXACT_ERR_UNKNOWN:        return "EXACT_ERR_UNKNOWN";
        case EXACT_ERR_FORMAT:         return "EXACT_ERR_FORMAT";
        case EXACT_ERR_OVERFLOW:       return "EXACT_ERR_OVERFLOW";
        case EXACT_ERR_DIVIDE_BY_ZERO: return "EXACT_ERR_DIVIDE_BY_ZERO";
        case EXACT_ERR_INVALID_ARG:    return "EXACT_ERR_INVALID_ARG";
        default:                       return "EXACT_ERR_UNKNOWN";
    }
}
