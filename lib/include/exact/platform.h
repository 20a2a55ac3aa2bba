// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file platform.h
 * @brief Compiler portability macros shared by every exact header.
 *
 *   - EXACT_EXPORT : Marks a symbol for export from the shared library.
 */

#pragma once

/*
 * On GCC and Clang the "default" visibility attribute exports the symbol
 * from the .so even when the library is built with -fvisibility=hidden.
 * Other compilers get an empty macro.
 */
#if defined(__GNUC__) || defined(__clang__)
#   define EXACT_EXPORT __attribute__((visibility("default")))
#else
#   define EXACT_EXPORT
#endif
