// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>
#include <exact/Exception.hpp>
#include <exact/Rational.hpp>

namespace exact::tests
{
    //
    // RAII helper that writes a file in the temp directory for the duration of a test
    //
    class TempFileFixture
    {
    public:
        /// Create the fixture with an empty, uniquely named file path.
        TempFileFixture();
        /// Delete the file if it was written
        ~TempFileFixture();

        /// Replace the content of the file.
        void write(std::string const& content) const;

    protected:
        /// The path to the file
        std::filesystem::path file;
    };

    // Simple utility to read a file into a string
    std::string readFile(std::filesystem::path const& filepath);

    // 2^exponent as a BigInt
    BigInt pow2(unsigned exponent);

    // 10^exponent as a BigInt
    BigInt pow10(unsigned exponent);

    // Run fn and report the status of the exact::Exception it threw, EXACT_STATUS_OK if none
    template<typename F>
    exactStatus thrownStatus(F&& fn)
    {
        try
        {
            fn();
        }
        catch (Exception const& e)
        {
            return e.status();
        }
        return EXACT_STATUS_OK;
    }

} // namespace exact::tests
