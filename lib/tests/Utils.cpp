// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"
#include <atomic>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <unistd.h>
#include <fmt/format.h>

namespace exact::tests
{
    namespace
    {
        std::atomic<unsigned> fileCounter{0};
    }

    TempFileFixture::TempFileFixture()
        : file{std::filesystem::temp_directory_path() / fmt::format("exact-tests-{}-{}.json", ::getpid(), fileCounter++)}
    {}

    TempFileFixture::~TempFileFixture()
    {
        auto ec = std::error_code{};
        std::filesystem::remove(file, ec);
    }

    void TempFileFixture::write(std::string const& content) const
    {
        auto out = std::ofstream{file, std::ios::trunc};
        if (!out)
        {
            throw std::runtime_error{"Failed to open " + file.string()};
        }
        out << content;
    }

    std::string readFile(std::filesystem::path const& filepath)
    {
        auto in = std::ifstream{filepath};
        if (!in)
        {
            throw std::runtime_error{"Failed to open " + filepath.string()};
        }
        return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    }

    BigInt pow2(unsigned exponent)
    {
        return BigInt{1} << exponent;
    }

    BigInt pow10(unsigned exponent)
    {
        return boost::multiprecision::pow(BigInt{10}, exponent);
    }
}
