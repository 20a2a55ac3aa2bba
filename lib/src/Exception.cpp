// SPDX-FileCopyrightText: 2025 Contributors to the exact project.
// SPDX-License-Identifier: Apache-2.0

#include <exact/Exception.hpp>
#include <utility>

namespace exact
{
    Exception::Exception(std::string msg, exactStatus status)
        : _msg{std::move(msg)}
        , _status{status}
    {}

    exactStatus Exception::status() const noexcept
    {
        return _status;
    }

    char const* Exception::what() const noexcept
    {
        return _msg.c_str();
    }
}
