//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <stdexcept>
#include <string>

// Error raised by OnvifDevice. One kind per failure class, with the context
// that belongs to it.
class DeviceError : public std::runtime_error
{
  public:
    enum class Kind
    {
        UnexpectedBehavior, // device violated a resolution invariant
        Transport,          // serialization or network failure
        Unauthorized,       // credentials missing, incomplete or rejected
        Unknown,
    };

    static DeviceError unexpected_behavior(std::string const &message, std::string const &advertised_uri,
                                           std::string const &expected_uri);
    static DeviceError transport(std::string const &detail);
    static DeviceError unauthorized(std::string const &detail);
    static DeviceError unknown();
    static DeviceError unknown(std::string const &detail);

    Kind kind() const
    {
        return _kind;
    }

    // Message without the kind prefix. Empty for an Unknown error without detail.
    std::string const &detail() const
    {
        return _detail;
    }

    // UnexpectedBehavior only.
    std::string const &advertised_uri() const
    {
        return _advertised_uri;
    }
    std::string const &expected_uri() const
    {
        return _expected_uri;
    }

  private:
    DeviceError(Kind kind, std::string const &what, std::string const &detail);

    Kind _kind;
    std::string _detail;
    std::string _advertised_uri{};
    std::string _expected_uri{};
};
