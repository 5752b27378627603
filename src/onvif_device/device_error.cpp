//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "device_error.hpp"

DeviceError::DeviceError(Kind kind, std::string const &what, std::string const &detail)
    : std::runtime_error(what),
      _kind(kind),
      _detail(detail)
{
}

DeviceError DeviceError::unexpected_behavior(std::string const &message, std::string const &advertised_uri,
                                             std::string const &expected_uri)
{
    DeviceError res(Kind::UnexpectedBehavior, "Unexpected behavior: " + message, message);
    res._advertised_uri = advertised_uri;
    res._expected_uri = expected_uri;
    return res;
}

DeviceError DeviceError::transport(std::string const &detail)
{
    return DeviceError(Kind::Transport, "Transport error: " + detail, detail);
}

DeviceError DeviceError::unauthorized(std::string const &detail)
{
    return DeviceError(Kind::Unauthorized, "Unauthorized: " + detail, detail);
}

DeviceError DeviceError::unknown()
{
    return DeviceError(Kind::Unknown, "Unknown error", "");
}

DeviceError DeviceError::unknown(std::string const &detail)
{
    return DeviceError(Kind::Unknown, "Unknown error: " + detail, detail);
}
