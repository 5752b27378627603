//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

class TransportError : public std::runtime_error
{
  public:
    TransportError(const std::string &what = "")
        : std::runtime_error(what)
    {
    }
};

// The device rejected the credentials (or none were given where required).
class TransportAuthorizationError : public TransportError
{
  public:
    TransportAuthorizationError(const std::string &what = "")
        : TransportError(what)
    {
    }
};

struct Credentials
{
    std::string username;
    std::string password;
};

// Request/response client bound to one service endpoint.
class SoapTransport
{
  public:
    virtual ~SoapTransport() = default;

    virtual std::string const &endpoint() const = 0;

    // Sends body_xml (one element with its namespaces declared) as the Body of
    // a request for action and returns the response envelope text.
    // Throws TransportError / TransportAuthorizationError.
    virtual std::string invoke(std::string const &action, std::string const &body_xml) = 0;
};

// creds may be null (anonymous access).
typedef std::function<std::shared_ptr<SoapTransport>(std::string const &endpoint, std::shared_ptr<const Credentials> creds,
                                                     int timeout_ms)>
    TransportFactory;
