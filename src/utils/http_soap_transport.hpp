//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "soap_transport.hpp"

// SOAP 1.2 over plain HTTP/1.1. A new TCP connection is made per request.
class HttpSoapTransport : public SoapTransport
{
  public:
    HttpSoapTransport(std::string const &endpoint, std::shared_ptr<const Credentials> creds, int timeout_ms);

    std::string const &endpoint() const override;
    std::string invoke(std::string const &action, std::string const &body_xml) override;

    static TransportFactory factory();

  private:
    std::string build_envelope(std::string const &body_xml) const;

    std::string _endpoint;
    std::shared_ptr<const Credentials> _creds;
    int _timeout_ms;
};

struct HttpResponse
{
    int status{};
    std::string reason{};
    std::string body{};
};

// Returns true once raw holds a complete response (headers plus body per
// Content-Length or chunked encoding).
bool http_response_complete(std::string const &raw);

// Parses a complete (or connection-close terminated) response.
// Throws TransportError when the status line or framing is invalid.
HttpResponse parse_http_response(std::string const &raw);

// Maps the HTTP status and SOAP faults of a response to transport errors:
// 401/403 and NotAuthorized faults throw TransportAuthorizationError, other
// faults, non-2xx statuses and unparsable 2xx bodies throw TransportError.
void check_soap_response(HttpResponse const &response);
