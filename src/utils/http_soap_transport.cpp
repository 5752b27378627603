//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "http_soap_transport.hpp"

#include "simple_tcp_communicator.hpp"
#include "soap_envelope.hpp"
#include "ws_security.hpp"

#include <SoapySDR/Logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Value of header name (case insensitive) within the header block, empty when absent.
static std::string find_header(std::string const &headers, std::string const &name)
{
    const std::string lname = to_lower(name);
    std::istringstream ss(headers);
    std::string line;
    while (std::getline(ss, line))
    {
        if (!line.empty() && line[line.size() - 1] == '\r')
        {
            line.erase(line.size() - 1);
        }
        const size_t colon = line.find(':');
        if (colon == std::string::npos)
        {
            continue;
        }
        if (to_lower(line.substr(0, colon)) == lname)
        {
            const size_t begin = line.find_first_not_of(" \t", colon + 1);
            return begin == std::string::npos ? std::string() : line.substr(begin);
        }
    }
    return std::string();
}

// Decodes a chunked body. Returns false while more data is needed.
static bool decode_chunked(std::string const &data, std::string &out)
{
    out.clear();
    size_t pos = 0;
    for (;;)
    {
        const size_t eol = data.find("\r\n", pos);
        if (eol == std::string::npos)
        {
            return false;
        }
        const std::string size_text = data.substr(pos, eol - pos);
        char *end = NULL;
        const unsigned long chunk_size = std::strtoul(size_text.c_str(), &end, 16);
        if (end == size_text.c_str())
        {
            throw TransportError("invalid chunk size in HTTP response");
        }
        pos = eol + 2;
        if (chunk_size == 0)
        {
            return true;
        }
        if (data.size() < pos + chunk_size + 2)
        {
            return false;
        }
        out.append(data, pos, chunk_size);
        pos += chunk_size + 2;
    }
}

bool http_response_complete(std::string const &raw)
{
    const size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos)
    {
        return false;
    }
    const std::string headers = raw.substr(0, header_end);
    const std::string body = raw.substr(header_end + 4);

    if (to_lower(find_header(headers, "Transfer-Encoding")).find("chunked") != std::string::npos)
    {
        std::string decoded;
        try
        {
            return decode_chunked(body, decoded);
        }
        catch (TransportError const &)
        {
            // let parse_http_response report it
            return true;
        }
    }

    const std::string length = find_header(headers, "Content-Length");
    if (!length.empty())
    {
        return body.size() >= static_cast<size_t>(std::strtoul(length.c_str(), NULL, 10));
    }

    // no framing information: the body ends when the server closes the connection
    return false;
}

HttpResponse parse_http_response(std::string const &raw)
{
    const size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos)
    {
        throw TransportError("incomplete HTTP response");
    }

    const size_t status_end = raw.find("\r\n");
    const std::string status_line = raw.substr(0, status_end);
    if (status_line.compare(0, 5, "HTTP/") != 0)
    {
        throw TransportError("invalid HTTP status line: " + status_line);
    }

    HttpResponse res;
    {
        std::istringstream ss(status_line);
        std::string version;
        ss >> version >> res.status;
        if (!ss)
        {
            throw TransportError("invalid HTTP status line: " + status_line);
        }
        std::getline(ss, res.reason);
        const size_t begin = res.reason.find_first_not_of(' ');
        res.reason = begin == std::string::npos ? std::string() : res.reason.substr(begin);
    }

    const std::string headers = raw.substr(status_end + 2, header_end - status_end - 2);
    const std::string body = raw.substr(header_end + 4);

    if (to_lower(find_header(headers, "Transfer-Encoding")).find("chunked") != std::string::npos)
    {
        if (!decode_chunked(body, res.body))
        {
            throw TransportError("truncated chunked HTTP response");
        }
        return res;
    }

    const std::string length = find_header(headers, "Content-Length");
    if (!length.empty())
    {
        const size_t expected = std::strtoul(length.c_str(), NULL, 10);
        if (body.size() < expected)
        {
            throw TransportError("truncated HTTP response");
        }
        res.body = body.substr(0, expected);
        return res;
    }

    res.body = body;
    return res;
}

void check_soap_response(HttpResponse const &response)
{
    if (response.status == 401 || response.status == 403)
    {
        throw TransportAuthorizationError("HTTP " + std::to_string(response.status) + " " + response.reason);
    }

    // SOAP faults usually come with status 400 or 500
    try
    {
        SoapResponse soap(response.body);
        if (soap.is_fault())
        {
            const auto subcodes = soap.fault_subcodes();
            const bool not_authorized = std::find(subcodes.begin(), subcodes.end(), "NotAuthorized") != subcodes.end();
            const std::string reason = soap.fault_reason();
            if (not_authorized)
            {
                throw TransportAuthorizationError(reason.empty() ? std::string("NotAuthorized") : reason);
            }
            throw TransportError("SOAP fault: " + reason);
        }
    }
    catch (SoapParseError const &ex)
    {
        if (response.status / 100 == 2)
        {
            throw TransportError(std::string("invalid SOAP response: ") + ex.what());
        }
    }

    if (response.status / 100 != 2)
    {
        throw TransportError("HTTP " + std::to_string(response.status) + " " + response.reason);
    }
}

static Uri parse_endpoint(std::string const &endpoint)
{
    try
    {
        return Uri::parse(endpoint);
    }
    catch (UriParseError const &ex)
    {
        throw TransportError(ex.what());
    }
}

HttpSoapTransport::HttpSoapTransport(std::string const &endpoint, std::shared_ptr<const Credentials> creds, int timeout_ms)
    : _endpoint(endpoint),
      _creds(creds),
      _timeout_ms(timeout_ms)
{
}

std::string const &HttpSoapTransport::endpoint() const
{
    return _endpoint;
}

std::string HttpSoapTransport::build_envelope(std::string const &body_xml) const
{
    SoapEnvelope envelope;
    if (_creds)
    {
        envelope.add_username_token(_creds->username, _creds->password, make_nonce(), make_created_timestamp());
    }
    envelope.append_body_fragment(body_xml);
    return envelope.to_string();
}

std::string HttpSoapTransport::invoke(std::string const &action, std::string const &body_xml)
{
    const Uri uri = parse_endpoint(_endpoint);

    if (uri.scheme() != "http")
    {
        throw TransportError("unsupported scheme " + uri.scheme() + " for " + _endpoint);
    }

    std::string payload;
    try
    {
        payload = build_envelope(body_xml);
    }
    catch (SoapParseError const &ex)
    {
        throw TransportError(ex.what());
    }

    std::ostringstream req;
    req << "POST " << uri.path();
    if (!uri.query().empty())
    {
        req << "?" << uri.query();
    }
    req << " HTTP/1.1\r\n";
    req << "Host: " << uri.host();
    if (uri.has_explicit_port())
    {
        req << ":" << uri.port();
    }
    req << "\r\n";
    req << "Content-Type: application/soap+xml; charset=utf-8; action=\"" << action << "\"\r\n";
    req << "Content-Length: " << payload.size() << "\r\n";
    req << "Connection: close\r\n";
    req << "\r\n";
    req << payload;

    std::string host = uri.host();
    if (!host.empty() && host[0] == '[')
    {
        host = host.substr(1, host.size() - 2);
    }

    SoapySDR::logf(SOAPY_SDR_TRACE, "onvif request to %s: %s", _endpoint.c_str(), action.c_str());

    HttpResponse response;
    try
    {
        SimpleTcpCommunicator comm(host, uri.port());
        comm.send(req.str());
        response = parse_http_response(comm.read_with_timeout(_timeout_ms, http_response_complete));
    }
    catch (CommunicatorErrorBase const &ex)
    {
        throw TransportError(ex.what());
    }

    check_soap_response(response);
    return response.body;
}

TransportFactory HttpSoapTransport::factory()
{
    return [](std::string const &endpoint, std::shared_ptr<const Credentials> creds, int timeout_ms) {
        return std::shared_ptr<SoapTransport>(new HttpSoapTransport(endpoint, creds, timeout_ms));
    };
}
