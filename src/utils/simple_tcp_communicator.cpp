//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "simple_tcp_communicator.hpp"

#include "inet_common.h"
#include "portable_utils.h"

#include <chrono>
#include <cstring>
#include <sstream>
#include <vector>

SimpleTcpCommunicator::SimpleTcpCommunicator(std::string const &host, int port)
    : _sock(-1)
{
    network_startup();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo *result = NULL;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0 || result == NULL)
    {
        std::ostringstream ss;
        ss << "cannot resolve host " << host << ": " << gai_strerror(rc);
        throw ConnectError(ss.str());
    }

    _sock = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
    if (_sock < 0)
    {
        freeaddrinfo(result);
        throw ConnectError("socket error");
    }

        // Simple way to make connect timeout (Linux only)
#ifdef __linux
    int synRetries = 2; // Send a total of 3 SYN packets => Timeout ~7s
    setsockopt(_sock, IPPROTO_TCP, TCP_SYNCNT, &synRetries, sizeof(synRetries));
#endif

    rc = connect(_sock, result->ai_addr, (int)result->ai_addrlen);
    freeaddrinfo(result);
    if (rc < 0)
    {
        std::ostringstream ss;
        ss << "connect error to " << host << ":" << port << ": " << get_error_text();
        closesocket(_sock);
        throw ConnectError(ss.str());
    }
}

SimpleTcpCommunicator::~SimpleTcpCommunicator()
{
    closesocket(_sock);
}

void SimpleTcpCommunicator::send(std::string const &buf)
{
    size_t sent = 0;
    while (sent < buf.size())
    {
        int rc = ::send(_sock, buf.data() + sent, (int)(buf.size() - sent), 0);
        if (rc < 0)
            throw OperationError("Send error");
        sent += static_cast<size_t>(rc);
    }
}

std::string SimpleTcpCommunicator::read_with_timeout(int timeout_in_ms, std::function<bool(std::string const &)> stop_predicate)
{
    std::string res;

    if (stop_predicate(res))
    {
        return res;
    }

    std::vector<char> tmp_buf;
    tmp_buf.resize(4096);

    auto start_stamp = std::chrono::steady_clock::now();

    for (;;)
    {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(_sock, &readfds);

        // 50ms delay max
        struct timeval tv = {0, 50000};
        int ret = select((int)_sock + 1, &readfds, NULL, NULL, &tv);
        if (ret < 0)
        {
            throw OperationError("select error");
        }
        if (ret)
        {
            ssize_t received = recv(_sock, &tmp_buf[0], (int)tmp_buf.size(), 0);
            if (received < 0)
            {
                throw OperationError("Rx error");
            }
            if (received == 0)
            {
                // peer closed the connection, caller decides whether the data is complete
                break;
            }

            // append result array
            res.append(&tmp_buf[0], static_cast<size_t>(received));

            // exit loop if predicate return true
            if (stop_predicate(res))
            {
                break;
            }
        }

        const auto now_stamp = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now_stamp - start_stamp);
        if (elapsed.count() > timeout_in_ms)
        {
            throw ReadTimeout("SimpleTcpCommunicator read timeout");
        }
    }

    return res;
}
