//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "inet_common.h"

#include <functional>
#include <stdexcept>
#include <string>

#define DERIVE_SIMPLE_TCP_EXCEPTION(class_name, base_name) \
    class class_name : public base_name \
    { \
      public: \
        class_name(const std::string &what = "") \
            : base_name(what) \
        { \
        } \
    };

DERIVE_SIMPLE_TCP_EXCEPTION(CommunicatorErrorBase, std::runtime_error);
DERIVE_SIMPLE_TCP_EXCEPTION(ConnectError, CommunicatorErrorBase);
DERIVE_SIMPLE_TCP_EXCEPTION(OperationError, CommunicatorErrorBase);
DERIVE_SIMPLE_TCP_EXCEPTION(ReadTimeout, CommunicatorErrorBase);

class SimpleTcpCommunicator
{
  public:
    // host may be a dotted address or a name resolved through getaddrinfo.
    SimpleTcpCommunicator(std::string const &host, int port);
    SimpleTcpCommunicator(SimpleTcpCommunicator &) = delete;
    ~SimpleTcpCommunicator();

    void send(std::string const &buf);

    // Reads until stop_predicate returns true or the peer closes the connection.
    // Throws ReadTimeout when neither happens within timeout_in_ms.
    std::string read_with_timeout(int timeout_in_ms, std::function<bool(std::string const &)> stop_predicate);

  private:
    MYSOCKET _sock;
};
