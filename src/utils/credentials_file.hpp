//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "soap_transport.hpp"

class CredentialsFileError : public std::runtime_error
{
  public:
    CredentialsFileError(const std::string &what = "")
        : std::runtime_error(what)
    {
    }
};

// Credential file: JSON array of {"user": ..., "pass": ..., "serial": [...]}.
// Returns the first record that applies to serial (empty serial: any record),
// or null when none does. Records without a serial list apply to every device.
std::shared_ptr<Credentials> load_credentials(std::string const &path, std::string const &serial = "");

// Same as load_credentials but from JSON text.
std::shared_ptr<Credentials> parse_credentials(std::string const &json_text, std::string const &serial = "");
