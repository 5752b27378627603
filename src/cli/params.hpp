//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <SoapySDR/Logger.hpp>
#include <SoapySDR/Types.hpp>

#include <stdexcept>
#include <string>
#include <vector>

class WrongParamsError : public std::runtime_error
{
  public:
    WrongParamsError(const std::string &what = "")
        : std::runtime_error(what)
    {
    }
};

struct Params
{
    std::string uri{};    // device management endpoint
    std::string creds{};  // credential file path
    std::string serial{}; // serial number to pick credentials for
    std::string log{"warning"};

    std::string as_debug_string() const;

    static Params make_from_kwargs(const SoapySDR::Kwargs &args);
};

struct CommandLine
{
    SoapySDR::Kwargs args;
    std::vector<std::string> positional; // command followed by its arguments
    bool help{false};
};

// --key=value, --key value and --args="k=v,k=v" options, then the command and its arguments.
CommandLine parse_command_line(int argc, const char *const argv[]);

// Checks the command name and its argument count.
void validate_command(std::vector<std::string> const &positional);

SoapySDR::LogLevel parse_log_level(std::string const &name);

std::string usage_text(std::string const &program);
