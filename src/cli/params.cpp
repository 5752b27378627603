//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "params.hpp"

#include <sstream>

static const char *const known_keys[] = {"uri", "creds", "serial", "log"};

static bool is_known_key(std::string const &key)
{
    for (auto const *k : known_keys)
    {
        if (key == k)
        {
            return true;
        }
    }
    return false;
}

std::string Params::as_debug_string() const
{
    std::ostringstream ss;
    ss << "uri=" << uri << " creds=" << creds << " serial=" << serial << " log=" << log;
    return ss.str();
}

Params Params::make_from_kwargs(const SoapySDR::Kwargs &args)
{
    Params res;

    if (args.count("uri"))
    {
        res.uri = args.at("uri");
    }

    if (args.count("creds"))
    {
        res.creds = args.at("creds");
    }

    if (args.count("serial"))
    {
        res.serial = args.at("serial");
    }

    if (args.count("log"))
    {
        res.log = args.at("log");
    }

    return res;
}

CommandLine parse_command_line(int argc, const char *const argv[])
{
    CommandLine res;

    int idx = 1;
    for (; idx < argc; idx++)
    {
        const std::string arg = argv[idx];
        if (arg == "-h" || arg == "--help")
        {
            res.help = true;
            continue;
        }
        if (arg.compare(0, 2, "--") != 0)
        {
            break;
        }

        std::string key = arg.substr(2);
        std::string value;
        const size_t eq = key.find('=');
        if (eq != std::string::npos)
        {
            value = key.substr(eq + 1);
            key.erase(eq);
        }
        else
        {
            if (idx + 1 >= argc)
            {
                throw WrongParamsError("option --" + key + " needs a value");
            }
            value = argv[++idx];
        }

        if (key == "args")
        {
            for (auto const &kv : SoapySDR::KwargsFromString(value))
            {
                if (!is_known_key(kv.first))
                {
                    throw WrongParamsError("unknown key '" + kv.first + "' in --args");
                }
                res.args[kv.first] = kv.second;
            }
            continue;
        }

        if (!is_known_key(key))
        {
            throw WrongParamsError("unknown option --" + key);
        }
        res.args[key] = value;
    }

    for (; idx < argc; idx++)
    {
        res.positional.push_back(argv[idx]);
    }

    return res;
}

void validate_command(std::vector<std::string> const &positional)
{
    if (positional.empty())
    {
        throw WrongParamsError("no command given");
    }

    const std::string &command = positional[0];
    size_t expected_args = 0;
    if (command == "set-user")
    {
        expected_args = 2;
    }
    else if (command != "probe" && command != "info" && command != "get-users" && command != "reboot")
    {
        throw WrongParamsError("unknown command '" + command + "'");
    }

    if (positional.size() - 1 != expected_args)
    {
        std::ostringstream ss;
        ss << "command '" << command << "' takes " << expected_args << " argument(s)";
        throw WrongParamsError(ss.str());
    }
}

SoapySDR::LogLevel parse_log_level(std::string const &name)
{
    if (name == "fatal")
        return SOAPY_SDR_FATAL;
    if (name == "critical")
        return SOAPY_SDR_CRITICAL;
    if (name == "error")
        return SOAPY_SDR_ERROR;
    if (name == "warning")
        return SOAPY_SDR_WARNING;
    if (name == "notice")
        return SOAPY_SDR_NOTICE;
    if (name == "info")
        return SOAPY_SDR_INFO;
    if (name == "debug")
        return SOAPY_SDR_DEBUG;
    if (name == "trace")
        return SOAPY_SDR_TRACE;
    throw WrongParamsError("unknown log level '" + name + "'");
}

std::string usage_text(std::string const &program)
{
    std::ostringstream ss;
    ss << "ONVIF camera control program.\n"
       << "\n"
       << "Usage: " << program << " [options] <command> [args]\n"
       << "\n"
       << "Commands:\n"
       << "  probe                          Query network for all online ONVIF compatible devices\n"
       << "  info                           Show configuration for an ONVIF camera\n"
       << "  get-users                      Get a list of users from a camera\n"
       << "  set-user <username> <password> Set a user's password\n"
       << "  reboot                         Reboot a camera\n"
       << "\n"
       << "Options:\n"
       << "  --uri=URI        Camera device management URI\n"
       << "  --creds=FILE     Credentials file\n"
       << "  --serial=SN      Pick credentials listed for this serial number\n"
       << "  --log=LEVEL      fatal, critical, error, warning, notice, info, debug, trace\n"
       << "  --args=KWARGS    Options as key=value pairs, e.g. \"uri=http://...,creds=creds.json\"\n";
    return ss.str();
}
