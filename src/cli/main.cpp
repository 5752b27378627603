//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "commands.hpp"
#include "params.hpp"

#include "portable_utils.h"

#include <SoapySDR/Logger.hpp>

#include <iostream>

int main(int argc, char *argv[])
{
    CommandLine cmd;
    Params params;
    try
    {
        cmd = parse_command_line(argc, argv);
        if (cmd.help)
        {
            std::cout << usage_text(argv[0]);
            return 0;
        }
        validate_command(cmd.positional);
        params = Params::make_from_kwargs(cmd.args);
        SoapySDR::setLogLevel(parse_log_level(params.log));
    }
    catch (WrongParamsError const &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n\n" << usage_text(argv[0]);
        return 2;
    }

    SoapySDR::logf(SOAPY_SDR_DEBUG, "onvifctl params: %s", params.as_debug_string().c_str());

    try
    {
        network_startup();
    }
    catch (std::runtime_error const &ex)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "Error: %s", ex.what());
        return -2;
    }

    if (cmd.positional[0] == "probe")
    {
        return run_probe(std::cout);
    }

    try
    {
        return run_command(params, cmd.positional, std::cout);
    }
    catch (DeviceError const &err)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "Error: %s", err.what());
        return -2;
    }
}
