//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "onvif_device.hpp"
#include "params.hpp"
#include "ws_discovery.hpp"

// Runs a device command (everything but probe). Returns the exit status.
// Throws DeviceError.
int run_command(Params const &params, std::vector<std::string> const &positional, std::ostream &out);

// Runs discovery and prints each match. Returns the exit status.
int run_probe(std::ostream &out);

void print_probe_match(WsDiscovery::ProbeMatch const &match, std::ostream &out);
void print_users(std::vector<DeviceMgmtControl::UserAccount> const &users, std::ostream &out);
int show_device_info(OnvifDevice const &device, std::ostream &out);
