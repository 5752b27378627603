//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "commands.hpp"

#include "credentials_file.hpp"

#include <SoapySDR/Logger.hpp>

#include <cmath>
#include <cstdlib>
#include <ctime>

static const char *bool_text(bool value)
{
    return value ? "true" : "false";
}

static std::time_t utc_to_time_t(DeviceMgmtControl::DateTime const &dt)
{
    std::tm tm{};
    tm.tm_year = dt.year - 1900;
    tm.tm_mon = dt.month - 1;
    tm.tm_mday = dt.day;
    tm.tm_hour = dt.hour;
    tm.tm_min = dt.minute;
    tm.tm_sec = dt.second;
    tm.tm_isdst = 0;
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

static void print_hosts(std::vector<DeviceMgmtControl::NetworkHost> const &hosts, std::ostream &out)
{
    for (auto const &host : hosts)
    {
        out << host.to_display_string();
    }
}

void print_probe_match(WsDiscovery::ProbeMatch const &match, std::ostream &out)
{
    out << "Device " << match.endpoint_reference << "\n";
    out << "  Types\t\t";
    for (auto const &t : match.types)
    {
        out << t << " ";
    }
    out << "\n  Scopes\n";
    for (auto const &s : match.scopes)
    {
        out << "    " << s << "\n";
    }
    out << "  XAddrs\t";
    for (auto const &x : match.xaddrs)
    {
        out << x << " ";
    }
    out << "\n  Metadata\t" << match.metadata_version << std::endl;
}

void print_users(std::vector<DeviceMgmtControl::UserAccount> const &users, std::ostream &out)
{
    out << "Users:\n";
    for (auto const &user : users)
    {
        out << "    " << user.username << "\t" << user.level << "\t" << user.extension << "\n";
    }
    out.flush();
}

int show_device_info(OnvifDevice const &device, std::ostream &out)
{
    // Device Info
    const auto info = device.device_information();
    out << "Device Info:\n"
        << "  Serial\t" << info.serial_number << "\n"
        << "  Make\t\t" << info.manufacturer << "\n"
        << "  Model\t\t" << info.model << "\n"
        << "  Firmware\t" << info.firmware_version << "\n"
        << "  Hardware ID\t" << info.hardware_id << "\n";

    // Device Time
    const auto time = device.system_date_and_time();
    const auto ntp = device.ntp();
    out << "Device Time:\n";
    out << "  Source\t" << time.date_time_type << "\n";
    out << "  DST\t\t" << bool_text(time.daylight_savings) << "\n";
    if (time.has_time_zone)
    {
        out << "  TimeZone\t" << time.time_zone << "\n";
    }
    else
    {
        out << "  TimeZone\tNot Set\n";
    }
    if (time.has_utc)
    {
        out << "  UTC\t\t" << time.utc.to_string();
        const double drift = std::difftime(utc_to_time_t(time.utc), std::time(NULL));
        if (std::abs(drift) > 15.0)
        {
            out << " *DOES NOT MATCH SYSTEM*";
        }
        out << "\n";
    }
    else
    {
        out << "  UTC\t\tNot Set\n";
    }
    if (time.has_local)
    {
        out << "  Local\t\t" << time.local.to_string() << "\n";
    }
    else
    {
        out << "  Local\t\tNot Set\n";
    }

    if (ntp.from_dhcp)
    {
        out << "  DHCP NTP\t";
        print_hosts(ntp.ntp_from_dhcp, out);
        out << "\n";
    }
    out << "  NTP\t\t";
    print_hosts(ntp.ntp_manual, out);
    out << "\n";

    // Network Configuration
    for (auto const &iface : device.network_interfaces())
    {
        const std::string name = (iface.has_info && !iface.name.empty()) ? iface.name : iface.token;
        out << "Interface " << name << " enabled=" << bool_text(iface.enabled) << "\n";
        if (iface.has_info)
        {
            out << "  HW Addr\t" << iface.hw_address << "\n";
            if (iface.mtu != -1)
            {
                out << "  MTU\t\t" << iface.mtu << "\n";
            }
        }
        for (auto const &addr : iface.dhcp_addresses)
        {
            out << "  DHCP IP\t" << addr << "\n";
        }
        for (auto const &addr : iface.manual_addresses)
        {
            out << "  IP\t\t" << addr << "\n";
        }
        for (auto const &ssid : iface.ssids)
        {
            out << "  SSID\t\t" << ssid << "\n";
        }
    }

    // Media profiles
    if (device.has_service(ServiceKind::Media))
    {
        out << "Media Profiles:\n";
        for (auto const &profile : device.media_profiles())
        {
            out << "  Profile\t" << profile.name << " (" << profile.token << ")" << (profile.fixed ? " fixed" : "") << "\n";
        }
    }

    // User Configuration
    out << "Users:\n";
    for (auto const &user : device.list_users())
    {
        out << "  User\t\t" << user.username << " (" << user.level << ")\n";
    }
    out.flush();

    return 0;
}

int run_command(Params const &params, std::vector<std::string> const &positional, std::ostream &out)
{
    if (params.uri.empty())
    {
        throw DeviceError::unknown("No URI specified");
    }

    Uri uri = [&params]() -> Uri {
        try
        {
            return Uri::parse(params.uri);
        }
        catch (UriParseError const &)
        {
            throw DeviceError::unknown("Could not parse URI");
        }
    }();

    std::shared_ptr<Credentials> creds;
    if (!params.creds.empty())
    {
        try
        {
            creds = load_credentials(params.creds, params.serial);
        }
        catch (CredentialsFileError const &ex)
        {
            throw DeviceError::unknown(std::string("Could not load credential file: ") + ex.what());
        }
    }

    const auto device = creds ? OnvifDevice::resolve(uri, &creds->username, &creds->password) : OnvifDevice::resolve(uri, NULL, NULL);

    const std::string &command = positional[0];

    if (command == "get-users")
    {
        print_users(device->list_users(), out);
    }
    else if (command == "set-user")
    {
        const std::string &username = positional[1];
        const std::string &password = positional[2];
        if (device->set_user(username, password) == SetUserResult::NotFound)
        {
            out << "User " << username << " not found." << std::endl;
            return -1;
        }
    }
    else if (command == "reboot")
    {
        out << "Reboot: " << device->reboot() << std::endl;
    }
    else if (command == "info")
    {
        return show_device_info(*device, out);
    }
    else
    {
        throw DeviceError::unknown("unsupported command " + command);
    }

    return 0;
}

int run_probe(std::ostream &out)
{
    out << "Discovering cameras" << std::endl;
    try
    {
        WsDiscovery::discovery([&out](WsDiscovery::ProbeMatch const &match) { print_probe_match(match, out); });
    }
    catch (DiscoveryError const &ex)
    {
        out << "Error: " << ex.what() << std::endl;
    }
    return 0;
}
