//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "onvif_control.hpp"

#include "soap_envelope.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>

static bool parse_bool(std::string const &text)
{
    return text == "true" || text == "1";
}

static int parse_int(std::string const &text)
{
    return std::atoi(text.c_str());
}

// Empty request element <prefix:name xmlns:...> for the given service namespace.
static pugi::xml_node make_request_node(pugi::xml_document &doc, const char *prefix, const char *ns, const char *name)
{
    const std::string qname = std::string(prefix) + ":" + name;
    const std::string xmlns = std::string("xmlns:") + prefix;

    auto node = doc.append_child(qname.c_str());
    node.append_attribute(xmlns.c_str()) = ns;
    node.append_attribute("xmlns:tt") = NS_TT;
    return node;
}

// Loads a response envelope and checks its payload element name.
static pugi::xml_node expect_payload(SoapResponse const &response, const char *expected)
{
    auto payload = response.payload();
    if (local_name(payload) != expected)
    {
        throw SoapParseError(std::string("expected ") + expected + ", got '" + local_name(payload) + "'");
    }
    return payload;
}

static DeviceMgmtControl::DateTime parse_date_time(pugi::xml_node node)
{
    DeviceMgmtControl::DateTime res;
    auto date = child_local(node, "Date");
    auto time = child_local(node, "Time");
    res.year = parse_int(child_text(date, "Year"));
    res.month = parse_int(child_text(date, "Month"));
    res.day = parse_int(child_text(date, "Day"));
    res.hour = parse_int(child_text(time, "Hour"));
    res.minute = parse_int(child_text(time, "Minute"));
    res.second = parse_int(child_text(time, "Second"));
    return res;
}

static DeviceMgmtControl::NetworkHost parse_network_host(pugi::xml_node node)
{
    DeviceMgmtControl::NetworkHost res;
    res.type = child_text(node, "Type");
    res.ipv4_address = child_text(node, "IPv4Address");
    res.ipv6_address = child_text(node, "IPv6Address");
    res.dns_name = child_text(node, "DNSname");
    return res;
}

std::string DeviceMgmtControl::DateTime::to_string() const
{
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << month << "-" << std::setw(2) << day << " "
       << std::setw(2) << hour << ":" << std::setw(2) << minute << ":" << std::setw(2) << second;
    return ss.str();
}

std::string DeviceMgmtControl::NetworkHost::to_display_string() const
{
    std::string res;
    if (!dns_name.empty())
    {
        res += dns_name + " ";
    }
    if (!ipv4_address.empty())
    {
        res += ipv4_address + " ";
    }
    if (!ipv6_address.empty())
    {
        res += ipv6_address + " ";
    }
    return res;
}

DeviceMgmtControl::DeviceMgmtControl(std::shared_ptr<SoapTransport> transport)
    : _transport(transport)
{
}

std::string DeviceMgmtControl::call(const char *operation, std::string const &body_xml)
{
    return _transport->invoke(std::string(NS_TDS) + "/" + operation, body_xml);
}

std::vector<DeviceMgmtControl::ServiceDescriptor> DeviceMgmtControl::get_services()
{
    pugi::xml_document doc;
    auto req = make_request_node(doc, "tds", NS_TDS, "GetServices");
    req.append_child("tds:IncludeCapability").text() = "false";

    return parse_get_services(call("GetServices", serialize_node(req)));
}

std::vector<DeviceMgmtControl::ServiceDescriptor> DeviceMgmtControl::parse_get_services(std::string const &text)
{
    SoapResponse response(text);
    auto payload = expect_payload(response, "GetServicesResponse");

    std::vector<ServiceDescriptor> res;
    for (auto const &service : children_local(payload, "Service"))
    {
        ServiceDescriptor item;
        item.namespace_uri = child_text(service, "Namespace");
        item.address = child_text(service, "XAddr");
        res.push_back(item);
    }
    return res;
}

std::vector<DeviceMgmtControl::UserAccount> DeviceMgmtControl::get_users()
{
    pugi::xml_document doc;
    auto req = make_request_node(doc, "tds", NS_TDS, "GetUsers");

    return parse_get_users(call("GetUsers", serialize_node(req)));
}

std::vector<DeviceMgmtControl::UserAccount> DeviceMgmtControl::parse_get_users(std::string const &text)
{
    SoapResponse response(text);
    auto payload = expect_payload(response, "GetUsersResponse");

    std::vector<UserAccount> res;
    for (auto const &user : children_local(payload, "User"))
    {
        UserAccount item;
        item.username = child_text(user, "Username");
        auto password = child_local(user, "Password");
        if (password)
        {
            item.has_password = true;
            item.password = password.text().get();
        }
        item.level = child_text(user, "UserLevel");
        auto extension = child_local(user, "Extension");
        if (extension)
        {
            item.extension = capture_fragment(extension);
        }
        res.push_back(item);
    }
    return res;
}

std::string DeviceMgmtControl::make_set_user_request(UserAccount const &user)
{
    pugi::xml_document doc;
    auto req = make_request_node(doc, "tds", NS_TDS, "SetUser");
    auto node = req.append_child("tds:User");

    node.append_child("tt:Username").text() = user.username.c_str();
    if (user.has_password)
    {
        node.append_child("tt:Password").text() = user.password.c_str();
    }
    node.append_child("tt:UserLevel").text() = user.level.c_str();
    if (!user.extension.empty())
    {
        pugi::xml_parse_result rc = node.append_buffer(user.extension.data(), user.extension.size());
        if (!rc)
        {
            throw SoapParseError(std::string("user extension is not well formed: ") + rc.description());
        }
    }

    return serialize_node(req);
}

void DeviceMgmtControl::set_user(UserAccount const &user)
{
    SoapResponse response(call("SetUser", make_set_user_request(user)));
    expect_payload(response, "SetUserResponse");
}

std::string DeviceMgmtControl::system_reboot()
{
    pugi::xml_document doc;
    auto req = make_request_node(doc, "tds", NS_TDS, "SystemReboot");

    SoapResponse response(call("SystemReboot", serialize_node(req)));
    auto payload = expect_payload(response, "SystemRebootResponse");
    return child_text(payload, "Message");
}

DeviceMgmtControl::DeviceInformation DeviceMgmtControl::get_device_information()
{
    pugi::xml_document doc;
    auto req = make_request_node(doc, "tds", NS_TDS, "GetDeviceInformation");

    SoapResponse response(call("GetDeviceInformation", serialize_node(req)));
    auto payload = expect_payload(response, "GetDeviceInformationResponse");

    DeviceInformation res;
    res.manufacturer = child_text(payload, "Manufacturer");
    res.model = child_text(payload, "Model");
    res.firmware_version = child_text(payload, "FirmwareVersion");
    res.serial_number = child_text(payload, "SerialNumber");
    res.hardware_id = child_text(payload, "HardwareId");
    return res;
}

DeviceMgmtControl::SystemDateAndTime DeviceMgmtControl::get_system_date_and_time()
{
    pugi::xml_document doc;
    auto req = make_request_node(doc, "tds", NS_TDS, "GetSystemDateAndTime");

    SoapResponse response(call("GetSystemDateAndTime", serialize_node(req)));
    auto payload = expect_payload(response, "GetSystemDateAndTimeResponse");
    auto sdt = child_local(payload, "SystemDateAndTime");
    if (!sdt)
    {
        throw SoapParseError("GetSystemDateAndTimeResponse without SystemDateAndTime");
    }

    SystemDateAndTime res;
    res.date_time_type = child_text(sdt, "DateTimeType");
    res.daylight_savings = parse_bool(child_text(sdt, "DaylightSavings"));

    auto tz = child_local(sdt, "TimeZone");
    if (tz)
    {
        res.has_time_zone = true;
        res.time_zone = child_text(tz, "TZ");
    }

    auto utc = child_local(sdt, "UTCDateTime");
    if (utc)
    {
        res.has_utc = true;
        res.utc = parse_date_time(utc);
    }

    auto local = child_local(sdt, "LocalDateTime");
    if (local)
    {
        res.has_local = true;
        res.local = parse_date_time(local);
    }
    return res;
}

DeviceMgmtControl::NtpInformation DeviceMgmtControl::get_ntp()
{
    pugi::xml_document doc;
    auto req = make_request_node(doc, "tds", NS_TDS, "GetNTP");

    SoapResponse response(call("GetNTP", serialize_node(req)));
    auto payload = expect_payload(response, "GetNTPResponse");
    auto info = child_local(payload, "NTPInformation");

    NtpInformation res;
    res.from_dhcp = parse_bool(child_text(info, "FromDHCP"));
    for (auto const &host : children_local(info, "NTPFromDHCP"))
    {
        res.ntp_from_dhcp.push_back(parse_network_host(host));
    }
    for (auto const &host : children_local(info, "NTPManual"))
    {
        res.ntp_manual.push_back(parse_network_host(host));
    }
    return res;
}

std::vector<DeviceMgmtControl::NetworkInterface> DeviceMgmtControl::get_network_interfaces()
{
    pugi::xml_document doc;
    auto req = make_request_node(doc, "tds", NS_TDS, "GetNetworkInterfaces");

    SoapResponse response(call("GetNetworkInterfaces", serialize_node(req)));
    auto payload = expect_payload(response, "GetNetworkInterfacesResponse");

    std::vector<NetworkInterface> res;
    for (auto const &iface : children_local(payload, "NetworkInterfaces"))
    {
        NetworkInterface item;
        item.token = iface.attribute("token").value();
        item.enabled = parse_bool(child_text(iface, "Enabled"));

        auto info = child_local(iface, "Info");
        if (info)
        {
            item.has_info = true;
            item.name = child_text(info, "Name");
            item.hw_address = child_text(info, "HwAddress");
            const std::string mtu = child_text(info, "MTU");
            if (!mtu.empty())
            {
                item.mtu = parse_int(mtu);
            }
        }

        for (auto const &ipv4 : children_local(iface, "IPv4"))
        {
            auto config = child_local(ipv4, "Config");
            if (parse_bool(child_text(config, "DHCP")))
            {
                item.dhcp = true;
                for (auto const &addr : children_local(config, "FromDHCP"))
                {
                    item.dhcp_addresses.push_back(child_text(addr, "Address"));
                }
            }
            for (auto const &addr : children_local(config, "Manual"))
            {
                item.manual_addresses.push_back(child_text(addr, "Address"));
            }
        }

        for (auto const &dot11 : children_local(child_local(iface, "Extension"), "Dot11"))
        {
            item.ssids.push_back(child_text(dot11, "SSID"));
        }

        res.push_back(item);
    }
    return res;
}

MediaControl::MediaControl(std::shared_ptr<SoapTransport> transport)
    : _transport(transport)
{
}

std::vector<MediaControl::Profile> MediaControl::get_profiles()
{
    pugi::xml_document doc;
    auto req = make_request_node(doc, "trt", NS_TRT, "GetProfiles");

    SoapResponse response(_transport->invoke(std::string(NS_TRT) + "/GetProfiles", serialize_node(req)));
    auto payload = expect_payload(response, "GetProfilesResponse");

    std::vector<Profile> res;
    for (auto const &profile : children_local(payload, "Profiles"))
    {
        Profile item;
        item.token = profile.attribute("token").value();
        item.fixed = parse_bool(profile.attribute("fixed").value());
        item.name = child_text(profile, "Name");
        res.push_back(item);
    }
    return res;
}
