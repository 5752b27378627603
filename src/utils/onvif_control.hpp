//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "soap_transport.hpp"

// Typed device management operations (http://www.onvif.org/ver10/device/wsdl).
// Errors: TransportError from the transport, SoapParseError when a reply does
// not have the expected shape.
class DeviceMgmtControl
{
  public:
    explicit DeviceMgmtControl(std::shared_ptr<SoapTransport> transport);

    struct ServiceDescriptor
    {
        std::string namespace_uri;
        std::string address;
    };

    struct UserAccount
    {
        std::string username;
        bool has_password{false};
        std::string password;
        std::string level;     // UserLevel, passed through untouched
        std::string extension; // tt:Extension element as captured from the device, empty when absent
    };

    struct DeviceInformation
    {
        std::string manufacturer;
        std::string model;
        std::string firmware_version;
        std::string serial_number;
        std::string hardware_id;
    };

    struct DateTime
    {
        int year{};
        int month{};
        int day{};
        int hour{};
        int minute{};
        int second{};

        std::string to_string() const;
    };

    struct SystemDateAndTime
    {
        std::string date_time_type; // Manual or NTP
        bool daylight_savings{false};
        bool has_time_zone{false};
        std::string time_zone;
        bool has_utc{false};
        DateTime utc;
        bool has_local{false};
        DateTime local;
    };

    struct NetworkHost
    {
        std::string type;
        std::string ipv4_address;
        std::string ipv6_address;
        std::string dns_name;

        // "dns ipv4 ipv6 " with absent parts left out
        std::string to_display_string() const;
    };

    struct NtpInformation
    {
        bool from_dhcp{false};
        std::vector<NetworkHost> ntp_from_dhcp;
        std::vector<NetworkHost> ntp_manual;
    };

    struct NetworkInterface
    {
        std::string token;
        bool enabled{false};
        bool has_info{false};
        std::string name;
        std::string hw_address;
        int mtu{-1}; // -1 when not reported
        bool dhcp{false};
        std::vector<std::string> dhcp_addresses;
        std::vector<std::string> manual_addresses;
        std::vector<std::string> ssids;
    };

    std::vector<ServiceDescriptor> get_services();
    std::vector<UserAccount> get_users();
    void set_user(UserAccount const &user);
    // Returns the device's free text reply.
    std::string system_reboot();
    DeviceInformation get_device_information();
    SystemDateAndTime get_system_date_and_time();
    NtpInformation get_ntp();
    std::vector<NetworkInterface> get_network_interfaces();

    // Body elements, exposed for inspection in tests.
    static std::string make_set_user_request(UserAccount const &user);

    static std::vector<ServiceDescriptor> parse_get_services(std::string const &response);
    static std::vector<UserAccount> parse_get_users(std::string const &response);

  private:
    std::string call(const char *operation, std::string const &body_xml);

    std::shared_ptr<SoapTransport> _transport;
};

// Media service (http://www.onvif.org/ver10/media/wsdl).
class MediaControl
{
  public:
    explicit MediaControl(std::shared_ptr<SoapTransport> transport);

    struct Profile
    {
        std::string token;
        std::string name;
        bool fixed{false};
    };

    std::vector<Profile> get_profiles();

  private:
    std::shared_ptr<SoapTransport> _transport;
};
