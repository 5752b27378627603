//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "device_error.hpp"
#include "onvif_control.hpp"
#include "soap_transport.hpp"
#include "uri.hpp"

enum class ServiceKind
{
    Events,
    DeviceIO,
    Media,
    Media2,
    Imaging,
    PTZ,
    Analytics,
};

const char *service_kind_name(ServiceKind kind);

// Namespace of the device management service itself.
constexpr const char *DEVICE_MGMT_NAMESPACE = "http://www.onvif.org/ver10/device/wsdl";

// Known namespace -> kind table. Returns false for namespaces outside it.
bool lookup_service_kind(std::string const &namespace_uri, ServiceKind &kind);

enum class SetUserResult
{
    Updated,
    NotFound,
};

/***********************************************************************
 * Device handle
 *
 * Constructed from the device management endpoint. The constructor asks the
 * device for its service list and creates one client per recognized service.
 * Construction either succeeds completely or throws DeviceError; the object
 * does not change afterwards.
 **********************************************************************/
class OnvifDevice
{
  public:
    static constexpr int SERVICE_TIMEOUT_MS = 10000;

    // username and password are optional but must be given together.
    OnvifDevice(Uri const &devicemgmt_uri, const std::string *username, const std::string *password,
                TransportFactory const &transport_factory);
    OnvifDevice(OnvifDevice const &) = delete;
    OnvifDevice &operator=(OnvifDevice const &) = delete;

    // Resolves with the HTTP transport.
    static std::unique_ptr<OnvifDevice> resolve(Uri const &devicemgmt_uri, const std::string *username, const std::string *password);

    std::shared_ptr<SoapTransport> device_service() const;

    // Client for the given service, null when the device did not advertise it.
    std::shared_ptr<SoapTransport> service(ServiceKind kind) const;
    bool has_service(ServiceKind kind) const;

    /*******************************************************************
     * Users API
     ******************************************************************/

    std::vector<DeviceMgmtControl::UserAccount> list_users() const;

    // Replaces the password of an existing account, keeping its level and extension.
    SetUserResult set_user(std::string const &username, std::string const &new_password) const;

    /*******************************************************************
     * System API
     ******************************************************************/

    std::string reboot() const;

    DeviceMgmtControl::DeviceInformation device_information() const;
    DeviceMgmtControl::SystemDateAndTime system_date_and_time() const;
    DeviceMgmtControl::NtpInformation ntp() const;
    std::vector<DeviceMgmtControl::NetworkInterface> network_interfaces() const;

    // Empty when the device has no media service.
    std::vector<MediaControl::Profile> media_profiles() const;

  private:
    std::string _devicemgmt_uri;
    std::shared_ptr<SoapTransport> _devicemgmt;
    std::map<ServiceKind, std::shared_ptr<SoapTransport>> _services;
};
