//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "onvif_device.hpp"

#include "device_call.hpp"
#include "http_soap_transport.hpp"

#include <SoapySDR/Logger.hpp>

constexpr int OnvifDevice::SERVICE_TIMEOUT_MS;

struct ServiceTableEntry
{
    const char *namespace_uri;
    ServiceKind kind;
};

static const ServiceTableEntry service_table[] = {
    {"http://www.onvif.org/ver10/events/wsdl", ServiceKind::Events},
    {"http://www.onvif.org/ver10/deviceIO/wsdl", ServiceKind::DeviceIO},
    {"http://www.onvif.org/ver10/media/wsdl", ServiceKind::Media},
    {"http://www.onvif.org/ver20/media/wsdl", ServiceKind::Media2},
    {"http://www.onvif.org/ver20/imaging/wsdl", ServiceKind::Imaging},
    {"http://www.onvif.org/ver20/ptz/wsdl", ServiceKind::PTZ},
    {"http://www.onvif.org/ver20/analytics/wsdl", ServiceKind::Analytics},
};

bool lookup_service_kind(std::string const &namespace_uri, ServiceKind &kind)
{
    for (auto const &entry : service_table)
    {
        if (namespace_uri == entry.namespace_uri)
        {
            kind = entry.kind;
            return true;
        }
    }
    return false;
}

static std::shared_ptr<const Credentials> make_credentials(const std::string *username, const std::string *password)
{
    if (username && password)
    {
        return std::make_shared<Credentials>(Credentials{*username, *password});
    }
    if (!username && !password)
    {
        return nullptr;
    }
    throw DeviceError::unauthorized("Username and password must be specified together");
}

static bool starts_with(std::string const &s, std::string const &prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

OnvifDevice::OnvifDevice(Uri const &devicemgmt_uri, const std::string *username, const std::string *password,
                         TransportFactory const &transport_factory)
    : _devicemgmt_uri(devicemgmt_uri.to_string())
{
    // Checked before anything touches the network.
    const auto creds = make_credentials(username, password);

    _devicemgmt = transport_factory(_devicemgmt_uri, creds, SERVICE_TIMEOUT_MS);

    const std::string base_uri = devicemgmt_uri.authority_base();

    DeviceMgmtControl control(_devicemgmt);
    const auto services = device_call([&control]() { return control.get_services(); });

    for (auto const &s : services)
    {
        std::string address;
        try
        {
            address = Uri::parse(s.address).to_string();
        }
        catch (UriParseError const &ex)
        {
            throw DeviceError::unknown(ex.what());
        }

        if (!starts_with(address, base_uri))
        {
            throw DeviceError::unexpected_behavior("Service URI " + s.address + " is not within base URI " + base_uri, s.address,
                                                   base_uri);
        }

        if (s.namespace_uri == DEVICE_MGMT_NAMESPACE)
        {
            if (s.address != _devicemgmt_uri)
            {
                throw DeviceError::unexpected_behavior("advertised device mgmt uri " + s.address + " not expected " + _devicemgmt_uri,
                                                       s.address, _devicemgmt_uri);
            }
            continue;
        }

        ServiceKind kind;
        if (!lookup_service_kind(s.namespace_uri, kind))
        {
            SoapySDR::logf(SOAPY_SDR_DEBUG, "unknown service: %s at %s", s.namespace_uri.c_str(), s.address.c_str());
            continue;
        }

        _services[kind] = transport_factory(address, creds, SERVICE_TIMEOUT_MS);
        SoapySDR::logf(SOAPY_SDR_DEBUG, "%s service at %s", service_kind_name(kind), address.c_str());
    }
}

std::unique_ptr<OnvifDevice> OnvifDevice::resolve(Uri const &devicemgmt_uri, const std::string *username, const std::string *password)
{
    return std::unique_ptr<OnvifDevice>(new OnvifDevice(devicemgmt_uri, username, password, HttpSoapTransport::factory()));
}
