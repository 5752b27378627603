//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "onvif_device.hpp"

const char *service_kind_name(ServiceKind kind)
{
    switch (kind)
    {
    case ServiceKind::Events:
        return "Events";
    case ServiceKind::DeviceIO:
        return "DeviceIO";
    case ServiceKind::Media:
        return "Media";
    case ServiceKind::Media2:
        return "Media2";
    case ServiceKind::Imaging:
        return "Imaging";
    case ServiceKind::PTZ:
        return "PTZ";
    case ServiceKind::Analytics:
        return "Analytics";
    }
    return "Unknown";
}

std::shared_ptr<SoapTransport> OnvifDevice::device_service() const
{
    return _devicemgmt;
}

std::shared_ptr<SoapTransport> OnvifDevice::service(ServiceKind kind) const
{
    const auto it = _services.find(kind);
    if (it == _services.end())
    {
        return nullptr;
    }
    return it->second;
}

bool OnvifDevice::has_service(ServiceKind kind) const
{
    return _services.count(kind) != 0;
}
