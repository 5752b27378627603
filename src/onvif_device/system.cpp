//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "onvif_device.hpp"

#include "device_call.hpp"

std::string OnvifDevice::reboot() const
{
    DeviceMgmtControl control(_devicemgmt);
    return device_call([&control]() { return control.system_reboot(); });
}

DeviceMgmtControl::DeviceInformation OnvifDevice::device_information() const
{
    DeviceMgmtControl control(_devicemgmt);
    return device_call([&control]() { return control.get_device_information(); });
}

DeviceMgmtControl::SystemDateAndTime OnvifDevice::system_date_and_time() const
{
    DeviceMgmtControl control(_devicemgmt);
    return device_call([&control]() { return control.get_system_date_and_time(); });
}

DeviceMgmtControl::NtpInformation OnvifDevice::ntp() const
{
    DeviceMgmtControl control(_devicemgmt);
    return device_call([&control]() { return control.get_ntp(); });
}

std::vector<DeviceMgmtControl::NetworkInterface> OnvifDevice::network_interfaces() const
{
    DeviceMgmtControl control(_devicemgmt);
    return device_call([&control]() { return control.get_network_interfaces(); });
}

std::vector<MediaControl::Profile> OnvifDevice::media_profiles() const
{
    const auto media = service(ServiceKind::Media);
    if (!media)
    {
        return std::vector<MediaControl::Profile>();
    }

    MediaControl control(media);
    return device_call([&control]() { return control.get_profiles(); });
}
