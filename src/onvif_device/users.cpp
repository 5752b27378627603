//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#include "onvif_device.hpp"

#include "device_call.hpp"

#include <SoapySDR/Logger.hpp>

std::vector<DeviceMgmtControl::UserAccount> OnvifDevice::list_users() const
{
    DeviceMgmtControl control(_devicemgmt);
    return device_call([&control]() { return control.get_users(); });
}

SetUserResult OnvifDevice::set_user(std::string const &username, std::string const &new_password) const
{
    const auto users = list_users();

    for (auto const &existing : users)
    {
        if (existing.username != username)
        {
            continue;
        }

        // SetUser takes the whole record, not a patch
        DeviceMgmtControl::UserAccount update = existing;
        update.has_password = true;
        update.password = new_password;

        DeviceMgmtControl control(_devicemgmt);
        device_call([&control, &update]() { control.set_user(update); });
        return SetUserResult::Updated;
    }

    SoapySDR::logf(SOAPY_SDR_DEBUG, "set_user: no account named %s", username.c_str());
    return SetUserResult::NotFound;
}
