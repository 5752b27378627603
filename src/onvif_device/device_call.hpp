//  SPDX-FileCopyrightText: 2023 Alexander Sholokhov <ra9yer@yahoo.com>
//  SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "device_error.hpp"
#include "soap_envelope.hpp"
#include "soap_transport.hpp"

// Runs one device operation, converting transport and parse failures to DeviceError.
template <typename F>
auto device_call(F f) -> decltype(f())
{
    try
    {
        return f();
    }
    catch (TransportAuthorizationError const &ex)
    {
        throw DeviceError::unauthorized(ex.what());
    }
    catch (TransportError const &ex)
    {
        throw DeviceError::transport(ex.what());
    }
    catch (SoapParseError const &ex)
    {
        throw DeviceError::transport(ex.what());
    }
}
