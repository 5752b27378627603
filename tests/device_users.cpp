#include "commands.hpp"
#include "fake_transport.hpp"
#include "onvif_device.hpp"
#include "soap_envelope.hpp"

#include <cassert>
#include <ctime>
#include <sstream>
#include <string>

using test::FakeDevice;
using test::envelope;

namespace
{

const std::string devicemgmt = "http://10.0.0.5/onvif/device_service";

bool contains(std::string const &haystack, std::string const &needle)
{
    return haystack.find(needle) != std::string::npos;
}

std::string utc_now_date_time()
{
    const std::time_t now = std::time(NULL);
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream ss;
    ss << "<tt:UTCDateTime><tt:Date><tt:Year>" << utc.tm_year + 1900 << "</tt:Year><tt:Month>" << utc.tm_mon + 1
       << "</tt:Month><tt:Day>" << utc.tm_mday << "</tt:Day></tt:Date><tt:Time><tt:Hour>" << utc.tm_hour
       << "</tt:Hour><tt:Minute>" << utc.tm_min << "</tt:Minute><tt:Second>" << utc.tm_sec
       << "</tt:Second></tt:Time></tt:UTCDateTime>";
    return ss.str();
}

void prepare(FakeDevice &device)
{
    device.responses["GetServices"] =
        test::services_response({{"http://www.onvif.org/ver10/device/wsdl", devicemgmt},
                                 {"http://www.onvif.org/ver10/media/wsdl", "http://10.0.0.5/onvif/media"}});
    device.responses["GetUsers"] =
        envelope("<tds:GetUsersResponse>"
                 "<tds:User><tt:Username>admin</tt:Username><tt:UserLevel>Administrator</tt:UserLevel></tds:User>"
                 "<tds:User><tt:Username>operator</tt:Username><tt:UserLevel>Operator</tt:UserLevel>"
                 "<tt:Extension><tt:Shift>night</tt:Shift></tt:Extension></tds:User>"
                 "</tds:GetUsersResponse>");
    device.responses["SetUser"] = envelope("<tds:SetUserResponse/>");
    device.responses["SystemReboot"] =
        envelope("<tds:SystemRebootResponse><tds:Message>Rebooting</tds:Message></tds:SystemRebootResponse>");
}

} // namespace

int main()
{
    // list_users passes the records through
    {
        FakeDevice device;
        prepare(device);
        OnvifDevice handle(Uri::parse(devicemgmt), nullptr, nullptr, device.factory());

        const auto users = handle.list_users();
        assert(users.size() == 2);
        assert(users[0].username == "admin" && users[0].level == "Administrator");
        assert(users[1].username == "operator" && users[1].level == "Operator");

        std::ostringstream out;
        print_users(users, out);
        assert(contains(out.str(), "Users:\n    admin\tAdministrator\t\n"));
        assert(contains(out.str(), "    operator\tOperator\t<tt:Extension"));
    }

    // unknown user: no update is sent
    {
        FakeDevice device;
        prepare(device);
        OnvifDevice handle(Uri::parse(devicemgmt), nullptr, nullptr, device.factory());

        assert(handle.set_user("nobody", "pw") == SetUserResult::NotFound);
        // usernames match exactly
        assert(handle.set_user("Admin", "pw") == SetUserResult::NotFound);
        assert(device.count("GetUsers") == 2);
        assert(device.count("SetUser") == 0);
    }

    // known user: only the password changes
    {
        FakeDevice device;
        prepare(device);
        OnvifDevice handle(Uri::parse(devicemgmt), nullptr, nullptr, device.factory());

        assert(handle.set_user("operator", "n3w-pass") == SetUserResult::Updated);
        assert(device.count("GetUsers") == 1);
        assert(device.count("SetUser") == 1);

        const auto &request = device.invocations.back();
        assert(request.endpoint == devicemgmt);
        assert(request.action == "http://www.onvif.org/ver10/device/wsdl/SetUser");

        // the request parses back to the same record with the new password
        SoapResponse parsed(envelope(request.body));
        auto user = find_local(parsed.payload(), "User");
        assert(child_text(user, "Username") == "operator");
        assert(child_text(user, "Password") == "n3w-pass");
        assert(child_text(user, "UserLevel") == "Operator");
        assert(child_text(child_local(user, "Extension"), "Shift") == "night");
        assert(children_local(parsed.payload(), "User").size() == 1);
    }

    // errors while updating surface as DeviceError
    {
        FakeDevice device;
        prepare(device);
        device.authorization_errors["SetUser"] = "Sender not Authorized";
        OnvifDevice handle(Uri::parse(devicemgmt), nullptr, nullptr, device.factory());

        bool thrown = false;
        try
        {
            handle.set_user("admin", "pw");
        }
        catch (DeviceError const &ex)
        {
            thrown = ex.kind() == DeviceError::Kind::Unauthorized;
        }
        assert(thrown);
        // no retry
        assert(device.count("SetUser") == 1);
    }

    {
        FakeDevice device;
        prepare(device);
        device.responses["SetUser"] = envelope("<tds:GetUsersResponse/>");
        OnvifDevice handle(Uri::parse(devicemgmt), nullptr, nullptr, device.factory());

        bool thrown = false;
        try
        {
            handle.set_user("admin", "pw");
        }
        catch (DeviceError const &ex)
        {
            thrown = ex.kind() == DeviceError::Kind::Transport;
        }
        assert(thrown);
    }

    // reboot returns the device message
    {
        FakeDevice device;
        prepare(device);
        OnvifDevice handle(Uri::parse(devicemgmt), nullptr, nullptr, device.factory());
        assert(handle.reboot() == "Rebooting");
        assert(device.count("SystemReboot") == 1);
    }

    // device summary
    {
        FakeDevice device;
        prepare(device);
        device.responses["GetDeviceInformation"] =
            envelope("<tds:GetDeviceInformationResponse><tds:Manufacturer>Acme</tds:Manufacturer><tds:Model>C1</tds:Model>"
                     "<tds:FirmwareVersion>1.0</tds:FirmwareVersion><tds:SerialNumber>SN42</tds:SerialNumber>"
                     "<tds:HardwareId>HW7</tds:HardwareId></tds:GetDeviceInformationResponse>");
        device.responses["GetSystemDateAndTime"] =
            envelope("<tds:GetSystemDateAndTimeResponse><tds:SystemDateAndTime>"
                     "<tt:DateTimeType>Manual</tt:DateTimeType><tt:DaylightSavings>false</tt:DaylightSavings>"
                     "<tt:UTCDateTime><tt:Date><tt:Year>2001</tt:Year><tt:Month>1</tt:Month><tt:Day>2</tt:Day></tt:Date>"
                     "<tt:Time><tt:Hour>3</tt:Hour><tt:Minute>4</tt:Minute><tt:Second>5</tt:Second></tt:Time></tt:UTCDateTime>"
                     "</tds:SystemDateAndTime></tds:GetSystemDateAndTimeResponse>");
        device.responses["GetNTP"] = envelope("<tds:GetNTPResponse><tds:NTPInformation><tt:FromDHCP>false</tt:FromDHCP>"
                                              "</tds:NTPInformation></tds:GetNTPResponse>");
        device.responses["GetNetworkInterfaces"] = envelope("<tds:GetNetworkInterfacesResponse/>");
        device.responses["GetProfiles"] =
            envelope("<trt:GetProfilesResponse><trt:Profiles token=\"p0\"><tt:Name>Main</tt:Name></trt:Profiles>"
                     "</trt:GetProfilesResponse>");

        OnvifDevice handle(Uri::parse(devicemgmt), nullptr, nullptr, device.factory());
        std::ostringstream out;
        assert(show_device_info(handle, out) == 0);

        const std::string text = out.str();
        assert(contains(text, "  Serial\tSN42\n"));
        assert(contains(text, "  Make\t\tAcme\n"));
        assert(contains(text, "  Source\tManual\n"));
        assert(contains(text, "  TimeZone\tNot Set\n"));
        assert(contains(text, "  UTC\t\t2001-01-02 03:04:05 *DOES NOT MATCH SYSTEM*\n"));
        assert(contains(text, "  Local\t\tNot Set\n"));
        assert(contains(text, "  Profile\tMain (p0)\n"));
        assert(contains(text, "  User\t\toperator (Operator)\n"));

        // media requests go to the media endpoint
        bool media_called = false;
        for (auto const &inv : device.invocations)
        {
            if (FakeDevice::operation_of(inv.action) == "GetProfiles")
            {
                media_called = inv.endpoint == "http://10.0.0.5/onvif/media";
            }
        }
        assert(media_called);
    }

    // a device clock in step with the system is not flagged
    {
        FakeDevice device;
        prepare(device);
        device.responses["GetDeviceInformation"] = envelope("<tds:GetDeviceInformationResponse/>");
        device.responses["GetSystemDateAndTime"] =
            envelope("<tds:GetSystemDateAndTimeResponse><tds:SystemDateAndTime><tt:DateTimeType>NTP</tt:DateTimeType>" +
                     utc_now_date_time() + "</tds:SystemDateAndTime></tds:GetSystemDateAndTimeResponse>");
        device.responses["GetNTP"] = envelope("<tds:GetNTPResponse><tds:NTPInformation/></tds:GetNTPResponse>");
        device.responses["GetNetworkInterfaces"] = envelope("<tds:GetNetworkInterfacesResponse/>");
        device.responses["GetProfiles"] = envelope("<trt:GetProfilesResponse/>");

        OnvifDevice handle(Uri::parse(devicemgmt), nullptr, nullptr, device.factory());
        std::ostringstream out;
        assert(show_device_info(handle, out) == 0);
        assert(contains(out.str(), "  UTC\t\t"));
        assert(!contains(out.str(), "DOES NOT MATCH SYSTEM"));
    }

    return 0;
}
