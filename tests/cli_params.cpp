#include "params.hpp"

#include <cassert>
#include <string>
#include <vector>

namespace
{

CommandLine parse(std::vector<const char *> args)
{
    args.insert(args.begin(), "onvifctl");
    return parse_command_line(static_cast<int>(args.size()), args.data());
}

bool parse_fails(std::vector<const char *> args)
{
    try
    {
        parse(args);
    }
    catch (WrongParamsError const &)
    {
        return true;
    }
    return false;
}

bool command_fails(std::vector<std::string> const &positional)
{
    try
    {
        validate_command(positional);
    }
    catch (WrongParamsError const &)
    {
        return true;
    }
    return false;
}

} // namespace

int main()
{
    {
        const auto cmd = parse({"--uri=http://10.0.0.5/onvif/device_service", "--creds", "creds.json", "get-users"});
        assert(!cmd.help);
        assert(cmd.positional.size() == 1 && cmd.positional[0] == "get-users");

        const auto params = Params::make_from_kwargs(cmd.args);
        assert(params.uri == "http://10.0.0.5/onvif/device_service");
        assert(params.creds == "creds.json");
        assert(params.serial.empty());
        assert(params.log == "warning");
    }

    // --args takes the same keys
    {
        const auto cmd = parse({"--args=uri=http://cam/onvif/device_service,serial=SN1,log=debug", "set-user", "bob", "pw"});
        const auto params = Params::make_from_kwargs(cmd.args);
        assert(params.uri == "http://cam/onvif/device_service");
        assert(params.serial == "SN1");
        assert(params.log == "debug");
        assert(cmd.positional.size() == 3);
        assert(cmd.positional[1] == "bob" && cmd.positional[2] == "pw");
        assert(params.as_debug_string() == "uri=http://cam/onvif/device_service creds= serial=SN1 log=debug");
    }

    // options stop at the command; later dashes belong to its arguments
    {
        const auto cmd = parse({"set-user", "bob", "--weird-password"});
        assert(cmd.positional.size() == 3);
        assert(cmd.positional[2] == "--weird-password");
        assert(cmd.args.empty());
    }

    assert(parse({"-h"}).help);
    assert(parse({"--log=info", "--help", "probe"}).help);

    assert(parse_fails({"--bogus=1", "probe"}));
    assert(parse_fails({"--args=bogus=1", "probe"}));
    assert(parse_fails({"--uri"}));

    validate_command({"probe"});
    validate_command({"info"});
    validate_command({"get-users"});
    validate_command({"reboot"});
    validate_command({"set-user", "bob", "pw"});

    assert(command_fails({}));
    assert(command_fails({"frobnicate"}));
    assert(command_fails({"probe", "extra"}));
    assert(command_fails({"set-user", "bob"}));
    assert(command_fails({"set-user", "bob", "pw", "extra"}));

    assert(parse_log_level("warning") == SOAPY_SDR_WARNING);
    assert(parse_log_level("debug") == SOAPY_SDR_DEBUG);
    assert(parse_log_level("trace") == SOAPY_SDR_TRACE);
    {
        bool thrown = false;
        try
        {
            parse_log_level("loud");
        }
        catch (WrongParamsError const &)
        {
            thrown = true;
        }
        assert(thrown);
    }

    const std::string usage = usage_text("onvifctl");
    assert(usage.find("set-user <username> <password>") != std::string::npos);
    assert(usage.find("--uri=URI") != std::string::npos);

    return 0;
}
