#include <array>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace
{

struct CommandResult
{
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string &executable, const std::string &arguments)
{
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
#if defined(_WIN32)
    FILE *pipe = _popen(command.c_str(), "r");
#else
    FILE *pipe = popen(command.c_str(), "r");
#endif
    if (!pipe)
    {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe))
    {
        output.append(buffer.data());
    }

#if defined(_WIN32)
    const int exit_code = _pclose(pipe);
#else
    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status))
    {
        exit_code = WEXITSTATUS(status);
    }
#endif

    return CommandResult{exit_code, output};
}

bool expect(CommandResult const &res, int exit_code, std::string const &needle, std::string const &what)
{
    if (res.exit_code != exit_code || res.output.find(needle) == std::string::npos)
    {
        std::cerr << "Failure on " << what << ". exit=" << res.exit_code << "\n" << res.output << std::endl;
        return false;
    }
    return true;
}

// main() returns -2 for device errors
const int device_error_exit = 254;

} // namespace

int main()
{
    const char *executable_env = std::getenv("ONVIFCTL_EXECUTABLE");
    if (!executable_env)
    {
        std::cerr << "ONVIFCTL_EXECUTABLE is not defined" << std::endl;
        return 1;
    }
    const std::string executable = executable_env;

    bool ok = true;

    ok &= expect(run_cli(executable, "--help"), 0, "Usage: ", "--help");
    ok &= expect(run_cli(executable, ""), 2, "no command given", "missing command");
    ok &= expect(run_cli(executable, "frobnicate"), 2, "unknown command", "unknown command");
    ok &= expect(run_cli(executable, "--uri=http://127.0.0.1/ set-user bob"), 2, "takes 2 argument(s)", "set-user arity");
    ok &= expect(run_cli(executable, "--bogus=1 get-users"), 2, "unknown option --bogus", "unknown option");
    ok &= expect(run_cli(executable, "--log=loud get-users"), 2, "unknown log level", "bad log level");

    ok &= expect(run_cli(executable, "get-users"), device_error_exit, "No URI specified", "missing uri");
    ok &= expect(run_cli(executable, "--uri=not-a-uri get-users"), device_error_exit, "Could not parse URI", "bad uri");
    ok &= expect(run_cli(executable, "--uri=http://127.0.0.1:1/onvif/device_service --creds=/nonexistent/creds.json reboot"),
                 device_error_exit, "Could not load credential file", "missing credential file");

    // nothing listens on port 1
    ok &= expect(run_cli(executable, "--uri=http://127.0.0.1:1/onvif/device_service get-users"), device_error_exit,
                 "Transport error", "unreachable device");

    return ok ? 0 : 1;
}
