#include "service_finder/settings.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

#include <fmt/format.h>

namespace service_finder
{

namespace
{

std::chrono::milliseconds ParseTimeout(const std::string& option, const std::string& value)
{
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw SettingsError(fmt::format("{} expects a positive number of milliseconds, got '{}'", option, value));
    }
    errno = 0;
    const unsigned long long parsed = std::strtoull(value.c_str(), nullptr, 10);
    if (errno == ERANGE || parsed == 0 || parsed > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
        throw SettingsError(fmt::format("{} out of range: '{}'", option, value));
    }
    return std::chrono::milliseconds(parsed);
}

}

FinderSettings ParseCommandLine(int argc, const char* const* argv)
{
    FinderSettings settings;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--debug") {
            settings.debug = true;
        } else if (arg == "--no-netbios") {
            settings.use_netbios = false;
        } else if (arg == "--no-color") {
            settings.color = false;
        } else if (arg == "-h" || arg == "--help") {
            settings.help = true;
        } else if (arg == "--timeout") {
            if (i + 1 >= argc) {
                throw SettingsError("--timeout requires a value");
            }
            settings.info_timeout = ParseTimeout(arg, argv[++i]);
        } else if (arg.rfind("--timeout=", 0) == 0) {
            settings.info_timeout = ParseTimeout("--timeout", arg.substr(10));
        } else {
            throw SettingsError(fmt::format("Unknown option '{}'", arg));
        }
    }
    return settings;
}

std::string Usage(const std::string& program)
{
    return fmt::format(
        "Usage: {} [options]\n"
        "\n"
        "Lists services advertised over mDNS/DNS-SD on the local network.\n"
        "\n"
        "Options:\n"
        "  --debug          Print lookups, malformed names and resolver failures\n"
        "  --no-netbios     Do not fall back to NetBIOS name queries\n"
        "  --no-color       Plain output without ANSI colors\n"
        "  --timeout <ms>   How long to wait for service info (default 3000)\n"
        "  -h, --help       Show this help\n",
        program);
}

}
