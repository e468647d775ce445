#pragma once

#include "service_finder/service_name.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace service_finder
{

class SettingsError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

struct FinderSettings
{
    bool debug{false};
    bool use_netbios{true};
    bool color{true};
    bool help{false};
    std::chrono::milliseconds info_timeout{3000};
    std::chrono::milliseconds netbios_timeout{1000};
    std::string meta_type{kServiceTypeEnumeration};
};

// Throws SettingsError on unknown options or bad values
FinderSettings ParseCommandLine(int argc, const char* const* argv);

std::string Usage(const std::string& program);

}
