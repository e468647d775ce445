#pragma once

#include "service_finder/types.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace service_finder
{

// Well-known name listing every service type on the link
inline constexpr const char* kServiceTypeEnumeration = "_services._dns-sd._udp.local.";

class BadTypeInNameError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// Appends the trailing '.' if missing, "_http._tcp.local" -> "_http._tcp.local."
std::string NormalizeName(std::string_view name);

// Returns the "_service._proto.local." part of a type or instance name.
// Throws BadTypeInNameError when the name breaks DNS-SD naming rules.
// strict: type names as browsed; non-strict: instance names, '_' allowed and
// the protocol label may be missing.
std::string ServiceTypeName(std::string_view name, bool strict = true);

// Lowercase copy, DNS names compare case-insensitively
std::string CacheKey(std::string_view name);

std::string Ipv4ToString(const Ipv4Address& address);

}
