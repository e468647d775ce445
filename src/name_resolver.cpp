#include "service_finder/name_resolver.hpp"
#include "service_finder/log.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstring>
#include <exception>
#include <stdexcept>

#include <fmt/format.h>

namespace service_finder
{

std::optional<std::string> ReverseDnsStrategy::Resolve(const std::string& address)
{
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        throw std::invalid_argument(fmt::format("'{}' is not an IPv4 address", address));
    }

    char host[NI_MAXHOST] = {0};
    const int ret = getnameinfo(reinterpret_cast<const struct sockaddr*>(&addr), sizeof(addr), host, sizeof(host),
                                nullptr, 0, NI_NAMEREQD);
    if (ret == EAI_NONAME) {
        return std::nullopt;
    }
    if (ret != 0) {
        throw std::runtime_error(gai_strerror(ret));
    }
    return std::string(host);
}

NameResolver::NameResolver(std::vector<std::unique_ptr<NameStrategy>> strategies)
: m_strategies(std::move(strategies))
{}

void NameResolver::AddStrategy(std::unique_ptr<NameStrategy> strategy)
{
    m_strategies.push_back(std::move(strategy));
}

std::string NameResolver::ResolveDeviceName(const std::string& address) const
{
    for (const auto& strategy : m_strategies) {
        try {
            auto name = strategy->Resolve(address);
            if (name && !name->empty()) {
                return *name;
            }
            Log(LogLevel::Debug, fmt::format("{} lookup found no name for IP {}", strategy->Name(), address));
        } catch (const std::exception& e) {
            Log(LogLevel::Debug, fmt::format("{} lookup failed for IP {}: {}", strategy->Name(), address, e.what()));
        }
    }
    return kUnknownDeviceName;
}

std::vector<std::string> NameResolver::StrategyNames() const
{
    std::vector<std::string> names;
    names.reserve(m_strategies.size());
    for (const auto& strategy : m_strategies) {
        names.push_back(strategy->Name());
    }
    return names;
}

std::unique_ptr<NameResolver> MakeDefaultResolver(bool use_netbios, std::chrono::milliseconds netbios_timeout)
{
    auto resolver = std::make_unique<NameResolver>();
    resolver->AddStrategy(std::make_unique<ReverseDnsStrategy>());
    if (use_netbios) {
        if (NetBiosAvailable()) {
            resolver->AddStrategy(std::make_unique<NetBiosStrategy>(netbios_timeout));
        } else {
            Log(LogLevel::Debug, "NetBIOS lookups unavailable, using reverse DNS only.");
        }
    }
    return resolver;
}

}
