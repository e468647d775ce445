#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace service_finder
{

inline constexpr const char* kUnknownDeviceName = "Unknown";

// One way of turning an address into a host name.
// Resolve returns nullopt when the name is not known and throws when
// the lookup itself failed; both mean "try the next strategy".
class NameStrategy
{
public:
    virtual ~NameStrategy() = default;

    [[nodiscard]] virtual std::string Name() const = 0;
    virtual std::optional<std::string> Resolve(const std::string& address) = 0;
};

// getnameinfo() with NI_NAMEREQD
class ReverseDnsStrategy : public NameStrategy
{
public:
    [[nodiscard]] std::string Name() const override { return "reverse DNS"; }
    std::optional<std::string> Resolve(const std::string& address) override;
};

// NetBIOS node status query to udp/137
class NetBiosStrategy : public NameStrategy
{
public:
    explicit NetBiosStrategy(std::chrono::milliseconds timeout = std::chrono::seconds(1));

    [[nodiscard]] std::string Name() const override { return "NetBIOS"; }
    std::optional<std::string> Resolve(const std::string& address) override;

private:
    std::chrono::milliseconds m_timeout;
};

// Tries the strategies in order, first answer wins
class NameResolver
{
public:
    NameResolver() = default;
    explicit NameResolver(std::vector<std::unique_ptr<NameStrategy>> strategies);

    void AddStrategy(std::unique_ptr<NameStrategy> strategy);

    // Never throws, falls back to "Unknown"
    std::string ResolveDeviceName(const std::string& address) const;

    [[nodiscard]] std::vector<std::string> StrategyNames() const;

private:
    std::vector<std::unique_ptr<NameStrategy>> m_strategies;
};

// Reverse DNS, then NetBIOS when compiled in and wanted
std::unique_ptr<NameResolver> MakeDefaultResolver(bool use_netbios, std::chrono::milliseconds netbios_timeout);

// Whether this build carries the NetBIOS client
[[nodiscard]] bool NetBiosAvailable();

}
