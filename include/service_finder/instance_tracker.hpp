#pragma once

#include "service_finder/engine.hpp"
#include "service_finder/types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace service_finder
{

class Console;
class NameResolver;

// Keeps the instances of one service type and prints a line per resolved instance
class InstanceTracker : public ServiceListener
{
public:
    // Width of the IP column, "255.255.255.255"
    static constexpr std::size_t kAddressWidth = 15;
    static constexpr std::size_t kColumnGap = 4;

    InstanceTracker(const NameResolver& resolver, Console& console,
                    std::chrono::milliseconds info_timeout = std::chrono::milliseconds(3000));

    void AddService(Engine& engine, const std::string& type, const std::string& name) override;
    void UpdateService(Engine& engine, const std::string& type, const std::string& name) override;
    void RemoveService(Engine& engine, const std::string& type, const std::string& name) override;

    [[nodiscard]] bool Contains(const std::string& name) const;
    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] std::optional<ServiceInstanceRecord> Find(const std::string& name) const;
    [[nodiscard]] std::size_t MaxNameLength() const;

    // Unstyled listing line, column widths from the current running maximum
    [[nodiscard]] std::string FormatLine(const ServiceInstanceRecord& record) const;

private:
    void Resolve(Engine& engine, const std::string& type, const std::string& name);
    void Render(const ServiceInstanceRecord& record);

    const NameResolver& m_resolver;
    Console& m_console;
    std::chrono::milliseconds m_infoTimeout;

    mutable std::mutex m_mutex;
    std::map<std::string, ServiceInstanceRecord> m_services;
    std::size_t m_maxNameLength{0};
};

}
