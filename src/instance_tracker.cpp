#include "service_finder/instance_tracker.hpp"
#include "service_finder/console.hpp"
#include "service_finder/log.hpp"
#include "service_finder/name_resolver.hpp"
#include "service_finder/service_name.hpp"

#include <algorithm>
#include <exception>

#include <fmt/format.h>

namespace service_finder
{

namespace
{

std::string Padding(std::size_t width, std::size_t length)
{
    return std::string((width > length ? width - length : 0) + InstanceTracker::kColumnGap, ' ');
}

struct LineParts
{
    std::string service;
    std::string address;
    std::string device;
};

LineParts SplitLine(const ServiceInstanceRecord& record, std::size_t name_width)
{
    LineParts parts;
    parts.service = fmt::format("Service {}{}", record.instance_name, Padding(name_width, record.instance_name.size()));
    parts.address = fmt::format("IP: {}{}", record.address,
                                Padding(InstanceTracker::kAddressWidth, record.address.size()));
    parts.device = fmt::format("Name: {}", record.device_name);
    return parts;
}

}

InstanceTracker::InstanceTracker(const NameResolver& resolver, Console& console, std::chrono::milliseconds info_timeout)
: m_resolver(resolver)
, m_console(console)
, m_infoTimeout(info_timeout)
{}

void InstanceTracker::AddService(Engine& engine, const std::string& type, const std::string& name)
{
    UpdateService(engine, type, name);
}

void InstanceTracker::UpdateService(Engine& engine, const std::string& type, const std::string& name)
{
    try {
        Resolve(engine, type, name);
    } catch (const std::exception& e) {
        m_console.PrintLine(Style::Warning, fmt::format("Failed to resolve service {}: {}", name, e.what()));
    }
}

void InstanceTracker::RemoveService(Engine& engine, const std::string& type, const std::string& name)
{
    (void)engine;
    (void)type;
    const auto formatted_name = NormalizeName(name);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_services.erase(formatted_name) > 0) {
        m_console.PrintLine(Style::Removal, fmt::format("Service {} removed", formatted_name));
    }
}

void InstanceTracker::Resolve(Engine& engine, const std::string& type, const std::string& name)
{
    const auto formatted_type = NormalizeName(type);
    const auto formatted_name = NormalizeName(name);
    Log(LogLevel::Debug,
        fmt::format("Attempting to get service info for type: {}, name: {}", formatted_type, formatted_name));

    std::optional<ServiceInfo> info;
    try {
        info = engine.GetServiceInfo(formatted_type, formatted_name, m_infoTimeout);
    } catch (const BadTypeInNameError& e) {
        Log(LogLevel::Warn, fmt::format("Skipping service {}: malformed name", formatted_name));
        Log(LogLevel::Debug, fmt::format("BadTypeInName for type: {} (raw {}), name: {} (raw {}) - {}",
                                         formatted_type, type, formatted_name, name, e.what()));
        return;
    }

    if (!info) {
        m_console.PrintLine(Style::Warning, fmt::format("No info found for service {}", formatted_name));
        return;
    }
    if (info->addresses.empty()) {
        m_console.PrintLine(Style::Warning, fmt::format("Service {} has no address", formatted_name));
        return;
    }

    ServiceInstanceRecord record;
    record.instance_name = formatted_name;
    record.address = Ipv4ToString(info->addresses.front());
    record.device_name = m_resolver.ResolveDeviceName(record.address);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_services[formatted_name] = record;
    m_maxNameLength = std::max(m_maxNameLength, formatted_name.size());
    Render(record);
}

// m_mutex held
void InstanceTracker::Render(const ServiceInstanceRecord& record)
{
    const auto parts = SplitLine(record, m_maxNameLength);
    m_console.PrintSegments({{Style::ServiceName, parts.service},
                             {Style::Address, parts.address},
                             {Style::DeviceName, parts.device}});
}

std::string InstanceTracker::FormatLine(const ServiceInstanceRecord& record) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto parts = SplitLine(record, std::max(m_maxNameLength, record.instance_name.size()));
    return parts.service + parts.address + parts.device;
}

bool InstanceTracker::Contains(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_services.count(NormalizeName(name)) > 0;
}

std::size_t InstanceTracker::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_services.size();
}

std::optional<ServiceInstanceRecord> InstanceTracker::Find(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto found = m_services.find(NormalizeName(name));
    if (found == m_services.end()) {
        return std::nullopt;
    }
    return found->second;
}

std::size_t InstanceTracker::MaxNameLength() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_maxNameLength;
}

}
