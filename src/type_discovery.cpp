#include "service_finder/type_discovery.hpp"
#include "service_finder/console.hpp"
#include "service_finder/instance_tracker.hpp"
#include "service_finder/log.hpp"
#include "service_finder/service_name.hpp"

#include <fmt/format.h>

namespace service_finder
{

TypeDiscoveryDriver::TypeDiscoveryDriver(const NameResolver& resolver, Console& console,
                                         std::chrono::milliseconds info_timeout)
: m_resolver(resolver)
, m_console(console)
, m_infoTimeout(info_timeout)
{}

void TypeDiscoveryDriver::AddService(Engine& engine, const std::string& type, const std::string& name)
{
    (void)type;
    const auto formatted_type = NormalizeName(name);
    m_console.PrintLine(Style::TypeNotice, fmt::format("Discovered service type: {}", formatted_type));

    std::shared_ptr<InstanceTracker> tracker;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto [it, inserted] = m_types.try_emplace(CacheKey(formatted_type));
        if (!inserted) {
            return;
        }
        it->second.record.type_name = formatted_type;
        it->second.tracker = std::make_shared<InstanceTracker>(m_resolver, m_console, m_infoTimeout);
        tracker = it->second.tracker;
    }

    Log(LogLevel::Debug, fmt::format("Creating browser for type: {}", formatted_type));
    engine.Browse(formatted_type, std::move(tracker));
}

void TypeDiscoveryDriver::UpdateService(Engine& engine, const std::string& type, const std::string& name)
{
    (void)engine;
    (void)type;
    (void)name;
}

void TypeDiscoveryDriver::RemoveService(Engine& engine, const std::string& type, const std::string& name)
{
    (void)engine;
    (void)type;
    (void)name;
}

std::vector<std::string> TypeDiscoveryDriver::KnownTypes() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> types;
    types.reserve(m_types.size());
    for (const auto& known : m_types) {
        types.push_back(known.second.record.type_name);
    }
    return types;
}

std::size_t TypeDiscoveryDriver::TrackerCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_types.size();
}

std::shared_ptr<InstanceTracker> TypeDiscoveryDriver::Tracker(const std::string& type) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto found = m_types.find(CacheKey(NormalizeName(type)));
    return found == m_types.end() ? nullptr : found->second.tracker;
}

}
