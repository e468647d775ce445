#pragma once

#include "service_finder/engine.hpp"
#include "service_finder/types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace service_finder
{

class Console;
class InstanceTracker;
class NameResolver;

// Listens on the service type enumeration and starts one
// instance browse per newly seen type
class TypeDiscoveryDriver : public ServiceListener
{
public:
    TypeDiscoveryDriver(const NameResolver& resolver, Console& console,
                        std::chrono::milliseconds info_timeout = std::chrono::milliseconds(3000));

    // name is the discovered type, e.g. "_ipp._tcp.local."
    void AddService(Engine& engine, const std::string& type, const std::string& name) override;
    // Types are never retracted
    void UpdateService(Engine& engine, const std::string& type, const std::string& name) override;
    void RemoveService(Engine& engine, const std::string& type, const std::string& name) override;

    // Types as first announced, normalized
    [[nodiscard]] std::vector<std::string> KnownTypes() const;
    [[nodiscard]] std::size_t TrackerCount() const;
    [[nodiscard]] std::shared_ptr<InstanceTracker> Tracker(const std::string& type) const;

private:
    const NameResolver& m_resolver;
    Console& m_console;
    std::chrono::milliseconds m_infoTimeout;

    struct KnownType
    {
        ServiceTypeRecord record;
        std::shared_ptr<InstanceTracker> tracker;
    };

    mutable std::mutex m_mutex;
    std::map<std::string, KnownType> m_types; // by CacheKey()
};

}
