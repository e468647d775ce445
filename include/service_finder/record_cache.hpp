#pragma once

#include "service_finder/engine.hpp"
#include "service_finder/types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace service_finder
{

enum class EventKind
{
    Added,
    Updated,
    Removed
};

// One listener notification, listeners captured when the event was raised
struct BrowseEvent
{
    EventKind kind{EventKind::Added};
    std::string type;
    std::string name;
    std::vector<std::shared_ptr<ServiceListener>> listeners;
};

// Records received from the network, kept until their TTL runs out, and the
// browse subscriptions they are matched against. Not synchronized, the
// engine calls it under its own mutex.
class RecordCache
{
public:
    using Clock = std::chrono::steady_clock;

    RecordCache(std::chrono::milliseconds query_interval_min, std::chrono::milliseconds query_interval_max);

    // Adds listener to the browse of type. For a type already browsed the
    // known instances are returned as Added events for this listener only.
    std::vector<BrowseEvent> Subscribe(const std::string& type, std::shared_ptr<ServiceListener> listener,
                                       Clock::time_point now);

    // TTL 0 is a goodbye and drops the record
    std::vector<BrowseEvent> Insert(const Record& record, Clock::time_point now);

    std::vector<BrowseEvent> Expire(Clock::time_point now);

    // Types whose PTR query is due, the interval doubles after each one
    std::vector<std::string> DueQueries(Clock::time_point now);

    // What is cached for name, nullopt until its SRV record arrived.
    // Throws BadTypeInNameError if name is malformed or not an instance of type.
    std::optional<ServiceInfo> Lookup(const std::string& type, const std::string& name) const;

    void Clear();

    [[nodiscard]] bool Browsing(const std::string& type) const;
    [[nodiscard]] std::size_t InstanceCount(const std::string& type) const;
    [[nodiscard]] std::size_t HostCount() const;

private:
    struct KnownInstance
    {
        std::string name;
        Clock::time_point expiry;
    };

    struct BrowseState
    {
        std::string type;
        std::vector<std::shared_ptr<ServiceListener>> listeners;
        std::map<std::string, KnownInstance> instances; // by CacheKey()
        Clock::time_point next_query;
        std::chrono::milliseconds interval{0};
    };

    struct CachedService
    {
        std::string target;
        std::uint16_t port{0};
        Clock::time_point expiry;
    };

    struct CachedAddress
    {
        Ipv4Address address;
        Clock::time_point expiry;
    };

    struct CachedText
    {
        TxtProperties txt;
        Clock::time_point expiry;
    };

    void OnPointer(const DomainNamePointerRecord& record, Clock::time_point now, std::vector<BrowseEvent>& events);
    void OnService(const ServiceRecord& record, Clock::time_point now);
    void OnAddress(const ARecord& record, Clock::time_point now);
    void OnText(const TXTRecord& record, Clock::time_point now, std::vector<BrowseEvent>& events);

    static void Raise(EventKind kind, const BrowseState& state, const std::string& name,
                      std::vector<BrowseEvent>& events);

    std::chrono::milliseconds m_intervalMin;
    std::chrono::milliseconds m_intervalMax;

    std::map<std::string, BrowseState> m_browsers; // by CacheKey()
    std::map<std::string, CachedService> m_services;
    std::map<std::string, std::vector<CachedAddress>> m_addresses;
    std::map<std::string, CachedText> m_texts;
};

}
