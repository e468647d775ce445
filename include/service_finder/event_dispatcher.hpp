#pragma once

#include "service_finder/record_cache.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace service_finder
{

class Engine;

// Delivers browse events to listeners, one worker thread per browsed type.
// Events of one type arrive in the order they were posted; a listener
// blocking on one type does not hold up the others.
class EventDispatcher
{
public:
    explicit EventDispatcher(Engine& engine);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // Dropped once Stop() was called
    void Post(BrowseEvent event);

    // Discards pending events and joins the workers. May be called from a
    // listener, its own worker is then joined by the destructor.
    void Stop();

    [[nodiscard]] std::size_t WorkerCount() const;

private:
    class Worker;

    Engine& m_engine;
    mutable std::mutex m_mutex;
    bool m_stopped{false};
    std::map<std::string, std::unique_ptr<Worker>> m_workers; // by CacheKey()
};

}
