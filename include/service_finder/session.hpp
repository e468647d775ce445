#pragma once

#include "service_finder/engine.hpp"
#include "service_finder/settings.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace service_finder
{

class Console;
class NameResolver;
class TypeDiscoveryDriver;

// One discovery run: owns the engine from Begin() until Cancel()
class Session
{
public:
    using EngineFactory = std::function<std::unique_ptr<Engine>()>;

    Session(FinderSettings settings, Console& console, EngineFactory engine_factory,
            std::shared_ptr<const NameResolver> resolver);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Opens the engine and starts the meta-browse.
    // Engine startup errors propagate, nothing is browsed in that case.
    void Begin();

    // Blocks until Cancel() has closed the engine
    void WaitForCancel();

    void Run();

    // Closes the engine once, later calls do nothing.
    // Safe from any thread, also while Begin() is still running.
    void Cancel();

    [[nodiscard]] bool Cancelled() const;
    [[nodiscard]] const TypeDiscoveryDriver* Driver() const;

private:
    FinderSettings m_settings;
    Console& m_console;
    EngineFactory m_engineFactory;
    std::shared_ptr<const NameResolver> m_resolver;

    std::unique_ptr<Engine> m_engine;
    std::shared_ptr<TypeDiscoveryDriver> m_driver;

    std::atomic<bool> m_cancelled{false};
    bool m_closed{false};
    mutable std::mutex m_mutex; // guards m_engine, m_driver, m_closed
    std::condition_variable m_closedCv;
};

}
