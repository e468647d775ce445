#include "service_finder/session.hpp"
#include "service_finder/console.hpp"
#include "service_finder/log.hpp"
#include "service_finder/name_resolver.hpp"
#include "service_finder/type_discovery.hpp"

#include <fmt/format.h>

namespace service_finder
{

Session::Session(FinderSettings settings, Console& console, EngineFactory engine_factory,
                 std::shared_ptr<const NameResolver> resolver)
: m_settings(std::move(settings))
, m_console(console)
, m_engineFactory(std::move(engine_factory))
, m_resolver(std::move(resolver))
{}

Session::~Session()
{
    Cancel();
}

void Session::Begin()
{
    if (Cancelled()) {
        return;
    }
    if (m_settings.debug) {
        m_console.PrintLine(Style::Plain, "Debug mode enabled");
    }

    auto engine = m_engineFactory();
    if (!engine) {
        throw EngineError("No mDNS engine available.");
    }
    auto driver = std::make_shared<TypeDiscoveryDriver>(*m_resolver, m_console, m_settings.info_timeout);

    Engine* browsing = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (Cancelled()) {
            // Cancel() already ran and will not see this engine
            return;
        }
        m_engine = std::move(engine);
        m_driver = driver;
        browsing = m_engine.get();
    }

    m_console.PrintLine(Style::Plain, "Waiting for services to appear...");
    Log(LogLevel::Debug, fmt::format("Browsing {} for service types.", m_settings.meta_type));
    browsing->Browse(m_settings.meta_type, std::move(driver));
}

void Session::WaitForCancel()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_closedCv.wait(lock, [this]() { return m_closed; });
}

void Session::Run()
{
    Begin();
    WaitForCancel();
}

void Session::Cancel()
{
    if (m_cancelled.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    Engine* engine = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        engine = m_engine.get();
    }
    if (engine) {
        m_console.PrintLine(Style::Plain, "Exiting...");
        engine->Close();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_closedCv.notify_all();
}

bool Session::Cancelled() const
{
    return m_cancelled.load(std::memory_order_acquire);
}

const TypeDiscoveryDriver* Session::Driver() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_driver.get();
}

}
