#include "service_finder/console.hpp"
#include "service_finder/log.hpp"
#include "service_finder/mdns_engine.hpp"
#include "service_finder/name_resolver.hpp"
#include "service_finder/session.hpp"
#include "service_finder/settings.hpp"

#include <pthread.h>
#include <signal.h>

#include <cstdlib>
#include <iostream>
#include <thread>

#include <fmt/format.h>

namespace
{

service_finder::Style StyleFor(service_finder::LogLevel level)
{
    switch (level) {
        case service_finder::LogLevel::Debug: return service_finder::Style::Debug;
        case service_finder::LogLevel::Info: return service_finder::Style::Plain;
        case service_finder::LogLevel::Warn: return service_finder::Style::Warning;
        case service_finder::LogLevel::Error: return service_finder::Style::Removal;
    }
    return service_finder::Style::Plain;
}

}

int main(int argc, char* argv[])
{
    service_finder::FinderSettings settings;
    try {
        settings = service_finder::ParseCommandLine(argc, argv);
    } catch (const service_finder::SettingsError& e) {
        std::cerr << e.what() << "\n" << service_finder::Usage(argv[0]);
        return 2;
    }
    if (settings.help) {
        std::cout << service_finder::Usage(argv[0]);
        return EXIT_SUCCESS;
    }

    // Interrupts are taken by the watcher thread below, every thread
    // started from here on inherits the blocked mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    service_finder::Console console(std::cout, settings.color);
    service_finder::SetLogLevel(settings.debug ? service_finder::LogLevel::Debug : service_finder::LogLevel::Info);
    service_finder::SetLogCallback([&console](service_finder::LogLevel level, std::string_view message) {
        console.PrintLine(StyleFor(level), message);
    });

    std::shared_ptr<const service_finder::NameResolver> resolver =
        service_finder::MakeDefaultResolver(settings.use_netbios, settings.netbios_timeout);

    service_finder::Session session(settings, console, []() {
        return std::make_unique<service_finder::MdnsEngine>();
    }, resolver);

    try {
        session.Begin();
    } catch (const service_finder::EngineError& e) {
        console.PrintLine(service_finder::Style::Removal, fmt::format("Cannot start discovery: {}", e.what()));
        service_finder::SetLogCallback(nullptr);
        return EXIT_FAILURE;
    }

    std::thread watcher([&session, signals]() {
        int signal_number = 0;
        sigwait(&signals, &signal_number);
        session.Cancel();
    });

    session.WaitForCancel();
    watcher.join();

    service_finder::SetLogCallback(nullptr);
    return EXIT_SUCCESS;
}
