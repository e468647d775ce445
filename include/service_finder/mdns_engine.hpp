#pragma once

#include "service_finder/engine.hpp"

#include <chrono>
#include <memory>

namespace service_finder
{

struct EngineSettings
{
    // Browse queries go out immediately, then back off up to the max
    std::chrono::milliseconds query_interval_min{1000};
    std::chrono::milliseconds query_interval_max{60000};
    bool use_ipv6{true};
};

// Engine on top of the mdns.h sockets, listening on port 5353.
// Throws EngineError from the constructor if no socket could be opened.
class MdnsEngine : public Engine
{
public:
    explicit MdnsEngine(EngineSettings settings = EngineSettings());
    ~MdnsEngine() override;

    void Browse(const std::string& type, std::shared_ptr<ServiceListener> listener) override;
    std::optional<ServiceInfo> GetServiceInfo(const std::string& type, const std::string& name,
                                              std::chrono::milliseconds timeout) override;
    void Close() override;

private:
    class EngineImpl;
    std::unique_ptr<EngineImpl> m_impl;
};

}
