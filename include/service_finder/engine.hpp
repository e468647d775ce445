#pragma once

#include "service_finder/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace service_finder
{

class Engine;

class EngineError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Receives browse events for one service type.
// Called from the engine's worker thread for that type, may block.
class ServiceListener
{
public:
    virtual ~ServiceListener() = default;

    virtual void AddService(Engine& engine, const std::string& type, const std::string& name) = 0;
    virtual void UpdateService(Engine& engine, const std::string& type, const std::string& name) = 0;
    virtual void RemoveService(Engine& engine, const std::string& type, const std::string& name) = 0;
};

// mDNS querier as seen by the discovery code
class Engine
{
public:
    virtual ~Engine() = default;

    // Subscribes listener to instances of type until Close()
    virtual void Browse(const std::string& type, std::shared_ptr<ServiceListener> listener) = 0;

    // Blocks up to timeout collecting SRV/TXT/A records for name.
    // Throws BadTypeInNameError if name does not belong to type.
    virtual std::optional<ServiceInfo> GetServiceInfo(const std::string& type, const std::string& name,
                                                      std::chrono::milliseconds timeout) = 0;

    // Releases every subscription and socket. May be called from a listener,
    // the engine must then outlive that listener call.
    virtual void Close() = 0;
};

}
