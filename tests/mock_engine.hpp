#pragma once

#include "service_finder/engine.hpp"
#include "service_finder/name_resolver.hpp"

#include <gmock/gmock.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace service_finder
{

class MockEngine : public Engine
{
public:
    MOCK_METHOD(void, Browse, (const std::string& type, std::shared_ptr<ServiceListener> listener), (override));
    MOCK_METHOD(std::optional<ServiceInfo>, GetServiceInfo,
                (const std::string& type, const std::string& name, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(void, Close, (), (override));
};

class MockServiceListener : public ServiceListener
{
public:
    MOCK_METHOD(void, AddService, (Engine& engine, const std::string& type, const std::string& name), (override));
    MOCK_METHOD(void, UpdateService, (Engine& engine, const std::string& type, const std::string& name), (override));
    MOCK_METHOD(void, RemoveService, (Engine& engine, const std::string& type, const std::string& name), (override));
};

class MockNameStrategy : public NameStrategy
{
public:
    MOCK_METHOD(std::string, Name, (), (const, override));
    MOCK_METHOD(std::optional<std::string>, Resolve, (const std::string& address), (override));
};

inline ServiceInfo MakeInfo(const std::string& type, const std::string& name, std::vector<Ipv4Address> addresses)
{
    ServiceInfo info;
    info.type = type;
    info.name = name;
    info.server = "host.local.";
    info.port = 631;
    info.addresses = std::move(addresses);
    return info;
}

}
