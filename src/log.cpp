#include "service_finder/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace service_finder
{

namespace
{

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

std::mutex& CallbackMutex()
{
    static std::mutex mutex;
    return mutex;
}

LogCallback& Callback()
{
    static LogCallback callback;
    return callback;
}

}

void SetLogLevel(LogLevel level)
{
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel GetLogLevel()
{
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool LogEnabled(LogLevel level)
{
    return static_cast<int>(level) >= g_level.load(std::memory_order_relaxed);
}

void SetLogCallback(LogCallback callback)
{
    std::lock_guard<std::mutex> lock(CallbackMutex());
    Callback() = std::move(callback);
}

void Log(LogLevel level, std::string_view string)
{
    if (!LogEnabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(CallbackMutex());
    if (Callback()) {
        Callback()(level, string);
        return;
    }
    std::cout << string << std::endl;
}

}
