#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace service_finder
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

using LogCallback = std::function<void(LogLevel, std::string_view)>;

// Messages below this level are dropped, default Info
void SetLogLevel(LogLevel level);
[[nodiscard]] LogLevel GetLogLevel();
[[nodiscard]] bool LogEnabled(LogLevel level);

// Replaces the default std::cout sink, pass nullptr to restore it
void SetLogCallback(LogCallback callback);

void Log(LogLevel level, std::string_view string);

}
