#pragma once

#include <functional>
#include <string_view>

namespace rxdnssd
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

using LogCallback = std::function<void(LogLevel, std::string_view)>;

// Routes library messages to the host application. An empty callback restores
// the default sink, which prints to std::cout.
void SetLogCallback(LogCallback callback);

// Messages below this level are dropped. Defaults to LogLevel::Info.
void SetLogLevel(LogLevel level);

void Log(LogLevel level, std::string_view string);

}
