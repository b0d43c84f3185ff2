#include "rxdnssd/log.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace rxdnssd
{

namespace
{

struct LogSink
{
    std::mutex mutex;
    LogCallback callback;
    LogLevel level{LogLevel::Info};
};

LogSink& GetSink()
{
    static LogSink sink;
    return sink;
}

}

void SetLogCallback(LogCallback callback)
{
    auto& sink = GetSink();
    std::lock_guard<std::mutex> lock(sink.mutex);
    sink.callback = std::move(callback);
}

void SetLogLevel(LogLevel level)
{
    auto& sink = GetSink();
    std::lock_guard<std::mutex> lock(sink.mutex);
    sink.level = level;
}

void Log(LogLevel level, std::string_view string)
{
    auto& sink = GetSink();
    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(sink.mutex);
        if (level < sink.level) {
            return;
        }
        if (!sink.callback) {
            std::cout << string << "\n";
            return;
        }
        callback = sink.callback;
    }
    // Called without the lock, callbacks may log or replace themselves
    callback(level, string);
}

}
