#include "mdns_discover/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

#include <fmt/core.h>

namespace mdns_discover
{

namespace
{

std::atomic<LogLevel> g_threshold{LogLevel::Warn};
std::mutex g_logMutex;

std::string_view Prefix(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "";
}

}

void SetLogLevel(LogLevel level)
{
    g_threshold.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel()
{
    return g_threshold.load(std::memory_order_relaxed);
}

void Log(LogLevel level, std::string_view string)
{
    if (level < GetLogLevel()) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_logMutex);
    fmt::print(stderr, "{}: {}\n", Prefix(level), string);
    std::fflush(stderr);
}

}
