#pragma once

#include <string_view>

namespace mdns_discover
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

// Messages below the threshold are dropped. Defaults to Warn.
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

// Writes one "<level>: <message>" line to stderr. Safe to call from any thread.
void Log(LogLevel level, std::string_view string);

}
