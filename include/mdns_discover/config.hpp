#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mdns_discover/types.hpp"

namespace mdns_discover
{

enum class Action {
    Run,
    Help,
    Man
};

// Effective command line configuration. Flags override the environment,
// the environment overrides the defaults.
struct Config {
    Action action{Action::Run};
    std::string service_filter;              // non-empty selects single-service mode
    std::vector<std::string> output_fields;  // raw names, normalized by the output layer
    OutputMode output_mode{OutputMode::Text};
    std::chrono::milliseconds timeout{kDefaultTimeout};
    std::size_t concurrency{kDefaultConcurrency};
    bool debug{false};
    bool summary{false};
    bool no_color{false};
};

// Returns the value of an environment variable, std::nullopt when unset or empty
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;
EnvLookup ProcessEnvironment();

// Reads MDNS_* variables through `env`, then the flags and the optional
// subcommand. Throws UsageError for anything that cannot be honoured.
Config ParseConfig(int argc, char* argv[], const EnvLookup& env = ProcessEnvironment());

// Go duration syntax: "300ms", "1.5s", "1m30s", "2h". Units ns, us, ms, s, m, h.
// Throws std::invalid_argument for malformed or non-positive durations.
std::chrono::nanoseconds ParseDuration(std::string_view text);

// Splits a comma separated field list, trimming every element
std::vector<std::string> SplitFieldList(std::string_view list);

}
