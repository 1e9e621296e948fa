#include "mdns_discover/catalog.hpp"
#include "mdns_discover/config.hpp"
#include "mdns_discover/discovery_worker.hpp"
#include "mdns_discover/errors.hpp"
#include "mdns_discover/log.hpp"
#include "mdns_discover/orchestrator.hpp"
#include "mdns_discover/output.hpp"
#include "mdns_discover/stats_reporter.hpp"
#include "mdns_discover/usage.hpp"

#include <unistd.h>

#include <ctime>
#include <iostream>

#include <fmt/chrono.h>
#include <fmt/core.h>

#ifndef MDNS_DISCOVER_VERSION
#define MDNS_DISCOVER_VERSION "0.0.0"
#endif

using namespace mdns_discover;

namespace
{

std::string ProgramName(const char* argv0)
{
    const std::string path = argv0 != nullptr ? argv0 : "mdns-discover";
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string Today()
{
    return fmt::format("{:%Y-%m-%d}", fmt::localtime(std::time(nullptr)));
}

// Single-service mode: the query's own error decides the exit code
int RunSingle(const Config& config, std::vector<Service>& discovered, DiscoveryStats& stats)
{
    QuerySettings settings;
    settings.service_type = config.service_filter;
    settings.output_fields = config.output_fields;
    settings.emit_immediately = config.output_mode == OutputMode::Text;
    settings.timeout = config.timeout;
    settings.debug = config.debug;

    QueryResult result = RunQuery(MakeMdnsResolver, settings);
    stats.attempts = 1;
    if (!result.Ok()) {
        Log(LogLevel::Error, fmt::format("discover {}: {}", result.service_type, result.message));
        return static_cast<int>(SelectExitCode({result.error}));
    }
    if (!result.services.empty()) {
        stats.service_type_counts[result.service_type] = static_cast<int>(result.services.size());
    }
    discovered = std::move(result.services);
    return static_cast<int>(ExitCode::Ok);
}

int RunAll(const Config& config, std::vector<Service>& discovered, DiscoveryStats& stats)
{
    DiscoverySettings settings;
    settings.output_fields = config.output_fields;
    settings.emit_immediately = true;
    settings.output_mode = config.output_mode;
    settings.timeout = config.timeout;
    settings.concurrency = config.concurrency;
    settings.debug = config.debug;

    try {
        const Orchestrator orchestrator(MakeMdnsResolver, settings);
        DiscoveryResult result = orchestrator.DiscoverAll(BuiltinServiceTypes());
        discovered = std::move(result.services);
        stats = std::move(result.stats);
    } catch (const DiscoveryError& e) {
        if (e.Code() == ErrorCode::NoServicesConfigured) {
            Log(LogLevel::Error, "no built-in services available (services list empty), rebuild may be required");
        } else {
            Log(LogLevel::Error, fmt::format("multi-discover: {}", e.what()));
        }
        return static_cast<int>(ExitCodeFor(e.Code()));
    }
    return static_cast<int>(ExitCode::Ok);
}

int Run(int argc, char* argv[])
{
    const std::string program = ProgramName(argc > 0 ? argv[0] : nullptr);

    Config config;
    try {
        config = ParseConfig(argc, argv);
    } catch (const UsageError& e) {
        Log(LogLevel::Error, e.what());
        std::cerr << HelpText(program, MDNS_DISCOVER_VERSION);
        return static_cast<int>(ExitCode::Usage);
    }

    switch (config.action) {
        case Action::Help:
            std::cout << HelpText(program, MDNS_DISCOVER_VERSION);
            return static_cast<int>(ExitCode::Ok);
        case Action::Man:
            std::cout << ManPage(program, MDNS_DISCOVER_VERSION, Today());
            return static_cast<int>(ExitCode::Ok);
        case Action::Run:
            break;
    }

    SetLogLevel(config.debug ? LogLevel::Debug : LogLevel::Warn);
    const auto start = Clock::now();

    std::vector<Service> discovered;
    DiscoveryStats stats;
    const int status = config.service_filter.empty() ? RunAll(config, discovered, stats)
                                                     : RunSingle(config, discovered, stats);
    if (status != static_cast<int>(ExitCode::Ok)) {
        return status;
    }

    if (config.output_mode == OutputMode::Json) {
        if (config.summary) {
            std::cout << ServicesToJson(discovered, Summarize(discovered, stats, Clock::now() - start)) << "\n";
        } else {
            std::cout << ServicesToJson(discovered) << "\n";
        }
        return static_cast<int>(ExitCode::Ok);
    }

    if (discovered.empty()) {
        std::cerr << "No services discovered (consider adjusting MDNS_TIMEOUT or filters)\n";
    }
    const bool color = isatty(STDERR_FILENO) != 0 && !config.no_color;
    PrintSummary(discovered, start, config.summary, stats, color);
    return static_cast<int>(ExitCode::Ok);
}

}

int main(int argc, char* argv[])
{
    try {
        return Run(argc, argv);
    } catch (const std::exception& e) {
        Log(LogLevel::Error, e.what());
        return static_cast<int>(ExitCode::RuntimeError);
    }
}
