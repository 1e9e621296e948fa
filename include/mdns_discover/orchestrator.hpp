#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "mdns_discover/output.hpp"
#include "mdns_discover/resolver.hpp"
#include "mdns_discover/types.hpp"

namespace mdns_discover
{

struct DiscoverySettings
{
    std::vector<std::string> output_fields; // empty selects every field
    bool emit_immediately{true};            // print lines as results arrive (text mode only)
    OutputMode output_mode{OutputMode::Text};
    std::chrono::milliseconds timeout{kDefaultTimeout}; // per service type
    std::size_t concurrency{kDefaultConcurrency};       // max queries in flight, > 0
    bool debug{false};                                  // report timeouts as errors
    std::string domain{kDefaultDomain};
};

struct DiscoveryResult
{
    std::vector<Service> services; // completion order, not catalog order
    DiscoveryStats stats;
};

// Runs one query per catalog entry with at most `concurrency` in flight and
// merges the results. A failing query is recorded in the stats and never
// aborts the run.
class Orchestrator
{
public:
    // Throws std::invalid_argument if settings.concurrency is 0
    Orchestrator(ResolverFactory factory, DiscoverySettings settings, LineSink sink = StdoutSink());

    // Throws DiscoveryError(NoServicesConfigured) for an empty catalog
    DiscoveryResult DiscoverAll(const std::vector<std::string>& catalog) const;

    [[nodiscard]] const DiscoverySettings& Settings() const { return m_settings; }

private:
    ResolverFactory m_factory;
    DiscoverySettings m_settings;
    LineSink m_sink;
};

}
