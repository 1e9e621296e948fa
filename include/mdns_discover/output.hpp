#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "mdns_discover/types.hpp"

namespace mdns_discover
{

// Normalized set of output fields. Membership decides what is rendered,
// the rendering order is always count, service, hostname, address, port, text.
class FieldSelection
{
public:
    FieldSelection() = default;
    explicit FieldSelection(std::vector<OutputField> fields);

    [[nodiscard]] bool Contains(OutputField field) const;
    // Fields in the order they were first requested
    [[nodiscard]] const std::vector<OutputField>& Ordered() const { return m_ordered; }
    [[nodiscard]] bool Empty() const { return m_ordered.empty(); }

private:
    std::vector<OutputField> m_ordered;
};

// Applies the default set when `names` is empty, trims names, drops blanks,
// duplicates and unknown names.
FieldSelection NormalizeOutputFields(const std::vector<std::string>& names);

std::string RenderLine(const FieldSelection& fields, int sequence, const std::string& service_type,
                       const std::string& hostname, const std::string& address, std::uint16_t port,
                       const std::string& text);

// Receives rendered result lines
using LineSink = std::function<void(const std::string& line)>;
LineSink StdoutSink();

struct RunSummary {
    std::chrono::milliseconds elapsed{0};
    int service_types{0};
    int instances{0};
    double instances_per_second{0.0};
    int suppressed_timeouts{0};
    int errors{0};
};
RunSummary Summarize(const std::vector<Service>& services, const DiscoveryStats& stats,
                     std::chrono::steady_clock::duration elapsed);

// Go-style duration text truncated to milliseconds: "0s", "850ms", "1.5s", "2m3.25s"
std::string FormatDuration(std::chrono::steady_clock::duration duration);

// Pretty printed JSON array of services
std::string ServicesToJson(const std::vector<Service>& services);
// {"results": [...], "summary": {...}}
std::string ServicesToJson(const std::vector<Service>& services, const RunSummary& summary);
// Inverse of the array form. Throws std::runtime_error on malformed input.
std::vector<Service> ServicesFromJson(const std::string& json);

}
