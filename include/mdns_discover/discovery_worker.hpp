#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "mdns_discover/errors.hpp"
#include "mdns_discover/output.hpp"
#include "mdns_discover/resolver.hpp"
#include "mdns_discover/types.hpp"

namespace mdns_discover
{

struct QuerySettings
{
    std::string service_type{"_http._tcp"};
    std::string domain{kDefaultDomain};
    std::vector<std::string> output_fields; // empty selects every field
    bool emit_immediately{false};           // print each line as it is found
    std::chrono::milliseconds timeout{kDefaultTimeout};
    bool debug{false};
};

// Outcome of one service-type query. `services` may be non-empty even when
// `error` is set.
struct QueryResult
{
    std::string service_type;
    std::vector<Service> services;
    ErrorCode error{ErrorCode::None};
    std::string message;

    [[nodiscard]] bool Ok() const { return error == ErrorCode::None; }
};

// now + timeout, saturated at Clock::time_point::max()
Clock::time_point DeadlineAfter(Clock::time_point now, std::chrono::milliseconds timeout);

// Browses one service type until the resolver closes the stream or the
// timeout passes. Duplicate (hostname, address, port) triples within the query
// are dropped, the first occurrence and its TXT payload win.
// A timeout with no results is reported as ErrorCode::TimedOutZero.
QueryResult RunQuery(const ResolverFactory& factory, const QuerySettings& settings,
                     const LineSink& sink = StdoutSink());

}
