#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "mdns_discover/types.hpp"

namespace mdns_discover
{

using Clock = std::chrono::steady_clock;

enum class StreamStatus {
    Entry,            // an entry was written to the out parameter
    Closed,           // the resolver finished before the deadline
    DeadlineExceeded
};

// Live results of one browse. Entries may repeat and arrive in any order.
class BrowseStream
{
public:
    virtual ~BrowseStream() = default;

    // Blocks until an entry arrives, the stream closes or the deadline passes
    virtual StreamStatus Next(ServiceEntry& entry) = 0;
};

class Resolver
{
public:
    virtual ~Resolver() = default;

    // Starts browsing "<service_type>.<domain>". Throws DiscoveryError(BrowseFailed).
    virtual std::unique_ptr<BrowseStream> Browse(const std::string& service_type, const std::string& domain,
                                                 Clock::time_point deadline) = 0;
};

// Creates a fresh resolver per query. Throws DiscoveryError(ResolverInitFailed).
using ResolverFactory = std::function<std::unique_ptr<Resolver>()>;

// Multicast DNS resolver on every multicast-capable interface
std::unique_ptr<Resolver> MakeMdnsResolver();

}
