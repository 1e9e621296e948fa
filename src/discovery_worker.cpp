#include "mdns_discover/discovery_worker.hpp"
#include "mdns_discover/dedup.hpp"
#include "mdns_discover/log.hpp"
#include "mdns_discover/txt.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace mdns_discover
{

namespace
{

QueryResult Failed(QueryResult result, const DiscoveryError& error)
{
    result.error = error.Code();
    result.message = error.what();
    return result;
}

}

Clock::time_point DeadlineAfter(Clock::time_point now, std::chrono::milliseconds timeout)
{
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (timeout >= headroom) {
        return Clock::time_point::max();
    }
    return now + timeout;
}

QueryResult RunQuery(const ResolverFactory& factory, const QuerySettings& settings, const LineSink& sink)
{
    QueryResult result;
    result.service_type = settings.service_type;

    const FieldSelection fields = NormalizeOutputFields(settings.output_fields);
    if (settings.debug && settings.emit_immediately) {
        std::vector<std::string> names;
        for (const auto field : fields.Ordered()) {
            names.push_back(ToString(field));
        }
        Log(LogLevel::Debug, fmt::format("Showing: {}", fmt::join(names, " ")));
    }

    std::unique_ptr<Resolver> resolver;
    std::unique_ptr<BrowseStream> stream;
    const auto started = Clock::now();
    const auto deadline = DeadlineAfter(started, settings.timeout);
    try {
        resolver = factory();
        if (!resolver) {
            throw DiscoveryError(ErrorCode::ResolverInitFailed, "no resolver available");
        }
        stream = resolver->Browse(settings.service_type, settings.domain, deadline);
    } catch (const DiscoveryError& e) {
        return Failed(std::move(result), e);
    }
    if (!stream) {
        return Failed(std::move(result), DiscoveryError(ErrorCode::BrowseFailed, "resolver returned no stream"));
    }

    Deduplicator seen;
    int count = 0;
    const auto emit = [&](const ServiceEntry& entry, const std::string& address, const ParsedTxt& txt) {
        if (!seen.Insert(entry.hostname, address, entry.port)) {
            return;
        }
        ++count;
        if (settings.emit_immediately && sink) {
            sink(RenderLine(fields, count, settings.service_type, entry.hostname, address, entry.port, txt.joined));
        }

        Service service;
        service.service_type = settings.service_type;
        service.hostname = entry.hostname;
        service.address = address;
        service.port = entry.port;
        service.text = txt.joined;
        service.txt_attributes = txt.attributes;
        result.services.push_back(std::move(service));
    };

    ServiceEntry entry;
    while (true) {
        const StreamStatus status = stream->Next(entry);
        if (status == StreamStatus::Closed) {
            Log(LogLevel::Debug, fmt::format("discovery channel closed for {} ({} results)", settings.service_type,
                                             result.services.size()));
            return result;
        }
        if (status == StreamStatus::DeadlineExceeded) {
            Log(LogLevel::Debug, fmt::format("discovery for {} timed out after {} ({} results)", settings.service_type,
                                             FormatDuration(Clock::now() - started), result.services.size()));
            if (result.services.empty()) {
                result.error = ErrorCode::TimedOutZero;
                result.message = ToString(ErrorCode::TimedOutZero);
            }
            return result;
        }

        const ParsedTxt txt = ParseTxt(entry.txt);
        for (const auto& address : entry.ipv4) {
            emit(entry, address, txt);
        }
        for (const auto& address : entry.ipv6) {
            emit(entry, address, txt);
        }
    }
}

}
