#include "mdns_discover/orchestrator.hpp"
#include "mdns_discover/dedup.hpp"
#include "mdns_discover/discovery_worker.hpp"
#include "mdns_discover/errors.hpp"
#include "mdns_discover/log.hpp"
#include "result_queue.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

#include <fmt/core.h>

namespace mdns_discover
{

namespace
{

// Joins every thread on scope exit, also when the aggregator unwinds
class ThreadGroup
{
public:
    ThreadGroup() = default;
    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    ~ThreadGroup()
    {
        for (auto& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    template <typename F> void Spawn(F&& func)
    {
        m_threads.emplace_back(std::forward<F>(func));
    }

private:
    std::vector<std::thread> m_threads;
};

QueryResult RunTask(const ResolverFactory& factory, const QuerySettings& settings, const LineSink& sink)
{
    try {
        return RunQuery(factory, settings, sink);
    } catch (const std::exception& e) {
        QueryResult result;
        result.service_type = settings.service_type;
        result.error = ErrorCode::Internal;
        result.message = fmt::format("{}: {}", ToString(ErrorCode::Internal), e.what());
        return result;
    } catch (...) {
        QueryResult result;
        result.service_type = settings.service_type;
        result.error = ErrorCode::Internal;
        result.message = fmt::format("{}: unknown exception", ToString(ErrorCode::Internal));
        return result;
    }
}

}

Orchestrator::Orchestrator(ResolverFactory factory, DiscoverySettings settings, LineSink sink)
: m_factory(std::move(factory))
, m_settings(std::move(settings))
, m_sink(std::move(sink))
{
    if (m_settings.concurrency == 0) {
        throw std::invalid_argument("concurrency must be a positive integer");
    }
}

DiscoveryResult Orchestrator::DiscoverAll(const std::vector<std::string>& catalog) const
{
    if (catalog.empty()) {
        throw DiscoveryError(ErrorCode::NoServicesConfigured, "");
    }

    const FieldSelection fields = NormalizeOutputFields(m_settings.output_fields);

    QuerySettings query;
    query.domain = m_settings.domain;
    query.output_fields = m_settings.output_fields;
    query.emit_immediately = false;
    query.timeout = m_settings.timeout;
    query.debug = m_settings.debug;

    // Fixed-size task group: every worker pulls the next catalog index until
    // all of them are taken, so at most `workers` queries are ever in flight.
    ResultQueue<QueryResult> results;
    std::atomic<std::size_t> next{0};
    const std::size_t workers = std::min(m_settings.concurrency, catalog.size());

    Log(LogLevel::Debug, fmt::format("Discovering {} service types with {} concurrent queries", catalog.size(), workers));

    DiscoveryResult out;
    ThreadGroup group;
    for (std::size_t i = 0; i < workers; ++i) {
        group.Spawn([&]() {
            while (true) {
                const std::size_t index = next.fetch_add(1);
                if (index >= catalog.size()) {
                    return;
                }
                QuerySettings settings = query;
                settings.service_type = catalog[index];
                results.Push(RunTask(m_factory, settings, m_sink));
            }
        });
    }

    // Single consumer: drains exactly one message per catalog entry
    DiscoveryStats& stats = out.stats;
    stats.attempts = static_cast<int>(catalog.size());
    Deduplicator seen;
    int count = 0;
    for (std::size_t received = 0; received < catalog.size(); ++received) {
        QueryResult batch = results.Pop();
        if (!batch.Ok()) {
            const auto msg = fmt::format("discover {}: {}", batch.service_type, batch.message);
            if (batch.error == ErrorCode::TimedOutZero && !m_settings.debug) {
                ++stats.suppressed_timeouts;
                stats.warnings.push_back(msg + " (suppressed)");
                continue;
            }
            ++stats.errors;
            stats.warnings.push_back(msg);
            Log(LogLevel::Warn, msg);
            continue;
        }

        for (auto& service : batch.services) {
            if (!seen.Insert(service.hostname, service.address, service.port)) {
                ++stats.duplicates;
                continue;
            }
            ++count;
            if (m_settings.emit_immediately && m_settings.output_mode == OutputMode::Text && m_sink) {
                m_sink(RenderLine(fields, count, batch.service_type, service.hostname, service.address, service.port,
                                  service.text));
            }
            service.service_type = batch.service_type;
            ++stats.service_type_counts[batch.service_type];
            out.services.push_back(std::move(service));
        }
    }

    Log(LogLevel::Debug, fmt::format("Discovery finished: {} instances, {} duplicates, {} errors, {} suppressed timeouts",
                                     out.services.size(), stats.duplicates, stats.errors, stats.suppressed_timeouts));
    return out;
}

}
