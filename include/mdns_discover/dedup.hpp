#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>

namespace mdns_discover
{

// "hostname|address|port", port in plain decimal
std::string BuildKey(std::string_view hostname, std::string_view address, std::uint16_t port);

// First-seen-wins membership over BuildKey() keys.
// Not thread safe: one instance per worker, one per aggregator.
class Deduplicator
{
public:
    // Returns true the first time a triple is offered, false afterwards
    bool Insert(std::string_view hostname, std::string_view address, std::uint16_t port);
    [[nodiscard]] bool Contains(std::string_view hostname, std::string_view address, std::uint16_t port) const;
    [[nodiscard]] std::size_t Size() const { return m_seen.size(); }

private:
    std::unordered_set<std::string> m_seen;
};

}
