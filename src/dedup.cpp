#include "mdns_discover/dedup.hpp"

#include <fmt/core.h>

namespace mdns_discover
{

std::string BuildKey(std::string_view hostname, std::string_view address, std::uint16_t port)
{
    return fmt::format("{}|{}|{}", hostname, address, port);
}

bool Deduplicator::Insert(std::string_view hostname, std::string_view address, std::uint16_t port)
{
    return m_seen.insert(BuildKey(hostname, address, port)).second;
}

bool Deduplicator::Contains(std::string_view hostname, std::string_view address, std::uint16_t port) const
{
    return m_seen.count(BuildKey(hostname, address, port)) > 0;
}

}
