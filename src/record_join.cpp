#include "mdns_discover/record_join.hpp"
#include "mdns_discover/log.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

namespace mdns_discover
{

namespace
{

std::string Lower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool EndsWith(const std::string& str, const std::string& suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}

std::string QueryName(std::string service_type, std::string domain)
{
    while (!service_type.empty() && service_type.back() == '.') {
        service_type.pop_back();
    }
    while (!domain.empty() && domain.front() == '.') {
        domain.erase(domain.begin());
    }
    if (domain.empty()) {
        domain = kDefaultDomain;
    }
    if (domain.back() != '.') {
        domain += '.';
    }
    return fmt::format("{}.{}", service_type, domain);
}

RecordJoiner::RecordJoiner(std::string query_name)
: m_queryName(std::move(query_name))
, m_queryKey(Lower(m_queryName))
{}

bool RecordJoiner::BelongsToQuery(const std::string& key) const
{
    return m_instances.count(key) > 0 || EndsWith(key, "." + m_queryKey);
}

RecordJoiner::Instance& RecordJoiner::Touch(const std::string& name)
{
    const auto key = Lower(name);
    auto& instance = m_instances[key];
    if (instance.name.empty()) {
        instance.name = name;
        Log(LogLevel::Debug, fmt::format("Found instance {}", name));
    }
    m_dirty.insert(key);
    return instance;
}

void RecordJoiner::AddPtr(const std::string& owner, const std::string& instance)
{
    if (instance.empty() || Lower(owner) != m_queryKey) {
        return;
    }
    Touch(instance);
}

void RecordJoiner::AddSrv(const std::string& instance, const std::string& target, std::uint16_t port)
{
    if (!BelongsToQuery(Lower(instance))) {
        return;
    }
    auto& entry = Touch(instance);
    entry.target = target;
    entry.port = port;
    entry.has_srv = true;
}

void RecordJoiner::AddTxt(const std::string& instance, std::vector<std::string> segments)
{
    if (!BelongsToQuery(Lower(instance))) {
        return;
    }
    Touch(instance).txt = std::move(segments);
}

void RecordJoiner::AddAddress(const std::string& host, const std::string& address, bool ipv6)
{
    if (address.empty()) {
        return;
    }
    const auto hostKey = Lower(host);
    auto& addresses = m_hosts[hostKey];
    auto& list = ipv6 ? addresses.ipv6 : addresses.ipv4;
    if (std::find(list.begin(), list.end(), address) != list.end()) {
        return;
    }
    list.push_back(address);
    for (const auto& [key, instance] : m_instances) {
        if (instance.has_srv && Lower(instance.target) == hostKey) {
            m_dirty.insert(key);
        }
    }
}

std::vector<ServiceEntry> RecordJoiner::TakeChanged()
{
    std::vector<ServiceEntry> changed;
    for (const auto& key : m_dirty) {
        const auto& instance = m_instances[key];
        if (!instance.has_srv) {
            continue;
        }
        const auto host = m_hosts.find(Lower(instance.target));
        if (host == m_hosts.end()) {
            continue;
        }

        ServiceEntry entry;
        entry.instance = instance.name;
        entry.hostname = instance.target;
        entry.ipv4 = host->second.ipv4;
        entry.ipv6 = host->second.ipv6;
        entry.port = instance.port;
        entry.txt = instance.txt;

        auto& published = m_published[key];
        if (published == entry) {
            continue;
        }
        published = entry;
        Log(LogLevel::Debug, fmt::format("Got entry: {}", ToString(entry)));
        changed.push_back(std::move(entry));
    }
    m_dirty.clear();
    return changed;
}

std::vector<FollowUpQuery> RecordJoiner::PendingQueries() const
{
    std::vector<FollowUpQuery> queries;
    for (const auto& [key, instance] : m_instances) {
        if (!instance.has_srv) {
            queries.push_back({FollowUpQuery::Type::Srv, instance.name});
        } else if (m_hosts.find(Lower(instance.target)) == m_hosts.end()) {
            queries.push_back({FollowUpQuery::Type::Address, instance.target});
        }
    }
    return queries;
}

}
