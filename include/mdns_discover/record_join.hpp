#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "mdns_discover/types.hpp"

namespace mdns_discover
{

// "<service_type>.<domain>" with exactly one dot between and a trailing dot.
// An empty domain means "local.".
std::string QueryName(std::string service_type, std::string domain);

// A question still needed to complete an instance
struct FollowUpQuery {
    enum class Type {
        Srv,    // instance name known from PTR, target and port missing
        Address // target known from SRV, no A/AAAA seen yet
    };

    Type type;
    std::string name;

    bool operator==(const FollowUpQuery& other) const { return type == other.type && name == other.name; }
};

// Joins decoded PTR, SRV, A/AAAA and TXT records of one browse into
// ServiceEntry values. Names compare case-insensitively. Records can arrive
// in any order and spread over any number of packets.
class RecordJoiner
{
public:
    explicit RecordJoiner(std::string query_name);

    [[nodiscard]] const std::string& QueryName() const { return m_queryName; }

    // PTR "<owner> -> <instance>", ignored unless owner is the query name
    void AddPtr(const std::string& owner, const std::string& instance);
    // SRV and TXT are ignored for names outside the queried service type
    void AddSrv(const std::string& instance, const std::string& target, std::uint16_t port);
    void AddTxt(const std::string& instance, std::vector<std::string> segments);
    // A and AAAA, accepted for any host so they can precede the SRV record
    void AddAddress(const std::string& host, const std::string& address, bool ipv6);

    // Entries for instances that are complete and changed since they were last taken
    std::vector<ServiceEntry> TakeChanged();

    std::vector<FollowUpQuery> PendingQueries() const;

private:
    struct Instance {
        std::string name;
        std::string target;
        std::uint16_t port{0};
        bool has_srv{false};
        std::vector<std::string> txt;
    };

    struct Host {
        std::vector<std::string> ipv4;
        std::vector<std::string> ipv6;
    };

    bool BelongsToQuery(const std::string& key) const;
    Instance& Touch(const std::string& name);

    std::string m_queryName;
    std::string m_queryKey;
    std::map<std::string, Instance> m_instances;
    std::map<std::string, Host> m_hosts;
    std::map<std::string, ServiceEntry> m_published;
    std::set<std::string> m_dirty;
};

}
