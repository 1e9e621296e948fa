#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdns_discover
{

constexpr std::chrono::milliseconds kDefaultTimeout{15000};
constexpr std::size_t kDefaultConcurrency = 10;
constexpr char kDefaultDomain[] = "local.";

// One raw answer from a Resolver browse, already joined across PTR/SRV/A/AAAA/TXT
struct ServiceEntry {
    std::string instance; // example: "office printer._ipp._tcp.local."
    std::string hostname; // SRV target, example: "printer.local."
    std::vector<std::string> ipv4;
    std::vector<std::string> ipv6;
    std::uint16_t port{0};
    std::vector<std::string> txt; // raw segments, example: "fv=p20.1"
};
bool operator==(const ServiceEntry& lhs, const ServiceEntry& rhs);
std::string ToString(const ServiceEntry& entry);
std::ostream& operator<<(std::ostream& os, const ServiceEntry& entry);

using TxtAttributes = std::map<std::string, std::string>;

// A discovered service instance, one per (hostname, address, port)
struct Service {
    std::string service_type; // example: "_ssh._tcp"
    std::string hostname;
    std::string address;
    std::uint16_t port{0};
    std::string text; // TXT segments joined with ';'
    std::optional<TxtAttributes> txt_attributes;
};
bool operator==(const Service& lhs, const Service& rhs);
bool operator!=(const Service& lhs, const Service& rhs);
std::ostream& operator<<(std::ostream& os, const Service& service);

// Aggregate information about a multi-service discovery run
struct DiscoveryStats {
    int attempts{0};
    int errors{0};
    int suppressed_timeouts{0};
    int duplicates{0};
    std::map<std::string, int> service_type_counts;
    std::vector<std::string> warnings;
};

enum class OutputField {
    Count,
    Service,
    Hostname,
    Address,
    Port,
    Text
};
std::string ToString(OutputField field);
std::optional<OutputField> ParseOutputField(std::string_view name);

enum class OutputMode {
    Text,
    Json
};
std::string ToString(OutputMode mode);

}
