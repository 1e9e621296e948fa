#include "mdns_discover/types.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace mdns_discover
{

bool operator==(const ServiceEntry& lhs, const ServiceEntry& rhs)
{
    return lhs.instance == rhs.instance
        && lhs.hostname == rhs.hostname
        && lhs.ipv4 == rhs.ipv4
        && lhs.ipv6 == rhs.ipv6
        && lhs.port == rhs.port
        && lhs.txt == rhs.txt;
}

std::string ToString(const ServiceEntry& entry)
{
    return fmt::format("{} SRV {} port {} A {} AAAA {} TXT {}", entry.instance, entry.hostname, entry.port,
                       entry.ipv4, entry.ipv6, entry.txt);
}

std::ostream& operator<<(std::ostream& os, const ServiceEntry& entry)
{
    os << ToString(entry);
    return os;
}

bool operator==(const Service& lhs, const Service& rhs)
{
    return lhs.service_type == rhs.service_type
        && lhs.hostname == rhs.hostname
        && lhs.address == rhs.address
        && lhs.port == rhs.port
        && lhs.text == rhs.text
        && lhs.txt_attributes == rhs.txt_attributes;
}

bool operator!=(const Service& lhs, const Service& rhs)
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Service& service)
{
    os << fmt::format("{} {} {} {}", service.service_type, service.hostname, service.address, service.port);
    if (!service.text.empty()) {
        os << " " << service.text;
    }
    if (service.txt_attributes) {
        os << fmt::format(" {}", *service.txt_attributes);
    }
    return os;
}

std::string ToString(OutputField field)
{
    switch (field) {
        case OutputField::Count: return "count";
        case OutputField::Service: return "service";
        case OutputField::Hostname: return "hostname";
        case OutputField::Address: return "address";
        case OutputField::Port: return "port";
        case OutputField::Text: return "text";
    }
    return "";
}

std::optional<OutputField> ParseOutputField(std::string_view name)
{
    if (name == "count") return OutputField::Count;
    if (name == "service") return OutputField::Service;
    if (name == "hostname") return OutputField::Hostname;
    if (name == "address") return OutputField::Address;
    if (name == "port") return OutputField::Port;
    if (name == "text") return OutputField::Text;
    return std::nullopt;
}

std::string ToString(OutputMode mode)
{
    switch (mode) {
        case OutputMode::Text: return "text";
        case OutputMode::Json: return "json";
    }
    return "";
}

}
