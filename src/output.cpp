#include "mdns_discover/output.hpp"

#include <algorithm>
#include <cstdio>
#include <set>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <json/json.h>

namespace mdns_discover
{

namespace
{

constexpr OutputField kCanonicalOrder[] = {
    OutputField::Count,
    OutputField::Service,
    OutputField::Hostname,
    OutputField::Address,
    OutputField::Port,
    OutputField::Text,
};

std::string Trim(const std::string& str)
{
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

Json::Value ToJson(const Service& service)
{
    Json::Value value(Json::objectValue);
    if (!service.service_type.empty()) {
        value["service"] = service.service_type;
    }
    value["hostname"] = service.hostname;
    value["address"] = service.address;
    value["port"] = static_cast<Json::UInt>(service.port);
    value["text"] = service.text;
    if (service.txt_attributes && !service.txt_attributes->empty()) {
        Json::Value txtMap(Json::objectValue);
        for (const auto& [key, val] : *service.txt_attributes) {
            txtMap[key] = val;
        }
        value["txtMap"] = txtMap;
    }
    return value;
}

Json::Value ToJson(const std::vector<Service>& services)
{
    Json::Value array(Json::arrayValue);
    for (const auto& service : services) {
        array.append(ToJson(service));
    }
    return array;
}

std::string Write(const Json::Value& root)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root);
}

const Json::Value& Member(const Json::Value& object, const char* name, std::size_t index)
{
    const Json::Value& value = object[name];
    if (value.isNull()) {
        throw std::runtime_error(fmt::format("result {}: missing \"{}\"", index, name));
    }
    return value;
}

Service ServiceFromJson(const Json::Value& value, std::size_t index)
{
    if (!value.isObject()) {
        throw std::runtime_error(fmt::format("result {}: expected an object", index));
    }
    Service service;
    if (value.isMember("service")) {
        service.service_type = value["service"].asString();
    }
    service.hostname = Member(value, "hostname", index).asString();
    service.address = Member(value, "address", index).asString();
    const Json::Value& port = Member(value, "port", index);
    if (!port.isUInt() || port.asUInt() > 0xFFFF) {
        throw std::runtime_error(fmt::format("result {}: invalid port", index));
    }
    service.port = static_cast<std::uint16_t>(port.asUInt());
    service.text = value.get("text", "").asString();
    if (value.isMember("txtMap")) {
        const Json::Value& txtMap = value["txtMap"];
        if (!txtMap.isObject()) {
            throw std::runtime_error(fmt::format("result {}: txtMap is not an object", index));
        }
        TxtAttributes attributes;
        for (const auto& key : txtMap.getMemberNames()) {
            attributes[key] = txtMap[key].asString();
        }
        service.txt_attributes = std::move(attributes);
    }
    return service;
}

}

FieldSelection::FieldSelection(std::vector<OutputField> fields)
: m_ordered(std::move(fields))
{}

bool FieldSelection::Contains(OutputField field) const
{
    return std::find(m_ordered.begin(), m_ordered.end(), field) != m_ordered.end();
}

FieldSelection NormalizeOutputFields(const std::vector<std::string>& names)
{
    if (names.empty()) {
        return FieldSelection(std::vector<OutputField>(std::begin(kCanonicalOrder), std::end(kCanonicalOrder)));
    }

    std::vector<OutputField> ordered;
    for (const auto& name : names) {
        const auto field = ParseOutputField(Trim(name));
        if (!field) {
            continue;
        }
        if (std::find(ordered.begin(), ordered.end(), *field) == ordered.end()) {
            ordered.push_back(*field);
        }
    }
    return FieldSelection(std::move(ordered));
}

std::string RenderLine(const FieldSelection& fields, int sequence, const std::string& service_type,
                       const std::string& hostname, const std::string& address, std::uint16_t port,
                       const std::string& text)
{
    std::vector<std::string> parts;
    for (const auto field : kCanonicalOrder) {
        if (!fields.Contains(field)) {
            continue;
        }
        switch (field) {
            case OutputField::Count: parts.push_back(std::to_string(sequence)); break;
            case OutputField::Service: parts.push_back(service_type); break;
            case OutputField::Hostname: parts.push_back(hostname); break;
            case OutputField::Address: parts.push_back(address); break;
            case OutputField::Port: parts.push_back(std::to_string(port)); break;
            case OutputField::Text:
                if (!text.empty()) {
                    parts.push_back(text);
                }
                break;
        }
    }
    return fmt::format("{}", fmt::join(parts, " "));
}

LineSink StdoutSink()
{
    return [](const std::string& line) {
        fmt::print("{}\n", line);
        std::fflush(stdout);
    };
}

RunSummary Summarize(const std::vector<Service>& services, const DiscoveryStats& stats,
                     std::chrono::steady_clock::duration elapsed)
{
    RunSummary summary;
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);

    std::set<std::string> types;
    for (const auto& service : services) {
        if (!service.service_type.empty()) {
            types.insert(service.service_type);
        }
    }
    summary.service_types = static_cast<int>(types.size());
    summary.instances = static_cast<int>(services.size());

    const double seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds > 0) {
        summary.instances_per_second = summary.instances / seconds;
    }
    summary.suppressed_timeouts = stats.suppressed_timeouts;
    summary.errors = stats.errors;
    return summary;
}

std::string FormatDuration(std::chrono::steady_clock::duration duration)
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    if (ms <= 0) {
        return "0s";
    }
    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    }

    std::string out;
    const auto hours = ms / 3600000;
    ms %= 3600000;
    const auto minutes = ms / 60000;
    ms %= 60000;
    if (hours > 0) {
        out += fmt::format("{}h", hours);
    }
    if (hours > 0 || minutes > 0) {
        out += fmt::format("{}m", minutes);
    }

    out += std::to_string(ms / 1000);
    if (ms % 1000 != 0) {
        std::string fraction = fmt::format("{:03}", ms % 1000);
        fraction.erase(fraction.find_last_not_of('0') + 1);
        out += "." + fraction;
    }
    out += "s";
    return out;
}

std::string ServicesToJson(const std::vector<Service>& services)
{
    return Write(ToJson(services));
}

std::string ServicesToJson(const std::vector<Service>& services, const RunSummary& summary)
{
    Json::Value root(Json::objectValue);
    root["results"] = ToJson(services);

    Json::Value& out = root["summary"];
    out["elapsed"] = FormatDuration(summary.elapsed);
    out["service_types"] = summary.service_types;
    out["instances"] = summary.instances;
    out["instances_per_second"] = summary.instances_per_second;
    out["suppressed_timeouts"] = summary.suppressed_timeouts;
    out["errors"] = summary.errors;
    return Write(root);
}

std::vector<Service> ServicesFromJson(const std::string& json)
{
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(json);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw std::runtime_error(fmt::format("invalid JSON: {}", errors));
    }
    if (!root.isArray()) {
        throw std::runtime_error("expected a JSON array of services");
    }

    std::vector<Service> services;
    services.reserve(root.size());
    for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
        services.push_back(ServiceFromJson(root[i], i));
    }
    return services;
}

}
