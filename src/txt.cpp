#include "mdns_discover/txt.hpp"

#include <fmt/ranges.h>

namespace mdns_discover
{

ParsedTxt ParseTxt(const std::vector<std::string>& segments)
{
    ParsedTxt parsed;
    if (segments.empty()) {
        return parsed;
    }
    parsed.joined = fmt::format("{}", fmt::join(segments, ";"));

    TxtAttributes attributes;
    for (const auto& raw : segments) {
        const auto pos = raw.find('=');
        if (pos == std::string::npos || pos == 0) {
            continue;
        }
        attributes[raw.substr(0, pos)] = raw.substr(pos + 1);
    }
    if (!attributes.empty()) {
        parsed.attributes = std::move(attributes);
    }
    return parsed;
}

std::vector<std::string> SplitTxtRdata(std::string_view rdata)
{
    std::vector<std::string> segments;
    std::size_t pos = 0;
    while (pos < rdata.size()) {
        const auto length = static_cast<std::size_t>(static_cast<unsigned char>(rdata[pos]));
        ++pos;
        if (length > rdata.size() - pos) {
            break;
        }
        if (length > 0) {
            segments.emplace_back(rdata.substr(pos, length));
        }
        pos += length;
    }
    return segments;
}

}
