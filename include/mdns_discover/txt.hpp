#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mdns_discover/types.hpp"

namespace mdns_discover
{

struct ParsedTxt {
    std::string joined; // segments joined with ';' in original order
    std::optional<TxtAttributes> attributes; // set only if a segment was "key=value"
};

// Splits each segment on its first '='. Segments without '=' or with an
// empty key stay in the joined text but not in the attributes.
ParsedTxt ParseTxt(const std::vector<std::string>& segments);

// Splits TXT RDATA into its length-prefixed character strings, byte for byte.
// Empty strings are skipped, a string running past the end is dropped.
std::vector<std::string> SplitTxtRdata(std::string_view rdata);

}
