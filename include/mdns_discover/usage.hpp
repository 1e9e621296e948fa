#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mdns_discover
{

// Documentation metadata shared by the help text and the man page
struct FlagDoc {
    std::string_view name;         // without leading dashes
    std::string_view value_syntax; // "=text|json", "<n>" or empty for switches
    std::string_view default_value;
    std::string_view env;          // related environment variable, may be empty
    std::string_view description;
};

struct EnvDoc {
    std::string_view name;
    std::string_view description;
};

struct ExampleDoc {
    std::string_view command; // written with the canonical program name
    std::string_view description;
};

struct ExitCodeDoc {
    int code;
    std::string_view meaning;
};

const std::vector<FlagDoc>& FlagDocs();
const std::vector<EnvDoc>& EnvDocs();
const std::vector<ExampleDoc>& ExampleDocs();
const std::vector<ExitCodeDoc>& ExitCodeDocs();
std::vector<std::string> AllowedFieldNames();

std::string HelpText(const std::string& program, const std::string& version);

// mdoc(7) formatted manual page
std::string ManPage(const std::string& program, const std::string& version, const std::string& date);

}
