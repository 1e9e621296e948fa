#include "mdns_discover/usage.hpp"
#include "mdns_discover/types.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace mdns_discover
{

namespace
{

constexpr std::string_view kCanonicalName = "mdns-discover";

std::string Upper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
    return text;
}

// Examples are written for "mdns-discover", show them with the invoked name
std::string ExampleCommand(std::string_view command, const std::string& program)
{
    if (command == kCanonicalName) {
        return program;
    }
    const auto pos = command.find(kCanonicalName);
    if (pos == std::string_view::npos) {
        return std::string(command);
    }
    return fmt::format("{}{}{}", command.substr(0, pos), program, command.substr(pos + kCanonicalName.size()));
}

template <typename T, typename Less> std::vector<T> Sorted(std::vector<T> items, Less less)
{
    std::sort(items.begin(), items.end(), less);
    return items;
}

std::vector<FlagDoc> SortedFlags()
{
    return Sorted(FlagDocs(), [](const FlagDoc& lhs, const FlagDoc& rhs) { return lhs.name < rhs.name; });
}

std::vector<EnvDoc> SortedEnv()
{
    return Sorted(EnvDocs(), [](const EnvDoc& lhs, const EnvDoc& rhs) { return lhs.name < rhs.name; });
}

}

const std::vector<FlagDoc>& FlagDocs()
{
    static const std::vector<FlagDoc> docs = {
        {"output", "=text|json", "text", "", "Output format"},
        {"timeout", "=30s", "15s", "MDNS_TIMEOUT", "Discovery timeout per service type"},
        {"concurrency", "=<n>", "10", "MDNS_CONCURRENCY", "Simultaneous lookups"},
        {"debug", "", "false", "MDNS_DEBUG", "Verbose debug output"},
        {"summary", "", "false", "", "Print summary (show all service types with counts)"},
        {"no-color", "", "false", "", "Disable ANSI color in summary"},
        {"man", "", "", "", "Print the manual page (mdoc) and exit"},
        {"help", "", "", "", "Show this help text and exit"},
    };
    return docs;
}

const std::vector<EnvDoc>& EnvDocs()
{
    static const std::vector<EnvDoc> docs = {
        {"MDNS_SERVICE_FILTER", "Restrict to a single service type"},
        {"MDNS_FIELD_FILTER", "Comma list of fields (overridden by show-fields)"},
        {"MDNS_TIMEOUT", "Discovery timeout (duration string)"},
        {"MDNS_DEBUG", "Verbose debug output (1 / true)"},
        {"MDNS_CONCURRENCY", "Max concurrent service lookups"},
    };
    return docs;
}

const std::vector<ExampleDoc>& ExampleDocs()
{
    static const std::vector<ExampleDoc> docs = {
        {"mdns-discover", "Discover using defaults"},
        {"mdns-discover --output=json", "JSON array output"},
        {"MDNS_SERVICE_FILTER=\"_workstation._tcp\" mdns-discover", "Filter to a specific service"},
        {"mdns-discover show-fields \"hostname,address,port\"", "Limit output columns"},
        {"MDNS_TIMEOUT=30s mdns-discover --concurrency=5", "Override timeout and concurrency"},
        {"mdns-discover --summary --output=json", "JSON results with a run summary"},
    };
    return docs;
}

const std::vector<ExitCodeDoc>& ExitCodeDocs()
{
    static const std::vector<ExitCodeDoc> docs = {
        {0, "Success"},
        {1, "Runtime error"},
        {2, "Usage error"},
        {3, "Resolver initialization failed"},
        {4, "Browse operation failed"},
        {5, "Timed out with zero results"},
    };
    return docs;
}

std::vector<std::string> AllowedFieldNames()
{
    std::vector<std::string> names;
    for (auto field : {OutputField::Count, OutputField::Service, OutputField::Hostname, OutputField::Address,
                       OutputField::Port, OutputField::Text}) {
        names.push_back(ToString(field));
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string HelpText(const std::string& program, const std::string& version)
{
    std::string out;
    out += fmt::format("{} v{} - mDNS service discovery utility\n", program, version);
    out += fmt::format("Usage: {} [flags] [subcommand]\n\n", program);

    out += "Commands:\n";
    out += "  help                  Show this help text\n";
    out += "  man                   Print the manual page (mdoc)\n";
    out += "  show-fields \"a,b,c\"   Limit output to specified comma-separated fields\n\n";

    out += "Flags:\n";
    for (const auto& flag : SortedFlags()) {
        std::string line = fmt::format("  {:<20} {}", fmt::format("--{}{}", flag.name, flag.value_syntax),
                                       flag.description);
        if (!flag.default_value.empty()) {
            line += fmt::format(" (default: {})", flag.default_value);
        }
        if (!flag.env.empty()) {
            line += fmt::format(" (env: {})", flag.env);
        }
        out += line + "\n";
    }
    out += "\n";

    out += "Environment:\n";
    for (const auto& env : SortedEnv()) {
        out += fmt::format("  {:<22} {}\n", env.name, env.description);
    }
    out += "\n";

    out += "Fields:\n";
    out += fmt::format("  Allowed: {}\n", fmt::join(AllowedFieldNames(), ", "));
    out += "  Unknown field names are ignored\n\n";

    out += "Output modes:\n";
    out += "  text  One line per discovered (service + address).\n";
    out += "  json  Single JSON array (all results), an object with a summary when --summary is set.\n\n";

    out += "Examples:\n";
    for (const auto& example : ExampleDocs()) {
        out += fmt::format("  {:<45} {}\n", ExampleCommand(example.command, program), example.description);
    }
    out += "\n";

    out += "Exit codes:\n";
    for (const auto& code : ExitCodeDocs()) {
        out += fmt::format("  {:<3} {}\n", code.code, code.meaning);
    }
    return out;
}

std::string ManPage(const std::string& program, const std::string& version, const std::string& date)
{
    std::string out;
    out += fmt::format(".Dd {}\n", date);
    out += fmt::format(".Dt {} 1\n", Upper(program));
    out += fmt::format(".Os {} {}\n", kCanonicalName, version);
    out += ".Sh NAME\n";
    out += fmt::format(".Nm {}\n", program);
    out += ".Nd mDNS service discovery utility\n";

    out += ".Sh SYNOPSIS\n";
    out += ".Nm\n";
    out += ".Op Fl -output Ns = Ns Ar text|json\n";
    out += ".Op Fl -timeout Ns = Ns Ar duration\n";
    out += ".Op Fl -concurrency Ns = Ns Ar n\n";
    out += ".Op Fl -debug\n";
    out += ".Op Fl -summary\n";
    out += ".Op Fl -no-color\n";
    out += ".Op Fl h | Fl -help | Fl -man\n";
    out += ".Op Ar subcommand\n";

    out += ".Sh DESCRIPTION\n";
    out += ".Nm\n";
    out += "performs multicast DNS (mDNS / DNS-SD) discovery across a curated list of service types "
           "or an optionally restricted single service.\n";
    out += "Results can be emitted as plain text lines or a JSON array.\n";

    out += ".Sh FLAGS\n";
    out += ".Bl -tag -width Ds\n";
    for (const auto& flag : SortedFlags()) {
        std::vector<std::string> parts{std::string(flag.description)};
        if (!flag.default_value.empty()) {
            parts.push_back(fmt::format("default: {}", flag.default_value));
        }
        if (!flag.env.empty()) {
            parts.push_back(fmt::format("env: {}", flag.env));
        }
        out += fmt::format(".It Fl -{}{}\n{}\n", flag.name, flag.value_syntax, fmt::join(parts, "; "));
    }
    out += ".El\n";

    out += ".Sh ENVIRONMENT\n";
    out += ".Bl -tag -width Ds\n";
    for (const auto& env : SortedEnv()) {
        out += fmt::format(".It Ev {}\n{}\n", env.name, env.description);
    }
    out += ".El\n";

    out += ".Sh FIELDS\n";
    out += fmt::format("Allowed output fields: {}.\nUnknown names are ignored.\n",
                       fmt::join(AllowedFieldNames(), ", "));

    out += ".Sh OUTPUT MODES\n";
    out += ".Bl -tag -width Ds\n";
    out += ".It text\nOne line per discovered service instance (fields space-separated).\n";
    out += ".It json\nSingle JSON array containing all discovered services.\n";
    out += ".El\n";

    out += ".Sh EXAMPLES\n";
    out += ".Bl -tag -width Ds\n";
    for (const auto& example : ExampleDocs()) {
        out += fmt::format(".It Li {}\n{}\n", ExampleCommand(example.command, program), example.description);
    }
    out += ".El\n";

    out += ".Sh EXIT STATUS\n";
    out += ".Bl -tag -width Ds\n";
    for (const auto& code : ExitCodeDocs()) {
        out += fmt::format(".It {}\n{}\n", code.code, code.meaning);
    }
    out += ".El\n";

    out += ".Sh SEE ALSO\n";
    out += "multicast DNS (mDNS), DNS-SD specifications\n";
    return out;
}

}
