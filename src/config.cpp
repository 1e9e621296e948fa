#include "mdns_discover/config.hpp"
#include "mdns_discover/errors.hpp"
#include "mdns_discover/log.hpp"
#include "mdns_discover/output.hpp"

#include <getopt.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace mdns_discover
{

namespace
{

enum LongOption {
    kOptOutput = 256,
    kOptTimeout,
    kOptConcurrency,
    kOptDebug,
    kOptSummary,
    kOptNoColor,
    kOptMan
};

const struct option kLongOptions[] = {
    {"output", required_argument, nullptr, kOptOutput},
    {"timeout", required_argument, nullptr, kOptTimeout},
    {"concurrency", required_argument, nullptr, kOptConcurrency},
    {"debug", no_argument, nullptr, kOptDebug},
    {"summary", no_argument, nullptr, kOptSummary},
    {"no-color", no_argument, nullptr, kOptNoColor},
    {"help", no_argument, nullptr, 'h'},
    {"man", no_argument, nullptr, kOptMan},
    {nullptr, 0, nullptr, 0},
};

std::string_view Trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string ToLower(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::optional<std::size_t> ParsePositive(std::string_view text)
{
    text = Trim(text);
    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

// Rounds up to whole milliseconds without leaving the nanosecond range
std::chrono::milliseconds ToTimeout(std::chrono::nanoseconds duration)
{
    constexpr auto kLimit = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds::max());
    return std::min(std::chrono::ceil<std::chrono::milliseconds>(duration), kLimit);
}

struct Unit {
    std::string_view name;
    std::int64_t nanoseconds;
};

constexpr Unit kUnits[] = {
    {"ns", 1},
    {"us", 1000},
    {"\u00b5s", 1000},
    {"\u03bcs", 1000},
    {"ms", 1000 * 1000},
    {"s", 1000 * 1000 * 1000},
    {"m", 60LL * 1000 * 1000 * 1000},
    {"h", 3600LL * 1000 * 1000 * 1000},
};

std::optional<std::int64_t> UnitScale(std::string_view name)
{
    for (const auto& unit : kUnits) {
        if (unit.name == name) {
            return unit.nanoseconds;
        }
    }
    return std::nullopt;
}

}

EnvLookup ProcessEnvironment()
{
    return [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::chrono::nanoseconds ParseDuration(std::string_view text)
{
    const std::string original(text);
    auto invalid = [&original](const std::string& why) {
        return std::invalid_argument(fmt::format("invalid duration \"{}\": {}", original, why));
    };

    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        throw invalid("empty");
    }
    if (text.front() == '-') {
        throw invalid("must be positive");
    }

    constexpr std::uint64_t kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    std::uint64_t total = 0;
    while (!text.empty()) {
        std::size_t pos = 0;
        std::uint64_t whole = 0;
        bool digits = false;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (whole > (kMax - 9) / 10) {
                throw invalid("overflow");
            }
            whole = whole * 10 + static_cast<std::uint64_t>(text[pos] - '0');
            digits = true;
            ++pos;
        }
        // Fraction kept as fraction / scale, digits beyond 1e18 precision are dropped
        std::uint64_t fraction = 0;
        std::uint64_t scale = 1;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (scale < 1000000000000000000ULL) {
                    fraction = fraction * 10 + static_cast<std::uint64_t>(text[pos] - '0');
                    scale *= 10;
                }
                digits = true;
                ++pos;
            }
        }
        if (!digits) {
            throw invalid("expected a number");
        }

        const std::size_t unitStart = pos;
        while (pos < text.size() && text[pos] != '.' && !std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (unitStart == pos) {
            // "0" is the only duration allowed without a unit
            if (pos == text.size() && whole == 0 && fraction == 0 && total == 0) {
                throw invalid("must be positive");
            }
            throw invalid("missing unit");
        }
        const auto unit = text.substr(unitStart, pos - unitStart);
        const auto unitScale = UnitScale(unit);
        if (!unitScale) {
            throw invalid(fmt::format("unknown unit \"{}\"", unit));
        }
        const auto perUnit = static_cast<std::uint64_t>(*unitScale);

        if (whole > kMax / perUnit) {
            throw invalid("overflow");
        }
        std::uint64_t value = whole * perUnit;
        if (fraction > 0) {
            const long double part = static_cast<long double>(fraction) * static_cast<long double>(perUnit)
                / static_cast<long double>(scale);
            value += static_cast<std::uint64_t>(part + 0.5L);
        }
        if (value > kMax - total) {
            throw invalid("overflow");
        }
        total += value;
        text.remove_prefix(pos);
    }

    if (total == 0) {
        throw invalid("must be positive");
    }
    return std::chrono::nanoseconds(static_cast<std::int64_t>(total));
}

std::vector<std::string> SplitFieldList(std::string_view list)
{
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const auto comma = list.find(',', start);
        const auto item = list.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        out.emplace_back(Trim(item));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

Config ParseConfig(int argc, char* argv[], const EnvLookup& env)
{
    Config config;

    if (auto filter = env("MDNS_SERVICE_FILTER")) {
        config.service_filter = std::string(Trim(*filter));
    }
    const auto fieldFilter = env("MDNS_FIELD_FILTER");
    if (auto debug = env("MDNS_DEBUG")) {
        const auto value = ToLower(Trim(*debug));
        config.debug = value == "1" || value == "true";
    }
    if (auto concurrency = env("MDNS_CONCURRENCY")) {
        if (auto n = ParsePositive(*concurrency)) {
            config.concurrency = *n;
        }
    }
    if (auto timeout = env("MDNS_TIMEOUT")) {
        try {
            config.timeout = ToTimeout(ParseDuration(Trim(*timeout)));
        } catch (const std::invalid_argument& e) {
            Log(LogLevel::Warn, fmt::format("invalid MDNS_TIMEOUT '{}' (using default {}): {}", *timeout,
                                            FormatDuration(config.timeout), e.what()));
        }
    }

    std::optional<std::string> outputFlag;
    std::optional<std::string> timeoutFlag;
    std::optional<std::string> concurrencyFlag;
    bool wantHelp = false;
    bool wantMan = false;

    // Full reinitialisation, ParseConfig may run more than once per process
    optind = 0;
    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, ":h", kLongOptions, nullptr)) != -1) {
        switch (opt) {
            case kOptOutput: outputFlag = optarg; break;
            case kOptTimeout: timeoutFlag = optarg; break;
            case kOptConcurrency: concurrencyFlag = optarg; break;
            case kOptDebug: config.debug = true; break;
            case kOptSummary: config.summary = true; break;
            case kOptNoColor: config.no_color = true; break;
            case kOptMan: wantMan = true; break;
            case 'h': wantHelp = true; break;
            case ':':
                throw UsageError(fmt::format("flag needs an argument: {}", argv[optind - 1]));
            case '?':
            default:
                if (optopt != 0) {
                    throw UsageError(fmt::format("unknown flag: -{}", static_cast<char>(optopt)));
                }
                throw UsageError(fmt::format("unknown flag: {}", argv[optind - 1]));
        }
    }

    if (wantHelp) {
        config.action = Action::Help;
        return config;
    }
    if (wantMan) {
        config.action = Action::Man;
        return config;
    }

    if (outputFlag) {
        const auto mode = ToLower(Trim(*outputFlag));
        if (mode == "text" || mode.empty()) {
            config.output_mode = OutputMode::Text;
        } else if (mode == "json") {
            config.output_mode = OutputMode::Json;
        } else {
            throw UsageError(fmt::format("unknown --output value: {} (expected text or json)", *outputFlag));
        }
    }
    if (concurrencyFlag) {
        const auto n = ParsePositive(*concurrencyFlag);
        if (!n) {
            throw UsageError(fmt::format("invalid --concurrency value: {} (must be > 0)", *concurrencyFlag));
        }
        config.concurrency = *n;
    }
    if (timeoutFlag) {
        try {
            config.timeout = ToTimeout(ParseDuration(Trim(*timeoutFlag)));
        } catch (const std::invalid_argument& e) {
            throw UsageError(fmt::format("invalid --timeout value: {}", e.what()));
        }
    }

    const std::vector<std::string> args(argv + optind, argv + argc);
    if (!args.empty()) {
        const std::string& command = args[0];
        if (command == "help") {
            config.action = Action::Help;
            return config;
        }
        if (command == "man") {
            config.action = Action::Man;
            return config;
        }
        if (command != "show-fields") {
            throw UsageError(fmt::format("unknown command: {}", command));
        }
        if (args.size() < 2) {
            throw UsageError("missing output filter, specify what to output with \"show-fields\"");
        }
        if (args.size() > 2) {
            throw UsageError(fmt::format("unexpected extra arguments: {}", fmt::join(args.begin() + 2, args.end(), " ")));
        }
        config.output_fields = SplitFieldList(args[1]);
    }

    if (config.output_fields.empty() && fieldFilter) {
        config.output_fields = SplitFieldList(*fieldFilter);
    }
    return config;
}

}
