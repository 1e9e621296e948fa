#include "mdns_discover/stats_reporter.hpp"
#include "mdns_discover/output.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace mdns_discover
{

namespace
{

struct Palette
{
    std::string reset;
    std::string bold;
    std::string green;
    std::string yellow;
    std::string red;
};

Palette MakePalette(bool color)
{
    if (!color) {
        return {};
    }
    return {"\033[0m", "\033[1m", "\033[32m", "\033[33m", "\033[31m"};
}

std::string Plural(int n, const char* singular, const char* plural)
{
    return fmt::format("{} {}", n, n == 1 ? singular : plural);
}

std::string Paint(const std::string& text, const std::string& color, const Palette& palette)
{
    if (color.empty()) {
        return text;
    }
    return color + text + palette.reset;
}

}

void PrintSummary(const std::vector<Service>& discovered, Clock::time_point start, bool enabled,
                  const DiscoveryStats& stats, bool color, std::ostream& os)
{
    if (!enabled) {
        return;
    }

    const Palette palette = MakePalette(color);
    const auto elapsed = Clock::now() - start;

    if (discovered.empty()) {
        std::string msg = fmt::format("Summary: Completed in {} - No services found", FormatDuration(elapsed));
        if (stats.suppressed_timeouts > 0) {
            msg += fmt::format(" ({} suppressed timeouts)", stats.suppressed_timeouts);
        }
        os << palette.bold << msg << palette.reset << "\n";
        return;
    }

    const RunSummary summary = Summarize(discovered, stats, elapsed);

    std::vector<std::string> extras;
    extras.push_back(fmt::format("{:.2f} inst/s", summary.instances_per_second));
    if (stats.suppressed_timeouts > 0) {
        extras.push_back(Paint(fmt::format("{} suppressed timeouts", stats.suppressed_timeouts), palette.yellow, palette));
    }
    if (stats.errors > 0) {
        extras.push_back(Paint(fmt::format("{} errors", stats.errors), palette.red, palette));
    }

    os << fmt::format("{}Summary:{} Completed in {} - {}, {} ({})\n", palette.bold, palette.reset,
                      FormatDuration(summary.elapsed),
                      Paint(Plural(summary.service_types, "service type", "service types"), palette.green, palette),
                      Paint(Plural(summary.instances, "instance", "instances"), palette.green, palette),
                      fmt::join(extras, ", "));

    if (stats.service_type_counts.empty()) {
        return;
    }

    std::vector<std::pair<std::string, int>> pairs(stats.service_type_counts.begin(), stats.service_type_counts.end());
    std::sort(pairs.begin(), pairs.end(), [](const auto& lhs, const auto& rhs) {
        if (lhs.second == rhs.second) {
            return lhs.first < rhs.first;
        }
        return lhs.second > rhs.second;
    });

    os << palette.bold << "Top services:" << palette.reset << "\n";
    for (const auto& [name, count] : pairs) {
        const double pct = static_cast<double>(count) / static_cast<double>(summary.instances) * 100.0;
        os << Paint(fmt::format("  {}: {} ({:.1f}%)", name, count, pct), palette.green, palette) << "\n";
    }
}

}
