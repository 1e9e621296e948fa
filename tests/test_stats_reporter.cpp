#include "mdns_discover/stats_reporter.hpp"

#include <sstream>

#include <gtest/gtest.h>

using namespace mdns_discover;

namespace
{

Service MakeService(const std::string& type, const std::string& host)
{
    Service service;
    service.service_type = type;
    service.hostname = host;
    service.address = "10.0.0.1";
    service.port = 1;
    return service;
}

std::vector<std::string> Lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

}

TEST(StatsReporter, DisabledPrintsNothing)
{
    std::ostringstream os;
    PrintSummary({MakeService("_ssh._tcp", "a")}, Clock::now(), false, DiscoveryStats{}, false, os);
    EXPECT_TRUE(os.str().empty());
}

TEST(StatsReporter, NoResults)
{
    DiscoveryStats stats;
    stats.suppressed_timeouts = 7;
    std::ostringstream os;
    PrintSummary({}, Clock::now(), true, stats, false, os);

    const auto lines = Lines(os.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].rfind("Summary: Completed in ", 0), 0u);
    EXPECT_NE(lines[0].find(" - No services found (7 suppressed timeouts)"), std::string::npos);
}

TEST(StatsReporter, NoResultsWithoutTimeouts)
{
    std::ostringstream os;
    PrintSummary({}, Clock::now(), true, DiscoveryStats{}, false, os);
    const auto lines = Lines(os.str());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].substr(lines[0].size() - 17), "No services found");
}

TEST(StatsReporter, ListsServiceTypesByCountThenName)
{
    DiscoveryStats stats;
    stats.errors = 2;
    stats.service_type_counts = {{"_ssh._tcp", 1}, {"_http._tcp", 2}, {"_afpovertcp._tcp", 1}};
    const std::vector<Service> services = {MakeService("_http._tcp", "a"), MakeService("_http._tcp", "b"),
                                           MakeService("_ssh._tcp", "a"), MakeService("_afpovertcp._tcp", "c")};
    std::ostringstream os;
    PrintSummary(services, Clock::now(), true, stats, false, os);

    const auto lines = Lines(os.str());
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_NE(lines[0].find(" - 3 service types, 4 instances ("), std::string::npos);
    EXPECT_NE(lines[0].find("inst/s, 2 errors)"), std::string::npos);
    EXPECT_EQ(lines[1], "Top services:");
    EXPECT_EQ(lines[2], "  _http._tcp: 2 (50.0%)");
    EXPECT_EQ(lines[3], "  _afpovertcp._tcp: 1 (25.0%)");
    EXPECT_EQ(lines[4], "  _ssh._tcp: 1 (25.0%)");
}

TEST(StatsReporter, SingularWording)
{
    DiscoveryStats stats;
    stats.service_type_counts = {{"_ssh._tcp", 1}};
    std::ostringstream os;
    PrintSummary({MakeService("_ssh._tcp", "a")}, Clock::now(), true, stats, false, os);
    EXPECT_NE(os.str().find(" - 1 service type, 1 instance ("), std::string::npos);
}

TEST(StatsReporter, ColorWrapsSummaryInEscapes)
{
    DiscoveryStats stats;
    stats.service_type_counts = {{"_ssh._tcp", 1}};
    std::ostringstream os;
    PrintSummary({MakeService("_ssh._tcp", "a")}, Clock::now(), true, stats, true, os);
    EXPECT_NE(os.str().find("\033[1mSummary:\033[0m"), std::string::npos);
    EXPECT_NE(os.str().find("\033[32m  _ssh._tcp: 1 (100.0%)\033[0m"), std::string::npos);
}
