#include "mdns_discover/config.hpp"
#include "mdns_discover/discovery_worker.hpp"

#include "fake_resolver.hpp"

#include <gtest/gtest.h>

using namespace mdns_discover;
using namespace std::chrono_literals;
using mdns_discover::test::BrowseScript;
using mdns_discover::test::FakeResolverHub;
using mdns_discover::test::MakeEntry;

namespace
{

QuerySettings Settings(const std::string& serviceType, std::chrono::milliseconds timeout = 200ms)
{
    QuerySettings settings;
    settings.service_type = serviceType;
    settings.timeout = timeout;
    return settings;
}

LineSink Collect(std::vector<std::string>& lines)
{
    return [&lines](const std::string& line) { lines.push_back(line); };
}

}

TEST(DiscoveryWorker, ZeroEntriesBeforeDeadlineIsTimedOutZero)
{
    FakeResolverHub hub;
    BrowseScript script;
    script.end = BrowseScript::End::WaitForDeadline;
    hub.Script("_ssh._tcp", script);

    const auto start = Clock::now();
    const QueryResult result = RunQuery(hub.Factory(), Settings("_ssh._tcp", 50ms), nullptr);
    EXPECT_GE(Clock::now() - start, 50ms);

    EXPECT_EQ(result.error, ErrorCode::TimedOutZero);
    EXPECT_EQ(result.message, "timeout no results");
    EXPECT_TRUE(result.services.empty());
    EXPECT_EQ(result.service_type, "_ssh._tcp");
}

TEST(DiscoveryWorker, DeadlineWithResultsIsSuccess)
{
    FakeResolverHub hub;
    BrowseScript script;
    script.entries = {MakeEntry("h.local.", {"10.0.0.1"}, 22)};
    script.end = BrowseScript::End::WaitForDeadline;
    hub.Script("_ssh._tcp", script);

    const QueryResult result = RunQuery(hub.Factory(), Settings("_ssh._tcp", 30ms), nullptr);
    EXPECT_TRUE(result.Ok());
    ASSERT_EQ(result.services.size(), 1u);
}

TEST(DiscoveryWorker, ClosedStreamReturnsBeforeDeadline)
{
    FakeResolverHub hub;
    BrowseScript script;
    script.entries = {MakeEntry("h.local.", {"10.0.0.1"}, 22, {"fv=p20.1", "junk"})};
    hub.Script("_ssh._tcp", script);

    const auto start = Clock::now();
    const QueryResult result = RunQuery(hub.Factory(), Settings("_ssh._tcp", 10s), nullptr);
    EXPECT_LT(Clock::now() - start, 5s);

    ASSERT_TRUE(result.Ok());
    ASSERT_EQ(result.services.size(), 1u);
    const Service& service = result.services[0];
    EXPECT_EQ(service.service_type, "_ssh._tcp");
    EXPECT_EQ(service.hostname, "h.local.");
    EXPECT_EQ(service.address, "10.0.0.1");
    EXPECT_EQ(service.port, 22);
    EXPECT_EQ(service.text, "fv=p20.1;junk");
    ASSERT_TRUE(service.txt_attributes.has_value());
    EXPECT_EQ(*service.txt_attributes, (TxtAttributes{{"fv", "p20.1"}}));
}

TEST(DiscoveryWorker, ClosedStreamWithoutEntriesIsEmptySuccess)
{
    FakeResolverHub hub;
    const QueryResult result = RunQuery(hub.Factory(), Settings("_nothing._tcp"), nullptr);
    EXPECT_TRUE(result.Ok());
    EXPECT_TRUE(result.services.empty());
}

TEST(DiscoveryWorker, RepeatedAdvertisementKeepsFirstPayload)
{
    FakeResolverHub hub;
    BrowseScript script;
    script.entries = {MakeEntry("h.local.", {"10.0.0.1"}, 22, {"v=1"}), MakeEntry("h.local.", {"10.0.0.1"}, 22, {"v=2"})};
    hub.Script("_ssh._tcp", script);

    const QueryResult result = RunQuery(hub.Factory(), Settings("_ssh._tcp"), nullptr);
    ASSERT_EQ(result.services.size(), 1u);
    EXPECT_EQ(result.services[0].text, "v=1");
}

TEST(DiscoveryWorker, OneServicePerAddressIpv4First)
{
    FakeResolverHub hub;
    BrowseScript script;
    script.entries = {MakeEntry("h.local.", {"10.0.0.1", "10.0.0.2"}, 80, {}, {"fe80::1"})};
    hub.Script("_http._tcp", script);

    const QueryResult result = RunQuery(hub.Factory(), Settings("_http._tcp"), nullptr);
    ASSERT_EQ(result.services.size(), 3u);
    EXPECT_EQ(result.services[0].address, "10.0.0.1");
    EXPECT_EQ(result.services[1].address, "10.0.0.2");
    EXPECT_EQ(result.services[2].address, "fe80::1");
    EXPECT_FALSE(result.services[0].txt_attributes.has_value());
}

TEST(DiscoveryWorker, EntryWithoutAddressesContributesNothing)
{
    FakeResolverHub hub;
    BrowseScript script;
    script.entries = {MakeEntry("h.local.", {}, 80)};
    hub.Script("_http._tcp", script);

    const QueryResult result = RunQuery(hub.Factory(), Settings("_http._tcp"), nullptr);
    EXPECT_TRUE(result.Ok());
    EXPECT_TRUE(result.services.empty());
}

TEST(DiscoveryWorker, ResolverInitFailure)
{
    FakeResolverHub hub;
    hub.FailInit(true);

    const QueryResult result = RunQuery(hub.Factory(), Settings("_ssh._tcp"), nullptr);
    EXPECT_EQ(result.error, ErrorCode::ResolverInitFailed);
    EXPECT_EQ(result.message, "resolver init failed: no multicast sockets");
    EXPECT_EQ(hub.Browses(), 0);
}

TEST(DiscoveryWorker, NullResolverIsInitFailure)
{
    const ResolverFactory factory = []() -> std::unique_ptr<Resolver> { return nullptr; };
    const QueryResult result = RunQuery(factory, Settings("_ssh._tcp"), nullptr);
    EXPECT_EQ(result.error, ErrorCode::ResolverInitFailed);
}

TEST(DiscoveryWorker, BrowseFailure)
{
    FakeResolverHub hub;
    BrowseScript script;
    script.fail_browse = true;
    hub.Script("_ssh._tcp", script);

    const QueryResult result = RunQuery(hub.Factory(), Settings("_ssh._tcp"), nullptr);
    EXPECT_EQ(result.error, ErrorCode::BrowseFailed);
    EXPECT_EQ(hub.Browses(), 1);
}

TEST(DiscoveryWorker, EmitsNumberedLinesWhenRequested)
{
    FakeResolverHub hub;
    BrowseScript script;
    script.entries = {MakeEntry("a.local.", {"10.0.0.1"}, 22), MakeEntry("a.local.", {"10.0.0.1"}, 22),
                      MakeEntry("b.local.", {"10.0.0.2"}, 22, {"k=v"})};
    hub.Script("_ssh._tcp", script);

    QuerySettings settings = Settings("_ssh._tcp");
    settings.emit_immediately = true;
    std::vector<std::string> lines;
    const QueryResult result = RunQuery(hub.Factory(), settings, Collect(lines));

    EXPECT_EQ(result.services.size(), 2u);
    const std::vector<std::string> expected = {"1 _ssh._tcp a.local. 10.0.0.1 22",
                                               "2 _ssh._tcp b.local. 10.0.0.2 22 k=v"};
    EXPECT_EQ(lines, expected);
}

TEST(DiscoveryWorker, SilentWhenNotEmitting)
{
    FakeResolverHub hub;
    BrowseScript script;
    script.entries = {MakeEntry("a.local.", {"10.0.0.1"}, 22)};
    hub.Script("_ssh._tcp", script);

    std::vector<std::string> lines;
    const QueryResult result = RunQuery(hub.Factory(), Settings("_ssh._tcp"), Collect(lines));
    EXPECT_EQ(result.services.size(), 1u);
    EXPECT_TRUE(lines.empty());
}

TEST(DiscoveryWorker, DeadlineSaturatesForHugeTimeouts)
{
    const auto now = Clock::now();
    EXPECT_EQ(DeadlineAfter(now, std::chrono::milliseconds::max()), Clock::time_point::max());
    EXPECT_EQ(DeadlineAfter(now, 250ms), now + 250ms);
}

TEST(DiscoveryWorker, LargestAcceptedTimeoutStillBrowses)
{
    FakeResolverHub hub;
    BrowseScript script;
    script.entries = {MakeEntry("h.local.", {"10.0.0.1"}, 22)};
    hub.Script("_ssh._tcp", script);

    QuerySettings settings = Settings("_ssh._tcp");
    settings.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(ParseDuration("2562047h47m16s"));
    const QueryResult result = RunQuery(hub.Factory(), settings, nullptr);

    EXPECT_TRUE(result.Ok()) << result.message;
    EXPECT_EQ(result.services.size(), 1u);
    EXPECT_GT(hub.LastDeadline(), Clock::now() + 24h);
}
