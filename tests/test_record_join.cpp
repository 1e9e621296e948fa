#include "mdns_discover/record_join.hpp"

#include <gtest/gtest.h>

using namespace mdns_discover;

namespace
{

constexpr char kQuery[] = "_ipp._tcp.local.";
constexpr char kInstance[] = "Office Printer._ipp._tcp.local.";

}

TEST(QueryName, JoinsTypeAndDomain)
{
    EXPECT_EQ(QueryName("_ipp._tcp", "local."), "_ipp._tcp.local.");
    EXPECT_EQ(QueryName("_ipp._tcp.", "local"), "_ipp._tcp.local.");
    EXPECT_EQ(QueryName("_ipp._tcp", ""), "_ipp._tcp.local.");
    EXPECT_EQ(QueryName("_ipp._tcp", ".example.org"), "_ipp._tcp.example.org.");
}

TEST(RecordJoiner, CompleteInstanceIsPublishedOnce)
{
    RecordJoiner joiner(kQuery);
    joiner.AddPtr(kQuery, kInstance);
    joiner.AddSrv(kInstance, "printer.local.", 631);
    joiner.AddTxt(kInstance, {"rp=ipp/print", "key="});
    joiner.AddAddress("printer.local.", "192.168.1.20", false);
    joiner.AddAddress("printer.local.", "fe80::20", true);

    const auto entries = joiner.TakeChanged();
    ASSERT_EQ(entries.size(), 1u);
    const ServiceEntry& entry = entries[0];
    EXPECT_EQ(entry.instance, kInstance);
    EXPECT_EQ(entry.hostname, "printer.local.");
    EXPECT_EQ(entry.port, 631);
    EXPECT_EQ(entry.ipv4, (std::vector<std::string>{"192.168.1.20"}));
    EXPECT_EQ(entry.ipv6, (std::vector<std::string>{"fe80::20"}));
    EXPECT_EQ(entry.txt, (std::vector<std::string>{"rp=ipp/print", "key="}));

    EXPECT_TRUE(joiner.TakeChanged().empty());
    EXPECT_TRUE(joiner.PendingQueries().empty());
}

TEST(RecordJoiner, RecordsInAnyOrder)
{
    RecordJoiner joiner(kQuery);
    joiner.AddAddress("PRINTER.local.", "192.168.1.20", false);
    joiner.AddSrv(kInstance, "printer.local.", 631);
    EXPECT_TRUE(joiner.PendingQueries().empty());

    const auto entries = joiner.TakeChanged();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].ipv4, (std::vector<std::string>{"192.168.1.20"}));
}

TEST(RecordJoiner, IncompleteInstancesAskForMissingRecords)
{
    RecordJoiner joiner(kQuery);
    joiner.AddPtr(kQuery, kInstance);
    joiner.AddPtr(kQuery, "Scanner._ipp._tcp.local.");
    joiner.AddSrv("Scanner._ipp._tcp.local.", "scanner.local.", 631);

    EXPECT_TRUE(joiner.TakeChanged().empty());
    const auto pending = joiner.PendingQueries();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0], (FollowUpQuery{FollowUpQuery::Type::Srv, kInstance}));
    EXPECT_EQ(pending[1], (FollowUpQuery{FollowUpQuery::Type::Address, "scanner.local."}));
}

TEST(RecordJoiner, RepublishesOnlyWhenSomethingChanged)
{
    RecordJoiner joiner(kQuery);
    joiner.AddSrv(kInstance, "printer.local.", 631);
    joiner.AddAddress("printer.local.", "192.168.1.20", false);
    ASSERT_EQ(joiner.TakeChanged().size(), 1u);

    // Same answers again
    joiner.AddSrv(kInstance, "printer.local.", 631);
    joiner.AddAddress("printer.local.", "192.168.1.20", false);
    EXPECT_TRUE(joiner.TakeChanged().empty());

    joiner.AddAddress("printer.local.", "192.168.1.21", false);
    auto entries = joiner.TakeChanged();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].ipv4, (std::vector<std::string>{"192.168.1.20", "192.168.1.21"}));

    joiner.AddTxt(kInstance, {"note=moved"});
    entries = joiner.TakeChanged();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].txt, (std::vector<std::string>{"note=moved"}));
}

TEST(RecordJoiner, IgnoresOtherServiceTypes)
{
    RecordJoiner joiner(kQuery);
    joiner.AddPtr("_http._tcp.local.", "Web._http._tcp.local.");
    joiner.AddSrv("Web._http._tcp.local.", "web.local.", 80);
    joiner.AddTxt("Web._http._tcp.local.", {"path=/"});
    joiner.AddAddress("web.local.", "192.168.1.30", false);

    EXPECT_TRUE(joiner.TakeChanged().empty());
    EXPECT_TRUE(joiner.PendingQueries().empty());
}

TEST(RecordJoiner, QueryNameMatchesCaseInsensitively)
{
    RecordJoiner joiner(kQuery);
    joiner.AddPtr("_IPP._TCP.LOCAL.", kInstance);
    joiner.AddSrv("office printer._ipp._tcp.local.", "printer.local.", 631);
    joiner.AddAddress("printer.local.", "192.168.1.20", false);

    const auto entries = joiner.TakeChanged();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].instance, kInstance);
}
