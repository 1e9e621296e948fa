#include "mdns_discover/dedup.hpp"

#include <gtest/gtest.h>

using namespace mdns_discover;

TEST(Dedup, KeyJoinsTripleWithPipes)
{
    EXPECT_EQ(BuildKey("printer.local.", "192.168.1.20", 631), "printer.local.|192.168.1.20|631");
    EXPECT_EQ(BuildKey("", "", 0), "||0");
}

TEST(Dedup, FirstInsertWins)
{
    Deduplicator seen;
    EXPECT_TRUE(seen.Insert("h.local.", "10.0.0.1", 22));
    EXPECT_FALSE(seen.Insert("h.local.", "10.0.0.1", 22));
    EXPECT_TRUE(seen.Contains("h.local.", "10.0.0.1", 22));
    EXPECT_EQ(seen.Size(), 1u);
}

TEST(Dedup, AnyDifferingComponentIsANewKey)
{
    Deduplicator seen;
    EXPECT_TRUE(seen.Insert("h.local.", "10.0.0.1", 22));
    EXPECT_TRUE(seen.Insert("h.local.", "10.0.0.1", 80));
    EXPECT_TRUE(seen.Insert("h.local.", "fe80::1", 22));
    EXPECT_TRUE(seen.Insert("g.local.", "10.0.0.1", 22));
    EXPECT_EQ(seen.Size(), 4u);
    EXPECT_FALSE(seen.Contains("g.local.", "fe80::1", 22));
}
