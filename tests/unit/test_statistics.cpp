/**
 * Cloak - Statistics Tests
 */

#include <gtest/gtest.h>
#include "core/statistics.hpp"

using namespace cloak;

TEST(StatisticsTest, SetAndIncrement) {
    Statistics stats;

    stats.set("count", 42);
    stats.increment("counter");
    stats.increment("counter", 5);

    EXPECT_EQ(stats.get("count"), 42);
    EXPECT_EQ(stats.get("counter"), 6);
    EXPECT_TRUE(stats.has("counter"));
}

TEST(StatisticsTest, DefaultValues) {
    Statistics stats;

    EXPECT_EQ(stats.get("nonexistent"), 0);
    EXPECT_FALSE(stats.has("nonexistent"));
    EXPECT_DOUBLE_EQ(stats.getTiming("nonexistent"), 0.0);
    EXPECT_TRUE(stats.empty());
}

TEST(StatisticsTest, MergeAddsCounters) {
    Statistics s1, s2;

    s1.set("a", 10);
    s1.set("b", 20);
    s2.set("a", 5);
    s2.set("c", 30);

    s1.merge(s2);

    EXPECT_EQ(s1.get("a"), 15);
    EXPECT_EQ(s1.get("b"), 20);
    EXPECT_EQ(s1.get("c"), 30);
}

TEST(StatisticsTest, PrefixedCountersCountAsTransformations) {
    Statistics stats;

    stats.mergePrefixed("mba", {{"add_replaced", 3}, {"xor_replaced", 2}});
    stats.mergePrefixed("cff", {{"functions_flattened", 1}});
    stats.set("functions", 9);

    EXPECT_EQ(stats.get("mba.add_replaced"), 3);
    EXPECT_EQ(stats.get("cff.functions_flattened"), 1);
    EXPECT_EQ(stats.totalTransformations(), 6);
}

TEST(StatisticsTest, ScopedTimerAccumulates) {
    Statistics stats;
    {
        ScopedTimer timer(stats.timing("parse"));
    }
    {
        ScopedTimer timer(stats.timing("parse"));
    }
    EXPECT_GE(stats.getTiming("parse"), 0.0);
    EXPECT_EQ(stats.timings().size(), 1u);
}

TEST(StatisticsTest, FormatGroupsByPass) {
    Statistics stats;
    stats.mergePrefixed("rename", {{"identifiers_renamed", 4}});
    stats.set("functions", 2);

    std::string report = stats.format();
    EXPECT_NE(report.find("[rename]"), std::string::npos);
    EXPECT_NE(report.find("identifiers_renamed"), std::string::npos);
    EXPECT_NE(report.find("[general]"), std::string::npos);
    EXPECT_NE(report.find("Total transformations: 4"), std::string::npos);
}

TEST(StatisticsTest, ToJson) {
    Statistics stats;
    stats.set("x.y", 1);

    std::string json = stats.toJson();
    EXPECT_NE(json.find("\"counters\""), std::string::npos);
    EXPECT_NE(json.find("\"x.y\": 1"), std::string::npos);
    EXPECT_NE(json.find("\"timings_ms\": {}"), std::string::npos);
}

TEST(StatisticsTest, Clear) {
    Statistics stats;
    stats.set("count", 42);
    stats.timing("t") = 1.0;

    stats.clear();
    EXPECT_TRUE(stats.empty());
}
