#include <gtest/gtest.h>

#include <limits>

#include "common/units.hpp"

using namespace std::chrono_literals;

TEST(Units, ParsesPrometheusDurations) {
    EXPECT_EQ(units::parseDuration("15s"), 15s);
    EXPECT_EQ(units::parseDuration("1m30s"), 90s);
    EXPECT_EQ(units::parseDuration("500ms"), 500ms);
    EXPECT_EQ(units::parseDuration("2h"), 2h);
    EXPECT_EQ(units::parseDuration("1d"), 24h);
    EXPECT_EQ(units::parseDuration("0"), 0ms);
}

TEST(Units, RejectsMalformedDurations) {
    EXPECT_THROW(units::parseDuration(""), std::invalid_argument);
    EXPECT_THROW(units::parseDuration("15"), std::invalid_argument);
    EXPECT_THROW(units::parseDuration("10x"), std::invalid_argument);
    EXPECT_THROW(units::parseDuration("30s1m"), std::invalid_argument);
    EXPECT_THROW(units::parseDuration("-5s"), std::invalid_argument);
}

TEST(Units, RejectsOverflowingDurations) {
    // 单个单位不溢出，累加后溢出
    EXPECT_THROW(units::parseDuration("292000000y1000000000w"), std::invalid_argument);
    EXPECT_THROW(units::parseDuration("106751991167d8h"), std::invalid_argument);
    EXPECT_NO_THROW(units::parseDuration("106751991167d7h"));
    EXPECT_THROW(units::parseDuration("300000000y"), std::invalid_argument);
    EXPECT_EQ(units::parseDuration("9223372036854775807ms"),
              units::Duration(std::numeric_limits<std::int64_t>::max()));
}

TEST(Units, FormatsDurations) {
    EXPECT_EQ(units::formatDuration(90s), "1m30s");
    EXPECT_EQ(units::formatDuration(10s), "10s");
    EXPECT_EQ(units::formatDuration(1500ms), "1s500ms");
    EXPECT_EQ(units::formatDuration(0ms), "0s");
}

TEST(Units, ParsesBase2Sizes) {
    EXPECT_EQ(units::parseBytes("0"), 0u);
    EXPECT_EQ(units::parseBytes("512"), 512u);
    EXPECT_EQ(units::parseBytes("1KB"), 1024u);
    EXPECT_EQ(units::parseBytes("10MiB"), 10u * 1024 * 1024);
    EXPECT_EQ(units::parseBytes("1GB"), 1024ull * 1024 * 1024);
    EXPECT_THROW(units::parseBytes("10 MB"), std::invalid_argument);
    EXPECT_THROW(units::parseBytes("5XB"), std::invalid_argument);
}

TEST(Units, FormatsSizes) {
    EXPECT_EQ(units::formatBytes(10u * 1024 * 1024), "10MiB");
    EXPECT_EQ(units::formatBytes(1500), "1500B");
}
