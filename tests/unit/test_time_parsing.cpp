#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "time_format.h"

TEST(TimeParsingTest, ParseIsoTimeRespectsZulu) {
    // 2024-01-01T00:00:00Z is 1704067200 unix timestamp
    auto tp = runscope::ParseIsoTime("2024-01-01T00:00:00Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*tp), 1704067200);
}

TEST(TimeParsingTest, ParseIsoTimeLeapDayAndFraction) {
    auto tp = runscope::ParseIsoTime("2024-02-29T12:00:00.123456Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*tp), 1709208000);
}

TEST(TimeParsingTest, RejectsGarbage) {
    EXPECT_FALSE(runscope::ParseIsoTime("").has_value());
    EXPECT_FALSE(runscope::ParseIsoTime("yesterday").has_value());
}

TEST(TimeParsingTest, FormatRoundsToSeconds) {
    auto tp = runscope::ParseIsoTime("2023-06-15T08:30:05Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(runscope::FormatIsoTime(*tp), "2023-06-15T08:30:05Z");
}

TEST(TimeParsingTest, AppliesZoneOffsets) {
    auto utc = runscope::ParseIsoTime("2024-01-01T00:00:00Z");
    auto east = runscope::ParseIsoTime("2024-01-01T02:00:00+02:00");
    auto west = runscope::ParseIsoTime("2023-12-31T19:30:00.5-04:30");
    ASSERT_TRUE(utc && east && west);
    EXPECT_EQ(*east, *utc);
    EXPECT_EQ(*west, *utc);
    EXPECT_FALSE(runscope::ParseIsoTime("2024-01-01T00:00:00+25:00").has_value());
}

TEST(TimeParsingTest, AcceptsSpaceSeparatorWithoutZone) {
    auto tp = runscope::ParseIsoTime("2024-01-01 00:00:00");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*tp), 1704067200);
    EXPECT_FALSE(runscope::ParseIsoTime("2024-01-01X00:00:00").has_value());
}
