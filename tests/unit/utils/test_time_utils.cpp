//
// Created by gregorian on 19/10/2026.
//

#include <gtest/gtest.h>
#include "insight/utils/time_utils.h"
#include <chrono>

using namespace insight::utils;
using namespace std::chrono;

TEST(TimeUtilsTest, FormatEpoch) {
    const insight::core::timestamp epoch{};
    EXPECT_EQ(format_timestamp(epoch), "1970-01-01T00:00:00.000Z");
}

TEST(TimeUtilsTest, FormatKeepsMilliseconds) {
    const insight::core::timestamp ts = system_clock::from_time_t(86400) + milliseconds(120);
    EXPECT_EQ(format_timestamp(ts), "1970-01-02T00:00:00.120Z");
}

TEST(TimeUtilsTest, ParseFormattedTimestamp) {
    const auto ts = time_point_cast<milliseconds>(now());
    const auto parsed = parse_timestamp(format_timestamp(ts));

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(time_point_cast<milliseconds>(*parsed), ts);
}

TEST(TimeUtilsTest, ParseWithoutFraction) {
    const auto parsed = parse_timestamp("2026-10-19T08:15:30Z");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(format_timestamp(*parsed), "2026-10-19T08:15:30.000Z");
}

TEST(TimeUtilsTest, ParseRejectsGarbage) {
    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp("2026-10-19T08:15:30").has_value());
    EXPECT_FALSE(parse_timestamp("2026-10-19T08:15:30.Z").has_value());
}
