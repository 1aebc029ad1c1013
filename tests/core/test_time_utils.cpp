#include <gtest/gtest.h>
#include "paper_ngin/core/time_utils.hpp"

using namespace paper_ngin;
using namespace paper_ngin::core;

TEST(TimeUtilsTest, FormatIsIsoUtc) {
    Timestamp ts = std::chrono::system_clock::from_time_t(1730693100);  // 2024-11-04 04:05:00 UTC
    EXPECT_EQ(format_timestamp(ts), "2024-11-04T04:05:00Z");
}

TEST(TimeUtilsTest, ParseInvertsFormat) {
    auto parsed = parse_timestamp("2024-11-04T04:05:00Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*parsed), 1730693100);
}

TEST(TimeUtilsTest, ParseRejectsGarbage) {
    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp("").has_value());
}

TEST(TimeUtilsTest, FormattedTimeUsesPattern) {
    std::string year = get_formatted_time("%Y", false);
    EXPECT_EQ(year.size(), 4u);
}
