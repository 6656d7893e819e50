#include <gtest/gtest.h>
#include "utils/time_utils.hpp"
#include <stdexcept>

TEST(TimeUtilsTest, ParsesTimeOfDay) {
    EXPECT_EQ(TimeUtils::parse_time_of_day("08:45:00"), 8 * 3600 + 45 * 60);
    EXPECT_EQ(TimeUtils::parse_time_of_day("00:00:00"), 0);
    EXPECT_EQ(TimeUtils::parse_time_of_day("23:59:59"), 86399);
}

TEST(TimeUtilsTest, RejectsMalformedTimeOfDay) {
    EXPECT_THROW(TimeUtils::parse_time_of_day("8.45"), std::invalid_argument);
    EXPECT_THROW(TimeUtils::parse_time_of_day("08:45:00 pm"), std::invalid_argument);
    EXPECT_THROW(TimeUtils::parse_time_of_day(""), std::invalid_argument);
}

TEST(TimeUtilsTest, FormatsTimeOfDay) {
    EXPECT_EQ(TimeUtils::format_time_of_day(8 * 3600 + 45 * 60), "08:45:00");
    EXPECT_EQ(TimeUtils::format_time_of_day(13 * 3600 + 45 * 60 + 7), "13:45:07");
}

TEST(TimeUtilsTest, FormatsWithFixedOffset) {
    // 2024-03-06T02:00:00Z
    std::chrono::system_clock::time_point instant(std::chrono::seconds(1709690400));
    EXPECT_EQ(TimeUtils::format_human_readable_with_offset(instant, std::chrono::hours(8)), "2024-03-06 10:00:00");
    EXPECT_EQ(TimeUtils::format_human_readable_with_offset(instant, std::chrono::hours(0)), "2024-03-06 02:00:00");
}

TEST(TimeUtilsTest, EpochSecondsKeepFraction) {
    std::chrono::system_clock::time_point instant(std::chrono::milliseconds(1709690400250LL));
    EXPECT_DOUBLE_EQ(TimeUtils::to_epoch_seconds(instant), 1709690400.25);
    EXPECT_EQ(TimeUtils::to_epoch_whole_seconds(instant), 1709690400LL);
}
