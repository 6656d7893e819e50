#include <gtest/gtest.h>
#include "tracker/market_data/market_clock.hpp"
#include "fixtures/quote_pages.hpp"
#include <stdexcept>

using namespace FtseTracker::Core;
using QuotePages::taipei_wednesday;

namespace {

MarketClock make_taipei_clock() {
    SessionConfig session_config;
    return MarketClock(session_config);
}

} // anonymous namespace

TEST(MarketClockTest, SessionBoundsAreInclusive) {
    MarketClock clock = make_taipei_clock();

    EXPECT_FALSE(clock.is_market_open(taipei_wednesday(8, 44, 59)));
    EXPECT_TRUE(clock.is_market_open(taipei_wednesday(8, 45, 0)));
    EXPECT_TRUE(clock.is_market_open(taipei_wednesday(11, 0, 0)));
    EXPECT_TRUE(clock.is_market_open(taipei_wednesday(13, 45, 0)));
    EXPECT_FALSE(clock.is_market_open(taipei_wednesday(13, 45, 1)));
}

TEST(MarketClockTest, ComparesAtFullPrecision) {
    MarketClock clock = make_taipei_clock();

    auto close_instant = taipei_wednesday(13, 45, 0);
    EXPECT_FALSE(clock.is_market_open(close_instant + std::chrono::milliseconds(1)));
    EXPECT_FALSE(clock.is_market_open(taipei_wednesday(8, 45, 0) - std::chrono::milliseconds(1)));
}

TEST(MarketClockTest, WeekendIsAlwaysClosed) {
    MarketClock clock = make_taipei_clock();

    // Wednesday + 3 days = Saturday, + 4 days = Sunday, + 5 days = Monday
    auto one_day = std::chrono::hours(24);
    EXPECT_FALSE(clock.is_market_open(taipei_wednesday(10, 0, 0) + 3 * one_day));
    EXPECT_FALSE(clock.is_market_open(taipei_wednesday(10, 0, 0) + 4 * one_day));
    EXPECT_TRUE(clock.is_market_open(taipei_wednesday(10, 0, 0) + 5 * one_day));
    // Friday is a weekday
    EXPECT_TRUE(clock.is_market_open(taipei_wednesday(10, 0, 0) + 2 * one_day));
}

TEST(MarketClockTest, WeekdayFollowsTheSessionZoneNotUtc) {
    MarketClock clock = make_taipei_clock();

    // Monday 09:00 Taipei is still Sunday 01:00 UTC
    auto monday_morning = taipei_wednesday(9, 0, 0) + std::chrono::hours(24 * 5);
    EXPECT_TRUE(clock.is_market_open(monday_morning));
}

TEST(MarketClockTest, FormatsLocalTimeInSessionZone) {
    MarketClock clock = make_taipei_clock();

    EXPECT_EQ(clock.format_local_time(taipei_wednesday(8, 45, 0)), "2024-03-06 08:45:00");
    EXPECT_EQ(clock.format_local_time(taipei_wednesday(23, 59, 59)), "2024-03-06 23:59:59");
    EXPECT_EQ(clock.get_utc_offset(), std::chrono::hours(8));
}

TEST(MarketClockTest, UnknownZoneIsRejectedAtConstruction) {
    SessionConfig session_config;
    session_config.time_zone_name = "Mars/Olympus_Mons";
    EXPECT_THROW(MarketClock clock(session_config), std::invalid_argument);
    EXPECT_THROW(MarketClock::resolve_time_zone(""), std::invalid_argument);
    EXPECT_EQ(MarketClock::resolve_time_zone("Asia/Tokyo"), std::chrono::hours(9));
}

TEST(MarketClockTest, DaylightSavingZonesAreNotOffered) {
    // A single offset would be wrong for half the year
    EXPECT_THROW(MarketClock::resolve_time_zone("Europe/London"), std::invalid_argument);
    EXPECT_THROW(MarketClock::resolve_time_zone("America/New_York"), std::invalid_argument);
    EXPECT_THROW(MarketClock::resolve_time_zone("Australia/Sydney"), std::invalid_argument);
}

TEST(MarketClockTest, EmptySessionIsRejected) {
    SessionConfig session_config;
    session_config.open_seconds_of_day = session_config.close_seconds_of_day;
    EXPECT_THROW(MarketClock clock(session_config), std::invalid_argument);
}
