#include <gtest/gtest.h>
#include <ctime>
#include "finpipe/core/clock.hpp"
#include "finpipe/core/time_utils.hpp"

using namespace finpipe;
using namespace finpipe::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpoch) {
    std::time_t epoch = 0;
    std::tm result;
    ASSERT_NE(safe_gmtime(&epoch, &result), nullptr);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, ParseDateIsUtcMidnight) {
    auto parsed = parse_date("2024-01-02");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(to_unix_seconds(*parsed), 1704153600);
    EXPECT_EQ(format_date(*parsed), "2024-01-02");
}

TEST_F(TimeUtilsTest, ParseDateRejectsMalformedAndImpossibleDates) {
    EXPECT_FALSE(parse_date("").has_value());
    EXPECT_FALSE(parse_date("2024/01/02").has_value());
    EXPECT_FALSE(parse_date("2024-13-01").has_value());
    EXPECT_FALSE(parse_date("2023-02-29").has_value());
    EXPECT_TRUE(parse_date("2024-02-29").has_value());
}

TEST_F(TimeUtilsTest, ParseTimestampAcceptsSpaceOrT) {
    auto spaced = parse_timestamp("2024-01-02 14:30:05");
    auto iso = parse_timestamp("2024-01-02T14:30:05");
    ASSERT_TRUE(spaced.has_value());
    ASSERT_TRUE(iso.has_value());
    EXPECT_EQ(*spaced, *iso);
    EXPECT_EQ(format_timestamp(*spaced), "2024-01-02 14:30:05");
}

TEST_F(TimeUtilsTest, FloorToDay) {
    auto ts = *parse_timestamp("2024-03-15 21:59:59");
    EXPECT_EQ(format_timestamp(floor_to_day(ts)), "2024-03-15 00:00:00");

    auto midnight = *parse_date("2024-03-15");
    EXPECT_EQ(floor_to_day(midnight), midnight);

    // Before the epoch the floor still moves backwards
    auto before_epoch = from_unix_seconds(-1);
    EXPECT_EQ(to_unix_seconds(floor_to_day(before_epoch)), -86400);
}

TEST_F(TimeUtilsTest, UnixSecondsRoundTrip) {
    EXPECT_EQ(to_unix_seconds(from_unix_seconds(1700000000)), 1700000000);
}

TEST_F(TimeUtilsTest, ManualClockOnlyMovesWhenTold) {
    ManualClock clock(*parse_date("2024-01-02"));
    auto start = clock.now();
    EXPECT_EQ(clock.now(), start);

    clock.advance(std::chrono::minutes(90));
    EXPECT_EQ(format_timestamp(clock.now()), "2024-01-02 01:30:00");

    clock.set(*parse_date("2025-06-01"));
    EXPECT_EQ(format_date(clock.now()), "2025-06-01");
}
