/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * ISO-8601 timestamp tests
 */

#include "util/time_format.hpp"

#include <gtest/gtest.h>

#include <ctime>

using namespace std::chrono;
using mailrlm::util::format_iso8601;
using mailrlm::util::parse_iso8601;

namespace {

mailrlm::util::Timestamp epoch_plus(seconds s) {
    return mailrlm::util::Timestamp(s);
}

} // namespace

TEST(TimeFormatTest, FormatsUtcWithMicroseconds) {
    auto tp = epoch_plus(seconds(1700000000)) + microseconds(123456);
    EXPECT_EQ(format_iso8601(tp), "2023-11-14T22:13:20.123456Z");
}

TEST(TimeFormatTest, ParsesOwnOutput) {
    auto tp = epoch_plus(seconds(1700000000)) + microseconds(42);
    auto parsed = parse_iso8601(format_iso8601(tp));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(time_point_cast<microseconds>(*parsed), time_point_cast<microseconds>(tp));
}

TEST(TimeFormatTest, NaiveTimestampIsLocalTime) {
    std::tm local{};
    local.tm_year = 2023 - 1900;
    local.tm_mon = 10;
    local.tm_mday = 14;
    local.tm_hour = 22;
    local.tm_min = 13;
    local.tm_sec = 20;
    local.tm_isdst = -1;
    auto expected = system_clock::from_time_t(std::mktime(&local));

    auto parsed = parse_iso8601("2023-11-14T22:13:20.123456");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(time_point_cast<seconds>(*parsed), expected);
    EXPECT_EQ(*parsed - time_point_cast<seconds>(*parsed), microseconds(123456));
}

TEST(TimeFormatTest, ExplicitUtcIgnoresLocalZone) {
    auto parsed = parse_iso8601("2023-11-14T22:13:20Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, epoch_plus(seconds(1700000000)));
}

TEST(TimeFormatTest, AppliesZoneOffset) {
    auto parsed = parse_iso8601("2023-11-15T00:13:20+02:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, epoch_plus(seconds(1700000000)));
}

TEST(TimeFormatTest, AcceptsSpaceSeparator) {
    EXPECT_TRUE(parse_iso8601("2024-01-02 03:04:05").has_value());
}

TEST(TimeFormatTest, RejectsMalformedInput) {
    EXPECT_FALSE(parse_iso8601("").has_value());
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601("2024-13-01T00:00:00").has_value());
    EXPECT_FALSE(parse_iso8601("2024-01-01T00:00:00.").has_value());
    EXPECT_FALSE(parse_iso8601("2024-01-01T00:00:00Zjunk").has_value());
}
