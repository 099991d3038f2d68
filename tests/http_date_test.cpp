#include <gtest/gtest.h>

#include "http/date.hpp"

#include <ctime>
#include <stdexcept>

namespace
{

std::time_t seconds(const char* date)
{
    return std::chrono::system_clock::to_time_t(http::parse_date(date));
}

} // namespace

TEST(http_date, accepts_all_three_formats)
{
    EXPECT_EQ(seconds("Sun, 06 Nov 1994 08:49:37 GMT"), 784111777);
    EXPECT_EQ(seconds("Sunday, 06-Nov-94 08:49:37 GMT"), 784111777);
    EXPECT_EQ(seconds("Sun Nov  6 08:49:37 1994"), 784111777);
}

TEST(http_date, rfc850_zone_is_read_as_utc)
{
    EXPECT_EQ(seconds("Sunday, 06-Nov-94 08:49:37 PST"), 784111777);
}

TEST(http_date, rejects_other_formats)
{
    EXPECT_THROW(http::parse_date(""), std::invalid_argument);
    EXPECT_THROW(http::parse_date("1994-11-06T08:49:37Z"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Sun, 06 Nov 1994 08:49:37"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Sun, 06 Nov 1994 08:49:37 GMT trailing"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Sun, 32 Nov 1994 08:49:37 GMT"), std::invalid_argument);
}

TEST(http_date, formats_as_imf_fixdate)
{
    EXPECT_EQ(http::format_date(std::chrono::system_clock::from_time_t(784111777)), "Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST(http_date, asctime_day_may_be_zero_padded)
{
    EXPECT_EQ(seconds("Sun Nov 06 08:49:37 1994"), 784111777);
}

TEST(http_date, impossible_calendar_dates_fail)
{
    EXPECT_THROW(http::parse_date("Sun, 31 Feb 1994 08:49:37 GMT"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Sun, 06 Nov 1994 08:49:60 GMT"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Wed, 29 Feb 1995 00:00:00 GMT"), std::invalid_argument);
    EXPECT_EQ(seconds("Thu, 29 Feb 1996 00:00:00 GMT"), 825552000);
}

TEST(http_date, fixdate_layout_is_strict)
{
    EXPECT_THROW(http::parse_date("Sunday, 06 Nov 1994 08:49:37 GMT"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Sun, 6 Nov 1994 08:49:37 GMT"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Sun,06 Nov 1994 08:49:37GMT"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Sun,  06 Nov 1994 08:49:37 GMT"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Sun, 06 Nov 94 08:49:37 GMT"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Sun, 06 Nov 1994 08:49:37 UTC"), std::invalid_argument);
}

TEST(http_date, rfc850_needs_full_weekday_and_zone)
{
    EXPECT_THROW(http::parse_date("Sun, 06-Nov-94 08:49:37 GMT"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Sunday, 06-Nov-94 08:49:37"), std::invalid_argument);
    EXPECT_THROW(http::parse_date("Sunday, 6-Nov-94 08:49:37 GMT"), std::invalid_argument);
}
