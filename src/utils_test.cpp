#include <chrono>
#include <ratio>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "utils.hpp"

TEST(Utils, CanParseTimestamp)
{
    auto t = parseTimestamp("2025-01-15T10:00:00Z");
    ASSERT_TRUE(t.has_value());
    mw::Time expected = std::chrono::sys_days(std::chrono::year_month_day(
        std::chrono::year(2025), std::chrono::January, std::chrono::day(15)))
        + std::chrono::hours(10);
    EXPECT_EQ(*t, expected);
}

TEST(Utils, CanParseTimestampWithFraction)
{
    auto t = parseTimestamp("2025-01-15T10:00:00.25Z");
    ASSERT_TRUE(t.has_value());
    auto base = parseTimestamp("2025-01-15T10:00:00Z");
    EXPECT_EQ(*t - *base, std::chrono::milliseconds(250));

    // Nanoseconds are truncated to microseconds.
    auto fine = parseTimestamp("2025-01-15T10:00:00.123456789Z");
    ASSERT_TRUE(fine.has_value());
    EXPECT_EQ(*fine - *base, std::chrono::microseconds(123456));
}

TEST(Utils, RejectsTimestampWithoutUTCDesignator)
{
    EXPECT_FALSE(parseTimestamp("2025-01-15T10:00:00").has_value());
    EXPECT_FALSE(parseTimestamp("2025-01-15T10:00:00+00:00").has_value());
    EXPECT_FALSE(parseTimestamp("2025-01-15T10:00:00+05:30").has_value());
    EXPECT_FALSE(parseTimestamp("2025-01-15 10:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2025-1-15T10:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2025-02-30T10:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2025-01-15T24:00:00Z").has_value());
    EXPECT_FALSE(parseTimestamp("2025-01-15T10:00:00.Z").has_value());
    EXPECT_FALSE(parseTimestamp("2025-01-15T10:00:00ZZ").has_value());
    EXPECT_FALSE(parseTimestamp("").has_value());
}

TEST(Utils, RejectsTimestampOutsideClockRange)
{
    // A nanosecond clock ends in 1677 and 2262.
    constexpr bool nano_clock =
        std::ratio_less_equal_v<mw::Time::period, std::nano>;
    auto now = parseTimestamp("2025-01-15T10:00:00Z");
    ASSERT_TRUE(now.has_value());
    for(const char* s : {"0000-01-01T00:00:00Z", "1600-01-01T00:00:00Z",
                         "2300-01-01T00:00:00Z", "9999-12-31T23:59:59Z"})
    {
        auto t = parseTimestamp(s);
        if(nano_clock)
        {
            EXPECT_FALSE(t.has_value()) << s;
        }
        if(t.has_value())
        {
            EXPECT_EQ(formatTimestamp(*t), s);
            EXPECT_EQ(*t < *now, std::string_view(s) < "2025") << s;
        }
    }

    for(const char* s : {"1700-01-01T00:00:00Z", "2200-12-31T23:59:59Z"})
    {
        auto t = parseTimestamp(s);
        ASSERT_TRUE(t.has_value()) << s;
        EXPECT_EQ(formatTimestamp(*t), s);
    }
}

TEST(Utils, CanFormatTimestamp)
{
    EXPECT_EQ(formatTimestamp(*parseTimestamp("2025-01-15T10:00:00Z")),
              "2025-01-15T10:00:00Z");
    EXPECT_EQ(formatTimestamp(*parseTimestamp("1999-12-31T23:59:59.5Z")),
              "1999-12-31T23:59:59.500000Z");
}

TEST(Utils, MicrosConversionKeepsPrecision)
{
    mw::Time t = *parseTimestamp("2025-01-15T10:00:00.000001Z");
    EXPECT_EQ(microsToTime(timeToMicros(t)), t);
    EXPECT_EQ(timeToMicros(microsToTime(0)), 0);
}

TEST(Utils, CanCheckE164)
{
    EXPECT_TRUE(isE164("+14155550100"));
    EXPECT_TRUE(isE164("+1"));
    EXPECT_FALSE(isE164("+"));
    EXPECT_FALSE(isE164("14155550100"));
    EXPECT_FALSE(isE164("+1 415 555"));
    EXPECT_FALSE(isE164("+1-415"));
    EXPECT_FALSE(isE164("++1"));
    EXPECT_FALSE(isE164(""));
}

TEST(Utils, CanCountCodePoints)
{
    EXPECT_EQ(codePointCount(""), 0);
    EXPECT_EQ(codePointCount("abc"), 3);
    // “é” is 2 bytes, “你” is 3 bytes, and the emoji is 4 bytes.
    EXPECT_EQ(codePointCount("\xc3\xa9"), 1);
    EXPECT_EQ(codePointCount("\xe4\xbd\xa0"), 1);
    EXPECT_EQ(codePointCount("\xf0\x9f\x98\x80 hi"), 4);
}

TEST(Utils, CanEscapeLikePattern)
{
    EXPECT_EQ(escapeLikePattern("hi"), "hi");
    EXPECT_EQ(escapeLikePattern("50%_off\\"), "50\\%\\_off\\\\");
}
