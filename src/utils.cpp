#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "utils.hpp"

namespace {

bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

// Parse exactly `s.size()` digits. Caller makes sure they are digits.
int digitsToInt(std::string_view s)
{
    int result = 0;
    for(char c : s)
    {
        result = result * 10 + (c - '0');
    }
    return result;
}

} // namespace

std::optional<mw::Time> parseTimestamp(std::string_view s)
{
    // YYYY-MM-DDTHH:MM:SS is 19 characters, plus at least the “Z”.
    if(s.size() < 20)
    {
        return std::nullopt;
    }
    constexpr size_t digit_positions[] = {0, 1, 2, 3, 5, 6, 8, 9, 11, 12,
                                          14, 15, 17, 18};
    for(size_t i : digit_positions)
    {
        if(!isDigit(s[i]))
        {
            return std::nullopt;
        }
    }
    if(s[4] != '-' || s[7] != '-' || (s[10] != 'T' && s[10] != 't') ||
       s[13] != ':' || s[16] != ':')
    {
        return std::nullopt;
    }

    int64_t micros = 0;
    size_t pos = 19;
    if(s[pos] == '.')
    {
        pos++;
        size_t frac_begin = pos;
        while(pos < s.size() && isDigit(s[pos]))
        {
            pos++;
        }
        size_t frac_len = pos - frac_begin;
        if(frac_len == 0 || frac_len > 9)
        {
            return std::nullopt;
        }
        for(size_t i = 0; i < 6; i++)
        {
            micros *= 10;
            if(i < frac_len)
            {
                micros += s[frac_begin + i] - '0';
            }
        }
    }
    if(pos + 1 != s.size() || (s[pos] != 'Z' && s[pos] != 'z'))
    {
        return std::nullopt;
    }

    std::chrono::year_month_day ymd{
        std::chrono::year(digitsToInt(s.substr(0, 4))),
        std::chrono::month(static_cast<unsigned>(digitsToInt(s.substr(5, 2)))),
        std::chrono::day(static_cast<unsigned>(digitsToInt(s.substr(8, 2))))};
    if(!ymd.ok())
    {
        return std::nullopt;
    }
    int hour = digitsToInt(s.substr(11, 2));
    int minute = digitsToInt(s.substr(14, 2));
    int second = digitsToInt(s.substr(17, 2));
    if(hour > 23 || minute > 59 || second > 59)
    {
        return std::nullopt;
    }

    std::chrono::sys_time<std::chrono::microseconds> t =
        std::chrono::sys_days(ymd) + std::chrono::hours(hour) +
        std::chrono::minutes(minute) + std::chrono::seconds(second) +
        std::chrono::microseconds(micros);
    // mw::Time may not span the whole 0000-9999 range.
    if(t < std::chrono::ceil<std::chrono::microseconds>(mw::Time::min()) ||
       t > std::chrono::floor<std::chrono::microseconds>(mw::Time::max()))
    {
        return std::nullopt;
    }
    return std::chrono::time_point_cast<mw::Time::duration>(t);
}

std::string formatTimestamp(const mw::Time& t)
{
    auto us = std::chrono::floor<std::chrono::microseconds>(t);
    auto day = std::chrono::floor<std::chrono::days>(us);
    std::chrono::year_month_day ymd(day);
    std::chrono::hh_mm_ss hms(us - day);

    std::string result = std::format(
        "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
        hms.hours().count(), hms.minutes().count(), hms.seconds().count());
    if(hms.subseconds().count() != 0)
    {
        result += std::format(".{:06}", hms.subseconds().count());
    }
    result += "Z";
    return result;
}

int64_t timeToMicros(const mw::Time& t)
{
    return std::chrono::duration_cast<std::chrono::microseconds>(
        t.time_since_epoch()).count();
}

mw::Time microsToTime(int64_t us)
{
    return mw::Time(std::chrono::duration_cast<mw::Time::duration>(
        std::chrono::microseconds(us)));
}

bool isE164(std::string_view s)
{
    if(s.size() < 2 || s[0] != '+')
    {
        return false;
    }
    for(char c : s.substr(1))
    {
        if(!isDigit(c))
        {
            return false;
        }
    }
    return true;
}

size_t codePointCount(std::string_view s)
{
    size_t count = 0;
    for(char c : s)
    {
        // Continuation bytes look like 10xxxxxx.
        if((static_cast<unsigned char>(c) & 0xC0) != 0x80)
        {
            count++;
        }
    }
    return count;
}

std::string escapeLikePattern(std::string_view s)
{
    std::string result;
    result.reserve(s.size());
    for(char c : s)
    {
        if(c == '%' || c == '_' || c == '\\')
        {
            result += '\\';
        }
        result += c;
    }
    return result;
}
