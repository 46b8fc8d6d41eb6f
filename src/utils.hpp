#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <mw/utils.hpp>

// Parse an ISO-8601 UTC timestamp like “2025-01-15T10:00:00Z”, with an
// optional fraction of up to 9 digits before the “Z”. The UTC
// designator is mandatory; numeric offsets are not accepted. Digits
// beyond microseconds are dropped.
std::optional<mw::Time> parseTimestamp(std::string_view s);

// Render in the canonical form “YYYY-MM-DDTHH:MM:SSZ”, with a
// 6-digit fraction only when the sub-second part is not zero.
std::string formatTimestamp(const mw::Time& t);

int64_t timeToMicros(const mw::Time& t);
mw::Time microsToTime(int64_t us);

// “+” followed by at least one ASCII digit, nothing else.
bool isE164(std::string_view s);

// Number of code points in a UTF-8 string. The input is assumed to be
// valid UTF-8.
size_t codePointCount(std::string_view s);

// Escape “%”, “_” and “\” so that the result matches literally inside a
// LIKE pattern declared with ESCAPE '\'.
std::string escapeLikePattern(std::string_view s);
