// iso8601.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace lingo {

using Timestamp = std::chrono::system_clock::time_point;

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day);

// "YYYY-MM-DDTHH:MM:SS.mmmZ", always UTC, millisecond precision.
std::string format_iso8601(Timestamp timestamp);

// Accepts an optional fractional part and either "Z" or a "+HH:MM"/"-HH:MM"
// offset. Throws std::invalid_argument on anything else, including dates
// the system clock cannot represent.
Timestamp parse_iso8601(const std::string& text);

} // namespace lingo
