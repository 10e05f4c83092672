#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace windwatch::util {

using SysTime = std::chrono::system_clock::time_point;

// Parse an RFC 3339 timestamp ("2024-01-01T00:00:00Z", "...T00:00:00.000+02:00").
// Fractional seconds are kept to millisecond precision. A missing offset is read as UTC.
[[nodiscard]] std::optional<SysTime> parse_rfc3339(std::string_view s);

// "YYYY-MM-DDTHH:MM:SS.mmmZ" in UTC; parse_rfc3339 reads it back unchanged.
[[nodiscard]] std::string format_rfc3339_utc(SysTime t);

// Same wall-clock instant `months` calendar months earlier. The day is clamped to
// the length of the target month (Mar 31 -> Feb 29 in a leap year).
[[nodiscard]] SysTime months_before(SysTime t, int months);

[[nodiscard]] std::string format_clock_utc(SysTime t);  // HH:MM:SS
[[nodiscard]] std::string format_date_utc(SysTime t);   // dd.MM.yyyy

// Countdown as HH:MM.SS, truncated to whole seconds. Negative durations show as zero.
[[nodiscard]] std::string format_countdown(std::chrono::milliseconds d);

// Shortest round-trip fixed notation ("25", "12.5").
[[nodiscard]] std::string format_float(float v);

} // namespace windwatch::util
