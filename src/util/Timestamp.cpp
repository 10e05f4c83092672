#include "util/Timestamp.hpp"
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <ctime>

using namespace std::chrono;

namespace windwatch::util {

static bool read_digits(std::string_view s, size_t& pos, size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (size_t i = 0; i < n; ++i) {
    char c = s[pos + i];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  pos += n;
  return true;
}

static bool expect(std::string_view s, size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

static int days_in_month(int year, int month) {
  static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2) {
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return leap ? 29 : 28;
  }
  return days[month - 1];
}

static std::tm utc_tm(SysTime t) {
  std::time_t tt = system_clock::to_time_t(floor<seconds>(t));
  std::tm tm{};
  ::gmtime_r(&tt, &tm);
  return tm;
}

std::optional<SysTime> parse_rfc3339(std::string_view s) {
  size_t pos = 0;
  int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
  if (!read_digits(s, pos, 4, year) || !expect(s, pos, '-') ||
      !read_digits(s, pos, 2, mon) || !expect(s, pos, '-') ||
      !read_digits(s, pos, 2, day))
    return std::nullopt;
  if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ')) return std::nullopt;
  ++pos;
  if (!read_digits(s, pos, 2, hour) || !expect(s, pos, ':') ||
      !read_digits(s, pos, 2, min) || !expect(s, pos, ':') ||
      !read_digits(s, pos, 2, sec))
    return std::nullopt;
  if (mon < 1 || mon > 12 || day < 1 || day > days_in_month(year, mon)) return std::nullopt;
  if (hour > 23 || min > 59 || sec > 60) return std::nullopt;

  int millis = 0;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (digits < 3) millis = millis * 10 + (s[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0) return std::nullopt;
    for (int d = digits; d < 3; ++d) millis *= 10;
  }

  int offset_min = 0;
  if (pos < s.size()) {
    char c = s[pos++];
    if (c == '+' || c == '-') {
      int oh = 0, om = 0;
      if (!read_digits(s, pos, 2, oh) || !expect(s, pos, ':') || !read_digits(s, pos, 2, om))
        return std::nullopt;
      if (oh > 23 || om > 59) return std::nullopt;
      offset_min = (oh * 60 + om) * (c == '-' ? -1 : 1);
    } else if (c != 'Z' && c != 'z') {
      return std::nullopt;
    }
  }
  if (pos != s.size()) return std::nullopt;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = mon - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = min;
  tm.tm_sec = sec;
  std::time_t secs = ::timegm(&tm);
  return system_clock::from_time_t(secs) + milliseconds(millis) - minutes(offset_min);
}

std::string format_rfc3339_utc(SysTime t) {
  auto ms = duration_cast<milliseconds>(t - floor<seconds>(t)).count();
  std::tm tm = utc_tm(t);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  return buf;
}

SysTime months_before(SysTime t, int months) {
  auto sub = t - floor<seconds>(t);
  std::tm tm = utc_tm(t);
  int total = tm.tm_year * 12 + tm.tm_mon - months;
  int y = total / 12, m = total % 12;
  if (m < 0) { m += 12; y -= 1; }
  tm.tm_year = y;
  tm.tm_mon = m;
  tm.tm_mday = std::min(tm.tm_mday, days_in_month(y + 1900, m + 1));
  return system_clock::from_time_t(::timegm(&tm)) + sub;
}

std::string format_clock_utc(SysTime t) {
  std::tm tm = utc_tm(t);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

std::string format_date_utc(SysTime t) {
  std::tm tm = utc_tm(t);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d.%02d.%04d", tm.tm_mday, tm.tm_mon + 1, tm.tm_year + 1900);
  return buf;
}

std::string format_countdown(milliseconds d) {
  if (d < milliseconds::zero()) d = milliseconds::zero();
  long long total = duration_cast<seconds>(d).count();
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld.%02lld",
                total / 3600, (total % 3600) / 60, total % 60);
  return buf;
}

std::string format_float(float v) {
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
  if (ec != std::errc{}) return "0";
  return std::string(buf, ptr);
}

} // namespace windwatch::util
