#include "minitest.hpp"
#include "util/Timestamp.hpp"
#include <chrono>

using namespace windwatch::util;
using namespace std::chrono;

TEST(rfc3339_parses_zulu_and_offsets) {
  auto z = parse_rfc3339("2024-01-01T00:00:00Z");
  auto ms = parse_rfc3339("2024-01-01T00:00:00.000Z");
  auto plus = parse_rfc3339("2024-01-01T02:00:00+02:00");
  auto minus = parse_rfc3339("2023-12-31T19:30:00-04:30");
  ASSERT_TRUE(z && ms && plus && minus);
  ASSERT_TRUE(*z == *ms);
  ASSERT_TRUE(*z == *plus);
  ASSERT_TRUE(*z == *minus);
  ASSERT_EQ(system_clock::to_time_t(*z), static_cast<std::time_t>(1704067200));
}

TEST(rfc3339_keeps_milliseconds) {
  auto a = parse_rfc3339("2024-01-01T00:00:00.25Z");
  auto b = parse_rfc3339("2024-01-01T00:00:00Z");
  ASSERT_TRUE(a && b);
  ASSERT_TRUE(*a - *b == milliseconds(250));
}

TEST(rfc3339_without_offset_is_utc) {
  ASSERT_TRUE(parse_rfc3339("2024-06-01T12:00:00") == parse_rfc3339("2024-06-01T12:00:00Z"));
}

TEST(rfc3339_rejects_garbage) {
  ASSERT_TRUE(!parse_rfc3339(""));
  ASSERT_TRUE(!parse_rfc3339("2024-01-01"));
  ASSERT_TRUE(!parse_rfc3339("2024-13-01T00:00:00Z"));
  ASSERT_TRUE(!parse_rfc3339("2023-02-29T00:00:00Z"));
  ASSERT_TRUE(!parse_rfc3339("2024-01-01T00:00:00Zjunk"));
  ASSERT_TRUE(!parse_rfc3339("2024-01-01T00:00:00."));
}

TEST(rfc3339_formats_round_trip) {
  auto t = parse_rfc3339("2024-02-29T23:59:58.123Z").value();
  ASSERT_EQ(format_rfc3339_utc(t), std::string("2024-02-29T23:59:58.123Z"));
}

TEST(months_before_clamps_day) {
  auto t = parse_rfc3339("2024-03-31T08:15:00Z").value();
  ASSERT_EQ(format_rfc3339_utc(months_before(t, 1)), std::string("2024-02-29T08:15:00.000Z"));
  auto jan = parse_rfc3339("2024-01-15T00:00:00Z").value();
  ASSERT_EQ(format_rfc3339_utc(months_before(jan, 1)), std::string("2023-12-15T00:00:00.000Z"));
}

TEST(clock_and_date_formats) {
  auto t = parse_rfc3339("2024-07-04T09:05:03.900Z").value();
  ASSERT_EQ(format_clock_utc(t), std::string("09:05:03"));
  ASSERT_EQ(format_date_utc(t), std::string("04.07.2024"));
}

TEST(countdown_format) {
  ASSERT_EQ(format_countdown(milliseconds(180000)), std::string("00:03.00"));
  ASSERT_EQ(format_countdown(milliseconds(150999)), std::string("00:02.30"));
  ASSERT_EQ(format_countdown(milliseconds(3723000)), std::string("01:02.03"));
  ASSERT_EQ(format_countdown(milliseconds(-1)), std::string("00:00.00"));
}

TEST(float_format_is_shortest_fixed) {
  ASSERT_EQ(format_float(25.0f), std::string("25"));
  ASSERT_EQ(format_float(12.5f), std::string("12.5"));
  ASSERT_EQ(format_float(0.0f), std::string("0"));
}
