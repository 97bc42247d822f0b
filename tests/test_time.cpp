#include <gtest/gtest.h>
#include <stexporter/time_utils.hpp>

using stexporter::parse_iso8601_ms;
using stexporter::to_time_t_seconds;

TEST(TimeConv, SecondsPassThrough) {
  EXPECT_EQ(to_time_t_seconds(1'730'000'000), 1'730'000'000);
}

TEST(TimeConv, MillisToSeconds) {
  EXPECT_EQ(to_time_t_seconds(1'730'000'000'000), 1'730'000'000);
}

TEST(TimeConv, BoundaryNear10B) {
  // ровно 10_000_000_000 считаем секундами
  EXPECT_EQ(to_time_t_seconds(10'000'000'000LL), 10'000'000'000LL);
  // +1: уже эвристика миллисекунд
  EXPECT_EQ(to_time_t_seconds(10'000'000'001LL), 10'000'000'001LL / 1000);
}

TEST(Iso8601, EpochAndFraction) {
  EXPECT_EQ(parse_iso8601_ms("1970-01-01T00:00:00Z"), 0);
  EXPECT_EQ(parse_iso8601_ms("1970-01-01T00:00:01.5Z"), 1500);
  EXPECT_EQ(parse_iso8601_ms("2024-03-01T12:34:56.789Z"), 1709296496789LL);
}

TEST(Iso8601, OffsetIsApplied) {
  // 12:00 в +02:00 == 10:00 UTC
  EXPECT_EQ(parse_iso8601_ms("2024-03-01T12:00:00+02:00"),
            parse_iso8601_ms("2024-03-01T10:00:00Z"));
}

TEST(Iso8601, RejectsGarbage) {
  EXPECT_FALSE(parse_iso8601_ms("").has_value());
  EXPECT_FALSE(parse_iso8601_ms("yesterday").has_value());
  EXPECT_FALSE(parse_iso8601_ms("2024-13-01T00:00:00Z").has_value());
  EXPECT_FALSE(parse_iso8601_ms("2024-03-01T00:00:00Zjunk").has_value());
}
