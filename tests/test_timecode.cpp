// Timecode parsing and formatting.

#include <gtest/gtest.h>

#include "reel/core/util/timecode.hpp"

namespace reel {
namespace {

TEST(TimecodeTest, ParsesMatchClockForms) {
  auto mmss = parse_match_clock("45:30");
  ASSERT_TRUE(mmss.ok());
  EXPECT_DOUBLE_EQ(*mmss, 2730.0);

  auto hhmmss = parse_match_clock("1:02:03");
  ASSERT_TRUE(hhmmss.ok());
  EXPECT_DOUBLE_EQ(*hhmmss, 3723.0);

  auto plain = parse_match_clock("83");
  ASSERT_TRUE(plain.ok());
  EXPECT_DOUBLE_EQ(*plain, 83.0);

  auto frac = parse_match_clock(" 12.5 ");
  ASSERT_TRUE(frac.ok());
  EXPECT_DOUBLE_EQ(*frac, 12.5);
}

TEST(TimecodeTest, RejectsBadMatchClocks) {
  for (const char* bad : {"", "ab:cd", "-5", "1:2:3:4", "12:", "99999999999:00"}) {
    auto r = parse_match_clock(bad);
    EXPECT_FALSE(r.ok()) << bad;
    EXPECT_EQ(r.status().code(), Status::Code::kParseError) << bad;
  }
}

TEST(TimecodeTest, ParsesTimestamps) {
  auto hms = parse_timestamp("00:05:00");
  ASSERT_TRUE(hms.ok());
  EXPECT_DOUBLE_EQ(*hms, 300.0);

  auto ms = parse_timestamp("01:00:00.250");
  ASSERT_TRUE(ms.ok());
  EXPECT_DOUBLE_EQ(*ms, 3600.25);

  auto secs = parse_timestamp("42.5");
  ASSERT_TRUE(secs.ok());
  EXPECT_DOUBLE_EQ(*secs, 42.5);

  EXPECT_FALSE(parse_timestamp("00:05").ok());
  EXPECT_FALSE(parse_timestamp("00:00:01.x").ok());
  EXPECT_FALSE(parse_timestamp("soon").ok());
}

TEST(TimecodeTest, FormatsTimestamps) {
  EXPECT_EQ(seconds_to_timestamp(3723.456), "01:02:03.456");
  EXPECT_EQ(seconds_to_timestamp(0.0), "00:00:00.000");
  EXPECT_EQ(seconds_to_timestamp(-3.0), "00:00:00.000");
  // Rounds before splitting into fields.
  EXPECT_EQ(seconds_to_timestamp(59.9996), "00:01:00.000");
}

TEST(TimecodeTest, FormatsClock) {
  EXPECT_EQ(seconds_to_clock(83.9), "01:23");
  EXPECT_EQ(seconds_to_clock(6000.0), "100:00");
}

TEST(TimecodeTest, ParsesScores) {
  auto s = parse_score("2-1");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(*s, (MatchScore{2, 1}));

  auto spaced = parse_score(" 3 - 0 ");
  ASSERT_TRUE(spaced.has_value());
  EXPECT_EQ(*spaced, (MatchScore{3, 0}));

  EXPECT_FALSE(parse_score("2:1").has_value());
  EXPECT_FALSE(parse_score("two-one").has_value());
  EXPECT_FALSE(parse_score("-1-2").has_value());
  EXPECT_FALSE(parse_score("").has_value());
}

TEST(TimecodeTest, ComputesAbsoluteTimePerHalf) {
  auto first = compute_absolute_time(1, "10:00", 100.0);
  ASSERT_TRUE(first.ok());
  EXPECT_DOUBLE_EQ(*first, 700.0);

  // 100 + 49 min + 15 min + 5 min
  auto second = compute_absolute_time(2, "05:00", 100.0);
  ASSERT_TRUE(second.ok());
  EXPECT_DOUBLE_EQ(*second, 4240.0);

  MatchTiming short_break;
  short_break.first_half_duration_s = 2700.0;
  short_break.half_time_duration_s = 600.0;
  auto custom = compute_absolute_time(2, "00:30", 0.0, short_break);
  ASSERT_TRUE(custom.ok());
  EXPECT_DOUBLE_EQ(*custom, 3330.0);

  auto extra = compute_absolute_time(3, "01:00", 50.0);
  ASSERT_TRUE(extra.ok());
  EXPECT_DOUBLE_EQ(*extra, 110.0);

  EXPECT_FALSE(compute_absolute_time(1, "late", 0.0).ok());
}

}  // namespace
}  // namespace reel
