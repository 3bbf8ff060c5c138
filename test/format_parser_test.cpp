#include "csvexpr/format_parser.h"

#include <gtest/gtest.h>

using namespace csvexpr;

// ============================================================================
// ParsedDateTime epoch conversion tests
// ============================================================================

class ParsedDateTimeTest : public ::testing::Test {};

TEST_F(ParsedDateTimeTest, UnixEpoch) {
  ParsedDateTime dt{1970, 1, 1, 0, 0, 0, 0, 0};
  EXPECT_EQ(dt.to_epoch_days(), 0);
  EXPECT_EQ(dt.to_epoch_micros(), 0);
}

TEST_F(ParsedDateTimeTest, Y2K) {
  ParsedDateTime dt{2000, 1, 1, 0, 0, 0, 0, 0};
  EXPECT_EQ(dt.to_epoch_days(), 10957);
  EXPECT_EQ(dt.to_epoch_micros(), 10957LL * 86400LL * 1000000LL);
}

TEST_F(ParsedDateTimeTest, LeapYearFeb29) {
  ParsedDateTime dt{2024, 2, 29, 0, 0, 0, 0, 0};
  EXPECT_EQ(dt.to_epoch_days(), 19782);
}

TEST_F(ParsedDateTimeTest, DateBeforeEpoch) {
  ParsedDateTime dt{1969, 12, 31, 0, 0, 0, 0, 0};
  EXPECT_EQ(dt.to_epoch_days(), -1);
}

TEST_F(ParsedDateTimeTest, Microseconds) {
  ParsedDateTime dt{1970, 1, 1, 0, 0, 1, 500000, 0};
  EXPECT_EQ(dt.to_epoch_micros(), 1500000LL);
}

TEST_F(ParsedDateTimeTest, TimezoneOffset) {
  ParsedDateTime dt{2024, 1, 1, 0, 0, 0, 0, 330};
  int64_t base = 19723LL * 86400LL * 1000000LL;
  int64_t offset = 330LL * 60LL * 1000000LL;
  EXPECT_EQ(dt.to_epoch_micros(), base - offset);
}

TEST_F(ParsedDateTimeTest, FromEpochDays) {
  ParsedDateTime dt = ParsedDateTime::from_epoch_days(19782);
  EXPECT_EQ(dt.year, 2024);
  EXPECT_EQ(dt.month, 2);
  EXPECT_EQ(dt.day, 29);

  ParsedDateTime before = ParsedDateTime::from_epoch_days(-1);
  EXPECT_EQ(before.year, 1969);
  EXPECT_EQ(before.month, 12);
  EXPECT_EQ(before.day, 31);
}

TEST_F(ParsedDateTimeTest, FromEpochMicrosBeforeEpoch) {
  // One microsecond before 1970-01-01T00:00:00
  ParsedDateTime dt = ParsedDateTime::from_epoch_micros(-1);
  EXPECT_EQ(dt.year, 1969);
  EXPECT_EQ(dt.month, 12);
  EXPECT_EQ(dt.day, 31);
  EXPECT_EQ(dt.hour, 23);
  EXPECT_EQ(dt.minute, 59);
  EXPECT_EQ(dt.second, 59);
  EXPECT_EQ(dt.microsecond, 999999);
}

TEST_F(ParsedDateTimeTest, DayOfWeek) {
  EXPECT_EQ((ParsedDateTime{1970, 1, 1}).day_of_week(), 4);  // Thursday
  EXPECT_EQ((ParsedDateTime{2024, 3, 15}).day_of_week(), 5); // Friday
  EXPECT_EQ((ParsedDateTime{1969, 12, 28}).day_of_week(), 0); // Sunday
}

// ============================================================================
// FormatLocale tests
// ============================================================================

TEST(FormatLocaleTest, EnglishNames) {
  const FormatLocale& locale = FormatLocale::english();
  EXPECT_EQ(locale.month_names[0], "January");
  EXPECT_EQ(locale.month_abbrev[11], "Dec");
  EXPECT_EQ(locale.day_names[6], "Saturday");
  EXPECT_EQ(locale.day_abbrev[0], "Sun");
  EXPECT_EQ(locale.am, "AM");
  EXPECT_EQ(locale.pm, "PM");
}

// ============================================================================
// FormatParser tests
// ============================================================================

class FormatParserTest : public ::testing::Test {};

TEST_F(FormatParserTest, ISO8601Date) {
  FormatParser parser("%Y-%m-%d");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("2024-03-15", dt));
  EXPECT_EQ(dt.year, 2024);
  EXPECT_EQ(dt.month, 3);
  EXPECT_EQ(dt.day, 15);
}

TEST_F(FormatParserTest, SingleDigitMonthAndDay) {
  FormatParser parser("%Y-%m-%d");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("2024-3-5", dt));
  EXPECT_EQ(dt.month, 3);
  EXPECT_EQ(dt.day, 5);
}

TEST_F(FormatParserTest, TwoDigitYearPivotsIntoThisCentury) {
  FormatParser parser("%m/%d/%y");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("03/15/24", dt));
  EXPECT_EQ(dt.year, 2024);

  ASSERT_TRUE(parser.parse("03/15/99", dt));
  EXPECT_EQ(dt.year, 2099);
}

TEST_F(FormatParserTest, MonthAndDayNames) {
  FormatParser parser("%a, %d %b %Y");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("Fri, 15 Mar 2024", dt));
  EXPECT_EQ(dt.day, 15);
  EXPECT_EQ(dt.month, 3);

  FormatParser full("%A, %B %d, %Y");
  ASSERT_TRUE(full.parse("Friday, March 15, 2024", dt));
  EXPECT_EQ(dt.month, 3);
}

TEST_F(FormatParserTest, CaseInsensitiveNames) {
  FormatParser parser("%d-%b-%Y");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("15-mar-2024", dt));
  EXPECT_EQ(dt.month, 3);
}

TEST_F(FormatParserTest, DayWithLeadingSpace) {
  FormatParser parser("%Y-%m-%e");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("2024-03- 5", dt));
  EXPECT_EQ(dt.day, 5);
}

TEST_F(FormatParserTest, Time12h) {
  FormatParser parser("%I:%M %p");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("02:30 PM", dt));
  EXPECT_EQ(dt.hour, 14);
  ASSERT_TRUE(parser.parse("12:00 PM", dt));
  EXPECT_EQ(dt.hour, 12);
  ASSERT_TRUE(parser.parse("12:00 am", dt));
  EXPECT_EQ(dt.hour, 0);
}

TEST_F(FormatParserTest, FractionalSeconds) {
  FormatParser parser("%H:%M:%OS");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("14:30:45.123", dt));
  EXPECT_EQ(dt.second, 45);
  EXPECT_EQ(dt.microsecond, 123000);

  ASSERT_TRUE(parser.parse("14:30:45", dt));
  EXPECT_EQ(dt.microsecond, 0);
}

TEST_F(FormatParserTest, FractionDigitsPastMicrosAreDropped) {
  FormatParser parser("%T.%f");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("00:00:01.123456789", dt));
  EXPECT_EQ(dt.microsecond, 123456);
}

TEST_F(FormatParserTest, TimezoneOffsets) {
  FormatParser parser("%F %T%z");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("2024-01-01 00:00:00+0530", dt));
  EXPECT_EQ(dt.tz_offset_minutes, 330);
  EXPECT_TRUE(dt.has_tz_offset);

  ASSERT_TRUE(parser.parse("2024-01-01 00:00:00-05:00", dt));
  EXPECT_EQ(dt.tz_offset_minutes, -300);

  ASSERT_TRUE(parser.parse("2024-01-01 00:00:00-05", dt));
  EXPECT_EQ(dt.tz_offset_minutes, -300);

  ASSERT_TRUE(parser.parse("2024-01-01 00:00:00Z", dt));
  EXPECT_EQ(dt.tz_offset_minutes, 0);
  EXPECT_TRUE(dt.has_tz_offset);
}

TEST_F(FormatParserTest, NoOffsetLeavesFlagUnset) {
  FormatParser parser("%F %T");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("2024-01-01 10:00:00", dt));
  EXPECT_FALSE(dt.has_tz_offset);
}

TEST_F(FormatParserTest, UtcZoneNames) {
  FormatParser parser("%F %T %Z");
  ParsedDateTime dt;
  EXPECT_TRUE(parser.parse("2024-01-01 10:00:00 UTC", dt));
  EXPECT_TRUE(parser.parse("2024-01-01 10:00:00 gmt", dt));
  EXPECT_FALSE(parser.parse("2024-01-01 10:00:00 PST", dt));
}

TEST_F(FormatParserTest, LiteralPercent) {
  FormatParser parser("%%date: %Y-%m-%d");
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("%date: 2024-03-15", dt));
  EXPECT_EQ(dt.year, 2024);
}

TEST_F(FormatParserTest, Rejects) {
  FormatParser parser("%Y-%m-%d");
  ParsedDateTime dt;
  EXPECT_FALSE(parser.parse("2024/03/15", dt));
  EXPECT_FALSE(parser.parse("2024-03", dt));
  EXPECT_FALSE(parser.parse("2024-13-01", dt));
  EXPECT_FALSE(parser.parse("2024-02-30", dt));
  EXPECT_FALSE(parser.parse("2023-02-29", dt));
  EXPECT_FALSE(parser.parse("2024-03-15 extra", dt));
  EXPECT_FALSE(parser.parse("", dt));
}

TEST_F(FormatParserTest, CustomLocale) {
  FormatLocale fr = FormatLocale::english();
  fr.month_names = {"janvier", "fevrier", "mars",      "avril",   "mai",      "juin",
                    "juillet", "aout",    "septembre", "octobre", "novembre", "decembre"};

  FormatParser parser("%d %B %Y", fr);
  ParsedDateTime dt;
  ASSERT_TRUE(parser.parse("15 mars 2024", dt));
  EXPECT_EQ(dt.month, 3);
}
