#include "csvexpr/error.h"
#include "csvexpr/time_zone.h"

#include <gtest/gtest.h>

using namespace csvexpr;

TEST(TimeZoneTest, DefaultIsUtc) {
  TimeZone zone;
  EXPECT_EQ(zone.id(), "UTC");
  EXPECT_EQ(zone.offset_minutes(), 0);
  EXPECT_EQ(zone.offset_micros(), 0);
}

TEST(TimeZoneTest, UtcAliases) {
  for (const char* id : {"UTC", "utc", "GMT", "UT", "Z", "Etc/UTC", "Etc/GMT", "Zulu"}) {
    TimeZone zone = resolve_time_zone(id);
    EXPECT_EQ(zone.offset_minutes(), 0) << id;
    EXPECT_EQ(zone.id(), id);
  }
}

TEST(TimeZoneTest, FixedOffsets) {
  EXPECT_EQ(resolve_time_zone("+02:00").offset_minutes(), 120);
  EXPECT_EQ(resolve_time_zone("-05:30").offset_minutes(), -330);
  EXPECT_EQ(resolve_time_zone("+0530").offset_minutes(), 330);
  EXPECT_EQ(resolve_time_zone("+9").offset_minutes(), 540);
  EXPECT_EQ(resolve_time_zone("-08").offset_minutes(), -480);
  EXPECT_EQ(resolve_time_zone("+18:00").offset_minutes(), 18 * 60);
}

TEST(TimeZoneTest, PrefixedOffsets) {
  EXPECT_EQ(resolve_time_zone("UTC+01:00").offset_minutes(), 60);
  EXPECT_EQ(resolve_time_zone("GMT-3").offset_minutes(), -180);
  EXPECT_EQ(resolve_time_zone("UT+0930").offset_minutes(), 570);
}

TEST(TimeZoneTest, OffsetMicros) {
  EXPECT_EQ(resolve_time_zone("+01:00").offset_micros(), 3600LL * 1000000LL);
}

TEST(TimeZoneTest, EqualityComparesOffsets) {
  EXPECT_EQ(resolve_time_zone("UTC"), resolve_time_zone("+00:00"));
  EXPECT_FALSE(resolve_time_zone("UTC") == resolve_time_zone("+01:00"));
}

TEST(TimeZoneTest, RejectsUnknownZones) {
  for (const char* id : {"America/Los_Angeles", "PST", "", "+", "+19:00", "+05:60", "+123",
                         "UTC+", "+5:3"}) {
    try {
      resolve_time_zone(id);
      FAIL() << "expected failure for '" << id << "'";
    } catch (const ConfigurationError& e) {
      EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_TIME_ZONE) << id;
    }
  }
}
