/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gtest/gtest.h>

#include "tempo/common/base/Exceptions.h"
#include "tempo/tz/TimeZone.h"

namespace facebook::tempo::test {
namespace {

constexpr uint8_t kSunday = 6;

class TimeZoneTest : public testing::Test {
 protected:
  void SetUp() override {
    // Last Sunday of March to first Sunday of November, both at 02:00.
    store_.addDst(
        "Test/North",
        DstZone(
            TransitionRule(3, kSunday, true, 0, 2),
            TransitionRule(11, kSunday, false, 0, 2),
            Offset(5, 0, -1)));
    store_.addOffset("Test/Fixed", Offset(3, 0, 1));
  }

  Offset northOffsetAt(uint8_t month, uint8_t day, uint8_t hour = 0) const {
    auto zone = TimeZone::lookup("Test/North", &store_);
    EXPECT_TRUE(zone.has_value());
    return zone->offsetAt(2024, month, day, hour);
  }

  InMemoryZoneStore store_;
};

TEST_F(TimeZoneTest, utcByDefault) {
  const TimeZone utc;
  EXPECT_EQ(utc.name(), "UTC");
  EXPECT_FALSE(utc.hasDst());
  EXPECT_EQ(utc.offset(), Offset());
  EXPECT_EQ(utc.offsetAt(2024, 7, 1), Offset());
  EXPECT_EQ(utc.toString(), "UTC (+00:00)");
}

TEST_F(TimeZoneTest, lookup) {
  auto fixed = TimeZone::lookup("Test/Fixed", &store_);
  ASSERT_TRUE(fixed.has_value());
  EXPECT_FALSE(fixed->hasDst());
  EXPECT_EQ(fixed->offset(), Offset(3, 0, 1));

  auto north = TimeZone::lookup("Test/North", &store_);
  ASSERT_TRUE(north.has_value());
  EXPECT_TRUE(north->hasDst());
  EXPECT_EQ(north->offset(), Offset(5, 0, -1));

  EXPECT_FALSE(TimeZone::lookup("Test/Missing", &store_).has_value());
  EXPECT_FALSE(TimeZone::lookup("Asia/Tokyo", &store_).has_value());
}

TEST_F(TimeZoneTest, northernHemisphere) {
  const Offset standard(5, 0, -1);
  const Offset daylight(4, 0, -1);
  EXPECT_EQ(northOffsetAt(1, 15), standard);
  EXPECT_EQ(northOffsetAt(7, 1), daylight);
  EXPECT_EQ(northOffsetAt(12, 1), standard);

  // March 31st 2024 is the last Sunday of March.
  EXPECT_EQ(northOffsetAt(3, 30, 23), standard);
  EXPECT_EQ(northOffsetAt(3, 31, 1), standard);
  EXPECT_EQ(northOffsetAt(3, 31, 2), daylight);
  EXPECT_EQ(northOffsetAt(3, 31, 3), daylight);

  // November 3rd 2024 is the first Sunday of November.
  EXPECT_EQ(northOffsetAt(11, 2, 12), daylight);
  EXPECT_EQ(northOffsetAt(11, 3, 1), daylight);
  EXPECT_EQ(northOffsetAt(11, 3, 2), standard);
}

TEST_F(TimeZoneTest, southernHemisphere) {
  auto sydney = TimeZone::lookup("Australia/Sydney");
  ASSERT_TRUE(sydney.has_value());
  EXPECT_EQ(sydney->offsetAt(2024, 1, 15), Offset(11, 0, 1));
  EXPECT_EQ(sydney->offsetAt(2024, 7, 15), Offset(10, 0, 1));
  EXPECT_EQ(sydney->offsetAt(2024, 12, 25), Offset(11, 0, 1));

  // DST ends on April 7th 2024 at 03:00 and starts on October 6th at 02:00.
  EXPECT_EQ(sydney->offsetAt(2024, 4, 7, 2), Offset(11, 0, 1));
  EXPECT_EQ(sydney->offsetAt(2024, 4, 7, 3), Offset(10, 0, 1));
  EXPECT_EQ(sydney->offsetAt(2024, 10, 6, 1), Offset(10, 0, 1));
  EXPECT_EQ(sydney->offsetAt(2024, 10, 6, 2), Offset(11, 0, 1));
}

TEST_F(TimeZoneTest, irregularDst) {
  auto lordHowe = TimeZone::lookup("Australia/Lord_Howe");
  ASSERT_TRUE(lordHowe.has_value());
  EXPECT_EQ(lordHowe->offsetAt(2024, 1, 15), Offset(11, 0, 1));
  EXPECT_EQ(lordHowe->offsetAt(2024, 7, 15), Offset(10, 30, 1, true));

  auto troll = TimeZone::lookup("Antarctica/Troll");
  ASSERT_TRUE(troll.has_value());
  EXPECT_EQ(troll->offsetAt(2024, 7, 15), Offset(2, 0, 1));
  EXPECT_EQ(troll->offsetAt(2024, 1, 15), Offset(0, 0, 1, true));
}

TEST_F(TimeZoneTest, builtinFixedZones) {
  auto kolkata = TimeZone::lookup("Asia/Kolkata");
  ASSERT_TRUE(kolkata.has_value());
  EXPECT_FALSE(kolkata->hasDst());
  EXPECT_EQ(kolkata->offsetAt(2024, 7, 1), Offset(5, 30, 1));
  EXPECT_EQ(kolkata->toString(), "Asia/Kolkata (+05:30)");

  auto phoenix = TimeZone::lookup("America/Phoenix");
  ASSERT_TRUE(phoenix.has_value());
  EXPECT_EQ(phoenix->offsetAt(2024, 7, 1), Offset(7, 0, -1));
}

TEST_F(TimeZoneTest, missingRuleFallsBackToStaticOffset) {
  const InMemoryZoneStore empty;
  const TimeZone zone("Test/Gone", Offset(3, 0, 1), true, &empty);
  EXPECT_EQ(zone.offsetAt(2024, 7, 1), Offset(3, 0, 1));
}

TEST_F(TimeZoneTest, sameMonthRules) {
  // First Sunday to last Sunday of March.
  const DstZone zone(
      TransitionRule(3, kSunday, false, 0, 2),
      TransitionRule(3, kSunday, true, 0, 2),
      Offset(1, 0, 1));
  EXPECT_FALSE(isDaylightSavingTime(zone, kGregorianCalendar, 2024, 2, 10, 0));
  EXPECT_FALSE(isDaylightSavingTime(zone, kGregorianCalendar, 2024, 3, 3, 1));
  EXPECT_TRUE(isDaylightSavingTime(zone, kGregorianCalendar, 2024, 3, 3, 2));
  EXPECT_TRUE(isDaylightSavingTime(zone, kGregorianCalendar, 2024, 3, 10, 0));
  EXPECT_FALSE(isDaylightSavingTime(zone, kGregorianCalendar, 2024, 3, 31, 3));
}

TEST_F(TimeZoneTest, daylightOffset) {
  EXPECT_EQ(daylightOffset(Offset(5, 0, -1)), Offset(4, 0, -1));
  EXPECT_EQ(daylightOffset(Offset(0, 30, -1)), Offset(0, 30, 1));
  EXPECT_EQ(daylightOffset(Offset(10, 30, 1, true)), Offset(11, 0, 1));
  // -00:45 would move to +00:15, which has no minute code.
  EXPECT_THROW(daylightOffset(Offset(0, 45, -1)), TempoUserError);
}

TEST_F(TimeZoneTest, equality) {
  EXPECT_EQ(TimeZone(), TimeZone("UTC", Offset()));
  EXPECT_NE(TimeZone("UTC", Offset()), TimeZone("Test/Fixed", Offset()));
  EXPECT_NE(
      TimeZone("Test/Fixed", Offset(3, 0, 1)),
      TimeZone("Test/Fixed", Offset(2, 0, 1)));
}

} // namespace
} // namespace facebook::tempo::test
