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

#include "tempo/type/DateNormalization.h"

namespace facebook::tempo::util::test {
namespace {

void expectDate(
    const CivilDate& date,
    uint16_t year,
    uint8_t month,
    uint8_t day) {
  EXPECT_EQ(date.year, year);
  EXPECT_EQ(date.month, month);
  EXPECT_EQ(date.day, day);
}

TEST(DateNormalizationTest, wrapYear) {
  EXPECT_EQ(wrapYear(kGregorianCalendar, 2024), 2024);
  EXPECT_EQ(wrapYear(kGregorianCalendar, 10'000), 1);
  EXPECT_EQ(wrapYear(kGregorianCalendar, 0), 9999);
  EXPECT_EQ(wrapYear(kUtcCalendar, 1969), 9999);
  EXPECT_EQ(wrapYear(kUtcCalendar, 10'001), 1971);
}

TEST(DateNormalizationTest, months) {
  expectDate(normalizeDate(kGregorianCalendar, 2023, 13, 1), 2024, 1, 1);
  expectDate(normalizeDate(kGregorianCalendar, 2023, 0, 1), 2022, 12, 1);
  expectDate(normalizeDate(kGregorianCalendar, 2023, -11, 15), 2022, 1, 15);
  expectDate(normalizeDate(kGregorianCalendar, 2023, 25, 15), 2025, 1, 15);
}

TEST(DateNormalizationTest, days) {
  expectDate(normalizeDate(kGregorianCalendar, 2024, 2, 30), 2024, 3, 1);
  expectDate(normalizeDate(kGregorianCalendar, 2023, 2, 29), 2023, 3, 1);
  expectDate(normalizeDate(kGregorianCalendar, 2024, 12, 32), 2025, 1, 1);
  expectDate(normalizeDate(kGregorianCalendar, 2024, 3, 0), 2024, 2, 29);
  expectDate(normalizeDate(kGregorianCalendar, 2024, 1, 0), 2023, 12, 31);
  expectDate(normalizeDate(kGregorianCalendar, 2024, 1, -365), 2022, 12, 31);

  // Several years at once, in both directions.
  expectDate(normalizeDate(kGregorianCalendar, 2000, 1, 1 + 3653), 2010, 1, 1);
  expectDate(normalizeDate(kGregorianCalendar, 2010, 1, 1 - 3653), 2000, 1, 1);
  expectDate(normalizeDate(kUtcCalendar, 1970, 1, 1 + 19'723), 2024, 1, 1);
}

TEST(DateNormalizationTest, wholeYearRangeTurns) {
  // Days in years 1 through 9999.
  constexpr int64_t kGregorianCycle = 3'652'059;
  expectDate(
      normalizeDate(kGregorianCalendar, 2024, 1, 1 + kGregorianCycle),
      2024,
      1,
      1);
  expectDate(
      normalizeDate(
          kGregorianCalendar, 2024, 1, -1'000'000'000 * kGregorianCycle),
      2023,
      12,
      31);
  expectDate(
      normalizeDate(kGregorianCalendar, 2024, 3, 10 + 1'000'000'000'000'000),
      5040,
      10,
      24);

  constexpr int64_t kFastUtcCycle = 365 * (9999 - 1970 + 1);
  expectDate(
      normalizeDate(kFastUtcCalendar, 2023, 12, 35 - 7 * kFastUtcCycle),
      2023,
      12,
      35);

  // 2^62 seconds is about 5.3e13 days.
  const auto c = normalizeDateTime(
      kGregorianCalendar, 2000, 1, 1, 0, 0, int64_t{1} << 62, 0, 0, 0);
  expectDate(c.date, 9940, 2, 10);
  EXPECT_EQ(c.hour, 7);
  EXPECT_EQ(c.minute, 45);
  EXPECT_EQ(c.second, 4);
}

TEST(DateNormalizationTest, fastUtcDays) {
  expectDate(normalizeDate(kFastUtcCalendar, 2023, 12, 31), 2023, 12, 31);
  expectDate(normalizeDate(kFastUtcCalendar, 2023, 12, 36), 2024, 1, 1);
  expectDate(normalizeDate(kFastUtcCalendar, 2023, 2, 31), 2023, 3, 1);
  expectDate(normalizeDate(kFastUtcCalendar, 2024, 1, 0), 2023, 12, 35);
}

TEST(DateNormalizationTest, dateTimeCarry) {
  const auto c = normalizeDateTime(
      kGregorianCalendar, 2023, 12, 31, 23, 59, 59, 999, 999, 1'000);
  expectDate(c.date, 2024, 1, 1);
  EXPECT_EQ(c.hour, 0);
  EXPECT_EQ(c.minute, 0);
  EXPECT_EQ(c.second, 0);
  EXPECT_EQ(c.millisecond, 0);
  EXPECT_EQ(c.microsecond, 0);
  EXPECT_EQ(c.nanosecond, 0);

  const auto borrow =
      normalizeDateTime(kGregorianCalendar, 2024, 3, 1, 0, 0, 0, 0, 0, -1);
  expectDate(borrow.date, 2024, 2, 29);
  EXPECT_EQ(borrow.hour, 23);
  EXPECT_EQ(borrow.minute, 59);
  EXPECT_EQ(borrow.second, 59);
  EXPECT_EQ(borrow.millisecond, 999);
  EXPECT_EQ(borrow.microsecond, 999);
  EXPECT_EQ(borrow.nanosecond, 999);

  // A leap second carries into the next minute.
  const auto leap =
      normalizeDateTime(kGregorianCalendar, 2016, 12, 31, 23, 59, 60, 0, 0, 0);
  expectDate(leap.date, 2017, 1, 1);
  EXPECT_EQ(leap.hour, 0);
  EXPECT_EQ(leap.second, 0);
}

TEST(DateNormalizationTest, validity) {
  EXPECT_TRUE(isValidDate(kGregorianCalendar, 2024, 2, 29));
  EXPECT_FALSE(isValidDate(kGregorianCalendar, 2023, 2, 29));
  EXPECT_FALSE(isValidDate(kGregorianCalendar, 2023, 13, 1));
  EXPECT_FALSE(isValidDate(kGregorianCalendar, 2023, 1, 0));
  EXPECT_FALSE(isValidDate(kGregorianCalendar, 0, 1, 1));
  EXPECT_FALSE(isValidDate(kUtcCalendar, 1969, 12, 31));
  EXPECT_TRUE(isValidDate(kFastUtcCalendar, 2023, 12, 35));
  EXPECT_FALSE(isValidDate(kFastUtcCalendar, 2023, 11, 31));

  EXPECT_TRUE(isValidDateTime(
      kGregorianCalendar, 2016, 12, 31, 23, 59, 60, 0, 0, 0));
  EXPECT_FALSE(isValidDateTime(
      kGregorianCalendar, 2017, 12, 31, 23, 59, 60, 0, 0, 0));
  EXPECT_FALSE(isValidDateTime(
      kGregorianCalendar, 2016, 12, 31, 23, 59, 61, 0, 0, 0));
  EXPECT_FALSE(isValidDateTime(
      kGregorianCalendar, 2016, 12, 31, 24, 0, 0, 0, 0, 0));
  EXPECT_FALSE(isValidDateTime(
      kGregorianCalendar, 2016, 12, 31, 0, 0, 0, 1'000, 0, 0));
  EXPECT_FALSE(isValidDateTime(
      kGregorianCalendar, 2016, 12, 31, 0, 0, 0, 0, 0, -1));
}

} // namespace
} // namespace facebook::tempo::util::test
