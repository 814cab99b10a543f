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

#include <limits>

#include "tempo/type/FixedDateTime.h"

namespace facebook::tempo::test {
namespace {

constexpr uint64_t kMillisInDay = 86'400'000;

TEST(FixedDateTimeTest, fromFields64) {
  const auto dt = FixedDateTime64::fromFields(2023, 6, 15, 12, 30, 45, 500);
  EXPECT_EQ(dt.year(), 2023);
  EXPECT_EQ(dt.month(), 6);
  EXPECT_EQ(dt.day(), 15);
  EXPECT_EQ(dt.hour(), 12);
  EXPECT_EQ(dt.minute(), 30);
  EXPECT_EQ(dt.second(), 45);
  EXPECT_EQ(dt.millisecond(), 500);
  EXPECT_EQ(
      dt.counter(),
      (53 * 365 + 5 * 30 + 14) * kMillisInDay + 12 * 3'600'000 + 30 * 60'000 +
          45'500);
  EXPECT_TRUE(dt.hashMatchesCounter());
  EXPECT_EQ(FixedDateTime64(dt.counter()), dt);
  EXPECT_EQ(dt.hash(), FixedDateTime64(dt.counter()).hash());
}

TEST(FixedDateTimeTest, epoch) {
  const FixedDateTime64 epoch;
  EXPECT_EQ(epoch.counter(), 0);
  EXPECT_EQ(
      epoch.fields(), (DateTimeFields{.year = 1970, .month = 1, .day = 1}));
  EXPECT_EQ(
      epoch.toString(), "FixedDateTime64(0, 1970-01-01 00:00:00.000000)");

  EXPECT_EQ(FixedDateTime64::fromUnixEpoch(86'400).counter(), kMillisInDay);
  EXPECT_EQ(FixedDateTime32::fromUnixEpoch(86'400).counter(), 1'440);
  EXPECT_EQ(FixedDateTime16::fromUnixEpoch(86'400).counter(), 24);
  EXPECT_THROW(FixedDateTime64::fromUnixEpoch(-1), TempoUserError);

  EXPECT_GE(FixedDateTime64::now().year(), 2024);
}

TEST(FixedDateTimeTest, december) {
  const auto lastDay = FixedDateTime64::fromFields(2023, 12, 35);
  EXPECT_EQ(lastDay.month(), 12);
  EXPECT_EQ(lastDay.day(), 35);

  const auto next = FixedDateTime64(lastDay.counter() + kMillisInDay);
  EXPECT_EQ(next.year(), 2024);
  EXPECT_EQ(next.month(), 1);
  EXPECT_EQ(next.day(), 1);
}

TEST(FixedDateTimeTest, arithmeticLeavesHashStale) {
  auto dt = FixedDateTime64::fromFields(2023, 12, 35, 23, 59, 59, 999);
  const auto before = dt.counter();
  dt.add({.milliseconds = 1});
  EXPECT_EQ(dt.counter(), before + 1);
  // Field accessors read the hash, which still holds the old value.
  EXPECT_EQ(dt.year(), 2023);
  EXPECT_EQ(dt.second(), 59);
  EXPECT_FALSE(dt.hashMatchesCounter());

  const FixedDateTime64 fresh(dt.counter());
  EXPECT_EQ(fresh.year(), 2024);
  EXPECT_EQ(fresh.month(), 1);
  EXPECT_EQ(fresh.day(), 1);
  EXPECT_EQ(fresh.hour(), 0);
  EXPECT_EQ(fresh.second(), 0);
  EXPECT_EQ(fresh, dt);

  dt.rehash();
  EXPECT_TRUE(dt.hashMatchesCounter());
  EXPECT_EQ(dt.year(), 2024);
  EXPECT_EQ(dt.hash(), fresh.hash());
}

TEST(FixedDateTimeTest, addAndSubtract) {
  const auto start = FixedDateTime64::fromFields(2023, 1, 1);
  EXPECT_EQ(
      (start + FixedDelta{.months = 1}).rehash().fields(),
      (DateTimeFields{.year = 2023, .month = 2, .day = 1}));
  EXPECT_EQ(
      (start + FixedDelta{.years = 1}).rehash().fields(),
      (DateTimeFields{.year = 2024, .month = 1, .day = 1}));
  EXPECT_EQ(
      (start + FixedDelta{.days = 364}).rehash().fields(),
      (DateTimeFields{.year = 2023, .month = 12, .day = 35}));
  EXPECT_EQ(
      (start - FixedDelta{.hours = 1}).rehash().fields(),
      (DateTimeFields{
          .year = 2022, .month = 12, .day = 35, .hour = 23}));

  // Operators return copies.
  EXPECT_EQ(start.month(), 1);
  EXPECT_TRUE(start.hashMatchesCounter());
  EXPECT_LT(start, start + FixedDelta{.seconds = 1});
  EXPECT_GT(start, start - FixedDelta{.seconds = 1});

  auto dt = start;
  dt.add({.days = 1}).subtract({.hours = 24});
  EXPECT_EQ(dt, start);
}

TEST(FixedDateTimeTest, deltaBeyondInt64Wraps) {
  // 300 million years of milliseconds exceed the int64_t range.
  constexpr uint64_t kMillisInYear = 31'536'000'000;
  FixedDateTime64 dt;
  dt.add({.years = 300'000'000});
  EXPECT_EQ(dt.counter(), 300'000'000 * kMillisInYear);
  dt.subtract({.years = 300'000'000});
  EXPECT_EQ(dt.counter(), 0u);

  dt.subtract({.milliseconds = 1});
  EXPECT_EQ(dt.counter(), std::numeric_limits<uint64_t>::max());
}

TEST(FixedDateTimeTest, replaceLeavesCounter) {
  auto dt = FixedDateTime64::fromFields(2023, 6, 15, 12);
  const auto counter = dt.counter();
  dt.replace({.year = 2030, .hour = 7});
  EXPECT_EQ(dt.counter(), counter);
  EXPECT_EQ(dt.year(), 2030);
  EXPECT_EQ(dt.month(), 6);
  EXPECT_EQ(dt.hour(), 7);
  EXPECT_FALSE(dt.hashMatchesCounter());

  // A replacement that restores the fields makes the hash match again.
  dt.replace({.year = 2023, .hour = 12});
  EXPECT_TRUE(dt.hashMatchesCounter());
}

TEST(FixedDateTimeTest, fromHash) {
  const DateTimeFields fields{
      .year = 2024, .month = 3, .day = 9, .hour = 7, .minute = 5};
  const auto hash = pack<HashWidth::kUInt64>(fields);
  const auto dt = FixedDateTime64::fromHash(hash);
  EXPECT_EQ(dt.hash(), hash);
  EXPECT_EQ(dt.fields(), fields);
  EXPECT_EQ(dt, FixedDateTime64::fromFields(2024, 3, 9, 7, 5));
  EXPECT_TRUE(dt.hashMatchesCounter());
}

TEST(FixedDateTimeTest, width32) {
  const auto dt = FixedDateTime32::fromFields(2023, 6, 15, 12, 30, 45);
  // Seconds fall below the counter unit.
  EXPECT_EQ(dt.counter(), (53 * 365 + 5 * 30 + 14) * 1'440 + 12 * 60 + 30);
  EXPECT_EQ(dt.year(), 2023);
  EXPECT_EQ(dt.minute(), 30);
  EXPECT_EQ(dt.second(), 0);
  EXPECT_EQ(dt.millisecond(), 0);

  auto next = dt + FixedDelta{.minutes = 30};
  EXPECT_EQ(next.counter(), dt.counter() + 30);
  EXPECT_EQ(next.rehash().hour(), 13);
  EXPECT_EQ(next.minute(), 0);
  // Less than a unit does not move the counter.
  EXPECT_EQ((dt + FixedDelta{.seconds = 59}).counter(), dt.counter());
}

TEST(FixedDateTimeTest, width16) {
  const auto dt = FixedDateTime16::fromFields(1971, 3, 2, 5);
  EXPECT_EQ(dt.counter(), (365 + 60 + 1) * 24 + 5);
  EXPECT_EQ(dt.year(), 1971);
  EXPECT_EQ(dt.month(), 3);
  EXPECT_EQ(dt.day(), 2);
  EXPECT_EQ(dt.hour(), 5);
  EXPECT_EQ(dt.minute(), 0);
  EXPECT_EQ(unpack<HashWidth::kUInt16>(dt.hash()).year, 1);

  auto replaced = dt;
  replaced.replace({.year = 1972});
  EXPECT_EQ(replaced.year(), 1972);
  EXPECT_EQ(replaced.counter(), dt.counter());

  // The counter wraps after 65536 hours.
  const FixedDateTime16 last(0xFFFF);
  EXPECT_EQ((last + FixedDelta{.hours = 1}).counter(), 0);
}

TEST(FixedDateTimeTest, width8) {
  const FixedDateTime8 dt(29);
  EXPECT_EQ(dt.year(), 1970);
  EXPECT_EQ(dt.month(), 1);
  EXPECT_EQ(dt.day(), 2);
  EXPECT_EQ(dt.hour(), 5);
  EXPECT_EQ(dt.hash(), (2 << 5) | 5);

  EXPECT_EQ((FixedDateTime8(0) - FixedDelta{.hours = 1}).counter(), 255);
  EXPECT_EQ(
      FixedDateTime8(0).toString(),
      "FixedDateTime8(0, 1970-01-01 00:00:00.000000)");
}

} // namespace
} // namespace facebook::tempo::test
