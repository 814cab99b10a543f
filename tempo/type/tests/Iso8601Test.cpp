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

#include "tempo/type/Iso8601.h"

namespace facebook::tempo::test {
namespace {

const DateTimeFields kFields{
    .year = 2024,
    .month = 3,
    .day = 9,
    .hour = 7,
    .minute = 5,
    .second = 1,
    .millisecond = 250};

TEST(Iso8601Test, format) {
  EXPECT_EQ(formatIso(kFields, IsoFormat::kFull), "2024-03-09T07:05:01");
  EXPECT_EQ(
      formatIso(kFields, IsoFormat::kFullWithOffset, Offset(5, 30, 1)),
      "2024-03-09T07:05:01+05:30");
  EXPECT_EQ(
      formatIso(kFields, IsoFormat::kFullWithOffset),
      "2024-03-09T07:05:01+00:00");
  EXPECT_EQ(formatIso(kFields, IsoFormat::kCompact), "20240309070501");
  EXPECT_EQ(formatIso(kFields, IsoFormat::kDate), "2024-03-09");
  EXPECT_EQ(formatIso(kFields, IsoFormat::kTime), "07:05:01");
  EXPECT_EQ(
      formatIso(
          DateTimeFields{.year = 33, .month = 1, .day = 1}, IsoFormat::kDate),
      "0033-01-01");
}

TEST(Iso8601Test, parse) {
  auto full = parseIso("2024-03-09T07:05:01", IsoFormat::kFull);
  ASSERT_TRUE(full.hasValue()) << full.error();
  EXPECT_EQ(full->fields.year, 2024);
  EXPECT_EQ(full->fields.month, 3);
  EXPECT_EQ(full->fields.day, 9);
  EXPECT_EQ(full->fields.hour, 7);
  EXPECT_EQ(full->fields.minute, 5);
  EXPECT_EQ(full->fields.second, 1);
  EXPECT_FALSE(full->offset.has_value());

  auto spaced = parseIso("2024-03-09 07:05:01", IsoFormat::kFull);
  ASSERT_TRUE(spaced.hasValue());
  EXPECT_EQ(spaced->fields, full->fields);

  auto compact = parseIso("20240309070501", IsoFormat::kCompact);
  ASSERT_TRUE(compact.hasValue());
  EXPECT_EQ(compact->fields, full->fields);

  auto date = parseIso("2024-02-29", IsoFormat::kDate);
  ASSERT_TRUE(date.hasValue());
  EXPECT_EQ(
      date->fields, (DateTimeFields{.year = 2024, .month = 2, .day = 29}));

  auto time = parseIso("23:59:60", IsoFormat::kTime);
  ASSERT_TRUE(time.hasValue());
  EXPECT_EQ(time->fields.second, 60);
}

TEST(Iso8601Test, parseOffset) {
  auto utc = parseIso("2024-03-09T07:05:01Z", IsoFormat::kFullWithOffset);
  ASSERT_TRUE(utc.hasValue());
  EXPECT_EQ(utc->offset, Offset());

  auto east =
      parseIso("2024-03-09T07:05:01+05:45", IsoFormat::kFullWithOffset);
  ASSERT_TRUE(east.hasValue());
  EXPECT_EQ(east->offset, Offset(5, 45, 1));

  auto west =
      parseIso("2024-03-09T07:05:01-09:30", IsoFormat::kFullWithOffset);
  ASSERT_TRUE(west.hasValue());
  EXPECT_EQ(west->offset, Offset(9, 30, -1));

  EXPECT_TRUE(parseIso("2024-03-09T07:05:01", IsoFormat::kFullWithOffset)
                  .hasError());
  EXPECT_TRUE(parseIso("2024-03-09T07:05:01+05:15", IsoFormat::kFullWithOffset)
                  .hasError());
  EXPECT_TRUE(parseIso("2024-03-09T07:05:01+16:00", IsoFormat::kFullWithOffset)
                  .hasError());
  EXPECT_TRUE(
      parseIso("2024-03-09T07:05:01Z", IsoFormat::kFull).hasError());
}

TEST(Iso8601Test, parseErrors) {
  for (const auto* text :
       {"",
        "2024-3-09",
        "2024-03-9",
        "2024/03/09",
        "2024-13-01",
        "2024-00-01",
        "2024-01-00",
        "2024-01-36",
        "2024-01-01x",
        "2024-01-01T00:00:00"}) {
    auto result = parseIso(text, IsoFormat::kDate);
    EXPECT_TRUE(result.hasError()) << text;
  }
  // Day 35 exists in the fast UTC calendar, so it parses.
  EXPECT_TRUE(parseIso("2024-12-35", IsoFormat::kDate).hasValue());

  EXPECT_TRUE(parseIso("24:00:00", IsoFormat::kTime).hasError());
  EXPECT_TRUE(parseIso("23:60:00", IsoFormat::kTime).hasError());
  EXPECT_TRUE(parseIso("23:59:61", IsoFormat::kTime).hasError());

  auto result = parseIso("2024-03-09X07:05:01", IsoFormat::kFull);
  ASSERT_TRUE(result.hasError());
  EXPECT_TRUE(result.error().isUserError());
  EXPECT_EQ(
      result.error().message(),
      "Unable to parse '2024-03-09X07:05:01' as FULL ISO-8601 text");
}

TEST(Iso8601Test, strftime) {
  // 2024-03-09 was a Saturday, the 69th day of the year.
  auto formatted = formatStrftime(kFields, "%Y/%m/%d %H:%M:%S %A %j", 5, 69);
  ASSERT_TRUE(formatted.hasValue()) << formatted.error();
  EXPECT_EQ(formatted.value(), "2024/03/09 07:05:01 Saturday 069");

  EXPECT_EQ(formatStrftime(kFields, "%a", 6).value(), "Sun");
  EXPECT_TRUE(formatStrftime(kFields, "").hasError());
}

TEST(Iso8601Test, strptime) {
  auto parsed = parseStrptime("09.03.2024 07:05:01", "%d.%m.%Y %H:%M:%S");
  ASSERT_TRUE(parsed.hasValue()) << parsed.error();
  EXPECT_EQ(
      parsed.value(),
      (DateTimeFields{
          .year = 2024,
          .month = 3,
          .day = 9,
          .hour = 7,
          .minute = 5,
          .second = 1}));

  auto dateOnly = parseStrptime("2024-02-29", "%Y-%m-%d");
  ASSERT_TRUE(dateOnly.hasValue());
  EXPECT_EQ(
      dateOnly.value(), (DateTimeFields{.year = 2024, .month = 2, .day = 29}));

  EXPECT_TRUE(parseStrptime("2024-02-29 trailing", "%Y-%m-%d").hasError());
  EXPECT_TRUE(parseStrptime("not a date", "%Y-%m-%d").hasError());
}

} // namespace
} // namespace facebook::tempo::test
