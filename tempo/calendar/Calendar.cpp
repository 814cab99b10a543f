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

#include "tempo/calendar/Calendar.h"

#include <algorithm>
#include <array>

#include "tempo/common/base/CheckedArithmetic.h"
#include "tempo/common/base/Exceptions.h"

namespace facebook::tempo {
namespace {

constexpr int64_t kSecondsInDay = 86'400;
constexpr int64_t kMillisInSecond = 1'000;
constexpr int64_t kMillisInDay = kSecondsInDay * kMillisInSecond;
constexpr uint64_t kNanosInSecond = 1'000'000'000;

constexpr std::array<uint8_t, 12> kDaysInMonth =
    {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
constexpr std::array<uint16_t, 12> kDaysBeforeMonth =
    {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};

// Leap second insertions as year * 100 + month. Each one happened at 23:59:60
// on the last day of the month.
constexpr std::array<uint32_t, 27> kLeapSecondDates = {
    197206, 197212, 197312, 197412, 197512, 197612, 197712, 197812, 197912,
    198106, 198206, 198306, 198506, 198712, 198912, 199012, 199206, 199306,
    199406, 199512, 199706, 199812, 200512, 200812, 201206, 201506, 201612,
};

// Number of Gregorian leap years in [0, year). Year 0 is a leap year.
constexpr uint64_t leapYearsBefore(uint64_t year) {
  if (year == 0) {
    return 0;
  }
  const uint64_t y = year - 1;
  return y / 4 - y / 100 + y / 400 + 1;
}

constexpr uint64_t leapSecondsAt(uint16_t year) {
  return year >= GregorianCalendar::kLeapSecondYear
      ? GregorianCalendar::kLeapSeconds
      : 0;
}

void checkMonth(uint8_t month) {
  TEMPO_USER_CHECK(month >= 1 && month <= 12, "Invalid month: {}", month);
}

void checkNotBeforeEpoch(uint16_t year, const CalendarLimits& limits) {
  TEMPO_USER_CHECK_GE(
      year, limits.minYear, "Year precedes the epoch of the calendar");
}

uint64_t intradaySeconds(uint8_t hour, uint8_t minute, uint8_t second) {
  return uint64_t{hour} * 3'600 + uint64_t{minute} * 60 + second;
}

} // namespace

namespace detail {
void throwInvalidYearRange(uint16_t minYear, uint16_t maxYear) {
  TEMPO_USER_FAIL("Invalid calendar year range: [{}, {}]", minYear, maxYear);
}
} // namespace detail

std::string_view toString(CalendarKind kind) {
  switch (kind) {
    case CalendarKind::kGregorian:
      return "GREGORIAN";
    case CalendarKind::kFastUtc:
      return "FAST_UTC";
  }
  TEMPO_UNREACHABLE();
}

//============================ GregorianCalendar ============================//

bool GregorianCalendar::isLeapSecond(
    uint16_t year,
    uint8_t month,
    uint8_t day,
    uint8_t hour,
    uint8_t minute,
    uint8_t second) const {
  if (second != 60 || hour != 23 || minute != 59 || month < 1 || month > 12) {
    return false;
  }
  if (day != maxDaysInMonth(year, month)) {
    return false;
  }
  return std::binary_search(
      kLeapSecondDates.begin(),
      kLeapSecondDates.end(),
      uint32_t{year} * 100 + month);
}

uint8_t GregorianCalendar::dayOfWeek(uint16_t year, uint8_t month, uint8_t day)
    const {
  // Days from 0001-01-01 to the start of 'year'. Year 0 starts 366 days
  // earlier, which is 5 modulo 7.
  const uint64_t daysBeforeYear = year == 0
      ? 5
      : uint64_t{365} * (year - 1) + leapYearsBefore(year) - 1;
  return (daysBeforeYear + dayOfYear(year, month, day) + 6) % 7;
}

uint16_t GregorianCalendar::dayOfYear(uint16_t year, uint8_t month, uint8_t day)
    const {
  checkMonth(month);
  uint16_t result = kDaysBeforeMonth[month - 1] + day;
  if (month > 2 && isLeapYear(year)) {
    ++result;
  }
  return result;
}

uint8_t GregorianCalendar::maxDaysInMonth(uint16_t year, uint8_t month) const {
  checkMonth(month);
  if (month == 2 && isLeapYear(year)) {
    return 29;
  }
  return kDaysInMonth[month - 1];
}

uint64_t GregorianCalendar::leapSecondsSinceEpoch(
    uint16_t year,
    uint8_t /*month*/,
    uint8_t /*day*/) const {
  checkNotBeforeEpoch(year, limits_);
  return leapSecondsAt(year) - leapSecondsAt(limits_.minYear);
}

uint64_t GregorianCalendar::leapDaysSinceEpoch(
    uint16_t year,
    uint8_t month,
    uint8_t /*day*/) const {
  checkNotBeforeEpoch(year, limits_);
  uint64_t result = leapYearsBefore(year) - leapYearsBefore(limits_.minYear);
  if (month > 2 && isLeapYear(year)) {
    ++result;
  }
  return result;
}

uint64_t GregorianCalendar::daysSinceEpoch(
    uint16_t year,
    uint8_t month,
    uint8_t day) const {
  checkNotBeforeEpoch(year, limits_);
  // 365-day years plus one day per leap year crossed. dayOfYear() already
  // counts February 29th of the current year.
  return uint64_t{365} * (year - limits_.minYear) + leapYearsBefore(year) -
      leapYearsBefore(limits_.minYear) + dayOfYear(year, month, day) - 1;
}

uint64_t GregorianCalendar::secondsSinceEpoch(
    uint16_t year,
    uint8_t month,
    uint8_t day,
    uint8_t hour,
    uint8_t minute,
    uint8_t second) const {
  return daysSinceEpoch(year, month, day) * kSecondsInDay +
      intradaySeconds(hour, minute, second) +
      leapSecondsSinceEpoch(year, month, day);
}

uint64_t GregorianCalendar::daysInYears(uint16_t fromYear, uint16_t years)
    const {
  const uint64_t toYear = uint64_t{fromYear} + years;
  return uint64_t{365} * years + leapYearsBefore(toYear) -
      leapYearsBefore(fromYear);
}

//============================= FastUtcCalendar =============================//

uint8_t FastUtcCalendar::dayOfWeek(uint16_t year, uint8_t month, uint8_t day)
    const {
  const int64_t days = (int64_t{year} - 1970) * kDaysInYear +
      int64_t{dayOfYear(year, month, day)} - 1;
  // 1970-01-01 is a Thursday.
  return floorMod<int64_t>(days + 3, 7);
}

uint16_t FastUtcCalendar::dayOfYear(
    uint16_t /*year*/,
    uint8_t month,
    uint8_t day) const {
  return (month - 1) * kDaysInMonth + day;
}

uint64_t FastUtcCalendar::daysSinceEpoch(
    uint16_t year,
    uint8_t month,
    uint8_t day) const {
  checkNotBeforeEpoch(year, limits_);
  return uint64_t{kDaysInYear} * (year - limits_.minYear) +
      dayOfYear(year, month, day) - 1;
}

uint64_t FastUtcCalendar::secondsSinceEpoch(
    uint16_t year,
    uint8_t month,
    uint8_t day,
    uint8_t hour,
    uint8_t minute,
    uint8_t second) const {
  return daysSinceEpoch(year, month, day) * kSecondsInDay +
      intradaySeconds(hour, minute, second);
}

DateTimeFields FastUtcCalendar::fieldsFromMillis(uint64_t millis) const {
  const uint64_t days = millis / kMillisInDay;
  uint64_t remainder = millis % kMillisInDay;

  DateTimeFields fields;
  fields.year = limits_.minYear + days / kDaysInYear;
  const uint16_t day = days % kDaysInYear;
  fields.month = std::min(day / kDaysInMonth + 1, 12);
  fields.day = day - (fields.month - 1) * kDaysInMonth + 1;

  fields.hour = remainder / 3'600'000;
  remainder %= 3'600'000;
  fields.minute = remainder / 60'000;
  remainder %= 60'000;
  fields.second = remainder / kMillisInSecond;
  fields.millisecond = remainder % kMillisInSecond;
  return fields;
}

//================================ Calendar =================================//

std::pair<uint8_t, uint8_t> Calendar::monthRange(uint16_t year, uint8_t month)
    const {
  return {dayOfWeek(year, month, 1), maxDaysInMonth(year, month)};
}

uint64_t Calendar::millisSinceEpoch(
    uint16_t year,
    uint8_t month,
    uint8_t day,
    uint8_t hour,
    uint8_t minute,
    uint8_t second,
    uint16_t millisecond) const {
  const uint64_t seconds =
      secondsSinceEpoch(year, month, day, hour, minute, second);
  return checkedPlus<uint64_t>(
      checkedMultiply<uint64_t>(seconds, kMillisInSecond), millisecond);
}

uint64_t Calendar::nanosSinceEpoch(
    uint16_t year,
    uint8_t month,
    uint8_t day,
    uint8_t hour,
    uint8_t minute,
    uint8_t second,
    uint16_t millisecond,
    uint16_t microsecond,
    uint16_t nanosecond) const {
  const uint64_t seconds =
      secondsSinceEpoch(year, month, day, hour, minute, second);
  const uint64_t subsecond = uint64_t{millisecond} * 1'000'000 +
      uint64_t{microsecond} * 1'000 + nanosecond;
  return checkedPlus<uint64_t>(
      checkedMultiply<uint64_t>(seconds, kNanosInSecond), subsecond);
}

std::string Calendar::toString() const {
  return fmt::format(
      "{}[{}, {}]",
      ::facebook::tempo::toString(kind()),
      minYear(),
      maxYear());
}

} // namespace facebook::tempo
