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

#include "tempo/type/DateNormalization.h"

#include "tempo/common/base/CheckedArithmetic.h"

namespace facebook::tempo::util {
namespace {

void carry(int64_t& low, int64_t& high, int64_t base) {
  high = checkedPlus(high, floorDiv(low, base));
  low = floorMod(low, base);
}

uint8_t monthsPerYear(const CalendarLimits& limits) {
  return limits.maxMonth - limits.minMonth + 1;
}

// Days in the 12 months starting at (year, month).
int64_t daysInSpan(const Calendar& calendar, uint16_t year, uint8_t month) {
  const auto& limits = calendar.limits();
  int64_t days = 0;
  for (uint8_t i = 0; i < monthsPerYear(limits); ++i) {
    days += calendar.maxDaysInMonth(year, month);
    if (month == limits.maxMonth) {
      month = limits.minMonth;
      year = wrapYear(calendar, int64_t{year} + 1);
    } else {
      ++month;
    }
  }
  return days;
}

} // namespace

uint16_t wrapYear(const Calendar& calendar, int64_t year) {
  const auto& limits = calendar.limits();
  const int64_t span = int64_t{limits.maxYear} - limits.minYear + 1;
  return limits.minYear + floorMod<int64_t>(year - limits.minYear, span);
}

CivilDate normalizeDate(
    const Calendar& calendar,
    int64_t year,
    int64_t month,
    int64_t day) {
  const auto& limits = calendar.limits();

  int64_t monthIndex = month - limits.minMonth;
  year = checkedPlus(
      year, floorDiv<int64_t>(monthIndex, monthsPerYear(limits)));
  monthIndex = floorMod<int64_t>(monthIndex, monthsPerYear(limits));

  CivilDate date{
      wrapYear(calendar, year),
      static_cast<uint8_t>(limits.minMonth + monthIndex),
      limits.minDay};
  // Day offset from the first day of (date.year, date.month). Years wrap, so
  // whole turns of the year range are dropped first; the sign is kept to
  // walk the shorter way.
  const auto cycleDays = static_cast<int64_t>(
      calendar.daysInYears(limits.minYear, limits.maxYear - limits.minYear) +
      calendar.daysInYears(limits.maxYear, 1));
  int64_t offset = checkedMinus<int64_t>(day, limits.minDay) % cycleDays;

  // Skip whole 12-month spans, then single months.
  for (;;) {
    const int64_t span = daysInSpan(calendar, date.year, date.month);
    if (offset < span) {
      break;
    }
    offset -= span;
    date.year = wrapYear(calendar, int64_t{date.year} + 1);
  }
  while (offset < 0) {
    const uint16_t previousYear = wrapYear(calendar, int64_t{date.year} - 1);
    const int64_t span = daysInSpan(calendar, previousYear, date.month);
    if (-offset <= span) {
      break;
    }
    offset += span;
    date.year = previousYear;
  }
  while (offset < 0) {
    if (date.month == limits.minMonth) {
      date.month = limits.maxMonth;
      date.year = wrapYear(calendar, int64_t{date.year} - 1);
    } else {
      --date.month;
    }
    offset += calendar.maxDaysInMonth(date.year, date.month);
  }
  for (;;) {
    const uint8_t daysInMonth = calendar.maxDaysInMonth(date.year, date.month);
    if (offset < daysInMonth) {
      break;
    }
    offset -= daysInMonth;
    if (date.month == limits.maxMonth) {
      date.month = limits.minMonth;
      date.year = wrapYear(calendar, int64_t{date.year} + 1);
    } else {
      ++date.month;
    }
  }
  date.day = limits.minDay + offset;
  return date;
}

CivilDateTime normalizeDateTime(
    const Calendar& calendar,
    int64_t year,
    int64_t month,
    int64_t day,
    int64_t hour,
    int64_t minute,
    int64_t second,
    int64_t millisecond,
    int64_t microsecond,
    int64_t nanosecond) {
  const auto& limits = calendar.limits();
  carry(nanosecond, microsecond, limits.maxNanosecond + 1);
  carry(microsecond, millisecond, limits.maxMicrosecond + 1);
  carry(millisecond, second, limits.maxMillisecond + 1);
  carry(second, minute, limits.maxSecond + 1);
  carry(minute, hour, limits.maxMinute + 1);
  carry(hour, day, limits.maxHour + 1);
  return CivilDateTime{
      normalizeDate(calendar, year, month, day),
      static_cast<uint8_t>(hour),
      static_cast<uint8_t>(minute),
      static_cast<uint8_t>(second),
      static_cast<uint16_t>(millisecond),
      static_cast<uint16_t>(microsecond),
      static_cast<uint16_t>(nanosecond)};
}

bool isValidDate(
    const Calendar& calendar,
    int64_t year,
    int64_t month,
    int64_t day) {
  const auto& limits = calendar.limits();
  if (year < limits.minYear || year > limits.maxYear ||
      month < limits.minMonth || month > limits.maxMonth ||
      day < limits.minDay) {
    return false;
  }
  return day <= calendar.maxDaysInMonth(year, month);
}

bool isValidDateTime(
    const Calendar& calendar,
    int64_t year,
    int64_t month,
    int64_t day,
    int64_t hour,
    int64_t minute,
    int64_t second,
    int64_t millisecond,
    int64_t microsecond,
    int64_t nanosecond) {
  const auto& limits = calendar.limits();
  if (!isValidDate(calendar, year, month, day)) {
    return false;
  }
  if (hour < limits.minHour || hour > limits.maxHour ||
      minute < limits.minMinute || minute > limits.maxMinute ||
      second < limits.minSecond || millisecond < limits.minMillisecond ||
      millisecond > limits.maxMillisecond ||
      microsecond < limits.minMicrosecond ||
      microsecond > limits.maxMicrosecond ||
      nanosecond < limits.minNanosecond ||
      nanosecond > limits.maxNanosecond) {
    return false;
  }
  if (second > limits.maxSecond) {
    return second == limits.maxSecond + 1 &&
        calendar.isLeapSecond(year, month, day, hour, minute, second);
  }
  return true;
}

} // namespace facebook::tempo::util
