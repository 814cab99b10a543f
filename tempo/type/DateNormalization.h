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

#pragma once

#include <cstdint>

#include "tempo/calendar/Calendar.h"

namespace facebook::tempo::util {

struct CivilDate {
  uint16_t year;
  uint8_t month;
  uint8_t day;
};

struct CivilDateTime {
  CivilDate date;
  uint8_t hour;
  uint8_t minute;
  uint8_t second;
  uint16_t millisecond;
  uint16_t microsecond;
  uint16_t nanosecond;
};

/// Maps 'year' into the calendar's year range, wrapping around at both ends.
uint16_t wrapYear(const Calendar& calendar, int64_t year);

/// Brings arbitrary, possibly negative, month and day counts back into the
/// calendar's ranges. Months carry into years, days carry into months (whole
/// 12-month spans are skipped first), and the year wraps within
/// [minYear, maxYear]. Day 0 is the last day of the previous month.
CivilDate normalizeDate(
    const Calendar& calendar,
    int64_t year,
    int64_t month,
    int64_t day);

/// Carries nanoseconds into microseconds, then milliseconds, seconds, minutes,
/// hours and days, and normalizes the date. A leap second (second 60) is
/// carried into the next minute.
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
    int64_t nanosecond);

bool isValidDate(
    const Calendar& calendar,
    int64_t year,
    int64_t month,
    int64_t day);

/// Second 60 is valid only on a leap second of the calendar.
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
    int64_t nanosecond);

} // namespace facebook::tempo::util
