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
#include <optional>
#include <string>

#include <fmt/format.h>

#include "tempo/calendar/Calendar.h"
#include "tempo/tz/TimeZone.h"

namespace facebook::tempo {

/// Amounts added to a CalendarDate. Any field may be negative or exceed its
/// unit's range; seconds are truncated to whole days toward negative
/// infinity.
struct DateDelta {
  int64_t years{0};
  int64_t months{0};
  int64_t days{0};
  int64_t seconds{0};
};

/// Fields to change in CalendarDate::replace(). Unset fields are kept.
struct DateReplacement {
  std::optional<uint16_t> year;
  std::optional<uint8_t> month;
  std::optional<uint8_t> day;
  std::optional<TimeZone> timeZone;
  /// The date keeps its distance from the epoch: it is re-expressed as the
  /// same number of days after the new calendar's epoch.
  std::optional<Calendar> calendar;
};

/// A civil date bound to a time zone and a calendar.
class CalendarDate {
 public:
  /// Throws a user error if the date does not exist in 'calendar'.
  CalendarDate(
      uint16_t year,
      uint8_t month,
      uint8_t day,
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar);

  /// Date of a Unix timestamp in 'timeZone'.
  static CalendarDate fromUnixEpoch(
      int64_t seconds,
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar);

  static CalendarDate today(
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar);

  /// Parses YYYY-MM-DD. Returns std::nullopt for malformed text or a date
  /// that does not exist in 'calendar'.
  static std::optional<CalendarDate> fromIso(
      std::string_view text,
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar);

  /// Unpacks a hash produced by hash<W>(). Throws a user error if the
  /// unpacked fields are not a valid date, which is always the case for the
  /// 8-bit layout and for years past 3 in the 16-bit layout.
  template <HashWidth W>
  static CalendarDate fromHash(
      HashType<W> value,
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar) {
    const auto fields = calendar.fromHash<W>(value);
    return CalendarDate(
        fields.year,
        fields.month,
        fields.day,
        std::move(timeZone),
        std::move(calendar));
  }

  uint16_t year() const {
    return year_;
  }

  uint8_t month() const {
    return month_;
  }

  uint8_t day() const {
    return day_;
  }

  const TimeZone& timeZone() const {
    return timeZone_;
  }

  const Calendar& calendar() const {
    return calendar_;
  }

  /// Returns a copy with the given fields changed. Throws a user error if the
  /// result is not a valid date.
  CalendarDate replace(const DateReplacement& replacement) const;

  /// Adds 'delta' and normalizes the result into the calendar's ranges,
  /// carrying days into months and months into years. Years wrap around
  /// within the calendar's year range.
  CalendarDate add(const DateDelta& delta) const;

  CalendarDate subtract(const DateDelta& delta) const;

  /// Monday is 0.
  uint8_t dayOfWeek() const {
    return calendar_.dayOfWeek(year_, month_, day_);
  }

  uint16_t dayOfYear() const {
    return calendar_.dayOfYear(year_, month_, day_);
  }

  uint64_t leapDaysSinceEpoch() const {
    return calendar_.leapDaysSinceEpoch(year_, month_, day_);
  }

  uint64_t daysSinceEpoch() const {
    return calendar_.daysSinceEpoch(year_, month_, day_);
  }

  uint64_t secondsSinceEpoch() const {
    return calendar_.secondsSinceEpoch(year_, month_, day_);
  }

  template <HashWidth W>
  HashType<W> hash() const {
    return calendar_.hash<W>(
        DateTimeFields{.year = year_, .month = month_, .day = day_});
  }

  std::string toIso() const;

  /// ISO date followed by the zone name.
  std::string toString() const;

  /// Equal dates have the same fields, time zone and calendar.
  bool operator==(const CalendarDate& other) const {
    return year_ == other.year_ && month_ == other.month_ &&
        day_ == other.day_ && timeZone_ == other.timeZone_ &&
        calendar_ == other.calendar_;
  }

  bool operator!=(const CalendarDate& other) const {
    return !(*this == other);
  }

  /// Ordering compares (year, month, day) only.
  bool operator<(const CalendarDate& other) const {
    return compare(other) < 0;
  }

  bool operator<=(const CalendarDate& other) const {
    return compare(other) <= 0;
  }

  bool operator>(const CalendarDate& other) const {
    return compare(other) > 0;
  }

  bool operator>=(const CalendarDate& other) const {
    return compare(other) >= 0;
  }

 private:
  int compare(const CalendarDate& other) const;

  uint16_t year_;
  uint8_t month_;
  uint8_t day_;
  TimeZone timeZone_;
  Calendar calendar_;
};

} // namespace facebook::tempo

template <>
struct fmt::formatter<facebook::tempo::CalendarDate>
    : fmt::formatter<std::string> {
  auto format(const facebook::tempo::CalendarDate& d, format_context& ctx)
      const {
    return formatter<std::string>::format(d.toString(), ctx);
  }
};
