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
#include <utility>

#include <fmt/format.h>

#include "tempo/calendar/Calendar.h"
#include "tempo/tz/TimeZone.h"
#include "tempo/type/CalendarDate.h"
#include "tempo/type/Iso8601.h"

namespace facebook::tempo {

/// Amounts added to a CalendarDateTime. Any field may be negative or exceed
/// its unit's range.
struct DateTimeDelta {
  int64_t years{0};
  int64_t months{0};
  int64_t days{0};
  int64_t hours{0};
  int64_t minutes{0};
  int64_t seconds{0};
  int64_t milliseconds{0};
  int64_t microseconds{0};
  int64_t nanoseconds{0};
};

/// Fields to change in CalendarDateTime::replace(). Unset fields are kept.
struct DateTimeReplacement {
  std::optional<uint16_t> year;
  std::optional<uint8_t> month;
  std::optional<uint8_t> day;
  std::optional<uint8_t> hour;
  std::optional<uint8_t> minute;
  std::optional<uint8_t> second;
  std::optional<uint16_t> millisecond;
  std::optional<uint16_t> microsecond;
  std::optional<uint16_t> nanosecond;
  std::optional<TimeZone> timeZone;
  /// Keeps the distance from the epoch, see DateReplacement::calendar.
  std::optional<Calendar> calendar;
};

/// Difference between two date/times in nanoseconds, split so that no part
/// overflows 64 bits. Both operands are measured from January 1st of the
/// earlier operand's year. When the later operand is more than
/// kMaxNanosecondYears after that, whole 400-year blocks are removed from it
/// first; 'overflowYears' counts them and 'overflowSeconds' holds their
/// length.
struct NanosecondDelta {
  /// Years a 64-bit nanosecond counter covers, with margin.
  static constexpr uint16_t kMaxNanosecondYears = 580;
  /// Block size removed from the later operand. A multiple of the Gregorian
  /// 400-year cycle keeps month, day and weekday unchanged.
  static constexpr uint16_t kOverflowBlockYears = 400;

  uint64_t selfNs{0};
  uint64_t otherNs{0};
  uint16_t overflowYears{0};
  /// 1 if self is at or after other, -1 otherwise.
  int8_t sign{1};
  int64_t overflowSeconds{0};

  /// Exact signed difference self - other in nanoseconds.
  __int128_t total() const;
};

/// A civil date and time down to the nanosecond bound to a time zone and a
/// calendar.
class CalendarDateTime {
 public:
  /// Throws a user error if the fields are not valid in 'calendar'. Second 60
  /// is accepted on leap seconds only.
  CalendarDateTime(
      uint16_t year,
      uint8_t month,
      uint8_t day,
      uint8_t hour = 0,
      uint8_t minute = 0,
      uint8_t second = 0,
      uint16_t millisecond = 0,
      uint16_t microsecond = 0,
      uint16_t nanosecond = 0,
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar);

  /// Current time in 'timeZone'.
  static CalendarDateTime now(
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar);

  /// Local time in 'timeZone' of a Unix timestamp.
  static CalendarDateTime fromUnixEpoch(
      int64_t seconds,
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar);

  static CalendarDateTime fromUnixEpochNanos(
      int64_t nanos,
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar);

  /// Parses 'text' in 'format', which must carry a date. With
  /// IsoFormat::kFullWithOffset the result is bound to a fixed-offset zone
  /// named after the parsed offset and 'timeZone' is ignored. Returns
  /// std::nullopt for malformed text or fields invalid in 'calendar'.
  static std::optional<CalendarDateTime> fromIso(
      std::string_view text,
      IsoFormat format = IsoFormat::kFull,
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar);

  /// Parses with a strptime(3) pattern.
  static std::optional<CalendarDateTime> strptime(
      const std::string& text,
      const std::string& pattern,
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar);

  template <HashWidth W>
  static CalendarDateTime fromHash(
      HashType<W> value,
      TimeZone timeZone = TimeZone(),
      Calendar calendar = kGregorianCalendar) {
    const auto f = calendar.fromHash<W>(value);
    return CalendarDateTime(
        f.year,
        f.month,
        f.day,
        f.hour,
        f.minute,
        f.second,
        f.millisecond,
        f.microsecond,
        0,
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
  uint8_t hour() const {
    return hour_;
  }
  uint8_t minute() const {
    return minute_;
  }
  uint8_t second() const {
    return second_;
  }
  uint16_t millisecond() const {
    return millisecond_;
  }
  uint16_t microsecond() const {
    return microsecond_;
  }
  uint16_t nanosecond() const {
    return nanosecond_;
  }

  const TimeZone& timeZone() const {
    return timeZone_;
  }

  const Calendar& calendar() const {
    return calendar_;
  }

  CalendarDate date() const {
    return CalendarDate(year_, month_, day_, timeZone_, calendar_);
  }

  CalendarDateTime replace(const DateTimeReplacement& replacement) const;

  /// Adds 'delta', carrying nanoseconds up through microseconds,
  /// milliseconds, seconds, minutes, hours, days, months and years in a
  /// single pass. Years wrap around within the calendar's year range.
  CalendarDateTime add(const DateTimeDelta& delta) const;

  CalendarDateTime subtract(const DateTimeDelta& delta) const;

  uint8_t dayOfWeek() const {
    return calendar_.dayOfWeek(year_, month_, day_);
  }

  uint16_t dayOfYear() const {
    return calendar_.dayOfYear(year_, month_, day_);
  }

  uint64_t leapSecondsSinceEpoch() const {
    return calendar_.leapSecondsSinceEpoch(year_, month_, day_);
  }

  uint64_t leapDaysSinceEpoch() const {
    return calendar_.leapDaysSinceEpoch(year_, month_, day_);
  }

  uint64_t secondsSinceEpoch() const {
    return calendar_.secondsSinceEpoch(
        year_, month_, day_, hour_, minute_, second_);
  }

  /// Throws an arithmetic error past the range of a 64-bit counter, see
  /// deltaNs() for differences between distant date/times.
  uint64_t nanosSinceEpoch() const {
    return calendar_.nanosSinceEpoch(
        year_,
        month_,
        day_,
        hour_,
        minute_,
        second_,
        millisecond_,
        microsecond_,
        nanosecond_);
  }

  /// Difference to 'other' measured on UTC instants, valid over the whole
  /// year range of the calendar. If 'other' uses another calendar it is
  /// first moved onto this one with replace().
  NanosecondDelta deltaNs(const CalendarDateTime& other) const;

  /// The same instant in UTC. A result before the first or after the last
  /// year of the calendar wraps around like add() does; comparisons and
  /// deltaNs() do not depend on it.
  CalendarDateTime toUtc() const;

  /// Reads this date/time as UTC and returns the same instant in
  /// 'timeZone'.
  CalendarDateTime fromUtc(const TimeZone& timeZone) const;

  template <HashWidth W>
  HashType<W> hash() const {
    return calendar_.hash<W>(fields());
  }

  DateTimeFields fields() const {
    return DateTimeFields{
        .year = year_,
        .month = month_,
        .day = day_,
        .hour = hour_,
        .minute = minute_,
        .second = second_,
        .millisecond = millisecond_,
        .microsecond = microsecond_};
  }

  /// kFullWithOffset writes the offset resolved at this date/time.
  std::string toIso(IsoFormat format = IsoFormat::kFull) const;

  /// Returns std::nullopt if 'pattern' yields no output.
  std::optional<std::string> strftime(const std::string& pattern) const;

  std::string toString() const;

  /// Comparisons are on UTC instants, so equal date/times may carry
  /// different zones. An operand on another calendar is moved onto this one
  /// with replace() first.
  bool operator==(const CalendarDateTime& other) const {
    return compare(other) == 0;
  }

  bool operator!=(const CalendarDateTime& other) const {
    return compare(other) != 0;
  }

  bool operator<(const CalendarDateTime& other) const {
    return compare(other) < 0;
  }

  bool operator<=(const CalendarDateTime& other) const {
    return compare(other) <= 0;
  }

  bool operator>(const CalendarDateTime& other) const {
    return compare(other) > 0;
  }

  bool operator>=(const CalendarDateTime& other) const {
    return compare(other) >= 0;
  }

 private:
  int compare(const CalendarDateTime& other) const;

  // Fields compared lexicographically, zone and calendar ignored.
  int compareFields(const CalendarDateTime& other) const;

  // This date/time and 'other' as UTC instants on this calendar extended by
  // one year at each end, where the UTC shift cannot wrap the year.
  std::pair<CalendarDateTime, CalendarDateTime> utcInstants(
      const CalendarDateTime& other) const;

  // Shifts by 'minutes' into 'timeZone', then corrects the intraday time by
  // the change in cumulative leap seconds.
  CalendarDateTime shiftTo(const TimeZone& timeZone, int64_t minutes) const;

  uint16_t year_;
  uint8_t month_;
  uint8_t day_;
  uint8_t hour_;
  uint8_t minute_;
  uint8_t second_;
  uint16_t millisecond_;
  uint16_t microsecond_;
  uint16_t nanosecond_;
  TimeZone timeZone_;
  Calendar calendar_;
};

} // namespace facebook::tempo

template <>
struct fmt::formatter<facebook::tempo::CalendarDateTime>
    : fmt::formatter<std::string> {
  auto format(const facebook::tempo::CalendarDateTime& d, format_context& ctx)
      const {
    return formatter<std::string>::format(d.toString(), ctx);
  }
};
