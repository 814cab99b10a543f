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

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "tempo/calendar/BitHashLayout.h"

namespace facebook::tempo {

/// Valid range of every civil field for a calendar. The epoch of a calendar is
/// January 1st, 00:00:00 of 'minYear'.
struct CalendarLimits {
  uint16_t minYear;
  uint16_t maxYear;
  uint8_t minMonth{1};
  uint8_t maxMonth{12};
  uint8_t minDay{1};
  uint8_t maxDay{31};
  uint8_t minHour{0};
  uint8_t maxHour{23};
  uint8_t minMinute{0};
  uint8_t maxMinute{59};
  uint8_t minSecond{0};
  uint8_t maxSecond{59};
  uint16_t minMillisecond{0};
  uint16_t maxMillisecond{999};
  uint16_t minMicrosecond{0};
  uint16_t maxMicrosecond{999};
  uint16_t minNanosecond{0};
  uint16_t maxNanosecond{999};

  bool operator==(const CalendarLimits& other) const = default;
};

enum class CalendarKind : uint8_t {
  kGregorian = 0,
  kFastUtc = 1,
};

std::string_view toString(CalendarKind kind);

namespace detail {
[[noreturn]] void throwInvalidYearRange(uint16_t minYear, uint16_t maxYear);
} // namespace detail

/// Proleptic Gregorian calendar. Leap seconds follow a constant model: every
/// date in or after 1972 carries 27 leap seconds. isLeapSecond() still
/// recognizes 23:59:60 on each of the 27 historical insertion dates, so such
/// timestamps can be represented.
class GregorianCalendar {
 public:
  static constexpr CalendarKind kKind = CalendarKind::kGregorian;

  /// First year with leap seconds and the number of them from then on.
  static constexpr uint16_t kLeapSecondYear = 1972;
  static constexpr uint64_t kLeapSeconds = 27;

  constexpr explicit GregorianCalendar(
      uint16_t minYear = 1,
      uint16_t maxYear = 9999)
      : limits_{.minYear = minYear, .maxYear = maxYear} {
    if (minYear > maxYear) {
      detail::throwInvalidYearRange(minYear, maxYear);
    }
  }

  const CalendarLimits& limits() const {
    return limits_;
  }

  static constexpr bool isLeapYear(uint16_t year) {
    return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
  }

  bool isLeapSecond(
      uint16_t year,
      uint8_t month,
      uint8_t day,
      uint8_t hour,
      uint8_t minute,
      uint8_t second) const;

  /// Monday is 0.
  uint8_t dayOfWeek(uint16_t year, uint8_t month, uint8_t day) const;

  /// January 1st is 1.
  uint16_t dayOfYear(uint16_t year, uint8_t month, uint8_t day) const;

  uint8_t maxDaysInMonth(uint16_t year, uint8_t month) const;

  uint64_t leapSecondsSinceEpoch(uint16_t year, uint8_t month, uint8_t day)
      const;

  /// Number of February 29ths between the epoch and the given date, the date
  /// itself excluded.
  uint64_t leapDaysSinceEpoch(uint16_t year, uint8_t month, uint8_t day)
      const;

  uint64_t daysSinceEpoch(uint16_t year, uint8_t month, uint8_t day) const;

  /// Whole days times 86400 plus the intraday seconds plus the leap-second
  /// correction of the date.
  uint64_t secondsSinceEpoch(
      uint16_t year,
      uint8_t month,
      uint8_t day,
      uint8_t hour,
      uint8_t minute,
      uint8_t second) const;

  /// A calendar with the same rules anchored at 'year'.
  GregorianCalendar withEpochYear(uint16_t year) const {
    return GregorianCalendar(year, std::max(year, limits_.maxYear));
  }

  /// Days in 'years' consecutive years starting at 'fromYear'.
  uint64_t daysInYears(uint16_t fromYear, uint16_t years) const;

  bool operator==(const GregorianCalendar& other) const = default;

 private:
  CalendarLimits limits_;
};

/// 365-day years made of twelve 30-day months, with December absorbing the
/// remaining 5 days. No leap years and no leap seconds. Dates computed with
/// it are not civil dates; it exists for the fixed-width date/time values and
/// for fast comparisons.
class FastUtcCalendar {
 public:
  static constexpr CalendarKind kKind = CalendarKind::kFastUtc;

  static constexpr uint8_t kDaysInMonth = 30;
  static constexpr uint8_t kDaysInDecember = 35;
  static constexpr uint16_t kDaysInYear = 365;

  constexpr explicit FastUtcCalendar(
      uint16_t minYear = 1970,
      uint16_t maxYear = 9999)
      : limits_{.minYear = minYear, .maxYear = maxYear, .maxDay = 35} {
    if (minYear > maxYear) {
      detail::throwInvalidYearRange(minYear, maxYear);
    }
  }

  const CalendarLimits& limits() const {
    return limits_;
  }

  static constexpr bool isLeapYear(uint16_t /*year*/) {
    return false;
  }

  bool isLeapSecond(
      uint16_t /*year*/,
      uint8_t /*month*/,
      uint8_t /*day*/,
      uint8_t /*hour*/,
      uint8_t /*minute*/,
      uint8_t /*second*/) const {
    return false;
  }

  /// Monday is 0. 1970-01-01 is a Thursday whatever the epoch year.
  uint8_t dayOfWeek(uint16_t year, uint8_t month, uint8_t day) const;

  uint16_t dayOfYear(uint16_t year, uint8_t month, uint8_t day) const;

  uint8_t maxDaysInMonth(uint16_t /*year*/, uint8_t month) const {
    return month == 12 ? kDaysInDecember : kDaysInMonth;
  }

  uint64_t leapSecondsSinceEpoch(
      uint16_t /*year*/,
      uint8_t /*month*/,
      uint8_t /*day*/) const {
    return 0;
  }

  uint64_t leapDaysSinceEpoch(
      uint16_t /*year*/,
      uint8_t /*month*/,
      uint8_t /*day*/) const {
    return 0;
  }

  uint64_t daysSinceEpoch(uint16_t year, uint8_t month, uint8_t day) const;

  uint64_t secondsSinceEpoch(
      uint16_t year,
      uint8_t month,
      uint8_t day,
      uint8_t hour,
      uint8_t minute,
      uint8_t second) const;

  FastUtcCalendar withEpochYear(uint16_t year) const {
    return FastUtcCalendar(year, std::max(year, limits_.maxYear));
  }

  uint64_t daysInYears(uint16_t /*fromYear*/, uint16_t years) const {
    return uint64_t{kDaysInYear} * years;
  }

  /// Decomposes a millisecond counter measured from the epoch.
  DateTimeFields fieldsFromMillis(uint64_t millis) const;

  bool operator==(const FastUtcCalendar& other) const = default;

 private:
  CalendarLimits limits_;
};

/// A calendar is one of a closed set of implementations. Every operation is
/// dispatched with std::visit, so adding an alternative fails to compile
/// until it implements the full operation set.
class Calendar {
 public:
  using Variant = std::variant<GregorianCalendar, FastUtcCalendar>;

  constexpr Calendar(GregorianCalendar calendar) : impl_(calendar) {}
  constexpr Calendar(FastUtcCalendar calendar) : impl_(calendar) {}

 private:
  // Precedes its callers, which need the deduced return type.
  template <typename F>
  decltype(auto) visit(F&& f) const {
    return std::visit(std::forward<F>(f), impl_);
  }

 public:
  CalendarKind kind() const {
    return visit([](const auto& c) { return c.kKind; });
  }

  const CalendarLimits& limits() const {
    return visit(
        [](const auto& c) -> const CalendarLimits& { return c.limits(); });
  }

  uint16_t minYear() const {
    return limits().minYear;
  }

  uint16_t maxYear() const {
    return limits().maxYear;
  }

  bool isLeapYear(uint16_t year) const {
    return visit([&](const auto& c) { return c.isLeapYear(year); });
  }

  bool isLeapSecond(
      uint16_t year,
      uint8_t month,
      uint8_t day,
      uint8_t hour,
      uint8_t minute,
      uint8_t second) const {
    return visit([&](const auto& c) {
      return c.isLeapSecond(year, month, day, hour, minute, second);
    });
  }

  uint8_t dayOfWeek(uint16_t year, uint8_t month, uint8_t day) const {
    return visit([&](const auto& c) { return c.dayOfWeek(year, month, day); });
  }

  uint16_t dayOfYear(uint16_t year, uint8_t month, uint8_t day) const {
    return visit([&](const auto& c) { return c.dayOfYear(year, month, day); });
  }

  uint8_t maxDaysInMonth(uint16_t year, uint8_t month) const {
    return visit([&](const auto& c) { return c.maxDaysInMonth(year, month); });
  }

  /// Returns the weekday of the first day of the month and the number of days
  /// in the month.
  std::pair<uint8_t, uint8_t> monthRange(uint16_t year, uint8_t month) const;

  uint64_t leapSecondsSinceEpoch(uint16_t year, uint8_t month, uint8_t day)
      const {
    return visit([&](const auto& c) {
      return c.leapSecondsSinceEpoch(year, month, day);
    });
  }

  uint64_t leapDaysSinceEpoch(uint16_t year, uint8_t month, uint8_t day)
      const {
    return visit(
        [&](const auto& c) { return c.leapDaysSinceEpoch(year, month, day); });
  }

  uint64_t daysSinceEpoch(uint16_t year, uint8_t month, uint8_t day) const {
    return visit(
        [&](const auto& c) { return c.daysSinceEpoch(year, month, day); });
  }

  uint64_t secondsSinceEpoch(
      uint16_t year,
      uint8_t month,
      uint8_t day,
      uint8_t hour = 0,
      uint8_t minute = 0,
      uint8_t second = 0) const {
    return visit([&](const auto& c) {
      return c.secondsSinceEpoch(year, month, day, hour, minute, second);
    });
  }

  uint64_t millisSinceEpoch(
      uint16_t year,
      uint8_t month,
      uint8_t day,
      uint8_t hour = 0,
      uint8_t minute = 0,
      uint8_t second = 0,
      uint16_t millisecond = 0) const;

  /// Throws an arithmetic error when the result does not fit 64 bits, which
  /// happens roughly 584 years after the epoch.
  uint64_t nanosSinceEpoch(
      uint16_t year,
      uint8_t month,
      uint8_t day,
      uint8_t hour = 0,
      uint8_t minute = 0,
      uint8_t second = 0,
      uint16_t millisecond = 0,
      uint16_t microsecond = 0,
      uint16_t nanosecond = 0) const;

  /// Days in 'years' consecutive years starting at 'fromYear'.
  uint64_t daysInYears(uint16_t fromYear, uint16_t years) const {
    return visit([&](const auto& c) { return c.daysInYears(fromYear, years); });
  }

  /// Same rules, epoch moved to January 1st of 'year'.
  Calendar withEpochYear(uint16_t year) const {
    return visit(
        [&](const auto& c) { return Calendar(c.withEpochYear(year)); });
  }

  /// Same rules over [minYear, maxYear].
  Calendar withYearRange(uint16_t minYear, uint16_t maxYear) const {
    return visit([&](const auto& c) {
      return Calendar(std::decay_t<decltype(c)>(minYear, maxYear));
    });
  }

  template <HashWidth W>
  HashType<W> hash(const DateTimeFields& fields) const {
    return pack<W>(fields);
  }

  template <HashWidth W>
  DateTimeFields fromHash(HashType<W> value) const {
    return unpack<W>(value);
  }

  const Variant& variant() const {
    return impl_;
  }

  bool operator==(const Calendar& other) const {
    return impl_ == other.impl_;
  }

  std::string toString() const;

 private:
  Variant impl_;
};

/// Proleptic Gregorian calendar with its epoch in year 1.
inline constexpr Calendar kGregorianCalendar{GregorianCalendar{1, 9999}};

/// Gregorian calendar with the Unix epoch.
inline constexpr Calendar kUtcCalendar{GregorianCalendar{1970, 9999}};

/// The frozen calendar used by the fixed-width date/time values.
inline constexpr Calendar kFastUtcCalendar{FastUtcCalendar{1970, 9999}};

} // namespace facebook::tempo
