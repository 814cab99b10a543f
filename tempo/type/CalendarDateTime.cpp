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

#include "tempo/type/CalendarDateTime.h"

#include <chrono>
#include <limits>
#include <tuple>

#include "tempo/common/base/CheckedArithmetic.h"
#include "tempo/common/base/Exceptions.h"
#include "tempo/type/DateNormalization.h"

namespace facebook::tempo {
namespace {

constexpr int64_t kSecondsInDay = 86'400;
constexpr int64_t kNanosInSecond = 1'000'000'000;

CalendarDateTime fromCivil(
    const util::CivilDateTime& c,
    const TimeZone& timeZone,
    const Calendar& calendar) {
  return CalendarDateTime(
      c.date.year,
      c.date.month,
      c.date.day,
      c.hour,
      c.minute,
      c.second,
      c.millisecond,
      c.microsecond,
      c.nanosecond,
      timeZone,
      calendar);
}

CalendarDateTime fromUnix(
    int64_t seconds,
    int64_t nanos,
    const TimeZone& timeZone,
    const Calendar& calendar) {
  const auto utc = util::normalizeDateTime(
      calendar, 1970, 1, 1, 0, 0, seconds, 0, 0, nanos);
  return fromCivil(utc, TimeZone(), calendar).fromUtc(timeZone);
}

Calendar widened(const Calendar& calendar) {
  const auto& limits = calendar.limits();
  return calendar.withYearRange(
      limits.minYear > 0 ? limits.minYear - 1 : limits.minYear,
      limits.maxYear < std::numeric_limits<uint16_t>::max() ? limits.maxYear + 1
                                                            : limits.maxYear);
}

} // namespace

__int128_t NanosecondDelta::total() const {
  const __int128_t later = sign >= 0 ? selfNs : otherNs;
  const __int128_t earlier = sign >= 0 ? otherNs : selfNs;
  return sign *
      (later - earlier + __int128_t{overflowSeconds} * kNanosInSecond);
}

CalendarDateTime::CalendarDateTime(
    uint16_t year,
    uint8_t month,
    uint8_t day,
    uint8_t hour,
    uint8_t minute,
    uint8_t second,
    uint16_t millisecond,
    uint16_t microsecond,
    uint16_t nanosecond,
    TimeZone timeZone,
    Calendar calendar)
    : year_(year),
      month_(month),
      day_(day),
      hour_(hour),
      minute_(minute),
      second_(second),
      millisecond_(millisecond),
      microsecond_(microsecond),
      nanosecond_(nanosecond),
      timeZone_(std::move(timeZone)),
      calendar_(std::move(calendar)) {
  TEMPO_USER_CHECK(
      util::isValidDateTime(
          calendar_,
          year_,
          month_,
          day_,
          hour_,
          minute_,
          second_,
          millisecond_,
          microsecond_,
          nanosecond_),
      "Invalid date/time {}.{:03}{:03}{:03} for calendar {}",
      formatIso(fields(), IsoFormat::kFull),
      millisecond_,
      microsecond_,
      nanosecond_,
      calendar_.toString());
}

CalendarDateTime CalendarDateTime::now(TimeZone timeZone, Calendar calendar) {
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
  return fromUnixEpochNanos(nanos, std::move(timeZone), std::move(calendar));
}

CalendarDateTime CalendarDateTime::fromUnixEpoch(
    int64_t seconds,
    TimeZone timeZone,
    Calendar calendar) {
  return fromUnix(seconds, 0, timeZone, calendar);
}

CalendarDateTime CalendarDateTime::fromUnixEpochNanos(
    int64_t nanos,
    TimeZone timeZone,
    Calendar calendar) {
  return fromUnix(
      floorDiv(nanos, kNanosInSecond),
      floorMod(nanos, kNanosInSecond),
      timeZone,
      calendar);
}

std::optional<CalendarDateTime> CalendarDateTime::fromIso(
    std::string_view text,
    IsoFormat format,
    TimeZone timeZone,
    Calendar calendar) {
  if (format == IsoFormat::kTime) {
    return std::nullopt;
  }
  const auto parsed = parseIso(text, format);
  if (parsed.hasError()) {
    return std::nullopt;
  }
  const auto& f = parsed.value().fields;
  if (!util::isValidDateTime(
          calendar,
          f.year,
          f.month,
          f.day,
          f.hour,
          f.minute,
          f.second,
          0,
          0,
          0)) {
    return std::nullopt;
  }
  if (const auto& offset = parsed.value().offset) {
    timeZone = TimeZone(offset->toString(), *offset);
  }
  return CalendarDateTime(
      f.year,
      f.month,
      f.day,
      f.hour,
      f.minute,
      f.second,
      0,
      0,
      0,
      std::move(timeZone),
      std::move(calendar));
}

std::optional<CalendarDateTime> CalendarDateTime::strptime(
    const std::string& text,
    const std::string& pattern,
    TimeZone timeZone,
    Calendar calendar) {
  const auto parsed = parseStrptime(text, pattern);
  if (parsed.hasError()) {
    return std::nullopt;
  }
  const auto& f = parsed.value();
  if (!util::isValidDateTime(
          calendar,
          f.year,
          f.month,
          f.day,
          f.hour,
          f.minute,
          f.second,
          0,
          0,
          0)) {
    return std::nullopt;
  }
  return CalendarDateTime(
      f.year,
      f.month,
      f.day,
      f.hour,
      f.minute,
      f.second,
      0,
      0,
      0,
      std::move(timeZone),
      std::move(calendar));
}

CalendarDateTime CalendarDateTime::replace(
    const DateTimeReplacement& r) const {
  CalendarDateTime result(
      r.year.value_or(year_),
      r.month.value_or(month_),
      r.day.value_or(day_),
      r.hour.value_or(hour_),
      r.minute.value_or(minute_),
      r.second.value_or(second_),
      r.millisecond.value_or(millisecond_),
      r.microsecond.value_or(microsecond_),
      r.nanosecond.value_or(nanosecond_),
      r.timeZone.value_or(timeZone_),
      calendar_);
  if (!r.calendar.has_value()) {
    return result;
  }
  const Calendar& target = *r.calendar;
  const auto& limits = target.limits();
  const uint64_t days =
      result.calendar_.daysSinceEpoch(result.year_, result.month_, result.day_);
  const auto c = util::normalizeDateTime(
      target,
      limits.minYear,
      limits.minMonth,
      int64_t{limits.minDay} + static_cast<int64_t>(days),
      result.hour_,
      result.minute_,
      result.second_,
      result.millisecond_,
      result.microsecond_,
      result.nanosecond_);
  return fromCivil(c, result.timeZone_, target);
}

CalendarDateTime CalendarDateTime::add(const DateTimeDelta& delta) const {
  const auto c = util::normalizeDateTime(
      calendar_,
      checkedPlus<int64_t>(year_, delta.years),
      checkedPlus<int64_t>(month_, delta.months),
      checkedPlus<int64_t>(day_, delta.days),
      checkedPlus<int64_t>(hour_, delta.hours),
      checkedPlus<int64_t>(minute_, delta.minutes),
      checkedPlus<int64_t>(second_, delta.seconds),
      checkedPlus<int64_t>(millisecond_, delta.milliseconds),
      checkedPlus<int64_t>(microsecond_, delta.microseconds),
      checkedPlus<int64_t>(nanosecond_, delta.nanoseconds));
  return fromCivil(c, timeZone_, calendar_);
}

CalendarDateTime CalendarDateTime::subtract(const DateTimeDelta& delta) const {
  return add(DateTimeDelta{
      .years = checkedMinus<int64_t>(0, delta.years),
      .months = checkedMinus<int64_t>(0, delta.months),
      .days = checkedMinus<int64_t>(0, delta.days),
      .hours = checkedMinus<int64_t>(0, delta.hours),
      .minutes = checkedMinus<int64_t>(0, delta.minutes),
      .seconds = checkedMinus<int64_t>(0, delta.seconds),
      .milliseconds = checkedMinus<int64_t>(0, delta.milliseconds),
      .microseconds = checkedMinus<int64_t>(0, delta.microseconds),
      .nanoseconds = checkedMinus<int64_t>(0, delta.nanoseconds)});
}

NanosecondDelta CalendarDateTime::deltaNs(
    const CalendarDateTime& other) const {
  const auto [self, that] = utcInstants(other);

  NanosecondDelta delta;
  delta.sign = self.compareFields(that) >= 0 ? 1 : -1;
  const auto& earlier = delta.sign > 0 ? that : self;
  const auto& later = delta.sign > 0 ? self : that;

  // Both operands are measured on one calendar, moved to the earlier year.
  const Calendar anchored = self.calendar_.withEpochYear(earlier.year_);
  const uint16_t years = later.year_ - earlier.year_;
  uint16_t laterYear = later.year_;
  if (years > NanosecondDelta::kMaxNanosecondYears) {
    constexpr uint16_t kBlock = NanosecondDelta::kOverflowBlockYears;
    const uint16_t excess = years - NanosecondDelta::kMaxNanosecondYears;
    delta.overflowYears = (excess + kBlock - 1) / kBlock * kBlock;
    laterYear = later.year_ - delta.overflowYears;
    const uint64_t days = anchored.daysInYears(laterYear, delta.overflowYears);
    const uint64_t leapSeconds =
        anchored.leapSecondsSinceEpoch(later.year_, later.month_, later.day_) -
        anchored.leapSecondsSinceEpoch(laterYear, later.month_, later.day_);
    delta.overflowSeconds = days * kSecondsInDay + leapSeconds;
  }

  const uint64_t earlierNs = anchored.nanosSinceEpoch(
      earlier.year_,
      earlier.month_,
      earlier.day_,
      earlier.hour_,
      earlier.minute_,
      earlier.second_,
      earlier.millisecond_,
      earlier.microsecond_,
      earlier.nanosecond_);
  const uint64_t laterNs = anchored.nanosSinceEpoch(
      laterYear,
      later.month_,
      later.day_,
      later.hour_,
      later.minute_,
      later.second_,
      later.millisecond_,
      later.microsecond_,
      later.nanosecond_);
  delta.selfNs = delta.sign > 0 ? laterNs : earlierNs;
  delta.otherNs = delta.sign > 0 ? earlierNs : laterNs;
  return delta;
}

CalendarDateTime CalendarDateTime::shiftTo(
    const TimeZone& timeZone,
    int64_t minutes) const {
  if (minutes == 0) {
    return replace({.timeZone = timeZone});
  }
  const auto c = util::normalizeDateTime(
      calendar_,
      year_,
      month_,
      day_,
      hour_,
      int64_t{minute_} + minutes,
      second_,
      millisecond_,
      microsecond_,
      nanosecond_);
  auto result = fromCivil(c, timeZone, calendar_);
  // Keep secondsSinceEpoch() apart by exactly the shift when the move crosses
  // a change in the cumulative leap-second count.
  const int64_t correction = static_cast<int64_t>(
                                 result.leapSecondsSinceEpoch()) -
      static_cast<int64_t>(leapSecondsSinceEpoch());
  if (correction != 0) {
    result = result.add({.seconds = -correction});
  }
  return result;
}

CalendarDateTime CalendarDateTime::toUtc() const {
  const Offset offset = timeZone_.offsetAt(
      year_, month_, day_, hour_, minute_, second_, calendar_);
  return shiftTo(TimeZone(), -offset.totalMinutes());
}

CalendarDateTime CalendarDateTime::fromUtc(const TimeZone& timeZone) const {
  const Offset guess = timeZone.offsetAt(
      year_, month_, day_, hour_, minute_, second_, calendar_);
  auto local = shiftTo(timeZone, guess.totalMinutes());
  // The offset is defined on local time; resolve it again once the local
  // time is known.
  const Offset resolved = timeZone.offsetAt(
      local.year_,
      local.month_,
      local.day_,
      local.hour_,
      local.minute_,
      local.second_,
      calendar_);
  if (resolved != guess) {
    local = shiftTo(timeZone, resolved.totalMinutes());
  }
  return local;
}

std::string CalendarDateTime::toIso(IsoFormat format) const {
  Offset offset;
  if (format == IsoFormat::kFullWithOffset) {
    offset = timeZone_.offsetAt(
        year_, month_, day_, hour_, minute_, second_, calendar_);
  }
  return formatIso(fields(), format, offset);
}

std::optional<std::string> CalendarDateTime::strftime(
    const std::string& pattern) const {
  auto formatted =
      formatStrftime(fields(), pattern, dayOfWeek(), dayOfYear());
  if (formatted.hasError()) {
    return std::nullopt;
  }
  return std::move(formatted.value());
}

std::string CalendarDateTime::toString() const {
  return fmt::format(
      "{}.{:03}{:03}{:03} {}",
      formatIso(fields(), IsoFormat::kFull),
      millisecond_,
      microsecond_,
      nanosecond_,
      timeZone_.name());
}

int CalendarDateTime::compare(const CalendarDateTime& other) const {
  if (calendar_ == other.calendar_ && timeZone_ == other.timeZone_ &&
      !timeZone_.hasDst()) {
    return compareFields(other);
  }
  const auto [self, that] = utcInstants(other);
  return self.compareFields(that);
}

std::pair<CalendarDateTime, CalendarDateTime> CalendarDateTime::utcInstants(
    const CalendarDateTime& other) const {
  const Calendar wide = widened(calendar_);
  const auto toWideUtc = [&](const CalendarDateTime& d) {
    return CalendarDateTime(
               d.year_,
               d.month_,
               d.day_,
               d.hour_,
               d.minute_,
               d.second_,
               d.millisecond_,
               d.microsecond_,
               d.nanosecond_,
               d.timeZone_,
               wide)
        .toUtc();
  };
  if (other.calendar_ == calendar_) {
    return {toWideUtc(*this), toWideUtc(other)};
  }
  return {toWideUtc(*this), toWideUtc(other.replace({.calendar = calendar_}))};
}

int CalendarDateTime::compareFields(const CalendarDateTime& other) const {
  const auto lhs = std::tie(
      year_,
      month_,
      day_,
      hour_,
      minute_,
      second_,
      millisecond_,
      microsecond_,
      nanosecond_);
  const auto rhs = std::tie(
      other.year_,
      other.month_,
      other.day_,
      other.hour_,
      other.minute_,
      other.second_,
      other.millisecond_,
      other.microsecond_,
      other.nanosecond_);
  if (lhs < rhs) {
    return -1;
  }
  return rhs < lhs ? 1 : 0;
}

} // namespace facebook::tempo
