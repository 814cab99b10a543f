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

#include "tempo/type/CalendarDate.h"

#include <chrono>

#include "tempo/common/base/CheckedArithmetic.h"
#include "tempo/common/base/Exceptions.h"
#include "tempo/type/CalendarDateTime.h"
#include "tempo/type/DateNormalization.h"
#include "tempo/type/Iso8601.h"

namespace facebook::tempo {
namespace {

constexpr int64_t kSecondsInDay = 86'400;

CalendarDate fromCivil(
    const util::CivilDate& date,
    const TimeZone& timeZone,
    const Calendar& calendar) {
  return CalendarDate(date.year, date.month, date.day, timeZone, calendar);
}

} // namespace

CalendarDate::CalendarDate(
    uint16_t year,
    uint8_t month,
    uint8_t day,
    TimeZone timeZone,
    Calendar calendar)
    : year_(year),
      month_(month),
      day_(day),
      timeZone_(std::move(timeZone)),
      calendar_(std::move(calendar)) {
  TEMPO_USER_CHECK(
      util::isValidDate(calendar_, year_, month_, day_),
      "Invalid date {:04}-{:02}-{:02} for calendar {}",
      year_,
      month_,
      day_,
      calendar_.toString());
}

CalendarDate CalendarDate::fromUnixEpoch(
    int64_t seconds,
    TimeZone timeZone,
    Calendar calendar) {
  return CalendarDateTime::fromUnixEpoch(
             seconds, std::move(timeZone), std::move(calendar))
      .date();
}

CalendarDate CalendarDate::today(TimeZone timeZone, Calendar calendar) {
  const auto now = std::chrono::system_clock::now();
  const int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(
                              now.time_since_epoch())
                              .count();
  return fromUnixEpoch(seconds, std::move(timeZone), std::move(calendar));
}

std::optional<CalendarDate> CalendarDate::fromIso(
    std::string_view text,
    TimeZone timeZone,
    Calendar calendar) {
  const auto parsed = parseIso(text, IsoFormat::kDate);
  if (parsed.hasError()) {
    return std::nullopt;
  }
  const auto& f = parsed.value().fields;
  if (!util::isValidDate(calendar, f.year, f.month, f.day)) {
    return std::nullopt;
  }
  return CalendarDate(
      f.year, f.month, f.day, std::move(timeZone), std::move(calendar));
}

CalendarDate CalendarDate::replace(const DateReplacement& replacement) const {
  CalendarDate result(
      replacement.year.value_or(year_),
      replacement.month.value_or(month_),
      replacement.day.value_or(day_),
      replacement.timeZone.value_or(timeZone_),
      calendar_);
  if (replacement.calendar.has_value()) {
    const Calendar& target = *replacement.calendar;
    const auto& limits = target.limits();
    const auto date = util::normalizeDate(
        target,
        limits.minYear,
        limits.minMonth,
        int64_t{limits.minDay} + static_cast<int64_t>(result.daysSinceEpoch()));
    return fromCivil(date, result.timeZone_, target);
  }
  return result;
}

CalendarDate CalendarDate::add(const DateDelta& delta) const {
  const int64_t days =
      checkedPlus<int64_t>(delta.days, floorDiv(delta.seconds, kSecondsInDay));
  const auto date = util::normalizeDate(
      calendar_,
      checkedPlus<int64_t>(year_, delta.years),
      checkedPlus<int64_t>(month_, delta.months),
      checkedPlus<int64_t>(day_, days));
  return fromCivil(date, timeZone_, calendar_);
}

CalendarDate CalendarDate::subtract(const DateDelta& delta) const {
  return add(DateDelta{
      .years = checkedMinus<int64_t>(0, delta.years),
      .months = checkedMinus<int64_t>(0, delta.months),
      .days = checkedMinus<int64_t>(0, delta.days),
      .seconds = checkedMinus<int64_t>(0, delta.seconds)});
}

std::string CalendarDate::toIso() const {
  return formatIso(
      DateTimeFields{.year = year_, .month = month_, .day = day_},
      IsoFormat::kDate);
}

std::string CalendarDate::toString() const {
  return fmt::format("{} {}", toIso(), timeZone_.name());
}

int CalendarDate::compare(const CalendarDate& other) const {
  if (year_ != other.year_) {
    return year_ < other.year_ ? -1 : 1;
  }
  if (month_ != other.month_) {
    return month_ < other.month_ ? -1 : 1;
  }
  if (day_ != other.day_) {
    return day_ < other.day_ ? -1 : 1;
  }
  return 0;
}

} // namespace facebook::tempo
