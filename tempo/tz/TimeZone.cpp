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

#include "tempo/tz/TimeZone.h"

#include "tempo/tz/ZoneRegistry.h"

namespace facebook::tempo {
namespace {

// Whether the civil (day, hour) is at or after the instant 'rule' fires in
// (year, month).
bool atOrAfter(
    const TransitionRule& rule,
    const Calendar& calendar,
    uint16_t year,
    uint8_t day,
    uint8_t hour) {
  const uint8_t transitionDay = rule.transitionDay(calendar, year);
  if (day != transitionDay) {
    return day > transitionDay;
  }
  return hour >= rule.hour();
}

} // namespace

bool isDaylightSavingTime(
    const DstZone& zone,
    const Calendar& calendar,
    uint16_t year,
    uint8_t month,
    uint8_t day,
    uint8_t hour) {
  const auto start = zone.start();
  const auto end = zone.end();
  const uint8_t startMonth = start.month();
  const uint8_t endMonth = end.month();

  if (startMonth == endMonth) {
    if (month != startMonth) {
      return false;
    }
    const bool started = atOrAfter(start, calendar, year, day, hour);
    const bool ended = atOrAfter(end, calendar, year, day, hour);
    // Both rules in the same month: DST is the stretch between them, or the
    // complement when the end rule fires first.
    if (start.transitionDay(calendar, year) <=
        end.transitionDay(calendar, year)) {
      return started && !ended;
    }
    return started || !ended;
  }

  if (month == startMonth) {
    return atOrAfter(start, calendar, year, day, hour);
  }
  if (month == endMonth) {
    return !atOrAfter(end, calendar, year, day, hour);
  }
  if (startMonth < endMonth) {
    return month > startMonth && month < endMonth;
  }
  return month > startMonth || month < endMonth;
}

Offset daylightOffset(Offset standard) {
  return Offset::fromMinutes(
      standard.totalMinutes() + standard.dstDeltaMinutes());
}

std::optional<TimeZone> TimeZone::lookup(
    std::string_view name,
    const ZoneStore* store) {
  const ZoneStore& source = store ? *store : defaultZoneStore();
  if (auto dst = source.findDst(name)) {
    return TimeZone(std::string(name), dst->offset(), true, store);
  }
  if (auto offset = source.findOffset(name)) {
    return TimeZone(std::string(name), *offset, false, store);
  }
  return std::nullopt;
}

Offset TimeZone::offsetAt(
    uint16_t year,
    uint8_t month,
    uint8_t day,
    uint8_t hour,
    uint8_t /*minute*/,
    uint8_t /*second*/,
    const Calendar& calendar) const {
  if (!hasDst_) {
    return offset_;
  }
  const auto zone = store().findDst(name_);
  if (!zone.has_value()) {
    return offset_;
  }
  const Offset standard = zone->offset();
  if (isDaylightSavingTime(*zone, calendar, year, month, day, hour)) {
    return daylightOffset(standard);
  }
  return standard;
}

std::string TimeZone::toString() const {
  return fmt::format("{} ({})", name_, offset_.toString());
}

const ZoneStore& TimeZone::store() const {
  return store_ ? *store_ : defaultZoneStore();
}

} // namespace facebook::tempo
