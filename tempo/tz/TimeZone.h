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

#include <optional>
#include <string>
#include <string_view>

#include "tempo/calendar/Calendar.h"
#include "tempo/tz/ZoneRecord.h"
#include "tempo/tz/ZoneStore.h"

namespace facebook::tempo {

/// Returns true if DST is in effect at the civil hour (year, month, day,
/// hour) under 'zone'. Transition instants are inclusive on the start side:
/// from the start rule's day and hour on, DST applies; from the end rule's day
/// and hour on, standard time applies again. A start month after the end
/// month describes a southern hemisphere zone whose DST period spans the turn
/// of the year.
bool isDaylightSavingTime(
    const DstZone& zone,
    const Calendar& calendar,
    uint16_t year,
    uint8_t month,
    uint8_t day,
    uint8_t hour);

/// Offset in effect while DST is active for a zone whose standard offset is
/// 'standard'. Throws a user error if that is not a valid Offset, which the
/// DstZone constructor already rules out for zones with DST rules.
Offset daylightOffset(Offset standard);

/// A named zone. Zones without DST carry their offset. Zones with DST carry
/// their standard offset and read the transition rules from a zone store on
/// every resolution.
class TimeZone {
 public:
  static constexpr std::string_view kUtcName = "UTC";

  /// UTC.
  TimeZone() : name_(kUtcName) {}

  /// A zone resolved against 'store', or the process-wide registry when
  /// 'store' is null. 'store' must outlive the zone.
  TimeZone(
      std::string name,
      Offset offset,
      bool hasDst = false,
      const ZoneStore* store = nullptr)
      : name_(std::move(name)),
        offset_(offset),
        hasDst_(hasDst),
        store_(store) {}

  /// Builds the zone 'name' from its record in 'store' (the process-wide
  /// registry when null). Returns std::nullopt if the store has no such
  /// zone.
  static std::optional<TimeZone> lookup(
      std::string_view name,
      const ZoneStore* store = nullptr);

  const std::string& name() const {
    return name_;
  }

  bool hasDst() const {
    return hasDst_;
  }

  /// Standard offset.
  Offset offset() const {
    return offset_;
  }

  /// Resolves the UTC offset in effect at a civil time. Falls back to the
  /// standard offset when the zone has no DST rule in its store.
  Offset offsetAt(
      uint16_t year,
      uint8_t month,
      uint8_t day,
      uint8_t hour = 0,
      uint8_t minute = 0,
      uint8_t second = 0,
      const Calendar& calendar = kGregorianCalendar) const;

  /// Equality is by name and standard offset, not by resolved offsets.
  bool operator==(const TimeZone& other) const {
    return name_ == other.name_ && offset_ == other.offset_;
  }

  bool operator!=(const TimeZone& other) const {
    return !(*this == other);
  }

  std::string toString() const;

 private:
  const ZoneStore& store() const;

  std::string name_;
  Offset offset_;
  bool hasDst_{false};
  const ZoneStore* store_{nullptr};
};

} // namespace facebook::tempo
