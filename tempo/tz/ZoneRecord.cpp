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

#include "tempo/tz/ZoneRecord.h"

#include <algorithm>
#include <array>
#include <cstdlib>

#include "tempo/common/base/Exceptions.h"

namespace facebook::tempo {
namespace {

constexpr std::array<uint8_t, 3> kMinuteCodes = {0, 30, 45};
constexpr uint8_t kReservedMinuteCode = 3;

constexpr std::array<uint8_t, 8> kHourCodes = {20, 21, 22, 23, 0, 1, 2, 3};

uint8_t minuteCode(uint8_t minute) {
  for (uint8_t i = 0; i < kMinuteCodes.size(); ++i) {
    if (kMinuteCodes[i] == minute) {
      return i;
    }
  }
  TEMPO_USER_FAIL("Offset minute must be 0, 30 or 45, got {}", minute);
}

uint8_t hourCode(uint8_t hour) {
  for (uint8_t i = 0; i < kHourCodes.size(); ++i) {
    if (kHourCodes[i] == hour) {
      return i;
    }
  }
  TEMPO_USER_FAIL(
      "Transition hour must be in [20, 23] or [0, 3], got {}", hour);
}

} // namespace

//================================= Offset ==================================//

Offset::Offset(uint8_t hour, uint8_t minute, int8_t sign, bool irregularDst) {
  TEMPO_USER_CHECK_LE(hour, kMaxHour, "Offset hour out of range");
  TEMPO_USER_CHECK(
      sign == 1 || sign == -1, "Offset sign must be 1 or -1, got {}", sign);
  buf_ = (sign < 0 ? 0x80 : 0) | (hour << 3) | (minuteCode(minute) << 1) |
      (irregularDst ? 1 : 0);
}

Offset Offset::fromPacked(uint8_t packed) {
  TEMPO_USER_CHECK_NE(
      (packed >> 1) & 0x3,
      kReservedMinuteCode,
      "Packed offset {:#04x} uses the reserved minute code",
      packed);
  return Offset(packed, true);
}

Offset Offset::fromMinutes(int32_t minutes, bool irregularDst) {
  const int32_t magnitude = std::abs(minutes);
  TEMPO_USER_CHECK_LT(
      magnitude, (kMaxHour + 1) * 60, "Offset of {} minutes", minutes);
  return Offset(
      magnitude / 60, magnitude % 60, minutes < 0 ? -1 : 1, irregularDst);
}

uint8_t Offset::minute() const {
  const uint8_t code = (buf_ >> 1) & 0x3;
  TEMPO_CHECK(code < kReservedMinuteCode, "Offset byte {:#04x}", buf_);
  return kMinuteCodes[code];
}

int32_t Offset::dstDeltaMinutes() const {
  if (!irregularDst()) {
    return 60;
  }
  // Lord Howe Island shifts by half an hour, Troll station by two hours.
  return minute() != 0 ? 30 : 120;
}

std::string Offset::toString() const {
  return fmt::format("{}{:02}:{:02}", sign() < 0 ? '-' : '+', hour(), minute());
}

//============================= TransitionRule ==============================//

TransitionRule::TransitionRule(
    uint8_t month,
    uint8_t dayOfWeek,
    bool fromEndOfMonth,
    uint8_t weekOrdinal,
    uint8_t hour) {
  TEMPO_USER_CHECK(
      month >= 1 && month <= 12, "Transition month out of range: {}", month);
  TEMPO_USER_CHECK_LE(dayOfWeek, 6, "Transition weekday out of range");
  TEMPO_USER_CHECK_LE(weekOrdinal, 1, "Transition week ordinal out of range");
  buf_ = (month << 8) | (dayOfWeek << 5) | (fromEndOfMonth ? 0x10 : 0) |
      (weekOrdinal << 3) | hourCode(hour);
}

TransitionRule TransitionRule::fromPacked(uint16_t packed) {
  TEMPO_USER_CHECK_EQ(
      packed & ~kMask, 0, "Transition rule {:#x} exceeds 12 bits", packed);
  TransitionRule rule(packed, true);
  TEMPO_USER_CHECK(
      rule.month() >= 1 && rule.month() <= 12,
      "Transition rule {:#x} has an invalid month",
      packed);
  TEMPO_USER_CHECK_LE(
      rule.dayOfWeek(),
      6,
      "Transition rule {:#x} has an invalid weekday",
      packed);
  return rule;
}

uint8_t TransitionRule::hour() const {
  return kHourCodes[hourCode()];
}

uint8_t TransitionRule::transitionDay(const Calendar& calendar, uint16_t year)
    const {
  const auto [firstDow, daysInMonth] = calendar.monthRange(year, month());
  const int target = dayOfWeek();
  const int weeks = 7 * weekOrdinal();
  if (!fromEndOfMonth()) {
    return 1 + (target - firstDow + 7) % 7 + weeks;
  }
  const int lastDow = (firstDow + daysInMonth - 1) % 7;
  return daysInMonth - (lastDow - target + 7) % 7 - weeks;
}

std::string TransitionRule::toString() const {
  static constexpr std::array<const char*, 7> kDays = {
      "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};
  return fmt::format(
      "{} {} {} of month {} at {:02}:00",
      weekOrdinal() == 0 ? (fromEndOfMonth() ? "last" : "first")
                         : (fromEndOfMonth() ? "second to last" : "second"),
      kDays[dayOfWeek()],
      fromEndOfMonth() ? "before end" : "from start",
      month(),
      hour());
}

//================================= DstZone =================================//

DstZone::DstZone(TransitionRule start, TransitionRule end, Offset offset)
    : buf_(
          (uint32_t{start.packed()} << 20) | (uint32_t{end.packed()} << 8) |
          offset.packed()) {
  const int32_t daylight = offset.totalMinutes() + offset.dstDeltaMinutes();
  const int32_t magnitude = std::abs(daylight);
  const int32_t minute = magnitude % 60;
  TEMPO_USER_CHECK(
      magnitude <= Offset::kMaxHour * 60 + 45 &&
          std::find(kMinuteCodes.begin(), kMinuteCodes.end(), minute) !=
              kMinuteCodes.end(),
      "Standard offset {} has no valid daylight offset ({} minutes)",
      offset.toString(),
      daylight);
}

DstZone DstZone::fromPacked(uint32_t packed) {
  return DstZone(
      TransitionRule::fromPacked(packed >> 20),
      TransitionRule::fromPacked((packed >> 8) & TransitionRule::kMask),
      Offset::fromPacked(packed & 0xFF));
}

std::string DstZone::toString() const {
  return fmt::format(
      "DstZone(offset {}, start: {}, end: {})",
      offset().toString(),
      start().toString(),
      end().toString());
}

} // namespace facebook::tempo
