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
#include <string>

#include <fmt/format.h>

#include "tempo/calendar/Calendar.h"

namespace facebook::tempo {

/// A UTC offset packed in one byte:
///
///   bit 7     sign, set for offsets west of UTC
///   bits 6..3 hours, 0 to 15
///   bits 2..1 minute code: 0, 1 and 2 stand for 0, 30 and 45 minutes; 3 is
///             reserved
///   bit 0     irregular DST flag
///
/// The irregular flag marks the two zones whose DST shift is not one hour. A
/// zone with a non-zero minute part (Lord Howe Island) shifts by 30 minutes,
/// a zone on a whole hour (Troll station) shifts by 2 hours.
class Offset {
 public:
  static constexpr uint8_t kMaxHour = 15;

  /// UTC.
  constexpr Offset() = default;

  /// Throws a user error if 'hour' > 15, 'minute' is not 0, 30 or 45, or
  /// 'sign' is neither 1 nor -1.
  Offset(uint8_t hour, uint8_t minute, int8_t sign, bool irregularDst = false);

  /// Throws a user error if 'packed' carries the reserved minute code.
  static Offset fromPacked(uint8_t packed);

  /// Builds an offset from a signed number of minutes east of UTC.
  static Offset fromMinutes(int32_t minutes, bool irregularDst = false);

  uint8_t hour() const {
    return (buf_ >> 3) & 0xF;
  }

  uint8_t minute() const;

  int8_t sign() const {
    return (buf_ & 0x80) ? -1 : 1;
  }

  bool irregularDst() const {
    return buf_ & 1;
  }

  /// Signed minutes east of UTC.
  int32_t totalMinutes() const {
    return sign() * (hour() * 60 + minute());
  }

  /// Minutes added to this offset while DST is in effect.
  int32_t dstDeltaMinutes() const;

  uint8_t packed() const {
    return buf_;
  }

  bool operator==(const Offset& other) const {
    return buf_ == other.buf_;
  }

  bool operator!=(const Offset& other) const {
    return buf_ != other.buf_;
  }

  /// ISO-8601 form, e.g. "+05:30" or "-03:00".
  std::string toString() const;

 private:
  explicit Offset(uint8_t packed, bool /*unchecked*/) : buf_(packed) {}

  uint8_t buf_{0};
};

/// When a DST period starts or ends, packed in 12 bits:
///
///   bits 11..8 month, 1 to 12
///   bits 7..5  day of week, Monday = 0
///   bit 4      count weeks from the end of the month
///   bit 3      week ordinal, 0 for the first (last) matching weekday and 1
///              for the second (second to last)
///   bits 2..0  hour code over {20, 21, 22, 23, 0, 1, 2, 3}
///
/// E.g. "last Sunday of March at 02:00" is {3, 6, true, 0, 2}.
class TransitionRule {
 public:
  static constexpr uint16_t kMask = 0xFFF;

  TransitionRule(
      uint8_t month,
      uint8_t dayOfWeek,
      bool fromEndOfMonth,
      uint8_t weekOrdinal,
      uint8_t hour);

  /// Throws a user error if 'packed' does not decode to a valid rule.
  static TransitionRule fromPacked(uint16_t packed);

  uint8_t month() const {
    return (buf_ >> 8) & 0xF;
  }

  uint8_t dayOfWeek() const {
    return (buf_ >> 5) & 0x7;
  }

  bool fromEndOfMonth() const {
    return (buf_ >> 4) & 1;
  }

  uint8_t weekOrdinal() const {
    return (buf_ >> 3) & 1;
  }

  uint8_t hourCode() const {
    return buf_ & 0x7;
  }

  uint8_t hour() const;

  /// The day of month the rule falls on in 'year' under 'calendar'.
  uint8_t transitionDay(const Calendar& calendar, uint16_t year) const;

  uint16_t packed() const {
    return buf_;
  }

  bool operator==(const TransitionRule& other) const {
    return buf_ == other.buf_;
  }

  std::string toString() const;

 private:
  explicit TransitionRule(uint16_t packed, bool /*unchecked*/)
      : buf_(packed) {}

  uint16_t buf_;
};

/// DST start rule, DST end rule and standard offset of a zone, packed in 32
/// bits: start in bits 31..20, end in bits 19..8, offset in bits 7..0.
class DstZone {
 public:
  /// Throws a user error if the offset in effect during DST, the standard
  /// offset plus its DST delta, is not itself a valid Offset. For example
  /// -00:45 would move to +00:15.
  DstZone(TransitionRule start, TransitionRule end, Offset offset);

  static DstZone fromPacked(uint32_t packed);

  TransitionRule start() const {
    return TransitionRule::fromPacked(buf_ >> 20);
  }

  TransitionRule end() const {
    return TransitionRule::fromPacked((buf_ >> 8) & TransitionRule::kMask);
  }

  /// Standard offset of the zone.
  Offset offset() const {
    return Offset::fromPacked(buf_ & 0xFF);
  }

  uint32_t packed() const {
    return buf_;
  }

  bool operator==(const DstZone& other) const {
    return buf_ == other.buf_;
  }

  std::string toString() const;

 private:
  uint32_t buf_;
};

} // namespace facebook::tempo

template <>
struct fmt::formatter<facebook::tempo::Offset> : fmt::formatter<std::string> {
  auto format(const facebook::tempo::Offset& o, format_context& ctx) const {
    return formatter<std::string>::format(o.toString(), ctx);
  }
};
