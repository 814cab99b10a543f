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
#include <optional>
#include <string>
#include <variant>

#include <fmt/format.h>

#include "tempo/calendar/BitHashLayout.h"
#include "tempo/calendar/Calendar.h"
#include "tempo/common/base/Exceptions.h"

namespace facebook::tempo {

/// Amounts added to a fixed-width date/time. Years and months are 365 and 30
/// days long. The total is truncated toward zero to the counter's unit and
/// the counter wraps around on overflow.
struct FixedDelta {
  int64_t years{0};
  int64_t months{0};
  int64_t days{0};
  int64_t hours{0};
  int64_t minutes{0};
  int64_t seconds{0};
  int64_t milliseconds{0};
};

/// Fields to overwrite in the cached hash of a fixed-width date/time.
struct FixedReplacement {
  std::optional<uint16_t> year;
  std::optional<uint8_t> month;
  std::optional<uint8_t> day;
  std::optional<uint8_t> hour;
  std::optional<uint8_t> minute;
  std::optional<uint8_t> second;
  std::optional<uint16_t> millisecond;
};

struct FixedDateTime64Traits {
  using Counter = uint64_t;
  static constexpr HashWidth kHashWidth = HashWidth::kUInt64;
  static constexpr uint64_t kMillisPerUnit = 1;
  static constexpr uint16_t kYearBase = 0;
  static constexpr std::string_view kName = "FixedDateTime64";
};

struct FixedDateTime32Traits {
  using Counter = uint32_t;
  static constexpr HashWidth kHashWidth = HashWidth::kUInt32;
  static constexpr uint64_t kMillisPerUnit = 60'000;
  static constexpr uint16_t kYearBase = 0;
  static constexpr std::string_view kName = "FixedDateTime32";
};

/// The 16-bit hash has 2 year bits and stores the year relative to 1970.
struct FixedDateTime16Traits {
  using Counter = uint16_t;
  static constexpr HashWidth kHashWidth = HashWidth::kUInt16;
  static constexpr uint64_t kMillisPerUnit = 3'600'000;
  static constexpr uint16_t kYearBase = 1970;
  static constexpr std::string_view kName = "FixedDateTime16";
};

/// The 8-bit hash keeps the low 3 bits of the day and the hour. Year and
/// month always read as 1970 and 1.
struct FixedDateTime8Traits {
  using Counter = uint8_t;
  static constexpr HashWidth kHashWidth = HashWidth::kUInt8;
  static constexpr uint64_t kMillisPerUnit = 3'600'000;
  static constexpr uint16_t kYearBase = 1970;
  static constexpr std::string_view kName = "FixedDateTime8";
};

namespace detail {
/// Milliseconds since the Unix epoch from the system clock.
uint64_t currentUnixMillis();
} // namespace detail

/// A date/time stored as one unsigned counter of fixed units since
/// 1970-01-01 on kFastUtcCalendar, plus a cached packed hash of its fields.
///
/// Field accessors read the cached hash only, so they cost a shift and a
/// mask. The hash is derived from the counter at construction and by
/// rehash(). add() and the arithmetic operators change the counter only and
/// replace() changes the hash only; after either, the two may disagree until
/// rehash() is called. hashMatchesCounter() tells whether they agree.
template <typename Traits>
class FixedDateTime {
 public:
  using Counter = typename Traits::Counter;
  static constexpr HashWidth kHashWidth = Traits::kHashWidth;
  using Hash = HashType<kHashWidth>;

  explicit FixedDateTime(Counter counter = 0)
      : counter_(counter), hash_(hashOf(counter)) {}

  /// Fields on kFastUtcCalendar. Precision below the counter's unit is
  /// dropped and counters past the width wrap around.
  static FixedDateTime fromFields(
      uint16_t year,
      uint8_t month,
      uint8_t day,
      uint8_t hour = 0,
      uint8_t minute = 0,
      uint8_t second = 0,
      uint16_t millisecond = 0) {
    const uint64_t millis = kFastUtcCalendar.millisSinceEpoch(
        year, month, day, hour, minute, second, millisecond);
    return FixedDateTime(static_cast<Counter>(millis / Traits::kMillisPerUnit));
  }

  /// Unix seconds taken as seconds since the fast calendar's epoch, without
  /// calendar correction.
  static FixedDateTime fromUnixEpoch(int64_t seconds) {
    TEMPO_USER_CHECK_GE(seconds, 0, "Unix timestamp before 1970");
    return fromUnixMillis(static_cast<uint64_t>(seconds) * 1'000);
  }

  static FixedDateTime now() {
    return fromUnixMillis(detail::currentUnixMillis());
  }

  /// The hash is kept as given and the counter is derived from it. Fields
  /// the layout does not store, and a zero month or day, count as their
  /// minimum.
  static FixedDateTime fromHash(Hash hash) {
    const auto f = unpackFields(hash);
    const uint64_t millis = kFastUtcCalendar.millisSinceEpoch(
        std::max<uint16_t>(f.year, 1970),
        std::max<uint8_t>(f.month, 1),
        std::max<uint8_t>(f.day, 1),
        f.hour,
        f.minute,
        f.second,
        f.millisecond);
    FixedDateTime result(static_cast<Counter>(millis / Traits::kMillisPerUnit));
    result.hash_ = hash;
    return result;
  }

  Counter counter() const {
    return counter_;
  }

  Hash hash() const {
    return hash_;
  }

  uint16_t year() const {
    return unpackFields(hash_).year;
  }

  uint8_t month() const {
    return unpackFields(hash_).month;
  }

  uint8_t day() const {
    return unpackFields(hash_).day;
  }

  uint8_t hour() const {
    return unpackFields(hash_).hour;
  }

  uint8_t minute() const {
    return unpackFields(hash_).minute;
  }

  uint8_t second() const {
    return unpackFields(hash_).second;
  }

  uint16_t millisecond() const {
    return unpackFields(hash_).millisecond;
  }

  /// Fields as read from the cached hash.
  DateTimeFields fields() const {
    return unpackFields(hash_);
  }

  /// Overwrites fields in the cached hash. The counter is left alone. Values
  /// are masked to the layout's bit budget.
  FixedDateTime& replace(const FixedReplacement& r) {
    auto f = unpack<kHashWidth>(hash_);
    if (r.year.has_value()) {
      f.year = *r.year - Traits::kYearBase;
    }
    if (r.month.has_value()) {
      f.month = *r.month;
    }
    if (r.day.has_value()) {
      f.day = *r.day;
    }
    if (r.hour.has_value()) {
      f.hour = *r.hour;
    }
    if (r.minute.has_value()) {
      f.minute = *r.minute;
    }
    if (r.second.has_value()) {
      f.second = *r.second;
    }
    if (r.millisecond.has_value()) {
      f.millisecond = *r.millisecond;
    }
    hash_ = pack<kHashWidth>(f);
    return *this;
  }

  /// Moves the counter. The cached hash is left alone.
  FixedDateTime& add(const FixedDelta& delta) {
    counter_ = static_cast<Counter>(
        counter_ + static_cast<Counter>(toUnits(delta)));
    return *this;
  }

  FixedDateTime& subtract(const FixedDelta& delta) {
    counter_ = static_cast<Counter>(
        counter_ - static_cast<Counter>(toUnits(delta)));
    return *this;
  }

  FixedDateTime operator+(const FixedDelta& delta) const {
    FixedDateTime result(*this);
    result.add(delta);
    return result;
  }

  FixedDateTime operator-(const FixedDelta& delta) const {
    FixedDateTime result(*this);
    result.subtract(delta);
    return result;
  }

  bool hashMatchesCounter() const {
    return hash_ == hashOf(counter_);
  }

  /// Re-derives the cached hash from the counter.
  FixedDateTime& rehash() {
    hash_ = hashOf(counter_);
    return *this;
  }

  bool operator==(const FixedDateTime& other) const {
    return counter_ == other.counter_;
  }

  bool operator!=(const FixedDateTime& other) const {
    return counter_ != other.counter_;
  }

  bool operator<(const FixedDateTime& other) const {
    return counter_ < other.counter_;
  }

  bool operator<=(const FixedDateTime& other) const {
    return counter_ <= other.counter_;
  }

  bool operator>(const FixedDateTime& other) const {
    return counter_ > other.counter_;
  }

  bool operator>=(const FixedDateTime& other) const {
    return counter_ >= other.counter_;
  }

  std::string toString() const {
    return fmt::format("{}({}, {})", Traits::kName, counter_, fields());
  }

 private:
  static FixedDateTime fromUnixMillis(uint64_t millis) {
    return FixedDateTime(static_cast<Counter>(millis / Traits::kMillisPerUnit));
  }

  static Hash hashOf(Counter counter) {
    auto f = std::get<FastUtcCalendar>(kFastUtcCalendar.variant())
                 .fieldsFromMillis(uint64_t{counter} * Traits::kMillisPerUnit);
    f.year -= Traits::kYearBase;
    return pack<kHashWidth>(f);
  }

  static DateTimeFields unpackFields(Hash hash) {
    constexpr const FieldLayout& l = HashLayout<kHashWidth>::kFields;
    auto f = unpack<kHashWidth>(hash);
    f.year += Traits::kYearBase;
    if constexpr (l.month.bits == 0) {
      f.month = 1;
    }
    if constexpr (l.day.bits == 0) {
      f.day = 1;
    }
    return f;
  }

  static int64_t toUnits(const FixedDelta& d) {
    constexpr uint64_t kMillisInDay = 86'400'000;
    // Summed in uint64_t so that deltas beyond 64 bits wrap around.
    const uint64_t millis = static_cast<uint64_t>(d.years) *
            FastUtcCalendar::kDaysInYear * kMillisInDay +
        static_cast<uint64_t>(d.months) * FastUtcCalendar::kDaysInMonth *
            kMillisInDay +
        static_cast<uint64_t>(d.days) * kMillisInDay +
        static_cast<uint64_t>(d.hours) * 3'600'000 +
        static_cast<uint64_t>(d.minutes) * 60'000 +
        static_cast<uint64_t>(d.seconds) * 1'000 +
        static_cast<uint64_t>(d.milliseconds);
    return static_cast<int64_t>(millis) /
        static_cast<int64_t>(Traits::kMillisPerUnit);
  }

  Counter counter_;
  Hash hash_;
};

using FixedDateTime64 = FixedDateTime<FixedDateTime64Traits>;
using FixedDateTime32 = FixedDateTime<FixedDateTime32Traits>;
using FixedDateTime16 = FixedDateTime<FixedDateTime16Traits>;
using FixedDateTime8 = FixedDateTime<FixedDateTime8Traits>;

extern template class FixedDateTime<FixedDateTime64Traits>;
extern template class FixedDateTime<FixedDateTime32Traits>;
extern template class FixedDateTime<FixedDateTime16Traits>;
extern template class FixedDateTime<FixedDateTime8Traits>;

} // namespace facebook::tempo
