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
#include <string_view>

#include <fmt/format.h>

namespace facebook::tempo {

/// Width of a packed date/time hash, in bits.
enum class HashWidth : uint8_t {
  kUInt8 = 8,
  kUInt16 = 16,
  kUInt32 = 32,
  kUInt64 = 64,
};

std::string_view toString(HashWidth width);

/// Decomposed civil date/time fields as stored in a packed hash. Fields a
/// layout has no bits for read back as zero.
struct DateTimeFields {
  uint16_t year{0};
  uint8_t month{0};
  uint8_t day{0};
  uint8_t hour{0};
  uint8_t minute{0};
  uint8_t second{0};
  uint16_t millisecond{0};
  uint16_t microsecond{0};

  bool operator==(const DateTimeFields& other) const = default;

  std::string toString() const;
};

/// A contiguous run of bits inside a packed word. A field with zero bits is
/// not stored and always unpacks to zero.
struct BitField {
  uint8_t shift;
  uint8_t bits;

  constexpr uint64_t mask() const {
    return bits == 0 ? 0 : (bits >= 64 ? ~0ULL : ((1ULL << bits) - 1));
  }

  constexpr uint64_t pack(uint64_t value) const {
    return (value & mask()) << shift;
  }

  constexpr uint64_t unpack(uint64_t word) const {
    return (word >> shift) & mask();
  }

  constexpr bool fits(uint64_t value) const {
    return (value & ~mask()) == 0;
  }
};

/// Bit budget of every field for one hash width, most significant field
/// first.
struct FieldLayout {
  BitField year;
  BitField month;
  BitField day;
  BitField hour;
  BitField minute;
  BitField second;
  BitField millisecond;
  BitField microsecond;
};

template <HashWidth W>
struct HashLayout;

// year 16 | month 4 | day 6 | hour 5 | minute 6 | second 6 | ms 10 | us 10.
// Bit 63 is unused.
template <>
struct HashLayout<HashWidth::kUInt64> {
  using type = uint64_t;
  static constexpr FieldLayout kFields{
      .year = {47, 16},
      .month = {43, 4},
      .day = {37, 6},
      .hour = {32, 5},
      .minute = {26, 6},
      .second = {20, 6},
      .millisecond = {10, 10},
      .microsecond = {0, 10},
  };
};

// year 12 | month 4 | day 5 | hour 5 | minute 6.
template <>
struct HashLayout<HashWidth::kUInt32> {
  using type = uint32_t;
  static constexpr FieldLayout kFields{
      .year = {20, 12},
      .month = {16, 4},
      .day = {11, 5},
      .hour = {6, 5},
      .minute = {0, 6},
      .second = {0, 0},
      .millisecond = {0, 0},
      .microsecond = {0, 0},
  };
};

// year 2 | month 4 | day 5 | hour 5.
template <>
struct HashLayout<HashWidth::kUInt16> {
  using type = uint16_t;
  static constexpr FieldLayout kFields{
      .year = {14, 2},
      .month = {10, 4},
      .day = {5, 5},
      .hour = {0, 5},
      .minute = {0, 0},
      .second = {0, 0},
      .millisecond = {0, 0},
      .microsecond = {0, 0},
  };
};

// day 3 | hour 5.
template <>
struct HashLayout<HashWidth::kUInt8> {
  using type = uint8_t;
  static constexpr FieldLayout kFields{
      .year = {0, 0},
      .month = {0, 0},
      .day = {5, 3},
      .hour = {0, 5},
      .minute = {0, 0},
      .second = {0, 0},
      .millisecond = {0, 0},
      .microsecond = {0, 0},
  };
};

template <HashWidth W>
using HashType = typename HashLayout<W>::type;

const FieldLayout& fieldLayout(HashWidth width);

/// Packs 'fields' into a word of width W. Values that exceed a field's bit
/// budget are truncated by masking. Never throws.
template <HashWidth W>
constexpr HashType<W> pack(const DateTimeFields& fields) {
  constexpr const FieldLayout& l = HashLayout<W>::kFields;
  return static_cast<HashType<W>>(
      l.year.pack(fields.year) | l.month.pack(fields.month) |
      l.day.pack(fields.day) | l.hour.pack(fields.hour) |
      l.minute.pack(fields.minute) | l.second.pack(fields.second) |
      l.millisecond.pack(fields.millisecond) |
      l.microsecond.pack(fields.microsecond));
}

template <HashWidth W>
constexpr DateTimeFields unpack(HashType<W> word) {
  constexpr const FieldLayout& l = HashLayout<W>::kFields;
  const uint64_t w = word;
  return DateTimeFields{
      .year = static_cast<uint16_t>(l.year.unpack(w)),
      .month = static_cast<uint8_t>(l.month.unpack(w)),
      .day = static_cast<uint8_t>(l.day.unpack(w)),
      .hour = static_cast<uint8_t>(l.hour.unpack(w)),
      .minute = static_cast<uint8_t>(l.minute.unpack(w)),
      .second = static_cast<uint8_t>(l.second.unpack(w)),
      .millisecond = static_cast<uint16_t>(l.millisecond.unpack(w)),
      .microsecond = static_cast<uint16_t>(l.microsecond.unpack(w)),
  };
}

/// Runtime-dispatched variants. The packed word is returned widened to 64
/// bits.
uint64_t pack(HashWidth width, const DateTimeFields& fields);
DateTimeFields unpack(HashWidth width, uint64_t word);

/// Returns true if every field of 'fields' is representable in 'width', i.e.
/// unpack(width, pack(width, fields)) == fields.
bool fitsLayout(HashWidth width, const DateTimeFields& fields);

} // namespace facebook::tempo

template <>
struct fmt::formatter<facebook::tempo::DateTimeFields>
    : fmt::formatter<std::string> {
  auto format(
      const facebook::tempo::DateTimeFields& f,
      format_context& ctx) const {
    return formatter<std::string>::format(f.toString(), ctx);
  }
};
