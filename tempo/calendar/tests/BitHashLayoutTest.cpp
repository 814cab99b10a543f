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

#include <gtest/gtest.h>

#include "tempo/calendar/BitHashLayout.h"

namespace facebook::tempo::test {
namespace {

DateTimeFields makeFields(
    uint16_t year,
    uint8_t month,
    uint8_t day,
    uint8_t hour = 0,
    uint8_t minute = 0,
    uint8_t second = 0,
    uint16_t millisecond = 0,
    uint16_t microsecond = 0) {
  return DateTimeFields{
      .year = year,
      .month = month,
      .day = day,
      .hour = hour,
      .minute = minute,
      .second = second,
      .millisecond = millisecond,
      .microsecond = microsecond};
}

TEST(BitHashLayoutTest, widthNames) {
  EXPECT_EQ(toString(HashWidth::kUInt8), "UINT8");
  EXPECT_EQ(toString(HashWidth::kUInt16), "UINT16");
  EXPECT_EQ(toString(HashWidth::kUInt32), "UINT32");
  EXPECT_EQ(toString(HashWidth::kUInt64), "UINT64");
}

TEST(BitHashLayoutTest, bitField) {
  constexpr BitField field{4, 6};
  static_assert(field.mask() == 0x3F);
  EXPECT_EQ(field.pack(0x2A), 0x2A0u);
  EXPECT_EQ(field.unpack(0xFFFF), 0x3Fu);
  EXPECT_TRUE(field.fits(63));
  EXPECT_FALSE(field.fits(64));

  constexpr BitField empty{0, 0};
  EXPECT_EQ(empty.pack(123), 0u);
  EXPECT_TRUE(empty.fits(0));
  EXPECT_FALSE(empty.fits(1));
}

TEST(BitHashLayoutTest, layoutsDoNotOverlap) {
  for (auto width :
       {HashWidth::kUInt8,
        HashWidth::kUInt16,
        HashWidth::kUInt32,
        HashWidth::kUInt64}) {
    const auto& layout = fieldLayout(width);
    uint64_t used = 0;
    for (const auto& field :
         {layout.year,
          layout.month,
          layout.day,
          layout.hour,
          layout.minute,
          layout.second,
          layout.millisecond,
          layout.microsecond}) {
      const uint64_t bits = field.mask() << field.shift;
      EXPECT_EQ(used & bits, 0u) << toString(width);
      used |= bits;
    }
    if (width != HashWidth::kUInt64) {
      EXPECT_LT(used, 1ULL << static_cast<int>(width)) << toString(width);
    }
  }
}

TEST(BitHashLayoutTest, uint64) {
  const auto fields = makeFields(2024, 2, 29, 23, 59, 60, 999, 123);
  const auto hash = pack<HashWidth::kUInt64>(fields);
  EXPECT_EQ(unpack<HashWidth::kUInt64>(hash), fields);
  EXPECT_TRUE(fitsLayout(HashWidth::kUInt64, fields));
  EXPECT_EQ(pack(HashWidth::kUInt64, fields), hash);

  // Hashes order like the fields they encode.
  EXPECT_LT(hash, pack<HashWidth::kUInt64>(makeFields(2024, 3, 1)));
  EXPECT_GT(hash, pack<HashWidth::kUInt64>(makeFields(2023, 12, 31, 23)));
}

TEST(BitHashLayoutTest, uint32) {
  const auto fields = makeFields(2023, 12, 31, 23, 59);
  const auto hash = pack<HashWidth::kUInt32>(fields);
  EXPECT_EQ(unpack<HashWidth::kUInt32>(hash), fields);
  EXPECT_EQ(
      hash,
      (2023u << 20) | (12u << 16) | (31u << 11) | (23u << 6) | 59u);

  // Seconds and below have no bits.
  const auto withSeconds = makeFields(2023, 12, 31, 23, 59, 30, 500);
  EXPECT_FALSE(fitsLayout(HashWidth::kUInt32, withSeconds));
  EXPECT_EQ(pack<HashWidth::kUInt32>(withSeconds), hash);
}

TEST(BitHashLayoutTest, narrowWidths) {
  // Two bits of year keep only the low bits.
  const auto hash16 = pack<HashWidth::kUInt16>(makeFields(2023, 7, 4, 18));
  EXPECT_EQ(unpack<HashWidth::kUInt16>(hash16), makeFields(3, 7, 4, 18));
  EXPECT_FALSE(fitsLayout(HashWidth::kUInt16, makeFields(2023, 7, 4, 18)));
  EXPECT_TRUE(fitsLayout(HashWidth::kUInt16, makeFields(3, 7, 4, 18)));

  const auto hash8 = pack<HashWidth::kUInt8>(makeFields(0, 0, 5, 17));
  EXPECT_EQ(hash8, (5u << 5) | 17u);
  EXPECT_EQ(unpack<HashWidth::kUInt8>(hash8), makeFields(0, 0, 5, 17));
  EXPECT_EQ(unpack(HashWidth::kUInt8, hash8), makeFields(0, 0, 5, 17));
}

TEST(BitHashLayoutTest, fieldsToString) {
  const auto fields = makeFields(987, 3, 9, 7, 5, 1, 42, 7);
  EXPECT_EQ(fields.toString(), "0987-03-09 07:05:01.042007");
  EXPECT_EQ(fmt::format("{}", fields), "0987-03-09 07:05:01.042007");
}

} // namespace
} // namespace facebook::tempo::test
