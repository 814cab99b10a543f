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

#include "tempo/calendar/BitHashLayout.h"

#include "tempo/common/base/Exceptions.h"

namespace facebook::tempo {

std::string_view toString(HashWidth width) {
  switch (width) {
    case HashWidth::kUInt8:
      return "UINT8";
    case HashWidth::kUInt16:
      return "UINT16";
    case HashWidth::kUInt32:
      return "UINT32";
    case HashWidth::kUInt64:
      return "UINT64";
  }
  TEMPO_UNREACHABLE();
}

std::string DateTimeFields::toString() const {
  return fmt::format(
      "{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}{:03}",
      year,
      month,
      day,
      hour,
      minute,
      second,
      millisecond,
      microsecond);
}

const FieldLayout& fieldLayout(HashWidth width) {
  switch (width) {
    case HashWidth::kUInt8:
      return HashLayout<HashWidth::kUInt8>::kFields;
    case HashWidth::kUInt16:
      return HashLayout<HashWidth::kUInt16>::kFields;
    case HashWidth::kUInt32:
      return HashLayout<HashWidth::kUInt32>::kFields;
    case HashWidth::kUInt64:
      return HashLayout<HashWidth::kUInt64>::kFields;
  }
  TEMPO_UNREACHABLE();
}

uint64_t pack(HashWidth width, const DateTimeFields& fields) {
  switch (width) {
    case HashWidth::kUInt8:
      return pack<HashWidth::kUInt8>(fields);
    case HashWidth::kUInt16:
      return pack<HashWidth::kUInt16>(fields);
    case HashWidth::kUInt32:
      return pack<HashWidth::kUInt32>(fields);
    case HashWidth::kUInt64:
      return pack<HashWidth::kUInt64>(fields);
  }
  TEMPO_UNREACHABLE();
}

DateTimeFields unpack(HashWidth width, uint64_t word) {
  switch (width) {
    case HashWidth::kUInt8:
      return unpack<HashWidth::kUInt8>(static_cast<uint8_t>(word));
    case HashWidth::kUInt16:
      return unpack<HashWidth::kUInt16>(static_cast<uint16_t>(word));
    case HashWidth::kUInt32:
      return unpack<HashWidth::kUInt32>(static_cast<uint32_t>(word));
    case HashWidth::kUInt64:
      return unpack<HashWidth::kUInt64>(word);
  }
  TEMPO_UNREACHABLE();
}

bool fitsLayout(HashWidth width, const DateTimeFields& fields) {
  const auto& l = fieldLayout(width);
  return l.year.fits(fields.year) && l.month.fits(fields.month) &&
      l.day.fits(fields.day) && l.hour.fits(fields.hour) &&
      l.minute.fits(fields.minute) && l.second.fits(fields.second) &&
      l.millisecond.fits(fields.millisecond) &&
      l.microsecond.fits(fields.microsecond);
}

} // namespace facebook::tempo
