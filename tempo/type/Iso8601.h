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

#include "tempo/calendar/BitHashLayout.h"
#include "tempo/common/base/Status.h"
#include "tempo/tz/ZoneRecord.h"

namespace facebook::tempo {

enum class IsoFormat : uint8_t {
  /// YYYY-MM-DDTHH:MM:SS. A space is accepted in place of 'T' when parsing.
  kFull,
  /// YYYY-MM-DDTHH:MM:SS+HH:MM. 'Z' is accepted for UTC when parsing.
  kFullWithOffset,
  /// YYYYMMDDHHMMSS.
  kCompact,
  /// YYYY-MM-DD.
  kDate,
  /// HH:MM:SS.
  kTime,
};

std::string_view toString(IsoFormat format);

struct IsoParseResult {
  /// Fields the format does not carry are zero.
  DateTimeFields fields;
  /// Set for IsoFormat::kFullWithOffset only.
  std::optional<Offset> offset;
};

/// Formats the year through second of 'fields'. 'offset' is written for
/// IsoFormat::kFullWithOffset only.
std::string formatIso(
    const DateTimeFields& fields,
    IsoFormat format,
    Offset offset = Offset());

/// Parses 'text' in exactly 'format'. Checks field ranges that hold for every
/// calendar (month 1 to 12, day 1 to 35, hour below 24, minute below 60,
/// second up to 60); whether the day exists in a given month is left to the
/// caller. Returns Status::UserError on malformed input.
Expected<IsoParseResult> parseIso(std::string_view text, IsoFormat format);

/// Formats with std::strftime. 'dayOfWeek' (Monday = 0) and 'dayOfYear'
/// (January 1st = 1) feed the weekday and day-of-year conversions. Returns
/// Status::UserError if the pattern yields no output.
Expected<std::string> formatStrftime(
    const DateTimeFields& fields,
    const std::string& pattern,
    uint8_t dayOfWeek = 0,
    uint16_t dayOfYear = 1);

/// Parses with strptime(3). The whole of 'text' must match 'pattern'.
Expected<DateTimeFields> parseStrptime(
    const std::string& text,
    const std::string& pattern);

} // namespace facebook::tempo
