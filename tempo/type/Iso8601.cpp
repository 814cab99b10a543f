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

#include "tempo/type/Iso8601.h"

#include <ctime>
#include <vector>

#include <fmt/format.h>

#include "tempo/common/base/Exceptions.h"

namespace facebook::tempo {
namespace {

inline bool characterIsDigit(char c) {
  return c >= '0' && c <= '9';
}

// Parses exactly 'digits' decimal digits at 'pos'.
bool parseFixedDigits(
    std::string_view buf,
    size_t& pos,
    size_t digits,
    int32_t& result) {
  if (pos + digits > buf.size()) {
    return false;
  }
  result = 0;
  for (size_t i = 0; i < digits; ++i) {
    const char c = buf[pos + i];
    if (!characterIsDigit(c)) {
      return false;
    }
    result = result * 10 + (c - '0');
  }
  pos += digits;
  return true;
}

bool expectCharacter(std::string_view buf, size_t& pos, char expected) {
  if (pos < buf.size() && buf[pos] == expected) {
    ++pos;
    return true;
  }
  return false;
}

bool tryParseDate(
    std::string_view buf,
    size_t& pos,
    bool separators,
    DateTimeFields& fields) {
  int32_t year;
  int32_t month;
  int32_t day;
  if (!parseFixedDigits(buf, pos, 4, year) ||
      (separators && !expectCharacter(buf, pos, '-')) ||
      !parseFixedDigits(buf, pos, 2, month) ||
      (separators && !expectCharacter(buf, pos, '-')) ||
      !parseFixedDigits(buf, pos, 2, day)) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > 35) {
    return false;
  }
  fields.year = year;
  fields.month = month;
  fields.day = day;
  return true;
}

bool tryParseTime(
    std::string_view buf,
    size_t& pos,
    bool separators,
    DateTimeFields& fields) {
  int32_t hour;
  int32_t minute;
  int32_t second;
  if (!parseFixedDigits(buf, pos, 2, hour) ||
      (separators && !expectCharacter(buf, pos, ':')) ||
      !parseFixedDigits(buf, pos, 2, minute) ||
      (separators && !expectCharacter(buf, pos, ':')) ||
      !parseFixedDigits(buf, pos, 2, second)) {
    return false;
  }
  if (hour > 23 || minute > 59 || second > 60) {
    return false;
  }
  fields.hour = hour;
  fields.minute = minute;
  fields.second = second;
  return true;
}

bool tryParseUtcOffset(
    std::string_view buf,
    size_t& pos,
    std::optional<Offset>& offset) {
  if (expectCharacter(buf, pos, 'Z')) {
    offset = Offset();
    return true;
  }
  int8_t sign;
  if (expectCharacter(buf, pos, '+')) {
    sign = 1;
  } else if (expectCharacter(buf, pos, '-')) {
    sign = -1;
  } else {
    return false;
  }
  int32_t hour;
  int32_t minute;
  if (!parseFixedDigits(buf, pos, 2, hour) ||
      !expectCharacter(buf, pos, ':') ||
      !parseFixedDigits(buf, pos, 2, minute)) {
    return false;
  }
  if (hour > Offset::kMaxHour ||
      (minute != 0 && minute != 30 && minute != 45)) {
    return false;
  }
  offset = Offset(hour, minute, sign);
  return true;
}

} // namespace

std::string_view toString(IsoFormat format) {
  switch (format) {
    case IsoFormat::kFull:
      return "FULL";
    case IsoFormat::kFullWithOffset:
      return "FULL_WITH_OFFSET";
    case IsoFormat::kCompact:
      return "COMPACT";
    case IsoFormat::kDate:
      return "DATE";
    case IsoFormat::kTime:
      return "TIME";
  }
  TEMPO_UNREACHABLE();
}

std::string
formatIso(const DateTimeFields& f, IsoFormat format, Offset offset) {
  switch (format) {
    case IsoFormat::kFull:
      return fmt::format(
          "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
          f.year,
          f.month,
          f.day,
          f.hour,
          f.minute,
          f.second);
    case IsoFormat::kFullWithOffset:
      return fmt::format(
          "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}{}",
          f.year,
          f.month,
          f.day,
          f.hour,
          f.minute,
          f.second,
          offset.toString());
    case IsoFormat::kCompact:
      return fmt::format(
          "{:04}{:02}{:02}{:02}{:02}{:02}",
          f.year,
          f.month,
          f.day,
          f.hour,
          f.minute,
          f.second);
    case IsoFormat::kDate:
      return fmt::format("{:04}-{:02}-{:02}", f.year, f.month, f.day);
    case IsoFormat::kTime:
      return fmt::format("{:02}:{:02}:{:02}", f.hour, f.minute, f.second);
  }
  TEMPO_UNREACHABLE();
}

Expected<IsoParseResult> parseIso(std::string_view text, IsoFormat format) {
  IsoParseResult result;
  size_t pos = 0;
  bool ok = false;
  switch (format) {
    case IsoFormat::kFull:
    case IsoFormat::kFullWithOffset:
      ok = tryParseDate(text, pos, true, result.fields) &&
          (expectCharacter(text, pos, 'T') ||
           expectCharacter(text, pos, ' ')) &&
          tryParseTime(text, pos, true, result.fields) &&
          (format == IsoFormat::kFull ||
           tryParseUtcOffset(text, pos, result.offset));
      break;
    case IsoFormat::kCompact:
      ok = tryParseDate(text, pos, false, result.fields) &&
          tryParseTime(text, pos, false, result.fields);
      break;
    case IsoFormat::kDate:
      ok = tryParseDate(text, pos, true, result.fields);
      break;
    case IsoFormat::kTime:
      ok = tryParseTime(text, pos, true, result.fields);
      break;
  }
  if (!ok || pos != text.size()) {
    return folly::makeUnexpected(Status::UserError(
        "Unable to parse '{}' as {} ISO-8601 text", text, toString(format)));
  }
  return result;
}

Expected<std::string> formatStrftime(
    const DateTimeFields& fields,
    const std::string& pattern,
    uint8_t dayOfWeek,
    uint16_t dayOfYear) {
  std::tm tm{};
  tm.tm_year = int{fields.year} - 1900;
  tm.tm_mon = fields.month - 1;
  tm.tm_mday = fields.day;
  tm.tm_hour = fields.hour;
  tm.tm_min = fields.minute;
  tm.tm_sec = fields.second;
  // struct tm counts weekdays from Sunday.
  tm.tm_wday = (dayOfWeek + 1) % 7;
  tm.tm_yday = dayOfYear - 1;
  tm.tm_isdst = 0;

  std::vector<char> buffer(pattern.size() * 4 + 64);
  for (int attempt = 0; attempt < 4; ++attempt) {
    const size_t written =
        std::strftime(buffer.data(), buffer.size(), pattern.c_str(), &tm);
    if (written > 0) {
      return std::string(buffer.data(), written);
    }
    buffer.resize(buffer.size() * 4);
  }
  return folly::makeUnexpected(
      Status::UserError("strftime pattern '{}' produced no output", pattern));
}

Expected<DateTimeFields> parseStrptime(
    const std::string& text,
    const std::string& pattern) {
  std::tm tm{};
  tm.tm_mday = 1;
  const char* end = ::strptime(text.c_str(), pattern.c_str(), &tm);
  if (end == nullptr || *end != '\0') {
    return folly::makeUnexpected(Status::UserError(
        "Unable to parse '{}' with pattern '{}'", text, pattern));
  }
  const int year = tm.tm_year + 1900;
  if (year < 0 || year > 9999) {
    return folly::makeUnexpected(Status::UserError(
        "Year {} parsed from '{}' is out of range", year, text));
  }
  DateTimeFields fields;
  fields.year = year;
  fields.month = tm.tm_mon + 1;
  fields.day = tm.tm_mday;
  fields.hour = tm.tm_hour;
  fields.minute = tm.tm_min;
  fields.second = tm.tm_sec;
  return fields;
}

} // namespace facebook::tempo
