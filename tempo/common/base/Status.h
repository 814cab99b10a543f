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

// Adapted from Apache Arrow.

#pragma once

#include <fmt/format.h>
#include <folly/Expected.h>
#include <folly/Likely.h>
#include <ostream>
#include <string>
#include <utility>

namespace facebook::tempo {

/// The Status object holds the outcome of an operation that reports failure
/// without throwing: ISO-8601 parsing, zone file decoding and loading.
///
/// A success is represented by a null state pointer, so the common case costs
/// a single pointer and no allocation. Failures carry a StatusCode and a
/// message:
///
///  Expected<DstZone> decode(std::string_view bytes) {
///    if (bytes.size() < 4) {
///      return folly::makeUnexpected(Status::Invalid("truncated record"));
///    }
///    ...
///  }
///
/// - kUserError: malformed input supplied by the caller, e.g. an ISO-8601
///   string that does not match the requested format.
///
/// - kIOError: a file could not be opened or read.
///
/// - kInvalid: input that was read successfully but is corrupt, e.g. a zone
///   file with a bad magic number.
enum class StatusCode : int8_t {
  kOK = 0,
  kUserError = 1,
  kIOError = 2,
  kInvalid = 3,
};
std::string_view toString(StatusCode code);

class [[nodiscard]] Status {
 public:
  // Create a success status.
  constexpr Status() noexcept : state_(nullptr) {}

  ~Status() noexcept {
    if (FOLLY_UNLIKELY(state_ != nullptr)) {
      deleteState();
    }
  }

  explicit Status(StatusCode code);

  Status(StatusCode code, std::string msg);

  // Copy the specified status.
  inline Status(const Status& s);
  inline Status& operator=(const Status& s);

  // Move the specified status.
  inline Status(Status&& s) noexcept;
  inline Status& operator=(Status&& s) noexcept;

  inline bool operator==(const Status& other) const noexcept;
  inline bool operator!=(const Status& other) const noexcept {
    return !(*this == other);
  }

  inline friend std::ostream& operator<<(std::ostream& ss, const Status& s) {
    return ss << s.toString();
  }

  /// Return a success status.
  static Status OK() {
    return Status();
  }

  // The static factory methods below do not follow the lower camel-case pattern
  // as they are meant to represent classes of errors.

  /// Return an error status for user errors.
  template <typename... Args>
  static Status UserError(Args&&... args) {
    return Status::fromArgs(
        StatusCode::kUserError, std::forward<Args>(args)...);
  }

  /// Return an error status when some IO-related operation failed
  template <typename... Args>
  static Status IOError(Args&&... args) {
    return Status::fromArgs(StatusCode::kIOError, std::forward<Args>(args)...);
  }

  /// Return an error status for invalid data (for example a zone file that
  /// fails decoding)
  template <typename... Args>
  static Status Invalid(Args&&... args) {
    return Status::fromArgs(StatusCode::kInvalid, std::forward<Args>(args)...);
  }

  /// Return true iff the status indicates success.
  constexpr bool ok() const {
    return (state_ == nullptr);
  }

  constexpr bool isUserError() const {
    return code() == StatusCode::kUserError;
  }

  constexpr bool isIOError() const {
    return code() == StatusCode::kIOError;
  }

  constexpr bool isInvalid() const {
    return code() == StatusCode::kInvalid;
  }

  /// Return a string representation of this status suitable for printing.
  ///
  /// The string "OK" is returned for success.
  std::string toString() const;

  /// Return a string representation of the status code, without the message
  /// text.
  std::string_view codeAsString() const;

  /// Return the StatusCode value attached to this status.
  constexpr StatusCode code() const {
    return ok() ? StatusCode::kOK : state_->code;
  }

  /// Return the specific error message attached to this status.
  const std::string& message() const {
    static const std::string kNoMessage = "";
    return ok() ? kNoMessage : state_->msg;
  }

  /// Logs 'message' and this status as a warning.
  void warn(const std::string_view& message) const;

 private:
  template <typename... Args>
  static Status
  fromArgs(StatusCode code, fmt::string_view fmt, Args&&... args) {
    return Status(code, fmt::vformat(fmt, fmt::make_format_args(args...)));
  }

  static Status fromArgs(StatusCode code) {
    return Status(code);
  }

  void deleteState() {
    delete state_;
    state_ = nullptr;
  }

  void copyFrom(const Status& s);
  inline void moveFrom(Status& s);

  struct State {
    StatusCode code;
    std::string msg;
  };

  // OK status has a `nullptr` state_.  Otherwise, `state_` points to
  // a `State` structure containing the error code and message.
  State* state_;
};

Status::Status(const Status& s)
    : state_((s.state_ == nullptr) ? nullptr : new State(*s.state_)) {}

Status& Status::operator=(const Status& s) {
  // Catches both aliasing (this == &s) and the case where both are ok.
  if (state_ != s.state_) {
    copyFrom(s);
  }
  return *this;
}

Status::Status(Status&& s) noexcept : state_(s.state_) {
  s.state_ = nullptr;
}

Status& Status::operator=(Status&& s) noexcept {
  moveFrom(s);
  return *this;
}

inline bool Status::operator==(const Status& other) const noexcept {
  if (state_ == other.state_) {
    return true;
  }

  if (ok() || other.ok()) {
    return false;
  }
  return (code() == other.code()) && (message() == other.message());
}

void Status::moveFrom(Status& s) {
  delete state_;
  state_ = s.state_;
  s.state_ = nullptr;
}

/// Holds a result or an error. Designed to be used by APIs that do not throw.
///
/// Status should not be OK.
template <typename T>
using Expected = folly::Expected<T, Status>;

} // namespace facebook::tempo

template <>
struct fmt::formatter<facebook::tempo::Status> : fmt::formatter<std::string> {
  auto format(const facebook::tempo::Status& s, format_context& ctx) const {
    return formatter<std::string>::format(s.toString(), ctx);
  }
};
