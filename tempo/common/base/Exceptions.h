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

#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include <folly/Likely.h>
#include <folly/Preprocessor.h>
#include "tempo/common/base/TempoException.h"

DECLARE_bool(tempo_log_check_failures);

namespace facebook::tempo {
namespace detail {

struct TempoCheckFailArgs {
  const char* file;
  size_t line;
  const char* function;
  const char* expression;
  const char* errorSource;
  const char* errorCode;
  bool isRetriable;
};

struct CompileTimeEmptyString {
  CompileTimeEmptyString() = default;
  constexpr operator const char*() const {
    return "";
  }
  constexpr operator std::string_view() const {
    return {};
  }
  operator std::string() const {
    return {};
  }
};

// tempoCheckFail is kept out of line so that small functions calling the
// check macros stay eligible for inlining.
template <typename Exception, typename StringType>
[[noreturn]] void tempoCheckFail(const TempoCheckFailArgs& args, StringType s) {
  static_assert(
      !std::is_same_v<StringType, std::string>,
      "BUG: we should not pass std::string by value to tempoCheckFail");
  if (FLAGS_tempo_log_check_failures) {
    LOG(ERROR) << "Line: " << args.file << ":" << args.line
               << ", Function:" << args.function
               << ", Expression: " << args.expression << " " << s
               << ", Source: " << args.errorSource
               << ", ErrorCode: " << args.errorCode;
  }

  throw Exception(
      args.file,
      args.line,
      args.function,
      args.expression,
      s,
      args.errorSource,
      args.errorCode,
      args.isRetriable);
}

// TempoCheckFailStringType passes std::string by reference to
// tempoCheckFail and everything else by value.
template <typename T>
struct TempoCheckFailStringType;

template <>
struct TempoCheckFailStringType<CompileTimeEmptyString> {
  using type = CompileTimeEmptyString;
};

template <>
struct TempoCheckFailStringType<const char*> {
  using type = const char*;
};

template <>
struct TempoCheckFailStringType<std::string> {
  using type = const std::string&;
};

// Declares the explicit instantiations of tempoCheckFail that Exceptions.cpp
// defines, so they are not emitted in every translation unit.
#define DECLARE_CHECK_FAIL_TEMPLATES(exception_type)                           \
  namespace detail {                                                           \
  extern template void tempoCheckFail<exception_type, CompileTimeEmptyString>( \
      const TempoCheckFailArgs& args,                                          \
      CompileTimeEmptyString);                                                 \
  extern template void tempoCheckFail<exception_type, const char*>(            \
      const TempoCheckFailArgs& args,                                          \
      const char*);                                                            \
  extern template void tempoCheckFail<exception_type, const std::string&>(     \
      const TempoCheckFailArgs& args,                                          \
      const std::string&);                                                     \
  } // namespace detail

// Definitions corresponding to DECLARE_CHECK_FAIL_TEMPLATES. Should
// only be used in Exceptions.cpp.
#define DEFINE_CHECK_FAIL_TEMPLATES(exception_type)                     \
  template void tempoCheckFail<exception_type, CompileTimeEmptyString>( \
      const TempoCheckFailArgs& args, CompileTimeEmptyString);          \
  template void tempoCheckFail<exception_type, const char*>(            \
      const TempoCheckFailArgs& args, const char*);                     \
  template void tempoCheckFail<exception_type, const std::string&>(     \
      const TempoCheckFailArgs& args, const std::string&);

inline CompileTimeEmptyString errorMessage() {
  return {};
}

inline const char* errorMessage(const char* s) {
  return s;
}

template <typename... Args>
std::string errorMessage(fmt::string_view fmt, const Args&... args) {
  return fmt::vformat(fmt, fmt::make_format_args(args...));
}

} // namespace detail

#define _TEMPO_THROW_IMPL(                                               \
    exception, expr_str, errorSource, errorCode, isRetriable, ...)       \
  {                                                                      \
    static const ::facebook::tempo::detail::TempoCheckFailArgs           \
        tempoCheckFailArgs = {                                           \
            __FILE__,                                                    \
            __LINE__,                                                    \
            __FUNCTION__,                                                \
            expr_str,                                                    \
            errorSource,                                                 \
            errorCode,                                                   \
            isRetriable};                                                \
    auto message = ::facebook::tempo::detail::errorMessage(__VA_ARGS__); \
    ::facebook::tempo::detail::tempoCheckFail<                           \
        exception,                                                       \
        typename ::facebook::tempo::detail::TempoCheckFailStringType<    \
            decltype(message)>::type>(tempoCheckFailArgs, message);      \
  }

#define _TEMPO_CHECK_AND_THROW_IMPL(                                     \
    expr, expr_str, exception, errorSource, errorCode, isRetriable, ...) \
  if (FOLLY_UNLIKELY(!(expr))) {                                         \
    _TEMPO_THROW_IMPL(                                                   \
        exception,                                                       \
        expr_str,                                                        \
        errorSource,                                                     \
        errorCode,                                                       \
        isRetriable,                                                     \
        __VA_ARGS__);                                                    \
  }

#define _TEMPO_THROW(exception, ...) \
  _TEMPO_THROW_IMPL(exception, "", ##__VA_ARGS__)

DECLARE_CHECK_FAIL_TEMPLATES(::facebook::tempo::TempoRuntimeError);

#define _TEMPO_CHECK_IMPL(expr, expr_str, ...)                      \
  _TEMPO_CHECK_AND_THROW_IMPL(                                      \
      expr,                                                         \
      expr_str,                                                     \
      ::facebook::tempo::TempoRuntimeError,                         \
      ::facebook::tempo::error_source::kErrorSourceRuntime.c_str(), \
      ::facebook::tempo::error_code::kInvalidState.c_str(),         \
      /* isRetriable */ false,                                      \
      ##__VA_ARGS__)

// With a custom message (4 or more arguments) our "({} vs. {})" prefix is
// joined with the caller's format string; otherwise it is used alone.

#define _TEMPO_CHECK_OP_WITH_USER_FMT_HELPER(   \
    implmacro, expr1, expr2, op, user_fmt, ...) \
  implmacro(                                    \
      (expr1)op(expr2),                         \
      #expr1 " " #op " " #expr2,                \
      "({} vs. {}) " user_fmt,                  \
      expr1,                                    \
      expr2,                                    \
      ##__VA_ARGS__)

#define _TEMPO_CHECK_OP_HELPER(implmacro, expr1, expr2, op, ...) \
  if constexpr (FOLLY_PP_DETAIL_NARGS(__VA_ARGS__) > 0) {        \
    _TEMPO_CHECK_OP_WITH_USER_FMT_HELPER(                        \
        implmacro, expr1, expr2, op, __VA_ARGS__);               \
  } else {                                                       \
    implmacro(                                                   \
        (expr1)op(expr2),                                        \
        #expr1 " " #op " " #expr2,                               \
        "({} vs. {})",                                           \
        expr1,                                                   \
        expr2);                                                  \
  }

#define _TEMPO_USER_CHECK_IMPL(expr, expr_str, ...)              \
  _TEMPO_CHECK_AND_THROW_IMPL(                                   \
      expr,                                                      \
      expr_str,                                                  \
      ::facebook::tempo::TempoUserError,                         \
      ::facebook::tempo::error_source::kErrorSourceUser.c_str(), \
      ::facebook::tempo::error_code::kInvalidArgument.c_str(),   \
      /* isRetriable */ false,                                   \
      ##__VA_ARGS__)

#define _TEMPO_USER_CHECK_OP(expr1, expr2, op, ...) \
  _TEMPO_CHECK_OP_HELPER(                           \
      _TEMPO_USER_CHECK_IMPL, expr1, expr2, op, ##__VA_ARGS__)

// For all below macros, an additional message can be passed using a
// format string and arguments, as with `fmt::format`.
#define TEMPO_CHECK(expr, ...) _TEMPO_CHECK_IMPL(expr, #expr, ##__VA_ARGS__)

#define TEMPO_ARITHMETIC_ERROR(...)                              \
  _TEMPO_THROW(                                                  \
      ::facebook::tempo::TempoUserError,                         \
      ::facebook::tempo::error_source::kErrorSourceUser.c_str(), \
      ::facebook::tempo::error_code::kArithmeticError.c_str(),   \
      /* isRetriable */ false,                                   \
      ##__VA_ARGS__)

#define TEMPO_UNREACHABLE(...)                                      \
  _TEMPO_THROW(                                                     \
      ::facebook::tempo::TempoRuntimeError,                         \
      ::facebook::tempo::error_source::kErrorSourceRuntime.c_str(), \
      ::facebook::tempo::error_code::kUnreachableCode.c_str(),      \
      /* isRetriable */ false,                                      \
      ##__VA_ARGS__)

DECLARE_CHECK_FAIL_TEMPLATES(::facebook::tempo::TempoUserError);

#define TEMPO_USER_CHECK(expr, ...) \
  _TEMPO_USER_CHECK_IMPL(expr, #expr, ##__VA_ARGS__)
#define TEMPO_USER_CHECK_GE(e1, e2, ...) \
  _TEMPO_USER_CHECK_OP(e1, e2, >=, ##__VA_ARGS__)
#define TEMPO_USER_CHECK_LT(e1, e2, ...) \
  _TEMPO_USER_CHECK_OP(e1, e2, <, ##__VA_ARGS__)
#define TEMPO_USER_CHECK_LE(e1, e2, ...) \
  _TEMPO_USER_CHECK_OP(e1, e2, <=, ##__VA_ARGS__)
#define TEMPO_USER_CHECK_EQ(e1, e2, ...) \
  _TEMPO_USER_CHECK_OP(e1, e2, ==, ##__VA_ARGS__)
#define TEMPO_USER_CHECK_NE(e1, e2, ...) \
  _TEMPO_USER_CHECK_OP(e1, e2, !=, ##__VA_ARGS__)

#define TEMPO_USER_FAIL(...)                                     \
  _TEMPO_THROW(                                                  \
      ::facebook::tempo::TempoUserError,                         \
      ::facebook::tempo::error_source::kErrorSourceUser.c_str(), \
      ::facebook::tempo::error_code::kInvalidArgument.c_str(),   \
      /* isRetriable */ false,                                   \
      ##__VA_ARGS__)

} // namespace facebook::tempo
