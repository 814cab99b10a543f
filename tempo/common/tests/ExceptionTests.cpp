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

#include <fmt/format.h>
#include <folly/Range.h>
#include <gtest/gtest.h>

#include <functional>
#include <limits>

#include "tempo/common/base/CheckedArithmetic.h"
#include "tempo/common/base/Exceptions.h"

using namespace facebook::tempo;

template <typename T>
void verifyException(
    std::function<void()> f,
    std::function<void(const T&)> exceptionVerifier) {
  try {
    f();
    FAIL() << "Expected exception of type " << typeid(T).name()
           << ", but no exception was thrown.";
  } catch (const T& e) {
    exceptionVerifier(e);
  } catch (...) {
    FAIL() << "Expected exception of type " << typeid(T).name()
           << ", but instead got an exception of a different type.";
  }
}

void verifyTempoException(
    std::function<void()> f,
    const std::string& messagePrefix) {
  verifyException<TempoException>(f, [&messagePrefix](const auto& e) {
    EXPECT_TRUE(folly::StringPiece{e.what()}.startsWith(messagePrefix))
        << "\nException message prefix mismatch.\n\nExpected prefix: "
        << messagePrefix << "\n\nActual message: " << e.what();
  });
}

TEST(ExceptionTests, argumentsEvaluatedOnFailureOnly) {
  size_t i = 0;
  TEMPO_CHECK(true, "{}", i++);
  EXPECT_EQ(0, i);

  EXPECT_THROW(
      ([&]() { TEMPO_CHECK(false, "{}", i++); })(), TempoRuntimeError);
  EXPECT_EQ(1, i);

  EXPECT_THROW(
      ([&]() { TEMPO_USER_CHECK(false, "{}", ++i); })(), TempoUserError);
  EXPECT_EQ(2, i);
}

TEST(ExceptionTests, exceptionMessage) {
  verifyTempoException(
      []() { TEMPO_CHECK(4 > 5, "Test message 1"); },
      "Exception: TempoRuntimeError\nError Source: RUNTIME\n"
      "Error Code: INVALID_STATE\nReason: Test message 1\n"
      "Retriable: False\nExpression: 4 > 5\nFunction: operator()\nFile: ");

  verifyTempoException(
      []() { TEMPO_USER_CHECK(1 == 2, "Month {} is invalid", 13); },
      "Exception: TempoUserError\nError Source: USER\n"
      "Error Code: INVALID_ARGUMENT\nReason: Month 13 is invalid\n"
      "Retriable: False\nExpression: 1 == 2\nFunction: operator()\nFile: ");
}

TEST(ExceptionTests, unreachable) {
  verifyTempoException(
      []() { TEMPO_UNREACHABLE("Test message 3"); },
      "Exception: TempoRuntimeError\nError Source: RUNTIME\n"
      "Error Code: UNREACHABLE_CODE\nReason: Test message 3\n"
      "Retriable: False\nFunction: operator()\nFile: ");
}

TEST(ExceptionTests, userFail) {
  verifyTempoException(
      []() {
        TEMPO_USER_FAIL("Invalid calendar year range: [{}, {}]", 9, 1);
      },
      "Exception: TempoUserError\nError Source: USER\n"
      "Error Code: INVALID_ARGUMENT\n"
      "Reason: Invalid calendar year range: [9, 1]\n"
      "Retriable: False\nFunction: operator()\nFile: ");
  verifyTempoException(
      []() { TEMPO_USER_FAIL(); },
      "Exception: TempoUserError\nError Source: USER\n"
      "Error Code: INVALID_ARGUMENT\nRetriable: False\n");
}

TEST(ExceptionTests, userCheckComparisons) {
  const uint8_t month = 13;
  verifyTempoException(
      [&]() { TEMPO_USER_CHECK_LE(month, 12); },
      "Exception: TempoUserError\nError Source: USER\n"
      "Error Code: INVALID_ARGUMENT\nReason: (13 vs. 12)\n"
      "Retriable: False\nExpression: month <= 12\n");
  verifyTempoException(
      [&]() { TEMPO_USER_CHECK_EQ(month, 12, "Month of {}", "FAST_UTC"); },
      "Exception: TempoUserError\nError Source: USER\n"
      "Error Code: INVALID_ARGUMENT\n"
      "Reason: (13 vs. 12) Month of FAST_UTC\n"
      "Retriable: False\nExpression: month == 12\n");
  EXPECT_THROW(TEMPO_USER_CHECK_NE(month, 13), TempoUserError);
  EXPECT_THROW(TEMPO_USER_CHECK_GE(month, 14, "Year"), TempoUserError);

  TEMPO_USER_CHECK_LE(month, 13);
  TEMPO_USER_CHECK_GE(month, 1, "Month");
  TEMPO_USER_CHECK_EQ(month, 13);
  TEMPO_USER_CHECK_NE(month, 12, "Month");
  TEMPO_USER_CHECK_LT(month, 14);
}

TEST(ExceptionTests, accessors) {
  try {
    TEMPO_USER_CHECK_LT(16, 15, "Offset hour out of range");
    FAIL() << "Expected TempoUserError";
  } catch (const TempoUserError& e) {
    EXPECT_TRUE(e.isUserError());
    EXPECT_FALSE(e.isRetriable());
    EXPECT_EQ(e.errorCode(), error_code::kInvalidArgument.c_str());
    EXPECT_EQ(e.errorSource(), error_source::kErrorSourceUser.c_str());
    EXPECT_EQ(e.exceptionName(), "TempoUserError");
    EXPECT_EQ(e.failingExpression(), "16 < 15");
    EXPECT_EQ(e.message(), "(16 vs. 15) Offset hour out of range");
  }
}

TEST(ExceptionTests, checkedArithmetic) {
  EXPECT_EQ(checkedPlus<int64_t>(1, 2), 3);
  EXPECT_EQ(checkedMinus<uint64_t>(5, 3), 2);
  EXPECT_EQ(
      checkedMultiply<uint64_t>(86'400, 1'000'000'000), 86'400'000'000'000);

  verifyTempoException(
      []() {
        checkedPlus<int64_t>(std::numeric_limits<int64_t>::max(), 1);
      },
      "Exception: TempoUserError\nError Source: USER\n"
      "Error Code: ARITHMETIC_ERROR\n");
  EXPECT_THROW(checkedMinus<uint64_t>(0, 1), TempoUserError);
  EXPECT_THROW(
      checkedMultiply<uint64_t>(std::numeric_limits<uint64_t>::max(), 2),
      TempoUserError);
}

TEST(ExceptionTests, floorDivision) {
  EXPECT_EQ(floorDiv(7, 3), 2);
  EXPECT_EQ(floorMod(7, 3), 1);
  EXPECT_EQ(floorDiv(-1, 60), -1);
  EXPECT_EQ(floorMod(-1, 60), 59);
  EXPECT_EQ(floorDiv(-60, 60), -1);
  EXPECT_EQ(floorMod(-60, 60), 0);
  EXPECT_EQ(floorDiv(-61, 60), -2);
  EXPECT_EQ(floorMod(-61, 60), 59);
  static_assert(floorDiv(-13, 12) == -2);
  static_assert(floorMod(-13, 12) == 11);
}
