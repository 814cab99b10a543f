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

#include "tempo/common/base/Status.h"

namespace facebook::tempo::test {
namespace {

Expected<int> parseMonth(int month) {
  if (month < 1 || month > 12) {
    return folly::makeUnexpected(Status::UserError("Invalid month {}", month));
  }
  return month;
}

TEST(StatusTest, basic) {
  auto status = Status::OK();
  ASSERT_TRUE(status.ok());
  ASSERT_EQ(status.code(), StatusCode::kOK);
  ASSERT_EQ(status.toString(), "OK");
  ASSERT_EQ(status.message(), "");

  status = Status::IOError("Cannot open {}", "/tmp/zones.tzr");
  ASSERT_FALSE(status.ok());
  ASSERT_TRUE(status.isIOError());
  ASSERT_EQ(status.codeAsString(), "IOError");
  ASSERT_EQ(status.message(), "Cannot open /tmp/zones.tzr");
  ASSERT_EQ(status.toString(), "IOError: Cannot open /tmp/zones.tzr");
  ASSERT_EQ(fmt::format("{}", status), "IOError: Cannot open /tmp/zones.tzr");
}

TEST(StatusTest, codes) {
  ASSERT_TRUE(Status::UserError().isUserError());
  ASSERT_TRUE(Status::Invalid("bad magic").isInvalid());
  ASSERT_FALSE(Status::Invalid("bad magic").isIOError());
  ASSERT_EQ(toString(StatusCode::kUserError), "User error");
  ASSERT_EQ(toString(StatusCode::kInvalid), "Invalid");
  ASSERT_EQ(Status::UserError().toString(), "User error: ");
}

TEST(StatusTest, copyAndMove) {
  const auto status = Status::Invalid("Truncated record {}", 3);
  Status copy(status);
  ASSERT_EQ(copy, status);

  Status moved(std::move(copy));
  ASSERT_EQ(moved, status);
  ASSERT_TRUE(copy.ok());

  Status assigned;
  assigned = moved;
  ASSERT_EQ(assigned, status);
  ASSERT_NE(assigned, Status::Invalid("Truncated record 4"));
  ASSERT_NE(assigned, Status::OK());
}

TEST(StatusTest, expected) {
  auto month = parseMonth(7);
  ASSERT_TRUE(month.hasValue());
  ASSERT_EQ(month.value(), 7);

  month = parseMonth(13);
  ASSERT_TRUE(month.hasError());
  ASSERT_TRUE(month.error().isUserError());
  ASSERT_EQ(month.error().message(), "Invalid month 13");
}

} // namespace
} // namespace facebook::tempo::test
