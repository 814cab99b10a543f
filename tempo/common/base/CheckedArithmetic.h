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

#include <functional>
#include <limits>

#include <folly/Likely.h>
#include "tempo/common/base/Exceptions.h"

namespace facebook::tempo {

template <typename T>
T checkedPlus(const T& a, const T& b) {
  T result;
  bool overflow = __builtin_add_overflow(a, b, &result);
  if (FOLLY_UNLIKELY(overflow)) {
    TEMPO_ARITHMETIC_ERROR("integer overflow: {} + {}", a, b);
  }
  return result;
}

template <typename T>
T checkedMinus(const T& a, const T& b) {
  T result;
  bool overflow = __builtin_sub_overflow(a, b, &result);
  if (FOLLY_UNLIKELY(overflow)) {
    TEMPO_ARITHMETIC_ERROR("integer overflow: {} - {}", a, b);
  }
  return result;
}

template <typename T>
T checkedMultiply(const T& a, const T& b) {
  T result;
  bool overflow = __builtin_mul_overflow(a, b, &result);
  if (FOLLY_UNLIKELY(overflow)) {
    TEMPO_ARITHMETIC_ERROR("integer overflow: {} * {}", a, b);
  }
  return result;
}

/// Floor division and modulus. The civil arithmetic carries negative
/// remainders into the next unit, so '-1 seconds' becomes '-1 minutes' plus
/// '59 seconds' rather than truncating toward zero.
template <typename T>
constexpr T floorDiv(T a, T b) {
  T q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

template <typename T>
constexpr T floorMod(T a, T b) {
  return a - floorDiv(a, b) * b;
}

} // namespace facebook::tempo
