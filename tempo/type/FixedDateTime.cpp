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

#include "tempo/type/FixedDateTime.h"

#include <chrono>

namespace facebook::tempo {

namespace detail {
uint64_t currentUnixMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}
} // namespace detail

template class FixedDateTime<FixedDateTime64Traits>;
template class FixedDateTime<FixedDateTime32Traits>;
template class FixedDateTime<FixedDateTime16Traits>;
template class FixedDateTime<FixedDateTime8Traits>;

} // namespace facebook::tempo
