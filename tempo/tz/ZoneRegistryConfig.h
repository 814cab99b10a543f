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
#include <unordered_map>

#include "tempo/common/config/Config.h"

namespace facebook::tempo {

/// Settings of the process-wide zone registry.
class ZoneRegistryConfig : public config::ConfigBase {
 public:
  /// Zone file merged into the registry. When empty, the
  /// --tempo_zone_file_path flag is used instead.
  static inline const Entry<std::string> kFilePath{
      "tempo.zone-registry.file-path",
      "",
      [](const std::string& /*key*/, const std::string& value) {
        return value;
      }};

  /// Whether the registry starts from the compiled-in zone records.
  static inline const Entry<bool> kIncludeBuiltinZones{
      "tempo.zone-registry.include-builtin-zones",
      true};

  explicit ZoneRegistryConfig(
      std::unordered_map<std::string, std::string>&& values = {})
      : ConfigBase(std::move(values)) {}

  std::string filePath() const {
    return get(kFilePath);
  }

  bool includeBuiltinZones() const {
    return get(kIncludeBuiltinZones);
  }
};

} // namespace facebook::tempo
