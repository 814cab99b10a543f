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
#include <optional>
#include <string>
#include <unordered_map>

#include <folly/Conv.h>
#include <folly/Demangle.h>

#include "tempo/common/base/Exceptions.h"

namespace facebook::tempo::config {

/// Read-only key/value settings. The concrete config class should inherit the
/// config base and define all the entries.
class ConfigBase {
 public:
  template <typename T>
  struct Entry {
    Entry(
        const std::string& _key,
        const T& _val,
        std::function<T(const std::string&, const std::string&)> _toT =
            [](const std::string& k, const std::string& v) {
              auto converted = folly::tryTo<T>(v);
              TEMPO_CHECK(
                  converted.hasValue(),
                  fmt::format(
                      "Invalid configuration for key '{}'. Value '{}' cannot be converted to type {}.",
                      k,
                      v,
                      folly::demangle(typeid(T)).toStdString()));
              return converted.value();
            })
        : key{_key}, defaultVal{_val}, toT{_toT} {}

    const std::string key;
    const T defaultVal;
    const std::function<T(const std::string&, const std::string&)> toT;
  };

  explicit ConfigBase(std::unordered_map<std::string, std::string>&& configs)
      : configs_(std::move(configs)) {}

  virtual ~ConfigBase() {}

  /// Returns the configured value of 'entry', or its default when the key is
  /// not set. Throws if the value does not convert to T.
  template <typename T>
  T get(const Entry<T>& entry) const {
    auto value = get(entry.key);
    return value.has_value() ? entry.toT(entry.key, value.value())
                             : entry.defaultVal;
  }

 protected:
  const std::unordered_map<std::string, std::string> configs_;

 private:
  std::optional<std::string> get(const std::string& key) const;
};

} // namespace facebook::tempo::config
