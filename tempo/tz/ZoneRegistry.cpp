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

#include "tempo/tz/ZoneRegistry.h"

#include <fmt/format.h>
#include <folly/synchronization/CallOnce.h>
#include <glog/logging.h>

#include "tempo/flag_definitions/flags.h"

namespace facebook::tempo {
namespace {

constexpr int8_t kEast = 1;
constexpr int8_t kWest = -1;
constexpr uint8_t kSunday = 6;

struct Registry {
  folly::once_flag once;
  InMemoryZoneStore store;
};

Registry& registry() {
  static Registry instance;
  return instance;
}

InMemoryZoneStore buildRegistry(const ZoneRegistryConfig& config) {
  InMemoryZoneStore store;
  if (config.includeBuiltinZones()) {
    store.merge(builtinZones());
  }
  const size_t numBuiltin = store.size();

  std::string path = config.filePath();
  if (path.empty()) {
    path = FLAGS_tempo_zone_file_path;
  }
  if (!path.empty()) {
    auto loaded = readZoneFile(path);
    if (loaded.hasValue()) {
      store.merge(loaded.value());
    } else {
      loaded.error().warn(fmt::format("Skipping zone file {}", path));
    }
  }
  VLOG(1) << "Zone registry populated with " << store.size()
          << " zone records (" << numBuiltin << " built in"
          << (path.empty() ? "" : ", zone file " + path) << ")";
  return store;
}

} // namespace

InMemoryZoneStore builtinZones() {
  InMemoryZoneStore store;
  store.addOffset("UTC", Offset());
  store.addOffset("Asia/Tokyo", Offset(9, 0, kEast));
  store.addOffset("Asia/Kolkata", Offset(5, 30, kEast));
  store.addOffset("Asia/Kathmandu", Offset(5, 45, kEast));
  store.addOffset("America/Phoenix", Offset(7, 0, kWest));

  // Second Sunday of March to first Sunday of November, both at 02:00.
  store.addDst(
      "America/New_York",
      DstZone(
          TransitionRule(3, kSunday, false, 1, 2),
          TransitionRule(11, kSunday, false, 0, 2),
          Offset(5, 0, kWest)));
  store.addDst(
      "Europe/London",
      DstZone(
          TransitionRule(3, kSunday, true, 0, 1),
          TransitionRule(10, kSunday, true, 0, 2),
          Offset(0, 0, kEast)));
  store.addDst(
      "Europe/Berlin",
      DstZone(
          TransitionRule(3, kSunday, true, 0, 2),
          TransitionRule(10, kSunday, true, 0, 3),
          Offset(1, 0, kEast)));
  store.addDst(
      "Australia/Sydney",
      DstZone(
          TransitionRule(10, kSunday, false, 0, 2),
          TransitionRule(4, kSunday, false, 0, 3),
          Offset(10, 0, kEast)));
  store.addDst(
      "Pacific/Auckland",
      DstZone(
          TransitionRule(9, kSunday, true, 0, 2),
          TransitionRule(4, kSunday, false, 0, 3),
          Offset(12, 0, kEast)));
  store.addDst(
      "Australia/Lord_Howe",
      DstZone(
          TransitionRule(10, kSunday, false, 0, 2),
          TransitionRule(4, kSunday, false, 0, 2),
          Offset(10, 30, kEast, true)));
  store.addDst(
      "Antarctica/Troll",
      DstZone(
          TransitionRule(3, kSunday, true, 0, 1),
          TransitionRule(10, kSunday, true, 0, 1),
          Offset(0, 0, kEast, true)));
  return store;
}

bool initializeZoneRegistry(const ZoneRegistryConfig& config) {
  bool initialized = false;
  auto& instance = registry();
  folly::call_once(instance.once, [&] {
    instance.store = buildRegistry(config);
    initialized = true;
  });
  return initialized;
}

const ZoneStore& defaultZoneStore() {
  auto& instance = registry();
  folly::call_once(instance.once, [&] {
    instance.store = buildRegistry(ZoneRegistryConfig());
  });
  return instance.store;
}

} // namespace facebook::tempo
