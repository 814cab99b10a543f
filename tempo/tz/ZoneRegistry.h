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

#include "tempo/tz/ZoneRegistryConfig.h"
#include "tempo/tz/ZoneStore.h"

namespace facebook::tempo {

/// Zone records compiled into the library: a handful of fixed-offset zones
/// and one DST zone per rule family, including both irregular DST zones.
InMemoryZoneStore builtinZones();

/// Populates the process-wide zone registry from 'config'. The registry is
/// written once; returns false and leaves it untouched if it was already
/// populated, either by an earlier call or by a lookup through
/// defaultZoneStore().
bool initializeZoneRegistry(const ZoneRegistryConfig& config);

/// The process-wide zone registry. Populated from a default
/// ZoneRegistryConfig on first use unless initializeZoneRegistry() ran
/// before. Read-only afterwards.
const ZoneStore& defaultZoneStore();

} // namespace facebook::tempo
