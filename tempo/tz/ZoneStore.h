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

#include <optional>
#include <string>
#include <string_view>

#include <folly/container/F14Map.h>
#include <folly/synchronization/CallOnce.h>

#include "tempo/common/base/Status.h"
#include "tempo/tz/ZoneRecord.h"

namespace facebook::tempo {

/// Name to zone record lookup. A zone is either a fixed offset or a DST zone;
/// a name resolves to at most one of the two.
class ZoneStore {
 public:
  virtual ~ZoneStore() = default;

  virtual std::optional<DstZone> findDst(std::string_view name) const = 0;

  virtual std::optional<Offset> findOffset(std::string_view name) const = 0;

  /// Number of zone records.
  virtual size_t size() const = 0;
};

class InMemoryZoneStore : public ZoneStore {
 public:
  /// Longest zone name the binary zone file format can hold.
  static constexpr size_t kMaxNameLength = 255;

  /// Adds a fixed-offset zone, replacing any record with the same name.
  void addOffset(const std::string& name, Offset offset);

  /// Adds a DST zone, replacing any record with the same name.
  void addDst(const std::string& name, DstZone zone);

  /// Copies every record of 'other' into this store. Records of 'other' win
  /// on name collisions.
  void merge(const InMemoryZoneStore& other);

  std::optional<DstZone> findDst(std::string_view name) const override;

  std::optional<Offset> findOffset(std::string_view name) const override;

  size_t size() const override {
    return dstZones_.size() + offsets_.size();
  }

  const folly::F14FastMap<std::string, DstZone>& dstZones() const {
    return dstZones_;
  }

  const folly::F14FastMap<std::string, Offset>& offsets() const {
    return offsets_;
  }

 private:
  folly::F14FastMap<std::string, DstZone> dstZones_;
  folly::F14FastMap<std::string, Offset> offsets_;
};

/// Binary zone file layout, all integers little endian:
///
///   "TZR1" | uint32 record count | record*
///
/// where a record is a kind byte (0 = offset, 1 = DST zone), a name length
/// byte, the name, then either the packed Offset byte or the 4 byte packed
/// DstZone. Records are written sorted by name.
std::string serializeZoneStore(const InMemoryZoneStore& store);

/// Returns Status::Invalid if 'data' is not a well formed zone file.
Expected<InMemoryZoneStore> deserializeZoneStore(std::string_view data);

Status writeZoneFile(const std::string& path, const InMemoryZoneStore& store);

/// Returns Status::IOError if the file cannot be read and Status::Invalid if
/// its content does not decode.
Expected<InMemoryZoneStore> readZoneFile(const std::string& path);

/// Store backed by a zone file. The file is read once, on the first lookup.
/// If it cannot be loaded, a warning is logged and every lookup misses.
class FileZoneStore : public ZoneStore {
 public:
  explicit FileZoneStore(std::string path) : path_(std::move(path)) {}

  std::optional<DstZone> findDst(std::string_view name) const override {
    return ensureLoaded().findDst(name);
  }

  std::optional<Offset> findOffset(std::string_view name) const override {
    return ensureLoaded().findOffset(name);
  }

  size_t size() const override {
    return ensureLoaded().size();
  }

  const std::string& path() const {
    return path_;
  }

  /// Outcome of loading the file. Triggers the load.
  const Status& loadStatus() const {
    ensureLoaded();
    return loadStatus_;
  }

 private:
  const InMemoryZoneStore& ensureLoaded() const;

  const std::string path_;
  mutable folly::once_flag loadOnce_;
  mutable InMemoryZoneStore store_;
  mutable Status loadStatus_;
};

} // namespace facebook::tempo
