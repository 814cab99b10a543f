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

#include "tempo/tz/ZoneStore.h"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <vector>

#include <folly/String.h>
#include <glog/logging.h>

#include "tempo/common/base/Exceptions.h"

namespace facebook::tempo {
namespace {

constexpr std::string_view kMagic = "TZR1";

enum class RecordKind : uint8_t {
  kOffset = 0,
  kDst = 1,
};

void appendUInt32(std::string& out, uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
  }
}

// Cursor over the serialized bytes. Every read reports whether enough bytes
// were left.
class Reader {
 public:
  explicit Reader(std::string_view data) : data_(data) {}

  bool readByte(uint8_t& value) {
    if (pos_ + 1 > data_.size()) {
      return false;
    }
    value = static_cast<uint8_t>(data_[pos_++]);
    return true;
  }

  bool readUInt32(uint32_t& value) {
    if (pos_ + 4 > data_.size()) {
      return false;
    }
    value = 0;
    for (int i = 0; i < 4; ++i) {
      value |= uint32_t{static_cast<uint8_t>(data_[pos_ + i])} << (8 * i);
    }
    pos_ += 4;
    return true;
  }

  bool readString(size_t length, std::string_view& value) {
    if (pos_ + length > data_.size()) {
      return false;
    }
    value = data_.substr(pos_, length);
    pos_ += length;
    return true;
  }

  bool atEnd() const {
    return pos_ == data_.size();
  }

  size_t position() const {
    return pos_;
  }

 private:
  const std::string_view data_;
  size_t pos_{0};
};

void checkName(const std::string& name) {
  TEMPO_USER_CHECK(!name.empty(), "Zone name must not be empty");
  TEMPO_USER_CHECK_LE(
      name.size(),
      InMemoryZoneStore::kMaxNameLength,
      "Zone name too long: {}",
      name);
}

} // namespace

void InMemoryZoneStore::addOffset(const std::string& name, Offset offset) {
  checkName(name);
  dstZones_.erase(name);
  offsets_.insert_or_assign(name, offset);
}

void InMemoryZoneStore::addDst(const std::string& name, DstZone zone) {
  checkName(name);
  offsets_.erase(name);
  dstZones_.insert_or_assign(name, zone);
}

void InMemoryZoneStore::merge(const InMemoryZoneStore& other) {
  for (const auto& [name, offset] : other.offsets_) {
    addOffset(name, offset);
  }
  for (const auto& [name, zone] : other.dstZones_) {
    addDst(name, zone);
  }
}

std::optional<DstZone> InMemoryZoneStore::findDst(std::string_view name) const {
  auto it = dstZones_.find(name);
  if (it == dstZones_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Offset> InMemoryZoneStore::findOffset(
    std::string_view name) const {
  auto it = offsets_.find(name);
  if (it == offsets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string serializeZoneStore(const InMemoryZoneStore& store) {
  struct Record {
    std::string_view name;
    RecordKind kind;
    uint32_t value;
  };
  std::vector<Record> records;
  records.reserve(store.size());
  for (const auto& [name, offset] : store.offsets()) {
    records.push_back({name, RecordKind::kOffset, offset.packed()});
  }
  for (const auto& [name, zone] : store.dstZones()) {
    records.push_back({name, RecordKind::kDst, zone.packed()});
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    return a.name < b.name;
  });

  std::string out(kMagic);
  appendUInt32(out, records.size());
  for (const auto& record : records) {
    out.push_back(static_cast<char>(record.kind));
    out.push_back(static_cast<char>(record.name.size()));
    out.append(record.name);
    if (record.kind == RecordKind::kOffset) {
      out.push_back(static_cast<char>(record.value));
    } else {
      appendUInt32(out, record.value);
    }
  }
  return out;
}

Expected<InMemoryZoneStore> deserializeZoneStore(std::string_view data) {
  Reader reader(data);
  std::string_view magic;
  if (!reader.readString(kMagic.size(), magic) || magic != kMagic) {
    return folly::makeUnexpected(Status::Invalid("Bad zone file magic"));
  }
  uint32_t count;
  if (!reader.readUInt32(count)) {
    return folly::makeUnexpected(
        Status::Invalid("Truncated zone file header"));
  }

  InMemoryZoneStore store;
  for (uint32_t i = 0; i < count; ++i) {
    uint8_t kind;
    uint8_t nameLength;
    std::string_view name;
    if (!reader.readByte(kind) || !reader.readByte(nameLength) ||
        !reader.readString(nameLength, name)) {
      return folly::makeUnexpected(Status::Invalid(
          "Truncated zone record {} at offset {}", i, reader.position()));
    }
    if (name.empty()) {
      return folly::makeUnexpected(
          Status::Invalid("Zone record {} has an empty name", i));
    }
    // Packed values are validated by the record decoders, which throw on
    // reserved codes.
    try {
      switch (static_cast<RecordKind>(kind)) {
        case RecordKind::kOffset: {
          uint8_t packed;
          if (!reader.readByte(packed)) {
            return folly::makeUnexpected(
                Status::Invalid("Truncated offset for zone {}", name));
          }
          store.addOffset(std::string(name), Offset::fromPacked(packed));
          break;
        }
        case RecordKind::kDst: {
          uint32_t packed;
          if (!reader.readUInt32(packed)) {
            return folly::makeUnexpected(
                Status::Invalid("Truncated DST rule for zone {}", name));
          }
          store.addDst(std::string(name), DstZone::fromPacked(packed));
          break;
        }
        default:
          return folly::makeUnexpected(Status::Invalid(
              "Unknown record kind {} for zone {}", kind, name));
      }
    } catch (const TempoUserError& e) {
      return folly::makeUnexpected(Status::Invalid(
          "Invalid record for zone {}: {}", name, e.message()));
    }
  }
  if (!reader.atEnd()) {
    return folly::makeUnexpected(Status::Invalid(
        "{} trailing bytes after {} zone records",
        data.size() - reader.position(),
        count));
  }
  return store;
}

Status writeZoneFile(const std::string& path, const InMemoryZoneStore& store) {
  const std::string data = serializeZoneStore(store);
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    return Status::IOError(
        "Cannot open or create {}. Error: {}", path, folly::errnoStr(errno));
  }
  const ssize_t written = ::write(fd, data.data(), data.size());
  const int writeErrno = errno;
  if (::close(fd) < 0) {
    return Status::IOError(
        "Cannot close {}. Error: {}", path, folly::errnoStr(errno));
  }
  if (written != static_cast<ssize_t>(data.size())) {
    return Status::IOError(
        "Short write to {}, {} vs. {}. Error: {}",
        path,
        written,
        data.size(),
        folly::errnoStr(writeErrno));
  }
  return Status::OK();
}

Expected<InMemoryZoneStore> readZoneFile(const std::string& path) {
  const int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    if (errno == ENOENT) {
      return folly::makeUnexpected(
          Status::IOError("No such file or directory: {}", path));
    }
    return folly::makeUnexpected(Status::IOError(
        "Cannot open {}. Error: {}", path, folly::errnoStr(errno)));
  }
  const off_t size = ::lseek(fd, 0, SEEK_END);
  if (size < 0) {
    const auto error = folly::errnoStr(errno);
    ::close(fd);
    return folly::makeUnexpected(
        Status::IOError("Cannot seek {}. Error: {}", path, error));
  }
  std::string data(size, '\0');
  const ssize_t bytesRead = ::pread(fd, data.data(), size, 0);
  const int readErrno = errno;
  ::close(fd);
  if (bytesRead != size) {
    return folly::makeUnexpected(Status::IOError(
        "Short read of {}, {} vs. {}. Error: {}",
        path,
        bytesRead,
        size,
        folly::errnoStr(readErrno)));
  }
  return deserializeZoneStore(data);
}

const InMemoryZoneStore& FileZoneStore::ensureLoaded() const {
  folly::call_once(loadOnce_, [&] {
    auto loaded = readZoneFile(path_);
    if (loaded.hasError()) {
      loadStatus_ = std::move(loaded.error());
      LOG(WARNING) << "Failed to load zone file " << path_ << ": "
                   << loadStatus_.toString();
      return;
    }
    store_ = std::move(loaded.value());
    LOG(INFO) << "Loaded " << store_.size() << " zone records from " << path_;
  });
  return store_;
}

} // namespace facebook::tempo
