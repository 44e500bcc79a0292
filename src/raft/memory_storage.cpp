// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "raft/memory_storage.hpp"

#include <algorithm>
#include <iterator>

#include "utils/logging.hpp"

namespace rangekv::raft {

MemoryStorage::MemoryStorage() : entries_(1) {}

std::unique_ptr<MemoryStorage> MemoryStorage::WithVoters(const std::vector<uint64_t> &voters) {
  auto storage = std::make_unique<MemoryStorage>();
  ConfState conf_state;
  conf_state.voters = voters;
  storage->SetConfState(conf_state);
  return storage;
}

RaftState MemoryStorage::InitialState() const {
  auto guard = std::lock_guard{lock_};
  return RaftState{hard_state_, snapshot_.metadata.conf_state};
}

StorageResult<std::vector<Entry>> MemoryStorage::Entries(const uint64_t low, const uint64_t high,
                                                         const uint64_t max_size) const {
  auto guard = std::lock_guard{lock_};
  const auto offset = entries_.front().index;
  if (low <= offset) return StorageError::COMPACTED;
  RKV_ASSERT(high <= LastIndexLocked() + 1, "Entries' high bound {} is out of bound, last index {}", high,
             LastIndexLocked());
  // Only the dummy entry is present.
  if (entries_.size() == 1) return StorageError::UNAVAILABLE;

  std::vector<Entry> result(entries_.begin() + static_cast<ptrdiff_t>(low - offset),
                            entries_.begin() + static_cast<ptrdiff_t>(high - offset));
  LimitSize(&result, max_size);
  return result;
}

StorageResult<uint64_t> MemoryStorage::Term(const uint64_t index) const {
  auto guard = std::lock_guard{lock_};
  const auto offset = entries_.front().index;
  if (index < offset) return StorageError::COMPACTED;
  if (index - offset >= entries_.size()) return StorageError::UNAVAILABLE;
  return entries_[index - offset].term;
}

uint64_t MemoryStorage::FirstIndex() const {
  auto guard = std::lock_guard{lock_};
  return FirstIndexLocked();
}

uint64_t MemoryStorage::LastIndex() const {
  auto guard = std::lock_guard{lock_};
  return LastIndexLocked();
}

StorageResult<raft::Snapshot> MemoryStorage::GetSnapshot(const uint64_t /*request_index*/) {
  auto guard = std::lock_guard{lock_};
  if (snapshot_unavailable_) return StorageError::SNAPSHOT_TEMPORARILY_UNAVAILABLE;
  return snapshot_;
}

void MemoryStorage::SetHardState(const HardState &hard_state) {
  auto guard = std::lock_guard{lock_};
  hard_state_ = hard_state;
}

void MemoryStorage::SetConfState(const ConfState &conf_state) {
  auto guard = std::lock_guard{lock_};
  snapshot_.metadata.conf_state = conf_state;
}

utils::BasicResult<StorageError> MemoryStorage::ApplySnapshot(const raft::Snapshot &snapshot) {
  auto guard = std::lock_guard{lock_};
  if (snapshot_.metadata.index >= snapshot.metadata.index) return StorageError::SNAPSHOT_OUT_OF_DATE;
  snapshot_ = snapshot;
  entries_.clear();
  entries_.push_back(Entry{.term = snapshot.metadata.term, .index = snapshot.metadata.index});
  return {};
}

utils::BasicResult<StorageError, raft::Snapshot> MemoryStorage::CreateSnapshot(const uint64_t index,
                                                                               const ConfState *conf_state,
                                                                               std::string data) {
  auto guard = std::lock_guard{lock_};
  if (index <= snapshot_.metadata.index) return StorageError::SNAPSHOT_OUT_OF_DATE;
  const auto offset = entries_.front().index;
  RKV_ASSERT(index <= LastIndexLocked(), "Snapshot index {} is out of bound, last index {}", index,
             LastIndexLocked());
  snapshot_.metadata.index = index;
  snapshot_.metadata.term = entries_[index - offset].term;
  if (conf_state != nullptr) snapshot_.metadata.conf_state = *conf_state;
  snapshot_.data = std::move(data);
  return snapshot_;
}

utils::BasicResult<StorageError> MemoryStorage::Compact(const uint64_t compact_index) {
  auto guard = std::lock_guard{lock_};
  const auto offset = entries_.front().index;
  if (compact_index <= offset) return StorageError::COMPACTED;
  RKV_ASSERT(compact_index <= LastIndexLocked(), "Compact index {} is out of bound, last index {}", compact_index,
             LastIndexLocked());
  const auto i = compact_index - offset;
  std::vector<Entry> entries;
  entries.reserve(entries_.size() - i);
  entries.push_back(Entry{.term = entries_[i].term, .index = entries_[i].index});
  std::move(entries_.begin() + static_cast<ptrdiff_t>(i) + 1, entries_.end(), std::back_inserter(entries));
  entries_ = std::move(entries);
  return {};
}

void MemoryStorage::Append(std::vector<Entry> entries) {
  if (entries.empty()) return;
  auto guard = std::lock_guard{lock_};
  const auto first = FirstIndexLocked();
  const auto last = entries.back().index;
  // Entries which are already compacted are skipped.
  if (last < first) return;
  if (first > entries.front().index) {
    entries.erase(entries.begin(), entries.begin() + static_cast<ptrdiff_t>(first - entries.front().index));
  }

  const auto offset = entries.front().index - entries_.front().index;
  if (entries_.size() > offset) {
    entries_.resize(offset);
  } else {
    RKV_ASSERT(entries_.size() == offset, "Missing log entry [last: {}, append at: {}]", LastIndexLocked(),
               entries.front().index);
  }
  std::move(entries.begin(), entries.end(), std::back_inserter(entries_));
}

void MemoryStorage::SetSnapshotUnavailable(const bool unavailable) {
  auto guard = std::lock_guard{lock_};
  snapshot_unavailable_ = unavailable;
}

}  // namespace rangekv::raft
