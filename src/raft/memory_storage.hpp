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

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "raft/storage.hpp"

namespace rangekv::raft {

/// Storage kept completely in memory. Used by tests and as the reference for
/// persistent implementations.
///
/// The first element of `entries_` is a dummy entry holding the index and
/// term of the last compacted entry (or the snapshot).
class MemoryStorage final : public Storage {
 public:
  MemoryStorage();

  /// Storage of a fresh group with the given voters.
  static std::unique_ptr<MemoryStorage> WithVoters(const std::vector<uint64_t> &voters);

  RaftState InitialState() const override;
  StorageResult<std::vector<Entry>> Entries(uint64_t low, uint64_t high, uint64_t max_size) const override;
  StorageResult<uint64_t> Term(uint64_t index) const override;
  uint64_t FirstIndex() const override;
  uint64_t LastIndex() const override;
  StorageResult<raft::Snapshot> GetSnapshot(uint64_t request_index) override;

  void SetHardState(const HardState &hard_state);
  void SetConfState(const ConfState &conf_state);

  /// Replaces the contents of the storage with the snapshot.
  utils::BasicResult<StorageError> ApplySnapshot(const raft::Snapshot &snapshot);

  /// Makes a snapshot at `index` which can be retrieved with GetSnapshot.
  utils::BasicResult<StorageError, raft::Snapshot> CreateSnapshot(uint64_t index, const ConfState *conf_state,
                                                                  std::string data);

  /// Discards all entries up to and including `compact_index`.
  utils::BasicResult<StorageError> Compact(uint64_t compact_index);

  /// Appends entries, truncating any conflicting suffix of the log.
  void Append(std::vector<Entry> entries);

  /// Makes GetSnapshot report the snapshot as still being generated.
  void SetSnapshotUnavailable(bool unavailable);

 private:
  uint64_t FirstIndexLocked() const { return entries_.front().index + 1; }
  uint64_t LastIndexLocked() const { return entries_.front().index + entries_.size() - 1; }

  mutable std::mutex lock_;
  HardState hard_state_;
  raft::Snapshot snapshot_;
  std::vector<Entry> entries_;
  bool snapshot_unavailable_{false};
};

}  // namespace rangekv::raft
