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

#include <cstdint>
#include <string_view>
#include <vector>

#include "raft/messages.hpp"
#include "utils/result.hpp"

namespace rangekv::raft {

enum class StorageError : uint8_t {
  // The requested index is older than the first retained entry.
  COMPACTED,
  // The requested entries aren't available yet.
  UNAVAILABLE,
  // The snapshot is older than the storage's current snapshot.
  SNAPSHOT_OUT_OF_DATE,
  // A snapshot is being generated, try again later.
  SNAPSHOT_TEMPORARILY_UNAVAILABLE,
};

constexpr std::string_view StorageErrorToString(const StorageError error) {
  switch (error) {
    case StorageError::COMPACTED:
      return "COMPACTED";
    case StorageError::UNAVAILABLE:
      return "UNAVAILABLE";
    case StorageError::SNAPSHOT_OUT_OF_DATE:
      return "SNAPSHOT_OUT_OF_DATE";
    case StorageError::SNAPSHOT_TEMPORARILY_UNAVAILABLE:
      return "SNAPSHOT_TEMPORARILY_UNAVAILABLE";
  }
  return "UNKNOWN";
}

template <typename TValue>
using StorageResult = utils::BasicResult<StorageError, TValue>;

struct RaftState {
  HardState hard_state;
  ConfState conf_state;
};

/// Read side of the persisted log, used by the consensus core. Writes happen
/// outside of the core when a Ready is handled.
class Storage {
 public:
  Storage() = default;
  Storage(const Storage &) = delete;
  Storage &operator=(const Storage &) = delete;
  Storage(Storage &&) = delete;
  Storage &operator=(Storage &&) = delete;
  virtual ~Storage() = default;

  virtual RaftState InitialState() const = 0;

  /// Entries in [low, high). At least one entry is returned when any exists,
  /// even if it exceeds `max_size`.
  virtual StorageResult<std::vector<Entry>> Entries(uint64_t low, uint64_t high, uint64_t max_size) const = 0;

  /// Term of the entry at `index`, which must be in [FirstIndex() - 1,
  /// LastIndex()]. The term of FirstIndex() - 1 is kept for matching.
  virtual StorageResult<uint64_t> Term(uint64_t index) const = 0;

  virtual uint64_t FirstIndex() const = 0;

  virtual uint64_t LastIndex() const = 0;

  /// Most recent snapshot. `request_index` is the index the follower asks
  /// for. Returns SNAPSHOT_TEMPORARILY_UNAVAILABLE while it's being built.
  virtual StorageResult<raft::Snapshot> GetSnapshot(uint64_t request_index) = 0;
};

}  // namespace rangekv::raft
