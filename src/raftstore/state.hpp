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


/// @file
///
/// Per shard state a node persists in the raft column family besides the log
/// entries, and helpers to read and write it.
#pragma once

#include <cstdint>
#include <optional>

#include "common/keys.hpp"
#include "common/types.hpp"
#include "kvstore/kvstore.hpp"
#include "raft/messages.hpp"
#include "slk/serialization.hpp"

namespace rangekv::raftstore {

/// Shards created by bootstrap or split start with a log whose first entries
/// are considered compacted, so that a new replica always catches up through
/// a snapshot.
inline constexpr uint64_t kInitLogIndex = 5;
inline constexpr uint64_t kInitLogTerm = 5;

struct RaftLocalState {
  raft::HardState hard_state;
  uint64_t last_index{0};

  friend bool operator==(const RaftLocalState &lhs, const RaftLocalState &rhs) = default;
};

/// Written together with the effects of every applied entry.
struct ApplyState {
  uint64_t applied_index{0};
  uint64_t applied_term{0};
  /// Entries up to the truncated index have been removed from the log.
  uint64_t truncated_index{0};
  uint64_t truncated_term{0};
  /// Membership as of the applied index.
  raft::ConfState conf_state;

  friend bool operator==(const ApplyState &lhs, const ApplyState &rhs) = default;
};

/// Voters and learners as listed by the shard's peers.
raft::ConfState ConfStateFromMeta(const common::ShardMeta &meta);

void WriteRaftState(kvstore::WriteBatch *batch, common::ShardId shard_id, const RaftLocalState &state);
void WriteApplyState(kvstore::WriteBatch *batch, common::ShardId shard_id, const ApplyState &state);
void WriteShardState(kvstore::WriteBatch *batch, const common::ShardLocalState &state);

/// Writes the raft, apply and shard state of a newly created shard.
void WriteInitialState(kvstore::WriteBatch *batch, const common::ShardMeta &meta);

/// Removes every log entry and the raft and apply state of the shard. The
/// shard state is left in place.
void ClearRaftState(kvstore::WriteBatch *batch, common::ShardId shard_id);

/// Readers for both kvstore::KVStore and kvstore::Snapshot.
/// @throw kvstore::KVStoreIOError
/// @throw slk::SlkDecodeException on a corrupted record.
template <typename TEngine>
std::optional<RaftLocalState> LoadRaftState(const TEngine &engine, const common::ShardId shard_id) {
  auto value = engine.Get(kvstore::ColumnFamily::RAFT, common::keys::RaftStateKey(shard_id));
  if (!value) return std::nullopt;
  RaftLocalState state;
  slk::LoadFromString(*value, &state);
  return state;
}

template <typename TEngine>
std::optional<ApplyState> LoadApplyState(const TEngine &engine, const common::ShardId shard_id) {
  auto value = engine.Get(kvstore::ColumnFamily::RAFT, common::keys::ApplyStateKey(shard_id));
  if (!value) return std::nullopt;
  ApplyState state;
  slk::LoadFromString(*value, &state);
  return state;
}

template <typename TEngine>
std::optional<common::ShardLocalState> LoadShardState(const TEngine &engine, const common::ShardId shard_id) {
  auto value = engine.Get(kvstore::ColumnFamily::RAFT, common::keys::ShardStateKey(shard_id));
  if (!value) return std::nullopt;
  common::ShardLocalState state;
  slk::LoadFromString(*value, &state);
  return state;
}

using slk::Load;
using slk::Save;

void Save(const RaftLocalState &obj, slk::Builder *builder);
void Load(RaftLocalState *obj, slk::Reader *reader);
void Save(const ApplyState &obj, slk::Builder *builder);
void Load(ApplyState *obj, slk::Reader *reader);

}  // namespace rangekv::raftstore
