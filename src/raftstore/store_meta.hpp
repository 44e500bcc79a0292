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

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "common/types.hpp"

namespace rangekv::raftstore {

using common::ShardId;
using common::ShardMeta;

/// Node wide view of the shards hosted locally, shared by all peers.
struct StoreMeta {
  std::map<ShardId, ShardMeta> shards;
  /// Start key -> id, initialized shards only.
  std::map<std::string, ShardId, std::less<>> ranges;
  /// Merge source -> target whose CommitMerge waits for the source to reach
  /// MERGING state.
  std::map<ShardId, ShardId> merge_waiters;
  /// Shards whose replica hit a storage error.
  std::set<ShardId> unhealthy;
  /// Shards whose local replica is the leader.
  std::set<ShardId> leaders;

  /// Inserts or replaces the range of `meta.id`.
  void SetShard(const ShardMeta &meta);

  void RemoveShard(ShardId shard_id);

  /// Some initialized shard other than `meta.id` overlapping its range.
  std::optional<ShardId> FindOverlap(const ShardMeta &meta) const;

  std::optional<ShardMeta> FindByKey(std::string_view key) const;

  std::optional<ShardMeta> Find(ShardId shard_id) const;
};

}  // namespace rangekv::raftstore
