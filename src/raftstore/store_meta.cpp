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


#include "raftstore/store_meta.hpp"

namespace rangekv::raftstore {

void StoreMeta::SetShard(const ShardMeta &meta) {
  if (const auto it = shards.find(meta.id); it != shards.end()) {
    if (const auto range = ranges.find(it->second.start_key); range != ranges.end() && range->second == meta.id) {
      ranges.erase(range);
    }
  }
  shards[meta.id] = meta;
  if (meta.IsInitialized()) ranges[meta.start_key] = meta.id;
}

void StoreMeta::RemoveShard(const ShardId shard_id) {
  const auto it = shards.find(shard_id);
  if (it == shards.end()) return;
  if (const auto range = ranges.find(it->second.start_key); range != ranges.end() && range->second == shard_id) {
    ranges.erase(range);
  }
  shards.erase(it);
  merge_waiters.erase(shard_id);
  unhealthy.erase(shard_id);
  leaders.erase(shard_id);
}

std::optional<ShardId> StoreMeta::FindOverlap(const ShardMeta &meta) const {
  for (const auto &[start_key, id] : ranges) {
    if (id == meta.id) continue;
    const auto &other = shards.at(id);
    if (common::RangesOverlap(other.start_key, other.end_key, meta.start_key, meta.end_key)) return id;
  }
  return std::nullopt;
}

std::optional<ShardMeta> StoreMeta::FindByKey(const std::string_view key) const {
  auto it = ranges.upper_bound(key);
  if (it == ranges.begin()) return std::nullopt;
  --it;
  const auto &meta = shards.at(it->second);
  if (!meta.ContainsKey(key)) return std::nullopt;
  return meta;
}

std::optional<ShardMeta> StoreMeta::Find(const ShardId shard_id) const {
  const auto it = shards.find(shard_id);
  if (it == shards.end()) return std::nullopt;
  return it->second;
}

}  // namespace rangekv::raftstore
