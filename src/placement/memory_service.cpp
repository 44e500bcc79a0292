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


#include "placement/memory_service.hpp"

#include <spdlog/spdlog.h>

#include "utils/variant_helpers.hpp"

namespace rangekv::placement {

std::string_view PlacementErrorToString(const PlacementError error) {
  switch (error) {
    case PlacementError::NOT_BOOTSTRAPPED:
      return "NOT_BOOTSTRAPPED";
    case PlacementError::ALREADY_BOOTSTRAPPED:
      return "ALREADY_BOOTSTRAPPED";
    case PlacementError::NODE_NOT_FOUND:
      return "NODE_NOT_FOUND";
    case PlacementError::SHARD_NOT_FOUND:
      return "SHARD_NOT_FOUND";
    case PlacementError::STALE_SHARD:
      return "STALE_SHARD";
    case PlacementError::UNAVAILABLE:
      return "UNAVAILABLE";
  }
  return "UNKNOWN";
}

std::string_view OperatorName(const ShardOperator &op) {
  return std::visit(utils::Overloaded{[](const TransferLeaderOp &) { return std::string_view{"TransferLeader"}; },
                                      [](const ChangePeerOp &) { return std::string_view{"ChangePeer"}; },
                                      [](const SplitShardOp &) { return std::string_view{"SplitShard"}; },
                                      [](const MergeShardOp &) { return std::string_view{"MergeShard"}; }},
                    op);
}

MemoryPlacementService::MemoryPlacementService(const uint64_t cluster_id) : cluster_id_(cluster_id) {}

MemoryPlacementService::MemoryPlacementService(const uint64_t cluster_id, TimestampOracle::PhysicalClock clock)
    : cluster_id_(cluster_id), tso_(std::move(clock)) {}

bool MemoryPlacementService::IsBootstrapped() const {
  return state_.WithLock([](const State &state) { return state.bootstrapped; });
}

PlacementResult<> MemoryPlacementService::Bootstrap(const NodeMeta &node, const ShardMeta &first_shard) {
  auto state = state_.Lock();
  if (state->bootstrapped) return PlacementError::ALREADY_BOOTSTRAPPED;
  state->nodes[node.id] = node;
  state->shards[first_shard.id] = ShardRoute{.meta = first_shard, .leader = std::nullopt};
  state->ranges[first_shard.start_key] = first_shard.id;
  state->bootstrapped = true;
  spdlog::info("Placement bootstrapped cluster {} with node {} and shard {}", cluster_id_, node.id, first_shard.id);
  return {};
}

PlacementResult<uint64_t> MemoryPlacementService::AllocId() {
  auto state = state_.Lock();
  return state->next_id++;
}

PlacementResult<> MemoryPlacementService::PutNode(const NodeMeta &node) {
  auto state = state_.Lock();
  if (!state->bootstrapped) return PlacementError::NOT_BOOTSTRAPPED;
  state->nodes[node.id] = node;
  return {};
}

PlacementResult<NodeMeta> MemoryPlacementService::GetNode(const NodeId node_id) const {
  auto state = state_.Lock();
  const auto it = state->nodes.find(node_id);
  if (it == state->nodes.end()) return PlacementError::NODE_NOT_FOUND;
  return it->second;
}

PlacementResult<> MemoryPlacementService::NodeHeartbeat(const NodeStats &stats) {
  auto state = state_.Lock();
  if (!state->nodes.contains(stats.node_id)) return PlacementError::NODE_NOT_FOUND;
  if (!stats.unhealthy_shards.empty()) {
    spdlog::warn("Node {} reports {} unhealthy shard(s)", stats.node_id, stats.unhealthy_shards.size());
  }
  state->node_stats[stats.node_id] = stats;
  return {};
}

PlacementResult<> MemoryPlacementService::UpdateShard(State *state, const ShardMeta &meta) {
  if (const auto it = state->shards.find(meta.id); it != state->shards.end()) {
    if (common::IsEpochStale(meta.epoch, it->second.meta.epoch)) return PlacementError::STALE_SHARD;
  }

  std::vector<ShardId> overlapped;
  for (const auto &[id, route] : state->shards) {
    if (id == meta.id) continue;
    if (!common::RangesOverlap(route.meta.start_key, route.meta.end_key, meta.start_key, meta.end_key)) continue;
    if (route.meta.epoch.version > meta.epoch.version) return PlacementError::STALE_SHARD;
    overlapped.push_back(id);
  }

  for (const auto id : overlapped) {
    const auto it = state->shards.find(id);
    spdlog::debug("Placement drops shard {} which overlaps shard {}", id, meta.id);
    state->ranges.erase(it->second.meta.start_key);
    state->shards.erase(it);
    state->operators.erase(id);
  }

  auto &route = state->shards[meta.id];
  if (route.meta.id == meta.id) {
    if (const auto range = state->ranges.find(route.meta.start_key);
        range != state->ranges.end() && range->second == meta.id) {
      state->ranges.erase(range);
    }
  }
  route.meta = meta;
  state->ranges[meta.start_key] = meta.id;
  return {};
}

PlacementResult<std::optional<ShardOperator>> MemoryPlacementService::ShardHeartbeat(
    const ShardHeartbeatRequest &heartbeat) {
  auto state = state_.Lock();
  if (!state->bootstrapped) return PlacementError::NOT_BOOTSTRAPPED;
  if (auto result = UpdateShard(&*state, heartbeat.meta); result.HasError()) return result.GetError();

  state->shards[heartbeat.meta.id].leader = heartbeat.leader;

  auto queue = state->operators.find(heartbeat.meta.id);
  if (queue == state->operators.end() || queue->second.empty()) return std::optional<ShardOperator>{};
  auto op = std::move(queue->second.front());
  queue->second.pop_front();
  spdlog::info("Placement sends {} to the leader of shard {}", OperatorName(op), heartbeat.meta.id);
  return std::optional<ShardOperator>{std::move(op)};
}

PlacementResult<AskSplitResponse> MemoryPlacementService::AskSplit(const ShardMeta &meta) {
  auto state = state_.Lock();
  if (!state->bootstrapped) return PlacementError::NOT_BOOTSTRAPPED;
  if (const auto it = state->shards.find(meta.id);
      it != state->shards.end() && common::IsEpochStale(meta.epoch, it->second.meta.epoch)) {
    return PlacementError::STALE_SHARD;
  }
  AskSplitResponse response{.new_shard_id = state->next_id++, .new_peer_ids = {}};
  for (size_t i = 0; i < meta.peers.size(); ++i) {
    response.new_peer_ids.push_back(state->next_id++);
  }
  return response;
}

PlacementResult<> MemoryPlacementService::ReportSplit(const ShardMeta &left, const ShardMeta &right) {
  auto state = state_.Lock();
  if (!state->bootstrapped) return PlacementError::NOT_BOOTSTRAPPED;
  if (auto result = UpdateShard(&*state, left); result.HasError()) return result;
  if (auto result = UpdateShard(&*state, right); result.HasError()) return result;
  spdlog::info("Placement recorded split of shard {} into [{}, {}) and shard {}", left.id, left.start_key,
               left.end_key, right.id);
  return {};
}

PlacementResult<ShardRoute> MemoryPlacementService::GetShardByKey(const std::string_view key) const {
  auto state = state_.Lock();
  auto it = state->ranges.upper_bound(key);
  if (it == state->ranges.begin()) return PlacementError::SHARD_NOT_FOUND;
  --it;
  const auto &route = state->shards.at(it->second);
  if (!route.meta.ContainsKey(key)) return PlacementError::SHARD_NOT_FOUND;
  return route;
}

PlacementResult<ShardRoute> MemoryPlacementService::GetShardById(const ShardId shard_id) const {
  auto state = state_.Lock();
  const auto it = state->shards.find(shard_id);
  if (it == state->shards.end()) return PlacementError::SHARD_NOT_FOUND;
  return it->second;
}

PlacementResult<txn::TimeStamp> MemoryPlacementService::GetTimestamp() { return tso_.Next(); }

PlacementResult<txn::TimeStamp> MemoryPlacementService::UpdateGcSafePoint(const txn::TimeStamp safe_point) {
  auto state = state_.Lock();
  if (safe_point > state->gc_safe_point) {
    spdlog::info("GC safe point advanced from {} to {}", state->gc_safe_point, safe_point);
    state->gc_safe_point = safe_point;
  }
  return state->gc_safe_point;
}

PlacementResult<txn::TimeStamp> MemoryPlacementService::GetGcSafePoint() const {
  return state_.WithLock([](const State &state) { return state.gc_safe_point; });
}

void MemoryPlacementService::ScheduleOperator(const ShardId shard_id, ShardOperator op) {
  auto state = state_.Lock();
  state->operators[shard_id].push_back(std::move(op));
}

std::vector<ShardRoute> MemoryPlacementService::Shards() const {
  auto state = state_.Lock();
  std::vector<ShardRoute> shards;
  shards.reserve(state->ranges.size());
  for (const auto &[start_key, id] : state->ranges) {
    shards.push_back(state->shards.at(id));
  }
  return shards;
}

std::vector<NodeMeta> MemoryPlacementService::Nodes() const {
  auto state = state_.Lock();
  std::vector<NodeMeta> nodes;
  for (const auto &[id, node] : state->nodes) nodes.push_back(node);
  return nodes;
}

std::optional<NodeStats> MemoryPlacementService::GetNodeStats(const NodeId node_id) const {
  auto state = state_.Lock();
  const auto it = state->node_stats.find(node_id);
  if (it == state->node_stats.end()) return std::nullopt;
  return it->second;
}

}  // namespace rangekv::placement
