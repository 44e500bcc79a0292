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

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "placement/client.hpp"
#include "placement/tso.hpp"
#include "utils/synchronized.hpp"

namespace rangekv::placement {

/**
 * Placement service which keeps its whole state in memory. Used by tests and
 * by clusters whose nodes all run inside one process. Operators are never
 * generated on its own, they are queued by ScheduleOperator and handed to the
 * shard leader with its next heartbeat.
 */
class MemoryPlacementService final : public PlacementClient {
 public:
  explicit MemoryPlacementService(uint64_t cluster_id);
  MemoryPlacementService(uint64_t cluster_id, TimestampOracle::PhysicalClock clock);

  uint64_t ClusterId() const override { return cluster_id_; }
  bool IsBootstrapped() const override;
  PlacementResult<> Bootstrap(const NodeMeta &node, const ShardMeta &first_shard) override;
  PlacementResult<uint64_t> AllocId() override;
  PlacementResult<> PutNode(const NodeMeta &node) override;
  PlacementResult<NodeMeta> GetNode(NodeId node_id) const override;
  PlacementResult<> NodeHeartbeat(const NodeStats &stats) override;
  PlacementResult<std::optional<ShardOperator>> ShardHeartbeat(const ShardHeartbeatRequest &heartbeat) override;
  PlacementResult<AskSplitResponse> AskSplit(const ShardMeta &meta) override;
  PlacementResult<> ReportSplit(const ShardMeta &left, const ShardMeta &right) override;
  PlacementResult<ShardRoute> GetShardByKey(std::string_view key) const override;
  PlacementResult<ShardRoute> GetShardById(ShardId shard_id) const override;
  PlacementResult<txn::TimeStamp> GetTimestamp() override;
  PlacementResult<txn::TimeStamp> UpdateGcSafePoint(txn::TimeStamp safe_point) override;
  PlacementResult<txn::TimeStamp> GetGcSafePoint() const override;

  /// Queues an operator for the shard's leader.
  void ScheduleOperator(ShardId shard_id, ShardOperator op);

  /// Every known shard ordered by start key.
  std::vector<ShardRoute> Shards() const;

  std::vector<NodeMeta> Nodes() const;

  std::optional<NodeStats> GetNodeStats(NodeId node_id) const;

 private:
  struct State {
    bool bootstrapped{false};
    uint64_t next_id{1};
    std::map<NodeId, NodeMeta> nodes;
    std::map<NodeId, NodeStats> node_stats;
    std::map<ShardId, ShardRoute> shards;
    /// Start key -> shard id.
    std::map<std::string, ShardId, std::less<>> ranges;
    std::map<ShardId, std::deque<ShardOperator>> operators;
    txn::TimeStamp gc_safe_point{0};
  };

  /// Installs `meta`, dropping every older shard it overlaps. Fails when a
  /// newer descriptor covers part of the range.
  static PlacementResult<> UpdateShard(State *state, const ShardMeta &meta);

  uint64_t cluster_id_;
  TimestampOracle tso_;
  mutable utils::Synchronized<State> state_;
};

}  // namespace rangekv::placement
