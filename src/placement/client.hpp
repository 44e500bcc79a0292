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
/// Interface to the cluster placement service. It allocates ids, keeps the
/// authoritative shard map, hands out timestamps and decides where replicas
/// live. Nodes only report to it and execute the operators it returns.
#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/types.hpp"
#include "txn/types.hpp"
#include "utils/result.hpp"

namespace rangekv::placement {

using common::NodeId;
using common::PeerMeta;
using common::ShardId;
using common::ShardMeta;

enum class PlacementError : uint8_t {
  NOT_BOOTSTRAPPED,
  ALREADY_BOOTSTRAPPED,
  NODE_NOT_FOUND,
  SHARD_NOT_FOUND,
  STALE_SHARD,
  UNAVAILABLE,
};

std::string_view PlacementErrorToString(PlacementError error);

inline std::ostream &operator<<(std::ostream &in, const PlacementError error) {
  return in << PlacementErrorToString(error);
}

template <typename TValue = void>
using PlacementResult = utils::BasicResult<PlacementError, TValue>;

struct NodeMeta {
  NodeId id{common::kInvalidId};
  /// Address the node serves peer and client traffic on, may be empty for
  /// in-process nodes.
  std::string address;

  friend bool operator==(const NodeMeta &lhs, const NodeMeta &rhs) = default;
};

struct NodeStats {
  NodeId node_id{common::kInvalidId};
  uint64_t shard_count{0};
  uint64_t leader_count{0};
  uint64_t used_bytes{0};
  /// Shards whose replica hit a storage error.
  std::vector<ShardId> unhealthy_shards;
};

struct ShardHeartbeatRequest {
  ShardMeta meta;
  PeerMeta leader;
  uint64_t term{0};
  /// Peers the leader has not heard from within an election timeout.
  std::vector<PeerMeta> down_peers;
  /// Peers still catching up with the log.
  std::vector<PeerMeta> pending_peers;
  uint64_t approximate_size{0};
};

struct TransferLeaderOp {
  PeerMeta peer;
};

enum class ChangePeerType : uint8_t { ADD_VOTER, ADD_LEARNER, REMOVE };

struct ChangePeerOp {
  ChangePeerType type{ChangePeerType::ADD_VOTER};
  PeerMeta peer;
};

struct SplitShardOp {
  /// The leader picks the middle key when empty.
  std::string split_key;
};

struct MergeShardOp {
  ShardId target_id{common::kInvalidId};
};

/// Commands a shard leader receives in reply to its heartbeat.
using ShardOperator = std::variant<TransferLeaderOp, ChangePeerOp, SplitShardOp, MergeShardOp>;

std::string_view OperatorName(const ShardOperator &op);

struct AskSplitResponse {
  ShardId new_shard_id{common::kInvalidId};
  /// One per peer of the parent shard, in the same order.
  std::vector<common::PeerId> new_peer_ids;
};

struct ShardRoute {
  ShardMeta meta;
  std::optional<PeerMeta> leader;
};

/**
 * Client side of the placement service. Implementations are thread safe.
 */
class PlacementClient {
 public:
  PlacementClient() = default;
  PlacementClient(const PlacementClient &) = delete;
  PlacementClient &operator=(const PlacementClient &) = delete;
  PlacementClient(PlacementClient &&) = delete;
  PlacementClient &operator=(PlacementClient &&) = delete;
  virtual ~PlacementClient() = default;

  virtual uint64_t ClusterId() const = 0;

  virtual bool IsBootstrapped() const = 0;

  /// Registers the first node and the shard which covers the whole keyspace.
  virtual PlacementResult<> Bootstrap(const NodeMeta &node, const ShardMeta &first_shard) = 0;

  /// Unique id for nodes, shards and peers.
  virtual PlacementResult<uint64_t> AllocId() = 0;

  virtual PlacementResult<> PutNode(const NodeMeta &node) = 0;

  virtual PlacementResult<NodeMeta> GetNode(NodeId node_id) const = 0;

  virtual PlacementResult<> NodeHeartbeat(const NodeStats &stats) = 0;

  /// Reports a shard as seen by its leader, returns the next operator the
  /// leader should execute if any.
  virtual PlacementResult<std::optional<ShardOperator>> ShardHeartbeat(const ShardHeartbeatRequest &heartbeat) = 0;

  virtual PlacementResult<AskSplitResponse> AskSplit(const ShardMeta &meta) = 0;

  virtual PlacementResult<> ReportSplit(const ShardMeta &left, const ShardMeta &right) = 0;

  virtual PlacementResult<ShardRoute> GetShardByKey(std::string_view key) const = 0;

  virtual PlacementResult<ShardRoute> GetShardById(ShardId shard_id) const = 0;

  /// Strictly increasing across calls.
  virtual PlacementResult<txn::TimeStamp> GetTimestamp() = 0;

  /// The GC safe point never moves backwards, a smaller value is ignored.
  /// Returns the safe point after the update.
  virtual PlacementResult<txn::TimeStamp> UpdateGcSafePoint(txn::TimeStamp safe_point) = 0;

  virtual PlacementResult<txn::TimeStamp> GetGcSafePoint() const = 0;
};

}  // namespace rangekv::placement
