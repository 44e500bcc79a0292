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

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "io/future.hpp"
#include "kvstore/kvstore.hpp"
#include "placement/client.hpp"
#include "raftstore/command.hpp"
#include "raftstore/config.hpp"
#include "raftstore/message.hpp"
#include "raftstore/peer.hpp"
#include "raftstore/router.hpp"
#include "raftstore/store_meta.hpp"
#include "raftstore/transport.hpp"
#include "utils/scheduler.hpp"
#include "utils/synchronized.hpp"
#include "utils/thread_pool.hpp"

namespace rangekv::raftstore {

/**
 * Hosts the shard replicas of one node on top of a single store. Creates
 * replicas for shards this node learns about through messages or splits,
 * destroys removed ones, drives their ticks and answers client commands
 * through the router.
 *
 * The engine, transport and placement client must outlive the store.
 */
class Store final {
 public:
  /// @throw RaftstoreConfigException
  Store(Config config, common::NodeId node_id, kvstore::KVStore *engine, Transport *transport,
        placement::PlacementClient *placement);

  Store(const Store &) = delete;
  Store &operator=(const Store &) = delete;
  Store(Store &&) = delete;
  Store &operator=(Store &&) = delete;

  ~Store();

  /// Persists the initial state of a shard created by bootstrap. Does
  /// nothing when the store already has state for the shard.
  /// @throw kvstore::KVStoreIOError
  static bool BootstrapShard(kvstore::KVStore *engine, const ShardMeta &meta);

  /// Starts a replica for every shard of this node found in the store, and
  /// the background jobs.
  /// @throw kvstore::KVStoreIOError
  void Start();

  /// Stops the background jobs and every replica. Pending requests fail.
  void Stop();

  /// Entry point of the transport for messages addressed to this node.
  void OnRaftMessage(RaftMessage msg);

  io::Future<CommandResult> SendCommand(RaftCommand command);
  io::Future<CommandResult> ChangePeers(CommandHeader header, std::vector<ChangePeerRequest> changes);
  io::Future<CommandResult> ShardDetail(ShardId shard_id);
  /// Splits at `split_key`, or at the middle of the data when it's empty.
  io::Future<CommandResult> SplitShard(ShardId shard_id, std::string split_key);
  io::Future<CommandResult> MergeShard(ShardId source_id, ShardId target_id);
  bool TransferLeader(ShardId shard_id, PeerId peer_id);
  bool Campaign(ShardId shard_id);

  std::optional<ShardMeta> FindShardByKey(std::string_view key) const;
  std::optional<ShardMeta> FindShard(ShardId shard_id) const;
  std::vector<ShardMeta> Shards() const;
  bool IsLeader(ShardId shard_id) const;

  /// Pulls the GC safe point and collects garbage below it on the shards
  /// this node leads.
  void RunGc();
  /// Shards whose last GC run is remembered.
  std::vector<ShardId> GcTrackedShards() const;

  common::NodeId node_id() const { return node_id_; }
  const Config &config() const { return config_; }
  kvstore::KVStore *engine() { return engine_; }

 private:
  /// @throw kvstore::KVStoreIOError
  void CreatePeer(const common::ShardLocalState &state, const PeerMeta &self);
  void MaybeCreatePeer(const RaftMessage &msg);
  void CreateSplitPeer(const ShardMeta &meta, bool campaign);
  void DestroyPeer(ShardId shard_id, bool remove_data);
  void ReplyTombstone(const RaftMessage &msg, const ShardMeta &tombstone);
  void SendNodeHeartbeat();

  io::Future<CommandResult> SendWithPromise(ShardId shard_id,
                                            const std::function<PeerMsg(io::Promise<CommandResult>)> &make_msg);

  Config config_;
  common::NodeId node_id_;
  kvstore::KVStore *engine_;
  Transport *transport_;
  placement::PlacementClient *placement_;

  mutable utils::Synchronized<StoreMeta> store_meta_;
  utils::ThreadPool raft_pool_;
  utils::ThreadPool apply_pool_;
  utils::ThreadPool snap_pool_;
  utils::ThreadPool split_check_pool_;
  utils::ThreadPool control_pool_;
  Router router_;
  StoreContext ctx_;

  /// Serializes replica creation and guards `stopped_`.
  std::mutex create_lock_;
  bool stopped_{false};
  std::atomic<bool> started_{false};

  /// Safe point the last GC run of each shard used.
  mutable utils::Synchronized<std::map<ShardId, txn::TimeStamp>> gc_done_;

  utils::Scheduler tick_scheduler_;
  utils::Scheduler gc_scheduler_;
  utils::Scheduler heartbeat_scheduler_;
};

}  // namespace rangekv::raftstore
