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

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "client/cluster_client.hpp"
#include "client/connector.hpp"
#include "common/keys.hpp"
#include "io/local_transport.hpp"
#include "kvstore/kvstore.hpp"
#include "placement/memory_service.hpp"
#include "raftstore/store.hpp"
#include "server/kv_service.hpp"
#include "utils/file.hpp"

namespace rangekv::tests {

using namespace std::chrono_literals;

/// Short ticks so elections and log compaction happen within a test.
inline raftstore::Config FastConfig() {
  raftstore::Config config;
  config.raft_base_tick_interval = 10ms;
  config.raft_election_timeout_ticks = 10;
  config.raft_heartbeat_ticks = 2;
  config.raft_pool_size = 1;
  config.apply_pool_size = 1;
  config.snap_pool_size = 1;
  config.raft_log_gc_tick_interval = 5;
  config.split_check_tick_interval = 10;
  config.placement_heartbeat_tick_interval = 5;
  config.merge_check_tick_interval = 5;
  config.proposal_timeout_ticks = 300;
  config.gc_interval = 100ms;
  config.node_heartbeat_interval = 100ms;
  return config;
}

template <typename TPredicate>
bool WaitUntil(TPredicate &&predicate, const std::chrono::milliseconds timeout = 15s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(10ms);
  }
  return predicate();
}

/**
 * Nodes of one cluster living in the test process. They talk over a
 * `LocalNetwork`, share an in-memory placement service and are reached by
 * the client through a `LocalConnector`. Stopped nodes keep their store and
 * can be started again.
 */
class Cluster {
 public:
  explicit Cluster(const size_t node_count, raftstore::Config config = FastConfig(), size_t snap_chunk_size = 4096)
      : config_(std::move(config)),
        directory_(std::filesystem::temp_directory_path() /
                   fmt::format("rangekv_simulation_{}_{}", ::getpid(),
                               ::testing::UnitTest::GetInstance()->current_test_info()->name())),
        placement_(1),
        network_(snap_chunk_size) {
    std::filesystem::remove_all(directory_);
    utils::EnsureDirOrDie(directory_);
    for (common::NodeId id = 1; id <= node_count; ++id) {
      auto &node = nodes_[id];
      node.engine = std::make_unique<kvstore::KVStore>(directory_ / fmt::format("node_{}", id));
      node.transport = std::make_unique<io::LocalTransport>(&network_);
    }
    client_ = std::make_unique<client::ClusterClient>(
        &placement_, &connector_,
        client::ClientConfig{.max_retries = 200, .initial_backoff = 5ms, .max_backoff = 100ms, .lock_ttl = 3000});
  }

  Cluster(const Cluster &) = delete;
  Cluster &operator=(const Cluster &) = delete;
  Cluster(Cluster &&) = delete;
  Cluster &operator=(Cluster &&) = delete;

  ~Cluster() {
    client_.reset();
    for (auto &[id, node] : nodes_) StopNode(id);
    nodes_.clear();
    std::filesystem::remove_all(directory_);
  }

  /// Creates the first shard with a replica on every node and starts the
  /// nodes.
  common::ShardMeta Bootstrap() {
    common::ShardMeta first;
    first.id = *placement_.AllocId();
    for (const auto &[id, node] : nodes_) {
      first.peers.push_back(common::PeerMeta{.id = *placement_.AllocId(), .node_id = id});
    }
    EXPECT_FALSE(placement_.Bootstrap(placement::NodeMeta{.id = nodes_.begin()->first}, first).HasError());
    for (auto &[id, node] : nodes_) {
      EXPECT_FALSE(placement_.PutNode(placement::NodeMeta{.id = id}).HasError());
      raftstore::Store::BootstrapShard(node.engine.get(), first);
    }
    for (const auto &[id, node] : nodes_) StartNode(id);
    return first;
  }

  void StartNode(const common::NodeId id) {
    auto &node = nodes_.at(id);
    if (node.store) return;
    node.store = std::make_unique<raftstore::Store>(config_, id, node.engine.get(), node.transport.get(), &placement_);
    node.service = std::make_unique<server::KvService>(node.store.get(), 5s);
    auto *store = node.store.get();
    network_.RegisterNode(id, [store](raftstore::RaftMessage message) { store->OnRaftMessage(std::move(message)); });
    node.store->Start();
    connector_.Register(id, node.service.get());
  }

  /// The node's data stays in its engine.
  void StopNode(const common::NodeId id) {
    auto &node = nodes_.at(id);
    if (!node.store) return;
    connector_.Unregister(id);
    network_.UnregisterNode(id);
    node.store->Stop();
    node.service.reset();
    node.store.reset();
  }

  std::optional<common::NodeId> LeaderOf(const common::ShardId shard_id) const {
    for (const auto &[id, node] : nodes_) {
      if (node.store && node.store->IsLeader(shard_id)) return id;
    }
    return std::nullopt;
  }

  common::NodeId WaitForLeader(const common::ShardId shard_id) {
    std::optional<common::NodeId> leader;
    EXPECT_TRUE(WaitUntil([&] { return (leader = LeaderOf(shard_id)).has_value(); }))
        << "Shard " << shard_id << " has no leader";
    return leader.value_or(common::kInvalidId);
  }

  /// Reads a raw value straight from the node's engine.
  std::optional<std::string> ReadLocal(const common::NodeId id, const std::string &key) {
    return nodes_.at(id).engine->Get(kvstore::ColumnFamily::DEFAULT, common::keys::DataKey(key));
  }

  /// True once every running node hosts exactly `count` shards.
  bool HasShardsEverywhere(const size_t count) const {
    for (const auto &[id, node] : nodes_) {
      if (node.store && node.store->Shards().size() != count) return false;
    }
    return true;
  }

  raftstore::Store &store(const common::NodeId id) { return *nodes_.at(id).store; }
  kvstore::KVStore &engine(const common::NodeId id) { return *nodes_.at(id).engine; }
  placement::MemoryPlacementService &placement() { return placement_; }
  io::LocalNetwork &network() { return network_; }
  client::ClusterClient &client() { return *client_; }

 private:
  struct Node {
    std::unique_ptr<kvstore::KVStore> engine;
    std::unique_ptr<io::LocalTransport> transport;
    std::unique_ptr<raftstore::Store> store;
    std::unique_ptr<server::KvService> service;
  };

  raftstore::Config config_;
  std::filesystem::path directory_;
  placement::MemoryPlacementService placement_;
  io::LocalNetwork network_;
  client::LocalConnector connector_;
  std::map<common::NodeId, Node> nodes_;
  std::unique_ptr<client::ClusterClient> client_;
};

}  // namespace rangekv::tests
