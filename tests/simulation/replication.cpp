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


#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "cluster.hpp"

using namespace rangekv;
using namespace std::chrono_literals;
using rangekv::tests::Cluster;
using rangekv::tests::WaitUntil;

namespace {

std::string Key(const int i) { return fmt::format("key{:03}", i); }

std::string Value(const int i) { return std::string(64, static_cast<char>('a' + i % 26)); }

bool IsSnapshot(const raftstore::RaftMessage &message) {
  return std::holds_alternative<raft::InstallSnapshot>(message.message.payload);
}

}  // namespace

TEST(Replication, WritesReachEveryNode) {
  Cluster cluster(3);
  const auto shard = cluster.Bootstrap();
  cluster.WaitForLeader(shard.id);

  for (int i = 0; i < 20; ++i) {
    ASSERT_FALSE(cluster.client().RawPut(Key(i), fmt::format("value{}", i)).HasError());
  }
  for (common::NodeId node = 1; node <= 3; ++node) {
    EXPECT_TRUE(WaitUntil([&] { return cluster.ReadLocal(node, Key(19)) == "value19"; })) << "node " << node;
    for (int i = 0; i < 20; ++i) EXPECT_EQ(cluster.ReadLocal(node, Key(i)), fmt::format("value{}", i));
  }

  auto value = cluster.client().RawGet(Key(7));
  ASSERT_FALSE(value.HasError());
  EXPECT_EQ(*value, "value7");

  ASSERT_FALSE(cluster.client().RawDelete(Key(7)).HasError());
  value = cluster.client().RawGet(Key(7));
  ASSERT_FALSE(value.HasError());
  EXPECT_FALSE(value->has_value());
}

TEST(Replication, LeaderIsReportedToPlacement) {
  Cluster cluster(3);
  const auto shard = cluster.Bootstrap();
  const auto leader = cluster.WaitForLeader(shard.id);

  EXPECT_TRUE(WaitUntil([&] {
    auto route = cluster.placement().GetShardById(shard.id);
    return !route.HasError() && route->leader && route->leader->node_id == leader;
  }));
}

TEST(Replication, ShardDetailReportsMetaAndLeader) {
  Cluster cluster(3);
  const auto shard = cluster.Bootstrap();
  const auto leader = cluster.WaitForLeader(shard.id);
  const auto leader_peer = shard.FindPeerOnNode(leader);
  ASSERT_TRUE(leader_peer);

  auto detail_on = [&](const common::NodeId node) -> std::optional<raftstore::ShardDetailResponse> {
    auto result = cluster.store(node).ShardDetail(shard.id).WaitFor(5000ms);
    if (!result || result->HasError()) return std::nullopt;
    return std::get<raftstore::ShardDetailResponse>(**result);
  };

  for (common::NodeId node = 1; node <= 3; ++node) {
    std::optional<raftstore::ShardDetailResponse> detail;
    // Followers learn the leader from its first message.
    ASSERT_TRUE(WaitUntil([&] { return (detail = detail_on(node)) && detail->leader.has_value(); }))
        << "node " << node;
    EXPECT_EQ(detail->meta.id, shard.id);
    EXPECT_TRUE(detail->meta.start_key.empty());
    EXPECT_TRUE(detail->meta.end_key.empty());
    EXPECT_EQ(detail->meta.epoch.conf_version, 1U);
    EXPECT_EQ(detail->meta.epoch.version, 1U);
    EXPECT_EQ(detail->meta.peers, shard.peers);
    EXPECT_EQ(detail->leader->id, leader_peer->id);
    EXPECT_EQ(detail->leader->node_id, leader);
  }

  auto missing = cluster.store(leader).ShardDetail(shard.id + 100).WaitFor(5000ms);
  ASSERT_TRUE(missing.has_value());
  ASSERT_TRUE(missing->HasError());
  EXPECT_TRUE(std::holds_alternative<common::ShardNotFound>(missing->GetError()));
}

TEST(Replication, SurvivesLeaderFailure) {
  Cluster cluster(3);
  const auto shard = cluster.Bootstrap();
  const auto old_leader = cluster.WaitForLeader(shard.id);
  ASSERT_FALSE(cluster.client().RawPut("before", "1").HasError());

  cluster.StopNode(old_leader);
  std::optional<common::NodeId> new_leader;
  ASSERT_TRUE(WaitUntil([&] {
    new_leader = cluster.LeaderOf(shard.id);
    return new_leader && *new_leader != old_leader;
  }));

  auto value = cluster.client().RawGet("before");
  ASSERT_FALSE(value.HasError()) << common::ErrorToString(value.GetError());
  EXPECT_EQ(*value, "1");
  ASSERT_FALSE(cluster.client().RawPut("after", "2").HasError());

  // The old leader rejoins as a follower and catches up.
  cluster.StartNode(old_leader);
  EXPECT_TRUE(WaitUntil([&] { return cluster.ReadLocal(old_leader, "after") == "2"; }));
}

TEST(Replication, MinorityCantWrite) {
  Cluster cluster(3);
  const auto shard = cluster.Bootstrap();
  const auto leader = cluster.WaitForLeader(shard.id);

  cluster.network().Isolate(leader);
  // The isolated node may still consider itself the leader for a while.
  ASSERT_TRUE(WaitUntil([&] {
    for (common::NodeId node = 1; node <= 3; ++node) {
      if (node != leader && cluster.store(node).IsLeader(shard.id)) return true;
    }
    return false;
  }));
  ASSERT_FALSE(cluster.client().RawPut("k", "majority").HasError());
  EXPECT_FALSE(cluster.ReadLocal(leader, "k").has_value());

  cluster.network().Heal();
  EXPECT_TRUE(WaitUntil([&] { return cluster.ReadLocal(leader, "k") == "majority"; }));
}

TEST(Replication, TransferLeader) {
  Cluster cluster(3);
  const auto shard = cluster.Bootstrap();
  const auto leader = cluster.WaitForLeader(shard.id);
  const auto target = leader == 3 ? 1 : leader + 1;
  const auto target_peer = shard.FindPeerOnNode(target);
  ASSERT_TRUE(target_peer);

  ASSERT_TRUE(cluster.store(leader).TransferLeader(shard.id, target_peer->id));
  EXPECT_TRUE(WaitUntil([&] { return cluster.LeaderOf(shard.id) == target; }));
  ASSERT_FALSE(cluster.client().RawPut("k", "v").HasError());
}

TEST(Replication, LaggingFollowerCatchesUpFromSnapshot) {
  auto config = tests::FastConfig();
  config.raft_log_gc_threshold = 8;
  config.raft_log_gc_tick_interval = 2;
  Cluster cluster(3, config, 512);
  const auto shard = cluster.Bootstrap();
  const auto leader = cluster.WaitForLeader(shard.id);
  const common::NodeId lagging = leader == 1 ? 2 : 1;

  auto snapshots = std::make_shared<std::atomic<uint64_t>>(0);
  cluster.network().AddFilter([snapshots, lagging](const raftstore::RaftMessage &message) {
    if (IsSnapshot(message) && message.to_peer.node_id == lagging) snapshots->fetch_add(1);
    return true;
  });

  cluster.StopNode(lagging);
  for (int i = 0; i < 100; ++i) {
    ASSERT_FALSE(cluster.client().RawPut(Key(i), Value(i)).HasError());
  }
  // Gives the leader time to compact the log the stopped node still needs.
  std::this_thread::sleep_for(300ms);

  cluster.StartNode(lagging);
  ASSERT_TRUE(WaitUntil([&] { return cluster.ReadLocal(lagging, Key(99)).has_value(); }));
  for (int i = 0; i < 100; ++i) EXPECT_EQ(cluster.ReadLocal(lagging, Key(i)), Value(i));
  EXPECT_GT(snapshots->load(), 0);
}

TEST(Replication, RestartKeepsAppliedData) {
  Cluster cluster(3);
  const auto shard = cluster.Bootstrap();
  cluster.WaitForLeader(shard.id);

  ASSERT_FALSE(cluster.client().RawPut("k", "1").HasError());
  ASSERT_FALSE(cluster.client().RawPut("k", "2").HasError());
  ASSERT_FALSE(cluster.client().RawDelete("gone").HasError());
  ASSERT_TRUE(WaitUntil([&] {
    for (common::NodeId node = 1; node <= 3; ++node) {
      if (cluster.ReadLocal(node, "k") != "2") return false;
    }
    return true;
  }));

  // Every node replays whatever it hadn't marked as applied. Applying an
  // entry twice must not bring back the older value.
  for (common::NodeId node = 1; node <= 3; ++node) cluster.StopNode(node);
  for (common::NodeId node = 1; node <= 3; ++node) cluster.StartNode(node);
  cluster.WaitForLeader(shard.id);

  auto value = cluster.client().RawGet("k");
  ASSERT_FALSE(value.HasError()) << common::ErrorToString(value.GetError());
  EXPECT_EQ(*value, "2");
  for (common::NodeId node = 1; node <= 3; ++node) EXPECT_EQ(cluster.ReadLocal(node, "k"), "2");
}
