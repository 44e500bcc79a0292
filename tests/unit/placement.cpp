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


#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "placement/memory_service.hpp"
#include "placement/tso.hpp"

using namespace rangekv;
using namespace rangekv::placement;

namespace {

ShardMeta MakeShard(ShardId id, std::string start, std::string end, uint64_t version,
                    std::vector<PeerMeta> peers = {PeerMeta{.id = 100, .node_id = 1}}) {
  return ShardMeta{.id = id,
                   .start_key = std::move(start),
                   .end_key = std::move(end),
                   .epoch = common::ShardEpoch{.conf_version = 1, .version = version},
                   .peers = std::move(peers)};
}

ShardHeartbeatRequest Heartbeat(const ShardMeta &meta) {
  return ShardHeartbeatRequest{.meta = meta, .leader = meta.peers.front(), .term = 1};
}

class PlacementServiceTest : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_FALSE(service_.Bootstrap(NodeMeta{.id = 1, .address = "n1"}, MakeShard(1, "", "", 1)).HasError()); }

  MemoryPlacementService service_{42};
};

}  // namespace

TEST(PlacementService, RequiresBootstrap) {
  MemoryPlacementService service(7);
  EXPECT_EQ(service.ClusterId(), 7);
  EXPECT_FALSE(service.IsBootstrapped());
  auto put = service.PutNode(NodeMeta{.id = 2});
  ASSERT_TRUE(put.HasError());
  EXPECT_EQ(put.GetError(), PlacementError::NOT_BOOTSTRAPPED);
  EXPECT_EQ(service.GetShardByKey("a").GetError(), PlacementError::SHARD_NOT_FOUND);

  ASSERT_FALSE(service.Bootstrap(NodeMeta{.id = 1}, MakeShard(1, "", "", 1)).HasError());
  EXPECT_TRUE(service.IsBootstrapped());
  auto again = service.Bootstrap(NodeMeta{.id = 1}, MakeShard(1, "", "", 1));
  ASSERT_TRUE(again.HasError());
  EXPECT_EQ(again.GetError(), PlacementError::ALREADY_BOOTSTRAPPED);
}

TEST_F(PlacementServiceTest, Nodes) {
  ASSERT_FALSE(service_.PutNode(NodeMeta{.id = 2, .address = "n2"}).HasError());
  EXPECT_EQ(service_.GetNode(2)->address, "n2");
  EXPECT_EQ(service_.GetNode(3).GetError(), PlacementError::NODE_NOT_FOUND);
  EXPECT_EQ(service_.Nodes().size(), 2);

  EXPECT_EQ(service_.NodeHeartbeat(NodeStats{.node_id = 3}).GetError(), PlacementError::NODE_NOT_FOUND);
  ASSERT_FALSE(service_.NodeHeartbeat(NodeStats{.node_id = 2, .shard_count = 4}).HasError());
  ASSERT_TRUE(service_.GetNodeStats(2));
  EXPECT_EQ(service_.GetNodeStats(2)->shard_count, 4);
  EXPECT_FALSE(service_.GetNodeStats(1));
}

TEST_F(PlacementServiceTest, AllocatedIdsAreUnique) {
  std::set<uint64_t> ids;
  for (int i = 0; i < 100; ++i) {
    auto id = service_.AllocId();
    ASSERT_FALSE(id.HasError());
    EXPECT_TRUE(ids.insert(*id).second);
  }

  auto split = service_.AskSplit(MakeShard(1, "", "", 1, {PeerMeta{.id = 100, .node_id = 1}, PeerMeta{.id = 101, .node_id = 2}}));
  ASSERT_FALSE(split.HasError());
  ASSERT_EQ(split->new_peer_ids.size(), 2);
  EXPECT_TRUE(ids.insert(split->new_shard_id).second);
  for (const auto peer_id : split->new_peer_ids) EXPECT_TRUE(ids.insert(peer_id).second);
}

TEST_F(PlacementServiceTest, RoutesFollowSplits) {
  EXPECT_EQ(service_.GetShardByKey("anything")->meta.id, 1);

  ASSERT_FALSE(service_.ReportSplit(MakeShard(1, "", "m", 2), MakeShard(5, "m", "", 2)).HasError());
  EXPECT_EQ(service_.GetShardByKey("a")->meta.id, 1);
  EXPECT_EQ(service_.GetShardByKey("")->meta.id, 1);
  EXPECT_EQ(service_.GetShardByKey("m")->meta.id, 5);
  EXPECT_EQ(service_.GetShardByKey("zzz")->meta.id, 5);

  const auto shards = service_.Shards();
  ASSERT_EQ(shards.size(), 2);
  EXPECT_EQ(shards[0].meta.id, 1);
  EXPECT_EQ(shards[1].meta.id, 5);

  // The parent's old descriptor is stale now.
  auto stale = service_.ShardHeartbeat(Heartbeat(MakeShard(1, "", "", 1)));
  ASSERT_TRUE(stale.HasError());
  EXPECT_EQ(stale.GetError(), PlacementError::STALE_SHARD);
  EXPECT_EQ(service_.AskSplit(MakeShard(1, "", "", 1)).GetError(), PlacementError::STALE_SHARD);
}

TEST_F(PlacementServiceTest, MergedShardReplacesItsSource) {
  ASSERT_FALSE(service_.ReportSplit(MakeShard(1, "", "m", 2), MakeShard(5, "m", "", 2)).HasError());

  // Shard 5 absorbed shard 1.
  ASSERT_FALSE(service_.ShardHeartbeat(Heartbeat(MakeShard(5, "", "", 3))).HasError());
  const auto shards = service_.Shards();
  ASSERT_EQ(shards.size(), 1);
  EXPECT_EQ(shards[0].meta.id, 5);
  EXPECT_EQ(service_.GetShardByKey("a")->meta.id, 5);
  EXPECT_EQ(service_.GetShardById(1).GetError(), PlacementError::SHARD_NOT_FOUND);

  // A late heartbeat of the source can't bring it back.
  EXPECT_EQ(service_.ShardHeartbeat(Heartbeat(MakeShard(1, "", "m", 2))).GetError(), PlacementError::STALE_SHARD);
}

TEST_F(PlacementServiceTest, OperatorsAreHandedOutInOrder) {
  service_.ScheduleOperator(1, ChangePeerOp{.type = ChangePeerType::ADD_VOTER, .peer = PeerMeta{.id = 101, .node_id = 2}});
  service_.ScheduleOperator(1, TransferLeaderOp{.peer = PeerMeta{.id = 101, .node_id = 2}});

  auto first = service_.ShardHeartbeat(Heartbeat(MakeShard(1, "", "", 1)));
  ASSERT_FALSE(first.HasError());
  ASSERT_TRUE(*first);
  ASSERT_TRUE(std::holds_alternative<ChangePeerOp>(**first));
  EXPECT_EQ(OperatorName(**first), "ChangePeer");
  EXPECT_EQ(std::get<ChangePeerOp>(**first).peer.id, 101);

  auto second = service_.ShardHeartbeat(Heartbeat(MakeShard(1, "", "", 1)));
  ASSERT_FALSE(second.HasError());
  ASSERT_TRUE(*second);
  EXPECT_TRUE(std::holds_alternative<TransferLeaderOp>(**second));

  auto none = service_.ShardHeartbeat(Heartbeat(MakeShard(1, "", "", 1)));
  ASSERT_FALSE(none.HasError());
  EXPECT_FALSE(*none);

  const auto route = service_.GetShardById(1);
  ASSERT_TRUE(route->leader);
  EXPECT_EQ(route->leader->id, 100);
}

TEST_F(PlacementServiceTest, GcSafePointNeverMovesBack) {
  EXPECT_EQ(*service_.GetGcSafePoint(), 0);
  EXPECT_EQ(*service_.UpdateGcSafePoint(100), 100);
  EXPECT_EQ(*service_.UpdateGcSafePoint(50), 100);
  EXPECT_EQ(*service_.GetGcSafePoint(), 100);
}

TEST(TimestampOracle, StrictlyIncreasingOnAStoppedClock) {
  TimestampOracle tso([] { return uint64_t{1000}; });
  EXPECT_EQ(tso.Last(), 0);
  EXPECT_EQ(tso.Next(), txn::ComposeTs(1000, 0));
  EXPECT_EQ(tso.Next(), txn::ComposeTs(1000, 1));
  EXPECT_EQ(tso.Last(), txn::ComposeTs(1000, 1));
}

TEST(TimestampOracle, ClockGoingBackwards) {
  uint64_t now = 2000;
  TimestampOracle tso([&now] { return now; });
  const auto before = tso.Next();
  now = 1500;
  const auto after = tso.Next();
  EXPECT_GT(after, before);
  EXPECT_EQ(txn::ExtractPhysical(after), 2000);
}

TEST(TimestampOracle, ExhaustedLogicalPartBorrowsAMillisecond) {
  TimestampOracle tso([] { return uint64_t{10}; });
  txn::TimeStamp last = 0;
  for (uint64_t i = 0; i < (1ULL << txn::kLogicalBits); ++i) last = tso.Next();
  EXPECT_EQ(last, txn::ComposeTs(10, (1ULL << txn::kLogicalBits) - 1));
  EXPECT_EQ(tso.Next(), txn::ComposeTs(11, 0));
}

TEST(TimestampOracle, ConcurrentCallersGetDistinctTimestamps) {
  TimestampOracle tso;
  constexpr int kThreads = 4;
  constexpr int kPerThread = 1000;
  std::vector<std::vector<txn::TimeStamp>> results(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      txn::TimeStamp previous = 0;
      for (int j = 0; j < kPerThread; ++j) {
        const auto ts = tso.Next();
        EXPECT_GT(ts, previous);
        previous = ts;
        results[i].push_back(ts);
      }
    });
  }
  for (auto &thread : threads) thread.join();

  std::set<txn::TimeStamp> all;
  for (const auto &result : results) all.insert(result.begin(), result.end());
  EXPECT_EQ(all.size(), kThreads * kPerThread);
}
