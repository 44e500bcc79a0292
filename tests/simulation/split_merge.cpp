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


#include <algorithm>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "client/transaction.hpp"
#include "cluster.hpp"
#include "raftstore/state.hpp"

using namespace rangekv;
using namespace std::chrono_literals;
using rangekv::tests::Cluster;
using rangekv::tests::WaitUntil;

namespace {

constexpr int kRows = 40;

std::string Row(const int i) { return fmt::format("row{:02}", i); }

}  // namespace

class SplitMerge : public ::testing::Test {
 protected:
  void Start(raftstore::Config config = tests::FastConfig()) {
    cluster_ = std::make_unique<Cluster>(3, std::move(config));
    first_ = cluster_->Bootstrap();
    cluster_->WaitForLeader(first_.id);
  }

  void TearDown() override { cluster_.reset(); }

  client::ClusterClient &client() { return cluster_->client(); }

  txn::TimeStamp Now() {
    auto ts = client().GetTimestamp();
    EXPECT_FALSE(ts.HasError());
    return *ts;
  }

  void WriteRows() {
    auto txn = client().Begin();
    for (int i = 0; i < kRows; ++i) txn->Put(Row(i), fmt::format("value{}", i));
    auto commit = txn->Commit();
    ASSERT_FALSE(commit.HasError()) << common::ErrorToString(commit.GetError());
  }

  void ExpectAllRows() {
    auto rows = client().Scan("", "", 0, Now());
    ASSERT_FALSE(rows.HasError()) << common::ErrorToString(rows.GetError());
    ASSERT_EQ(rows->size(), static_cast<size_t>(kRows));
    for (int i = 0; i < kRows; ++i) {
      EXPECT_EQ((*rows)[i].key, Row(i));
      EXPECT_EQ((*rows)[i].value, fmt::format("value{}", i));
    }
  }

  raftstore::SplitResponse Split(const common::ShardId shard_id, std::string split_key) {
    const auto leader = cluster_->WaitForLeader(shard_id);
    auto result = cluster_->store(leader).SplitShard(shard_id, std::move(split_key)).WaitFor(5000ms);
    EXPECT_TRUE(result.has_value());
    if (!result) return {};
    EXPECT_FALSE(result->HasError()) << common::ErrorToString(result->GetError());
    if (result->HasError()) return {};
    return std::get<raftstore::SplitResponse>(**result);
  }

  std::unique_ptr<Cluster> cluster_;
  common::ShardMeta first_;
};

TEST_F(SplitMerge, SplitShardServesBothHalves) {
  Start();
  WriteRows();
  // Caches the route of the whole keyspace.
  ASSERT_FALSE(client().Get(Row(30), Now()).HasError());

  const auto split = Split(first_.id, Row(20));
  EXPECT_EQ(split.left.end_key, Row(20));
  EXPECT_EQ(split.right.start_key, Row(20));
  EXPECT_TRUE(split.right.end_key.empty());
  EXPECT_NE(split.left.id, split.right.id);
  EXPECT_EQ(split.left.epoch.version, first_.epoch.version + 1);

  EXPECT_TRUE(WaitUntil([&] { return cluster_->HasShardsEverywhere(2); }));
  EXPECT_TRUE(WaitUntil([&] { return cluster_->placement().Shards().size() == 2; }));
  cluster_->WaitForLeader(split.right.id);

  // The stale cached route is refreshed on the way.
  auto txn = client().Begin();
  txn->Put(Row(10), "left");
  txn->Put(Row(30), "right");
  ASSERT_FALSE(txn->Commit().HasError());

  auto left = client().Get(Row(10), Now());
  auto right = client().Get(Row(30), Now());
  ASSERT_FALSE(left.HasError());
  ASSERT_FALSE(right.HasError());
  EXPECT_EQ(*left, "left");
  EXPECT_EQ(*right, "right");

  auto rows = client().Scan(Row(15), Row(25), 0, Now());
  ASSERT_FALSE(rows.HasError());
  ASSERT_EQ(rows->size(), 10U);
  EXPECT_EQ(rows->front().key, Row(15));
  EXPECT_EQ(rows->back().key, Row(24));
}

TEST_F(SplitMerge, SplitKeyOutsideTheShardIsRejected) {
  Start();
  WriteRows();
  const auto split = Split(first_.id, Row(20));
  const auto leader = cluster_->WaitForLeader(split.left.id);

  auto result = cluster_->store(leader).SplitShard(split.left.id, Row(30)).WaitFor(5000ms);
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->HasError());
  EXPECT_EQ(cluster_->store(leader).Shards().size(), 2U);
}

TEST_F(SplitMerge, PlacementOperatorSplitsAtTheMiddle) {
  Start();
  WriteRows();

  cluster_->placement().ScheduleOperator(first_.id, placement::SplitShardOp{.split_key = ""});
  ASSERT_TRUE(WaitUntil([&] { return cluster_->placement().Shards().size() == 2; }));
  const auto shards = cluster_->placement().Shards();
  EXPECT_GE(shards[0].meta.end_key, Row(kRows / 2 - 2));
  EXPECT_LE(shards[0].meta.end_key, Row(kRows / 2 + 2));
  ExpectAllRows();
}

TEST_F(SplitMerge, LargeShardSplitsByItself) {
  auto config = tests::FastConfig();
  config.shard_split_size = 16 * 1024;
  config.split_check_tick_interval = 5;
  Start(config);

  for (int i = 0; i < 128; ++i) {
    ASSERT_FALSE(client().RawPut(fmt::format("big{:03}", i), std::string(1024, 'b')).HasError());
  }
  ASSERT_TRUE(WaitUntil([&] { return cluster_->placement().Shards().size() >= 2; }));
  for (int i = 0; i < 128; ++i) {
    auto value = client().RawGet(fmt::format("big{:03}", i));
    ASSERT_FALSE(value.HasError()) << common::ErrorToString(value.GetError());
    EXPECT_EQ(value->value_or(""), std::string(1024, 'b'));
  }
}

TEST_F(SplitMerge, MergeJoinsAdjacentShards) {
  Start();
  WriteRows();
  const auto split = Split(first_.id, Row(20));
  ASSERT_TRUE(WaitUntil([&] { return cluster_->HasShardsEverywhere(2); }));

  const auto source_leader = cluster_->WaitForLeader(split.right.id);
  const auto source = split.right.id;
  auto gc_tracks_source = [&](const common::NodeId node) {
    const auto tracked = cluster_->store(node).GcTrackedShards();
    return std::find(tracked.begin(), tracked.end(), source) != tracked.end();
  };
  ASSERT_FALSE(client().UpdateSafePoint().HasError());
  ASSERT_TRUE(WaitUntil([&] { return gc_tracks_source(source_leader); }));

  auto result = cluster_->store(source_leader).MergeShard(source, split.left.id).WaitFor(5000ms);
  ASSERT_TRUE(result.has_value());
  ASSERT_FALSE(result->HasError()) << common::ErrorToString(result->GetError());

  ASSERT_TRUE(WaitUntil([&] { return cluster_->HasShardsEverywhere(1); }));
  for (common::NodeId node = 1; node <= 3; ++node) {
    auto &engine = cluster_->engine(node);
    ASSERT_TRUE(WaitUntil([&] {
      const auto state = raftstore::LoadShardState(engine, source);
      return state && state->state == common::PeerState::TOMBSTONE && !raftstore::LoadRaftState(engine, source);
    })) << "Shard " << source << " wasn't torn down on node " << node;
    EXPECT_FALSE(raftstore::LoadApplyState(engine, source).has_value());
    EXPECT_FALSE(engine.Get(kvstore::ColumnFamily::RAFT, common::keys::RaftLogKey(source, raftstore::kInitLogIndex + 1))
                     .has_value());

    auto detail = cluster_->store(node).ShardDetail(source).WaitFor(5000ms);
    ASSERT_TRUE(detail.has_value());
    ASSERT_TRUE(detail->HasError());
    EXPECT_TRUE(std::holds_alternative<common::ShardNotFound>(detail->GetError()));
    EXPECT_FALSE(gc_tracks_source(node));
  }
  auto routed = cluster_->store(source_leader)
                    .SendCommand(raftstore::RaftCommand{.header = {.shard_id = source, .epoch = split.right.epoch},
                                                        .request = raftstore::RawGetRequest{.key = Row(30)}})
                    .WaitFor(5000ms);
  ASSERT_TRUE(routed.has_value());
  ASSERT_TRUE(routed->HasError());
  EXPECT_TRUE(std::holds_alternative<common::ShardNotFound>(routed->GetError()));

  ASSERT_TRUE(WaitUntil([&] { return cluster_->placement().Shards().size() == 1; }));
  const auto merged = cluster_->placement().Shards().front().meta;
  EXPECT_EQ(merged.id, split.left.id);
  EXPECT_TRUE(merged.start_key.empty());
  EXPECT_TRUE(merged.end_key.empty());
  EXPECT_GT(merged.epoch.version, split.left.epoch.version);

  ExpectAllRows();
  auto txn = client().Begin();
  txn->Put(Row(5), "after merge");
  txn->Put(Row(35), "after merge");
  ASSERT_FALSE(txn->Commit().HasError());
  auto value = client().Get(Row(35), Now());
  ASSERT_FALSE(value.HasError());
  EXPECT_EQ(*value, "after merge");
}

TEST_F(SplitMerge, MergeIntoMissingShardFails) {
  Start();
  const auto leader = cluster_->WaitForLeader(first_.id);
  auto result = cluster_->store(leader).MergeShard(first_.id, 4242).WaitFor(5000ms);
  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->HasError());
  EXPECT_TRUE(std::holds_alternative<common::ShardNotFound>(result->GetError()));
}
