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


#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "client/cluster_client.hpp"
#include "client/connector.hpp"
#include "client/transaction.hpp"
#include "placement/memory_service.hpp"

using namespace rangekv;
using namespace rangekv::client;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace {

class MockConnector : public KvConnector {
 public:
  MOCK_METHOD(raftstore::CommandResult, Call, (common::NodeId node_id, server::ClientRequest request), (override));
};

common::PeerMeta Peer(common::PeerId id, common::NodeId node_id) { return common::PeerMeta{.id = id, .node_id = node_id}; }

common::ShardMeta Shard(common::ShardId id, std::string start, std::string end, uint64_t version = 1) {
  return common::ShardMeta{.id = id,
                           .start_key = std::move(start),
                           .end_key = std::move(end),
                           .epoch = {.conf_version = 1, .version = version},
                           .peers = {Peer(id * 10 + 1, 1), Peer(id * 10 + 2, 2), Peer(id * 10 + 3, 3)}};
}

const raftstore::RaftCommand &Command(const server::ClientRequest &request) {
  return std::get<raftstore::RaftCommand>(request);
}

raftstore::CommandResult Ok() { return raftstore::ResponseResult(raftstore::EmptyResponse{}); }

class ClusterClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_FALSE(placement_.Bootstrap(placement::NodeMeta{.id = 1}, Shard(1, "", "")).HasError());
    // The leader of shard 1 lives on node 2.
    ASSERT_FALSE(placement_
                     .ShardHeartbeat(placement::ShardHeartbeatRequest{
                         .meta = Shard(1, "", ""), .leader = Peer(12, 2), .term = 1})
                     .HasError());
  }

  void SplitAt(const std::string &key) {
    ASSERT_FALSE(placement_.ReportSplit(Shard(1, "", key, 2), Shard(2, key, "", 2)).HasError());
  }

  placement::MemoryPlacementService placement_{1};
  MockConnector connector_;
  ClusterClient client_{&placement_, &connector_,
                        ClientConfig{.max_retries = 5,
                                     .initial_backoff = std::chrono::milliseconds{1},
                                     .max_backoff = std::chrono::milliseconds{2}}};
};

}  // namespace

TEST_F(ClusterClientTest, RequestsGoToTheLeader) {
  EXPECT_CALL(connector_, Call(2, _)).WillOnce(Invoke([](common::NodeId, server::ClientRequest request) {
    const auto &command = Command(request);
    EXPECT_EQ(command.header.shard_id, 1);
    EXPECT_EQ(command.header.peer_id, 12);
    EXPECT_EQ(command.header.epoch.version, 1);
    const auto &put = std::get<raftstore::RawPutRequest>(command.request);
    EXPECT_EQ(put.key, "k");
    EXPECT_EQ(put.value, "v");
    return Ok();
  }));
  EXPECT_FALSE(client_.RawPut("k", "v").HasError());
  ASSERT_TRUE(client_.CachedRoute("k"));
  EXPECT_EQ(client_.CachedRoute("k")->meta.id, 1);
}

TEST_F(ClusterClientTest, FollowsNotLeaderHints) {
  {
    ::testing::InSequence seq;
    EXPECT_CALL(connector_, Call(2, _))
        .WillOnce(Return(raftstore::ErrorResult(common::NotLeader{.shard_id = 1, .leader = Peer(13, 3)})));
    EXPECT_CALL(connector_, Call(3, _)).WillOnce(Return(raftstore::ResponseResult(raftstore::GetResponse{.value = "v"})));
    // The hint is remembered for the next request.
    EXPECT_CALL(connector_, Call(3, _)).WillOnce(Return(raftstore::ResponseResult(raftstore::GetResponse{})));
  }
  auto value = client_.RawGet("k");
  ASSERT_FALSE(value.HasError());
  EXPECT_EQ(*value, "v");
  auto missing = client_.RawGet("k");
  ASSERT_FALSE(missing.HasError());
  EXPECT_EQ(*missing, std::nullopt);
}

TEST_F(ClusterClientTest, TriesOtherPeersWithoutAHint) {
  {
    ::testing::InSequence seq;
    EXPECT_CALL(connector_, Call(2, _)).WillOnce(Return(raftstore::ErrorResult(common::TimedOut{})));
    EXPECT_CALL(connector_, Call(3, _)).WillOnce(Return(raftstore::ErrorResult(common::NotLeader{.shard_id = 1})));
    EXPECT_CALL(connector_, Call(1, _)).WillOnce(Return(Ok()));
    // The peer which answered is the leader from now on.
    EXPECT_CALL(connector_, Call(1, _)).WillOnce(Return(Ok()));
  }
  EXPECT_FALSE(client_.RawDelete("k").HasError());
  EXPECT_EQ(client_.CachedRoute("k")->leader->id, 11);
  EXPECT_FALSE(client_.RawDelete("k").HasError());
}

TEST_F(ClusterClientTest, StaleEpochRefreshesTheRoute) {
  {
    ::testing::InSequence seq;
    EXPECT_CALL(connector_, Call(2, _)).WillOnce(Return(Ok()));
    // The cached route still covers the whole keyspace.
    EXPECT_CALL(connector_, Call(2, _)).WillOnce(Invoke([](common::NodeId, server::ClientRequest request) {
      EXPECT_EQ(Command(request).header.shard_id, 1);
      return raftstore::ErrorResult(common::StaleEpoch{.current = {Shard(1, "", "m", 2), Shard(2, "m", "", 2)}});
    }));
    EXPECT_CALL(connector_, Call(1, _)).WillOnce(Invoke([](common::NodeId, server::ClientRequest request) {
      EXPECT_EQ(Command(request).header.shard_id, 2);
      EXPECT_EQ(Command(request).header.peer_id, 21);
      EXPECT_EQ(Command(request).header.epoch.version, 2);
      return Ok();
    }));
  }
  EXPECT_FALSE(client_.RawPut("z", "1").HasError());
  SplitAt("m");
  EXPECT_FALSE(client_.RawPut("z", "2").HasError());
  EXPECT_EQ(client_.CachedRoute("a")->meta.end_key, "m");
  EXPECT_EQ(client_.CachedRoute("z")->meta.id, 2);
}

TEST_F(ClusterClientTest, OtherErrorsAreNotRetried) {
  EXPECT_CALL(connector_, Call(_, _))
      .Times(1)
      .WillOnce(Return(raftstore::ErrorResult(common::InvalidRequest{.message = "bad"})));
  auto result = client_.RawPut("k", "v");
  ASSERT_TRUE(result.HasError());
  EXPECT_TRUE(std::holds_alternative<common::InvalidRequest>(result.GetError()));
}

TEST_F(ClusterClientTest, GivesUpWhenBusyForTooLong) {
  // One attempt plus one per backoff wait.
  EXPECT_CALL(connector_, Call(_, _))
      .Times(6)
      .WillRepeatedly(Return(raftstore::ErrorResult(common::ServerIsBusy{.reason = "too many pending proposals"})));
  auto result = client_.RawPut("k", "v");
  ASSERT_TRUE(result.HasError());
  EXPECT_TRUE(std::holds_alternative<common::ServerIsBusy>(result.GetError()));
}

TEST_F(ClusterClientTest, KeysAreGroupedByShard) {
  SplitAt("m");
  EXPECT_CALL(connector_, Call(2, _)).WillOnce(Invoke([](common::NodeId, server::ClientRequest request) {
    const auto &commit = std::get<raftstore::CommitRequest>(Command(request).request);
    EXPECT_EQ(Command(request).header.shard_id, 1);
    EXPECT_EQ(commit.keys, (std::vector<std::string>{"a", "b"}));
    return Ok();
  }));
  EXPECT_CALL(connector_, Call(1, _)).WillOnce(Invoke([](common::NodeId, server::ClientRequest request) {
    const auto &commit = std::get<raftstore::CommitRequest>(Command(request).request);
    EXPECT_EQ(Command(request).header.shard_id, 2);
    EXPECT_EQ(commit.keys, (std::vector<std::string>{"n", "z"}));
    return Ok();
  }));

  int responses = 0;
  auto result = client_.ExecuteOnKeys(
      {"a", "n", "b", "z"},
      [](const std::vector<std::string> &keys) {
        return raftstore::Request{raftstore::CommitRequest{.keys = keys, .start_ts = 1, .commit_ts = 2}};
      },
      [&](raftstore::Response &) { ++responses; });
  EXPECT_FALSE(result.HasError());
  EXPECT_EQ(responses, 2);
}

TEST_F(ClusterClientTest, ScanContinuesInTheNextShard) {
  SplitAt("m");
  EXPECT_CALL(connector_, Call(2, _)).WillOnce(Invoke([](common::NodeId, server::ClientRequest request) {
    const auto &scan = std::get<raftstore::ScanRequest>(Command(request).request);
    EXPECT_EQ(scan.start_key, "");
    EXPECT_EQ(scan.ts, 100);
    return raftstore::ResponseResult(raftstore::ScanResponse{.pairs = {{"a", "1"}, {"b", "2"}}});
  }));
  EXPECT_CALL(connector_, Call(1, _)).WillOnce(Invoke([](common::NodeId, server::ClientRequest request) {
    const auto &scan = std::get<raftstore::ScanRequest>(Command(request).request);
    EXPECT_EQ(scan.start_key, "m");
    return raftstore::ResponseResult(raftstore::ScanResponse{.pairs = {{"n", "3"}}});
  }));

  auto pairs = client_.Scan("", "", 0, 100);
  ASSERT_FALSE(pairs.HasError());
  EXPECT_EQ(*pairs, (std::vector<txn::KvPair>{{"a", "1"}, {"b", "2"}, {"n", "3"}}));
}

TEST_F(ClusterClientTest, SafePointWaitsForRunningTransactions) {
  auto txn = client_.Begin();
  ASSERT_TRUE(txn);
  auto safe_point = client_.UpdateSafePoint();
  ASSERT_FALSE(safe_point.HasError());
  EXPECT_EQ(*safe_point, txn->start_ts());
  EXPECT_EQ(*placement_.GetGcSafePoint(), txn->start_ts());

  // Nothing was written, so nothing has to be rolled back.
  const auto start_ts = txn->start_ts();
  txn.reset();
  EXPECT_FALSE(client_.safe_points().OldestActive());
  safe_point = client_.UpdateSafePoint();
  ASSERT_FALSE(safe_point.HasError());
  EXPECT_GT(*safe_point, start_ts);
  EXPECT_EQ(*placement_.GetGcSafePoint(), *safe_point);
}
