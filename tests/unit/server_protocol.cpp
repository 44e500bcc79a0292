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
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "client/connector.hpp"
#include "common/errors.hpp"
#include "raftstore/command.hpp"
#include "server/protocol.hpp"
#include "slk/serialization.hpp"
#include "slk/streams.hpp"

using namespace rangekv;
using namespace rangekv::server;

TEST(ServerProtocol, ErrorsSurviveTheResponseConversion) {
  auto response = ToClientResponse(raftstore::ErrorResult(common::NotLeader{.shard_id = 3, .leader = {}}));
  ASSERT_TRUE(std::holds_alternative<common::Error>(response));

  auto result = FromClientResponse(std::move(response));
  ASSERT_TRUE(result.HasError());
  const auto *not_leader = std::get_if<common::NotLeader>(&result.GetError());
  ASSERT_NE(not_leader, nullptr);
  EXPECT_EQ(not_leader->shard_id, 3U);
}

TEST(ServerProtocol, ResponsesSurviveTheWire) {
  ClientResponse response =
      ToClientResponse(raftstore::ResponseResult(raftstore::GetResponse{.value = std::string("stored")}));
  ClientResponse decoded;
  slk::LoadFromString(slk::SaveToString(response), &decoded);

  auto result = FromClientResponse(std::move(decoded));
  ASSERT_FALSE(result.HasError());
  const auto *get = std::get_if<raftstore::GetResponse>(&*result);
  ASSERT_NE(get, nullptr);
  EXPECT_EQ(get->value, "stored");
}

TEST(ServerProtocol, RequestsSurviveTheWire) {
  const ClientRequest command = raftstore::RaftCommand{
      .header = raftstore::CommandHeader{.shard_id = 7, .peer_id = 8, .epoch = {.conf_version = 2, .version = 5}},
      .request = raftstore::CommitRequest{.keys = {"a", "b"}, .start_ts = 10, .commit_ts = 20}};
  ClientRequest decoded;
  slk::LoadFromString(slk::SaveToString(command), &decoded);
  const auto *raft_command = std::get_if<raftstore::RaftCommand>(&decoded);
  ASSERT_NE(raft_command, nullptr);
  EXPECT_EQ(raft_command->header.shard_id, 7U);
  EXPECT_EQ(raft_command->header.epoch.version, 5U);
  const auto *commit = std::get_if<raftstore::CommitRequest>(&raft_command->request);
  ASSERT_NE(commit, nullptr);
  EXPECT_EQ(commit->keys, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(commit->commit_ts, 20U);

  const ClientRequest detail = ShardDetailRequest{.shard_id = 42};
  slk::LoadFromString(slk::SaveToString(detail), &decoded);
  ASSERT_TRUE(std::holds_alternative<ShardDetailRequest>(decoded));
  EXPECT_EQ(std::get<ShardDetailRequest>(decoded).shard_id, 42U);
}

TEST(ServerProtocol, TruncatedRequestIsRejected) {
  const ClientRequest detail = ShardDetailRequest{.shard_id = 42};
  auto data = slk::SaveToString(detail);
  data.resize(data.size() / 2);
  ClientRequest decoded;
  EXPECT_THROW(slk::LoadFromString(data, &decoded), utils::BasicException);
}

TEST(LocalConnector, UnknownNodeTimesOut) {
  client::LocalConnector connector;
  auto result = connector.Call(9, ShardDetailRequest{.shard_id = 1});
  ASSERT_TRUE(result.HasError());
  EXPECT_TRUE(std::holds_alternative<common::TimedOut>(result.GetError()));
}
