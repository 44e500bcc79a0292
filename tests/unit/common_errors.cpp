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


#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "slk/serialization.hpp"

using namespace rangekv;
using namespace rangekv::common;

TEST(Errors, CodesMatchAlternatives) {
  EXPECT_EQ(GetErrorCode(NotLeader{}), ErrorCode::NOT_LEADER);
  EXPECT_EQ(GetErrorCode(StaleEpoch{}), ErrorCode::STALE_EPOCH);
  EXPECT_EQ(GetErrorCode(KeyIsLocked{}), ErrorCode::KEY_IS_LOCKED);
  EXPECT_EQ(GetErrorCode(TimedOut{}), ErrorCode::TIMED_OUT);
  EXPECT_EQ(GetErrorCode(InvalidRequest{}), ErrorCode::INVALID_REQUEST);
}

TEST(Errors, RoutingErrorsAreRetryable) {
  EXPECT_TRUE(IsRetryableRoutingError(NotLeader{}));
  EXPECT_TRUE(IsRetryableRoutingError(StaleEpoch{}));
  EXPECT_TRUE(IsRetryableRoutingError(ShardNotFound{}));
  EXPECT_TRUE(IsRetryableRoutingError(KeyNotInShard{}));
  EXPECT_TRUE(IsRetryableRoutingError(ServerIsBusy{}));
  EXPECT_TRUE(IsRetryableRoutingError(ShardMerging{}));

  EXPECT_FALSE(IsRetryableRoutingError(KeyIsLocked{}));
  EXPECT_FALSE(IsRetryableRoutingError(WriteConflict{}));
  EXPECT_FALSE(IsRetryableRoutingError(Committed{}));
  EXPECT_FALSE(IsRetryableRoutingError(StorageIOError{}));
  EXPECT_FALSE(IsRetryableRoutingError(SnapshotCorrupt{}));
}

TEST(Errors, ToStringNamesTheCode) {
  const Error error = NotLeader{.shard_id = 4, .leader = std::nullopt};
  const auto text = ErrorToString(error);
  EXPECT_NE(text.find("NOT_LEADER"), std::string::npos);
  EXPECT_NE(text.find("unknown"), std::string::npos);

  EXPECT_EQ(ErrorToString(TimedOut{}), "TIMED_OUT");
}

TEST(Errors, SerializedErrorsKeepTheirDetails) {
  ShardMeta meta;
  meta.id = 9;
  meta.start_key = "a";
  meta.end_key = "m";
  meta.epoch = ShardEpoch{.conf_version = 2, .version = 3};
  meta.peers.push_back(PeerMeta{.id = 10, .node_id = 1});

  Error decoded;
  slk::LoadFromString(slk::SaveToString(Error{StaleEpoch{.current = {meta}}}), &decoded);
  ASSERT_TRUE(std::holds_alternative<StaleEpoch>(decoded));
  ASSERT_EQ(std::get<StaleEpoch>(decoded).current.size(), 1);
  EXPECT_EQ(std::get<StaleEpoch>(decoded).current[0], meta);

  const LockInfo lock{.key = "k", .primary = "p", .start_ts = 5, .ttl = 3000, .type = LockType::DELETE};
  slk::LoadFromString(slk::SaveToString(Error{KeyIsLocked{.lock = lock}}), &decoded);
  ASSERT_TRUE(std::holds_alternative<KeyIsLocked>(decoded));
  EXPECT_EQ(std::get<KeyIsLocked>(decoded).lock, lock);
}
