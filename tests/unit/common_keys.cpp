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

#include "common/keys.hpp"
#include "utils/codec.hpp"

using namespace rangekv::common;
using namespace std::string_literals;

TEST(Keys, DataKeysStayInsideTheDataRange) {
  for (const auto *user_key : {"", "a", "zzzz", "\xff\xff"}) {
    const auto key = keys::DataKey(user_key);
    EXPECT_GE(key, keys::DataMinKey());
    EXPECT_LT(key, keys::DataMaxKey());
    EXPECT_EQ(keys::OriginKey(key), user_key);
  }
}

TEST(Keys, EmptyEndKeyIsTheEndOfTheKeyspace) {
  EXPECT_EQ(keys::DataEndKey(""), keys::DataMaxKey());
  EXPECT_EQ(keys::DataEndKey("m"), keys::DataKey("m"));

  ShardMeta meta;
  meta.start_key = "a";
  EXPECT_EQ(keys::ShardDataStart(meta), keys::DataKey("a"));
  EXPECT_EQ(keys::ShardDataEnd(meta), keys::DataMaxKey());
}

TEST(Keys, VersionsOfAKeySortNewestFirst) {
  const auto v10 = keys::DataKeyWithTs("k", 10);
  const auto v20 = keys::DataKeyWithTs("k", 20);
  EXPECT_LT(v20, v10);
  // Every version of "k" sorts before any version of a larger key.
  EXPECT_LT(v10, keys::DataKeyWithTs("k\0"s, 100));
  EXPECT_LT(keys::DataKey("k"), v20);

  const auto [user_key, ts] = keys::SplitKeyTs(v20);
  EXPECT_EQ(user_key, "k");
  EXPECT_EQ(ts, 20);
}

TEST(Keys, SplitKeyTsRejectsForeignKeys) {
  EXPECT_THROW(keys::SplitKeyTs(keys::RaftStateKey(1)), rangekv::utils::CodecException);
  EXPECT_THROW(keys::SplitKeyTs(keys::DataKey("k")), rangekv::utils::CodecException);
  EXPECT_THROW(keys::OriginKey("x"), rangekv::utils::CodecException);
}

TEST(Keys, RaftLogKeysOrderByIndex) {
  EXPECT_LT(keys::RaftLogKey(7, 9), keys::RaftLogKey(7, 10));
  EXPECT_LT(keys::RaftLogKey(7, 10), keys::RaftLogKey(8, 1));
  EXPECT_EQ(keys::RaftLogIndex(keys::RaftLogKey(7, 123)), 123);
  EXPECT_THROW(keys::RaftLogIndex(keys::RaftStateKey(7)), rangekv::utils::CodecException);
}

TEST(Keys, ShardRaftRangeCoversOnlyItsShard) {
  const auto begin = keys::ShardRaftPrefix(5);
  const auto end = keys::ShardRaftEnd(5);
  for (const auto &key : {keys::RaftLogKey(5, 1), keys::RaftStateKey(5), keys::ApplyStateKey(5)}) {
    EXPECT_GE(key, begin);
    EXPECT_LT(key, end);
  }
  EXPECT_GE(keys::RaftLogKey(6, 0), end);
  EXPECT_FALSE(keys::ShardStateKey(5) >= begin && keys::ShardStateKey(5) < end);
}

TEST(Keys, ShardStateKeys) {
  const auto key = keys::ShardStateKey(42);
  EXPECT_GE(key, keys::ShardMetaMinKey());
  EXPECT_LT(key, keys::ShardMetaMaxKey());
  EXPECT_EQ(keys::ShardIdFromStateKey(key), 42);
  EXPECT_THROW(keys::ShardIdFromStateKey(keys::NodeIdentKey()), rangekv::utils::CodecException);
}

TEST(ShardRange, ContainsKey) {
  ShardMeta meta;
  meta.start_key = "b";
  meta.end_key = "d";
  EXPECT_FALSE(meta.ContainsKey("a"));
  EXPECT_TRUE(meta.ContainsKey("b"));
  EXPECT_TRUE(meta.ContainsKey("c\xff"));
  EXPECT_FALSE(meta.ContainsKey("d"));

  meta.end_key.clear();
  EXPECT_TRUE(meta.ContainsKey("\xff\xff\xff"));
}

TEST(ShardRange, RangesOverlap) {
  EXPECT_TRUE(RangesOverlap("a", "c", "b", "d"));
  EXPECT_FALSE(RangesOverlap("a", "b", "b", "c"));
  EXPECT_TRUE(RangesOverlap("", "", "x", "y"));
  EXPECT_TRUE(RangesOverlap("m", "", "a", "n"));
  EXPECT_FALSE(RangesOverlap("m", "", "a", "m"));
}

TEST(ShardRange, EpochStaleness) {
  const ShardEpoch current{.conf_version = 3, .version = 5};
  EXPECT_FALSE(IsEpochStale(current, current));
  EXPECT_TRUE(IsEpochStale(ShardEpoch{.conf_version = 2, .version = 5}, current));
  EXPECT_TRUE(IsEpochStale(ShardEpoch{.conf_version = 3, .version = 4}, current));
  EXPECT_FALSE(IsEpochStale(ShardEpoch{.conf_version = 4, .version = 6}, current));
}
