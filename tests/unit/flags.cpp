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


#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "flags/log_level.hpp"
#include "flags/raftstore.hpp"

using namespace rangekv;

TEST(Flags, LogLevels) {
  EXPECT_EQ(flags::LogLevelToEnum("TRACE"), spdlog::level::trace);
  EXPECT_EQ(flags::LogLevelToEnum("WARNING"), spdlog::level::warn);
  EXPECT_EQ(flags::LogLevelToEnum("CRITICAL"), spdlog::level::critical);
  EXPECT_FALSE(flags::LogLevelToEnum("LOUD"));
  EXPECT_FALSE(flags::LogLevelToEnum("info"));

  EXPECT_TRUE(flags::ValidLogLevel("INFO"));
  EXPECT_FALSE(flags::ValidLogLevel(""));
  EXPECT_FALSE(flags::ValidLogLevel("VERBOSE"));
}

TEST(Flags, RaftstoreConfig) {
  gflags::FlagSaver saver;
  FLAGS_raft_base_tick_interval_ms = 50;
  FLAGS_raft_log_gc_threshold = 128;
  FLAGS_shard_split_size = 1024;

  const auto config = flags::RaftstoreConfigFromFlags();
  EXPECT_EQ(config.raft_base_tick_interval, std::chrono::milliseconds(50));
  EXPECT_EQ(config.raft_log_gc_threshold, 128U);
  EXPECT_EQ(config.shard_split_size, 1024U);
}

TEST(Flags, InvalidRaftstoreConfigIsRejected) {
  gflags::FlagSaver saver;
  FLAGS_raft_heartbeat_ticks = FLAGS_raft_election_timeout_ticks;
  EXPECT_THROW(flags::RaftstoreConfigFromFlags(), raftstore::RaftstoreConfigException);
}
