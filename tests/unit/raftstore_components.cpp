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


#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "common/keys.hpp"
#include "kvstore/kvstore.hpp"
#include "raftstore/config.hpp"
#include "raftstore/mailbox.hpp"
#include "raftstore/split_checker.hpp"
#include "raftstore/store_meta.hpp"
#include "utils/codec.hpp"
#include "utils/thread_pool.hpp"

using namespace rangekv;
using namespace rangekv::raftstore;
using namespace std::chrono_literals;

TEST(Mailbox, CapacityAndClose) {
  Mailbox<int> mailbox(2);
  int a = 1;
  int b = 2;
  int c = 3;
  EXPECT_EQ(mailbox.Send(std::move(a), false), SendResult::OK);
  EXPECT_EQ(mailbox.Send(std::move(b), false), SendResult::OK);
  EXPECT_EQ(mailbox.Send(std::move(c), false), SendResult::FULL);
  EXPECT_EQ(mailbox.Send(std::move(c), true), SendResult::OK);
  EXPECT_EQ(mailbox.Size(), 3);

  EXPECT_TRUE(mailbox.TrySchedule());
  EXPECT_FALSE(mailbox.TrySchedule());
  EXPECT_EQ(mailbox.Drain(2), (std::vector<int>{1, 2}));
  // Still has work, stays scheduled.
  EXPECT_TRUE(mailbox.FinishRun());
  EXPECT_EQ(mailbox.Drain(10), (std::vector<int>{3}));
  EXPECT_FALSE(mailbox.FinishRun());
  EXPECT_FALSE(mailbox.TrySchedule());

  int d = 4;
  EXPECT_EQ(mailbox.Send(std::move(d), false), SendResult::OK);
  mailbox.Close();
  EXPECT_TRUE(mailbox.IsClosed());
  int e = 5;
  EXPECT_EQ(mailbox.Send(std::move(e), true), SendResult::CLOSED);
  EXPECT_FALSE(mailbox.TrySchedule());
  EXPECT_EQ(mailbox.TakeAll(), (std::vector<int>{4}));
  EXPECT_EQ(SendResultToString(SendResult::CLOSED), "CLOSED");
}

namespace {

struct CountingFsm {
  void Handle(std::vector<int> &msgs) {
    const auto running = in_flight.fetch_add(1) + 1;
    if (running > 1) overlapped = true;
    {
      std::lock_guard guard(lock);
      received.insert(received.end(), msgs.begin(), msgs.end());
    }
    in_flight.fetch_sub(1);
  }

  std::atomic<int> in_flight{0};
  std::atomic<bool> overlapped{false};
  std::mutex lock;
  std::vector<int> received;
};

}  // namespace

TEST(Mailbox, FsmRunsOneBatchAtATimeInOrder) {
  utils::ThreadPool pool(4, "mailbox_test");
  auto handle = std::make_shared<FsmHandle<int, CountingFsm>>(std::make_unique<CountingFsm>(), &pool, 10000, 16);
  constexpr int kMessages = 5000;
  for (int i = 0; i < kMessages; ++i) {
    int msg = i;
    ASSERT_EQ(handle->Send(std::move(msg), false), SendResult::OK);
  }

  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (std::chrono::steady_clock::now() < deadline) {
    {
      std::lock_guard guard(handle->fsm().lock);
      if (handle->fsm().received.size() == kMessages) break;
    }
    std::this_thread::sleep_for(1ms);
  }

  EXPECT_TRUE(handle->Shutdown().empty());
  EXPECT_FALSE(handle->fsm().overlapped);
  ASSERT_EQ(handle->fsm().received.size(), kMessages);
  for (int i = 0; i < kMessages; ++i) EXPECT_EQ(handle->fsm().received[i], i);

  int late = 0;
  EXPECT_EQ(handle->Send(std::move(late), true), SendResult::CLOSED);
  pool.ShutDown();
}

namespace {

ShardMeta Shard(ShardId id, std::string start, std::string end) {
  return ShardMeta{.id = id,
                   .start_key = std::move(start),
                   .end_key = std::move(end),
                   .epoch = {},
                   .peers = {common::PeerMeta{.id = id * 10, .node_id = 1}}};
}

}  // namespace

TEST(StoreMeta, Ranges) {
  StoreMeta meta;
  meta.SetShard(Shard(1, "", "g"));
  meta.SetShard(Shard(2, "g", "p"));
  meta.SetShard(Shard(3, "p", ""));
  // Created by a raft message, its range isn't known yet.
  meta.SetShard(ShardMeta{.id = 4});

  EXPECT_EQ(meta.FindByKey("a")->id, 1);
  EXPECT_EQ(meta.FindByKey("g")->id, 2);
  EXPECT_EQ(meta.FindByKey("zzz")->id, 3);
  EXPECT_EQ(meta.ranges.size(), 3);
  ASSERT_TRUE(meta.Find(4));
  EXPECT_FALSE(meta.Find(5));

  EXPECT_EQ(meta.FindOverlap(Shard(5, "h", "i")), 2);
  EXPECT_EQ(meta.FindOverlap(Shard(2, "g", "p")), std::nullopt);

  // Shard 2 merged into shard 3.
  meta.RemoveShard(2);
  meta.SetShard(Shard(3, "g", ""));
  EXPECT_EQ(meta.FindByKey("h")->id, 3);
  EXPECT_EQ(meta.ranges.size(), 2);
  EXPECT_FALSE(meta.ranges.contains("p"));

  meta.leaders.insert(1);
  meta.unhealthy.insert(1);
  meta.RemoveShard(1);
  EXPECT_FALSE(meta.FindByKey("a"));
  EXPECT_TRUE(meta.leaders.empty());
  EXPECT_TRUE(meta.unhealthy.empty());
}

TEST(RaftstoreConfig, Validate) {
  Config config;
  EXPECT_NO_THROW(config.Validate());

  {
    auto broken = config;
    broken.raft_election_timeout_ticks = broken.raft_heartbeat_ticks;
    EXPECT_THROW(broken.Validate(), RaftstoreConfigException);
  }
  {
    auto broken = config;
    broken.apply_pool_size = 0;
    EXPECT_THROW(broken.Validate(), RaftstoreConfigException);
  }
  {
    auto broken = config;
    broken.mailbox_capacity = broken.max_batch_size - 1;
    EXPECT_THROW(broken.Validate(), RaftstoreConfigException);
  }
  {
    auto broken = config;
    broken.proposal_timeout_ticks = broken.raft_election_timeout_ticks;
    EXPECT_THROW(broken.Validate(), RaftstoreConfigException);
  }
}

class SplitCheckerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    engine_ = std::make_unique<kvstore::KVStore>(test_folder_);
    // Values that don't compress, so the size of the flushed files follows the data.
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> byte(0, 255);
    kvstore::WriteBatch batch;
    for (int i = 0; i < 1000; ++i) {
      const auto key = fmt::format("k{:03}", i);
      std::string value(1024, '\0');
      for (auto &c : value) c = static_cast<char>(byte(gen));
      batch.Put(kvstore::ColumnFamily::DEFAULT, common::keys::DataKeyWithTs(key, 10), value);
      batch.Put(kvstore::ColumnFamily::WRITE, common::keys::DataKeyWithTs(key, 11), "w");
    }
    ASSERT_TRUE(engine_->Write(batch));
    ASSERT_TRUE(engine_->Flush());
  }

  uint64_t ApproximateSize(const ShardMeta &meta) const {
    const auto start = common::keys::ShardDataStart(meta);
    const auto end = common::keys::ShardDataEnd(meta);
    return engine_->ApproximateSize(kvstore::ColumnFamily::DEFAULT, start, end) +
           engine_->ApproximateSize(kvstore::ColumnFamily::WRITE, start, end);
  }

  void TearDown() override {
    engine_.reset();
    std::filesystem::remove_all(test_folder_);
  }

  std::filesystem::path test_folder_{std::filesystem::temp_directory_path() /
                                     ("unit_split_checker_" + std::to_string(static_cast<int>(getpid())))};
  std::unique_ptr<kvstore::KVStore> engine_;
};

TEST_F(SplitCheckerTest, SmallShardIsNotSplit) {
  const auto result = CheckSplit(*engine_, Shard(1, "", ""), 16ULL << 20U);
  EXPECT_GT(result.approximate_size, 512 * 1024);
  EXPECT_LT(result.approximate_size, 16ULL << 20U);
  EXPECT_FALSE(result.split_key);
}

TEST_F(SplitCheckerTest, EngineEstimateTriggersTheSplit) {
  const auto shard = Shard(1, "", "");
  const auto estimate = ApproximateSize(shard);
  ASSERT_GT(estimate, 0U);

  auto result = CheckSplit(*engine_, shard, estimate);
  EXPECT_EQ(result.approximate_size, estimate);
  EXPECT_FALSE(result.split_key);

  result = CheckSplit(*engine_, shard, estimate - 1);
  ASSERT_TRUE(result.split_key);
  EXPECT_GT(*result.split_key, "k300");
  EXPECT_LT(*result.split_key, "k700");
  // Scanned bytes of every key and value.
  EXPECT_GT(result.approximate_size, 1000 * 1024);
}

TEST_F(SplitCheckerTest, SplitKeyIsNearTheMiddle) {
  const auto result = CheckSplit(*engine_, Shard(1, "", ""), 128 * 1024);
  ASSERT_TRUE(result.split_key);
  EXPECT_GT(*result.split_key, "k300");
  EXPECT_LT(*result.split_key, "k700");
}

TEST_F(SplitCheckerTest, OnlyKeysOfTheShardCount) {
  const auto shard = Shard(1, "k500", "k600");
  const auto result = CheckSplit(*engine_, shard, 0, true);
  EXPECT_LT(result.approximate_size, 200 * 1024);
  ASSERT_TRUE(result.split_key);
  // Every key carries the same number of bytes.
  EXPECT_EQ(*result.split_key, "k550");
}

TEST_F(SplitCheckerTest, ShardWithOneKeyCantBeSplit) {
  const auto result = CheckSplit(*engine_, Shard(1, "k500", "k501"), 0, true);
  EXPECT_GT(result.approximate_size, 1024);
  EXPECT_FALSE(result.split_key);
}

TEST(SplitChecker, UserKeyOf) {
  EXPECT_EQ(UserKeyOf(common::keys::DataKey("abc")), "abc");
  EXPECT_EQ(UserKeyOf(common::keys::DataKeyWithTs("abc", 42)), "abc");
  EXPECT_THROW(UserKeyOf("xabc"), utils::CodecException);
}
