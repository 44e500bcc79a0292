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
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "client/transaction.hpp"
#include "cluster.hpp"

using namespace rangekv;
using namespace std::chrono_literals;
using rangekv::tests::Cluster;
using rangekv::tests::WaitUntil;

class Transactions : public ::testing::Test {
 protected:
  void SetUp() override {
    cluster_ = std::make_unique<Cluster>(3);
    shard_ = cluster_->Bootstrap();
    cluster_->WaitForLeader(shard_.id);
  }

  void TearDown() override { cluster_.reset(); }

  client::ClusterClient &client() { return cluster_->client(); }

  txn::TimeStamp Now() {
    auto ts = client().GetTimestamp();
    EXPECT_FALSE(ts.HasError());
    return *ts;
  }

  std::optional<std::string> ReadLatest(const std::string &key) {
    auto value = client().Get(key, Now());
    EXPECT_FALSE(value.HasError()) << common::ErrorToString(value.GetError());
    return value.HasError() ? std::nullopt : *value;
  }

  txn::TimeStamp MustWrite(const std::string &key, const std::string &value) {
    auto txn = client().Begin();
    txn->Put(key, value);
    auto commit_ts = txn->Commit();
    EXPECT_FALSE(commit_ts.HasError()) << common::ErrorToString(commit_ts.GetError());
    return commit_ts.HasError() ? 0 : *commit_ts;
  }

  void Prewrite(std::vector<txn::Mutation> mutations, const std::string &primary, const txn::TimeStamp start_ts,
                const uint64_t ttl) {
    for (auto &mutation : mutations) {
      auto result = client().ExecuteOnKey(
          mutation.key,
          raftstore::PrewriteRequest{.mutations = {mutation}, .primary = primary, .start_ts = start_ts, .lock_ttl = ttl});
      ASSERT_FALSE(result.HasError()) << common::ErrorToString(result.GetError());
      ASSERT_TRUE(std::get<raftstore::PrewriteResponse>(*result).errors.empty());
    }
  }

  /// Versions of `key` in the write column family of `node`.
  size_t CountVersions(const common::NodeId node, const std::string &key) {
    auto it = cluster_->engine(node).NewIterator(kvstore::ColumnFamily::WRITE, common::keys::DataKey(key),
                                                 common::keys::DataKey(key + '\0'));
    size_t count = 0;
    for (it.SeekToFirst(); it.Valid(); it.Next()) ++count;
    return count;
  }

  std::unique_ptr<Cluster> cluster_;
  common::ShardMeta shard_;
};

TEST_F(Transactions, CommitMakesAllWritesVisibleAtOnce) {
  auto txn = client().Begin();
  txn->Put("a", "1");
  txn->Put("b", "2");
  txn->Put("c", std::string(1000, 'c'));
  auto own = txn->Get("a");
  ASSERT_FALSE(own.HasError());
  EXPECT_EQ(*own, "1");
  EXPECT_FALSE(ReadLatest("a").has_value());

  auto commit_ts = txn->Commit();
  ASSERT_FALSE(commit_ts.HasError()) << common::ErrorToString(commit_ts.GetError());
  EXPECT_EQ(txn->state(), client::Transaction::State::COMMITTED);
  EXPECT_GT(*commit_ts, txn->start_ts());

  EXPECT_EQ(ReadLatest("a"), "1");
  EXPECT_EQ(ReadLatest("b"), "2");
  EXPECT_EQ(ReadLatest("c"), std::string(1000, 'c'));

  auto before = client().Get("b", *commit_ts - 1);
  ASSERT_FALSE(before.HasError());
  EXPECT_FALSE(before->has_value());
}

TEST_F(Transactions, ReadsSeeTheSnapshotAtStart) {
  MustWrite("x", "old");
  auto reader = client().Begin();
  MustWrite("x", "new");

  auto value = reader->Get("x");
  ASSERT_FALSE(value.HasError());
  EXPECT_EQ(*value, "old");
  EXPECT_EQ(ReadLatest("x"), "new");
}

TEST_F(Transactions, DeleteHidesTheKey) {
  MustWrite("x", "1");
  auto txn = client().Begin();
  txn->Delete("x");
  ASSERT_FALSE(txn->Commit().HasError());
  EXPECT_FALSE(ReadLatest("x").has_value());
}

TEST_F(Transactions, ConcurrentWritersConflict) {
  auto first = client().Begin();
  auto second = client().Begin();
  second->Put("x", "second");
  ASSERT_FALSE(second->Commit().HasError());

  first->Put("x", "first");
  auto result = first->Commit();
  ASSERT_TRUE(result.HasError());
  EXPECT_TRUE(std::holds_alternative<common::WriteConflict>(result.GetError()))
      << common::ErrorToString(result.GetError());
  EXPECT_EQ(first->state(), client::Transaction::State::ROLLED_BACK);
  EXPECT_EQ(ReadLatest("x"), "second");
}

TEST_F(Transactions, LockOnlyRecordsDontBlockReaders) {
  MustWrite("x", "committed");
  const auto start_ts = Now();
  Prewrite({txn::Mutation{.op = txn::MutationOp::LOCK, .key = "x", .value = {}}}, "x", start_ts, 60000);

  auto value = client().Get("x", Now());
  ASSERT_FALSE(value.HasError()) << common::ErrorToString(value.GetError());
  EXPECT_EQ(*value, "committed");

  auto resolved =
      client().ExecuteOnKey("x", raftstore::ResolveLockRequest{.start_ts = start_ts, .commit_ts = 0, .keys = {}});
  ASSERT_FALSE(resolved.HasError()) << common::ErrorToString(resolved.GetError());
  MustWrite("x", "next");
  EXPECT_EQ(ReadLatest("x"), "next");
}

TEST_F(Transactions, RolledBackWritesStayInvisible) {
  const auto start_ts = Now();
  Prewrite({txn::Mutation{.op = txn::MutationOp::PUT, .key = "k", .value = "v"}}, "k", start_ts, 3000);
  auto rollback = client().ExecuteOnKey("k", raftstore::RollbackRequest{.keys = {"k"}, .start_ts = start_ts});
  ASSERT_FALSE(rollback.HasError()) << common::ErrorToString(rollback.GetError());
  EXPECT_FALSE(ReadLatest("k").has_value());

  // A late commit of the rolled back transaction fails.
  auto commit = client().ExecuteOnKey("k", raftstore::CommitRequest{.keys = {"k"}, .start_ts = start_ts,
                                                                     .commit_ts = Now()});
  ASSERT_TRUE(commit.HasError());
  EXPECT_TRUE(std::holds_alternative<common::TxnLockNotFound>(commit.GetError()))
      << common::ErrorToString(commit.GetError());
  EXPECT_FALSE(ReadLatest("k").has_value());

  auto txn = client().Begin();
  txn->Put("k", "discarded");
  ASSERT_FALSE(txn->Rollback().HasError());
  EXPECT_EQ(txn->state(), client::Transaction::State::ROLLED_BACK);
  auto again = txn->Commit();
  ASSERT_TRUE(again.HasError());
  EXPECT_TRUE(std::holds_alternative<common::InvalidRequest>(again.GetError()));
  EXPECT_FALSE(ReadLatest("k").has_value());
}

TEST_F(Transactions, ReadersRollBackExpiredLocks) {
  const auto start_ts = Now();
  Prewrite({txn::Mutation{.op = txn::MutationOp::PUT, .key = "k", .value = "abandoned"}}, "k", start_ts, 1);
  std::this_thread::sleep_for(20ms);

  EXPECT_FALSE(ReadLatest("k").has_value());
  MustWrite("k", "fresh");
  EXPECT_EQ(ReadLatest("k"), "fresh");
}

TEST_F(Transactions, ReadersCommitSecondariesOfCommittedTransactions) {
  const auto start_ts = Now();
  Prewrite({txn::Mutation{.op = txn::MutationOp::PUT, .key = "p", .value = "primary"},
            txn::Mutation{.op = txn::MutationOp::PUT, .key = "s", .value = "secondary"}},
           "p", start_ts, 60000);
  const auto commit_ts = Now();
  auto commit =
      client().ExecuteOnKey("p", raftstore::CommitRequest{.keys = {"p"}, .start_ts = start_ts, .commit_ts = commit_ts});
  ASSERT_FALSE(commit.HasError()) << common::ErrorToString(commit.GetError());

  // The secondary is still locked, the reader finishes the commit.
  EXPECT_EQ(ReadLatest("s"), "secondary");
  EXPECT_EQ(ReadLatest("p"), "primary");
  auto locks = client().ExecuteOnKey(
      "s", raftstore::ScanLockRequest{.max_ts = Now(), .start_key = "", .end_key = "", .limit = 10});
  ASSERT_FALSE(locks.HasError());
  EXPECT_TRUE(std::get<raftstore::ScanLockResponse>(*locks).locks.empty());
}

TEST_F(Transactions, ScanReturnsCommittedRowsInOrder) {
  auto txn = client().Begin();
  for (int i = 9; i >= 0; --i) txn->Put(fmt::format("row{}", i), fmt::format("{}", i));
  ASSERT_FALSE(txn->Commit().HasError());
  MustWrite("row5", "changed");

  auto rows = client().Scan("row2", "row8", 100, Now());
  ASSERT_FALSE(rows.HasError()) << common::ErrorToString(rows.GetError());
  ASSERT_EQ(rows->size(), 6U);
  EXPECT_EQ((*rows)[0].key, "row2");
  EXPECT_EQ((*rows)[3].value, "changed");
  EXPECT_EQ((*rows)[5].key, "row7");

  auto limited = client().Scan("", "", 3, Now());
  ASSERT_FALSE(limited.HasError());
  ASSERT_EQ(limited->size(), 3U);
  EXPECT_EQ(limited->back().key, "row2");
}

TEST_F(Transactions, GcDropsVersionsBelowTheSafePoint) {
  MustWrite("x", "1");
  MustWrite("x", "2");
  MustWrite("x", "3");
  ASSERT_TRUE(WaitUntil([&] {
    for (common::NodeId node = 1; node <= 3; ++node) {
      if (CountVersions(node, "x") != 3) return false;
    }
    return true;
  }));

  auto running = client().Begin();
  auto safe_point = client().UpdateSafePoint();
  ASSERT_FALSE(safe_point.HasError());
  EXPECT_EQ(*safe_point, running->start_ts());
  running.reset();

  safe_point = client().UpdateSafePoint();
  ASSERT_FALSE(safe_point.HasError());
  auto stored = cluster_->placement().GetGcSafePoint();
  ASSERT_FALSE(stored.HasError());
  EXPECT_EQ(*stored, *safe_point);

  EXPECT_TRUE(WaitUntil([&] {
    for (common::NodeId node = 1; node <= 3; ++node) {
      if (CountVersions(node, "x") != 1) return false;
    }
    return true;
  }));
  EXPECT_EQ(ReadLatest("x"), "3");
}
