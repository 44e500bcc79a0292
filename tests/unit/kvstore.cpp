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

#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "kvstore/kvstore.hpp"
#include "utils/file.hpp"

namespace fs = std::filesystem;
using namespace rangekv::kvstore;

class KVStoreTest : public ::testing::Test {
 protected:
  void SetUp() override { rangekv::utils::EnsureDir(test_folder_); }

  void TearDown() override { fs::remove_all(test_folder_); }

  static std::vector<std::string> Keys(Iterator it) {
    std::vector<std::string> keys;
    for (it.SeekToFirst(); it.Valid(); it.Next()) keys.emplace_back(it.Key());
    return keys;
  }

  fs::path test_folder_{fs::temp_directory_path() /
                        ("unit_kvstore_test_" + std::to_string(static_cast<int>(getpid())))};
};

TEST_F(KVStoreTest, PutGetDelete) {
  KVStore kvstore(test_folder_ / "PutGetDelete");
  ASSERT_TRUE(kvstore.Put(ColumnFamily::DEFAULT, "key", "value"));
  ASSERT_EQ(kvstore.Get(ColumnFamily::DEFAULT, "key").value(), "value");
  ASSERT_TRUE(kvstore.Delete(ColumnFamily::DEFAULT, "key"));
  ASSERT_FALSE(kvstore.Get(ColumnFamily::DEFAULT, "key"));
}

TEST_F(KVStoreTest, ColumnFamiliesAreSeparate) {
  KVStore kvstore(test_folder_ / "ColumnFamiliesAreSeparate");
  ASSERT_TRUE(kvstore.Put(ColumnFamily::LOCK, "key", "lock"));
  ASSERT_TRUE(kvstore.Put(ColumnFamily::WRITE, "key", "write"));
  EXPECT_EQ(kvstore.Get(ColumnFamily::LOCK, "key").value(), "lock");
  EXPECT_EQ(kvstore.Get(ColumnFamily::WRITE, "key").value(), "write");
  EXPECT_FALSE(kvstore.Get(ColumnFamily::DEFAULT, "key"));
  EXPECT_FALSE(kvstore.Get(ColumnFamily::RAFT, "key"));
}

TEST_F(KVStoreTest, BatchIsAppliedInOrder) {
  KVStore kvstore(test_folder_ / "BatchIsAppliedInOrder");
  WriteBatch batch;
  batch.Put(ColumnFamily::DEFAULT, "a", "1");
  batch.Put(ColumnFamily::DEFAULT, "b", "2");
  batch.Delete(ColumnFamily::DEFAULT, "a");
  batch.Put(ColumnFamily::RAFT, "meta", "m");
  EXPECT_EQ(batch.Count(), 4);
  EXPECT_FALSE(batch.Empty());
  ASSERT_TRUE(kvstore.Write(batch, true));

  EXPECT_FALSE(kvstore.Get(ColumnFamily::DEFAULT, "a"));
  EXPECT_EQ(kvstore.Get(ColumnFamily::DEFAULT, "b").value(), "2");
  EXPECT_EQ(kvstore.Get(ColumnFamily::RAFT, "meta").value(), "m");

  batch.Clear();
  EXPECT_TRUE(batch.Empty());
  EXPECT_EQ(batch.DataSize(), 0);
}

TEST_F(KVStoreTest, BatchAppend) {
  WriteBatch first;
  first.Put(ColumnFamily::DEFAULT, "a", "1");
  WriteBatch second;
  second.Delete(ColumnFamily::DEFAULT, "a");
  first.Append(second);
  ASSERT_EQ(first.Count(), 2);
  EXPECT_EQ(first.Ops()[1].type, WriteBatch::Op::Type::DELETE);
}

TEST_F(KVStoreTest, DeleteRange) {
  KVStore kvstore(test_folder_ / "DeleteRange");
  for (const auto *key : {"a", "b", "c", "d"}) ASSERT_TRUE(kvstore.Put(ColumnFamily::DEFAULT, key, key));
  WriteBatch batch;
  batch.DeleteRange(ColumnFamily::DEFAULT, "b", "d");
  ASSERT_TRUE(kvstore.Write(batch));
  EXPECT_EQ(Keys(kvstore.NewIterator(ColumnFamily::DEFAULT, "", "")), (std::vector<std::string>{"a", "d"}));
}

TEST_F(KVStoreTest, IteratorBounds) {
  KVStore kvstore(test_folder_ / "IteratorBounds");
  for (const auto *key : {"a", "b", "c", "d", "e"}) ASSERT_TRUE(kvstore.Put(ColumnFamily::DEFAULT, key, key));

  EXPECT_EQ(Keys(kvstore.NewIterator(ColumnFamily::DEFAULT, "b", "d")), (std::vector<std::string>{"b", "c"}));
  EXPECT_EQ(Keys(kvstore.NewIterator(ColumnFamily::DEFAULT, "c", "")), (std::vector<std::string>{"c", "d", "e"}));

  auto it = kvstore.NewIterator(ColumnFamily::DEFAULT, "b", "e");
  it.SeekToLast();
  ASSERT_TRUE(it.Valid());
  EXPECT_EQ(it.Key(), "d");
  it.SeekForPrev("c\xff");
  ASSERT_TRUE(it.Valid());
  EXPECT_EQ(it.Key(), "c");
  it.Seek("bb");
  ASSERT_TRUE(it.Valid());
  EXPECT_EQ(it.Key(), "c");
  it.Prev();
  ASSERT_TRUE(it.Valid());
  EXPECT_EQ(it.Key(), "b");
  it.Prev();
  EXPECT_FALSE(it.Valid());
}

TEST_F(KVStoreTest, SnapshotIsolation) {
  KVStore kvstore(test_folder_ / "SnapshotIsolation");
  ASSERT_TRUE(kvstore.Put(ColumnFamily::DEFAULT, "key", "old"));
  auto snapshot = kvstore.GetSnapshot();
  ASSERT_TRUE(kvstore.Put(ColumnFamily::DEFAULT, "key", "new"));
  ASSERT_TRUE(kvstore.Put(ColumnFamily::DEFAULT, "other", "x"));

  EXPECT_EQ(snapshot->Get(ColumnFamily::DEFAULT, "key").value(), "old");
  EXPECT_FALSE(snapshot->Get(ColumnFamily::DEFAULT, "other"));
  EXPECT_EQ(Keys(snapshot->NewIterator(ColumnFamily::DEFAULT, "", "")), (std::vector<std::string>{"key"}));
  EXPECT_EQ(kvstore.Get(ColumnFamily::DEFAULT, "key").value(), "new");
}

TEST_F(KVStoreTest, Durability) {
  {
    KVStore kvstore(test_folder_ / "Durability");
    ASSERT_TRUE(kvstore.Put(ColumnFamily::RAFT, "key", "value", true));
  }
  {
    KVStore kvstore(test_folder_ / "Durability");
    ASSERT_EQ(kvstore.Get(ColumnFamily::RAFT, "key").value(), "value");
  }
}

TEST_F(KVStoreTest, ApproximateSizeGrows) {
  KVStore kvstore(test_folder_ / "ApproximateSizeGrows");
  const std::string value(4096, 'v');
  for (int i = 0; i < 256; ++i) {
    ASSERT_TRUE(kvstore.Put(ColumnFamily::DEFAULT, "key" + std::to_string(1000 + i), value));
  }
  ASSERT_TRUE(kvstore.Flush());
  EXPECT_GT(kvstore.ApproximateSize(ColumnFamily::DEFAULT, "key", "kez"), 0);
  EXPECT_EQ(kvstore.ApproximateSize(ColumnFamily::DEFAULT, "x", "y"), 0);
  EXPECT_TRUE(kvstore.CompactRange(ColumnFamily::DEFAULT, "", ""));
}

TEST_F(KVStoreTest, ColumnFamilyNames) {
  EXPECT_EQ(ColumnFamilyName(ColumnFamily::DEFAULT), "default");
  EXPECT_EQ(ColumnFamilyName(ColumnFamily::LOCK), "lock");
  EXPECT_EQ(ColumnFamilyName(ColumnFamily::WRITE), "write");
  EXPECT_EQ(ColumnFamilyName(ColumnFamily::RAFT), "raft");
}
