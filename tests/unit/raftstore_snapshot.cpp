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

#include <algorithm>
#include <filesystem>
#include <random>

#include <gtest/gtest.h>

#include "common/keys.hpp"
#include "kvstore/kvstore.hpp"
#include "raftstore/snapshot.hpp"
#include "raftstore/state.hpp"
#include "slk/serialization.hpp"

namespace fs = std::filesystem;
using namespace rangekv;
using namespace rangekv::raftstore;
using kvstore::ColumnFamily;
namespace keys = common::keys;

class SnapshotTest : public ::testing::Test {
 protected:
  void SetUp() override {
    source_ = std::make_unique<kvstore::KVStore>(folder_ / "source");
    target_ = std::make_unique<kvstore::KVStore>(folder_ / "target");

    kvstore::WriteBatch batch;
    WriteInitialState(&batch, meta_);
    // Written by another shard, never part of the snapshot.
    batch.Put(ColumnFamily::DEFAULT, keys::DataKeyWithTs("a", 1), "outside");
    batch.Put(ColumnFamily::DEFAULT, keys::DataKeyWithTs("z", 1), "outside");
    for (int i = 0; i < 100; ++i) {
      const auto key = "c" + std::to_string(i);
      batch.Put(ColumnFamily::DEFAULT, keys::DataKeyWithTs(key, 10), std::string(100, 'v'));
      batch.Put(ColumnFamily::WRITE, keys::DataKeyWithTs(key, 11), "w");
    }
    batch.Put(ColumnFamily::LOCK, keys::DataKey("c5"), "l");
    ASSERT_TRUE(source_->Write(batch));
  }

  void TearDown() override {
    source_.reset();
    target_.reset();
    fs::remove_all(folder_);
  }

  raft::Snapshot Build() { return BuildSnapshot(*source_->GetSnapshot(), meta_.id); }

  common::ShardMeta meta_{.id = 7,
                          .start_key = "b",
                          .end_key = "y",
                          .epoch = {.conf_version = 2, .version = 3},
                          .peers = {common::PeerMeta{.id = 70, .node_id = 1}, common::PeerMeta{.id = 71, .node_id = 2}}};
  fs::path folder_{fs::temp_directory_path() / ("unit_snapshot_" + std::to_string(static_cast<int>(getpid())))};
  std::unique_ptr<kvstore::KVStore> source_;
  std::unique_ptr<kvstore::KVStore> target_;
};

TEST_F(SnapshotTest, BuildAndDecode) {
  const auto snapshot = Build();
  EXPECT_EQ(snapshot.metadata.index, kInitLogIndex);
  EXPECT_EQ(snapshot.metadata.term, kInitLogTerm);
  EXPECT_EQ(snapshot.metadata.conf_state.voters, (std::vector<uint64_t>{70, 71}));

  auto data = DecodeSnapshot(snapshot, meta_.id);
  ASSERT_FALSE(data.HasError()) << data.GetError().message;
  EXPECT_EQ(data->meta, meta_);
  ASSERT_EQ(data->cfs.size(), kvstore::kDataColumnFamilies.size());
  size_t pairs = 0;
  for (const auto &cf : data->cfs) pairs += cf.pairs.size();
  EXPECT_EQ(pairs, 201);
}

TEST_F(SnapshotTest, TombstoneShardCantBeSnapshotted) {
  kvstore::WriteBatch batch;
  WriteShardState(&batch, common::ShardLocalState{.state = common::PeerState::TOMBSTONE, .meta = meta_});
  ASSERT_TRUE(source_->Write(batch));
  EXPECT_THROW(Build(), SnapshotException);
  EXPECT_THROW(BuildSnapshot(*source_->GetSnapshot(), 99), SnapshotException);
}

TEST_F(SnapshotTest, CorruptSnapshotsAreRejected) {
  const auto snapshot = Build();

  EXPECT_TRUE(DecodeSnapshot(snapshot, meta_.id + 1).HasError());

  {
    auto truncated = snapshot;
    truncated.data.resize(truncated.data.size() / 2);
    EXPECT_TRUE(DecodeSnapshot(truncated, meta_.id).HasError());
  }
  {
    auto moved = snapshot;
    moved.metadata.index += 1;
    EXPECT_TRUE(DecodeSnapshot(moved, meta_.id).HasError());
  }
  {
    auto data = DecodeSnapshot(snapshot, meta_.id);
    ASSERT_FALSE(data.HasError());
    data->cfs[0].pairs[0].second = "tampered";
    auto tampered = snapshot;
    tampered.data = slk::SaveToString(*data);
    const auto result = DecodeSnapshot(tampered, meta_.id);
    ASSERT_TRUE(result.HasError());
    EXPECT_NE(result.GetError().message.find("Checksum"), std::string::npos);
  }
  {
    auto data = DecodeSnapshot(snapshot, meta_.id);
    ASSERT_FALSE(data.HasError());
    data->cfs[0].pairs.emplace_back(keys::DataKeyWithTs("zzz", 1), "x");
    data->checksum = SnapshotChecksum(data->cfs);
    auto outside = snapshot;
    outside.data = slk::SaveToString(*data);
    EXPECT_TRUE(DecodeSnapshot(outside, meta_.id).HasError());
  }
}

TEST_F(SnapshotTest, ApplyReplacesTheRange) {
  kvstore::WriteBatch stale;
  stale.Put(ColumnFamily::DEFAULT, keys::DataKeyWithTs("d-stale", 1), "old");
  stale.Put(ColumnFamily::LOCK, keys::DataKey("e-stale"), "old");
  stale.Put(ColumnFamily::DEFAULT, keys::DataKeyWithTs("a", 1), "neighbour");
  ASSERT_TRUE(target_->Write(stale));

  const auto snapshot = Build();
  auto data = DecodeSnapshot(snapshot, meta_.id);
  ASSERT_FALSE(data.HasError());

  kvstore::WriteBatch batch;
  const raft::HardState hard_state{.term = 9, .vote = 70, .commit = 1};
  const auto applied = ApplySnapshotToBatch(*data, snapshot, hard_state, &batch);
  ASSERT_TRUE(target_->Write(batch));

  EXPECT_TRUE(applied.success);
  EXPECT_EQ(applied.raft_state.hard_state.term, 9);
  EXPECT_EQ(applied.raft_state.hard_state.commit, kInitLogIndex);
  EXPECT_EQ(applied.apply_state.truncated_index, kInitLogIndex);

  const auto view = target_->GetSnapshot();
  EXPECT_FALSE(view->Get(ColumnFamily::DEFAULT, keys::DataKeyWithTs("d-stale", 1)));
  EXPECT_FALSE(view->Get(ColumnFamily::LOCK, keys::DataKey("e-stale")));
  EXPECT_EQ(view->Get(ColumnFamily::DEFAULT, keys::DataKeyWithTs("a", 1)), "neighbour");
  EXPECT_EQ(view->Get(ColumnFamily::LOCK, keys::DataKey("c5")), "l");
  EXPECT_EQ(view->Get(ColumnFamily::WRITE, keys::DataKeyWithTs("c42", 11)), "w");

  EXPECT_EQ(LoadShardState(*view, meta_.id)->meta, meta_);
  EXPECT_EQ(LoadApplyState(*view, meta_.id), applied.apply_state);
  EXPECT_EQ(LoadRaftState(*view, meta_.id), applied.raft_state);
}

namespace {

RaftMessage SnapshotMessage(const raft::Snapshot &snapshot) {
  RaftMessage message;
  message.shard_id = 7;
  message.from_peer = common::PeerMeta{.id = 70, .node_id = 1};
  message.to_peer = common::PeerMeta{.id = 71, .node_id = 2};
  message.message = raft::Message{.from = 70, .to = 71, .term = 6, .payload = raft::InstallSnapshot{snapshot}};
  return message;
}

const raft::Snapshot &SnapshotOf(const RaftMessage &message) {
  return std::get<raft::InstallSnapshot>(message.message.payload).snapshot;
}

}  // namespace

TEST_F(SnapshotTest, ChunksReassembleInAnyOrder) {
  const auto snapshot = Build();
  auto chunks = SplitSnapshotMessage(SnapshotMessage(snapshot), 1000);
  ASSERT_GT(chunks.size(), 3);
  EXPECT_TRUE(chunks[0].header);
  EXPECT_TRUE(SnapshotOf(*chunks[0].header).data.empty());

  std::mt19937 rng(7);
  std::shuffle(chunks.begin(), chunks.end(), rng);

  SnapshotAssembler assembler;
  std::optional<RaftMessage> assembled;
  for (size_t i = 0; i < chunks.size(); ++i) {
    assembled = assembler.Add(chunks[i]);
    if (i + 1 < chunks.size()) {
      EXPECT_FALSE(assembled);
      // A duplicate doesn't complete the snapshot early.
      EXPECT_FALSE(assembler.Add(chunks[i]));
    }
  }
  ASSERT_TRUE(assembled);
  EXPECT_EQ(SnapshotOf(*assembled), snapshot);
  EXPECT_EQ(assembled->to_peer.id, 71);
  EXPECT_EQ(assembler.PendingCount(), 0);
}

TEST_F(SnapshotTest, NewerSnapshotReplacesAnIncompleteOne) {
  const auto snapshot = Build();
  auto old_chunks = SplitSnapshotMessage(SnapshotMessage(snapshot), 1000);

  auto newer = snapshot;
  newer.metadata.index += 10;
  auto new_chunks = SplitSnapshotMessage(SnapshotMessage(newer), 1000);

  SnapshotAssembler assembler;
  for (size_t i = 0; i + 1 < old_chunks.size(); ++i) EXPECT_FALSE(assembler.Add(old_chunks[i]));
  std::optional<RaftMessage> assembled;
  for (auto &chunk : new_chunks) assembled = assembler.Add(chunk);
  ASSERT_TRUE(assembled);
  EXPECT_EQ(SnapshotOf(*assembled).metadata.index, snapshot.metadata.index + 10);

  // The last chunk of the discarded snapshot alone can't complete it.
  EXPECT_FALSE(assembler.Add(old_chunks.back()));

  SnapshotChunk malformed;
  malformed.total = 2;
  malformed.seq = 2;
  EXPECT_FALSE(assembler.Add(malformed));
}
