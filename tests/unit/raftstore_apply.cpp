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
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "common/keys.hpp"
#include "io/future.hpp"
#include "kvstore/kvstore.hpp"
#include "raftstore/apply.hpp"
#include "raftstore/router.hpp"
#include "raftstore/state.hpp"
#include "slk/serialization.hpp"
#include "utils/thread_pool.hpp"

namespace fs = std::filesystem;
using namespace rangekv;
using namespace rangekv::raftstore;
using kvstore::ColumnFamily;
namespace keys = common::keys;

class ApplyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    engine_ = std::make_unique<kvstore::KVStore>(folder_);
    kvstore::WriteBatch batch;
    WriteInitialState(&batch, meta_);
    ASSERT_TRUE(engine_->Write(batch));

    auto local_state = LoadShardState(*engine_, meta_.id);
    auto apply_state = LoadApplyState(*engine_, meta_.id);
    ASSERT_TRUE(local_state);
    ASSERT_TRUE(apply_state);
    fsm_ = std::make_unique<ApplyFsm>(engine_.get(), &router_, &store_meta_, &snap_pool_, std::move(*local_state),
                                      std::move(*apply_state), "[shard 3]");
  }

  void TearDown() override {
    fsm_.reset();
    engine_.reset();
    fs::remove_all(folder_);
  }

  raft::Entry CommandEntry(uint64_t index, Request request) const {
    RaftCommand command{.header = {.shard_id = meta_.id, .peer_id = 31, .epoch = meta_.epoch},
                        .request = std::move(request)};
    return raft::Entry{.term = 2, .index = index, .data = slk::SaveToString(command)};
  }

  void Apply(std::vector<raft::Entry> entries, std::vector<Proposal> proposals = {}) {
    std::vector<ApplyMsg> msgs;
    msgs.emplace_back(ApplyEntriesTask{.entries = std::move(entries), .proposals = std::move(proposals)});
    fsm_->Handle(msgs);
  }

  std::optional<std::string> Read(const std::string &key) const {
    return engine_->Get(ColumnFamily::DEFAULT, keys::DataKey(key));
  }

  uint64_t AppliedIndex() const { return LoadApplyState(*engine_, meta_.id)->applied_index; }

  common::ShardMeta meta_{.id = 3,
                          .start_key = "",
                          .end_key = "",
                          .epoch = {.conf_version = 1, .version = 1},
                          .peers = {common::PeerMeta{.id = 31, .node_id = 1}}};
  fs::path folder_{fs::temp_directory_path() / ("unit_apply_" + std::to_string(static_cast<int>(getpid())))};
  std::unique_ptr<kvstore::KVStore> engine_;
  Router router_;
  utils::Synchronized<StoreMeta> store_meta_;
  utils::ThreadPool snap_pool_{1, "snap"};
  std::unique_ptr<ApplyFsm> fsm_;
};

TEST_F(ApplyTest, EntriesAreAppliedOnce) {
  const auto put = CommandEntry(kInitLogIndex + 1, RawPutRequest{.key = "k", .value = "v1"});
  Apply({put});
  EXPECT_EQ(Read("k"), "v1");
  EXPECT_EQ(AppliedIndex(), kInitLogIndex + 1);

  Apply({put});
  EXPECT_EQ(Read("k"), "v1");
  EXPECT_EQ(AppliedIndex(), kInitLogIndex + 1);
}

TEST_F(ApplyTest, ReplayedEntryDoesntUndoLaterOnes) {
  const auto put = CommandEntry(kInitLogIndex + 1, RawPutRequest{.key = "k", .value = "v1"});
  Apply({put, CommandEntry(kInitLogIndex + 2, RawDeleteRequest{.key = "k"})});
  EXPECT_EQ(Read("k"), std::nullopt);
  const auto state = LoadApplyState(*engine_, meta_.id);
  ASSERT_TRUE(state);
  EXPECT_EQ(state->applied_index, kInitLogIndex + 2);

  Apply({put});
  EXPECT_EQ(Read("k"), std::nullopt);
  EXPECT_EQ(LoadApplyState(*engine_, meta_.id), state);

  // A later batch that starts with applied entries only applies the new tail.
  Apply({put, CommandEntry(kInitLogIndex + 3, RawPutRequest{.key = "k", .value = "v3"})});
  EXPECT_EQ(Read("k"), "v3");
  EXPECT_EQ(AppliedIndex(), kInitLogIndex + 3);
}

TEST_F(ApplyTest, ProposalOfAReplayedEntryIsDropped) {
  const auto put = CommandEntry(kInitLogIndex + 1, RawPutRequest{.key = "k", .value = "v1"});
  Apply({put});

  auto [future, promise] = io::FuturePromisePair<CommandResult>();
  std::vector<Proposal> proposals;
  proposals.push_back(Proposal{.index = put.index, .term = put.term, .promise = std::move(promise)});
  Apply({put}, std::move(proposals));

  auto result = future.Wait();
  ASSERT_TRUE(result.HasError());
  EXPECT_TRUE(std::holds_alternative<common::ProposalDropped>(result.GetError()));
  EXPECT_EQ(Read("k"), "v1");
}
