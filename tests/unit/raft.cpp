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


#include <algorithm>
#include <map>
#include <random>
#include <set>

#include <gtest/gtest.h>

#include "raft_network.hpp"

using namespace rangekv::raft;
using rangekv::raft::test::Network;

namespace {

std::vector<uint64_t> Sorted(std::vector<uint64_t> ids) {
  std::sort(ids.begin(), ids.end());
  return ids;
}

/// Ticks the whole group until a leader other than `not_this` shows up.
std::optional<uint64_t> WaitForLeader(Network *network, std::optional<uint64_t> not_this = std::nullopt,
                                      size_t max_ticks = 500) {
  for (size_t i = 0; i < max_ticks; ++i) {
    if (auto leader = network->Leader(); leader && leader != not_this) return leader;
    network->TickAll(1);
  }
  return std::nullopt;
}

}  // namespace

TEST(Raft, SingleVoterElectsItself) {
  Network network({1});
  network.Campaign(1);
  ASSERT_EQ(network.Leader(), 1);
  EXPECT_EQ(network.raft(1).term(), 1);
  ASSERT_TRUE(network.Propose(1, "a"));
  EXPECT_EQ(network.member(1).applied, (std::vector<std::string>{"a"}));
}

TEST(Raft, PreVoteElection) {
  Network network({1, 2, 3});
  network.Campaign(1);
  ASSERT_EQ(network.Leader(), 1);
  for (const auto id : {1, 2, 3}) {
    EXPECT_EQ(network.raft(id).term(), 1);
    EXPECT_EQ(network.raft(id).leader_id(), 1);
  }
  EXPECT_EQ(network.raft(2).vote(), 1);
}

TEST(Raft, ProposalsReplicateInOrder) {
  Network network({1, 2, 3});
  network.Campaign(1);
  ASSERT_TRUE(network.Propose(1, "a"));
  ASSERT_TRUE(network.Propose(1, "b"));
  ASSERT_TRUE(network.Propose(1, "c"));
  for (const auto id : {1, 2, 3}) {
    EXPECT_EQ(network.member(id).applied, (std::vector<std::string>{"a", "b", "c"})) << "member " << id;
  }
}

TEST(Raft, FollowersRejectProposals) {
  Network network({1, 2, 3});
  network.Campaign(1);
  const auto result = network.node(2).Propose("x");
  ASSERT_TRUE(result.HasError());
  EXPECT_EQ(result.GetError(), ProposeError::NOT_LEADER);
}

TEST(Raft, MinorityCannotCommit) {
  Network network({1, 2, 3});
  network.Campaign(1);
  network.Isolate(2);
  network.Isolate(3);
  ASSERT_TRUE(network.Propose(1, "lost"));
  EXPECT_TRUE(network.member(1).applied.empty());
  EXPECT_EQ(network.raft(1).raft_log().committed(), 1);
}

TEST(Raft, PreVoteKeepsIsolatedMemberFromBumpingTerms) {
  Network network({1, 2, 3});
  network.Campaign(1);
  network.Isolate(3);
  network.Tick(3, 100);
  EXPECT_EQ(network.raft(3).term(), 1);
  EXPECT_EQ(network.raft(3).role(), StateRole::PRE_CANDIDATE);

  network.Heal();
  network.TickAll(5);
  EXPECT_EQ(network.Leader(), 1);
  EXPECT_EQ(network.raft(1).term(), 1);
  EXPECT_EQ(network.raft(3).role(), StateRole::FOLLOWER);
}

TEST(Raft, WithoutPreVoteIsolatedMemberBumpsTerms) {
  Network network({1, 2, 3}, false);
  network.Campaign(1);
  network.Isolate(3);
  network.Tick(3, 100);
  EXPECT_GT(network.raft(3).term(), 1);
  EXPECT_EQ(network.raft(3).role(), StateRole::CANDIDATE);
}

TEST(Raft, LeaderWithoutQuorumStepsDown) {
  Network network({1, 2, 3});
  network.Campaign(1);
  network.TickAll(2);
  EXPECT_TRUE(network.raft(1).InLease());

  network.Isolate(1);
  network.Tick(1, 25);
  EXPECT_FALSE(network.raft(1).InLease());
  EXPECT_EQ(network.raft(1).role(), StateRole::FOLLOWER);
}

TEST(Raft, NewLeaderAfterPartition) {
  Network network({1, 2, 3});
  network.Campaign(1);
  ASSERT_TRUE(network.Propose(1, "a"));

  network.Isolate(1);
  const auto leader = WaitForLeader(&network, 1);
  ASSERT_TRUE(leader);
  EXPECT_GT(network.raft(*leader).term(), 1);
  ASSERT_TRUE(network.Propose(*leader, "b"));

  network.Heal();
  network.TickAll(5);
  ASSERT_TRUE(network.Propose(*leader, "c"));
  for (const auto id : {1, 2, 3}) {
    EXPECT_EQ(network.member(id).applied, (std::vector<std::string>{"a", "b", "c"})) << "member " << id;
  }
}

TEST(Raft, DivergentTailIsOverwritten) {
  Network network({1, 2, 3});
  network.Campaign(1);
  network.Isolate(1);
  // Never committed, the new leader discards it.
  ASSERT_TRUE(network.Propose(1, "orphan"));

  const auto leader = WaitForLeader(&network, 1);
  ASSERT_TRUE(leader);
  ASSERT_TRUE(network.Propose(*leader, "kept"));
  network.Heal();
  network.TickAll(5);

  EXPECT_EQ(network.member(1).applied, (std::vector<std::string>{"kept"}));
  EXPECT_EQ(network.raft(1).raft_log().LastIndex(), network.raft(*leader).raft_log().LastIndex());
}

TEST(Raft, AtMostOneLeaderPerTerm) {
  Network network({1, 2, 3, 4, 5});
  std::mt19937 random(42);
  std::map<uint64_t, std::set<uint64_t>> leaders;
  for (int round = 0; round < 40; ++round) {
    network.Heal();
    const auto isolated = 1 + random() % 5;
    network.Isolate(isolated);
    if (random() % 2 == 0) network.Isolate(1 + random() % 5);
    for (int tick = 0; tick < 15; ++tick) {
      network.TickAll(1);
      for (uint64_t id = 1; id <= 5; ++id) {
        if (network.raft(id).role() == StateRole::LEADER) leaders[network.raft(id).term()].insert(id);
      }
    }
  }
  ASSERT_FALSE(leaders.empty());
  for (const auto &[term, ids] : leaders) {
    EXPECT_EQ(ids.size(), 1) << "term " << term;
  }
}

TEST(Raft, TransferLeadership) {
  Network network({1, 2, 3});
  network.Campaign(1);
  network.node(1).TransferLeader(2);
  network.Stabilize();
  EXPECT_EQ(network.Leader(), 2);
  EXPECT_EQ(network.raft(2).term(), 2);
  EXPECT_TRUE(network.Propose(2, "after"));
}

TEST(Raft, TransferWaitsForTransfereeToCatchUp) {
  Network network({1, 2, 3});
  network.Campaign(1);
  network.Cut(1, 3);
  ASSERT_TRUE(network.Propose(1, "a"));
  ASSERT_TRUE(network.Propose(1, "b"));
  network.Heal();

  network.node(1).TransferLeader(3);
  const auto blocked = network.node(1).Propose("during");
  ASSERT_TRUE(blocked.HasError());
  EXPECT_EQ(blocked.GetError(), ProposeError::TRANSFERRING_LEADER);

  network.Stabilize();
  network.TickAll(3);
  EXPECT_EQ(network.Leader(), 3);
  EXPECT_EQ(network.member(3).applied, (std::vector<std::string>{"a", "b"}));
}

TEST(Raft, TransferIsAbortedAfterElectionTimeout) {
  Network network({1, 2, 3});
  network.Campaign(1);
  network.Isolate(3);
  network.node(1).TransferLeader(3);
  network.Stabilize();
  EXPECT_EQ(network.raft(1).lead_transferee(), 3);

  network.Tick(1, 10);
  EXPECT_EQ(network.raft(1).lead_transferee(), kNone);
}

TEST(Raft, RemoveVoter) {
  Network network({1, 2, 3});
  network.Campaign(1);
  ConfChange change{.changes = {{ConfChangeType::REMOVE_NODE, 3}}};
  ASSERT_FALSE(network.node(1).ProposeConfChange(change).HasError());
  network.Stabilize();

  EXPECT_EQ(Sorted(network.member(1).conf_state.voters), (std::vector<uint64_t>{1, 2}));
  network.Isolate(3);
  ASSERT_TRUE(network.Propose(1, "two voters"));
  EXPECT_EQ(network.member(2).applied, (std::vector<std::string>{"two voters"}));
}

TEST(Raft, OnlyOneConfChangeAtATime) {
  Network network({1, 2, 3});
  network.Campaign(1);
  network.Isolate(2);
  network.Isolate(3);
  ASSERT_FALSE(network.node(1).ProposeConfChange(ConfChange{.changes = {{ConfChangeType::REMOVE_NODE, 3}}}).HasError());
  const auto second = network.node(1).ProposeConfChange(ConfChange{.changes = {{ConfChangeType::REMOVE_NODE, 2}}});
  ASSERT_TRUE(second.HasError());
  EXPECT_EQ(second.GetError(), ProposeError::CONF_CHANGE_PENDING);
}

TEST(Raft, JointConsensusLeavesAutomatically) {
  Network network({1, 2, 3});
  network.Campaign(1);
  network.AddMember(4, std::make_unique<MemoryStorage>());

  ConfChange change{.changes = {{ConfChangeType::ADD_NODE, 4}, {ConfChangeType::REMOVE_NODE, 3}}};
  bool auto_leave = false;
  ASSERT_TRUE(change.EnterJoint(&auto_leave));
  EXPECT_TRUE(auto_leave);
  ASSERT_FALSE(network.node(1).ProposeConfChange(change).HasError());
  network.Stabilize();

  const auto &conf_state = network.member(1).conf_state;
  EXPECT_EQ(Sorted(conf_state.voters), (std::vector<uint64_t>{1, 2, 4}));
  EXPECT_TRUE(conf_state.voters_outgoing.empty());
  EXPECT_EQ(network.member(2).conf_state, conf_state);
}

TEST(Raft, ExplicitJointConfigurationWaitsForLeave) {
  Network network({1, 2, 3});
  network.Campaign(1);
  network.AddMember(4, std::make_unique<MemoryStorage>());

  ConfChange change{.transition = ConfChangeTransition::JOINT_EXPLICIT,
                    .changes = {{ConfChangeType::ADD_NODE, 4}, {ConfChangeType::REMOVE_NODE, 3}}};
  ASSERT_FALSE(network.node(1).ProposeConfChange(change).HasError());
  network.Stabilize();
  EXPECT_EQ(Sorted(network.member(1).conf_state.voters_outgoing), (std::vector<uint64_t>{1, 2, 3}));

  // Anything but leaving is refused while joint.
  EXPECT_TRUE(network.node(1).ProposeConfChange(ConfChange{.changes = {{ConfChangeType::ADD_NODE, 5}}}).HasError());

  ASSERT_FALSE(network.node(1).ProposeConfChange(ConfChange{}).HasError());
  network.Stabilize();
  EXPECT_EQ(Sorted(network.member(1).conf_state.voters), (std::vector<uint64_t>{1, 2, 4}));
  EXPECT_TRUE(network.member(1).conf_state.voters_outgoing.empty());
}

TEST(Raft, NewMemberCatchesUpFromSnapshot) {
  Network network({1, 2, 3});
  network.Campaign(1);
  ASSERT_TRUE(network.Propose(1, "a"));

  network.AddMember(4, std::make_unique<MemoryStorage>());
  ASSERT_FALSE(network.node(1).ProposeConfChange(ConfChange{.changes = {{ConfChangeType::ADD_NODE, 4}}}).HasError());
  network.Stabilize();

  auto &leader = network.member(1);
  ASSERT_FALSE(leader.storage->CreateSnapshot(leader.applied_index, &leader.conf_state, "image").HasError());
  ASSERT_FALSE(leader.storage->Compact(leader.applied_index).HasError());

  network.TickAll(3);
  auto &joined = network.member(4);
  EXPECT_EQ(Sorted(joined.conf_state.voters), (std::vector<uint64_t>{1, 2, 3, 4}));
  EXPECT_EQ(joined.storage->GetSnapshot(0)->data, "image");

  ASSERT_TRUE(network.Propose(1, "b"));
  EXPECT_EQ(joined.applied, (std::vector<std::string>{"b"}));
}

TEST(Raft, LaggingFollowerGetsSnapshot) {
  Network network({1, 2, 3});
  network.Campaign(1);
  network.Isolate(3);
  for (const auto *data : {"a", "b", "c"}) ASSERT_TRUE(network.Propose(1, data));

  auto &leader = network.member(1);
  ASSERT_FALSE(leader.storage->CreateSnapshot(leader.applied_index, &leader.conf_state, "abc").HasError());
  ASSERT_FALSE(leader.storage->Compact(leader.applied_index).HasError());

  network.Heal();
  network.TickAll(3);
  EXPECT_EQ(network.raft(3).raft_log().committed(), network.raft(1).raft_log().committed());
  EXPECT_TRUE(network.member(3).applied.empty());

  ASSERT_TRUE(network.Propose(1, "d"));
  EXPECT_EQ(network.member(3).applied, (std::vector<std::string>{"d"}));
}

TEST(Raft, RestartKeepsState) {
  Network network({1, 2, 3});
  network.Campaign(1);
  ASSERT_TRUE(network.Propose(1, "a"));

  auto storage = std::move(network.member(2).storage);
  const auto applied = network.member(2).applied_index;
  network.RemoveMember(2);
  network.AddMember(2, std::move(storage));
  EXPECT_EQ(network.raft(2).term(), 1);
  EXPECT_EQ(network.raft(2).vote(), 1);
  EXPECT_EQ(network.raft(2).raft_log().committed(), applied);
}

TEST(Raft, MessageSerialization) {
  Message message{.from = 1,
                  .to = 2,
                  .term = 3,
                  .payload = AppendRequest{.prev_log_index = 4,
                                           .prev_log_term = 2,
                                           .entries = {Entry{.term = 3, .index = 5, .data = "x"}},
                                           .commit = 4}};
  Message decoded;
  rangekv::slk::LoadFromString(rangekv::slk::SaveToString(message), &decoded);
  EXPECT_EQ(decoded.from, 1);
  EXPECT_EQ(decoded.term, 3);
  ASSERT_TRUE(std::holds_alternative<AppendRequest>(decoded.payload));
  const auto &request = std::get<AppendRequest>(decoded.payload);
  EXPECT_EQ(request.prev_log_index, 4);
  ASSERT_EQ(request.entries.size(), 1);
  EXPECT_EQ(request.entries[0], (Entry{.term = 3, .index = 5, .data = "x"}));
}

TEST(Raft, LimitSizeKeepsFirstEntry) {
  std::vector<Entry> entries(4, Entry{.data = std::string(100, 'x')});
  LimitSize(&entries, 1);
  EXPECT_EQ(entries.size(), 1);
}
