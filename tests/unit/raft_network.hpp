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


#pragma once

#include <algorithm>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "raft/memory_storage.hpp"
#include "raft/messages.hpp"
#include "raft/raw_node.hpp"
#include "slk/serialization.hpp"

namespace rangekv::raft::test {

/// A group member driven by the test: its storage, the consensus node and
/// the data entries it applied.
struct Member {
  std::unique_ptr<MemoryStorage> storage;
  std::unique_ptr<RawNode> node;
  std::vector<std::string> applied;
  ConfState conf_state;
  uint64_t applied_index{0};
};

/**
 * Synchronous network of raft members. Messages are delivered in the order
 * they were produced, ready states are persisted into MemoryStorage and
 * committed entries applied right away. Links can be cut to simulate
 * partitions.
 */
class Network {
 public:
  explicit Network(const std::vector<uint64_t> &voters, bool pre_vote = true, uint64_t election_tick = 10)
      : pre_vote_(pre_vote), election_tick_(election_tick) {
    for (const auto id : voters) AddMember(id, MemoryStorage::WithVoters(voters));
  }

  /// Starts a member with the given storage. A member with an empty storage
  /// waits to be added to the group by a membership change.
  void AddMember(uint64_t id, std::unique_ptr<MemoryStorage> storage) {
    Member member;
    member.storage = std::move(storage);
    Config config{.id = id,
                  .election_tick = election_tick_,
                  .heartbeat_tick = 1,
                  .pre_vote = pre_vote_,
                  .random_seed = id * 7919};
    member.node = std::make_unique<RawNode>(config, member.storage.get());
    member.conf_state = member.storage->InitialState().conf_state;
    members_[id] = std::move(member);
  }

  void RemoveMember(uint64_t id) { members_.erase(id); }

  Member &member(uint64_t id) { return members_.at(id); }
  RawNode &node(uint64_t id) { return *members_.at(id).node; }
  const Raft &raft(uint64_t id) { return members_.at(id).node->raft(); }

  /// Cuts every link between `id` and the rest of the group.
  void Isolate(uint64_t id) {
    for (const auto &[other, member] : members_) {
      if (other == id) continue;
      Cut(id, other);
      Cut(other, id);
    }
  }

  void Cut(uint64_t from, uint64_t to) { cut_.emplace(from, to); }

  void Heal() { cut_.clear(); }

  void Tick(uint64_t id, size_t times = 1) {
    for (size_t i = 0; i < times; ++i) node(id).Tick();
    Stabilize();
  }

  void TickAll(size_t times) {
    for (size_t i = 0; i < times; ++i) {
      for (auto &[id, member] : members_) member.node->Tick();
      Stabilize();
    }
  }

  void Campaign(uint64_t id) {
    node(id).Campaign();
    Stabilize();
  }

  bool Propose(uint64_t id, std::string data) {
    const auto result = node(id).Propose(std::move(data));
    Stabilize();
    return !result.HasError();
  }

  /// Processes ready states and delivers messages until the group is quiet.
  void Stabilize() {
    while (true) {
      bool progress = false;
      for (auto &[id, member] : members_) {
        if (!member.node->HasReady()) continue;
        HandleReady(&member);
        progress = true;
      }
      while (!in_flight_.empty()) {
        auto message = std::move(in_flight_.front());
        in_flight_.pop_front();
        auto target = members_.find(message.to);
        if (target == members_.end() || cut_.contains({message.from, message.to})) {
          ++dropped_;
          continue;
        }
        target->second.node->Step(std::move(message));
        progress = true;
      }
      if (!progress) return;
    }
  }

  /// The single member every other member agrees is the leader, if any.
  std::optional<uint64_t> Leader() const {
    std::optional<uint64_t> leader;
    for (const auto &[id, member] : members_) {
      if (member.node->raft().role() != StateRole::LEADER) continue;
      if (leader) return std::nullopt;
      leader = id;
    }
    return leader;
  }

  size_t dropped() const { return dropped_; }

 private:
  void HandleReady(Member *member) {
    auto &node = *member->node;
    auto ready = node.GetReady();
    if (!ready.snapshot.IsEmpty()) {
      EXPECT_FALSE(member->storage->ApplySnapshot(ready.snapshot).HasError());
      member->conf_state = ready.snapshot.metadata.conf_state;
    }
    member->storage->Append(ready.entries);
    if (ready.hard_state) member->storage->SetHardState(*ready.hard_state);
    for (auto &message : ready.messages) in_flight_.push_back(std::move(message));

    uint64_t applied = ready.snapshot.metadata.index;
    for (const auto &entry : ready.committed_entries) {
      if (entry.type == EntryType::CONF_CHANGE) {
        ConfChange conf_change;
        slk::LoadFromString(entry.data, &conf_change);
        member->conf_state = node.ApplyConfChange(conf_change);
        member->storage->SetConfState(member->conf_state);
      } else if (!entry.data.empty()) {
        member->applied.push_back(entry.data);
      }
      applied = entry.index;
    }
    node.Advance(ready);
    if (applied > member->applied_index) {
      member->applied_index = applied;
      node.AdvanceApply(applied);
    }
  }

  bool pre_vote_;
  uint64_t election_tick_;
  std::map<uint64_t, Member> members_;
  std::deque<Message> in_flight_;
  std::set<std::pair<uint64_t, uint64_t>> cut_;
  size_t dropped_{0};
};

}  // namespace rangekv::raft::test
