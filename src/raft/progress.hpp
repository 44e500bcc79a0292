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

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "raft/messages.hpp"
#include "raft/quorum.hpp"

namespace rangekv::raft {

/// Sliding window of the last indexes of append messages in flight to one
/// follower.
class Inflights {
 public:
  explicit Inflights(size_t capacity) : capacity_(capacity) {}

  void Add(uint64_t index);

  /// Frees all inflight messages with an index <= `to`.
  void FreeLE(uint64_t to);

  bool Full() const { return indexes_.size() >= capacity_; }
  size_t Count() const { return indexes_.size(); }
  void Reset() { indexes_.clear(); }

 private:
  size_t capacity_;
  std::deque<uint64_t> indexes_;
};

enum class ProgressState : uint8_t {
  // The leader sends at most one append per heartbeat interval while looking
  // for the last matching index.
  PROBE,
  // Entries are streamed optimistically, bounded by the inflights window.
  REPLICATE,
  // A snapshot is on its way, nothing else is sent.
  SNAPSHOT,
};

std::string_view ProgressStateToString(ProgressState state);

/// The leader's view of a follower.
struct Progress {
  explicit Progress(size_t max_inflight) : inflights(max_inflight) {}

  uint64_t match{0};
  uint64_t next{1};
  ProgressState state{ProgressState::PROBE};
  // Index of the snapshot in flight while in the SNAPSHOT state.
  uint64_t pending_snapshot{0};
  // Set when the follower was heard from since the last check-quorum.
  bool recent_active{false};
  // In the PROBE state, set after an append until the follower responds.
  bool probe_sent{false};
  bool is_learner{false};
  // Leader tick of the newest acknowledged heartbeat.
  uint64_t heartbeat_ack_tick{0};
  Inflights inflights;

  void ResetState(ProgressState new_state);
  void BecomeProbe();
  void BecomeReplicate();
  void BecomeSnapshot(uint64_t snapshot_index);

  /// Called on a successful append response. Returns false when the index is
  /// outdated.
  bool MaybeUpdate(uint64_t index);

  void OptimisticUpdate(uint64_t index) { next = index + 1; }

  /// Called on a rejected append. `rejected` is the rejected prev index and
  /// `match_hint` the follower's guess of its last matching index. Returns
  /// false when the rejection is stale.
  bool MaybeDecrTo(uint64_t rejected, uint64_t match_hint);

  bool IsPaused() const;

  friend std::ostream &operator<<(std::ostream &in, const Progress &progress);
};

using ProgressMap = std::map<uint64_t, Progress>;

/// Membership as tracked by the leader.
struct TrackerConfig {
  JointConfig voters;
  // Learners which aren't voters in either half of the joint configuration.
  std::set<uint64_t> learners;
  // Voters of the outgoing configuration which become learners when the
  // joint configuration is left.
  std::set<uint64_t> learners_next;
  bool auto_leave{false};

  std::string Describe() const;

  friend bool operator==(const TrackerConfig &lhs, const TrackerConfig &rhs) = default;
};

/// Tracks the active configuration, the progress of every member and the
/// votes of an ongoing election.
class ProgressTracker {
 public:
  explicit ProgressTracker(size_t max_inflight) : max_inflight_(max_inflight) {}

  ConfState GetConfState() const;

  bool IsSingleton() const { return config_.voters.incoming.Size() == 1 && !config_.voters.IsJoint(); }

  /// Largest index replicated on a quorum of voters.
  uint64_t Committed() const;

  /// Highest value of `value_of` shared by a quorum. Values of members
  /// without progress are treated as zero.
  uint64_t QuorumMin(const std::function<uint64_t(uint64_t id, const Progress &)> &value_of) const;

  bool QuorumActive() const;

  std::vector<uint64_t> VoterNodes() const;
  std::vector<uint64_t> LearnerNodes() const;

  void ResetVotes() { votes_.clear(); }
  void RecordVote(uint64_t id, bool granted);

  struct TallyResult {
    size_t granted;
    size_t rejected;
    VoteResult result;
  };
  TallyResult TallyVotes() const;

  void Visit(const std::function<void(uint64_t id, Progress &)> &visitor);

  Progress *Find(uint64_t id);
  const Progress *Find(uint64_t id) const;

  const TrackerConfig &config() const { return config_; }
  TrackerConfig &config() { return config_; }
  const ProgressMap &progress() const { return progress_; }
  ProgressMap &progress() { return progress_; }
  size_t max_inflight() const { return max_inflight_; }

 private:
  TrackerConfig config_;
  ProgressMap progress_;
  std::map<uint64_t, bool> votes_;
  size_t max_inflight_;
};

}  // namespace rangekv::raft
