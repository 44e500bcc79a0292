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
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "raft/config.hpp"
#include "raft/confchange.hpp"
#include "raft/messages.hpp"
#include "raft/progress.hpp"
#include "raft/raft_log.hpp"
#include "raft/storage.hpp"
#include "utils/result.hpp"

namespace rangekv::raft {

enum class StateRole : uint8_t { FOLLOWER, PRE_CANDIDATE, CANDIDATE, LEADER };

std::string_view StateRoleToString(StateRole role);

enum class CampaignType : uint8_t {
  // Pre-election which doesn't change terms.
  PRE_ELECTION,
  ELECTION,
  // Election forced by a leadership transfer, bypasses leader leases.
  TRANSFER,
};

enum class ProposeError : uint8_t {
  NOT_LEADER,
  // A leadership transfer is in progress.
  TRANSFERRING_LEADER,
  // The local member was removed from the group.
  NOT_MEMBER,
  // Another membership change isn't applied yet.
  CONF_CHANGE_PENDING,
  INVALID_CONF_CHANGE,
};

std::string_view ProposeErrorToString(ProposeError error);

/// Volatile state which is interesting to the host, not persisted.
struct SoftState {
  uint64_t leader_id{kNone};
  StateRole role{StateRole::FOLLOWER};

  friend bool operator==(const SoftState &lhs, const SoftState &rhs) = default;
};

/// The consensus state machine of a single group member. It is purely
/// reactive: time advances through Tick, input arrives through Step and the
/// proposal methods, and the output (messages, entries to persist) is
/// collected by RawNode. It does no I/O and is not thread safe.
class Raft {
 public:
  /// @throw RaftConfigException when the config is invalid.
  /// @throw CorruptedStateException when the stored state is inconsistent.
  Raft(const Config &config, Storage *storage);

  Raft(const Raft &) = delete;
  Raft &operator=(const Raft &) = delete;
  Raft(Raft &&) = delete;
  Raft &operator=(Raft &&) = delete;
  ~Raft() = default;

  void Tick();

  /// Processes a message from another member. Messages from older terms are
  /// ignored (or answered so that a stale leader learns about the new term).
  void Step(Message message);

  /// Starts an election if the member is promotable and has no unapplied
  /// membership changes.
  void Campaign();

  utils::BasicResult<ProposeError> Propose(std::string data);

  utils::BasicResult<ProposeError> ProposeConfChange(const ConfChange &conf_change);

  /// Applies a committed membership change and returns the new membership.
  /// A rejected change leaves the configuration as it was.
  ConfState ApplyConfChange(const ConfChange &conf_change);

  /// Asks the leader to hand leadership over to `transferee`. On a follower
  /// the request is forwarded to the known leader.
  void TransferLeader(uint64_t transferee);

  /// Reports that the last snapshot sent to `id` was delivered or failed.
  void ReportSnapshot(uint64_t id, bool failure);

  void ReportUnreachable(uint64_t id);

  /// Notifies the core that entries up to `index` are applied to the state
  /// machine.
  void AppliedTo(uint64_t index);

  /// True while the leader can serve reads locally: a quorum acknowledged a
  /// heartbeat recent enough that no other member can have been elected in
  /// the meantime.
  bool InLease() const;

  bool Promotable() const;

  uint64_t id() const { return id_; }
  uint64_t term() const { return term_; }
  uint64_t vote() const { return vote_; }
  uint64_t leader_id() const { return leader_id_; }
  StateRole role() const { return role_; }
  uint64_t lead_transferee() const { return lead_transferee_; }
  uint64_t pending_conf_index() const { return pending_conf_index_; }
  const RaftLog &raft_log() const { return raft_log_; }
  RaftLog &raft_log() { return raft_log_; }
  const ProgressTracker &tracker() const { return tracker_; }
  uint64_t randomized_election_timeout() const { return randomized_election_timeout_; }

  SoftState GetSoftState() const { return SoftState{leader_id_, role_}; }
  HardState GetHardState() const { return HardState{term_, vote_, raft_log_.committed()}; }

  /// Messages produced since the last call.
  std::vector<Message> TakeMessages();
  bool HasMessages() const { return !messages_.empty(); }

  /// Restores the log and the membership from a snapshot. Returns false when
  /// the snapshot is outdated or doesn't include this member.
  bool Restore(Snapshot snapshot);

  void BecomeFollower(uint64_t term, uint64_t leader_id);
  void BecomeCandidate();
  void BecomePreCandidate();
  void BecomeLeader();

 private:
  void LoadState(const HardState &state);
  void Reset(uint64_t term);
  void ResetRandomizedElectionTimeout();
  bool PastElectionTimeout() const { return election_elapsed_ >= randomized_election_timeout_; }

  void TickElection();
  void TickHeartbeat();

  void Hup(CampaignType type);
  void CampaignImpl(CampaignType type);
  VoteResult Poll(uint64_t id, bool granted);
  bool HasUnappliedConfChanges() const;

  void StepLeader(Message &message);
  void StepCandidate(Message &message);
  void StepFollower(Message &message);
  void HandleVoteRequest(const Message &message, const VoteRequest &request);
  void HandleAppendRequest(const Message &message, AppendRequest &request);
  void HandleHeartbeat(const Message &message, const HeartbeatRequest &request);
  void HandleSnapshot(const Message &message, InstallSnapshot &request);
  void HandleAppendResponse(const Message &message, const AppendResponse &response);
  void HandleHeartbeatResponse(const Message &message, const HeartbeatResponse &response);
  void HandleTransferLeader(uint64_t transferee);

  void Send(uint64_t to, MessagePayload payload);
  void SendWithTerm(uint64_t to, uint64_t term, MessagePayload payload);
  void SendAppend(uint64_t to) { MaybeSendAppend(to, true); }
  bool MaybeSendAppend(uint64_t to, bool send_if_empty);
  bool MaybeSendSnapshot(uint64_t to, Progress *progress);
  void SendHeartbeat(uint64_t to);
  void SendTimeoutNow(uint64_t to);
  void BcastAppend();
  void BcastHeartbeat();

  bool AppendEntries(std::vector<Entry> entries);
  bool MaybeCommit();
  void AbortLeaderTransfer() { lead_transferee_ = kNone; }

  ConfState SwitchToConfig(ConfigChangeResult change);

  uint64_t id_;
  std::string tag_;
  uint64_t term_{0};
  uint64_t vote_{kNone};
  RaftLog raft_log_;
  ProgressTracker tracker_;
  StateRole role_{StateRole::FOLLOWER};
  uint64_t leader_id_{kNone};
  uint64_t lead_transferee_{kNone};
  // Index of the newest proposed membership change. A new change can only be
  // proposed once this index is applied.
  uint64_t pending_conf_index_{0};
  bool is_learner_{false};

  uint64_t max_msg_size_;
  uint64_t election_timeout_;
  uint64_t heartbeat_timeout_;
  uint64_t randomized_election_timeout_{0};
  uint64_t election_elapsed_{0};
  uint64_t heartbeat_elapsed_{0};
  // Monotonic tick counter, used to date heartbeats for the lease.
  uint64_t tick_count_{1};
  bool check_quorum_;
  bool pre_vote_;

  std::mt19937_64 random_;
  std::vector<Message> messages_;
};

}  // namespace rangekv::raft
