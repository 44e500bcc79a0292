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

#include "raft/raft.hpp"

#include <algorithm>

#include <fmt/ostream.h>

#include "raft/exceptions.hpp"
#include "slk/serialization.hpp"
#include "utils/logging.hpp"
#include "utils/variant_helpers.hpp"

namespace rangekv::raft {

void Config::Validate() const {
  if (id == kNone) throw RaftConfigException("Cannot use none as id");
  if (heartbeat_tick == 0) throw RaftConfigException("Heartbeat tick must be greater than 0");
  if (election_tick <= heartbeat_tick) throw RaftConfigException("Election tick must be greater than heartbeat tick");
  if (max_inflight_msgs == 0) throw RaftConfigException("Max inflight messages must be greater than 0");
}

std::string_view StateRoleToString(const StateRole role) {
  switch (role) {
    case StateRole::FOLLOWER:
      return "FOLLOWER";
    case StateRole::PRE_CANDIDATE:
      return "PRE_CANDIDATE";
    case StateRole::CANDIDATE:
      return "CANDIDATE";
    case StateRole::LEADER:
      return "LEADER";
  }
  return "UNKNOWN";
}

std::string_view ProposeErrorToString(const ProposeError error) {
  switch (error) {
    case ProposeError::NOT_LEADER:
      return "NOT_LEADER";
    case ProposeError::TRANSFERRING_LEADER:
      return "TRANSFERRING_LEADER";
    case ProposeError::NOT_MEMBER:
      return "NOT_MEMBER";
    case ProposeError::CONF_CHANGE_PENDING:
      return "CONF_CHANGE_PENDING";
    case ProposeError::INVALID_CONF_CHANGE:
      return "INVALID_CONF_CHANGE";
  }
  return "UNKNOWN";
}

Raft::Raft(const Config &config, Storage *storage)
    : id_(config.id),
      tag_(config.tag.empty() ? fmt::format("[peer {}]", config.id) : config.tag),
      raft_log_(storage, config.max_committed_size_per_ready, tag_),
      tracker_(config.max_inflight_msgs),
      max_msg_size_(config.max_size_per_msg),
      election_timeout_(config.election_tick),
      heartbeat_timeout_(config.heartbeat_tick),
      check_quorum_(config.check_quorum),
      pre_vote_(config.pre_vote),
      random_(config.random_seed != 0 ? config.random_seed : std::random_device{}()) {
  config.Validate();

  const auto initial_state = storage->InitialState();
  auto restored = RestoreConfig(tracker_, raft_log_.LastIndex(), initial_state.conf_state);
  if (restored.HasError()) {
    throw CorruptedStateException("{} cannot restore the configuration: {}", tag_, restored.GetError());
  }
  SwitchToConfig(std::move(restored).GetValue());

  if (!initial_state.hard_state.IsEmpty()) LoadState(initial_state.hard_state);
  if (config.applied > 0) {
    if (config.applied > raft_log_.committed()) {
      throw CorruptedStateException("{} applied index {} is past the commit index {}", tag_, config.applied,
                                    raft_log_.committed());
    }
    raft_log_.AppliedTo(config.applied);
  }
  BecomeFollower(term_, kNone);

  spdlog::info("{} new raft [peers: {}, term: {}, commit: {}, applied: {}, last index: {}, last term: {}]", tag_,
               tracker_.config().Describe(), term_, raft_log_.committed(), raft_log_.applied(),
               raft_log_.LastIndex(), raft_log_.LastTerm());
}

void Raft::LoadState(const HardState &state) {
  if (state.commit < raft_log_.committed() || state.commit > raft_log_.LastIndex()) {
    throw CorruptedStateException("{} state.commit {} is out of range [{}, {}]", tag_, state.commit,
                                  raft_log_.committed(), raft_log_.LastIndex());
  }
  raft_log_.CommitTo(state.commit);
  term_ = state.term;
  vote_ = state.vote;
}

std::vector<Message> Raft::TakeMessages() {
  std::vector<Message> messages;
  messages.swap(messages_);
  return messages;
}

bool Raft::Promotable() const {
  const auto *progress = tracker_.Find(id_);
  return progress != nullptr && !progress->is_learner && !raft_log_.HasPendingSnapshot();
}

void Raft::Reset(const uint64_t term) {
  if (term_ != term) {
    term_ = term;
    vote_ = kNone;
  }
  leader_id_ = kNone;
  election_elapsed_ = 0;
  heartbeat_elapsed_ = 0;
  ResetRandomizedElectionTimeout();
  AbortLeaderTransfer();
  tracker_.ResetVotes();

  const auto last_index = raft_log_.LastIndex();
  const auto max_inflight = tracker_.max_inflight();
  tracker_.Visit([&](const uint64_t id, Progress &progress) {
    const auto is_learner = progress.is_learner;
    progress = Progress(max_inflight);
    progress.next = last_index + 1;
    progress.is_learner = is_learner;
    if (id == id_) progress.match = last_index;
  });
  pending_conf_index_ = 0;
}

void Raft::ResetRandomizedElectionTimeout() {
  std::uniform_int_distribution<uint64_t> distribution(election_timeout_, 2 * election_timeout_ - 1);
  randomized_election_timeout_ = distribution(random_);
}

void Raft::BecomeFollower(const uint64_t term, const uint64_t leader_id) {
  Reset(term);
  leader_id_ = leader_id;
  role_ = StateRole::FOLLOWER;
  spdlog::info("{} became follower at term {}", tag_, term_);
}

void Raft::BecomeCandidate() {
  RKV_ASSERT(role_ != StateRole::LEADER, "{} invalid transition [leader -> candidate]", tag_);
  Reset(term_ + 1);
  vote_ = id_;
  role_ = StateRole::CANDIDATE;
  spdlog::info("{} became candidate at term {}", tag_, term_);
}

void Raft::BecomePreCandidate() {
  RKV_ASSERT(role_ != StateRole::LEADER, "{} invalid transition [leader -> pre-candidate]", tag_);
  // Neither the term nor the vote change, so a failed pre-election leaves no
  // trace.
  tracker_.ResetVotes();
  role_ = StateRole::PRE_CANDIDATE;
  leader_id_ = kNone;
  spdlog::info("{} became pre-candidate at term {}", tag_, term_);
}

void Raft::BecomeLeader() {
  RKV_ASSERT(role_ != StateRole::FOLLOWER, "{} invalid transition [follower -> leader]", tag_);
  Reset(term_);
  leader_id_ = id_;
  role_ = StateRole::LEADER;

  if (auto *self = tracker_.Find(id_)) {
    self->BecomeReplicate();
    self->recent_active = true;
  }

  // Any membership change in the uncommitted tail of the log may still be
  // pending.
  pending_conf_index_ = raft_log_.LastIndex();

  // Entries of previous terms can only be committed together with an entry
  // of the current term.
  AppendEntries({Entry{}});
  spdlog::info("{} became leader at term {}", tag_, term_);
}

void Raft::Tick() {
  ++tick_count_;
  if (role_ == StateRole::LEADER) {
    TickHeartbeat();
  } else {
    TickElection();
  }
}

void Raft::TickElection() {
  ++election_elapsed_;
  if (Promotable() && PastElectionTimeout()) {
    election_elapsed_ = 0;
    Hup(pre_vote_ ? CampaignType::PRE_ELECTION : CampaignType::ELECTION);
  }
}

void Raft::TickHeartbeat() {
  ++heartbeat_elapsed_;
  ++election_elapsed_;

  if (election_elapsed_ >= election_timeout_) {
    election_elapsed_ = 0;
    if (check_quorum_) {
      if (!tracker_.QuorumActive()) {
        spdlog::warn("{} stepped down to follower since quorum is not active", tag_);
        BecomeFollower(term_, kNone);
        return;
      }
      tracker_.Visit([&](const uint64_t id, Progress &progress) {
        if (id != id_) progress.recent_active = false;
      });
    }
    // A transfer which didn't finish within an election timeout is given up.
    if (role_ == StateRole::LEADER && lead_transferee_ != kNone) {
      spdlog::info("{} aborted leadership transfer to {}", tag_, lead_transferee_);
      AbortLeaderTransfer();
    }
  }

  if (role_ != StateRole::LEADER) return;

  if (heartbeat_elapsed_ >= heartbeat_timeout_) {
    heartbeat_elapsed_ = 0;
    BcastHeartbeat();
  }
}

void Raft::Campaign() { Hup(pre_vote_ ? CampaignType::PRE_ELECTION : CampaignType::ELECTION); }

void Raft::Hup(const CampaignType type) {
  if (role_ == StateRole::LEADER) {
    spdlog::debug("{} ignoring campaign because already leader", tag_);
    return;
  }
  if (!Promotable()) {
    spdlog::warn("{} is unpromotable and can not campaign", tag_);
    return;
  }
  if (HasUnappliedConfChanges()) {
    spdlog::warn("{} cannot campaign at term {} since there are still pending configuration changes to apply", tag_,
                 term_);
    return;
  }
  spdlog::info("{} is starting a new election at term {}", tag_, term_);
  CampaignImpl(type);
}

bool Raft::HasUnappliedConfChanges() const {
  if (raft_log_.applied() >= raft_log_.committed()) return false;
  auto low = std::max(raft_log_.applied() + 1, raft_log_.FirstIndex());
  const auto high = raft_log_.committed() + 1;
  while (low < high) {
    const auto entries = raft_log_.Slice(low, high, max_msg_size_);
    // Compacted entries are applied.
    if (entries.HasError() || entries->empty()) return false;
    for (const auto &entry : *entries) {
      if (entry.type == EntryType::CONF_CHANGE) return true;
    }
    low = entries->back().index + 1;
  }
  return false;
}

void Raft::CampaignImpl(const CampaignType type) {
  uint64_t term = 0;
  const bool pre_vote = type == CampaignType::PRE_ELECTION;
  if (pre_vote) {
    BecomePreCandidate();
    // Pre-votes are requested for the next term without incrementing the
    // local term.
    term = term_ + 1;
  } else {
    BecomeCandidate();
    term = term_;
  }

  if (Poll(id_, true) == VoteResult::WON) {
    // Single voter groups win right away.
    if (pre_vote) {
      CampaignImpl(CampaignType::ELECTION);
    } else {
      BecomeLeader();
    }
    return;
  }

  const auto last_index = raft_log_.LastIndex();
  const auto last_term = raft_log_.LastTerm();
  for (const auto id : tracker_.config().voters.Ids()) {
    if (id == id_) continue;
    spdlog::info("{} [log term: {}, index: {}] sent {} request to {} at term {}", tag_, last_term, last_index,
                 pre_vote ? "pre-vote" : "vote", id, term_);
    SendWithTerm(id, term,
                 VoteRequest{.pre_vote = pre_vote,
                             .last_log_index = last_index,
                             .last_log_term = last_term,
                             .leader_transfer = type == CampaignType::TRANSFER});
  }
}

VoteResult Raft::Poll(const uint64_t id, const bool granted) {
  spdlog::debug("{} received {} from {} at term {}", tag_, granted ? "vote" : "rejection", id, term_);
  tracker_.RecordVote(id, granted);
  return tracker_.TallyVotes().result;
}

void Raft::Step(Message message) {
  const auto *vote_request = std::get_if<VoteRequest>(&message.payload);
  const auto *vote_response = std::get_if<VoteResponse>(&message.payload);
  const bool from_leader = std::holds_alternative<AppendRequest>(message.payload) ||
                           std::holds_alternative<HeartbeatRequest>(message.payload) ||
                           std::holds_alternative<InstallSnapshot>(message.payload);

  if (message.term > term_) {
    if (vote_request != nullptr) {
      const bool in_lease = check_quorum_ && leader_id_ != kNone && election_elapsed_ < election_timeout_;
      if (!vote_request->leader_transfer && in_lease) {
        // A member which can't reach the leader doesn't disrupt the group.
        spdlog::info("{} [log term: {}, index: {}, vote: {}] ignored {} from {} at term {}: lease is not expired "
                     "(remaining ticks: {})",
                     tag_, raft_log_.LastTerm(), raft_log_.LastIndex(), vote_, MessageTypeName(message.payload),
                     message.from, term_, election_timeout_ - election_elapsed_);
        return;
      }
    }
    if (vote_request != nullptr && vote_request->pre_vote) {
      // Pre-votes never change the local term.
    } else if (vote_response != nullptr && vote_response->pre_vote && !vote_response->reject) {
      // A granted pre-vote carries the future term, which is taken once a
      // quorum grants it.
    } else {
      spdlog::info("{} [term: {}] received a {} message with higher term from {} [term: {}]", tag_, term_,
                   MessageTypeName(message.payload), message.from, message.term);
      BecomeFollower(message.term, from_leader ? message.from : kNone);
    }
  } else if (message.term < term_) {
    if ((check_quorum_ || pre_vote_) && (std::holds_alternative<AppendRequest>(message.payload) ||
                                         std::holds_alternative<HeartbeatRequest>(message.payload))) {
      // A stale leader learns about the new term from the response. Without
      // it a partitioned member with a bumped term could never rejoin.
      Send(message.from, AppendResponse{});
    } else if (vote_request != nullptr && vote_request->pre_vote) {
      // Rejected with the local term, so the pre-candidate catches up.
      SendWithTerm(message.from, term_, VoteResponse{.pre_vote = true, .reject = true});
    } else {
      spdlog::debug("{} [term: {}] ignored a {} message with lower term from {} [term: {}]", tag_, term_,
                    MessageTypeName(message.payload), message.from, message.term);
    }
    return;
  }

  if (vote_request != nullptr) {
    HandleVoteRequest(message, *vote_request);
    return;
  }

  switch (role_) {
    case StateRole::LEADER:
      StepLeader(message);
      break;
    case StateRole::PRE_CANDIDATE:
    case StateRole::CANDIDATE:
      StepCandidate(message);
      break;
    case StateRole::FOLLOWER:
      StepFollower(message);
      break;
  }
}

void Raft::HandleVoteRequest(const Message &message, const VoteRequest &request) {
  // A repeated vote for the same candidate is granted again. A pre-vote for a
  // future term can always be granted.
  const bool can_vote = vote_ == message.from || (vote_ == kNone && leader_id_ == kNone) ||
                        (request.pre_vote && message.term > term_);
  if (can_vote && raft_log_.IsUpToDate(request.last_log_index, request.last_log_term)) {
    spdlog::info("{} [log term: {}, index: {}, vote: {}] cast {} for {} [log term: {}, index: {}] at term {}", tag_,
                 raft_log_.LastTerm(), raft_log_.LastIndex(), vote_, request.pre_vote ? "pre-vote" : "vote",
                 message.from, request.last_log_term, request.last_log_index, term_);
    SendWithTerm(message.from, message.term, VoteResponse{.pre_vote = request.pre_vote, .reject = false});
    if (!request.pre_vote) {
      election_elapsed_ = 0;
      vote_ = message.from;
    }
    return;
  }
  spdlog::info("{} [log term: {}, index: {}, vote: {}] rejected {} from {} [log term: {}, index: {}] at term {}", tag_,
               raft_log_.LastTerm(), raft_log_.LastIndex(), vote_, request.pre_vote ? "pre-vote" : "vote",
               message.from, request.last_log_term, request.last_log_index, term_);
  SendWithTerm(message.from, term_, VoteResponse{.pre_vote = request.pre_vote, .reject = true});
}

void Raft::StepLeader(Message &message) {
  std::visit(utils::Overloaded{
                 [&](const AppendResponse &response) { HandleAppendResponse(message, response); },
                 [&](const HeartbeatResponse &response) { HandleHeartbeatResponse(message, response); },
                 [&](const TransferLeaderRequest &request) {
                   HandleTransferLeader(request.transferee != kNone ? request.transferee : message.from);
                 },
                 [&](const VoteResponse &) {},
                 [&](const auto &) {
                   spdlog::warn("{} leader ignored {} from {} at term {}", tag_, MessageTypeName(message.payload),
                                message.from, term_);
                 },
             },
             message.payload);
}

void Raft::StepCandidate(Message &message) {
  std::visit(utils::Overloaded{
                 [&](AppendRequest &request) {
                   BecomeFollower(message.term, message.from);
                   HandleAppendRequest(message, request);
                 },
                 [&](const HeartbeatRequest &request) {
                   BecomeFollower(message.term, message.from);
                   HandleHeartbeat(message, request);
                 },
                 [&](InstallSnapshot &request) {
                   BecomeFollower(message.term, message.from);
                   HandleSnapshot(message, request);
                 },
                 [&](const VoteResponse &response) {
                   // Responses of the other kind of election are stale.
                   if (response.pre_vote != (role_ == StateRole::PRE_CANDIDATE)) return;
                   const auto result = Poll(message.from, !response.reject);
                   const auto tally = tracker_.TallyVotes();
                   spdlog::info("{} has received {} {} votes and {} vote rejections", tag_, tally.granted,
                                response.pre_vote ? "pre-vote" : "vote", tally.rejected);
                   switch (result) {
                     case VoteResult::WON:
                       if (role_ == StateRole::PRE_CANDIDATE) {
                         CampaignImpl(CampaignType::ELECTION);
                       } else {
                         BecomeLeader();
                         BcastAppend();
                       }
                       break;
                     case VoteResult::LOST:
                       BecomeFollower(term_, kNone);
                       break;
                     case VoteResult::PENDING:
                       break;
                   }
                 },
                 [&](const auto &) {
                   spdlog::debug("{} {} ignored {} from {} at term {}", tag_, StateRoleToString(role_),
                                 MessageTypeName(message.payload), message.from, term_);
                 },
             },
             message.payload);
}

void Raft::StepFollower(Message &message) {
  std::visit(utils::Overloaded{
                 [&](AppendRequest &request) {
                   election_elapsed_ = 0;
                   leader_id_ = message.from;
                   HandleAppendRequest(message, request);
                 },
                 [&](const HeartbeatRequest &request) {
                   election_elapsed_ = 0;
                   leader_id_ = message.from;
                   HandleHeartbeat(message, request);
                 },
                 [&](InstallSnapshot &request) {
                   election_elapsed_ = 0;
                   leader_id_ = message.from;
                   HandleSnapshot(message, request);
                 },
                 [&](const TransferLeaderRequest &request) {
                   if (leader_id_ == kNone) {
                     spdlog::info("{} no leader at term {}; dropping leader transfer message", tag_, term_);
                     return;
                   }
                   const auto transferee = request.transferee != kNone ? request.transferee : message.from;
                   Send(leader_id_, TransferLeaderRequest{transferee});
                 },
                 [&](const TimeoutNow &) {
                   spdlog::info("{} [term {}] received TimeoutNow from {} and starts an election to get leadership",
                                tag_, term_, message.from);
                   // Leadership transfers never use pre-vote, the leader
                   // itself asked for the election.
                   Hup(CampaignType::TRANSFER);
                 },
                 [&](const auto &) {
                   spdlog::debug("{} follower ignored {} from {} at term {}", tag_, MessageTypeName(message.payload),
                                 message.from, term_);
                 },
             },
             message.payload);
}

void Raft::HandleAppendRequest(const Message &message, AppendRequest &request) {
  if (request.prev_log_index < raft_log_.committed()) {
    Send(message.from, AppendResponse{.index = raft_log_.committed()});
    return;
  }

  if (const auto last_new_index =
          raft_log_.MaybeAppend(request.prev_log_index, request.prev_log_term, request.commit, request.entries)) {
    Send(message.from, AppendResponse{.index = *last_new_index});
    return;
  }

  // The leader is given a hint about the last entry which could match, so it
  // can skip over whole terms of conflicting entries.
  const auto hint_index = std::min(request.prev_log_index, raft_log_.LastIndex());
  const auto [reject_hint, log_term] = raft_log_.FindConflictByTerm(hint_index, request.prev_log_term);
  spdlog::debug("{} [last term: {}, last index: {}] rejected append [log term: {}, index: {}] from {}", tag_,
                raft_log_.LastTerm(), raft_log_.LastIndex(),
                request.prev_log_term, request.prev_log_index, message.from);
  Send(message.from, AppendResponse{.reject = true,
                                    .index = request.prev_log_index,
                                    .reject_hint = reject_hint,
                                    .log_term = log_term});
}

void Raft::HandleHeartbeat(const Message &message, const HeartbeatRequest &request) {
  raft_log_.CommitTo(request.commit);
  Send(message.from, HeartbeatResponse{request.context});
}

void Raft::HandleSnapshot(const Message &message, InstallSnapshot &request) {
  const auto index = request.snapshot.metadata.index;
  const auto term = request.snapshot.metadata.term;
  if (Restore(std::move(request.snapshot))) {
    spdlog::info("{} [commit: {}] restored snapshot [index: {}, term: {}]", tag_, raft_log_.committed(), index, term);
    Send(message.from, AppendResponse{.index = raft_log_.LastIndex()});
  } else {
    spdlog::info("{} [commit: {}] ignored snapshot [index: {}, term: {}]", tag_, raft_log_.committed(), index, term);
    Send(message.from, AppendResponse{.index = raft_log_.committed()});
  }
}

void Raft::HandleAppendResponse(const Message &message, const AppendResponse &response) {
  auto *progress = tracker_.Find(message.from);
  if (progress == nullptr) {
    spdlog::debug("{} no progress available for {}", tag_, message.from);
    return;
  }
  progress->recent_active = true;

  if (response.reject) {
    spdlog::debug("{} received append rejection (hint: {}, log term: {}) from {} for index {}", tag_,
                  response.reject_hint, response.log_term, message.from, response.index);
    auto next_probe_index = response.reject_hint;
    if (response.log_term > 0) {
      // Skip all local entries with a term above the follower's hint term,
      // they can't match.
      next_probe_index = raft_log_.FindConflictByTerm(response.reject_hint, response.log_term).first;
    }
    if (progress->MaybeDecrTo(response.index, next_probe_index)) {
      spdlog::debug("{} decreased progress of {} to {}", tag_, message.from, fmt::streamed(*progress));
      if (progress->state == ProgressState::REPLICATE) progress->BecomeProbe();
      SendAppend(message.from);
    }
    return;
  }

  const auto old_paused = progress->IsPaused();
  if (!progress->MaybeUpdate(response.index)) return;

  switch (progress->state) {
    case ProgressState::PROBE:
      progress->BecomeReplicate();
      break;
    case ProgressState::SNAPSHOT:
      if (progress->match >= progress->pending_snapshot || progress->match + 1 >= raft_log_.FirstIndex()) {
        spdlog::debug("{} recovered from needing snapshot, resumed sending replication messages to {} {}", tag_,
                      message.from, fmt::streamed(*progress));
        // Passing through PROBE resets the next index to match + 1.
        progress->BecomeProbe();
        progress->BecomeReplicate();
      }
      break;
    case ProgressState::REPLICATE:
      progress->inflights.FreeLE(response.index);
      break;
  }

  if (MaybeCommit()) {
    BcastAppend();
  } else if (old_paused) {
    // The follower was paused and is now able to accept more entries.
    SendAppend(message.from);
  }
  // Stream as much of the log as the inflights window allows.
  while (MaybeSendAppend(message.from, false)) {
  }

  if (message.from == lead_transferee_ && progress->match == raft_log_.LastIndex()) {
    spdlog::info("{} sent TimeoutNow to {} after it caught up with the log", tag_, message.from);
    SendTimeoutNow(message.from);
  }
}

void Raft::HandleHeartbeatResponse(const Message &message, const HeartbeatResponse &response) {
  auto *progress = tracker_.Find(message.from);
  if (progress == nullptr) return;
  progress->recent_active = true;
  progress->probe_sent = false;
  progress->heartbeat_ack_tick = std::max(progress->heartbeat_ack_tick, response.context);

  if (progress->match < raft_log_.LastIndex() || progress->state == ProgressState::PROBE) {
    SendAppend(message.from);
  }
}

void Raft::HandleTransferLeader(const uint64_t transferee) {
  const auto *progress = tracker_.Find(transferee);
  if (progress == nullptr || progress->is_learner) {
    spdlog::debug("{} ignored leadership transfer to {}, it is not a voter", tag_, transferee);
    return;
  }
  if (lead_transferee_ != kNone) {
    if (lead_transferee_ == transferee) {
      spdlog::info("{} [term {}] transfer leadership to {} is in progress, ignores request to same node", tag_,
                   term_, transferee);
      return;
    }
    spdlog::info("{} [term {}] abort previous transferring leadership to {}", tag_, term_, lead_transferee_);
    AbortLeaderTransfer();
  }
  if (transferee == id_) {
    spdlog::debug("{} is already leader, ignored transferring leadership to self", tag_);
    return;
  }
  spdlog::info("{} [term {}] starts to transfer leadership to {}", tag_, term_, transferee);
  // The transfer has to finish within an election timeout.
  election_elapsed_ = 0;
  lead_transferee_ = transferee;
  if (progress->match == raft_log_.LastIndex()) {
    SendTimeoutNow(transferee);
    spdlog::info("{} sent TimeoutNow to {} immediately as it already has up-to-date log", tag_, transferee);
  } else {
    SendAppend(transferee);
  }
}

void Raft::Send(const uint64_t to, MessagePayload payload) { SendWithTerm(to, term_, std::move(payload)); }

void Raft::SendWithTerm(const uint64_t to, const uint64_t term, MessagePayload payload) {
  messages_.push_back(Message{.from = id_, .to = to, .term = term, .payload = std::move(payload)});
}

bool Raft::MaybeSendAppend(const uint64_t to, const bool send_if_empty) {
  auto *progress = tracker_.Find(to);
  if (progress == nullptr || progress->IsPaused()) return false;

  const auto prev_index = progress->next - 1;
  const auto prev_term = raft_log_.Term(prev_index);
  auto entries = raft_log_.Entries(progress->next, max_msg_size_);
  if (!entries.HasError() && entries->empty() && !send_if_empty) return false;

  // The follower needs entries which were compacted away.
  if (prev_term.HasError() || entries.HasError()) return MaybeSendSnapshot(to, progress);

  AppendRequest request{.prev_log_index = prev_index,
                        .prev_log_term = prev_term.GetValue(),
                        .entries = std::move(entries).GetValue(),
                        .commit = raft_log_.committed()};
  if (!request.entries.empty()) {
    const auto last = request.entries.back().index;
    switch (progress->state) {
      case ProgressState::REPLICATE:
        progress->OptimisticUpdate(last);
        progress->inflights.Add(last);
        break;
      case ProgressState::PROBE:
        progress->probe_sent = true;
        break;
      case ProgressState::SNAPSHOT:
        LOG_FATAL("{} is sending append in unhandled state {}", tag_, ProgressStateToString(progress->state));
    }
  }
  Send(to, std::move(request));
  return true;
}

bool Raft::MaybeSendSnapshot(const uint64_t to, Progress *progress) {
  if (!progress->recent_active) {
    spdlog::debug("{} ignore sending snapshot to {} since it is not recently active", tag_, to);
    return false;
  }

  auto snapshot = raft_log_.GetSnapshot(progress->next - 1);
  if (snapshot.HasError()) {
    if (snapshot.GetError() == StorageError::SNAPSHOT_TEMPORARILY_UNAVAILABLE) {
      spdlog::debug("{} failed to send snapshot to {} because snapshot is temporarily unavailable", tag_, to);
    } else {
      spdlog::error("{} failed to get snapshot for {}: {}", tag_, to, StorageErrorToString(snapshot.GetError()));
    }
    return false;
  }
  if (snapshot->IsEmpty()) {
    spdlog::error("{} the snapshot for {} is empty", tag_, to);
    return false;
  }

  const auto index = snapshot->metadata.index;
  spdlog::info("{} [first index: {}, commit: {}] sent snapshot [index: {}, term: {}] to {} {}", tag_,
               raft_log_.FirstIndex(), raft_log_.committed(), index, snapshot->metadata.term, to, fmt::streamed(*progress));
  progress->BecomeSnapshot(index);
  Send(to, InstallSnapshot{std::move(snapshot).GetValue()});
  return true;
}

void Raft::SendHeartbeat(const uint64_t to) {
  const auto *progress = tracker_.Find(to);
  // The follower may not have the committed entries yet, its commit index can
  // only move as far as its matched log.
  const auto commit = progress == nullptr ? 0 : std::min(progress->match, raft_log_.committed());
  Send(to, HeartbeatRequest{.commit = commit, .context = tick_count_});
}

void Raft::SendTimeoutNow(const uint64_t to) { Send(to, TimeoutNow{}); }

void Raft::BcastAppend() {
  for (const auto &[id, progress] : tracker_.progress()) {
    if (id == id_) continue;
    SendAppend(id);
  }
}

void Raft::BcastHeartbeat() {
  for (const auto &[id, progress] : tracker_.progress()) {
    if (id == id_) continue;
    SendHeartbeat(id);
  }
}

bool Raft::AppendEntries(std::vector<Entry> entries) {
  auto last_index = raft_log_.LastIndex();
  for (auto &entry : entries) {
    entry.term = term_;
    entry.index = ++last_index;
  }
  last_index = raft_log_.Append(entries);
  if (auto *self = tracker_.Find(id_)) self->MaybeUpdate(last_index);
  // A single voter group commits right away.
  MaybeCommit();
  return true;
}

bool Raft::MaybeCommit() { return raft_log_.MaybeCommit(tracker_.Committed(), term_); }

utils::BasicResult<ProposeError> Raft::Propose(std::string data) {
  if (role_ != StateRole::LEADER) return ProposeError::NOT_LEADER;
  if (tracker_.Find(id_) == nullptr) return ProposeError::NOT_MEMBER;
  if (lead_transferee_ != kNone) {
    spdlog::debug("{} [term {}] transfer leadership to {} is in progress; dropping proposal", tag_, term_,
                  lead_transferee_);
    return ProposeError::TRANSFERRING_LEADER;
  }
  AppendEntries({Entry{.type = EntryType::NORMAL, .data = std::move(data)}});
  BcastAppend();
  return {};
}

utils::BasicResult<ProposeError> Raft::ProposeConfChange(const ConfChange &conf_change) {
  if (role_ != StateRole::LEADER) return ProposeError::NOT_LEADER;
  if (tracker_.Find(id_) == nullptr) return ProposeError::NOT_MEMBER;
  if (lead_transferee_ != kNone) return ProposeError::TRANSFERRING_LEADER;

  if (pending_conf_index_ > raft_log_.applied()) {
    spdlog::info("{} ignoring conf change, possible unapplied conf change at index {} (applied to {})", tag_,
                 pending_conf_index_, raft_log_.applied());
    return ProposeError::CONF_CHANGE_PENDING;
  }
  const auto already_joint = tracker_.config().voters.IsJoint();
  const auto wants_leave_joint = conf_change.LeaveJoint();
  if (already_joint && !wants_leave_joint) {
    spdlog::info("{} ignoring conf change, must transition out of joint configuration first", tag_);
    return ProposeError::INVALID_CONF_CHANGE;
  }
  if (!already_joint && wants_leave_joint) {
    spdlog::info("{} ignoring conf change, not in joint state", tag_);
    return ProposeError::INVALID_CONF_CHANGE;
  }

  // Changes which would be rejected when applied aren't replicated at all.
  auto outcome = ExecuteConfChange(Changer(tracker_, raft_log_.LastIndex()), conf_change);
  if (outcome.HasError()) {
    spdlog::info("{} ignoring invalid conf change: {}", tag_, outcome.GetError());
    return ProposeError::INVALID_CONF_CHANGE;
  }

  AppendEntries({Entry{.type = EntryType::CONF_CHANGE, .data = slk::SaveToString(conf_change)}});
  pending_conf_index_ = raft_log_.LastIndex();
  BcastAppend();
  return {};
}

ConfState Raft::ApplyConfChange(const ConfChange &conf_change) {
  auto outcome = ExecuteConfChange(Changer(tracker_, raft_log_.LastIndex()), conf_change);
  if (outcome.HasError()) {
    spdlog::error("{} rejected committed conf change: {}", tag_, outcome.GetError());
    return tracker_.GetConfState();
  }
  return SwitchToConfig(std::move(outcome).GetValue());
}

ConfState Raft::SwitchToConfig(ConfigChangeResult change) {
  tracker_.config() = std::move(change.config);
  tracker_.progress() = std::move(change.progress);
  spdlog::info("{} switched to configuration {}", tag_, tracker_.config().Describe());

  auto conf_state = tracker_.GetConfState();
  const auto *self = tracker_.Find(id_);
  is_learner_ = self != nullptr && self->is_learner;

  if ((self == nullptr || is_learner_) && role_ == StateRole::LEADER) {
    // A leader which is no longer a voter hands the group over.
    spdlog::info("{} stepped down as it is no longer a voter", tag_);
    BecomeFollower(term_, kNone);
    return conf_state;
  }

  if (role_ != StateRole::LEADER || conf_state.voters.empty()) return conf_state;

  // The quorum may have changed, so the commit index can move.
  if (MaybeCommit()) {
    BcastAppend();
  } else {
    for (const auto &[id, progress] : tracker_.progress()) {
      if (id == id_) continue;
      MaybeSendAppend(id, false);
    }
  }
  if (lead_transferee_ != kNone && !tracker_.config().voters.Contains(lead_transferee_)) AbortLeaderTransfer();
  return conf_state;
}

void Raft::TransferLeader(const uint64_t transferee) {
  if (role_ == StateRole::LEADER) {
    HandleTransferLeader(transferee);
    return;
  }
  if (leader_id_ == kNone) {
    spdlog::info("{} no leader at term {}; dropping leader transfer", tag_, term_);
    return;
  }
  Send(leader_id_, TransferLeaderRequest{transferee});
}

void Raft::ReportSnapshot(const uint64_t id, const bool failure) {
  auto *progress = tracker_.Find(id);
  if (progress == nullptr || progress->state != ProgressState::SNAPSHOT) return;
  if (failure) progress->pending_snapshot = 0;
  spdlog::debug("{} snapshot to {} {}, resumed sending replication messages", tag_, id,
                failure ? "failed" : "succeeded");
  progress->BecomeProbe();
  // Wait for the follower's response (or a heartbeat after a failure) before
  // sending more.
  progress->probe_sent = true;
}

void Raft::ReportUnreachable(const uint64_t id) {
  auto *progress = tracker_.Find(id);
  if (progress == nullptr) return;
  if (progress->state == ProgressState::REPLICATE) progress->BecomeProbe();
  spdlog::debug("{} failed to send message to {} because it is unreachable", tag_, id);
}

void Raft::AppliedTo(const uint64_t index) {
  raft_log_.AppliedTo(index);

  if (tracker_.config().auto_leave && index >= pending_conf_index_ && role_ == StateRole::LEADER) {
    // The joint configuration has been applied, the leader leaves it right
    // away.
    spdlog::info("{} initiating automatic transition out of joint configuration {}", tag_,
                 tracker_.config().Describe());
    if (auto result = ProposeConfChange(ConfChange{}); result.HasError()) {
      spdlog::warn("{} failed to leave joint configuration: {}", tag_, ProposeErrorToString(result.GetError()));
    }
  }
}

bool Raft::InLease() const {
  if (role_ != StateRole::LEADER || !check_quorum_ || lead_transferee_ != kNone) return false;
  // The newest tick acknowledged by a quorum. Members that acknowledged a
  // heartbeat sent at tick T won't vote for anybody else before T plus an
  // election timeout.
  const auto acked = tracker_.QuorumMin([this](const uint64_t id, const Progress &progress) {
    return id == id_ ? tick_count_ : progress.heartbeat_ack_tick;
  });
  return acked != 0 && tick_count_ + 1 < acked + election_timeout_;
}

bool Raft::Restore(Snapshot snapshot) {
  if (snapshot.metadata.index <= raft_log_.committed()) return false;

  if (role_ != StateRole::FOLLOWER) {
    // Only a follower accepts snapshots. Become a follower of the next term
    // so the snapshot is retried.
    spdlog::warn("{} attempted to restore snapshot as {}, should never happen", tag_, StateRoleToString(role_));
    BecomeFollower(term_ + 1, kNone);
    return false;
  }

  const auto &conf_state = snapshot.metadata.conf_state;
  const auto contains = [&](const std::vector<uint64_t> &ids) {
    return std::find(ids.begin(), ids.end(), id_) != ids.end();
  };
  if (!contains(conf_state.voters) && !contains(conf_state.learners) && !contains(conf_state.voters_outgoing)) {
    spdlog::warn("{} attempted to restore snapshot but it is not in the configuration, should never happen", tag_);
    return false;
  }

  const auto index = snapshot.metadata.index;
  const auto term = snapshot.metadata.term;
  // The snapshot's last entry is already in the log, fast forward the commit.
  if (raft_log_.MatchTerm(index, term)) {
    spdlog::info("{} [commit: {}, last index: {}, last term: {}] fast-forwarded commit to snapshot [index: {}, term: "
                 "{}]",
                 tag_, raft_log_.committed(), raft_log_.LastIndex(), raft_log_.LastTerm(), index, term);
    raft_log_.CommitTo(index);
    return false;
  }

  ProgressTracker fresh(tracker_.max_inflight());
  auto restored = RestoreConfig(fresh, index, conf_state);
  if (restored.HasError()) {
    spdlog::error("{} unable to restore config from snapshot: {}", tag_, restored.GetError());
    return false;
  }

  raft_log_.Restore(std::move(snapshot));
  SwitchToConfig(std::move(restored).GetValue());
  if (auto *self = tracker_.Find(id_)) self->MaybeUpdate(self->next - 1);
  spdlog::info("{} [commit: {}, last index: {}, last term: {}] restored snapshot [index: {}, term: {}]", tag_,
               raft_log_.committed(), raft_log_.LastIndex(), raft_log_.LastTerm(), index, term);
  return true;
}

}  // namespace rangekv::raft
