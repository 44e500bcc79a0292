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

#include "raft/progress.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "utils/logging.hpp"

namespace rangekv::raft {

void Inflights::Add(const uint64_t index) {
  RKV_ASSERT(!Full(), "Cannot add into a full inflights window");
  DRKV_ASSERT(indexes_.empty() || indexes_.back() < index, "Inflight indexes must grow");
  indexes_.push_back(index);
}

void Inflights::FreeLE(const uint64_t to) {
  while (!indexes_.empty() && indexes_.front() <= to) {
    indexes_.pop_front();
  }
}

std::string_view ProgressStateToString(const ProgressState state) {
  switch (state) {
    case ProgressState::PROBE:
      return "PROBE";
    case ProgressState::REPLICATE:
      return "REPLICATE";
    case ProgressState::SNAPSHOT:
      return "SNAPSHOT";
  }
  return "UNKNOWN";
}

void Progress::ResetState(const ProgressState new_state) {
  probe_sent = false;
  pending_snapshot = 0;
  state = new_state;
  inflights.Reset();
}

void Progress::BecomeProbe() {
  // After a snapshot the follower is probed right after the snapshot index.
  if (state == ProgressState::SNAPSHOT) {
    const auto pending = pending_snapshot;
    ResetState(ProgressState::PROBE);
    next = std::max(match + 1, pending + 1);
  } else {
    ResetState(ProgressState::PROBE);
    next = match + 1;
  }
}

void Progress::BecomeReplicate() {
  ResetState(ProgressState::REPLICATE);
  next = match + 1;
}

void Progress::BecomeSnapshot(const uint64_t snapshot_index) {
  ResetState(ProgressState::SNAPSHOT);
  pending_snapshot = snapshot_index;
}

bool Progress::MaybeUpdate(const uint64_t index) {
  bool updated = false;
  if (match < index) {
    match = index;
    updated = true;
    probe_sent = false;
  }
  next = std::max(next, index + 1);
  return updated;
}

bool Progress::MaybeDecrTo(const uint64_t rejected, const uint64_t match_hint) {
  if (state == ProgressState::REPLICATE) {
    // Stale rejection of an already matched index.
    if (rejected <= match) return false;
    next = match + 1;
    return true;
  }

  // Only the rejection of the most recent probe counts.
  if (next == 0 || next - 1 != rejected) return false;

  next = std::max(std::min(rejected, match_hint + 1), match + 1);
  probe_sent = false;
  return true;
}

bool Progress::IsPaused() const {
  switch (state) {
    case ProgressState::PROBE:
      return probe_sent;
    case ProgressState::REPLICATE:
      return inflights.Full();
    case ProgressState::SNAPSHOT:
      return true;
  }
  return true;
}

std::ostream &operator<<(std::ostream &in, const Progress &progress) {
  in << "Progress { state: " << ProgressStateToString(progress.state) << ", match: " << progress.match
     << ", next: " << progress.next;
  if (progress.is_learner) in << ", learner";
  if (progress.state == ProgressState::SNAPSHOT) in << ", pending_snapshot: " << progress.pending_snapshot;
  if (!progress.recent_active) in << ", inactive";
  if (progress.inflights.Count() > 0) in << ", inflight: " << progress.inflights.Count();
  in << " }";
  return in;
}

std::string TrackerConfig::Describe() const {
  auto description = fmt::format("voters={}", voters.Describe());
  if (!learners.empty()) description += fmt::format(" learners=({})", fmt::join(learners, " "));
  if (!learners_next.empty()) description += fmt::format(" learners_next=({})", fmt::join(learners_next, " "));
  if (auto_leave) description += " autoleave";
  return description;
}

ConfState ProgressTracker::GetConfState() const {
  ConfState state;
  state.voters.assign(config_.voters.incoming.ids().begin(), config_.voters.incoming.ids().end());
  state.voters_outgoing.assign(config_.voters.outgoing.ids().begin(), config_.voters.outgoing.ids().end());
  state.learners.assign(config_.learners.begin(), config_.learners.end());
  state.learners_next.assign(config_.learners_next.begin(), config_.learners_next.end());
  state.auto_leave = config_.auto_leave;
  return state;
}

uint64_t ProgressTracker::Committed() const {
  return QuorumMin([](uint64_t /*id*/, const Progress &progress) { return progress.match; });
}

uint64_t ProgressTracker::QuorumMin(const std::function<uint64_t(uint64_t, const Progress &)> &value_of) const {
  return config_.voters.CommittedIndex([&](const uint64_t id) -> std::optional<uint64_t> {
    const auto it = progress_.find(id);
    if (it == progress_.end()) return std::nullopt;
    return value_of(id, it->second);
  });
}

bool ProgressTracker::QuorumActive() const {
  std::map<uint64_t, bool> votes;
  for (const auto &[id, progress] : progress_) {
    if (progress.is_learner) continue;
    votes[id] = progress.recent_active;
  }
  return config_.voters.Vote(votes) == VoteResult::WON;
}

std::vector<uint64_t> ProgressTracker::VoterNodes() const {
  const auto ids = config_.voters.Ids();
  return {ids.begin(), ids.end()};
}

std::vector<uint64_t> ProgressTracker::LearnerNodes() const { return {config_.learners.begin(), config_.learners.end()}; }

void ProgressTracker::RecordVote(const uint64_t id, const bool granted) { votes_.try_emplace(id, granted); }

ProgressTracker::TallyResult ProgressTracker::TallyVotes() const {
  TallyResult tally{0, 0, VoteResult::PENDING};
  for (const auto &[id, progress] : progress_) {
    if (progress.is_learner) continue;
    const auto it = votes_.find(id);
    if (it == votes_.end()) continue;
    if (it->second) {
      ++tally.granted;
    } else {
      ++tally.rejected;
    }
  }
  tally.result = config_.voters.Vote(votes_);
  return tally;
}

void ProgressTracker::Visit(const std::function<void(uint64_t, Progress &)> &visitor) {
  for (auto &[id, progress] : progress_) {
    visitor(id, progress);
  }
}

Progress *ProgressTracker::Find(const uint64_t id) {
  const auto it = progress_.find(id);
  return it == progress_.end() ? nullptr : &it->second;
}

const Progress *ProgressTracker::Find(const uint64_t id) const {
  const auto it = progress_.find(id);
  return it == progress_.end() ? nullptr : &it->second;
}

}  // namespace rangekv::raft
