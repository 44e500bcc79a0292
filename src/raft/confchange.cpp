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

#include "raft/confchange.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace rangekv::raft {

namespace {

size_t SymmetricDifference(const std::set<uint64_t> &lhs, const std::set<uint64_t> &rhs) {
  size_t count = 0;
  for (const auto id : lhs) {
    if (!rhs.contains(id)) ++count;
  }
  for (const auto id : rhs) {
    if (!lhs.contains(id)) ++count;
  }
  return count;
}

ConfigChangeOutcome CheckAndReturn(ConfigChangeResult result) {
  if (auto error = CheckInvariants(result.config, result.progress); !error.empty()) {
    return error;
  }
  return result;
}

}  // namespace

std::string CheckInvariants(const TrackerConfig &config, const ProgressMap &progress) {
  // Every member of the configuration must have a progress.
  for (const auto id : config.voters.Ids()) {
    if (!progress.contains(id)) return fmt::format("no progress for voter {}", id);
  }
  for (const auto id : config.learners) {
    const auto it = progress.find(id);
    if (it == progress.end()) return fmt::format("no progress for learner {}", id);
    // Learners and voters of either half don't overlap.
    if (config.voters.outgoing.Contains(id)) return fmt::format("{} is in learners and outgoing voters", id);
    if (config.voters.incoming.Contains(id)) return fmt::format("{} is in learners and incoming voters", id);
    if (!it->second.is_learner) return fmt::format("{} is in learners, but is not marked as learner", id);
  }
  for (const auto id : config.learners_next) {
    const auto it = progress.find(id);
    if (it == progress.end()) return fmt::format("no progress for next learner {}", id);
    // Next learners are voters of the outgoing half.
    if (!config.voters.outgoing.Contains(id)) return fmt::format("{} is in learners_next, but not outgoing", id);
    if (it->second.is_learner) return fmt::format("{} is in learners_next, but is already marked as learner", id);
  }
  if (!config.voters.IsJoint()) {
    if (!config.learners_next.empty()) return "learners_next must be empty when not joint";
    if (config.auto_leave) return "auto_leave must be false when not joint";
  }
  return {};
}

ConfigChangeOutcome Changer::CheckAndCopy() const {
  ConfigChangeResult result{tracker_.config(), tracker_.progress()};
  return CheckAndReturn(std::move(result));
}

ConfigChangeOutcome Changer::EnterJoint(const bool auto_leave, const std::vector<ConfChangeSingle> &changes) const {
  auto copy = CheckAndCopy();
  if (copy.HasError()) return copy;
  auto result = std::move(copy).GetValue();
  if (result.config.voters.IsJoint()) return std::string{"config is already joint"};
  if (result.config.voters.incoming.Empty()) return std::string{"can't make a zero-voter config joint"};

  result.config.voters.outgoing = result.config.voters.incoming;
  if (auto error = Apply(&result, changes); !error.empty()) return error;
  result.config.auto_leave = auto_leave;
  return CheckAndReturn(std::move(result));
}

ConfigChangeOutcome Changer::LeaveJoint() const {
  auto copy = CheckAndCopy();
  if (copy.HasError()) return copy;
  auto result = std::move(copy).GetValue();
  if (!result.config.voters.IsJoint()) return std::string{"can't leave a non-joint config"};

  for (const auto id : result.config.learners_next) {
    result.config.learners.insert(id);
    result.progress.at(id).is_learner = true;
  }
  result.config.learners_next.clear();

  for (const auto id : result.config.voters.outgoing.ids()) {
    const auto is_voter = result.config.voters.incoming.Contains(id);
    const auto is_learner = result.config.learners.contains(id);
    if (!is_voter && !is_learner) result.progress.erase(id);
  }
  result.config.voters.outgoing = MajorityConfig{};
  result.config.auto_leave = false;
  return CheckAndReturn(std::move(result));
}

ConfigChangeOutcome Changer::Simple(const std::vector<ConfChangeSingle> &changes) const {
  auto copy = CheckAndCopy();
  if (copy.HasError()) return copy;
  auto result = std::move(copy).GetValue();
  if (result.config.voters.IsJoint()) return std::string{"can't apply simple config change in joint config"};

  if (auto error = Apply(&result, changes); !error.empty()) return error;
  if (SymmetricDifference(tracker_.config().voters.incoming.ids(), result.config.voters.incoming.ids()) > 1) {
    return std::string{"more than one voter changed without entering joint config"};
  }
  return CheckAndReturn(std::move(result));
}

std::string Changer::Apply(ConfigChangeResult *result, const std::vector<ConfChangeSingle> &changes) const {
  for (const auto &change : changes) {
    // Changes with a zero id are no-ops.
    if (change.node_id == kNone) continue;
    switch (change.type) {
      case ConfChangeType::ADD_NODE:
        MakeVoter(result, change.node_id);
        break;
      case ConfChangeType::ADD_LEARNER_NODE:
        MakeLearner(result, change.node_id);
        break;
      case ConfChangeType::REMOVE_NODE:
        Remove(result, change.node_id);
        break;
    }
  }
  if (result->config.voters.incoming.Empty()) return "removed all voters";
  return {};
}

void Changer::MakeVoter(ConfigChangeResult *result, const uint64_t id) const {
  auto it = result->progress.find(id);
  if (it == result->progress.end()) {
    InitProgress(result, id, false);
    return;
  }
  it->second.is_learner = false;
  result->config.learners.erase(id);
  result->config.learners_next.erase(id);
  result->config.voters.incoming.ids().insert(id);
}

void Changer::MakeLearner(ConfigChangeResult *result, const uint64_t id) const {
  auto it = result->progress.find(id);
  if (it == result->progress.end()) {
    InitProgress(result, id, true);
    return;
  }
  if (it->second.is_learner) return;

  // Remove any existing voter in the incoming config, but keep the progress.
  auto progress = it->second;
  Remove(result, id);
  auto inserted = result->progress.insert_or_assign(id, std::move(progress)).first;

  // A voter of the outgoing config can't be a learner at the same time, it
  // becomes one when the joint config is left.
  if (result->config.voters.outgoing.Contains(id)) {
    result->config.learners_next.insert(id);
  } else {
    inserted->second.is_learner = true;
    result->config.learners.insert(id);
  }
}

void Changer::Remove(ConfigChangeResult *result, const uint64_t id) const {
  if (!result->progress.contains(id)) return;

  result->config.voters.incoming.ids().erase(id);
  result->config.learners.erase(id);
  result->config.learners_next.erase(id);

  // Outgoing voters keep their progress until the joint config is left.
  if (!result->config.voters.outgoing.Contains(id)) result->progress.erase(id);
}

void Changer::InitProgress(ConfigChangeResult *result, const uint64_t id, const bool is_learner) const {
  if (is_learner) {
    result->config.learners.insert(id);
  } else {
    result->config.voters.incoming.ids().insert(id);
  }
  Progress progress(tracker_.max_inflight());
  // The new member is probed from the current last index, it catches up
  // through rejections or a snapshot.
  progress.next = std::max<uint64_t>(last_index_, 1);
  progress.match = 0;
  progress.is_learner = is_learner;
  // Counted as active so that check-quorum doesn't step down right after
  // adding members.
  progress.recent_active = true;
  result->progress.insert_or_assign(id, std::move(progress));
}

ConfigChangeOutcome RestoreConfig(const ProgressTracker &tracker, const uint64_t last_index,
                                  const ConfState &conf_state) {
  std::vector<ConfChangeSingle> outgoing;
  std::vector<ConfChangeSingle> incoming;
  for (const auto id : conf_state.voters_outgoing) {
    outgoing.push_back({ConfChangeType::ADD_NODE, id});
  }
  // The incoming config is built on top of the outgoing one, so the outgoing
  // voters are removed first.
  for (const auto id : conf_state.voters_outgoing) {
    incoming.push_back({ConfChangeType::REMOVE_NODE, id});
  }
  for (const auto id : conf_state.voters) {
    incoming.push_back({ConfChangeType::ADD_NODE, id});
  }
  for (const auto id : conf_state.learners) {
    incoming.push_back({ConfChangeType::ADD_LEARNER_NODE, id});
  }
  for (const auto id : conf_state.learners_next) {
    incoming.push_back({ConfChangeType::ADD_LEARNER_NODE, id});
  }

  ProgressTracker current(tracker.max_inflight());
  auto apply_one_by_one = [&](const std::vector<ConfChangeSingle> &changes) -> std::string {
    for (const auto &change : changes) {
      auto outcome = Changer(current, last_index).Simple({change});
      if (outcome.HasError()) return outcome.GetError();
      current.config() = std::move(outcome.GetValue().config);
      current.progress() = std::move(outcome.GetValue().progress);
    }
    return {};
  };

  if (outgoing.empty()) {
    if (auto error = apply_one_by_one(incoming); !error.empty()) return error;
    return ConfigChangeResult{current.config(), current.progress()};
  }

  if (auto error = apply_one_by_one(outgoing); !error.empty()) return error;
  return Changer(current, last_index).EnterJoint(conf_state.auto_leave, incoming);
}

ConfigChangeOutcome ExecuteConfChange(const Changer &changer, const ConfChange &conf_change) {
  if (conf_change.LeaveJoint()) return changer.LeaveJoint();
  bool auto_leave = false;
  if (conf_change.EnterJoint(&auto_leave)) return changer.EnterJoint(auto_leave, conf_change.changes);
  return changer.Simple(conf_change.changes);
}

utils::BasicResult<std::string, ConfState> NextConfState(const ConfState &conf_state, const ConfChange &conf_change) {
  // Progress isn't needed, any inflight limit will do.
  ProgressTracker tracker(1);
  auto restored = RestoreConfig(tracker, 0, conf_state);
  if (restored.HasError()) return restored.GetError();
  tracker.config() = std::move(restored.GetValue().config);
  tracker.progress() = std::move(restored.GetValue().progress);

  auto outcome = ExecuteConfChange(Changer(tracker, 0), conf_change);
  if (outcome.HasError()) return outcome.GetError();
  tracker.config() = std::move(outcome.GetValue().config);
  tracker.progress() = std::move(outcome.GetValue().progress);
  return tracker.GetConfState();
}

}  // namespace rangekv::raft
