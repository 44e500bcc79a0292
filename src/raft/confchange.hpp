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
#include <string>
#include <vector>

#include "raft/messages.hpp"
#include "raft/progress.hpp"
#include "utils/result.hpp"

namespace rangekv::raft {

struct ConfigChangeResult {
  TrackerConfig config;
  ProgressMap progress;
};

/// Errors are human readable descriptions of the rejected change.
using ConfigChangeOutcome = utils::BasicResult<std::string, ConfigChangeResult>;

/// Computes the configuration which results from applying membership changes
/// to the tracker's current one. The tracker itself is left untouched.
class Changer {
 public:
  /// `last_index` is used to initialize the progress of added members.
  Changer(const ProgressTracker &tracker, uint64_t last_index) : tracker_(tracker), last_index_(last_index) {}

  /// Enters a joint configuration: the current voters become the outgoing
  /// half and the changes are applied to the incoming half.
  ConfigChangeOutcome EnterJoint(bool auto_leave, const std::vector<ConfChangeSingle> &changes) const;

  /// Leaves the joint configuration, dropping the outgoing half.
  ConfigChangeOutcome LeaveJoint() const;

  /// Applies changes which alter at most one voter without a joint state.
  ConfigChangeOutcome Simple(const std::vector<ConfChangeSingle> &changes) const;

 private:
  ConfigChangeOutcome CheckAndCopy() const;
  std::string Apply(ConfigChangeResult *result, const std::vector<ConfChangeSingle> &changes) const;
  void MakeVoter(ConfigChangeResult *result, uint64_t id) const;
  void MakeLearner(ConfigChangeResult *result, uint64_t id) const;
  void Remove(ConfigChangeResult *result, uint64_t id) const;
  void InitProgress(ConfigChangeResult *result, uint64_t id, bool is_learner) const;

  const ProgressTracker &tracker_;
  uint64_t last_index_;
};

/// Rebuilds the tracker state described by a ConfState, by replaying the
/// changes which lead to it.
ConfigChangeOutcome RestoreConfig(const ProgressTracker &tracker, uint64_t last_index, const ConfState &conf_state);

/// Dispatches a ConfChange to the matching Changer operation.
ConfigChangeOutcome ExecuteConfChange(const Changer &changer, const ConfChange &conf_change);

/// ConfState which results from applying `conf_change` on top of
/// `conf_state`. Used by replicas that track membership outside of the core.
utils::BasicResult<std::string, ConfState> NextConfState(const ConfState &conf_state, const ConfChange &conf_change);

/// Verifies the configuration invariants, returns an error description or an
/// empty string.
std::string CheckInvariants(const TrackerConfig &config, const ProgressMap &progress);

}  // namespace rangekv::raft
