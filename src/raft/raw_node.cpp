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

#include "raft/raw_node.hpp"

namespace rangekv::raft {

RawNode::RawNode(const Config &config, Storage *storage)
    : raft_(config, storage), prev_soft_state_(raft_.GetSoftState()), prev_hard_state_(raft_.GetHardState()) {}

bool RawNode::HasReady() const {
  if (raft_.GetSoftState() != prev_soft_state_) return true;
  if (const auto hard_state = raft_.GetHardState(); !hard_state.IsEmpty() && hard_state != prev_hard_state_) {
    return true;
  }
  const auto &log = raft_.raft_log();
  return log.HasPendingSnapshot() || raft_.HasMessages() || !log.unstable().entries().empty() ||
         log.HasNextCommittedEntries();
}

Ready RawNode::GetReady() {
  Ready ready;
  auto &log = raft_.raft_log();

  if (const auto soft_state = raft_.GetSoftState(); soft_state != prev_soft_state_) {
    ready.soft_state = soft_state;
    prev_soft_state_ = soft_state;
  }
  if (const auto hard_state = raft_.GetHardState(); hard_state != prev_hard_state_) {
    ready.hard_state = hard_state;
    // Only a change of term or vote has to be durable before answering; a
    // lost commit index is recovered from the leader.
    ready.must_sync = hard_state.term != prev_hard_state_.term || hard_state.vote != prev_hard_state_.vote;
  }
  if (const auto &snapshot = log.unstable().snapshot()) ready.snapshot = *snapshot;
  ready.entries = log.UnstableEntries();
  if (!ready.entries.empty()) ready.must_sync = true;
  ready.committed_entries = log.NextCommittedEntries();
  ready.messages = raft_.TakeMessages();
  return ready;
}

void RawNode::Advance(const Ready &ready) {
  auto &log = raft_.raft_log();
  if (ready.hard_state) prev_hard_state_ = *ready.hard_state;
  if (!ready.entries.empty()) {
    const auto &last = ready.entries.back();
    log.StableTo(last.index, last.term);
  }
  if (!ready.snapshot.IsEmpty()) log.StableSnapTo(ready.snapshot.metadata.index);
  if (!ready.committed_entries.empty()) log.AcceptApplying(ready.committed_entries.back().index);
}

Status RawNode::GetStatus() const {
  Status status{.id = raft_.id(),
                .hard_state = raft_.GetHardState(),
                .soft_state = raft_.GetSoftState(),
                .applied = raft_.raft_log().applied(),
                .lead_transferee = raft_.lead_transferee()};
  if (raft_.role() == StateRole::LEADER) status.progress = raft_.tracker().progress();
  return status;
}

}  // namespace rangekv::raft
