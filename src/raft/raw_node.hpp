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
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "raft/config.hpp"
#include "raft/messages.hpp"
#include "raft/raft.hpp"
#include "raft/storage.hpp"

namespace rangekv::raft {

/// Everything the host has to do after the core made progress. The host
/// persists `hard_state`, `snapshot` and `entries` (synced when `must_sync`
/// is set) before sending `messages`, then hands `committed_entries` to the
/// state machine and calls RawNode::Advance.
struct Ready {
  std::optional<SoftState> soft_state;
  std::optional<HardState> hard_state;
  Snapshot snapshot;
  std::vector<Entry> entries;
  std::vector<Entry> committed_entries;
  std::vector<Message> messages;
  bool must_sync{false};
};

struct Status {
  uint64_t id{kNone};
  HardState hard_state;
  SoftState soft_state;
  uint64_t applied{0};
  uint64_t lead_transferee{kNone};
  // Replication progress of each member, only filled on the leader.
  std::map<uint64_t, Progress> progress;
};

/// Thread unsafe wrapper around the consensus core which batches its output
/// into Ready structs. Applying committed entries is decoupled from the
/// persistence cycle: Advance only marks entries as handed out, AdvanceApply
/// reports what the state machine actually applied.
class RawNode {
 public:
  RawNode(const Config &config, Storage *storage);

  void Tick() { raft_.Tick(); }
  void Campaign() { raft_.Campaign(); }
  utils::BasicResult<ProposeError> Propose(std::string data) { return raft_.Propose(std::move(data)); }
  utils::BasicResult<ProposeError> ProposeConfChange(const ConfChange &conf_change) {
    return raft_.ProposeConfChange(conf_change);
  }
  ConfState ApplyConfChange(const ConfChange &conf_change) { return raft_.ApplyConfChange(conf_change); }
  void Step(Message message) { raft_.Step(std::move(message)); }
  void TransferLeader(uint64_t transferee) { raft_.TransferLeader(transferee); }
  void ReportSnapshot(uint64_t id, bool failure) { raft_.ReportSnapshot(id, failure); }
  void ReportUnreachable(uint64_t id) { raft_.ReportUnreachable(id); }

  bool HasReady() const;

  /// Collects the pending output. Must be followed by Advance before the
  /// next call.
  Ready GetReady();

  void Advance(const Ready &ready);

  /// Reports that the state machine applied everything up to `applied`.
  void AdvanceApply(uint64_t applied) { raft_.AppliedTo(applied); }

  Status GetStatus() const;

  const Raft &raft() const { return raft_; }
  Raft &raft() { return raft_; }

 private:
  Raft raft_;
  SoftState prev_soft_state_;
  HardState prev_hard_state_;
};

}  // namespace rangekv::raft
