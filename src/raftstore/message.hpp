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


/// @file
///
/// Messages exchanged between nodes and between the state machines of a
/// shard on one node.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/types.hpp"
#include "io/future.hpp"
#include "placement/client.hpp"
#include "raft/messages.hpp"
#include "raftstore/command.hpp"
#include "raftstore/state.hpp"

namespace rangekv::raftstore {

/// Envelope of a consensus message sent to another node. Besides the raft
/// message it carries enough of the sender's view of the shard for the
/// receiver to create a missing replica or detect a stale one.
struct RaftMessage {
  ShardId shard_id{common::kInvalidId};
  PeerMeta from_peer;
  PeerMeta to_peer;
  ShardEpoch epoch;
  std::string start_key;
  std::string end_key;
  /// The receiver has been removed from the shard and should destroy itself.
  bool is_tombstone{false};
  /// The receiver refused the snapshot carried by the previous message.
  bool snapshot_rejected{false};
  /// Asks the target shard's leader to propose CommitMerge. Such envelopes
  /// carry no raft message.
  std::optional<CommitMergeRequest> commit_merge;
  raft::Message message;
};

/// Part of an InstallSnapshot envelope whose payload is sent in pieces.
struct SnapshotChunk {
  ShardId shard_id{common::kInvalidId};
  PeerId to_peer_id{common::kInvalidId};
  uint64_t snapshot_index{0};
  uint64_t snapshot_term{0};
  uint32_t seq{0};
  uint32_t total{0};
  std::string data;
  /// Envelope with an empty snapshot payload, carried by the first chunk.
  std::optional<RaftMessage> header;
};

/// A command waiting for its log entry to be applied.
struct Proposal {
  uint64_t index{0};
  uint64_t term{0};
  bool is_conf_change{false};
  /// Tick count of the peer at proposal time.
  uint64_t propose_tick{0};
  io::Promise<CommandResult> promise;
};

struct RaftCommandMsg {
  RaftCommand command;
  io::Promise<CommandResult> promise;
};

struct ChangePeerMsg {
  CommandHeader header;
  std::vector<ChangePeerRequest> changes;
  io::Promise<CommandResult> promise;
};

struct TransferLeaderMsg {
  PeerId peer_id{common::kInvalidId};
};

struct TickMsg {};

struct CampaignMsg {};

struct ShardDetailMsg {
  io::Promise<CommandResult> promise;
};

struct ExecConfChange {
  raft::ConfChange conf_change;
  ShardMeta meta;
};

struct ExecSplit {
  ShardMeta left;
  ShardMeta right;
};

struct ExecPrepareMerge {
  common::ShardLocalState state;
};

struct ExecCommitMerge {
  ShardMeta meta;
  ShardMeta source;
};

struct ExecRollbackMerge {
  ShardMeta meta;
};

struct ExecCompactLog {
  uint64_t truncated_index{0};
  uint64_t truncated_term{0};
};

/// Side effects of admin commands the peer has to follow up on.
using ExecResult =
    std::variant<ExecConfChange, ExecSplit, ExecPrepareMerge, ExecCommitMerge, ExecRollbackMerge, ExecCompactLog>;

struct ApplyResult {
  ApplyState apply_state;
  std::vector<ExecResult> results;
  /// A write failed, the apply state machine stopped.
  bool storage_error{false};
};

struct SnapshotApplied {
  bool success{false};
  std::string error;
  common::ShardLocalState shard_state;
  ApplyState apply_state;
  RaftLocalState raft_state;
};

struct SplitCheckResult {
  ShardEpoch epoch;
  uint64_t approximate_size{0};
  /// Set when the shard is over the split threshold.
  std::optional<std::string> split_key;
};

/// Split directive, from placement or an operator.
struct SplitShardMsg {
  /// The middle key is looked up when empty.
  std::string split_key;
  std::optional<io::Promise<CommandResult>> promise;
};

/// Ids for the new shard handed out by placement. An invalid shard id
/// means placement couldn't be reached.
struct SplitIdsAllocated {
  std::string split_key;
  ShardEpoch epoch;
  placement::AskSplitResponse ids;
};

struct MergeShardMsg {
  ShardId target_id{common::kInvalidId};
  std::optional<io::Promise<CommandResult>> promise;
};

struct PlacementOperatorMsg {
  placement::ShardOperator op;
};

/// Stops the peer. Its data range is removed as well when the peer has been
/// removed from the shard, but not when the shard was merged away.
struct DestroyMsg {
  bool remove_data{false};
};

using PeerMsg = std::variant<RaftMessage, RaftCommandMsg, ChangePeerMsg, TransferLeaderMsg, TickMsg, CampaignMsg,
                             ShardDetailMsg, ApplyResult, SnapshotApplied, SplitCheckResult, SplitShardMsg,
                             SplitIdsAllocated, MergeShardMsg, PlacementOperatorMsg, DestroyMsg>;

/// Committed entries in log order, with the proposals waiting for them.
struct ApplyEntriesTask {
  std::vector<raft::Entry> entries;
  std::vector<Proposal> proposals;
};

struct ApplySnapshotTask {
  raft::Snapshot snapshot;
  raft::HardState hard_state;
};

/// Result of a snapshot application run on the snapshot pool.
struct SnapshotDoneTask {
  SnapshotApplied result;
};

/// A merge source this shard is waiting on has reached MERGING state.
struct ResumeMergeTask {};

using ApplyMsg = std::variant<ApplyEntriesTask, ApplySnapshotTask, SnapshotDoneTask, ResumeMergeTask>;

/// Fails every promise carried by the message.
void FailPeerMsg(PeerMsg *msg, const common::Error &error);
void FailApplyMsg(ApplyMsg *msg, const common::Error &error);

std::string_view PeerMsgName(const PeerMsg &msg);

using slk::Load;
using slk::Save;

void Save(const RaftMessage &obj, slk::Builder *builder);
void Load(RaftMessage *obj, slk::Reader *reader);
void Save(const SnapshotChunk &obj, slk::Builder *builder);
void Load(SnapshotChunk *obj, slk::Reader *reader);

}  // namespace rangekv::raftstore
