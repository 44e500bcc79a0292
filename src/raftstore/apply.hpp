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

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "kvstore/kvstore.hpp"
#include "raftstore/command.hpp"
#include "raftstore/message.hpp"
#include "raftstore/state.hpp"
#include "raftstore/store_meta.hpp"
#include "utils/synchronized.hpp"
#include "utils/thread_pool.hpp"

namespace rangekv::raftstore {

class Router;

/// Executes a read-only request against the latest applied state.
CommandResult ExecuteRead(const kvstore::KVStore &engine, const ShardMeta &meta, const Request &request);

/**
 * Applies the committed entries of one shard to the store, strictly in log
 * order. Each entry is applied with a single atomic batch which also records
 * the new applied index, so an entry at or below the applied index is never
 * applied twice.
 *
 * Runs on the apply pool, at most one batch of messages at a time.
 */
class ApplyFsm {
 public:
  ApplyFsm(kvstore::KVStore *engine, Router *router, utils::Synchronized<StoreMeta> *store_meta,
           utils::ThreadPool *snap_pool, common::ShardLocalState local_state, ApplyState apply_state,
           std::string tag);

  void Handle(std::vector<ApplyMsg> &msgs);

  /// Fails the proposals of every message the state machine kept for later.
  void FailPending(const common::Error &error);

  common::ShardId shard_id() const { return local_state_.meta.id; }

 private:
  enum class WaitReason : uint8_t { NONE, SNAPSHOT, MERGE_SOURCE };

  enum class MergeSourceStatus : uint8_t { READY, NOT_READY, ALREADY_MERGED, ABORTED };

  void HandleMsg(ApplyMsg &msg);
  void HandleEntries(ApplyEntriesTask task);
  void HandleSnapshot(ApplySnapshotTask task);
  void HandleSnapshotDone(SnapshotDoneTask task);
  void ResumeStashed();

  /// Returns false when the entry couldn't be applied yet or the store
  /// failed, in which case the rest of the task is not applied either.
  bool ApplyEntry(const raft::Entry &entry, std::optional<Proposal> *proposal);

  CommandResult ExecCommand(const RaftCommand &command, const raft::Entry &entry, bool has_proposal,
                            kvstore::WriteBatch *batch);
  CommandResult ExecConfChange(const raft::Entry &entry, kvstore::WriteBatch *batch);
  CommandResult ExecSplit(const SplitRequest &request, kvstore::WriteBatch *batch);
  CommandResult ExecPrepareMerge(const PrepareMergeRequest &request, const raft::Entry &entry,
                                 kvstore::WriteBatch *batch);
  CommandResult ExecCommitMerge(const CommitMergeRequest &request, kvstore::WriteBatch *batch);
  CommandResult ExecRollbackMerge(const RollbackMergeRequest &request, kvstore::WriteBatch *batch);
  CommandResult ExecCompactLog(const CompactLogRequest &request, const raft::Entry &entry);
  CommandResult ExecWrite(const Request &request, kvstore::WriteBatch *batch);

  MergeSourceStatus CheckMergeSource(const CommitMergeRequest &request) const;

  /// Wakes up a target shard waiting for this shard to reach MERGING state.
  void NotifyMergeWaiter();

  void ReportResults();

  kvstore::KVStore *engine_;
  Router *router_;
  utils::Synchronized<StoreMeta> *store_meta_;
  utils::ThreadPool *snap_pool_;
  common::ShardLocalState local_state_;
  ApplyState apply_state_;
  std::string tag_;

  WaitReason wait_reason_{WaitReason::NONE};
  /// Messages received while waiting, in arrival order.
  std::deque<ApplyMsg> stashed_;
  std::vector<ExecResult> results_;
  bool applied_any_{false};
  bool storage_error_{false};
  bool storage_error_reported_{false};
};

}  // namespace rangekv::raftstore
