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

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "kvstore/kvstore.hpp"
#include "raft/storage.hpp"
#include "raftstore/message.hpp"
#include "raftstore/state.hpp"
#include "utils/thread_pool.hpp"

namespace rangekv::raftstore {

/**
 * raft::Storage backed by the raft column family of the node's store. Only
 * the owning peer touches it, except for snapshot generation which runs on
 * the snapshot pool against a point in time view of the store.
 *
 * Writes go into batches the peer commits itself, the in-memory state is
 * updated right away.
 */
class PeerStorage final : public raft::Storage {
 public:
  /// A replica without raft state is uninitialized, it waits for a snapshot.
  /// @throw kvstore::KVStoreIOError
  /// @throw slk::SlkDecodeException
  PeerStorage(kvstore::KVStore *engine, common::ShardLocalState local_state, utils::ThreadPool *snap_pool,
              std::string tag);

  raft::RaftState InitialState() const override;
  raft::StorageResult<std::vector<raft::Entry>> Entries(uint64_t low, uint64_t high,
                                                        uint64_t max_size) const override;
  raft::StorageResult<uint64_t> Term(uint64_t index) const override;
  uint64_t FirstIndex() const override { return apply_state_.truncated_index + 1; }
  uint64_t LastIndex() const override { return raft_state_.last_index; }

  /// Snapshots are built asynchronously on the snapshot pool. The first call
  /// starts the generation, later calls return it once it's done.
  raft::StorageResult<raft::Snapshot> GetSnapshot(uint64_t request_index) override;

  /// Adds `entries` to the log, dropping any conflicting suffix.
  void Append(const std::vector<raft::Entry> &entries, kvstore::WriteBatch *batch);

  void SetHardState(const raft::HardState &hard_state);

  void WriteRaftState(kvstore::WriteBatch *batch) const;

  /// Drops log entries up to `index`, which must be applied. The truncated
  /// state may already have been taken over from an apply result.
  void CompactTo(uint64_t index, uint64_t term, kvstore::WriteBatch *batch);

  /// Takes over the state written by a snapshot application.
  void OnSnapshotApplied(const SnapshotApplied &applied);

  void SetApplyState(const ApplyState &apply_state) { apply_state_ = apply_state; }
  void SetLocalState(common::ShardLocalState local_state) { local_state_ = std::move(local_state); }

  bool IsInitialized() const { return local_state_.meta.IsInitialized(); }
  const common::ShardMeta &meta() const { return local_state_.meta; }
  const common::ShardLocalState &local_state() const { return local_state_; }
  const RaftLocalState &raft_state() const { return raft_state_; }
  const ApplyState &apply_state() const { return apply_state_; }
  uint64_t applied_index() const { return apply_state_.applied_index; }
  uint64_t applied_term() const { return apply_state_.applied_term; }
  common::ShardId shard_id() const { return local_state_.meta.id; }

 private:
  struct SnapshotGeneration {
    enum class State : uint8_t { RUNNING, DONE, FAILED };

    std::mutex lock;
    State state{State::RUNNING};
    std::optional<raft::Snapshot> snapshot;
  };

  void StartSnapshotGeneration();

  kvstore::KVStore *engine_;
  common::ShardLocalState local_state_;
  RaftLocalState raft_state_;
  ApplyState apply_state_;
  utils::ThreadPool *snap_pool_;
  std::string tag_;
  /// Entries below it have been deleted from the store.
  uint64_t log_gc_index_{1};
  std::shared_ptr<SnapshotGeneration> generation_;
};

}  // namespace rangekv::raftstore
