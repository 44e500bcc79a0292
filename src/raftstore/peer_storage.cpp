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


#include "raftstore/peer_storage.hpp"

#include <spdlog/spdlog.h>

#include "common/keys.hpp"
#include "raftstore/snapshot.hpp"
#include "utils/logging.hpp"

namespace rangekv::raftstore {

PeerStorage::PeerStorage(kvstore::KVStore *engine, common::ShardLocalState local_state,
                         utils::ThreadPool *snap_pool, std::string tag)
    : engine_(engine), local_state_(std::move(local_state)), snap_pool_(snap_pool), tag_(std::move(tag)) {
  if (!local_state_.meta.IsInitialized()) return;

  auto raft_state = LoadRaftState(*engine_, shard_id());
  auto apply_state = LoadApplyState(*engine_, shard_id());
  RKV_ASSERT(raft_state && apply_state, "{} is initialized but has no raft state", tag_);
  raft_state_ = std::move(*raft_state);
  apply_state_ = std::move(*apply_state);
  log_gc_index_ = apply_state_.truncated_index + 1;
  RKV_ASSERT(apply_state_.applied_index <= raft_state_.hard_state.commit,
             "{} applied index {} is ahead of commit index {}", tag_, apply_state_.applied_index,
             raft_state_.hard_state.commit);
  spdlog::debug("{} loaded raft state: term {}, commit {}, last index {}, applied {}, truncated {}", tag_,
                raft_state_.hard_state.term, raft_state_.hard_state.commit, raft_state_.last_index,
                apply_state_.applied_index, apply_state_.truncated_index);
}

raft::RaftState PeerStorage::InitialState() const {
  return raft::RaftState{.hard_state = raft_state_.hard_state, .conf_state = apply_state_.conf_state};
}

raft::StorageResult<std::vector<raft::Entry>> PeerStorage::Entries(const uint64_t low, const uint64_t high,
                                                                   const uint64_t max_size) const {
  if (low <= apply_state_.truncated_index) return raft::StorageError::COMPACTED;
  if (high > LastIndex() + 1) return raft::StorageError::UNAVAILABLE;

  std::vector<raft::Entry> entries;
  if (low >= high) return entries;

  uint64_t size = 0;
  uint64_t expected = low;
  auto it = engine_->NewIterator(kvstore::ColumnFamily::RAFT, common::keys::RaftLogKey(shard_id(), low),
                                 common::keys::RaftLogKey(shard_id(), high));
  for (it.SeekToFirst(); it.Valid(); it.Next()) {
    if (common::keys::RaftLogIndex(it.Key()) != expected) break;
    raft::Entry entry;
    slk::LoadFromString(it.Value(), &entry);
    size += entry.ByteSize();
    if (!entries.empty() && size > max_size) return entries;
    entries.push_back(std::move(entry));
    ++expected;
  }
  if (expected != high) {
    spdlog::error("{} log has a hole at index {}, asked for [{}, {})", tag_, expected, low, high);
    return raft::StorageError::UNAVAILABLE;
  }
  return entries;
}

raft::StorageResult<uint64_t> PeerStorage::Term(const uint64_t index) const {
  if (index == apply_state_.truncated_index) return apply_state_.truncated_term;
  if (index < apply_state_.truncated_index) return raft::StorageError::COMPACTED;
  if (index > LastIndex()) return raft::StorageError::UNAVAILABLE;
  auto value = engine_->Get(kvstore::ColumnFamily::RAFT, common::keys::RaftLogKey(shard_id(), index));
  if (!value) return raft::StorageError::UNAVAILABLE;
  raft::Entry entry;
  slk::LoadFromString(*value, &entry);
  return entry.term;
}

raft::StorageResult<raft::Snapshot> PeerStorage::GetSnapshot(const uint64_t request_index) {
  if (generation_) {
    std::unique_lock guard(generation_->lock);
    switch (generation_->state) {
      case SnapshotGeneration::State::RUNNING:
        return raft::StorageError::SNAPSHOT_TEMPORARILY_UNAVAILABLE;
      case SnapshotGeneration::State::DONE: {
        auto snapshot = std::move(*generation_->snapshot);
        guard.unlock();
        generation_.reset();
        if (snapshot.metadata.index >= apply_state_.truncated_index) return snapshot;
        spdlog::info("{} generated snapshot at {} is older than truncated index {}, regenerating", tag_,
                     snapshot.metadata.index, apply_state_.truncated_index);
        break;
      }
      case SnapshotGeneration::State::FAILED:
        guard.unlock();
        generation_.reset();
        break;
    }
  }

  spdlog::info("{} starts generating a snapshot requested at index {}", tag_, request_index);
  StartSnapshotGeneration();
  return raft::StorageError::SNAPSHOT_TEMPORARILY_UNAVAILABLE;
}

void PeerStorage::StartSnapshotGeneration() {
  generation_ = std::make_shared<SnapshotGeneration>();
  auto task = [generation = generation_, engine = engine_, shard_id = shard_id(), tag = tag_] {
    try {
      auto view = engine->GetSnapshot();
      auto snapshot = BuildSnapshot(*view, shard_id);
      std::lock_guard guard(generation->lock);
      generation->snapshot = std::move(snapshot);
      generation->state = SnapshotGeneration::State::DONE;
    } catch (const utils::BasicException &e) {
      spdlog::error("{} failed to generate a snapshot: {}", tag, e.what());
      std::lock_guard guard(generation->lock);
      generation->state = SnapshotGeneration::State::FAILED;
    }
  };
  if (!snap_pool_->AddTask(std::move(task))) {
    std::lock_guard guard(generation_->lock);
    generation_->state = SnapshotGeneration::State::FAILED;
  }
}

void PeerStorage::Append(const std::vector<raft::Entry> &entries, kvstore::WriteBatch *batch) {
  if (entries.empty()) return;
  const auto previous_last = raft_state_.last_index;
  for (const auto &entry : entries) {
    batch->Put(kvstore::ColumnFamily::RAFT, common::keys::RaftLogKey(shard_id(), entry.index),
               slk::SaveToString(entry));
  }
  const auto last = entries.back().index;
  if (last < previous_last) {
    // The conflicting suffix of the old log is gone.
    batch->DeleteRange(kvstore::ColumnFamily::RAFT, common::keys::RaftLogKey(shard_id(), last + 1),
                       common::keys::RaftLogKey(shard_id(), previous_last + 1));
  }
  raft_state_.last_index = last;
}

void PeerStorage::SetHardState(const raft::HardState &hard_state) { raft_state_.hard_state = hard_state; }

void PeerStorage::WriteRaftState(kvstore::WriteBatch *batch) const {
  raftstore::WriteRaftState(batch, shard_id(), raft_state_);
}

void PeerStorage::CompactTo(const uint64_t index, const uint64_t term, kvstore::WriteBatch *batch) {
  RKV_ASSERT(index <= apply_state_.applied_index, "{} compacts unapplied entries up to {}", tag_, index);
  if (index >= log_gc_index_) {
    batch->DeleteRange(kvstore::ColumnFamily::RAFT, common::keys::RaftLogKey(shard_id(), log_gc_index_),
                       common::keys::RaftLogKey(shard_id(), index + 1));
    log_gc_index_ = index + 1;
  }
  if (index > apply_state_.truncated_index) {
    apply_state_.truncated_index = index;
    apply_state_.truncated_term = term;
  }
  spdlog::debug("{} compacted log up to {}", tag_, index);
}

void PeerStorage::OnSnapshotApplied(const SnapshotApplied &applied) {
  local_state_ = applied.shard_state;
  raft_state_ = applied.raft_state;
  apply_state_ = applied.apply_state;
  log_gc_index_ = apply_state_.truncated_index + 1;
  generation_.reset();
}

}  // namespace rangekv::raftstore
