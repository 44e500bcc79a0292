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


#include "raftstore/apply.hpp"

#include <algorithm>
#include <set>

#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

#include "common/keys.hpp"
#include "raft/confchange.hpp"
#include "raftstore/router.hpp"
#include "raftstore/snapshot.hpp"
#include "txn/actions.hpp"
#include "utils/logging.hpp"
#include "utils/variant_helpers.hpp"

namespace rangekv::raftstore {

namespace {

// A range request ends at the shard end at the latest.
std::string ClampEnd(const std::string &end_key, const ShardMeta &meta) {
  if (meta.end_key.empty()) return end_key;
  if (end_key.empty() || end_key > meta.end_key) return meta.end_key;
  return end_key;
}

bool IsAdjacent(const ShardMeta &lhs, const ShardMeta &rhs) {
  return (!lhs.end_key.empty() && lhs.end_key == rhs.start_key) ||
         (!rhs.end_key.empty() && rhs.end_key == lhs.start_key);
}

std::set<common::NodeId> PeerNodes(const ShardMeta &meta) {
  std::set<common::NodeId> nodes;
  for (const auto &peer : meta.peers) nodes.insert(peer.node_id);
  return nodes;
}

bool Contains(const std::vector<uint64_t> &ids, const uint64_t id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

}  // namespace

CommandResult ExecuteRead(const kvstore::KVStore &engine, const ShardMeta &meta, const Request &request) {
  try {
    return std::visit(
        utils::Overloaded{
            [&](const RawGetRequest &r) {
              return ResponseResult(
                  GetResponse{engine.Get(kvstore::ColumnFamily::DEFAULT, common::keys::DataKey(r.key))});
            },
            [&](const GetRequest &r) {
              txn::MvccReader reader(engine.GetSnapshot());
              auto value = txn::Get(reader, r.key, r.ts);
              if (value.HasError()) return CommandResult(std::move(value).GetError());
              return ResponseResult(GetResponse{std::move(*value)});
            },
            [&](const ScanRequest &r) {
              txn::MvccReader reader(engine.GetSnapshot());
              auto pairs = txn::Scan(reader, r.start_key, ClampEnd(r.end_key, meta), r.limit, r.ts);
              if (pairs.HasError()) return CommandResult(std::move(pairs).GetError());
              return ResponseResult(ScanResponse{std::move(*pairs)});
            },
            [&](const ScanLockRequest &r) {
              txn::MvccReader reader(engine.GetSnapshot());
              return ResponseResult(
                  ScanLockResponse{txn::ScanLock(reader, r.max_ts, r.start_key, ClampEnd(r.end_key, meta), r.limit)});
            },
            [&](const auto &) {
              return ErrorResult(common::InvalidRequest{fmt::format("{} isn't a read", RequestName(request))});
            },
        },
        request);
  } catch (const utils::BasicException &e) {
    spdlog::error("Read on shard {} failed: {}", meta.id, e.what());
    return ErrorResult(common::StorageIOError{e.what()});
  }
}

ApplyFsm::ApplyFsm(kvstore::KVStore *engine, Router *router, utils::Synchronized<StoreMeta> *store_meta,
                   utils::ThreadPool *snap_pool, common::ShardLocalState local_state, ApplyState apply_state,
                   std::string tag)
    : engine_(engine),
      router_(router),
      store_meta_(store_meta),
      snap_pool_(snap_pool),
      local_state_(std::move(local_state)),
      apply_state_(std::move(apply_state)),
      tag_(std::move(tag)) {}

void ApplyFsm::Handle(std::vector<ApplyMsg> &msgs) {
  for (auto &msg : msgs) HandleMsg(msg);
  ReportResults();
}

void ApplyFsm::FailPending(const common::Error &error) {
  for (auto &msg : stashed_) FailApplyMsg(&msg, error);
  stashed_.clear();
}

void ApplyFsm::HandleMsg(ApplyMsg &msg) {
  if (storage_error_) {
    FailApplyMsg(&msg, common::StorageIOError{fmt::format("{} stopped after a storage error", tag_)});
    return;
  }
  std::visit(utils::Overloaded{
                 [&](ApplyEntriesTask &task) {
                   if (wait_reason_ != WaitReason::NONE || !stashed_.empty()) {
                     stashed_.emplace_back(std::move(task));
                     return;
                   }
                   HandleEntries(std::move(task));
                 },
                 [&](ApplySnapshotTask &task) {
                   if (wait_reason_ != WaitReason::NONE || !stashed_.empty()) {
                     stashed_.emplace_back(std::move(task));
                     return;
                   }
                   HandleSnapshot(std::move(task));
                 },
                 [&](SnapshotDoneTask &task) { HandleSnapshotDone(std::move(task)); },
                 [&](ResumeMergeTask &) {
                   if (wait_reason_ != WaitReason::MERGE_SOURCE) return;
                   spdlog::info("{} resumes applying, merge source is ready", tag_);
                   wait_reason_ = WaitReason::NONE;
                   ResumeStashed();
                 },
             },
             msg);
}

void ApplyFsm::ResumeStashed() {
  while (wait_reason_ == WaitReason::NONE && !stashed_.empty() && !storage_error_) {
    auto msg = std::move(stashed_.front());
    stashed_.pop_front();
    std::visit(utils::Overloaded{
                   [&](ApplyEntriesTask &task) { HandleEntries(std::move(task)); },
                   [&](ApplySnapshotTask &task) { HandleSnapshot(std::move(task)); },
                   [&](auto &) {},
               },
               msg);
  }
  if (storage_error_) FailPending(common::StorageIOError{fmt::format("{} stopped after a storage error", tag_)});
}

void ApplyFsm::HandleEntries(ApplyEntriesTask task) {
  std::deque<Proposal> proposals;
  for (auto &proposal : task.proposals) proposals.push_back(std::move(proposal));

  for (size_t i = 0; i < task.entries.size(); ++i) {
    const auto &entry = task.entries[i];

    std::optional<Proposal> proposal;
    while (!proposals.empty() && proposals.front().index < entry.index) {
      proposals.front().promise.Fill(ErrorResult(common::ProposalDropped{proposals.front().term}));
      proposals.pop_front();
    }
    if (!proposals.empty() && proposals.front().index == entry.index) {
      if (proposals.front().term == entry.term) {
        proposal.emplace(std::move(proposals.front()));
      } else {
        // Another leader overwrote the entry.
        proposals.front().promise.Fill(ErrorResult(common::ProposalDropped{proposals.front().term}));
      }
      proposals.pop_front();
    }

    if (ApplyEntry(entry, &proposal)) continue;

    if (storage_error_) {
      for (auto &rest : proposals) {
        rest.promise.Fill(ErrorResult(common::StorageIOError{"Apply stopped after a storage error"}));
      }
      return;
    }

    // Waiting for a merge source, keep the rest for later.
    ApplyEntriesTask rest;
    rest.entries.assign(std::make_move_iterator(task.entries.begin() + static_cast<std::ptrdiff_t>(i)),
                        std::make_move_iterator(task.entries.end()));
    if (proposal) rest.proposals.push_back(std::move(*proposal));
    for (auto &pending : proposals) rest.proposals.push_back(std::move(pending));
    stashed_.emplace_front(std::move(rest));
    return;
  }

  for (auto &rest : proposals) {
    rest.promise.Fill(ErrorResult(common::ProposalDropped{rest.term}));
  }
}

bool ApplyFsm::ApplyEntry(const raft::Entry &entry, std::optional<Proposal> *proposal) {
  if (entry.index <= apply_state_.applied_index) {
    spdlog::debug("{} skips entry {} which is already applied", tag_, entry.index);
    if (*proposal) (*proposal)->promise.Fill(ErrorResult(common::ProposalDropped{entry.term}));
    return true;
  }

  kvstore::WriteBatch batch;
  std::optional<CommandResult> response;
  if (entry.data.empty()) {
    // Appended by a new leader, nothing to apply.
  } else if (entry.type == raft::EntryType::NORMAL) {
    RaftCommand command;
    bool decoded = true;
    try {
      slk::LoadFromString(entry.data, &command);
    } catch (const utils::BasicException &e) {
      spdlog::error("{} can't decode the command at index {}: {}", tag_, entry.index, e.what());
      response = ErrorResult(common::InvalidRequest{"Undecodable command"});
      decoded = false;
    }

    if (decoded) {
      if (const auto *merge = std::get_if<CommitMergeRequest>(&command.request)) {
        auto status = CheckMergeSource(*merge);
        if (status == MergeSourceStatus::NOT_READY) {
          store_meta_->WithLock([&](StoreMeta &meta) { meta.merge_waiters[merge->source.id] = shard_id(); });
          // The source may have become ready before the waiter was visible.
          status = CheckMergeSource(*merge);
          if (status == MergeSourceStatus::NOT_READY) {
            spdlog::info("{} waits for merge source {} to apply PrepareMerge at {}", tag_, merge->source.id,
                         merge->commit);
            wait_reason_ = WaitReason::MERGE_SOURCE;
            return false;
          }
          store_meta_->WithLock([&](StoreMeta &meta) { meta.merge_waiters.erase(merge->source.id); });
        }
        if (status == MergeSourceStatus::ALREADY_MERGED) {
          response = ErrorResult(common::InvalidRequest{fmt::format("Shard {} is already merged", merge->source.id)});
        } else if (status == MergeSourceStatus::ABORTED) {
          response = ErrorResult(
              common::InvalidRequest{fmt::format("Merge of shard {} has been rolled back", merge->source.id)});
        }
      }
      if (!response) response = ExecCommand(command, entry, proposal->has_value(), &batch);
    }
  } else {
    response = ExecConfChange(entry, &batch);
  }

  apply_state_.applied_index = entry.index;
  apply_state_.applied_term = entry.term;
  WriteApplyState(&batch, shard_id(), apply_state_);
  if (!engine_->Write(batch)) {
    spdlog::critical("{} failed to write the effects of entry {}", tag_, entry.index);
    storage_error_ = true;
    if (*proposal) {
      (*proposal)->promise.Fill(ErrorResult(common::StorageIOError{"Failed to apply the command"}));
    }
    return false;
  }
  applied_any_ = true;

  if (local_state_.state == common::PeerState::MERGING) NotifyMergeWaiter();

  if (*proposal) {
    (*proposal)->promise.Fill(response ? std::move(*response) : ResponseResult(EmptyResponse{}));
  }
  return true;
}

CommandResult ApplyFsm::ExecCommand(const RaftCommand &command, const raft::Entry &entry, const bool has_proposal,
                                    kvstore::WriteBatch *batch) {
  const auto &request = command.request;
  const auto &meta = local_state_.meta;

  // Only the replica which proposed a read answers it.
  if (IsReadOnly(request) && !has_proposal) return ResponseResult(EmptyResponse{});

  if (command.header.shard_id != meta.id) return ErrorResult(common::ShardNotFound{command.header.shard_id});
  if (ChecksVersion(request) && command.header.epoch.version != meta.epoch.version) {
    return ErrorResult(common::StaleEpoch{{meta}});
  }
  if (local_state_.state == common::PeerState::MERGING && !IsReadOnly(request) &&
      !std::holds_alternative<RollbackMergeRequest>(request) && !std::holds_alternative<CompactLogRequest>(request)) {
    return ErrorResult(common::ShardMerging{meta.id});
  }
  if (auto error = CheckKeysInShard(request, meta)) return common::Error{std::move(*error)};

  if (IsReadOnly(request)) return ExecuteRead(*engine_, meta, request);

  return std::visit(utils::Overloaded{
                        [&](const SplitRequest &r) { return ExecSplit(r, batch); },
                        [&](const PrepareMergeRequest &r) { return ExecPrepareMerge(r, entry, batch); },
                        [&](const CommitMergeRequest &r) { return ExecCommitMerge(r, batch); },
                        [&](const RollbackMergeRequest &r) { return ExecRollbackMerge(r, batch); },
                        [&](const CompactLogRequest &r) { return ExecCompactLog(r, entry); },
                        [&](const auto &) { return ExecWrite(request, batch); },
                    },
                    request);
}

CommandResult ApplyFsm::ExecWrite(const Request &request, kvstore::WriteBatch *batch) {
  const auto &meta = local_state_.meta;
  try {
    return std::visit(
        utils::Overloaded{
            [&](const RawPutRequest &r) {
              batch->Put(kvstore::ColumnFamily::DEFAULT, common::keys::DataKey(r.key), r.value);
              return ResponseResult(EmptyResponse{});
            },
            [&](const RawDeleteRequest &r) {
              batch->Delete(kvstore::ColumnFamily::DEFAULT, common::keys::DataKey(r.key));
              return ResponseResult(EmptyResponse{});
            },
            [&](const PrewriteRequest &r) {
              txn::MvccReader reader(engine_->GetSnapshot());
              txn::MvccTxn txn;
              auto errors = txn::Prewrite(reader, &txn, r.mutations, r.primary, r.start_ts, r.lock_ttl);
              if (errors.empty()) batch->Append(txn.batch());
              return ResponseResult(PrewriteResponse{std::move(errors)});
            },
            [&](const CommitRequest &r) {
              txn::MvccReader reader(engine_->GetSnapshot());
              txn::MvccTxn txn;
              auto result = txn::Commit(reader, &txn, r.keys, r.start_ts, r.commit_ts);
              if (result.HasError()) return CommandResult(std::move(result).GetError());
              batch->Append(txn.batch());
              return ResponseResult(EmptyResponse{});
            },
            [&](const RollbackRequest &r) {
              txn::MvccReader reader(engine_->GetSnapshot());
              txn::MvccTxn txn;
              auto result = txn::Rollback(reader, &txn, r.keys, r.start_ts);
              if (result.HasError()) return CommandResult(std::move(result).GetError());
              batch->Append(txn.batch());
              return ResponseResult(EmptyResponse{});
            },
            [&](const CheckTxnStatusRequest &r) {
              txn::MvccReader reader(engine_->GetSnapshot());
              txn::MvccTxn txn;
              auto status = txn::CheckTxnStatus(reader, &txn, r.primary, r.lock_ts, r.current_ts);
              if (status.HasError()) return CommandResult(std::move(status).GetError());
              batch->Append(txn.batch());
              return ResponseResult(CheckTxnStatusResponse{*status});
            },
            [&](const ResolveLockRequest &r) {
              txn::MvccReader reader(engine_->GetSnapshot());
              txn::MvccTxn txn;
              auto result = txn::ResolveLock(reader, &txn, r.start_ts, r.commit_ts, r.keys, meta.start_key,
                                             meta.end_key);
              if (result.HasError()) return CommandResult(std::move(result).GetError());
              batch->Append(txn.batch());
              return ResponseResult(EmptyResponse{});
            },
            [&](const GcRequest &r) {
              txn::MvccReader reader(engine_->GetSnapshot());
              txn::MvccTxn txn;
              const auto removed = txn::Gc(reader, &txn, r.safe_point, meta.start_key, meta.end_key);
              batch->Append(txn.batch());
              if (removed > 0) spdlog::debug("{} GC at {} removed {} versions", tag_, r.safe_point, removed);
              return ResponseResult(GcResponse{removed});
            },
            [&](const auto &) {
              return ErrorResult(common::InvalidRequest{fmt::format("{} isn't a write", RequestName(request))});
            },
        },
        request);
  } catch (const utils::BasicException &e) {
    spdlog::error("{} failed to execute {}: {}", tag_, RequestName(request), e.what());
    return ErrorResult(common::StorageIOError{e.what()});
  }
}

CommandResult ApplyFsm::ExecConfChange(const raft::Entry &entry, kvstore::WriteBatch *batch) {
  raft::ConfChange conf_change;
  ConfChangeContext context;
  try {
    slk::LoadFromString(entry.data, &conf_change);
    if (!conf_change.context.empty()) slk::LoadFromString(conf_change.context, &context);
  } catch (const utils::BasicException &e) {
    spdlog::error("{} can't decode the conf change at index {}: {}", tag_, entry.index, e.what());
    return ErrorResult(common::InvalidRequest{"Undecodable conf change"});
  }

  auto &meta = local_state_.meta;
  // Leaving a joint configuration is proposed by the consensus core itself
  // and carries no context.
  if (!conf_change.LeaveJoint() && context.header.epoch.conf_version != meta.epoch.conf_version) {
    spdlog::info("{} rejects conf change at {} built for conf version {}, current {}", tag_, entry.index,
                 context.header.epoch.conf_version, meta.epoch.conf_version);
    return ErrorResult(common::StaleEpoch{{meta}});
  }

  auto next = raft::NextConfState(apply_state_.conf_state, conf_change);
  if (next.HasError()) {
    spdlog::warn("{} rejects conf change at {}: {}", tag_, entry.index, next.GetError());
    return ErrorResult(common::InvalidRequest{next.GetError()});
  }
  apply_state_.conf_state = std::move(*next);
  const auto &conf_state = apply_state_.conf_state;

  auto is_member = [&](const uint64_t id) {
    return Contains(conf_state.voters, id) || Contains(conf_state.voters_outgoing, id) ||
           Contains(conf_state.learners, id) || Contains(conf_state.learners_next, id);
  };
  auto role_of = [&](const uint64_t id) {
    return Contains(conf_state.voters, id) || Contains(conf_state.voters_outgoing, id) ? common::PeerRole::VOTER
                                                                                       : common::PeerRole::LEARNER;
  };

  std::vector<PeerMeta> peers;
  for (const auto &peer : meta.peers) {
    if (is_member(peer.id)) peers.push_back(PeerMeta{.id = peer.id, .node_id = peer.node_id, .role = role_of(peer.id)});
  }
  for (const auto &change : context.changes) {
    const auto known = std::any_of(peers.begin(), peers.end(), [&](const auto &p) { return p.id == change.peer.id; });
    if (!known && is_member(change.peer.id)) {
      peers.push_back(
          PeerMeta{.id = change.peer.id, .node_id = change.peer.node_id, .role = role_of(change.peer.id)});
    }
  }
  meta.peers = std::move(peers);
  ++meta.epoch.conf_version;
  WriteShardState(batch, local_state_);

  spdlog::info("{} applied conf change at {}, now {}", tag_, entry.index, fmt::streamed(meta));
  results_.push_back(raftstore::ExecConfChange{.conf_change = std::move(conf_change), .meta = meta});
  return ResponseResult(ChangePeerResponse{meta});
}

CommandResult ApplyFsm::ExecSplit(const SplitRequest &request, kvstore::WriteBatch *batch) {
  auto &meta = local_state_.meta;
  if (request.new_peer_ids.size() != meta.peers.size()) {
    return ErrorResult(common::InvalidRequest{
        fmt::format("Split of shard {} got {} peer ids for {} peers", meta.id, request.new_peer_ids.size(),
                    meta.peers.size())});
  }

  ShardMeta left = meta;
  ShardMeta right = meta;
  ++left.epoch.version;
  left.end_key = request.split_key;
  right.id = request.new_shard_id;
  right.start_key = request.split_key;
  right.epoch = left.epoch;
  for (size_t i = 0; i < right.peers.size(); ++i) right.peers[i].id = request.new_peer_ids[i];

  local_state_.meta = left;
  WriteShardState(batch, local_state_);

  // A replica of the new shard which already received a snapshot, or has
  // been removed since, must not be reset.
  const auto existing = LoadShardState(*engine_, right.id);
  if (existing && (existing->meta.IsInitialized() || existing->state == common::PeerState::TOMBSTONE)) {
    spdlog::info("{} keeps the existing state of split shard {}", tag_, right.id);
  } else {
    WriteInitialState(batch, right);
  }

  spdlog::info("{} split at {} into shards {} and {}", tag_, logging::Escape(request.split_key), left.id, right.id);
  results_.push_back(raftstore::ExecSplit{.left = left, .right = right});
  return ResponseResult(SplitResponse{.left = std::move(left), .right = std::move(right)});
}

CommandResult ApplyFsm::ExecPrepareMerge(const PrepareMergeRequest &request, const raft::Entry &entry,
                                         kvstore::WriteBatch *batch) {
  auto &meta = local_state_.meta;
  const auto &target = request.target;
  if (local_state_.state != common::PeerState::NORMAL) {
    return ErrorResult(common::InvalidRequest{fmt::format("Shard {} is already merging", meta.id)});
  }
  if (!IsAdjacent(meta, target)) {
    return ErrorResult(common::InvalidRequest{fmt::format("Shards {} and {} aren't adjacent", meta.id, target.id)});
  }
  if (PeerNodes(meta) != PeerNodes(target)) {
    return ErrorResult(
        common::InvalidRequest{fmt::format("Shards {} and {} aren't on the same nodes", meta.id, target.id)});
  }

  ++meta.epoch.version;
  ++meta.epoch.conf_version;
  local_state_.state = common::PeerState::MERGING;
  local_state_.merge_state = common::MergeState{.commit = entry.index, .target = target};
  WriteShardState(batch, local_state_);

  spdlog::info("{} prepared merge into shard {} at index {}", tag_, target.id, entry.index);
  results_.push_back(raftstore::ExecPrepareMerge{.state = local_state_});
  return ResponseResult(EmptyResponse{});
}

ApplyFsm::MergeSourceStatus ApplyFsm::CheckMergeSource(const CommitMergeRequest &request) const {
  const auto source = LoadShardState(*engine_, request.source.id);
  if (!source) return MergeSourceStatus::NOT_READY;
  if (source->state == common::PeerState::TOMBSTONE) return MergeSourceStatus::ALREADY_MERGED;
  if (source->state == common::PeerState::MERGING && source->merge_state &&
      source->merge_state->commit == request.commit) {
    return MergeSourceStatus::READY;
  }
  if (source->meta.epoch.version > request.source.epoch.version) return MergeSourceStatus::ABORTED;
  return MergeSourceStatus::NOT_READY;
}

CommandResult ApplyFsm::ExecCommitMerge(const CommitMergeRequest &request, kvstore::WriteBatch *batch) {
  auto &meta = local_state_.meta;
  const auto source_state = LoadShardState(*engine_, request.source.id);
  RKV_ASSERT(source_state && source_state->merge_state, "{} commits merge of {} which isn't merging", tag_,
             request.source.id);
  const auto &source = source_state->meta;

  if (source_state->merge_state->target.epoch != meta.epoch) {
    return ErrorResult(common::InvalidRequest{
        fmt::format("Shard {} changed since shard {} prepared the merge", meta.id, source.id)});
  }
  if (source.end_key == meta.start_key && !source.end_key.empty()) {
    meta.start_key = source.start_key;
  } else if (source.start_key == meta.end_key && !meta.end_key.empty()) {
    meta.end_key = source.end_key;
  } else {
    return ErrorResult(common::InvalidRequest{fmt::format("Shards {} and {} aren't adjacent", meta.id, source.id)});
  }
  meta.epoch.version = std::max(meta.epoch.version, source.epoch.version) + 1;

  WriteShardState(batch, local_state_);
  WriteShardState(batch, common::ShardLocalState{.state = common::PeerState::TOMBSTONE, .meta = source});

  spdlog::info("{} merged shard {}, now [{}, {})", tag_, source.id, logging::Escape(meta.start_key),
               logging::Escape(meta.end_key));
  results_.push_back(raftstore::ExecCommitMerge{.meta = meta, .source = source});
  return ResponseResult(EmptyResponse{});
}

CommandResult ApplyFsm::ExecRollbackMerge(const RollbackMergeRequest &request, kvstore::WriteBatch *batch) {
  if (local_state_.state != common::PeerState::MERGING || !local_state_.merge_state ||
      local_state_.merge_state->commit != request.commit) {
    return ErrorResult(common::InvalidRequest{fmt::format("Shard {} has no merge at {} to roll back",
                                                          local_state_.meta.id, request.commit)});
  }
  local_state_.state = common::PeerState::NORMAL;
  local_state_.merge_state.reset();
  ++local_state_.meta.epoch.version;
  WriteShardState(batch, local_state_);

  spdlog::info("{} rolled back the merge prepared at {}", tag_, request.commit);
  results_.push_back(raftstore::ExecRollbackMerge{.meta = local_state_.meta});
  return ResponseResult(EmptyResponse{});
}

CommandResult ApplyFsm::ExecCompactLog(const CompactLogRequest &request, const raft::Entry &entry) {
  if (request.compact_index <= apply_state_.truncated_index) return ResponseResult(EmptyResponse{});
  if (request.compact_index >= entry.index) {
    return ErrorResult(common::InvalidRequest{
        fmt::format("Can't compact up to {} before applying it", request.compact_index)});
  }
  apply_state_.truncated_index = request.compact_index;
  apply_state_.truncated_term = request.compact_term;
  results_.push_back(
      raftstore::ExecCompactLog{.truncated_index = request.compact_index, .truncated_term = request.compact_term});
  return ResponseResult(EmptyResponse{});
}

void ApplyFsm::NotifyMergeWaiter() {
  auto target = store_meta_->WithLock([&](StoreMeta &meta) -> std::optional<ShardId> {
    const auto it = meta.merge_waiters.find(shard_id());
    if (it == meta.merge_waiters.end()) return std::nullopt;
    const auto target_id = it->second;
    meta.merge_waiters.erase(it);
    return target_id;
  });
  if (target) router_->SendApply(*target, ResumeMergeTask{});
}

void ApplyFsm::HandleSnapshot(ApplySnapshotTask task) {
  wait_reason_ = WaitReason::SNAPSHOT;
  spdlog::info("{} applies snapshot at index {} term {}", tag_, task.snapshot.metadata.index,
               task.snapshot.metadata.term);

  auto job = [engine = engine_, router = router_, shard_id = shard_id(), tag = tag_, task = std::move(task)] {
    SnapshotDoneTask done;
    auto data = DecodeSnapshot(task.snapshot, shard_id);
    if (data.HasError()) {
      spdlog::warn("{} rejects snapshot: {}", tag, data.GetError().message);
      done.result.error = data.GetError().message;
    } else {
      kvstore::WriteBatch batch;
      done.result = ApplySnapshotToBatch(*data, task.snapshot, task.hard_state, &batch);
      if (!engine->Write(batch, true)) {
        spdlog::critical("{} failed to write snapshot at index {}", tag, data->index);
        done.result.success = false;
        done.result.error = "Failed to write the snapshot";
      }
    }
    router->SendApply(shard_id, std::move(done));
  };

  if (!snap_pool_->AddTask(std::move(job))) {
    SnapshotDoneTask done;
    done.result.error = "Snapshot pool is stopped";
    HandleSnapshotDone(std::move(done));
  }
}

void ApplyFsm::HandleSnapshotDone(SnapshotDoneTask task) {
  wait_reason_ = WaitReason::NONE;
  if (task.result.success) {
    local_state_ = task.result.shard_state;
    apply_state_ = task.result.apply_state;
    spdlog::info("{} applied snapshot, shard is now {}", tag_, fmt::streamed(local_state_.meta));
  }
  router_->SendPeer(shard_id(), std::move(task.result), true);
  ResumeStashed();
}

void ApplyFsm::ReportResults() {
  if (!applied_any_ && results_.empty() && !storage_error_) return;
  if (storage_error_ && storage_error_reported_) return;
  storage_error_reported_ = storage_error_;
  router_->SendPeer(shard_id(),
                    ApplyResult{.apply_state = apply_state_, .results = std::move(results_), .storage_error = storage_error_},
                    true);
  results_.clear();
  applied_any_ = false;
}

}  // namespace rangekv::raftstore
