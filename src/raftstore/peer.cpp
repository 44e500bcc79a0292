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


#include "raftstore/peer.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

#include "raftstore/apply.hpp"
#include "raftstore/snapshot.hpp"
#include "raftstore/split_checker.hpp"
#include "utils/logging.hpp"
#include "utils/variant_helpers.hpp"

namespace rangekv::raftstore {

namespace {

void FillIfAny(std::optional<io::Promise<CommandResult>> *promise, CommandResult result) {
  if (*promise && !(*promise)->IsFilled()) (*promise)->Fill(std::move(result));
  promise->reset();
}

raft::ConfChangeType ToConfChangeType(const placement::ChangePeerType type) {
  switch (type) {
    case placement::ChangePeerType::ADD_VOTER:
      return raft::ConfChangeType::ADD_NODE;
    case placement::ChangePeerType::ADD_LEARNER:
      return raft::ConfChangeType::ADD_LEARNER_NODE;
    case placement::ChangePeerType::REMOVE:
      return raft::ConfChangeType::REMOVE_NODE;
  }
  LOG_FATAL("Unknown peer change type {}", static_cast<int>(type));
}

// Whether `outer` covers the whole range of `inner`.
bool Covers(const ShardMeta &outer, const ShardMeta &inner) {
  if (outer.start_key > inner.start_key) return false;
  if (outer.end_key.empty()) return true;
  return !inner.end_key.empty() && inner.end_key <= outer.end_key;
}

}  // namespace

PeerFsm::PeerFsm(StoreContext *ctx, PeerMeta self, std::unique_ptr<PeerStorage> storage)
    : ctx_(ctx),
      self_(self),
      storage_(std::move(storage)),
      tag_(fmt::format("[shard {}] peer {}:", storage_->shard_id(), self_.id)) {
  for (const auto &peer : storage_->meta().peers) peer_cache_[peer.id] = peer;
  RecreateRawNode();
}

void PeerFsm::RecreateRawNode() {
  const auto &cfg = ctx_->config;
  raft::Config config;
  config.id = self_.id;
  config.election_tick = cfg.raft_election_timeout_ticks;
  config.heartbeat_tick = cfg.raft_heartbeat_ticks;
  config.applied = storage_->applied_index();
  config.max_size_per_msg = cfg.raft_max_size_per_msg;
  config.max_inflight_msgs = cfg.raft_max_inflight_msgs;
  config.tag = tag_;
  config.Validate();
  raw_node_ = std::make_unique<raft::RawNode>(config, storage_.get());
}

void PeerFsm::Handle(std::vector<PeerMsg> &msgs) {
  for (auto &msg : msgs) {
    if (destroying_) {
      FailPeerMsg(&msg, common::ShardNotFound{shard_id()});
      continue;
    }
    try {
      HandleMsg(msg);
    } catch (const utils::BasicException &e) {
      spdlog::critical("{} failed to handle {}: {}", tag_, PeerMsgName(msg), e.what());
      FailPeerMsg(&msg, common::StorageIOError{e.what()});
      MarkUnhealthy();
    }
  }
  if (destroying_) return;
  try {
    HandleReady();
  } catch (const utils::BasicException &e) {
    spdlog::critical("{} failed to handle the consensus output: {}", tag_, e.what());
    MarkUnhealthy();
  }
}

void PeerFsm::FailPending(const common::Error &error) {
  for (auto &proposal : proposals_) proposal.promise.Fill(error);
  proposals_.clear();
  FillIfAny(&split_promise_, error);
}

void PeerFsm::HandleMsg(PeerMsg &msg) {
  std::visit(utils::Overloaded{
                 [&](RaftMessage &m) { OnRaftMessage(std::move(m)); },
                 [&](RaftCommandMsg &m) { Propose(std::move(m.command), std::move(m.promise)); },
                 [&](ChangePeerMsg &m) { ProposeConfChange(m.header, std::move(m.changes), std::move(m.promise)); },
                 [&](TransferLeaderMsg &m) {
                   if (IsLeader() && m.peer_id != self_.id) raw_node_->TransferLeader(m.peer_id);
                 },
                 [&](TickMsg &) { OnTick(); },
                 [&](CampaignMsg &) {
                   if (storage_->IsInitialized()) raw_node_->Campaign();
                 },
                 [&](ShardDetailMsg &m) { OnShardDetail(std::move(m)); },
                 [&](ApplyResult &m) { OnApplyResult(std::move(m)); },
                 [&](SnapshotApplied &m) { OnSnapshotApplied(std::move(m)); },
                 [&](SplitCheckResult &m) { OnSplitCheckResult(m); },
                 [&](SplitShardMsg &m) { OnSplitShard(std::move(m)); },
                 [&](SplitIdsAllocated &m) { OnSplitIdsAllocated(std::move(m)); },
                 [&](MergeShardMsg &m) { OnMergeShard(std::move(m)); },
                 [&](PlacementOperatorMsg &m) { OnPlacementOperator(m.op); },
                 [&](DestroyMsg &m) { Destroy(m.remove_data); },
             },
             msg);
}

std::optional<PeerMeta> PeerFsm::FindPeer(const PeerId peer_id) const {
  if (auto peer = storage_->meta().FindPeer(peer_id)) return peer;
  if (const auto it = peer_cache_.find(peer_id); it != peer_cache_.end()) return it->second;
  return std::nullopt;
}

common::Error PeerFsm::NotLeaderError() const {
  const auto leader_id = raw_node_->raft().leader_id();
  std::optional<PeerMeta> leader;
  if (leader_id != raft::kNone) leader = FindPeer(leader_id);
  return common::NotLeader{.shard_id = shard_id(), .leader = std::move(leader)};
}

bool PeerFsm::IsBusy() const {
  const auto committed = raw_node_->raft().raft_log().committed();
  return proposals_.size() >= ctx_->config.max_pending_proposals ||
         committed > storage_->applied_index() + ctx_->config.max_pending_apply;
}

void PeerFsm::OnRaftMessage(RaftMessage msg) {
  const auto &meta = storage_->meta();

  if (msg.is_tombstone) {
    if (!storage_->IsInitialized() || meta.epoch.conf_version < msg.epoch.conf_version) {
      spdlog::info("{} has been removed from the shard as of {}, destroying", tag_, fmt::streamed(msg.epoch));
      Destroy(true);
    }
    return;
  }
  if (msg.snapshot_rejected) {
    spdlog::info("{} snapshot rejected by peer {}", tag_, msg.from_peer.id);
    raw_node_->ReportSnapshot(msg.from_peer.id, true);
    return;
  }
  if (msg.commit_merge) {
    OnCommitMergeRequest(*msg.commit_merge);
    return;
  }
  if (msg.to_peer.id != self_.id) {
    spdlog::debug("{} drops message for peer {}", tag_, msg.to_peer.id);
    return;
  }

  // A peer which was removed from the shard keeps campaigning until it
  // learns about its removal.
  if (storage_->IsInitialized() && !meta.FindPeer(msg.from_peer.id) && IsEpochStale(msg.epoch, meta.epoch)) {
    spdlog::info("{} tells stale peer {} that it has been removed", tag_, msg.from_peer.id);
    SendToPeer(msg.from_peer, raft::Message{}, true);
    return;
  }
  peer_cache_[msg.from_peer.id] = msg.from_peer;

  if (std::holds_alternative<raft::InstallSnapshot>(msg.message.payload) && !AcceptSnapshot(msg)) {
    RaftMessage reply{.shard_id = shard_id(),
                      .from_peer = self_,
                      .to_peer = msg.from_peer,
                      .epoch = meta.epoch,
                      .start_key = meta.start_key,
                      .end_key = meta.end_key,
                      .snapshot_rejected = true};
    if (!ctx_->transport->Send(std::move(reply))) {
      spdlog::debug("{} couldn't reject the snapshot of peer {}", tag_, msg.from_peer.id);
    }
    return;
  }

  raw_node_->Step(std::move(msg.message));
}

bool PeerFsm::AcceptSnapshot(const RaftMessage &msg) const {
  const auto &snapshot = std::get<raft::InstallSnapshot>(msg.message.payload).snapshot;
  // The consensus core ignores it anyway.
  if (snapshot.metadata.index <= storage_->applied_index()) return true;
  if (pending_ready_) {
    spdlog::info("{} is still applying a snapshot, rejects the one at {}", tag_, snapshot.metadata.index);
    return false;
  }

  auto data = DecodeSnapshot(snapshot, shard_id());
  if (data.HasError()) {
    spdlog::warn("{} rejects snapshot from peer {}: {}", tag_, msg.from_peer.id, data.GetError().message);
    return false;
  }
  const auto overlap =
      ctx_->store_meta->WithLock([&](const StoreMeta &store_meta) { return store_meta.FindOverlap(data->meta); });
  if (overlap) {
    spdlog::info("{} rejects snapshot of {} which overlaps local shard {}", tag_, fmt::streamed(data->meta),
                 *overlap);
    return false;
  }
  return true;
}

std::optional<common::Error> PeerFsm::PreProposeCheck(const RaftCommand &command) const {
  const auto &meta = storage_->meta();
  const auto &request = command.request;
  if (unhealthy_) return common::StorageIOError{fmt::format("Replica of shard {} is unhealthy", meta.id)};
  if (command.header.shard_id != meta.id) return common::ShardNotFound{command.header.shard_id};
  if (!IsLeader()) return NotLeaderError();
  if (ChecksVersion(request) && command.header.epoch.version != meta.epoch.version) {
    return common::StaleEpoch{{meta}};
  }
  if (storage_->local_state().state == common::PeerState::MERGING && !IsReadOnly(request) &&
      !std::holds_alternative<RollbackMergeRequest>(request) && !std::holds_alternative<CompactLogRequest>(request)) {
    return common::ShardMerging{meta.id};
  }
  return CheckKeysInShard(request, meta);
}

void PeerFsm::Propose(RaftCommand command, io::Promise<CommandResult> promise) {
  if (auto error = PreProposeCheck(command)) {
    promise.Fill(std::move(*error));
    return;
  }

  const auto &raft = raw_node_->raft();
  if (IsReadOnly(command.request) && raft.InLease() && storage_->applied_term() == raft.term()) {
    promise.Fill(ExecuteRead(*ctx_->engine, storage_->meta(), command.request));
    return;
  }

  if (IsBusy()) {
    promise.Fill(ErrorResult(common::ServerIsBusy{"Too many pending proposals"}));
    return;
  }

  auto data = slk::SaveToString(command);
  if (data.size() > ctx_->config.raft_entry_max_size) {
    promise.Fill(ErrorResult(common::InvalidRequest{
        fmt::format("Command of {} bytes exceeds the entry limit of {}", data.size(), ctx_->config.raft_entry_max_size)}));
    return;
  }

  if (auto result = raw_node_->Propose(std::move(data)); result.HasError()) {
    switch (result.GetError()) {
      case raft::ProposeError::NOT_LEADER:
      case raft::ProposeError::NOT_MEMBER:
        promise.Fill(NotLeaderError());
        return;
      case raft::ProposeError::TRANSFERRING_LEADER:
        promise.Fill(ErrorResult(common::ServerIsBusy{"Leadership transfer in progress"}));
        return;
      case raft::ProposeError::CONF_CHANGE_PENDING:
      case raft::ProposeError::INVALID_CONF_CHANGE:
        promise.Fill(ErrorResult(common::InvalidRequest{std::string(raft::ProposeErrorToString(result.GetError()))}));
        return;
    }
  }

  proposals_.push_back(Proposal{.index = raft.raft_log().LastIndex(),
                                .term = raft.term(),
                                .is_conf_change = false,
                                .propose_tick = ticks_,
                                .promise = std::move(promise)});
}

void PeerFsm::ProposeInternal(Request request) {
  auto [future, promise] = io::FuturePromisePair<CommandResult>();
  const auto &meta = storage_->meta();
  const auto name = RequestName(request);
  Propose(RaftCommand{.header = CommandHeader{.shard_id = meta.id, .peer_id = self_.id, .epoch = meta.epoch},
                      .request = std::move(request)},
          std::move(promise));
  if (auto result = future.TryGet(); result && result->HasError()) {
    spdlog::debug("{} couldn't propose {}: {}", tag_, name, fmt::streamed(result->GetError()));
  }
}

void PeerFsm::ProposeConfChange(const CommandHeader &header, std::vector<ChangePeerRequest> changes,
                                io::Promise<CommandResult> promise) {
  const auto &meta = storage_->meta();
  if (unhealthy_) {
    promise.Fill(ErrorResult(common::StorageIOError{fmt::format("Replica of shard {} is unhealthy", meta.id)}));
    return;
  }
  if (header.shard_id != meta.id) {
    promise.Fill(ErrorResult(common::ShardNotFound{header.shard_id}));
    return;
  }
  if (!IsLeader()) {
    promise.Fill(NotLeaderError());
    return;
  }
  if (header.epoch.conf_version != meta.epoch.conf_version) {
    promise.Fill(ErrorResult(common::StaleEpoch{{meta}}));
    return;
  }
  if (changes.empty()) {
    promise.Fill(ErrorResult(common::InvalidRequest{"Membership change without changes"}));
    return;
  }

  raft::ConfChange conf_change;
  for (const auto &change : changes) {
    conf_change.changes.push_back(raft::ConfChangeSingle{.type = change.type, .node_id = change.peer.id});
    peer_cache_[change.peer.id] = change.peer;
  }
  conf_change.context = slk::SaveToString(ConfChangeContext{.header = header, .changes = std::move(changes)});

  if (auto result = raw_node_->ProposeConfChange(conf_change); result.HasError()) {
    const auto error = result.GetError();
    spdlog::info("{} rejected membership change: {}", tag_, raft::ProposeErrorToString(error));
    if (error == raft::ProposeError::NOT_LEADER || error == raft::ProposeError::NOT_MEMBER) {
      promise.Fill(NotLeaderError());
    } else if (error == raft::ProposeError::CONF_CHANGE_PENDING ||
               error == raft::ProposeError::TRANSFERRING_LEADER) {
      promise.Fill(ErrorResult(common::ServerIsBusy{std::string(raft::ProposeErrorToString(error))}));
    } else {
      promise.Fill(ErrorResult(common::InvalidRequest{std::string(raft::ProposeErrorToString(error))}));
    }
    return;
  }

  const auto &raft = raw_node_->raft();
  proposals_.push_back(Proposal{.index = raft.raft_log().LastIndex(),
                                .term = raft.term(),
                                .is_conf_change = true,
                                .propose_tick = ticks_,
                                .promise = std::move(promise)});
}

void PeerFsm::OnTick() {
  ++ticks_;
  raw_node_->Tick();
  CheckProposalTimeouts();

  if (!IsLeader() || unhealthy_) return;
  const auto &cfg = ctx_->config;
  if (ticks_ % cfg.raft_log_gc_tick_interval == 0) OnLogGcTick();
  if (ticks_ % cfg.split_check_tick_interval == 0 && !splitting_) StartSplitCheck(false);
  if (ticks_ % cfg.placement_heartbeat_tick_interval == 0) OnPlacementHeartbeatTick();
  if (storage_->local_state().state == common::PeerState::MERGING && ticks_ % cfg.merge_check_tick_interval == 0) {
    OnMergeCheckTick();
  }
}

void PeerFsm::CheckProposalTimeouts() {
  while (!proposals_.empty() && ticks_ - proposals_.front().propose_tick > ctx_->config.proposal_timeout_ticks) {
    spdlog::debug("{} proposal at index {} timed out", tag_, proposals_.front().index);
    proposals_.front().promise.Fill(ErrorResult(common::TimedOut{}));
    proposals_.pop_front();
  }
}

void PeerFsm::OnLogGcTick() {
  const auto &raft = raw_node_->raft();
  const auto applied = storage_->applied_index();
  const auto truncated = storage_->apply_state().truncated_index;
  const auto threshold = ctx_->config.raft_log_gc_threshold;
  if (applied <= truncated + threshold) return;

  auto replicated = applied;
  for (const auto &[id, progress] : raft.tracker().progress()) replicated = std::min(replicated, progress.match);
  // Followers further behind catch up through a snapshot.
  const auto compact_index = std::max(replicated, applied - threshold);
  if (compact_index <= truncated) return;

  auto term = storage_->Term(compact_index);
  if (term.HasError()) {
    spdlog::warn("{} can't compact the log up to {}: {}", tag_, compact_index,
                 raft::StorageErrorToString(term.GetError()));
    return;
  }
  spdlog::debug("{} compacts the log up to {}", tag_, compact_index);
  ProposeInternal(CompactLogRequest{.compact_index = compact_index, .compact_term = *term});
}

void PeerFsm::StartSplitCheck(const bool force) {
  splitting_ = true;
  auto job = [engine = ctx_->engine, router = ctx_->router, meta = storage_->meta(),
              split_size = ctx_->config.shard_split_size, force, tag = tag_] {
    SplitCheckResult result{.epoch = meta.epoch};
    try {
      result = CheckSplit(*engine, meta, split_size, force);
    } catch (const utils::BasicException &e) {
      spdlog::error("{} split check failed: {}", tag, e.what());
    }
    PeerMsg msg{std::move(result)};
    if (router->SendPeer(meta.id, std::move(msg), true) != SendResult::OK) {
      spdlog::debug("{} is gone, dropping its split check result", tag);
    }
  };
  if (!ctx_->split_check_pool->AddTask(std::move(job))) {
    splitting_ = false;
    FillIfAny(&split_promise_, ErrorResult(common::ServerIsBusy{"Split checker is stopped"}));
  }
}

void PeerFsm::OnSplitCheckResult(const SplitCheckResult &result) {
  splitting_ = false;
  const auto &meta = storage_->meta();
  if (result.epoch != meta.epoch) {
    FillIfAny(&split_promise_, ErrorResult(common::StaleEpoch{{meta}}));
    return;
  }
  approximate_size_ = result.approximate_size;
  if (!IsLeader()) {
    FillIfAny(&split_promise_, NotLeaderError());
    return;
  }
  if (!result.split_key) {
    FillIfAny(&split_promise_, ErrorResult(common::InvalidRequest{"No key to split the shard at"}));
    return;
  }

  SplitShardMsg msg{.split_key = *result.split_key};
  if (split_promise_) {
    msg.promise.emplace(std::move(*split_promise_));
    split_promise_.reset();
  }
  OnSplitShard(std::move(msg));
}

void PeerFsm::OnSplitShard(SplitShardMsg msg) {
  const auto &meta = storage_->meta();
  if (!IsLeader()) {
    FillIfAny(&msg.promise, NotLeaderError());
    return;
  }
  if (splitting_) {
    FillIfAny(&msg.promise, ErrorResult(common::ServerIsBusy{"Another split is in progress"}));
    return;
  }
  if (storage_->local_state().state != common::PeerState::NORMAL) {
    FillIfAny(&msg.promise, ErrorResult(common::ShardMerging{meta.id}));
    return;
  }
  if (msg.promise) {
    split_promise_.emplace(std::move(*msg.promise));
    msg.promise.reset();
  }

  if (msg.split_key.empty()) {
    StartSplitCheck(true);
    return;
  }
  if (auto error = CheckKeysInShard(SplitRequest{.split_key = msg.split_key}, meta)) {
    FillIfAny(&split_promise_, std::move(*error));
    return;
  }

  splitting_ = true;
  auto job = [placement = ctx_->placement, router = ctx_->router, meta, split_key = msg.split_key, tag = tag_] {
    SplitIdsAllocated allocated{.split_key = split_key, .epoch = meta.epoch};
    if (auto ids = placement->AskSplit(meta); ids.HasError()) {
      spdlog::warn("{} couldn't allocate ids for a split: {}", tag, placement::PlacementErrorToString(ids.GetError()));
    } else {
      allocated.ids = std::move(*ids);
    }
    PeerMsg reply{std::move(allocated)};
    if (router->SendPeer(meta.id, std::move(reply), true) != SendResult::OK) {
      spdlog::debug("{} is gone, dropping its split ids", tag);
    }
  };
  if (!ctx_->control_pool->AddTask(std::move(job))) {
    splitting_ = false;
    FillIfAny(&split_promise_, ErrorResult(common::ServerIsBusy{"Control pool is stopped"}));
  }
}

void PeerFsm::OnSplitIdsAllocated(SplitIdsAllocated msg) {
  splitting_ = false;
  const auto &meta = storage_->meta();
  if (msg.ids.new_shard_id == common::kInvalidId) {
    FillIfAny(&split_promise_, ErrorResult(common::ServerIsBusy{"Placement is unavailable"}));
    return;
  }
  if (msg.epoch != meta.epoch) {
    FillIfAny(&split_promise_, ErrorResult(common::StaleEpoch{{meta}}));
    return;
  }

  spdlog::info("{} proposes split at {} into new shard {}", tag_, logging::Escape(msg.split_key),
               msg.ids.new_shard_id);
  SplitRequest request{
      .split_key = std::move(msg.split_key), .new_shard_id = msg.ids.new_shard_id, .new_peer_ids = msg.ids.new_peer_ids};
  if (!split_promise_) {
    ProposeInternal(std::move(request));
    return;
  }
  auto promise = std::move(*split_promise_);
  split_promise_.reset();
  Propose(RaftCommand{.header = CommandHeader{.shard_id = meta.id, .peer_id = self_.id, .epoch = meta.epoch},
                      .request = std::move(request)},
          std::move(promise));
}

void PeerFsm::OnMergeShard(MergeShardMsg msg) {
  const auto &meta = storage_->meta();
  if (!IsLeader()) {
    FillIfAny(&msg.promise, NotLeaderError());
    return;
  }
  const auto target =
      ctx_->store_meta->WithLock([&](const StoreMeta &store_meta) { return store_meta.Find(msg.target_id); });
  if (!target || !target->IsInitialized()) {
    FillIfAny(&msg.promise, ErrorResult(common::ShardNotFound{msg.target_id}));
    return;
  }

  spdlog::info("{} proposes to merge into shard {}", tag_, msg.target_id);
  RaftCommand command{.header = CommandHeader{.shard_id = meta.id, .peer_id = self_.id, .epoch = meta.epoch},
                      .request = PrepareMergeRequest{.target = *target}};
  if (!msg.promise) {
    ProposeInternal(std::move(command.request));
    return;
  }
  auto promise = std::move(*msg.promise);
  msg.promise.reset();
  Propose(std::move(command), std::move(promise));
}

void PeerFsm::OnMergeCheckTick() {
  const auto &state = storage_->local_state();
  if (!state.merge_state) return;
  const auto &merge = *state.merge_state;
  const auto &meta = state.meta;

  const auto target =
      ctx_->store_meta->WithLock([&](const StoreMeta &store_meta) { return store_meta.Find(merge.target.id); });
  if (target && target->epoch != merge.target.epoch) {
    if (Covers(*target, meta)) {
      // Merged, the replica is destroyed once the target applies it here.
      return;
    }
    spdlog::info("{} rolls back the merge into shard {} which changed to {}", tag_, merge.target.id,
                 fmt::streamed(target->epoch));
    ProposeInternal(RollbackMergeRequest{.commit = merge.commit});
    return;
  }

  CommitMergeRequest request{.source = meta, .commit = merge.commit};
  for (const auto &peer : merge.target.peers) {
    RaftMessage envelope{.shard_id = merge.target.id,
                         .from_peer = self_,
                         .to_peer = peer,
                         .epoch = merge.target.epoch,
                         .start_key = merge.target.start_key,
                         .end_key = merge.target.end_key,
                         .commit_merge = request};
    if (!ctx_->transport->Send(std::move(envelope))) {
      spdlog::debug("{} couldn't ask peer {} to commit the merge", tag_, peer.id);
    }
  }
}

void PeerFsm::OnCommitMergeRequest(const CommitMergeRequest &request) {
  if (!IsLeader()) return;
  const auto source_id = request.source.id;
  if (const auto it = pending_merge_commits_.find(source_id);
      it != pending_merge_commits_.end() && ticks_ - it->second < 2 * ctx_->config.merge_check_tick_interval) {
    return;
  }
  spdlog::info("{} proposes to commit the merge of shard {}", tag_, source_id);
  pending_merge_commits_[source_id] = ticks_;
  ProposeInternal(request);
}

void PeerFsm::OnPlacementOperator(const placement::ShardOperator &op) {
  if (!IsLeader()) return;
  spdlog::info("{} received operator {} from placement", tag_, placement::OperatorName(op));
  const auto &meta = storage_->meta();
  std::visit(
      utils::Overloaded{
          [&](const placement::TransferLeaderOp &o) {
            if (o.peer.id != self_.id) raw_node_->TransferLeader(o.peer.id);
          },
          [&](const placement::ChangePeerOp &o) {
            auto [future, promise] = io::FuturePromisePair<CommandResult>();
            ProposeConfChange(CommandHeader{.shard_id = meta.id, .peer_id = self_.id, .epoch = meta.epoch},
                              {ChangePeerRequest{.type = ToConfChangeType(o.type), .peer = o.peer}},
                              std::move(promise));
          },
          [&](const placement::SplitShardOp &o) { OnSplitShard(SplitShardMsg{.split_key = o.split_key}); },
          [&](const placement::MergeShardOp &o) { OnMergeShard(MergeShardMsg{.target_id = o.target_id}); },
      },
      op);
}

void PeerFsm::OnPlacementHeartbeatTick() {
  const auto &raft = raw_node_->raft();
  placement::ShardHeartbeatRequest request{
      .meta = storage_->meta(), .leader = self_, .term = raft.term(), .approximate_size = approximate_size_};
  const auto truncated = storage_->apply_state().truncated_index;
  for (const auto &[id, progress] : raft.tracker().progress()) {
    if (id == self_.id) continue;
    const auto peer = FindPeer(id);
    if (!peer) continue;
    if (!progress.recent_active) request.down_peers.push_back(*peer);
    if (progress.match < truncated) request.pending_peers.push_back(*peer);
  }

  auto job = [placement = ctx_->placement, router = ctx_->router, request = std::move(request), tag = tag_] {
    auto result = placement->ShardHeartbeat(request);
    if (result.HasError()) {
      spdlog::debug("{} heartbeat to placement failed: {}", tag, placement::PlacementErrorToString(result.GetError()));
      return;
    }
    if (!*result) return;
    PeerMsg msg{PlacementOperatorMsg{.op = std::move(**result)}};
    if (router->SendPeer(request.meta.id, std::move(msg), true) != SendResult::OK) {
      spdlog::debug("{} is gone, dropping operator from placement", tag);
    }
  };
  if (!ctx_->control_pool->AddTask(std::move(job))) spdlog::debug("{} skipped placement heartbeat", tag_);
}

void PeerFsm::OnShardDetail(ShardDetailMsg msg) {
  std::optional<PeerMeta> leader;
  if (const auto leader_id = raw_node_->raft().leader_id(); leader_id != raft::kNone) leader = FindPeer(leader_id);
  msg.promise.Fill(ResponseResult(ShardDetailResponse{.meta = storage_->meta(), .leader = std::move(leader)}));
}

void PeerFsm::UpdateMeta(const common::ShardLocalState &state) {
  storage_->SetLocalState(state);
  ctx_->store_meta->WithLock([&](StoreMeta &store_meta) { store_meta.SetShard(state.meta); });
  for (const auto &peer : state.meta.peers) peer_cache_[peer.id] = peer;
}

void PeerFsm::OnApplyResult(ApplyResult result) {
  if (result.storage_error) {
    spdlog::critical("{} apply failed to write to the store", tag_);
    MarkUnhealthy();
  }
  storage_->SetApplyState(result.apply_state);
  if (result.apply_state.applied_index > raw_node_->raft().raft_log().applied()) {
    raw_node_->AdvanceApply(result.apply_state.applied_index);
  }

  for (auto &exec : result.results) {
    if (destroying_) return;
    std::visit(
        utils::Overloaded{
            [&](raftstore::ExecConfChange &r) {
              raw_node_->ApplyConfChange(r.conf_change);
              auto state = storage_->local_state();
              state.meta = r.meta;
              UpdateMeta(state);
              if (!r.meta.FindPeer(self_.id)) {
                spdlog::info("{} has been removed from the shard", tag_);
                Destroy(true);
              }
            },
            [&](raftstore::ExecSplit &r) {
              auto state = storage_->local_state();
              state.meta = r.left;
              UpdateMeta(state);
              approximate_size_ = 0;
              ctx_->create_split_peer(r.right, IsLeader());
              if (IsLeader()) {
                auto job = [placement = ctx_->placement, left = r.left, right = r.right, tag = tag_] {
                  if (auto reported = placement->ReportSplit(left, right); reported.HasError()) {
                    spdlog::warn("{} couldn't report split to placement: {}", tag,
                                 placement::PlacementErrorToString(reported.GetError()));
                  }
                };
                if (!ctx_->control_pool->AddTask(std::move(job))) spdlog::debug("{} didn't report split", tag_);
              }
            },
            [&](raftstore::ExecPrepareMerge &r) {
              UpdateMeta(r.state);
              if (IsLeader()) OnMergeCheckTick();
            },
            [&](raftstore::ExecCommitMerge &r) {
              auto state = storage_->local_state();
              state.meta = r.meta;
              UpdateMeta(state);
              pending_merge_commits_.erase(r.source.id);
              ctx_->destroy_peer(r.source.id, false);
            },
            [&](raftstore::ExecRollbackMerge &r) {
              auto state = storage_->local_state();
              state.state = common::PeerState::NORMAL;
              state.merge_state.reset();
              state.meta = r.meta;
              UpdateMeta(state);
            },
            [&](raftstore::ExecCompactLog &r) {
              kvstore::WriteBatch batch;
              storage_->CompactTo(r.truncated_index, r.truncated_term, &batch);
              if (!batch.Empty() && !ctx_->engine->Write(batch)) {
                spdlog::critical("{} failed to delete compacted log entries", tag_);
                MarkUnhealthy();
              }
            },
        },
        exec);
  }
}

void PeerFsm::OnSnapshotApplied(SnapshotApplied applied) {
  if (!pending_ready_) {
    spdlog::warn("{} got a snapshot result without a pending snapshot", tag_);
    return;
  }
  auto ready = std::move(*pending_ready_);
  pending_ready_.reset();

  if (!applied.success) {
    spdlog::warn("{} failed to apply snapshot at {}: {}", tag_, ready.snapshot.metadata.index, applied.error);
    // The core already took the snapshot over, start again from the stored
    // state and let the leader retry.
    RecreateRawNode();
    return;
  }

  const auto index = applied.apply_state.applied_index;
  storage_->OnSnapshotApplied(applied);
  UpdateMeta(applied.shard_state);
  PersistAndAdvance(std::move(ready));
  if (!unhealthy_) raw_node_->AdvanceApply(index);
  spdlog::info("{} restored snapshot at index {}, shard {}", tag_, index, fmt::streamed(storage_->meta()));
}

void PeerFsm::HandleReady() {
  if (pending_ready_ || unhealthy_ || !raw_node_->HasReady()) return;
  auto ready = raw_node_->GetReady();
  if (ready.soft_state) OnRoleChange(*ready.soft_state);

  if (!ready.snapshot.IsEmpty()) {
    // Nothing else of this Ready may be persisted or sent before the
    // snapshot is applied.
    ApplyMsg task{ApplySnapshotTask{.snapshot = ready.snapshot,
                                    .hard_state = ready.hard_state.value_or(raw_node_->raft().GetHardState())}};
    pending_ready_ = std::move(ready);
    if (ctx_->router->SendApply(shard_id(), std::move(task)) != SendResult::OK) {
      spdlog::warn("{} couldn't hand the snapshot over for applying", tag_);
    }
    return;
  }
  PersistAndAdvance(std::move(ready));
}

void PeerFsm::PersistAndAdvance(raft::Ready ready) {
  kvstore::WriteBatch batch;
  if (!ready.entries.empty()) storage_->Append(ready.entries, &batch);
  if (ready.hard_state) storage_->SetHardState(*ready.hard_state);
  if (!ready.entries.empty() || ready.hard_state) {
    storage_->WriteRaftState(&batch);
    if (!ctx_->engine->Write(batch, ready.must_sync)) {
      spdlog::critical("{} failed to persist the raft log", tag_);
      MarkUnhealthy();
      return;
    }
  }

  raw_node_->Advance(ready);
  SendRaftMessages(std::move(ready.messages));
  SendCommitted(std::move(ready.committed_entries));
}

void PeerFsm::SendRaftMessages(std::vector<raft::Message> messages) {
  for (auto &message : messages) {
    const auto to = FindPeer(message.to);
    if (!to) {
      spdlog::warn("{} doesn't know where peer {} lives", tag_, message.to);
      raw_node_->ReportUnreachable(message.to);
      continue;
    }
    SendToPeer(*to, std::move(message));
  }
}

void PeerFsm::SendToPeer(const PeerMeta &to, raft::Message message, const bool is_tombstone) {
  const auto &meta = storage_->meta();
  const bool is_snapshot = std::holds_alternative<raft::InstallSnapshot>(message.payload);
  RaftMessage envelope{.shard_id = meta.id,
                       .from_peer = self_,
                       .to_peer = to,
                       .epoch = meta.epoch,
                       .start_key = meta.start_key,
                       .end_key = meta.end_key,
                       .is_tombstone = is_tombstone,
                       .message = std::move(message)};
  if (ctx_->transport->Send(std::move(envelope)) || is_tombstone) return;
  raw_node_->ReportUnreachable(to.id);
  if (is_snapshot) raw_node_->ReportSnapshot(to.id, true);
}

void PeerFsm::SendCommitted(std::vector<raft::Entry> entries) {
  if (entries.empty()) return;
  const auto last = entries.back().index;
  ApplyEntriesTask task{.entries = std::move(entries)};
  while (!proposals_.empty() && proposals_.front().index <= last) {
    task.proposals.push_back(std::move(proposals_.front()));
    proposals_.pop_front();
  }
  ApplyMsg msg{std::move(task)};
  if (ctx_->router->SendApply(shard_id(), std::move(msg)) != SendResult::OK) {
    spdlog::warn("{} couldn't hand committed entries up to {} over for applying", tag_, last);
    FailApplyMsg(&msg, common::ShardNotFound{shard_id()});
  }
}

void PeerFsm::OnRoleChange(const raft::SoftState &soft_state) {
  const auto term = raw_node_->raft().term();
  spdlog::info("{} is now {} in term {}, leader {}", tag_, raft::StateRoleToString(soft_state.role), term,
               soft_state.leader_id);
  const bool is_leader = soft_state.role == raft::StateRole::LEADER;
  ctx_->store_meta->WithLock([&](StoreMeta &store_meta) {
    if (is_leader) {
      store_meta.leaders.insert(shard_id());
    } else {
      store_meta.leaders.erase(shard_id());
    }
  });
  if (is_leader) {
    pending_merge_commits_.clear();
    OnPlacementHeartbeatTick();
    return;
  }
  // Entries of the old term may still commit, but nobody will tell.
  for (auto &proposal : proposals_) proposal.promise.Fill(ErrorResult(common::ProposalDropped{proposal.term}));
  proposals_.clear();
  FillIfAny(&split_promise_, NotLeaderError());
}

void PeerFsm::MarkUnhealthy() {
  if (unhealthy_) return;
  unhealthy_ = true;
  ctx_->store_meta->WithLock([&](StoreMeta &store_meta) { store_meta.unhealthy.insert(shard_id()); });
  FailPending(common::StorageIOError{fmt::format("Replica of shard {} is unhealthy", shard_id())});
}

void PeerFsm::Destroy(const bool remove_data) {
  if (destroying_) return;
  destroying_ = true;
  spdlog::info("{} is being destroyed{}", tag_, remove_data ? " with its data" : "");
  FailPending(common::ShardNotFound{shard_id()});
  ctx_->destroy_peer(shard_id(), remove_data);
}

}  // namespace rangekv::raftstore
