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


#include "raftstore/store.hpp"

#include <utility>

#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

#include "common/keys.hpp"
#include "raftstore/apply.hpp"
#include "raftstore/peer_storage.hpp"
#include "raftstore/state.hpp"
#include "utils/logging.hpp"

namespace rangekv::raftstore {

namespace {

constexpr auto kGcCommandTimeout = std::chrono::seconds(10);

// Messages which may come from a leader this node hasn't heard of yet.
bool MayCreatePeer(const raft::MessagePayload &payload) {
  return std::holds_alternative<raft::AppendRequest>(payload) ||
         std::holds_alternative<raft::HeartbeatRequest>(payload) ||
         std::holds_alternative<raft::InstallSnapshot>(payload) || std::holds_alternative<raft::VoteRequest>(payload);
}

Config Validated(Config config) {
  config.Validate();
  return config;
}

}  // namespace

Store::Store(Config config, const common::NodeId node_id, kvstore::KVStore *engine, Transport *transport,
             placement::PlacementClient *placement)
    : config_(Validated(std::move(config))),
      node_id_(node_id),
      engine_(engine),
      transport_(transport),
      placement_(placement),
      raft_pool_(config_.raft_pool_size, fmt::format("raft-{}", node_id)),
      apply_pool_(config_.apply_pool_size, fmt::format("apply-{}", node_id)),
      snap_pool_(config_.snap_pool_size, fmt::format("snap-{}", node_id)),
      split_check_pool_(config_.split_check_pool_size, fmt::format("split-{}", node_id)),
      control_pool_(config_.control_pool_size, fmt::format("control-{}", node_id)) {
  ctx_.node_id = node_id_;
  ctx_.config = config_;
  ctx_.engine = engine_;
  ctx_.router = &router_;
  ctx_.transport = transport_;
  ctx_.placement = placement_;
  ctx_.store_meta = &store_meta_;
  ctx_.snap_pool = &snap_pool_;
  ctx_.control_pool = &control_pool_;
  ctx_.split_check_pool = &split_check_pool_;
  ctx_.create_split_peer = [this](const ShardMeta &meta, const bool campaign) {
    if (!control_pool_.AddTask([this, meta, campaign] { CreateSplitPeer(meta, campaign); })) {
      spdlog::warn("Node {} is stopping, shard {} isn't started", node_id_, meta.id);
    }
  };
  ctx_.destroy_peer = [this](const ShardId shard_id, const bool remove_data) {
    if (!control_pool_.AddTask([this, shard_id, remove_data] { DestroyPeer(shard_id, remove_data); })) {
      spdlog::warn("Node {} is stopping, shard {} isn't destroyed", node_id_, shard_id);
    }
  };
}

Store::~Store() { Stop(); }

bool Store::BootstrapShard(kvstore::KVStore *engine, const ShardMeta &meta) {
  if (LoadShardState(*engine, meta.id)) return false;
  kvstore::WriteBatch batch;
  WriteInitialState(&batch, meta);
  if (!engine->Write(batch, true)) {
    throw kvstore::KVStoreIOError("Failed to write the initial state of shard {}", meta.id);
  }
  spdlog::info("Bootstrapped shard {}", fmt::streamed(meta));
  return true;
}

void Store::Start() {
  if (started_.exchange(true)) return;

  std::vector<common::ShardLocalState> states;
  {
    auto it = engine_->NewIterator(kvstore::ColumnFamily::RAFT, common::keys::ShardMetaMinKey(),
                                   common::keys::ShardMetaMaxKey());
    for (it.SeekToFirst(); it.Valid(); it.Next()) {
      common::ShardLocalState state;
      slk::LoadFromString(it.Value(), &state);
      states.push_back(std::move(state));
    }
  }

  size_t started = 0;
  for (const auto &state : states) {
    if (state.state == common::PeerState::TOMBSTONE) continue;
    const auto self = state.meta.FindPeerOnNode(node_id_);
    if (!self) {
      spdlog::warn("Node {} has state of shard {} without a local peer", node_id_, state.meta.id);
      continue;
    }
    CreatePeer(state, *self);
    ++started;
  }
  spdlog::info("Node {} started {} shard replicas", node_id_, started);

  tick_scheduler_.Run(fmt::format("tick-{}", node_id_), config_.raft_base_tick_interval,
                      [this] { router_.Broadcast([] { return PeerMsg{TickMsg{}}; }); });
  gc_scheduler_.Run(fmt::format("gc-{}", node_id_), config_.gc_interval, [this] { RunGc(); });
  heartbeat_scheduler_.Run(fmt::format("heartbeat-{}", node_id_), config_.node_heartbeat_interval,
                           [this] { SendNodeHeartbeat(); });
}

void Store::Stop() {
  {
    std::lock_guard guard(create_lock_);
    if (stopped_) return;
    stopped_ = true;
  }
  spdlog::info("Stopping node {}", node_id_);
  tick_scheduler_.Stop();
  gc_scheduler_.Stop();
  heartbeat_scheduler_.Stop();
  control_pool_.ShutDown();
  router_.Shutdown();
  split_check_pool_.ShutDown();
  snap_pool_.ShutDown();
  apply_pool_.ShutDown();
  raft_pool_.ShutDown();
}

void Store::CreatePeer(const common::ShardLocalState &state, const PeerMeta &self) {
  const auto tag = fmt::format("[shard {}] peer {}:", state.meta.id, self.id);
  auto storage = std::make_unique<PeerStorage>(engine_, state, &snap_pool_, tag);
  auto apply = std::make_unique<ApplyFsm>(engine_, &router_, &store_meta_, &snap_pool_, state, storage->apply_state(),
                                          tag);
  auto peer = std::make_unique<PeerFsm>(&ctx_, self, std::move(storage));

  auto peer_handle =
      std::make_shared<PeerHandle>(std::move(peer), &raft_pool_, config_.mailbox_capacity, config_.max_batch_size);
  auto apply_handle = std::make_shared<ApplyHandle>(std::move(apply), &apply_pool_, config_.mailbox_capacity,
                                                    config_.max_batch_size);
  store_meta_.WithLock([&](StoreMeta &store_meta) { store_meta.SetShard(state.meta); });
  if (!router_.Register(state.meta.id, std::move(peer_handle), std::move(apply_handle))) {
    spdlog::warn("Shard {} already has a replica on node {}", state.meta.id, node_id_);
    return;
  }
  spdlog::debug("Node {} created replica {} of shard {}", node_id_, self.id, state.meta.id);
}

void Store::OnRaftMessage(RaftMessage msg) {
  const auto shard_id = msg.shard_id;
  PeerMsg peer_msg{std::move(msg)};
  auto result = router_.SendPeer(shard_id, std::move(peer_msg));
  if (result == SendResult::NOT_FOUND) {
    MaybeCreatePeer(std::get<RaftMessage>(peer_msg));
    result = router_.SendPeer(shard_id, std::move(peer_msg));
  }
  if (result != SendResult::OK) {
    spdlog::debug("Node {} drops message for shard {}: {}", node_id_, shard_id, SendResultToString(result));
  }
}

void Store::MaybeCreatePeer(const RaftMessage &msg) {
  if (msg.to_peer.node_id != node_id_ || msg.is_tombstone || msg.commit_merge ||
      !MayCreatePeer(msg.message.payload)) {
    return;
  }

  std::lock_guard guard(create_lock_);
  if (stopped_ || router_.Contains(msg.shard_id)) return;

  try {
    const auto existing = LoadShardState(*engine_, msg.shard_id);
    if (existing && existing->state == common::PeerState::TOMBSTONE) {
      if (existing->meta.epoch.conf_version >= msg.epoch.conf_version) {
        ReplyTombstone(msg, existing->meta);
        return;
      }
    } else if (existing && existing->meta.IsInitialized()) {
      // Its replica is being destroyed or hasn't been started.
      return;
    }

    spdlog::info("Node {} creates replica {} of shard {} on a message from peer {}", node_id_, msg.to_peer.id,
                 msg.shard_id, msg.from_peer.id);
    common::ShardLocalState state;
    state.meta.id = msg.shard_id;
    CreatePeer(state, msg.to_peer);
  } catch (const utils::BasicException &e) {
    spdlog::error("Node {} failed to create a replica of shard {}: {}", node_id_, msg.shard_id, e.what());
  }
}

void Store::ReplyTombstone(const RaftMessage &msg, const ShardMeta &tombstone) {
  RaftMessage reply{.shard_id = msg.shard_id,
                    .from_peer = msg.to_peer,
                    .to_peer = msg.from_peer,
                    .epoch = tombstone.epoch,
                    .start_key = tombstone.start_key,
                    .end_key = tombstone.end_key,
                    .is_tombstone = true};
  if (!transport_->Send(std::move(reply))) {
    spdlog::debug("Node {} couldn't tell peer {} about tombstone shard {}", node_id_, msg.from_peer.id, msg.shard_id);
  }
}

void Store::CreateSplitPeer(const ShardMeta &meta, const bool campaign) {
  std::lock_guard guard(create_lock_);
  if (stopped_) return;
  try {
    if (router_.Contains(meta.id)) {
      const auto known = store_meta_.WithLock([&](const StoreMeta &store_meta) { return store_meta.Find(meta.id); });
      // Already initialized by a snapshot from the new shard's leader.
      if (known && known->IsInitialized()) return;
      router_.Destroy(meta.id, common::ShardNotFound{meta.id});
    }
    const auto state = LoadShardState(*engine_, meta.id);
    if (!state || state->state == common::PeerState::TOMBSTONE) {
      spdlog::info("Node {} skips split shard {} which has been removed", node_id_, meta.id);
      return;
    }
    const auto self = state->meta.FindPeerOnNode(node_id_);
    if (!self) return;
    CreatePeer(*state, *self);
  } catch (const utils::BasicException &e) {
    spdlog::error("Node {} failed to start split shard {}: {}", node_id_, meta.id, e.what());
    return;
  }
  if (campaign) {
    PeerMsg msg{CampaignMsg{}};
    (void)router_.SendPeer(meta.id, std::move(msg), true);
  }
}

void Store::DestroyPeer(const ShardId shard_id, const bool remove_data) {
  router_.Destroy(shard_id, common::ShardNotFound{shard_id});
  gc_done_.WithLock([&](auto &done) { done.erase(shard_id); });

  try {
    const auto state = LoadShardState(*engine_, shard_id);
    kvstore::WriteBatch batch;
    ClearRaftState(&batch, shard_id);
    if (state && state->meta.IsInitialized()) {
      const auto overlap =
          store_meta_.WithLock([&](const StoreMeta &store_meta) { return store_meta.FindOverlap(state->meta); });
      if (remove_data && !overlap) {
        for (const auto cf : kvstore::kDataColumnFamilies) {
          batch.DeleteRange(cf, common::keys::ShardDataStart(state->meta), common::keys::ShardDataEnd(state->meta));
        }
      } else if (remove_data) {
        spdlog::info("Node {} keeps the data of shard {}, shard {} owns part of it now", node_id_, shard_id,
                     *overlap);
      }
      if (state->state != common::PeerState::TOMBSTONE) {
        WriteShardState(&batch,
                        common::ShardLocalState{.state = common::PeerState::TOMBSTONE, .meta = state->meta});
      }
    }
    if (!engine_->Write(batch, true)) {
      spdlog::critical("Node {} failed to clean up shard {}", node_id_, shard_id);
    }
  } catch (const utils::BasicException &e) {
    spdlog::critical("Node {} failed to clean up shard {}: {}", node_id_, shard_id, e.what());
  }

  store_meta_.WithLock([&](StoreMeta &store_meta) {
    // A merge target may have taken over the id's range entry already.
    store_meta.RemoveShard(shard_id);
  });
  spdlog::info("Node {} destroyed its replica of shard {}", node_id_, shard_id);
}

io::Future<CommandResult> Store::SendWithPromise(
    const ShardId shard_id, const std::function<PeerMsg(io::Promise<CommandResult>)> &make_msg) {
  auto [future, promise] = io::FuturePromisePair<CommandResult>();
  auto msg = make_msg(std::move(promise));
  switch (router_.SendPeer(shard_id, std::move(msg))) {
    case SendResult::OK:
      break;
    case SendResult::FULL:
      FailPeerMsg(&msg, common::ServerIsBusy{fmt::format("Mailbox of shard {} is full", shard_id)});
      break;
    case SendResult::CLOSED:
    case SendResult::NOT_FOUND:
      FailPeerMsg(&msg, common::ShardNotFound{shard_id});
      break;
  }
  return std::move(future);
}

io::Future<CommandResult> Store::SendCommand(RaftCommand command) {
  const auto shard_id = command.header.shard_id;
  return SendWithPromise(shard_id, [&](io::Promise<CommandResult> promise) {
    return PeerMsg{RaftCommandMsg{.command = std::move(command), .promise = std::move(promise)}};
  });
}

io::Future<CommandResult> Store::ChangePeers(CommandHeader header, std::vector<ChangePeerRequest> changes) {
  const auto shard_id = header.shard_id;
  return SendWithPromise(shard_id, [&](io::Promise<CommandResult> promise) {
    return PeerMsg{ChangePeerMsg{.header = header, .changes = std::move(changes), .promise = std::move(promise)}};
  });
}

io::Future<CommandResult> Store::ShardDetail(const ShardId shard_id) {
  return SendWithPromise(shard_id, [](io::Promise<CommandResult> promise) {
    return PeerMsg{ShardDetailMsg{.promise = std::move(promise)}};
  });
}

io::Future<CommandResult> Store::SplitShard(const ShardId shard_id, std::string split_key) {
  return SendWithPromise(shard_id, [&](io::Promise<CommandResult> promise) {
    return PeerMsg{SplitShardMsg{.split_key = std::move(split_key), .promise = std::move(promise)}};
  });
}

io::Future<CommandResult> Store::MergeShard(const ShardId source_id, const ShardId target_id) {
  return SendWithPromise(source_id, [&](io::Promise<CommandResult> promise) {
    return PeerMsg{MergeShardMsg{.target_id = target_id, .promise = std::move(promise)}};
  });
}

bool Store::TransferLeader(const ShardId shard_id, const PeerId peer_id) {
  PeerMsg msg{TransferLeaderMsg{.peer_id = peer_id}};
  return router_.SendPeer(shard_id, std::move(msg), true) == SendResult::OK;
}

bool Store::Campaign(const ShardId shard_id) {
  PeerMsg msg{CampaignMsg{}};
  return router_.SendPeer(shard_id, std::move(msg), true) == SendResult::OK;
}

std::optional<ShardMeta> Store::FindShardByKey(const std::string_view key) const {
  return store_meta_.WithLock([&](const StoreMeta &store_meta) { return store_meta.FindByKey(key); });
}

std::optional<ShardMeta> Store::FindShard(const ShardId shard_id) const {
  return store_meta_.WithLock([&](const StoreMeta &store_meta) { return store_meta.Find(shard_id); });
}

std::vector<ShardMeta> Store::Shards() const {
  return store_meta_.WithLock([](const StoreMeta &store_meta) {
    std::vector<ShardMeta> shards;
    for (const auto &[_, id] : store_meta.ranges) shards.push_back(store_meta.shards.at(id));
    return shards;
  });
}

bool Store::IsLeader(const ShardId shard_id) const {
  return store_meta_.WithLock([&](const StoreMeta &store_meta) { return store_meta.leaders.contains(shard_id); });
}

void Store::RunGc() {
  auto safe_point = placement_->GetGcSafePoint();
  if (safe_point.HasError()) {
    spdlog::debug("Node {} couldn't get the GC safe point: {}", node_id_,
                  placement::PlacementErrorToString(safe_point.GetError()));
    return;
  }
  if (*safe_point == 0) return;

  const auto leaders = store_meta_.WithLock([](const StoreMeta &store_meta) {
    std::vector<ShardMeta> shards;
    for (const auto id : store_meta.leaders) {
      if (const auto it = store_meta.shards.find(id); it != store_meta.shards.end() && it->second.IsInitialized()) {
        shards.push_back(it->second);
      }
    }
    return shards;
  });

  std::vector<std::pair<ShardId, io::Future<CommandResult>>> pending;
  const auto gc_done = gc_done_.WithLock([](const auto &done) { return done; });
  for (const auto &meta : leaders) {
    if (const auto it = gc_done.find(meta.id); it != gc_done.end() && it->second >= *safe_point) continue;
    pending.emplace_back(meta.id,
                         SendCommand(RaftCommand{.header = CommandHeader{.shard_id = meta.id, .epoch = meta.epoch},
                                                 .request = GcRequest{.safe_point = *safe_point}}));
  }
  for (auto &[shard_id, future] : pending) {
    auto result = future.WaitFor(std::chrono::duration_cast<std::chrono::milliseconds>(kGcCommandTimeout));
    if (!result) {
      spdlog::warn("Node {} GC of shard {} didn't finish in time", node_id_, shard_id);
      continue;
    }
    if (result->HasError()) {
      spdlog::debug("Node {} GC of shard {} failed: {}", node_id_, shard_id, fmt::streamed(result->GetError()));
      continue;
    }
    gc_done_.WithLock([&, id = shard_id](auto &done) {
      // DestroyPeer unregisters the replica before it forgets the shard.
      if (router_.Contains(id)) done[id] = *safe_point;
    });
  }
}

std::vector<ShardId> Store::GcTrackedShards() const {
  return gc_done_.WithLock([](const auto &done) {
    std::vector<ShardId> shards;
    shards.reserve(done.size());
    for (const auto &[shard_id, safe_point] : done) shards.push_back(shard_id);
    return shards;
  });
}

void Store::SendNodeHeartbeat() {
  auto stats = store_meta_.WithLock([&](const StoreMeta &store_meta) {
    return placement::NodeStats{.node_id = node_id_,
                                .shard_count = store_meta.ranges.size(),
                                .leader_count = store_meta.leaders.size(),
                                .unhealthy_shards = {store_meta.unhealthy.begin(), store_meta.unhealthy.end()}};
  });
  stats.used_bytes = engine_->ApproximateSize(kvstore::ColumnFamily::DEFAULT, common::keys::DataMinKey(),
                                              common::keys::DataMaxKey()) +
                     engine_->ApproximateSize(kvstore::ColumnFamily::WRITE, common::keys::DataMinKey(),
                                              common::keys::DataMaxKey());
  if (auto result = placement_->NodeHeartbeat(stats); result.HasError()) {
    spdlog::debug("Node {} heartbeat to placement failed: {}", node_id_,
                  placement::PlacementErrorToString(result.GetError()));
  }
}

}  // namespace rangekv::raftstore
