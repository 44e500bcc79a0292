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


#include "raftstore/router.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "raftstore/apply.hpp"
#include "raftstore/peer.hpp"

namespace rangekv::raftstore {

Router::~Router() { Shutdown(); }

std::optional<Router::Entry> Router::Find(const ShardId shard_id) const {
  std::shared_lock guard(lock_);
  const auto it = shards_.find(shard_id);
  if (it == shards_.end()) return std::nullopt;
  return it->second;
}

SendResult Router::SendPeer(const ShardId shard_id, PeerMsg &&msg, const bool force) {
  const auto entry = Find(shard_id);
  if (!entry) return SendResult::NOT_FOUND;
  return entry->peer->Send(std::move(msg), force);
}

SendResult Router::SendApply(const ShardId shard_id, ApplyMsg &&msg) {
  const auto entry = Find(shard_id);
  if (!entry) return SendResult::NOT_FOUND;
  return entry->apply->Send(std::move(msg), true);
}

bool Router::Register(const ShardId shard_id, std::shared_ptr<PeerHandle> peer, std::shared_ptr<ApplyHandle> apply) {
  std::unique_lock guard(lock_);
  return shards_.emplace(shard_id, Entry{.peer = std::move(peer), .apply = std::move(apply)}).second;
}

bool Router::Contains(const ShardId shard_id) const {
  std::shared_lock guard(lock_);
  return shards_.contains(shard_id);
}

std::vector<ShardId> Router::ShardIds() const {
  std::shared_lock guard(lock_);
  std::vector<ShardId> ids;
  ids.reserve(shards_.size());
  for (const auto &[id, _] : shards_) ids.push_back(id);
  return ids;
}

void Router::Broadcast(const std::function<PeerMsg()> &make_msg) {
  std::vector<std::shared_ptr<PeerHandle>> peers;
  {
    std::shared_lock guard(lock_);
    peers.reserve(shards_.size());
    for (const auto &[_, entry] : shards_) peers.push_back(entry.peer);
  }
  for (const auto &peer : peers) {
    // A full mailbox skips the tick, the next one catches up.
    (void)peer->Send(make_msg(), false);
  }
}

void Router::Destroy(const ShardId shard_id, const common::Error &error) {
  Entry entry;
  {
    std::unique_lock guard(lock_);
    auto it = shards_.find(shard_id);
    if (it == shards_.end()) return;
    entry = std::move(it->second);
    shards_.erase(it);
  }

  // The apply side goes first so its results can't reach a stopped peer.
  auto apply_rest = entry.apply->Shutdown();
  for (auto &msg : apply_rest) FailApplyMsg(&msg, error);
  entry.apply->fsm().FailPending(error);

  auto peer_rest = entry.peer->Shutdown();
  for (auto &msg : peer_rest) FailPeerMsg(&msg, error);
  entry.peer->fsm().FailPending(error);

  spdlog::debug("Shard {} unregistered, {} queued messages failed", shard_id, apply_rest.size() + peer_rest.size());
}

void Router::Shutdown() {
  for (const auto shard_id : ShardIds()) {
    Destroy(shard_id, common::ShardNotFound{shard_id});
  }
}

}  // namespace rangekv::raftstore
