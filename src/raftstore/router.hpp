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

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

#include "common/types.hpp"
#include "raftstore/mailbox.hpp"
#include "raftstore/message.hpp"

namespace rangekv::raftstore {

class PeerFsm;
class ApplyFsm;

using PeerHandle = FsmHandle<PeerMsg, PeerFsm>;
using ApplyHandle = FsmHandle<ApplyMsg, ApplyFsm>;

/**
 * Routes messages to the peer and apply state machines of the shards hosted
 * by a node. Sending to a shard which isn't registered, or is being
 * destroyed, fails without side effects on the message.
 */
class Router {
 public:
  Router() = default;

  Router(const Router &) = delete;
  Router &operator=(const Router &) = delete;
  Router(Router &&) = delete;
  Router &operator=(Router &&) = delete;

  ~Router();

  /// On anything but OK the message is left untouched for the caller.
  SendResult SendPeer(ShardId shard_id, PeerMsg &&msg, bool force = false);

  /// Apply messages are internal and never rejected for capacity.
  SendResult SendApply(ShardId shard_id, ApplyMsg &&msg);

  /// Returns false when the shard already has state machines.
  bool Register(ShardId shard_id, std::shared_ptr<PeerHandle> peer, std::shared_ptr<ApplyHandle> apply);

  bool Contains(ShardId shard_id) const;

  std::vector<ShardId> ShardIds() const;

  /// Sends a copy of `msg` to every peer. Ticks and other control messages
  /// only.
  void Broadcast(const std::function<PeerMsg()> &make_msg);

  /// Unregisters the shard, waits for runs in progress and fails whatever
  /// was still queued with `error`. Must not be called from the shard's own
  /// state machines.
  void Destroy(ShardId shard_id, const common::Error &error);

  /// Destroys every shard. The pools running the state machines must still
  /// be alive.
  void Shutdown();

 private:
  struct Entry {
    std::shared_ptr<PeerHandle> peer;
    std::shared_ptr<ApplyHandle> apply;
  };

  std::optional<Entry> Find(ShardId shard_id) const;

  mutable std::shared_mutex lock_;
  std::map<ShardId, Entry> shards_;
};

}  // namespace rangekv::raftstore
