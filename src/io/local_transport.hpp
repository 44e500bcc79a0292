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

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>

#include "common/types.hpp"
#include "raftstore/message.hpp"
#include "raftstore/snapshot.hpp"
#include "raftstore/transport.hpp"
#include "utils/thread_pool.hpp"

namespace rangekv::io {

using common::NodeId;

/// Returns false for messages which should be lost.
using MessageFilter = std::function<bool(const raftstore::RaftMessage &)>;

/**
 * In-process network between the nodes of one process. Messages are
 * delivered in send order by a single thread. Snapshots travel in chunks and
 * are reassembled on the receiving side like on a real connection.
 *
 * Filters make it possible to lose messages on purpose: everything matching
 * a filter that returns false is accepted by `Deliver` and then dropped.
 */
class LocalNetwork {
 public:
  using Handler = std::function<void(raftstore::RaftMessage)>;

  explicit LocalNetwork(size_t snap_chunk_size = 1ULL << 20U);

  LocalNetwork(const LocalNetwork &) = delete;
  LocalNetwork &operator=(const LocalNetwork &) = delete;
  LocalNetwork(LocalNetwork &&) = delete;
  LocalNetwork &operator=(LocalNetwork &&) = delete;

  ~LocalNetwork();

  void RegisterNode(NodeId node_id, Handler handler);

  /// Waits for a running delivery to the node to finish. No delivery starts
  /// afterwards.
  void UnregisterNode(NodeId node_id);

  /// Returns false when the receiving node isn't registered.
  bool Deliver(raftstore::RaftMessage message);

  uint64_t AddFilter(MessageFilter filter);
  void RemoveFilter(uint64_t filter_id);
  void ClearFilters();

  /// Drops all traffic between the two groups until `Heal`.
  void Partition(const std::set<NodeId> &left, const std::set<NodeId> &right);
  /// Drops all traffic from and to `node_id` until `Heal`.
  void Isolate(NodeId node_id);
  void Heal();

  uint64_t DeliveredCount() const { return delivered_.load(std::memory_order_acquire); }
  uint64_t DroppedCount() const { return dropped_.load(std::memory_order_acquire); }

 private:
  struct Node {
    Handler handler;
    std::mutex call_lock;
    bool active{true};
    /// Used only from the delivery thread.
    raftstore::SnapshotAssembler assembler;
  };

  std::shared_ptr<Node> FindNode(NodeId node_id) const;
  bool Allowed(const raftstore::RaftMessage &message) const;
  void Dispatch(NodeId node_id, raftstore::RaftMessage message);
  void DispatchChunk(NodeId node_id, raftstore::SnapshotChunk chunk);

  size_t snap_chunk_size_;

  mutable std::mutex nodes_lock_;
  std::map<NodeId, std::shared_ptr<Node>> nodes_;

  mutable std::mutex filters_lock_;
  std::map<uint64_t, MessageFilter> filters_;
  uint64_t next_filter_id_{1};
  std::set<uint64_t> fault_filters_;

  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};

  utils::ThreadPool delivery_pool_;
};

/// Transport of one node attached to a `LocalNetwork`.
class LocalTransport final : public raftstore::Transport {
 public:
  explicit LocalTransport(LocalNetwork *network) : network_(network) {}

  bool Send(raftstore::RaftMessage message) override { return network_->Deliver(std::move(message)); }

 private:
  LocalNetwork *network_;
};

}  // namespace rangekv::io
