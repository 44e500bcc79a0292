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

#include "io/local_transport.hpp"

#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

namespace rangekv::io {

LocalNetwork::LocalNetwork(const size_t snap_chunk_size)
    : snap_chunk_size_(snap_chunk_size), delivery_pool_(1, "local_net") {}

LocalNetwork::~LocalNetwork() { delivery_pool_.ShutDown(); }

void LocalNetwork::RegisterNode(const NodeId node_id, Handler handler) {
  auto node = std::make_shared<Node>();
  node->handler = std::move(handler);
  std::lock_guard guard(nodes_lock_);
  nodes_[node_id] = std::move(node);
}

void LocalNetwork::UnregisterNode(const NodeId node_id) {
  std::shared_ptr<Node> node;
  {
    std::lock_guard guard(nodes_lock_);
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) return;
    node = std::move(it->second);
    nodes_.erase(it);
  }
  std::lock_guard call_guard(node->call_lock);
  node->active = false;
}

std::shared_ptr<LocalNetwork::Node> LocalNetwork::FindNode(const NodeId node_id) const {
  std::lock_guard guard(nodes_lock_);
  auto it = nodes_.find(node_id);
  if (it == nodes_.end()) return nullptr;
  return it->second;
}

bool LocalNetwork::Allowed(const raftstore::RaftMessage &message) const {
  std::lock_guard guard(filters_lock_);
  for (const auto &[id, filter] : filters_) {
    if (!filter(message)) return false;
  }
  return true;
}

bool LocalNetwork::Deliver(raftstore::RaftMessage message) {
  const auto to_node = message.to_peer.node_id;
  if (!FindNode(to_node)) return false;

  if (!Allowed(message)) {
    dropped_.fetch_add(1, std::memory_order_acq_rel);
    return true;
  }

  if (std::holds_alternative<raft::InstallSnapshot>(message.message.payload)) {
    auto chunks = raftstore::SplitSnapshotMessage(message, snap_chunk_size_);
    for (auto &chunk : chunks) {
      if (!delivery_pool_.AddTask(
              [this, to_node, chunk = std::move(chunk)]() mutable { DispatchChunk(to_node, std::move(chunk)); })) {
        return false;
      }
    }
    return true;
  }

  return delivery_pool_.AddTask(
      [this, to_node, message = std::move(message)]() mutable { Dispatch(to_node, std::move(message)); });
}

void LocalNetwork::Dispatch(const NodeId node_id, raftstore::RaftMessage message) {
  auto node = FindNode(node_id);
  if (!node) {
    dropped_.fetch_add(1, std::memory_order_acq_rel);
    return;
  }
  std::lock_guard guard(node->call_lock);
  if (!node->active) return;
  delivered_.fetch_add(1, std::memory_order_acq_rel);
  node->handler(std::move(message));
}

void LocalNetwork::DispatchChunk(const NodeId node_id, raftstore::SnapshotChunk chunk) {
  auto node = FindNode(node_id);
  if (!node) {
    dropped_.fetch_add(1, std::memory_order_acq_rel);
    return;
  }
  std::lock_guard guard(node->call_lock);
  if (!node->active) return;
  auto message = node->assembler.Add(std::move(chunk));
  if (!message) return;
  spdlog::debug("Snapshot for shard {} assembled on node {}", message->shard_id, node_id);
  delivered_.fetch_add(1, std::memory_order_acq_rel);
  node->handler(std::move(*message));
}

uint64_t LocalNetwork::AddFilter(MessageFilter filter) {
  std::lock_guard guard(filters_lock_);
  const auto id = next_filter_id_++;
  filters_.emplace(id, std::move(filter));
  return id;
}

void LocalNetwork::RemoveFilter(const uint64_t filter_id) {
  std::lock_guard guard(filters_lock_);
  filters_.erase(filter_id);
  fault_filters_.erase(filter_id);
}

void LocalNetwork::ClearFilters() {
  std::lock_guard guard(filters_lock_);
  filters_.clear();
  fault_filters_.clear();
}

void LocalNetwork::Partition(const std::set<NodeId> &left, const std::set<NodeId> &right) {
  const auto id = AddFilter([left, right](const raftstore::RaftMessage &message) {
    const auto from = message.from_peer.node_id;
    const auto to = message.to_peer.node_id;
    return !((left.contains(from) && right.contains(to)) || (right.contains(from) && left.contains(to)));
  });
  std::lock_guard guard(filters_lock_);
  fault_filters_.insert(id);
}

void LocalNetwork::Isolate(const NodeId node_id) {
  const auto id = AddFilter([node_id](const raftstore::RaftMessage &message) {
    return message.from_peer.node_id != node_id && message.to_peer.node_id != node_id;
  });
  std::lock_guard guard(filters_lock_);
  fault_filters_.insert(id);
}

void LocalNetwork::Heal() {
  std::lock_guard guard(filters_lock_);
  for (const auto id : fault_filters_) filters_.erase(id);
  fault_filters_.clear();
}

}  // namespace rangekv::io
