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

#include "io/tcp_transport.hpp"

#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "io/errors.hpp"
#include "slk/serialization.hpp"

namespace rangekv::io {

TcpTransport::TcpTransport(EventLoop *loop, placement::PlacementClient *placement, const size_t snap_chunk_size)
    : loop_(loop),
      placement_(placement),
      snap_chunk_size_(snap_chunk_size),
      connections_(std::make_shared<Connections>()) {}

TcpTransport::~TcpTransport() { Close(); }

void TcpTransport::SetAddress(const common::NodeId node_id, std::string address) {
  auto endpoint = ParseEndpoint(address);
  std::lock_guard guard(lock_);
  addresses_[node_id] = std::move(endpoint);
}

std::optional<Endpoint> TcpTransport::ResolveNode(const common::NodeId node_id) {
  {
    std::lock_guard guard(lock_);
    if (auto it = addresses_.find(node_id); it != addresses_.end()) return it->second;
  }
  auto node = placement_->GetNode(node_id);
  if (node.HasError()) {
    spdlog::warn("Can't resolve node {}: {}", node_id, placement::PlacementErrorToString(node.GetError()));
    return std::nullopt;
  }
  if (node->address.empty()) return std::nullopt;
  try {
    auto endpoint = ParseEndpoint(node->address);
    std::lock_guard guard(lock_);
    addresses_[node_id] = endpoint;
    return endpoint;
  } catch (const InvalidAddressException &e) {
    spdlog::error("Node {} registered an invalid address: {}", node_id, e.what());
    return std::nullopt;
  }
}

std::shared_ptr<Connection> TcpTransport::GetConnection(const common::NodeId node_id) {
  {
    std::lock_guard guard(connections_->lock);
    if (connections_->closed) return nullptr;
    if (auto it = connections_->open.find(node_id); it != connections_->open.end() && it->second->IsOpen()) {
      return it->second;
    }
  }

  auto endpoint = ResolveNode(node_id);
  if (!endpoint) return nullptr;

  std::lock_guard guard(connections_->lock);
  if (connections_->closed) return nullptr;
  auto &slot = connections_->open[node_id];
  if (slot && slot->IsOpen()) return slot;

  // Outgoing connections only carry requests, anything received is ignored.
  std::weak_ptr<Connections> weak_connections = connections_;
  slot = std::make_shared<Connection>(
      loop_->context(),
      [node_id](Packet packet, const std::shared_ptr<Connection> & /*conn*/) {
        spdlog::debug("Ignoring {} packet from node {}", PacketTypeToString(packet.type), node_id);
      },
      [weak_connections, node_id](const std::shared_ptr<Connection> &conn) {
        auto connections = weak_connections.lock();
        if (!connections) return;
        std::lock_guard guard(connections->lock);
        if (auto it = connections->open.find(node_id); it != connections->open.end() && it->second == conn) {
          connections->open.erase(it);
        }
      });
  spdlog::debug("Connecting to node {} at {}", node_id, endpoint->ToString());
  slot->Connect(*endpoint);
  return slot;
}

bool TcpTransport::Send(raftstore::RaftMessage message) {
  auto connection = GetConnection(message.to_peer.node_id);
  if (!connection) return false;

  if (std::holds_alternative<raft::InstallSnapshot>(message.message.payload)) {
    for (const auto &chunk : raftstore::SplitSnapshotMessage(message, snap_chunk_size_)) {
      if (!connection->Send(Packet{PacketType::SNAPSHOT_CHUNK, 0, slk::SaveToString(chunk)})) return false;
    }
    return true;
  }
  return connection->Send(Packet{PacketType::RAFT_MESSAGE, 0, slk::SaveToString(message)});
}

void TcpTransport::Close() {
  std::map<common::NodeId, std::shared_ptr<Connection>> connections;
  {
    std::lock_guard guard(connections_->lock);
    connections_->closed = true;
    connections.swap(connections_->open);
  }
  for (auto &[node_id, connection] : connections) connection->Close();
}

bool RaftPacketReceiver::Handle(const Packet &packet) {
  switch (packet.type) {
    case PacketType::RAFT_MESSAGE: {
      raftstore::RaftMessage message;
      slk::LoadFromString(packet.body, &message);
      handler_(std::move(message));
      return true;
    }
    case PacketType::SNAPSHOT_CHUNK: {
      raftstore::SnapshotChunk chunk;
      slk::LoadFromString(packet.body, &chunk);
      std::optional<raftstore::RaftMessage> message;
      {
        std::lock_guard guard(lock_);
        message = assembler_.Add(std::move(chunk));
      }
      if (message) handler_(std::move(*message));
      return true;
    }
    case PacketType::REQUEST:
    case PacketType::RESPONSE:
      return false;
  }
  return false;
}

}  // namespace rangekv::io
