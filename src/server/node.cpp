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

#include "server/node.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "common/keys.hpp"
#include "server/protocol.hpp"
#include "slk/serialization.hpp"
#include "slk/streams.hpp"

namespace rangekv::server {

Node::Node(NodeConfig config, placement::PlacementClient *placement)
    : config_(std::move(config)),
      placement_(placement),
      engine_(config_.data_directory),
      loop_(config_.io_threads, "node_io"),
      transport_(&loop_, placement_, config_.raftstore.snap_chunk_size),
      store_(config_.raftstore, config_.node_id, &engine_, &transport_, placement_),
      service_(&store_, config_.request_timeout),
      receiver_([this](raftstore::RaftMessage message) { store_.OnRaftMessage(std::move(message)); }),
      request_pool_(config_.request_threads, "node_request") {
  if (config_.advertise_address.empty()) config_.advertise_address = config_.listen_address;
}

Node::~Node() { Stop(); }

void Node::CheckIdent() {
  const auto key = common::keys::NodeIdentKey();
  const auto cluster_id = placement_->ClusterId();
  if (auto stored = engine_.Get(kvstore::ColumnFamily::RAFT, key)) {
    common::NodeIdent ident;
    slk::LoadFromString(*stored, &ident);
    if (ident.cluster_id != cluster_id || ident.node_id != config_.node_id) {
      throw NodeException("Data directory {} belongs to node {} of cluster {}, not node {} of cluster {}",
                          config_.data_directory.string(), ident.node_id, ident.cluster_id, config_.node_id,
                          cluster_id);
    }
    return;
  }
  const common::NodeIdent ident{.cluster_id = cluster_id, .node_id = config_.node_id};
  if (!engine_.Put(kvstore::ColumnFamily::RAFT, key, slk::SaveToString(ident), true)) {
    throw NodeException("Can't write the identity of node {}", config_.node_id);
  }
}

void Node::BootstrapCluster(const placement::NodeMeta &self) {
  {
    auto it = engine_.NewIterator(kvstore::ColumnFamily::RAFT, common::keys::ShardMetaMinKey(),
                                  common::keys::ShardMetaMaxKey());
    it.SeekToFirst();
    if (it.Valid()) {
      throw NodeException("Data directory {} holds shards of a cluster placement has no record of",
                          config_.data_directory.string());
    }
  }
  auto shard_id = placement_->AllocId();
  auto peer_id = placement_->AllocId();
  if (shard_id.HasError() || peer_id.HasError()) {
    throw NodeException("Can't allocate ids for the first shard");
  }
  common::ShardMeta first;
  first.id = *shard_id;
  first.peers.push_back(common::PeerMeta{.id = *peer_id, .node_id = config_.node_id});

  raftstore::Store::BootstrapShard(&engine_, first);
  auto result = placement_->Bootstrap(self, first);
  if (result.HasError() && result.GetError() != placement::PlacementError::ALREADY_BOOTSTRAPPED) {
    throw NodeException("Bootstrapping the cluster failed: {}", placement::PlacementErrorToString(result.GetError()));
  }
  spdlog::info("Bootstrapped the cluster with shard {} on node {}", first.id, config_.node_id);
}

void Node::Start() {
  if (started_) return;
  CheckIdent();

  const placement::NodeMeta self{.id = config_.node_id, .address = config_.advertise_address};
  if (!placement_->IsBootstrapped()) {
    BootstrapCluster(self);
  } else if (auto result = placement_->PutNode(self); result.HasError()) {
    throw NodeException("Registering node {} failed: {}", config_.node_id,
                        placement::PlacementErrorToString(result.GetError()));
  }

  listener_ = std::make_shared<io::Listener>(
      loop_.context(), io::ParseEndpoint(config_.listen_address),
      [this](io::Packet packet, const std::shared_ptr<io::Connection> &connection) {
        OnPacket(std::move(packet), connection);
      });
  listener_->Start();
  store_.Start();
  started_ = true;
  spdlog::info("Node {} serving on {}", config_.node_id, config_.advertise_address);
}

void Node::Stop() {
  if (listener_) listener_->Stop();
  transport_.Close();
  store_.Stop();
  request_pool_.ShutDown();
  loop_.Stop();
  started_ = false;
}

uint16_t Node::port() const { return listener_ ? listener_->port() : 0; }

void Node::OnPacket(io::Packet packet, const std::shared_ptr<io::Connection> &connection) {
  if (receiver_.Handle(packet)) return;
  if (packet.type != io::PacketType::REQUEST) {
    spdlog::warn("Unexpected {} packet from {}", io::PacketTypeToString(packet.type), connection->peer_address());
    return;
  }
  const auto request_id = packet.request_id;
  // Requests wait for replication, they must not hold up the socket threads.
  if (!request_pool_.AddTask([this, packet = std::move(packet), connection] { HandleRequest(packet, connection); })) {
    spdlog::warn("Dropping request {} from {}, the node is stopping", request_id, connection->peer_address());
  }
}

void Node::HandleRequest(const io::Packet &packet, const std::shared_ptr<io::Connection> &connection) {
  ClientResponse response;
  try {
    ClientRequest request;
    slk::LoadFromString(packet.body, &request);
    response = ToClientResponse(service_.Handle(std::move(request)));
  } catch (const slk::SlkDecodeException &e) {
    response = common::Error{common::InvalidRequest{e.what()}};
  } catch (const slk::SlkReaderException &e) {
    response = common::Error{common::InvalidRequest{e.what()}};
  }
  if (!connection->Send(io::Packet{io::PacketType::RESPONSE, packet.request_id, slk::SaveToString(response)})) {
    spdlog::debug("Response {} to {} was not sent", packet.request_id, connection->peer_address());
  }
}

}  // namespace rangekv::server
