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

#include "client/connector.hpp"

#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "io/errors.hpp"
#include "slk/serialization.hpp"
#include "slk/streams.hpp"

namespace rangekv::client {

void LocalConnector::Register(const common::NodeId node_id, server::KvService *service) {
  std::lock_guard guard(lock_);
  services_[node_id] = service;
}

void LocalConnector::Unregister(const common::NodeId node_id) {
  std::lock_guard guard(lock_);
  services_.erase(node_id);
}

raftstore::CommandResult LocalConnector::Call(const common::NodeId node_id, server::ClientRequest request) {
  server::KvService *service = nullptr;
  {
    std::lock_guard guard(lock_);
    if (auto it = services_.find(node_id); it != services_.end()) service = it->second;
  }
  if (!service) return raftstore::ErrorResult(common::TimedOut{});
  return service->Handle(std::move(request));
}

TcpConnector::TcpConnector(placement::PlacementClient *placement, const std::chrono::milliseconds timeout,
                           const size_t io_threads)
    : placement_(placement), timeout_(timeout), loop_(io_threads, "client_io"), pending_(std::make_shared<Pending>()) {}

TcpConnector::~TcpConnector() {
  std::map<common::NodeId, std::shared_ptr<io::Connection>> connections;
  {
    std::lock_guard guard(lock_);
    connections.swap(connections_);
  }
  for (auto &[node_id, connection] : connections) connection->Close();
  loop_.Stop();
  std::lock_guard guard(pending_->lock);
  for (auto &[id, promise] : pending_->promises) promise.Fill(raftstore::ErrorResult(common::TimedOut{}));
  pending_->promises.clear();
  pending_->owners.clear();
}

std::shared_ptr<io::Connection> TcpConnector::GetConnection(const common::NodeId node_id) {
  {
    std::lock_guard guard(lock_);
    if (auto it = connections_.find(node_id); it != connections_.end() && it->second->IsOpen()) return it->second;
  }
  auto node = placement_->GetNode(node_id);
  if (node.HasError() || node->address.empty()) {
    spdlog::warn("No address known for node {}", node_id);
    return nullptr;
  }
  io::Endpoint endpoint;
  try {
    endpoint = io::ParseEndpoint(node->address);
  } catch (const io::InvalidAddressException &e) {
    spdlog::error("Node {} has an invalid address: {}", node_id, e.what());
    return nullptr;
  }

  std::weak_ptr<Pending> weak_pending = pending_;
  auto on_packet = [weak_pending](io::Packet packet, const std::shared_ptr<io::Connection> & /*conn*/) {
    if (packet.type != io::PacketType::RESPONSE) return;
    auto pending = weak_pending.lock();
    if (!pending) return;
    server::ClientResponse response;
    try {
      slk::LoadFromString(packet.body, &response);
    } catch (const slk::SlkDecodeException &e) {
      response = common::Error{common::InvalidRequest{e.what()}};
    } catch (const slk::SlkReaderException &e) {
      response = common::Error{common::InvalidRequest{e.what()}};
    }
    std::optional<io::Promise<raftstore::CommandResult>> promise;
    {
      std::lock_guard guard(pending->lock);
      auto it = pending->promises.find(packet.request_id);
      if (it == pending->promises.end()) return;
      promise.emplace(std::move(it->second));
      pending->promises.erase(it);
      pending->owners.erase(packet.request_id);
    }
    promise->Fill(server::FromClientResponse(std::move(response)));
  };
  // Requests in flight on a closed connection get no response.
  auto on_close = [weak_pending](const std::shared_ptr<io::Connection> &conn) {
    auto pending = weak_pending.lock();
    if (!pending) return;
    std::vector<io::Promise<raftstore::CommandResult>> failed;
    {
      std::lock_guard guard(pending->lock);
      for (auto it = pending->owners.begin(); it != pending->owners.end();) {
        if (it->second.lock() == conn || it->second.expired()) {
          if (auto promise = pending->promises.find(it->first); promise != pending->promises.end()) {
            failed.push_back(std::move(promise->second));
            pending->promises.erase(promise);
          }
          it = pending->owners.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto &promise : failed) promise.Fill(raftstore::ErrorResult(common::TimedOut{}));
  };

  std::lock_guard guard(lock_);
  auto &slot = connections_[node_id];
  if (slot && slot->IsOpen()) return slot;
  slot = std::make_shared<io::Connection>(loop_.context(), std::move(on_packet), std::move(on_close));
  slot->Connect(endpoint);
  return slot;
}

raftstore::CommandResult TcpConnector::Call(const common::NodeId node_id, server::ClientRequest request) {
  auto connection = GetConnection(node_id);
  if (!connection) return raftstore::ErrorResult(common::TimedOut{});

  const auto request_id = next_request_id_.fetch_add(1, std::memory_order_acq_rel);
  auto [future, promise] = io::FuturePromisePair<raftstore::CommandResult>();
  {
    std::lock_guard guard(pending_->lock);
    pending_->promises.emplace(request_id, std::move(promise));
    pending_->owners.emplace(request_id, connection);
  }

  auto forget = [this, request_id] {
    std::optional<io::Promise<raftstore::CommandResult>> promise;
    {
      std::lock_guard guard(pending_->lock);
      auto it = pending_->promises.find(request_id);
      if (it == pending_->promises.end()) return;
      promise.emplace(std::move(it->second));
      pending_->promises.erase(it);
      pending_->owners.erase(request_id);
    }
    promise->Fill(raftstore::ErrorResult(common::TimedOut{}));
  };

  if (!connection->Send(io::Packet{io::PacketType::REQUEST, request_id, slk::SaveToString(request)})) {
    forget();
  }
  auto result = future.WaitFor(timeout_);
  if (result) return std::move(*result);
  forget();
  return raftstore::ErrorResult(common::TimedOut{});
}

}  // namespace rangekv::client
