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

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "common/types.hpp"
#include "io/tcp.hpp"
#include "io/tcp_transport.hpp"
#include "kvstore/kvstore.hpp"
#include "placement/client.hpp"
#include "raftstore/config.hpp"
#include "raftstore/store.hpp"
#include "server/kv_service.hpp"
#include "utils/exceptions.hpp"
#include "utils/thread_pool.hpp"

namespace rangekv::server {

class NodeException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(NodeException)
};

struct NodeConfig {
  common::NodeId node_id{common::kInvalidId};
  std::filesystem::path data_directory;
  /// host:port for peer and client traffic.
  std::string listen_address{"127.0.0.1:20160"};
  /// Address other nodes and clients use, the listen address when empty.
  std::string advertise_address;
  size_t io_threads{2};
  size_t request_threads{4};
  std::chrono::milliseconds request_timeout{5000};
  raftstore::Config raftstore;
};

/**
 * A storage node serving over TCP: the store, its engine, the peer transport
 * and the client request handler.
 */
class Node final {
 public:
  /// @throw kvstore::KVStoreError, raftstore::RaftstoreConfigException
  Node(NodeConfig config, placement::PlacementClient *placement);

  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;
  Node(Node &&) = delete;
  Node &operator=(Node &&) = delete;

  ~Node();

  /// Registers the node with placement, creates the first shard when the
  /// cluster isn't bootstrapped yet, then starts listening and the replicas.
  /// @throw NodeException, io::NetworkException
  void Start();

  void Stop();

  uint16_t port() const;
  raftstore::Store &store() { return store_; }
  KvService &service() { return service_; }

 private:
  void CheckIdent();
  void BootstrapCluster(const placement::NodeMeta &self);
  void OnPacket(io::Packet packet, const std::shared_ptr<io::Connection> &connection);
  void HandleRequest(const io::Packet &packet, const std::shared_ptr<io::Connection> &connection);

  NodeConfig config_;
  placement::PlacementClient *placement_;

  kvstore::KVStore engine_;
  io::EventLoop loop_;
  io::TcpTransport transport_;
  raftstore::Store store_;
  KvService service_;
  io::RaftPacketReceiver receiver_;
  utils::ThreadPool request_pool_;
  std::shared_ptr<io::Listener> listener_;
  bool started_{false};
};

}  // namespace rangekv::server
