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
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include "common/types.hpp"
#include "io/future.hpp"
#include "io/tcp.hpp"
#include "placement/client.hpp"
#include "raftstore/command.hpp"
#include "server/kv_service.hpp"
#include "server/protocol.hpp"

namespace rangekv::client {

/**
 * Delivers a request to the node hosting the addressed replica and returns
 * its result. An unreachable node yields `common::TimedOut`.
 */
class KvConnector {
 public:
  KvConnector() = default;
  KvConnector(const KvConnector &) = delete;
  KvConnector &operator=(const KvConnector &) = delete;
  KvConnector(KvConnector &&) = delete;
  KvConnector &operator=(KvConnector &&) = delete;
  virtual ~KvConnector() = default;

  virtual raftstore::CommandResult Call(common::NodeId node_id, server::ClientRequest request) = 0;
};

/// Calls the services of nodes running in the same process.
class LocalConnector final : public KvConnector {
 public:
  void Register(common::NodeId node_id, server::KvService *service);
  void Unregister(common::NodeId node_id);

  raftstore::CommandResult Call(common::NodeId node_id, server::ClientRequest request) override;

 private:
  std::mutex lock_;
  std::map<common::NodeId, server::KvService *> services_;
};

/**
 * Calls nodes over TCP, one connection per node. Node addresses come from
 * placement.
 */
class TcpConnector final : public KvConnector {
 public:
  TcpConnector(placement::PlacementClient *placement, std::chrono::milliseconds timeout, size_t io_threads = 1);
  ~TcpConnector() override;

  raftstore::CommandResult Call(common::NodeId node_id, server::ClientRequest request) override;

 private:
  /// Requests waiting for their response, shared with the connection
  /// callbacks.
  struct Pending {
    std::mutex lock;
    std::map<uint64_t, io::Promise<raftstore::CommandResult>> promises;
    std::map<uint64_t, std::weak_ptr<io::Connection>> owners;
  };

  std::shared_ptr<io::Connection> GetConnection(common::NodeId node_id);

  placement::PlacementClient *placement_;
  std::chrono::milliseconds timeout_;
  io::EventLoop loop_;
  std::shared_ptr<Pending> pending_;
  std::atomic<uint64_t> next_request_id_{1};

  std::mutex lock_;
  std::map<common::NodeId, std::shared_ptr<io::Connection>> connections_;
};

}  // namespace rangekv::client
