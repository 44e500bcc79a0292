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
#include <mutex>
#include <string>

#include "common/types.hpp"
#include "io/packet.hpp"
#include "io/tcp.hpp"
#include "placement/client.hpp"
#include "raftstore/message.hpp"
#include "raftstore/snapshot.hpp"
#include "raftstore/transport.hpp"

namespace rangekv::io {

/**
 * Sends envelopes to other nodes over one outgoing connection per node.
 * Node addresses are looked up in placement the first time a node is
 * contacted. A failed connection is dropped and reopened by the next send.
 */
class TcpTransport final : public raftstore::Transport {
 public:
  TcpTransport(EventLoop *loop, placement::PlacementClient *placement, size_t snap_chunk_size);

  TcpTransport(const TcpTransport &) = delete;
  TcpTransport &operator=(const TcpTransport &) = delete;
  TcpTransport(TcpTransport &&) = delete;
  TcpTransport &operator=(TcpTransport &&) = delete;

  ~TcpTransport() override;

  bool Send(raftstore::RaftMessage message) override;

  /// Overrides the address placement reports for `node_id`.
  void SetAddress(common::NodeId node_id, std::string address);

  void Close();

 private:
  std::shared_ptr<Connection> GetConnection(common::NodeId node_id);
  std::optional<Endpoint> ResolveNode(common::NodeId node_id);

  EventLoop *loop_;
  placement::PlacementClient *placement_;
  size_t snap_chunk_size_;

  /// Shared with the close handlers of the connections, which may run after
  /// the transport is gone.
  struct Connections {
    std::mutex lock;
    std::map<common::NodeId, std::shared_ptr<Connection>> open;
    bool closed{false};
  };

  std::mutex lock_;
  std::map<common::NodeId, Endpoint> addresses_;
  std::shared_ptr<Connections> connections_;
};

/**
 * Turns peer traffic received on any connection back into envelopes,
 * reassembling chunked snapshots.
 */
class RaftPacketReceiver {
 public:
  using Handler = std::function<void(raftstore::RaftMessage)>;

  explicit RaftPacketReceiver(Handler handler) : handler_(std::move(handler)) {}

  /// Returns false for packets which aren't peer traffic.
  /// @throw slk::SlkDecodeException
  bool Handle(const Packet &packet);

 private:
  Handler handler_;
  std::mutex lock_;
  raftstore::SnapshotAssembler assembler_;
};

}  // namespace rangekv::io
