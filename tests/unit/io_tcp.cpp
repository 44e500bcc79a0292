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


#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

#include <gtest/gtest.h>

#include "io/errors.hpp"
#include "io/tcp.hpp"
#include "io/tcp_transport.hpp"
#include "placement/memory_service.hpp"

using namespace rangekv;
using namespace rangekv::io;
using namespace std::chrono_literals;

namespace {

template <typename T>
class Collector {
 public:
  void Add(T item) {
    {
      std::lock_guard guard(lock_);
      items_.push_back(std::move(item));
    }
    cv_.notify_all();
  }

  bool WaitFor(size_t count) {
    std::unique_lock guard(lock_);
    return cv_.wait_for(guard, 5s, [&] { return items_.size() >= count; });
  }

  std::vector<T> Items() {
    std::lock_guard guard(lock_);
    return items_;
  }

 private:
  std::mutex lock_;
  std::condition_variable cv_;
  std::vector<T> items_;
};

}  // namespace

TEST(Tcp, RequestResponseOverLoopback) {
  EventLoop loop(2, "tcp_test");
  auto listener = std::make_shared<Listener>(
      loop.context(), Endpoint{"127.0.0.1", 0}, [](Packet packet, const std::shared_ptr<Connection> &connection) {
        packet.type = PacketType::RESPONSE;
        packet.body = "echo:" + packet.body;
        EXPECT_TRUE(connection->Send(packet));
      });
  listener->Start();
  ASSERT_NE(listener->port(), 0);

  Collector<Packet> responses;
  Collector<bool> closed;
  auto client = std::make_shared<Connection>(
      loop.context(), [&](Packet packet, const std::shared_ptr<Connection> &) { responses.Add(std::move(packet)); },
      [&](const std::shared_ptr<Connection> &) { closed.Add(true); });
  client->Connect(Endpoint{"127.0.0.1", listener->port()});

  // Queued until the connection is up.
  for (uint64_t id = 1; id <= 50; ++id) {
    ASSERT_TRUE(client->Send(Packet{.type = PacketType::REQUEST, .request_id = id, .body = std::to_string(id)}));
  }
  ASSERT_TRUE(responses.WaitFor(50));
  const auto received = responses.Items();
  for (uint64_t i = 0; i < received.size(); ++i) {
    EXPECT_EQ(received[i].request_id, i + 1);
    EXPECT_EQ(received[i].body, "echo:" + std::to_string(i + 1));
  }

  listener->Stop();
  ASSERT_TRUE(closed.WaitFor(1));
  EXPECT_FALSE(client->IsOpen());
  EXPECT_FALSE(client->Send(Packet{}));
  loop.Stop();
}

TEST(Tcp, ConnectFailureClosesTheConnection) {
  EventLoop loop(1, "tcp_test");
  // Nothing listens on the privileged port 1 of the loopback interface.
  const uint16_t port = 1;

  Collector<bool> closed;
  auto client = std::make_shared<Connection>(
      loop.context(), [](Packet, const std::shared_ptr<Connection> &) {},
      [&](const std::shared_ptr<Connection> &) { closed.Add(true); });
  client->Connect(Endpoint{"127.0.0.1", port});
  ASSERT_TRUE(closed.WaitFor(1));
  EXPECT_FALSE(client->IsOpen());
  loop.Stop();
}

TEST(Tcp, ListenOnInvalidAddress) {
  EventLoop loop(1, "tcp_test");
  EXPECT_THROW(Listener(loop.context(), Endpoint{"not an address", 0}, [](Packet, const std::shared_ptr<Connection> &) {}),
               NetworkException);
  loop.Stop();
}

TEST(TcpTransport, DeliversRaftMessagesAndSnapshots) {
  EventLoop loop(2, "tcp_test");
  Collector<raftstore::RaftMessage> inbox;
  RaftPacketReceiver receiver([&](raftstore::RaftMessage message) { inbox.Add(std::move(message)); });
  auto listener = std::make_shared<Listener>(loop.context(), Endpoint{"127.0.0.1", 0},
                                             [&](Packet packet, const std::shared_ptr<Connection> &) {
                                               EXPECT_TRUE(receiver.Handle(packet));
                                             });
  listener->Start();

  placement::MemoryPlacementService placement(1);
  TcpTransport transport(&loop, &placement, 100);
  transport.SetAddress(2, Endpoint{"127.0.0.1", listener->port()}.ToString());

  raftstore::RaftMessage message;
  message.shard_id = 9;
  message.from_peer = common::PeerMeta{.id = 90, .node_id = 1};
  message.to_peer = common::PeerMeta{.id = 91, .node_id = 2};
  message.message = raft::Message{.from = 90, .to = 91, .term = 4, .payload = raft::HeartbeatRequest{.commit = 3}};
  ASSERT_TRUE(transport.Send(message));

  raft::Snapshot snapshot;
  snapshot.data = std::string(1000, 'd');
  snapshot.metadata.index = 12;
  snapshot.metadata.term = 4;
  message.message.payload = raft::InstallSnapshot{snapshot};
  ASSERT_TRUE(transport.Send(message));

  ASSERT_TRUE(inbox.WaitFor(2));
  const auto received = inbox.Items();
  EXPECT_EQ(received[0].shard_id, 9);
  EXPECT_EQ(std::get<raft::HeartbeatRequest>(received[0].message.payload).commit, 3);
  EXPECT_EQ(std::get<raft::InstallSnapshot>(received[1].message.payload).snapshot, snapshot);

  // Unknown nodes can't be reached.
  message.to_peer.node_id = 3;
  EXPECT_FALSE(transport.Send(message));

  EXPECT_FALSE(receiver.Handle(Packet{.type = PacketType::REQUEST}));

  transport.Close();
  listener->Stop();
  loop.Stop();
}
