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

/// @file
///
/// Framed packet connections over TCP. All socket work runs on the threads
/// of an `EventLoop`; every connection and listener serializes its handlers
/// on its own strand, so callbacks of one connection never run concurrently.
#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include "io/crc_frame.hpp"
#include "io/packet.hpp"

namespace rangekv::io {

struct Endpoint {
  std::string host;
  uint16_t port{0};

  std::string ToString() const;
};

/// Parses "host:port".
/// @throw InvalidAddressException
Endpoint ParseEndpoint(std::string_view address);

/**
 * Owns the io_context and the threads running it.
 */
class EventLoop {
 public:
  EventLoop(size_t thread_count, std::string name);

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;
  EventLoop(EventLoop &&) = delete;
  EventLoop &operator=(EventLoop &&) = delete;

  ~EventLoop();

  /// Cancels outstanding work and joins the threads.
  void Stop();

  boost::asio::io_context &context() { return context_; }

 private:
  boost::asio::io_context context_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::vector<std::jthread> threads_;
  std::string name_;
  std::once_flag stopped_;
};

/**
 * One TCP stream carrying frames of packets in both directions. Sending is
 * possible from any thread, packets are written in the order `Send` accepted
 * them.
 */
class Connection : public std::enable_shared_from_this<Connection> {
 public:
  using PacketHandler = std::function<void(Packet, const std::shared_ptr<Connection> &)>;
  using CloseHandler = std::function<void(const std::shared_ptr<Connection> &)>;

  /// Packets queued for writing beyond this size make `Send` fail.
  static constexpr size_t kDefaultMaxQueuedBytes = 64ULL << 20U;

  Connection(boost::asio::io_context &context, PacketHandler on_packet, CloseHandler on_close,
             size_t max_queued_bytes = kDefaultMaxQueuedBytes);
  Connection(boost::asio::io_context &context, boost::asio::ip::tcp::socket socket, PacketHandler on_packet,
             CloseHandler on_close, size_t max_queued_bytes = kDefaultMaxQueuedBytes);

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;
  Connection(Connection &&) = delete;
  Connection &operator=(Connection &&) = delete;

  ~Connection() = default;

  /// Starts reading from an accepted socket.
  void Start();

  /// Resolves and connects asynchronously, then starts reading. Packets sent
  /// before the connection is established are queued.
  void Connect(const Endpoint &endpoint);

  /// Returns false when the connection is closed or its queue is full.
  bool Send(const Packet &packet);

  void Close();

  bool IsOpen() const;

  const std::string &peer_address() const { return peer_address_; }

 private:
  void DoRead();
  void DoWrite();
  void HandleError(std::string_view operation, const boost::system::error_code &error);
  void CloseOnStrand();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::ip::tcp::resolver resolver_;
  PacketHandler on_packet_;
  CloseHandler on_close_;
  size_t max_queued_bytes_;
  std::string peer_address_;

  std::array<char, 64ULL << 10U> read_buffer_;
  FrameDecoder decoder_;

  mutable std::mutex lock_;
  std::deque<std::string> write_queue_;
  size_t queued_bytes_{0};
  bool connected_{false};
  bool writing_{false};
  bool closed_{false};
};

/**
 * Accepts connections on an endpoint and hands them the packet handler.
 */
class Listener : public std::enable_shared_from_this<Listener> {
 public:
  /// @throw NetworkException when the endpoint can't be bound.
  Listener(boost::asio::io_context &context, const Endpoint &endpoint, Connection::PacketHandler on_packet);

  Listener(const Listener &) = delete;
  Listener &operator=(const Listener &) = delete;
  Listener(Listener &&) = delete;
  Listener &operator=(Listener &&) = delete;

  ~Listener() = default;

  void Start();

  /// Stops accepting and closes every accepted connection.
  void Stop();

  /// Port actually bound, useful when listening on port 0.
  uint16_t port() const { return port_; }

 private:
  void DoAccept();

  boost::asio::io_context &context_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ip::tcp::acceptor acceptor_;
  Connection::PacketHandler on_packet_;
  uint16_t port_{0};

  std::mutex lock_;
  std::set<std::shared_ptr<Connection>> connections_;
  bool stopped_{false};
};

}  // namespace rangekv::io
