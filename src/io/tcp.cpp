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

#include "io/tcp.hpp"

#include <charconv>
#include <limits>
#include <utility>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>

#include "io/errors.hpp"
#include "slk/streams.hpp"
#include "utils/thread.hpp"

namespace rangekv::io {

using boost::asio::ip::tcp;

std::string Endpoint::ToString() const { return fmt::format("{}:{}", host, port); }

Endpoint ParseEndpoint(std::string_view address) {
  const auto colon = address.rfind(':');
  if (colon == std::string_view::npos || colon == 0 || colon + 1 == address.size()) {
    throw InvalidAddressException("Invalid address '{}', expected host:port", address);
  }
  auto host = address.substr(0, colon);
  const auto port_str = address.substr(colon + 1);
  // Bracketed IPv6 literal.
  if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  uint32_t port = 0;
  const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
  if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port > std::numeric_limits<uint16_t>::max()) {
    throw InvalidAddressException("Invalid port in address '{}'", address);
  }
  return Endpoint{std::string{host}, static_cast<uint16_t>(port)};
}

EventLoop::EventLoop(const size_t thread_count, std::string name)
    : work_guard_(boost::asio::make_work_guard(context_)), name_(std::move(name)) {
  threads_.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    threads_.emplace_back([this, i] {
      utils::ThreadSetName(fmt::format("{}_{}", name_, i));
      context_.run();
    });
  }
}

EventLoop::~EventLoop() { Stop(); }

void EventLoop::Stop() {
  std::call_once(stopped_, [this] {
    work_guard_.reset();
    context_.stop();
    threads_.clear();
  });
}

Connection::Connection(boost::asio::io_context &context, PacketHandler on_packet, CloseHandler on_close,
                       const size_t max_queued_bytes)
    : strand_(boost::asio::make_strand(context)),
      socket_(context),
      resolver_(context),
      on_packet_(std::move(on_packet)),
      on_close_(std::move(on_close)),
      max_queued_bytes_(max_queued_bytes) {}

Connection::Connection(boost::asio::io_context &context, tcp::socket socket, PacketHandler on_packet,
                       CloseHandler on_close, const size_t max_queued_bytes)
    : strand_(boost::asio::make_strand(context)),
      socket_(std::move(socket)),
      resolver_(context),
      on_packet_(std::move(on_packet)),
      on_close_(std::move(on_close)),
      max_queued_bytes_(max_queued_bytes),
      connected_(true) {
  boost::system::error_code ec;
  const auto remote = socket_.remote_endpoint(ec);
  if (!ec) peer_address_ = fmt::format("{}:{}", remote.address().to_string(), remote.port());
}

void Connection::Start() {
  boost::asio::post(strand_, [self = shared_from_this()] {
    boost::system::error_code ec;
    self->socket_.set_option(tcp::no_delay(true), ec);
    self->DoRead();
  });
}

void Connection::Connect(const Endpoint &endpoint) {
  peer_address_ = endpoint.ToString();
  resolver_.async_resolve(
      endpoint.host, std::to_string(endpoint.port),
      boost::asio::bind_executor(strand_, [self = shared_from_this()](const boost::system::error_code &ec,
                                                                      const tcp::resolver::results_type &results) {
        if (ec) {
          self->HandleError("resolve", ec);
          return;
        }
        boost::asio::async_connect(
            self->socket_, results,
            boost::asio::bind_executor(self->strand_,
                                       [self](const boost::system::error_code &ec, const tcp::endpoint & /*ep*/) {
                                         if (ec) {
                                           self->HandleError("connect", ec);
                                           return;
                                         }
                                         boost::system::error_code option_ec;
                                         self->socket_.set_option(tcp::no_delay(true), option_ec);
                                         {
                                           std::lock_guard guard(self->lock_);
                                           self->connected_ = true;
                                         }
                                         self->DoWrite();
                                         self->DoRead();
                                       }));
      }));
}

bool Connection::Send(const Packet &packet) {
  auto frame = EncodePacket(packet);
  {
    std::lock_guard guard(lock_);
    if (closed_) return false;
    if (queued_bytes_ + frame.size() > max_queued_bytes_) {
      spdlog::warn("Send queue to {} is full, dropping {} packet", peer_address_, PacketTypeToString(packet.type));
      return false;
    }
    queued_bytes_ += frame.size();
    write_queue_.push_back(std::move(frame));
  }
  boost::asio::post(strand_, [self = shared_from_this()] { self->DoWrite(); });
  return true;
}

void Connection::DoWrite() {
  std::string_view front;
  {
    std::lock_guard guard(lock_);
    if (closed_ || !connected_ || writing_ || write_queue_.empty()) return;
    writing_ = true;
    front = write_queue_.front();
  }
  // The front of the queue stays in place until the write completes.
  boost::asio::async_write(
      socket_, boost::asio::buffer(front.data(), front.size()),
      boost::asio::bind_executor(strand_, [self = shared_from_this()](const boost::system::error_code &ec,
                                                                      size_t /*bytes*/) {
        {
          std::lock_guard guard(self->lock_);
          self->writing_ = false;
          if (!self->write_queue_.empty()) {
            self->queued_bytes_ -= self->write_queue_.front().size();
            self->write_queue_.pop_front();
          }
        }
        if (ec) {
          self->HandleError("write", ec);
          return;
        }
        self->DoWrite();
      }));
}

void Connection::DoRead() {
  socket_.async_read_some(
      boost::asio::buffer(read_buffer_),
      boost::asio::bind_executor(strand_, [self = shared_from_this()](const boost::system::error_code &ec,
                                                                      size_t bytes) {
        if (ec) {
          self->HandleError("read", ec);
          return;
        }
        self->decoder_.Append(self->read_buffer_.data(), bytes);
        try {
          while (auto payload = self->decoder_.Next()) {
            self->on_packet_(DecodePacket(*payload), self);
          }
        } catch (const FrameCorruptException &e) {
          spdlog::error("Closing connection to {}: {}", self->peer_address_, e.what());
          self->CloseOnStrand();
          return;
        } catch (const slk::SlkReaderException &e) {
          spdlog::error("Closing connection to {}, undecodable packet: {}", self->peer_address_, e.what());
          self->CloseOnStrand();
          return;
        } catch (const slk::SlkDecodeException &e) {
          spdlog::error("Closing connection to {}, undecodable packet: {}", self->peer_address_, e.what());
          self->CloseOnStrand();
          return;
        }
        self->DoRead();
      }));
}

void Connection::HandleError(std::string_view operation, const boost::system::error_code &error) {
  if (error == boost::asio::error::operation_aborted) {
    CloseOnStrand();
    return;
  }
  if (error == boost::asio::error::eof) {
    spdlog::debug("Connection to {} closed by the remote side", peer_address_);
  } else {
    spdlog::warn("Connection to {} failed during {}: {}", peer_address_, operation, error.message());
  }
  CloseOnStrand();
}

void Connection::Close() {
  boost::asio::post(strand_, [self = shared_from_this()] { self->CloseOnStrand(); });
}

void Connection::CloseOnStrand() {
  {
    std::lock_guard guard(lock_);
    if (closed_) return;
    // A write in flight still refers to the front of the queue, it is
    // released with the connection.
    closed_ = true;
  }
  boost::system::error_code ec;
  resolver_.cancel();
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  if (on_close_) on_close_(shared_from_this());
}

bool Connection::IsOpen() const {
  std::lock_guard guard(lock_);
  return !closed_;
}

Listener::Listener(boost::asio::io_context &context, const Endpoint &endpoint, Connection::PacketHandler on_packet)
    : context_(context), strand_(boost::asio::make_strand(context)), acceptor_(context), on_packet_(std::move(on_packet)) {
  boost::system::error_code ec;
  const auto address = boost::asio::ip::make_address(endpoint.host, ec);
  if (ec) throw NetworkException("Invalid listen address {}: {}", endpoint.host, ec.message());
  const tcp::endpoint bind_endpoint{address, endpoint.port};

  acceptor_.open(bind_endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_.bind(bind_endpoint, ec);
  if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) throw NetworkException("Can't listen on {}: {}", endpoint.ToString(), ec.message());
  port_ = acceptor_.local_endpoint().port();
  spdlog::info("Listening on {}:{}", endpoint.host, port_);
}

void Listener::Start() {
  boost::asio::post(strand_, [self = shared_from_this()] { self->DoAccept(); });
}

void Listener::DoAccept() {
  acceptor_.async_accept(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code &ec, tcp::socket socket) {
        if (ec) {
          if (ec != boost::asio::error::operation_aborted) {
            spdlog::warn("Accepting a connection failed: {}", ec.message());
          }
          return;
        }
        std::weak_ptr<Listener> weak_self = self;
        auto connection = std::make_shared<Connection>(
            self->context_, std::move(socket), self->on_packet_, [weak_self](const std::shared_ptr<Connection> &conn) {
              if (auto listener = weak_self.lock()) {
                std::lock_guard guard(listener->lock_);
                listener->connections_.erase(conn);
              }
            });
        {
          std::lock_guard guard(self->lock_);
          if (self->stopped_) return;
          self->connections_.insert(connection);
        }
        spdlog::debug("Accepted connection from {}", connection->peer_address());
        connection->Start();
        self->DoAccept();
      }));
}

void Listener::Stop() {
  std::set<std::shared_ptr<Connection>> connections;
  {
    std::lock_guard guard(lock_);
    if (stopped_) return;
    stopped_ = true;
    connections.swap(connections_);
  }
  boost::asio::post(strand_, [self = shared_from_this()] {
    boost::system::error_code ec;
    self->acceptor_.close(ec);
  });
  for (const auto &connection : connections) connection->Close();
}

}  // namespace rangekv::io
