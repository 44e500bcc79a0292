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

#include <cstdint>
#include <string>
#include <string_view>

#include "slk/serialization.hpp"

namespace rangekv::io {

enum class PacketType : uint8_t {
  RAFT_MESSAGE,
  SNAPSHOT_CHUNK,
  REQUEST,
  RESPONSE,
};

std::string_view PacketTypeToString(PacketType type);

/// Unit of exchange on a connection, carried in one frame. The body is the
/// SLK encoding of whatever the type says.
struct Packet {
  PacketType type{PacketType::RAFT_MESSAGE};
  /// Pairs a response with its request, unused for peer traffic.
  uint64_t request_id{0};
  std::string body;
};

/// Frame bytes of `packet`, ready to be written to a socket.
std::string EncodePacket(const Packet &packet);

/// @throw slk::SlkDecodeException
Packet DecodePacket(std::string_view payload);

void Save(const Packet &obj, slk::Builder *builder);
void Load(Packet *obj, slk::Reader *reader);

}  // namespace rangekv::io
