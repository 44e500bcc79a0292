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

#include "io/packet.hpp"

#include "io/crc_frame.hpp"

namespace rangekv::io {

std::string_view PacketTypeToString(const PacketType type) {
  switch (type) {
    case PacketType::RAFT_MESSAGE:
      return "RAFT_MESSAGE";
    case PacketType::SNAPSHOT_CHUNK:
      return "SNAPSHOT_CHUNK";
    case PacketType::REQUEST:
      return "REQUEST";
    case PacketType::RESPONSE:
      return "RESPONSE";
  }
  return "UNKNOWN";
}

std::string EncodePacket(const Packet &packet) { return EncodeFrame(slk::SaveToString(packet)); }

Packet DecodePacket(std::string_view payload) {
  Packet packet;
  slk::LoadFromString(payload, &packet);
  return packet;
}

void Save(const Packet &obj, slk::Builder *builder) {
  slk::Save(obj.type, builder);
  slk::Save(obj.request_id, builder);
  slk::Save(obj.body, builder);
}

void Load(Packet *obj, slk::Reader *reader) {
  slk::Load(&obj->type, reader);
  slk::Load(&obj->request_id, reader);
  slk::Load(&obj->body, reader);
}

}  // namespace rangekv::io
