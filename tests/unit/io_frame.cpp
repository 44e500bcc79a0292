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


#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "io/crc_frame.hpp"
#include "io/errors.hpp"
#include "io/packet.hpp"
#include "io/tcp.hpp"
#include "utils/exceptions.hpp"
#include "utils/codec.hpp"

using namespace rangekv;
using namespace rangekv::io;

TEST(FrameDecoder, FramesSplitAcrossReads) {
  const std::vector<std::string> payloads{"first", "", std::string(100000, 'x'), "last"};
  std::string stream;
  for (const auto &payload : payloads) stream += EncodeFrame(payload);

  FrameDecoder decoder;
  std::vector<std::string> decoded;
  // Feed the stream in uneven pieces, like a socket would.
  size_t offset = 0;
  size_t piece = 1;
  while (offset < stream.size()) {
    const auto size = std::min(piece, stream.size() - offset);
    decoder.Append(stream.data() + offset, size);
    offset += size;
    piece = piece * 3 + 1;
    while (auto frame = decoder.Next()) decoded.push_back(std::move(*frame));
  }
  EXPECT_EQ(decoded, payloads);
  EXPECT_EQ(decoder.Buffered(), 0);
}

TEST(FrameDecoder, IncompleteFrameWaits) {
  const auto frame = EncodeFrame("payload");
  ASSERT_EQ(frame.size(), kFrameHeaderSize + 7);
  FrameDecoder decoder;
  decoder.Append(frame.data(), frame.size() - 1);
  EXPECT_FALSE(decoder.Next());
  EXPECT_EQ(decoder.Buffered(), frame.size() - 1);
  decoder.Append(frame.data() + frame.size() - 1, 1);
  EXPECT_EQ(decoder.Next(), "payload");
}

TEST(FrameDecoder, CorruptFrames) {
  {
    auto frame = EncodeFrame("payload");
    frame.back() ^= 0x01;
    FrameDecoder decoder;
    decoder.Append(frame.data(), frame.size());
    EXPECT_THROW(decoder.Next(), FrameCorruptException);
  }
  {
    std::string header(4, '\0');
    utils::EncodeU64(kMaxFramePayloadSize + 1, &header);
    FrameDecoder decoder;
    decoder.Append(header.data(), header.size());
    EXPECT_THROW(decoder.Next(), FrameCorruptException);
  }
}

TEST(Packet, EncodeDecode) {
  const Packet packet{.type = PacketType::RESPONSE, .request_id = 77, .body = std::string(5000, 'b')};
  const auto frame = EncodePacket(packet);

  FrameDecoder decoder;
  decoder.Append(frame.data(), frame.size());
  const auto payload = decoder.Next();
  ASSERT_TRUE(payload);
  const auto decoded = DecodePacket(*payload);
  EXPECT_EQ(decoded.type, PacketType::RESPONSE);
  EXPECT_EQ(decoded.request_id, 77);
  EXPECT_EQ(decoded.body, packet.body);
  EXPECT_EQ(PacketTypeToString(decoded.type), "RESPONSE");

  EXPECT_THROW(DecodePacket(payload->substr(0, payload->size() - 1)), utils::BasicException);
}

TEST(Endpoint, Parse) {
  const auto endpoint = ParseEndpoint("127.0.0.1:20160");
  EXPECT_EQ(endpoint.host, "127.0.0.1");
  EXPECT_EQ(endpoint.port, 20160);
  EXPECT_EQ(endpoint.ToString(), "127.0.0.1:20160");

  const auto v6 = ParseEndpoint("[::1]:80");
  EXPECT_EQ(v6.host, "::1");
  EXPECT_EQ(v6.port, 80);

  for (const auto *address : {"localhost", ":80", "host:", "host:port", "host:70000", "host:80x"}) {
    EXPECT_THROW(ParseEndpoint(address), InvalidAddressException) << address;
  }
}
