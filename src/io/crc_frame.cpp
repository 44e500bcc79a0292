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

#include "io/crc_frame.hpp"

#include "io/errors.hpp"
#include "utils/codec.hpp"
#include "utils/crc.hpp"

namespace rangekv::io {

namespace {

constexpr size_t kCompactThreshold = 64ULL << 10U;

void EncodeU32(uint32_t value, std::string *out) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    out->push_back(static_cast<char>((value >> static_cast<uint32_t>(shift)) & 0xFFU));
  }
}

uint32_t DecodeU32(std::string_view input) {
  uint32_t value = 0;
  for (size_t i = 0; i < 4; ++i) {
    value = (value << 8U) | static_cast<uint8_t>(input[i]);
  }
  return value;
}

}  // namespace

std::string EncodeFrame(std::string_view payload) {
  std::string frame;
  frame.reserve(kFrameHeaderSize + payload.size());
  EncodeU32(utils::Crc32(payload), &frame);
  utils::EncodeU64(payload.size(), &frame);
  frame.append(payload);
  return frame;
}

void FrameDecoder::Append(const char *data, const size_t size) {
  if (offset_ > 0 && offset_ >= kCompactThreshold) {
    buffer_.erase(0, offset_);
    offset_ = 0;
  }
  buffer_.append(data, size);
}

std::optional<std::string> FrameDecoder::Next() {
  std::string_view input{buffer_};
  input.remove_prefix(offset_);
  if (input.size() < kFrameHeaderSize) return std::nullopt;

  const uint32_t crc = DecodeU32(input);
  auto len_bytes = input.substr(4, 8);
  const uint64_t len = utils::DecodeU64(&len_bytes);
  if (len > kMaxFramePayloadSize) {
    throw FrameCorruptException("Frame of {} bytes exceeds the limit of {} bytes", len, kMaxFramePayloadSize);
  }
  if (input.size() < kFrameHeaderSize + len) return std::nullopt;

  auto payload = input.substr(kFrameHeaderSize, len);
  if (utils::Crc32(payload) != crc) {
    throw FrameCorruptException("Frame checksum mismatch");
  }
  std::string result{payload};
  offset_ += kFrameHeaderSize + len;
  if (offset_ == buffer_.size()) {
    buffer_.clear();
    offset_ = 0;
  }
  return result;
}

}  // namespace rangekv::io
