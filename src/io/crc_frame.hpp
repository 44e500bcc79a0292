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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rangekv::io {

/// Protocol:
///   crc32:        4 bytes, big endian, over the buffer
///   len:          8 bytes, big endian
///   buffer:       <len bytes>
inline constexpr size_t kFrameHeaderSize = 12;
inline constexpr uint64_t kMaxFramePayloadSize = 256ULL << 20U;

std::string EncodeFrame(std::string_view payload);

/**
 * Cuts a byte stream into frames. Bytes are appended as they arrive from the
 * socket and complete frames are taken out one at a time.
 */
class FrameDecoder {
 public:
  void Append(const char *data, size_t size);

  /// Returns the payload of the next complete frame.
  /// @throw FrameCorruptException on checksum mismatch or oversized frames.
  std::optional<std::string> Next();

  size_t Buffered() const { return buffer_.size() - offset_; }

 private:
  std::string buffer_;
  size_t offset_{0};
};

}  // namespace rangekv::io
