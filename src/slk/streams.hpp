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

#include <array>
#include <cstdint>
#include <functional>
#include <limits>

#include "utils/exceptions.hpp"

namespace rangekv::slk {

using SegmentSize = uint32_t;

// Segments are buffered on the builder, 64 KiB keeps the builder small while
// most messages (everything except snapshots) fit into one segment.
constexpr uint64_t kSegmentMaxDataSize = 65536;
constexpr uint64_t kSegmentMaxTotalSize = kSegmentMaxDataSize + sizeof(SegmentSize);

static_assert(kSegmentMaxDataSize <= std::numeric_limits<SegmentSize>::max(),
              "The SLK segment can't be larger than the type used to store its size!");

/// SLK splits binary data into segments so that encoding never needs the whole
/// message in memory. Every segment starts with a little endian `SegmentSize`
/// followed by that many bytes of data. A segment of size 0 terminates the
/// stream. Reading requires the complete stream in memory.

class SlkBuilderException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(SlkBuilderException)
};

/// Builder used to create a SLK segment stream.
class Builder {
 public:
  /// `write_func` receives each finished segment, `have_more` is false for the
  /// last call.
  explicit Builder(std::function<void(const uint8_t *data, size_t size, bool have_more)> write_func);

  Builder(const Builder &) = delete;
  Builder &operator=(const Builder &) = delete;
  Builder(Builder &&) = delete;
  Builder &operator=(Builder &&) = delete;
  ~Builder() = default;

  /// Function used internally by SLK to serialize the data.
  void Save(const uint8_t *data, uint64_t size);

  /// Must be called exactly once after all `slk::Save` operations are done.
  void Finalize();

  bool IsEmpty() const;

 private:
  void FlushSegment(bool final_segment);

  std::function<void(const uint8_t *, size_t, bool)> write_func_;
  size_t pos_{0};
  bool finalized_{false};
  std::array<uint8_t, kSegmentMaxTotalSize + sizeof(SegmentSize)> segment_;
};

/// Exception that will be thrown if segments can't be decoded from the byte
/// stream.
class SlkReaderException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(SlkReaderException)
};

/// Reader used to read data from a SLK segment stream.
class Reader {
 public:
  Reader(const uint8_t *data, size_t size);

  /// Function used internally by SLK to deserialize the data.
  void Load(uint8_t *data, uint64_t size);

  /// Must be called after all `slk::Load` operations are done, verifies that
  /// the whole stream was consumed.
  void Finalize();

  size_t GetPos() const { return pos_; }

 private:
  void GetSegment(bool should_be_final = false);

  const uint8_t *data_;
  size_t size_;

  size_t pos_{0};
  size_t have_{0};
};

/// Stream status that is returned by the `CheckStreamComplete` function.
enum class StreamStatus : uint8_t { PARTIAL, COMPLETE, INVALID };

struct StreamInfo {
  StreamStatus status;
  size_t stream_size;
  size_t encoded_data_size;
};

/// Checks whether `data` starts with a fully received segment stream. For a
/// partial stream `stream_size` is the minimal size worth waiting for before
/// checking again.
StreamInfo CheckStreamComplete(const uint8_t *data, size_t size);

}  // namespace rangekv::slk
