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
/// Order preserving binary encodings used for storage keys and compact record
/// values.
///
/// Memcomparable bytes: the input is split into groups of 8 bytes. Every
/// group is padded with zeroes up to 8 bytes and followed by a marker byte
/// `0xFF - padding`. The encoding of `a` sorts before the encoding of `b`
/// exactly when `a < b`, and no encoding is a prefix of another, which lets a
/// timestamp be appended to an encoded key without breaking the ordering.
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "utils/exceptions.hpp"

namespace rangekv::utils {

class CodecException : public BasicException {
 public:
  using BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(CodecException)
};

inline constexpr size_t kEncGroupSize = 8;
inline constexpr uint8_t kEncMarker = 0xFF;
inline constexpr uint8_t kEncPad = 0x00;

size_t MaxEncodedBytesSize(size_t size);

void EncodeBytes(std::string_view data, std::string *out);
std::string EncodeBytes(std::string_view data);

/// Decodes memcomparable bytes from the front of `input` and advances it past
/// the consumed bytes.
/// @throw CodecException on malformed input.
std::string DecodeBytes(std::string_view *input);

/// Big endian, so unsigned integers sort in their numeric order.
void EncodeU64(uint64_t value, std::string *out);
uint64_t DecodeU64(std::string_view *input);

/// Bit inverted big endian, so larger values sort first.
void EncodeU64Desc(uint64_t value, std::string *out);
uint64_t DecodeU64Desc(std::string_view *input);

void EncodeVarU64(uint64_t value, std::string *out);
uint64_t DecodeVarU64(std::string_view *input);

/// Variable length prefix followed by the raw bytes. Not order preserving.
void EncodeCompactBytes(std::string_view data, std::string *out);
std::string DecodeCompactBytes(std::string_view *input);

/// Smallest key which is greater than every key starting with `prefix`.
/// Returns an empty string when there is no such key (all bytes are 0xFF).
std::string PrefixNext(std::string_view prefix);

}  // namespace rangekv::utils
