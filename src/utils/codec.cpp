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

#include "utils/codec.hpp"

#include <cstring>

#include "utils/endian.hpp"

namespace rangekv::utils {

size_t MaxEncodedBytesSize(const size_t size) { return (size / kEncGroupSize + 1) * (kEncGroupSize + 1); }

void EncodeBytes(std::string_view data, std::string *out) {
  out->reserve(out->size() + MaxEncodedBytesSize(data.size()));
  size_t index = 0;
  while (true) {
    const size_t remain = data.size() - index;
    if (remain >= kEncGroupSize) {
      out->append(data.substr(index, kEncGroupSize));
      out->push_back(static_cast<char>(kEncMarker));
      index += kEncGroupSize;
      continue;
    }
    const auto pad = static_cast<uint8_t>(kEncGroupSize - remain);
    out->append(data.substr(index, remain));
    out->append(pad, static_cast<char>(kEncPad));
    out->push_back(static_cast<char>(kEncMarker - pad));
    return;
  }
}

std::string EncodeBytes(std::string_view data) {
  std::string out;
  EncodeBytes(data, &out);
  return out;
}

std::string DecodeBytes(std::string_view *input) {
  std::string out;
  while (true) {
    if (input->size() < kEncGroupSize + 1) {
      throw CodecException("Insufficient bytes to decode memcomparable group, {} left", input->size());
    }
    const auto group = input->substr(0, kEncGroupSize);
    const auto marker = static_cast<uint8_t>((*input)[kEncGroupSize]);
    input->remove_prefix(kEncGroupSize + 1);
    const uint8_t pad = kEncMarker - marker;
    if (pad == 0) {
      out.append(group);
      continue;
    }
    if (pad > kEncGroupSize) {
      throw CodecException("Invalid memcomparable marker {:#x}", marker);
    }
    const auto real = group.substr(0, kEncGroupSize - pad);
    for (const char c : group.substr(kEncGroupSize - pad)) {
      if (static_cast<uint8_t>(c) != kEncPad) throw CodecException("Invalid memcomparable padding");
    }
    out.append(real);
    return out;
  }
}

void EncodeU64(const uint64_t value, std::string *out) {
  const uint64_t be = HostToBigEndian(value);
  out->append(reinterpret_cast<const char *>(&be), sizeof(be));
}

uint64_t DecodeU64(std::string_view *input) {
  if (input->size() < sizeof(uint64_t)) {
    throw CodecException("Insufficient bytes to decode u64, {} left", input->size());
  }
  uint64_t be = 0;
  std::memcpy(&be, input->data(), sizeof(be));
  input->remove_prefix(sizeof(be));
  return BigEndianToHost(be);
}

void EncodeU64Desc(const uint64_t value, std::string *out) { EncodeU64(~value, out); }

uint64_t DecodeU64Desc(std::string_view *input) { return ~DecodeU64(input); }

void EncodeVarU64(uint64_t value, std::string *out) {
  while (value >= 0x80) {
    out->push_back(static_cast<char>((value & 0x7F) | 0x80));
    value >>= 7;
  }
  out->push_back(static_cast<char>(value));
}

uint64_t DecodeVarU64(std::string_view *input) {
  uint64_t value = 0;
  for (size_t i = 0, shift = 0; i < input->size() && shift < 64; ++i, shift += 7) {
    const auto byte = static_cast<uint8_t>((*input)[i]);
    value |= static_cast<uint64_t>(byte & 0x7F) << shift;
    if ((byte & 0x80) == 0) {
      input->remove_prefix(i + 1);
      return value;
    }
  }
  throw CodecException("Truncated or overlong varint");
}

void EncodeCompactBytes(std::string_view data, std::string *out) {
  EncodeVarU64(data.size(), out);
  out->append(data);
}

std::string DecodeCompactBytes(std::string_view *input) {
  const auto size = DecodeVarU64(input);
  if (input->size() < size) {
    throw CodecException("Compact bytes declare {} bytes but only {} are left", size, input->size());
  }
  std::string out{input->substr(0, size)};
  input->remove_prefix(size);
  return out;
}

std::string PrefixNext(std::string_view prefix) {
  std::string next{prefix};
  while (!next.empty()) {
    auto &last = reinterpret_cast<uint8_t &>(next.back());
    if (last != 0xFF) {
      ++last;
      return next;
    }
    next.pop_back();
  }
  return next;
}

}  // namespace rangekv::utils
