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
#include <string_view>

#include <boost/crc.hpp>

namespace rangekv::utils {

inline uint32_t Crc32(std::string_view data) {
  boost::crc_32_type crc;
  crc.process_bytes(data.data(), data.size());
  return crc.checksum();
}

/// Incremental variant for data which is produced in pieces.
class Crc32Builder {
 public:
  void Update(std::string_view data) { crc_.process_bytes(data.data(), data.size()); }
  uint32_t Checksum() const { return crc_.checksum(); }

 private:
  boost::crc_32_type crc_;
};

}  // namespace rangekv::utils
