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


#include "placement/tso.hpp"

namespace rangekv::placement {

namespace {

constexpr uint64_t kMaxLogical = (1ULL << txn::kLogicalBits) - 1;

uint64_t WallClockMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

TimestampOracle::TimestampOracle() : clock_(WallClockMs) {}

txn::TimeStamp TimestampOracle::Next() {
  std::lock_guard guard(lock_);
  const auto now = clock_();
  if (now > physical_) {
    physical_ = now;
    logical_ = 0;
  } else if (logical_ == kMaxLogical) {
    // Logical space exhausted within the same millisecond, borrow from the
    // future.
    ++physical_;
    logical_ = 0;
  } else {
    ++logical_;
  }
  return txn::ComposeTs(physical_, logical_);
}

txn::TimeStamp TimestampOracle::Last() const {
  std::lock_guard guard(lock_);
  if (physical_ == 0) return 0;
  return txn::ComposeTs(physical_, logical_);
}

}  // namespace rangekv::placement
