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

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>

#include "txn/types.hpp"

namespace rangekv::placement {

/// Hybrid logical clock handing out strictly increasing timestamps. The
/// physical part follows the wall clock, the logical part breaks ties within
/// one millisecond.
class TimestampOracle {
 public:
  using PhysicalClock = std::function<uint64_t()>;

  TimestampOracle();
  explicit TimestampOracle(PhysicalClock clock) : clock_(std::move(clock)) {}

  txn::TimeStamp Next();

  /// Latest timestamp handed out, 0 before the first one.
  txn::TimeStamp Last() const;

 private:
  PhysicalClock clock_;
  mutable std::mutex lock_;
  uint64_t physical_{0};
  uint64_t logical_{0};
};

}  // namespace rangekv::placement
