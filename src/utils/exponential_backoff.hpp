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

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>

namespace rangekv::utils {

/// Doubles the delay on every retry until it reaches `max_delay`, then keeps
/// returning `max_delay`. `max_retries` bounds the number of waits.
class ExponentialBackoff {
 public:
  ExponentialBackoff(std::chrono::milliseconds initial_delay, std::chrono::milliseconds max_delay,
                     uint32_t max_retries)
      : initial_delay_(initial_delay), max_delay_(max_delay), max_retries_(max_retries) {}

  std::chrono::milliseconds NextDelay() const {
    if (retry_count_ >= 31) return max_delay_;
    auto base_delay = std::chrono::milliseconds{initial_delay_.count() * (int64_t{1} << retry_count_)};
    return std::min(base_delay, max_delay_);
  }

  /// Sleeps for the next delay. Returns false, without sleeping, once the
  /// retry budget is spent.
  bool Wait() {
    if (Exhausted()) return false;
    std::this_thread::sleep_for(NextDelay());
    ++retry_count_;
    return true;
  }

  bool Exhausted() const { return retry_count_ >= max_retries_; }

  uint32_t Retries() const { return retry_count_; }

 private:
  std::chrono::milliseconds initial_delay_;
  std::chrono::milliseconds max_delay_;
  uint32_t max_retries_;
  uint32_t retry_count_{0};
};

}  // namespace rangekv::utils
