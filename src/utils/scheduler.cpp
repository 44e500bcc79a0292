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

#include "utils/scheduler.hpp"

#include "utils/logging.hpp"
#include "utils/thread.hpp"

namespace rangekv::utils {

void Scheduler::Run(const std::string &service_name, std::chrono::milliseconds period, std::function<void()> f) {
  RKV_ASSERT(period > std::chrono::milliseconds(0), "Scheduler period must be positive, got {}ms.", period.count());
  Stop();
  thread_ = std::jthread([this, period, f = std::move(f), service_name](std::stop_token token) mutable {
    ThreadRun(std::move(service_name), period, std::move(f), token);
  });
}

// Checking stop_possible() is necessary because otherwise calling IsRunning
// on a non-started Scheduler would return true.
bool Scheduler::IsRunning() {
  const auto token = thread_.get_stop_token();
  return token.stop_possible() && !token.stop_requested();
}

void Scheduler::ThreadRun(std::string service_name, std::chrono::milliseconds period, std::function<void()> f,
                          std::stop_token token) {
  utils::ThreadSetName(service_name);

  auto next_execution = std::chrono::steady_clock::now() + period;
  while (true) {
    {
      auto lk = std::unique_lock{mutex_};
      condition_variable_.wait_until(lk, token, next_execution, [] { return false; });
      if (is_paused_) {
        condition_variable_.wait(lk, token, [&] { return !is_paused_; });
      }
      if (token.stop_requested()) break;
    }

    f();

    const auto now = std::chrono::steady_clock::now();
    next_execution += period;
    // Missed periods are collapsed into a single execution.
    if (next_execution < now) next_execution = now;
  }
}

void Scheduler::Stop() {
  if (thread_.request_stop()) {
    {
      // Lock needs to be held when modifying cv even if atomic
      auto lk = std::unique_lock{mutex_};
    }
    condition_variable_.notify_all();
    if (thread_.joinable()) thread_.join();
  }
}

void Scheduler::Pause() {
  auto lk = std::unique_lock{mutex_};
  is_paused_ = true;
}

void Scheduler::Resume() {
  {
    auto lk = std::unique_lock{mutex_};
    is_paused_ = false;
  }
  condition_variable_.notify_one();
}

}  // namespace rangekv::utils
