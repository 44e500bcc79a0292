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
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace rangekv::utils {

/**
 * Runs a function periodically on its own named thread.
 */
class Scheduler {
 public:
  Scheduler() = default;

  /**
   * @param service_name Name of the scheduler thread.
   * @param period Pause between two executions. If the function is still
   * running when it should be ran again, it will run right after it
   * finishes its previous run.
   * @param f Function
   */
  void Run(const std::string &service_name, std::chrono::milliseconds period, std::function<void()> f);

  void Pause();

  void Resume();

  void Stop();

  bool IsRunning();

  ~Scheduler() { Stop(); }

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;
  Scheduler(Scheduler &&) = delete;
  Scheduler &operator=(Scheduler &&) = delete;

 private:
  void ThreadRun(std::string service_name, std::chrono::milliseconds period, std::function<void()> f,
                 std::stop_token token);

  /**
   * Variable is true when thread is paused.
   */
  bool is_paused_{false};

  std::mutex mutex_;

  /**
   * Condition variable is used to stop waiting until the end of the
   * time interval if Stop is called.
   */
  std::condition_variable_any condition_variable_;

  std::jthread thread_;
};

}  // namespace rangekv::utils
