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

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace rangekv::utils {

/// Fixed size pool of named worker threads consuming a FIFO task queue.
/// Tasks still queued when the pool is shut down are dropped.
class ThreadPool {
  using TaskSignature = std::function<void()>;

 public:
  ThreadPool(size_t pool_size, std::string name);

  /// Returns false when the pool is already shutting down.
  bool AddTask(std::function<void()> new_task);

  void ShutDown();

  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  size_t UnfinishedTasksNum() const;

  size_t Size() const { return pool_size_; }

 private:
  void ThreadLoop(size_t index);

  std::string name_;
  size_t pool_size_;

  std::mutex pool_lock_;
  std::condition_variable_any queue_cv_;

  std::queue<TaskSignature> task_queue_;
  std::stop_source pool_stop_source_;  //<! Common stop source for all the jthreads in `thread_pool_`

  std::vector<std::jthread> thread_pool_;

  std::atomic<size_t> unfinished_tasks_num_{0};
};

}  // namespace rangekv::utils
