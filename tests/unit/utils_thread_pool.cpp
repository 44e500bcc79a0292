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


#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <chrono>
#include <thread>

#include "utils/thread_pool.hpp"

using namespace std::chrono_literals;

TEST(ThreadPool, RunsEveryTask) {
  static constexpr size_t adder_count = 100000;
  static constexpr std::array<size_t, 4> pool_sizes{1, 2, 4, 16};

  for (const auto pool_size : pool_sizes) {
    rangekv::utils::ThreadPool pool{pool_size, "test"};
    EXPECT_EQ(pool.Size(), pool_size);

    std::atomic<size_t> count{0};
    for (size_t i = 0; i < adder_count; ++i) {
      ASSERT_TRUE(pool.AddTask([&] { count.fetch_add(1); }));
    }

    while (pool.UnfinishedTasksNum() != 0) {
      std::this_thread::sleep_for(10ms);
    }

    ASSERT_EQ(count.load(), adder_count);
  }
}

TEST(ThreadPool, RejectsTasksAfterShutDown) {
  rangekv::utils::ThreadPool pool{2, "test"};
  std::atomic<int> count{0};
  ASSERT_TRUE(pool.AddTask([&] { count.fetch_add(1); }));
  while (pool.UnfinishedTasksNum() != 0) std::this_thread::sleep_for(1ms);

  pool.ShutDown();
  EXPECT_FALSE(pool.AddTask([&] { count.fetch_add(1); }));
  // A second shut down does nothing.
  pool.ShutDown();
  EXPECT_EQ(count.load(), 1);
}

TEST(ThreadPool, ShutDownDropsQueuedTasks) {
  rangekv::utils::ThreadPool pool{1, "test"};
  std::atomic<bool> started{false};
  std::atomic<bool> release{false};
  std::atomic<int> count{0};
  ASSERT_TRUE(pool.AddTask([&] {
    started = true;
    while (!release) std::this_thread::sleep_for(1ms);
    count.fetch_add(1);
  }));
  for (int i = 0; i < 10; ++i) ASSERT_TRUE(pool.AddTask([&] { count.fetch_add(1); }));
  while (!started) std::this_thread::sleep_for(1ms);

  std::thread releaser([&] {
    std::this_thread::sleep_for(50ms);
    release = true;
  });
  pool.ShutDown();
  releaser.join();

  // Only the task which was already running finished.
  EXPECT_EQ(count.load(), 1);
  EXPECT_EQ(pool.UnfinishedTasksNum(), 0);
}
