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


#include <atomic>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "io/future.hpp"

using namespace rangekv::io;
using namespace std::chrono_literals;

TEST(Future, FilledFromAnotherThread) {
  auto [future, promise] = FuturePromisePair<std::string>();
  std::jthread filler([promise = std::move(promise)]() mutable {
    std::this_thread::sleep_for(10ms);
    promise.Fill("success");
  });
  EXPECT_EQ(future.Wait(), "success");
}

TEST(Future, WaitForTimesOutAndStaysUsable) {
  auto [future, promise] = FuturePromisePair<int>();
  EXPECT_FALSE(future.WaitFor(5ms));
  EXPECT_FALSE(future.IsReady());
  EXPECT_FALSE(promise.IsAwaited());
  promise.Fill(7);
  EXPECT_TRUE(promise.IsFilled());
  EXPECT_TRUE(future.IsReady());
  EXPECT_EQ(future.WaitFor(5ms), 7);
}

TEST(Future, OnReadyRunsOnceFilled) {
  auto [future, promise] = FuturePromisePair<int>();
  std::atomic<int> seen{0};
  future.OnReady([&seen, &future = future] { seen = *future.TryGet(); });
  EXPECT_EQ(seen, 0);
  promise.Fill(3);
  EXPECT_EQ(seen, 3);

  // Registered after the fill, runs right away.
  auto [ready, ready_promise] = FuturePromisePair<int>();
  ready_promise.Fill(4);
  bool ran = false;
  ready.OnReady([&ran] { ran = true; });
  EXPECT_TRUE(ran);
  EXPECT_EQ(ready.TryGet(), 4);
}

TEST(Future, MovedPromiseStillFillsTheFuture) {
  auto [future, promise] = FuturePromisePair<int>();
  auto moved = std::move(promise);
  moved.Fill(11);
  auto moved_future = std::move(future);
  EXPECT_EQ(moved_future.TryGet(), 11);
}
