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
#include <csignal>
#include <thread>

#include <gtest/gtest.h>

#include "utils/signals.hpp"

/**
 * NOTE: The signals used in these tests must be unique because signal handlers
 * installed in one test are preserved during the other tests.
 */

namespace {
volatile sig_atomic_t hangups = 0;
}  // namespace

TEST(Signals, Handler) {
  ASSERT_TRUE(rangekv::utils::SignalHandler::RegisterHandler(rangekv::utils::Signal::HANGUP, [] { hangups = hangups + 1; }));
  std::raise(SIGHUP);
  std::raise(SIGHUP);
  EXPECT_EQ(hangups, 2);
}

TEST(Signals, Ignore) {
  ASSERT_TRUE(rangekv::utils::SignalIgnore(rangekv::utils::Signal::PIPE));
  std::raise(SIGPIPE);
}

TEST(Signals, ShutdownIsRequestedOnce) {
  ASSERT_TRUE(rangekv::utils::ShutdownSignal::Install());
  EXPECT_FALSE(rangekv::utils::ShutdownSignal::Requested());

  std::thread raiser([] { std::raise(SIGTERM); });
  raiser.join();
  // Returns right away once the flag is set.
  rangekv::utils::ShutdownSignal::Wait(1);
  EXPECT_TRUE(rangekv::utils::ShutdownSignal::Requested());

  std::raise(SIGINT);
  EXPECT_TRUE(rangekv::utils::ShutdownSignal::Requested());
}
