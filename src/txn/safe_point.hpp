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

#include <functional>
#include <optional>
#include <set>

#include "txn/types.hpp"
#include "utils/synchronized.hpp"

namespace rangekv::txn {

/**
 * Tracks the start timestamps of running transactions and derives the GC
 * safe point from them. The safe point never moves backwards and never
 * passes the oldest running transaction, so every snapshot a transaction may
 * still read stays intact.
 */
class SafePointManager {
 public:
  void Register(TimeStamp start_ts);

  /// Registers the start timestamp `fetch_ts` issues. The fetch runs under the
  /// lock Advance takes, so a concurrent Advance either sees the transaction
  /// or finished before its timestamp was issued. Returns nullopt when the
  /// fetch fails.
  std::optional<TimeStamp> RegisterNew(const std::function<std::optional<TimeStamp>()> &fetch_ts);
  void Unregister(TimeStamp start_ts);

  /// Moves the safe point towards `candidate` and returns the new one.
  TimeStamp Advance(TimeStamp candidate);

  TimeStamp SafePoint() const;
  std::optional<TimeStamp> OldestActive() const;

 private:
  struct State {
    std::multiset<TimeStamp> active;
    TimeStamp safe_point{0};
  };
  mutable utils::Synchronized<State> state_;
};

}  // namespace rangekv::txn
