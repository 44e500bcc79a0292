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

#include "txn/safe_point.hpp"

#include <algorithm>

#include "utils/logging.hpp"

namespace rangekv::txn {

void SafePointManager::Register(const TimeStamp start_ts) {
  state_.WithLock([&](State &state) { state.active.insert(start_ts); });
}

std::optional<TimeStamp> SafePointManager::RegisterNew(const std::function<std::optional<TimeStamp>()> &fetch_ts) {
  return state_.WithLock([&](State &state) {
    auto start_ts = fetch_ts();
    if (start_ts) state.active.insert(*start_ts);
    return start_ts;
  });
}

void SafePointManager::Unregister(const TimeStamp start_ts) {
  state_.WithLock([&](State &state) {
    if (auto it = state.active.find(start_ts); it != state.active.end()) state.active.erase(it);
  });
}

TimeStamp SafePointManager::Advance(const TimeStamp candidate) {
  return state_.WithLock([&](State &state) {
    auto bound = candidate;
    if (!state.active.empty()) bound = std::min(bound, *state.active.begin());
    if (bound > state.safe_point) {
      spdlog::debug("GC safe point advanced from {} to {}", state.safe_point, bound);
      state.safe_point = bound;
    }
    return state.safe_point;
  });
}

TimeStamp SafePointManager::SafePoint() const {
  return state_.WithLock([](const State &state) { return state.safe_point; });
}

std::optional<TimeStamp> SafePointManager::OldestActive() const {
  return state_.WithLock([](const State &state) -> std::optional<TimeStamp> {
    if (state.active.empty()) return std::nullopt;
    return *state.active.begin();
  });
}

}  // namespace rangekv::txn
