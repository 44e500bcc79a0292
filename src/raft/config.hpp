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

/// @file
#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace rangekv::raft {

/// Parameters of a single consensus state machine.
struct Config {
  /// Id of the local member. Must not be zero.
  uint64_t id{0};

  /// Number of ticks a follower waits for a leader before it campaigns. The
  /// actual timeout is randomized in [election_tick, 2 * election_tick).
  uint64_t election_tick{10};

  /// Number of ticks between two leader heartbeats. Must be smaller than
  /// `election_tick`.
  uint64_t heartbeat_tick{2};

  /// Last applied index when restarting. Committed entries up to this index
  /// aren't handed out again.
  uint64_t applied{0};

  /// Soft limit of the entries payload in a single append message.
  uint64_t max_size_per_msg{1024 * 1024};

  /// Soft limit of committed entries handed out by one Ready.
  uint64_t max_committed_size_per_ready{16 * 1024 * 1024};

  /// Number of append messages in flight to a single follower in the
  /// replicate state.
  size_t max_inflight_msgs{256};

  /// The leader steps down when it hasn't heard from a quorum during an
  /// election timeout, and followers ignore votes while they have a leader.
  bool check_quorum{true};

  bool pre_vote{true};

  /// Seed of the election timeout randomization. Zero seeds from the system.
  uint64_t random_seed{0};

  /// Prefix of every log line, identifies the group and the member.
  std::string tag;

  /// @throw RaftConfigException
  void Validate() const;
};

}  // namespace rangekv::raft
