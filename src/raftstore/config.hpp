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
#include <cstdint>
#include <cstddef>

#include "utils/exceptions.hpp"

namespace rangekv::raftstore {

class RaftstoreConfigException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(RaftstoreConfigException)
};

/// Settings of a node's replication engine. Tick based intervals are counted
/// in raft base ticks.
struct Config {
  std::chrono::milliseconds raft_base_tick_interval{100};
  uint64_t raft_election_timeout_ticks{10};
  uint64_t raft_heartbeat_ticks{2};
  uint64_t raft_max_size_per_msg{1ULL << 20U};
  uint64_t raft_max_inflight_msgs{256};
  /// Proposals bigger than this are rejected.
  uint64_t raft_entry_max_size{8ULL << 20U};

  size_t raft_pool_size{2};
  size_t apply_pool_size{2};
  size_t snap_pool_size{2};
  size_t split_check_pool_size{1};
  /// Placement calls, replica creation and destruction.
  size_t control_pool_size{1};

  /// Messages a peer or apply state machine handles in one run.
  size_t max_batch_size{256};
  /// Capacity of a peer mailbox. Proposals to a full mailbox are rejected.
  size_t mailbox_capacity{4096};
  /// Proposals are rejected while the commit index is this far ahead of the
  /// applied index.
  uint64_t max_pending_apply{1024};
  size_t max_pending_proposals{4096};

  uint64_t raft_log_gc_tick_interval{20};
  /// Applied entries kept in the log before it is compacted.
  uint64_t raft_log_gc_threshold{64};

  uint64_t split_check_tick_interval{20};
  uint64_t shard_split_size{96ULL << 20U};

  uint64_t placement_heartbeat_tick_interval{10};
  uint64_t merge_check_tick_interval{10};

  size_t snap_chunk_size{1ULL << 20U};

  /// Ticks without progress after which a pending proposal times out.
  uint64_t proposal_timeout_ticks{100};

  /// How often the GC safe point is pulled from placement.
  std::chrono::milliseconds gc_interval{10000};
  std::chrono::milliseconds node_heartbeat_interval{2000};

  /// @throw RaftstoreConfigException
  void Validate() const;
};

}  // namespace rangekv::raftstore
