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

#include "raftstore/config.hpp"

namespace rangekv::raftstore {

void Config::Validate() const {
  if (raft_base_tick_interval.count() <= 0) throw RaftstoreConfigException("Raft base tick interval must be positive");
  if (raft_heartbeat_ticks == 0) throw RaftstoreConfigException("Heartbeat ticks must be greater than 0");
  if (raft_election_timeout_ticks <= raft_heartbeat_ticks) {
    throw RaftstoreConfigException("Election timeout ticks ({}) must be greater than heartbeat ticks ({})",
                                   raft_election_timeout_ticks, raft_heartbeat_ticks);
  }
  if (raft_pool_size == 0 || apply_pool_size == 0 || snap_pool_size == 0 || split_check_pool_size == 0 ||
      control_pool_size == 0) {
    throw RaftstoreConfigException("Every worker pool needs at least one thread");
  }
  if (max_batch_size == 0) throw RaftstoreConfigException("Max batch size must be greater than 0");
  if (mailbox_capacity < max_batch_size) {
    throw RaftstoreConfigException("Mailbox capacity ({}) can't be smaller than the batch size ({})", mailbox_capacity,
                                   max_batch_size);
  }
  if (snap_chunk_size == 0) throw RaftstoreConfigException("Snapshot chunk size must be greater than 0");
  if (raft_log_gc_threshold == 0) throw RaftstoreConfigException("Raft log GC threshold must be greater than 0");
  if (raft_log_gc_tick_interval == 0 || split_check_tick_interval == 0 || placement_heartbeat_tick_interval == 0 ||
      merge_check_tick_interval == 0) {
    throw RaftstoreConfigException("Tick intervals must be greater than 0");
  }
  if (proposal_timeout_ticks <= raft_election_timeout_ticks) {
    throw RaftstoreConfigException("Proposal timeout ({} ticks) must exceed the election timeout ({} ticks)",
                                   proposal_timeout_ticks, raft_election_timeout_ticks);
  }
  if (gc_interval.count() <= 0 || node_heartbeat_interval.count() <= 0) {
    throw RaftstoreConfigException("GC and node heartbeat intervals must be positive");
  }
}

}  // namespace rangekv::raftstore
