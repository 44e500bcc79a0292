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

#include "gflags/gflags.h"

#include "raftstore/config.hpp"

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_uint64(raft_base_tick_interval_ms);
DECLARE_uint64(raft_election_timeout_ticks);
DECLARE_uint64(raft_heartbeat_ticks);
DECLARE_uint64(raft_max_size_per_msg);
DECLARE_uint64(raft_max_inflight_msgs);
DECLARE_uint64(raft_entry_max_size);
DECLARE_uint32(raft_pool_size);
DECLARE_uint32(apply_pool_size);
DECLARE_uint32(snap_pool_size);
DECLARE_uint32(split_check_pool_size);
DECLARE_uint32(mailbox_capacity);
DECLARE_uint64(max_pending_apply);
DECLARE_uint32(max_pending_proposals);
DECLARE_uint64(raft_log_gc_threshold);
DECLARE_uint64(shard_split_size);
DECLARE_uint64(snap_chunk_size);
DECLARE_uint64(gc_interval_ms);
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

namespace rangekv::flags {

/// @throw raftstore::RaftstoreConfigException
raftstore::Config RaftstoreConfigFromFlags();

}  // namespace rangekv::flags
