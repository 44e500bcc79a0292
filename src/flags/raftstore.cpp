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

#include "flags/raftstore.hpp"

#include <chrono>

#include "utils/flag_validation.hpp"

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(raft_base_tick_interval_ms, 100, "Interval of the raft base tick in milliseconds.",
                        FLAG_IN_RANGE(1, 60000));
DEFINE_VALIDATED_uint64(raft_election_timeout_ticks, 10, "Election timeout in base ticks.", FLAG_IN_RANGE(2, 10000));
DEFINE_VALIDATED_uint64(raft_heartbeat_ticks, 2, "Heartbeat interval in base ticks.", FLAG_IN_RANGE(1, 10000));
DEFINE_uint64(raft_max_size_per_msg, 1ULL << 20U, "Upper bound on the entry bytes of one append message.");
DEFINE_VALIDATED_uint64(raft_max_inflight_msgs, 256, "Append messages in flight per follower.",
                        FLAG_IN_RANGE(1, 1ULL << 16U));
DEFINE_uint64(raft_entry_max_size, 8ULL << 20U, "Proposals larger than this many bytes are rejected.");
DEFINE_VALIDATED_uint32(raft_pool_size, 2, "Threads running the consensus state machines.", FLAG_IN_RANGE(1, 256));
DEFINE_VALIDATED_uint32(apply_pool_size, 2, "Threads applying committed entries.", FLAG_IN_RANGE(1, 256));
DEFINE_VALIDATED_uint32(snap_pool_size, 2, "Threads generating and applying snapshots.", FLAG_IN_RANGE(1, 64));
DEFINE_VALIDATED_uint32(split_check_pool_size, 1, "Threads looking for split keys.", FLAG_IN_RANGE(1, 64));
DEFINE_VALIDATED_uint32(mailbox_capacity, 4096, "Messages a shard replica queues before rejecting proposals.",
                        FLAG_IN_RANGE(16, 1U << 24U));
DEFINE_uint64(max_pending_apply, 1024, "Committed but unapplied entries after which proposals are rejected.");
DEFINE_uint32(max_pending_proposals, 4096, "Proposals waiting for their entry after which new ones are rejected.");
DEFINE_uint64(raft_log_gc_threshold, 64, "Applied entries kept in the log before compaction.");
DEFINE_uint64(shard_split_size, 96ULL << 20U, "Approximate shard size in bytes that triggers a split.");
DEFINE_VALIDATED_uint64(snap_chunk_size, 1ULL << 20U, "Bytes of snapshot payload per network chunk.",
                        FLAG_IN_RANGE(1024, 1ULL << 30U));
DEFINE_VALIDATED_uint64(gc_interval_ms, 10000, "How often MVCC garbage is collected, in milliseconds.",
                        FLAG_IN_RANGE(100, 86400000));
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

namespace rangekv::flags {

raftstore::Config RaftstoreConfigFromFlags() {
  raftstore::Config config;
  config.raft_base_tick_interval = std::chrono::milliseconds(FLAGS_raft_base_tick_interval_ms);
  config.raft_election_timeout_ticks = FLAGS_raft_election_timeout_ticks;
  config.raft_heartbeat_ticks = FLAGS_raft_heartbeat_ticks;
  config.raft_max_size_per_msg = FLAGS_raft_max_size_per_msg;
  config.raft_max_inflight_msgs = FLAGS_raft_max_inflight_msgs;
  config.raft_entry_max_size = FLAGS_raft_entry_max_size;
  config.raft_pool_size = FLAGS_raft_pool_size;
  config.apply_pool_size = FLAGS_apply_pool_size;
  config.snap_pool_size = FLAGS_snap_pool_size;
  config.split_check_pool_size = FLAGS_split_check_pool_size;
  config.mailbox_capacity = FLAGS_mailbox_capacity;
  config.max_pending_apply = FLAGS_max_pending_apply;
  config.max_pending_proposals = FLAGS_max_pending_proposals;
  config.raft_log_gc_threshold = FLAGS_raft_log_gc_threshold;
  config.shard_split_size = FLAGS_shard_split_size;
  config.snap_chunk_size = FLAGS_snap_chunk_size;
  config.gc_interval = std::chrono::milliseconds(FLAGS_gc_interval_ms);
  config.Validate();
  return config;
}

}  // namespace rangekv::flags
