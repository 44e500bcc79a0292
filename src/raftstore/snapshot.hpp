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
///
/// Shard snapshots: a point in time copy of a shard's data column families,
/// packaged with the shard metadata and a checksum.
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "common/errors.hpp"
#include "kvstore/kvstore.hpp"
#include "raft/messages.hpp"
#include "raftstore/message.hpp"
#include "raftstore/state.hpp"
#include "utils/exceptions.hpp"
#include "utils/result.hpp"

namespace rangekv::raftstore {

class SnapshotException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(SnapshotException)
};

inline constexpr uint32_t kSnapshotFormatVersion = 1;

struct SnapshotCfData {
  kvstore::ColumnFamily cf{kvstore::ColumnFamily::DEFAULT};
  std::vector<std::pair<std::string, std::string>> pairs;
};

/// Payload of a raft::Snapshot.
struct SnapshotData {
  uint32_t version{kSnapshotFormatVersion};
  ShardMeta meta;
  uint64_t index{0};
  uint64_t term{0};
  std::vector<SnapshotCfData> cfs;
  /// CRC32 over the contents of all column families.
  uint32_t checksum{0};
};

uint32_t SnapshotChecksum(const std::vector<SnapshotCfData> &cfs);

/// Copies the shard at the applied index recorded in `view`. The data and
/// the apply state come from the same point in time.
/// @throw SnapshotException when the shard has no state in `view`.
/// @throw kvstore::KVStoreIOError
raft::Snapshot BuildSnapshot(const kvstore::Snapshot &view, ShardId shard_id);

/// Decodes the payload and verifies it belongs to shard `shard_id` at the
/// snapshot's index.
utils::BasicResult<common::SnapshotCorrupt, SnapshotData> DecodeSnapshot(const raft::Snapshot &snapshot,
                                                                          ShardId shard_id);

/// Adds to `batch` everything needed to replace the shard's local replica:
/// the data range is cleared in every data column family and refilled, the
/// old log is dropped, and the raft, apply and shard states are rewritten.
SnapshotApplied ApplySnapshotToBatch(const SnapshotData &data, const raft::Snapshot &snapshot,
                                     const raft::HardState &hard_state, kvstore::WriteBatch *batch);

/// Splits an InstallSnapshot envelope into chunks of at most `chunk_size`
/// payload bytes.
std::vector<SnapshotChunk> SplitSnapshotMessage(const RaftMessage &message, size_t chunk_size);

/**
 * Rebuilds InstallSnapshot envelopes from their chunks. A newer snapshot for
 * the same peer replaces an incomplete older one.
 */
class SnapshotAssembler {
 public:
  /// Returns the whole envelope once its last missing chunk is added.
  std::optional<RaftMessage> Add(SnapshotChunk chunk);

  size_t PendingCount() const { return pending_.size(); }

 private:
  struct Pending {
    uint64_t snapshot_index{0};
    uint64_t snapshot_term{0};
    std::optional<RaftMessage> header;
    std::vector<std::optional<std::string>> chunks;
    uint32_t received{0};
  };

  /// Keyed by shard and receiving peer.
  std::map<std::pair<ShardId, PeerId>, Pending> pending_;
};

using slk::Load;
using slk::Save;

void Save(const SnapshotCfData &obj, slk::Builder *builder);
void Load(SnapshotCfData *obj, slk::Reader *reader);
void Save(const SnapshotData &obj, slk::Builder *builder);
void Load(SnapshotData *obj, slk::Reader *reader);

}  // namespace rangekv::raftstore
