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

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/types.hpp"

namespace rangekv::common {

enum class ErrorCode : uint8_t {
  // Routing, the caller refreshes its shard cache and retries.
  NOT_LEADER,
  STALE_EPOCH,
  SHARD_NOT_FOUND,
  KEY_NOT_IN_SHARD,
  // Transaction conflicts, resolved by the lock resolution protocol.
  KEY_IS_LOCKED,
  WRITE_CONFLICT,
  TXN_LOCK_NOT_FOUND,
  COMMITTED,
  INVALID_TIMESTAMP,
  // Consensus and node health.
  PROPOSAL_DROPPED,
  SERVER_IS_BUSY,
  SHARD_MERGING,
  STORAGE_IO_ERROR,
  SNAPSHOT_CORRUPT,
  TIMED_OUT,
  INVALID_REQUEST,
};

constexpr std::string_view ErrorCodeToString(const ErrorCode code) {
  switch (code) {
    case ErrorCode::NOT_LEADER:
      return "NOT_LEADER";
    case ErrorCode::STALE_EPOCH:
      return "STALE_EPOCH";
    case ErrorCode::SHARD_NOT_FOUND:
      return "SHARD_NOT_FOUND";
    case ErrorCode::KEY_NOT_IN_SHARD:
      return "KEY_NOT_IN_SHARD";
    case ErrorCode::KEY_IS_LOCKED:
      return "KEY_IS_LOCKED";
    case ErrorCode::WRITE_CONFLICT:
      return "WRITE_CONFLICT";
    case ErrorCode::TXN_LOCK_NOT_FOUND:
      return "TXN_LOCK_NOT_FOUND";
    case ErrorCode::COMMITTED:
      return "COMMITTED";
    case ErrorCode::INVALID_TIMESTAMP:
      return "INVALID_TIMESTAMP";
    case ErrorCode::PROPOSAL_DROPPED:
      return "PROPOSAL_DROPPED";
    case ErrorCode::SERVER_IS_BUSY:
      return "SERVER_IS_BUSY";
    case ErrorCode::SHARD_MERGING:
      return "SHARD_MERGING";
    case ErrorCode::STORAGE_IO_ERROR:
      return "STORAGE_IO_ERROR";
    case ErrorCode::SNAPSHOT_CORRUPT:
      return "SNAPSHOT_CORRUPT";
    case ErrorCode::TIMED_OUT:
      return "TIMED_OUT";
    case ErrorCode::INVALID_REQUEST:
      return "INVALID_REQUEST";
  }
  return "UNKNOWN";
}

// The peer addressed isn't the leader of the shard. `leader` is the last
// leader this node knows about, if any.
struct NotLeader {
  ShardId shard_id{kInvalidId};
  std::optional<PeerMeta> leader;
};

// The request was built against an older shard epoch. `current` holds the
// shards which now cover the requested range on this node.
struct StaleEpoch {
  std::vector<ShardMeta> current;
};

struct ShardNotFound {
  ShardId shard_id{kInvalidId};
};

struct KeyNotInShard {
  std::string key;
  ShardId shard_id{kInvalidId};
  std::string start_key;
  std::string end_key;
};

enum class LockType : uint8_t { PUT, DELETE, LOCK };

struct LockInfo {
  std::string key;
  std::string primary;
  uint64_t start_ts{0};
  uint64_t ttl{0};
  LockType type{LockType::PUT};

  friend bool operator==(const LockInfo &lhs, const LockInfo &rhs) = default;
};

struct KeyIsLocked {
  LockInfo lock;
};

// A write committed at or after `start_ts` already exists for the key.
struct WriteConflict {
  std::string key;
  std::string primary;
  uint64_t start_ts{0};
  uint64_t conflict_start_ts{0};
  uint64_t conflict_commit_ts{0};
};

// Neither a lock nor a commit record exists for the transaction on the key.
struct TxnLockNotFound {
  std::string key;
  uint64_t start_ts{0};
};

// The transaction is already committed, it can't be rolled back.
struct Committed {
  std::string key;
  uint64_t commit_ts{0};
};

// Commit timestamp must be greater than the start timestamp.
struct InvalidTimestamp {
  uint64_t start_ts{0};
  uint64_t commit_ts{0};
};

// Leadership changed before the proposal got committed. The command may or
// may not be applied eventually.
struct ProposalDropped {
  uint64_t term{0};
};

struct ServerIsBusy {
  std::string reason;
};

// The shard is being merged into its neighbour and doesn't accept writes.
struct ShardMerging {
  ShardId shard_id{kInvalidId};
};

struct StorageIOError {
  std::string message;
};

struct SnapshotCorrupt {
  std::string message;
};

// No response arrived in time. It does not mean that the request wasn't
// processed.
struct TimedOut {};

struct InvalidRequest {
  std::string message;
};

using Error = std::variant<NotLeader, StaleEpoch, ShardNotFound, KeyNotInShard, KeyIsLocked, WriteConflict,
                           TxnLockNotFound, Committed, InvalidTimestamp, ProposalDropped, ServerIsBusy, ShardMerging, StorageIOError,
                           SnapshotCorrupt, TimedOut, InvalidRequest>;

ErrorCode GetErrorCode(const Error &error);

/// Routing errors tell the caller to refresh its view of the cluster and
/// retry the same request.
bool IsRetryableRoutingError(const Error &error);

std::ostream &operator<<(std::ostream &in, const Error &error);
std::string ErrorToString(const Error &error);

void Save(const NotLeader &obj, slk::Builder *builder);
void Load(NotLeader *obj, slk::Reader *reader);
void Save(const StaleEpoch &obj, slk::Builder *builder);
void Load(StaleEpoch *obj, slk::Reader *reader);
void Save(const ShardNotFound &obj, slk::Builder *builder);
void Load(ShardNotFound *obj, slk::Reader *reader);
void Save(const KeyNotInShard &obj, slk::Builder *builder);
void Load(KeyNotInShard *obj, slk::Reader *reader);
void Save(const LockInfo &obj, slk::Builder *builder);
void Load(LockInfo *obj, slk::Reader *reader);
void Save(const KeyIsLocked &obj, slk::Builder *builder);
void Load(KeyIsLocked *obj, slk::Reader *reader);
void Save(const WriteConflict &obj, slk::Builder *builder);
void Load(WriteConflict *obj, slk::Reader *reader);
void Save(const TxnLockNotFound &obj, slk::Builder *builder);
void Load(TxnLockNotFound *obj, slk::Reader *reader);
void Save(const Committed &obj, slk::Builder *builder);
void Load(Committed *obj, slk::Reader *reader);
void Save(const InvalidTimestamp &obj, slk::Builder *builder);
void Load(InvalidTimestamp *obj, slk::Reader *reader);
void Save(const ProposalDropped &obj, slk::Builder *builder);
void Load(ProposalDropped *obj, slk::Reader *reader);
void Save(const ServerIsBusy &obj, slk::Builder *builder);
void Load(ServerIsBusy *obj, slk::Reader *reader);
void Save(const ShardMerging &obj, slk::Builder *builder);
void Load(ShardMerging *obj, slk::Reader *reader);
void Save(const StorageIOError &obj, slk::Builder *builder);
void Load(StorageIOError *obj, slk::Reader *reader);
void Save(const SnapshotCorrupt &obj, slk::Builder *builder);
void Load(SnapshotCorrupt *obj, slk::Reader *reader);
void Save(const TimedOut &obj, slk::Builder *builder);
void Load(TimedOut *obj, slk::Reader *reader);
void Save(const InvalidRequest &obj, slk::Builder *builder);
void Load(InvalidRequest *obj, slk::Reader *reader);

}  // namespace rangekv::common
