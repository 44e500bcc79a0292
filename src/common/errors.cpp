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

#include "common/errors.hpp"

#include <sstream>

#include "utils/logging.hpp"
#include "utils/variant_helpers.hpp"

namespace rangekv::common {

ErrorCode GetErrorCode(const Error &error) {
  return std::visit(utils::Overloaded{
                        [](const NotLeader &) { return ErrorCode::NOT_LEADER; },
                        [](const StaleEpoch &) { return ErrorCode::STALE_EPOCH; },
                        [](const ShardNotFound &) { return ErrorCode::SHARD_NOT_FOUND; },
                        [](const KeyNotInShard &) { return ErrorCode::KEY_NOT_IN_SHARD; },
                        [](const KeyIsLocked &) { return ErrorCode::KEY_IS_LOCKED; },
                        [](const WriteConflict &) { return ErrorCode::WRITE_CONFLICT; },
                        [](const TxnLockNotFound &) { return ErrorCode::TXN_LOCK_NOT_FOUND; },
                        [](const Committed &) { return ErrorCode::COMMITTED; },
                        [](const InvalidTimestamp &) { return ErrorCode::INVALID_TIMESTAMP; },
                        [](const ProposalDropped &) { return ErrorCode::PROPOSAL_DROPPED; },
                        [](const ServerIsBusy &) { return ErrorCode::SERVER_IS_BUSY; },
                        [](const ShardMerging &) { return ErrorCode::SHARD_MERGING; },
                        [](const StorageIOError &) { return ErrorCode::STORAGE_IO_ERROR; },
                        [](const SnapshotCorrupt &) { return ErrorCode::SNAPSHOT_CORRUPT; },
                        [](const TimedOut &) { return ErrorCode::TIMED_OUT; },
                        [](const InvalidRequest &) { return ErrorCode::INVALID_REQUEST; },
                    },
                    error);
}

bool IsRetryableRoutingError(const Error &error) {
  switch (GetErrorCode(error)) {
    case ErrorCode::NOT_LEADER:
    case ErrorCode::STALE_EPOCH:
    case ErrorCode::SHARD_NOT_FOUND:
    case ErrorCode::KEY_NOT_IN_SHARD:
    case ErrorCode::PROPOSAL_DROPPED:
    case ErrorCode::SERVER_IS_BUSY:
    case ErrorCode::SHARD_MERGING:
    case ErrorCode::TIMED_OUT:
      return true;
    default:
      return false;
  }
}

std::ostream &operator<<(std::ostream &in, const Error &error) {
  in << ErrorCodeToString(GetErrorCode(error));
  std::visit(utils::Overloaded{
                 [&](const NotLeader &e) {
                   in << " { shard_id: " << e.shard_id << ", leader: ";
                   if (e.leader) {
                     in << *e.leader;
                   } else {
                     in << "unknown";
                   }
                   in << " }";
                 },
                 [&](const StaleEpoch &e) {
                   in << " { current: [";
                   for (size_t i = 0; i < e.current.size(); ++i) {
                     if (i != 0) in << ", ";
                     in << e.current[i];
                   }
                   in << "] }";
                 },
                 [&](const ShardNotFound &e) { in << " { shard_id: " << e.shard_id << " }"; },
                 [&](const KeyNotInShard &e) {
                   in << " { key: \"" << logging::Escape(e.key) << "\", shard_id: " << e.shard_id << " }";
                 },
                 [&](const KeyIsLocked &e) {
                   in << " { key: \"" << logging::Escape(e.lock.key) << "\", primary: \""
                      << logging::Escape(e.lock.primary) << "\", start_ts: " << e.lock.start_ts
                      << ", ttl: " << e.lock.ttl << " }";
                 },
                 [&](const WriteConflict &e) {
                   in << " { key: \"" << logging::Escape(e.key) << "\", start_ts: " << e.start_ts
                      << ", conflict_start_ts: " << e.conflict_start_ts
                      << ", conflict_commit_ts: " << e.conflict_commit_ts << " }";
                 },
                 [&](const TxnLockNotFound &e) {
                   in << " { key: \"" << logging::Escape(e.key) << "\", start_ts: " << e.start_ts << " }";
                 },
                 [&](const Committed &e) {
                   in << " { key: \"" << logging::Escape(e.key) << "\", commit_ts: " << e.commit_ts << " }";
                 },
                 [&](const InvalidTimestamp &e) {
                   in << " { start_ts: " << e.start_ts << ", commit_ts: " << e.commit_ts << " }";
                 },
                 [&](const ProposalDropped &e) { in << " { term: " << e.term << " }"; },
                 [&](const ServerIsBusy &e) { in << " { reason: " << e.reason << " }"; },
                 [&](const ShardMerging &e) { in << " { shard_id: " << e.shard_id << " }"; },
                 [&](const StorageIOError &e) { in << " { message: " << e.message << " }"; },
                 [&](const SnapshotCorrupt &e) { in << " { message: " << e.message << " }"; },
                 [&](const TimedOut &) {},
                 [&](const InvalidRequest &e) { in << " { message: " << e.message << " }"; },
             },
             error);
  return in;
}

std::string ErrorToString(const Error &error) {
  std::stringstream ss;
  ss << error;
  return ss.str();
}

void Save(const NotLeader &obj, slk::Builder *builder) {
  Save(obj.shard_id, builder);
  Save(obj.leader, builder);
}

void Load(NotLeader *obj, slk::Reader *reader) {
  Load(&obj->shard_id, reader);
  Load(&obj->leader, reader);
}

void Save(const StaleEpoch &obj, slk::Builder *builder) { Save(obj.current, builder); }
void Load(StaleEpoch *obj, slk::Reader *reader) { Load(&obj->current, reader); }

void Save(const ShardNotFound &obj, slk::Builder *builder) { Save(obj.shard_id, builder); }
void Load(ShardNotFound *obj, slk::Reader *reader) { Load(&obj->shard_id, reader); }

void Save(const KeyNotInShard &obj, slk::Builder *builder) {
  Save(obj.key, builder);
  Save(obj.shard_id, builder);
  Save(obj.start_key, builder);
  Save(obj.end_key, builder);
}

void Load(KeyNotInShard *obj, slk::Reader *reader) {
  Load(&obj->key, reader);
  Load(&obj->shard_id, reader);
  Load(&obj->start_key, reader);
  Load(&obj->end_key, reader);
}

void Save(const LockInfo &obj, slk::Builder *builder) {
  Save(obj.key, builder);
  Save(obj.primary, builder);
  Save(obj.start_ts, builder);
  Save(obj.ttl, builder);
  Save(obj.type, builder);
}

void Load(LockInfo *obj, slk::Reader *reader) {
  Load(&obj->key, reader);
  Load(&obj->primary, reader);
  Load(&obj->start_ts, reader);
  Load(&obj->ttl, reader);
  Load(&obj->type, reader);
}

void Save(const KeyIsLocked &obj, slk::Builder *builder) { Save(obj.lock, builder); }
void Load(KeyIsLocked *obj, slk::Reader *reader) { Load(&obj->lock, reader); }

void Save(const WriteConflict &obj, slk::Builder *builder) {
  Save(obj.key, builder);
  Save(obj.primary, builder);
  Save(obj.start_ts, builder);
  Save(obj.conflict_start_ts, builder);
  Save(obj.conflict_commit_ts, builder);
}

void Load(WriteConflict *obj, slk::Reader *reader) {
  Load(&obj->key, reader);
  Load(&obj->primary, reader);
  Load(&obj->start_ts, reader);
  Load(&obj->conflict_start_ts, reader);
  Load(&obj->conflict_commit_ts, reader);
}

void Save(const TxnLockNotFound &obj, slk::Builder *builder) {
  Save(obj.key, builder);
  Save(obj.start_ts, builder);
}

void Load(TxnLockNotFound *obj, slk::Reader *reader) {
  Load(&obj->key, reader);
  Load(&obj->start_ts, reader);
}

void Save(const Committed &obj, slk::Builder *builder) {
  Save(obj.key, builder);
  Save(obj.commit_ts, builder);
}

void Load(Committed *obj, slk::Reader *reader) {
  Load(&obj->key, reader);
  Load(&obj->commit_ts, reader);
}

void Save(const InvalidTimestamp &obj, slk::Builder *builder) {
  Save(obj.start_ts, builder);
  Save(obj.commit_ts, builder);
}

void Load(InvalidTimestamp *obj, slk::Reader *reader) {
  Load(&obj->start_ts, reader);
  Load(&obj->commit_ts, reader);
}

void Save(const ProposalDropped &obj, slk::Builder *builder) { Save(obj.term, builder); }
void Load(ProposalDropped *obj, slk::Reader *reader) { Load(&obj->term, reader); }

void Save(const ServerIsBusy &obj, slk::Builder *builder) { Save(obj.reason, builder); }
void Load(ServerIsBusy *obj, slk::Reader *reader) { Load(&obj->reason, reader); }

void Save(const ShardMerging &obj, slk::Builder *builder) { Save(obj.shard_id, builder); }
void Load(ShardMerging *obj, slk::Reader *reader) { Load(&obj->shard_id, reader); }

void Save(const StorageIOError &obj, slk::Builder *builder) { Save(obj.message, builder); }
void Load(StorageIOError *obj, slk::Reader *reader) { Load(&obj->message, reader); }

void Save(const SnapshotCorrupt &obj, slk::Builder *builder) { Save(obj.message, builder); }
void Load(SnapshotCorrupt *obj, slk::Reader *reader) { Load(&obj->message, reader); }

void Save(const TimedOut & /*obj*/, slk::Builder * /*builder*/) {}
void Load(TimedOut * /*obj*/, slk::Reader * /*reader*/) {}

void Save(const InvalidRequest &obj, slk::Builder *builder) { Save(obj.message, builder); }
void Load(InvalidRequest *obj, slk::Reader *reader) { Load(&obj->message, reader); }

}  // namespace rangekv::common
