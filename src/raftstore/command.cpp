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

#include "raftstore/command.hpp"

#include "utils/logging.hpp"
#include "utils/variant_helpers.hpp"

namespace rangekv::raftstore {

namespace {

std::optional<common::Error> CheckKey(std::string_view key, const ShardMeta &meta) {
  if (key.empty()) return common::InvalidRequest{"Empty key"};
  if (!meta.ContainsKey(key)) {
    return common::KeyNotInShard{
        .key = std::string(key), .shard_id = meta.id, .start_key = meta.start_key, .end_key = meta.end_key};
  }
  return std::nullopt;
}

template <typename TKeys>
std::optional<common::Error> CheckKeys(const TKeys &keys, const ShardMeta &meta) {
  for (const auto &key : keys) {
    if (auto error = CheckKey(key, meta)) return error;
  }
  return std::nullopt;
}

// A range request must start inside the shard; its end is clamped later.
std::optional<common::Error> CheckRangeStart(std::string_view start_key, const ShardMeta &meta) {
  if (start_key < meta.start_key || (!meta.end_key.empty() && start_key >= meta.end_key)) {
    return common::KeyNotInShard{
        .key = std::string(start_key), .shard_id = meta.id, .start_key = meta.start_key, .end_key = meta.end_key};
  }
  return std::nullopt;
}

}  // namespace

bool IsReadOnly(const Request &request) {
  return std::holds_alternative<RawGetRequest>(request) || std::holds_alternative<GetRequest>(request) ||
         std::holds_alternative<ScanRequest>(request) || std::holds_alternative<ScanLockRequest>(request);
}

bool IsAdmin(const Request &request) {
  return std::holds_alternative<SplitRequest>(request) || std::holds_alternative<PrepareMergeRequest>(request) ||
         std::holds_alternative<CommitMergeRequest>(request) ||
         std::holds_alternative<RollbackMergeRequest>(request) || std::holds_alternative<CompactLogRequest>(request);
}

bool ChecksVersion(const Request &request) {
  return !std::holds_alternative<CompactLogRequest>(request) &&
         !std::holds_alternative<CommitMergeRequest>(request) && !std::holds_alternative<RollbackMergeRequest>(request);
}

std::string_view RequestName(const Request &request) {
  return std::visit(utils::Overloaded{
                        [](const RawPutRequest &) { return "RawPut"; },
                        [](const RawDeleteRequest &) { return "RawDelete"; },
                        [](const RawGetRequest &) { return "RawGet"; },
                        [](const PrewriteRequest &) { return "Prewrite"; },
                        [](const CommitRequest &) { return "Commit"; },
                        [](const RollbackRequest &) { return "Rollback"; },
                        [](const CheckTxnStatusRequest &) { return "CheckTxnStatus"; },
                        [](const ResolveLockRequest &) { return "ResolveLock"; },
                        [](const GcRequest &) { return "Gc"; },
                        [](const GetRequest &) { return "Get"; },
                        [](const ScanRequest &) { return "Scan"; },
                        [](const ScanLockRequest &) { return "ScanLock"; },
                        [](const SplitRequest &) { return "Split"; },
                        [](const PrepareMergeRequest &) { return "PrepareMerge"; },
                        [](const CommitMergeRequest &) { return "CommitMerge"; },
                        [](const RollbackMergeRequest &) { return "RollbackMerge"; },
                        [](const CompactLogRequest &) { return "CompactLog"; },
                    },
                    request);
}

std::optional<common::Error> CheckKeysInShard(const Request &request, const ShardMeta &meta) {
  return std::visit(
      utils::Overloaded{
          [&](const RawPutRequest &r) { return CheckKey(r.key, meta); },
          [&](const RawDeleteRequest &r) { return CheckKey(r.key, meta); },
          [&](const RawGetRequest &r) { return CheckKey(r.key, meta); },
          [&](const PrewriteRequest &r) -> std::optional<common::Error> {
            if (r.mutations.empty()) return common::InvalidRequest{"Prewrite without mutations"};
            for (const auto &mutation : r.mutations) {
              if (auto error = CheckKey(mutation.key, meta)) return error;
            }
            return std::nullopt;
          },
          [&](const CommitRequest &r) { return CheckKeys(r.keys, meta); },
          [&](const RollbackRequest &r) { return CheckKeys(r.keys, meta); },
          [&](const CheckTxnStatusRequest &r) { return CheckKey(r.primary, meta); },
          [&](const ResolveLockRequest &r) { return CheckKeys(r.keys, meta); },
          [&](const GcRequest &) -> std::optional<common::Error> { return std::nullopt; },
          [&](const GetRequest &r) { return CheckKey(r.key, meta); },
          [&](const ScanRequest &r) { return CheckRangeStart(r.start_key, meta); },
          [&](const ScanLockRequest &r) { return CheckRangeStart(r.start_key, meta); },
          [&](const SplitRequest &r) -> std::optional<common::Error> {
            if (r.split_key.empty() || r.split_key <= meta.start_key ||
                (!meta.end_key.empty() && r.split_key >= meta.end_key)) {
              return common::InvalidRequest{
                  fmt::format("Split key {} is not inside shard {}", logging::Escape(r.split_key), meta.id)};
            }
            return std::nullopt;
          },
          [&](const auto &) -> std::optional<common::Error> { return std::nullopt; },
      },
      request);
}

void Save(const CommandHeader &obj, slk::Builder *builder) {
  Save(obj.shard_id, builder);
  Save(obj.peer_id, builder);
  Save(obj.epoch, builder);
}

void Load(CommandHeader *obj, slk::Reader *reader) {
  Load(&obj->shard_id, reader);
  Load(&obj->peer_id, reader);
  Load(&obj->epoch, reader);
}

void Save(const RawPutRequest &obj, slk::Builder *builder) {
  Save(obj.key, builder);
  Save(obj.value, builder);
}

void Load(RawPutRequest *obj, slk::Reader *reader) {
  Load(&obj->key, reader);
  Load(&obj->value, reader);
}

void Save(const RawDeleteRequest &obj, slk::Builder *builder) { Save(obj.key, builder); }
void Load(RawDeleteRequest *obj, slk::Reader *reader) { Load(&obj->key, reader); }

void Save(const RawGetRequest &obj, slk::Builder *builder) { Save(obj.key, builder); }
void Load(RawGetRequest *obj, slk::Reader *reader) { Load(&obj->key, reader); }

void Save(const PrewriteRequest &obj, slk::Builder *builder) {
  Save(obj.mutations, builder);
  Save(obj.primary, builder);
  Save(obj.start_ts, builder);
  Save(obj.lock_ttl, builder);
}

void Load(PrewriteRequest *obj, slk::Reader *reader) {
  Load(&obj->mutations, reader);
  Load(&obj->primary, reader);
  Load(&obj->start_ts, reader);
  Load(&obj->lock_ttl, reader);
}

void Save(const CommitRequest &obj, slk::Builder *builder) {
  Save(obj.keys, builder);
  Save(obj.start_ts, builder);
  Save(obj.commit_ts, builder);
}

void Load(CommitRequest *obj, slk::Reader *reader) {
  Load(&obj->keys, reader);
  Load(&obj->start_ts, reader);
  Load(&obj->commit_ts, reader);
}

void Save(const RollbackRequest &obj, slk::Builder *builder) {
  Save(obj.keys, builder);
  Save(obj.start_ts, builder);
}

void Load(RollbackRequest *obj, slk::Reader *reader) {
  Load(&obj->keys, reader);
  Load(&obj->start_ts, reader);
}

void Save(const CheckTxnStatusRequest &obj, slk::Builder *builder) {
  Save(obj.primary, builder);
  Save(obj.lock_ts, builder);
  Save(obj.current_ts, builder);
}

void Load(CheckTxnStatusRequest *obj, slk::Reader *reader) {
  Load(&obj->primary, reader);
  Load(&obj->lock_ts, reader);
  Load(&obj->current_ts, reader);
}

void Save(const ResolveLockRequest &obj, slk::Builder *builder) {
  Save(obj.start_ts, builder);
  Save(obj.commit_ts, builder);
  Save(obj.keys, builder);
}

void Load(ResolveLockRequest *obj, slk::Reader *reader) {
  Load(&obj->start_ts, reader);
  Load(&obj->commit_ts, reader);
  Load(&obj->keys, reader);
}

void Save(const GcRequest &obj, slk::Builder *builder) { Save(obj.safe_point, builder); }
void Load(GcRequest *obj, slk::Reader *reader) { Load(&obj->safe_point, reader); }

void Save(const GetRequest &obj, slk::Builder *builder) {
  Save(obj.key, builder);
  Save(obj.ts, builder);
}

void Load(GetRequest *obj, slk::Reader *reader) {
  Load(&obj->key, reader);
  Load(&obj->ts, reader);
}

void Save(const ScanRequest &obj, slk::Builder *builder) {
  Save(obj.start_key, builder);
  Save(obj.end_key, builder);
  Save(obj.limit, builder);
  Save(obj.ts, builder);
}

void Load(ScanRequest *obj, slk::Reader *reader) {
  Load(&obj->start_key, reader);
  Load(&obj->end_key, reader);
  Load(&obj->limit, reader);
  Load(&obj->ts, reader);
}

void Save(const ScanLockRequest &obj, slk::Builder *builder) {
  Save(obj.max_ts, builder);
  Save(obj.start_key, builder);
  Save(obj.end_key, builder);
  Save(obj.limit, builder);
}

void Load(ScanLockRequest *obj, slk::Reader *reader) {
  Load(&obj->max_ts, reader);
  Load(&obj->start_key, reader);
  Load(&obj->end_key, reader);
  Load(&obj->limit, reader);
}

void Save(const SplitRequest &obj, slk::Builder *builder) {
  Save(obj.split_key, builder);
  Save(obj.new_shard_id, builder);
  Save(obj.new_peer_ids, builder);
}

void Load(SplitRequest *obj, slk::Reader *reader) {
  Load(&obj->split_key, reader);
  Load(&obj->new_shard_id, reader);
  Load(&obj->new_peer_ids, reader);
}

void Save(const PrepareMergeRequest &obj, slk::Builder *builder) { Save(obj.target, builder); }
void Load(PrepareMergeRequest *obj, slk::Reader *reader) { Load(&obj->target, reader); }

void Save(const CommitMergeRequest &obj, slk::Builder *builder) {
  Save(obj.source, builder);
  Save(obj.commit, builder);
}

void Load(CommitMergeRequest *obj, slk::Reader *reader) {
  Load(&obj->source, reader);
  Load(&obj->commit, reader);
}

void Save(const RollbackMergeRequest &obj, slk::Builder *builder) { Save(obj.commit, builder); }
void Load(RollbackMergeRequest *obj, slk::Reader *reader) { Load(&obj->commit, reader); }

void Save(const CompactLogRequest &obj, slk::Builder *builder) {
  Save(obj.compact_index, builder);
  Save(obj.compact_term, builder);
}

void Load(CompactLogRequest *obj, slk::Reader *reader) {
  Load(&obj->compact_index, reader);
  Load(&obj->compact_term, reader);
}

void Save(const RaftCommand &obj, slk::Builder *builder) {
  Save(obj.header, builder);
  Save(obj.request, builder);
}

void Load(RaftCommand *obj, slk::Reader *reader) {
  Load(&obj->header, reader);
  Load(&obj->request, reader);
}

void Save(const ChangePeerRequest &obj, slk::Builder *builder) {
  Save(obj.type, builder);
  Save(obj.peer, builder);
}

void Load(ChangePeerRequest *obj, slk::Reader *reader) {
  Load(&obj->type, reader);
  Load(&obj->peer, reader);
}

void Save(const ConfChangeContext &obj, slk::Builder *builder) {
  Save(obj.header, builder);
  Save(obj.changes, builder);
}

void Load(ConfChangeContext *obj, slk::Reader *reader) {
  Load(&obj->header, reader);
  Load(&obj->changes, reader);
}

void Save(const EmptyResponse & /*obj*/, slk::Builder * /*builder*/) {}
void Load(EmptyResponse * /*obj*/, slk::Reader * /*reader*/) {}

void Save(const PrewriteResponse &obj, slk::Builder *builder) { Save(obj.errors, builder); }
void Load(PrewriteResponse *obj, slk::Reader *reader) { Load(&obj->errors, reader); }

void Save(const GetResponse &obj, slk::Builder *builder) { Save(obj.value, builder); }
void Load(GetResponse *obj, slk::Reader *reader) { Load(&obj->value, reader); }

void Save(const ScanResponse &obj, slk::Builder *builder) { Save(obj.pairs, builder); }
void Load(ScanResponse *obj, slk::Reader *reader) { Load(&obj->pairs, reader); }

void Save(const ScanLockResponse &obj, slk::Builder *builder) { Save(obj.locks, builder); }
void Load(ScanLockResponse *obj, slk::Reader *reader) { Load(&obj->locks, reader); }

void Save(const CheckTxnStatusResponse &obj, slk::Builder *builder) { Save(obj.status, builder); }
void Load(CheckTxnStatusResponse *obj, slk::Reader *reader) { Load(&obj->status, reader); }

void Save(const GcResponse &obj, slk::Builder *builder) { Save(obj.removed, builder); }
void Load(GcResponse *obj, slk::Reader *reader) { Load(&obj->removed, reader); }

void Save(const SplitResponse &obj, slk::Builder *builder) {
  Save(obj.left, builder);
  Save(obj.right, builder);
}

void Load(SplitResponse *obj, slk::Reader *reader) {
  Load(&obj->left, reader);
  Load(&obj->right, reader);
}

void Save(const ShardDetailResponse &obj, slk::Builder *builder) {
  Save(obj.meta, builder);
  Save(obj.leader, builder);
}

void Load(ShardDetailResponse *obj, slk::Reader *reader) {
  Load(&obj->meta, reader);
  Load(&obj->leader, reader);
}

void Save(const ChangePeerResponse &obj, slk::Builder *builder) { Save(obj.meta, builder); }
void Load(ChangePeerResponse *obj, slk::Reader *reader) { Load(&obj->meta, reader); }

}  // namespace rangekv::raftstore
