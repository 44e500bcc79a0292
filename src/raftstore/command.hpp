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
/// Commands which are replicated through a shard's log and executed by its
/// apply state machine, and the responses they produce.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "common/errors.hpp"
#include "common/types.hpp"
#include "raft/messages.hpp"
#include "txn/types.hpp"
#include "utils/result.hpp"

namespace rangekv::raftstore {

using common::PeerId;
using common::PeerMeta;
using common::ShardEpoch;
using common::ShardId;
using common::ShardMeta;

/// Which shard replica a request targets and the shard version the sender
/// knows about.
struct CommandHeader {
  ShardId shard_id{common::kInvalidId};
  PeerId peer_id{common::kInvalidId};
  ShardEpoch epoch;
};

struct RawPutRequest {
  std::string key;
  std::string value;
};

struct RawDeleteRequest {
  std::string key;
};

struct RawGetRequest {
  std::string key;
};

struct PrewriteRequest {
  std::vector<txn::Mutation> mutations;
  std::string primary;
  txn::TimeStamp start_ts{0};
  uint64_t lock_ttl{0};
};

struct CommitRequest {
  std::vector<std::string> keys;
  txn::TimeStamp start_ts{0};
  txn::TimeStamp commit_ts{0};
};

struct RollbackRequest {
  std::vector<std::string> keys;
  txn::TimeStamp start_ts{0};
};

struct CheckTxnStatusRequest {
  std::string primary;
  txn::TimeStamp lock_ts{0};
  txn::TimeStamp current_ts{0};
};

struct ResolveLockRequest {
  txn::TimeStamp start_ts{0};
  /// 0 rolls the transaction back.
  txn::TimeStamp commit_ts{0};
  /// Every lock of the transaction in the shard when empty.
  std::vector<std::string> keys;
};

struct GcRequest {
  txn::TimeStamp safe_point{0};
};

struct GetRequest {
  std::string key;
  txn::TimeStamp ts{0};
};

struct ScanRequest {
  std::string start_key;
  /// Clamped to the shard end.
  std::string end_key;
  uint64_t limit{0};
  txn::TimeStamp ts{0};
};

struct ScanLockRequest {
  txn::TimeStamp max_ts{0};
  std::string start_key;
  std::string end_key;
  uint64_t limit{0};
};

struct SplitRequest {
  std::string split_key;
  ShardId new_shard_id{common::kInvalidId};
  /// Peer ids of the new shard, in the order of the parent's peers.
  std::vector<PeerId> new_peer_ids;
};

struct PrepareMergeRequest {
  ShardMeta target;
};

struct CommitMergeRequest {
  /// Source metadata as of its PrepareMerge.
  ShardMeta source;
  /// Log index of the source's PrepareMerge.
  uint64_t commit{0};
};

struct RollbackMergeRequest {
  uint64_t commit{0};
};

struct CompactLogRequest {
  uint64_t compact_index{0};
  uint64_t compact_term{0};
};

using Request = std::variant<RawPutRequest, RawDeleteRequest, RawGetRequest, PrewriteRequest, CommitRequest,
                             RollbackRequest, CheckTxnStatusRequest, ResolveLockRequest, GcRequest, GetRequest,
                             ScanRequest, ScanLockRequest, SplitRequest, PrepareMergeRequest, CommitMergeRequest,
                             RollbackMergeRequest, CompactLogRequest>;

struct RaftCommand {
  CommandHeader header;
  Request request;
};

/// Reads don't change the state and may be served without replication.
bool IsReadOnly(const Request &request);

/// Admin commands change the shard itself rather than its data.
bool IsAdmin(const Request &request);

/// Commands which change the shard boundaries and therefore require the
/// sender's version to be current.
bool ChecksVersion(const Request &request);

std::string_view RequestName(const Request &request);

/// Returns an error when a key of the request lies outside of the shard.
std::optional<common::Error> CheckKeysInShard(const Request &request, const ShardMeta &meta);

/// Peers to add, remove or demote, carried in the context of conf change
/// entries so every replica learns their nodes.
struct ChangePeerRequest {
  raft::ConfChangeType type{raft::ConfChangeType::ADD_NODE};
  PeerMeta peer;
};

struct ConfChangeContext {
  CommandHeader header;
  std::vector<ChangePeerRequest> changes;
};

struct EmptyResponse {};

struct PrewriteResponse {
  /// Per key failures; the prewrite wrote nothing when not empty.
  std::vector<common::Error> errors;
};

struct GetResponse {
  std::optional<std::string> value;
};

struct ScanResponse {
  std::vector<txn::KvPair> pairs;
};

struct ScanLockResponse {
  std::vector<common::LockInfo> locks;
};

struct CheckTxnStatusResponse {
  txn::TxnStatus status;
};

struct GcResponse {
  uint64_t removed{0};
};

struct SplitResponse {
  ShardMeta left;
  ShardMeta right;
};

struct ShardDetailResponse {
  ShardMeta meta;
  std::optional<PeerMeta> leader;
};

struct ChangePeerResponse {
  ShardMeta meta;
};

using Response = std::variant<EmptyResponse, PrewriteResponse, GetResponse, ScanResponse, ScanLockResponse,
                              CheckTxnStatusResponse, GcResponse, SplitResponse, ShardDetailResponse,
                              ChangePeerResponse>;

using CommandResult = utils::BasicResult<common::Error, Response>;

template <typename TError>
CommandResult ErrorResult(TError error) {
  return common::Error{std::move(error)};
}

inline CommandResult ResponseResult(Response response) { return response; }

using slk::Load;
using slk::Save;

void Save(const CommandHeader &obj, slk::Builder *builder);
void Load(CommandHeader *obj, slk::Reader *reader);
void Save(const RawPutRequest &obj, slk::Builder *builder);
void Load(RawPutRequest *obj, slk::Reader *reader);
void Save(const RawDeleteRequest &obj, slk::Builder *builder);
void Load(RawDeleteRequest *obj, slk::Reader *reader);
void Save(const RawGetRequest &obj, slk::Builder *builder);
void Load(RawGetRequest *obj, slk::Reader *reader);
void Save(const PrewriteRequest &obj, slk::Builder *builder);
void Load(PrewriteRequest *obj, slk::Reader *reader);
void Save(const CommitRequest &obj, slk::Builder *builder);
void Load(CommitRequest *obj, slk::Reader *reader);
void Save(const RollbackRequest &obj, slk::Builder *builder);
void Load(RollbackRequest *obj, slk::Reader *reader);
void Save(const CheckTxnStatusRequest &obj, slk::Builder *builder);
void Load(CheckTxnStatusRequest *obj, slk::Reader *reader);
void Save(const ResolveLockRequest &obj, slk::Builder *builder);
void Load(ResolveLockRequest *obj, slk::Reader *reader);
void Save(const GcRequest &obj, slk::Builder *builder);
void Load(GcRequest *obj, slk::Reader *reader);
void Save(const GetRequest &obj, slk::Builder *builder);
void Load(GetRequest *obj, slk::Reader *reader);
void Save(const ScanRequest &obj, slk::Builder *builder);
void Load(ScanRequest *obj, slk::Reader *reader);
void Save(const ScanLockRequest &obj, slk::Builder *builder);
void Load(ScanLockRequest *obj, slk::Reader *reader);
void Save(const SplitRequest &obj, slk::Builder *builder);
void Load(SplitRequest *obj, slk::Reader *reader);
void Save(const PrepareMergeRequest &obj, slk::Builder *builder);
void Load(PrepareMergeRequest *obj, slk::Reader *reader);
void Save(const CommitMergeRequest &obj, slk::Builder *builder);
void Load(CommitMergeRequest *obj, slk::Reader *reader);
void Save(const RollbackMergeRequest &obj, slk::Builder *builder);
void Load(RollbackMergeRequest *obj, slk::Reader *reader);
void Save(const CompactLogRequest &obj, slk::Builder *builder);
void Load(CompactLogRequest *obj, slk::Reader *reader);
void Save(const RaftCommand &obj, slk::Builder *builder);
void Load(RaftCommand *obj, slk::Reader *reader);
void Save(const ChangePeerRequest &obj, slk::Builder *builder);
void Load(ChangePeerRequest *obj, slk::Reader *reader);
void Save(const ConfChangeContext &obj, slk::Builder *builder);
void Load(ConfChangeContext *obj, slk::Reader *reader);

void Save(const EmptyResponse &obj, slk::Builder *builder);
void Load(EmptyResponse *obj, slk::Reader *reader);
void Save(const PrewriteResponse &obj, slk::Builder *builder);
void Load(PrewriteResponse *obj, slk::Reader *reader);
void Save(const GetResponse &obj, slk::Builder *builder);
void Load(GetResponse *obj, slk::Reader *reader);
void Save(const ScanResponse &obj, slk::Builder *builder);
void Load(ScanResponse *obj, slk::Reader *reader);
void Save(const ScanLockResponse &obj, slk::Builder *builder);
void Load(ScanLockResponse *obj, slk::Reader *reader);
void Save(const CheckTxnStatusResponse &obj, slk::Builder *builder);
void Load(CheckTxnStatusResponse *obj, slk::Reader *reader);
void Save(const GcResponse &obj, slk::Builder *builder);
void Load(GcResponse *obj, slk::Reader *reader);
void Save(const SplitResponse &obj, slk::Builder *builder);
void Load(SplitResponse *obj, slk::Reader *reader);
void Save(const ShardDetailResponse &obj, slk::Builder *builder);
void Load(ShardDetailResponse *obj, slk::Reader *reader);
void Save(const ChangePeerResponse &obj, slk::Builder *builder);
void Load(ChangePeerResponse *obj, slk::Reader *reader);

}  // namespace rangekv::raftstore
