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

#include "server/kv_service.hpp"

#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "utils/logging.hpp"
#include "utils/variant_helpers.hpp"

namespace rangekv::server {

namespace {

using raftstore::CommandResult;
using raftstore::RaftCommand;

template <typename TResponse>
KvResult<TResponse> Expect(CommandResult result) {
  if (result.HasError()) return std::move(result).GetError();
  auto *response = std::get_if<TResponse>(&*result);
  RKV_ASSERT(response, "Unexpected response type for the request");
  return std::move(*response);
}

KvResult<> ExpectEmpty(CommandResult result) {
  if (result.HasError()) return std::move(result).GetError();
  return {};
}

}  // namespace

KvService::KvService(raftstore::Store *store, const std::chrono::milliseconds request_timeout)
    : store_(store), request_timeout_(request_timeout) {}

CommandResult KvService::Wait(io::Future<CommandResult> future) {
  auto result = future.WaitFor(request_timeout_);
  if (!result) return raftstore::ErrorResult(common::TimedOut{});
  return std::move(*result);
}

CommandResult KvService::Execute(RaftCommand command) {
  spdlog::trace("Executing {} on shard {}", raftstore::RequestName(command.request), command.header.shard_id);
  return Wait(store_->SendCommand(std::move(command)));
}

CommandResult KvService::Handle(ClientRequest request) {
  return std::visit(utils::Overloaded{
                        [this](RaftCommand &command) { return Execute(std::move(command)); },
                        [this](ShardDetailRequest &detail) { return Wait(store_->ShardDetail(detail.shard_id)); },
                    },
                    request);
}

KvResult<std::optional<std::string>> KvService::Get(const ShardContext &ctx, std::string key,
                                                     const txn::TimeStamp ts) {
  auto result = Expect<raftstore::GetResponse>(
      Execute(RaftCommand{ctx, raftstore::GetRequest{.key = std::move(key), .ts = ts}}));
  if (result.HasError()) return std::move(result).GetError();
  return std::move(result->value);
}

KvResult<std::vector<txn::KvPair>> KvService::Scan(const ShardContext &ctx, std::string start_key,
                                                   std::string end_key, const uint64_t limit,
                                                   const txn::TimeStamp ts) {
  auto result = Expect<raftstore::ScanResponse>(Execute(RaftCommand{
      ctx, raftstore::ScanRequest{
               .start_key = std::move(start_key), .end_key = std::move(end_key), .limit = limit, .ts = ts}}));
  if (result.HasError()) return std::move(result).GetError();
  return std::move(result->pairs);
}

KvResult<std::vector<common::Error>> KvService::Prewrite(const ShardContext &ctx,
                                                         std::vector<txn::Mutation> mutations, std::string primary,
                                                         const txn::TimeStamp start_ts, const uint64_t lock_ttl) {
  auto result = Expect<raftstore::PrewriteResponse>(
      Execute(RaftCommand{ctx, raftstore::PrewriteRequest{.mutations = std::move(mutations),
                                                          .primary = std::move(primary),
                                                          .start_ts = start_ts,
                                                          .lock_ttl = lock_ttl}}));
  if (result.HasError()) return std::move(result).GetError();
  return std::move(result->errors);
}

KvResult<> KvService::Commit(const ShardContext &ctx, std::vector<std::string> keys, const txn::TimeStamp start_ts,
                             const txn::TimeStamp commit_ts) {
  return ExpectEmpty(Execute(RaftCommand{
      ctx, raftstore::CommitRequest{.keys = std::move(keys), .start_ts = start_ts, .commit_ts = commit_ts}}));
}

KvResult<> KvService::Rollback(const ShardContext &ctx, std::vector<std::string> keys,
                               const txn::TimeStamp start_ts) {
  return ExpectEmpty(
      Execute(RaftCommand{ctx, raftstore::RollbackRequest{.keys = std::move(keys), .start_ts = start_ts}}));
}

KvResult<> KvService::ResolveLock(const ShardContext &ctx, const txn::TimeStamp start_ts,
                                  const txn::TimeStamp commit_ts, std::vector<std::string> keys) {
  return ExpectEmpty(Execute(RaftCommand{
      ctx, raftstore::ResolveLockRequest{.start_ts = start_ts, .commit_ts = commit_ts, .keys = std::move(keys)}}));
}

KvResult<txn::TxnStatus> KvService::CheckTxnStatus(const ShardContext &ctx, std::string primary,
                                                   const txn::TimeStamp lock_ts, const txn::TimeStamp current_ts) {
  auto result = Expect<raftstore::CheckTxnStatusResponse>(Execute(RaftCommand{
      ctx, raftstore::CheckTxnStatusRequest{
               .primary = std::move(primary), .lock_ts = lock_ts, .current_ts = current_ts}}));
  if (result.HasError()) return std::move(result).GetError();
  return result->status;
}

KvResult<std::vector<common::LockInfo>> KvService::ScanLock(const ShardContext &ctx, const txn::TimeStamp max_ts,
                                                            std::string start_key, std::string end_key,
                                                            const uint64_t limit) {
  auto result = Expect<raftstore::ScanLockResponse>(Execute(RaftCommand{
      ctx, raftstore::ScanLockRequest{
               .max_ts = max_ts, .start_key = std::move(start_key), .end_key = std::move(end_key), .limit = limit}}));
  if (result.HasError()) return std::move(result).GetError();
  return std::move(result->locks);
}

KvResult<> KvService::RawPut(const ShardContext &ctx, std::string key, std::string value) {
  return ExpectEmpty(
      Execute(RaftCommand{ctx, raftstore::RawPutRequest{.key = std::move(key), .value = std::move(value)}}));
}

KvResult<> KvService::RawDelete(const ShardContext &ctx, std::string key) {
  return ExpectEmpty(Execute(RaftCommand{ctx, raftstore::RawDeleteRequest{.key = std::move(key)}}));
}

KvResult<std::optional<std::string>> KvService::RawGet(const ShardContext &ctx, std::string key) {
  auto result =
      Expect<raftstore::GetResponse>(Execute(RaftCommand{ctx, raftstore::RawGetRequest{.key = std::move(key)}}));
  if (result.HasError()) return std::move(result).GetError();
  return std::move(result->value);
}

KvResult<raftstore::ShardDetailResponse> KvService::ShardDetail(const common::ShardId shard_id) {
  return Expect<raftstore::ShardDetailResponse>(Wait(store_->ShardDetail(shard_id)));
}

}  // namespace rangekv::server
