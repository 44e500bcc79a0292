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
#include <optional>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "raftstore/command.hpp"
#include "raftstore/store.hpp"
#include "server/protocol.hpp"
#include "txn/types.hpp"
#include "utils/result.hpp"

namespace rangekv::server {

template <typename TValue = void>
using KvResult = utils::BasicResult<common::Error, TValue>;

/**
 * Client facing operations of one node. Every call is routed to the local
 * replica named by the shard context and waits for its result, at most for
 * the request timeout.
 */
class KvService {
 public:
  KvService(raftstore::Store *store, std::chrono::milliseconds request_timeout);

  raftstore::CommandResult Execute(raftstore::RaftCommand command);
  raftstore::CommandResult Handle(ClientRequest request);

  KvResult<std::optional<std::string>> Get(const ShardContext &ctx, std::string key, txn::TimeStamp ts);
  KvResult<std::vector<txn::KvPair>> Scan(const ShardContext &ctx, std::string start_key, std::string end_key,
                                          uint64_t limit, txn::TimeStamp ts);
  /// The inner vector holds per key failures; nothing was written when it
  /// isn't empty.
  KvResult<std::vector<common::Error>> Prewrite(const ShardContext &ctx, std::vector<txn::Mutation> mutations,
                                                std::string primary, txn::TimeStamp start_ts, uint64_t lock_ttl);
  KvResult<> Commit(const ShardContext &ctx, std::vector<std::string> keys, txn::TimeStamp start_ts,
                    txn::TimeStamp commit_ts);
  KvResult<> Rollback(const ShardContext &ctx, std::vector<std::string> keys, txn::TimeStamp start_ts);
  /// A zero `commit_ts` rolls the transaction back.
  KvResult<> ResolveLock(const ShardContext &ctx, txn::TimeStamp start_ts, txn::TimeStamp commit_ts,
                         std::vector<std::string> keys = {});
  KvResult<txn::TxnStatus> CheckTxnStatus(const ShardContext &ctx, std::string primary, txn::TimeStamp lock_ts,
                                          txn::TimeStamp current_ts);
  KvResult<std::vector<common::LockInfo>> ScanLock(const ShardContext &ctx, txn::TimeStamp max_ts,
                                                   std::string start_key, std::string end_key, uint64_t limit);

  KvResult<> RawPut(const ShardContext &ctx, std::string key, std::string value);
  KvResult<> RawDelete(const ShardContext &ctx, std::string key);
  KvResult<std::optional<std::string>> RawGet(const ShardContext &ctx, std::string key);

  KvResult<raftstore::ShardDetailResponse> ShardDetail(common::ShardId shard_id);

 private:
  raftstore::CommandResult Wait(io::Future<raftstore::CommandResult> future);

  raftstore::Store *store_;
  std::chrono::milliseconds request_timeout_;
};

}  // namespace rangekv::server
