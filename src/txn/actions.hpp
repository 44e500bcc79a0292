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
/// Percolator style transaction commands. Each command reads through an
/// MvccReader and stages its changes in an MvccTxn; the caller writes the
/// staged batch only when the command succeeded. The commands are
/// deterministic, so every replica of a shard produces the same changes.
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/errors.hpp"
#include "txn/mvcc.hpp"
#include "txn/types.hpp"
#include "utils/result.hpp"

namespace rangekv::txn {

/// Locks every mutated key for the transaction `start_ts` and stages the new
/// values. Returns one error per key which can't be locked; nothing may be
/// written when the result isn't empty. Prewriting a key which is already
/// locked or committed by the same transaction is a no-op.
std::vector<common::Error> Prewrite(const MvccReader &reader, MvccTxn *txn, const std::vector<Mutation> &mutations,
                                    std::string_view primary, TimeStamp start_ts, uint64_t lock_ttl);

/// Turns the locks of `start_ts` into write records at `commit_ts`.
utils::BasicResult<common::Error> Commit(const MvccReader &reader, MvccTxn *txn, const std::vector<std::string> &keys,
                                         TimeStamp start_ts, TimeStamp commit_ts);

/// Removes the locks and values of `start_ts` and leaves rollback records, so
/// a late prewrite of the same transaction fails.
utils::BasicResult<common::Error> Rollback(const MvccReader &reader, MvccTxn *txn,
                                           const std::vector<std::string> &keys, TimeStamp start_ts);

/// Decides the fate of the transaction `lock_ts` through its primary key. An
/// expired primary lock is rolled back, a missing one is protected with a
/// rollback record.
utils::BasicResult<common::Error, TxnStatus> CheckTxnStatus(const MvccReader &reader, MvccTxn *txn,
                                                            std::string_view primary, TimeStamp lock_ts,
                                                            TimeStamp current_ts);

/// Commits (commit_ts > 0) or rolls back (commit_ts == 0) the locks left by
/// `start_ts` on `keys`, or on every key in [start, end) when `keys` is
/// empty. Keys without such a lock are skipped.
utils::BasicResult<common::Error> ResolveLock(const MvccReader &reader, MvccTxn *txn, TimeStamp start_ts,
                                              TimeStamp commit_ts, const std::vector<std::string> &keys,
                                              std::string_view start, std::string_view end);

/// Removes the versions in [start, end) which are invisible to every read at
/// or after `safe_point`. Returns the number of removed write records.
uint64_t Gc(const MvccReader &reader, MvccTxn *txn, TimeStamp safe_point, std::string_view start,
            std::string_view end);

utils::BasicResult<common::Error, std::optional<std::string>> Get(const MvccReader &reader, std::string_view key,
                                                                  TimeStamp ts);

utils::BasicResult<common::Error, std::vector<KvPair>> Scan(const MvccReader &reader, std::string_view start,
                                                            std::string_view end, size_t limit, TimeStamp ts);

/// Locks in [start, end) with start_ts <= max_ts.
std::vector<LockInfo> ScanLock(const MvccReader &reader, TimeStamp max_ts, std::string_view start,
                               std::string_view end, size_t limit);

}  // namespace rangekv::txn
