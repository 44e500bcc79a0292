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

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kvstore/kvstore.hpp"
#include "txn/types.hpp"

namespace rangekv::txn {

/// A committed version of a key: the commit timestamp and its write record.
struct CommitRecord {
  TimeStamp commit_ts{0};
  Write write;
};

/**
 * Reads lock, write and value records of user keys from a consistent view of
 * the store. Keys passed in and returned are user keys.
 *
 * Every method may throw kvstore::KVStoreIOError, and utils::CodecException
 * when a stored record is malformed.
 */
class MvccReader {
 public:
  explicit MvccReader(std::shared_ptr<const kvstore::Snapshot> snapshot) : snapshot_(std::move(snapshot)) {}

  std::optional<Lock> LoadLock(std::string_view key) const;

  /// Value written by the transaction `start_ts`, stored separately when it
  /// doesn't fit into the records.
  std::optional<std::string> LoadData(std::string_view key, TimeStamp start_ts) const;

  /// Newest write of `key` with commit_ts <= ts, of any type.
  std::optional<CommitRecord> SeekWrite(std::string_view key, TimeStamp ts) const;

  /// The commit or rollback record the transaction `start_ts` left on `key`.
  std::optional<CommitRecord> GetTxnCommitRecord(std::string_view key, TimeStamp start_ts) const;

  /// Value of `key` as of `ts`, ignoring locks.
  std::optional<std::string> GetValue(std::string_view key, TimeStamp ts) const;

  /// Locks in [start, end) accepted by `filter`. A limit of 0 means no limit.
  std::vector<std::pair<std::string, Lock>> ScanLocks(std::string_view start, std::string_view end,
                                                      const std::function<bool(const Lock &)> &filter,
                                                      size_t limit) const;

  /// Visible values in [start, end) as of `ts`, in key order. A limit of 0
  /// means no limit.
  std::vector<KvPair> ScanValues(std::string_view start, std::string_view end, size_t limit, TimeStamp ts) const;

  /// Every version of `key`, newest first.
  std::vector<CommitRecord> AllWrites(std::string_view key) const;

  /// Distinct user keys in [start, end) which have write records.
  std::vector<std::string> WriteKeys(std::string_view start, std::string_view end) const;

 private:
  std::optional<std::string> ValueOf(std::string_view key, const Write &write) const;

  std::shared_ptr<const kvstore::Snapshot> snapshot_;
};

/**
 * Collects the record changes of one transactional command. Nothing is
 * visible until the batch is written.
 */
class MvccTxn {
 public:
  void PutLock(std::string_view key, const Lock &lock);
  void UnlockKey(std::string_view key);
  void PutValue(std::string_view key, TimeStamp start_ts, std::string_view value);
  void DeleteValue(std::string_view key, TimeStamp start_ts);
  void PutWrite(std::string_view key, TimeStamp commit_ts, const Write &write);
  void DeleteWrite(std::string_view key, TimeStamp commit_ts);

  const kvstore::WriteBatch &batch() const { return batch_; }
  kvstore::WriteBatch TakeBatch() { return std::move(batch_); }
  bool Empty() const { return batch_.Empty(); }

 private:
  kvstore::WriteBatch batch_;
};

}  // namespace rangekv::txn
