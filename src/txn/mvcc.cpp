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

#include "txn/mvcc.hpp"

#include "common/keys.hpp"
#include "utils/codec.hpp"

namespace rangekv::txn {

using kvstore::ColumnFamily;
namespace keys = common::keys;

std::optional<Lock> MvccReader::LoadLock(std::string_view key) const {
  auto value = snapshot_->Get(ColumnFamily::LOCK, keys::DataKey(key));
  if (!value) return std::nullopt;
  return DecodeLock(*value);
}

std::optional<std::string> MvccReader::LoadData(std::string_view key, const TimeStamp start_ts) const {
  return snapshot_->Get(ColumnFamily::DEFAULT, keys::DataKeyWithTs(key, start_ts));
}

std::optional<CommitRecord> MvccReader::SeekWrite(std::string_view key, const TimeStamp ts) const {
  const auto prefix = keys::DataKey(key);
  auto it = snapshot_->NewIterator(ColumnFamily::WRITE, keys::DataKeyWithTs(key, ts), utils::PrefixNext(prefix));
  it.SeekToFirst();
  if (!it.Valid()) return std::nullopt;
  const auto [user_key, commit_ts] = keys::SplitKeyTs(it.Key());
  return CommitRecord{.commit_ts = commit_ts, .write = DecodeWrite(it.Value())};
}

std::optional<CommitRecord> MvccReader::GetTxnCommitRecord(std::string_view key, const TimeStamp start_ts) const {
  // Versions are ordered newest first, so everything committed after the
  // transaction started is visited before the first older version.
  const auto prefix = keys::DataKey(key);
  auto it = snapshot_->NewIterator(ColumnFamily::WRITE, prefix, utils::PrefixNext(prefix));
  for (it.SeekToFirst(); it.Valid(); it.Next()) {
    const auto [user_key, commit_ts] = keys::SplitKeyTs(it.Key());
    if (commit_ts < start_ts) break;
    auto write = DecodeWrite(it.Value());
    if (write.start_ts == start_ts) return CommitRecord{.commit_ts = commit_ts, .write = std::move(write)};
  }
  return std::nullopt;
}

std::optional<std::string> MvccReader::ValueOf(std::string_view key, const Write &write) const {
  if (write.short_value) return write.short_value;
  auto value = LoadData(key, write.start_ts);
  if (!value) {
    throw kvstore::KVStoreIOError("Value of {} written at {} is missing", key, write.start_ts);
  }
  return value;
}

std::optional<std::string> MvccReader::GetValue(std::string_view key, TimeStamp ts) const {
  while (true) {
    auto record = SeekWrite(key, ts);
    if (!record) return std::nullopt;
    switch (record->write.type) {
      case WriteType::PUT:
        return ValueOf(key, record->write);
      case WriteType::DELETE:
        return std::nullopt;
      case WriteType::LOCK:
      case WriteType::ROLLBACK:
        // Not a data change, look at the previous version.
        if (record->commit_ts == 0) return std::nullopt;
        ts = record->commit_ts - 1;
        break;
    }
  }
}

std::vector<std::pair<std::string, Lock>> MvccReader::ScanLocks(std::string_view start, std::string_view end,
                                                                const std::function<bool(const Lock &)> &filter,
                                                                const size_t limit) const {
  std::vector<std::pair<std::string, Lock>> locks;
  auto it = snapshot_->NewIterator(ColumnFamily::LOCK, keys::DataKey(start), keys::DataEndKey(end));
  for (it.SeekToFirst(); it.Valid(); it.Next()) {
    auto lock = DecodeLock(it.Value());
    if (!filter(lock)) continue;
    locks.emplace_back(keys::OriginKey(it.Key()), std::move(lock));
    if (limit != 0 && locks.size() >= limit) break;
  }
  return locks;
}

std::vector<KvPair> MvccReader::ScanValues(std::string_view start, std::string_view end, const size_t limit,
                                           const TimeStamp ts) const {
  std::vector<KvPair> result;
  auto it = snapshot_->NewIterator(ColumnFamily::WRITE, keys::DataKey(start), keys::DataEndKey(end));
  it.SeekToFirst();
  while (it.Valid()) {
    auto [user_key, commit_ts] = keys::SplitKeyTs(it.Key());
    if (auto value = GetValue(user_key, ts)) {
      result.push_back(KvPair{.key = user_key, .value = std::move(*value)});
      if (limit != 0 && result.size() >= limit) break;
    }
    // Skip the remaining versions of this key.
    it.Seek(utils::PrefixNext(keys::DataKey(user_key)));
  }
  return result;
}

std::vector<CommitRecord> MvccReader::AllWrites(std::string_view key) const {
  std::vector<CommitRecord> records;
  const auto prefix = keys::DataKey(key);
  auto it = snapshot_->NewIterator(ColumnFamily::WRITE, prefix, utils::PrefixNext(prefix));
  for (it.SeekToFirst(); it.Valid(); it.Next()) {
    const auto [user_key, commit_ts] = keys::SplitKeyTs(it.Key());
    records.push_back(CommitRecord{.commit_ts = commit_ts, .write = DecodeWrite(it.Value())});
  }
  return records;
}

std::vector<std::string> MvccReader::WriteKeys(std::string_view start, std::string_view end) const {
  std::vector<std::string> result;
  auto it = snapshot_->NewIterator(ColumnFamily::WRITE, keys::DataKey(start), keys::DataEndKey(end));
  it.SeekToFirst();
  while (it.Valid()) {
    auto [user_key, commit_ts] = keys::SplitKeyTs(it.Key());
    const auto next = utils::PrefixNext(keys::DataKey(user_key));
    result.push_back(std::move(user_key));
    it.Seek(next);
  }
  return result;
}

void MvccTxn::PutLock(std::string_view key, const Lock &lock) {
  batch_.Put(ColumnFamily::LOCK, keys::DataKey(key), EncodeLock(lock));
}

void MvccTxn::UnlockKey(std::string_view key) { batch_.Delete(ColumnFamily::LOCK, keys::DataKey(key)); }

void MvccTxn::PutValue(std::string_view key, const TimeStamp start_ts, std::string_view value) {
  batch_.Put(ColumnFamily::DEFAULT, keys::DataKeyWithTs(key, start_ts), value);
}

void MvccTxn::DeleteValue(std::string_view key, const TimeStamp start_ts) {
  batch_.Delete(ColumnFamily::DEFAULT, keys::DataKeyWithTs(key, start_ts));
}

void MvccTxn::PutWrite(std::string_view key, const TimeStamp commit_ts, const Write &write) {
  batch_.Put(ColumnFamily::WRITE, keys::DataKeyWithTs(key, commit_ts), EncodeWrite(write));
}

void MvccTxn::DeleteWrite(std::string_view key, const TimeStamp commit_ts) {
  batch_.Delete(ColumnFamily::WRITE, keys::DataKeyWithTs(key, commit_ts));
}

}  // namespace rangekv::txn
