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

#include "txn/actions.hpp"

#include <set>

#include "utils/logging.hpp"

namespace rangekv::txn {

namespace {

LockType LockTypeFromOp(const MutationOp op) {
  switch (op) {
    case MutationOp::PUT:
      return LockType::PUT;
    case MutationOp::DELETE:
      return LockType::DELETE;
    case MutationOp::LOCK:
      return LockType::LOCK;
  }
  return LockType::LOCK;
}

std::optional<common::Error> PrewriteKey(const MvccReader &reader, MvccTxn *txn, const Mutation &mutation,
                                         std::string_view primary, const TimeStamp start_ts, const uint64_t lock_ttl) {
  if (auto lock = reader.LoadLock(mutation.key)) {
    if (lock->start_ts != start_ts) return common::KeyIsLocked{lock->ToLockInfo(mutation.key)};
    // Prewritten before.
    return std::nullopt;
  }

  if (auto newest = reader.SeekWrite(mutation.key, kMaxTimeStamp); newest && newest->commit_ts >= start_ts) {
    // Either another transaction committed after this one started, or this
    // transaction was rolled back, or it already committed this key.
    if (auto own = reader.GetTxnCommitRecord(mutation.key, start_ts); own && own->write.type != WriteType::ROLLBACK) {
      return std::nullopt;
    }
    return common::WriteConflict{.key = mutation.key,
                                 .primary = std::string(primary),
                                 .start_ts = start_ts,
                                 .conflict_start_ts = newest->write.start_ts,
                                 .conflict_commit_ts = newest->commit_ts};
  }

  Lock lock{.type = LockTypeFromOp(mutation.op),
            .primary = std::string(primary),
            .start_ts = start_ts,
            .ttl = lock_ttl};
  if (mutation.op == MutationOp::PUT) {
    if (mutation.value.size() <= kShortValueMaxLen) {
      lock.short_value = mutation.value;
    } else {
      txn->PutValue(mutation.key, start_ts, mutation.value);
    }
  }
  txn->PutLock(mutation.key, lock);
  return std::nullopt;
}

// Removes the lock of `start_ts` and records the rollback.
void RollbackLock(MvccTxn *txn, std::string_view key, const Lock &lock) {
  if (lock.type == LockType::PUT && !lock.short_value) txn->DeleteValue(key, lock.start_ts);
  txn->UnlockKey(key);
  txn->PutWrite(key, lock.start_ts, Write{.type = WriteType::ROLLBACK, .start_ts = lock.start_ts});
}

void CommitLock(MvccTxn *txn, std::string_view key, const Lock &lock, const TimeStamp commit_ts) {
  txn->PutWrite(key, commit_ts,
                Write{.type = WriteTypeFromLockType(lock.type), .start_ts = lock.start_ts, .short_value = lock.short_value});
  txn->UnlockKey(key);
}

utils::BasicResult<common::Error> CommitKey(const MvccReader &reader, MvccTxn *txn, const std::string &key,
                                            const TimeStamp start_ts, const TimeStamp commit_ts) {
  if (auto lock = reader.LoadLock(key); lock && lock->start_ts == start_ts) {
    CommitLock(txn, key, *lock, commit_ts);
    return {};
  }
  auto record = reader.GetTxnCommitRecord(key, start_ts);
  if (record && record->write.type != WriteType::ROLLBACK) {
    spdlog::debug("Key {} is already committed by {} at {}", logging::Escape(key), start_ts, record->commit_ts);
    return {};
  }
  return common::Error{common::TxnLockNotFound{.key = key, .start_ts = start_ts}};
}

utils::BasicResult<common::Error> RollbackKey(const MvccReader &reader, MvccTxn *txn, const std::string &key,
                                              const TimeStamp start_ts) {
  if (auto lock = reader.LoadLock(key); lock && lock->start_ts == start_ts) {
    RollbackLock(txn, key, *lock);
    return {};
  }
  auto record = reader.GetTxnCommitRecord(key, start_ts);
  if (record) {
    if (record->write.type == WriteType::ROLLBACK) return {};
    return common::Error{common::Committed{.key = key, .commit_ts = record->commit_ts}};
  }
  // The prewrite may still arrive, the rollback record makes it fail.
  txn->PutWrite(key, start_ts, Write{.type = WriteType::ROLLBACK, .start_ts = start_ts});
  return {};
}

}  // namespace

std::vector<common::Error> Prewrite(const MvccReader &reader, MvccTxn *txn, const std::vector<Mutation> &mutations,
                                    std::string_view primary, const TimeStamp start_ts, const uint64_t lock_ttl) {
  std::vector<common::Error> errors;
  std::set<std::string_view> seen;
  for (const auto &mutation : mutations) {
    if (!seen.insert(mutation.key).second) {
      errors.emplace_back(common::InvalidRequest{fmt::format("Key {} is mutated twice", logging::Escape(mutation.key))});
      continue;
    }
    if (auto error = PrewriteKey(reader, txn, mutation, primary, start_ts, lock_ttl)) {
      errors.push_back(std::move(*error));
    }
  }
  return errors;
}

utils::BasicResult<common::Error> Commit(const MvccReader &reader, MvccTxn *txn, const std::vector<std::string> &keys,
                                         const TimeStamp start_ts, const TimeStamp commit_ts) {
  if (commit_ts <= start_ts) {
    return common::Error{common::InvalidTimestamp{.start_ts = start_ts, .commit_ts = commit_ts}};
  }
  for (const auto &key : keys) {
    if (auto result = CommitKey(reader, txn, key, start_ts, commit_ts); result.HasError()) return result;
  }
  return {};
}

utils::BasicResult<common::Error> Rollback(const MvccReader &reader, MvccTxn *txn,
                                           const std::vector<std::string> &keys, const TimeStamp start_ts) {
  for (const auto &key : keys) {
    if (auto result = RollbackKey(reader, txn, key, start_ts); result.HasError()) return result;
  }
  return {};
}

utils::BasicResult<common::Error, TxnStatus> CheckTxnStatus(const MvccReader &reader, MvccTxn *txn,
                                                            std::string_view primary, const TimeStamp lock_ts,
                                                            const TimeStamp current_ts) {
  if (auto lock = reader.LoadLock(primary); lock && lock->start_ts == lock_ts) {
    const auto expire_at = ExtractPhysical(lock->start_ts) + lock->ttl;
    const auto now = ExtractPhysical(current_ts);
    if (now >= expire_at) {
      spdlog::info("Rolling back expired primary lock {} of transaction {}", logging::Escape(primary), lock_ts);
      RollbackLock(txn, primary, *lock);
      return TxnStatus::RolledBack();
    }
    return TxnStatus::Locked(expire_at - now);
  }

  if (auto record = reader.GetTxnCommitRecord(primary, lock_ts)) {
    if (record->write.type == WriteType::ROLLBACK) return TxnStatus::RolledBack();
    return TxnStatus::Committed(record->commit_ts);
  }

  // Neither locked nor committed: the primary prewrite hasn't arrived yet or
  // never will. Roll it back so it can't succeed later.
  txn->PutWrite(primary, lock_ts, Write{.type = WriteType::ROLLBACK, .start_ts = lock_ts});
  return TxnStatus::RolledBack();
}

utils::BasicResult<common::Error> ResolveLock(const MvccReader &reader, MvccTxn *txn, const TimeStamp start_ts,
                                              const TimeStamp commit_ts, const std::vector<std::string> &keys,
                                              std::string_view start, std::string_view end) {
  if (commit_ts != 0 && commit_ts <= start_ts) {
    return common::Error{common::InvalidTimestamp{.start_ts = start_ts, .commit_ts = commit_ts}};
  }

  std::vector<std::pair<std::string, Lock>> locks;
  if (keys.empty()) {
    locks = reader.ScanLocks(
        start, end, [start_ts](const Lock &lock) { return lock.start_ts == start_ts; }, 0);
  } else {
    for (const auto &key : keys) {
      if (auto lock = reader.LoadLock(key); lock && lock->start_ts == start_ts) locks.emplace_back(key, *lock);
    }
  }

  for (const auto &[key, lock] : locks) {
    if (commit_ts == 0) {
      RollbackLock(txn, key, lock);
    } else {
      CommitLock(txn, key, lock, commit_ts);
    }
  }
  spdlog::debug("Resolved {} locks of transaction {} (commit ts {})", locks.size(), start_ts, commit_ts);
  return {};
}

uint64_t Gc(const MvccReader &reader, MvccTxn *txn, const TimeStamp safe_point, std::string_view start,
            std::string_view end) {
  uint64_t removed = 0;
  for (const auto &key : reader.WriteKeys(start, end)) {
    bool found_visible = false;
    for (const auto &record : reader.AllWrites(key)) {
      if (record.commit_ts > safe_point) continue;
      if (!found_visible) {
        switch (record.write.type) {
          case WriteType::PUT:
            // The version every read at the safe point sees.
            found_visible = true;
            continue;
          case WriteType::DELETE:
            // Nothing below a delete is visible, the marker itself isn't
            // needed either.
            found_visible = true;
            break;
          case WriteType::LOCK:
          case WriteType::ROLLBACK:
            break;
        }
      }
      if (record.write.type == WriteType::PUT && !record.write.short_value) {
        txn->DeleteValue(key, record.write.start_ts);
      }
      txn->DeleteWrite(key, record.commit_ts);
      ++removed;
    }
  }
  return removed;
}

utils::BasicResult<common::Error, std::optional<std::string>> Get(const MvccReader &reader, std::string_view key,
                                                                  const TimeStamp ts) {
  if (auto lock = reader.LoadLock(key); lock && lock->type != LockType::LOCK && lock->start_ts <= ts) {
    return common::Error{common::KeyIsLocked{lock->ToLockInfo(std::string(key))}};
  }
  return reader.GetValue(key, ts);
}

utils::BasicResult<common::Error, std::vector<KvPair>> Scan(const MvccReader &reader, std::string_view start,
                                                            std::string_view end, const size_t limit,
                                                            const TimeStamp ts) {
  auto locks = reader.ScanLocks(
      start, end, [ts](const Lock &lock) { return lock.type != LockType::LOCK && lock.start_ts <= ts; }, 1);
  if (!locks.empty()) {
    return common::Error{common::KeyIsLocked{locks.front().second.ToLockInfo(locks.front().first)}};
  }
  return reader.ScanValues(start, end, limit, ts);
}

std::vector<LockInfo> ScanLock(const MvccReader &reader, const TimeStamp max_ts, std::string_view start,
                               std::string_view end, const size_t limit) {
  std::vector<LockInfo> result;
  for (auto &[key, lock] : reader.ScanLocks(
           start, end, [max_ts](const Lock &lock) { return lock.start_ts <= max_ts; }, limit)) {
    result.push_back(lock.ToLockInfo(std::move(key)));
  }
  return result;
}

}  // namespace rangekv::txn
