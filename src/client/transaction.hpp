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
#include <map>
#include <optional>
#include <string>

#include "server/kv_service.hpp"
#include "txn/types.hpp"

namespace rangekv::client {

class ClusterClient;

/**
 * Optimistic transaction with snapshot isolation. Writes are buffered
 * locally and made visible at once by a two phase commit: all keys are
 * locked by prewrite, then the primary key is committed, which commits the
 * transaction, and finally the secondary keys.
 */
class Transaction {
 public:
  enum class State : uint8_t { ACTIVE, COMMITTED, ROLLED_BACK };

  Transaction(ClusterClient *client, txn::TimeStamp start_ts);

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;
  Transaction(Transaction &&) = delete;
  Transaction &operator=(Transaction &&) = delete;

  ~Transaction();

  /// Sees the transaction's own writes, otherwise the snapshot at the start
  /// timestamp.
  server::KvResult<std::optional<std::string>> Get(const std::string &key);

  void Put(std::string key, std::string value);
  void Delete(std::string key);
  /// Locks the key without writing it, so concurrent writers conflict.
  void Lock(std::string key);

  /// Returns the commit timestamp. The transaction is rolled back when
  /// prewrite fails.
  server::KvResult<txn::TimeStamp> Commit();

  server::KvResult<> Rollback();

  txn::TimeStamp start_ts() const { return start_ts_; }
  State state() const { return state_; }

 private:
  server::KvResult<> Prewrite(const std::string &primary);
  server::KvResult<> RollbackKeys();
  void Finish(State state);

  ClusterClient *client_;
  txn::TimeStamp start_ts_;
  State state_{State::ACTIVE};
  bool prewritten_{false};
  std::map<std::string, txn::Mutation> mutations_;
};

}  // namespace rangekv::client
