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

#include <map>
#include <optional>
#include <vector>

#include "common/errors.hpp"
#include "txn/types.hpp"
#include "utils/synchronized.hpp"

namespace rangekv::client {

class ClusterClient;

/**
 * Clears locks left behind by other transactions. The fate of a lock's
 * transaction is decided by its primary key: committed transactions get
 * their lock committed, rolled back or expired ones get it rolled back.
 * Locks of transactions which are still alive are left alone.
 */
class LockResolver {
 public:
  explicit LockResolver(ClusterClient *client) : client_(client) {}

  /// Returns true when none of `locks` blocks anymore.
  bool Resolve(const std::vector<common::LockInfo> &locks);

 private:
  std::optional<txn::TxnStatus> GetTxnStatus(const common::LockInfo &lock);

  ClusterClient *client_;
  /// Outcome of finished transactions by start timestamp.
  utils::Synchronized<std::map<txn::TimeStamp, txn::TxnStatus>> finished_;
};

}  // namespace rangekv::client
