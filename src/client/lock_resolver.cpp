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

#include "client/lock_resolver.hpp"

#include <variant>

#include <spdlog/spdlog.h>

#include "client/cluster_client.hpp"

namespace rangekv::client {

std::optional<txn::TxnStatus> LockResolver::GetTxnStatus(const common::LockInfo &lock) {
  auto cached = finished_.WithLock([&](auto &finished) -> std::optional<txn::TxnStatus> {
    if (auto it = finished.find(lock.start_ts); it != finished.end()) return it->second;
    return std::nullopt;
  });
  if (cached) return cached;

  auto now = client_->GetTimestamp();
  if (now.HasError()) return std::nullopt;

  auto result = client_->ExecuteOnKey(
      lock.primary,
      raftstore::CheckTxnStatusRequest{.primary = lock.primary, .lock_ts = lock.start_ts, .current_ts = *now});
  if (result.HasError()) {
    spdlog::debug("Checking transaction {} failed: {}", lock.start_ts, common::ErrorToString(result.GetError()));
    return std::nullopt;
  }
  const auto &status = std::get<raftstore::CheckTxnStatusResponse>(*result).status;
  if (status.kind != txn::TxnStatus::Kind::LOCKED) {
    finished_.WithLock([&](auto &finished) { finished.emplace(lock.start_ts, status); });
  }
  return status;
}

bool LockResolver::Resolve(const std::vector<common::LockInfo> &locks) {
  bool all_resolved = true;
  for (const auto &lock : locks) {
    auto status = GetTxnStatus(lock);
    if (!status || status->kind == txn::TxnStatus::Kind::LOCKED) {
      all_resolved = false;
      continue;
    }
    const txn::TimeStamp commit_ts = status->kind == txn::TxnStatus::Kind::COMMITTED ? status->commit_ts : 0;
    auto result = client_->ExecuteOnKey(
        lock.key, raftstore::ResolveLockRequest{.start_ts = lock.start_ts, .commit_ts = commit_ts, .keys = {lock.key}});
    if (result.HasError()) {
      spdlog::debug("Resolving the lock on {} failed: {}", lock.key, common::ErrorToString(result.GetError()));
      all_resolved = false;
      continue;
    }
    spdlog::debug("Resolved lock of transaction {} on {} ({})", lock.start_ts, lock.key,
                  commit_ts == 0 ? "rolled back" : "committed");
  }
  return all_resolved;
}

}  // namespace rangekv::client
