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

#include "client/transaction.hpp"

#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "client/cluster_client.hpp"
#include "utils/exponential_backoff.hpp"

namespace rangekv::client {

Transaction::Transaction(ClusterClient *client, const txn::TimeStamp start_ts)
    : client_(client), start_ts_(start_ts) {}

Transaction::~Transaction() {
  if (state_ == State::ACTIVE) {
    if (prewritten_) {
      auto result = RollbackKeys();
      if (result.HasError()) {
        spdlog::warn("Rolling back transaction {} failed: {}, its locks expire after their TTL", start_ts_,
                     common::ErrorToString(result.GetError()));
      }
    }
    Finish(State::ROLLED_BACK);
  }
}

void Transaction::Finish(const State state) {
  state_ = state;
  client_->safe_points().Unregister(start_ts_);
}

server::KvResult<std::optional<std::string>> Transaction::Get(const std::string &key) {
  if (auto it = mutations_.find(key); it != mutations_.end()) {
    switch (it->second.op) {
      case txn::MutationOp::PUT:
        return std::optional<std::string>{it->second.value};
      case txn::MutationOp::DELETE:
        return std::optional<std::string>{};
      case txn::MutationOp::LOCK:
        break;
    }
  }
  return client_->Get(key, start_ts_);
}

void Transaction::Put(std::string key, std::string value) {
  auto &mutation = mutations_[key];
  mutation = txn::Mutation{.op = txn::MutationOp::PUT, .key = std::move(key), .value = std::move(value)};
}

void Transaction::Delete(std::string key) {
  auto &mutation = mutations_[key];
  mutation = txn::Mutation{.op = txn::MutationOp::DELETE, .key = std::move(key), .value = {}};
}

void Transaction::Lock(std::string key) {
  if (mutations_.contains(key)) return;
  mutations_.emplace(key, txn::Mutation{.op = txn::MutationOp::LOCK, .key = key, .value = {}});
}

server::KvResult<> Transaction::Prewrite(const std::string &primary) {
  const auto &config = client_->config();
  utils::ExponentialBackoff backoff(config.initial_backoff, config.max_backoff, config.max_retries);

  std::vector<std::string> keys;
  keys.reserve(mutations_.size());
  for (const auto &[key, mutation] : mutations_) keys.push_back(key);

  auto make_request = [&](const std::vector<std::string> &group) -> raftstore::Request {
    raftstore::PrewriteRequest request{.mutations = {}, .primary = primary, .start_ts = start_ts_,
                                       .lock_ttl = config.lock_ttl};
    request.mutations.reserve(group.size());
    for (const auto &key : group) request.mutations.push_back(mutations_.at(key));
    return request;
  };

  while (true) {
    std::vector<common::Error> key_errors;
    prewritten_ = true;
    auto result = client_->ExecuteOnKeys(keys, make_request, [&](raftstore::Response &response) {
      auto &errors = std::get<raftstore::PrewriteResponse>(response).errors;
      for (auto &error : errors) key_errors.push_back(std::move(error));
    });
    if (result.HasError()) return result;
    if (key_errors.empty()) return {};

    std::vector<common::LockInfo> locks;
    for (auto &error : key_errors) {
      auto *locked = std::get_if<common::KeyIsLocked>(&error);
      if (!locked) return std::move(error);
      locks.push_back(std::move(locked->lock));
    }
    // Locks of other transactions may belong to finished or abandoned ones.
    if (!client_->lock_resolver().Resolve(locks) && !backoff.Wait()) {
      return common::Error{common::KeyIsLocked{locks.front()}};
    }
  }
}

server::KvResult<txn::TimeStamp> Transaction::Commit() {
  if (state_ != State::ACTIVE) {
    return common::Error{common::InvalidRequest{"The transaction is already finished"}};
  }
  if (mutations_.empty()) {
    Finish(State::COMMITTED);
    return start_ts_;
  }

  const auto primary = mutations_.begin()->first;
  if (auto prewrite = Prewrite(primary); prewrite.HasError()) {
    spdlog::debug("Prewrite of transaction {} failed: {}", start_ts_, common::ErrorToString(prewrite.GetError()));
    if (auto rollback = RollbackKeys(); rollback.HasError()) {
      spdlog::warn("Rolling back transaction {} failed: {}", start_ts_, common::ErrorToString(rollback.GetError()));
    }
    Finish(State::ROLLED_BACK);
    return std::move(prewrite).GetError();
  }

  auto commit_ts = client_->GetTimestamp();
  if (commit_ts.HasError()) {
    if (auto rollback = RollbackKeys(); rollback.HasError()) {
      spdlog::warn("Rolling back transaction {} failed: {}", start_ts_, common::ErrorToString(rollback.GetError()));
    }
    Finish(State::ROLLED_BACK);
    return std::move(commit_ts).GetError();
  }

  // The transaction is committed once its primary key is.
  auto primary_result = client_->ExecuteOnKey(
      primary, raftstore::CommitRequest{.keys = {primary}, .start_ts = start_ts_, .commit_ts = *commit_ts});
  if (primary_result.HasError()) {
    auto error = std::move(primary_result).GetError();
    if (std::holds_alternative<common::TxnLockNotFound>(error)) {
      // Someone else rolled the transaction back.
      if (auto rollback = RollbackKeys(); rollback.HasError()) {
        spdlog::warn("Rolling back transaction {} failed: {}", start_ts_, common::ErrorToString(rollback.GetError()));
      }
      Finish(State::ROLLED_BACK);
    } else {
      // The outcome is unknown, the locks are left for resolution.
      Finish(State::ROLLED_BACK);
    }
    return error;
  }
  Finish(State::COMMITTED);

  std::vector<std::string> secondaries;
  for (const auto &[key, mutation] : mutations_) {
    if (key != primary) secondaries.push_back(key);
  }
  const auto ts = *commit_ts;
  auto result = client_->ExecuteOnKeys(
      std::move(secondaries),
      [&](const std::vector<std::string> &group) -> raftstore::Request {
        return raftstore::CommitRequest{.keys = group, .start_ts = start_ts_, .commit_ts = ts};
      },
      [](raftstore::Response & /*response*/) {});
  if (result.HasError()) {
    // Readers resolve the remaining locks through the primary.
    spdlog::warn("Committing secondary keys of transaction {} failed: {}", start_ts_,
                 common::ErrorToString(result.GetError()));
  }
  return ts;
}

server::KvResult<> Transaction::RollbackKeys() {
  if (!prewritten_) return {};
  std::vector<std::string> keys;
  for (const auto &[key, mutation] : mutations_) keys.push_back(key);
  return client_->ExecuteOnKeys(
      std::move(keys),
      [&](const std::vector<std::string> &group) -> raftstore::Request {
        return raftstore::RollbackRequest{.keys = group, .start_ts = start_ts_};
      },
      [](raftstore::Response & /*response*/) {});
}

server::KvResult<> Transaction::Rollback() {
  if (state_ != State::ACTIVE) {
    return common::Error{common::InvalidRequest{"The transaction is already finished"}};
  }
  auto result = RollbackKeys();
  Finish(State::ROLLED_BACK);
  return result;
}

}  // namespace rangekv::client
