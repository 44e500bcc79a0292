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
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "client/connector.hpp"
#include "client/lock_resolver.hpp"
#include "common/errors.hpp"
#include "placement/client.hpp"
#include "raftstore/command.hpp"
#include "server/kv_service.hpp"
#include "txn/safe_point.hpp"
#include "txn/types.hpp"
#include "utils/synchronized.hpp"

namespace rangekv::client {

class Transaction;

using server::KvResult;

struct ClientConfig {
  /// Backoff waits a single call may spend on retryable errors.
  uint32_t max_retries{20};
  std::chrono::milliseconds initial_backoff{10};
  std::chrono::milliseconds max_backoff{1000};
  /// TTL of the locks written by transactions, in milliseconds.
  uint64_t lock_ttl{3000};
  /// Rows a scan asks a single shard for at once.
  uint64_t scan_batch_size{256};
};

/**
 * Routes requests to shard leaders. Shard locations are cached and refreshed
 * from placement when a node reports a stale view; busy or unreachable
 * replicas are retried with exponential backoff.
 */
class ClusterClient {
 public:
  using KeysRequestBuilder = std::function<raftstore::Request(const std::vector<std::string> &keys)>;
  using ResponseHandler = std::function<void(raftstore::Response &response)>;

  ClusterClient(placement::PlacementClient *placement, KvConnector *connector, ClientConfig config = {});

  ClusterClient(const ClusterClient &) = delete;
  ClusterClient &operator=(const ClusterClient &) = delete;
  ClusterClient(ClusterClient &&) = delete;
  ClusterClient &operator=(ClusterClient &&) = delete;

  ~ClusterClient() = default;

  /// Sends `request` to the shard owning `key`. `served` receives the route
  /// of the shard that answered.
  raftstore::CommandResult ExecuteOnKey(std::string_view key, const raftstore::Request &request,
                                        placement::ShardRoute *served = nullptr);

  /// Sends one request per shard owning some of `keys`. Keys are regrouped
  /// when the shard boundaries turn out to have changed. Returns the first
  /// error which isn't about routing.
  KvResult<> ExecuteOnKeys(std::vector<std::string> keys, const KeysRequestBuilder &make_request,
                           const ResponseHandler &on_response);

  KvResult<> RawPut(std::string key, std::string value);
  KvResult<std::optional<std::string>> RawGet(std::string key);
  KvResult<> RawDelete(std::string key);

  /// Snapshot read at `ts`. Locks of finished or expired transactions are
  /// resolved on the way.
  KvResult<std::optional<std::string>> Get(const std::string &key, txn::TimeStamp ts);
  KvResult<std::vector<txn::KvPair>> Scan(std::string start_key, std::string end_key, uint64_t limit,
                                          txn::TimeStamp ts);

  KvResult<txn::TimeStamp> GetTimestamp();

  std::unique_ptr<Transaction> Begin();

  /// Moves the cluster GC safe point up to the oldest transaction this
  /// client still runs, or to now when there is none.
  KvResult<txn::TimeStamp> UpdateSafePoint();

  std::optional<placement::ShardRoute> CachedRoute(std::string_view key) const;
  void InvalidateShard(common::ShardId shard_id);

  const ClientConfig &config() const { return config_; }
  LockResolver &lock_resolver() { return lock_resolver_; }
  txn::SafePointManager &safe_points() { return safe_points_; }

 private:
  enum class RetryAction : uint8_t { RETRY_NOW, NEXT_PEER, BACKOFF, REGROUP, GIVE_UP };

  KvResult<placement::ShardRoute> Locate(std::string_view key);
  KvResult<std::vector<std::pair<placement::ShardRoute, std::vector<std::string>>>> GroupKeys(
      const std::vector<std::string> &keys);
  raftstore::CommandResult SendToShard(const placement::ShardRoute &route, const raftstore::Request &request,
                                       size_t peer_offset);
  RetryAction OnError(const common::Error &error, const placement::ShardRoute &route);
  void UpdateRoute(placement::ShardRoute route);

  placement::PlacementClient *placement_;
  KvConnector *connector_;
  ClientConfig config_;

  /// Keyed by start key.
  utils::Synchronized<std::map<std::string, placement::ShardRoute>, std::shared_mutex> routes_;
  LockResolver lock_resolver_;
  txn::SafePointManager safe_points_;
};

}  // namespace rangekv::client
