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

#include "client/cluster_client.hpp"

#include <algorithm>
#include <deque>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "client/transaction.hpp"
#include "utils/exponential_backoff.hpp"
#include "utils/variant_helpers.hpp"

namespace rangekv::client {

namespace {

using raftstore::CommandResult;

constexpr uint32_t kMaxImmediateRetries = 8;

common::Error PlacementToError(const placement::PlacementError error, const common::ShardId shard_id) {
  if (error == placement::PlacementError::SHARD_NOT_FOUND) return common::ShardNotFound{shard_id};
  return common::TimedOut{};
}

std::vector<common::PeerMeta> Voters(const common::ShardMeta &meta) {
  std::vector<common::PeerMeta> voters;
  for (const auto &peer : meta.peers) {
    if (peer.role == common::PeerRole::VOTER) voters.push_back(peer);
  }
  return voters;
}

}  // namespace

ClusterClient::ClusterClient(placement::PlacementClient *placement, KvConnector *connector, ClientConfig config)
    : placement_(placement), connector_(connector), config_(config), lock_resolver_(this) {}

std::optional<placement::ShardRoute> ClusterClient::CachedRoute(std::string_view key) const {
  return routes_.WithReadLock([&](const auto &routes) -> std::optional<placement::ShardRoute> {
    auto it = routes.upper_bound(std::string{key});
    if (it == routes.begin()) return std::nullopt;
    --it;
    if (!it->second.meta.ContainsKey(key)) return std::nullopt;
    return it->second;
  });
}

void ClusterClient::UpdateRoute(placement::ShardRoute route) {
  routes_.WithLock([&](auto &routes) {
    for (auto it = routes.begin(); it != routes.end();) {
      const auto &meta = it->second.meta;
      const bool overlaps =
          common::RangesOverlap(meta.start_key, meta.end_key, route.meta.start_key, route.meta.end_key);
      if (overlaps || meta.id == route.meta.id) {
        it = routes.erase(it);
      } else {
        ++it;
      }
    }
    auto start_key = route.meta.start_key;
    routes.emplace(std::move(start_key), std::move(route));
  });
}

void ClusterClient::InvalidateShard(const common::ShardId shard_id) {
  routes_.WithLock([&](auto &routes) {
    std::erase_if(routes, [&](const auto &entry) { return entry.second.meta.id == shard_id; });
  });
}

KvResult<placement::ShardRoute> ClusterClient::Locate(std::string_view key) {
  if (auto cached = CachedRoute(key)) return std::move(*cached);
  auto route = placement_->GetShardByKey(key);
  if (route.HasError()) return PlacementToError(route.GetError(), common::kInvalidId);
  UpdateRoute(*route);
  return std::move(*route);
}

KvResult<std::vector<std::pair<placement::ShardRoute, std::vector<std::string>>>> ClusterClient::GroupKeys(
    const std::vector<std::string> &keys) {
  std::vector<std::pair<placement::ShardRoute, std::vector<std::string>>> groups;
  for (const auto &key : keys) {
    auto route = Locate(key);
    if (route.HasError()) return std::move(route).GetError();
    auto it = std::find_if(groups.begin(), groups.end(),
                           [&](const auto &group) { return group.first.meta.id == route->meta.id; });
    if (it == groups.end()) {
      groups.emplace_back(std::move(*route), std::vector<std::string>{key});
    } else {
      it->second.push_back(key);
    }
  }
  return groups;
}

CommandResult ClusterClient::SendToShard(const placement::ShardRoute &route, const raftstore::Request &request,
                                         const size_t peer_offset) {
  const auto voters = Voters(route.meta);
  if (voters.empty()) return raftstore::ErrorResult(common::ShardNotFound{route.meta.id});

  size_t first = 0;
  if (route.leader) {
    auto it = std::find_if(voters.begin(), voters.end(),
                           [&](const auto &peer) { return peer.id == route.leader->id; });
    if (it != voters.end()) first = static_cast<size_t>(std::distance(voters.begin(), it));
  }
  const auto &peer = voters[(first + peer_offset) % voters.size()];

  raftstore::RaftCommand command{
      .header = raftstore::CommandHeader{.shard_id = route.meta.id, .peer_id = peer.id, .epoch = route.meta.epoch},
      .request = request};
  auto result = connector_->Call(peer.node_id, std::move(command));
  // Only the leader serves requests.
  if (!result.HasError() && (!route.leader || route.leader->id != peer.id)) {
    auto updated = route;
    updated.leader = peer;
    UpdateRoute(std::move(updated));
  }
  return result;
}

ClusterClient::RetryAction ClusterClient::OnError(const common::Error &error, const placement::ShardRoute &route) {
  return std::visit(
      utils::Overloaded{
          [&](const common::NotLeader &not_leader) {
            if (not_leader.leader && route.meta.FindPeer(not_leader.leader->id)) {
              auto updated = route;
              updated.leader = not_leader.leader;
              UpdateRoute(std::move(updated));
              return RetryAction::RETRY_NOW;
            }
            return RetryAction::NEXT_PEER;
          },
          [&](const common::StaleEpoch &stale) {
            if (stale.current.empty()) {
              InvalidateShard(route.meta.id);
            } else {
              for (const auto &meta : stale.current) UpdateRoute(placement::ShardRoute{.meta = meta, .leader = {}});
            }
            return RetryAction::REGROUP;
          },
          [&](const common::ShardNotFound & /*not_found*/) {
            InvalidateShard(route.meta.id);
            return RetryAction::REGROUP;
          },
          [&](const common::KeyNotInShard & /*not_in_shard*/) {
            InvalidateShard(route.meta.id);
            return RetryAction::REGROUP;
          },
          [](const common::ServerIsBusy & /*busy*/) { return RetryAction::BACKOFF; },
          [](const common::ProposalDropped & /*dropped*/) { return RetryAction::BACKOFF; },
          [](const common::ShardMerging & /*merging*/) { return RetryAction::BACKOFF; },
          [](const common::TimedOut & /*timed_out*/) { return RetryAction::NEXT_PEER; },
          [](const auto & /*other*/) { return RetryAction::GIVE_UP; },
      },
      error);
}

CommandResult ClusterClient::ExecuteOnKey(std::string_view key, const raftstore::Request &request,
                                          placement::ShardRoute *served) {
  utils::ExponentialBackoff backoff(config_.initial_backoff, config_.max_backoff, config_.max_retries);
  uint32_t immediate_retries = 0;
  size_t peer_offset = 0;

  while (true) {
    auto route = Locate(key);
    if (route.HasError()) {
      if (!backoff.Wait()) return std::move(route).GetError();
      continue;
    }

    auto result = SendToShard(*route, request, peer_offset);
    if (!result.HasError()) {
      if (served) *served = std::move(*route);
      return result;
    }

    switch (OnError(result.GetError(), *route)) {
      case RetryAction::GIVE_UP:
        return result;
      case RetryAction::RETRY_NOW:
        peer_offset = 0;
        if (immediate_retries++ < kMaxImmediateRetries) continue;
        break;
      case RetryAction::NEXT_PEER:
        ++peer_offset;
        break;
      case RetryAction::REGROUP:
      case RetryAction::BACKOFF:
        peer_offset = 0;
        break;
    }
    spdlog::debug("Retrying {} on key {} after {}", raftstore::RequestName(request), key,
                  common::ErrorToString(result.GetError()));
    if (!backoff.Wait()) return result;
  }
}

KvResult<> ClusterClient::ExecuteOnKeys(std::vector<std::string> keys, const KeysRequestBuilder &make_request,
                                        const ResponseHandler &on_response) {
  utils::ExponentialBackoff backoff(config_.initial_backoff, config_.max_backoff, config_.max_retries);
  std::deque<std::vector<std::string>> work;
  if (!keys.empty()) work.push_back(std::move(keys));

  while (!work.empty()) {
    auto batch = std::move(work.front());
    work.pop_front();

    auto groups = GroupKeys(batch);
    if (groups.HasError()) {
      if (!backoff.Wait()) return std::move(groups).GetError();
      work.push_back(std::move(batch));
      continue;
    }

    for (auto &[route, group_keys] : *groups) {
      const auto request = make_request(group_keys);
      size_t peer_offset = 0;
      uint32_t immediate_retries = 0;
      while (true) {
        // The cached route may have been refreshed by a previous attempt.
        auto current = CachedRoute(group_keys.front());
        const auto &target = current && current->meta.id == route.meta.id ? *current : route;
        auto result = SendToShard(target, request, peer_offset);
        if (!result.HasError()) {
          on_response(*result);
          break;
        }
        const auto action = OnError(result.GetError(), target);
        if (action == RetryAction::GIVE_UP) return std::move(result).GetError();
        if (action == RetryAction::REGROUP) {
          if (!backoff.Wait()) return std::move(result).GetError();
          work.push_back(std::move(group_keys));
          break;
        }
        if (action == RetryAction::RETRY_NOW && immediate_retries++ < kMaxImmediateRetries) {
          peer_offset = 0;
          continue;
        }
        if (action == RetryAction::NEXT_PEER) ++peer_offset;
        if (!backoff.Wait()) return std::move(result).GetError();
      }
    }
  }
  return {};
}

KvResult<> ClusterClient::RawPut(std::string key, std::string value) {
  auto result = ExecuteOnKey(key, raftstore::RawPutRequest{.key = key, .value = std::move(value)});
  if (result.HasError()) return std::move(result).GetError();
  return {};
}

KvResult<std::optional<std::string>> ClusterClient::RawGet(std::string key) {
  auto result = ExecuteOnKey(key, raftstore::RawGetRequest{.key = key});
  if (result.HasError()) return std::move(result).GetError();
  return std::move(std::get<raftstore::GetResponse>(*result).value);
}

KvResult<> ClusterClient::RawDelete(std::string key) {
  auto result = ExecuteOnKey(key, raftstore::RawDeleteRequest{.key = key});
  if (result.HasError()) return std::move(result).GetError();
  return {};
}

KvResult<std::optional<std::string>> ClusterClient::Get(const std::string &key, const txn::TimeStamp ts) {
  utils::ExponentialBackoff backoff(config_.initial_backoff, config_.max_backoff, config_.max_retries);
  while (true) {
    auto result = ExecuteOnKey(key, raftstore::GetRequest{.key = key, .ts = ts});
    if (!result.HasError()) return std::move(std::get<raftstore::GetResponse>(*result).value);

    const auto *locked = std::get_if<common::KeyIsLocked>(&result.GetError());
    if (!locked) return std::move(result).GetError();
    // A live lock needs time to be committed or to expire.
    if (!lock_resolver_.Resolve({locked->lock}) && !backoff.Wait()) return std::move(result).GetError();
  }
}

KvResult<std::vector<txn::KvPair>> ClusterClient::Scan(std::string start_key, std::string end_key,
                                                       const uint64_t limit, const txn::TimeStamp ts) {
  std::vector<txn::KvPair> pairs;
  utils::ExponentialBackoff backoff(config_.initial_backoff, config_.max_backoff, config_.max_retries);
  auto current = std::move(start_key);

  while (limit == 0 || pairs.size() < limit) {
    const uint64_t remaining = limit == 0 ? config_.scan_batch_size : limit - pairs.size();
    const auto batch = std::min(remaining, config_.scan_batch_size);
    placement::ShardRoute served;
    auto result = ExecuteOnKey(
        current, raftstore::ScanRequest{.start_key = current, .end_key = end_key, .limit = batch, .ts = ts}, &served);
    if (result.HasError()) {
      const auto *locked = std::get_if<common::KeyIsLocked>(&result.GetError());
      if (!locked) return std::move(result).GetError();
      if (!lock_resolver_.Resolve({locked->lock}) && !backoff.Wait()) return std::move(result).GetError();
      continue;
    }

    auto &found = std::get<raftstore::ScanResponse>(*result).pairs;
    const bool shard_exhausted = found.size() < batch;
    if (!found.empty()) {
      // Continue right after the last key returned.
      current = found.back().key;
      current.push_back('\0');
    }
    for (auto &pair : found) pairs.push_back(std::move(pair));

    if (!shard_exhausted) continue;
    const auto &shard_end = served.meta.end_key;
    if (shard_end.empty() || (!end_key.empty() && shard_end >= end_key)) break;
    current = shard_end;
  }
  return pairs;
}

KvResult<txn::TimeStamp> ClusterClient::GetTimestamp() {
  auto ts = placement_->GetTimestamp();
  if (ts.HasError()) return common::Error{common::TimedOut{}};
  return *ts;
}

std::unique_ptr<Transaction> ClusterClient::Begin() {
  const auto start_ts = safe_points_.RegisterNew([this]() -> std::optional<txn::TimeStamp> {
    auto ts = GetTimestamp();
    if (ts.HasError()) return std::nullopt;
    return *ts;
  });
  if (!start_ts) return nullptr;
  return std::make_unique<Transaction>(this, *start_ts);
}

KvResult<txn::TimeStamp> ClusterClient::UpdateSafePoint() {
  auto now = GetTimestamp();
  if (now.HasError()) return std::move(now).GetError();
  // Advance caps `now` at the oldest running transaction.
  const auto safe_point = safe_points_.Advance(*now);
  auto published = placement_->UpdateGcSafePoint(safe_point);
  if (published.HasError()) return common::Error{common::TimedOut{}};
  spdlog::debug("GC safe point is now {}", *published);
  return *published;
}

}  // namespace rangekv::client
