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


#include "raftstore/split_checker.hpp"

#include <tuple>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/keys.hpp"
#include "utils/codec.hpp"
#include "utils/logging.hpp"

namespace rangekv::raftstore {

namespace {

// Key and value bytes of the shard's range in `cf`.
uint64_t CfBytes(const kvstore::Snapshot &view, const kvstore::ColumnFamily cf, const common::ShardMeta &meta) {
  uint64_t bytes = 0;
  auto it = view.NewIterator(cf, common::keys::ShardDataStart(meta), common::keys::ShardDataEnd(meta));
  for (it.SeekToFirst(); it.Valid(); it.Next()) bytes += it.Key().size() + it.Value().size();
  return bytes;
}

/// First user key with at least half of the column family's bytes before it.
/// The shard's start key can't split it.
std::optional<std::string> MiddleKey(const kvstore::Snapshot &view, const kvstore::ColumnFamily cf,
                                     const common::ShardMeta &meta, const uint64_t total) {
  const auto half = total / 2;
  uint64_t bytes = 0;
  std::optional<std::string> last_candidate;
  std::string last_key;
  auto it = view.NewIterator(cf, common::keys::ShardDataStart(meta), common::keys::ShardDataEnd(meta));
  for (it.SeekToFirst(); it.Valid(); it.Next()) {
    auto user_key = UserKeyOf(it.Key());
    if (user_key != last_key && user_key != meta.start_key) {
      if (bytes >= half) return user_key;
      last_candidate = user_key;
    }
    bytes += it.Key().size() + it.Value().size();
    last_key = std::move(user_key);
  }
  return last_candidate;
}

}  // namespace

std::string UserKeyOf(std::string_view data_key) {
  if (data_key.empty() || data_key.front() != common::keys::kDataPrefix) {
    throw utils::CodecException("Key isn't a data key");
  }
  data_key.remove_prefix(1);
  return utils::DecodeBytes(&data_key);
}

SplitCheckResult CheckSplit(const kvstore::KVStore &engine, const common::ShardMeta &meta, const uint64_t split_size,
                            const bool force) {
  const auto start = common::keys::ShardDataStart(meta);
  const auto end = common::keys::ShardDataEnd(meta);
  SplitCheckResult result{.epoch = meta.epoch,
                          .approximate_size = engine.ApproximateSize(kvstore::ColumnFamily::DEFAULT, start, end) +
                                              engine.ApproximateSize(kvstore::ColumnFamily::WRITE, start, end)};
  if (!force && result.approximate_size <= split_size) return result;

  const auto snapshot = engine.GetSnapshot();
  const auto &view = *snapshot;
  const auto values = CfBytes(view, kvstore::ColumnFamily::DEFAULT, meta);
  const auto writes = CfBytes(view, kvstore::ColumnFamily::WRITE, meta);
  result.approximate_size = values + writes;

  // The bigger column family decides, the other one is the fallback.
  const auto [first, first_bytes, second, second_bytes] =
      values >= writes ? std::tuple{kvstore::ColumnFamily::DEFAULT, values, kvstore::ColumnFamily::WRITE, writes}
                       : std::tuple{kvstore::ColumnFamily::WRITE, writes, kvstore::ColumnFamily::DEFAULT, values};
  if (first_bytes > 0) result.split_key = MiddleKey(view, first, meta, first_bytes);
  if (!result.split_key && second_bytes > 0) result.split_key = MiddleKey(view, second, meta, second_bytes);
  if (result.split_key) {
    spdlog::info("Shard {} holds {} bytes, proposing split at {}", meta.id, result.approximate_size,
                 logging::Escape(*result.split_key));
  }
  return result;
}

}  // namespace rangekv::raftstore
