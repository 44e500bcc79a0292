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

#include "common/keys.hpp"

#include "utils/codec.hpp"

namespace rangekv::common::keys {

namespace {

std::string ShardPrefix(const char category, const ShardId shard_id, const char suffix) {
  std::string key;
  key.reserve(11);
  key.push_back(kLocalPrefix);
  key.push_back(category);
  utils::EncodeU64(shard_id, &key);
  key.push_back(suffix);
  return key;
}

}  // namespace

std::string DataMinKey() { return std::string(1, kDataPrefix); }

std::string DataMaxKey() { return std::string(1, static_cast<char>(kDataPrefix + 1)); }

std::string DataKey(std::string_view user_key) {
  std::string key;
  key.reserve(1 + utils::MaxEncodedBytesSize(user_key.size()));
  key.push_back(kDataPrefix);
  utils::EncodeBytes(user_key, &key);
  return key;
}

std::string DataEndKey(std::string_view user_end_key) {
  if (user_end_key.empty()) return DataMaxKey();
  return DataKey(user_end_key);
}

std::string DataKeyWithTs(std::string_view user_key, const uint64_t ts) {
  auto key = DataKey(user_key);
  utils::EncodeU64Desc(ts, &key);
  return key;
}

std::string OriginKey(std::string_view key) {
  if (key.empty() || key.front() != kDataPrefix) {
    throw utils::CodecException("Key isn't a data key");
  }
  key.remove_prefix(1);
  return utils::DecodeBytes(&key);
}

std::pair<std::string, uint64_t> SplitKeyTs(std::string_view key) {
  if (key.empty() || key.front() != kDataPrefix) {
    throw utils::CodecException("Key isn't a data key");
  }
  key.remove_prefix(1);
  auto user_key = utils::DecodeBytes(&key);
  const auto ts = utils::DecodeU64Desc(&key);
  if (!key.empty()) {
    throw utils::CodecException("Trailing bytes after the timestamp of a data key");
  }
  return {std::move(user_key), ts};
}

std::string NodeIdentKey() { return std::string{kLocalPrefix, kIdentSuffix}; }

std::string RaftLogPrefix(const ShardId shard_id) { return ShardPrefix(kShardRaftPrefix, shard_id, kRaftLogSuffix); }

std::string RaftLogKey(const ShardId shard_id, const uint64_t index) {
  auto key = RaftLogPrefix(shard_id);
  utils::EncodeU64(index, &key);
  return key;
}

uint64_t RaftLogIndex(std::string_view key) {
  constexpr size_t kPrefixSize = 11;
  if (key.size() != kPrefixSize + sizeof(uint64_t)) {
    throw utils::CodecException("Invalid raft log key size {}", key.size());
  }
  key.remove_prefix(kPrefixSize);
  return utils::DecodeU64(&key);
}

std::string RaftStateKey(const ShardId shard_id) { return ShardPrefix(kShardRaftPrefix, shard_id, kRaftStateSuffix); }

std::string ApplyStateKey(const ShardId shard_id) {
  return ShardPrefix(kShardRaftPrefix, shard_id, kApplyStateSuffix);
}

std::string ShardRaftPrefix(const ShardId shard_id) {
  std::string key{kLocalPrefix, kShardRaftPrefix};
  utils::EncodeU64(shard_id, &key);
  return key;
}

std::string ShardRaftEnd(const ShardId shard_id) { return utils::PrefixNext(ShardRaftPrefix(shard_id)); }

std::string ShardStateKey(const ShardId shard_id) {
  return ShardPrefix(kShardMetaPrefix, shard_id, kShardStateSuffix);
}

std::string ShardMetaMinKey() { return std::string{kLocalPrefix, kShardMetaPrefix}; }

std::string ShardMetaMaxKey() { return std::string{kLocalPrefix, static_cast<char>(kShardMetaPrefix + 1)}; }

ShardId ShardIdFromStateKey(std::string_view key) {
  if (key.size() != 11 || key[0] != kLocalPrefix || key[1] != kShardMetaPrefix) {
    throw utils::CodecException("Invalid shard state key");
  }
  key.remove_prefix(2);
  return utils::DecodeU64(&key);
}

}  // namespace rangekv::common::keys
