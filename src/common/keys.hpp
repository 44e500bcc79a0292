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

/// @file
///
/// Layout of the keys a node persists.
///
/// Data keys (`default`, `lock` and `write` column families):
///   'z' memcomparable(user_key) [ts:desc64]
///
/// Local keys (`raft` column family):
///   0x01 0x01                          node identity
///   0x01 0x02 shard_id 0x01 index      log entry
///   0x01 0x02 shard_id 0x02            raft state
///   0x01 0x02 shard_id 0x03            apply state
///   0x01 0x03 shard_id 0x01            shard local state
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "common/types.hpp"

namespace rangekv::common::keys {

inline constexpr char kDataPrefix = 'z';
inline constexpr char kLocalPrefix = 0x01;
inline constexpr char kIdentSuffix = 0x01;
inline constexpr char kShardRaftPrefix = 0x02;
inline constexpr char kShardMetaPrefix = 0x03;
inline constexpr char kRaftLogSuffix = 0x01;
inline constexpr char kRaftStateSuffix = 0x02;
inline constexpr char kApplyStateSuffix = 0x03;
inline constexpr char kShardStateSuffix = 0x01;

/// Bounds which enclose every data key.
std::string DataMinKey();
std::string DataMaxKey();

/// 'z' + memcomparable(user_key). An empty user key encodes the start of
/// the keyspace.
std::string DataKey(std::string_view user_key);

/// Encoded end bound of a shard range. An empty end key maps to the end of
/// the data keyspace.
std::string DataEndKey(std::string_view user_end_key);

/// Data key with a descending timestamp suffix, newer versions sort first.
std::string DataKeyWithTs(std::string_view user_key, uint64_t ts);

/// Inverse of DataKey.
/// @throw utils::CodecException when `key` isn't a data key.
std::string OriginKey(std::string_view key);

/// Splits a timestamped data key into the user key and the timestamp.
/// @throw utils::CodecException when `key` isn't a timestamped data key.
std::pair<std::string, uint64_t> SplitKeyTs(std::string_view key);

/// Encoded bounds of a shard range in the data keyspace.
inline std::string ShardDataStart(const ShardMeta &meta) { return DataKey(meta.start_key); }
inline std::string ShardDataEnd(const ShardMeta &meta) { return DataEndKey(meta.end_key); }

std::string NodeIdentKey();

std::string RaftLogPrefix(ShardId shard_id);
std::string RaftLogKey(ShardId shard_id, uint64_t index);
/// @throw utils::CodecException on a malformed key.
uint64_t RaftLogIndex(std::string_view key);
std::string RaftStateKey(ShardId shard_id);
std::string ApplyStateKey(ShardId shard_id);

/// First and past-the-end key of every raft key of a shard.
std::string ShardRaftPrefix(ShardId shard_id);
std::string ShardRaftEnd(ShardId shard_id);

std::string ShardStateKey(ShardId shard_id);
std::string ShardMetaMinKey();
std::string ShardMetaMaxKey();
/// @throw utils::CodecException on a malformed key.
ShardId ShardIdFromStateKey(std::string_view key);

}  // namespace rangekv::common::keys
