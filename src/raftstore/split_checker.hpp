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
#include <optional>
#include <string>

#include "common/types.hpp"
#include "kvstore/kvstore.hpp"
#include "raftstore/message.hpp"

namespace rangekv::raftstore {

/// Proposes a split key for `meta` when the engine estimates the shard at
/// more than `split_size` bytes, or unconditionally when `force` is set and
/// the shard has any key past its start key. Only then is the data scanned,
/// in a point in time view, and the reported size is the scanned one.
///
/// The split key is a user key close to the middle of the data, never the
/// shard start key.
/// @throw kvstore::KVStoreIOError
SplitCheckResult CheckSplit(const kvstore::KVStore &engine, const common::ShardMeta &meta, uint64_t split_size,
                            bool force = false);

/// User key of an encoded data key, with or without a timestamp suffix.
/// @throw utils::CodecException
std::string UserKeyOf(std::string_view data_key);

}  // namespace rangekv::raftstore
