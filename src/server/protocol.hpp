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
/// Bodies of client REQUEST and RESPONSE packets.
#pragma once

#include <variant>

#include "common/errors.hpp"
#include "common/types.hpp"
#include "raftstore/command.hpp"
#include "slk/serialization.hpp"

namespace rangekv::server {

/// Which replica a request is for and the shard epoch the client knows.
using ShardContext = raftstore::CommandHeader;

struct ShardDetailRequest {
  common::ShardId shard_id{common::kInvalidId};
};

using ClientRequest = std::variant<raftstore::RaftCommand, ShardDetailRequest>;

/// Wire form of a `raftstore::CommandResult`.
using ClientResponse = std::variant<raftstore::Response, common::Error>;

ClientResponse ToClientResponse(raftstore::CommandResult result);
raftstore::CommandResult FromClientResponse(ClientResponse response);

void Save(const ShardDetailRequest &obj, slk::Builder *builder);
void Load(ShardDetailRequest *obj, slk::Reader *reader);

}  // namespace rangekv::server
