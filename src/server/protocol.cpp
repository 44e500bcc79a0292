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

#include "server/protocol.hpp"

#include <utility>

namespace rangekv::server {

ClientResponse ToClientResponse(raftstore::CommandResult result) {
  if (result.HasError()) return std::move(result).GetError();
  return std::move(result).GetValue();
}

raftstore::CommandResult FromClientResponse(ClientResponse response) {
  return std::visit([](auto &&value) -> raftstore::CommandResult { return std::move(value); }, std::move(response));
}

void Save(const ShardDetailRequest &obj, slk::Builder *builder) { slk::Save(obj.shard_id, builder); }

void Load(ShardDetailRequest *obj, slk::Reader *reader) { slk::Load(&obj->shard_id, reader); }

}  // namespace rangekv::server
