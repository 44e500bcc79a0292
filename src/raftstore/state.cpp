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


#include "raftstore/state.hpp"

namespace rangekv::raftstore {

raft::ConfState ConfStateFromMeta(const common::ShardMeta &meta) {
  raft::ConfState conf_state;
  for (const auto &peer : meta.peers) {
    if (peer.role == common::PeerRole::VOTER) {
      conf_state.voters.push_back(peer.id);
    } else {
      conf_state.learners.push_back(peer.id);
    }
  }
  return conf_state;
}

void WriteRaftState(kvstore::WriteBatch *batch, const common::ShardId shard_id, const RaftLocalState &state) {
  batch->Put(kvstore::ColumnFamily::RAFT, common::keys::RaftStateKey(shard_id), slk::SaveToString(state));
}

void WriteApplyState(kvstore::WriteBatch *batch, const common::ShardId shard_id, const ApplyState &state) {
  batch->Put(kvstore::ColumnFamily::RAFT, common::keys::ApplyStateKey(shard_id), slk::SaveToString(state));
}

void WriteShardState(kvstore::WriteBatch *batch, const common::ShardLocalState &state) {
  batch->Put(kvstore::ColumnFamily::RAFT, common::keys::ShardStateKey(state.meta.id), slk::SaveToString(state));
}

void WriteInitialState(kvstore::WriteBatch *batch, const common::ShardMeta &meta) {
  RaftLocalState raft_state{.hard_state = {.term = kInitLogTerm, .vote = raft::kNone, .commit = kInitLogIndex},
                            .last_index = kInitLogIndex};
  ApplyState apply_state{.applied_index = kInitLogIndex,
                         .applied_term = kInitLogTerm,
                         .truncated_index = kInitLogIndex,
                         .truncated_term = kInitLogTerm,
                         .conf_state = ConfStateFromMeta(meta)};
  WriteRaftState(batch, meta.id, raft_state);
  WriteApplyState(batch, meta.id, apply_state);
  WriteShardState(batch, common::ShardLocalState{.state = common::PeerState::NORMAL, .meta = meta});
}

void ClearRaftState(kvstore::WriteBatch *batch, const common::ShardId shard_id) {
  batch->DeleteRange(kvstore::ColumnFamily::RAFT, common::keys::ShardRaftPrefix(shard_id),
                     common::keys::ShardRaftEnd(shard_id));
}

void Save(const RaftLocalState &obj, slk::Builder *builder) {
  Save(obj.hard_state, builder);
  Save(obj.last_index, builder);
}

void Load(RaftLocalState *obj, slk::Reader *reader) {
  Load(&obj->hard_state, reader);
  Load(&obj->last_index, reader);
}

void Save(const ApplyState &obj, slk::Builder *builder) {
  Save(obj.applied_index, builder);
  Save(obj.applied_term, builder);
  Save(obj.truncated_index, builder);
  Save(obj.truncated_term, builder);
  Save(obj.conf_state, builder);
}

void Load(ApplyState *obj, slk::Reader *reader) {
  Load(&obj->applied_index, reader);
  Load(&obj->applied_term, reader);
  Load(&obj->truncated_index, reader);
  Load(&obj->truncated_term, reader);
  Load(&obj->conf_state, reader);
}

}  // namespace rangekv::raftstore
