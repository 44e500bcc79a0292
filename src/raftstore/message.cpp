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


#include "raftstore/message.hpp"

#include "utils/variant_helpers.hpp"

namespace rangekv::raftstore {

namespace {

void FailOptional(std::optional<io::Promise<CommandResult>> *promise, const common::Error &error) {
  if (promise->has_value() && !(*promise)->IsFilled()) (*promise)->Fill(error);
}

}  // namespace

void FailPeerMsg(PeerMsg *msg, const common::Error &error) {
  std::visit(utils::Overloaded{
                 [&](RaftCommandMsg &m) { m.promise.Fill(error); },
                 [&](ChangePeerMsg &m) { m.promise.Fill(error); },
                 [&](ShardDetailMsg &m) { m.promise.Fill(error); },
                 [&](SplitShardMsg &m) { FailOptional(&m.promise, error); },
                 [&](MergeShardMsg &m) { FailOptional(&m.promise, error); },
                 [](auto &) {},
             },
             *msg);
}

void FailApplyMsg(ApplyMsg *msg, const common::Error &error) {
  if (auto *task = std::get_if<ApplyEntriesTask>(msg)) {
    for (auto &proposal : task->proposals) {
      if (!proposal.promise.IsFilled()) proposal.promise.Fill(error);
    }
  }
}

std::string_view PeerMsgName(const PeerMsg &msg) {
  return std::visit(utils::Overloaded{
                        [](const RaftMessage &) { return "RaftMessage"; },
                        [](const RaftCommandMsg &) { return "RaftCommand"; },
                        [](const ChangePeerMsg &) { return "ChangePeer"; },
                        [](const TransferLeaderMsg &) { return "TransferLeader"; },
                        [](const TickMsg &) { return "Tick"; },
                        [](const CampaignMsg &) { return "Campaign"; },
                        [](const ShardDetailMsg &) { return "ShardDetail"; },
                        [](const ApplyResult &) { return "ApplyResult"; },
                        [](const SnapshotApplied &) { return "SnapshotApplied"; },
                        [](const SplitCheckResult &) { return "SplitCheckResult"; },
                        [](const SplitShardMsg &) { return "SplitShard"; },
                        [](const SplitIdsAllocated &) { return "SplitIdsAllocated"; },
                        [](const MergeShardMsg &) { return "MergeShard"; },
                        [](const PlacementOperatorMsg &) { return "PlacementOperator"; },
                        [](const DestroyMsg &) { return "Destroy"; },
                    },
                    msg);
}

void Save(const RaftMessage &obj, slk::Builder *builder) {
  Save(obj.shard_id, builder);
  Save(obj.from_peer, builder);
  Save(obj.to_peer, builder);
  Save(obj.epoch, builder);
  Save(obj.start_key, builder);
  Save(obj.end_key, builder);
  Save(obj.is_tombstone, builder);
  Save(obj.snapshot_rejected, builder);
  Save(obj.commit_merge, builder);
  Save(obj.message, builder);
}

void Load(RaftMessage *obj, slk::Reader *reader) {
  Load(&obj->shard_id, reader);
  Load(&obj->from_peer, reader);
  Load(&obj->to_peer, reader);
  Load(&obj->epoch, reader);
  Load(&obj->start_key, reader);
  Load(&obj->end_key, reader);
  Load(&obj->is_tombstone, reader);
  Load(&obj->snapshot_rejected, reader);
  Load(&obj->commit_merge, reader);
  Load(&obj->message, reader);
}

void Save(const SnapshotChunk &obj, slk::Builder *builder) {
  Save(obj.shard_id, builder);
  Save(obj.to_peer_id, builder);
  Save(obj.snapshot_index, builder);
  Save(obj.snapshot_term, builder);
  Save(obj.seq, builder);
  Save(obj.total, builder);
  Save(obj.data, builder);
  Save(obj.header, builder);
}

void Load(SnapshotChunk *obj, slk::Reader *reader) {
  Load(&obj->shard_id, reader);
  Load(&obj->to_peer_id, reader);
  Load(&obj->snapshot_index, reader);
  Load(&obj->snapshot_term, reader);
  Load(&obj->seq, reader);
  Load(&obj->total, reader);
  Load(&obj->data, reader);
  Load(&obj->header, reader);
}

}  // namespace rangekv::raftstore
