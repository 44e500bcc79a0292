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

#include "common/types.hpp"

#include <algorithm>

#include "utils/logging.hpp"

namespace rangekv::common {

std::optional<PeerMeta> ShardMeta::FindPeer(PeerId peer_id) const {
  auto it = std::find_if(peers.begin(), peers.end(), [peer_id](const auto &peer) { return peer.id == peer_id; });
  if (it == peers.end()) return std::nullopt;
  return *it;
}

std::optional<PeerMeta> ShardMeta::FindPeerOnNode(NodeId node_id) const {
  auto it =
      std::find_if(peers.begin(), peers.end(), [node_id](const auto &peer) { return peer.node_id == node_id; });
  if (it == peers.end()) return std::nullopt;
  return *it;
}

std::ostream &operator<<(std::ostream &in, const ShardMeta &meta) {
  in << "ShardMeta { id: " << meta.id << ", start_key: \"" << logging::Escape(meta.start_key) << "\", end_key: \""
     << logging::Escape(meta.end_key) << "\", epoch: " << meta.epoch << ", peers: [";
  for (size_t i = 0; i < meta.peers.size(); ++i) {
    if (i != 0) in << ", ";
    in << meta.peers[i];
  }
  in << "] }";
  return in;
}

bool RangesOverlap(std::string_view start_a, std::string_view end_a, std::string_view start_b,
                   std::string_view end_b) {
  const bool a_before_b = !end_a.empty() && end_a <= start_b;
  const bool b_before_a = !end_b.empty() && end_b <= start_a;
  return !a_before_b && !b_before_a;
}

std::string_view PeerStateToString(const PeerState state) {
  switch (state) {
    case PeerState::NORMAL:
      return "NORMAL";
    case PeerState::APPLYING:
      return "APPLYING";
    case PeerState::TOMBSTONE:
      return "TOMBSTONE";
    case PeerState::MERGING:
      return "MERGING";
  }
  return "UNKNOWN";
}

void Save(const ShardEpoch &obj, slk::Builder *builder) {
  Save(obj.conf_version, builder);
  Save(obj.version, builder);
}

void Load(ShardEpoch *obj, slk::Reader *reader) {
  Load(&obj->conf_version, reader);
  Load(&obj->version, reader);
}

void Save(const PeerMeta &obj, slk::Builder *builder) {
  Save(obj.id, builder);
  Save(obj.node_id, builder);
  Save(obj.role, builder);
}

void Load(PeerMeta *obj, slk::Reader *reader) {
  Load(&obj->id, reader);
  Load(&obj->node_id, reader);
  Load(&obj->role, reader);
}

void Save(const ShardMeta &obj, slk::Builder *builder) {
  Save(obj.id, builder);
  Save(obj.start_key, builder);
  Save(obj.end_key, builder);
  Save(obj.epoch, builder);
  Save(obj.peers, builder);
}

void Load(ShardMeta *obj, slk::Reader *reader) {
  Load(&obj->id, reader);
  Load(&obj->start_key, reader);
  Load(&obj->end_key, reader);
  Load(&obj->epoch, reader);
  Load(&obj->peers, reader);
}

void Save(const MergeState &obj, slk::Builder *builder) {
  Save(obj.commit, builder);
  Save(obj.target, builder);
}

void Load(MergeState *obj, slk::Reader *reader) {
  Load(&obj->commit, reader);
  Load(&obj->target, reader);
}

void Save(const ShardLocalState &obj, slk::Builder *builder) {
  Save(obj.state, builder);
  Save(obj.meta, builder);
  Save(obj.merge_state, builder);
}

void Load(ShardLocalState *obj, slk::Reader *reader) {
  Load(&obj->state, reader);
  Load(&obj->meta, reader);
  Load(&obj->merge_state, reader);
}

void Save(const NodeIdent &obj, slk::Builder *builder) {
  Save(obj.cluster_id, builder);
  Save(obj.node_id, builder);
}

void Load(NodeIdent *obj, slk::Reader *reader) {
  Load(&obj->cluster_id, reader);
  Load(&obj->node_id, reader);
}

}  // namespace rangekv::common
