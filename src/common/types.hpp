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
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "slk/serialization.hpp"

namespace rangekv::common {

using ShardId = uint64_t;
using PeerId = uint64_t;
using NodeId = uint64_t;

inline constexpr uint64_t kInvalidId = 0;

/// Version stamp of a shard. `conf_version` grows with every membership
/// change, `version` with every boundary change (split or merge).
struct ShardEpoch {
  uint64_t conf_version{1};
  uint64_t version{1};

  friend bool operator==(const ShardEpoch &lhs, const ShardEpoch &rhs) = default;

  friend std::ostream &operator<<(std::ostream &in, const ShardEpoch &epoch) {
    in << "ShardEpoch { conf_version: " << epoch.conf_version << ", version: " << epoch.version << " }";
    return in;
  }
};

/// True when either component of `epoch` is behind `current`.
inline bool IsEpochStale(const ShardEpoch &epoch, const ShardEpoch &current) {
  return epoch.conf_version < current.conf_version || epoch.version < current.version;
}

enum class PeerRole : uint8_t { VOTER, LEARNER };

struct PeerMeta {
  PeerId id{kInvalidId};
  NodeId node_id{kInvalidId};
  PeerRole role{PeerRole::VOTER};

  friend bool operator==(const PeerMeta &lhs, const PeerMeta &rhs) = default;

  friend std::ostream &operator<<(std::ostream &in, const PeerMeta &peer) {
    in << "PeerMeta { id: " << peer.id << ", node_id: " << peer.node_id
       << ", role: " << (peer.role == PeerRole::VOTER ? "VOTER" : "LEARNER") << " }";
    return in;
  }
};

/// True when `key` lies in [start_key, end_key). An empty end key is the end
/// of the keyspace.
inline bool KeyInRange(std::string_view key, std::string_view start_key, std::string_view end_key) {
  return key >= start_key && (end_key.empty() || key < end_key);
}

/// Descriptor of a shard: the half open user key range it owns and the peers
/// replicating it.
struct ShardMeta {
  ShardId id{kInvalidId};
  std::string start_key;
  std::string end_key;
  ShardEpoch epoch;
  std::vector<PeerMeta> peers;

  bool ContainsKey(std::string_view key) const { return KeyInRange(key, start_key, end_key); }

  std::optional<PeerMeta> FindPeer(PeerId peer_id) const;
  std::optional<PeerMeta> FindPeerOnNode(NodeId node_id) const;

  /// A shard without peers has not received its metadata yet.
  bool IsInitialized() const { return !peers.empty(); }

  friend bool operator==(const ShardMeta &lhs, const ShardMeta &rhs) = default;

  friend std::ostream &operator<<(std::ostream &in, const ShardMeta &meta);
};

/// True when the two half open ranges share at least one key.
bool RangesOverlap(std::string_view start_a, std::string_view end_a, std::string_view start_b,
                   std::string_view end_b);

enum class PeerState : uint8_t { NORMAL, APPLYING, TOMBSTONE, MERGING };

std::string_view PeerStateToString(PeerState state);

/// Persisted while the shard is the source of an ongoing merge.
struct MergeState {
  /// Index of the PrepareMerge entry.
  uint64_t commit{0};
  ShardMeta target;

  friend bool operator==(const MergeState &lhs, const MergeState &rhs) = default;
};

/// What a node persists about each of its shards besides the consensus state.
struct ShardLocalState {
  PeerState state{PeerState::NORMAL};
  ShardMeta meta;
  std::optional<MergeState> merge_state;

  friend bool operator==(const ShardLocalState &lhs, const ShardLocalState &rhs) = default;
};

/// Identity of a node's data directory, written once at bootstrap.
struct NodeIdent {
  uint64_t cluster_id{0};
  NodeId node_id{kInvalidId};
};

using slk::Load;
using slk::Save;

void Save(const ShardEpoch &obj, slk::Builder *builder);
void Load(ShardEpoch *obj, slk::Reader *reader);
void Save(const PeerMeta &obj, slk::Builder *builder);
void Load(PeerMeta *obj, slk::Reader *reader);
void Save(const ShardMeta &obj, slk::Builder *builder);
void Load(ShardMeta *obj, slk::Reader *reader);
void Save(const MergeState &obj, slk::Builder *builder);
void Load(MergeState *obj, slk::Reader *reader);
void Save(const ShardLocalState &obj, slk::Builder *builder);
void Load(ShardLocalState *obj, slk::Reader *reader);
void Save(const NodeIdent &obj, slk::Builder *builder);
void Load(NodeIdent *obj, slk::Reader *reader);

}  // namespace rangekv::common
