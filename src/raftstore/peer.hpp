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

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "kvstore/kvstore.hpp"
#include "placement/client.hpp"
#include "raft/raw_node.hpp"
#include "raftstore/command.hpp"
#include "raftstore/config.hpp"
#include "raftstore/message.hpp"
#include "raftstore/peer_storage.hpp"
#include "raftstore/router.hpp"
#include "raftstore/store_meta.hpp"
#include "raftstore/transport.hpp"
#include "utils/synchronized.hpp"
#include "utils/thread_pool.hpp"

namespace rangekv::raftstore {

/// Node wide services shared by the peers of a store. Owned by the store,
/// outlives every peer.
struct StoreContext {
  common::NodeId node_id{common::kInvalidId};
  Config config;
  kvstore::KVStore *engine{nullptr};
  Router *router{nullptr};
  Transport *transport{nullptr};
  placement::PlacementClient *placement{nullptr};
  utils::Synchronized<StoreMeta> *store_meta{nullptr};
  utils::ThreadPool *snap_pool{nullptr};
  utils::ThreadPool *control_pool{nullptr};
  utils::ThreadPool *split_check_pool{nullptr};
  /// Creates and registers the replica of a shard created by a split on this
  /// node. `campaign` makes the new replica start an election right away.
  std::function<void(const ShardMeta &meta, bool campaign)> create_split_peer;
  /// Stops a replica asynchronously and cleans up its state.
  std::function<void(ShardId shard_id, bool remove_data)> destroy_peer;
};

/**
 * The replica of one shard on a node. Drives the consensus state machine:
 * persists its output, sends its messages, hands committed entries to the
 * apply state machine and follows up on the results. Validates and
 * proposes client commands on the leader.
 *
 * Runs on the raft pool, at most one batch of messages at a time.
 */
class PeerFsm {
 public:
  /// @throw kvstore::KVStoreIOError
  /// @throw raft::RaftConfigException
  PeerFsm(StoreContext *ctx, PeerMeta self, std::unique_ptr<PeerStorage> storage);

  void Handle(std::vector<PeerMsg> &msgs);

  /// Fails every proposal still waiting for its entry.
  void FailPending(const common::Error &error);

  ShardId shard_id() const { return storage_->shard_id(); }
  const PeerMeta &self() const { return self_; }
  const ShardMeta &meta() const { return storage_->meta(); }
  bool IsLeader() const { return raw_node_->raft().role() == raft::StateRole::LEADER; }

 private:
  void HandleMsg(PeerMsg &msg);

  void OnRaftMessage(RaftMessage msg);
  void OnTick();
  void OnShardDetail(ShardDetailMsg msg);
  void OnApplyResult(ApplyResult result);
  void OnSnapshotApplied(SnapshotApplied applied);
  void OnSplitCheckResult(const SplitCheckResult &result);
  void OnSplitShard(SplitShardMsg msg);
  void OnSplitIdsAllocated(SplitIdsAllocated msg);
  void OnMergeShard(MergeShardMsg msg);
  void OnPlacementOperator(const placement::ShardOperator &op);
  void OnCommitMergeRequest(const CommitMergeRequest &request);

  void OnLogGcTick();
  /// Looks for a split key on the split check pool. `force` ignores the
  /// size threshold.
  void StartSplitCheck(bool force);
  void OnPlacementHeartbeatTick();
  void OnMergeCheckTick();
  void CheckProposalTimeouts();

  /// Validates `command` for this replica and proposes it. Reads inside the
  /// leader lease are answered right away.
  void Propose(RaftCommand command, io::Promise<CommandResult> promise);
  void ProposeConfChange(const CommandHeader &header, std::vector<ChangePeerRequest> changes,
                         io::Promise<CommandResult> promise);
  /// Proposes a command on behalf of the replica itself. Failures are only
  /// logged.
  void ProposeInternal(Request request);

  std::optional<common::Error> PreProposeCheck(const RaftCommand &command) const;
  common::Error NotLeaderError() const;
  bool IsBusy() const;

  void HandleReady();
  /// Persists and sends everything in `ready` except its snapshot.
  void PersistAndAdvance(raft::Ready ready);
  void SendRaftMessages(std::vector<raft::Message> messages);
  void SendToPeer(const PeerMeta &to, raft::Message message, bool is_tombstone = false);
  void SendCommitted(std::vector<raft::Entry> entries);
  void OnRoleChange(const raft::SoftState &soft_state);

  /// Rejects snapshots which don't decode or overlap another local shard.
  bool AcceptSnapshot(const RaftMessage &msg) const;

  /// Updates the persisted-state mirror, the node wide shard index and the
  /// peer cache after the shard descriptor changed.
  void UpdateMeta(const common::ShardLocalState &state);

  void RecreateRawNode();
  void MarkUnhealthy();
  void Destroy(bool remove_data);

  std::optional<PeerMeta> FindPeer(PeerId peer_id) const;

  StoreContext *ctx_;
  PeerMeta self_;
  std::unique_ptr<PeerStorage> storage_;
  std::unique_ptr<raft::RawNode> raw_node_;
  std::string tag_;

  /// Peers seen in messages, covers members the local descriptor doesn't
  /// know yet.
  std::map<PeerId, PeerMeta> peer_cache_;
  /// Proposals in log order whose entries haven't been committed yet.
  std::deque<Proposal> proposals_;
  /// Ready holding a snapshot, completed once the snapshot is applied.
  std::optional<raft::Ready> pending_ready_;

  /// Caller of the split in progress, if it came with one.
  std::optional<io::Promise<CommandResult>> split_promise_;
  /// Merge sources whose CommitMerge has been proposed, with the tick of
  /// the proposal.
  std::map<ShardId, uint64_t> pending_merge_commits_;

  uint64_t ticks_{0};
  uint64_t approximate_size_{0};
  /// A split check, id allocation or split proposal is in progress.
  bool splitting_{false};
  bool unhealthy_{false};
  bool destroying_{false};
};

}  // namespace rangekv::raftstore
