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


#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <gflags/gflags.h>
#include <spdlog/spdlog.h>

#include "flags/general.hpp"
#include "flags/log_level.hpp"
#include "flags/raftstore.hpp"
#include "io/tcp.hpp"
#include "placement/memory_service.hpp"
#include "server/node.hpp"
#include "utils/signals.hpp"

namespace {

using namespace rangekv;

constexpr auto kReplicaWaitTimeout = std::chrono::seconds(30);

server::NodeConfig MakeNodeConfig(const uint32_t index) {
  server::NodeConfig config;
  config.node_id = FLAGS_node_id + index;
  config.data_directory = std::filesystem::path(FLAGS_data_directory);
  auto endpoint = io::ParseEndpoint(FLAGS_listen_address);
  if (FLAGS_nodes > 1) {
    config.data_directory /= fmt::format("node_{}", config.node_id);
    endpoint.port = static_cast<uint16_t>(endpoint.port + index);
  }
  config.listen_address = endpoint.ToString();
  if (FLAGS_nodes == 1) config.advertise_address = FLAGS_advertise_address;
  config.io_threads = FLAGS_io_threads;
  config.request_threads = FLAGS_request_threads;
  config.request_timeout = std::chrono::milliseconds(FLAGS_request_timeout_ms);
  config.raftstore = flags::RaftstoreConfigFromFlags();
  return config;
}

size_t VoterCount(const common::ShardMeta &meta) {
  size_t voters = 0;
  for (const auto &peer : meta.peers) {
    if (peer.role == common::PeerRole::VOTER) ++voters;
  }
  return voters;
}

/// Grows the first shard to `--replicas` voters, one membership change at a
/// time, on the nodes that don't hold it yet.
bool ReplicateFirstShard(placement::MemoryPlacementService *placement) {
  const auto shards = placement->Shards();
  if (shards.empty()) return false;
  const auto shard_id = shards.front().meta.id;
  const auto target = std::min<size_t>(FLAGS_replicas, FLAGS_nodes);

  for (uint32_t index = 0; index < FLAGS_nodes; ++index) {
    auto route = placement->GetShardById(shard_id);
    if (route.HasError()) return false;
    const auto &meta = route->meta;
    if (VoterCount(meta) >= target) return true;

    const auto node_id = FLAGS_node_id + index;
    if (meta.FindPeerOnNode(node_id)) continue;

    auto peer_id = placement->AllocId();
    if (peer_id.HasError()) return false;
    const auto voters = VoterCount(meta);
    spdlog::info("Adding peer {} on node {} to shard {}", *peer_id, node_id, shard_id);
    placement->ScheduleOperator(
        shard_id, placement::ChangePeerOp{.type = placement::ChangePeerType::ADD_VOTER,
                                          .peer = common::PeerMeta{.id = *peer_id, .node_id = node_id}});

    const auto deadline = std::chrono::steady_clock::now() + kReplicaWaitTimeout;
    while (true) {
      if (utils::ShutdownSignal::Requested()) return false;
      auto current = placement->GetShardById(shard_id);
      if (current.HasValue() && VoterCount(current->meta) > voters) break;
      if (std::chrono::steady_clock::now() > deadline) {
        spdlog::warn("Shard {} didn't take peer {} on node {} in time", shard_id, *peer_id, node_id);
        return false;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
  return true;
}

}  // namespace

int main(int argc, char **argv) {
  google::SetUsageMessage("rangekv storage node");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  flags::InitializeLogger();

  if (!utils::SignalIgnore(utils::Signal::PIPE)) {
    spdlog::critical("Couldn't ignore SIGPIPE");
    return EXIT_FAILURE;
  }
  if (!utils::ShutdownSignal::Install()) {
    spdlog::critical("Couldn't install the shutdown handlers");
    return EXIT_FAILURE;
  }

  placement::MemoryPlacementService placement(FLAGS_cluster_id);
  std::vector<std::unique_ptr<server::Node>> nodes;
  try {
    for (uint32_t index = 0; index < FLAGS_nodes; ++index) {
      auto node = std::make_unique<server::Node>(MakeNodeConfig(index), &placement);
      node->Start();
      nodes.push_back(std::move(node));
    }
  } catch (const std::exception &e) {
    spdlog::critical("Starting the node failed: {}", e.what());
    for (auto &node : nodes) node->Stop();
    return EXIT_FAILURE;
  }

  if (FLAGS_nodes > 1 && !ReplicateFirstShard(&placement)) {
    spdlog::warn("The first shard runs with fewer than {} replicas", FLAGS_replicas);
  }

  spdlog::info("rangekv is running with {} node(s) in cluster {}", nodes.size(), FLAGS_cluster_id);
  utils::ShutdownSignal::Wait();
  spdlog::info("Shutting down");

  // Reverse order, the first node owns the bootstrap shard.
  for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) (*it)->Stop();
  nodes.clear();
  gflags::ShutDownCommandLineFlags();
  return EXIT_SUCCESS;
}
