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
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace rangekv::raft {

enum class VoteResult : uint8_t {
  // Not decided yet, more votes are needed.
  PENDING,
  LOST,
  WON,
};

std::string_view VoteResultToString(VoteResult result);

/// Returns the acknowledged index of a voter, if known.
using AckedIndexer = std::function<std::optional<uint64_t>(uint64_t id)>;

/// A set of voters making decisions by simple majority.
class MajorityConfig {
 public:
  MajorityConfig() = default;
  explicit MajorityConfig(std::set<uint64_t> ids) : ids_(std::move(ids)) {}

  /// Largest index acknowledged by a majority. An empty configuration
  /// returns the maximum index so it doesn't restrict a joint quorum.
  uint64_t CommittedIndex(const AckedIndexer &acked) const;

  /// Outcome of an election given the votes cast so far. An empty
  /// configuration wins every election.
  VoteResult Vote(const std::map<uint64_t, bool> &votes) const;

  const std::set<uint64_t> &ids() const { return ids_; }
  std::set<uint64_t> &ids() { return ids_; }
  bool Contains(uint64_t id) const { return ids_.contains(id); }
  size_t Size() const { return ids_.size(); }
  bool Empty() const { return ids_.empty(); }

  std::string Describe() const;

  friend bool operator==(const MajorityConfig &lhs, const MajorityConfig &rhs) = default;

 private:
  std::set<uint64_t> ids_;
};

/// Two majority configurations, both of which have to agree on decisions.
/// The outgoing configuration is empty unless a membership change is in
/// progress.
struct JointConfig {
  MajorityConfig incoming;
  MajorityConfig outgoing;

  uint64_t CommittedIndex(const AckedIndexer &acked) const;
  VoteResult Vote(const std::map<uint64_t, bool> &votes) const;

  /// Union of both configurations.
  std::set<uint64_t> Ids() const;
  bool Contains(uint64_t id) const { return incoming.Contains(id) || outgoing.Contains(id); }
  bool IsJoint() const { return !outgoing.Empty(); }

  std::string Describe() const;

  friend bool operator==(const JointConfig &lhs, const JointConfig &rhs) = default;
};

}  // namespace rangekv::raft
