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

#include "raft/quorum.hpp"

#include <algorithm>
#include <limits>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rangekv::raft {

std::string_view VoteResultToString(const VoteResult result) {
  switch (result) {
    case VoteResult::PENDING:
      return "PENDING";
    case VoteResult::LOST:
      return "LOST";
    case VoteResult::WON:
      return "WON";
  }
  return "UNKNOWN";
}

uint64_t MajorityConfig::CommittedIndex(const AckedIndexer &acked) const {
  if (ids_.empty()) return std::numeric_limits<uint64_t>::max();

  std::vector<uint64_t> indexes;
  indexes.reserve(ids_.size());
  for (const auto id : ids_) {
    indexes.push_back(acked(id).value_or(0));
  }
  // The element at n - (n/2 + 1) in ascending order is acknowledged by a
  // majority.
  std::sort(indexes.begin(), indexes.end());
  return indexes[indexes.size() - (indexes.size() / 2 + 1)];
}

VoteResult MajorityConfig::Vote(const std::map<uint64_t, bool> &votes) const {
  if (ids_.empty()) return VoteResult::WON;

  size_t granted = 0;
  size_t missing = 0;
  for (const auto id : ids_) {
    const auto it = votes.find(id);
    if (it == votes.end()) {
      ++missing;
      continue;
    }
    if (it->second) ++granted;
  }

  const auto quorum = ids_.size() / 2 + 1;
  if (granted >= quorum) return VoteResult::WON;
  if (granted + missing >= quorum) return VoteResult::PENDING;
  return VoteResult::LOST;
}

std::string MajorityConfig::Describe() const { return fmt::format("({})", fmt::join(ids_, " ")); }

uint64_t JointConfig::CommittedIndex(const AckedIndexer &acked) const {
  return std::min(incoming.CommittedIndex(acked), outgoing.CommittedIndex(acked));
}

VoteResult JointConfig::Vote(const std::map<uint64_t, bool> &votes) const {
  const auto incoming_result = incoming.Vote(votes);
  const auto outgoing_result = outgoing.Vote(votes);
  if (incoming_result == outgoing_result) return incoming_result;
  if (incoming_result == VoteResult::LOST || outgoing_result == VoteResult::LOST) return VoteResult::LOST;
  // One side won, the other one is pending.
  return VoteResult::PENDING;
}

std::set<uint64_t> JointConfig::Ids() const {
  auto ids = incoming.ids();
  ids.insert(outgoing.ids().begin(), outgoing.ids().end());
  return ids;
}

std::string JointConfig::Describe() const {
  if (outgoing.Empty()) return incoming.Describe();
  return fmt::format("{}&&{}", incoming.Describe(), outgoing.Describe());
}

}  // namespace rangekv::raft
