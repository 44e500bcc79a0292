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
#include <variant>
#include <vector>

#include "slk/serialization.hpp"

namespace rangekv::raft {

/// Id of a raft group member. Zero means "nobody".
inline constexpr uint64_t kNone = 0;

enum class EntryType : uint8_t { NORMAL, CONF_CHANGE };

struct Entry {
  uint64_t term{0};
  uint64_t index{0};
  EntryType type{EntryType::NORMAL};
  std::string data;

  /// Approximate number of bytes the entry takes in a message.
  size_t ByteSize() const { return data.size() + 2 * sizeof(uint64_t) + 1; }

  friend bool operator==(const Entry &lhs, const Entry &rhs) = default;
};

/// Persistent part of the consensus state which has to be stored before any
/// message depending on it is sent.
struct HardState {
  uint64_t term{0};
  uint64_t vote{kNone};
  uint64_t commit{0};

  bool IsEmpty() const { return term == 0 && vote == kNone && commit == 0; }

  friend bool operator==(const HardState &lhs, const HardState &rhs) = default;
};

/// Membership of a group as seen by the consensus state machine.
/// `voters_outgoing` is non-empty only while in a joint configuration.
struct ConfState {
  std::vector<uint64_t> voters;
  std::vector<uint64_t> learners;
  std::vector<uint64_t> voters_outgoing;
  std::vector<uint64_t> learners_next;
  bool auto_leave{false};

  friend bool operator==(const ConfState &lhs, const ConfState &rhs) = default;
};

struct SnapshotMetadata {
  ConfState conf_state;
  uint64_t index{0};
  uint64_t term{0};

  friend bool operator==(const SnapshotMetadata &lhs, const SnapshotMetadata &rhs) = default;
};

/// Opaque state machine image together with the log position it represents.
struct Snapshot {
  std::string data;
  SnapshotMetadata metadata;

  bool IsEmpty() const { return metadata.index == 0; }

  friend bool operator==(const Snapshot &lhs, const Snapshot &rhs) = default;
};

enum class ConfChangeType : uint8_t { ADD_NODE, REMOVE_NODE, ADD_LEARNER_NODE };

struct ConfChangeSingle {
  ConfChangeType type{ConfChangeType::ADD_NODE};
  uint64_t node_id{kNone};

  friend bool operator==(const ConfChangeSingle &lhs, const ConfChangeSingle &rhs) = default;
};

enum class ConfChangeTransition : uint8_t {
  // Simple change when possible, otherwise a joint change left automatically.
  AUTO,
  // Joint change left automatically once applied.
  JOINT_IMPLICIT,
  // Joint change which stays until an empty ConfChange is proposed.
  JOINT_EXPLICIT,
};

/// Membership change. A change without any single changes and with the AUTO
/// transition leaves the current joint configuration. `context` is carried
/// through the log untouched.
struct ConfChange {
  ConfChangeTransition transition{ConfChangeTransition::AUTO};
  std::vector<ConfChangeSingle> changes;
  std::string context;

  bool LeaveJoint() const { return transition == ConfChangeTransition::AUTO && changes.empty(); }

  /// Returns whether the change has to go through a joint configuration and
  /// fills `auto_leave` in that case.
  bool EnterJoint(bool *auto_leave) const;

  friend bool operator==(const ConfChange &lhs, const ConfChange &rhs) = default;
};

// Election and pre-election ballots. A pre-vote is sent for the term the
// candidate would campaign in, without changing anybody's term.
struct VoteRequest {
  bool pre_vote{false};
  uint64_t last_log_index{0};
  uint64_t last_log_term{0};
  // Set when the campaign is the result of a leadership transfer. Such votes
  // bypass the leader lease of the receiver.
  bool leader_transfer{false};
};

struct VoteResponse {
  bool pre_vote{false};
  bool reject{false};
};

struct AppendRequest {
  uint64_t prev_log_index{0};
  uint64_t prev_log_term{0};
  std::vector<Entry> entries;
  uint64_t commit{0};
};

// On success `index` is the last index the follower matches. On rejection
// `index` is the rejected prev_log_index and (reject_hint, log_term) is the
// follower's best guess for a matching position.
struct AppendResponse {
  bool reject{false};
  uint64_t index{0};
  uint64_t reject_hint{0};
  uint64_t log_term{0};
};

struct HeartbeatRequest {
  uint64_t commit{0};
  // Leader tick at which the heartbeat was sent, echoed back in the response.
  uint64_t context{0};
};

struct HeartbeatResponse {
  uint64_t context{0};
};

struct InstallSnapshot {
  Snapshot snapshot;
};

/// Tells the transfer target to campaign immediately.
struct TimeoutNow {};

/// Sent by the transfer target (or forwarded by a follower) to the leader.
struct TransferLeaderRequest {
  uint64_t transferee{kNone};
};

using MessagePayload = std::variant<VoteRequest, VoteResponse, AppendRequest, AppendResponse, HeartbeatRequest,
                                    HeartbeatResponse, InstallSnapshot, TimeoutNow, TransferLeaderRequest>;

struct Message {
  uint64_t from{kNone};
  uint64_t to{kNone};
  uint64_t term{0};
  MessagePayload payload;
};

/// Drops entries from the back until the total size is within `max_size`,
/// always keeping the first entry.
void LimitSize(std::vector<Entry> *entries, uint64_t max_size);

std::string_view MessageTypeName(const MessagePayload &payload);

std::ostream &operator<<(std::ostream &in, const Message &message);

using slk::Load;
using slk::Save;

void Save(const Entry &obj, slk::Builder *builder);
void Load(Entry *obj, slk::Reader *reader);
void Save(const HardState &obj, slk::Builder *builder);
void Load(HardState *obj, slk::Reader *reader);
void Save(const ConfState &obj, slk::Builder *builder);
void Load(ConfState *obj, slk::Reader *reader);
void Save(const SnapshotMetadata &obj, slk::Builder *builder);
void Load(SnapshotMetadata *obj, slk::Reader *reader);
void Save(const Snapshot &obj, slk::Builder *builder);
void Load(Snapshot *obj, slk::Reader *reader);
void Save(const ConfChangeSingle &obj, slk::Builder *builder);
void Load(ConfChangeSingle *obj, slk::Reader *reader);
void Save(const ConfChange &obj, slk::Builder *builder);
void Load(ConfChange *obj, slk::Reader *reader);
void Save(const VoteRequest &obj, slk::Builder *builder);
void Load(VoteRequest *obj, slk::Reader *reader);
void Save(const VoteResponse &obj, slk::Builder *builder);
void Load(VoteResponse *obj, slk::Reader *reader);
void Save(const AppendRequest &obj, slk::Builder *builder);
void Load(AppendRequest *obj, slk::Reader *reader);
void Save(const AppendResponse &obj, slk::Builder *builder);
void Load(AppendResponse *obj, slk::Reader *reader);
void Save(const HeartbeatRequest &obj, slk::Builder *builder);
void Load(HeartbeatRequest *obj, slk::Reader *reader);
void Save(const HeartbeatResponse &obj, slk::Builder *builder);
void Load(HeartbeatResponse *obj, slk::Reader *reader);
void Save(const InstallSnapshot &obj, slk::Builder *builder);
void Load(InstallSnapshot *obj, slk::Reader *reader);
void Save(const TimeoutNow &obj, slk::Builder *builder);
void Load(TimeoutNow *obj, slk::Reader *reader);
void Save(const TransferLeaderRequest &obj, slk::Builder *builder);
void Load(TransferLeaderRequest *obj, slk::Reader *reader);
void Save(const Message &obj, slk::Builder *builder);
void Load(Message *obj, slk::Reader *reader);

}  // namespace rangekv::raft
