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

#include "raft/messages.hpp"

#include "utils/variant_helpers.hpp"

namespace rangekv::raft {

bool ConfChange::EnterJoint(bool *auto_leave) const {
  if (transition != ConfChangeTransition::AUTO || changes.size() > 1) {
    switch (transition) {
      case ConfChangeTransition::AUTO:
      case ConfChangeTransition::JOINT_IMPLICIT:
        *auto_leave = true;
        break;
      case ConfChangeTransition::JOINT_EXPLICIT:
        *auto_leave = false;
        break;
    }
    return true;
  }
  return false;
}

void LimitSize(std::vector<Entry> *entries, const uint64_t max_size) {
  if (entries->empty()) return;
  uint64_t size = 0;
  size_t limit = 0;
  for (; limit < entries->size(); ++limit) {
    size += (*entries)[limit].ByteSize();
    if (limit > 0 && size > max_size) break;
  }
  entries->resize(limit);
}

std::string_view MessageTypeName(const MessagePayload &payload) {
  return std::visit(utils::Overloaded{
                        [](const VoteRequest &m) -> std::string_view { return m.pre_vote ? "PreVote" : "Vote"; },
                        [](const VoteResponse &m) -> std::string_view {
                          return m.pre_vote ? "PreVoteResponse" : "VoteResponse";
                        },
                        [](const AppendRequest &) -> std::string_view { return "Append"; },
                        [](const AppendResponse &) -> std::string_view { return "AppendResponse"; },
                        [](const HeartbeatRequest &) -> std::string_view { return "Heartbeat"; },
                        [](const HeartbeatResponse &) -> std::string_view { return "HeartbeatResponse"; },
                        [](const InstallSnapshot &) -> std::string_view { return "Snapshot"; },
                        [](const TimeoutNow &) -> std::string_view { return "TimeoutNow"; },
                        [](const TransferLeaderRequest &) -> std::string_view { return "TransferLeader"; },
                    },
                    payload);
}

std::ostream &operator<<(std::ostream &in, const Message &message) {
  in << MessageTypeName(message.payload) << " { from: " << message.from << ", to: " << message.to
     << ", term: " << message.term;
  std::visit(utils::Overloaded{
                 [&](const VoteRequest &m) {
                   in << ", last_log_index: " << m.last_log_index << ", last_log_term: " << m.last_log_term;
                 },
                 [&](const VoteResponse &m) { in << ", reject: " << m.reject; },
                 [&](const AppendRequest &m) {
                   in << ", prev_log_index: " << m.prev_log_index << ", prev_log_term: " << m.prev_log_term
                      << ", entries: " << m.entries.size() << ", commit: " << m.commit;
                 },
                 [&](const AppendResponse &m) {
                   in << ", index: " << m.index << ", reject: " << m.reject;
                   if (m.reject) in << ", reject_hint: " << m.reject_hint << ", log_term: " << m.log_term;
                 },
                 [&](const HeartbeatRequest &m) { in << ", commit: " << m.commit; },
                 [&](const HeartbeatResponse &) {},
                 [&](const InstallSnapshot &m) {
                   in << ", index: " << m.snapshot.metadata.index << ", snapshot_term: " << m.snapshot.metadata.term;
                 },
                 [&](const TimeoutNow &) {},
                 [&](const TransferLeaderRequest &m) { in << ", transferee: " << m.transferee; },
             },
             message.payload);
  in << " }";
  return in;
}

void Save(const Entry &obj, slk::Builder *builder) {
  Save(obj.term, builder);
  Save(obj.index, builder);
  Save(obj.type, builder);
  Save(obj.data, builder);
}

void Load(Entry *obj, slk::Reader *reader) {
  Load(&obj->term, reader);
  Load(&obj->index, reader);
  Load(&obj->type, reader);
  Load(&obj->data, reader);
}

void Save(const HardState &obj, slk::Builder *builder) {
  Save(obj.term, builder);
  Save(obj.vote, builder);
  Save(obj.commit, builder);
}

void Load(HardState *obj, slk::Reader *reader) {
  Load(&obj->term, reader);
  Load(&obj->vote, reader);
  Load(&obj->commit, reader);
}

void Save(const ConfState &obj, slk::Builder *builder) {
  Save(obj.voters, builder);
  Save(obj.learners, builder);
  Save(obj.voters_outgoing, builder);
  Save(obj.learners_next, builder);
  Save(obj.auto_leave, builder);
}

void Load(ConfState *obj, slk::Reader *reader) {
  Load(&obj->voters, reader);
  Load(&obj->learners, reader);
  Load(&obj->voters_outgoing, reader);
  Load(&obj->learners_next, reader);
  Load(&obj->auto_leave, reader);
}

void Save(const SnapshotMetadata &obj, slk::Builder *builder) {
  Save(obj.conf_state, builder);
  Save(obj.index, builder);
  Save(obj.term, builder);
}

void Load(SnapshotMetadata *obj, slk::Reader *reader) {
  Load(&obj->conf_state, reader);
  Load(&obj->index, reader);
  Load(&obj->term, reader);
}

void Save(const Snapshot &obj, slk::Builder *builder) {
  Save(obj.data, builder);
  Save(obj.metadata, builder);
}

void Load(Snapshot *obj, slk::Reader *reader) {
  Load(&obj->data, reader);
  Load(&obj->metadata, reader);
}

void Save(const ConfChangeSingle &obj, slk::Builder *builder) {
  Save(obj.type, builder);
  Save(obj.node_id, builder);
}

void Load(ConfChangeSingle *obj, slk::Reader *reader) {
  Load(&obj->type, reader);
  Load(&obj->node_id, reader);
}

void Save(const ConfChange &obj, slk::Builder *builder) {
  Save(obj.transition, builder);
  Save(obj.changes, builder);
  Save(obj.context, builder);
}

void Load(ConfChange *obj, slk::Reader *reader) {
  Load(&obj->transition, reader);
  Load(&obj->changes, reader);
  Load(&obj->context, reader);
}

void Save(const VoteRequest &obj, slk::Builder *builder) {
  Save(obj.pre_vote, builder);
  Save(obj.last_log_index, builder);
  Save(obj.last_log_term, builder);
  Save(obj.leader_transfer, builder);
}

void Load(VoteRequest *obj, slk::Reader *reader) {
  Load(&obj->pre_vote, reader);
  Load(&obj->last_log_index, reader);
  Load(&obj->last_log_term, reader);
  Load(&obj->leader_transfer, reader);
}

void Save(const VoteResponse &obj, slk::Builder *builder) {
  Save(obj.pre_vote, builder);
  Save(obj.reject, builder);
}

void Load(VoteResponse *obj, slk::Reader *reader) {
  Load(&obj->pre_vote, reader);
  Load(&obj->reject, reader);
}

void Save(const AppendRequest &obj, slk::Builder *builder) {
  Save(obj.prev_log_index, builder);
  Save(obj.prev_log_term, builder);
  Save(obj.entries, builder);
  Save(obj.commit, builder);
}

void Load(AppendRequest *obj, slk::Reader *reader) {
  Load(&obj->prev_log_index, reader);
  Load(&obj->prev_log_term, reader);
  Load(&obj->entries, reader);
  Load(&obj->commit, reader);
}

void Save(const AppendResponse &obj, slk::Builder *builder) {
  Save(obj.reject, builder);
  Save(obj.index, builder);
  Save(obj.reject_hint, builder);
  Save(obj.log_term, builder);
}

void Load(AppendResponse *obj, slk::Reader *reader) {
  Load(&obj->reject, reader);
  Load(&obj->index, reader);
  Load(&obj->reject_hint, reader);
  Load(&obj->log_term, reader);
}

void Save(const HeartbeatRequest &obj, slk::Builder *builder) {
  Save(obj.commit, builder);
  Save(obj.context, builder);
}

void Load(HeartbeatRequest *obj, slk::Reader *reader) {
  Load(&obj->commit, reader);
  Load(&obj->context, reader);
}

void Save(const HeartbeatResponse &obj, slk::Builder *builder) { Save(obj.context, builder); }
void Load(HeartbeatResponse *obj, slk::Reader *reader) { Load(&obj->context, reader); }

void Save(const InstallSnapshot &obj, slk::Builder *builder) { Save(obj.snapshot, builder); }
void Load(InstallSnapshot *obj, slk::Reader *reader) { Load(&obj->snapshot, reader); }

void Save(const TimeoutNow & /*obj*/, slk::Builder * /*builder*/) {}
void Load(TimeoutNow * /*obj*/, slk::Reader * /*reader*/) {}

void Save(const TransferLeaderRequest &obj, slk::Builder *builder) { Save(obj.transferee, builder); }
void Load(TransferLeaderRequest *obj, slk::Reader *reader) { Load(&obj->transferee, reader); }

void Save(const Message &obj, slk::Builder *builder) {
  Save(obj.from, builder);
  Save(obj.to, builder);
  Save(obj.term, builder);
  Save(obj.payload, builder);
}

void Load(Message *obj, slk::Reader *reader) {
  Load(&obj->from, reader);
  Load(&obj->to, reader);
  Load(&obj->term, reader);
  Load(&obj->payload, reader);
}

}  // namespace rangekv::raft
