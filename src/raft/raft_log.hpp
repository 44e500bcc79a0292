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
#include <string>
#include <utility>
#include <vector>

#include "raft/messages.hpp"
#include "raft/storage.hpp"

namespace rangekv::raft {

/// Entries and an incoming snapshot which aren't persisted yet. Entry `i` is
/// stored at position `i - offset`.
class Unstable {
 public:
  explicit Unstable(uint64_t offset) : offset_(offset) {}

  /// Index of the first entry if there is a snapshot.
  std::optional<uint64_t> MaybeFirstIndex() const;
  std::optional<uint64_t> MaybeLastIndex() const;
  std::optional<uint64_t> MaybeTerm(uint64_t index) const;

  void StableTo(uint64_t index, uint64_t term);
  void StableSnapTo(uint64_t index);
  void Restore(Snapshot snapshot);
  void TruncateAndAppend(const std::vector<Entry> &entries);

  /// Entries in [low, high), which must lie within the unstable entries.
  std::vector<Entry> Slice(uint64_t low, uint64_t high) const;

  const std::vector<Entry> &entries() const { return entries_; }
  const std::optional<Snapshot> &snapshot() const { return snapshot_; }
  uint64_t offset() const { return offset_; }

 private:
  std::optional<Snapshot> snapshot_;
  std::vector<Entry> entries_;
  uint64_t offset_;
};

/// The log as seen by the consensus core: the persisted part in Storage and
/// the unstable part on top of it.
///
/// Invariant: applied <= applying <= committed <= last index.
class RaftLog {
 public:
  RaftLog(Storage *storage, uint64_t max_next_entries_size, std::string tag);

  uint64_t FirstIndex() const;
  uint64_t LastIndex() const;
  uint64_t LastTerm() const;

  /// Term of the entry at `index`. Indexes past the last entry have term 0.
  StorageResult<uint64_t> Term(uint64_t index) const;

  bool MatchTerm(uint64_t index, uint64_t term) const;

  /// Appends `entries` if the entry at `index` has `term`. Returns the index
  /// of the last new entry, or nullopt if the log doesn't match.
  std::optional<uint64_t> MaybeAppend(uint64_t index, uint64_t term, uint64_t committed,
                                      const std::vector<Entry> &entries);

  uint64_t Append(const std::vector<Entry> &entries);

  /// Index of the first entry which conflicts with the log, or 0 when all
  /// existing entries match.
  uint64_t FindConflict(const std::vector<Entry> &entries) const;

  /// Largest index <= `index` with a term <= `term`, together with that term.
  std::pair<uint64_t, uint64_t> FindConflictByTerm(uint64_t index, uint64_t term) const;

  std::vector<Entry> UnstableEntries() const { return unstable_.entries(); }

  bool HasNextCommittedEntries() const;
  std::vector<Entry> NextCommittedEntries() const;

  bool HasPendingSnapshot() const { return unstable_.snapshot().has_value(); }

  /// Pending snapshot, or the storage's snapshot.
  StorageResult<raft::Snapshot> GetSnapshot(uint64_t request_index) const;

  StorageResult<std::vector<Entry>> Entries(uint64_t index, uint64_t max_size) const;

  /// Entries in [low, high).
  StorageResult<std::vector<Entry>> Slice(uint64_t low, uint64_t high, uint64_t max_size) const;

  bool IsUpToDate(uint64_t last_index, uint64_t term) const;

  bool MaybeCommit(uint64_t max_index, uint64_t term);
  void CommitTo(uint64_t to_commit);

  /// Marks entries up to `index` as handed out for applying.
  void AcceptApplying(uint64_t index);
  void AppliedTo(uint64_t index);

  void StableTo(uint64_t index, uint64_t term) { unstable_.StableTo(index, term); }
  void StableSnapTo(uint64_t index) { unstable_.StableSnapTo(index); }

  void Restore(Snapshot snapshot);

  uint64_t committed() const { return committed_; }
  uint64_t applied() const { return applied_; }
  uint64_t applying() const { return applying_; }
  const Unstable &unstable() const { return unstable_; }

 private:
  uint64_t ZeroTermOnError(const StorageResult<uint64_t> &term) const;

  Storage *storage_;
  Unstable unstable_;
  uint64_t committed_;
  uint64_t applying_;
  uint64_t applied_;
  uint64_t max_next_entries_size_;
  std::string tag_;
};

}  // namespace rangekv::raft
