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

#include "raft/raft_log.hpp"

#include <algorithm>

#include "raft/exceptions.hpp"
#include "utils/logging.hpp"

namespace rangekv::raft {

std::optional<uint64_t> Unstable::MaybeFirstIndex() const {
  if (snapshot_) return snapshot_->metadata.index + 1;
  return std::nullopt;
}

std::optional<uint64_t> Unstable::MaybeLastIndex() const {
  if (!entries_.empty()) return offset_ + entries_.size() - 1;
  if (snapshot_) return snapshot_->metadata.index;
  return std::nullopt;
}

std::optional<uint64_t> Unstable::MaybeTerm(const uint64_t index) const {
  if (index < offset_) {
    if (snapshot_ && snapshot_->metadata.index == index) return snapshot_->metadata.term;
    return std::nullopt;
  }
  const auto last = MaybeLastIndex();
  if (!last || index > *last) return std::nullopt;
  return entries_[index - offset_].term;
}

void Unstable::StableTo(const uint64_t index, const uint64_t term) {
  const auto stored_term = MaybeTerm(index);
  if (!stored_term) return;
  // Only stable entries which weren't replaced in the meantime are dropped.
  if (*stored_term == term && index >= offset_) {
    entries_.erase(entries_.begin(), entries_.begin() + static_cast<ptrdiff_t>(index + 1 - offset_));
    offset_ = index + 1;
  }
}

void Unstable::StableSnapTo(const uint64_t index) {
  if (snapshot_ && snapshot_->metadata.index == index) snapshot_.reset();
}

void Unstable::Restore(Snapshot snapshot) {
  offset_ = snapshot.metadata.index + 1;
  entries_.clear();
  snapshot_ = std::move(snapshot);
}

void Unstable::TruncateAndAppend(const std::vector<Entry> &entries) {
  const auto after = entries.front().index;
  if (after == offset_ + entries_.size()) {
    entries_.insert(entries_.end(), entries.begin(), entries.end());
  } else if (after <= offset_) {
    // The log is replaced starting from `after`.
    offset_ = after;
    entries_ = entries;
  } else {
    entries_.resize(after - offset_);
    entries_.insert(entries_.end(), entries.begin(), entries.end());
  }
}

std::vector<Entry> Unstable::Slice(const uint64_t low, const uint64_t high) const {
  RKV_ASSERT(low <= high && low >= offset_ && high <= offset_ + entries_.size(),
             "Invalid unstable slice [{}, {}) of [{}, {})", low, high, offset_, offset_ + entries_.size());
  return {entries_.begin() + static_cast<ptrdiff_t>(low - offset_),
          entries_.begin() + static_cast<ptrdiff_t>(high - offset_)};
}

RaftLog::RaftLog(Storage *storage, const uint64_t max_next_entries_size, std::string tag)
    : storage_(storage),
      unstable_(storage->LastIndex() + 1),
      committed_(storage->FirstIndex() - 1),
      applying_(committed_),
      applied_(committed_),
      max_next_entries_size_(max_next_entries_size),
      tag_(std::move(tag)) {}

uint64_t RaftLog::FirstIndex() const {
  if (const auto index = unstable_.MaybeFirstIndex()) return *index;
  return storage_->FirstIndex();
}

uint64_t RaftLog::LastIndex() const {
  if (const auto index = unstable_.MaybeLastIndex()) return *index;
  return storage_->LastIndex();
}

uint64_t RaftLog::LastTerm() const {
  const auto term = Term(LastIndex());
  RKV_ASSERT(!term.HasError(), "{} unexpected error when getting the last term: {}", tag_,
             StorageErrorToString(term.GetError()));
  return term.GetValue();
}

StorageResult<uint64_t> RaftLog::Term(const uint64_t index) const {
  // The valid term range is [first index - 1, last index].
  const auto dummy_index = FirstIndex() - 1;
  if (index < dummy_index) return StorageError::COMPACTED;
  if (index > LastIndex()) return uint64_t{0};

  if (const auto term = unstable_.MaybeTerm(index)) return *term;

  auto term = storage_->Term(index);
  if (term.HasError() && term.GetError() != StorageError::COMPACTED && term.GetError() != StorageError::UNAVAILABLE) {
    LOG_FATAL("{} unexpected storage error when reading the term of {}: {}", tag_, index,
              StorageErrorToString(term.GetError()));
  }
  return term;
}

uint64_t RaftLog::ZeroTermOnError(const StorageResult<uint64_t> &term) const {
  if (term.HasError()) return 0;
  return term.GetValue();
}

bool RaftLog::MatchTerm(const uint64_t index, const uint64_t term) const {
  const auto stored_term = Term(index);
  return !stored_term.HasError() && stored_term.GetValue() == term;
}

std::optional<uint64_t> RaftLog::MaybeAppend(const uint64_t index, const uint64_t term, const uint64_t committed,
                                             const std::vector<Entry> &entries) {
  if (!MatchTerm(index, term)) return std::nullopt;

  const auto last_new_index = index + entries.size();
  const auto conflict_index = FindConflict(entries);
  if (conflict_index != 0) {
    RKV_ASSERT(conflict_index > committed_, "{} entry {} conflicts with the committed entry (committed {})", tag_,
               conflict_index, committed_);
    const auto offset = index + 1;
    RKV_ASSERT(conflict_index - offset <= entries.size(), "{} conflict index {} is out of range", tag_,
               conflict_index);
    Append(std::vector<Entry>(entries.begin() + static_cast<ptrdiff_t>(conflict_index - offset), entries.end()));
  }
  CommitTo(std::min(committed, last_new_index));
  return last_new_index;
}

uint64_t RaftLog::Append(const std::vector<Entry> &entries) {
  if (entries.empty()) return LastIndex();
  const auto after = entries.front().index - 1;
  RKV_ASSERT(after >= committed_, "{} appending after {} is out of range [committed {}]", tag_, after, committed_);
  unstable_.TruncateAndAppend(entries);
  return LastIndex();
}

uint64_t RaftLog::FindConflict(const std::vector<Entry> &entries) const {
  for (const auto &entry : entries) {
    if (!MatchTerm(entry.index, entry.term)) {
      if (entry.index <= LastIndex()) {
        spdlog::info("{} found conflict at index {} [existing term: {}, conflicting term: {}]", tag_, entry.index,
                     ZeroTermOnError(Term(entry.index)), entry.term);
      }
      return entry.index;
    }
  }
  return 0;
}

std::pair<uint64_t, uint64_t> RaftLog::FindConflictByTerm(uint64_t index, const uint64_t term) const {
  for (; index > 0; --index) {
    const auto stored_term = Term(index);
    // An unknown term (compacted) is treated as a possible match.
    if (stored_term.HasError()) return {index, 0};
    if (stored_term.GetValue() <= term) return {index, stored_term.GetValue()};
  }
  return {0, 0};
}

bool RaftLog::HasNextCommittedEntries() const {
  if (HasPendingSnapshot()) return false;
  const auto offset = std::max(applying_ + 1, FirstIndex());
  return committed_ + 1 > offset;
}

std::vector<Entry> RaftLog::NextCommittedEntries() const {
  if (HasPendingSnapshot()) return {};
  const auto offset = std::max(applying_ + 1, FirstIndex());
  if (committed_ + 1 <= offset) return {};
  auto entries = Slice(offset, committed_ + 1, max_next_entries_size_);
  if (entries.HasError()) {
    LOG_FATAL("{} unexpected error when getting unapplied entries: {}", tag_,
              StorageErrorToString(entries.GetError()));
  }
  return std::move(entries).GetValue();
}

StorageResult<raft::Snapshot> RaftLog::GetSnapshot(const uint64_t request_index) const {
  if (unstable_.snapshot()) return *unstable_.snapshot();
  return storage_->GetSnapshot(request_index);
}

StorageResult<std::vector<Entry>> RaftLog::Entries(const uint64_t index, const uint64_t max_size) const {
  if (index > LastIndex()) return std::vector<Entry>{};
  return Slice(index, LastIndex() + 1, max_size);
}

StorageResult<std::vector<Entry>> RaftLog::Slice(const uint64_t low, const uint64_t high,
                                                 const uint64_t max_size) const {
  RKV_ASSERT(low <= high, "{} invalid slice {} > {}", tag_, low, high);
  const auto first = FirstIndex();
  if (low < first) return StorageError::COMPACTED;
  RKV_ASSERT(high <= LastIndex() + 1, "{} slice [{}, {}) out of bound [{}, {}]", tag_, low, high, first, LastIndex());
  if (low == high) return std::vector<Entry>{};

  std::vector<Entry> entries;
  if (low < unstable_.offset()) {
    const auto stored_high = std::min(high, unstable_.offset());
    auto stored = storage_->Entries(low, stored_high, max_size);
    if (stored.HasError()) {
      if (stored.GetError() == StorageError::COMPACTED) return StorageError::COMPACTED;
      LOG_FATAL("{} entries [{}, {}) are unavailable from storage", tag_, low, stored_high);
    }
    entries = std::move(stored).GetValue();
    // The size limit was hit inside the stored part.
    if (entries.size() < stored_high - low) return entries;
  }
  if (high > unstable_.offset()) {
    auto unstable = unstable_.Slice(std::max(low, unstable_.offset()), high);
    entries.insert(entries.end(), std::make_move_iterator(unstable.begin()), std::make_move_iterator(unstable.end()));
  }
  LimitSize(&entries, max_size);
  return entries;
}

bool RaftLog::IsUpToDate(const uint64_t last_index, const uint64_t term) const {
  const auto last_term = LastTerm();
  return term > last_term || (term == last_term && last_index >= LastIndex());
}

bool RaftLog::MaybeCommit(const uint64_t max_index, const uint64_t term) {
  if (max_index > committed_ && ZeroTermOnError(Term(max_index)) == term) {
    CommitTo(max_index);
    return true;
  }
  return false;
}

void RaftLog::CommitTo(const uint64_t to_commit) {
  // Never decrease the commit index.
  if (committed_ >= to_commit) return;
  if (LastIndex() < to_commit) {
    throw CorruptedStateException("{} commit index {} is out of range [last index {}], was the log corrupted?", tag_,
                                  to_commit, LastIndex());
  }
  committed_ = to_commit;
}

void RaftLog::AcceptApplying(const uint64_t index) {
  RKV_ASSERT(index <= committed_, "{} applying index {} is past the commit index {}", tag_, index, committed_);
  applying_ = std::max(applying_, index);
}

void RaftLog::AppliedTo(const uint64_t index) {
  if (index == 0) return;
  RKV_ASSERT(committed_ >= index && index >= applied_, "{} applied index {} is out of range [prev applied {}, committed {}]",
             tag_, index, applied_, committed_);
  applied_ = index;
  applying_ = std::max(applying_, index);
}

void RaftLog::Restore(Snapshot snapshot) {
  spdlog::info("{} log starts to restore snapshot [index: {}, term: {}]", tag_, snapshot.metadata.index,
               snapshot.metadata.term);
  committed_ = snapshot.metadata.index;
  unstable_.Restore(std::move(snapshot));
}

}  // namespace rangekv::raft
