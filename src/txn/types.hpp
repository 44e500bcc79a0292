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
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "common/errors.hpp"
#include "slk/serialization.hpp"

namespace rangekv::txn {

using TimeStamp = uint64_t;

inline constexpr TimeStamp kMaxTimeStamp = std::numeric_limits<uint64_t>::max();

/// Timestamps are hybrid: the physical time in milliseconds shifted left by
/// kLogicalBits, plus a logical counter.
inline constexpr uint64_t kLogicalBits = 18;

constexpr TimeStamp ComposeTs(const uint64_t physical_ms, const uint64_t logical) {
  return (physical_ms << kLogicalBits) | logical;
}

constexpr uint64_t ExtractPhysical(const TimeStamp ts) { return ts >> kLogicalBits; }

/// Values up to this size are stored inside the lock and write records.
inline constexpr size_t kShortValueMaxLen = 64;

using common::LockInfo;
using common::LockType;

/// Lock record, at most one per key.
struct Lock {
  LockType type{LockType::PUT};
  std::string primary;
  TimeStamp start_ts{0};
  /// Milliseconds, relative to the physical part of start_ts.
  uint64_t ttl{0};
  std::optional<std::string> short_value;

  LockInfo ToLockInfo(std::string key) const {
    return LockInfo{.key = std::move(key), .primary = primary, .start_ts = start_ts, .ttl = ttl, .type = type};
  }

  friend bool operator==(const Lock &lhs, const Lock &rhs) = default;
};

enum class WriteType : uint8_t { PUT, DELETE, LOCK, ROLLBACK };

std::string_view WriteTypeToString(WriteType type);

/// Write record, keyed by (key, commit_ts). A rollback is recorded at
/// commit_ts == start_ts.
struct Write {
  WriteType type{WriteType::PUT};
  TimeStamp start_ts{0};
  std::optional<std::string> short_value;

  friend bool operator==(const Write &lhs, const Write &rhs) = default;
};

WriteType WriteTypeFromLockType(LockType type);

/// Compact record encodings stored in the `lock` and `write` column families.
/// @throw utils::CodecException on malformed input.
std::string EncodeLock(const Lock &lock);
Lock DecodeLock(std::string_view data);
std::string EncodeWrite(const Write &write);
Write DecodeWrite(std::string_view data);

enum class MutationOp : uint8_t { PUT, DELETE, LOCK };

struct Mutation {
  MutationOp op{MutationOp::PUT};
  std::string key;
  std::string value;

  friend bool operator==(const Mutation &lhs, const Mutation &rhs) = default;
};

struct KvPair {
  std::string key;
  std::string value;

  friend bool operator==(const KvPair &lhs, const KvPair &rhs) = default;
};

/// Outcome of checking a transaction through its primary key.
struct TxnStatus {
  enum class Kind : uint8_t { LOCKED, COMMITTED, ROLLED_BACK };
  Kind kind{Kind::LOCKED};
  /// Remaining lock TTL when the transaction is still running.
  uint64_t lock_ttl{0};
  TimeStamp commit_ts{0};

  static TxnStatus Locked(uint64_t ttl) { return TxnStatus{.kind = Kind::LOCKED, .lock_ttl = ttl}; }
  static TxnStatus Committed(TimeStamp commit_ts) {
    return TxnStatus{.kind = Kind::COMMITTED, .commit_ts = commit_ts};
  }
  static TxnStatus RolledBack() { return TxnStatus{.kind = Kind::ROLLED_BACK}; }

  friend bool operator==(const TxnStatus &lhs, const TxnStatus &rhs) = default;

  friend std::ostream &operator<<(std::ostream &in, const TxnStatus &status);
};

using slk::Load;
using slk::Save;

void Save(const Mutation &obj, slk::Builder *builder);
void Load(Mutation *obj, slk::Reader *reader);
void Save(const KvPair &obj, slk::Builder *builder);
void Load(KvPair *obj, slk::Reader *reader);
void Save(const TxnStatus &obj, slk::Builder *builder);
void Load(TxnStatus *obj, slk::Reader *reader);

}  // namespace rangekv::txn
