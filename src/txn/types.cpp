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

#include "txn/types.hpp"

#include "utils/codec.hpp"

namespace rangekv::txn {

namespace {

constexpr char kFlagPut = 'P';
constexpr char kFlagDelete = 'D';
constexpr char kFlagLock = 'L';
constexpr char kFlagRollback = 'R';
constexpr char kShortValuePrefix = 'v';

void EncodeShortValue(const std::optional<std::string> &value, std::string *out) {
  if (!value) return;
  out->push_back(kShortValuePrefix);
  out->push_back(static_cast<char>(value->size()));
  out->append(*value);
}

// Parses the optional trailing fields. Unknown prefixes are rejected.
std::optional<std::string> DecodeShortValue(std::string_view *input) {
  if (input->empty()) return std::nullopt;
  if (input->front() != kShortValuePrefix) {
    throw utils::CodecException("Unknown record field prefix {}", static_cast<int>(input->front()));
  }
  input->remove_prefix(1);
  if (input->empty()) throw utils::CodecException("Short value length is missing");
  const auto len = static_cast<uint8_t>(input->front());
  input->remove_prefix(1);
  if (input->size() < len) throw utils::CodecException("Short value is truncated");
  std::string value(input->substr(0, len));
  input->remove_prefix(len);
  if (!input->empty()) throw utils::CodecException("Trailing bytes after record");
  return value;
}

}  // namespace

std::string_view WriteTypeToString(const WriteType type) {
  switch (type) {
    case WriteType::PUT:
      return "PUT";
    case WriteType::DELETE:
      return "DELETE";
    case WriteType::LOCK:
      return "LOCK";
    case WriteType::ROLLBACK:
      return "ROLLBACK";
  }
  return "UNKNOWN";
}

WriteType WriteTypeFromLockType(const LockType type) {
  switch (type) {
    case LockType::PUT:
      return WriteType::PUT;
    case LockType::DELETE:
      return WriteType::DELETE;
    case LockType::LOCK:
      return WriteType::LOCK;
  }
  return WriteType::LOCK;
}

std::string EncodeLock(const Lock &lock) {
  std::string out;
  switch (lock.type) {
    case LockType::PUT:
      out.push_back(kFlagPut);
      break;
    case LockType::DELETE:
      out.push_back(kFlagDelete);
      break;
    case LockType::LOCK:
      out.push_back(kFlagLock);
      break;
  }
  utils::EncodeCompactBytes(lock.primary, &out);
  utils::EncodeVarU64(lock.start_ts, &out);
  utils::EncodeVarU64(lock.ttl, &out);
  EncodeShortValue(lock.short_value, &out);
  return out;
}

Lock DecodeLock(std::string_view data) {
  if (data.empty()) throw utils::CodecException("Empty lock record");
  Lock lock;
  switch (data.front()) {
    case kFlagPut:
      lock.type = LockType::PUT;
      break;
    case kFlagDelete:
      lock.type = LockType::DELETE;
      break;
    case kFlagLock:
      lock.type = LockType::LOCK;
      break;
    default:
      throw utils::CodecException("Invalid lock type flag {}", static_cast<int>(data.front()));
  }
  data.remove_prefix(1);
  lock.primary = utils::DecodeCompactBytes(&data);
  lock.start_ts = utils::DecodeVarU64(&data);
  lock.ttl = utils::DecodeVarU64(&data);
  lock.short_value = DecodeShortValue(&data);
  return lock;
}

std::string EncodeWrite(const Write &write) {
  std::string out;
  switch (write.type) {
    case WriteType::PUT:
      out.push_back(kFlagPut);
      break;
    case WriteType::DELETE:
      out.push_back(kFlagDelete);
      break;
    case WriteType::LOCK:
      out.push_back(kFlagLock);
      break;
    case WriteType::ROLLBACK:
      out.push_back(kFlagRollback);
      break;
  }
  utils::EncodeVarU64(write.start_ts, &out);
  EncodeShortValue(write.short_value, &out);
  return out;
}

Write DecodeWrite(std::string_view data) {
  if (data.empty()) throw utils::CodecException("Empty write record");
  Write write;
  switch (data.front()) {
    case kFlagPut:
      write.type = WriteType::PUT;
      break;
    case kFlagDelete:
      write.type = WriteType::DELETE;
      break;
    case kFlagLock:
      write.type = WriteType::LOCK;
      break;
    case kFlagRollback:
      write.type = WriteType::ROLLBACK;
      break;
    default:
      throw utils::CodecException("Invalid write type flag {}", static_cast<int>(data.front()));
  }
  data.remove_prefix(1);
  write.start_ts = utils::DecodeVarU64(&data);
  write.short_value = DecodeShortValue(&data);
  return write;
}

std::ostream &operator<<(std::ostream &in, const TxnStatus &status) {
  switch (status.kind) {
    case TxnStatus::Kind::LOCKED:
      in << "TxnStatus { LOCKED, ttl: " << status.lock_ttl << " }";
      break;
    case TxnStatus::Kind::COMMITTED:
      in << "TxnStatus { COMMITTED, commit_ts: " << status.commit_ts << " }";
      break;
    case TxnStatus::Kind::ROLLED_BACK:
      in << "TxnStatus { ROLLED_BACK }";
      break;
  }
  return in;
}

void Save(const Mutation &obj, slk::Builder *builder) {
  Save(obj.op, builder);
  Save(obj.key, builder);
  Save(obj.value, builder);
}

void Load(Mutation *obj, slk::Reader *reader) {
  Load(&obj->op, reader);
  Load(&obj->key, reader);
  Load(&obj->value, reader);
}

void Save(const KvPair &obj, slk::Builder *builder) {
  Save(obj.key, builder);
  Save(obj.value, builder);
}

void Load(KvPair *obj, slk::Reader *reader) {
  Load(&obj->key, reader);
  Load(&obj->value, reader);
}

void Save(const TxnStatus &obj, slk::Builder *builder) {
  Save(obj.kind, builder);
  Save(obj.lock_ttl, builder);
  Save(obj.commit_ts, builder);
}

void Load(TxnStatus *obj, slk::Reader *reader) {
  Load(&obj->kind, reader);
  Load(&obj->lock_ttl, reader);
  Load(&obj->commit_ts, reader);
}

}  // namespace rangekv::txn
