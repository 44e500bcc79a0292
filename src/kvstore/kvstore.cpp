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

#include "kvstore/kvstore.hpp"

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

#include "utils/file.hpp"
#include "utils/logging.hpp"

namespace rangekv::kvstore {

std::string_view ColumnFamilyName(const ColumnFamily cf) {
  switch (cf) {
    case ColumnFamily::DEFAULT:
      return rocksdb::kDefaultColumnFamilyName;
    case ColumnFamily::LOCK:
      return "lock";
    case ColumnFamily::WRITE:
      return "write";
    case ColumnFamily::RAFT:
      return "raft";
  }
  LOG_FATAL("Unknown column family {}", static_cast<int>(cf));
}

// WriteBatch

void WriteBatch::Put(ColumnFamily cf, std::string_view key, std::string_view value) {
  data_size_ += key.size() + value.size();
  ops_.push_back(Op{Op::Type::PUT, cf, std::string{key}, std::string{value}});
}

void WriteBatch::Delete(ColumnFamily cf, std::string_view key) {
  data_size_ += key.size();
  ops_.push_back(Op{Op::Type::DELETE, cf, std::string{key}, {}});
}

void WriteBatch::DeleteRange(ColumnFamily cf, std::string_view begin, std::string_view end) {
  data_size_ += begin.size() + end.size();
  ops_.push_back(Op{Op::Type::DELETE_RANGE, cf, std::string{begin}, std::string{end}});
}

void WriteBatch::Append(const WriteBatch &other) {
  ops_.insert(ops_.end(), other.ops_.begin(), other.ops_.end());
  data_size_ += other.data_size_;
}

void WriteBatch::Clear() {
  ops_.clear();
  data_size_ = 0;
}

// KVStore

struct KVStore::impl {
  impl() = default;
  impl(const impl &) = delete;
  impl &operator=(const impl &) = delete;
  impl(impl &&) = delete;
  impl &operator=(impl &&) = delete;

  ~impl() {
    if (db == nullptr) return;
    spdlog::debug("Closing KVStore at {}", storage.string());
    for (auto *handle : handles) {
      logging::CheckRocksDBStatus(db->DestroyColumnFamilyHandle(handle));
    }
    if (!db->SyncWAL().ok()) spdlog::error("KVStore sync failed!");
    if (!db->Close().ok()) spdlog::error("KVStore close failed!");
  }

  rocksdb::ColumnFamilyHandle *Handle(ColumnFamily cf) const { return handles[static_cast<size_t>(cf)]; }

  std::filesystem::path storage;
  std::unique_ptr<rocksdb::DB> db;
  std::vector<rocksdb::ColumnFamilyHandle *> handles;
};

namespace {
std::optional<std::string> GetWithOptions(rocksdb::DB *db, const rocksdb::ReadOptions &options,
                                          rocksdb::ColumnFamilyHandle *handle, std::string_view key) {
  std::string value;
  const auto s = db->Get(options, handle, rocksdb::Slice{key.data(), key.size()}, &value);
  if (s.IsNotFound()) return std::nullopt;
  if (!s.ok()) throw KVStoreIOError("Read failed: {}", s.ToString());
  return value;
}
}  // namespace

KVStore::KVStore(std::filesystem::path storage, Options options) : pimpl_(std::make_shared<impl>()) {
  pimpl_->storage = std::move(storage);
  if (!utils::EnsureDir(pimpl_->storage)) {
    throw KVStoreError("Folder for the key-value store " + pimpl_->storage.string() + " couldn't be initialized!");
  }

  rocksdb::DBOptions db_options;
  db_options.create_if_missing = options.create_if_missing;
  db_options.create_missing_column_families = true;
  db_options.max_background_jobs = options.max_background_jobs;

  rocksdb::ColumnFamilyOptions cf_options;
  cf_options.write_buffer_size = options.write_buffer_size;

  std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
  for (const auto cf : kAllColumnFamilies) {
    descriptors.emplace_back(std::string{ColumnFamilyName(cf)}, cf_options);
  }

  rocksdb::DB *db = nullptr;
  auto s = rocksdb::DB::Open(db_options, pimpl_->storage.string(), descriptors, &pimpl_->handles, &db);
  if (!s.ok()) {
    throw KVStoreError("RocksDB couldn't be initialized inside " + pimpl_->storage.string() + " -- " +
                       std::string(s.ToString()));
  }
  pimpl_->db.reset(db);
}

KVStore::~KVStore() = default;

bool KVStore::Write(const WriteBatch &batch, const bool sync) {
  rocksdb::WriteBatch rocks_batch;
  for (const auto &op : batch.Ops()) {
    auto *handle = pimpl_->Handle(op.cf);
    rocksdb::Status s;
    switch (op.type) {
      case WriteBatch::Op::Type::PUT:
        s = rocks_batch.Put(handle, op.key, op.value);
        break;
      case WriteBatch::Op::Type::DELETE:
        s = rocks_batch.Delete(handle, op.key);
        break;
      case WriteBatch::Op::Type::DELETE_RANGE:
        s = rocks_batch.DeleteRange(handle, op.key, op.value);
        break;
    }
    if (!logging::CheckRocksDBStatus(s)) return false;
  }
  rocksdb::WriteOptions write_options;
  write_options.sync = sync;
  return logging::CheckRocksDBStatus(pimpl_->db->Write(write_options, &rocks_batch));
}

bool KVStore::Put(ColumnFamily cf, std::string_view key, std::string_view value, const bool sync) {
  WriteBatch batch;
  batch.Put(cf, key, value);
  return Write(batch, sync);
}

bool KVStore::Delete(ColumnFamily cf, std::string_view key, const bool sync) {
  WriteBatch batch;
  batch.Delete(cf, key);
  return Write(batch, sync);
}

std::optional<std::string> KVStore::Get(ColumnFamily cf, std::string_view key) const {
  return GetWithOptions(pimpl_->db.get(), rocksdb::ReadOptions{}, pimpl_->Handle(cf), key);
}

uint64_t KVStore::ApproximateSize(ColumnFamily cf, std::string_view begin, std::string_view end) const {
  // An empty end means "up to the last key". The largest possible key is
  // approximated by a run of 0xFF bytes longer than any key we produce.
  const std::string max_key(64, '\xff');
  const std::string_view limit = end.empty() ? std::string_view{max_key} : end;
  rocksdb::Range range{rocksdb::Slice{begin.data(), begin.size()}, rocksdb::Slice{limit.data(), limit.size()}};
  uint64_t size = 0;
  rocksdb::SizeApproximationOptions options;
  options.include_memtables = true;
  options.include_files = true;
  if (!logging::CheckRocksDBStatus(pimpl_->db->GetApproximateSizes(options, pimpl_->Handle(cf), &range, 1, &size))) {
    return 0;
  }
  return size;
}

bool KVStore::CompactRange(ColumnFamily cf, std::string_view begin, std::string_view end) {
  rocksdb::CompactRangeOptions options;
  rocksdb::Slice begin_slice{begin.data(), begin.size()};
  rocksdb::Slice end_slice{end.data(), end.size()};
  auto s = pimpl_->db->CompactRange(options, pimpl_->Handle(cf), &begin_slice, end.empty() ? nullptr : &end_slice);
  return logging::CheckRocksDBStatus(s);
}

bool KVStore::Flush() {
  rocksdb::FlushOptions options;
  options.wait = true;
  return logging::CheckRocksDBStatus(pimpl_->db->Flush(options, pimpl_->handles));
}

const std::filesystem::path &KVStore::Path() const { return pimpl_->storage; }

// Iterator

struct Iterator::impl {
  impl(std::shared_ptr<const void> keep_alive, rocksdb::DB *db, rocksdb::ColumnFamilyHandle *handle,
       const rocksdb::Snapshot *snap, std::string_view lower_bound, std::string_view upper_bound)
      : keep_alive(std::move(keep_alive)), lower(lower_bound), upper(upper_bound), lower_slice(lower),
        upper_slice(upper) {
    rocksdb::ReadOptions options;
    options.snapshot = snap;
    options.iterate_lower_bound = &lower_slice;
    if (!upper.empty()) options.iterate_upper_bound = &upper_slice;
    options.fill_cache = snap == nullptr;
    it.reset(db->NewIterator(options, handle));
  }

  // Keeps the engine (and the snapshot, if any) alive while iterating.
  std::shared_ptr<const void> keep_alive;
  std::string lower;
  std::string upper;
  rocksdb::Slice lower_slice;
  rocksdb::Slice upper_slice;
  std::unique_ptr<rocksdb::Iterator> it;
};

Iterator::Iterator(std::unique_ptr<impl> pimpl) : pimpl_(std::move(pimpl)) {}
Iterator::Iterator(Iterator &&other) noexcept = default;
Iterator &Iterator::operator=(Iterator &&other) noexcept = default;
Iterator::~Iterator() = default;

void Iterator::SeekToFirst() { pimpl_->it->SeekToFirst(); }
void Iterator::SeekToLast() { pimpl_->it->SeekToLast(); }
void Iterator::Seek(std::string_view key) { pimpl_->it->Seek(rocksdb::Slice{key.data(), key.size()}); }
void Iterator::SeekForPrev(std::string_view key) { pimpl_->it->SeekForPrev(rocksdb::Slice{key.data(), key.size()}); }
void Iterator::Next() { pimpl_->it->Next(); }
void Iterator::Prev() { pimpl_->it->Prev(); }

bool Iterator::Valid() const {
  if (pimpl_->it->Valid()) return true;
  const auto s = pimpl_->it->status();
  if (!s.ok()) throw KVStoreIOError("Iteration failed: {}", s.ToString());
  return false;
}

std::string_view Iterator::Key() const {
  const auto key = pimpl_->it->key();
  return {key.data(), key.size()};
}

std::string_view Iterator::Value() const {
  const auto value = pimpl_->it->value();
  return {value.data(), value.size()};
}

Iterator KVStore::NewIterator(ColumnFamily cf, std::string_view lower, std::string_view upper) const {
  return Iterator{
      std::make_unique<Iterator::impl>(pimpl_, pimpl_->db.get(), pimpl_->Handle(cf), nullptr, lower, upper)};
}

// Snapshot

struct Snapshot::impl {
  impl(std::shared_ptr<KVStore::impl> store, const rocksdb::Snapshot *snap) : store(std::move(store)), snap(snap) {}
  impl(const impl &) = delete;
  impl &operator=(const impl &) = delete;
  impl(impl &&) = delete;
  impl &operator=(impl &&) = delete;
  ~impl() { store->db->ReleaseSnapshot(snap); }

  std::shared_ptr<KVStore::impl> store;
  const rocksdb::Snapshot *snap;
};

Snapshot::Snapshot(std::shared_ptr<impl> pimpl) : pimpl_(std::move(pimpl)) {}

Snapshot::~Snapshot() = default;

std::optional<std::string> Snapshot::Get(ColumnFamily cf, std::string_view key) const {
  rocksdb::ReadOptions options;
  options.snapshot = pimpl_->snap;
  return GetWithOptions(pimpl_->store->db.get(), options, pimpl_->store->Handle(cf), key);
}

Iterator Snapshot::NewIterator(ColumnFamily cf, std::string_view lower, std::string_view upper) const {
  return Iterator{std::make_unique<Iterator::impl>(pimpl_, pimpl_->store->db.get(), pimpl_->store->Handle(cf),
                                                   pimpl_->snap, lower, upper)};
}

std::shared_ptr<const Snapshot> KVStore::GetSnapshot() const {
  auto snapshot_impl = std::make_shared<Snapshot::impl>(pimpl_, pimpl_->db->GetSnapshot());
  return std::shared_ptr<const Snapshot>(new Snapshot(std::move(snapshot_impl)));
}

}  // namespace rangekv::kvstore
