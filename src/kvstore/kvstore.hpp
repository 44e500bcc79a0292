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

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "utils/exceptions.hpp"

namespace rangekv::kvstore {

class KVStoreError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(KVStoreError)
};

/// Raised by reads when the engine reports an I/O or corruption error. A
/// missing key is never an error.
class KVStoreIOError : public KVStoreError {
 public:
  using KVStoreError::KVStoreError;
  SPECIALIZE_GET_EXCEPTION_NAME(KVStoreIOError)
};

/// Separate key namespaces of the engine. DEFAULT holds raw values and MVCC
/// values, LOCK and WRITE hold the transaction records, RAFT holds consensus
/// logs and all per shard metadata.
enum class ColumnFamily : uint8_t { DEFAULT, LOCK, WRITE, RAFT };

inline constexpr std::array kAllColumnFamilies{ColumnFamily::DEFAULT, ColumnFamily::LOCK, ColumnFamily::WRITE,
                                               ColumnFamily::RAFT};
inline constexpr std::array kDataColumnFamilies{ColumnFamily::DEFAULT, ColumnFamily::LOCK, ColumnFamily::WRITE};

std::string_view ColumnFamilyName(ColumnFamily cf);

struct Options {
  bool create_if_missing{true};
  /// Size of a single memtable.
  uint64_t write_buffer_size{64ULL << 20U};
  int max_background_jobs{4};
};

/**
 * Ordered list of mutations which the store applies atomically.
 */
class WriteBatch {
 public:
  struct Op {
    enum class Type : uint8_t { PUT, DELETE, DELETE_RANGE };
    Type type;
    ColumnFamily cf;
    std::string key;
    /// Value for PUT, exclusive end key for DELETE_RANGE.
    std::string value;
  };

  void Put(ColumnFamily cf, std::string_view key, std::string_view value);
  void Delete(ColumnFamily cf, std::string_view key);
  /// Deletes every key in [begin, end).
  void DeleteRange(ColumnFamily cf, std::string_view begin, std::string_view end);

  /// Appends all operations of `other` after the ones already recorded.
  void Append(const WriteBatch &other);

  bool Empty() const { return ops_.empty(); }
  size_t Count() const { return ops_.size(); }
  size_t DataSize() const { return data_size_; }
  const std::vector<Op> &Ops() const { return ops_; }

  void Clear();

 private:
  std::vector<Op> ops_;
  size_t data_size_{0};
};

class Iterator;

/**
 * Consistent, read-only point in time view of the whole store. It pins the
 * engine state until destroyed.
 */
class Snapshot final {
 public:
  Snapshot(const Snapshot &) = delete;
  Snapshot &operator=(const Snapshot &) = delete;
  Snapshot(Snapshot &&) = delete;
  Snapshot &operator=(Snapshot &&) = delete;
  ~Snapshot();

  /// @throw KVStoreIOError
  std::optional<std::string> Get(ColumnFamily cf, std::string_view key) const;

  /// Iterator restricted to [lower, upper). An empty upper bound means no
  /// upper bound.
  Iterator NewIterator(ColumnFamily cf, std::string_view lower, std::string_view upper) const;

 private:
  friend class KVStore;
  struct impl;
  explicit Snapshot(std::shared_ptr<impl> pimpl);
  std::shared_ptr<impl> pimpl_;
};

/**
 * Bounded iterator over a single column family.
 */
class Iterator final {
 public:
  Iterator(Iterator &&other) noexcept;
  Iterator &operator=(Iterator &&other) noexcept;
  Iterator(const Iterator &) = delete;
  Iterator &operator=(const Iterator &) = delete;
  ~Iterator();

  void SeekToFirst();
  void SeekToLast();
  /// Positions at the first key >= `key`.
  void Seek(std::string_view key);
  /// Positions at the last key <= `key`.
  void SeekForPrev(std::string_view key);
  void Next();
  void Prev();

  /// @throw KVStoreIOError when the underlying iterator hit an error.
  bool Valid() const;

  std::string_view Key() const;
  std::string_view Value() const;

 private:
  friend class KVStore;
  friend class Snapshot;
  struct impl;
  explicit Iterator(std::unique_ptr<impl> pimpl);
  std::unique_ptr<impl> pimpl_;
};

/**
 * Ordered persistent key-value store with column families, atomic batches
 * and consistent snapshots. The underlying implementation guarantees thread
 * safety and durability properties.
 */
class KVStore final {
 public:
  KVStore() = delete;

  /**
   * @param storage Path to a directory where the data is persisted.
   *
   * NOTE: Don't instantiate more instances of a KVStore with the same
   *       storage directory because that will lead to undefined behaviour.
   *
   * @throw KVStoreError if the directory or the engine can't be initialized.
   */
  explicit KVStore(std::filesystem::path storage, Options options = {});

  KVStore(const KVStore &other) = delete;
  KVStore(KVStore &&other) = delete;
  KVStore &operator=(const KVStore &other) = delete;
  KVStore &operator=(KVStore &&other) = delete;

  ~KVStore();

  /**
   * Applies the whole batch atomically.
   *
   * @param sync Whether the write ahead log is fsynced before returning.
   *
   * @return true if the batch has been durably applied. In case of any error
   *         false is returned and nothing from the batch is visible.
   */
  bool Write(const WriteBatch &batch, bool sync = false);

  bool Put(ColumnFamily cf, std::string_view key, std::string_view value, bool sync = false);
  bool Delete(ColumnFamily cf, std::string_view key, bool sync = false);

  /**
   * @return Value for the given key or std::nullopt if it doesn't exist.
   * @throw KVStoreIOError
   */
  std::optional<std::string> Get(ColumnFamily cf, std::string_view key) const;

  std::shared_ptr<const Snapshot> GetSnapshot() const;

  /// Iterator over the latest state restricted to [lower, upper).
  Iterator NewIterator(ColumnFamily cf, std::string_view lower, std::string_view upper) const;

  /**
   * Estimated number of bytes used by the keys in [begin, end), memtables
   * included. An empty end means no upper bound.
   */
  uint64_t ApproximateSize(ColumnFamily cf, std::string_view begin, std::string_view end) const;

  /**
   * Compact the underlying storage for the key range [begin, end). The actual
   * compaction interval might be a superset of it.
   */
  bool CompactRange(ColumnFamily cf, std::string_view begin, std::string_view end);

  bool Flush();

  const std::filesystem::path &Path() const;

 private:
  friend class Snapshot;
  struct impl;
  std::shared_ptr<impl> pimpl_;
};

}  // namespace rangekv::kvstore
