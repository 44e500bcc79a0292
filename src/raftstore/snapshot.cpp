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


#include "raftstore/snapshot.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "common/keys.hpp"
#include "utils/crc.hpp"
#include "utils/codec.hpp"
#include "utils/logging.hpp"

namespace rangekv::raftstore {

namespace {

void UpdateWithLength(utils::Crc32Builder *crc, std::string_view bytes) {
  std::string size;
  utils::EncodeU64(bytes.size(), &size);
  crc->Update(size);
  crc->Update(bytes);
}

}  // namespace

uint32_t SnapshotChecksum(const std::vector<SnapshotCfData> &cfs) {
  utils::Crc32Builder crc;
  for (const auto &cf : cfs) {
    const auto cf_id = static_cast<char>(cf.cf);
    crc.Update({&cf_id, 1});
    for (const auto &[key, value] : cf.pairs) {
      UpdateWithLength(&crc, key);
      UpdateWithLength(&crc, value);
    }
  }
  return crc.Checksum();
}

raft::Snapshot BuildSnapshot(const kvstore::Snapshot &view, const ShardId shard_id) {
  auto local_state = LoadShardState(view, shard_id);
  if (!local_state || local_state->state == common::PeerState::TOMBSTONE) {
    throw SnapshotException("Shard {} has no state to build a snapshot from", shard_id);
  }
  auto apply_state = LoadApplyState(view, shard_id);
  if (!apply_state) throw SnapshotException("Shard {} has no apply state", shard_id);

  SnapshotData data;
  data.meta = local_state->meta;
  data.index = apply_state->applied_index;
  data.term = apply_state->applied_term;

  const auto start = common::keys::ShardDataStart(data.meta);
  const auto end = common::keys::ShardDataEnd(data.meta);
  size_t total_keys = 0;
  for (const auto cf : kvstore::kDataColumnFamilies) {
    SnapshotCfData cf_data{.cf = cf, .pairs = {}};
    auto it = view.NewIterator(cf, start, end);
    for (it.SeekToFirst(); it.Valid(); it.Next()) {
      cf_data.pairs.emplace_back(std::string(it.Key()), std::string(it.Value()));
    }
    total_keys += cf_data.pairs.size();
    data.cfs.push_back(std::move(cf_data));
  }
  data.checksum = SnapshotChecksum(data.cfs);

  spdlog::info("Built snapshot of shard {} at index {} term {} with {} keys", shard_id, data.index, data.term,
               total_keys);

  raft::Snapshot snapshot;
  snapshot.metadata = raft::SnapshotMetadata{
      .conf_state = std::move(apply_state->conf_state), .index = data.index, .term = data.term};
  snapshot.data = slk::SaveToString(data);
  return snapshot;
}

utils::BasicResult<common::SnapshotCorrupt, SnapshotData> DecodeSnapshot(const raft::Snapshot &snapshot,
                                                                          const ShardId shard_id) {
  SnapshotData data;
  try {
    slk::LoadFromString(snapshot.data, &data);
  } catch (const utils::BasicException &e) {
    return common::SnapshotCorrupt{fmt::format("Undecodable snapshot payload: {}", e.what())};
  }

  if (data.version != kSnapshotFormatVersion) {
    return common::SnapshotCorrupt{fmt::format("Unsupported snapshot version {}", data.version)};
  }
  if (data.meta.id != shard_id) {
    return common::SnapshotCorrupt{fmt::format("Snapshot of shard {} sent to shard {}", data.meta.id, shard_id)};
  }
  if (data.index != snapshot.metadata.index || data.term != snapshot.metadata.term) {
    return common::SnapshotCorrupt{fmt::format("Snapshot payload at {}/{} doesn't match metadata at {}/{}",
                                               data.index, data.term, snapshot.metadata.index,
                                               snapshot.metadata.term)};
  }
  if (SnapshotChecksum(data.cfs) != data.checksum) {
    return common::SnapshotCorrupt{fmt::format("Checksum mismatch in snapshot of shard {}", shard_id)};
  }

  const auto start = common::keys::ShardDataStart(data.meta);
  const auto end = common::keys::ShardDataEnd(data.meta);
  for (const auto &cf : data.cfs) {
    if (std::find(kvstore::kDataColumnFamilies.begin(), kvstore::kDataColumnFamilies.end(), cf.cf) ==
        kvstore::kDataColumnFamilies.end()) {
      return common::SnapshotCorrupt{fmt::format("Unexpected column family {}", kvstore::ColumnFamilyName(cf.cf))};
    }
    for (const auto &[key, value] : cf.pairs) {
      if (key < start || key >= end) {
        return common::SnapshotCorrupt{fmt::format("Key {} is outside of shard {}", logging::Escape(key), shard_id)};
      }
    }
  }
  return data;
}

SnapshotApplied ApplySnapshotToBatch(const SnapshotData &data, const raft::Snapshot &snapshot,
                                     const raft::HardState &hard_state, kvstore::WriteBatch *batch) {
  const auto &meta = data.meta;
  const auto start = common::keys::ShardDataStart(meta);
  const auto end = common::keys::ShardDataEnd(meta);
  for (const auto cf : kvstore::kDataColumnFamilies) {
    batch->DeleteRange(cf, start, end);
  }
  for (const auto &cf : data.cfs) {
    for (const auto &[key, value] : cf.pairs) {
      batch->Put(cf.cf, key, value);
    }
  }

  SnapshotApplied applied;
  applied.success = true;
  applied.raft_state.hard_state = hard_state;
  applied.raft_state.hard_state.commit = std::max(hard_state.commit, data.index);
  applied.raft_state.last_index = data.index;
  applied.apply_state = ApplyState{.applied_index = data.index,
                                   .applied_term = data.term,
                                   .truncated_index = data.index,
                                   .truncated_term = data.term,
                                   .conf_state = snapshot.metadata.conf_state};
  applied.shard_state = common::ShardLocalState{.state = common::PeerState::NORMAL, .meta = meta};

  ClearRaftState(batch, meta.id);
  WriteRaftState(batch, meta.id, applied.raft_state);
  WriteApplyState(batch, meta.id, applied.apply_state);
  WriteShardState(batch, applied.shard_state);
  return applied;
}

std::vector<SnapshotChunk> SplitSnapshotMessage(const RaftMessage &message, const size_t chunk_size) {
  const auto &install = std::get<raft::InstallSnapshot>(message.message.payload);
  const std::string_view data = install.snapshot.data;

  RaftMessage header = message;
  std::get<raft::InstallSnapshot>(header.message.payload).snapshot.data.clear();

  const size_t step = chunk_size == 0 ? std::max<size_t>(data.size(), 1) : chunk_size;
  const auto total = static_cast<uint32_t>(std::max<size_t>((data.size() + step - 1) / step, 1));

  std::vector<SnapshotChunk> chunks;
  chunks.reserve(total);
  for (uint32_t seq = 0; seq < total; ++seq) {
    SnapshotChunk chunk;
    chunk.shard_id = message.shard_id;
    chunk.to_peer_id = message.to_peer.id;
    chunk.snapshot_index = install.snapshot.metadata.index;
    chunk.snapshot_term = install.snapshot.metadata.term;
    chunk.seq = seq;
    chunk.total = total;
    const auto offset = static_cast<size_t>(seq) * step;
    if (offset < data.size()) chunk.data = std::string(data.substr(offset, step));
    if (seq == 0) chunk.header = header;
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

std::optional<RaftMessage> SnapshotAssembler::Add(SnapshotChunk chunk) {
  if (chunk.total == 0 || chunk.seq >= chunk.total) {
    spdlog::warn("Dropping malformed snapshot chunk {}/{} of shard {}", chunk.seq, chunk.total, chunk.shard_id);
    return std::nullopt;
  }

  const auto key = std::make_pair(chunk.shard_id, chunk.to_peer_id);
  auto &pending = pending_[key];
  if (pending.chunks.size() != chunk.total || pending.snapshot_index != chunk.snapshot_index ||
      pending.snapshot_term != chunk.snapshot_term) {
    if (!pending.chunks.empty()) {
      spdlog::info("Discarding incomplete snapshot {}/{} of shard {}", pending.snapshot_index, pending.snapshot_term,
                   chunk.shard_id);
    }
    pending = Pending{.snapshot_index = chunk.snapshot_index,
                      .snapshot_term = chunk.snapshot_term,
                      .header = std::nullopt,
                      .chunks = std::vector<std::optional<std::string>>(chunk.total),
                      .received = 0};
  }

  if (chunk.header) pending.header = std::move(chunk.header);
  if (!pending.chunks[chunk.seq]) {
    pending.chunks[chunk.seq] = std::move(chunk.data);
    ++pending.received;
  }
  if (pending.received != chunk.total || !pending.header) return std::nullopt;

  RaftMessage message = std::move(*pending.header);
  auto &data = std::get<raft::InstallSnapshot>(message.message.payload).snapshot.data;
  for (auto &piece : pending.chunks) data.append(*piece);
  pending_.erase(key);
  return message;
}

void Save(const SnapshotCfData &obj, slk::Builder *builder) {
  Save(obj.cf, builder);
  Save(obj.pairs, builder);
}

void Load(SnapshotCfData *obj, slk::Reader *reader) {
  Load(&obj->cf, reader);
  Load(&obj->pairs, reader);
}

void Save(const SnapshotData &obj, slk::Builder *builder) {
  Save(obj.version, builder);
  Save(obj.meta, builder);
  Save(obj.index, builder);
  Save(obj.term, builder);
  Save(obj.cfs, builder);
  Save(obj.checksum, builder);
}

void Load(SnapshotData *obj, slk::Reader *reader) {
  Load(&obj->version, reader);
  Load(&obj->meta, reader);
  Load(&obj->index, reader);
  Load(&obj->term, reader);
  Load(&obj->cfs, reader);
  Load(&obj->checksum, reader);
}

}  // namespace rangekv::raftstore
