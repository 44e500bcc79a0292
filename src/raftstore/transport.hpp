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

#include "raftstore/message.hpp"

namespace rangekv::raftstore {

/// Delivers envelopes to the node hosting the receiving peer. Snapshot
/// payloads may be sent in chunks, the receiving side reassembles them
/// before handing the envelope to its store.
class Transport {
 public:
  Transport() = default;
  Transport(const Transport &) = delete;
  Transport &operator=(const Transport &) = delete;
  Transport(Transport &&) = delete;
  Transport &operator=(Transport &&) = delete;
  virtual ~Transport() = default;

  /// Returns false when the receiving node can't be reached. Delivery of an
  /// accepted message isn't guaranteed either.
  virtual bool Send(RaftMessage message) = 0;
};

}  // namespace rangekv::raftstore
