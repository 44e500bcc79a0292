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

#include "utils/exceptions.hpp"

namespace rangekv::raft {

/// Base class for errors raised by the consensus core. These indicate a
/// misuse of the core by its host, never a message from a remote peer.
class RaftException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(RaftException)
};

/// Thrown when the consensus core is constructed with invalid parameters.
class RaftConfigException final : public RaftException {
 public:
  using RaftException::RaftException;
  SPECIALIZE_GET_EXCEPTION_NAME(RaftConfigException)
};

/// Thrown when the persisted state the core starts from is inconsistent,
/// e.g. the commit index points past the end of the log.
class CorruptedStateException final : public RaftException {
 public:
  using RaftException::RaftException;
  SPECIALIZE_GET_EXCEPTION_NAME(CorruptedStateException)
};

}  // namespace rangekv::raft
