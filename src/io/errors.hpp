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

namespace rangekv::io {

class NetworkException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(NetworkException)
};

/// The bytes read from a connection don't form a valid frame. The connection
/// can't be trusted afterwards and is closed.
class FrameCorruptException final : public NetworkException {
 public:
  using NetworkException::NetworkException;
  SPECIALIZE_GET_EXCEPTION_NAME(FrameCorruptException)
};

class InvalidAddressException final : public NetworkException {
 public:
  using NetworkException::NetworkException;
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidAddressException)
};

}  // namespace rangekv::io
