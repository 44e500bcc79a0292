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

#include "gflags/gflags.h"

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_uint64(node_id);
DECLARE_uint64(cluster_id);
DECLARE_string(data_directory);
DECLARE_string(listen_address);
DECLARE_string(advertise_address);
DECLARE_uint32(io_threads);
DECLARE_uint32(request_threads);
DECLARE_uint64(request_timeout_ms);
DECLARE_uint32(nodes);
DECLARE_uint32(replicas);
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)
