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

#include "flags/general.hpp"

#include "utils/flag_validation.hpp"

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(node_id, 1, "Id of this node, unique in the cluster.", FLAG_IN_RANGE(1, UINT64_MAX));
DEFINE_uint64(cluster_id, 1, "Id of the cluster. A data directory only opens in the cluster that created it.");
DEFINE_VALIDATED_string(data_directory, "rangekv_data", "Directory holding the node's store.", FLAG_NOT_EMPTY());
DEFINE_VALIDATED_string(listen_address, "127.0.0.1:20160", "host:port serving peer and client traffic.",
                        FLAG_NOT_EMPTY());
DEFINE_string(advertise_address, "", "Address other nodes and clients use to reach this node.");
DEFINE_VALIDATED_uint32(io_threads, 2, "Threads handling network traffic.", FLAG_IN_RANGE(1, 64));
DEFINE_VALIDATED_uint32(request_threads, 4, "Threads waiting on client requests.", FLAG_IN_RANGE(1, 1024));
DEFINE_VALIDATED_uint64(request_timeout_ms, 5000, "How long a client request may wait for its result.",
                        FLAG_IN_RANGE(10, 600000));
DEFINE_VALIDATED_uint32(nodes, 1,
                        "Nodes started in this process with an embedded placement service. Node i listens on the "
                        "listen_address port + i and keeps its data under data_directory/node_<id>.",
                        FLAG_IN_RANGE(1, 64));
DEFINE_VALIDATED_uint32(replicas, 3, "Voters the first shard gets when several nodes run.", FLAG_IN_RANGE(1, 64));
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)
