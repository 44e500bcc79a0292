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

/**
 * @file
 *
 * Filesystem helpers which report failures through return values instead of
 * exceptions.
 */
#pragma once

#include <filesystem>

namespace rangekv::utils {

/// Ensures that the given directory exists after this call. If the directory
/// didn't exist prior to the call it is created, if it existed prior to the
/// call it is left as is.
bool EnsureDir(const std::filesystem::path &dir) noexcept;

/// Calls `EnsureDir` and terminates the program if the call failed.
void EnsureDirOrDie(const std::filesystem::path &dir);

bool DirExists(const std::filesystem::path &dir);

/// Deletes everything from the given directory including the directory.
bool DeleteDir(const std::filesystem::path &dir) noexcept;

}  // namespace rangekv::utils
