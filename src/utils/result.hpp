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

/// @file
#pragma once

#include <optional>

#include "utils/logging.hpp"

namespace rangekv::utils {

/// Holds either a value or an error. Used for expected failures which the
/// caller is supposed to inspect, as opposed to exceptions.
template <class TError, class TValue = void>
class [[nodiscard]] BasicResult final {
 public:
  using ErrorType = TError;
  using ValueType = TValue;
  BasicResult(const TValue &value) : value_(value) {}
  BasicResult(TValue &&value) noexcept : value_(std::move(value)) {}
  BasicResult(const TError &error) : error_(error) {}
  BasicResult(TError &&error) noexcept : error_(std::move(error)) {}

  bool HasValue() const { return value_.has_value(); }
  bool HasError() const { return error_.has_value(); }

  TValue &GetValue() & {
    RKV_ASSERT(value_, "The result is an error!");
    return *value_;
  }

  TValue &&GetValue() && {
    RKV_ASSERT(value_, "The result is an error!");
    return std::move(*value_);
  }

  const TValue &GetValue() const & {
    RKV_ASSERT(value_, "The result is an error!");
    return *value_;
  }

  TValue &operator*() & { return GetValue(); }
  TValue &&operator*() && { return std::move(*this).GetValue(); }
  const TValue &operator*() const & { return GetValue(); }

  TValue *operator->() { return &GetValue(); }
  const TValue *operator->() const { return &GetValue(); }

  TError &GetError() & {
    RKV_ASSERT(error_, "The result is a value!");
    return *error_;
  }

  TError &&GetError() && {
    RKV_ASSERT(error_, "The result is a value!");
    return std::move(*error_);
  }

  const TError &GetError() const & {
    RKV_ASSERT(error_, "The result is a value!");
    return *error_;
  }

 private:
  std::optional<TValue> value_;
  std::optional<TError> error_;
};

template <class TError>
class [[nodiscard]] BasicResult<TError, void> final {
 public:
  using ErrorType = TError;
  using ValueType = void;
  BasicResult() = default;
  BasicResult(const TError &error) : error_(error) {}
  BasicResult(TError &&error) noexcept : error_(std::move(error)) {}

  bool HasError() const { return error_.has_value(); }

  TError &GetError() & {
    RKV_ASSERT(error_, "The result is a value!");
    return *error_;
  }

  TError &&GetError() && {
    RKV_ASSERT(error_, "The result is a value!");
    return std::move(*error_);
  }

  const TError &GetError() const & {
    RKV_ASSERT(error_, "The result is a value!");
    return *error_;
  }

 private:
  std::optional<TError> error_;
};

}  // namespace rangekv::utils
