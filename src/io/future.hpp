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

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "utils/logging.hpp"

namespace rangekv::io {

namespace detail {
template <typename T>
class Shared {
  std::condition_variable cv_;
  std::mutex mu_;
  std::optional<T> item_;
  std::function<void()> on_fill_;
  bool consumed_ = false;
  bool waiting_ = false;

 public:
  Shared() = default;
  Shared(Shared &&) = delete;
  Shared &operator=(Shared &&) = delete;
  Shared(const Shared &) = delete;
  Shared &operator=(const Shared &) = delete;
  ~Shared() = default;

  T Wait() {
    std::unique_lock<std::mutex> lock(mu_);
    waiting_ = true;
    cv_.wait(lock, [this] { return item_.has_value(); });
    return Consume();
  }

  std::optional<T> WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    waiting_ = true;
    if (!cv_.wait_for(lock, timeout, [this] { return item_.has_value(); })) {
      waiting_ = false;
      return std::nullopt;
    }
    return Consume();
  }

  bool IsReady() {
    std::unique_lock<std::mutex> lock(mu_);
    return item_.has_value();
  }

  std::optional<T> TryGet() {
    std::unique_lock<std::mutex> lock(mu_);
    if (!item_) return std::nullopt;
    return Consume();
  }

  void Fill(T item) {
    std::function<void()> on_fill;
    {
      std::unique_lock<std::mutex> lock(mu_);

      RKV_ASSERT(!item_, "Promise filled twice!");
      // A consumer which gave up waiting leaves the item unclaimed.
      item_.emplace(std::move(item));
      on_fill = std::move(on_fill_);
    }  // lock released before condition variable notification

    cv_.notify_all();
    if (on_fill) on_fill();
  }

  /// Registers a callback which runs on the filling thread. Runs right away
  /// when the item is already there.
  void OnFill(std::function<void()> callback) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      if (!item_) {
        on_fill_ = std::move(callback);
        return;
      }
    }
    callback();
  }

  bool IsAwaited() {
    std::unique_lock<std::mutex> lock(mu_);
    return waiting_;
  }

 private:
  // Must be called with the lock held.
  T Consume() {
    RKV_ASSERT(!consumed_, "Future consumed twice!");
    T ret = std::move(item_).value();
    item_.reset();
    waiting_ = false;
    consumed_ = true;
    return ret;
  }
};
}  // namespace detail

template <typename T>
class Future {
  bool consumed_or_moved_ = false;
  std::shared_ptr<detail::Shared<T>> shared_;

 public:
  explicit Future(std::shared_ptr<detail::Shared<T>> shared) : shared_(std::move(shared)) {}

  Future() = delete;
  Future(Future &&old) noexcept : consumed_or_moved_(old.consumed_or_moved_), shared_(std::move(old.shared_)) {
    old.consumed_or_moved_ = true;
  }
  Future &operator=(Future &&old) noexcept {
    shared_ = std::move(old.shared_);
    consumed_or_moved_ = old.consumed_or_moved_;
    old.consumed_or_moved_ = true;
    return *this;
  }
  Future(const Future &) = delete;
  Future &operator=(const Future &) = delete;
  ~Future() = default;

  bool IsReady() {
    RKV_ASSERT(!consumed_or_moved_, "Called IsReady after Future already consumed!");
    return shared_->IsReady();
  }

  /// Non-blocking method that returns the inner item if it's already ready,
  /// or std::nullopt if it is not ready yet.
  std::optional<T> TryGet() {
    RKV_ASSERT(!consumed_or_moved_, "Called TryGet after Future already consumed!");
    std::optional<T> ret = shared_->TryGet();
    if (ret) consumed_or_moved_ = true;
    return ret;
  }

  /// Block on the corresponding promise to be filled, returning the inner
  /// item when ready.
  T Wait() {
    RKV_ASSERT(!consumed_or_moved_, "Future should only be consumed with Wait once!");
    T ret = shared_->Wait();
    consumed_or_moved_ = true;
    return ret;
  }

  /// Like Wait, but gives up after `timeout`. The future stays usable after a
  /// timeout.
  std::optional<T> WaitFor(std::chrono::milliseconds timeout) {
    RKV_ASSERT(!consumed_or_moved_, "Future should only be consumed with WaitFor once!");
    auto ret = shared_->WaitFor(timeout);
    if (ret) consumed_or_moved_ = true;
    return ret;
  }

  /// Runs `callback` once the promise is filled. Consume the value with
  /// TryGet from inside the callback.
  void OnReady(std::function<void()> callback) {
    RKV_ASSERT(!consumed_or_moved_, "Called OnReady after Future already consumed!");
    shared_->OnFill(std::move(callback));
  }
};

template <typename T>
class Promise {
  std::shared_ptr<detail::Shared<T>> shared_;
  bool filled_or_moved_ = false;

 public:
  explicit Promise(std::shared_ptr<detail::Shared<T>> shared) : shared_(std::move(shared)) {}

  Promise() = delete;
  Promise(Promise &&old) noexcept : shared_(std::move(old.shared_)), filled_or_moved_(old.filled_or_moved_) {
    old.filled_or_moved_ = true;
  }
  Promise &operator=(Promise &&old) noexcept {
    RKV_ASSERT(filled_or_moved_, "Promise overwritten before its associated Future was filled!");
    shared_ = std::move(old.shared_);
    filled_or_moved_ = old.filled_or_moved_;
    old.filled_or_moved_ = true;
    return *this;
  }
  Promise(const Promise &) = delete;
  Promise &operator=(const Promise &) = delete;

  ~Promise() { RKV_ASSERT(filled_or_moved_, "Promise destroyed before its associated Future was filled!"); }

  // Fill the expected item into the Future.
  void Fill(T item) {
    RKV_ASSERT(!filled_or_moved_, "Promise::Fill called on a promise that is already filled or moved!");
    shared_->Fill(std::move(item));
    filled_or_moved_ = true;
  }

  bool IsFilled() const { return filled_or_moved_; }

  bool IsAwaited() { return shared_->IsAwaited(); }
};

template <typename T>
std::pair<Future<T>, Promise<T>> FuturePromisePair() {
  auto shared = std::make_shared<detail::Shared<T>>();

  Future<T> future = Future<T>(shared);
  Promise<T> promise = Promise<T>(shared);

  return std::make_pair(std::move(future), std::move(promise));
}

}  // namespace rangekv::io
