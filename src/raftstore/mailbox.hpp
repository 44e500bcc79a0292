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

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include "utils/thread_pool.hpp"

namespace rangekv::raftstore {

enum class SendResult : uint8_t { OK, FULL, CLOSED, NOT_FOUND };

constexpr std::string_view SendResultToString(const SendResult result) {
  switch (result) {
    case SendResult::OK:
      return "OK";
    case SendResult::FULL:
      return "FULL";
    case SendResult::CLOSED:
      return "CLOSED";
    case SendResult::NOT_FOUND:
      return "NOT_FOUND";
  }
  return "UNKNOWN";
}

/**
 * Bounded message queue of one state machine. The `scheduled` flag makes
 * sure at most one pool thread runs the state machine at any time.
 */
template <typename TMsg>
class Mailbox {
 public:
  explicit Mailbox(size_t capacity) : capacity_(capacity) {}

  /// Moves from `msg` only when the message is accepted. Forced messages
  /// ignore the capacity, they are used for internal traffic which must not
  /// be lost.
  SendResult Send(TMsg &&msg, bool force) {
    std::lock_guard guard(lock_);
    if (closed_) return SendResult::CLOSED;
    if (!force && queue_.size() >= capacity_) return SendResult::FULL;
    queue_.push_back(std::move(msg));
    return SendResult::OK;
  }

  /// Returns true when the caller has to schedule a run.
  bool TrySchedule() {
    std::lock_guard guard(lock_);
    if (scheduled_ || queue_.empty() || closed_) return false;
    scheduled_ = true;
    return true;
  }

  std::vector<TMsg> Drain(size_t max) {
    std::lock_guard guard(lock_);
    std::vector<TMsg> batch;
    const auto count = std::min(max, queue_.size());
    batch.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      batch.push_back(std::move(queue_.front()));
      queue_.pop_front();
    }
    return batch;
  }

  /// Called at the end of a run. Returns true when the state machine has to
  /// run again, in which case it stays scheduled.
  bool FinishRun() {
    std::lock_guard guard(lock_);
    if (!closed_ && !queue_.empty()) return true;
    scheduled_ = false;
    idle_cv_.notify_all();
    return false;
  }

  /// Rejects further messages. Runs in progress are not interrupted.
  void Close() {
    std::lock_guard guard(lock_);
    closed_ = true;
  }

  /// Blocks until no run is in progress.
  void WaitIdle() {
    std::unique_lock guard(lock_);
    idle_cv_.wait(guard, [this] { return !scheduled_; });
  }

  /// Everything still queued, used to fail pending requests after Close.
  std::vector<TMsg> TakeAll() {
    std::lock_guard guard(lock_);
    std::vector<TMsg> rest;
    rest.reserve(queue_.size());
    for (auto &msg : queue_) rest.push_back(std::move(msg));
    queue_.clear();
    return rest;
  }

  size_t Size() const {
    std::lock_guard guard(lock_);
    return queue_.size();
  }

  bool IsClosed() const {
    std::lock_guard guard(lock_);
    return closed_;
  }

 private:
  size_t capacity_;
  mutable std::mutex lock_;
  std::condition_variable idle_cv_;
  std::deque<TMsg> queue_;
  bool scheduled_{false};
  bool closed_{false};
};

/**
 * A state machine together with its mailbox. `TFsm` has to provide
 * `void Handle(std::vector<TMsg> &msgs)`.
 */
template <typename TMsg, typename TFsm>
class FsmHandle : public std::enable_shared_from_this<FsmHandle<TMsg, TFsm>> {
 public:
  FsmHandle(std::unique_ptr<TFsm> fsm, utils::ThreadPool *pool, size_t capacity, size_t batch_size)
      : mailbox_(capacity), fsm_(std::move(fsm)), pool_(pool), batch_size_(batch_size) {}

  SendResult Send(TMsg &&msg, bool force) {
    const auto result = mailbox_.Send(std::move(msg), force);
    if (result == SendResult::OK && mailbox_.TrySchedule()) Schedule();
    return result;
  }

  /// Closes the mailbox and waits for the run in progress. Returns the
  /// messages which were never handled.
  std::vector<TMsg> Shutdown() {
    mailbox_.Close();
    mailbox_.WaitIdle();
    return mailbox_.TakeAll();
  }

  TFsm &fsm() { return *fsm_; }
  Mailbox<TMsg> &mailbox() { return mailbox_; }

 private:
  void Schedule() {
    if (!pool_->AddTask([self = this->shared_from_this()] { self->Run(); })) {
      // The pool is stopping, nothing will run the state machine anymore.
      mailbox_.Close();
      (void)mailbox_.FinishRun();
    }
  }

  void Run() {
    auto batch = mailbox_.Drain(batch_size_);
    if (!batch.empty()) fsm_->Handle(batch);
    if (mailbox_.FinishRun()) Schedule();
  }

  Mailbox<TMsg> mailbox_;
  std::unique_ptr<TFsm> fsm_;
  utils::ThreadPool *pool_;
  size_t batch_size_;
};

}  // namespace rangekv::raftstore
