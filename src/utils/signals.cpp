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


#include "utils/signals.hpp"

#include <chrono>
#include <thread>

namespace rangekv::utils {

namespace {
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t shutdown_requested = 0;

bool Install(int signal_number, void (*handler)(int), const sigset_t &signal_mask, int flags) {
  struct sigaction action {};
  // `sa_sigaction` and `sa_handler` can share storage.
  action.sa_sigaction = nullptr;
  action.sa_handler = handler;
  action.sa_mask = signal_mask;
  action.sa_flags = flags;
  return sigaction(signal_number, &action, nullptr) == 0;
}
}  // namespace

bool SignalIgnore(const Signal signal) {
  sigset_t empty;
  sigemptyset(&empty);
  return Install(static_cast<int>(signal), SIG_IGN, empty, 0);
}

std::map<int, std::function<void()>> SignalHandler::handlers_ = {};

void SignalHandler::Handle(int signal) {
  auto found = handlers_.find(signal);
  if (found != handlers_.end() && found->second) found->second();
}

bool SignalHandler::RegisterHandler(Signal signal, std::function<void()> func) {
  sigset_t signal_mask;
  sigemptyset(&signal_mask);
  return RegisterHandler(signal, std::move(func), signal_mask);
}

bool SignalHandler::RegisterHandler(Signal signal, std::function<void()> func, sigset_t signal_mask) {
  const auto signal_number = static_cast<int>(signal);
  handlers_[signal_number] = std::move(func);
  return Install(signal_number, SignalHandler::Handle, signal_mask, SA_RESTART);
}

bool ShutdownSignal::Install() {
  sigset_t block_shutdown_signals;
  sigemptyset(&block_shutdown_signals);
  sigaddset(&block_shutdown_signals, SIGTERM);
  sigaddset(&block_shutdown_signals, SIGINT);

  auto on_signal = [] { shutdown_requested = 1; };
  return SignalHandler::RegisterHandler(Signal::TERMINATE, on_signal, block_shutdown_signals) &&
         SignalHandler::RegisterHandler(Signal::INTERRUPT, on_signal, block_shutdown_signals);
}

bool ShutdownSignal::Requested() { return shutdown_requested != 0; }

void ShutdownSignal::Wait(int poll_interval_ms) {
  while (!Requested()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms));
  }
}

}  // namespace rangekv::utils
