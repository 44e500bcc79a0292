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

#include <csignal>
#include <functional>
#include <map>

namespace rangekv::utils {

enum class Signal : int {
  TERMINATE = SIGTERM,
  INTERRUPT = SIGINT,
  PIPE = SIGPIPE,
  HANGUP = SIGHUP,
};

/// Ignores `signal` for the whole process, in every thread.
bool SignalIgnore(Signal signal);

class SignalHandler {
 public:
  /// Installs `func` as the handler of `signal`. The signals in
  /// `signal_mask` are blocked while the handler runs. Only
  /// async-signal-safe work belongs in `func`.
  static bool RegisterHandler(Signal signal, std::function<void()> func, sigset_t signal_mask);

  static bool RegisterHandler(Signal signal, std::function<void()> func);

 private:
  static void Handle(int signal);

  static std::map<int, std::function<void()>> handlers_;
};

/**
 * Routes SIGTERM and SIGINT to a flag the process polls. The first signal
 * sets the flag, later ones are ignored.
 */
class ShutdownSignal {
 public:
  /// @return false when a handler couldn't be installed
  static bool Install();

  static bool Requested();

  /// Blocks until a shutdown signal arrives, checking every `poll_interval_ms`.
  static void Wait(int poll_interval_ms = 100);
};

}  // namespace rangekv::utils
