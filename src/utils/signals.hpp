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

namespace leasehold::utils {

enum class Signal : int {
  Terminate = SIGTERM,
  Interrupt = SIGINT,
};

class SignalHandler {
 private:
  static std::map<int, std::function<void()>> handlers_;

  static void Handle(int signal);

 public:
  /// Installs `func` as the handler of `signal`. The `signal_mask` argument
  /// blocks signals during execution of the handler. `signal_mask` should be created
  /// using `sigemptyset` and `sigaddset` functions from `<signal.h>`.
  static bool RegisterHandler(Signal signal, std::function<void()> func, sigset_t signal_mask);
};

}  // namespace leasehold::utils
