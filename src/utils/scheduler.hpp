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
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace leasehold::utils {

/**
 * Class used to run scheduled function execution.
 *
 * The function passed to `Run` is executed on a dedicated thread once per
 * interval. The first execution happens one full interval after `Run`
 * (or after `start_time` if given).
 */
class Scheduler {
 public:
  using time_point = std::chrono::system_clock::time_point;

  Scheduler() = default;

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;
  Scheduler(Scheduler &&) = delete;
  Scheduler &operator=(Scheduler &&) = delete;

  ~Scheduler() { Stop(); }

  /**
   * @param service_name - Name given to the scheduler thread (at most 15 characters).
   * @param f - Function executed once per interval.
   * @throw std::system_error if thread could not be started.
   */
  void Run(const std::string &service_name, const std::function<void()> &f);

  template <typename TRep, typename TPeriod>
  void SetInterval(const std::chrono::duration<TRep, TPeriod> &period, std::optional<time_point> start_time = {}) {
    SetInterval_(std::chrono::duration_cast<std::chrono::milliseconds>(period), start_time);
  }

  void Stop();

  bool IsRunning();

 private:
  void SetInterval_(std::chrono::milliseconds pause, std::optional<time_point> start_time);

  void ThreadRun(std::string service_name, std::function<void()> f, std::stop_token token);

  time_point FindNext(time_point now, bool incr);

  /**
   * Period between two executions. Zero means the scheduler waits forever.
   */
  std::chrono::milliseconds pause_{0};

  /**
   * Next planned execution, only meaningful when `pause_` is set.
   */
  time_point next_execution_{};

  /**
   * Mutex used to synchronize threads using condition variable. It also
   * guards the interval setup.
   */
  std::mutex mutex_;

  /**
   * Condition variable is used to stop waiting until the end of the
   * time interval if destructor is called.
   */
  std::condition_variable_any condition_variable_;

  /**
   * Thread which runs function.
   */
  std::jthread thread_;
};

}  // namespace leasehold::utils
