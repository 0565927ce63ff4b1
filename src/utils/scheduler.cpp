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

#include "utils/scheduler.hpp"

#include "utils/logging.hpp"
#include "utils/thread.hpp"

namespace leasehold::utils {

/**
 * @param pause - Duration between two function executions. If function is
 * still running when it should be ran again, it will run right after it
 * finishes its previous run.
 * @param f - Function
 * @throw std::system_error if thread could not be started.
 * @throw std::bad_alloc
 */
void Scheduler::Run(const std::string &service_name, const std::function<void()> &f) {
  // stop any running thread
  Stop();

  thread_ = std::jthread([this, f = f, service_name = service_name](std::stop_token token) mutable {
    ThreadRun(std::move(service_name), std::move(f), token);
  });
}

void Scheduler::SetInterval_(std::chrono::milliseconds pause, std::optional<time_point> start_time) {
  DLH_ASSERT(pause > std::chrono::milliseconds(0), "Pause is invalid. Expected > 0, got {}.", pause.count());

  const auto now = std::chrono::system_clock::now();
  {
    auto lk = std::unique_lock{mutex_};
    pause_ = pause;
    if (start_time) {
      while (*start_time < now) *start_time += pause;
      next_execution_ = *start_time;
    } else {
      next_execution_ = now + pause;
    }
  }
  condition_variable_.notify_one();
}

// Must be called with mutex_ held.
Scheduler::time_point Scheduler::FindNext(const time_point now, const bool incr) {
  if (pause_ == std::chrono::milliseconds(0)) return time_point::max();
  if (!incr) return std::max(now, next_execution_);
  if (now >= next_execution_) {
    next_execution_ += pause_;
    // If multiple periods are missed, execute as soon as possible once
    if (now > next_execution_) {
      const auto delta = now - next_execution_;
      const auto n_periods = delta / pause_;
      next_execution_ += n_periods * pause_;
    }
  }
  return next_execution_;
}

// Checking stop_possible() is necessary because otherwise calling IsRunning
// on a non-started Scheduler would return true.
bool Scheduler::IsRunning() {
  const auto token = thread_.get_stop_token();
  return token.stop_possible() && !token.stop_requested();
}

void Scheduler::ThreadRun(std::string service_name, std::function<void()> f, std::stop_token token) {
  utils::ThreadSetName(service_name);

  while (true) {
    // First wait then execute the function. Schedulers are started together
    // with their owner and there is nothing to do right away.
    {
      auto lk = std::unique_lock{mutex_};
      const auto next = FindNext(std::chrono::system_clock::now(), false);
      if (next == time_point::max()) {
        condition_variable_.wait(lk, token, [] { return false; });
      } else {
        condition_variable_.wait_until(lk, token, next, [] { return false; });
      }

      if (token.stop_requested()) break;
      // Woken up too early (interval changed while waiting)
      const auto now = std::chrono::system_clock::now();
      if (now < FindNext(now, false)) continue;
      FindNext(now, true);
    }

    f();
  }
}

// Concurrent threads may request stopping the scheduler. In that case only one of them will
// actually stop the scheduler, the other one won't. We need to know which one is the successful
// one so that we don't try to join thread concurrently since this could cause undefined behavior.
void Scheduler::Stop() {
  if (thread_.request_stop()) {
    condition_variable_.notify_one();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
  }
}

}  // namespace leasehold::utils
