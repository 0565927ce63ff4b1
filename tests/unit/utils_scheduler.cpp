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

#include <atomic>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "utils/scheduler.hpp"

using namespace std::chrono_literals;

/**
 * Scheduler runs every second and increases one variable. The first run
 * happens one full interval after the start.
 */
TEST(Scheduler, TestFunctionExecuting) {
  std::atomic<int> x{0};
  std::function<void()> func{[&x]() { ++x; }};
  leasehold::utils::Scheduler scheduler;
  scheduler.SetInterval(std::chrono::seconds(1));
  scheduler.Run("Test", func);

  EXPECT_EQ(x, 0);
  std::this_thread::sleep_for(900ms);
  EXPECT_EQ(x, 0);

  std::this_thread::sleep_for(300ms);
  EXPECT_EQ(x, 1);

  std::this_thread::sleep_for(2000ms);
  EXPECT_EQ(x, 3);

  scheduler.Stop();
  std::this_thread::sleep_for(1100ms);
  EXPECT_EQ(x, 3);
}

TEST(Scheduler, FirstRunAfterFullInterval) {
  std::atomic<int> x{0};
  std::function<void()> func{[&x]() { ++x; }};
  leasehold::utils::Scheduler scheduler;
  scheduler.SetInterval(std::chrono::seconds(100));
  scheduler.Run("Test", func);

  std::this_thread::sleep_for(1500ms);
  EXPECT_EQ(x, 0);
}

TEST(Scheduler, StartTime) {
  std::atomic<int> x{0};
  std::function<void()> func{[&x]() { ++x; }};
  leasehold::utils::Scheduler scheduler;

  const auto now = std::chrono::system_clock::now();
  const auto timeout1 = now + std::chrono::seconds(4);
  const auto timeout2 = now + std::chrono::seconds(8);

  scheduler.SetInterval(std::chrono::seconds(3), now + std::chrono::seconds(3));
  scheduler.Run("Test", func);

  while (x == 0 && std::chrono::system_clock::now() < timeout1) {
    std::this_thread::sleep_for(100ms);
  }
  ASSERT_EQ(x, 1);

  while (x == 1 && std::chrono::system_clock::now() < timeout2) {
    std::this_thread::sleep_for(100ms);
  }
  ASSERT_EQ(x, 2);
}

TEST(Scheduler, IsRunningFalse) {
  leasehold::utils::Scheduler scheduler;
  EXPECT_FALSE(scheduler.IsRunning());
}

TEST(Scheduler, StopIdleScheduler) {
  leasehold::utils::Scheduler scheduler;
  ASSERT_NO_THROW(scheduler.Stop());
}

TEST(Scheduler, RunStop) {
  std::atomic<int> x{0};
  std::function<void()> func{[&x]() { ++x; }};
  leasehold::utils::Scheduler scheduler;
  scheduler.SetInterval(100ms);
  scheduler.Run("Test", func);
  EXPECT_TRUE(scheduler.IsRunning());
  scheduler.Stop();
  EXPECT_FALSE(scheduler.IsRunning());
  ASSERT_NO_THROW(scheduler.Stop());
}

TEST(Scheduler, StopWaitingScheduler) {
  std::atomic<int> x{0};
  std::function<void()> func{[&x]() { ++x; }};
  leasehold::utils::Scheduler scheduler;
  scheduler.SetInterval(std::chrono::seconds(100));
  scheduler.Run("Test", func);
  EXPECT_TRUE(scheduler.IsRunning());

  // Stop interrupts the wait for the next execution.
  const auto before = std::chrono::steady_clock::now();
  scheduler.Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(10));
  EXPECT_FALSE(scheduler.IsRunning());
  EXPECT_EQ(x, 0);
}

TEST(Scheduler, StopFromTask) {
  std::atomic<int> x{0};
  leasehold::utils::Scheduler scheduler;
  scheduler.SetInterval(100ms);
  scheduler.Run("Test", [&]() {
    ++x;
    scheduler.Stop();
  });

  const auto timeout = std::chrono::system_clock::now() + std::chrono::seconds(2);
  while (x == 0 && std::chrono::system_clock::now() < timeout) {
    std::this_thread::sleep_for(50ms);
  }
  std::this_thread::sleep_for(300ms);
  EXPECT_EQ(x, 1);
  EXPECT_FALSE(scheduler.IsRunning());
}

TEST(Scheduler, ConcurrentStops) {
  std::atomic<int> x{0};
  std::function<void()> func{[&x]() { ++x; }};
  leasehold::utils::Scheduler scheduler;
  scheduler.SetInterval(100ms);
  scheduler.Run("Test", func);

  std::jthread stopper1([&scheduler]() { scheduler.Stop(); });
  std::jthread stopper2([&scheduler]() { scheduler.Stop(); });
}
