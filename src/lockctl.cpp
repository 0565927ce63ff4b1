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
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <gflags/gflags.h>

#include "flags/locks.hpp"
#include "flags/log_level.hpp"
#include "kvstore/kvstore.hpp"
#include "locks/clock.hpp"
#include "locks/coordinator.hpp"
#include "locks/exceptions.hpp"
#include "locks/lease_policy.hpp"
#include "locks/local_bus.hpp"
#include "locks/lock_ledger.hpp"
#include "utils/logging.hpp"
#include "utils/signals.hpp"

namespace {

constexpr auto kUsage =
    "Inspect and hold leasehold locks.\n\n"
    "Usage:\n"
    "  lockctl [flags] list\n"
    "  lockctl [flags] status <resource>\n"
    "  lockctl [flags] hold <resource> [<resource>...]\n\n"
    "'hold' keeps the leases renewed until SIGINT or SIGTERM and releases them on exit.";

// Needed to prevent handling a shutdown inside a shutdown.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t is_shutting_down = 0;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<bool> shutdown_requested{false};

void InitSignalHandlers() {
  sigset_t block_shutdown_signals;
  sigemptyset(&block_shutdown_signals);
  sigaddset(&block_shutdown_signals, SIGTERM);
  sigaddset(&block_shutdown_signals, SIGINT);

  auto shutdown = []() {
    if (is_shutting_down) return;
    is_shutting_down = 1;
    shutdown_requested.store(true);
  };

  LH_ASSERT(leasehold::utils::SignalHandler::RegisterHandler(leasehold::utils::Signal::Terminate, shutdown,
                                                             block_shutdown_signals),
            "Unable to register SIGTERM handler!");
  LH_ASSERT(leasehold::utils::SignalHandler::RegisterHandler(leasehold::utils::Signal::Interrupt, shutdown,
                                                             block_shutdown_signals),
            "Unable to register SIGINT handler!");
}

std::string DescribeAge(std::chrono::milliseconds age) { return fmt::format("{:.1f}s", age.count() / 1000.0); }

int List(leasehold::locks::LockLedger &ledger, leasehold::locks::Clock &clock,
         const leasehold::locks::Config &config) {
  const auto now = clock.Now();
  const auto records = ledger.List();
  for (const auto &record : records) {
    std::cout << fmt::format("{}\t{}\t{}\t{}", record.resource_id, record.owner_id,
                             DescribeAge(leasehold::locks::LeaseAge(record, now)),
                             leasehold::locks::IsStale(record, now, config.lease_timeout) ? "stale" : "live")
              << std::endl;
  }
  spdlog::info("{} lock record(s)", records.size());
  return 0;
}

int Status(leasehold::locks::Coordinator &coordinator, const std::string &resource_id) {
  const auto status = coordinator.Status(resource_id);
  if (!status.is_locked) {
    std::cout << fmt::format("{}: not locked", resource_id) << std::endl;
    return 0;
  }
  std::cout << fmt::format("{}: locked by {} (lease age {})", resource_id, *status.holder_id,
                           DescribeAge(*status.lease_age))
            << std::endl;
  return 0;
}

int Hold(leasehold::locks::Coordinator &coordinator, const std::vector<std::string> &resource_ids) {
  InitSignalHandlers();
  for (const auto &resource_id : resource_ids) {
    if (!coordinator.Acquire(resource_id)) {
      const auto owner = coordinator.GetLockOwner(resource_id);
      std::cerr << fmt::format("{} is locked by {}", resource_id, owner.value_or("another context")) << std::endl;
      coordinator.Shutdown();
      return 1;
    }
    std::cout << fmt::format("holding {} as {}", resource_id, coordinator.SelfId()) << std::endl;
  }

  while (!shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  spdlog::info("Shutting down, releasing {} lock(s)", coordinator.HeldResources().size());
  coordinator.Shutdown();
  return 0;
}

}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage(kUsage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  leasehold::flags::InitializeLogger();

  if (argc < 2) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "lockctl");
    return 1;
  }
  const std::string command = argv[1];
  const std::vector<std::string> arguments(argv + 2, argv + argc);

  try {
    auto config = leasehold::flags::LocksConfigFromFlags();
    leasehold::locks::SystemClock clock;

    // Inspection opens the ledger read-only so it works next to a running 'hold'.
    if (command == "list" && arguments.empty()) {
      auto storage = leasehold::kvstore::KVStore::OpenForReadOnly(FLAGS_lock_ledger_directory);
      leasehold::locks::KVStoreLockLedger ledger(storage);
      return List(ledger, clock, config);
    }
    if (command == "status" && arguments.size() == 1) {
      auto storage = leasehold::kvstore::KVStore::OpenForReadOnly(FLAGS_lock_ledger_directory);
      leasehold::locks::KVStoreLockLedger ledger(storage);
      leasehold::locks::LocalBus bus;
      config.background_renewal = false;
      leasehold::locks::Coordinator coordinator(ledger, bus, clock, config);
      return Status(coordinator, arguments.front());
    }
    if (command == "hold" && !arguments.empty()) {
      leasehold::kvstore::KVStore storage(FLAGS_lock_ledger_directory);
      leasehold::locks::KVStoreLockLedger ledger(storage);
      // Declared before the coordinator, which detaches from it on destruction.
      leasehold::locks::LocalBus bus;
      leasehold::locks::Coordinator coordinator(ledger, bus, clock, config);
      return Hold(coordinator, arguments);
    }
    std::cerr << kUsage << std::endl;
    return 1;
  } catch (const leasehold::utils::BasicException &e) {
    spdlog::critical("{}: {}", e.name(), e.what());
    return 2;
  }
}
