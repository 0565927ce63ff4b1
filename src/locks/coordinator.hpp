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
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "locks/bus.hpp"
#include "locks/clock.hpp"
#include "locks/config.hpp"
#include "locks/lock_ledger.hpp"
#include "locks/notification_relay.hpp"
#include "utils/scheduler.hpp"

namespace leasehold::locks {

struct LockStatus {
  bool is_locked{false};
  bool owned_by_self{false};
  std::optional<std::string> holder_id;
  std::optional<std::chrono::milliseconds> lease_age;

  friend bool operator==(const LockStatus &lhs, const LockStatus &rhs) = default;
};

/// Produces the opaque, process-unique id of a context. Called once per
/// coordinator.
using IdentitySource = std::function<std::string()>;

/**
 * Arbitrates exclusive edit access to resources for one context.
 *
 * The coordinator keeps the set of resources it believes it holds, renews
 * their leases every `renewal_interval` and announces changes on the bus. The
 * ledger is the only source of truth: a held lease can be lost involuntarily
 * (stale reclamation by another context, or the acquire race below), so callers
 * should recheck `Status` before destructive edits.
 *
 * All operations which touch the ledger are serialized per coordinator. Ledger
 * failures surface as `LockLedgerError`; bus failures never fail an operation.
 *
 * The ledger, bus and clock must outlive the coordinator.
 */
class Coordinator final {
 public:
  /// @throw CoordinatorConfigError if the config or the produced id is invalid.
  Coordinator(LockLedger &ledger, Bus &bus, Clock &clock, Config config = {},
              const IdentitySource &identity = DefaultIdentity());

  /// Shuts the coordinator down, releasing every held resource.
  ~Coordinator();

  Coordinator(const Coordinator &) = delete;
  Coordinator &operator=(const Coordinator &) = delete;
  Coordinator(Coordinator &&) = delete;
  Coordinator &operator=(Coordinator &&) = delete;

  /**
   * Tries to take the lease on `resource_id`. Re-acquiring a resource this
   * context already holds refreshes the lease.
   *
   * @return false if another context holds a live lease. Nothing is changed
   *         in that case.
   * @throw LockLedgerError if the ledger couldn't be read or written. The
   *        resource is not held afterwards.
   */
  bool Acquire(const std::string &resource_id);

  /// Releases `resource_id` if this context holds it, no-op otherwise.
  /// @throw LockLedgerError
  void Release(const std::string &resource_id);

  /// Releases every held resource. Failures are logged and the remaining
  /// resources are still released; the held set is empty afterwards.
  void ReleaseAll();

  /// Read-only view of the ledger. A stale record is reported as not locked.
  /// @throw LockLedgerError
  LockStatus Status(const std::string &resource_id);

  /// @throw LockLedgerError
  bool IsLocked(const std::string &resource_id);

  /// Id of the context holding a live lease on `resource_id`.
  /// @throw LockLedgerError
  std::optional<std::string> GetLockOwner(const std::string &resource_id);

  /// One renewal cycle, the same one the background task runs. Leases which
  /// are still ours get a new timestamp and a ping; lost ones are dropped.
  void RenewHeldLeases();

  /// Renews a single held lease now.
  /// @return false if the resource isn't held or the lease turned out lost.
  /// @throw LockLedgerError
  bool Refresh(const std::string &resource_id);

  /// Hook for hosts entering a suspended or background state. Renews every
  /// held lease immediately so the context doesn't look stale while inactive.
  void OnBackgrounded();

  NotificationRelay::ObserverId Subscribe(NotificationRelay::Observer observer);
  bool Unsubscribe(NotificationRelay::ObserverId id);

  /// Cancels the renewal task and detaches from the bus. Held leases stay in
  /// the ledger and go stale unless released.
  void Stop();

  /// Stops renewal, then releases everything. Safe to call repeatedly.
  void Shutdown();

  const std::string &SelfId() const { return self_id_; }

  const Config &GetConfig() const { return config_; }

  std::set<std::string> HeldResources();

  static IdentitySource DefaultIdentity();

 private:
  enum class RenewOutcome : uint8_t { RENEWED, LOST };

  // The following require operation_lock_ to be held.
  void ReleaseLocked(const std::string &resource_id);
  RenewOutcome RenewLocked(const std::string &resource_id);
  void RenewAllLocked(bool announce);

  LockLedger &ledger_;
  Clock &clock_;
  Config config_;
  std::string self_id_;
  NotificationRelay relay_;

  std::mutex operation_lock_;
  std::set<std::string> held_;

  utils::Scheduler renewal_scheduler_;
};

}  // namespace leasehold::locks
