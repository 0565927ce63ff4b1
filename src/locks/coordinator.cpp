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

#include "locks/coordinator.hpp"

#include <algorithm>

#include "locks/exceptions.hpp"
#include "locks/lease_policy.hpp"
#include "utils/logging.hpp"
#include "utils/uuid.hpp"

namespace leasehold::locks {

namespace {
void ValidateConfig(const Config &config) {
  if (config.lease_timeout <= std::chrono::milliseconds::zero()) {
    throw CoordinatorConfigError("Lease timeout has to be positive, got {}ms", config.lease_timeout.count());
  }
  if (config.renewal_interval <= std::chrono::milliseconds::zero()) {
    throw CoordinatorConfigError("Renewal interval has to be positive, got {}ms", config.renewal_interval.count());
  }
  if (config.renewal_interval >= config.lease_timeout) {
    throw CoordinatorConfigError("Renewal interval ({}ms) has to be shorter than the lease timeout ({}ms)",
                                 config.renewal_interval.count(), config.lease_timeout.count());
  }
  if (config.topic.empty()) {
    throw CoordinatorConfigError("Notification topic can't be empty");
  }
}
}  // namespace

IdentitySource Coordinator::DefaultIdentity() { return [] { return utils::GenerateUUID(); }; }

Coordinator::Coordinator(LockLedger &ledger, Bus &bus, Clock &clock, Config config, const IdentitySource &identity)
    : ledger_(ledger),
      clock_(clock),
      config_(std::move(config)),
      self_id_(identity()),
      relay_(bus, config_.topic) {
  ValidateConfig(config_);
  if (self_id_.empty()) throw CoordinatorConfigError("Context identity can't be empty");
  if (config_.lease_timeout < 2 * config_.renewal_interval) {
    spdlog::warn("Lease timeout {}ms leaves little room for renewals every {}ms", config_.lease_timeout.count(),
                 config_.renewal_interval.count());
  }

  relay_.Start();
  if (config_.background_renewal) {
    renewal_scheduler_.SetInterval(config_.renewal_interval);
    renewal_scheduler_.Run("LeaseRenewal", [this] { RenewHeldLeases(); });
  }
  spdlog::debug("Lock coordinator {} started on topic '{}'", self_id_, config_.topic);
}

Coordinator::~Coordinator() { Shutdown(); }

bool Coordinator::Acquire(const std::string &resource_id) {
  auto guard = std::lock_guard{operation_lock_};

  // NOTE: Reading the record and writing the new one are two separate ledger
  // operations. Two contexts may both see an acquirable record and both write
  // it; the last write wins and the other context only notices at its next
  // renewal or status check.
  const auto current = ledger_.Get(resource_id);
  const auto now = clock_.Now();
  if (!IsAcquirable(current, now, self_id_, config_.lease_timeout)) {
    spdlog::debug("Lock on {} is held by {} (lease age {}ms)", resource_id, current->owner_id,
                  LeaseAge(*current, now).count());
    return false;
  }
  if (current && current->owner_id != self_id_) {
    spdlog::info("Reclaiming stale lock on {} from {} (lease age {}ms)", resource_id, current->owner_id,
                 LeaseAge(*current, now).count());
  }

  ledger_.Put(LockRecord{.resource_id = resource_id, .owner_id = self_id_, .renewed_at = now});
  held_.insert(resource_id);
  relay_.Publish(Notification{.type = NotificationType::ACQUIRED, .resource_id = resource_id, .owner_id = self_id_});
  return true;
}

void Coordinator::Release(const std::string &resource_id) {
  auto guard = std::lock_guard{operation_lock_};
  ReleaseLocked(resource_id);
}

void Coordinator::ReleaseLocked(const std::string &resource_id) {
  if (!held_.contains(resource_id)) return;

  // Never delete a lease another context reclaimed in the meantime.
  const auto current = ledger_.Get(resource_id);
  if (!IsOwnedBy(current, self_id_)) {
    spdlog::debug("Lock on {} was lost before it was released", resource_id);
    held_.erase(resource_id);
    return;
  }
  ledger_.Delete(resource_id);
  held_.erase(resource_id);
  relay_.Publish(Notification{.type = NotificationType::RELEASED, .resource_id = resource_id, .owner_id = self_id_});
}

void Coordinator::ReleaseAll() {
  auto guard = std::lock_guard{operation_lock_};
  const auto held = held_;
  for (const auto &resource_id : held) {
    try {
      ReleaseLocked(resource_id);
    } catch (const LockLedgerError &e) {
      spdlog::error("Failed to release lock on {}: {}", resource_id, e.what());
    }
  }
  held_.clear();
}

LockStatus Coordinator::Status(const std::string &resource_id) {
  const auto current = ledger_.Get(resource_id);
  const auto now = clock_.Now();
  if (!current || IsStale(*current, now, config_.lease_timeout)) return {};
  return LockStatus{.is_locked = true,
                    .owned_by_self = current->owner_id == self_id_,
                    .holder_id = current->owner_id,
                    .lease_age = std::max(LeaseAge(*current, now), std::chrono::milliseconds::zero())};
}

bool Coordinator::IsLocked(const std::string &resource_id) { return Status(resource_id).is_locked; }

std::optional<std::string> Coordinator::GetLockOwner(const std::string &resource_id) {
  return Status(resource_id).holder_id;
}

Coordinator::RenewOutcome Coordinator::RenewLocked(const std::string &resource_id) {
  const auto current = ledger_.Get(resource_id);
  if (!IsOwnedBy(current, self_id_)) {
    spdlog::debug("Lock on {} was lost to {}", resource_id, current ? current->owner_id : "nobody");
    held_.erase(resource_id);
    return RenewOutcome::LOST;
  }
  auto renewed = *current;
  renewed.renewed_at = NextRenewalTimestamp(*current, clock_.Now());
  ledger_.Put(renewed);
  return RenewOutcome::RENEWED;
}

void Coordinator::RenewAllLocked(const bool announce) {
  const auto held = held_;
  for (const auto &resource_id : held) {
    try {
      if (RenewLocked(resource_id) == RenewOutcome::RENEWED && announce) {
        relay_.Publish(Notification{.type = NotificationType::PING, .resource_id = resource_id, .owner_id = self_id_});
      }
    } catch (const LockLedgerError &e) {
      // Kept in the held set, the next cycle retries.
      spdlog::warn("Failed to renew lock on {}: {}", resource_id, e.what());
    }
  }
}

void Coordinator::RenewHeldLeases() {
  auto guard = std::lock_guard{operation_lock_};
  RenewAllLocked(true);
}

bool Coordinator::Refresh(const std::string &resource_id) {
  auto guard = std::lock_guard{operation_lock_};
  if (!held_.contains(resource_id)) return false;
  return RenewLocked(resource_id) == RenewOutcome::RENEWED;
}

void Coordinator::OnBackgrounded() {
  auto guard = std::lock_guard{operation_lock_};
  RenewAllLocked(false);
}

NotificationRelay::ObserverId Coordinator::Subscribe(NotificationRelay::Observer observer) {
  return relay_.AddObserver(std::move(observer));
}

bool Coordinator::Unsubscribe(const NotificationRelay::ObserverId id) { return relay_.RemoveObserver(id); }

void Coordinator::Stop() {
  renewal_scheduler_.Stop();
  relay_.Stop();
}

void Coordinator::Shutdown() {
  Stop();
  ReleaseAll();
}

std::set<std::string> Coordinator::HeldResources() {
  auto guard = std::lock_guard{operation_lock_};
  return held_;
}

}  // namespace leasehold::locks
