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

#include "locks/scoped_lease.hpp"

#include <utility>

#include "locks/coordinator.hpp"
#include "locks/exceptions.hpp"
#include "utils/logging.hpp"

namespace leasehold::locks {

ScopedLease::ScopedLease(Coordinator &coordinator, std::string resource_id)
    : coordinator_(&coordinator), resource_id_(std::move(resource_id)) {
  TryAcquire(kHeldElsewhere);
}

ScopedLease::~ScopedLease() { ReleaseNoThrow(); }

ScopedLease::ScopedLease(ScopedLease &&other) noexcept
    : coordinator_(other.coordinator_),
      resource_id_(std::move(other.resource_id_)),
      held_(std::exchange(other.held_, false)),
      error_(std::move(other.error_)) {}

ScopedLease &ScopedLease::operator=(ScopedLease &&other) noexcept {
  if (this == &other) return *this;
  ReleaseNoThrow();
  coordinator_ = other.coordinator_;
  resource_id_ = std::move(other.resource_id_);
  held_ = std::exchange(other.held_, false);
  error_ = std::move(other.error_);
  return *this;
}

bool ScopedLease::Retry() { return TryAcquire(kStillHeldElsewhere); }

void ScopedLease::Release() {
  if (!held_) return;
  coordinator_->Release(resource_id_);
  held_ = false;
}

bool ScopedLease::TryAcquire(std::string_view contention_message) {
  try {
    held_ = coordinator_->Acquire(resource_id_);
  } catch (const LockLedgerError &e) {
    spdlog::warn("Couldn't acquire lock on {}: {}", resource_id_, e.what());
    // A lease held before the failed attempt is still ours to release.
    error_ = e.what();
    return false;
  }
  if (held_) {
    error_.reset();
  } else {
    error_ = std::string{contention_message};
  }
  return held_;
}

void ScopedLease::ReleaseNoThrow() noexcept {
  if (!held_) return;
  try {
    coordinator_->Release(resource_id_);
  } catch (const LockLedgerError &e) {
    spdlog::error("Failed to release lock on {}: {}", resource_id_, e.what());
  }
  held_ = false;
}

}  // namespace leasehold::locks
