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

#include "locks/lease_policy.hpp"

#include <algorithm>

namespace leasehold::locks {

std::chrono::milliseconds LeaseAge(const LockRecord &record, const Timestamp now) { return now - record.renewed_at; }

bool IsStale(const LockRecord &record, const Timestamp now, const std::chrono::milliseconds lease_timeout) {
  return LeaseAge(record, now) >= lease_timeout;
}

bool IsStale(const std::optional<LockRecord> &record, const Timestamp now,
             const std::chrono::milliseconds lease_timeout) {
  return record && IsStale(*record, now, lease_timeout);
}

bool IsOwnedBy(const std::optional<LockRecord> &record, std::string_view owner_id) {
  return record && record->owner_id == owner_id;
}

bool IsAcquirable(const std::optional<LockRecord> &record, const Timestamp now, std::string_view self_id,
                  const std::chrono::milliseconds lease_timeout) {
  if (!record) return true;
  return IsOwnedBy(record, self_id) || IsStale(*record, now, lease_timeout);
}

Timestamp NextRenewalTimestamp(const LockRecord &record, const Timestamp now) {
  return std::max(now, record.renewed_at + Timestamp{1});
}

}  // namespace leasehold::locks
