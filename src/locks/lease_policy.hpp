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

/// @file
///
/// Pure functions deciding what a context may do with a lock record at a given
/// point in time. Nothing in here touches the ledger or the clock.
#pragma once

#include <chrono>
#include <optional>
#include <string_view>

#include "locks/clock.hpp"
#include "locks/lock_record.hpp"

namespace leasehold::locks {

/// Time elapsed since the owner last wrote the record. Negative when the
/// record was written by a context whose clock runs ahead of ours.
std::chrono::milliseconds LeaseAge(const LockRecord &record, Timestamp now);

/// A record is stale once its age reached the lease timeout. Anybody may
/// reclaim a stale record.
bool IsStale(const LockRecord &record, Timestamp now, std::chrono::milliseconds lease_timeout);
bool IsStale(const std::optional<LockRecord> &record, Timestamp now, std::chrono::milliseconds lease_timeout);

/// True iff the record exists and names `owner_id`. This is what makes a held
/// lease eligible for renewal.
bool IsOwnedBy(const std::optional<LockRecord> &record, std::string_view owner_id);

/// A resource is acquirable by `self_id` when there is no record, when the
/// record already names `self_id` or when the record is stale.
bool IsAcquirable(const std::optional<LockRecord> &record, Timestamp now, std::string_view self_id,
                  std::chrono::milliseconds lease_timeout);

/// Timestamp to write when renewing `record`. Always strictly greater than the
/// stored one, even if the clock didn't move.
Timestamp NextRenewalTimestamp(const LockRecord &record, Timestamp now);

}  // namespace leasehold::locks
