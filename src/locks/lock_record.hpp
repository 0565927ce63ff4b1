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

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "locks/clock.hpp"

namespace leasehold::locks {

/// Ledger entry describing who holds the lease on a resource. One record
/// exists per resource id; liveness is derived from `renewed_at` and is never
/// stored.
struct LockRecord {
  std::string resource_id;
  std::string owner_id;
  Timestamp renewed_at{0};

  nlohmann::json Serialize() const;

  /// @throw LockLedgerError if `data` doesn't describe a lock record.
  static LockRecord Deserialize(const nlohmann::json &data);

  friend bool operator==(const LockRecord &lhs, const LockRecord &rhs) = default;
};

}  // namespace leasehold::locks
