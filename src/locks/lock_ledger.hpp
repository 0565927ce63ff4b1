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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kvstore/kvstore.hpp"
#include "locks/lock_record.hpp"

namespace leasehold::locks {

/**
 * Durable, authoritative store of lock records keyed by resource id. This is
 * the only place the coordinator learns who holds what; bus notifications are
 * hints.
 *
 * Every operation throws `LockLedgerError` when the store fails. Implementations
 * must be safe to use from several coordinators and threads at once.
 */
class LockLedger {
 public:
  virtual ~LockLedger() = default;

  virtual std::optional<LockRecord> Get(const std::string &resource_id) = 0;

  /// Inserts or overwrites the record for `record.resource_id`. Last write wins.
  virtual void Put(const LockRecord &record) = 0;

  /// Removes the record. Deleting a missing record is not an error.
  virtual void Delete(const std::string &resource_id) = 0;

  virtual std::vector<LockRecord> List() = 0;
};

inline constexpr std::string_view kLockKeyPrefix = "lock:";

/**
 * Lock ledger living in a `kvstore::KVStore` under the `lock:` key prefix. The
 * same store may hold application documents under other prefixes.
 *
 * Records are stored as JSON:
 *   key="lock:<resource_id>", value={"resource_id", "owner_id", "renewed_at"}
 *
 * The store offers no conditional write, so a read followed by a write is
 * never atomic.
 */
class KVStoreLockLedger final : public LockLedger {
 public:
  /// `storage` must outlive the ledger.
  explicit KVStoreLockLedger(kvstore::KVStore &storage);

  std::optional<LockRecord> Get(const std::string &resource_id) override;
  void Put(const LockRecord &record) override;
  void Delete(const std::string &resource_id) override;

  /// Corrupt records are skipped with a warning.
  std::vector<LockRecord> List() override;

  static std::string KeyFor(std::string_view resource_id);

 private:
  kvstore::KVStore &storage_;
};

}  // namespace leasehold::locks
