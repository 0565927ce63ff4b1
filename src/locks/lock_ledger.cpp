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

#include "locks/lock_ledger.hpp"

#include <nlohmann/json.hpp>

#include "locks/exceptions.hpp"
#include "utils/logging.hpp"

namespace leasehold::locks {

namespace {
LockRecord ParseRecord(std::string_view key, std::string_view value) {
  nlohmann::json data;
  try {
    data = nlohmann::json::parse(value);
  } catch (const nlohmann::json::parse_error &e) {
    throw LockLedgerError("Couldn't parse lock record stored under '{}': {}", key, e.what());
  }
  auto record = LockRecord::Deserialize(data);
  if (KVStoreLockLedger::KeyFor(record.resource_id) != key) {
    throw LockLedgerError("Lock record stored under '{}' belongs to resource '{}'", key, record.resource_id);
  }
  return record;
}
}  // namespace

KVStoreLockLedger::KVStoreLockLedger(kvstore::KVStore &storage) : storage_(storage) {}

std::string KVStoreLockLedger::KeyFor(std::string_view resource_id) {
  return fmt::format("{}{}", kLockKeyPrefix, resource_id);
}

std::optional<LockRecord> KVStoreLockLedger::Get(const std::string &resource_id) {
  const auto key = KeyFor(resource_id);
  std::optional<std::string> value;
  try {
    value = storage_.Get(key);
  } catch (const kvstore::KVStoreError &e) {
    throw LockLedgerError("Couldn't read the lock record of '{}': {}", resource_id, e.what());
  }
  if (!value) return std::nullopt;
  return ParseRecord(key, *value);
}

void KVStoreLockLedger::Put(const LockRecord &record) {
  std::string value;
  try {
    value = record.Serialize().dump();
  } catch (const nlohmann::json::exception &e) {
    // Ids which aren't valid UTF-8 can't be stored as JSON.
    throw LockLedgerError("Couldn't encode the lock record of '{}': {}", record.resource_id, e.what());
  }
  if (!storage_.Put(KeyFor(record.resource_id), value)) {
    throw LockLedgerError("Couldn't write the lock record of '{}'", record.resource_id);
  }
}

void KVStoreLockLedger::Delete(const std::string &resource_id) {
  if (!storage_.Delete(KeyFor(resource_id))) {
    throw LockLedgerError("Couldn't delete the lock record of '{}'", resource_id);
  }
}

std::vector<LockRecord> KVStoreLockLedger::List() {
  const auto prefix = std::string{kLockKeyPrefix};
  std::vector<LockRecord> records;
  for (auto it = storage_.begin(prefix); it != storage_.end(prefix); ++it) {
    try {
      records.push_back(ParseRecord(it->first, it->second));
    } catch (const LockLedgerError &e) {
      spdlog::warn("Skipping lock record: {}", e.what());
    }
  }
  return records;
}

}  // namespace leasehold::locks
