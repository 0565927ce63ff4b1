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

#include "locks/lock_record.hpp"

#include <cstdint>
#include <limits>

#include <nlohmann/json.hpp>

#include "locks/exceptions.hpp"

namespace leasehold::locks {

namespace {
constexpr auto kResourceId = "resource_id";
constexpr auto kOwnerId = "owner_id";
constexpr auto kRenewedAt = "renewed_at";
constexpr auto kMaxRenewedAt = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
}  // namespace

nlohmann::json LockRecord::Serialize() const {
  nlohmann::json data = nlohmann::json::object();
  data[kResourceId] = resource_id;
  data[kOwnerId] = owner_id;
  data[kRenewedAt] = renewed_at.count();
  return data;
}

LockRecord LockRecord::Deserialize(const nlohmann::json &data) {
  if (!data.is_object()) {
    throw LockLedgerError("Couldn't load lock record data!");
  }
  const auto resource_id = data.find(kResourceId);
  const auto owner_id = data.find(kOwnerId);
  const auto renewed_at = data.find(kRenewedAt);
  if (resource_id == data.end() || owner_id == data.end() || renewed_at == data.end()) {
    throw LockLedgerError("Couldn't load lock record data!");
  }
  if (!resource_id->is_string() || !owner_id->is_string() || !renewed_at->is_number_integer()) {
    throw LockLedgerError("Couldn't load lock record data!");
  }
  // Milliseconds since the epoch, never negative and within the range of Timestamp.
  if (renewed_at->is_number_unsigned() ? renewed_at->get<uint64_t>() > kMaxRenewedAt
                                       : renewed_at->get<int64_t>() < 0) {
    throw LockLedgerError("Lock record of '{}' has an invalid renewal timestamp {}",
                          resource_id->get_ref<const std::string &>(), renewed_at->dump());
  }
  return LockRecord{.resource_id = resource_id->get<std::string>(),
                    .owner_id = owner_id->get<std::string>(),
                    .renewed_at = Timestamp{renewed_at->get<int64_t>()}};
}

}  // namespace leasehold::locks
