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
#include <string>
#include <string_view>

namespace leasehold::locks {

inline constexpr std::chrono::milliseconds kDefaultLeaseTimeout = std::chrono::minutes(5);
inline constexpr std::chrono::milliseconds kDefaultRenewalInterval = std::chrono::seconds(30);
inline constexpr std::string_view kDefaultTopic = "leasehold-locks";

/// Pass this class to the `Coordinator` constructor to change the default
/// behavior. The renewal interval has to be much shorter than the lease
/// timeout so a live owner never looks stale to other contexts.
struct Config {
  std::chrono::milliseconds lease_timeout{kDefaultLeaseTimeout};
  std::chrono::milliseconds renewal_interval{kDefaultRenewalInterval};
  std::string topic{kDefaultTopic};
  // When disabled no renewal task is started and the owner of the coordinator
  // drives `RenewHeldLeases` itself.
  bool background_renewal{true};

  friend bool operator==(const Config &lhs, const Config &rhs) = default;
};

}  // namespace leasehold::locks
