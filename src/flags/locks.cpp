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

#include "flags/locks.hpp"

#include "utils/flag_validation.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(lock_ledger_directory, "leasehold_data",
                        "Path to the directory holding the lock ledger (a RocksDB database).", FLAG_NOT_EMPTY);

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(lease_timeout_sec, 300,
                        "Seconds after the last renewal at which a lease is considered stale and may be reclaimed.",
                        FLAG_IN_RANGE(1, 24UL * 3600));

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(lease_renewal_interval_sec, 30,
                        "Interval (in seconds) at which held leases are renewed. Has to be shorter than "
                        "--lease_timeout_sec.",
                        FLAG_IN_RANGE(1, 24UL * 3600));

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(lock_topic, "leasehold-locks", "Bus topic on which lock notifications are exchanged.",
                        FLAG_NOT_EMPTY);

namespace leasehold::flags {

locks::Config LocksConfigFromFlags() {
  return locks::Config{.lease_timeout = std::chrono::seconds(FLAGS_lease_timeout_sec),
                       .renewal_interval = std::chrono::seconds(FLAGS_lease_renewal_interval_sec),
                       .topic = FLAGS_lock_topic,
                       .background_renewal = true};
}

}  // namespace leasehold::flags
