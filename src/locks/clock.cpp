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

#include "locks/clock.hpp"

#include <algorithm>

namespace leasehold::locks {

Timestamp SystemClock::Now() {
  const auto now = std::chrono::duration_cast<Timestamp>(std::chrono::system_clock::now().time_since_epoch()).count();
  auto last = last_.load(std::memory_order_acquire);
  while (last < now && !last_.compare_exchange_weak(last, now, std::memory_order_acq_rel)) {
  }
  return Timestamp{std::max(last, now)};
}

}  // namespace leasehold::locks
