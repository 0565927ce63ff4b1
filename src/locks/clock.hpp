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

#include <atomic>
#include <chrono>
#include <cstdint>

namespace leasehold::locks {

/// Milliseconds since the Unix epoch. This is the unit stored in the ledger.
using Timestamp = std::chrono::milliseconds;

class Clock {
 public:
  virtual ~Clock() = default;

  /// Returns the current time. Consecutive calls never go backwards.
  virtual Timestamp Now() = 0;
};

/// Wall clock backed by std::chrono::system_clock. Backward steps of the
/// system time are clamped to the last value handed out.
class SystemClock final : public Clock {
 public:
  Timestamp Now() override;

 private:
  std::atomic<int64_t> last_{0};
};

}  // namespace leasehold::locks
