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

namespace leasehold::locks {

class Coordinator;

/**
 * Edit session on one resource. The constructor tries to acquire the resource
 * and the destructor releases it if it was acquired. Failure to acquire isn't
 * an exception: `Held` is false and `Error` says why, `Retry` tries again.
 *
 * @code
 * locks::ScopedLease lease(coordinator, "proj-1");
 * if (!lease.Held()) {
 *   spdlog::warn("Read-only mode: {}", *lease.Error());
 * }
 * @endcode
 */
class ScopedLease {
 public:
  static constexpr std::string_view kHeldElsewhere = "This instance is already open in another context";
  static constexpr std::string_view kStillHeldElsewhere = "This instance is still locked by another context";

  /// `coordinator` must outlive the lease.
  ScopedLease(Coordinator &coordinator, std::string resource_id);
  ~ScopedLease();

  ScopedLease(const ScopedLease &) = delete;
  ScopedLease &operator=(const ScopedLease &) = delete;
  ScopedLease(ScopedLease &&other) noexcept;
  ScopedLease &operator=(ScopedLease &&other) noexcept;

  bool Held() const { return held_; }
  const std::optional<std::string> &Error() const { return error_; }
  const std::string &ResourceId() const { return resource_id_; }

  /// Attempts to acquire the resource again. A store error leaves `Held`
  /// unchanged and sets `Error`.
  bool Retry();

  /// Releases the resource early. The destructor won't release it again.
  void Release();

 private:
  bool TryAcquire(std::string_view contention_message);
  void ReleaseNoThrow() noexcept;

  Coordinator *coordinator_;
  std::string resource_id_;
  bool held_{false};
  std::optional<std::string> error_;
};

}  // namespace leasehold::locks
