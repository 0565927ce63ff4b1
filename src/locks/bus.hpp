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

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace leasehold::locks {

using SubscriptionId = uint64_t;
inline constexpr SubscriptionId kNoSubscription = 0;

/**
 * Best-effort multicast channel between contexts. A message published on a
 * topic reaches the other live subscribers of that topic, eventually and in no
 * guaranteed order, or not at all.
 *
 * Failures are reported with `BusError`.
 */
class Bus {
 public:
  using Handler = std::function<void(std::string_view message)>;

  virtual ~Bus() = default;

  virtual SubscriptionId Subscribe(const std::string &topic, Handler handler) = 0;

  /// After this returns the handler is not invoked anymore.
  virtual void Unsubscribe(SubscriptionId id) = 0;

  /// Publishes `message` on `topic`. The subscription given as `origin` (the
  /// publisher's own one, or `kNoSubscription`) doesn't receive the message.
  virtual void Publish(const std::string &topic, std::string message, SubscriptionId origin) = 0;
};

}  // namespace leasehold::locks
