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
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "locks/bus.hpp"
#include "locks/notification.hpp"
#include "utils/synchronized.hpp"

namespace leasehold::locks {

/**
 * Bridge between a coordinator and the bus.
 *
 * Outbound notifications are serialized and published on the coordinator's
 * topic; a failing bus is logged and otherwise ignored. Inbound messages are
 * validated and fanned out to the registered observers. An observer that throws
 * doesn't keep the others from being notified.
 */
class NotificationRelay {
 public:
  using ObserverId = uint64_t;
  using Observer = std::function<void(const Notification &)>;

  /// `bus` must outlive the relay.
  NotificationRelay(Bus &bus, std::string topic);
  ~NotificationRelay();

  NotificationRelay(const NotificationRelay &) = delete;
  NotificationRelay &operator=(const NotificationRelay &) = delete;
  NotificationRelay(NotificationRelay &&) = delete;
  NotificationRelay &operator=(NotificationRelay &&) = delete;

  /// Subscribes to the topic. Subsequent calls are no-ops while subscribed.
  /// Returns false if the bus refused the subscription.
  bool Start();

  /// Unsubscribes from the topic. Observers stay registered.
  void Stop();

  bool IsSubscribed();

  void Publish(const Notification &notification) noexcept;

  ObserverId AddObserver(Observer observer);

  /// After this returns the observer is not invoked anymore. Waits for a
  /// delivery in progress on another thread; may be called from an observer.
  bool RemoveObserver(ObserverId id);

  /// Entry point for raw inbound messages.
  void Deliver(std::string_view message);

  const std::string &Topic() const { return topic_; }

 private:
  Bus &bus_;
  std::string topic_;

  std::mutex subscription_mutex_;
  std::optional<SubscriptionId> subscription_;

  // Held while observers run. Recursive so an observer can remove observers.
  std::recursive_mutex delivery_mutex_;
  utils::Synchronized<std::map<ObserverId, Observer>> observers_;
  std::atomic<ObserverId> next_observer_id_{1};
};

}  // namespace leasehold::locks
