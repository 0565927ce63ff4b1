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

#include "locks/notification_relay.hpp"

#include "locks/exceptions.hpp"
#include "utils/logging.hpp"

namespace leasehold::locks {

NotificationRelay::NotificationRelay(Bus &bus, std::string topic) : bus_(bus), topic_(std::move(topic)) {}

NotificationRelay::~NotificationRelay() { Stop(); }

bool NotificationRelay::Start() {
  auto guard = std::lock_guard{subscription_mutex_};
  if (subscription_) return true;
  try {
    subscription_ = bus_.Subscribe(topic_, [this](std::string_view message) { Deliver(message); });
  } catch (const BusError &e) {
    spdlog::warn("Couldn't subscribe to lock notifications on '{}': {}", topic_, e.what());
    return false;
  }
  return true;
}

void NotificationRelay::Stop() {
  std::optional<SubscriptionId> subscription;
  {
    auto guard = std::lock_guard{subscription_mutex_};
    subscription.swap(subscription_);
  }
  if (subscription) bus_.Unsubscribe(*subscription);
}

bool NotificationRelay::IsSubscribed() {
  auto guard = std::lock_guard{subscription_mutex_};
  return subscription_.has_value();
}

void NotificationRelay::Publish(const Notification &notification) noexcept {
  SubscriptionId origin = kNoSubscription;
  {
    auto guard = std::lock_guard{subscription_mutex_};
    if (subscription_) origin = *subscription_;
  }
  try {
    bus_.Publish(topic_, SerializeNotification(notification), origin);
  } catch (const std::exception &e) {
    spdlog::warn("Failed to broadcast '{}' of {}: {}", NotificationTypeToString(notification.type),
                 notification.resource_id, e.what());
  }
}

NotificationRelay::ObserverId NotificationRelay::AddObserver(Observer observer) {
  const auto id = next_observer_id_.fetch_add(1, std::memory_order_relaxed);
  observers_->emplace(id, std::move(observer));
  return id;
}

bool NotificationRelay::RemoveObserver(const ObserverId id) {
  auto delivery_guard = std::lock_guard{delivery_mutex_};
  return observers_->erase(id) > 0;
}

void NotificationRelay::Deliver(std::string_view message) {
  const auto notification = ParseNotification(message);
  if (!notification) {
    spdlog::warn("Dropping malformed lock notification on '{}': {}", topic_, notification.error());
    return;
  }

  auto delivery_guard = std::lock_guard{delivery_mutex_};
  // Observers may (un)register from within a callback.
  auto observers = observers_.WithLock([](const auto &observers) { return observers; });
  for (const auto &entry : observers) {
    const auto id = entry.first;
    // An earlier observer may have removed this one.
    if (!observers_.WithLock([id](const auto &current) { return current.contains(id); })) continue;
    try {
      entry.second(*notification);
    } catch (const std::exception &e) {
      spdlog::error("Lock notification observer {} failed: {}", id, e.what());
    }
  }
}

}  // namespace leasehold::locks
