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

#include "locks/local_bus.hpp"

#include <utility>
#include <vector>

#include "locks/exceptions.hpp"
#include "utils/logging.hpp"
#include "utils/thread.hpp"

namespace leasehold::locks {

LocalBus::LocalBus() {
  dispatcher_ = std::jthread([this](std::stop_token token) { DispatchLoop(token); });
}

LocalBus::~LocalBus() { Shutdown(); }

SubscriptionId LocalBus::Subscribe(const std::string &topic, Handler handler) {
  auto guard = std::lock_guard{mutex_};
  if (shut_down_) throw BusError("Can't subscribe to '{}', the bus is shut down", topic);
  const auto id = next_id_++;
  subscribers_.emplace(id, Subscriber{.topic = topic, .handler = std::move(handler)});
  return id;
}

void LocalBus::Unsubscribe(const SubscriptionId id) {
  // Handlers run with the delivery mutex held.
  std::unique_lock<std::mutex> delivery_guard;
  if (std::this_thread::get_id() != dispatcher_.get_id()) {
    delivery_guard = std::unique_lock{delivery_mutex_};
  }
  auto guard = std::lock_guard{mutex_};
  subscribers_.erase(id);
}

bool LocalBus::IsSubscribed(const SubscriptionId id) {
  auto guard = std::lock_guard{mutex_};
  return subscribers_.contains(id);
}

void LocalBus::Publish(const std::string &topic, std::string message, const SubscriptionId origin) {
  {
    auto guard = std::lock_guard{mutex_};
    if (shut_down_) throw BusError("Can't publish on '{}', the bus is shut down", topic);
    queue_.push_back(Envelope{.topic = topic, .message = std::move(message), .origin = origin});
  }
  queue_cv_.notify_one();
}

void LocalBus::Flush() {
  DLH_ASSERT(std::this_thread::get_id() != dispatcher_.get_id(), "LocalBus::Flush called from a handler");
  auto lock = std::unique_lock{mutex_};
  idle_cv_.wait(lock, [this] { return shut_down_ || (queue_.empty() && !dispatching_); });
}

void LocalBus::Shutdown() {
  {
    auto guard = std::lock_guard{mutex_};
    if (shut_down_) return;
    shut_down_ = true;
    if (!queue_.empty()) spdlog::debug("LocalBus dropping {} undelivered message(s)", queue_.size());
    queue_.clear();
  }
  dispatcher_.request_stop();
  idle_cv_.notify_all();
  if (dispatcher_.joinable() && dispatcher_.get_id() != std::this_thread::get_id()) dispatcher_.join();
}

void LocalBus::DispatchLoop(std::stop_token token) {
  utils::ThreadSetName("LocalBus");

  while (true) {
    Envelope envelope;
    {
      auto lock = std::unique_lock{mutex_};
      if (!queue_cv_.wait(lock, token, [this] { return !queue_.empty(); })) break;
      envelope = std::move(queue_.front());
      queue_.pop_front();
      dispatching_ = true;
    }

    {
      auto delivery_guard = std::lock_guard{delivery_mutex_};
      std::vector<std::pair<SubscriptionId, Handler>> targets;
      {
        auto guard = std::lock_guard{mutex_};
        for (const auto &[id, subscriber] : subscribers_) {
          if (id == envelope.origin || subscriber.topic != envelope.topic) continue;
          targets.emplace_back(id, subscriber.handler);
        }
      }
      for (const auto &[id, handler] : targets) {
        // An earlier handler of this message may have unsubscribed it.
        if (!IsSubscribed(id)) continue;
        try {
          handler(envelope.message);
        } catch (const std::exception &e) {
          spdlog::error("LocalBus handler on topic '{}' failed: {}", envelope.topic, e.what());
        }
      }
    }

    {
      auto guard = std::lock_guard{mutex_};
      dispatching_ = false;
    }
    idle_cv_.notify_all();
  }
}

}  // namespace leasehold::locks
