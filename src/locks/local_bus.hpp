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

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "locks/bus.hpp"

namespace leasehold::locks {

/**
 * In-process bus connecting contexts which live in the same process (and the
 * unit tests). Messages are queued by `Publish` and handed to subscribers on a
 * dedicated dispatcher thread, so publishing never waits for a handler.
 */
class LocalBus final : public Bus {
 public:
  LocalBus();
  ~LocalBus() override;

  LocalBus(const LocalBus &) = delete;
  LocalBus &operator=(const LocalBus &) = delete;
  LocalBus(LocalBus &&) = delete;
  LocalBus &operator=(LocalBus &&) = delete;

  /// @throw BusError after `Shutdown`.
  SubscriptionId Subscribe(const std::string &topic, Handler handler) override;

  void Unsubscribe(SubscriptionId id) override;

  /// @throw BusError after `Shutdown`.
  void Publish(const std::string &topic, std::string message, SubscriptionId origin) override;

  /// Blocks until every message published so far has been delivered. Must not
  /// be called from a handler.
  void Flush();

  /// Stops the dispatcher. Messages which weren't delivered yet are dropped.
  void Shutdown();

 private:
  struct Envelope {
    std::string topic;
    std::string message;
    SubscriptionId origin;
  };

  struct Subscriber {
    std::string topic;
    Handler handler;
  };

  void DispatchLoop(std::stop_token token);
  bool IsSubscribed(SubscriptionId id);

  // Guards everything below except the dispatcher thread handle.
  std::mutex mutex_;
  std::condition_variable_any queue_cv_;
  std::condition_variable_any idle_cv_;
  std::deque<Envelope> queue_;
  std::map<SubscriptionId, Subscriber> subscribers_;
  SubscriptionId next_id_{kNoSubscription + 1};
  bool dispatching_{false};
  bool shut_down_{false};

  // Held while handlers run; `Unsubscribe` takes it so a handler is never
  // called after its subscription is gone. Always taken before `mutex_`.
  std::mutex delivery_mutex_;

  std::jthread dispatcher_;
};

}  // namespace leasehold::locks
