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

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "locks/exceptions.hpp"
#include "locks/local_bus.hpp"
#include "locks/notification_relay.hpp"
#include "tests/unit/locks_fakes.hpp"

using namespace std::chrono_literals;
using leasehold::locks::BusError;
using leasehold::locks::Notification;
using leasehold::locks::NotificationRelay;
using leasehold::locks::NotificationType;
using leasehold::locks::test::MockBus;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {
const Notification kAcquired{.type = NotificationType::ACQUIRED, .resource_id = "proj-1", .owner_id = "ctx-a"};
}  // namespace

TEST(NotificationRelay, PublishUsesOwnSubscriptionAsOrigin) {
  MockBus bus;
  EXPECT_CALL(bus, Subscribe("leasehold-locks", _)).WillOnce(Return(7));
  EXPECT_CALL(bus, Publish("leasehold-locks", leasehold::locks::SerializeNotification(kAcquired), 7));
  EXPECT_CALL(bus, Unsubscribe(7));

  NotificationRelay relay(bus, "leasehold-locks");
  ASSERT_TRUE(relay.Start());
  ASSERT_TRUE(relay.Start());
  EXPECT_TRUE(relay.IsSubscribed());
  relay.Publish(kAcquired);
}

TEST(NotificationRelay, PublishWithoutSubscription) {
  MockBus bus;
  EXPECT_CALL(bus, Publish("leasehold-locks", _, leasehold::locks::kNoSubscription));
  NotificationRelay relay(bus, "leasehold-locks");
  relay.Publish(kAcquired);
}

TEST(NotificationRelay, BusFailuresAreSwallowed) {
  MockBus bus;
  EXPECT_CALL(bus, Subscribe(_, _)).WillOnce(Throw(BusError("bus is down")));
  EXPECT_CALL(bus, Publish(_, _, _)).WillOnce(Throw(BusError("bus is down")));
  EXPECT_CALL(bus, Unsubscribe(_)).Times(0);

  NotificationRelay relay(bus, "leasehold-locks");
  EXPECT_FALSE(relay.Start());
  EXPECT_FALSE(relay.IsSubscribed());
  ASSERT_NO_THROW(relay.Publish(kAcquired));
}

TEST(NotificationRelay, StopUnsubscribesOnce) {
  MockBus bus;
  EXPECT_CALL(bus, Subscribe(_, _)).WillOnce(Return(3));
  EXPECT_CALL(bus, Unsubscribe(3)).Times(1);
  NotificationRelay relay(bus, "leasehold-locks");
  relay.Start();
  relay.Stop();
  relay.Stop();
  EXPECT_FALSE(relay.IsSubscribed());
}

TEST(NotificationRelay, DeliverFansOutValidMessages) {
  MockBus bus;
  NotificationRelay relay(bus, "leasehold-locks");
  std::vector<Notification> first;
  std::vector<Notification> second;
  relay.AddObserver([&](const Notification &n) { first.push_back(n); });
  const auto id = relay.AddObserver([&](const Notification &n) { second.push_back(n); });

  relay.Deliver(leasehold::locks::SerializeNotification(kAcquired));
  relay.Deliver("not json at all");
  relay.Deliver(R"({"type": "stolen", "resourceId": "proj-1", "ownerId": "ctx-a"})");
  ASSERT_TRUE(relay.RemoveObserver(id));
  ASSERT_FALSE(relay.RemoveObserver(id));
  relay.Deliver(R"({"type": "ping", "resourceId": "proj-1", "ownerId": "ctx-a"})");

  ASSERT_EQ(first.size(), 2);
  EXPECT_EQ(first[0], kAcquired);
  EXPECT_EQ(first[1].type, NotificationType::PING);
  EXPECT_EQ(second, std::vector<Notification>{kAcquired});
}

TEST(NotificationRelay, ThrowingObserverIsIsolated) {
  MockBus bus;
  NotificationRelay relay(bus, "leasehold-locks");
  int calls = 0;
  relay.AddObserver([](const Notification &) { throw std::runtime_error("observer failure"); });
  relay.AddObserver([&](const Notification &) { ++calls; });
  ASSERT_NO_THROW(relay.Deliver(leasehold::locks::SerializeNotification(kAcquired)));
  EXPECT_EQ(calls, 1);
}

TEST(NotificationRelay, ObserverMayRemoveItself) {
  MockBus bus;
  NotificationRelay relay(bus, "leasehold-locks");
  int calls = 0;
  NotificationRelay::ObserverId id{};
  id = relay.AddObserver([&](const Notification &) {
    ++calls;
    relay.RemoveObserver(id);
  });
  relay.Deliver(leasehold::locks::SerializeNotification(kAcquired));
  relay.Deliver(leasehold::locks::SerializeNotification(kAcquired));
  EXPECT_EQ(calls, 1);
}

TEST(NotificationRelay, ObserverMayRemoveAnother) {
  MockBus bus;
  NotificationRelay relay(bus, "leasehold-locks");
  int calls = 0;
  NotificationRelay::ObserverId second{};
  // Added first, so it runs first.
  relay.AddObserver([&](const Notification &) { relay.RemoveObserver(second); });
  second = relay.AddObserver([&](const Notification &) { ++calls; });
  relay.Deliver(leasehold::locks::SerializeNotification(kAcquired));
  relay.Deliver(leasehold::locks::SerializeNotification(kAcquired));
  EXPECT_EQ(calls, 0);
}

TEST(NotificationRelay, RemoveObserverWaitsForDelivery) {
  MockBus bus;
  NotificationRelay relay(bus, "leasehold-locks");
  std::atomic<bool> entered{false};
  std::atomic<bool> removed{false};
  std::atomic<int> calls_after_removal{0};
  relay.AddObserver([&](const Notification &) {
    entered = true;
    std::this_thread::sleep_for(200ms);
  });
  const auto second = relay.AddObserver([&](const Notification &) {
    if (removed) ++calls_after_removal;
  });

  std::jthread deliverer([&] { relay.Deliver(leasehold::locks::SerializeNotification(kAcquired)); });
  while (!entered) std::this_thread::sleep_for(1ms);
  EXPECT_TRUE(relay.RemoveObserver(second));
  removed = true;
  deliverer.join();
  EXPECT_EQ(calls_after_removal, 0);
}

TEST(NotificationRelay, OverLocalBus) {
  std::vector<Notification> sent_back;
  std::vector<Notification> received;
  leasehold::locks::LocalBus bus;
  NotificationRelay sender(bus, "leasehold-locks");
  NotificationRelay receiver(bus, "leasehold-locks");
  sender.AddObserver([&](const Notification &n) { sent_back.push_back(n); });
  receiver.AddObserver([&](const Notification &n) { received.push_back(n); });
  ASSERT_TRUE(sender.Start());
  ASSERT_TRUE(receiver.Start());

  sender.Publish(kAcquired);
  bus.Flush();

  EXPECT_TRUE(sent_back.empty());
  EXPECT_EQ(received, std::vector<Notification>{kAcquired});
}
