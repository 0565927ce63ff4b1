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
#include <expected>
#include <string>
#include <string_view>

namespace leasehold::locks {

enum class NotificationType : uint8_t { ACQUIRED, RELEASED, PING };

std::string_view NotificationTypeToString(NotificationType type);

/// Advisory message exchanged between contexts over the bus. Never read back as
/// ground truth; the ledger is.
struct Notification {
  NotificationType type;
  std::string resource_id;
  std::string owner_id;

  friend bool operator==(const Notification &lhs, const Notification &rhs) = default;
};

/// Wire form: {"type": "acquired"|"released"|"ping", "resourceId": ..., "ownerId": ...}
std::string SerializeNotification(const Notification &notification);

/// Validates the shape of an inbound message. The error describes why the
/// message was rejected.
std::expected<Notification, std::string> ParseNotification(std::string_view message);

}  // namespace leasehold::locks
