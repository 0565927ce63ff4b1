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

#include "locks/notification.hpp"

#include <array>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "utils/enum.hpp"
#include "utils/logging.hpp"

using namespace std::string_view_literals;

namespace leasehold::locks {

namespace {
constexpr auto kType = "type";
constexpr auto kResourceId = "resourceId";
constexpr auto kOwnerId = "ownerId";

inline constexpr std::array notification_type_mappings{std::pair{"acquired"sv, NotificationType::ACQUIRED},
                                                       std::pair{"released"sv, NotificationType::RELEASED},
                                                       std::pair{"ping"sv, NotificationType::PING}};
}  // namespace

std::string_view NotificationTypeToString(const NotificationType type) {
  const auto name = utils::EnumToString<NotificationType>(type, notification_type_mappings);
  LH_ASSERT(name, "Unknown notification type {}", static_cast<int>(type));
  return *name;
}

std::string SerializeNotification(const Notification &notification) {
  nlohmann::json data = nlohmann::json::object();
  data[kType] = NotificationTypeToString(notification.type);
  data[kResourceId] = notification.resource_id;
  data[kOwnerId] = notification.owner_id;
  return data.dump();
}

std::expected<Notification, std::string> ParseNotification(std::string_view message) {
  const auto data = nlohmann::json::parse(message, nullptr, /*allow_exceptions=*/false);
  if (data.is_discarded()) return std::unexpected{std::string{"message is not valid JSON"}};
  if (!data.is_object()) return std::unexpected{std::string{"message is not a JSON object"}};

  const auto type = data.find(kType);
  if (type == data.end() || !type->is_string()) return std::unexpected{std::string{"missing message type"}};
  const auto maybe_type =
      utils::StringToEnum<NotificationType>(type->get_ref<const std::string &>(), notification_type_mappings);
  if (!maybe_type) {
    return std::unexpected{fmt::format("unknown message type '{}', allowed values: {}",
                                       type->get_ref<const std::string &>(),
                                       utils::GetAllowedEnumValuesString(notification_type_mappings))};
  }

  const auto resource_id = data.find(kResourceId);
  if (resource_id == data.end() || !resource_id->is_string() || resource_id->get_ref<const std::string &>().empty()) {
    return std::unexpected{std::string{"missing resourceId"}};
  }
  const auto owner_id = data.find(kOwnerId);
  if (owner_id == data.end() || !owner_id->is_string() || owner_id->get_ref<const std::string &>().empty()) {
    return std::unexpected{std::string{"missing ownerId"}};
  }

  return Notification{.type = *maybe_type,
                      .resource_id = resource_id->get<std::string>(),
                      .owner_id = owner_id->get<std::string>()};
}

}  // namespace leasehold::locks
