#include "request/notification.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace apnsclient {
namespace json = boost::json;

namespace {

constexpr std::array<std::pair<std::string_view, PushType>, 8> kPushTypes{{
    {"alert", PushType::Alert},
    {"background", PushType::Background},
    {"location", PushType::Location},
    {"voip", PushType::Voip},
    {"complication", PushType::Complication},
    {"fileprovider", PushType::FileProvider},
    {"mdm", PushType::Mdm},
    {"liveactivity", PushType::LiveActivity},
}};

// 8-4-4-4-12 hex digits separated by dashes.
bool is_canonical_uuid(std::string_view id) {
  if (id.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < id.size(); ++i) {
    const bool dash_pos = i == 8 || i == 13 || i == 18 || i == 23;
    if (dash_pos) {
      if (id[i] != '-') {
        return false;
      }
    } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
      return false;
    }
  }
  return true;
}

bool is_hex_token(std::string_view token) {
  return !token.empty() &&
         std::all_of(token.begin(), token.end(), [](unsigned char c) {
           return std::isxdigit(c) != 0;
         });
}

bool has_control_chars(std::string_view value) {
  return std::any_of(value.begin(), value.end(), [](unsigned char c) {
    return std::iscntrl(c) != 0;
  });
}

} // namespace

std::string_view to_string(PushType type) {
  for (const auto &[name, value] : kPushTypes) {
    if (value == type) {
      return name;
    }
  }
  return "alert";
}

std::optional<PushType> parse_push_type(std::string_view name) {
  for (const auto &[candidate, value] : kPushTypes) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<Priority> parse_priority(int value) {
  switch (value) {
  case 10:
    return Priority::High;
  case 5:
    return Priority::Normal;
  case 1:
    return Priority::Low;
  default:
    return std::nullopt;
  }
}

ApnsResult<void> NotificationOptions::validate() const {
  if (apns_collapse_id && apns_collapse_id->size() > kMaxCollapseIdBytes) {
    return ApnsResult<void>::Err(invalid_options(fmt::format(
        "The collapse-id is too big. Maximum {} bytes, got {}.",
        kMaxCollapseIdBytes, apns_collapse_id->size())));
  }
  if (apns_collapse_id && has_control_chars(*apns_collapse_id)) {
    return ApnsResult<void>::Err(
        invalid_options("The collapse-id contains control characters."));
  }
  if (apns_topic && has_control_chars(*apns_topic)) {
    return ApnsResult<void>::Err(
        invalid_options("apns-topic contains control characters."));
  }
  if (apns_id && !is_canonical_uuid(*apns_id)) {
    return ApnsResult<void>::Err(invalid_options(fmt::format(
        "apns-id '{}' is not a canonical UUID (8-4-4-4-12).", *apns_id)));
  }
  if (apns_push_type == PushType::Background && apns_priority &&
      *apns_priority != Priority::Normal) {
    return ApnsResult<void>::Err(invalid_options(
        "Background notifications must use priority 5 (Normal)."));
  }
  return ApnsResult<void>::Ok();
}

ApnsResult<Notification> Notification::from_raw(std::string device_token,
                                                 std::string_view raw_payload,
                                                 NotificationOptions options) {
  boost::system::error_code ec;
  json::value payload = json::parse(raw_payload, ec);
  if (ec) {
    return ApnsResult<Notification>::Err(from_json_error(ec));
  }
  Notification n;
  n.device_token = std::move(device_token);
  n.options = std::move(options);
  n.payload = std::move(payload);
  return ApnsResult<Notification>::Ok(std::move(n));
}

ApnsResult<void> Notification::validate() const {
  if (device_token.empty()) {
    return ApnsResult<void>::Err(invalid_options("Device token is empty."));
  }
  if (!is_hex_token(device_token)) {
    return ApnsResult<void>::Err(
        invalid_options("Device token must be hexadecimal."));
  }
  if (!payload.is_object()) {
    return ApnsResult<void>::Err(
        invalid_options("Notification payload must be a JSON object."));
  }
  return options.validate();
}

std::string Notification::path() const {
  return fmt::format("/3/device/{}", device_token);
}

HeaderMap Notification::build_headers(
    const std::optional<std::string> &default_topic) const {
  HeaderMap headers;
  headers["apns-push-type"] = std::string(
      to_string(options.apns_push_type.value_or(PushType::Alert)));
  if (options.apns_id) {
    headers["apns-id"] = *options.apns_id;
  }
  if (options.apns_expiration) {
    headers["apns-expiration"] = std::to_string(*options.apns_expiration);
  }
  if (options.apns_priority) {
    headers["apns-priority"] =
        std::to_string(static_cast<int>(*options.apns_priority));
  }
  if (options.apns_topic) {
    headers["apns-topic"] = *options.apns_topic;
  } else if (default_topic) {
    headers["apns-topic"] = *default_topic;
  }
  if (options.apns_collapse_id) {
    headers["apns-collapse-id"] = *options.apns_collapse_id;
  }
  return headers;
}

} // namespace apnsclient
