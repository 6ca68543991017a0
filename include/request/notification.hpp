#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "apns_error.hpp"

namespace apnsclient {

using HeaderMap = std::unordered_map<std::string, std::string>;

enum class Priority { High = 10, Normal = 5, Low = 1 };

enum class PushType {
  Alert,
  Background,
  Location,
  Voip,
  Complication,
  FileProvider,
  Mdm,
  LiveActivity,
};

std::string_view to_string(PushType type);
std::optional<PushType> parse_push_type(std::string_view name);
std::optional<Priority> parse_priority(int value);

struct NotificationOptions {
  // Canonical UUID; the gateway generates one when absent.
  std::optional<std::string> apns_id;
  // Seconds since epoch; 0 means deliver once or discard.
  std::optional<std::uint64_t> apns_expiration;
  std::optional<Priority> apns_priority;
  std::optional<std::string> apns_collapse_id;
  std::optional<std::string> apns_topic;
  std::optional<PushType> apns_push_type;

  ApnsResult<void> validate() const;
};

inline constexpr std::size_t kMaxCollapseIdBytes = 64;

struct Notification {
  std::string device_token;
  NotificationOptions options;
  boost::json::value payload{boost::json::object{}};

  // Parses `raw_payload`; malformed JSON is a serialize failure.
  static ApnsResult<Notification> from_raw(std::string device_token,
                                           std::string_view raw_payload,
                                           NotificationOptions options = {});

  // Also requires a hexadecimal device token, since it becomes part of the
  // request path.
  ApnsResult<void> validate() const;

  std::string path() const;
  // Gateway headers derived from the options. `default_topic` fills in
  // apns-topic when the options carry none.
  HeaderMap build_headers(const std::optional<std::string> &default_topic) const;
};

} // namespace apnsclient
