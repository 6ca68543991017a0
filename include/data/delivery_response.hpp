#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace apnsclient {

// Reasons documented by the gateway for a refused notification.
enum class ErrorReason {
  BadCollapseId,
  BadDeviceToken,
  BadExpirationDate,
  BadMessageId,
  BadPriority,
  BadTopic,
  DeviceTokenNotForTopic,
  DuplicateHeaders,
  IdleTimeout,
  InvalidPushType,
  MissingDeviceToken,
  MissingTopic,
  PayloadEmpty,
  TopicDisallowed,
  BadCertificate,
  BadCertificateEnvironment,
  ExpiredProviderToken,
  Forbidden,
  InvalidProviderToken,
  MissingProviderToken,
  BadPath,
  MethodNotAllowed,
  Unregistered,
  PayloadTooLarge,
  TooManyProviderTokenUpdates,
  TooManyRequests,
  InternalServerError,
  ServiceUnavailable,
  Shutdown,
  Unknown,
};

ErrorReason parse_error_reason(std::string_view reason);

// Body of a refused request: {"reason": "...", "timestamp": 1234}
struct ReasonBody {
  std::string reason;
  // Milliseconds since epoch; only sent with Unregistered.
  std::optional<std::uint64_t> timestamp;

  ErrorReason known_reason() const { return parse_error_reason(reason); }

  bool operator==(const ReasonBody &) const = default;
};

struct DeliveryResponse {
  int code{200};
  std::optional<std::string> apns_id;
  std::optional<ReasonBody> error;

  bool operator==(const DeliveryResponse &) const = default;
};

void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const ReasonBody &body);
ReasonBody tag_invoke(const boost::json::value_to_tag<ReasonBody> &,
                      const boost::json::value &jv);

} // namespace apnsclient
