#include "data/delivery_response.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace apnsclient {
namespace json = boost::json;

namespace {

constexpr std::array<std::pair<std::string_view, ErrorReason>, 29>
    kReasonNames{{
        {"BadCollapseId", ErrorReason::BadCollapseId},
        {"BadDeviceToken", ErrorReason::BadDeviceToken},
        {"BadExpirationDate", ErrorReason::BadExpirationDate},
        {"BadMessageId", ErrorReason::BadMessageId},
        {"BadPriority", ErrorReason::BadPriority},
        {"BadTopic", ErrorReason::BadTopic},
        {"DeviceTokenNotForTopic", ErrorReason::DeviceTokenNotForTopic},
        {"DuplicateHeaders", ErrorReason::DuplicateHeaders},
        {"IdleTimeout", ErrorReason::IdleTimeout},
        {"InvalidPushType", ErrorReason::InvalidPushType},
        {"MissingDeviceToken", ErrorReason::MissingDeviceToken},
        {"MissingTopic", ErrorReason::MissingTopic},
        {"PayloadEmpty", ErrorReason::PayloadEmpty},
        {"TopicDisallowed", ErrorReason::TopicDisallowed},
        {"BadCertificate", ErrorReason::BadCertificate},
        {"BadCertificateEnvironment", ErrorReason::BadCertificateEnvironment},
        {"ExpiredProviderToken", ErrorReason::ExpiredProviderToken},
        {"Forbidden", ErrorReason::Forbidden},
        {"InvalidProviderToken", ErrorReason::InvalidProviderToken},
        {"MissingProviderToken", ErrorReason::MissingProviderToken},
        {"BadPath", ErrorReason::BadPath},
        {"MethodNotAllowed", ErrorReason::MethodNotAllowed},
        {"Unregistered", ErrorReason::Unregistered},
        {"PayloadTooLarge", ErrorReason::PayloadTooLarge},
        {"TooManyProviderTokenUpdates",
         ErrorReason::TooManyProviderTokenUpdates},
        {"TooManyRequests", ErrorReason::TooManyRequests},
        {"InternalServerError", ErrorReason::InternalServerError},
        {"ServiceUnavailable", ErrorReason::ServiceUnavailable},
        {"Shutdown", ErrorReason::Shutdown},
    }};

} // namespace

ErrorReason parse_error_reason(std::string_view reason) {
  for (const auto &[name, value] : kReasonNames) {
    if (name == reason) {
      return value;
    }
  }
  return ErrorReason::Unknown;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const ReasonBody &body) {
  json::object obj{{"reason", body.reason}};
  if (body.timestamp) {
    obj["timestamp"] = *body.timestamp;
  }
  jv = std::move(obj);
}

ReasonBody tag_invoke(const json::value_to_tag<ReasonBody> &,
                      const json::value &jv) {
  if (!jv.is_object()) {
    throw std::runtime_error("ReasonBody must be an object");
  }
  const auto &obj = jv.as_object();
  ReasonBody body;
  if (auto *p = obj.if_contains("reason"); p && p->is_string()) {
    body.reason = std::string(p->as_string());
  } else {
    throw std::runtime_error("ReasonBody missing string field 'reason'");
  }
  // A malformed timestamp is dropped; the reason still stands.
  if (auto *p = obj.if_contains("timestamp"); p && !p->is_null()) {
    boost::system::error_code ec;
    auto ts = p->to_number<std::uint64_t>(ec);
    if (!ec) {
      body.timestamp = ts;
    }
  }
  return body;
}

} // namespace apnsclient
