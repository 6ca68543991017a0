#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "apns_error.hpp"
#include "conf/logging_config.hpp"

namespace apnsclient {
namespace fs = std::filesystem;

enum class Endpoint { Production, Sandbox };

inline constexpr const char *kProductionHost = "api.push.apple.com";
inline constexpr const char *kSandboxHost = "api.sandbox.push.apple.com";

struct ApnsClientConfig {
  Endpoint endpoint{Endpoint::Production};
  // Overrides the host implied by `endpoint`.
  std::optional<std::string> host;
  std::string port{"443"};
  // Default apns-topic, usually the app bundle id.
  std::optional<std::string> topic;

  // Token based authentication.
  std::optional<std::string> team_id;
  std::optional<std::string> key_id;
  std::optional<std::string> signing_key_path;
  int token_ttl_seconds{55 * 60};

  // Certificate based authentication.
  std::optional<std::string> client_cert_path;
  std::optional<std::string> client_key_path;

  bool verify_tls{true};
  int request_timeout_ms{20000};
  LoggingConfig logging{};

  std::string effective_host() const {
    if (host) {
      return *host;
    }
    return endpoint == Endpoint::Sandbox ? kSandboxHost : kProductionHost;
  }

  bool uses_token_auth() const { return signing_key_path.has_value(); }

  std::chrono::milliseconds request_timeout() const {
    return std::chrono::milliseconds(request_timeout_ms);
  }

  // Exactly one complete authentication method and positive timeouts.
  ApnsResult<void> validate() const;

  friend ApnsClientConfig
  tag_invoke(const boost::json::value_to_tag<ApnsClientConfig> &,
             const boost::json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("ApnsClientConfig is not an object");
    }
    const auto &obj = jv.as_object();
    ApnsClientConfig cfg{};
    auto opt_string = [&obj](const char *key) -> std::optional<std::string> {
      if (auto *p = obj.if_contains(key); p && p->is_string()) {
        return std::string(p->as_string());
      }
      return std::nullopt;
    };
    if (auto ep = opt_string("endpoint")) {
      if (*ep == "production") {
        cfg.endpoint = Endpoint::Production;
      } else if (*ep == "sandbox") {
        cfg.endpoint = Endpoint::Sandbox;
      } else {
        throw std::runtime_error("ApnsClientConfig.endpoint must be "
                                 "'production' or 'sandbox'");
      }
    }
    cfg.host = opt_string("host");
    if (auto *p = obj.if_contains("port")) {
      cfg.port = p->is_string() ? std::string(p->as_string())
                                : std::to_string(p->to_number<int>());
    }
    cfg.topic = opt_string("topic");
    cfg.team_id = opt_string("team_id");
    cfg.key_id = opt_string("key_id");
    cfg.signing_key_path = opt_string("signing_key_path");
    cfg.client_cert_path = opt_string("client_cert_path");
    cfg.client_key_path = opt_string("client_key_path");
    if (auto *p = obj.if_contains("token_ttl_seconds")) {
      cfg.token_ttl_seconds = p->to_number<int>();
    }
    if (auto *p = obj.if_contains("verify_tls"); p && p->is_bool()) {
      cfg.verify_tls = p->as_bool();
    }
    if (auto *p = obj.if_contains("request_timeout_ms")) {
      cfg.request_timeout_ms = p->to_number<int>();
    }
    if (auto *p = obj.if_contains("logging")) {
      cfg.logging = boost::json::value_to<LoggingConfig>(*p);
    }
    return cfg;
  }
};

// Unreadable file: ReadFailure. Malformed JSON: SerializeFailure. Failed
// validate(): InvalidOptions.
ApnsResult<ApnsClientConfig> load_client_config(const fs::path &path);

} // namespace apnsclient
