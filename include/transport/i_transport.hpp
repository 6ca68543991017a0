#pragma once

#include <chrono>
#include <string>

#include "apns_error.hpp"
#include "request/notification.hpp"

namespace apnsclient {

struct GatewayRequest {
  std::string host;
  std::string port{"443"};
  std::string path;
  HeaderMap headers;
  std::string body;
};

struct GatewayReply {
  int status{0};
  HeaderMap headers;
  std::string body;
};

// One request/response exchange with the gateway. Implementations report
// only transport level failures (Connection, Tls, Read, Timeout); any HTTP
// status is a successful round trip.
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual ApnsResult<GatewayReply>
  round_trip(const GatewayRequest &request,
             std::chrono::milliseconds timeout) = 0;
};

} // namespace apnsclient
