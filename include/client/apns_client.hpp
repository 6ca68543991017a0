#pragma once

#include <chrono>
#include <memory>

#include "apns_error.hpp"
#include "conf/apns_client_config.hpp"
#include "data/delivery_response.hpp"
#include "request/notification.hpp"
#include "signer/token_signer.hpp"
#include "transport/i_transport.hpp"

namespace apnsclient {

// 200 is a delivery; every other status is a RemoteRejection. A body that is
// missing or does not decode leaves the rejection without a reason.
ApnsResult<DeliveryResponse> interpret_reply(const GatewayReply &reply);

class ApnsClient {
public:
  // `signer` may be null when the transport authenticates with a client
  // certificate.
  ApnsClient(ApnsClientConfig config, std::shared_ptr<ITransport> transport,
             std::shared_ptr<ITokenSigner> signer);

  // Wires a BeastTransport and, for token authentication, a TokenSigner.
  static ApnsResult<std::unique_ptr<ApnsClient>>
  create(const ApnsClientConfig &config);

  ApnsResult<DeliveryResponse> send(const Notification &notification);
  ApnsResult<DeliveryResponse>
  send_with_timeout(const Notification &notification,
                    std::chrono::milliseconds timeout);

  const ApnsClientConfig &config() const { return config_; }

private:
  ApnsResult<GatewayRequest> build_request(const Notification &notification);

  ApnsClientConfig config_;
  std::shared_ptr<ITransport> transport_;
  std::shared_ptr<ITokenSigner> signer_;
};

} // namespace apnsclient
