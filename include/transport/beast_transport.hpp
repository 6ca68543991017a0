#pragma once

#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ssl/context.hpp>

#include "conf/apns_client_config.hpp"
#include "transport/i_transport.hpp"

namespace apnsclient {

// Puts `host` in the ClientHello. OpenSSL refusing it is a TlsFailure.
ApnsResult<void> set_sni_host(SSL *ssl, const std::string &host);

class BeastTransport : public ITransport {
public:
  // Builds the TLS client context. Certificate files that cannot be read are
  // ReadFailure; material OpenSSL refuses is TlsFailure.
  static ApnsResult<std::shared_ptr<BeastTransport>>
  create(const ApnsClientConfig &config);

  ApnsResult<GatewayReply> round_trip(const GatewayRequest &request,
                                      std::chrono::milliseconds timeout) override;

private:
  explicit BeastTransport(bool verify_tls);

  bool verify_tls_;
  boost::asio::ssl::context ssl_ctx_;
};

} // namespace apnsclient
