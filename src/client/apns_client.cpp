#include "client/apns_client.hpp"

#include <boost/json.hpp>

#include "transport/beast_transport.hpp"
#include "util/my_logging.hpp"

namespace apnsclient {
namespace json = boost::json;

ApnsResult<DeliveryResponse> interpret_reply(const GatewayReply &reply) {
  DeliveryResponse response;
  response.code = reply.status;
  if (auto it = reply.headers.find("apns-id"); it != reply.headers.end()) {
    response.apns_id = it->second;
  }
  if (reply.status == 200) {
    return ApnsResult<DeliveryResponse>::Ok(std::move(response));
  }

  if (!reply.body.empty()) {
    boost::system::error_code ec;
    auto jv = json::parse(reply.body, ec);
    if (!ec) {
      try {
        response.error = json::value_to<ReasonBody>(jv);
      } catch (const std::exception &ex) {
        BOOST_LOG_SEV(app_logger(), trivial::debug)
            << "Gateway rejection body has no reason: " << ex.what();
      }
    } else {
      BOOST_LOG_SEV(app_logger(), trivial::debug)
          << "Gateway rejection body is not JSON: " << ec.message();
    }
  }
  return ApnsResult<DeliveryResponse>::Err(rejected(std::move(response)));
}

ApnsClient::ApnsClient(ApnsClientConfig config,
                       std::shared_ptr<ITransport> transport,
                       std::shared_ptr<ITokenSigner> signer)
    : config_(std::move(config)), transport_(std::move(transport)),
      signer_(std::move(signer)) {}

ApnsResult<std::unique_ptr<ApnsClient>>
ApnsClient::create(const ApnsClientConfig &config) {
  using ReturnType = ApnsResult<std::unique_ptr<ApnsClient>>;
  auto valid = config.validate();
  if (valid.is_err()) {
    return ReturnType::Err(valid.error());
  }

  auto transport = BeastTransport::create(config);
  if (transport.is_err()) {
    return ReturnType::Err(transport.error());
  }

  std::shared_ptr<ITokenSigner> signer;
  if (config.uses_token_auth()) {
    auto token_signer = TokenSigner::from_file(
        *config.signing_key_path, *config.key_id, *config.team_id,
        std::chrono::seconds(config.token_ttl_seconds));
    if (token_signer.is_err()) {
      return ReturnType::Err(token_signer.error());
    }
    signer = token_signer.value();
  }

  BOOST_LOG_SEV(app_logger(), trivial::info)
      << "Gateway client ready for " << config.effective_host() << ':'
      << config.port << (signer ? " (token auth)" : " (certificate auth)");
  return ReturnType::Ok(std::make_unique<ApnsClient>(
      config, transport.value(), std::move(signer)));
}

ApnsResult<DeliveryResponse> ApnsClient::send(const Notification &notification) {
  return send_with_timeout(notification, config_.request_timeout());
}

ApnsResult<GatewayRequest>
ApnsClient::build_request(const Notification &notification) {
  using ReturnType = ApnsResult<GatewayRequest>;
  auto valid = notification.validate();
  if (valid.is_err()) {
    return ReturnType::Err(valid.error());
  }

  GatewayRequest request;
  request.host = config_.effective_host();
  request.port = config_.port;
  request.path = notification.path();
  request.headers = notification.build_headers(config_.topic);

  if (signer_) {
    auto token = signer_->bearer_token();
    if (token.is_err()) {
      return ReturnType::Err(token.error());
    }
    request.headers["authorization"] = "bearer " + token.value();
  }

  try {
    request.body = json::serialize(notification.payload);
  } catch (const std::exception &ex) {
    return ReturnType::Err(from_json_exception(ex));
  }
  return ReturnType::Ok(std::move(request));
}

ApnsResult<DeliveryResponse>
ApnsClient::send_with_timeout(const Notification &notification,
                              std::chrono::milliseconds timeout) {
  using ReturnType = ApnsResult<DeliveryResponse>;
  BOOST_LOG_SEV(app_logger(), trivial::trace)
      << "Sending notification to device " << notification.device_token
      << " (timeout " << timeout.count() << "ms)";

  auto request = build_request(notification);
  if (request.is_err()) {
    const auto &err = request.error();
    BOOST_LOG_SEV(app_logger(), err.error_class() == ErrorClass::LocalInput
                                    ? trivial::warning
                                    : trivial::error)
        << "Notification not sent: " << err << " "
        << err.detail().value_or("");
    return ReturnType::Err(err);
  }

  auto reply = transport_->round_trip(request.value(), timeout);
  if (reply.is_err()) {
    const auto &err = reply.error();
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "Gateway exchange failed: " << err << " "
        << err.detail().value_or("");
    return ReturnType::Err(err);
  }

  auto outcome = interpret_reply(reply.value());
  if (outcome.is_err()) {
    BOOST_LOG_SEV(app_logger(), trivial::warning)
        << "Gateway refused notification for device "
        << notification.device_token << " with status "
        << reply.value().status << ": " << outcome.error();
  } else {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "Notification accepted, apns-id="
        << outcome.value().apns_id.value_or("<none>");
  }
  return outcome;
}

} // namespace apnsclient
