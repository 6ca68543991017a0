#include "conf/apns_client_config.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

#include "util/file_util.hpp"
#include "util/my_logging.hpp"

namespace apnsclient {

ApnsResult<void> ApnsClientConfig::validate() const {
  const bool token_auth = signing_key_path || key_id || team_id;
  const bool cert_auth = client_cert_path || client_key_path;
  if (token_auth && cert_auth) {
    return ApnsResult<void>::Err(invalid_options(
        "Configure either token (signing_key_path) or certificate "
        "(client_cert_path) authentication, not both."));
  }
  if (!token_auth && !cert_auth) {
    return ApnsResult<void>::Err(invalid_options(
        "No authentication configured: set signing_key_path, key_id and "
        "team_id, or client_cert_path."));
  }
  if (token_auth && !(signing_key_path && key_id && team_id)) {
    return ApnsResult<void>::Err(invalid_options(
        "Token authentication needs signing_key_path, key_id and team_id."));
  }
  if (cert_auth && !client_cert_path) {
    return ApnsResult<void>::Err(
        invalid_options("client_key_path given without client_cert_path."));
  }
  if (topic && std::any_of(topic->begin(), topic->end(), [](unsigned char c) {
        return std::iscntrl(c) != 0;
      })) {
    return ApnsResult<void>::Err(
        invalid_options("topic contains control characters."));
  }
  if (request_timeout_ms <= 0) {
    return ApnsResult<void>::Err(invalid_options(fmt::format(
        "request_timeout_ms must be positive, got {}.", request_timeout_ms)));
  }
  if (token_auth && token_ttl_seconds <= 0) {
    return ApnsResult<void>::Err(invalid_options(fmt::format(
        "token_ttl_seconds must be positive, got {}.", token_ttl_seconds)));
  }
  return ApnsResult<void>::Ok();
}

ApnsResult<ApnsClientConfig> load_client_config(const fs::path &path) {
  using ReturnType = ApnsResult<ApnsClientConfig>;
  auto text = fileutil::read_file(path);
  if (text.is_err()) {
    return ReturnType::Err(text.error());
  }

  boost::system::error_code ec;
  auto jv = boost::json::parse(text.value(), ec);
  if (ec) {
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "Config " << path << " is not valid JSON: " << ec.message();
    return ReturnType::Err(from_json_error(ec));
  }

  ApnsClientConfig cfg;
  try {
    cfg = boost::json::value_to<ApnsClientConfig>(jv);
  } catch (const std::exception &ex) {
    BOOST_LOG_SEV(app_logger(), trivial::error)
        << "Config " << path << " has an unexpected shape: " << ex.what();
    return ReturnType::Err(from_json_exception(ex));
  }

  auto valid = cfg.validate();
  if (valid.is_err()) {
    return ReturnType::Err(valid.error());
  }
  return ReturnType::Ok(std::move(cfg));
}

} // namespace apnsclient
