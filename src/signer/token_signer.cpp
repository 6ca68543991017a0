#include "signer/token_signer.hpp"

#include <jwt-cpp/jwt.h>
#include <openssl/ec.h>

#include "util/file_util.hpp"
#include "util/my_logging.hpp"

namespace apnsclient {

TokenSigner::TokenSigner(std::string pkcs8_pem, std::string key_id,
                         std::string team_id, std::chrono::seconds ttl)
    : pem_(std::move(pkcs8_pem)), key_id_(std::move(key_id)),
      team_id_(std::move(team_id)), ttl_(ttl) {}

ApnsResult<std::shared_ptr<TokenSigner>>
TokenSigner::create(std::string pkcs8_pem, std::string key_id,
                    std::string team_id, std::chrono::seconds ttl) {
  using ReturnType = ApnsResult<std::shared_ptr<TokenSigner>>;
  ERR_clear_error();
  auto pkey = cryptutil::load_private_key_pem(pkcs8_pem);
  if (!pkey) {
    return ReturnType::Err(
        from_openssl(cryptutil::OpensslErrorStack::capture()));
  }
  if (EVP_PKEY_get_base_id(pkey.get()) != EVP_PKEY_EC) {
    return ReturnType::Err(from_openssl(cryptutil::OpensslErrorStack(
        {"signing key is not an EC key (ES256 requires P-256)"})));
  }

  std::shared_ptr<TokenSigner> signer(new TokenSigner(
      std::move(pkcs8_pem), std::move(key_id), std::move(team_id), ttl));
  // Sign once so an unusable key is reported at construction.
  auto first = signer->token_at(Clock::now());
  if (first.is_err()) {
    return ReturnType::Err(first.error());
  }
  return ReturnType::Ok(std::move(signer));
}

ApnsResult<std::shared_ptr<TokenSigner>>
TokenSigner::from_file(const std::filesystem::path &key_path,
                       std::string key_id, std::string team_id,
                       std::chrono::seconds ttl) {
  auto pem = fileutil::read_file(key_path);
  if (pem.is_err()) {
    return ApnsResult<std::shared_ptr<TokenSigner>>::Err(pem.error());
  }
  return create(pem.value(), std::move(key_id), std::move(team_id), ttl);
}

ApnsResult<std::string> TokenSigner::bearer_token() {
  return token_at(Clock::now());
}

ApnsResult<std::string> TokenSigner::token_at(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool fresh = !token_.empty() && now >= issued_at_ &&
                     now - issued_at_ < ttl_;
  if (fresh) {
    return ApnsResult<std::string>::Ok(token_);
  }

  auto signed_token = sign(now);
  if (signed_token.is_err()) {
    return signed_token;
  }
  token_ = signed_token.value();
  issued_at_ = now;
  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << "Renewed provider token for key_id=" << key_id_;
  return ApnsResult<std::string>::Ok(token_);
}

ApnsResult<std::string> TokenSigner::sign(Clock::time_point issued_at) const {
  try {
    auto token = jwt::create()
                     .set_key_id(key_id_)
                     .set_issuer(team_id_)
                     .set_issued_at(issued_at)
                     .sign(jwt::algorithm::es256{"", pem_});
    return ApnsResult<std::string>::Ok(std::move(token));
  } catch (const std::exception &ex) {
    return ApnsResult<std::string>::Err(from_signer_exception(ex));
  }
}

} // namespace apnsclient
