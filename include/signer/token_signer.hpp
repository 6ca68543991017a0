#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "apns_error.hpp"

namespace apnsclient {

class ITokenSigner {
public:
  virtual ~ITokenSigner() = default;
  // Value for the `authorization` header, without the "bearer " prefix.
  virtual ApnsResult<std::string> bearer_token() = 0;
};

// Creates ES256 provider tokens and reuses each one until it is older than
// the configured time to live. The gateway refuses tokens older than one
// hour and throttles tokens renewed more often than every twenty minutes.
class TokenSigner : public ITokenSigner {
public:
  using Clock = std::chrono::system_clock;

  static constexpr std::chrono::seconds kDefaultTtl{55 * 60};

  // Fails with SigningFailure when `pkcs8_pem` is not a usable EC key.
  static ApnsResult<std::shared_ptr<TokenSigner>>
  create(std::string pkcs8_pem, std::string key_id, std::string team_id,
         std::chrono::seconds ttl = kDefaultTtl);

  // Fails with ReadFailure when the key file cannot be read.
  static ApnsResult<std::shared_ptr<TokenSigner>>
  from_file(const std::filesystem::path &key_path, std::string key_id,
            std::string team_id, std::chrono::seconds ttl = kDefaultTtl);

  ApnsResult<std::string> bearer_token() override;
  ApnsResult<std::string> token_at(Clock::time_point now);

  const std::string &key_id() const { return key_id_; }
  const std::string &team_id() const { return team_id_; }

private:
  TokenSigner(std::string pkcs8_pem, std::string key_id, std::string team_id,
              std::chrono::seconds ttl);

  ApnsResult<std::string> sign(Clock::time_point issued_at) const;

  std::string pem_;
  std::string key_id_;
  std::string team_id_;
  std::chrono::seconds ttl_;

  std::mutex mutex_;
  std::string token_;
  Clock::time_point issued_at_{};
};

} // namespace apnsclient
