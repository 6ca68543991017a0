#pragma once

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace apnsclient {
namespace cryptutil {

using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using BIO_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;

// Snapshot of the thread's OpenSSL error queue. Owns the rendered entries so
// it can outlive the queue it was drained from.
class OpensslErrorStack {
 public:
  OpensslErrorStack() = default;
  explicit OpensslErrorStack(std::vector<std::string> entries)
      : entries_(std::move(entries)) {}

  // Drains ERR_get_error() on the calling thread.
  static OpensslErrorStack capture();

  const std::vector<std::string>& entries() const { return entries_; }
  bool empty() const { return entries_.empty(); }

  // Entries joined with "; ", or a generic text when the queue was empty.
  std::string message() const;

 private:
  std::vector<std::string> entries_;
};

// Parses a PEM encoded private key (PKCS#8 or traditional). Returns a null
// pointer and leaves the reason on the OpenSSL error queue on failure.
EVP_PKEY_ptr load_private_key_pem(std::string_view pem);

}  // namespace cryptutil
}  // namespace apnsclient
