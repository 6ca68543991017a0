#include "openssl/crypt_util.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <limits>

namespace apnsclient {
namespace cryptutil {

OpensslErrorStack OpensslErrorStack::capture() {
  std::vector<std::string> entries;
  unsigned long err = 0;
  while ((err = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    entries.emplace_back(buf);
  }
  return OpensslErrorStack(std::move(entries));
}

std::string OpensslErrorStack::message() const {
  if (entries_.empty()) {
    return "unknown OpenSSL error";
  }
  return fmt::format("{}", fmt::join(entries_, "; "));
}

EVP_PKEY_ptr load_private_key_pem(std::string_view pem) {
  EVP_PKEY_ptr pkey(nullptr, &EVP_PKEY_free);
  if (pem.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return pkey;
  }
  BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())),
              &BIO_free);
  if (!bio) {
    return pkey;
  }
  pkey.reset(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
  return pkey;
}

}  // namespace cryptutil
}  // namespace apnsclient
