#pragma once

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

#include "openssl/crypt_util.hpp"

namespace apnsclient::testutil {

inline std::string pem_of(EVP_PKEY *pkey) {
  cryptutil::BIO_ptr bio(BIO_new(BIO_s_mem()), &BIO_free);
  if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey, nullptr, nullptr, 0,
                                       nullptr, nullptr) != 1) {
    throw std::runtime_error("PEM_write_bio_PrivateKey failed");
  }
  BUF_MEM *mem = nullptr;
  BIO_get_mem_ptr(bio.get(), &mem);
  return std::string(mem->data, mem->length);
}

// Fresh P-256 key in PKCS#8 PEM, the format the gateway hands out as .p8.
inline std::string make_p256_pem() {
  cryptutil::EVP_PKEY_ptr pkey(EVP_EC_gen("P-256"), &EVP_PKEY_free);
  if (!pkey) {
    throw std::runtime_error("EVP_EC_gen failed");
  }
  return pem_of(pkey.get());
}

inline std::string make_rsa_pem() {
  cryptutil::EVP_PKEY_ptr pkey(EVP_RSA_gen(2048), &EVP_PKEY_free);
  if (!pkey) {
    throw std::runtime_error("EVP_RSA_gen failed");
  }
  return pem_of(pkey.get());
}

// Scratch directory removed on destruction.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("apnsclient_test_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

  std::filesystem::path write(const std::string &name,
                              const std::string &content) const {
    auto p = path_ / name;
    std::ofstream out(p, std::ios::binary);
    out << content;
    return p;
  }

private:
  std::filesystem::path path_;
};

} // namespace apnsclient::testutil
