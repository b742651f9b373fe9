#include "tg/crypto/sha256.h"

#include "tg/common.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <iostream>

namespace tg::crypto {

namespace {

void ReportOpenSSLFailure(const char* context) {
  unsigned long err = ERR_get_error();
  char buf[256] = {0};
  if (err != 0) {
    ERR_error_string_n(err, buf, sizeof(buf));
  }
  std::clog << "{\"event\":\"crypto_error\",\"context\":\"" << context << "\",\"detail\":\""
            << (err != 0 ? buf : "unknown OpenSSL error") << "\"}" << std::endl;
}

} // namespace

std::optional<Sha256Digest> SHA256_Hash(std::span<const std::uint8_t> data) {
  Sha256Digest out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ReportOpenSSLFailure("EVP_Digest(EVP_sha256)");
    return std::nullopt;
  }
  if (len != out.size()) {
    ReportOpenSSLFailure("EVP_Digest length");
    return std::nullopt;
  }
  return out;
}

std::optional<Sha256Digest> SHA256_Hash(std::string_view text) {
  return SHA256_Hash(AsBytesConst(text));
}

} // namespace tg::crypto
