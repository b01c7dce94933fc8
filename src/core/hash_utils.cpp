#include "core/hash_utils.h"

#include <limits>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace basket_engine {

std::string BytesToHex(const unsigned char* bytes, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.resize(size * 2U);
  for (std::size_t i = 0; i < size; ++i) {
    const unsigned char v = bytes[i];
    out[i * 2U] = kHex[(v >> 4U) & 0x0FU];
    out[i * 2U + 1U] = kHex[v & 0x0FU];
  }
  return out;
}

bool Sha256Hex(const std::string& payload,
               std::string* out_hex,
               std::string* out_error) {
  if (out_hex == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_hex 为空";
    }
    return false;
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  // EVP_Digest 为一次性接口，内部自行管理 EVP_MD_CTX 生命周期。
  if (EVP_Digest(payload.data(), payload.size(), digest, &digest_len,
                 EVP_sha256(), nullptr) != 1 ||
      digest_len == 0U) {
    if (out_error != nullptr) {
      *out_error = "OpenSSL SHA-256 计算失败";
    }
    return false;
  }
  *out_hex = BytesToHex(digest, digest_len);
  return true;
}

bool HmacSha256Hex(const std::string& secret,
                   const std::string& payload,
                   std::string* out_signature,
                   std::string* out_error) {
  if (out_signature == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_signature 为空";
    }
    return false;
  }
  if (secret.size() >
      static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    if (out_error != nullptr) {
      *out_error = "secret 长度超出 OpenSSL HMAC 限制";
    }
    return false;
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  const unsigned char* result =
      HMAC(EVP_sha256(),
           secret.data(),
           static_cast<int>(secret.size()),
           reinterpret_cast<const unsigned char*>(payload.data()),
           payload.size(),
           digest,
           &digest_len);
  if (result == nullptr || digest_len == 0U) {
    if (out_error != nullptr) {
      *out_error = "OpenSSL HMAC-SHA256 计算失败";
    }
    return false;
  }
  *out_signature = BytesToHex(digest, digest_len);
  return true;
}

}  // namespace basket_engine
