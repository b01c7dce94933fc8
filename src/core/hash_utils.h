#pragma once

#include <cstddef>
#include <string>

namespace basket_engine {

/// 字节序列转小写十六进制。
std::string BytesToHex(const unsigned char* bytes, std::size_t size);

/**
 * @brief SHA-256 十六进制摘要
 *
 * 用途：跨链消息哈希（attestation 查询键）、决策 ID、幂等键。
 * @return false 表示 OpenSSL 摘要计算失败（原因写入 out_error）。
 */
bool Sha256Hex(const std::string& payload,
               std::string* out_hex,
               std::string* out_error);

/// HMAC-SHA256 十六进制签名（告警 webhook 的 `X-Signature` 头）。
bool HmacSha256Hex(const std::string& secret,
                   const std::string& payload,
                   std::string* out_signature,
                   std::string* out_error);

}  // namespace basket_engine
