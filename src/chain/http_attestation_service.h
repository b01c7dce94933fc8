#pragma once

#include <memory>
#include <string>

#include "chain/chain_gateways.h"
#include "core/http_transport.h"

namespace basket_engine {

/**
 * @brief HTTP attestation 轮询
 *
 * GET `<base_url>/attestations/0x<message_hash>`：
 * - 404 视为尚未收录（pending）；
 * - `status == "complete"` 且 attestation 非空视为完成；
 * - 其他状态码或响应非法为错误（由调用方计入重试）。
 */
class HttpAttestationService final : public AttestationService {
 public:
  HttpAttestationService(std::shared_ptr<const HttpTransport> transport,
                         std::string base_url,
                         long timeout_ms = 10000);

  bool Poll(const std::string& message_hash,
            AttestationPoll* out_poll,
            std::string* out_error) const override;

 private:
  std::shared_ptr<const HttpTransport> transport_;
  std::string base_url_;
  long timeout_ms_{10000};
};

}  // namespace basket_engine
