#include "chain/http_attestation_service.h"

#include <utility>

#include "core/json_utils.h"

namespace basket_engine {

namespace {

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

}  // namespace

HttpAttestationService::HttpAttestationService(std::shared_ptr<const HttpTransport> transport,
                                               std::string base_url,
                                               long timeout_ms)
    : transport_(std::move(transport)), base_url_(std::move(base_url)), timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

bool HttpAttestationService::Poll(const std::string& message_hash,
                                  AttestationPoll* out_poll,
                                  std::string* out_error) const {
  if (out_poll == nullptr || message_hash.empty()) {
    SetError(out_error, "attestation poll 参数非法");
    return false;
  }
  *out_poll = AttestationPoll{};

  HttpRequest request;
  request.method = "GET";
  request.url = base_url_ + "/attestations/" +
                (message_hash.rfind("0x", 0) == 0 ? message_hash : "0x" + message_hash);
  request.timeout_ms = timeout_ms_;
  request.headers.emplace_back("Accept", "application/json");

  const HttpResponse response = transport_->Send(request);
  if (!response.error.empty()) {
    SetError(out_error, "attestation 请求失败: " + response.error);
    return false;
  }
  if (response.status_code == 404) {
    return true;
  }
  if (response.status_code != 200) {
    SetError(out_error, "attestation HTTP 状态异常: " + std::to_string(response.status_code));
    return false;
  }

  JsonValue root;
  std::string parse_error;
  if (!ParseJson(response.body, &root, &parse_error)) {
    SetError(out_error, "attestation 响应非 JSON: " + parse_error);
    return false;
  }
  const auto status = JsonAsString(JsonObjectField(&root, "status"));
  if (!status.has_value()) {
    SetError(out_error, "attestation 响应缺少 status");
    return false;
  }
  if (*status != "complete") {
    return true;
  }
  const auto attestation = JsonAsString(JsonObjectField(&root, "attestation"));
  if (!attestation.has_value() || attestation->empty() || *attestation == "PENDING") {
    SetError(out_error, "attestation 状态 complete 但缺少证明数据");
    return false;
  }
  out_poll->complete = true;
  out_poll->attestation = *attestation;
  return true;
}

}  // namespace basket_engine
