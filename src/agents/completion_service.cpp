#include "agents/completion_service.h"

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

const char* ToString(AgentRole role) {
  switch (role) {
    case AgentRole::kTechnicalAnalyst:
      return "technical_analyst";
    case AgentRole::kSentimentAnalyst:
      return "sentiment_analyst";
    case AgentRole::kLiquidityAnalyst:
      return "liquidity_analyst";
    case AgentRole::kMacroAnalyst:
      return "macro_analyst";
    case AgentRole::kChangeAdvocate:
      return "change_advocate";
    case AgentRole::kHoldAdvocate:
      return "hold_advocate";
    case AgentRole::kSoftRiskJudge:
      return "soft_risk_judge";
    case AgentRole::kDecisionJudge:
      return "decision_judge";
  }
  return "unknown";
}

AgentRole RoleForProducer(ProducerKind kind) {
  switch (kind) {
    case ProducerKind::kTechnical:
      return AgentRole::kTechnicalAnalyst;
    case ProducerKind::kSentiment:
      return AgentRole::kSentimentAnalyst;
    case ProducerKind::kLiquidity:
      return AgentRole::kLiquidityAnalyst;
    case ProducerKind::kMacro:
      return AgentRole::kMacroAnalyst;
  }
  return AgentRole::kTechnicalAnalyst;
}

std::string RoleInstructions(AgentRole role) {
  switch (role) {
    case AgentRole::kTechnicalAnalyst:
    case AgentRole::kSentimentAnalyst:
    case AgentRole::kLiquidityAnalyst:
    case AgentRole::kMacroAnalyst:
      return std::string("You are the ") + ToString(role) +
             " of a token basket. Reply with one JSON object: "
             "{\"confidence\": number 0..1, \"direction\": "
             "\"bullish\"|\"bearish\"|\"neutral\", \"evidence\": [string], "
             "\"high_volatility\": bool}.";
    case AgentRole::kChangeAdvocate:
    case AgentRole::kHoldAdvocate:
      return std::string("You are the ") + ToString(role) +
             " in a bounded debate. Read the full transcript of both sides. "
             "Reply with one JSON object: {\"proposed_action\": "
             "\"REBALANCE\"|\"HOLD\"|\"EMERGENCY_EXIT\", \"target_weights\": "
             "{token: fraction}, \"confidence\": number 0..1, \"evidence\": "
             "[string]}. Changing your action after round 1 requires evidence "
             "not already in the transcript.";
    case AgentRole::kSoftRiskJudge:
      return "You judge qualitative rebalance risk after hard limits passed. "
             "Reply with one JSON object: {\"veto\": bool, \"reason\": string, "
             "\"max_change_fraction\": number 0..1}.";
    case AgentRole::kDecisionJudge:
      return "You make the final basket decision. A risk veto forces HOLD. "
             "Reply with one JSON object: {\"action\": "
             "\"REBALANCE\"|\"HOLD\"|\"EMERGENCY_EXIT\", \"confidence\": number "
             "0..1, \"rationale\": string}.";
  }
  return "";
}

HttpCompletionService::HttpCompletionService(
    std::shared_ptr<const HttpTransport> transport,
    LlmConfig config,
    std::string api_key)
    : transport_(std::move(transport)),
      config_(std::move(config)),
      api_key_(std::move(api_key)) {}

bool HttpCompletionService::Complete(const AgentRequest& request,
                                     const CancelToken& cancel,
                                     std::string* out_text,
                                     std::string* out_error) const {
  if (out_text == nullptr) {
    SetError(out_error, "out_text 为空");
    return false;
  }
  if (cancel.cancelled()) {
    SetError(out_error, "cancelled");
    return false;
  }

  JsonWriter body;
  body.BeginObject()
      .Key("model").String(config_.model)
      .Key("temperature").Number(0.0)
      .Key("response_format").BeginObject().Key("type").String("json_object").EndObject()
      .Key("messages").BeginArray()
      .BeginObject()
      .Key("role").String("system")
      .Key("content").String(request.instructions)
      .EndObject()
      .BeginObject()
      .Key("role").String("user")
      .Key("content").String(request.payload_json)
      .EndObject()
      .EndArray()
      .EndObject();

  HttpRequest http;
  http.method = "POST";
  http.url = config_.endpoint;
  http.body = body.str();
  http.timeout_ms = request.timeout_ms;
  http.headers.emplace_back("Content-Type", "application/json");
  http.headers.emplace_back("Authorization", "Bearer " + api_key_);

  const HttpResponse response = transport_->Send(http);
  if (cancel.cancelled()) {
    SetError(out_error, "cancelled");
    return false;
  }
  if (!response.error.empty()) {
    SetError(out_error, "模型请求失败: " + response.error);
    return false;
  }
  if (response.status_code != 200) {
    SetError(out_error, "模型 HTTP 状态异常: " + std::to_string(response.status_code));
    return false;
  }

  JsonValue root;
  std::string parse_error;
  if (!ParseJson(response.body, &root, &parse_error)) {
    SetError(out_error, "模型响应非 JSON: " + parse_error);
    return false;
  }
  const JsonValue* message = JsonObjectField(
      JsonArrayAt(JsonObjectField(&root, "choices"), 0), "message");
  const auto content = JsonAsString(JsonObjectField(message, "content"));
  if (!content.has_value()) {
    SetError(out_error, "模型响应缺少 choices[0].message.content");
    return false;
  }
  *out_text = *content;
  return true;
}

}  // namespace basket_engine
