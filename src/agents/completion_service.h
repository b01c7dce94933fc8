#pragma once

#include <memory>
#include <string>

#include "core/bounded_task.h"
#include "core/config.h"
#include "core/http_transport.h"

namespace basket_engine {

/// 模型调用角色：固定枚举，不做开放式插件注册。
enum class AgentRole {
  kTechnicalAnalyst,
  kSentimentAnalyst,
  kLiquidityAnalyst,
  kMacroAnalyst,
  kChangeAdvocate,
  kHoldAdvocate,
  kSoftRiskJudge,
  kDecisionJudge,
};

const char* ToString(AgentRole role);
AgentRole RoleForProducer(ProducerKind kind);

/**
 * @brief 一次结构化补全请求
 *
 * `payload_json` 是角色输入（篮子快照、报告、辩论记录等）的单行 JSON，
 * 输出约定为一个 JSON 对象，由调用方按角色 schema 校验。
 */
struct AgentRequest {
  AgentRole role{AgentRole::kTechnicalAnalyst};
  std::string instructions;
  std::string payload_json;
  int timeout_ms{8000};
};

/**
 * @brief 语言模型补全服务抽象
 *
 * 实现要求：
 * 1. 线程安全（四个分析师并发调用同一实例）；
 * 2. 不抛异常，失败返回 false 并写 `out_error`；
 * 3. 在阻塞调用前后检查 `cancel`，已取消时尽快返回。
 */
class CompletionService {
 public:
  virtual ~CompletionService() = default;
  virtual bool Complete(const AgentRequest& request,
                        const CancelToken& cancel,
                        std::string* out_text,
                        std::string* out_error) const = 0;
};

/// OpenAI 兼容 chat completion 接口（libcurl 传输，Bearer 鉴权）。
class HttpCompletionService final : public CompletionService {
 public:
  HttpCompletionService(std::shared_ptr<const HttpTransport> transport,
                        LlmConfig config,
                        std::string api_key);

  bool Complete(const AgentRequest& request,
                const CancelToken& cancel,
                std::string* out_text,
                std::string* out_error) const override;

 private:
  std::shared_ptr<const HttpTransport> transport_;
  LlmConfig config_;
  std::string api_key_;
};

/**
 * @brief 离线确定性后端
 *
 * 直接从 payload 中的行情/报告推导出与模型相同 schema 的 JSON 输出，
 * 用于 mock 模式、无密钥环境与回归测试。
 */
class RuleBasedCompletionService final : public CompletionService {
 public:
  bool Complete(const AgentRequest& request,
                const CancelToken& cancel,
                std::string* out_text,
                std::string* out_error) const override;
};

/// 各角色的输出 schema 说明（作为 system 指令的一部分）。
std::string RoleInstructions(AgentRole role);

}  // namespace basket_engine
