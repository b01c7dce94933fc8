#pragma once

#include <memory>
#include <string>
#include <vector>

#include "agents/completion_service.h"
#include "core/config.h"
#include "core/types.h"

namespace basket_engine {

/// 决策者输入：辩论最后一轮双方论点 + 风控裁决 + 上下文。
struct DecisionInput {
  TriggerReason trigger{TriggerReason::kScheduled};
  DebateThesis for_change;
  DebateThesis for_hold;
  RiskVerdict verdict;
  std::vector<AnalystReport> reports;
  BasketSnapshot snapshot;
  std::vector<CalibrationHint> hints;
  std::vector<Decision> history;
};

/// 决策者输出（尚未经过契约校验）。
struct DecisionProposal {
  DecisionAction action{DecisionAction::kHold};
  Weights weights;
  double confidence{0.0};
  double cost_estimate{0.0};
  std::string rationale;
  std::vector<std::string> tags;
};

/**
 * @brief 结算费用占 NAV 比例
 *
 * cost = (固定结算费 + turnover * NAV * swap_fee_bps / 1e4) / NAV。
 */
double EstimateCost(const DecisionConfig& config, double turnover, double nav_usd);

/// 决策者抽象：实现可以出错，但不得绕过 `EnforceDecisionContract`。
class DecisionMaker {
 public:
  virtual ~DecisionMaker() = default;
  virtual DecisionProposal Decide(const DecisionInput& input) const = 0;
};

/**
 * @brief 规则决策者
 *
 * 优先级：风控否决 -> 紧急退出 -> 变更方让步 -> 无换手 -> 持有方更强 ->
 * 费用超过预期收益（容忍倍数）-> REBALANCE。
 */
class RuleBasedDecisionMaker final : public DecisionMaker {
 public:
  explicit RuleBasedDecisionMaker(DecisionConfig config) : config_(config) {}
  DecisionProposal Decide(const DecisionInput& input) const override;

 private:
  DecisionConfig config_;
};

/**
 * @brief 模型决策者
 *
 * 先计算规则基线并随 payload 下发；模型只选择动作与置信度，权重始终取
 * 风控调整后的权重或变更方提议，模型不能凭空生成权重。
 * 模型失败/超时时退回规则基线。
 */
class ModelDecisionMaker final : public DecisionMaker {
 public:
  ModelDecisionMaker(DecisionConfig config,
                     std::shared_ptr<const CompletionService> completion);
  DecisionProposal Decide(const DecisionInput& input) const override;

 private:
  DecisionConfig config_;
  RuleBasedDecisionMaker baseline_;
  std::shared_ptr<const CompletionService> completion_;
};

/**
 * @brief 决策契约
 *
 * 1. 风控否决时动作必须为 HOLD；
 * 2. REBALANCE 的权重必须和为 1，且在存在风控调整时必须等于调整后权重，
 *    不得超过单 token 上限；
 * 3. 非 REBALANCE 动作的权重等于当前权重。
 *
 * 违约时把提案改写为 HOLD、打上 `decision_contract_violation` 标签并返回 false。
 */
bool EnforceDecisionContract(const DecisionInput& input,
                             const RiskLimits& limits,
                             DecisionProposal* proposal,
                             std::string* out_violation);

}  // namespace basket_engine
