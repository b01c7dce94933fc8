#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "agents/completion_service.h"
#include "core/config.h"
#include "core/types.h"

namespace basket_engine {

/**
 * @brief 硬限制检查（纯函数，无模型调用）
 *
 * 检查顺序固定：权重合法性 -> 单 token 上限 -> 锚定下限 -> 单次换手 ->
 * 增删 token 数 -> 流动性 -> 24h 累计换手。返回全部违规项（不在首条违规处停止），
 * 空数组表示全部通过。
 *
 * @param turnover_24h 过去 24h 已提交调仓的累计换手（不含本次）
 */
std::vector<std::string> CheckHardLimits(const RiskLimits& limits,
                                         const Weights& proposed,
                                         const BasketSnapshot& snapshot,
                                         double turnover_24h);

/// 软判断输入：硬限制已全部通过。
struct SoftRiskInput {
  Weights proposed;
  BasketSnapshot snapshot;
  std::vector<AnalystReport> reports;
  int rebalances_24h{0};
};

/// 软判断结果：可否决，也可返回向当前权重收缩的比例。
struct SoftRiskResult {
  bool veto{false};
  std::string reason;
  double max_change_fraction{1.0};  // 1.0 表示不收缩。
};

/// 软风控判断抽象。
class SoftRiskJudge {
 public:
  virtual ~SoftRiskJudge() = default;
  virtual SoftRiskResult Judge(const SoftRiskInput& input) const = 0;
};

/**
 * @brief 规则软判断
 *
 * 1. 频率：NAV 低于小篮子阈值时 24h 最多 1 次调仓，否则最多 3 次；
 * 2. 波动：任一报告带高波动标记时，把换手收缩到 `soft_turnover_cap`。
 */
class RuleBasedSoftRiskJudge final : public SoftRiskJudge {
 public:
  explicit RuleBasedSoftRiskJudge(RiskLimits limits) : limits_(limits) {}
  SoftRiskResult Judge(const SoftRiskInput& input) const override;

 private:
  RiskLimits limits_;
};

/**
 * @brief 模型软判断
 *
 * 先执行规则判断（规则否决直接生效），再询问模型；模型只能进一步收紧。
 * 模型超时或输出非法时沿用规则结果并在 reason 中注明。
 */
class ModelSoftRiskJudge final : public SoftRiskJudge {
 public:
  ModelSoftRiskJudge(RiskLimits limits,
                     std::shared_ptr<const CompletionService> completion);
  SoftRiskResult Judge(const SoftRiskInput& input) const override;

 private:
  RuleBasedSoftRiskJudge rules_;
  std::shared_ptr<const CompletionService> completion_;
  int timeout_ms_;
};

/// 风控闸门请求。
struct RiskRequest {
  DecisionAction action{DecisionAction::kHold};
  Weights proposed;
  BasketSnapshot snapshot;
  std::vector<AnalystReport> reports;
  double turnover_24h{0.0};
  int rebalances_24h{0};
};

/**
 * @brief 风控闸门 (Risk Gate)
 *
 * 系统的最终否决方：
 * 1. HOLD 直接通过；
 * 2. 任一硬限制违规即无条件否决，不再咨询软判断，verdict 列出全部违规；
 * 3. 硬限制全部通过后执行软判断，可否决或给出收缩后的权重（收缩结果再过一遍硬限制）。
 */
class RiskGate {
 public:
  RiskGate(RiskLimits limits, std::shared_ptr<const SoftRiskJudge> soft_judge);

  RiskVerdict Evaluate(const RiskRequest& request) const;
  const RiskLimits& limits() const { return limits_; }

 private:
  RiskLimits limits_;
  std::shared_ptr<const SoftRiskJudge> soft_judge_;
};

/// 向当前权重线性收缩：current + fraction * (proposed - current)。
Weights ShrinkTowards(const Weights& current, const Weights& proposed, double fraction);

}  // namespace basket_engine
