#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "core/config.h"

namespace basket_engine {

/// 触发策略输入：全部为调用方读取的外部状态快照。
struct BridgeTriggerInput {
  double accrued_fees_usd{0.0};  ///< 合约侧尚未转出的累计手续费。
  double reserved_usd{0.0};  ///< 已建任务但尚未锁定的金额（避免重复建单）。
  double source_congestion{0.0};
  double window_remaining_usd{0.0};  ///< 滚动窗口剩余额度。
  std::int64_t now_ms{0};
  std::int64_t last_job_ms{0};  ///< 最近一次建任务时间（无任务时为引擎启动时间）。
};

/// 触发结论；create=false 时 reason 说明跳过原因。
struct BridgeTriggerDecision {
  bool create{false};
  double amount_usd{0.0};
  std::string reason;
};

/**
 * @brief 结算触发策略（何时发起，与状态机解耦）
 *
 * 规则：
 * 1. 可转出额 = 累计手续费 - 已预留；
 * 2. 可转出额达到阈值，或距上次建单超过兜底周期（默认一周）时触发；
 * 3. 金额 = min(可转出额, 单笔上限, 窗口剩余额度)，低于单笔下限不建单；
 * 4. 源链拥堵超过上限时一律不建单。
 *
 * 熔断与限额的最终准入由 SafetySystem::AllowBridge 负责。
 */
class BridgeTriggerPolicy {
 public:
  explicit BridgeTriggerPolicy(SettlementConfig config) : config_(std::move(config)) {}

  BridgeTriggerDecision Evaluate(const BridgeTriggerInput& input) const;

 private:
  SettlementConfig config_;
};

}  // namespace basket_engine
