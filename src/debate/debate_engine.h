#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "agents/completion_service.h"
#include "core/config.h"
#include "core/types.h"

namespace basket_engine {

/// 辩论输入：快照、四份报告（含失败）、校准提示与风控限制（供倡导方自检）。
struct DebateInput {
  BasketSnapshot snapshot;
  std::vector<AnalystReport> reports;
  std::vector<CalibrationHint> hints;
  RiskLimits limits;
};

/// 辩论结果：ok=false 表示首轮即无法产出合法论点。
struct DebateOutcome {
  bool ok{false};
  bool converged{false};
  std::vector<DebateRound> rounds;
  std::string error;
};

/**
 * @brief 对抗辩论引擎
 *
 * 每轮先由 ADVOCATE_FOR_CHANGE 发言，再由 ADVOCATE_FOR_HOLD 发言，
 * 两方都看到此前双方的完整记录（含本轮对方已发言内容）。
 *
 * 约束：
 * 1. 轮数上限 min(config.max_rounds, kMaxDebateRounds)，循环必然终止；
 * 2. 最新两条论点置信度差小于 convergence_gap 时提前结束（视为收敛，不代表动作一致）；
 * 3. 第 2 轮起某方改变动作必须引用记录中未出现过的证据，否则拒绝并重试；
 *    重试耗尽后沿用该方上一轮论点（carried_forward）；
 * 4. 每次模型调用受 round_timeout_ms 约束，超时按非法输出处理。
 */
class DebateEngine {
 public:
  DebateEngine(DebateConfig config, std::shared_ptr<const CompletionService> completion);

  /// @param abort 可选中止标记；置位后不再开始新一轮。
  DebateOutcome Run(const DebateInput& input,
                    const std::atomic<bool>* abort = nullptr) const;

  /**
   * @brief 校验一条倡导方输出（schema + 权重 + 反附和规则）
   *
   * @param transcript 已有记录（本方之前所有轮、对方所有已发言内容）
   * @param previous 本方上一轮论点（第 1 轮为 nullptr）
   */
  static bool ValidateThesis(const std::string& text,
                             DebatePosition position,
                             int round,
                             const BasketSnapshot& snapshot,
                             const std::vector<DebateThesis>& transcript,
                             const DebateThesis* previous,
                             DebateThesis* out_thesis,
                             std::string* out_error);

 private:
  bool Speak(DebatePosition position,
             int round,
             const DebateInput& input,
             const std::vector<DebateThesis>& transcript,
             const DebateThesis* previous,
             DebateThesis* out_thesis) const;

  DebateConfig config_;
  std::shared_ptr<const CompletionService> completion_;
};

}  // namespace basket_engine
