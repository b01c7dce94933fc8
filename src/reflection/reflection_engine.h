#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "chain/chain_gateways.h"
#include "core/config.h"
#include "core/types.h"
#include "storage/wal_store.h"

namespace basket_engine {

/**
 * @brief 反思引擎
 *
 * 对至少 `delay_hours` 之前、尚未反思的决策：
 * 1. 用决策时的权重计算篮子内 token 的加权实际涨跌（与调仓无关的市场方向）；
 * 2. 逐个分析师比对预测方向与实际方向，给出 [0,1] 准确度；
 * 3. 产出一条 CalibrationHint（先写 HINT 再写 REFLECTED）。
 *
 * 只读行情与历史，不影响实盘路径。
 */
class ReflectionEngine {
 public:
  /// @param market/wal 外部注入（不拥有所有权），wal 可为空（测试）。
  ReflectionEngine(ReflectionConfig config, const MarketStateReader* market, const WalStore* wal);

  void Restore(const WalState& state);

  /// 对全部到期决策执行反思，返回本次产出的提示条数；单条失败不影响其余决策。
  int RunDue(const std::vector<Decision>& decisions, std::int64_t now_ms);

  /// 最近 n 条提示（时间升序）。
  std::vector<CalibrationHint> RecentHints(std::size_t n) const;
  bool IsReflected(const std::string& decision_id) const;

  static bool IsDue(const Decision& decision, std::int64_t now_ms, int delay_hours);
  /// 单个分析师得分：方向正确 0.5+0.5c，错误 0.5-0.5c；中性按 1-|move|/band。
  static double ScoreReport(const AnalystReport& report, double realized_move, double neutral_band);
  /// 纯函数：由决策与实际结果生成提示；没有可评分报告时返回 false。
  static bool BuildHint(const Decision& decision,
                        double realized_move,
                        double nav_change,
                        double neutral_band,
                        std::int64_t now_ms,
                        CalibrationHint* out_hint);

 private:
  /// 决策时刻到评估时刻的加权 token 涨跌与 NAV 变化。
  bool MeasureOutcome(const Decision& decision,
                      std::int64_t horizon_ms,
                      double* out_move,
                      double* out_nav_change,
                      std::string* out_error) const;

  ReflectionConfig config_;
  const MarketStateReader* market_{nullptr};
  const WalStore* wal_{nullptr};

  mutable std::mutex mutex_;
  std::unordered_set<std::string> reflected_ids_;
  std::vector<CalibrationHint> hints_;
};

}  // namespace basket_engine
