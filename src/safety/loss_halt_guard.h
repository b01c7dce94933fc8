#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <utility>

namespace basket_engine {

/**
 * @brief 亏损熔断守卫
 *
 * 维护滚动窗口内的 NAV 观测；窗口峰值到当前值的回撤超过阈值即置位熔断。
 * 熔断只能人工解除（`Clear`），不会随 NAV 回升自动恢复。
 */
class LossHaltGuard {
 public:
  LossHaltGuard(double max_drawdown, std::int64_t window_ms)
      : max_drawdown_(max_drawdown), window_ms_(window_ms) {}

  /**
   * @brief 记录一次 NAV 观测
   *
   * @return true 本次观测导致熔断由未置位变为置位（reason 写入 out_reason）
   */
  bool Observe(std::int64_t ts_ms, double nav_usd, std::string* out_reason);

  /// 当前窗口内峰值回撤（0 表示无回撤）。
  double CurrentDrawdown() const;

  void Engage(std::string reason);
  void Clear();

  bool halted() const { return halted_; }
  const std::string& reason() const { return reason_; }

 private:
  double max_drawdown_;
  std::int64_t window_ms_;
  std::deque<std::pair<std::int64_t, double>> samples_;  ///< (ts_ms, nav) 升序。
  bool halted_{false};
  std::string reason_;
};

}  // namespace basket_engine
