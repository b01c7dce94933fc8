#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <utility>

namespace basket_engine {

struct TransferLimiterConfig {
  // 单笔下限：低于该值的结算不值得支付跨链费用。
  double min_job_usd{1.0};
  // 单笔上限。
  double max_job_usd{5000.0};
  // 滚动窗口累计上限与窗口长度。
  double max_window_usd{20000.0};
  std::int64_t window_ms{86400LL * 1000};
};

/// 准入统计（进程生命周期内单调累加）。
struct TransferLimiterStats {
  std::uint64_t checks{0};  // 准入检查总次数。
  std::uint64_t allowed{0};  // 放行次数。
  std::uint64_t rejected{0};  // 拒绝次数。
  std::uint64_t below_min_rejects{0};  // 低于单笔下限。
  std::uint64_t per_job_rejects{0};  // 超过单笔上限。
  std::uint64_t window_rejects{0};  // 超过滚动窗口上限。
};

/**
 * @brief 跨链转账限额器
 *
 * 1. 单笔金额必须在 [min_job_usd, max_job_usd]；
 * 2. 滚动窗口内已受理金额 + 本笔不超过 max_window_usd；
 * 3. 仅做“准入判断”，受理后由调用方 `OnAccepted` 记账。
 */
class TransferLimiter {
 public:
  explicit TransferLimiter(TransferLimiterConfig config) : config_(config) {}

  /**
   * @brief 判断一笔转账是否可放行
   *
   * @param amount_usd 本笔金额（USD）
   * @param now_ms 当前毫秒时间戳
   * @param out_reason 拒绝原因（可选输出）
   */
  bool Allow(double amount_usd, std::int64_t now_ms, std::string* out_reason);

  /// 记账：仅在任务成功创建并落盘后调用（重启恢复时按历史任务回放）。
  void OnAccepted(double amount_usd, std::int64_t now_ms);

  /// 窗口内已受理金额。
  double WindowTotal(std::int64_t now_ms) const;
  /// 窗口剩余额度（不小于 0）。
  double WindowRemaining(std::int64_t now_ms) const;

  const TransferLimiterConfig& config() const { return config_; }
  const TransferLimiterStats& total_stats() const { return total_stats_; }

 private:
  void Prune(std::int64_t now_ms);

  TransferLimiterConfig config_;
  std::deque<std::pair<std::int64_t, double>> accepted_;  ///< (ts_ms, amount_usd)
  TransferLimiterStats total_stats_;
};

}  // namespace basket_engine
