#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"
#include "notify/notification_sink.h"
#include "safety/idempotency_guard.h"
#include "safety/kill_switch.h"
#include "safety/loss_halt_guard.h"
#include "safety/transfer_limiter.h"
#include "storage/wal_store.h"

namespace basket_engine {

/**
 * @brief 安全系统：五个独立守卫的组合入口
 *
 * 1. portfolio guard：执行时用最新快照重跑风控硬限制；
 * 2. loss-halt：滚动窗口回撤熔断，置位/解除都落盘并告警；
 * 3. transfer limiter：跨链单笔与滚动窗口限额；
 * 4. kill switch：整周期急停；
 * 5. idempotency guard：同一逻辑操作不可并发。
 *
 * 守卫之间不共享状态；熔断状态由内部互斥保护（结算触发与决策周期可能并发读取）。
 */
class SafetySystem {
 public:
  SafetySystem(const AppConfig& config,
               const WalStore* wal,
               std::shared_ptr<NotificationSink> notifier);

  /// 重启恢复：熔断标志 + 近期结算任务金额（回放到限额器）。
  void Restore(const WalState& state);

  /// 决策周期是否被阻断（急停或熔断），阻断原因写入 out_reason。
  bool CycleBlocked(std::string* out_reason) const;

  /// 记录 NAV；触发熔断时落盘并发送 critical 告警，返回 true。
  bool ObserveNav(std::int64_t ts_ms, double nav_usd);
  /// 主动置位熔断（紧急退出）。
  bool EngageLossHalt(const std::string& reason, std::int64_t ts_ms, std::string* out_error);
  /// 人工解除熔断。
  bool ClearLossHalt(std::int64_t ts_ms, std::string* out_error);
  bool loss_halted() const;
  std::string halt_reason() const;

  /// 执行时组合检查：用最新快照重跑硬限制，返回全部违规项。
  std::vector<std::string> CheckPortfolio(const Weights& proposed,
                                          const BasketSnapshot& fresh_snapshot,
                                          double turnover_24h) const;

  /// 结算触发准入：熔断 + 限额。
  bool AllowBridge(double amount_usd, std::int64_t now_ms, std::string* out_reason);
  void OnBridgeAccepted(double amount_usd, std::int64_t now_ms);
  double BridgeWindowRemaining(std::int64_t now_ms) const;

  IdempotencyGuard& idempotency() { return idempotency_; }
  KillSwitch& kill_switch() { return kill_switch_; }
  const TransferLimiter& transfer_limiter() const { return transfer_limiter_; }
  NotificationSink& notifier() { return *notifier_; }

 private:
  void RaiseAlert(AlertSeverity severity,
                  const std::string& code,
                  const std::string& message,
                  std::int64_t ts_ms);

  RiskLimits limits_;
  const WalStore* wal_{nullptr};  ///< 外部注入（不拥有所有权），可为空（测试）。
  std::shared_ptr<NotificationSink> notifier_;

  mutable std::mutex mutex_;  ///< 保护 loss_halt_ 与 transfer_limiter_。
  LossHaltGuard loss_halt_;
  TransferLimiter transfer_limiter_;
  KillSwitch kill_switch_;
  IdempotencyGuard idempotency_;
};

}  // namespace basket_engine
