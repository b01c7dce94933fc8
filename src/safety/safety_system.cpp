#include "safety/safety_system.h"

#include <utility>

#include "core/log.h"
#include "risk/risk_gate.h"

namespace basket_engine {

namespace {

TransferLimiterConfig LimiterConfigFrom(const SettlementConfig& settlement) {
  TransferLimiterConfig config;
  config.min_job_usd = settlement.min_job_usd;
  config.max_job_usd = settlement.max_job_usd;
  config.max_window_usd = settlement.max_bridged_24h_usd;
  config.window_ms = 86400LL * 1000;
  return config;
}

}  // namespace

SafetySystem::SafetySystem(const AppConfig& config,
                           const WalStore* wal,
                           std::shared_ptr<NotificationSink> notifier)
    : limits_(config.risk),
      wal_(wal),
      notifier_(std::move(notifier)),
      loss_halt_(config.safety.loss_halt_drawdown,
                 static_cast<std::int64_t>(config.safety.loss_window_sec) * 1000),
      transfer_limiter_(LimiterConfigFrom(config.settlement)),
      kill_switch_(config.safety.kill_switch_file),
      idempotency_(static_cast<std::int64_t>(config.safety.idempotency_ttl_sec) * 1000) {}

void SafetySystem::Restore(const WalState& state) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state.loss_halted) {
    loss_halt_.Engage(state.halt_reason);
    LogWarn("LOSS_HALT_RESTORED: 熔断标志从 WAL 恢复，需人工解除, reason=" +
            state.halt_reason);
  }
  for (const auto& [id, job] : state.latest_jobs) {
    transfer_limiter_.OnAccepted(RawToUsd(job.amount_raw), job.created_at_ms);
  }
}

bool SafetySystem::CycleBlocked(std::string* out_reason) const {
  if (kill_switch_.engaged()) {
    if (out_reason != nullptr) {
      *out_reason = "kill switch engaged";
    }
    return true;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (loss_halt_.halted()) {
    if (out_reason != nullptr) {
      *out_reason = "loss halt: " + loss_halt_.reason();
    }
    return true;
  }
  return false;
}

bool SafetySystem::ObserveNav(std::int64_t ts_ms, double nav_usd) {
  std::string reason;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!loss_halt_.Observe(ts_ms, nav_usd, &reason)) {
      return false;
    }
  }
  std::string error;
  if (wal_ != nullptr && !wal_->AppendSafetyEvent(true, reason, ts_ms, &error)) {
    // 内存中熔断已生效；落盘失败仅意味着重启后需重新判定。
    LogError("LOSS_HALT_PERSIST_FAILED: " + error);
  }
  RaiseAlert(AlertSeverity::kCritical, "loss_halt", reason, ts_ms);
  return true;
}

bool SafetySystem::EngageLossHalt(const std::string& reason,
                                  std::int64_t ts_ms,
                                  std::string* out_error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    loss_halt_.Engage(reason);
  }
  RaiseAlert(AlertSeverity::kCritical, "loss_halt", reason, ts_ms);
  if (wal_ != nullptr && !wal_->AppendSafetyEvent(true, reason, ts_ms, out_error)) {
    return false;
  }
  return true;
}

bool SafetySystem::ClearLossHalt(std::int64_t ts_ms, std::string* out_error) {
  // 先落盘再解除：落盘失败时保持熔断。
  if (wal_ != nullptr &&
      !wal_->AppendSafetyEvent(false, "manual clear", ts_ms, out_error)) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    loss_halt_.Clear();
  }
  RaiseAlert(AlertSeverity::kInfo, "loss_halt_cleared", "loss halt manually cleared", ts_ms);
  return true;
}

bool SafetySystem::loss_halted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loss_halt_.halted();
}

std::string SafetySystem::halt_reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loss_halt_.reason();
}

std::vector<std::string> SafetySystem::CheckPortfolio(const Weights& proposed,
                                                      const BasketSnapshot& fresh_snapshot,
                                                      double turnover_24h) const {
  return CheckHardLimits(limits_, proposed, fresh_snapshot, turnover_24h);
}

bool SafetySystem::AllowBridge(double amount_usd,
                               std::int64_t now_ms,
                               std::string* out_reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (loss_halt_.halted()) {
    if (out_reason != nullptr) {
      *out_reason = "loss halt: " + loss_halt_.reason();
    }
    return false;
  }
  return transfer_limiter_.Allow(amount_usd, now_ms, out_reason);
}

void SafetySystem::OnBridgeAccepted(double amount_usd, std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  transfer_limiter_.OnAccepted(amount_usd, now_ms);
}

double SafetySystem::BridgeWindowRemaining(std::int64_t now_ms) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transfer_limiter_.WindowRemaining(now_ms);
}

void SafetySystem::RaiseAlert(AlertSeverity severity,
                              const std::string& code,
                              const std::string& message,
                              std::int64_t ts_ms) {
  if (notifier_ != nullptr) {
    notifier_->Notify(MakeAlert(severity, code, message, ts_ms));
  }
}

}  // namespace basket_engine
