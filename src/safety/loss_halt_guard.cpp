#include "safety/loss_halt_guard.h"

#include <algorithm>
#include <cstdio>

namespace basket_engine {

bool LossHaltGuard::Observe(std::int64_t ts_ms, double nav_usd, std::string* out_reason) {
  if (nav_usd <= 0.0) {
    return false;
  }
  samples_.emplace_back(ts_ms, nav_usd);
  while (!samples_.empty() && samples_.front().first < ts_ms - window_ms_) {
    samples_.pop_front();
  }
  if (halted_) {
    return false;
  }

  const double drawdown = CurrentDrawdown();
  if (drawdown <= max_drawdown_) {
    return false;
  }
  char buffer[160];
  std::snprintf(buffer, sizeof(buffer),
                "nav drawdown %.2f%% in trailing window exceeds %.2f%%",
                drawdown * 100.0, max_drawdown_ * 100.0);
  Engage(buffer);
  if (out_reason != nullptr) {
    *out_reason = reason_;
  }
  return true;
}

double LossHaltGuard::CurrentDrawdown() const {
  if (samples_.empty()) {
    return 0.0;
  }
  double peak = 0.0;
  for (const auto& sample : samples_) {
    peak = std::max(peak, sample.second);
  }
  const double current = samples_.back().second;
  return peak > 0.0 ? std::max(0.0, (peak - current) / peak) : 0.0;
}

void LossHaltGuard::Engage(std::string reason) {
  halted_ = true;
  reason_ = std::move(reason);
}

void LossHaltGuard::Clear() {
  halted_ = false;
  reason_.clear();
  // 解除后从当前值重新计窗，避免旧峰值立即再次触发。
  if (!samples_.empty()) {
    const auto last = samples_.back();
    samples_.clear();
    samples_.push_back(last);
  }
}

}  // namespace basket_engine
