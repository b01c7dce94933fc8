#include "safety/transfer_limiter.h"

#include <algorithm>
#include <cstdio>

namespace basket_engine {

namespace {

std::string Usd(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return buffer;
}

}  // namespace

/**
 * @brief 检查是否允许转账 (Transfer Check)
 * 包含：单笔上下限、滚动窗口累计上限。
 */
bool TransferLimiter::Allow(double amount_usd,
                            std::int64_t now_ms,
                            std::string* out_reason) {
  auto on_allowed = [this]() {
    ++total_stats_.checks;
    ++total_stats_.allowed;
  };
  auto on_rejected = [this](std::uint64_t TransferLimiterStats::*bucket) {
    ++total_stats_.checks;
    ++total_stats_.rejected;
    ++(total_stats_.*bucket);
  };

  Prune(now_ms);

  // 规则 1: 单笔下限 (Minimum Deposit)
  if (amount_usd < config_.min_job_usd) {
    if (out_reason != nullptr) {
      *out_reason = "amount " + Usd(amount_usd) + " below per-job minimum " +
                    Usd(config_.min_job_usd);
    }
    on_rejected(&TransferLimiterStats::below_min_rejects);
    return false;
  }

  // 规则 2: 单笔上限 (Per-Job Ceiling)
  if (amount_usd > config_.max_job_usd) {
    if (out_reason != nullptr) {
      *out_reason = "amount " + Usd(amount_usd) + " exceeds per-job ceiling " +
                    Usd(config_.max_job_usd);
    }
    on_rejected(&TransferLimiterStats::per_job_rejects);
    return false;
  }

  // 规则 3: 滚动窗口累计上限 (Rolling Window Ceiling)
  const double window_total = WindowTotal(now_ms);
  if (window_total + amount_usd > config_.max_window_usd) {
    if (out_reason != nullptr) {
      *out_reason = "rolling window total " + Usd(window_total + amount_usd) +
                    " would exceed ceiling " + Usd(config_.max_window_usd);
    }
    on_rejected(&TransferLimiterStats::window_rejects);
    return false;
  }

  on_allowed();
  return true;
}

void TransferLimiter::OnAccepted(double amount_usd, std::int64_t now_ms) {
  accepted_.emplace_back(now_ms, amount_usd);
}

double TransferLimiter::WindowTotal(std::int64_t now_ms) const {
  double total = 0.0;
  for (const auto& [ts_ms, amount] : accepted_) {
    if (ts_ms >= now_ms - config_.window_ms) {
      total += amount;
    }
  }
  return total;
}

double TransferLimiter::WindowRemaining(std::int64_t now_ms) const {
  return std::max(0.0, config_.max_window_usd - WindowTotal(now_ms));
}

void TransferLimiter::Prune(std::int64_t now_ms) {
  while (!accepted_.empty() && accepted_.front().first < now_ms - config_.window_ms) {
    accepted_.pop_front();
  }
}

}  // namespace basket_engine
