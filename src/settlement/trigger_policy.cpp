#include "settlement/trigger_policy.h"

#include <algorithm>
#include <cstdio>

namespace basket_engine {

namespace {

std::string FormatUsd(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return buffer;
}

}  // namespace

BridgeTriggerDecision BridgeTriggerPolicy::Evaluate(const BridgeTriggerInput& input) const {
  BridgeTriggerDecision decision;
  if (!config_.enabled) {
    decision.reason = "settlement disabled";
    return decision;
  }
  const double available = std::max(0.0, input.accrued_fees_usd - input.reserved_usd);
  const bool threshold_hit = available >= config_.trigger_threshold_usd;
  const bool fallback_due =
      input.now_ms - input.last_job_ms >= static_cast<std::int64_t>(config_.fallback_interval_sec) * 1000;
  if (!threshold_hit && !fallback_due) {
    decision.reason = "available " + FormatUsd(available) + " below threshold " +
                      FormatUsd(config_.trigger_threshold_usd);
    return decision;
  }
  if (input.source_congestion > config_.max_source_congestion) {
    decision.reason = "source congestion " + FormatUsd(input.source_congestion) +
                      " exceeds ceiling " + FormatUsd(config_.max_source_congestion);
    return decision;
  }
  const double amount =
      std::min({available, config_.max_job_usd, std::max(0.0, input.window_remaining_usd)});
  if (amount < config_.min_job_usd) {
    decision.reason = "amount " + FormatUsd(amount) + " below minimum job " +
                      FormatUsd(config_.min_job_usd);
    return decision;
  }
  decision.create = true;
  decision.amount_usd = amount;
  decision.reason = threshold_hit ? "threshold" : "weekly fallback";
  return decision;
}

}  // namespace basket_engine
