#include "reflection/reflection_engine.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

#include "core/log.h"

namespace basket_engine {

namespace {

constexpr std::int64_t kHourMs = 3600LL * 1000;

std::string FormatScore(double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return buffer;
}

std::string FormatPercent(double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%+.2f%%", value * 100.0);
  return buffer;
}

}  // namespace

ReflectionEngine::ReflectionEngine(ReflectionConfig config,
                                   const MarketStateReader* market,
                                   const WalStore* wal)
    : config_(config), market_(market), wal_(wal) {}

void ReflectionEngine::Restore(const WalState& state) {
  std::lock_guard<std::mutex> lock(mutex_);
  reflected_ids_ = state.reflected_ids;
  hints_ = state.hints;
}

bool ReflectionEngine::IsDue(const Decision& decision, std::int64_t now_ms, int delay_hours) {
  return now_ms - decision.created_at_ms >= static_cast<std::int64_t>(delay_hours) * kHourMs;
}

double ReflectionEngine::ScoreReport(const AnalystReport& report,
                                     double realized_move,
                                     double neutral_band) {
  const double confidence = std::clamp(report.confidence, 0.0, 1.0);
  const double band = neutral_band > 0.0 ? neutral_band : 1e-9;
  if (report.direction == SignalDirection::kNeutral) {
    return std::clamp(1.0 - std::fabs(realized_move) / band, 0.0, 1.0);
  }
  if (std::fabs(realized_move) <= band) {
    // 方向性判断遇到区间内波动：不奖不罚。
    return 0.5;
  }
  const bool up = realized_move > 0.0;
  const bool correct = (report.direction == SignalDirection::kBullish) == up;
  return correct ? 0.5 + 0.5 * confidence : 0.5 - 0.5 * confidence;
}

bool ReflectionEngine::BuildHint(const Decision& decision,
                                 double realized_move,
                                 double nav_change,
                                 double neutral_band,
                                 std::int64_t now_ms,
                                 CalibrationHint* out_hint) {
  CalibrationHint hint;
  hint.decision_id = decision.id;
  hint.created_at_ms = now_ms;
  hint.realized_nav_change = nav_change;
  double best = -1.0;
  double worst = 2.0;
  for (const auto& report : decision.reports) {
    if (!report.ok()) {
      continue;
    }
    const double score = ScoreReport(report, realized_move, neutral_band);
    hint.accuracy[report.producer] = score;
    if (score > best) {
      best = score;
      hint.best_producer = ToString(report.producer);
    }
    if (score < worst) {
      worst = score;
      hint.worst_producer = ToString(report.producer);
    }
  }
  if (hint.accuracy.empty()) {
    return false;
  }
  hint.note = "best=" + hint.best_producer + "(" + FormatScore(best) + ") worst=" +
              hint.worst_producer + "(" + FormatScore(worst) + ") market_move=" +
              FormatPercent(realized_move) + " nav_change=" + FormatPercent(nav_change) +
              " action=" + ToString(decision.action);
  if (out_hint != nullptr) {
    *out_hint = std::move(hint);
  }
  return true;
}

bool ReflectionEngine::MeasureOutcome(const Decision& decision,
                                      std::int64_t horizon_ms,
                                      double* out_move,
                                      double* out_nav_change,
                                      std::string* out_error) const {
  if (market_ == nullptr) {
    if (out_error != nullptr) {
      *out_error = "market reader not configured";
    }
    return false;
  }
  double nav_then = 0.0;
  double nav_later = 0.0;
  if (!market_->NavAt(decision.created_at_ms, &nav_then, out_error) ||
      !market_->NavAt(horizon_ms, &nav_later, out_error)) {
    return false;
  }
  *out_nav_change = nav_then > 0.0 ? nav_later / nav_then - 1.0 : 0.0;

  // 市场方向：按决策前权重加权的 token 涨跌；价格缺失的 token 忽略并重新归一。
  double weighted = 0.0;
  double covered = 0.0;
  for (const auto& [token, weight] : decision.prior_weights) {
    double then_price = 0.0;
    double later_price = 0.0;
    std::string ignored;
    if (weight <= 0.0 || !market_->PriceAt(token, decision.created_at_ms, &then_price, &ignored) ||
        !market_->PriceAt(token, horizon_ms, &later_price, &ignored) || then_price <= 0.0) {
      continue;
    }
    weighted += weight * (later_price / then_price - 1.0);
    covered += weight;
  }
  *out_move = covered > 0.0 ? weighted / covered : *out_nav_change;
  return true;
}

int ReflectionEngine::RunDue(const std::vector<Decision>& decisions, std::int64_t now_ms) {
  int produced = 0;
  for (const auto& decision : decisions) {
    if (!IsDue(decision, now_ms, config_.delay_hours) || IsReflected(decision.id)) {
      continue;
    }
    const std::int64_t horizon =
        decision.created_at_ms + static_cast<std::int64_t>(config_.delay_hours) * kHourMs;
    double move = 0.0;
    double nav_change = 0.0;
    std::string error;
    if (!MeasureOutcome(decision, horizon, &move, &nav_change, &error)) {
      LogWarn("REFLECTION_MEASURE_FAILED: decision=" + decision.id + ", " + error);
      continue;
    }

    CalibrationHint hint;
    const bool has_hint =
        BuildHint(decision, move, nav_change, config_.neutral_band, now_ms, &hint);
    if (has_hint) {
      if (wal_ != nullptr && !wal_->AppendHint(hint, &error)) {
        LogError("REFLECTION_PERSIST_FAILED: decision=" + decision.id + ", " + error);
        continue;
      }
    }
    if (wal_ != nullptr && !wal_->AppendReflected(decision.id, now_ms, &error)) {
      LogError("REFLECTION_PERSIST_FAILED: decision=" + decision.id + ", " + error);
      if (!has_hint) {
        continue;
      }
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      reflected_ids_.insert(decision.id);
      if (has_hint) {
        hints_.push_back(hint);
      }
    }
    if (has_hint) {
      ++produced;
      LogInfo("REFLECTION_HINT: decision=" + decision.id + ", " + hint.note);
    } else {
      LogInfo("REFLECTION_SKIPPED: decision=" + decision.id + " 无可评分的分析师报告");
    }
  }
  return produced;
}

std::vector<CalibrationHint> ReflectionEngine::RecentHints(std::size_t n) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t start = hints_.size() > n ? hints_.size() - n : 0;
  return std::vector<CalibrationHint>(hints_.begin() + static_cast<std::ptrdiff_t>(start),
                                      hints_.end());
}

bool ReflectionEngine::IsReflected(const std::string& decision_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reflected_ids_.count(decision_id) > 0;
}

}  // namespace basket_engine
