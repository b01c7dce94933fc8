#include "risk/risk_gate.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <set>
#include <stdexcept>
#include <utility>

#include "core/json_utils.h"
#include "core/log.h"
#include "storage/record_codec.h"

namespace basket_engine {

namespace {

constexpr double kPresenceEpsilon = 1e-9;

std::string Fixed2(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return buffer;
}

std::string Fixed6(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.6f", value);
  return buffer;
}

double WeightOf(const Weights& weights, const std::string& token) {
  const auto it = weights.find(token);
  return it == weights.end() ? 0.0 : it->second;
}

bool AnyHighVolatility(const std::vector<AnalystReport>& reports) {
  return std::any_of(reports.begin(), reports.end(), [](const AnalystReport& report) {
    return report.ok() && report.high_volatility;
  });
}

}  // namespace

std::vector<std::string> CheckHardLimits(const RiskLimits& limits,
                                         const Weights& proposed,
                                         const BasketSnapshot& snapshot,
                                         double turnover_24h) {
  std::vector<std::string> violations;
  const Weights current = snapshot.weights();

  // 规则 0: 权重合法性（非负、和为 1）
  const double sum = WeightSum(proposed);
  if (std::fabs(sum - 1.0) > kWeightSumEpsilon) {
    violations.push_back("weights sum " + Fixed6(sum) + " != 1.0");
  }
  for (const auto& [token, weight] : proposed) {
    if (weight < 0.0) {
      violations.push_back("token " + token + " weight " + Fixed2(weight) +
                           " is negative");
    }
  }

  // 规则 1: 单 token 上限
  for (const auto& [token, weight] : proposed) {
    if (weight > limits.max_token_weight + kPresenceEpsilon) {
      violations.push_back("token " + token + " weight " + Fixed2(weight) +
                           " exceeds " + Fixed2(limits.max_token_weight) + " limit");
    }
  }

  // 规则 2: 锚定 token 下限
  if (!snapshot.anchor_token.empty()) {
    const double anchor = WeightOf(proposed, snapshot.anchor_token);
    if (anchor + kPresenceEpsilon < limits.anchor_floor) {
      violations.push_back("anchor " + snapshot.anchor_token + " weight " +
                           Fixed2(anchor) + " below " +
                           Fixed2(limits.anchor_floor) + " floor");
    }
  }

  // 规则 3: 单次换手上限
  const double turnover = Turnover(current, proposed);
  if (turnover > limits.max_turnover + kPresenceEpsilon) {
    violations.push_back("turnover " + Fixed2(turnover) + " exceeds " +
                         Fixed2(limits.max_turnover) + " limit");
  }

  // 规则 4: 增删 token 数
  std::set<std::string> tokens;
  for (const auto& [token, weight] : current) {
    tokens.insert(token);
  }
  for (const auto& [token, weight] : proposed) {
    tokens.insert(token);
  }
  int added_removed = 0;
  for (const auto& token : tokens) {
    const bool before = WeightOf(current, token) > kPresenceEpsilon;
    const bool after = WeightOf(proposed, token) > kPresenceEpsilon;
    if (before != after) {
      ++added_removed;
    }
  }
  if (added_removed > limits.max_tokens_added_removed) {
    violations.push_back("tokens added+removed " + std::to_string(added_removed) +
                         " exceeds " + std::to_string(limits.max_tokens_added_removed) +
                         " limit");
  }

  // 规则 5: 非平凡权重 token 的流动性下限
  for (const auto& [token, weight] : proposed) {
    if (weight <= limits.trivial_weight) {
      continue;
    }
    const auto it = snapshot.tokens.find(token);
    const double liquidity = it == snapshot.tokens.end() ? 0.0 : it->second.liquidity_usd;
    if (liquidity < limits.min_liquidity_usd) {
      violations.push_back("token " + token + " liquidity " + Fixed2(liquidity) +
                           " below " + Fixed2(limits.min_liquidity_usd) + " minimum");
    }
  }

  // 规则 6: 24h 累计换手
  if (turnover_24h + turnover > limits.max_turnover_24h + kPresenceEpsilon) {
    violations.push_back("rolling 24h turnover " + Fixed2(turnover_24h + turnover) +
                         " exceeds " + Fixed2(limits.max_turnover_24h) + " limit");
  }
  return violations;
}

Weights ShrinkTowards(const Weights& current, const Weights& proposed, double fraction) {
  const double f = std::clamp(fraction, 0.0, 1.0);
  std::set<std::string> tokens;
  for (const auto& [token, weight] : current) {
    tokens.insert(token);
  }
  for (const auto& [token, weight] : proposed) {
    tokens.insert(token);
  }
  Weights out;
  for (const auto& token : tokens) {
    const double from = WeightOf(current, token);
    const double to = WeightOf(proposed, token);
    const double value = from + f * (to - from);
    if (value > kPresenceEpsilon || proposed.count(token) > 0) {
      out[token] = value;
    }
  }
  return out;
}

SoftRiskResult RuleBasedSoftRiskJudge::Judge(const SoftRiskInput& input) const {
  SoftRiskResult result;
  const bool small_basket = input.snapshot.nav_usd < limits_.small_basket_nav_usd;
  const int allowed = small_basket ? limits_.small_basket_max_rebalances_24h
                                   : limits_.max_rebalances_24h;
  if (input.rebalances_24h >= allowed) {
    result.veto = true;
    result.reason = "rebalance frequency " + std::to_string(input.rebalances_24h) +
                    " in 24h reaches " + std::to_string(allowed) + " allowed for nav " +
                    Fixed2(input.snapshot.nav_usd);
    return result;
  }

  const double turnover = Turnover(input.snapshot.weights(), input.proposed);
  if (AnyHighVolatility(input.reports) && turnover > limits_.soft_turnover_cap) {
    result.max_change_fraction = limits_.soft_turnover_cap / turnover;
    result.reason = "high volatility: turnover " + Fixed2(turnover) + " shrunk to " +
                    Fixed2(limits_.soft_turnover_cap);
    return result;
  }
  result.reason = "soft checks passed";
  return result;
}

ModelSoftRiskJudge::ModelSoftRiskJudge(
    RiskLimits limits,
    std::shared_ptr<const CompletionService> completion)
    : rules_(limits),
      completion_(std::move(completion)),
      timeout_ms_(limits.soft_judge_timeout_ms) {}

SoftRiskResult ModelSoftRiskJudge::Judge(const SoftRiskInput& input) const {
  SoftRiskResult result = rules_.Judge(input);
  if (result.veto) {
    return result;
  }

  JsonWriter payload;
  payload.BeginObject();
  payload.Key("current");
  WriteWeightsJson(input.snapshot.weights(), &payload);
  payload.Key("proposed");
  WriteWeightsJson(input.proposed, &payload);
  payload.Key("nav_usd").Number(input.snapshot.nav_usd);
  payload.Key("turnover").Number(Turnover(input.snapshot.weights(), input.proposed));
  payload.Key("rebalances_24h").Integer(input.rebalances_24h);
  payload.Key("reports").BeginArray();
  for (const auto& report : input.reports) {
    WriteAnalystReportJson(report, &payload);
  }
  payload.EndArray();
  payload.EndObject();

  AgentRequest request;
  request.role = AgentRole::kSoftRiskJudge;
  request.instructions = RoleInstructions(request.role);
  request.payload_json = payload.str();
  request.timeout_ms = timeout_ms_;

  const auto completion = completion_;
  std::string text;
  std::string error;
  const bool ok = RunWithTimeout<std::string>(
      [completion, request](const CancelToken& cancel) {
        std::string out;
        std::string call_error;
        if (!completion->Complete(request, cancel, &out, &call_error)) {
          throw std::runtime_error(call_error);
        }
        return out;
      },
      std::chrono::milliseconds(timeout_ms_), &text, &error);

  JsonValue root;
  const auto object_text = ok ? ExtractJsonObject(text) : std::nullopt;
  if (!ok || !object_text.has_value() || !ParseJson(*object_text, &root, &error)) {
    LogWarn("SOFT_JUDGE_UNAVAILABLE: 沿用规则软判断, error=" + error);
    result.reason += " (model judge unavailable: " + error + ")";
    return result;
  }
  const auto veto = JsonAsBool(JsonObjectField(&root, "veto"));
  const auto fraction = JsonAsNumber(JsonObjectField(&root, "max_change_fraction"));
  if (!veto.has_value() || !fraction.has_value() || *fraction < 0.0 || *fraction > 1.0) {
    LogWarn("SOFT_JUDGE_SCHEMA: 模型输出不合 schema，沿用规则软判断");
    result.reason += " (model judge output rejected)";
    return result;
  }
  const std::string reason =
      JsonAsString(JsonObjectField(&root, "reason")).value_or("model judgment");
  if (*veto) {
    result.veto = true;
    result.reason = "model soft veto: " + reason;
    return result;
  }
  // 模型只能收紧，取两者中更小的收缩比例。
  if (*fraction < result.max_change_fraction) {
    result.max_change_fraction = *fraction;
    result.reason = "model shrink: " + reason;
  }
  return result;
}

RiskGate::RiskGate(RiskLimits limits, std::shared_ptr<const SoftRiskJudge> soft_judge)
    : limits_(limits), soft_judge_(std::move(soft_judge)) {}

RiskVerdict RiskGate::Evaluate(const RiskRequest& request) const {
  RiskVerdict verdict;
  verdict.max_allowed_change =
      std::max(0.0, std::min(limits_.max_turnover,
                             limits_.max_turnover_24h - request.turnover_24h));

  // HOLD / EMERGENCY_EXIT 不改变权重，直接通过。
  if (request.action != DecisionAction::kRebalance) {
    verdict.approved = true;
    verdict.soft_reason = "no weight change";
    return verdict;
  }

  verdict.violations =
      CheckHardLimits(limits_, request.proposed, request.snapshot, request.turnover_24h);
  if (!verdict.violations.empty()) {
    verdict.approved = false;
    std::string joined;
    for (const auto& violation : verdict.violations) {
      joined += (joined.empty() ? "" : "; ") + violation;
    }
    LogWarn("RISK_VETO: " + joined);
    return verdict;
  }

  SoftRiskInput soft_input;
  soft_input.proposed = request.proposed;
  soft_input.snapshot = request.snapshot;
  soft_input.reports = request.reports;
  soft_input.rebalances_24h = request.rebalances_24h;
  const SoftRiskResult soft = soft_judge_->Judge(soft_input);
  verdict.soft_checked = true;
  verdict.soft_reason = soft.reason;
  if (soft.veto) {
    verdict.approved = false;
    verdict.violations.push_back("soft veto: " + soft.reason);
    LogWarn("RISK_SOFT_VETO: " + soft.reason);
    return verdict;
  }

  if (soft.max_change_fraction < 1.0) {
    Weights adjusted = ShrinkTowards(request.snapshot.weights(), request.proposed,
                                     soft.max_change_fraction);
    const auto recheck =
        CheckHardLimits(limits_, adjusted, request.snapshot, request.turnover_24h);
    if (!recheck.empty()) {
      verdict.approved = false;
      verdict.violations = recheck;
      verdict.violations.push_back("soft adjustment breaches hard limits");
      LogWarn("RISK_VETO: 收缩后的权重违反硬限制");
      return verdict;
    }
    verdict.max_allowed_change =
        std::min(verdict.max_allowed_change, Turnover(request.snapshot.weights(), adjusted));
    verdict.adjusted_weights = std::move(adjusted);
  }
  verdict.approved = true;
  return verdict;
}

}  // namespace basket_engine
