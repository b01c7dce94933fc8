#include "decision/decision_maker.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>

#include "core/json_utils.h"
#include "core/log.h"
#include "storage/record_codec.h"

namespace basket_engine {

namespace {

std::string Fixed4(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.4f", value);
  return buffer;
}

DecisionProposal HoldProposal(const DecisionInput& input,
                              double confidence,
                              std::string rationale,
                              std::vector<std::string> tags = {}) {
  DecisionProposal proposal;
  proposal.action = DecisionAction::kHold;
  proposal.weights = input.snapshot.weights();
  proposal.confidence = confidence;
  proposal.rationale = std::move(rationale);
  proposal.tags = std::move(tags);
  return proposal;
}

const Weights& CandidateWeights(const DecisionInput& input) {
  return input.verdict.adjusted_weights.has_value() ? *input.verdict.adjusted_weights
                                                    : input.for_change.target_weights;
}

}  // namespace

double EstimateCost(const DecisionConfig& config, double turnover, double nav_usd) {
  if (nav_usd <= 0.0) {
    return 0.0;
  }
  return (config.fixed_settlement_fee_usd +
          turnover * nav_usd * config.swap_fee_bps / 1e4) /
         nav_usd;
}

DecisionProposal RuleBasedDecisionMaker::Decide(const DecisionInput& input) const {
  if (!input.verdict.approved) {
    std::string reasons;
    for (const auto& violation : input.verdict.violations) {
      reasons += (reasons.empty() ? "" : "; ") + violation;
    }
    return HoldProposal(input, 1.0, "risk veto: " + reasons, {"risk_veto"});
  }

  // 紧急退出：亏损事件触发，且足够多的高置信看空报告。
  int bearish = 0;
  double bearish_confidence = 0.0;
  for (const auto& report : input.reports) {
    if (report.ok() && report.direction == SignalDirection::kBearish) {
      ++bearish;
      bearish_confidence += report.confidence;
    }
  }
  if (input.trigger == TriggerReason::kLossEvent &&
      bearish >= config_.emergency_min_bearish_reports &&
      bearish_confidence / bearish >= config_.emergency_min_confidence) {
    DecisionProposal proposal;
    proposal.action = DecisionAction::kEmergencyExit;
    proposal.weights = input.snapshot.weights();
    proposal.confidence = bearish_confidence / bearish;
    proposal.rationale = std::to_string(bearish) +
                         " bearish reports on loss event, mean confidence " +
                         Fixed4(proposal.confidence);
    proposal.tags.push_back("emergency_exit");
    return proposal;
  }

  if (input.for_change.proposed_action != DecisionAction::kRebalance) {
    return HoldProposal(input, input.for_hold.confidence,
                        "change advocate did not propose a rebalance");
  }
  const Weights& weights = CandidateWeights(input);
  const double turnover = Turnover(input.snapshot.weights(), weights);
  if (turnover < 1e-9) {
    return HoldProposal(input, input.for_hold.confidence, "proposal equals current weights");
  }
  if (input.for_change.confidence <= input.for_hold.confidence) {
    return HoldProposal(input, input.for_hold.confidence,
                        "hold case stronger: " + Fixed4(input.for_hold.confidence) +
                            " >= " + Fixed4(input.for_change.confidence));
  }

  const double cost = EstimateCost(config_, turnover, input.snapshot.nav_usd);
  const double edge = input.for_change.confidence - input.for_hold.confidence;
  const double benefit = std::max(0.0, edge) * turnover * config_.expected_edge_per_turnover;
  if (cost > benefit * config_.fee_benefit_tolerance) {
    DecisionProposal hold = HoldProposal(
        input, input.for_hold.confidence,
        "fee cost " + Fixed4(cost) + " exceeds expected benefit " + Fixed4(benefit),
        {"fee_exceeds_benefit"});
    hold.cost_estimate = cost;
    return hold;
  }

  DecisionProposal proposal;
  proposal.action = DecisionAction::kRebalance;
  proposal.weights = weights;
  proposal.confidence = input.for_change.confidence;
  proposal.cost_estimate = cost;
  proposal.rationale = "change case stronger by " + Fixed4(edge) + ", turnover " +
                       Fixed4(turnover) + ", cost " + Fixed4(cost);
  if (input.verdict.adjusted_weights.has_value()) {
    proposal.tags.push_back("risk_adjusted");
  }
  return proposal;
}

ModelDecisionMaker::ModelDecisionMaker(
    DecisionConfig config,
    std::shared_ptr<const CompletionService> completion)
    : config_(config), baseline_(config), completion_(std::move(completion)) {}

DecisionProposal ModelDecisionMaker::Decide(const DecisionInput& input) const {
  DecisionProposal baseline = baseline_.Decide(input);
  // 否决时不咨询模型：HOLD 是唯一合法动作。
  if (!input.verdict.approved) {
    return baseline;
  }

  const Weights& candidate = CandidateWeights(input);
  const double turnover = Turnover(input.snapshot.weights(), candidate);
  const double cost = EstimateCost(config_, turnover, input.snapshot.nav_usd);

  JsonWriter payload;
  payload.BeginObject();
  payload.Key("trigger").String(ToString(input.trigger));
  payload.Key("current");
  WriteWeightsJson(input.snapshot.weights(), &payload);
  payload.Key("candidate_weights");
  WriteWeightsJson(candidate, &payload);
  payload.Key("change");
  WriteDebateThesisJson(input.for_change, &payload);
  payload.Key("hold");
  WriteDebateThesisJson(input.for_hold, &payload);
  payload.Key("verdict");
  WriteRiskVerdictJson(input.verdict, &payload);
  payload.Key("reports").BeginArray();
  for (const auto& report : input.reports) {
    WriteAnalystReportJson(report, &payload);
  }
  payload.EndArray();
  payload.Key("hints").BeginArray();
  for (const auto& hint : input.hints) {
    WriteCalibrationHintJson(hint, &payload);
  }
  payload.EndArray();
  payload.Key("history").BeginArray();
  for (const auto& past : input.history) {
    payload.BeginObject();
    payload.Key("id").String(past.id);
    payload.Key("action").String(ToString(past.action));
    payload.Key("confidence").Number(past.confidence);
    payload.Key("status").String(ToString(past.status));
    payload.EndObject();
  }
  payload.EndArray();
  payload.Key("cost_estimate").Number(cost);
  payload.Key("baseline").BeginObject();
  payload.Key("action").String(ToString(baseline.action));
  payload.Key("confidence").Number(baseline.confidence);
  payload.Key("rationale").String(baseline.rationale);
  payload.EndObject();
  payload.EndObject();

  AgentRequest request;
  request.role = AgentRole::kDecisionJudge;
  request.instructions = RoleInstructions(request.role);
  request.payload_json = payload.str();
  request.timeout_ms = config_.judge_timeout_ms;

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
      std::chrono::milliseconds(config_.judge_timeout_ms), &text, &error);

  JsonValue root;
  const auto object_text = ok ? ExtractJsonObject(text) : std::nullopt;
  DecisionAction action = DecisionAction::kHold;
  double confidence = 0.0;
  std::string action_text;
  if (!ok || !object_text.has_value() || !ParseJson(*object_text, &root, &error) ||
      !JsonRequireString(&root, "action", &action_text, &error) ||
      !ParseDecisionAction(action_text, &action) ||
      !JsonRequireNumber(&root, "confidence", 0.0, 1.0, &confidence, &error)) {
    LogWarn("DECISION_JUDGE_UNAVAILABLE: 使用规则基线, error=" + error);
    baseline.tags.push_back("model_judge_fallback");
    return baseline;
  }

  DecisionProposal proposal;
  proposal.action = action;
  proposal.confidence = confidence;
  proposal.rationale =
      JsonAsString(JsonObjectField(&root, "rationale")).value_or("model decision");
  proposal.tags.push_back("model_judge");
  if (action == DecisionAction::kRebalance &&
      (input.for_change.proposed_action != DecisionAction::kRebalance || turnover < 1e-9)) {
    LogWarn("DECISION_JUDGE_UNGATED_REBALANCE: 变更方未提议调仓或无换手，改为 HOLD");
    proposal.action = DecisionAction::kHold;
    proposal.tags.push_back("model_rebalance_not_gated");
  }
  if (proposal.action == DecisionAction::kRebalance) {
    proposal.weights = candidate;
    proposal.cost_estimate = cost;
  } else {
    proposal.weights = input.snapshot.weights();
    if (proposal.action == DecisionAction::kEmergencyExit) {
      proposal.tags.push_back("emergency_exit");
    }
  }
  return proposal;
}

bool EnforceDecisionContract(const DecisionInput& input,
                             const RiskLimits& limits,
                             DecisionProposal* proposal,
                             std::string* out_violation) {
  if (proposal == nullptr) {
    return false;
  }
  std::string violation;
  if (!input.verdict.approved && proposal->action != DecisionAction::kHold) {
    violation = std::string("action ") + ToString(proposal->action) +
                " proposed despite risk veto";
  } else if (proposal->action == DecisionAction::kRebalance) {
    const double sum = WeightSum(proposal->weights);
    if (std::fabs(sum - 1.0) > kWeightSumEpsilon) {
      violation = "rebalance weights sum " + Fixed4(sum) + " != 1.0";
    } else if (input.for_change.proposed_action != DecisionAction::kRebalance) {
      // 风控只评估了变更方的提议；变更方未提议调仓时闸门没有审过任何权重变化。
      violation = "rebalance without a risk-gated change proposal";
    } else if (Turnover(input.snapshot.weights(), proposal->weights) < 1e-9) {
      violation = "rebalance with zero turnover";
    } else if (input.verdict.adjusted_weights.has_value() &&
               Turnover(*input.verdict.adjusted_weights, proposal->weights) > 1e-9) {
      violation = "rebalance ignores risk-adjusted weights";
    } else {
      for (const auto& [token, weight] : proposal->weights) {
        if (weight > limits.max_token_weight + 1e-9 || weight < 0.0) {
          violation = "token " + token + " weight " + Fixed4(weight) + " out of bounds";
          break;
        }
      }
    }
  }

  if (violation.empty()) {
    if (proposal->action != DecisionAction::kRebalance) {
      proposal->weights = input.snapshot.weights();
    }
    return true;
  }

  LogError("DECISION_CONTRACT_VIOLATION: " + violation);
  if (out_violation != nullptr) {
    *out_violation = violation;
  }
  std::vector<std::string> tags = proposal->tags;
  tags.push_back("decision_contract_violation");
  *proposal = HoldProposal(input, proposal->confidence,
                           "decision rejected: " + violation, std::move(tags));
  return false;
}

}  // namespace basket_engine
