#include "debate/debate_engine.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <utility>

#include "core/json_utils.h"
#include "core/log.h"
#include "storage/record_codec.h"

namespace basket_engine {

namespace {

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

AgentRole RoleFor(DebatePosition position) {
  return position == DebatePosition::kAdvocateForChange ? AgentRole::kChangeAdvocate
                                                        : AgentRole::kHoldAdvocate;
}

std::string BuildAdvocatePayload(DebatePosition position,
                                  int round,
                                  const DebateInput& input,
                                  const std::vector<DebateThesis>& transcript,
                                  const std::string& rejection) {
  JsonWriter writer;
  writer.BeginObject();
  writer.Key("position").String(ToString(position));
  writer.Key("round").Integer(round);
  writer.Key("basket");
  WriteSnapshotJson(input.snapshot, &writer);
  writer.Key("reports").BeginArray();
  for (const auto& report : input.reports) {
    WriteAnalystReportJson(report, &writer);
  }
  writer.EndArray();
  writer.Key("transcript").BeginArray();
  for (const auto& thesis : transcript) {
    WriteDebateThesisJson(thesis, &writer);
  }
  writer.EndArray();
  writer.Key("limits").BeginObject();
  writer.Key("max_token_weight").Number(input.limits.max_token_weight);
  writer.Key("anchor_floor").Number(input.limits.anchor_floor);
  writer.Key("max_turnover").Number(input.limits.max_turnover);
  writer.EndObject();
  writer.Key("hints").BeginArray();
  for (const auto& hint : input.hints) {
    WriteCalibrationHintJson(hint, &writer);
  }
  writer.EndArray();
  if (!rejection.empty()) {
    writer.Key("previous_attempt_rejected").String(rejection);
  }
  writer.EndObject();
  return writer.str();
}

}  // namespace

DebateEngine::DebateEngine(DebateConfig config,
                           std::shared_ptr<const CompletionService> completion)
    : config_(config), completion_(std::move(completion)) {}

bool DebateEngine::ValidateThesis(const std::string& text,
                                  DebatePosition position,
                                  int round,
                                  const BasketSnapshot& snapshot,
                                  const std::vector<DebateThesis>& transcript,
                                  const DebateThesis* previous,
                                  DebateThesis* out_thesis,
                                  std::string* out_error) {
  if (out_thesis == nullptr) {
    SetError(out_error, "out_thesis 为空");
    return false;
  }
  const auto object_text = ExtractJsonObject(text);
  JsonValue root;
  std::string error;
  if (!object_text.has_value() || !ParseJson(*object_text, &root, &error)) {
    SetError(out_error, "malformed thesis: " + error);
    return false;
  }

  DebateThesis thesis;
  thesis.position = position;
  thesis.round = round;
  std::string action;
  if (!JsonRequireString(&root, "proposed_action", &action, &error) ||
      !JsonRequireNumber(&root, "confidence", 0.0, 1.0, &thesis.confidence, &error) ||
      !JsonReadStringArray(&root, "evidence", &thesis.evidence, &error) ||
      !WeightsFromJson(&root, "target_weights", &thesis.target_weights, &error)) {
    SetError(out_error, "schema violation: " + error);
    return false;
  }
  if (!ParseDecisionAction(action, &thesis.proposed_action)) {
    SetError(out_error, "schema violation: proposed_action=" + action);
    return false;
  }

  if (thesis.proposed_action == DecisionAction::kRebalance) {
    const double sum = WeightSum(thesis.target_weights);
    if (std::fabs(sum - 1.0) > kWeightSumEpsilon) {
      SetError(out_error, "target weights sum " + std::to_string(sum) + " != 1.0");
      return false;
    }
    for (const auto& [token, weight] : thesis.target_weights) {
      if (weight < 0.0 || !std::isfinite(weight)) {
        SetError(out_error, "negative target weight for " + token);
        return false;
      }
    }
  } else {
    // 不改变权重的动作统一以当前权重记录，避免审计链中出现歧义。
    thesis.target_weights = snapshot.weights();
  }

  // 反附和规则：第 2 轮起改变动作必须带来记录中从未出现的证据。
  if (round >= 2 && previous != nullptr &&
      thesis.proposed_action != previous->proposed_action) {
    std::set<std::string> seen;
    for (const auto& prior : transcript) {
      seen.insert(prior.evidence.begin(), prior.evidence.end());
    }
    const bool has_new = std::any_of(
        thesis.evidence.begin(), thesis.evidence.end(),
        [&seen](const std::string& item) { return !item.empty() && seen.count(item) == 0; });
    if (!has_new) {
      SetError(out_error, std::string("action changed from ") +
                              ToString(previous->proposed_action) + " to " +
                              ToString(thesis.proposed_action) +
                              " without new evidence");
      return false;
    }
  }

  *out_thesis = std::move(thesis);
  return true;
}

bool DebateEngine::Speak(DebatePosition position,
                         int round,
                         const DebateInput& input,
                         const std::vector<DebateThesis>& transcript,
                         const DebateThesis* previous,
                         DebateThesis* out_thesis) const {
  std::string rejection;
  const int attempts = 1 + std::max(0, config_.max_round_retries);
  for (int attempt = 0; attempt < attempts; ++attempt) {
    AgentRequest request;
    request.role = RoleFor(position);
    request.instructions = RoleInstructions(request.role);
    request.payload_json = BuildAdvocatePayload(position, round, input, transcript, rejection);
    request.timeout_ms = config_.round_timeout_ms;

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
        std::chrono::milliseconds(config_.round_timeout_ms), &text, &error);

    DebateThesis thesis;
    if (ok && ValidateThesis(text, position, round, input.snapshot, transcript, previous,
                             &thesis, &error)) {
      thesis.rejected_attempts = attempt;
      *out_thesis = std::move(thesis);
      return true;
    }
    rejection = error;
    LogWarn(std::string("DEBATE_ROUND_REJECTED: ") + ToString(position) + " round=" +
            std::to_string(round) + " attempt=" + std::to_string(attempt + 1) +
            " reason=" + error);
  }

  if (previous == nullptr) {
    return false;
  }
  DebateThesis carried = *previous;
  carried.round = round;
  carried.rejected_attempts = attempts;
  carried.carried_forward = true;
  *out_thesis = std::move(carried);
  return true;
}

DebateOutcome DebateEngine::Run(const DebateInput& input,
                                const std::atomic<bool>* abort) const {
  DebateOutcome outcome;
  const int max_rounds = std::clamp(config_.max_rounds, 1, kMaxDebateRounds);
  std::vector<DebateThesis> transcript;

  for (int round = 1; round <= max_rounds; ++round) {
    if (abort != nullptr && abort->load()) {
      outcome.error = "aborted";
      break;
    }
    const DebateThesis* prev_change =
        outcome.rounds.empty() ? nullptr : &outcome.rounds.back().for_change;
    const DebateThesis* prev_hold =
        outcome.rounds.empty() ? nullptr : &outcome.rounds.back().for_hold;

    DebateRound current;
    current.round = round;
    if (!Speak(DebatePosition::kAdvocateForChange, round, input, transcript, prev_change,
               &current.for_change)) {
      outcome.error = "change advocate produced no valid thesis in round " +
                      std::to_string(round);
      break;
    }
    // 持有方能看到本轮变更方刚发表的论点。
    std::vector<DebateThesis> with_change = transcript;
    with_change.push_back(current.for_change);
    if (!Speak(DebatePosition::kAdvocateForHold, round, input, with_change, prev_hold,
               &current.for_hold)) {
      outcome.error = "hold advocate produced no valid thesis in round " +
                      std::to_string(round);
      break;
    }

    transcript = std::move(with_change);
    transcript.push_back(current.for_hold);
    const double gap = std::fabs(current.for_change.confidence - current.for_hold.confidence);
    outcome.rounds.push_back(std::move(current));
    LogInfo("DEBATE_ROUND: round=" + std::to_string(round) +
            " gap=" + std::to_string(gap));
    if (gap < config_.convergence_gap) {
      outcome.converged = true;
      break;
    }
  }

  outcome.ok = !outcome.rounds.empty();
  return outcome;
}

}  // namespace basket_engine
