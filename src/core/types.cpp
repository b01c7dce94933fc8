#include "core/types.h"

#include <cmath>
#include <set>

namespace basket_engine {

namespace {

// 通用枚举反解析：按 ToString 文本逐个比对，避免两处维护映射表。
template <typename Enum, std::size_t N>
bool ParseByName(const std::string& text,
                 const std::array<Enum, N>& candidates,
                 Enum* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  for (const Enum candidate : candidates) {
    if (text == ToString(candidate)) {
      *out_value = candidate;
      return true;
    }
  }
  return false;
}

}  // namespace

bool ParseProducerKind(const std::string& text, ProducerKind* out_kind) {
  return ParseByName(text, kAllProducerKinds, out_kind);
}

bool ParseSignalDirection(const std::string& text,
                          SignalDirection* out_direction) {
  static constexpr std::array<SignalDirection, 3> kValues{
      SignalDirection::kBullish,
      SignalDirection::kBearish,
      SignalDirection::kNeutral,
  };
  return ParseByName(text, kValues, out_direction);
}

bool ParseDecisionAction(const std::string& text, DecisionAction* out_action) {
  static constexpr std::array<DecisionAction, 3> kValues{
      DecisionAction::kRebalance,
      DecisionAction::kHold,
      DecisionAction::kEmergencyExit,
  };
  return ParseByName(text, kValues, out_action);
}

bool ParseTriggerReason(const std::string& text, TriggerReason* out_reason) {
  static constexpr std::array<TriggerReason, 3> kValues{
      TriggerReason::kScheduled,
      TriggerReason::kLossEvent,
      TriggerReason::kSentimentEvent,
  };
  return ParseByName(text, kValues, out_reason);
}

bool ParseExecutionStatus(const std::string& text, ExecutionStatus* out_status) {
  static constexpr std::array<ExecutionStatus, 6> kValues{
      ExecutionStatus::kNotExecuted,
      ExecutionStatus::kSkipped,
      ExecutionStatus::kAborted,
      ExecutionStatus::kSubmitted,
      ExecutionStatus::kSubmitFailed,
      ExecutionStatus::kBlockedBySafety,
  };
  return ParseByName(text, kValues, out_status);
}

bool ParseBridgeState(const std::string& text, BridgeState* out_state) {
  static constexpr std::array<BridgeState, 9> kValues{
      BridgeState::kReady,
      BridgeState::kSourceLocked,
      BridgeState::kSourceConfirmed,
      BridgeState::kAttestationPending,
      BridgeState::kAttestationReceived,
      BridgeState::kDestMinted,
      BridgeState::kDeposited,
      BridgeState::kFailed,
      BridgeState::kCancelled,
  };
  return ParseByName(text, kValues, out_state);
}

double WeightSum(const Weights& weights) {
  double sum = 0.0;
  for (const auto& [token, weight] : weights) {
    (void)token;
    sum += weight;
  }
  return sum;
}

double Turnover(const Weights& current, const Weights& proposed) {
  std::set<std::string> tokens;
  for (const auto& [token, weight] : current) {
    (void)weight;
    tokens.insert(token);
  }
  for (const auto& [token, weight] : proposed) {
    (void)weight;
    tokens.insert(token);
  }

  double abs_delta_sum = 0.0;
  for (const auto& token : tokens) {
    const auto cur_it = current.find(token);
    const auto pro_it = proposed.find(token);
    const double cur = cur_it == current.end() ? 0.0 : cur_it->second;
    const double pro = pro_it == proposed.end() ? 0.0 : pro_it->second;
    abs_delta_sum += std::fabs(pro - cur);
  }
  return 0.5 * abs_delta_sum;
}

}  // namespace basket_engine
