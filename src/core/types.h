#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace basket_engine {

/// 目标权重：token -> 占比，使用有序 map 保证遍历/序列化顺序确定。
using Weights = std::map<std::string, double>;

/// 权重和的容差：提交决策时 `Σ weights == 1.0 ± kWeightSumEpsilon`。
inline constexpr double kWeightSumEpsilon = 1e-6;

/// 决策周期触发原因。
enum class TriggerReason {
  kScheduled,
  kLossEvent,
  kSentimentEvent,
};

/// 四个固定的分析师角色（不做开放式插件注册）。
enum class ProducerKind {
  kTechnical,
  kSentiment,
  kLiquidity,
  kMacro,
};

inline constexpr std::array<ProducerKind, 4> kAllProducerKinds{
    ProducerKind::kTechnical,
    ProducerKind::kSentiment,
    ProducerKind::kLiquidity,
    ProducerKind::kMacro,
};

/// 分析师方向性信号。
enum class SignalDirection {
  kBullish,
  kBearish,
  kNeutral,
};

/// 单个 token 的链上/行情状态。
struct TokenState {
  double weight{0.0};
  double price_usd{0.0};
  double liquidity_usd{0.0};
  double change_24h{0.0};  // 24h 价格变化率，0.05 表示 +5%。
};

/// 篮子快照：当前权重、NAV 与 per-token 流动性。
struct BasketSnapshot {
  std::int64_t ts_ms{0};
  double nav_usd{0.0};
  std::string anchor_token;
  std::map<std::string, TokenState> tokens;

  Weights weights() const {
    Weights out;
    for (const auto& [token, state] : tokens) {
      out[token] = state.weight;
    }
    return out;
  }
};

/// 市场上下文：分析师的附加输入（不含篮子本身）。
struct MarketContext {
  std::vector<double> recent_nav;  // 按时间升序的 NAV 序列。
  double sentiment_index{0.0};  // [-1, 1]，外部情绪指标。
  double realized_volatility{0.0};  // 近期 NAV 收益波动率。
};

/// 分析师报告：一经产出不可变，归属于创建它的决策周期。
struct AnalystReport {
  ProducerKind producer{ProducerKind::kTechnical};
  double confidence{0.0};  // [0, 1]
  SignalDirection direction{SignalDirection::kNeutral};
  std::vector<std::string> evidence;
  bool high_volatility{false};
  std::optional<std::string> error;  // 有值表示该分析师失败（超时/输出非法）。
  std::int64_t latency_ms{0};

  bool ok() const { return !error.has_value(); }
};

/// 最终动作。
enum class DecisionAction {
  kRebalance,
  kHold,
  kEmergencyExit,
};

/// 辩论立场。
enum class DebatePosition {
  kAdvocateForChange,
  kAdvocateForHold,
};

/// 辩论论点：每轮每方一条，追加写入，不做原地修改。
struct DebateThesis {
  DebatePosition position{DebatePosition::kAdvocateForHold};
  DecisionAction proposed_action{DecisionAction::kHold};
  Weights target_weights;  // proposed_action==kRebalance 时必须和为 1。
  double confidence{0.0};
  std::vector<std::string> evidence;
  int round{0};
  int rejected_attempts{0};  // 本轮被程序性拒绝的次数。
  bool carried_forward{false};  // 重试耗尽后沿用上一轮论点。
};

/// 一轮辩论的两条论点。
struct DebateRound {
  int round{0};
  DebateThesis for_change;
  DebateThesis for_hold;
};

/// 风控裁决：每个周期产出一次，不可变。
struct RiskVerdict {
  bool approved{false};
  std::vector<std::string> violations;  // 触发的全部硬限制（approved 时为空）。
  std::optional<Weights> adjusted_weights;  // 软判断缩量后的权重。
  double max_allowed_change{0.0};
  bool soft_checked{false};
  std::string soft_reason;
};

/// 决策执行状态。
enum class ExecutionStatus {
  kNotExecuted,
  kSkipped,
  kAborted,
  kSubmitted,
  kSubmitFailed,
  kBlockedBySafety,
};

/// 决策记录：每周期创建一次，仅追加，携带完整审计链。
struct Decision {
  std::string id;
  std::int64_t created_at_ms{0};
  TriggerReason trigger{TriggerReason::kScheduled};
  DecisionAction action{DecisionAction::kHold};
  Weights prior_weights;
  Weights final_weights;
  double confidence{0.0};
  double cost_estimate{0.0};  // 预计结算费用 / NAV。
  double nav_usd{0.0};
  std::string rationale;
  std::vector<std::string> tags;
  std::vector<AnalystReport> reports;
  std::vector<DebateRound> debate;
  std::optional<RiskVerdict> verdict;
  ExecutionStatus status{ExecutionStatus::kNotExecuted};
  std::optional<std::string> tx_ref;
  std::string status_detail;
};

/// 跨链结算任务状态（严格有序，FAILED/CANCELLED 为吸收态）。
enum class BridgeState {
  kReady,
  kSourceLocked,
  kSourceConfirmed,
  kAttestationPending,
  kAttestationReceived,
  kDestMinted,
  kDeposited,
  kFailed,
  kCancelled,
};

/// 跨链结算任务：由结算状态机原地推进，每次迁移都整体落盘。
struct BridgeJob {
  std::string id;
  std::uint64_t amount_raw{0};  // 6 位小数的基础单位。
  BridgeState state{BridgeState::kReady};
  std::string source_tx_ref;
  std::string message_hash;
  std::int64_t attestation_requested_ms{0};
  std::string attestation;
  std::string dest_tx_ref;
  std::string deposit_tx_ref;
  std::string error;
  std::string failed_step;
  int retry_count{0};
  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};
  std::int64_t state_entered_ms{0};
};

/// 分析师校准提示：由反思引擎产出，只追加。
struct CalibrationHint {
  std::string decision_id;
  std::int64_t created_at_ms{0};
  std::map<ProducerKind, double> accuracy;  // [0, 1]
  std::string best_producer;
  std::string worst_producer;
  double realized_nav_change{0.0};
  std::string note;
};

/// 告警级别。
enum class AlertSeverity {
  kInfo,
  kWarning,
  kCritical,
};

/// 安全系统/结算告警（fire-and-forget）。
struct Alert {
  AlertSeverity severity{AlertSeverity::kInfo};
  std::string code;
  std::string message;
  std::int64_t ts_ms{0};
};

/// 6 位小数基础单位与 USD 的换算。
inline constexpr std::uint64_t kAmountScale = 1'000'000ULL;

inline double RawToUsd(std::uint64_t amount_raw) {
  return static_cast<double>(amount_raw) / static_cast<double>(kAmountScale);
}

/// 向下取整到基础单位；负数与非有限值返回 0。
inline std::uint64_t UsdToRaw(double amount_usd) {
  if (!(amount_usd > 0.0)) {
    return 0;
  }
  return static_cast<std::uint64_t>(amount_usd * static_cast<double>(kAmountScale));
}

inline const char* ToString(TriggerReason reason) {
  switch (reason) {
    case TriggerReason::kScheduled:
      return "scheduled";
    case TriggerReason::kLossEvent:
      return "loss-event";
    case TriggerReason::kSentimentEvent:
      return "sentiment-event";
  }
  return "unknown";
}

inline const char* ToString(ProducerKind kind) {
  switch (kind) {
    case ProducerKind::kTechnical:
      return "technical";
    case ProducerKind::kSentiment:
      return "sentiment";
    case ProducerKind::kLiquidity:
      return "liquidity";
    case ProducerKind::kMacro:
      return "macro";
  }
  return "unknown";
}

inline const char* ToString(SignalDirection direction) {
  switch (direction) {
    case SignalDirection::kBullish:
      return "bullish";
    case SignalDirection::kBearish:
      return "bearish";
    case SignalDirection::kNeutral:
      return "neutral";
  }
  return "unknown";
}

inline const char* ToString(DecisionAction action) {
  switch (action) {
    case DecisionAction::kRebalance:
      return "REBALANCE";
    case DecisionAction::kHold:
      return "HOLD";
    case DecisionAction::kEmergencyExit:
      return "EMERGENCY_EXIT";
  }
  return "UNKNOWN";
}

inline const char* ToString(DebatePosition position) {
  switch (position) {
    case DebatePosition::kAdvocateForChange:
      return "ADVOCATE_FOR_CHANGE";
    case DebatePosition::kAdvocateForHold:
      return "ADVOCATE_FOR_HOLD";
  }
  return "UNKNOWN";
}

inline const char* ToString(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::kNotExecuted:
      return "NOT_EXECUTED";
    case ExecutionStatus::kSkipped:
      return "SKIPPED";
    case ExecutionStatus::kAborted:
      return "ABORTED";
    case ExecutionStatus::kSubmitted:
      return "SUBMITTED";
    case ExecutionStatus::kSubmitFailed:
      return "SUBMIT_FAILED";
    case ExecutionStatus::kBlockedBySafety:
      return "BLOCKED_BY_SAFETY";
  }
  return "UNKNOWN";
}

inline const char* ToString(BridgeState state) {
  switch (state) {
    case BridgeState::kReady:
      return "READY";
    case BridgeState::kSourceLocked:
      return "SOURCE_LOCKED";
    case BridgeState::kSourceConfirmed:
      return "SOURCE_CONFIRMED";
    case BridgeState::kAttestationPending:
      return "ATTESTATION_PENDING";
    case BridgeState::kAttestationReceived:
      return "ATTESTATION_RECEIVED";
    case BridgeState::kDestMinted:
      return "DEST_MINTED";
    case BridgeState::kDeposited:
      return "DEPOSITED";
    case BridgeState::kFailed:
      return "FAILED";
    case BridgeState::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

inline const char* ToString(AlertSeverity severity) {
  switch (severity) {
    case AlertSeverity::kInfo:
      return "info";
    case AlertSeverity::kWarning:
      return "warning";
    case AlertSeverity::kCritical:
      return "critical";
  }
  return "unknown";
}

/// 终态判定：DEPOSITED / FAILED / CANCELLED。
inline bool IsTerminal(BridgeState state) {
  return state == BridgeState::kDeposited || state == BridgeState::kFailed ||
         state == BridgeState::kCancelled;
}

/// 文本反解析（WAL / 配置 / LLM 输出共用），失败返回 false。
bool ParseProducerKind(const std::string& text, ProducerKind* out_kind);
bool ParseSignalDirection(const std::string& text, SignalDirection* out_direction);
bool ParseDecisionAction(const std::string& text, DecisionAction* out_action);
bool ParseTriggerReason(const std::string& text, TriggerReason* out_reason);
bool ParseExecutionStatus(const std::string& text, ExecutionStatus* out_status);
bool ParseBridgeState(const std::string& text, BridgeState* out_state);

/// 权重求和。
double WeightSum(const Weights& weights);
/// 换手率：0.5 * Σ|proposed - current|（两侧缺失 token 视为 0）。
double Turnover(const Weights& current, const Weights& proposed);

}  // namespace basket_engine
