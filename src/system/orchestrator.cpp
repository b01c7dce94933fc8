#include "system/orchestrator.h"

#include <algorithm>
#include <optional>
#include <utility>

#include "core/hash_utils.h"
#include "core/log.h"

namespace basket_engine {

namespace {

constexpr std::int64_t kDayMs = 86400LL * 1000;

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

std::shared_ptr<const SoftRiskJudge> MakeSoftJudge(
    const RiskLimits& limits,
    const std::shared_ptr<const CompletionService>& completion) {
  if (limits.use_model_soft_judge && completion != nullptr) {
    return std::make_shared<ModelSoftRiskJudge>(limits, completion);
  }
  return std::make_shared<RuleBasedSoftRiskJudge>(limits);
}

std::unique_ptr<DecisionMaker> MakeDecisionMaker(
    const DecisionConfig& config,
    const std::shared_ptr<const CompletionService>& completion) {
  if (config.use_model_judge && completion != nullptr) {
    return std::make_unique<ModelDecisionMaker>(config, completion);
  }
  return std::make_unique<RuleBasedDecisionMaker>(config);
}

std::string JoinViolations(const std::vector<std::string>& violations) {
  std::string out;
  for (const auto& violation : violations) {
    if (!out.empty()) out += "; ";
    out += violation;
  }
  return out;
}

/// 周期在进入执行前结束：HOLD、权重保持不变。
void MarkHold(Decision* decision,
              ExecutionStatus status,
              const std::string& tag,
              const std::string& rationale) {
  decision->action = DecisionAction::kHold;
  decision->final_weights = decision->prior_weights;
  decision->status = status;
  decision->tags.push_back(tag);
  decision->rationale = rationale;
}

}  // namespace

Orchestrator::Orchestrator(const AppConfig& config, OrchestratorDeps deps)
    : config_(config),
      deps_(std::move(deps)),
      fanout_(deps_.completion, config.producers.timeout_ms),
      debate_(config.debate, deps_.completion),
      risk_gate_(config.risk, MakeSoftJudge(config.risk, deps_.completion)),
      decision_maker_(MakeDecisionMaker(config.decision, deps_.completion)) {}

void Orchestrator::Restore(const WalState& state) {
  std::lock_guard<std::mutex> lock(history_mutex_);
  history_ = state.decisions;
  seq_ = history_.size();
}

std::vector<Decision> Orchestrator::History() const {
  std::lock_guard<std::mutex> lock(history_mutex_);
  return history_;
}

std::vector<Decision> Orchestrator::RecentDecisions(std::size_t n) const {
  std::lock_guard<std::mutex> lock(history_mutex_);
  const std::size_t start = history_.size() > n ? history_.size() - n : 0;
  return std::vector<Decision>(history_.begin() + static_cast<std::ptrdiff_t>(start),
                               history_.end());
}

double Orchestrator::Turnover24h(const std::vector<Decision>& history, std::int64_t now_ms) {
  double total = 0.0;
  for (const auto& decision : history) {
    if (decision.action == DecisionAction::kRebalance &&
        decision.status == ExecutionStatus::kSubmitted &&
        now_ms - decision.created_at_ms < kDayMs) {
      total += Turnover(decision.prior_weights, decision.final_weights);
    }
  }
  return total;
}

int Orchestrator::Rebalances24h(const std::vector<Decision>& history, std::int64_t now_ms) {
  int count = 0;
  for (const auto& decision : history) {
    if (decision.action == DecisionAction::kRebalance &&
        decision.status == ExecutionStatus::kSubmitted &&
        now_ms - decision.created_at_ms < kDayMs) {
      ++count;
    }
  }
  return count;
}

std::string Orchestrator::MakeDecisionId(TriggerReason trigger, std::int64_t now_ms) {
  std::uint64_t seq = 0;
  {
    std::lock_guard<std::mutex> lock(history_mutex_);
    seq = ++seq_;
  }
  const std::string material =
      std::string(ToString(trigger)) + "|" + std::to_string(now_ms) + "|" + std::to_string(seq);
  std::string hex;
  std::string error;
  if (!Sha256Hex(material, &hex, &error)) {
    // 摘要失败时退化为可读 ID，仍保证唯一。
    LogWarn("DECISION_ID_HASH_FAILED: " + error);
    return "dec-" + std::to_string(now_ms) + "-" + std::to_string(seq);
  }
  return "dec-" + hex.substr(0, 16);
}

bool Orchestrator::AbortRequested(Decision* decision, const std::string& stage) const {
  if (!abort_requested_.load()) {
    return false;
  }
  MarkHold(decision, ExecutionStatus::kAborted, "aborted", "cycle aborted before " + stage);
  LogWarn("CYCLE_ABORTED: decision=" + decision->id + ", stage=" + stage);
  return true;
}

bool Orchestrator::Persist(const Decision& decision, std::string* out_error) {
  if (deps_.wal != nullptr && !deps_.wal->AppendDecision(decision, out_error)) {
    LogError("DECISION_PERSIST_FAILED: decision=" + decision.id);
    return false;
  }
  std::lock_guard<std::mutex> lock(history_mutex_);
  history_.push_back(decision);
  return true;
}

bool Orchestrator::RunCycle(TriggerReason trigger,
                            std::int64_t now_ms,
                            Decision* out_decision,
                            std::string* out_error) {
  if (deps_.market == nullptr || deps_.contract == nullptr || deps_.safety == nullptr ||
      deps_.completion == nullptr) {
    SetError(out_error, "orchestrator collaborators not configured");
    return false;
  }
  std::string reason;
  IdempotencyGuard::Lease lease = deps_.safety->idempotency().TryAcquire("cycle", now_ms, &reason);
  if (!lease.valid()) {
    LogWarn("CYCLE_REJECTED: " + reason);
    SetError(out_error, "cycle already running: " + reason);
    return false;
  }
  abort_requested_.store(false);

  Decision decision;
  decision.id = MakeDecisionId(trigger, now_ms);
  decision.created_at_ms = now_ms;
  decision.trigger = trigger;
  LogInfo(std::string("CYCLE_START: decision=") + decision.id + ", trigger=" + ToString(trigger));

  BasketSnapshot snapshot;
  std::string error;
  if (!deps_.market->ReadSnapshot(&snapshot, &error)) {
    // 读不到快照时沿用上一条已提交决策的权重；没有可沿用的权重就不落无权重的决策。
    std::optional<Decision> last;
    {
      std::lock_guard<std::mutex> history_lock(history_mutex_);
      if (!history_.empty()) {
        last = history_.back();
      }
    }
    if (!last.has_value() || last->final_weights.empty()) {
      LogError("SNAPSHOT_UNAVAILABLE: decision=" + decision.id + ", no prior weights, " + error);
      if (deps_.notifier != nullptr) {
        deps_.notifier->Notify(MakeAlert(AlertSeverity::kWarning, "snapshot_unavailable",
                                         "basket snapshot unavailable: " + error, now_ms));
      }
      SetError(out_error, "basket snapshot unavailable: " + error);
      return false;
    }
    decision.prior_weights = last->final_weights;
    decision.nav_usd = last->nav_usd;
    MarkHold(&decision, ExecutionStatus::kSkipped, "snapshot_unavailable",
             "basket snapshot unavailable: " + error);
    LogWarn("CYCLE_SKIPPED: decision=" + decision.id + ", " + decision.rationale);
  } else {
    decision.prior_weights = snapshot.weights();
    decision.final_weights = decision.prior_weights;
    decision.nav_usd = snapshot.nav_usd;
    deps_.safety->ObserveNav(now_ms, snapshot.nav_usd);

    std::string blocked_reason;
    if (deps_.safety->CycleBlocked(&blocked_reason)) {
      MarkHold(&decision, ExecutionStatus::kSkipped, "safety_blocked", blocked_reason);
      LogWarn("CYCLE_SKIPPED: decision=" + decision.id + ", " + blocked_reason);
    } else {
      RunPipeline(&decision, snapshot, now_ms);
    }
  }

  if (out_decision != nullptr) {
    *out_decision = decision;
  }
  if (!Persist(decision, out_error)) {
    return false;
  }
  LogInfo(std::string("CYCLE_DONE: decision=") + decision.id + ", action=" +
          ToString(decision.action) + ", status=" + ToString(decision.status) +
          ", confidence=" + std::to_string(decision.confidence));
  LogInfo("REFLECTION_SCHEDULED: decision=" + decision.id + ", due_at_ms=" +
          std::to_string(now_ms + static_cast<std::int64_t>(config_.reflection.delay_hours) *
                                      3600LL * 1000));
  return true;
}

void Orchestrator::RunPipeline(Decision* decision,
                               const BasketSnapshot& snapshot,
                               std::int64_t now_ms) {
  MarketContext market;
  std::string error;
  if (!deps_.market->ReadMarketContext(&market, &error)) {
    LogWarn("MARKET_CONTEXT_UNAVAILABLE: " + error);
    market = MarketContext{};
  }
  std::vector<CalibrationHint> hints;
  if (deps_.reflection != nullptr) {
    hints = deps_.reflection->RecentHints(
        static_cast<std::size_t>(std::max(0, config_.producers.calibration_hint_window)));
  }

  // 1) 分析师扇出。
  ProducerInput producer_input{snapshot, market, hints};
  decision->reports = fanout_.Run(producer_input);
  const int failures = ReportFanout::CountFailures(decision->reports);
  if (failures >= config_.producers.max_failures_before_degraded) {
    MarkHold(decision, ExecutionStatus::kNotExecuted, "degraded",
             "degraded mode: " + std::to_string(failures) + " agents failed");
    LogWarn("DEGRADED_HOLD: decision=" + decision->id + ", failures=" + std::to_string(failures));
    return;
  }
  if (AbortRequested(decision, "debate")) {
    return;
  }

  // 2) 对抗辩论。
  DebateInput debate_input{snapshot, decision->reports, hints, config_.risk};
  DebateOutcome debate = debate_.Run(debate_input, &abort_requested_);
  for (const auto& round : debate.rounds) {
    decision->debate.push_back(round);
  }
  if (AbortRequested(decision, "risk gate")) {
    return;
  }
  if (!debate.ok || debate.rounds.empty()) {
    MarkHold(decision, ExecutionStatus::kNotExecuted, "debate_failed",
             "debate failed: " + debate.error);
    LogWarn("DEBATE_FAILED_HOLD: decision=" + decision->id + ", " + debate.error);
    return;
  }
  const DebateRound& last = debate.rounds.back();

  // 3) 风控闸门：评估变更方最后一轮的提议。
  std::vector<Decision> history;
  {
    std::lock_guard<std::mutex> lock(history_mutex_);
    const std::size_t window =
        static_cast<std::size_t>(std::max(0, config_.system.decision_history_window));
    const std::size_t start = history_.size() > window ? history_.size() - window : 0;
    history.assign(history_.begin() + static_cast<std::ptrdiff_t>(start), history_.end());
  }
  const double turnover_24h = Turnover24h(history, now_ms);
  RiskRequest risk_request;
  risk_request.action = last.for_change.proposed_action;
  risk_request.proposed = last.for_change.target_weights;
  risk_request.snapshot = snapshot;
  risk_request.reports = decision->reports;
  risk_request.turnover_24h = turnover_24h;
  risk_request.rebalances_24h = Rebalances24h(history, now_ms);
  const RiskVerdict verdict = risk_gate_.Evaluate(risk_request);
  decision->verdict = verdict;
  if (!verdict.approved) {
    LogWarn("RISK_VETO: decision=" + decision->id + ", " + JoinViolations(verdict.violations));
  }

  // 4) 决策 + 契约校验。
  DecisionInput input;
  input.trigger = decision->trigger;
  input.for_change = last.for_change;
  input.for_hold = last.for_hold;
  input.verdict = verdict;
  input.reports = decision->reports;
  input.snapshot = snapshot;
  input.hints = hints;
  input.history = std::move(history);
  DecisionProposal proposal = decision_maker_->Decide(input);
  std::string violation;
  if (!EnforceDecisionContract(input, config_.risk, &proposal, &violation)) {
    LogError("DECISION_CONTRACT_VIOLATION: decision=" + decision->id + ", " + violation);
  }
  decision->action = proposal.action;
  decision->final_weights = proposal.weights;
  decision->confidence = proposal.confidence;
  decision->cost_estimate = proposal.cost_estimate;
  decision->rationale = proposal.rationale;
  for (const auto& tag : proposal.tags) {
    decision->tags.push_back(tag);
  }

  // 5) 执行。
  switch (decision->action) {
    case DecisionAction::kRebalance:
      Execute(decision, turnover_24h, now_ms);
      break;
    case DecisionAction::kEmergencyExit: {
      decision->final_weights = decision->prior_weights;
      decision->status = ExecutionStatus::kNotExecuted;
      std::string halt_error;
      if (!deps_.safety->EngageLossHalt("emergency exit: " + decision->rationale, now_ms,
                                        &halt_error)) {
        LogError("EMERGENCY_HALT_PERSIST_FAILED: " + halt_error);
      }
      decision->status_detail = "loss halt engaged, manual clear required";
      LogError("EMERGENCY_EXIT: decision=" + decision->id + ", " + decision->rationale);
      break;
    }
    case DecisionAction::kHold:
      decision->status = ExecutionStatus::kNotExecuted;
      break;
  }
}

void Orchestrator::Execute(Decision* decision, double turnover_24h, std::int64_t now_ms) {
  if (AbortRequested(decision, "submission")) {
    return;
  }
  // 组合守卫：决策到执行之间状态可能变化，用最新快照复检硬限制。
  BasketSnapshot fresh;
  std::string error;
  if (!deps_.market->ReadSnapshot(&fresh, &error)) {
    decision->status = ExecutionStatus::kBlockedBySafety;
    decision->status_detail = "fresh snapshot unavailable: " + error;
    LogWarn("PORTFOLIO_GUARD_BLOCKED: decision=" + decision->id + ", " + decision->status_detail);
    return;
  }
  const std::vector<std::string> violations =
      deps_.safety->CheckPortfolio(decision->final_weights, fresh, turnover_24h);
  std::string blocked_reason;
  if (!violations.empty() || deps_.safety->CycleBlocked(&blocked_reason)) {
    decision->status = ExecutionStatus::kBlockedBySafety;
    decision->status_detail = violations.empty() ? blocked_reason : JoinViolations(violations);
    LogWarn("PORTFOLIO_GUARD_BLOCKED: decision=" + decision->id + ", " + decision->status_detail);
    if (deps_.notifier != nullptr) {
      deps_.notifier->Notify(MakeAlert(AlertSeverity::kWarning, "portfolio_guard",
                                       decision->id + ": " + decision->status_detail, now_ms));
    }
    return;
  }

  std::string reason;
  IdempotencyGuard::Lease lease =
      deps_.safety->idempotency().TryAcquire("submit:" + decision->id, now_ms, &reason);
  if (!lease.valid()) {
    decision->status = ExecutionStatus::kSubmitFailed;
    decision->status_detail = "submission in progress: " + reason;
    return;
  }
  std::string tx_ref;
  if (deps_.contract->FindSubmission(decision->id, &tx_ref)) {
    LogWarn("SUBMISSION_FOUND: decision=" + decision->id + ", tx=" + tx_ref);
  } else if (!deps_.contract->SubmitRebalance(decision->id, decision->final_weights, &tx_ref,
                                              &error)) {
    decision->status = ExecutionStatus::kSubmitFailed;
    decision->status_detail = error;
    LogError("SUBMIT_FAILED: decision=" + decision->id + ", " + error);
    return;
  }
  decision->status = ExecutionStatus::kSubmitted;
  decision->tx_ref = tx_ref;
  LogInfo("REBALANCE_SUBMITTED: decision=" + decision->id + ", tx=" + tx_ref);
}

}  // namespace basket_engine
