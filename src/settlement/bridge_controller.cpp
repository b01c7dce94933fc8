#include "settlement/bridge_controller.h"

#include <algorithm>
#include <utility>

#include "core/hash_utils.h"
#include "core/log.h"

namespace basket_engine {

namespace {

constexpr std::int64_t kRetryBaseDelayMs = 5000;

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

std::string ArtifactFor(const BridgeJob& job) {
  switch (job.state) {
    case BridgeState::kSourceLocked:
      return job.source_tx_ref;
    case BridgeState::kSourceConfirmed:
      return job.message_hash;
    case BridgeState::kAttestationPending:
      return "requested_at=" + std::to_string(job.attestation_requested_ms);
    case BridgeState::kAttestationReceived:
      return job.attestation.substr(0, 24);
    case BridgeState::kDestMinted:
      return job.dest_tx_ref;
    case BridgeState::kDeposited:
      return job.deposit_tx_ref;
    case BridgeState::kFailed:
    case BridgeState::kCancelled:
      return job.error;
    case BridgeState::kReady:
      break;
  }
  return "";
}

}  // namespace

BridgeController::BridgeController(SettlementConfig config,
                                   BridgeCollaborators collaborators,
                                   const WalStore* wal,
                                   IdempotencyGuard* idempotency,
                                   std::shared_ptr<NotificationSink> notifier)
    : config_(std::move(config)),
      collaborators_(collaborators),
      wal_(wal),
      idempotency_(idempotency),
      notifier_(std::move(notifier)) {}

BridgeState BridgeController::ResumeStateFor(const BridgeJob& job) {
  if (!job.deposit_tx_ref.empty()) {
    return BridgeState::kDeposited;
  }
  if (!job.dest_tx_ref.empty()) {
    return BridgeState::kDestMinted;
  }
  if (!job.attestation.empty()) {
    return BridgeState::kAttestationReceived;
  }
  if (job.attestation_requested_ms > 0) {
    return BridgeState::kAttestationPending;
  }
  if (!job.message_hash.empty()) {
    return BridgeState::kSourceConfirmed;
  }
  if (!job.source_tx_ref.empty()) {
    return BridgeState::kSourceLocked;
  }
  return BridgeState::kReady;
}

void BridgeController::Restore(const WalState& state) {
  std::lock_guard<std::mutex> lock(jobs_mutex_);
  jobs_.clear();
  order_.clear();
  last_poll_ms_.clear();
  for (const auto& snapshot : state.job_history) {
    if (std::find(order_.begin(), order_.end(), snapshot.id) == order_.end()) {
      order_.push_back(snapshot.id);
    }
  }
  int pending = 0;
  for (const auto& [id, job] : state.latest_jobs) {
    jobs_[id] = job;
    if (!IsTerminal(job.state)) {
      ++pending;
    }
    if (std::find(order_.begin(), order_.end(), id) == order_.end()) {
      order_.push_back(id);
    }
  }
  next_seq_ = order_.size() + 1;
  LogInfo("BRIDGE_RESTORE: jobs=" + std::to_string(jobs_.size()) +
          ", pending=" + std::to_string(pending));
}

bool BridgeController::CreateJob(std::uint64_t amount_raw,
                                 std::int64_t now_ms,
                                 BridgeJob* out_job,
                                 std::string* out_error) {
  if (amount_raw == 0 || RawToUsd(amount_raw) < config_.min_job_usd) {
    SetError(out_error, "bridge amount " + std::to_string(RawToUsd(amount_raw)) +
                            " below minimum " + std::to_string(config_.min_job_usd));
    return false;
  }
  std::lock_guard<std::mutex> step_lock(step_mutex_);
  BridgeJob job;
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    job.id = "bridge-" + std::to_string(now_ms) + "-" + std::to_string(next_seq_);
  }
  job.amount_raw = amount_raw;
  job.state = BridgeState::kReady;
  job.created_at_ms = now_ms;
  job.updated_at_ms = now_ms;
  job.state_entered_ms = now_ms;

  if (wal_ != nullptr && !wal_->AppendJob(job, out_error)) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    jobs_[job.id] = job;
    order_.push_back(job.id);
    ++next_seq_;
  }
  LogInfo("BRIDGE_JOB_CREATED: id=" + job.id +
          ", amount_usd=" + std::to_string(RawToUsd(amount_raw)) +
          (config_.dry_run ? ", dry_run=true" : ""));
  if (out_job != nullptr) {
    *out_job = job;
  }
  return true;
}

std::int64_t BridgeController::BackoffMs(int retry_count) const {
  if (retry_count <= 0) {
    return 0;
  }
  return kRetryBaseDelayMs << std::min(retry_count - 1, 10);
}

BridgeController::StepOutcome BridgeController::RunStep(const BridgeJob& job,
                                                        BridgeState from,
                                                        std::int64_t now_ms,
                                                        BridgeJob* out_next,
                                                        std::string* out_error) {
  BridgeJob next = job;
  const bool dry_run = config_.dry_run;
  switch (from) {
    case BridgeState::kReady: {
      std::string lock_ref;
      if (dry_run) {
        lock_ref = "dry_run_lock_" + job.id;
      } else if (collaborators_.source->FindLock(job.id, &lock_ref)) {
        // 上次锁定已上链但未来得及落盘：直接采用，不重复锁定。
        LogWarn("BRIDGE_LOCK_FOUND: id=" + job.id + ", lock=" + lock_ref);
      } else if (!collaborators_.source->Lock(job.id, job.amount_raw, &lock_ref, out_error)) {
        return StepOutcome::kRetryableError;
      }
      next.source_tx_ref = lock_ref;
      next.state = BridgeState::kSourceLocked;
      break;
    }
    case BridgeState::kSourceLocked: {
      std::string message;
      if (dry_run) {
        message = "dry_run_message_" + job.id;
      } else {
        SourceConfirmation confirmation;
        if (!collaborators_.source->Confirm(job.source_tx_ref, &confirmation, out_error)) {
          return StepOutcome::kRetryableError;
        }
        if (!confirmation.confirmed) {
          if (now_ms - job.state_entered_ms > config_.confirm_timeout_ms) {
            SetError(out_error, "source confirmation timeout after " +
                                    std::to_string(config_.confirm_timeout_ms) + "ms");
            return StepOutcome::kFatalError;
          }
          return StepOutcome::kWaiting;
        }
        message = confirmation.message;
      }
      std::string hash;
      if (!Sha256Hex(message, &hash, out_error)) {
        return StepOutcome::kRetryableError;
      }
      next.message_hash = hash;
      next.state = BridgeState::kSourceConfirmed;
      break;
    }
    case BridgeState::kSourceConfirmed:
      next.attestation_requested_ms = now_ms;
      next.state = BridgeState::kAttestationPending;
      break;
    case BridgeState::kAttestationPending: {
      if (now_ms - job.attestation_requested_ms > config_.attestation_timeout_ms) {
        SetError(out_error, "attestation timeout after " +
                                std::to_string(config_.attestation_timeout_ms) + "ms");
        return StepOutcome::kFatalError;
      }
      std::string attestation;
      if (dry_run) {
        attestation = "dry_run_attestation_" + job.id;
      } else {
        {
          std::lock_guard<std::mutex> lock(jobs_mutex_);
          const auto it = last_poll_ms_.find(job.id);
          if (it != last_poll_ms_.end() &&
              now_ms - it->second < config_.attestation_poll_interval_ms) {
            return StepOutcome::kWaiting;
          }
          last_poll_ms_[job.id] = now_ms;
        }
        AttestationPoll poll;
        if (!collaborators_.attestation->Poll(job.message_hash, &poll, out_error)) {
          return StepOutcome::kRetryableError;
        }
        if (!poll.complete) {
          return StepOutcome::kWaiting;
        }
        attestation = poll.attestation;
      }
      next.attestation = attestation;
      next.state = BridgeState::kAttestationReceived;
      break;
    }
    case BridgeState::kAttestationReceived: {
      std::string mint_ref;
      if (dry_run) {
        mint_ref = "dry_run_mint_" + job.id;
      } else if (collaborators_.destination->FindMint(job.message_hash, &mint_ref)) {
        LogWarn("BRIDGE_MINT_FOUND: id=" + job.id + ", mint=" + mint_ref);
      } else if (!collaborators_.destination->Mint(job.message_hash, job.attestation, &mint_ref,
                                                   out_error)) {
        return StepOutcome::kRetryableError;
      }
      next.dest_tx_ref = mint_ref;
      next.state = BridgeState::kDestMinted;
      break;
    }
    case BridgeState::kDestMinted: {
      std::string deposit_ref;
      if (dry_run) {
        deposit_ref = "dry_run_deposit_" + job.id;
      } else if (collaborators_.vault->FindDeposit(job.id, &deposit_ref)) {
        LogWarn("BRIDGE_DEPOSIT_FOUND: id=" + job.id + ", deposit=" + deposit_ref);
      } else if (!collaborators_.vault->DepositReward(job.id, job.amount_raw, now_ms,
                                                      &deposit_ref, out_error)) {
        return StepOutcome::kRetryableError;
      }
      next.deposit_tx_ref = deposit_ref;
      next.state = BridgeState::kDeposited;
      break;
    }
    case BridgeState::kDeposited:
    case BridgeState::kFailed:
    case BridgeState::kCancelled:
      SetError(out_error, std::string("no step for terminal state ") + ToString(from));
      return StepOutcome::kFatalError;
  }
  *out_next = std::move(next);
  return StepOutcome::kTransition;
}

bool BridgeController::Commit(const BridgeJob& previous,
                              const BridgeJob& next,
                              std::string* out_error) {
  if (wal_ != nullptr && !wal_->AppendJob(next, out_error)) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    jobs_[next.id] = next;
    if (IsTerminal(next.state)) {
      last_poll_ms_.erase(next.id);
    }
  }
  if (previous.state != next.state && notifier_ != nullptr) {
    notifier_->Notify(MakeAlert(AlertSeverity::kInfo, "bridge_transition",
                                "job=" + next.id + " from=" + ToString(previous.state) +
                                    " to=" + ToString(next.state) +
                                    " artifact=" + ArtifactFor(next),
                                next.updated_at_ms));
  }
  return true;
}

BridgeStepResult BridgeController::FailJob(BridgeJob job,
                                           BridgeState from,
                                           const std::string& error,
                                           std::int64_t now_ms) {
  BridgeStepResult result;
  result.job_id = job.id;
  result.from = job.state;
  const BridgeJob previous = job;
  job.state = BridgeState::kFailed;
  job.failed_step = ToString(from);
  job.error = error;
  job.updated_at_ms = now_ms;
  job.state_entered_ms = now_ms;
  std::string persist_error;
  if (!Commit(previous, job, &persist_error)) {
    result.to = previous.state;
    result.error = "persist FAILED state: " + persist_error;
    LogError("BRIDGE_PERSIST_FAILED: id=" + job.id + ", " + persist_error);
    return result;
  }
  LogError("BRIDGE_JOB_FAILED: id=" + job.id + ", step=" + job.failed_step + ", " + error);
  if (notifier_ != nullptr) {
    notifier_->Notify(MakeAlert(AlertSeverity::kCritical, "bridge_manual_intervention",
                                "job " + job.id + " failed at " + job.failed_step + ": " + error,
                                now_ms));
  }
  result.to = BridgeState::kFailed;
  result.advanced = true;
  result.error = error;
  return result;
}

BridgeStepResult BridgeController::Advance(const std::string& job_id, std::int64_t now_ms) {
  std::lock_guard<std::mutex> step_lock(step_mutex_);
  BridgeStepResult result;
  result.job_id = job_id;

  IdempotencyGuard::Lease lease;
  if (idempotency_ != nullptr) {
    std::string reason;
    lease = idempotency_->TryAcquire("bridge_job:" + job_id, now_ms, &reason);
    if (!lease.valid()) {
      result.error = reason;
      return result;
    }
  }

  const std::optional<BridgeJob> current = GetJob(job_id);
  if (!current.has_value()) {
    result.error = "unknown bridge job " + job_id;
    return result;
  }
  const BridgeJob& job = *current;
  result.from = job.state;
  result.to = job.state;
  if (IsTerminal(job.state)) {
    return result;
  }
  if (!config_.dry_run &&
      (collaborators_.source == nullptr || collaborators_.attestation == nullptr ||
       collaborators_.destination == nullptr || collaborators_.vault == nullptr)) {
    result.error = "bridge collaborators not configured";
    return result;
  }

  const BridgeState effective = ResumeStateFor(job);
  if (effective != job.state) {
    LogWarn(std::string("BRIDGE_STATE_ARTIFACT_MISMATCH: id=") + job.id +
            ", state=" + ToString(job.state) + ", artifacts=" + ToString(effective));
  }
  if (job.retry_count > 0 && now_ms < job.updated_at_ms + BackoffMs(job.retry_count)) {
    result.waiting = true;
    return result;
  }

  BridgeJob next;
  std::string error;
  switch (RunStep(job, effective, now_ms, &next, &error)) {
    case StepOutcome::kWaiting:
      result.waiting = true;
      return result;
    case StepOutcome::kFatalError:
      return FailJob(job, effective, error, now_ms);
    case StepOutcome::kRetryableError: {
      BridgeJob retry = job;
      retry.retry_count = job.retry_count + 1;
      retry.error = std::string("state ") + ToString(effective) + " failed (attempt " +
                    std::to_string(retry.retry_count) + "/" +
                    std::to_string(config_.max_retries) + "): " + error;
      retry.updated_at_ms = now_ms;
      LogError("BRIDGE_STEP_FAILED: id=" + job.id + ", " + retry.error);
      if (retry.retry_count >= config_.max_retries) {
        return FailJob(retry, effective, retry.error, now_ms);
      }
      std::string persist_error;
      if (!Commit(job, retry, &persist_error)) {
        LogError("BRIDGE_PERSIST_FAILED: id=" + job.id + ", " + persist_error);
      }
      LogWarn("BRIDGE_RETRY_SCHEDULED: id=" + job.id +
              ", backoff_ms=" + std::to_string(BackoffMs(retry.retry_count)));
      result.error = retry.error;
      return result;
    }
    case StepOutcome::kTransition:
      break;
  }

  next.retry_count = 0;
  next.error.clear();
  next.updated_at_ms = now_ms;
  next.state_entered_ms = now_ms;
  if (!Commit(job, next, &error)) {
    // 未落盘则不算完成：内存保持原状态，下次推进时由先查后做识别已执行的副作用。
    LogError("BRIDGE_PERSIST_FAILED: id=" + job.id + ", " + error);
    result.error = "persist transition: " + error;
    return result;
  }
  LogInfo(std::string("BRIDGE_TRANSITION: id=") + job.id + ", " + ToString(job.state) +
          " -> " + ToString(next.state));
  result.to = next.state;
  result.advanced = true;
  return result;
}

std::vector<BridgeStepResult> BridgeController::AdvanceAllPending(std::int64_t now_ms) {
  std::vector<std::string> pending;
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    for (const auto& id : order_) {
      const auto it = jobs_.find(id);
      if (it != jobs_.end() && !IsTerminal(it->second.state)) {
        pending.push_back(id);
      }
    }
  }
  std::vector<BridgeStepResult> results;
  results.reserve(pending.size());
  for (const auto& id : pending) {
    results.push_back(Advance(id, now_ms));
  }
  return results;
}

bool BridgeController::RetryJob(const std::string& job_id,
                                std::int64_t now_ms,
                                std::string* out_error) {
  std::lock_guard<std::mutex> step_lock(step_mutex_);
  IdempotencyGuard::Lease lease;
  if (idempotency_ != nullptr) {
    lease = idempotency_->TryAcquire("bridge_job:" + job_id, now_ms, out_error);
    if (!lease.valid()) {
      return false;
    }
  }
  const std::optional<BridgeJob> current = GetJob(job_id);
  if (!current.has_value()) {
    SetError(out_error, "unknown bridge job " + job_id);
    return false;
  }
  if (current->state != BridgeState::kFailed) {
    SetError(out_error, std::string("only FAILED jobs can be retried, state=") +
                            ToString(current->state));
    return false;
  }
  BridgeJob next = *current;
  next.state = ResumeStateFor(next);
  if (next.state == BridgeState::kAttestationPending) {
    // 新的等待窗口。
    next.attestation_requested_ms = now_ms;
  }
  next.retry_count = 0;
  next.error.clear();
  next.failed_step.clear();
  next.updated_at_ms = now_ms;
  next.state_entered_ms = now_ms;
  if (!Commit(*current, next, out_error)) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    last_poll_ms_.erase(job_id);
  }
  LogWarn(std::string("BRIDGE_MANUAL_RETRY: id=") + job_id + ", resume_state=" +
          ToString(next.state));
  return true;
}

bool BridgeController::CancelJob(const std::string& job_id,
                                 const std::string& reason,
                                 std::int64_t now_ms,
                                 std::string* out_error) {
  std::lock_guard<std::mutex> step_lock(step_mutex_);
  IdempotencyGuard::Lease lease;
  if (idempotency_ != nullptr) {
    lease = idempotency_->TryAcquire("bridge_job:" + job_id, now_ms, out_error);
    if (!lease.valid()) {
      return false;
    }
  }
  const std::optional<BridgeJob> current = GetJob(job_id);
  if (!current.has_value()) {
    SetError(out_error, "unknown bridge job " + job_id);
    return false;
  }
  if (IsTerminal(current->state)) {
    SetError(out_error, std::string("job already terminal: ") + ToString(current->state));
    return false;
  }
  BridgeJob next = *current;
  next.state = BridgeState::kCancelled;
  next.error = "cancelled: " + reason;
  next.updated_at_ms = now_ms;
  next.state_entered_ms = now_ms;
  if (!Commit(*current, next, out_error)) {
    return false;
  }
  if (!current->source_tx_ref.empty()) {
    LogWarn("BRIDGE_CANCELLED_AFTER_LOCK: id=" + job_id + ", lock=" + current->source_tx_ref +
            "，源链资金需人工回收");
  } else {
    LogInfo("BRIDGE_CANCELLED: id=" + job_id + ", reason=" + reason);
  }
  return true;
}

std::optional<BridgeJob> BridgeController::GetJob(const std::string& job_id) const {
  std::lock_guard<std::mutex> lock(jobs_mutex_);
  const auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<BridgeJob> BridgeController::Jobs() const {
  std::lock_guard<std::mutex> lock(jobs_mutex_);
  std::vector<BridgeJob> out;
  out.reserve(order_.size());
  for (const auto& id : order_) {
    const auto it = jobs_.find(id);
    if (it != jobs_.end()) {
      out.push_back(it->second);
    }
  }
  return out;
}

std::uint64_t BridgeController::ReadyAmountRaw() const {
  std::lock_guard<std::mutex> lock(jobs_mutex_);
  std::uint64_t total = 0;
  for (const auto& [id, job] : jobs_) {
    if (job.state == BridgeState::kReady) {
      total += job.amount_raw;
    }
  }
  return total;
}

std::int64_t BridgeController::LastJobCreatedMs() const {
  std::lock_guard<std::mutex> lock(jobs_mutex_);
  std::int64_t last = 0;
  for (const auto& [id, job] : jobs_) {
    last = std::max(last, job.created_at_ms);
  }
  return last;
}

}  // namespace basket_engine
