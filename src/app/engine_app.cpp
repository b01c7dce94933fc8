#include "app/engine_app.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <thread>
#include <utility>
#include <vector>

#include "chain/http_attestation_service.h"
#include "core/log.h"

namespace basket_engine {

namespace {

// mock 模式的模拟网关参数。
constexpr double kSimulatedInitialNavUsd = 100000.0;
constexpr double kSimulatedFeeUsdPerHour = 12.5;
constexpr std::int64_t kSimulatedConfirmDelayMs = 30 * 1000;
constexpr std::int64_t kSimulatedAttestationDelayMs = 60 * 1000;

// 有界模式收尾时等待结算队列排空的上限。
constexpr int kDrainWaitLimitMs = 5000;

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

std::string FormatUsd(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return buffer;
}

std::string ReadEnv(const std::string& name) {
  if (name.empty()) {
    return {};
  }
  const char* value = std::getenv(name.c_str());
  return value == nullptr ? std::string() : std::string(value);
}

}  // namespace

EngineApp::EngineApp(AppConfig config, ClockFn clock, EngineGateways gateways)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      gateways_(std::move(gateways)),
      wal_(config_.data_path + "/wal.log"),
      trigger_policy_(config_.settlement) {
  if (!gateways_.transport) {
    gateways_.transport = std::make_shared<CurlHttpTransport>();
  }
}

EngineApp::~EngineApp() { Shutdown(); }

void EngineApp::BuildNotifier() {
  if (gateways_.notifier) {
    notifier_ = gateways_.notifier;
    return;
  }
  if (config_.notify.sink == "webhook") {
    auto webhook = std::make_shared<WebhookNotificationSink>(
        gateways_.transport,
        config_.notify.webhook_url,
        ReadEnv(config_.notify.webhook_secret_env));
    webhook_ = webhook.get();
    notifier_ = std::move(webhook);
    LogInfo("NOTIFY_SINK: webhook " + config_.notify.webhook_url);
    return;
  }
  notifier_ = std::make_shared<LogNotificationSink>();
}

bool EngineApp::BuildCompletionService(std::string* out_error) {
  if (gateways_.completion) {
    completion_ = gateways_.completion;
    return true;
  }
  if (config_.llm.provider == "http") {
    const std::string api_key = ReadEnv(config_.llm.api_key_env);
    if (api_key.empty()) {
      SetError(out_error, "llm.provider=http 但环境变量 " + config_.llm.api_key_env + " 为空");
      return false;
    }
    completion_ =
        std::make_shared<HttpCompletionService>(gateways_.transport, config_.llm, api_key);
    LogInfo("LLM_BACKEND: http model=" + config_.llm.model);
    return true;
  }
  completion_ = std::make_shared<RuleBasedCompletionService>();
  LogInfo("LLM_BACKEND: rule_based");
  return true;
}

bool EngineApp::BuildGateways(std::string* out_error) {
  const bool any_injected = gateways_.market != nullptr || gateways_.contract != nullptr ||
                            gateways_.source != nullptr || gateways_.destination != nullptr;
  if (!any_injected && config_.system.mode == "mock") {
    sim_market_ = std::make_unique<SimulatedMarket>(
        DefaultSimulatedTokens(config_.system.anchor_token),
        config_.system.anchor_token,
        kSimulatedInitialNavUsd,
        clock_);
    sim_contract_ = std::make_unique<SimulatedBasketContract>(
        sim_market_.get(), kSimulatedFeeUsdPerHour, clock_);
    sim_source_ = std::make_unique<SimulatedSourceChain>(
        sim_contract_.get(), kSimulatedConfirmDelayMs, clock_);
    sim_destination_ = std::make_unique<SimulatedDestinationChain>();
    gateways_.market = sim_market_.get();
    gateways_.contract = sim_contract_.get();
    gateways_.source = sim_source_.get();
    gateways_.destination = sim_destination_.get();
    if (gateways_.attestation == nullptr) {
      owned_attestation_ =
          std::make_unique<SimulatedAttestationService>(kSimulatedAttestationDelayMs, clock_);
    }
    LogInfo("GATEWAYS: mock 模拟链已构建");
  }

  if (gateways_.market == nullptr || gateways_.contract == nullptr ||
      gateways_.source == nullptr || gateways_.destination == nullptr) {
    SetError(out_error,
             config_.system.mode + " 模式缺少链上网关（market/contract/source/destination 需注入）");
    return false;
  }
  if (gateways_.attestation == nullptr && !owned_attestation_) {
    owned_attestation_ = std::make_unique<HttpAttestationService>(
        gateways_.transport, config_.settlement.attestation_base_url);
    LogInfo("GATEWAYS: attestation " + config_.settlement.attestation_base_url);
  }
  if (gateways_.attestation == nullptr) {
    gateways_.attestation = owned_attestation_.get();
  }
  return true;
}

bool EngineApp::BuildRewards(const WalState& state, std::string* out_error) {
  if (gateways_.vault != nullptr) {
    LogInfo("REWARDS: 使用注入的质押程序");
    return true;
  }
  if (config_.system.mode != "mock") {
    SetError(out_error, config_.system.mode + " 模式缺少质押程序网关（vault 需注入）");
    return false;
  }
  rewards_ = std::make_unique<RewardDistributor>(config_.rewards, notifier_, &wal_);
  std::string error;
  if (!rewards_->Restore(state.reward_ops, &error)) {
    SetError(out_error, "奖励池恢复失败: " + error);
    return false;
  }
  vault_ = std::make_unique<DistributorRewardVault>(rewards_.get());
  gateways_.vault = vault_.get();
  return true;
}

bool EngineApp::Initialize(std::string* out_error) {
  if (initialized_) {
    return true;
  }
  std::string error;
  if (!wal_.Initialize(&error)) {
    SetError(out_error, "WAL 初始化失败: " + error);
    return false;
  }
  WalState state;
  if (!wal_.LoadState(&state, &error)) {
    SetError(out_error, "WAL 加载失败: " + error);
    return false;
  }

  BuildNotifier();
  if (!BuildCompletionService(out_error) || !BuildGateways(out_error)) {
    return false;
  }
  started_ms_ = clock_();

  safety_ = std::make_unique<SafetySystem>(config_, &wal_, notifier_);
  if (!BuildRewards(state, out_error)) {
    return false;
  }
  reflection_ =
      std::make_unique<ReflectionEngine>(config_.reflection, gateways_.market, &wal_);
  orchestrator_ = std::make_unique<Orchestrator>(
      config_,
      OrchestratorDeps{
          .completion = completion_,
          .market = gateways_.market,
          .contract = gateways_.contract,
          .safety = safety_.get(),
          .reflection = reflection_.get(),
          .wal = &wal_,
          .notifier = notifier_,
      });
  bridge_ = std::make_unique<BridgeController>(
      config_.settlement,
      BridgeCollaborators{
          .source = gateways_.source,
          .attestation = gateways_.attestation,
          .destination = gateways_.destination,
          .vault = gateways_.vault,
      },
      &wal_,
      &safety_->idempotency(),
      notifier_);
  query_ = std::make_unique<QueryService>(
      orchestrator_.get(), bridge_.get(), rewards_.get(), &wal_);

  safety_->Restore(state);
  orchestrator_->Restore(state);
  bridge_->Restore(state);
  reflection_->Restore(state);
  LogInfo("WAL 恢复完成: decisions=" + std::to_string(state.decisions.size()) +
          ", jobs=" + std::to_string(state.latest_jobs.size()) +
          ", hints=" + std::to_string(state.hints.size()) +
          ", loss_halted=" + (state.loss_halted ? std::string("true") : std::string("false")));

  // 单工作线程推进结算，启动后立即续跑所有未完成任务。
  worker_ = std::make_unique<BridgeWorker>(bridge_.get(), clock_);
  worker_->Start();
  worker_->SubmitAdvanceAll();

  initialized_ = true;
  LogInfo("ENGINE_READY: mode=" + config_.system.mode +
          ", dry_run=" + (config_.settlement.dry_run ? std::string("true") : std::string("false")));
  return true;
}

bool EngineApp::RunCycle(TriggerReason trigger, Decision* out_decision, std::string* out_error) {
  if (!initialized_) {
    SetError(out_error, "engine not initialized");
    return false;
  }
  Decision decision;
  if (!orchestrator_->RunCycle(trigger, clock_(), &decision, out_error)) {
    return false;
  }
  if (out_decision != nullptr) {
    *out_decision = std::move(decision);
  }
  return true;
}

void EngineApp::DrainBridgeResults() {
  std::vector<BridgeStepResult> results;
  worker_->PollResults(&results);
  for (const auto& result : results) {
    if (!result.error.empty()) {
      LogWarn("BRIDGE_STEP_ERROR: job=" + result.job_id + ", state=" + ToString(result.from) +
              ", " + result.error);
    }
  }
}

bool EngineApp::MaybeCreateBridgeJob(std::int64_t now_ms) {
  double accrued = 0.0;
  std::string error;
  if (!gateways_.contract->ReadAccruedFeesUsd(&accrued, &error)) {
    LogWarn("BRIDGE_TRIGGER_READ_FAILED: " + error);
    return false;
  }

  // dry-run 不会真正转出手续费，已建任务的金额全部视为预留。
  std::uint64_t reserved_raw = bridge_->ReadyAmountRaw();
  if (config_.settlement.dry_run) {
    reserved_raw = 0;
    for (const auto& job : bridge_->Jobs()) {
      if (job.state != BridgeState::kFailed && job.state != BridgeState::kCancelled) {
        reserved_raw += job.amount_raw;
      }
    }
  }

  const BridgeTriggerInput input{
      .accrued_fees_usd = accrued,
      .reserved_usd = RawToUsd(reserved_raw),
      .source_congestion = gateways_.source->CongestionLevel(),
      .window_remaining_usd = safety_->BridgeWindowRemaining(now_ms),
      .now_ms = now_ms,
      .last_job_ms = std::max(bridge_->LastJobCreatedMs(), started_ms_),
  };
  const BridgeTriggerDecision trigger = trigger_policy_.Evaluate(input);
  if (!trigger.create) {
    return false;
  }

  std::string reason;
  if (!safety_->AllowBridge(trigger.amount_usd, now_ms, &reason)) {
    LogWarn("BRIDGE_TRIGGER_BLOCKED: amount_usd=" + FormatUsd(trigger.amount_usd) + ", " +
            reason);
    return false;
  }
  BridgeJob job;
  if (!bridge_->CreateJob(UsdToRaw(trigger.amount_usd), now_ms, &job, &error)) {
    LogError("BRIDGE_CREATE_FAILED: " + error);
    return false;
  }
  safety_->OnBridgeAccepted(trigger.amount_usd, now_ms);
  LogInfo("BRIDGE_TRIGGERED: job=" + job.id + ", amount_usd=" + FormatUsd(trigger.amount_usd) +
          ", reason=" + trigger.reason);
  return true;
}

void EngineApp::Tick() {
  if (!initialized_ || shut_down_) {
    return;
  }
  const std::int64_t now = clock_();
  DrainBridgeResults();
  MaybeCreateBridgeJob(now);
  worker_->SubmitAdvanceAll();
  const int hints = reflection_->RunDue(orchestrator_->History(), now);
  if (hints > 0) {
    LogInfo("REFLECTION_TICK: hints=" + std::to_string(hints));
  }
}

void EngineApp::AdvanceBridgeNow() {
  if (!initialized_) {
    return;
  }
  for (const auto& result : bridge_->AdvanceAllPending(clock_())) {
    if (!result.error.empty()) {
      LogWarn("BRIDGE_STEP_ERROR: job=" + result.job_id + ", state=" + ToString(result.from) +
              ", " + result.error);
    }
  }
}

void EngineApp::RunLoop(const LoopOptions& options) {
  if (!initialized_) {
    LogError("RunLoop 调用前未初始化");
    return;
  }
  const std::int64_t cycle_interval_ms =
      static_cast<std::int64_t>(config_.system.cycle_interval_sec) * 1000;
  const auto tick_sleep = std::chrono::milliseconds(config_.system.tick_interval_ms);

  auto run_one = [this](TriggerReason trigger) {
    Decision decision;
    std::string error;
    if (!RunCycle(trigger, &decision, &error)) {
      LogError("CYCLE_FAILED: trigger=" + std::string(ToString(trigger)) + ", " + error);
      return;
    }
    LogInfo("CYCLE_DONE: id=" + decision.id + ", action=" + ToString(decision.action) +
            ", status=" + ToString(decision.status));
  };

  if (!options.run_forever) {
    for (int i = 0; i < options.max_cycles; ++i) {
      run_one(i == 0 ? options.first_trigger : TriggerReason::kScheduled);
      Tick();
    }
    // 收尾：等待后台结算队列排空，再消费一次结果。
    int waited_ms = 0;
    while (worker_->pending_tasks() > 0 && waited_ms < kDrainWaitLimitMs) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      waited_ms += 10;
    }
    DrainBridgeResults();
    return;
  }

  run_one(options.first_trigger);
  std::int64_t last_cycle_ms = clock_();
  while (!shut_down_) {
    const std::int64_t now = clock_();
    if (now - last_cycle_ms >= cycle_interval_ms) {
      run_one(TriggerReason::kScheduled);
      last_cycle_ms = now;
    }
    Tick();
    std::this_thread::sleep_for(tick_sleep);
  }
}

bool EngineApp::RetryJob(const std::string& job_id, std::string* out_error) {
  if (!initialized_) {
    SetError(out_error, "engine not initialized");
    return false;
  }
  const std::int64_t now = clock_();
  if (!bridge_->RetryJob(job_id, now, out_error)) {
    return false;
  }
  worker_->SubmitAdvance(job_id);
  return true;
}

bool EngineApp::CancelJob(const std::string& job_id, std::string* out_error) {
  if (!initialized_) {
    SetError(out_error, "engine not initialized");
    return false;
  }
  return bridge_->CancelJob(job_id, "operator cancel", clock_(), out_error);
}

bool EngineApp::ClearHalt(std::string* out_error) {
  if (!initialized_) {
    SetError(out_error, "engine not initialized");
    return false;
  }
  return safety_->ClearLossHalt(clock_(), out_error);
}

void EngineApp::Shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  if (worker_) {
    worker_->Stop();
    DrainBridgeResults();
  }
  if (webhook_ != nullptr) {
    webhook_->Stop();
  }
  if (initialized_) {
    LogInfo("ENGINE_STOPPED");
  }
}

}  // namespace basket_engine
