#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "agents/completion_service.h"
#include "agents/report_producer.h"
#include "app/engine_app.h"
#include "chain/chain_gateways.h"
#include "chain/http_attestation_service.h"
#include "core/config.h"
#include "core/hash_utils.h"
#include "core/http_transport.h"
#include "core/json_utils.h"
#include "debate/debate_engine.h"
#include "decision/decision_maker.h"
#include "notify/notification_sink.h"
#include "reflection/reflection_engine.h"
#include "rewards/reward_distributor.h"
#include "rewards/reward_vault.h"
#include "risk/risk_gate.h"
#include "safety/idempotency_guard.h"
#include "safety/safety_system.h"
#include "settlement/bridge_controller.h"
#include "settlement/bridge_worker.h"
#include "settlement/trigger_policy.h"
#include "storage/wal_store.h"
#include "system/orchestrator.h"

namespace {

// 该测试文件覆盖决策与结算闭环的关键链路：
// - 分析师扇出、对抗辩论、风控闸门、决策与执行；
// - 安全系统（熔断、急停、幂等、组合守卫、转账限额）；
// - 跨链结算状态机的崩溃恢复与重试；
// - 质押奖励累加器、反思引擎、配置与应用层装配。
constexpr std::int64_t kT0 = 1'700'000'000'000LL;
constexpr std::int64_t kHourMs = 3600LL * 1000;
constexpr std::int64_t kDayMs = 24 * kHourMs;

bool NearlyEqual(double lhs, double rhs, double eps = 1e-6) {
  return std::fabs(lhs - rhs) < eps;
}

bool Contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

bool HasEntry(const std::vector<std::string>& items, const std::string& item) {
  for (const auto& candidate : items) {
    if (candidate == item) {
      return true;
    }
  }
  return false;
}

bool HasEntryContaining(const std::vector<std::string>& items, const std::string& needle) {
  for (const auto& candidate : items) {
    if (Contains(candidate, needle)) {
      return true;
    }
  }
  return false;
}

bool SameWeights(const basket_engine::Weights& lhs, const basket_engine::Weights& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (const auto& [token, weight] : lhs) {
    const auto it = rhs.find(token);
    if (it == rhs.end() || !NearlyEqual(weight, it->second)) {
      return false;
    }
  }
  return true;
}

class ScopedEnvVar {
 public:
  ScopedEnvVar(std::string key, std::string value) : key_(std::move(key)) {
    const char* existing = std::getenv(key_.c_str());
    if (existing != nullptr) {
      had_old_value_ = true;
      old_value_ = existing;
    }
    setenv(key_.c_str(), value.c_str(), 1);
  }

  ~ScopedEnvVar() {
    if (had_old_value_) {
      setenv(key_.c_str(), old_value_.c_str(), 1);
      return;
    }
    unsetenv(key_.c_str());
  }

 private:
  std::string key_;
  bool had_old_value_{false};
  std::string old_value_;
};

std::filesystem::path FreshTempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / ("basket_engine_test_" + name);
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

basket_engine::AppConfig MakeTestConfig(const std::filesystem::path& dir) {
  basket_engine::AppConfig config;
  config.data_path = dir.string();
  config.safety.kill_switch_file = (dir / "KILL_SWITCH").string();
  config.producers.timeout_ms = 2000;
  config.debate.round_timeout_ms = 2000;
  config.settlement.attestation_poll_interval_ms = 1000;
  return config;
}

// 5 个 token 的篮子：USDC 为锚定 token。
basket_engine::BasketSnapshot MakeSnapshot(double nav_usd = 1'000'000.0) {
  basket_engine::BasketSnapshot snapshot;
  snapshot.ts_ms = kT0;
  snapshot.nav_usd = nav_usd;
  snapshot.anchor_token = "USDC";
  auto add = [&snapshot](const std::string& token, double weight, double price) {
    basket_engine::TokenState state;
    state.weight = weight;
    state.price_usd = price;
    state.liquidity_usd = 5'000'000.0;
    snapshot.tokens[token] = state;
  };
  add("USDC", 0.10, 1.0);
  add("WETH", 0.25, 3000.0);
  add("WBTC", 0.25, 60000.0);
  add("SOL", 0.20, 150.0);
  add("AERO", 0.20, 1.2);
  return snapshot;
}

// 换手 0.10，满足全部硬限制。
const basket_engine::Weights kModestRebalance{
    {"USDC", 0.10}, {"WETH", 0.30}, {"WBTC", 0.30}, {"SOL", 0.15}, {"AERO", 0.15}};

// WETH 0.35 超过单 token 上限。
const basket_engine::Weights kOverweightRebalance{
    {"USDC", 0.10}, {"WETH", 0.35}, {"WBTC", 0.25}, {"SOL", 0.15}, {"AERO", 0.15}};

std::string ProducerJson(double confidence,
                         const std::string& direction,
                         bool high_volatility = false) {
  basket_engine::JsonWriter writer;
  writer.BeginObject()
      .Key("confidence").Number(confidence)
      .Key("direction").String(direction)
      .Key("evidence").BeginArray().String(direction + " signal").EndArray()
      .Key("high_volatility").Bool(high_volatility)
      .EndObject();
  return writer.str();
}

std::string AdvocateJson(const std::string& action,
                         const basket_engine::Weights& weights,
                         double confidence,
                         const std::vector<std::string>& evidence) {
  basket_engine::JsonWriter writer;
  writer.BeginObject().Key("proposed_action").String(action);
  writer.Key("target_weights").BeginObject();
  for (const auto& [token, weight] : weights) {
    writer.Key(token).Number(weight);
  }
  writer.EndObject();
  writer.Key("confidence").Number(confidence);
  writer.Key("evidence").BeginArray();
  for (const auto& item : evidence) {
    writer.String(item);
  }
  writer.EndArray().EndObject();
  return writer.str();
}

/// 按角色脚本化的补全服务；未脚本化的角色交给规则后端。
class ScriptedCompletion final : public basket_engine::CompletionService {
 public:
  using Handler = std::function<bool(const basket_engine::AgentRequest&,
                                     const basket_engine::CancelToken&,
                                     std::string*,
                                     std::string*)>;

  void Set(basket_engine::AgentRole role, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[role] = std::move(handler);
  }

  void Reply(basket_engine::AgentRole role, std::string text) {
    Set(role, [text](const basket_engine::AgentRequest&, const basket_engine::CancelToken&,
                     std::string* out_text, std::string*) {
      *out_text = text;
      return true;
    });
  }

  // 一直阻塞到被取消（模拟超时的分析师）。
  void Stall(basket_engine::AgentRole role) {
    Set(role, [](const basket_engine::AgentRequest&, const basket_engine::CancelToken& cancel,
                 std::string*, std::string* out_error) {
      const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
      while (!cancel.cancelled() && std::chrono::steady_clock::now() < give_up) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
      *out_error = "cancelled";
      return false;
    });
  }

  int calls(basket_engine::AgentRole role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = calls_.find(role);
    return it == calls_.end() ? 0 : it->second;
  }

  bool Complete(const basket_engine::AgentRequest& request,
                const basket_engine::CancelToken& cancel,
                std::string* out_text,
                std::string* out_error) const override {
    Handler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++calls_[request.role];
      const auto it = handlers_.find(request.role);
      if (it != handlers_.end()) {
        handler = it->second;
      }
    }
    if (handler) {
      return handler(request, cancel, out_text, out_error);
    }
    return fallback_.Complete(request, cancel, out_text, out_error);
  }

 private:
  basket_engine::RuleBasedCompletionService fallback_;
  mutable std::mutex mutex_;
  std::map<basket_engine::AgentRole, Handler> handlers_;
  mutable std::map<basket_engine::AgentRole, int> calls_;
};

void ScriptProducers(ScriptedCompletion* completion,
                     const std::vector<double>& confidences,
                     const std::string& direction) {
  const basket_engine::AgentRole roles[] = {
      basket_engine::AgentRole::kTechnicalAnalyst,
      basket_engine::AgentRole::kSentimentAnalyst,
      basket_engine::AgentRole::kLiquidityAnalyst,
      basket_engine::AgentRole::kMacroAnalyst,
  };
  for (std::size_t i = 0; i < 4 && i < confidences.size(); ++i) {
    completion->Reply(roles[i], ProducerJson(confidences[i], direction));
  }
}

class FixedMarket final : public basket_engine::MarketStateReader {
 public:
  explicit FixedMarket(basket_engine::BasketSnapshot snapshot)
      : snapshot_(std::move(snapshot)) {}

  bool ReadSnapshot(basket_engine::BasketSnapshot* out_snapshot,
                    std::string* out_error) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_reads_) {
      *out_error = "rpc unavailable";
      return false;
    }
    *out_snapshot = snapshot_;
    if (next_snapshot_.has_value()) {
      snapshot_ = *next_snapshot_;
      next_snapshot_.reset();
    }
    return true;
  }

  bool ReadMarketContext(basket_engine::MarketContext* out_context,
                         std::string*) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    out_context->recent_nav = {snapshot_.nav_usd, snapshot_.nav_usd};
    out_context->sentiment_index = 0.0;
    out_context->realized_volatility = 0.01;
    return true;
  }

  bool NavAt(std::int64_t ts_ms, double* out_nav, std::string*) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    *out_nav = nav_fn_ ? nav_fn_(ts_ms) : snapshot_.nav_usd;
    return true;
  }

  bool PriceAt(const std::string& token,
               std::int64_t ts_ms,
               double* out_price,
               std::string* out_error) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (price_fn_) {
      *out_price = price_fn_(token, ts_ms);
      return true;
    }
    const auto it = snapshot_.tokens.find(token);
    if (it == snapshot_.tokens.end()) {
      *out_error = "unknown token " + token;
      return false;
    }
    *out_price = it->second.price_usd;
    return true;
  }

  void SetNav(double nav_usd) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_.nav_usd = nav_usd;
  }

  // 下一次读取仍返回当前快照，之后的读取返回 next。
  void QueueNextSnapshot(basket_engine::BasketSnapshot next) {
    std::lock_guard<std::mutex> lock(mutex_);
    next_snapshot_ = std::move(next);
  }

  void SetHistory(std::function<double(std::int64_t)> nav_fn,
                  std::function<double(const std::string&, std::int64_t)> price_fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    nav_fn_ = std::move(nav_fn);
    price_fn_ = std::move(price_fn);
  }

  void FailReads(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_reads_ = fail;
  }

 private:
  mutable std::mutex mutex_;
  mutable basket_engine::BasketSnapshot snapshot_;
  mutable std::optional<basket_engine::BasketSnapshot> next_snapshot_;
  std::function<double(std::int64_t)> nav_fn_;
  std::function<double(const std::string&, std::int64_t)> price_fn_;
  bool fail_reads_{false};
};

class RecordingContract final : public basket_engine::BasketContract {
 public:
  bool SubmitRebalance(const std::string& decision_id,
                       const basket_engine::Weights& weights,
                       std::string* out_tx_ref,
                       std::string* out_error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_submit_) {
      *out_error = "rpc rejected transaction";
      return false;
    }
    const std::string ref = "tx_" + std::to_string(submissions_.size() + 1);
    submissions_[decision_id] = ref;
    last_weights_ = weights;
    *out_tx_ref = ref;
    return true;
  }

  bool FindSubmission(const std::string& decision_id, std::string* out_tx_ref) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = submissions_.find(decision_id);
    if (it == submissions_.end()) {
      return false;
    }
    *out_tx_ref = it->second;
    return true;
  }

  bool ReadAccruedFeesUsd(double* out_usd, std::string*) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    *out_usd = accrued_fees_usd_;
    return true;
  }

  void FailSubmissions(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_submit_ = fail;
  }

  std::size_t submission_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submissions_.size();
  }

 private:
  mutable std::mutex mutex_;
  bool fail_submit_{false};
  double accrued_fees_usd_{0.0};
  std::map<std::string, std::string> submissions_;
  basket_engine::Weights last_weights_;
};

class RecordingNotifier final : public basket_engine::NotificationSink {
 public:
  void Notify(const basket_engine::Alert& alert) override {
    std::lock_guard<std::mutex> lock(mutex_);
    alerts_.push_back(alert);
  }

  int Count(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int count = 0;
    for (const auto& alert : alerts_) {
      if (alert.code == code) {
        ++count;
      }
    }
    return count;
  }

  std::optional<basket_engine::Alert> Last(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = alerts_.rbegin(); it != alerts_.rend(); ++it) {
      if (it->code == code) {
        return *it;
      }
    }
    return std::nullopt;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<basket_engine::Alert> alerts_;
};

/// 告警回调中回读奖励池，用于验证告警发送时已释放池锁。
class PoolReadingNotifier final : public basket_engine::NotificationSink {
 public:
  void Notify(const basket_engine::Alert& alert) override {
    if (rewards != nullptr) {
      observed_principal = rewards->PoolView().pool.total_principal;
    }
    codes.push_back(alert.code);
  }

  const basket_engine::RewardDistributor* rewards{nullptr};
  std::uint64_t observed_principal{0};
  std::vector<std::string> codes;
};

class FakeSourceChain final : public basket_engine::SourceChain {
 public:
  bool FindLock(const std::string& job_id, std::string* out_lock_ref) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = lock_by_job_.find(job_id);
    if (it == lock_by_job_.end()) {
      return false;
    }
    *out_lock_ref = it->second;
    return true;
  }

  bool Lock(const std::string& job_id,
            std::uint64_t,
            std::string* out_lock_ref,
            std::string* out_error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++lock_calls_;
    if (fail_lock_) {
      *out_error = "source rpc timeout";
      return false;
    }
    const std::string ref = "lock_" + std::to_string(lock_calls_);
    lock_by_job_[job_id] = ref;
    *out_lock_ref = ref;
    return true;
  }

  bool Confirm(const std::string& lock_ref,
               basket_engine::SourceConfirmation* out_confirmation,
               std::string*) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    *out_confirmation = basket_engine::SourceConfirmation{};
    if (!confirmed_) {
      return true;
    }
    out_confirmation->confirmed = true;
    out_confirmation->message = "burn|" + lock_ref;
    return true;
  }

  double CongestionLevel() const override { return 5.0; }

  // 模拟“锁定已上链但未落盘”。
  void PreseedLock(const std::string& job_id, const std::string& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    lock_by_job_[job_id] = ref;
  }

  void FailLocks(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_lock_ = fail;
  }

  void SetConfirmed(bool confirmed) {
    std::lock_guard<std::mutex> lock(mutex_);
    confirmed_ = confirmed;
  }

  int lock_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lock_calls_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> lock_by_job_;
  int lock_calls_{0};
  bool fail_lock_{false};
  bool confirmed_{true};
};

class FakeAttestation final : public basket_engine::AttestationService {
 public:
  bool Poll(const std::string&,
            basket_engine::AttestationPoll* out_poll,
            std::string*) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++polls_;
    *out_poll = basket_engine::AttestationPoll{};
    if (complete_) {
      out_poll->complete = true;
      out_poll->attestation = "0xattestation";
    }
    return true;
  }

  void SetComplete(bool complete) {
    std::lock_guard<std::mutex> lock(mutex_);
    complete_ = complete;
  }

  int polls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return polls_;
  }

 private:
  mutable std::mutex mutex_;
  mutable int polls_{0};
  bool complete_{true};
};

class FakeDestination final : public basket_engine::DestinationChain {
 public:
  bool FindMint(const std::string& message_hash, std::string* out_mint_ref) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = mints_.find(message_hash);
    if (it == mints_.end()) {
      return false;
    }
    *out_mint_ref = it->second;
    return true;
  }

  bool Mint(const std::string& message_hash,
            const std::string&,
            std::string* out_mint_ref,
            std::string*) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++mint_calls_;
    const std::string ref = "mint_" + std::to_string(mint_calls_);
    mints_[message_hash] = ref;
    *out_mint_ref = ref;
    return true;
  }

  void PreseedMint(const std::string& message_hash, const std::string& ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    mints_[message_hash] = ref;
  }

  int mint_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mint_calls_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> mints_;
  int mint_calls_{0};
};

class ScriptedTransport final : public basket_engine::HttpTransport {
 public:
  void Push(basket_engine::HttpResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push_back(std::move(response));
  }

  basket_engine::HttpResponse Send(const basket_engine::HttpRequest& request) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (responses_.empty()) {
      basket_engine::HttpResponse ok;
      ok.status_code = 200;
      return ok;
    }
    basket_engine::HttpResponse response = responses_.front();
    responses_.pop_front();
    return response;
  }

  std::vector<basket_engine::HttpRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  mutable std::mutex mutex_;
  mutable std::deque<basket_engine::HttpResponse> responses_;
  mutable std::vector<basket_engine::HttpRequest> requests_;
};

basket_engine::HttpResponse Response(int status_code, std::string body) {
  basket_engine::HttpResponse response;
  response.status_code = status_code;
  response.body = std::move(body);
  return response;
}

/// 决策周期测试夹具：每个场景独立目录与 WAL。
struct CycleRig {
  explicit CycleRig(const std::string& name,
                    basket_engine::BasketSnapshot snapshot = MakeSnapshot())
      : dir(FreshTempDir(name)),
        config(MakeTestConfig(dir)),
        wal((dir / "wal.log").string()),
        market(std::move(snapshot)) {
    std::string error;
    if (!wal.Initialize(&error)) {
      std::cerr << "WAL 初始化失败: " << error << "\n";
    }
  }

  std::unique_ptr<basket_engine::Orchestrator> Build() {
    safety = std::make_unique<basket_engine::SafetySystem>(config, &wal, notifier);
    reflection =
        std::make_unique<basket_engine::ReflectionEngine>(config.reflection, &market, &wal);
    return std::make_unique<basket_engine::Orchestrator>(
        config,
        basket_engine::OrchestratorDeps{
            .completion = completion,
            .market = &market,
            .contract = &contract,
            .safety = safety.get(),
            .reflection = reflection.get(),
            .wal = &wal,
            .notifier = notifier,
        });
  }

  basket_engine::WalState Load() const {
    basket_engine::WalState state;
    std::string error;
    if (!wal.LoadState(&state, &error)) {
      std::cerr << "WAL 回放失败: " << error << "\n";
    }
    return state;
  }

  std::filesystem::path dir;
  basket_engine::AppConfig config;
  basket_engine::WalStore wal;
  FixedMarket market;
  RecordingContract contract;
  std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
  std::shared_ptr<ScriptedCompletion> completion = std::make_shared<ScriptedCompletion>();
  std::unique_ptr<basket_engine::SafetySystem> safety;
  std::unique_ptr<basket_engine::ReflectionEngine> reflection;
};

/// 结算测试夹具：链上网关与奖励池跨控制器实例共享（模拟真实链状态）。
struct BridgeRig {
  BridgeRig() {
    std::string error;
    if (!rewards.Stake("alice", 1000 * basket_engine::kAmountScale, kT0, &error)) {
      std::cerr << "质押失败: " << error << "\n";
    }
  }

  basket_engine::BridgeCollaborators collaborators() {
    return basket_engine::BridgeCollaborators{
        .source = &source,
        .attestation = &attestation,
        .destination = &destination,
        .vault = &vault,
    };
  }

  FakeSourceChain source;
  FakeAttestation attestation;
  FakeDestination destination;
  std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
  basket_engine::RewardDistributor rewards{basket_engine::RewardsConfig{}, notifier};
  basket_engine::DistributorRewardVault vault{&rewards};
};

basket_engine::SettlementConfig MakeSettlementConfig() {
  basket_engine::SettlementConfig config;
  config.attestation_poll_interval_ms = 1000;
  config.max_retries = 3;
  return config;
}

basket_engine::BridgeState StateOf(const basket_engine::BridgeController& controller,
                                   const std::string& job_id) {
  const auto job = controller.GetJob(job_id);
  return job.has_value() ? job->state : basket_engine::BridgeState::kCancelled;
}

// 每步推进 1 秒，直到终态或步数耗尽。
basket_engine::BridgeState DriveToTerminal(basket_engine::BridgeController* controller,
                                           const std::string& job_id,
                                           std::int64_t* now_ms,
                                           int max_steps = 20) {
  for (int i = 0; i < max_steps; ++i) {
    if (basket_engine::IsTerminal(StateOf(*controller, job_id))) {
      break;
    }
    *now_ms += 1000;
    controller->Advance(job_id, *now_ms);
  }
  return StateOf(*controller, job_id);
}

basket_engine::AnalystReport MakeReport(basket_engine::ProducerKind kind,
                                        basket_engine::SignalDirection direction,
                                        double confidence) {
  basket_engine::AnalystReport report;
  report.producer = kind;
  report.direction = direction;
  report.confidence = confidence;
  report.evidence = {"fixture"};
  return report;
}

std::vector<basket_engine::AnalystReport> UniformReports(basket_engine::SignalDirection direction,
                                                         double confidence) {
  std::vector<basket_engine::AnalystReport> reports;
  for (const auto kind : basket_engine::kAllProducerKinds) {
    reports.push_back(MakeReport(kind, direction, confidence));
  }
  return reports;
}

basket_engine::DebateThesis MakeThesis(basket_engine::DebatePosition position,
                                       basket_engine::DecisionAction action,
                                       const basket_engine::Weights& weights,
                                       double confidence) {
  basket_engine::DebateThesis thesis;
  thesis.position = position;
  thesis.proposed_action = action;
  thesis.target_weights = weights;
  thesis.confidence = confidence;
  thesis.round = 1;
  return thesis;
}

}  // namespace

int main() {
  {
    // YAML 配置：两级缩进、引号、行内注释；未知字段忽略。
    const auto dir = FreshTempDir("config_load");
    const auto path = dir / "engine.yaml";
    {
      std::ofstream out(path);
      out << "storage:\n"
          << "  data_path: /var/lib/basket  # 数据目录\n"
          << "system:\n"
          << "  mode: mock\n"
          << "  cycle_interval_sec: 600\n"
          << "  unknown_key: 1\n"
          << "debate:\n"
          << "  max_rounds: 2\n"
          << "  convergence_gap: 0.2\n"
          << "risk:\n"
          << "  max_token_weight: 0.25\n"
          << "settlement:\n"
          << "  dry_run: true\n"
          << "  attestation_base_url: \"https://attest.example\"\n"
          << "reflection:\n"
          << "  delay_hours: 48\n";
    }
    basket_engine::AppConfig config;
    std::string error;
    if (!basket_engine::LoadAppConfigFromYaml(path.string(), &config, &error)) {
      std::cerr << "预期配置加载成功，实际失败: " << error << "\n";
      return 1;
    }
    if (config.data_path != "/var/lib/basket" || config.system.cycle_interval_sec != 600 ||
        config.debate.max_rounds != 2 || !NearlyEqual(config.debate.convergence_gap, 0.2) ||
        !NearlyEqual(config.risk.max_token_weight, 0.25) || !config.settlement.dry_run ||
        config.settlement.attestation_base_url != "https://attest.example" ||
        config.reflection.delay_hours != 48) {
      std::cerr << "配置字段解析结果不符合预期\n";
      return 1;
    }
    // 未出现的字段保留默认值。
    if (!NearlyEqual(config.risk.anchor_floor, 0.05) || config.settlement.max_retries != 3) {
      std::cerr << "未配置字段应保留默认值\n";
      return 1;
    }
  }

  {
    const auto dir = FreshTempDir("config_reject");
    const auto bad_value = dir / "bad_value.yaml";
    {
      std::ofstream out(bad_value);
      out << "debate:\n"
          << "  max_rounds: abc\n";
    }
    basket_engine::AppConfig config;
    std::string error;
    if (basket_engine::LoadAppConfigFromYaml(bad_value.string(), &config, &error) ||
        !Contains(error, "debate.max_rounds") || !Contains(error, "2")) {
      std::cerr << "非法数值应带字段名与行号报错，实际: " << error << "\n";
      return 1;
    }

    const auto bad_delay = dir / "bad_delay.yaml";
    {
      std::ofstream out(bad_delay);
      out << "reflection:\n"
          << "  delay_hours: 12\n";
    }
    error.clear();
    if (basket_engine::LoadAppConfigFromYaml(bad_delay.string(), &config, &error) ||
        !Contains(error, "reflection.delay_hours")) {
      std::cerr << "反思延迟低于 24h 应被拒绝，实际: " << error << "\n";
      return 1;
    }

    basket_engine::AppConfig too_many_rounds;
    too_many_rounds.debate.max_rounds = 4;
    if (basket_engine::ValidateAppConfig(too_many_rounds, &error)) {
      std::cerr << "辩论轮数超过 3 应被拒绝\n";
      return 1;
    }
  }

  {
    // 仓库自带的默认配置必须能通过校验。
    basket_engine::AppConfig config;
    std::string error;
    if (!basket_engine::LoadAppConfigFromYaml("config/default.yaml", &config, &error)) {
      std::cerr << "默认配置加载失败: " << error << "\n";
      return 1;
    }
    if (config.system.mode != "mock" || config.llm.provider != "rule_based") {
      std::cerr << "默认配置应为 mock + rule_based\n";
      return 1;
    }
  }

  {
    // 扇出：返回顺序固定，与完成顺序无关；非法输出记为失败报告。
    auto completion = std::make_shared<ScriptedCompletion>();
    completion->Set(basket_engine::AgentRole::kTechnicalAnalyst,
                    [](const basket_engine::AgentRequest&, const basket_engine::CancelToken&,
                       std::string* out_text, std::string*) {
                      std::this_thread::sleep_for(std::chrono::milliseconds(100));
                      *out_text = ProducerJson(0.7, "bullish");
                      return true;
                    });
    completion->Reply(basket_engine::AgentRole::kSentimentAnalyst, "not json at all");
    completion->Reply(basket_engine::AgentRole::kLiquidityAnalyst,
                      "模型前缀 " + ProducerJson(0.6, "neutral", true) + " 模型后缀");
    completion->Reply(basket_engine::AgentRole::kMacroAnalyst,
                      "{\"confidence\":1.5,\"direction\":\"bearish\",\"evidence\":[]}");

    basket_engine::ReportFanout fanout(completion, 2000);
    basket_engine::ProducerInput input{MakeSnapshot(), basket_engine::MarketContext{}, {}};
    const auto reports = fanout.Run(input);
    if (reports.size() != 4 ||
        reports[0].producer != basket_engine::ProducerKind::kTechnical ||
        reports[1].producer != basket_engine::ProducerKind::kSentiment ||
        reports[2].producer != basket_engine::ProducerKind::kLiquidity ||
        reports[3].producer != basket_engine::ProducerKind::kMacro) {
      std::cerr << "扇出报告顺序应固定为 technical/sentiment/liquidity/macro\n";
      return 1;
    }
    if (!reports[0].ok() || !NearlyEqual(reports[0].confidence, 0.7)) {
      std::cerr << "慢但未超时的分析师报告应保留\n";
      return 1;
    }
    if (reports[1].ok() || reports[3].ok()) {
      std::cerr << "非法 JSON 与越界置信度应记为失败报告\n";
      return 1;
    }
    if (!reports[2].ok() || !reports[2].high_volatility ||
        reports[2].direction != basket_engine::SignalDirection::kNeutral) {
      std::cerr << "夹在文本中的 JSON 对象应被提取并解析\n";
      return 1;
    }
    if (basket_engine::ReportFanout::CountFailures(reports) != 2) {
      std::cerr << "失败计数应为 2\n";
      return 1;
    }
  }

  {
    // 反附和规则：第 2 轮起改变动作必须带来新证据。
    const auto snapshot = MakeSnapshot();
    basket_engine::DebateThesis previous =
        MakeThesis(basket_engine::DebatePosition::kAdvocateForHold,
                   basket_engine::DecisionAction::kHold, snapshot.weights(), 0.6);
    previous.evidence = {"volatility elevated"};
    const std::vector<basket_engine::DebateThesis> transcript{previous};

    basket_engine::DebateThesis thesis;
    std::string error;
    const std::string flip_without_evidence =
        AdvocateJson("REBALANCE", kModestRebalance, 0.7, {"volatility elevated"});
    if (basket_engine::DebateEngine::ValidateThesis(
            flip_without_evidence, basket_engine::DebatePosition::kAdvocateForHold, 2,
            snapshot, transcript, &previous, &thesis, &error) ||
        !Contains(error, "without new evidence")) {
      std::cerr << "无新证据改变立场应被拒绝，实际: " << error << "\n";
      return 1;
    }
    const std::string flip_with_evidence =
        AdvocateJson("REBALANCE", kModestRebalance, 0.7, {"funding rates normalized"});
    if (!basket_engine::DebateEngine::ValidateThesis(
            flip_with_evidence, basket_engine::DebatePosition::kAdvocateForHold, 2, snapshot,
            transcript, &previous, &thesis, &error)) {
      std::cerr << "带新证据改变立场应被接受: " << error << "\n";
      return 1;
    }
    // 第 1 轮不受反附和约束，但权重必须和为 1。
    const basket_engine::Weights bad_sum{{"USDC", 0.5}, {"WETH", 0.4}};
    if (basket_engine::DebateEngine::ValidateThesis(
            AdvocateJson("REBALANCE", bad_sum, 0.8, {"x"}),
            basket_engine::DebatePosition::kAdvocateForChange, 1, snapshot, {}, nullptr,
            &thesis, &error)) {
      std::cerr << "权重和不为 1 的调仓论点应被拒绝\n";
      return 1;
    }
    // HOLD 论点统一记录为当前权重。
    if (!basket_engine::DebateEngine::ValidateThesis(
            AdvocateJson("HOLD", {}, 0.4, {"x"}),
            basket_engine::DebatePosition::kAdvocateForHold, 1, snapshot, {}, nullptr,
            &thesis, &error) ||
        !SameWeights(thesis.target_weights, snapshot.weights())) {
      std::cerr << "HOLD 论点应记录当前权重\n";
      return 1;
    }
  }

  {
    // 轮数上限：配置超过 3 也只跑 3 轮；重试耗尽后沿用上一轮论点。
    auto completion = std::make_shared<ScriptedCompletion>();
    completion->Reply(basket_engine::AgentRole::kChangeAdvocate,
                      AdvocateJson("REBALANCE", kModestRebalance, 0.9, {"momentum"}));
    auto hold_calls = std::make_shared<std::atomic<int>>(0);
    completion->Set(basket_engine::AgentRole::kHoldAdvocate,
                    [hold_calls](const basket_engine::AgentRequest&,
                                 const basket_engine::CancelToken&, std::string* out_text,
                                 std::string*) {
                      if (hold_calls->fetch_add(1) == 0) {
                        *out_text = AdvocateJson("HOLD", {}, 0.3, {"fees"});
                      } else {
                        // 改投调仓但只复述旧证据，必然被拒绝。
                        *out_text = AdvocateJson("REBALANCE", kModestRebalance, 0.9, {"fees"});
                      }
                      return true;
                    });

    basket_engine::DebateConfig config;
    config.max_rounds = 7;
    config.round_timeout_ms = 2000;
    config.max_round_retries = 2;
    basket_engine::DebateEngine engine(config, completion);
    basket_engine::DebateInput input{MakeSnapshot(), UniformReports(
                                         basket_engine::SignalDirection::kBullish, 0.7),
                                     {}, basket_engine::RiskLimits{}};
    const auto outcome = engine.Run(input);
    if (!outcome.ok || outcome.converged || outcome.rounds.size() != 3) {
      std::cerr << "未收敛时辩论应恰好 3 轮，实际 " << outcome.rounds.size() << "\n";
      return 1;
    }
    const auto& round2 = outcome.rounds[1].for_hold;
    if (!round2.carried_forward || round2.rejected_attempts != 3 ||
        round2.proposed_action != basket_engine::DecisionAction::kHold || round2.round != 2) {
      std::cerr << "重试耗尽后应沿用上一轮 HOLD 论点\n";
      return 1;
    }
    if (completion->calls(basket_engine::AgentRole::kHoldAdvocate) != 7) {
      std::cerr << "持有方调用次数应为 1 + 3 + 3，实际 "
                << completion->calls(basket_engine::AgentRole::kHoldAdvocate) << "\n";
      return 1;
    }
  }

  {
    // 第 1 轮变更方无有效输出：辩论失败。
    auto completion = std::make_shared<ScriptedCompletion>();
    completion->Reply(basket_engine::AgentRole::kChangeAdvocate, "I refuse to answer");
    basket_engine::DebateConfig config;
    config.round_timeout_ms = 2000;
    basket_engine::DebateEngine engine(config, completion);
    basket_engine::DebateInput input{MakeSnapshot(), {}, {}, basket_engine::RiskLimits{}};
    const auto outcome = engine.Run(input);
    if (outcome.ok || !outcome.rounds.empty() || !Contains(outcome.error, "round 1")) {
      std::cerr << "第 1 轮失败应使辩论失败\n";
      return 1;
    }
  }

  {
    // 硬限制：列出全部违规，而不是遇到第一条就停。
    basket_engine::BasketSnapshot snapshot = MakeSnapshot();
    snapshot.tokens["AERO"].liquidity_usd = 50'000.0;
    const basket_engine::Weights proposed{
        {"USDC", 0.02}, {"WETH", 0.40}, {"WBTC", 0.18}, {"SOL", 0.20}, {"AERO", 0.20}};
    const auto violations =
        basket_engine::CheckHardLimits(basket_engine::RiskLimits{}, proposed, snapshot, 0.35);
    if (!HasEntry(violations, "token WETH weight 0.40 exceeds 0.30 limit") ||
        !HasEntry(violations, "anchor USDC weight 0.02 below 0.05 floor") ||
        !HasEntryContaining(violations, "token AERO liquidity 50000.00 below") ||
        !HasEntryContaining(violations, "rolling 24h turnover 0.50 exceeds 0.40")) {
      std::cerr << "硬限制违规列表不完整:\n";
      for (const auto& violation : violations) {
        std::cerr << "  " << violation << "\n";
      }
      return 1;
    }

    const basket_engine::Weights churn{
        {"USDC", 0.10}, {"WETH", 0.25}, {"LINK", 0.25}, {"UNI", 0.20}, {"ARB", 0.20}};
    basket_engine::BasketSnapshot wide = MakeSnapshot();
    for (const auto& token : {"LINK", "UNI", "ARB"}) {
      basket_engine::TokenState state;
      state.liquidity_usd = 5'000'000.0;
      wide.tokens[token] = state;
    }
    const auto churn_violations =
        basket_engine::CheckHardLimits(basket_engine::RiskLimits{}, churn, wide, 0.0);
    if (!HasEntry(churn_violations, "tokens added+removed 6 exceeds 3 limit") ||
        !HasEntryContaining(churn_violations, "turnover 0.65 exceeds 0.25 limit")) {
      std::cerr << "增删 token 数与单次换手违规未被识别\n";
      return 1;
    }

    basket_engine::RiskGate gate(
        basket_engine::RiskLimits{},
        std::make_shared<basket_engine::RuleBasedSoftRiskJudge>(basket_engine::RiskLimits{}));
    basket_engine::RiskRequest request;
    request.action = basket_engine::DecisionAction::kRebalance;
    request.proposed = proposed;
    request.snapshot = snapshot;
    request.turnover_24h = 0.35;
    const auto verdict = gate.Evaluate(request);
    if (verdict.approved || verdict.soft_checked || verdict.violations.size() < 4) {
      std::cerr << "硬限制违规应直接否决且不进入软判断\n";
      return 1;
    }

    request.action = basket_engine::DecisionAction::kHold;
    if (!gate.Evaluate(request).approved) {
      std::cerr << "HOLD 不改变权重，风控应直接放行\n";
      return 1;
    }
  }

  {
    // 软判断：高波动时把换手缩到上限；调仓频率超限时否决。
    basket_engine::RiskGate gate(
        basket_engine::RiskLimits{},
        std::make_shared<basket_engine::RuleBasedSoftRiskJudge>(basket_engine::RiskLimits{}));
    basket_engine::RiskRequest request;
    request.action = basket_engine::DecisionAction::kRebalance;
    request.snapshot = MakeSnapshot();
    request.proposed = {
        {"USDC", 0.10}, {"WETH", 0.30}, {"WBTC", 0.30}, {"SOL", 0.30}, {"AERO", 0.0}};
    request.reports = UniformReports(basket_engine::SignalDirection::kBullish, 0.7);
    request.reports[1].high_volatility = true;
    const auto verdict = gate.Evaluate(request);
    if (!verdict.approved || !verdict.soft_checked || !verdict.adjusted_weights.has_value()) {
      std::cerr << "高波动下应放行但给出收缩后的权重\n";
      return 1;
    }
    const double adjusted_turnover =
        basket_engine::Turnover(request.snapshot.weights(), *verdict.adjusted_weights);
    if (!NearlyEqual(adjusted_turnover, 0.15, 1e-9) ||
        !NearlyEqual(basket_engine::WeightSum(*verdict.adjusted_weights), 1.0, 1e-9)) {
      std::cerr << "收缩后换手应为 0.15，实际 " << adjusted_turnover << "\n";
      return 1;
    }

    request.reports = UniformReports(basket_engine::SignalDirection::kBullish, 0.7);
    request.proposed = kModestRebalance;
    request.rebalances_24h = 3;
    const auto frequency = gate.Evaluate(request);
    if (frequency.approved || !HasEntryContaining(frequency.violations, "soft veto: ")) {
      std::cerr << "24h 调仓次数达到上限应软否决\n";
      return 1;
    }

    request.rebalances_24h = 1;
    request.snapshot = MakeSnapshot(20'000.0);
    const auto small_basket = gate.Evaluate(request);
    if (small_basket.approved) {
      std::cerr << "小篮子 24h 内第二次调仓应被否决\n";
      return 1;
    }
  }

  {
    // 决策者优先级：否决 > 紧急退出 > 辩论比较 > 费用门槛。
    basket_engine::RuleBasedDecisionMaker maker{basket_engine::DecisionConfig{}};
    basket_engine::DecisionInput input;
    input.trigger = basket_engine::TriggerReason::kLossEvent;
    input.snapshot = MakeSnapshot();
    input.reports = UniformReports(basket_engine::SignalDirection::kBearish, 0.9);
    input.for_change = MakeThesis(basket_engine::DebatePosition::kAdvocateForChange,
                                  basket_engine::DecisionAction::kRebalance, kModestRebalance,
                                  0.8);
    input.for_hold = MakeThesis(basket_engine::DebatePosition::kAdvocateForHold,
                                basket_engine::DecisionAction::kHold,
                                input.snapshot.weights(), 0.6);
    input.verdict.approved = false;
    input.verdict.violations = {"token WETH weight 0.35 exceeds 0.30 limit"};

    auto proposal = maker.Decide(input);
    if (proposal.action != basket_engine::DecisionAction::kHold ||
        !HasEntry(proposal.tags, "risk_veto")) {
      std::cerr << "风控否决优先于紧急退出\n";
      return 1;
    }

    input.verdict = basket_engine::RiskVerdict{};
    input.verdict.approved = true;
    proposal = maker.Decide(input);
    if (proposal.action != basket_engine::DecisionAction::kEmergencyExit ||
        !SameWeights(proposal.weights, input.snapshot.weights())) {
      std::cerr << "亏损事件 + 4 条高置信看空应紧急退出\n";
      return 1;
    }

    input.trigger = basket_engine::TriggerReason::kScheduled;
    proposal = maker.Decide(input);
    if (proposal.action != basket_engine::DecisionAction::kRebalance ||
        !SameWeights(proposal.weights, kModestRebalance)) {
      std::cerr << "定时触发不应紧急退出，变更方更强时应调仓\n";
      return 1;
    }

    input.for_hold.confidence = 0.85;
    proposal = maker.Decide(input);
    if (proposal.action != basket_engine::DecisionAction::kHold) {
      std::cerr << "持有方更强时应 HOLD\n";
      return 1;
    }

    // 小篮子：固定结算费用压过预期收益。
    input.for_hold.confidence = 0.6;
    input.snapshot = MakeSnapshot(100.0);
    input.for_hold.target_weights = input.snapshot.weights();
    proposal = maker.Decide(input);
    if (proposal.action != basket_engine::DecisionAction::kHold ||
        !HasEntry(proposal.tags, "fee_exceeds_benefit")) {
      std::cerr << "费用明显超过收益时应 HOLD 并打标\n";
      return 1;
    }

    const double cost = basket_engine::EstimateCost(basket_engine::DecisionConfig{}, 0.1, 1e6);
    if (!NearlyEqual(cost, (2.0 + 0.1 * 1e6 * 30.0 / 1e4) / 1e6, 1e-12)) {
      std::cerr << "费用估计公式不符合预期: " << cost << "\n";
      return 1;
    }
  }

  {
    // 决策契约：否决后仍提议调仓会被改写为 HOLD。
    basket_engine::DecisionInput input;
    input.snapshot = MakeSnapshot();
    input.verdict.approved = false;
    basket_engine::DecisionProposal proposal;
    proposal.action = basket_engine::DecisionAction::kRebalance;
    proposal.weights = kModestRebalance;
    std::string violation;
    if (basket_engine::EnforceDecisionContract(input, basket_engine::RiskLimits{}, &proposal,
                                               &violation) ||
        proposal.action != basket_engine::DecisionAction::kHold ||
        !HasEntry(proposal.tags, "decision_contract_violation") ||
        !SameWeights(proposal.weights, input.snapshot.weights())) {
      std::cerr << "违反契约的决策应被改写为 HOLD\n";
      return 1;
    }

    input.verdict.approved = true;
    input.for_change.proposed_action = basket_engine::DecisionAction::kRebalance;
    input.verdict.adjusted_weights = kModestRebalance;
    proposal = basket_engine::DecisionProposal{};
    proposal.action = basket_engine::DecisionAction::kRebalance;
    proposal.weights = {
        {"USDC", 0.10}, {"WETH", 0.30}, {"WBTC", 0.30}, {"SOL", 0.30}, {"AERO", 0.0}};
    if (basket_engine::EnforceDecisionContract(input, basket_engine::RiskLimits{}, &proposal,
                                               &violation) ||
        !Contains(violation, "risk-adjusted")) {
      std::cerr << "忽略风控收缩权重的调仓应违反契约\n";
      return 1;
    }

    // 变更方未提议调仓时，风控没有审过任何权重变化，调仓不得放行。
    input.verdict.adjusted_weights.reset();
    input.for_change.proposed_action = basket_engine::DecisionAction::kHold;
    proposal = basket_engine::DecisionProposal{};
    proposal.action = basket_engine::DecisionAction::kRebalance;
    proposal.weights = kModestRebalance;
    if (basket_engine::EnforceDecisionContract(input, basket_engine::RiskLimits{}, &proposal,
                                               &violation) ||
        proposal.action != basket_engine::DecisionAction::kHold ||
        !Contains(violation, "risk-gated")) {
      std::cerr << "未经风控审查的调仓应违反契约\n";
      return 1;
    }

    input.for_change.proposed_action = basket_engine::DecisionAction::kRebalance;
    proposal = basket_engine::DecisionProposal{};
    proposal.action = basket_engine::DecisionAction::kRebalance;
    proposal.weights = input.snapshot.weights();
    if (basket_engine::EnforceDecisionContract(input, basket_engine::RiskLimits{}, &proposal,
                                               &violation) ||
        !Contains(violation, "zero turnover")) {
      std::cerr << "零换手调仓应违反契约\n";
      return 1;
    }
  }

  {
    // 主路径：四个分析师看多，辩论一轮收敛，风控放行并提交调仓。
    CycleRig rig("scenario_rebalance");
    ScriptProducers(rig.completion.get(), {0.8, 0.6, 0.7, 0.5}, "bullish");
    rig.completion->Reply(basket_engine::AgentRole::kChangeAdvocate,
                          AdvocateJson("REBALANCE", kModestRebalance, 0.70,
                                       {"momentum breakout in WETH and WBTC"}));
    rig.completion->Reply(basket_engine::AgentRole::kHoldAdvocate,
                          AdvocateJson("HOLD", {}, 0.60, {"settlement fees"}));
    auto orchestrator = rig.Build();

    basket_engine::Decision decision;
    std::string error;
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0, &decision,
                                &error)) {
      std::cerr << "决策周期执行失败: " << error << "\n";
      return 1;
    }
    if (decision.action != basket_engine::DecisionAction::kRebalance ||
        decision.status != basket_engine::ExecutionStatus::kSubmitted) {
      std::cerr << "预期 REBALANCE/SUBMITTED，实际 " << basket_engine::ToString(decision.action)
                << "/" << basket_engine::ToString(decision.status) << "\n";
      return 1;
    }
    if (decision.debate.size() != 1 || !decision.verdict.has_value() ||
        !decision.verdict->approved || !SameWeights(decision.final_weights, kModestRebalance) ||
        decision.reports.size() != 4) {
      std::cerr << "主路径审计链不完整\n";
      return 1;
    }
    if (rig.contract.submission_count() != 1 || decision.tx_ref.value_or("") != "tx_1") {
      std::cerr << "调仓应恰好提交一次\n";
      return 1;
    }
    const double turnover_24h = basket_engine::Orchestrator::Turnover24h(
        orchestrator->History(), kT0 + kHourMs);
    if (!NearlyEqual(turnover_24h, 0.10, 1e-9) ||
        basket_engine::Orchestrator::Rebalances24h(orchestrator->History(), kT0 + 25 * kHourMs) !=
            0) {
      std::cerr << "24h 换手统计不符合预期: " << turnover_24h << "\n";
      return 1;
    }

    const auto state = rig.Load();
    if (state.decisions.size() != 1 || state.decisions[0].id != decision.id ||
        state.decisions[0].status != basket_engine::ExecutionStatus::kSubmitted ||
        state.decisions[0].debate.size() != 1) {
      std::cerr << "决策应完整写入 WAL\n";
      return 1;
    }
    orchestrator.reset();
    auto restarted = rig.Build();
    restarted->Restore(state);
    if (restarted->History().size() != 1 || restarted->History()[0].id != decision.id) {
      std::cerr << "重启后决策历史应从 WAL 恢复\n";
      return 1;
    }
  }

  {
    // 双方都主张 HOLD 时，模型决策者给出 REBALANCE 也不能绕过风控提交。
    CycleRig rig("model_judge_ungated_rebalance");
    rig.config.decision.use_model_judge = true;
    rig.config.decision.judge_timeout_ms = 2000;
    ScriptProducers(rig.completion.get(), {0.6, 0.6, 0.6, 0.6}, "neutral");
    rig.completion->Reply(basket_engine::AgentRole::kChangeAdvocate,
                          AdvocateJson("HOLD", {}, 0.55, {"no clear edge"}));
    rig.completion->Reply(basket_engine::AgentRole::kHoldAdvocate,
                          AdvocateJson("HOLD", {}, 0.60, {"settlement fees"}));
    rig.completion->Reply(basket_engine::AgentRole::kDecisionJudge,
                          "{\"action\":\"REBALANCE\",\"confidence\":0.9,\"rationale\":\"go\"}");
    auto orchestrator = rig.Build();

    basket_engine::Decision decision;
    std::string error;
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0, &decision,
                                &error)) {
      std::cerr << "决策周期执行失败: " << error << "\n";
      return 1;
    }
    if (decision.action != basket_engine::DecisionAction::kHold ||
        rig.contract.submission_count() != 0 ||
        !HasEntry(decision.tags, "model_rebalance_not_gated") ||
        !SameWeights(decision.final_weights, MakeSnapshot().weights())) {
      std::cerr << "未经风控审查的模型调仓应改为 HOLD，实际 "
                << basket_engine::ToString(decision.action) << "\n";
      return 1;
    }
    if (basket_engine::Orchestrator::Rebalances24h(orchestrator->History(), kT0 + kHourMs) != 0) {
      std::cerr << "HOLD 不应计入 24h 调仓次数\n";
      return 1;
    }
  }

  {
    // 风控否决：变更方坚持超配 WETH，辩论跑满 3 轮后被硬限制否决。
    CycleRig rig("scenario_veto");
    ScriptProducers(rig.completion.get(), {0.9, 0.9, 0.9, 0.9}, "bullish");
    rig.completion->Reply(basket_engine::AgentRole::kChangeAdvocate,
                          AdvocateJson("REBALANCE", kOverweightRebalance, 0.95, {"breakout"}));
    rig.completion->Reply(basket_engine::AgentRole::kHoldAdvocate,
                          AdvocateJson("HOLD", {}, 0.30, {"concentration"}));
    auto orchestrator = rig.Build();

    basket_engine::Decision decision;
    std::string error;
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0, &decision,
                                &error)) {
      std::cerr << "否决场景周期执行失败: " << error << "\n";
      return 1;
    }
    if (decision.debate.size() != 3) {
      std::cerr << "不收敛的辩论应跑满 3 轮，实际 " << decision.debate.size() << "\n";
      return 1;
    }
    if (decision.action != basket_engine::DecisionAction::kHold ||
        !HasEntry(decision.tags, "risk_veto") || !decision.verdict.has_value() ||
        decision.verdict->approved ||
        !HasEntry(decision.verdict->violations, "token WETH weight 0.35 exceeds 0.30 limit")) {
      std::cerr << "超配提议应被风控否决并 HOLD\n";
      return 1;
    }
    if (rig.contract.submission_count() != 0 ||
        !SameWeights(decision.final_weights, decision.prior_weights)) {
      std::cerr << "否决后不得提交，权重保持不变\n";
      return 1;
    }
  }

  {
    // 降级：两个分析师超时，直接 HOLD，不进入辩论。
    CycleRig rig("scenario_degraded");
    rig.config.producers.timeout_ms = 300;
    ScriptProducers(rig.completion.get(), {0.8, 0.6, 0.7, 0.5}, "bullish");
    rig.completion->Stall(basket_engine::AgentRole::kSentimentAnalyst);
    rig.completion->Stall(basket_engine::AgentRole::kMacroAnalyst);
    auto orchestrator = rig.Build();

    basket_engine::Decision decision;
    std::string error;
    const auto started = std::chrono::steady_clock::now();
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0, &decision,
                                &error)) {
      std::cerr << "降级场景周期执行失败: " << error << "\n";
      return 1;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (decision.action != basket_engine::DecisionAction::kHold ||
        !HasEntry(decision.tags, "degraded") ||
        decision.rationale != "degraded mode: 2 agents failed") {
      std::cerr << "两个分析师失败应降级 HOLD，实际 rationale=" << decision.rationale << "\n";
      return 1;
    }
    if (decision.reports.size() != 4 || decision.reports[1].error.value_or("") !=
                                            "timeout after 300ms") {
      std::cerr << "超时分析师应记录 timeout 报告\n";
      return 1;
    }
    if (rig.completion->calls(basket_engine::AgentRole::kChangeAdvocate) != 0 ||
        !decision.debate.empty()) {
      std::cerr << "降级后不应调用辩论方\n";
      return 1;
    }
    if (elapsed.count() > 3000) {
      std::cerr << "超时分析师不应阻塞周期，耗时 " << elapsed.count() << "ms\n";
      return 1;
    }
  }

  {
    // 急停：进程内标志与哨兵文件任一置位，整个周期跳过且不调用模型。
    CycleRig rig("scenario_kill_switch");
    ScriptProducers(rig.completion.get(), {0.8, 0.6, 0.7, 0.5}, "bullish");
    rig.completion->Reply(basket_engine::AgentRole::kChangeAdvocate,
                          AdvocateJson("REBALANCE", kModestRebalance, 0.70, {"momentum"}));
    rig.completion->Reply(basket_engine::AgentRole::kHoldAdvocate,
                          AdvocateJson("HOLD", {}, 0.60, {"fees"}));
    auto orchestrator = rig.Build();

    rig.safety->kill_switch().Engage();
    basket_engine::Decision decision;
    std::string error;
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0, &decision,
                                &error) ||
        decision.status != basket_engine::ExecutionStatus::kSkipped ||
        !HasEntry(decision.tags, "safety_blocked") ||
        decision.rationale != "kill switch engaged") {
      std::cerr << "急停置位时周期应被跳过\n";
      return 1;
    }
    if (rig.completion->calls(basket_engine::AgentRole::kTechnicalAnalyst) != 0) {
      std::cerr << "急停时不应调用分析师\n";
      return 1;
    }
    if (!rig.safety->kill_switch().Release(&error)) {
      std::cerr << "解除急停失败: " << error << "\n";
      return 1;
    }

    { std::ofstream sentinel(rig.dir / "KILL_SWITCH"); }
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0 + 60'000,
                                &decision, &error) ||
        decision.status != basket_engine::ExecutionStatus::kSkipped) {
      std::cerr << "哨兵文件存在时周期应被跳过\n";
      return 1;
    }
    if (!rig.safety->kill_switch().Release(&error) ||
        std::filesystem::exists(rig.dir / "KILL_SWITCH")) {
      std::cerr << "解除急停应删除哨兵文件\n";
      return 1;
    }
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0 + 120'000,
                                &decision, &error) ||
        decision.status == basket_engine::ExecutionStatus::kSkipped) {
      std::cerr << "解除急停后周期应恢复执行\n";
      return 1;
    }
    if (rig.Load().decisions.size() != 3) {
      std::cerr << "跳过的周期同样要写入决策记录\n";
      return 1;
    }
  }

  {
    // 亏损熔断：1h 内 NAV 回撤 16%，熔断置位并落盘，重启后仍然生效，直到人工解除。
    CycleRig rig("scenario_loss_halt");
    ScriptProducers(rig.completion.get(), {0.8, 0.6, 0.7, 0.5}, "bullish");
    rig.completion->Reply(basket_engine::AgentRole::kChangeAdvocate,
                          AdvocateJson("REBALANCE", kModestRebalance, 0.70, {"momentum"}));
    rig.completion->Reply(basket_engine::AgentRole::kHoldAdvocate,
                          AdvocateJson("HOLD", {}, 0.60, {"fees"}));
    auto orchestrator = rig.Build();

    basket_engine::Decision decision;
    std::string error;
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0, &decision,
                                &error) ||
        decision.status == basket_engine::ExecutionStatus::kSkipped) {
      std::cerr << "首个周期不应被跳过\n";
      return 1;
    }

    rig.market.SetNav(840'000.0);
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kLossEvent, kT0 + kHourMs,
                                &decision, &error) ||
        decision.status != basket_engine::ExecutionStatus::kSkipped ||
        !Contains(decision.rationale, "loss halt: ")) {
      std::cerr << "回撤超过阈值应熔断并跳过周期，实际 rationale=" << decision.rationale << "\n";
      return 1;
    }
    const auto alert = rig.notifier->Last("loss_halt");
    if (rig.notifier->Count("loss_halt") != 1 || !alert.has_value() ||
        alert->severity != basket_engine::AlertSeverity::kCritical) {
      std::cerr << "熔断应发送一次 critical 告警\n";
      return 1;
    }

    // NAV 回升不会自动解除熔断。
    rig.market.SetNav(1'000'000.0);
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0 + 2 * kHourMs,
                                &decision, &error) ||
        decision.status != basket_engine::ExecutionStatus::kSkipped) {
      std::cerr << "熔断应持续到人工解除\n";
      return 1;
    }

    basket_engine::SafetySystem restored(rig.config, &rig.wal, rig.notifier);
    restored.Restore(rig.Load());
    std::string reason;
    if (!restored.loss_halted() || !restored.CycleBlocked(&reason)) {
      std::cerr << "熔断标志应从 WAL 恢复\n";
      return 1;
    }

    if (!rig.safety->ClearLossHalt(kT0 + 3 * kHourMs, &error)) {
      std::cerr << "人工解除熔断失败: " << error << "\n";
      return 1;
    }
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0 + 3 * kHourMs,
                                &decision, &error) ||
        decision.status == basket_engine::ExecutionStatus::kSkipped) {
      std::cerr << "解除熔断后周期应恢复执行\n";
      return 1;
    }
    basket_engine::SafetySystem after_clear(rig.config, &rig.wal, rig.notifier);
    after_clear.Restore(rig.Load());
    if (after_clear.loss_halted()) {
      std::cerr << "解除事件同样应落盘\n";
      return 1;
    }
  }

  {
    // 紧急退出：亏损事件 + 四条高置信看空，动作记为 EMERGENCY_EXIT 并置位熔断。
    CycleRig rig("scenario_emergency");
    ScriptProducers(rig.completion.get(), {0.9, 0.9, 0.9, 0.9}, "bearish");
    rig.completion->Reply(basket_engine::AgentRole::kChangeAdvocate,
                          AdvocateJson("REBALANCE", kModestRebalance, 0.50, {"rotate"}));
    rig.completion->Reply(basket_engine::AgentRole::kHoldAdvocate,
                          AdvocateJson("HOLD", {}, 0.55, {"wait"}));
    auto orchestrator = rig.Build();

    basket_engine::Decision decision;
    std::string error;
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kLossEvent, kT0, &decision,
                                &error)) {
      std::cerr << "紧急退出场景周期执行失败: " << error << "\n";
      return 1;
    }
    if (decision.action != basket_engine::DecisionAction::kEmergencyExit ||
        decision.status != basket_engine::ExecutionStatus::kNotExecuted ||
        !HasEntry(decision.tags, "emergency_exit")) {
      std::cerr << "预期 EMERGENCY_EXIT/NOT_EXECUTED，实际 "
                << basket_engine::ToString(decision.action) << "\n";
      return 1;
    }
    if (!rig.safety->loss_halted() || rig.notifier->Count("loss_halt") != 1 ||
        rig.contract.submission_count() != 0 ||
        !SameWeights(decision.final_weights, decision.prior_weights)) {
      std::cerr << "紧急退出应置位熔断且不提交\n";
      return 1;
    }
  }

  {
    // 中止：扇出期间请求中止，周期在辩论前结束。
    CycleRig rig("scenario_abort");
    ScriptProducers(rig.completion.get(), {0.8, 0.6, 0.7, 0.5}, "bullish");
    auto orchestrator = rig.Build();
    basket_engine::Orchestrator* raw = orchestrator.get();
    rig.completion->Set(basket_engine::AgentRole::kTechnicalAnalyst,
                        [raw](const basket_engine::AgentRequest&,
                              const basket_engine::CancelToken&, std::string* out_text,
                              std::string*) {
                          raw->RequestAbort();
                          *out_text = ProducerJson(0.8, "bullish");
                          return true;
                        });

    basket_engine::Decision decision;
    std::string error;
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0, &decision,
                                &error) ||
        decision.status != basket_engine::ExecutionStatus::kAborted ||
        !HasEntry(decision.tags, "aborted") ||
        decision.rationale != "cycle aborted before debate") {
      std::cerr << "扇出期间请求中止应记为 ABORTED\n";
      return 1;
    }
    if (rig.completion->calls(basket_engine::AgentRole::kChangeAdvocate) != 0 ||
        rig.Load().decisions.size() != 1) {
      std::cerr << "中止后不应进入辩论，但决策仍需落盘\n";
      return 1;
    }
  }

  {
    // 提交失败：链上拒绝，记录 SUBMIT_FAILED 与原因。
    CycleRig rig("scenario_submit_failed");
    ScriptProducers(rig.completion.get(), {0.8, 0.6, 0.7, 0.5}, "bullish");
    rig.completion->Reply(basket_engine::AgentRole::kChangeAdvocate,
                          AdvocateJson("REBALANCE", kModestRebalance, 0.70, {"momentum"}));
    rig.completion->Reply(basket_engine::AgentRole::kHoldAdvocate,
                          AdvocateJson("HOLD", {}, 0.60, {"fees"}));
    rig.contract.FailSubmissions(true);
    auto orchestrator = rig.Build();

    basket_engine::Decision decision;
    std::string error;
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0, &decision,
                                &error) ||
        decision.action != basket_engine::DecisionAction::kRebalance ||
        decision.status != basket_engine::ExecutionStatus::kSubmitFailed ||
        decision.status_detail != "rpc rejected transaction" || decision.tx_ref.has_value()) {
      std::cerr << "链上拒绝应记为 SUBMIT_FAILED\n";
      return 1;
    }
    // 失败的调仓不计入 24h 换手。
    if (basket_engine::Orchestrator::Turnover24h(orchestrator->History(), kT0 + 1) != 0.0) {
      std::cerr << "未提交的调仓不应计入 24h 换手\n";
      return 1;
    }
  }

  {
    // 组合守卫：决策后流动性骤降，执行前复检拦截。
    CycleRig rig("scenario_portfolio_guard");
    ScriptProducers(rig.completion.get(), {0.8, 0.6, 0.7, 0.5}, "bullish");
    rig.completion->Reply(basket_engine::AgentRole::kChangeAdvocate,
                          AdvocateJson("REBALANCE", kModestRebalance, 0.70, {"momentum"}));
    rig.completion->Reply(basket_engine::AgentRole::kHoldAdvocate,
                          AdvocateJson("HOLD", {}, 0.60, {"fees"}));
    basket_engine::BasketSnapshot drained = MakeSnapshot();
    drained.tokens["WETH"].liquidity_usd = 1000.0;
    rig.market.QueueNextSnapshot(drained);
    auto orchestrator = rig.Build();

    basket_engine::Decision decision;
    std::string error;
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0, &decision,
                                &error) ||
        decision.status != basket_engine::ExecutionStatus::kBlockedBySafety ||
        !Contains(decision.status_detail, "token WETH liquidity 1000.00 below")) {
      std::cerr << "执行前流动性不足应被组合守卫拦截，实际 " << decision.status_detail << "\n";
      return 1;
    }
    if (rig.contract.submission_count() != 0 || rig.notifier->Count("portfolio_guard") != 1) {
      std::cerr << "组合守卫拦截后不得提交，并应发送告警\n";
      return 1;
    }
  }

  {
    // 快照不可用：无历史权重时不落决策；有历史时沿用上一条决策的权重跳过周期。
    CycleRig rig("scenario_snapshot_and_lease");
    auto orchestrator = rig.Build();
    rig.market.FailReads(true);
    basket_engine::Decision decision;
    std::string error;
    if (orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0, &decision,
                               &error) ||
        !Contains(error, "snapshot unavailable") || !rig.Load().decisions.empty() ||
        rig.notifier->Count("snapshot_unavailable") != 1) {
      std::cerr << "无历史权重时快照不可用不应提交决策，实际: " << error << "\n";
      return 1;
    }

    rig.market.FailReads(false);
    basket_engine::Decision first;
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0 + 1000, &first,
                                &error)) {
      std::cerr << "快照恢复后周期应成功: " << error << "\n";
      return 1;
    }

    rig.market.FailReads(true);
    if (!orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0 + 2000, &decision,
                                &error) ||
        decision.status != basket_engine::ExecutionStatus::kSkipped ||
        decision.action != basket_engine::DecisionAction::kHold ||
        !HasEntry(decision.tags, "snapshot_unavailable") ||
        !SameWeights(decision.final_weights, first.final_weights)) {
      std::cerr << "快照不可用时应沿用上一条决策的权重跳过周期\n";
      return 1;
    }
    for (const auto& committed : rig.Load().decisions) {
      if (!NearlyEqual(basket_engine::WeightSum(committed.final_weights), 1.0, 1e-6)) {
        std::cerr << "已提交决策的权重和必须为 1: " << committed.id << "\n";
        return 1;
      }
    }

    std::string reason;
    auto held = rig.safety->idempotency().TryAcquire("cycle", kT0 + 3000, &reason);
    if (!held.valid()) {
      std::cerr << "周期结束后 cycle 键应已释放\n";
      return 1;
    }
    if (orchestrator->RunCycle(basket_engine::TriggerReason::kScheduled, kT0 + 3000, &decision,
                               &error) ||
        !Contains(error, "cycle already running")) {
      std::cerr << "并发周期应被拒绝，实际: " << error << "\n";
      return 1;
    }
    if (rig.Load().decisions.size() != 2) {
      std::cerr << "被拒绝的周期不应产生决策记录\n";
      return 1;
    }
  }

  {
    basket_engine::IdempotencyGuard guard(1000);
    std::string reason;
    auto first = guard.TryAcquire("submit:dec-1", 0, &reason);
    auto second = guard.TryAcquire("submit:dec-1", 500, &reason);
    if (!first.valid() || second.valid() ||
        reason != "operation already in progress: submit:dec-1") {
      std::cerr << "同一键不可并发持有\n";
      return 1;
    }
    if (!guard.TryAcquire("submit:dec-2", 500, &reason).valid()) {
      std::cerr << "不同键互不影响\n";
      return 1;
    }
    // 持有者未释放，TTL 到期后可被重新获取；旧租约释放不影响新持有者。
    auto third = guard.TryAcquire("submit:dec-1", 1500, &reason);
    first.Release();
    if (!third.valid() || !guard.IsHeld("submit:dec-1", 1600)) {
      std::cerr << "TTL 过期后的重新获取不应被旧租约释放\n";
      return 1;
    }
    third.Release();
    if (guard.IsHeld("submit:dec-1", 1600)) {
      std::cerr << "释放后键应可用\n";
      return 1;
    }
  }

  {
    basket_engine::AppConfig config;
    config.settlement.min_job_usd = 1.0;
    config.settlement.max_job_usd = 5000.0;
    config.settlement.max_bridged_24h_usd = 6000.0;
    basket_engine::SafetySystem safety(config, nullptr, nullptr);
    std::string reason;
    if (safety.AllowBridge(0.5, kT0, &reason) || !Contains(reason, "below per-job minimum")) {
      std::cerr << "低于单笔下限应拒绝\n";
      return 1;
    }
    if (safety.AllowBridge(5000.01, kT0, &reason) || !Contains(reason, "exceeds per-job ceiling")) {
      std::cerr << "超过单笔上限应拒绝\n";
      return 1;
    }
    if (!safety.AllowBridge(4000.0, kT0, &reason)) {
      std::cerr << "额度内应放行: " << reason << "\n";
      return 1;
    }
    safety.OnBridgeAccepted(4000.0, kT0);
    if (safety.AllowBridge(2500.0, kT0 + kHourMs, &reason) ||
        !Contains(reason, "would exceed ceiling")) {
      std::cerr << "滚动窗口超限应拒绝\n";
      return 1;
    }
    if (!NearlyEqual(safety.BridgeWindowRemaining(kT0 + kHourMs), 2000.0)) {
      std::cerr << "窗口剩余额度应为 2000\n";
      return 1;
    }
    // 窗口滑过后额度恢复。
    if (!safety.AllowBridge(2500.0, kT0 + kDayMs + 1, &reason)) {
      std::cerr << "窗口滑过后应恢复额度: " << reason << "\n";
      return 1;
    }
    const auto& stats = safety.transfer_limiter().total_stats();
    if (stats.checks != 5 || stats.allowed != 2 || stats.rejected != 3 ||
        stats.below_min_rejects != 1 || stats.per_job_rejects != 1 || stats.window_rejects != 1) {
      std::cerr << "限额统计不符合预期\n";
      return 1;
    }

    // 重启：按 WAL 中的历史任务回放限额，熔断期间拒绝一切结算。
    basket_engine::WalState state;
    basket_engine::BridgeJob job;
    job.id = "bridge-restored";
    job.amount_raw = 5000 * basket_engine::kAmountScale;
    job.created_at_ms = kT0;
    state.latest_jobs[job.id] = job;
    basket_engine::SafetySystem restored(config, nullptr, nullptr);
    restored.Restore(state);
    if (restored.AllowBridge(1500.0, kT0 + kHourMs, &reason)) {
      std::cerr << "重启后应按历史任务回放窗口额度\n";
      return 1;
    }
    if (!restored.EngageLossHalt("manual", kT0, &reason) ||
        restored.AllowBridge(10.0, kT0 + kHourMs, &reason) || !Contains(reason, "loss halt")) {
      std::cerr << "熔断期间应拒绝结算\n";
      return 1;
    }
  }

  {
    // 累加器：按加权质押分配，截断余数留作 dust，惰性升档，追加质押保留起始时间。
    auto notifier = std::make_shared<RecordingNotifier>();
    basket_engine::RewardDistributor rewards(basket_engine::RewardsConfig{}, notifier);
    const std::uint64_t usd = basket_engine::kAmountScale;
    std::string error;
    if (!rewards.Stake("a", 1000 * usd, kT0, &error) ||
        !rewards.Stake("b", 3000 * usd, kT0, &error) ||
        !rewards.DepositReward(100 * usd, kT0 + kHourMs, &error)) {
      std::cerr << "质押/注入失败: " << error << "\n";
      return 1;
    }
    auto a = rewards.EntryView("a", kT0 + kHourMs);
    auto b = rewards.EntryView("b", kT0 + kHourMs);
    if (!a.has_value() || !b.has_value() || a->pending_reward != 25 * usd ||
        b->pending_reward != 75 * usd) {
      std::cerr << "按权重分配应为 25/75\n";
      return 1;
    }

    if (!rewards.DepositReward(7, kT0 + 2 * kHourMs, &error) ||
        rewards.PoolView().dust != 7 ||
        rewards.EntryView("a", kT0 + 2 * kHourMs)->pending_reward != 25 * usd) {
      std::cerr << "不足一个单位的增量应全部计入 dust\n";
      return 1;
    }

    std::uint64_t claimed = 0;
    if (!rewards.Claim("a", kT0 + 31 * kDayMs, &claimed, &error) || claimed != 25 * usd) {
      std::cerr << "领取金额应为 25，实际 " << claimed << "\n";
      return 1;
    }
    // 领取时 a 已满 30 天，升档为 Silver（1.25x）；b 未交互仍按 1.00x。
    a = rewards.EntryView("a", kT0 + 31 * kDayMs);
    if (a->entry.multiplier_bps != 12500 || a->tier != basket_engine::RewardTier::kSilver ||
        a->pending_reward != 0) {
      std::cerr << "交互时应惰性升档\n";
      return 1;
    }
    if (!rewards.DepositReward(85 * usd, kT0 + 31 * kDayMs, &error)) {
      std::cerr << "第二次注入失败: " << error << "\n";
      return 1;
    }
    a = rewards.EntryView("a", kT0 + 31 * kDayMs);
    b = rewards.EntryView("b", kT0 + 31 * kDayMs);
    if (a->pending_reward != 25 * usd || b->pending_reward != 135 * usd) {
      std::cerr << "升档后分配应为 25/135，实际 " << a->pending_reward << "/"
                << b->pending_reward << "\n";
      return 1;
    }

    basket_engine::UnstakeReceipt receipt;
    if (!rewards.Unstake("b", 3000 * usd, kT0 + 32 * kDayMs, &receipt, &error) ||
        receipt.reward_paid != 135 * usd || receipt.principal_returned != 3000 * usd) {
      std::cerr << "全额解押应同时结清奖励\n";
      return 1;
    }
    b = rewards.EntryView("b", kT0 + 32 * kDayMs);
    if (!b.has_value() || b->entry.principal != 0 || b->entry.stake_start_ms != 0 ||
        b->entry.weighted_stake != 0) {
      std::cerr << "全额解押后记录清零但保留\n";
      return 1;
    }
    if (rewards.Unstake("b", 1, kT0 + 32 * kDayMs, nullptr, &error)) {
      std::cerr << "超额解押应失败\n";
      return 1;
    }

    if (!rewards.Stake("a", 500 * usd, kT0 + 40 * kDayMs, &error)) {
      std::cerr << "追加质押失败: " << error << "\n";
      return 1;
    }
    a = rewards.EntryView("a", kT0 + 40 * kDayMs);
    if (a->entry.stake_start_ms != kT0 || a->stake_days != 40 ||
        a->tier != basket_engine::RewardTier::kSilver || a->days_to_next_tier != 50 ||
        a->entry.principal != 1500 * usd || a->pending_reward != 25 * usd) {
      std::cerr << "追加质押应保留起始时间与已结算奖励\n";
      return 1;
    }
    const auto pool = rewards.PoolView();
    if (pool.participants != 1 || pool.pool.total_claimed != 160 * usd ||
        pool.outstanding_rewards != 25 * usd || pool.dust != 7 ||
        !rewards.CheckInvariant(&error)) {
      std::cerr << "池统计或不变量不符合预期: " << error << "\n";
      return 1;
    }

    if (rewards.TierFor(29 * kDayMs) != basket_engine::RewardTier::kBase ||
        rewards.TierFor(30 * kDayMs) != basket_engine::RewardTier::kSilver ||
        rewards.TierFor(89 * kDayMs) != basket_engine::RewardTier::kSilver ||
        rewards.TierFor(90 * kDayMs) != basket_engine::RewardTier::kGold) {
      std::cerr << "档位边界应为 30/90 天\n";
      return 1;
    }
    if (notifier->Count("accumulator_overflow") != 0) {
      std::cerr << "正常路径不应产生溢出告警\n";
      return 1;
    }
  }

  {
    // 溢出：整笔操作失败、状态不变，并发 critical 告警。
    auto notifier = std::make_shared<RecordingNotifier>();
    basket_engine::RewardDistributor rewards(basket_engine::RewardsConfig{}, notifier);
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    std::string error;
    if (rewards.DepositReward(100, kT0, &error) ||
        error != "no weighted stake to distribute to") {
      std::cerr << "无人质押时注入应失败，实际: " << error << "\n";
      return 1;
    }
    if (!rewards.Stake("a", basket_engine::kAmountScale, kT0, &error)) {
      std::cerr << "质押失败: " << error << "\n";
      return 1;
    }
    if (rewards.Stake("b", max, kT0, &error) || !Contains(error, "accumulator overflow")) {
      std::cerr << "本金溢出应被拒绝\n";
      return 1;
    }
    if (rewards.EntryView("b", kT0).has_value() ||
        rewards.PoolView().pool.total_principal != basket_engine::kAmountScale) {
      std::cerr << "溢出失败后不得留下部分状态\n";
      return 1;
    }
    if (!rewards.DepositReward(max, kT0, &error)) {
      std::cerr << "最大单笔注入应成功: " << error << "\n";
      return 1;
    }
    const auto before = rewards.PoolView().pool;
    if (rewards.DepositReward(1, kT0 + 1, &error) ||
        error != "accumulator overflow: total_deposited") {
      std::cerr << "累计注入溢出应失败，实际: " << error << "\n";
      return 1;
    }
    const auto after = rewards.PoolView().pool;
    if (after.total_deposited != before.total_deposited ||
        after.acc_reward_per_weight != before.acc_reward_per_weight ||
        after.last_update_ms != before.last_update_ms) {
      std::cerr << "溢出失败后池状态不得改变\n";
      return 1;
    }
    const auto alert = notifier->Last("accumulator_overflow");
    if (notifier->Count("accumulator_overflow") != 2 || !alert.has_value() ||
        alert->severity != basket_engine::AlertSeverity::kCritical) {
      std::cerr << "每次溢出都应发送 critical 告警\n";
      return 1;
    }
  }

  {
    // 溢出告警在释放池锁后发送：回调内可以读取池状态。
    auto notifier = std::make_shared<PoolReadingNotifier>();
    basket_engine::RewardDistributor rewards(basket_engine::RewardsConfig{}, notifier);
    notifier->rewards = &rewards;
    std::string error;
    if (!rewards.Stake("a", basket_engine::kAmountScale, kT0, &error) ||
        rewards.Stake("b", std::numeric_limits<std::uint64_t>::max(), kT0, &error)) {
      std::cerr << "本金溢出应失败\n";
      return 1;
    }
    if (notifier->codes.size() != 1 || notifier->codes[0] != "accumulator_overflow" ||
        notifier->observed_principal != basket_engine::kAmountScale) {
      std::cerr << "溢出告警回调应能读取未变化的池状态\n";
      return 1;
    }
  }

  {
    // 奖励池写操作落 WAL：新实例回放后状态一致，已存入的引用不可重复存入。
    const auto dir = FreshTempDir("reward_wal");
    basket_engine::WalStore wal((dir / "wal.log").string());
    std::string error;
    if (!wal.Initialize(&error)) {
      std::cerr << "WAL 初始化失败: " << error << "\n";
      return 1;
    }
    const std::uint64_t usd = basket_engine::kAmountScale;
    basket_engine::StakePoolView expected;
    std::optional<basket_engine::StakeEntryView> expected_a;
    {
      basket_engine::RewardDistributor rewards(basket_engine::RewardsConfig{}, nullptr, &wal);
      std::uint64_t claimed = 0;
      basket_engine::UnstakeReceipt receipt;
      if (!rewards.Stake("a", 1000 * usd, kT0, &error) ||
          !rewards.Stake("b", 3000 * usd, kT0, &error) ||
          !rewards.DepositReward("job_1", 100 * usd, kT0 + kHourMs, &error) ||
          !rewards.Claim("a", kT0 + 2 * kHourMs, &claimed, &error) ||
          !rewards.Unstake("b", 1000 * usd, kT0 + 3 * kHourMs, &receipt, &error) ||
          rewards.Stake("bad\towner", usd, kT0, &error)) {
        std::cerr << "奖励池写操作结果不符合预期: " << error << "\n";
        return 1;
      }
      expected = rewards.PoolView();
      expected_a = rewards.EntryView("a", kT0 + 4 * kHourMs);
    }

    basket_engine::WalState state;
    if (!wal.LoadState(&state, &error) || state.reward_ops.size() != 5 ||
        state.reward_ops[2].type != basket_engine::RewardOp::kDeposit ||
        state.reward_ops[2].ref != "job_1") {
      std::cerr << "WAL 应记录 5 条奖励池操作: " << error << "\n";
      return 1;
    }
    basket_engine::RewardDistributor restored(basket_engine::RewardsConfig{}, nullptr, &wal);
    if (!restored.Restore(state.reward_ops, &error)) {
      std::cerr << "奖励池回放失败: " << error << "\n";
      return 1;
    }
    const auto pool = restored.PoolView().pool;
    const auto a = restored.EntryView("a", kT0 + 4 * kHourMs);
    if (pool.total_principal != expected.pool.total_principal ||
        pool.total_weighted_stake != expected.pool.total_weighted_stake ||
        pool.acc_reward_per_weight != expected.pool.acc_reward_per_weight ||
        pool.total_deposited != expected.pool.total_deposited ||
        pool.total_claimed != expected.pool.total_claimed || !a.has_value() ||
        !expected_a.has_value() || a->pending_reward != expected_a->pending_reward ||
        !restored.CheckInvariant(&error)) {
      std::cerr << "回放后池状态应与崩溃前一致\n";
      return 1;
    }
    if (!restored.HasDeposit("job_1") ||
        restored.DepositReward("job_1", 100 * usd, kT0 + 5 * kHourMs, &error) ||
        !Contains(error, "already recorded")) {
      std::cerr << "同一引用回放后不得再次存入\n";
      return 1;
    }
    if (!wal.LoadState(&state, &error) || state.reward_ops.size() != 5) {
      std::cerr << "回放与被拒绝的操作不得追加 WAL\n";
      return 1;
    }
  }

  {
    // 结算主路径：6 次迁移，每次迁移一条告警，到账金额注入奖励池。
    BridgeRig rig;
    const auto dir = FreshTempDir("bridge_happy");
    basket_engine::WalStore wal((dir / "wal.log").string());
    std::string error;
    basket_engine::IdempotencyGuard idempotency(900'000);
    basket_engine::BridgeController controller(MakeSettlementConfig(), rig.collaborators(),
                                               &wal, &idempotency, rig.notifier);
    basket_engine::BridgeJob job;
    if (!wal.Initialize(&error) ||
        !controller.CreateJob(150 * basket_engine::kAmountScale, kT0, &job, &error)) {
      std::cerr << "创建结算任务失败: " << error << "\n";
      return 1;
    }
    std::int64_t now = kT0;
    if (DriveToTerminal(&controller, job.id, &now) != basket_engine::BridgeState::kDeposited) {
      std::cerr << "结算任务应推进到 DEPOSITED\n";
      return 1;
    }
    const auto done = controller.GetJob(job.id);
    if (rig.notifier->Count("bridge_transition") != 6 || done->source_tx_ref != "lock_1" ||
        done->attestation != "0xattestation" || done->dest_tx_ref != "mint_1" ||
        done->deposit_tx_ref != "vault_deposit_" + job.id || done->message_hash.size() != 64) {
      std::cerr << "迁移告警或产物不符合预期\n";
      return 1;
    }
    if (rig.rewards.PoolView().pool.total_deposited != 150 * basket_engine::kAmountScale) {
      std::cerr << "到账金额应注入奖励池\n";
      return 1;
    }
    basket_engine::WalState state;
    if (!wal.LoadState(&state, &error) || state.job_history.size() != 7 ||
        state.latest_jobs.at(job.id).state != basket_engine::BridgeState::kDeposited) {
      std::cerr << "每次迁移都应写入 WAL 快照\n";
      return 1;
    }
    // 终态任务再推进是空操作。
    const auto noop = controller.Advance(job.id, now + 1000);
    if (noop.advanced || !noop.error.empty() || rig.notifier->Count("bridge_transition") != 6) {
      std::cerr << "终态任务不应再迁移\n";
      return 1;
    }
  }

  {
    // 后台推进：重复投递合并为一个任务，执行时读取当前时间而不是投递时间。
    BridgeRig rig;
    const auto dir = FreshTempDir("bridge_worker");
    basket_engine::WalStore wal((dir / "wal.log").string());
    std::string error;
    basket_engine::IdempotencyGuard idempotency(900'000);
    basket_engine::BridgeController controller(MakeSettlementConfig(), rig.collaborators(),
                                               &wal, &idempotency, rig.notifier);
    basket_engine::BridgeJob job;
    if (!wal.Initialize(&error) ||
        !controller.CreateJob(150 * basket_engine::kAmountScale, kT0, &job, &error)) {
      std::cerr << "创建结算任务失败: " << error << "\n";
      return 1;
    }
    auto clock_ms = std::make_shared<std::atomic<std::int64_t>>(kT0);
    basket_engine::BridgeWorker worker(&controller, [clock_ms]() { return clock_ms->load(); });
    if (!worker.SubmitAdvanceAll()) {
      std::cerr << "首次投递应入队\n";
      return 1;
    }
    for (int i = 0; i < 50; ++i) {
      if (worker.SubmitAdvanceAll()) {
        std::cerr << "未执行的 AdvanceAll 应合并\n";
        return 1;
      }
    }
    if (!worker.SubmitAdvance(job.id) || worker.SubmitAdvance(job.id) ||
        worker.pending_tasks() != 2) {
      std::cerr << "队列应只保留一个 AdvanceAll 和一个单任务推进，实际 "
                << worker.pending_tasks() << "\n";
      return 1;
    }

    clock_ms->store(kT0 + 7777);
    worker.Start();
    for (int waited = 0; worker.pending_tasks() > 0 && waited < 2000; waited += 10) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    worker.Stop();
    std::vector<basket_engine::BridgeStepResult> results;
    worker.PollResults(&results);
    const auto advanced = controller.GetJob(job.id);
    if (results.empty() || !advanced.has_value() ||
        advanced->state == basket_engine::BridgeState::kReady ||
        advanced->state_entered_ms != kT0 + 7777) {
      std::cerr << "后台推进应使用执行时刻的时间\n";
      return 1;
    }
  }

  {
    // 崩溃恢复：在任意一步之后换新控制器从 WAL 恢复，最终只锁定/铸造/注入一次。
    for (int crash_after = 1; crash_after <= 6; ++crash_after) {
      BridgeRig rig;
      const auto dir = FreshTempDir("bridge_resume_" + std::to_string(crash_after));
      basket_engine::WalStore wal((dir / "wal.log").string());
      std::string error;
      basket_engine::BridgeJob job;
      std::int64_t now = kT0;
      {
        basket_engine::IdempotencyGuard idempotency(900'000);
        basket_engine::BridgeController first(MakeSettlementConfig(), rig.collaborators(), &wal,
                                              &idempotency, rig.notifier);
        if (!wal.Initialize(&error) ||
            !first.CreateJob(150 * basket_engine::kAmountScale, now, &job, &error)) {
          std::cerr << "创建结算任务失败: " << error << "\n";
          return 1;
        }
        for (int step = 0; step < crash_after; ++step) {
          now += 1000;
          first.Advance(job.id, now);
        }
      }

      basket_engine::WalState state;
      if (!wal.LoadState(&state, &error)) {
        std::cerr << "WAL 回放失败: " << error << "\n";
        return 1;
      }
      basket_engine::IdempotencyGuard idempotency(900'000);
      basket_engine::BridgeController second(MakeSettlementConfig(), rig.collaborators(), &wal,
                                             &idempotency, rig.notifier);
      second.Restore(state);
      if (DriveToTerminal(&second, job.id, &now) != basket_engine::BridgeState::kDeposited) {
        std::cerr << "第 " << crash_after << " 步后恢复未能完成结算\n";
        return 1;
      }
      if (rig.source.lock_calls() != 1 || rig.destination.mint_calls() != 1 ||
          rig.rewards.PoolView().pool.total_deposited != 150 * basket_engine::kAmountScale) {
        std::cerr << "第 " << crash_after << " 步后恢复出现重复副作用\n";
        return 1;
      }
    }
  }

  {
    // 副作用已上链但未落盘：先查后做，直接采用已有锁定与铸造。
    BridgeRig rig;
    basket_engine::BridgeController controller(MakeSettlementConfig(), rig.collaborators(),
                                               nullptr, nullptr, rig.notifier);
    basket_engine::BridgeJob job;
    std::string error;
    if (!controller.CreateJob(150 * basket_engine::kAmountScale, kT0, &job, &error)) {
      std::cerr << "创建结算任务失败: " << error << "\n";
      return 1;
    }
    rig.source.PreseedLock(job.id, "lock_preexisting");
    std::string hash;
    if (!basket_engine::Sha256Hex("burn|lock_preexisting", &hash, &error)) {
      std::cerr << "摘要计算失败: " << error << "\n";
      return 1;
    }
    rig.destination.PreseedMint(hash, "mint_preexisting");
    std::int64_t now = kT0;
    if (DriveToTerminal(&controller, job.id, &now) != basket_engine::BridgeState::kDeposited) {
      std::cerr << "预置产物的任务应完成结算\n";
      return 1;
    }
    const auto done = controller.GetJob(job.id);
    if (rig.source.lock_calls() != 0 || rig.destination.mint_calls() != 0 ||
        done->source_tx_ref != "lock_preexisting" || done->dest_tx_ref != "mint_preexisting") {
      std::cerr << "已存在的锁定/铸造不应重复执行\n";
      return 1;
    }
  }

  {
    // 重试预算：指数退避 5s/10s，第 3 次失败转 FAILED 并告警；人工重开后继续。
    BridgeRig rig;
    basket_engine::IdempotencyGuard idempotency(900'000);
    basket_engine::BridgeController controller(MakeSettlementConfig(), rig.collaborators(),
                                               nullptr, &idempotency, rig.notifier);
    basket_engine::BridgeJob job;
    std::string error;
    if (!controller.CreateJob(150 * basket_engine::kAmountScale, kT0, &job, &error)) {
      std::cerr << "创建结算任务失败: " << error << "\n";
      return 1;
    }
    rig.source.FailLocks(true);
    auto step = controller.Advance(job.id, kT0);
    if (step.advanced || StateOf(controller, job.id) != basket_engine::BridgeState::kReady ||
        controller.GetJob(job.id)->retry_count != 1) {
      std::cerr << "首次失败应留在 READY 并计入重试\n";
      return 1;
    }
    step = controller.Advance(job.id, kT0 + 1000);
    if (!step.waiting || rig.source.lock_calls() != 1) {
      std::cerr << "退避期内不应重试\n";
      return 1;
    }
    controller.Advance(job.id, kT0 + 5000);
    if (controller.GetJob(job.id)->retry_count != 2 || rig.source.lock_calls() != 2) {
      std::cerr << "退避 5s 后应进行第 2 次尝试\n";
      return 1;
    }
    if (!controller.Advance(job.id, kT0 + 14'999).waiting) {
      std::cerr << "第 2 次失败后应退避 10s\n";
      return 1;
    }
    controller.Advance(job.id, kT0 + 15'000);
    const auto failed = controller.GetJob(job.id);
    if (failed->state != basket_engine::BridgeState::kFailed || failed->failed_step != "READY" ||
        failed->error != "state READY failed (attempt 3/3): source rpc timeout") {
      std::cerr << "重试耗尽应转 FAILED，实际 error=" << failed->error << "\n";
      return 1;
    }
    if (rig.notifier->Count("bridge_manual_intervention") != 1 || rig.source.lock_calls() != 3) {
      std::cerr << "FAILED 应发送人工介入告警\n";
      return 1;
    }

    rig.source.FailLocks(false);
    if (!controller.RetryJob(job.id, kT0 + 20'000, &error) ||
        StateOf(controller, job.id) != basket_engine::BridgeState::kReady ||
        controller.GetJob(job.id)->retry_count != 0) {
      std::cerr << "人工重开应回到 READY 并重置重试预算: " << error << "\n";
      return 1;
    }
    controller.Advance(job.id, kT0 + 21'000);
    if (StateOf(controller, job.id) != basket_engine::BridgeState::kSourceLocked) {
      std::cerr << "重开后应能继续推进\n";
      return 1;
    }
    if (controller.RetryJob(job.id, kT0 + 22'000, &error) ||
        error != "only FAILED jobs can be retried, state=SOURCE_LOCKED") {
      std::cerr << "只有 FAILED 任务可以重开，实际: " << error << "\n";
      return 1;
    }
    if (!controller.CancelJob(job.id, "operator", kT0 + 23'000, &error) ||
        StateOf(controller, job.id) != basket_engine::BridgeState::kCancelled) {
      std::cerr << "非终态任务应可取消: " << error << "\n";
      return 1;
    }
    if (controller.CancelJob(job.id, "operator", kT0 + 24'000, &error) ||
        error != "job already terminal: CANCELLED") {
      std::cerr << "终态任务不可再取消\n";
      return 1;
    }
    if (controller.Advance(job.id, kT0 + 25'000).advanced ||
        controller.ReadyAmountRaw() != 0) {
      std::cerr << "已取消任务不应再推进\n";
      return 1;
    }
  }

  {
    // attestation 超时：转 FAILED；人工重开后重新计时并完成。
    BridgeRig rig;
    basket_engine::SettlementConfig config = MakeSettlementConfig();
    config.attestation_timeout_ms = 10'000;
    basket_engine::BridgeController controller(config, rig.collaborators(), nullptr, nullptr,
                                               rig.notifier);
    basket_engine::BridgeJob job;
    std::string error;
    if (!controller.CreateJob(150 * basket_engine::kAmountScale, kT0, &job, &error)) {
      std::cerr << "创建结算任务失败: " << error << "\n";
      return 1;
    }
    rig.attestation.SetComplete(false);
    std::int64_t now = kT0;
    if (DriveToTerminal(&controller, job.id, &now) != basket_engine::BridgeState::kFailed) {
      std::cerr << "attestation 长时间未完成应转 FAILED\n";
      return 1;
    }
    const auto failed = controller.GetJob(job.id);
    if (failed->failed_step != "ATTESTATION_PENDING" ||
        !Contains(failed->error, "attestation timeout") || rig.attestation.polls() < 5) {
      std::cerr << "超时原因应记录在 ATTESTATION_PENDING\n";
      return 1;
    }

    rig.attestation.SetComplete(true);
    if (!controller.RetryJob(job.id, now, &error) ||
        StateOf(controller, job.id) != basket_engine::BridgeState::kAttestationPending ||
        controller.GetJob(job.id)->attestation_requested_ms != now) {
      std::cerr << "重开应回到 ATTESTATION_PENDING 并重新计时\n";
      return 1;
    }
    if (DriveToTerminal(&controller, job.id, &now) != basket_engine::BridgeState::kDeposited ||
        rig.source.lock_calls() != 1 || rig.destination.mint_calls() != 1) {
      std::cerr << "重开后应完成结算且不重复锁定\n";
      return 1;
    }
  }

  {
    // 源链确认超时同样为致命错误。
    BridgeRig rig;
    basket_engine::SettlementConfig config = MakeSettlementConfig();
    config.confirm_timeout_ms = 5000;
    basket_engine::BridgeController controller(config, rig.collaborators(), nullptr, nullptr,
                                               rig.notifier);
    basket_engine::BridgeJob job;
    std::string error;
    if (!controller.CreateJob(150 * basket_engine::kAmountScale, kT0, &job, &error)) {
      std::cerr << "创建结算任务失败: " << error << "\n";
      return 1;
    }
    rig.source.SetConfirmed(false);
    std::int64_t now = kT0;
    if (DriveToTerminal(&controller, job.id, &now) != basket_engine::BridgeState::kFailed ||
        controller.GetJob(job.id)->failed_step != "SOURCE_LOCKED") {
      std::cerr << "源链确认超时应转 FAILED\n";
      return 1;
    }
  }

  {
    // dry-run：不触碰任何链上网关，产物以 dry_run_ 前缀标记。
    basket_engine::SettlementConfig config = MakeSettlementConfig();
    config.dry_run = true;
    basket_engine::BridgeController controller(config, basket_engine::BridgeCollaborators{},
                                               nullptr, nullptr, nullptr);
    basket_engine::BridgeJob job;
    std::string error;
    if (!controller.CreateJob(150 * basket_engine::kAmountScale, kT0, &job, &error)) {
      std::cerr << "创建结算任务失败: " << error << "\n";
      return 1;
    }
    std::int64_t now = kT0;
    if (DriveToTerminal(&controller, job.id, &now) != basket_engine::BridgeState::kDeposited) {
      std::cerr << "dry-run 任务应推进到 DEPOSITED\n";
      return 1;
    }
    const auto done = controller.GetJob(job.id);
    if (done->source_tx_ref != "dry_run_lock_" + job.id ||
        done->deposit_tx_ref != "dry_run_deposit_" + job.id) {
      std::cerr << "dry-run 产物应带 dry_run_ 前缀\n";
      return 1;
    }
    if (controller.CreateJob(basket_engine::kAmountScale / 2, kT0, &job, &error)) {
      std::cerr << "低于单笔下限的任务不应创建\n";
      return 1;
    }
  }

  {
    basket_engine::SettlementConfig config;
    basket_engine::BridgeTriggerPolicy policy(config);
    basket_engine::BridgeTriggerInput input{
        .accrued_fees_usd = 50.0,
        .reserved_usd = 0.0,
        .source_congestion = 5.0,
        .window_remaining_usd = 20'000.0,
        .now_ms = kT0 + kHourMs,
        .last_job_ms = kT0,
    };
    auto decision = policy.Evaluate(input);
    if (decision.create || decision.reason != "available 50.00 below threshold 100.00") {
      std::cerr << "低于阈值不应触发: " << decision.reason << "\n";
      return 1;
    }
    input.accrued_fees_usd = 150.0;
    input.reserved_usd = 60.0;
    if (policy.Evaluate(input).create) {
      std::cerr << "已预留金额应从可转出额中扣除\n";
      return 1;
    }
    input.reserved_usd = 0.0;
    decision = policy.Evaluate(input);
    if (!decision.create || !NearlyEqual(decision.amount_usd, 150.0) ||
        decision.reason != "threshold") {
      std::cerr << "达到阈值应触发全额结算\n";
      return 1;
    }
    input.accrued_fees_usd = 9000.0;
    if (!NearlyEqual(policy.Evaluate(input).amount_usd, 5000.0)) {
      std::cerr << "金额应受单笔上限约束\n";
      return 1;
    }
    input.window_remaining_usd = 30.0;
    if (!NearlyEqual(policy.Evaluate(input).amount_usd, 30.0)) {
      std::cerr << "金额应受窗口剩余额度约束\n";
      return 1;
    }
    input.window_remaining_usd = 20'000.0;
    input.source_congestion = 80.0;
    decision = policy.Evaluate(input);
    if (decision.create || decision.reason != "source congestion 80.00 exceeds ceiling 50.00") {
      std::cerr << "源链拥堵时不应触发\n";
      return 1;
    }
    input.source_congestion = 5.0;
    input.accrued_fees_usd = 20.0;
    input.now_ms = kT0 + 7 * kDayMs;
    decision = policy.Evaluate(input);
    if (!decision.create || decision.reason != "weekly fallback" ||
        !NearlyEqual(decision.amount_usd, 20.0)) {
      std::cerr << "超过一周未结算应兜底触发\n";
      return 1;
    }
    input.accrued_fees_usd = 0.5;
    decision = policy.Evaluate(input);
    if (decision.create || decision.reason != "amount 0.50 below minimum job 1.00") {
      std::cerr << "兜底金额低于单笔下限不应建单: " << decision.reason << "\n";
      return 1;
    }
    config.enabled = false;
    if (basket_engine::BridgeTriggerPolicy(config).Evaluate(input).reason !=
        "settlement disabled") {
      std::cerr << "关闭结算时不应触发\n";
      return 1;
    }
  }

  {
    // 反思：决策 24h 后按决策前权重衡量市场方向，给每个分析师打分。
    const auto dir = FreshTempDir("reflection");
    basket_engine::WalStore wal((dir / "wal.log").string());
    std::string error;
    if (!wal.Initialize(&error)) {
      std::cerr << "WAL 初始化失败: " << error << "\n";
      return 1;
    }
    FixedMarket market(MakeSnapshot());
    market.SetHistory(
        [](std::int64_t ts_ms) { return ts_ms >= kT0 + kDayMs ? 1'020'000.0 : 1'000'000.0; },
        [](const std::string& token, std::int64_t ts_ms) {
          if (token == "WETH") {
            return ts_ms >= kT0 + kDayMs ? 110.0 : 100.0;
          }
          return 1.0;
        });

    basket_engine::Decision decision;
    decision.id = "dec-reflect";
    decision.created_at_ms = kT0;
    decision.prior_weights = {{"USDC", 0.5}, {"WETH", 0.5}};
    decision.reports = {
        MakeReport(basket_engine::ProducerKind::kTechnical,
                   basket_engine::SignalDirection::kBullish, 0.8),
        MakeReport(basket_engine::ProducerKind::kSentiment,
                   basket_engine::SignalDirection::kBearish, 0.8),
        MakeReport(basket_engine::ProducerKind::kLiquidity,
                   basket_engine::SignalDirection::kNeutral, 0.5),
        MakeReport(basket_engine::ProducerKind::kMacro,
                   basket_engine::SignalDirection::kBullish, 0.9),
    };
    decision.reports[3].error = "timeout after 8000ms";

    basket_engine::ReflectionConfig config;
    basket_engine::ReflectionEngine engine(config, &market, &wal);
    if (engine.RunDue({decision}, kT0 + 23 * kHourMs) != 0 || engine.IsReflected(decision.id)) {
      std::cerr << "未满 24h 不应反思\n";
      return 1;
    }
    if (engine.RunDue({decision}, kT0 + kDayMs) != 1 || !engine.IsReflected(decision.id)) {
      std::cerr << "满 24h 应产出一条提示\n";
      return 1;
    }
    const auto hints = engine.RecentHints(10);
    if (hints.size() != 1) {
      std::cerr << "提示条数应为 1\n";
      return 1;
    }
    const auto& hint = hints[0];
    if (hint.accuracy.size() != 3 || hint.accuracy.count(basket_engine::ProducerKind::kMacro) != 0 ||
        !NearlyEqual(hint.accuracy.at(basket_engine::ProducerKind::kTechnical), 0.9) ||
        !NearlyEqual(hint.accuracy.at(basket_engine::ProducerKind::kSentiment), 0.1) ||
        !NearlyEqual(hint.accuracy.at(basket_engine::ProducerKind::kLiquidity), 0.0) ||
        hint.best_producer != "technical" || hint.worst_producer != "liquidity" ||
        !NearlyEqual(hint.realized_nav_change, 0.02)) {
      std::cerr << "分析师打分不符合预期: " << hint.note << "\n";
      return 1;
    }
    if (engine.RunDue({decision}, kT0 + 2 * kDayMs) != 0) {
      std::cerr << "同一决策只反思一次\n";
      return 1;
    }

    basket_engine::WalState state;
    if (!wal.LoadState(&state, &error) || state.hints.size() != 1 ||
        state.reflected_ids.count(decision.id) != 1) {
      std::cerr << "提示与反思标记应写入 WAL\n";
      return 1;
    }
    basket_engine::ReflectionEngine restored(config, &market, &wal);
    restored.Restore(state);
    if (!restored.IsReflected(decision.id) || restored.RunDue({decision}, kT0 + 3 * kDayMs) != 0 ||
        restored.RecentHints(10).size() != 1) {
      std::cerr << "重启后不应重复反思\n";
      return 1;
    }

    // 区间内波动：方向性判断不奖不罚。
    const auto bullish = MakeReport(basket_engine::ProducerKind::kTechnical,
                                    basket_engine::SignalDirection::kBullish, 0.8);
    if (!NearlyEqual(basket_engine::ReflectionEngine::ScoreReport(bullish, 0.005, 0.01), 0.5) ||
        !NearlyEqual(basket_engine::ReflectionEngine::ScoreReport(bullish, -0.05, 0.01), 0.1)) {
      std::cerr << "区间内外打分规则不符合预期\n";
      return 1;
    }
  }

  {
    auto transport = std::make_shared<ScriptedTransport>();
    basket_engine::HttpAttestationService service(transport, "https://attest.example/", 2000);
    basket_engine::AttestationPoll poll;
    std::string error;

    transport->Push(Response(404, ""));
    if (!service.Poll("deadbeef", &poll, &error) || poll.complete) {
      std::cerr << "404 应视为尚未收录\n";
      return 1;
    }
    const auto requests = transport->requests();
    if (requests.size() != 1 || requests[0].method != "GET" ||
        requests[0].url != "https://attest.example/attestations/0xdeadbeef") {
      std::cerr << "attestation 请求地址不符合预期: "
                << (requests.empty() ? "" : requests[0].url) << "\n";
      return 1;
    }

    transport->Push(Response(200, "{\"status\":\"pending_confirmations\"}"));
    if (!service.Poll("deadbeef", &poll, &error) || poll.complete) {
      std::cerr << "非 complete 状态应视为 pending\n";
      return 1;
    }
    transport->Push(Response(200, "{\"status\":\"complete\",\"attestation\":\"0xabc\"}"));
    if (!service.Poll("0xdeadbeef", &poll, &error) || !poll.complete ||
        poll.attestation != "0xabc") {
      std::cerr << "complete 状态应返回证明数据\n";
      return 1;
    }
    if (transport->requests().back().url != "https://attest.example/attestations/0xdeadbeef") {
      std::cerr << "已带 0x 前缀的哈希不应重复加前缀\n";
      return 1;
    }
    transport->Push(Response(200, "{\"status\":\"complete\",\"attestation\":\"PENDING\"}"));
    if (service.Poll("deadbeef", &poll, &error)) {
      std::cerr << "complete 但证明为占位值应报错\n";
      return 1;
    }
    transport->Push(Response(503, "unavailable"));
    if (service.Poll("deadbeef", &poll, &error) || !Contains(error, "503")) {
      std::cerr << "非 200 状态码应报错\n";
      return 1;
    }
    basket_engine::HttpResponse transport_error;
    transport_error.error = "connection refused";
    transport->Push(transport_error);
    if (service.Poll("deadbeef", &poll, &error) || !Contains(error, "connection refused")) {
      std::cerr << "传输层错误应透传\n";
      return 1;
    }
  }

  {
    // webhook：后台线程 POST，带 HMAC 签名；Stop 前排空队列。
    auto transport = std::make_shared<ScriptedTransport>();
    basket_engine::WebhookNotificationSink sink(transport, "https://hooks.example/alerts",
                                                "webhook-secret");
    sink.Notify(basket_engine::MakeAlert(basket_engine::AlertSeverity::kCritical, "loss_halt",
                                         "nav drawdown", kT0));
    sink.Notify(basket_engine::MakeAlert(basket_engine::AlertSeverity::kInfo,
                                         "bridge_transition", "job=1", kT0 + 1));
    sink.Stop();
    const auto requests = transport->requests();
    if (requests.size() != 2 || requests[0].method != "POST" ||
        requests[0].url != "https://hooks.example/alerts" ||
        !Contains(requests[0].body, "\"code\":\"loss_halt\"") ||
        !Contains(requests[0].body, "\"severity\":\"critical\"")) {
      std::cerr << "webhook 请求内容不符合预期\n";
      return 1;
    }
    std::string expected_signature;
    std::string error;
    if (!basket_engine::HmacSha256Hex("webhook-secret", requests[0].body, &expected_signature,
                                      &error)) {
      std::cerr << "HMAC 计算失败: " << error << "\n";
      return 1;
    }
    bool signed_ok = false;
    for (const auto& [name, value] : requests[0].headers) {
      if (name == "X-Signature" && value == expected_signature) {
        signed_ok = true;
      }
    }
    if (!signed_ok) {
      std::cerr << "webhook 请求应携带正确的 X-Signature\n";
      return 1;
    }
  }

  {
    // 应用层（mock 模拟链）：决策周期 -> 手续费结算 -> 奖励注入 -> 反思 -> 重启恢复。
    const auto dir = FreshTempDir("engine_app");
    const basket_engine::AppConfig config = MakeTestConfig(dir);
    auto clock_ms = std::make_shared<std::atomic<std::int64_t>>(kT0);
    auto clock = [clock_ms]() { return clock_ms->load(); };
    auto notifier = std::make_shared<RecordingNotifier>();

    std::string decision_id;
    std::string job_id;
    {
      basket_engine::EngineGateways gateways;
      gateways.notifier = notifier;
      basket_engine::EngineApp app(config, clock, gateways);
      std::string error;
      if (!app.Initialize(&error)) {
        std::cerr << "引擎初始化失败: " << error << "\n";
        return 1;
      }
      if (app.simulated_market() == nullptr || app.simulated_contract() == nullptr) {
        std::cerr << "mock 模式应自建模拟网关\n";
        return 1;
      }
      if (!app.rewards()->Stake("alice", 1000 * basket_engine::kAmountScale, clock(), &error)) {
        std::cerr << "质押失败: " << error << "\n";
        return 1;
      }
      basket_engine::Decision decision;
      if (!app.RunCycle(basket_engine::TriggerReason::kScheduled, &decision, &error) ||
          decision.id.empty()) {
        std::cerr << "决策周期执行失败: " << error << "\n";
        return 1;
      }
      decision_id = decision.id;
      const std::size_t expected_submissions =
          decision.status == basket_engine::ExecutionStatus::kSubmitted ? 1 : 0;
      if (app.simulated_contract()->submission_count() != expected_submissions) {
        std::cerr << "模拟合约提交次数应与决策执行状态一致\n";
        return 1;
      }

      // 源链拥堵时即使手续费达标也不建单。
      clock_ms->store(kT0 + 10 * kHourMs);
      app.simulated_source()->SetCongestion(80.0);
      if (app.MaybeCreateBridgeJob(clock()) || !app.bridge().Jobs().empty()) {
        std::cerr << "源链拥堵时不应建结算任务\n";
        return 1;
      }
      app.simulated_source()->SetCongestion(0.0);
      if (!app.MaybeCreateBridgeJob(clock())) {
        std::cerr << "累计手续费达到阈值应建结算任务\n";
        return 1;
      }
      const auto jobs = app.bridge().Jobs();
      if (jobs.size() != 1 || jobs[0].amount_raw != 125 * basket_engine::kAmountScale) {
        std::cerr << "结算金额应为 10h 累计手续费 125\n";
        return 1;
      }
      job_id = jobs[0].id;
      if (app.MaybeCreateBridgeJob(clock())) {
        std::cerr << "已预留金额不应重复建单\n";
        return 1;
      }

      for (int i = 0; i < 50; ++i) {
        if (basket_engine::IsTerminal(app.bridge().GetJob(job_id)->state)) {
          break;
        }
        clock_ms->fetch_add(20 * 1000);
        app.AdvanceBridgeNow();
      }
      if (app.bridge().GetJob(job_id)->state != basket_engine::BridgeState::kDeposited ||
          app.simulated_source()->lock_count() != 1 ||
          app.rewards()->PoolView().pool.total_deposited != 125 * basket_engine::kAmountScale) {
        std::cerr << "模拟链结算应完成并注入奖励池\n";
        return 1;
      }

      if (!Contains(app.query().PoolJson(), "\"total_deposited\":125000000") ||
          !Contains(app.query().BridgeJobsJson(true), "DEPOSITED") ||
          !Contains(app.query().LatestDecisionsJson(5), decision_id) ||
          !Contains(app.query().StakeEntryJson("alice", clock()), "\"owner\":\"alice\"") ||
          app.query().StakeEntryJson("nobody", clock()) != "null") {
        std::cerr << "查询接口输出不符合预期\n";
        return 1;
      }

      clock_ms->store(kT0 + 25 * kHourMs);
      app.Tick();
      if (!app.reflection().IsReflected(decision_id)) {
        std::cerr << "决策满 24h 后 tick 应完成反思\n";
        return 1;
      }
      app.Shutdown();
    }

    {
      basket_engine::EngineGateways gateways;
      gateways.notifier = notifier;
      basket_engine::EngineApp restarted(config, clock, gateways);
      std::string error;
      if (!restarted.Initialize(&error)) {
        std::cerr << "重启初始化失败: " << error << "\n";
        return 1;
      }
      const auto job = restarted.bridge().GetJob(job_id);
      if (restarted.orchestrator().History().size() != 1 || !job.has_value() ||
          job->state != basket_engine::BridgeState::kDeposited ||
          !restarted.reflection().IsReflected(decision_id)) {
        std::cerr << "重启后应恢复决策历史、结算任务与反思记录\n";
        return 1;
      }
      const auto pool = restarted.rewards()->PoolView();
      const auto alice = restarted.rewards()->EntryView("alice", clock());
      if (pool.pool.total_deposited != 125 * basket_engine::kAmountScale ||
          pool.pool.total_principal != 1000 * basket_engine::kAmountScale ||
          !alice.has_value() || alice->pending_reward == 0 ||
          !restarted.rewards()->HasDeposit(job_id) ||
          !Contains(restarted.query().PoolJson(), "\"total_deposited\":125000000")) {
        std::cerr << "重启后应从 WAL 恢复质押池与已存入奖励\n";
        return 1;
      }
      restarted.Shutdown();
    }
  }

  {
    // 模拟行情整体下跌：下一周期观测到回撤即熔断并跳过，重启后仍保持熔断。
    const auto dir = FreshTempDir("engine_shock");
    const basket_engine::AppConfig config = MakeTestConfig(dir);
    auto clock_ms = std::make_shared<std::atomic<std::int64_t>>(kT0);
    auto clock = [clock_ms]() { return clock_ms->load(); };
    auto notifier = std::make_shared<RecordingNotifier>();
    {
      basket_engine::EngineGateways gateways;
      gateways.notifier = notifier;
      basket_engine::EngineApp app(config, clock, gateways);
      std::string error;
      basket_engine::Decision decision;
      if (!app.Initialize(&error) ||
          !app.RunCycle(basket_engine::TriggerReason::kScheduled, &decision, &error)) {
        std::cerr << "首个周期执行失败: " << error << "\n";
        return 1;
      }
      clock_ms->store(kT0 + 60 * 1000);
      app.simulated_market()->ApplyShock(0.5);
      if (!app.RunCycle(basket_engine::TriggerReason::kLossEvent, &decision, &error) ||
          decision.status != basket_engine::ExecutionStatus::kSkipped ||
          !HasEntry(decision.tags, "safety_blocked") || notifier->Count("loss_halt") != 1) {
        std::cerr << "价格冲击后应触发亏损熔断\n";
        return 1;
      }
      app.Shutdown();
    }
    {
      basket_engine::EngineGateways gateways;
      gateways.notifier = notifier;
      basket_engine::EngineApp restarted(config, clock, gateways);
      std::string error;
      std::string reason;
      if (!restarted.Initialize(&error) || !restarted.safety().CycleBlocked(&reason) ||
          !Contains(reason, "loss halt")) {
        std::cerr << "熔断状态应跨重启保持\n";
        return 1;
      }
      if (!restarted.ClearHalt(&error) || restarted.safety().CycleBlocked(&reason)) {
        std::cerr << "人工解除后应恢复: " << error << "\n";
        return 1;
      }
      restarted.Shutdown();
    }
  }

  {
    // live 模式必须注入链上网关。
    const auto dir = FreshTempDir("engine_live");
    basket_engine::AppConfig config = MakeTestConfig(dir);
    config.system.mode = "live";
    basket_engine::EngineGateways gateways;
    gateways.notifier = std::make_shared<RecordingNotifier>();
    basket_engine::EngineApp app(config, [] { return kT0; }, gateways);
    std::string error;
    if (app.Initialize(&error) || !Contains(error, "模式缺少链上网关")) {
      std::cerr << "live 模式缺少网关应初始化失败，实际: " << error << "\n";
      return 1;
    }
  }

  {
    // live 模式的奖励池由外部质押程序承担，不退回进程内账本。
    const auto dir = FreshTempDir("engine_live_vault");
    basket_engine::AppConfig config = MakeTestConfig(dir);
    config.system.mode = "live";
    FixedMarket market(MakeSnapshot());
    RecordingContract contract;
    BridgeRig rig;
    basket_engine::EngineGateways gateways;
    gateways.notifier = rig.notifier;
    gateways.market = &market;
    gateways.contract = &contract;
    gateways.source = &rig.source;
    gateways.attestation = &rig.attestation;
    gateways.destination = &rig.destination;
    std::string error;
    {
      basket_engine::EngineApp app(config, [] { return kT0; }, gateways);
      if (app.Initialize(&error) || !Contains(error, "质押程序")) {
        std::cerr << "live 模式缺少质押程序应初始化失败，实际: " << error << "\n";
        return 1;
      }
    }
    gateways.vault = &rig.vault;
    basket_engine::EngineApp app(config, [] { return kT0; }, gateways);
    if (!app.Initialize(&error) || app.rewards() != nullptr ||
        app.query().PoolJson() != "{}" ||
        app.query().StakeEntryJson("alice", kT0) != "null") {
      std::cerr << "注入质押程序后应初始化成功且不建进程内奖励池: " << error << "\n";
      return 1;
    }
    app.Shutdown();
  }

  {
    // http 模型后端要求密钥环境变量非空。
    const auto dir = FreshTempDir("engine_http_llm");
    basket_engine::AppConfig config = MakeTestConfig(dir);
    config.llm.provider = "http";
    config.llm.api_key_env = "BASKET_ENGINE_TEST_LLM_KEY";
    ScopedEnvVar key("BASKET_ENGINE_TEST_LLM_KEY", "");
    basket_engine::EngineGateways gateways;
    gateways.notifier = std::make_shared<RecordingNotifier>();
    basket_engine::EngineApp app(config, [] { return kT0; }, gateways);
    std::string error;
    if (app.Initialize(&error) || !Contains(error, "BASKET_ENGINE_TEST_LLM_KEY")) {
      std::cerr << "密钥为空时应初始化失败，实际: " << error << "\n";
      return 1;
    }
  }

  {
    // OpenAI 兼容补全：Bearer 鉴权、JSON 请求体、choices[0].message.content。
    auto transport = std::make_shared<ScriptedTransport>();
    basket_engine::LlmConfig llm;
    llm.endpoint = "https://llm.example/v1/chat/completions";
    llm.model = "test-model";
    basket_engine::HttpCompletionService service(transport, llm, "sk-test");
    basket_engine::AgentRequest request;
    request.role = basket_engine::AgentRole::kSoftRiskJudge;
    request.instructions = basket_engine::RoleInstructions(request.role);
    request.payload_json = "{\"nav_usd\":1000}";
    basket_engine::CancelToken cancel;
    std::string text;
    std::string error;

    transport->Push(Response(
        200, "{\"choices\":[{\"message\":{\"role\":\"assistant\",\"content\":\"{\\\"veto\\\":false}\"}}]}"));
    if (!service.Complete(request, cancel, &text, &error) || text != "{\"veto\":false}") {
      std::cerr << "补全内容提取失败: " << error << " text=" << text << "\n";
      return 1;
    }
    const auto requests = transport->requests();
    if (requests.size() != 1 || requests[0].method != "POST" ||
        requests[0].url != llm.endpoint || !Contains(requests[0].body, "\"model\":\"test-model\"") ||
        !Contains(requests[0].body, "json_object")) {
      std::cerr << "补全请求内容不符合预期\n";
      return 1;
    }
    bool bearer = false;
    for (const auto& [name, value] : requests[0].headers) {
      if (name == "Authorization" && value == "Bearer sk-test") {
        bearer = true;
      }
    }
    if (!bearer) {
      std::cerr << "补全请求应携带 Bearer 密钥\n";
      return 1;
    }

    transport->Push(Response(429, "rate limited"));
    if (service.Complete(request, cancel, &text, &error) || !Contains(error, "429")) {
      std::cerr << "非 200 状态应报错，实际: " << error << "\n";
      return 1;
    }
    transport->Push(Response(200, "<html>"));
    if (service.Complete(request, cancel, &text, &error) || !Contains(error, "非 JSON")) {
      std::cerr << "非 JSON 响应应报错，实际: " << error << "\n";
      return 1;
    }
    transport->Push(Response(200, "{\"choices\":[]}"));
    if (service.Complete(request, cancel, &text, &error) || !Contains(error, "content")) {
      std::cerr << "缺少 content 应报错，实际: " << error << "\n";
      return 1;
    }
    cancel.Cancel();
    const std::size_t sent = transport->requests().size();
    if (service.Complete(request, cancel, &text, &error) || error != "cancelled" ||
        transport->requests().size() != sent) {
      std::cerr << "已取消的请求不应发出\n";
      return 1;
    }
  }

  {
    // 模型软判断只能收紧：否决与收缩生效，放宽被忽略，失败沿用规则。
    basket_engine::RiskLimits limits;
    limits.soft_judge_timeout_ms = 2000;
    auto completion = std::make_shared<ScriptedCompletion>();
    basket_engine::ModelSoftRiskJudge judge(limits, completion);
    basket_engine::SoftRiskInput input;
    input.proposed = kModestRebalance;
    input.snapshot = MakeSnapshot();
    input.reports = UniformReports(basket_engine::SignalDirection::kBullish, 0.7);

    completion->Reply(basket_engine::AgentRole::kSoftRiskJudge,
                      "{\"veto\":true,\"reason\":\"thin weekend liquidity\","
                      "\"max_change_fraction\":1.0}");
    auto result = judge.Judge(input);
    if (!result.veto || !Contains(result.reason, "thin weekend liquidity")) {
      std::cerr << "模型否决应生效\n";
      return 1;
    }

    completion->Reply(basket_engine::AgentRole::kSoftRiskJudge,
                      "{\"veto\":false,\"reason\":\"halve it\",\"max_change_fraction\":0.5}");
    result = judge.Judge(input);
    if (result.veto || !NearlyEqual(result.max_change_fraction, 0.5, 1e-12)) {
      std::cerr << "模型收缩比例应生效\n";
      return 1;
    }

    completion->Reply(basket_engine::AgentRole::kSoftRiskJudge,
                      "{\"veto\":false,\"reason\":\"fine\",\"max_change_fraction\":1.5}");
    result = judge.Judge(input);
    if (result.veto || !NearlyEqual(result.max_change_fraction, 1.0, 1e-12) ||
        !Contains(result.reason, "rejected")) {
      std::cerr << "越界的收缩比例应被拒绝并沿用规则\n";
      return 1;
    }

    completion->Set(basket_engine::AgentRole::kSoftRiskJudge,
                    [](const basket_engine::AgentRequest&, const basket_engine::CancelToken&,
                       std::string*, std::string* out_error) {
                      *out_error = "upstream 500";
                      return false;
                    });
    result = judge.Judge(input);
    if (result.veto || !Contains(result.reason, "unavailable")) {
      std::cerr << "模型失败时应沿用规则软判断\n";
      return 1;
    }

    // 规则否决时不再询问模型。
    const int calls = completion->calls(basket_engine::AgentRole::kSoftRiskJudge);
    input.rebalances_24h = limits.max_rebalances_24h;
    result = judge.Judge(input);
    if (!result.veto ||
        completion->calls(basket_engine::AgentRole::kSoftRiskJudge) != calls) {
      std::cerr << "频率规则否决后不应咨询模型\n";
      return 1;
    }
  }

  {
    // 模型决策者：只选动作，权重取候选；输出非法时退回规则基线。
    basket_engine::DecisionConfig config;
    config.judge_timeout_ms = 2000;
    auto completion = std::make_shared<ScriptedCompletion>();
    basket_engine::ModelDecisionMaker maker(config, completion);
    basket_engine::DecisionInput input;
    input.snapshot = MakeSnapshot();
    input.reports = UniformReports(basket_engine::SignalDirection::kBullish, 0.7);
    input.for_change = MakeThesis(basket_engine::DebatePosition::kAdvocateForChange,
                                  basket_engine::DecisionAction::kRebalance, kModestRebalance,
                                  0.8);
    input.for_hold = MakeThesis(basket_engine::DebatePosition::kAdvocateForHold,
                                basket_engine::DecisionAction::kHold,
                                input.snapshot.weights(), 0.6);
    input.verdict.approved = true;

    completion->Reply(basket_engine::AgentRole::kDecisionJudge,
                      "{\"action\":\"REBALANCE\",\"confidence\":0.75,\"rationale\":\"momentum\"}");
    auto proposal = maker.Decide(input);
    if (proposal.action != basket_engine::DecisionAction::kRebalance ||
        !SameWeights(proposal.weights, kModestRebalance) ||
        !NearlyEqual(proposal.confidence, 0.75, 1e-12) || !HasEntry(proposal.tags, "model_judge")) {
      std::cerr << "模型 REBALANCE 应采用候选权重\n";
      return 1;
    }

    completion->Reply(basket_engine::AgentRole::kDecisionJudge,
                      "{\"action\":\"SELL_EVERYTHING\",\"confidence\":0.9}");
    proposal = maker.Decide(input);
    if (!HasEntry(proposal.tags, "model_judge_fallback") ||
        proposal.action != basket_engine::DecisionAction::kRebalance) {
      std::cerr << "非法动作应退回规则基线\n";
      return 1;
    }

    // 否决时不咨询模型。
    const int calls = completion->calls(basket_engine::AgentRole::kDecisionJudge);
    input.verdict.approved = false;
    input.verdict.violations = {"turnover 0.60 exceeds 0.25 limit"};
    proposal = maker.Decide(input);
    if (proposal.action != basket_engine::DecisionAction::kHold ||
        completion->calls(basket_engine::AgentRole::kDecisionJudge) != calls) {
      std::cerr << "风控否决时模型决策者应直接 HOLD\n";
      return 1;
    }
  }

  return 0;
}
