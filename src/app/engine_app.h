#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "agents/completion_service.h"
#include "chain/chain_gateways.h"
#include "chain/simulated_chain.h"
#include "core/config.h"
#include "core/http_transport.h"
#include "core/types.h"
#include "notify/notification_sink.h"
#include "query/query_service.h"
#include "reflection/reflection_engine.h"
#include "rewards/reward_distributor.h"
#include "rewards/reward_vault.h"
#include "safety/safety_system.h"
#include "settlement/bridge_controller.h"
#include "settlement/bridge_worker.h"
#include "settlement/trigger_policy.h"
#include "storage/wal_store.h"
#include "system/orchestrator.h"

namespace basket_engine {

/**
 * @brief 外部链上网关（不拥有所有权）
 *
 * mock 模式下全部留空时由 EngineApp 自建模拟网关；
 * live 模式必须注入 market/contract/source/destination 与质押程序 vault，
 * attestation 留空时使用 HttpAttestationService。
 * vault 留空时使用进程内奖励分配器（写操作记入 WAL，重启重放），仅限 mock 模式。
 */
struct EngineGateways {
  MarketStateReader* market{nullptr};
  BasketContract* contract{nullptr};
  SourceChain* source{nullptr};
  AttestationService* attestation{nullptr};
  DestinationChain* destination{nullptr};
  RewardVault* vault{nullptr};
  /// 为空时使用 CurlHttpTransport。
  std::shared_ptr<const HttpTransport> transport;
  /// 为空时按 notify 配置构建。
  std::shared_ptr<NotificationSink> notifier;
  /// 为空时按 llm 配置构建。
  std::shared_ptr<const CompletionService> completion;
};

/// 主循环参数。
struct LoopOptions {
  /// 有界模式下连续执行的周期数；run_forever=true 时忽略。
  int max_cycles{1};
  bool run_forever{false};
  /// 首个周期的触发原因（外部事件触发立即执行）。
  TriggerReason first_trigger{TriggerReason::kScheduled};
};

/**
 * @brief 引擎应用层：组装全部组件并驱动主循环
 *
 * 执行顺序：Initialize -> (运维命令 | RunLoop) -> Shutdown。
 * 每个 tick：消费结算推进结果 -> 评估手续费结算触发 -> 投递推进全部任务 -> 执行到期反思。
 */
class EngineApp {
 public:
  EngineApp(AppConfig config, ClockFn clock, EngineGateways gateways = {});
  ~EngineApp();

  EngineApp(const EngineApp&) = delete;
  EngineApp& operator=(const EngineApp&) = delete;

  /**
   * @brief 初始化
   *
   * 关键顺序：
   * 1. 初始化并加载 WAL；
   * 2. 构建网关、安全系统与各业务组件；
   * 3. 用 WAL 状态恢复熔断、限额、决策历史、结算任务与反思记录；
   * 4. 启动结算后台线程。
   */
  bool Initialize(std::string* out_error);

  /// 主循环；有界模式执行完周期后等待结算队列排空再返回。
  void RunLoop(const LoopOptions& options);

  /// 立即执行一个决策周期。
  bool RunCycle(TriggerReason trigger, Decision* out_decision, std::string* out_error);

  /// 单次 tick（主循环与测试共用）。
  void Tick();

  /**
   * @brief 评估手续费结算触发，满足条件时新建任务
   * @return true 表示本次新建了任务
   */
  bool MaybeCreateBridgeJob(std::int64_t now_ms);

  /// 同步推进全部结算任务（绕过后台线程，测试与有界模式收尾使用）。
  void AdvanceBridgeNow();

  bool RetryJob(const std::string& job_id, std::string* out_error);
  bool CancelJob(const std::string& job_id, std::string* out_error);
  bool ClearHalt(std::string* out_error);

  /// 停止后台线程与告警出口（幂等）。
  void Shutdown();

  const QueryService& query() const { return *query_; }
  /// 进程内奖励分配器；注入外部质押程序时为空。
  RewardDistributor* rewards() { return rewards_.get(); }
  BridgeController& bridge() { return *bridge_; }
  Orchestrator& orchestrator() { return *orchestrator_; }
  SafetySystem& safety() { return *safety_; }
  ReflectionEngine& reflection() { return *reflection_; }
  const AppConfig& config() const { return config_; }

  /// mock 自建网关时可用，其余情况为空。
  SimulatedMarket* simulated_market() { return sim_market_.get(); }
  SimulatedBasketContract* simulated_contract() { return sim_contract_.get(); }
  SimulatedSourceChain* simulated_source() { return sim_source_.get(); }

 private:
  bool BuildGateways(std::string* out_error);
  bool BuildRewards(const WalState& state, std::string* out_error);
  bool BuildCompletionService(std::string* out_error);
  void BuildNotifier();
  void DrainBridgeResults();

  AppConfig config_;
  ClockFn clock_;
  EngineGateways gateways_;
  WalStore wal_;
  std::int64_t started_ms_{0};
  bool initialized_{false};
  bool shut_down_{false};

  std::unique_ptr<SimulatedMarket> sim_market_;
  std::unique_ptr<SimulatedBasketContract> sim_contract_;
  std::unique_ptr<SimulatedSourceChain> sim_source_;
  std::unique_ptr<SimulatedDestinationChain> sim_destination_;
  std::unique_ptr<AttestationService> owned_attestation_;
  std::shared_ptr<NotificationSink> notifier_;
  WebhookNotificationSink* webhook_{nullptr};  ///< notifier_ 为 webhook 时的别名，用于关闭。
  std::shared_ptr<const CompletionService> completion_;

  std::unique_ptr<SafetySystem> safety_;
  std::unique_ptr<RewardDistributor> rewards_;
  std::unique_ptr<DistributorRewardVault> vault_;
  std::unique_ptr<ReflectionEngine> reflection_;
  std::unique_ptr<Orchestrator> orchestrator_;
  std::unique_ptr<BridgeController> bridge_;
  std::unique_ptr<BridgeWorker> worker_;
  std::unique_ptr<QueryService> query_;
  BridgeTriggerPolicy trigger_policy_;
};

}  // namespace basket_engine
