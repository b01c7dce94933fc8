#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "agents/completion_service.h"
#include "agents/report_producer.h"
#include "chain/chain_gateways.h"
#include "core/config.h"
#include "core/types.h"
#include "debate/debate_engine.h"
#include "decision/decision_maker.h"
#include "notify/notification_sink.h"
#include "reflection/reflection_engine.h"
#include "risk/risk_gate.h"
#include "safety/safety_system.h"
#include "storage/wal_store.h"

namespace basket_engine {

/// 编排器依赖（指针均不拥有所有权，生命周期由 EngineApp 管理）。
struct OrchestratorDeps {
  std::shared_ptr<const CompletionService> completion;
  const MarketStateReader* market{nullptr};
  BasketContract* contract{nullptr};
  SafetySystem* safety{nullptr};
  ReflectionEngine* reflection{nullptr};
  const WalStore* wal{nullptr};
  std::shared_ptr<NotificationSink> notifier;
};

/**
 * @brief 决策周期编排器
 *
 * 责任边界：
 * 1. 驱动 分析师扇出 -> 辩论 -> 风控 -> 决策 -> 执行 的单次周期；
 * 2. 每个周期恰好产出一条 Decision（含完整审计链）并先落盘再返回；
 * 3. 同一时刻最多一个周期（幂等键 `cycle`），第二个调用立即失败。
 *
 * 非职责：
 * - 不负责调度（由 EngineApp 按周期/外部触发调用）；
 * - 不推进跨链结算。
 */
class Orchestrator {
 public:
  Orchestrator(const AppConfig& config, OrchestratorDeps deps);

  /// 重启恢复决策历史（用于 24h 换手/频率统计与查询）。
  void Restore(const WalState& state);

  /**
   * @brief 执行一个决策周期
   * @return false 表示周期未执行（已有周期在运行）或决策落盘失败
   */
  bool RunCycle(TriggerReason trigger,
                std::int64_t now_ms,
                Decision* out_decision,
                std::string* out_error);

  /// 请求中止当前周期；只在链上提交之前生效。
  void RequestAbort() { abort_requested_.store(true); }

  std::vector<Decision> History() const;
  std::vector<Decision> RecentDecisions(std::size_t n) const;

  /// 过去 24h 已提交调仓的累计换手与次数。
  static double Turnover24h(const std::vector<Decision>& history, std::int64_t now_ms);
  static int Rebalances24h(const std::vector<Decision>& history, std::int64_t now_ms);

 private:
  std::string MakeDecisionId(TriggerReason trigger, std::int64_t now_ms);
  /// 扇出 -> 辩论 -> 风控 -> 决策 -> 执行；各阶段的短路都体现在 decision 上。
  void RunPipeline(Decision* decision, const BasketSnapshot& snapshot, std::int64_t now_ms);
  /// 执行阶段：组合守卫复检 + 先查后做提交。
  void Execute(Decision* decision, double turnover_24h, std::int64_t now_ms);
  bool Persist(const Decision& decision, std::string* out_error);
  bool AbortRequested(Decision* decision, const std::string& stage) const;

  AppConfig config_;
  OrchestratorDeps deps_;
  ReportFanout fanout_;
  DebateEngine debate_;
  RiskGate risk_gate_;
  std::unique_ptr<DecisionMaker> decision_maker_;

  std::atomic<bool> abort_requested_{false};
  mutable std::mutex history_mutex_;
  std::vector<Decision> history_;
  std::uint64_t seq_{0};
};

}  // namespace basket_engine
