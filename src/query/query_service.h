#pragma once

#include <cstdint>
#include <string>

#include "rewards/reward_distributor.h"
#include "settlement/bridge_controller.h"
#include "storage/wal_store.h"
#include "system/orchestrator.h"

namespace basket_engine {

/**
 * @brief 只读查询接口
 *
 * 全部基于组件快照构造 JSON，不持有任何锁跨调用，不修改状态。
 * 任一依赖为空时对应查询返回空结构。
 */
class QueryService {
 public:
  QueryService(const Orchestrator* orchestrator,
               const BridgeController* bridge,
               const RewardDistributor* rewards,
               const WalStore* wal)
      : orchestrator_(orchestrator), bridge_(bridge), rewards_(rewards), wal_(wal) {}

  /// 最近 n 条决策（完整审计链），时间升序。
  std::string LatestDecisionsJson(std::size_t n) const;
  /// 全部结算任务；include_history=true 时附带 WAL 中每个任务的迁移快照。
  std::string BridgeJobsJson(bool include_history) const;
  /// 质押池统计。
  std::string PoolJson() const;
  /// 单个质押记录（含档位与待领奖励）；不存在返回 `null`。
  std::string StakeEntryJson(const std::string& owner, std::int64_t now_ms) const;

 private:
  const Orchestrator* orchestrator_{nullptr};
  const BridgeController* bridge_{nullptr};
  const RewardDistributor* rewards_{nullptr};
  const WalStore* wal_{nullptr};
};

}  // namespace basket_engine
