#pragma once

#include <string>

#include "chain/chain_gateways.h"
#include "rewards/reward_distributor.h"

namespace basket_engine {

/**
 * @brief 进程内奖励金库（mock 模式的质押程序）
 *
 * 结算任务的最后一步：把到账金额以 job_id 为引用转交给奖励分配器。
 * 引用随分配器的 DEPOSIT 记录落盘，重启后 `FindDeposit` 仍能识别已完成的存入。
 */
class DistributorRewardVault final : public RewardVault {
 public:
  /// @param distributor 外部注入（不拥有所有权）。
  explicit DistributorRewardVault(RewardDistributor* distributor) : distributor_(distributor) {}

  bool FindDeposit(const std::string& job_id, std::string* out_deposit_ref) const override;
  bool DepositReward(const std::string& job_id,
                     std::uint64_t amount_raw,
                     std::int64_t now_ms,
                     std::string* out_deposit_ref,
                     std::string* out_error) override;

 private:
  RewardDistributor* distributor_{nullptr};
};

}  // namespace basket_engine
