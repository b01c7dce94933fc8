#include "rewards/reward_vault.h"

namespace basket_engine {

namespace {

std::string DepositRef(const std::string& job_id) {
  return "vault_deposit_" + job_id;
}

}  // namespace

bool DistributorRewardVault::FindDeposit(const std::string& job_id,
                                         std::string* out_deposit_ref) const {
  if (distributor_ == nullptr || !distributor_->HasDeposit(job_id)) {
    return false;
  }
  if (out_deposit_ref != nullptr) {
    *out_deposit_ref = DepositRef(job_id);
  }
  return true;
}

bool DistributorRewardVault::DepositReward(const std::string& job_id,
                                           std::uint64_t amount_raw,
                                           std::int64_t now_ms,
                                           std::string* out_deposit_ref,
                                           std::string* out_error) {
  if (distributor_ == nullptr) {
    if (out_error != nullptr) {
      *out_error = "reward distributor not configured";
    }
    return false;
  }
  // 分配器拒绝重复引用："deposit already recorded for <job_id>"。
  if (!distributor_->DepositReward(job_id, amount_raw, now_ms, out_error)) {
    return false;
  }
  if (out_deposit_ref != nullptr) {
    *out_deposit_ref = DepositRef(job_id);
  }
  return true;
}

}  // namespace basket_engine
