#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "core/config.h"
#include "notify/notification_sink.h"
#include "storage/wal_store.h"

namespace basket_engine {

using u128 = unsigned __int128;

/// 累加器定点精度：reward_per_weight 以 1e12 放大存储。
inline constexpr u128 kRewardPrecision = 1'000'000'000'000ULL;
/// 乘数基点：10000 = 1.00x。
inline constexpr int kMultiplierBpsScale = 10000;

/// 时间加权档位。
enum class RewardTier {
  kBase,
  kSilver,
  kGold,
};

const char* ToString(RewardTier tier);

/// 质押池：唯一共享可变对象，单写者串行修改。
struct StakePool {
  std::uint64_t total_principal{0};
  u128 total_weighted_stake{0};  ///< Σ principal * multiplier_bps。
  u128 acc_reward_per_weight{0};  ///< 单调不减，放大 kRewardPrecision 倍。
  std::int64_t last_update_ms{0};
  std::uint64_t total_deposited{0};
  std::uint64_t total_claimed{0};
};

/// 单个参与者的质押记录；全额解押后清零但不删除。
struct StakeEntry {
  std::string owner;
  std::uint64_t principal{0};
  std::int64_t stake_start_ms{0};
  int multiplier_bps{kMultiplierBpsScale};
  u128 weighted_stake{0};
  u128 reward_snapshot{0};  ///< 上次交互时的累加器值。
  std::uint64_t settled_unclaimed{0};  ///< 已结算未领取。
  std::int64_t last_interaction_ms{0};
};

/// 查询视图（数值均为 6 位小数基础单位）。
struct StakeEntryView {
  StakeEntry entry;
  RewardTier tier{RewardTier::kBase};
  std::uint64_t pending_reward{0};  ///< settled_unclaimed + 本次快照以来的应得。
  int stake_days{0};
  int days_to_next_tier{0};  ///< 已是最高档为 0。
};

/// 池统计；dust = 已存入 - 已领取 - 全部参与者应得（截断留存给池子）。
struct StakePoolView {
  StakePool pool;
  std::size_t participants{0};
  std::uint64_t outstanding_rewards{0};
  std::uint64_t dust{0};
};

/// 解押回执。
struct UnstakeReceipt {
  std::uint64_t principal_returned{0};
  std::uint64_t reward_paid{0};
};

/**
 * @brief 奖励分配器（累加器模式）
 *
 * 1. stake/unstake/claim 先用当前累加器与旧权重结算应得，再修改本金；
 *    总加权质押按差量更新，不做全量重算；
 * 2. deposit_reward 要求总加权质押 > 0，累加器增量
 *    `amount * kRewardPrecision / total_weighted_stake` 向下取整，余数留在池中（dust）；
 * 3. 所有乘加都做溢出检查，溢出时整笔操作失败、不修改任何状态并发 critical 告警；
 * 4. 时间乘数在每次交互时按 `now - stake_start` 惰性重算，不依赖后台任务；
 * 5. 写操作持独占锁串行，读操作持共享锁可并发；告警在释放锁之后发出；
 * 6. 注入 WAL 时每个写操作校验通过后先追加 STAKE/UNSTAKE/CLAIM/DEPOSIT 记录再修改内存，
 *    重启时 `Restore` 按顺序重放，存入引用随之恢复。
 */
class RewardDistributor {
 public:
  /// @param wal 为空时不持久化（单元测试）。
  RewardDistributor(RewardsConfig config,
                    std::shared_ptr<NotificationSink> notifier,
                    const WalStore* wal = nullptr);

  /// 重放 WAL 中的写操作重建池与参与者；须在任何新写操作之前调用。
  bool Restore(const std::vector<RewardOp>& ops, std::string* out_error);

  bool Stake(const std::string& owner,
             std::uint64_t amount,
             std::int64_t now_ms,
             std::string* out_error);
  bool Unstake(const std::string& owner,
               std::uint64_t amount,
               std::int64_t now_ms,
               UnstakeReceipt* out_receipt,
               std::string* out_error);
  /// 领取全部应得；无应得时返回 true 且 out_reward=0。
  bool Claim(const std::string& owner,
             std::int64_t now_ms,
             std::uint64_t* out_reward,
             std::string* out_error);
  bool DepositReward(std::uint64_t amount, std::int64_t now_ms, std::string* out_error);
  /// 带幂等引用的存入：同一 ref 只能存入一次。
  bool DepositReward(const std::string& ref,
                     std::uint64_t amount,
                     std::int64_t now_ms,
                     std::string* out_error);
  bool HasDeposit(const std::string& ref) const;

  StakePoolView PoolView() const;
  std::optional<StakeEntryView> EntryView(const std::string& owner, std::int64_t now_ms) const;

  /// 不变量：total_weighted_stake == Σ entry.weighted_stake。
  bool CheckInvariant(std::string* out_error) const;

  RewardTier TierFor(std::int64_t stake_ms) const;
  int MultiplierBps(RewardTier tier) const;

 private:
  struct Settlement {
    std::uint64_t settled{0};  ///< 结算后的 settled_unclaimed。
  };

  /// 只计算不修改：按当前累加器结算 entry 的应得。
  bool SettlePending(const StakeEntry& entry, Settlement* out, std::string* out_error) const;
  bool Fail(const std::string& operation, const std::string& error,
            std::int64_t now_ms, std::string* out_error) const;
  bool Journal(const RewardOp& op, std::string* out_error) const;

  // 以下 *Locked 由调用方持有独占锁。
  bool StakeLocked(const std::string& owner, std::uint64_t amount, std::int64_t now_ms,
                   std::string* out_error);
  bool UnstakeLocked(const std::string& owner, std::uint64_t amount, std::int64_t now_ms,
                     UnstakeReceipt* out_receipt, std::string* out_error);
  bool ClaimLocked(const std::string& owner, std::int64_t now_ms, std::uint64_t* out_reward,
                   std::string* out_error);
  bool DepositLocked(const std::string& ref, std::uint64_t amount, std::int64_t now_ms,
                     std::string* out_error);

  RewardsConfig config_;
  std::shared_ptr<NotificationSink> notifier_;
  const WalStore* wal_{nullptr};
  mutable std::shared_mutex mutex_;
  StakePool pool_;
  std::map<std::string, StakeEntry> entries_;
  std::set<std::string> deposit_refs_;
  bool replaying_{false};
};

/// 128 位无符号数转十进制字符串（日志/JSON 输出）。
std::string U128ToString(u128 value);

}  // namespace basket_engine
