#include "rewards/reward_distributor.h"

#include <algorithm>
#include <limits>
#include <mutex>
#include <utility>

#include "core/log.h"

namespace basket_engine {

namespace {

constexpr std::int64_t kDayMs = 86400LL * 1000;
constexpr u128 kU128Max = ~static_cast<u128>(0);
constexpr std::uint64_t kU64Max = std::numeric_limits<std::uint64_t>::max();

bool MulNoOverflow(u128 a, u128 b, u128* out) {
  if (a != 0 && b > kU128Max / a) {
    return false;
  }
  *out = a * b;
  return true;
}

bool AddNoOverflow(u128 a, u128 b, u128* out) {
  if (b > kU128Max - a) {
    return false;
  }
  *out = a + b;
  return true;
}

bool AddNoOverflow64(std::uint64_t a, std::uint64_t b, std::uint64_t* out) {
  if (b > kU64Max - a) {
    return false;
  }
  *out = a + b;
  return true;
}

bool Reject(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

bool FitsU64(u128 value) {
  return value <= static_cast<u128>(kU64Max);
}

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

}  // namespace

std::string U128ToString(u128 value) {
  if (value == 0) {
    return "0";
  }
  std::string digits;
  while (value > 0) {
    digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

const char* ToString(RewardTier tier) {
  switch (tier) {
    case RewardTier::kBase:
      return "Base";
    case RewardTier::kSilver:
      return "Silver";
    case RewardTier::kGold:
      return "Gold";
  }
  return "Unknown";
}

RewardDistributor::RewardDistributor(RewardsConfig config,
                                     std::shared_ptr<NotificationSink> notifier,
                                     const WalStore* wal)
    : config_(config), notifier_(std::move(notifier)), wal_(wal) {}

RewardTier RewardDistributor::TierFor(std::int64_t stake_ms) const {
  const std::int64_t days = stake_ms / kDayMs;
  if (days >= config_.gold_days) {
    return RewardTier::kGold;
  }
  if (days >= config_.silver_days) {
    return RewardTier::kSilver;
  }
  return RewardTier::kBase;
}

int RewardDistributor::MultiplierBps(RewardTier tier) const {
  switch (tier) {
    case RewardTier::kBase:
      return config_.base_multiplier_bps;
    case RewardTier::kSilver:
      return config_.silver_multiplier_bps;
    case RewardTier::kGold:
      return config_.gold_multiplier_bps;
  }
  return config_.base_multiplier_bps;
}

bool RewardDistributor::SettlePending(const StakeEntry& entry,
                                      Settlement* out,
                                      std::string* out_error) const {
  // 累加器单调不减，差值不会下溢。
  const u128 delta = pool_.acc_reward_per_weight - entry.reward_snapshot;
  u128 scaled = 0;
  if (!MulNoOverflow(entry.weighted_stake, delta, &scaled)) {
    SetError(out_error, "accumulator overflow: weighted_stake * delta");
    return false;
  }
  const u128 pending = scaled / kRewardPrecision;
  if (!FitsU64(pending)) {
    SetError(out_error, "accumulator overflow: pending exceeds u64");
    return false;
  }
  if (!AddNoOverflow64(entry.settled_unclaimed, static_cast<std::uint64_t>(pending),
                       &out->settled)) {
    SetError(out_error, "accumulator overflow: settled_unclaimed");
    return false;
  }
  return true;
}

bool RewardDistributor::Fail(const std::string& operation,
                             const std::string& error,
                             std::int64_t now_ms,
                             std::string* out_error) const {
  SetError(out_error, error);
  // 调用方已释放池锁。溢出属于本次操作致命错误：记 ERROR 并告警；普通参数错误只返回。
  if (error.rfind("accumulator overflow", 0) == 0) {
    LogError("ACCUMULATOR_OVERFLOW: op=" + operation + ", " + error);
    if (notifier_ != nullptr) {
      notifier_->Notify(MakeAlert(AlertSeverity::kCritical, "accumulator_overflow",
                                  operation + ": " + error, now_ms));
    }
  }
  return false;
}

bool RewardDistributor::StakeLocked(const std::string& owner,
                                    std::uint64_t amount,
                                    std::int64_t now_ms,
                                    std::string* out_error) {
  if (owner.empty() || amount == 0) {
    return Reject("stake requires owner and amount > 0", out_error);
  }
  if (owner.find_first_of("\t\r\n") != std::string::npos) {
    return Reject("stake owner must not contain tab or newline", out_error);
  }
  const auto it = entries_.find(owner);
  StakeEntry entry = it != entries_.end() ? it->second : StakeEntry{};
  entry.owner = owner;

  // 1) 先按旧权重结算，保证旧权重下的奖励不丢失。
  Settlement settlement;
  std::string error;
  if (!SettlePending(entry, &settlement, &error)) {
    return Reject(error, out_error);
  }

  // 2) 计算新本金与新权重（追加质押保留起始时间）。
  std::uint64_t new_principal = 0;
  std::uint64_t new_total_principal = 0;
  if (!AddNoOverflow64(entry.principal, amount, &new_principal) ||
      !AddNoOverflow64(pool_.total_principal, amount, &new_total_principal)) {
    return Reject("accumulator overflow: principal", out_error);
  }
  const std::int64_t start_ms = entry.principal == 0 ? now_ms : entry.stake_start_ms;
  const int multiplier = MultiplierBps(TierFor(now_ms - start_ms));
  const u128 new_weighted = static_cast<u128>(new_principal) * static_cast<u128>(multiplier);
  u128 new_total = 0;
  if (!AddNoOverflow(pool_.total_weighted_stake - entry.weighted_stake, new_weighted,
                     &new_total)) {
    return Reject("accumulator overflow: total_weighted_stake", out_error);
  }

  // 3) 全部校验通过后先落盘，再一次性提交。
  if (!Journal(RewardOp{.type = RewardOp::kStake, .owner = owner, .ref = "",
                        .amount = amount, .ts_ms = now_ms},
               out_error)) {
    return false;
  }
  entry.principal = new_principal;
  entry.stake_start_ms = start_ms;
  entry.multiplier_bps = multiplier;
  entry.weighted_stake = new_weighted;
  entry.reward_snapshot = pool_.acc_reward_per_weight;
  entry.settled_unclaimed = settlement.settled;
  entry.last_interaction_ms = now_ms;
  pool_.total_principal = new_total_principal;
  pool_.total_weighted_stake = new_total;
  pool_.last_update_ms = now_ms;
  entries_[owner] = entry;
  return true;
}

bool RewardDistributor::UnstakeLocked(const std::string& owner,
                                      std::uint64_t amount,
                                      std::int64_t now_ms,
                                      UnstakeReceipt* out_receipt,
                                      std::string* out_error) {
  const auto it = entries_.find(owner);
  if (it == entries_.end() || amount == 0 || it->second.principal < amount) {
    return Reject("insufficient staked amount", out_error);
  }
  StakeEntry entry = it->second;

  Settlement settlement;
  std::string error;
  if (!SettlePending(entry, &settlement, &error)) {
    return Reject(error, out_error);
  }
  std::uint64_t new_claimed = 0;
  if (!AddNoOverflow64(pool_.total_claimed, settlement.settled, &new_claimed)) {
    return Reject("accumulator overflow: total_claimed", out_error);
  }

  const std::uint64_t new_principal = entry.principal - amount;
  // 全额解押清零起始时间；部分解押保留起始时间并按当前档位重算权重。
  const std::int64_t start_ms = new_principal == 0 ? 0 : entry.stake_start_ms;
  const int multiplier =
      new_principal == 0 ? kMultiplierBpsScale : MultiplierBps(TierFor(now_ms - start_ms));
  const u128 new_weighted = static_cast<u128>(new_principal) * static_cast<u128>(multiplier);
  const u128 new_total = pool_.total_weighted_stake - entry.weighted_stake + new_weighted;

  if (!Journal(RewardOp{.type = RewardOp::kUnstake, .owner = owner, .ref = "",
                        .amount = amount, .ts_ms = now_ms},
               out_error)) {
    return false;
  }
  if (out_receipt != nullptr) {
    out_receipt->principal_returned = amount;
    out_receipt->reward_paid = settlement.settled;
  }
  entry.principal = new_principal;
  entry.stake_start_ms = start_ms;
  entry.multiplier_bps = multiplier;
  entry.weighted_stake = new_weighted;
  entry.reward_snapshot = pool_.acc_reward_per_weight;
  entry.settled_unclaimed = 0;
  entry.last_interaction_ms = now_ms;
  pool_.total_principal -= amount;
  pool_.total_weighted_stake = new_total;
  pool_.total_claimed = new_claimed;
  pool_.last_update_ms = now_ms;
  it->second = entry;
  return true;
}

bool RewardDistributor::ClaimLocked(const std::string& owner,
                                    std::int64_t now_ms,
                                    std::uint64_t* out_reward,
                                    std::string* out_error) {
  const auto it = entries_.find(owner);
  if (it == entries_.end()) {
    return Reject("no stake entry for " + owner, out_error);
  }
  StakeEntry entry = it->second;

  Settlement settlement;
  std::string error;
  if (!SettlePending(entry, &settlement, &error)) {
    return Reject(error, out_error);
  }
  std::uint64_t new_claimed = 0;
  if (!AddNoOverflow64(pool_.total_claimed, settlement.settled, &new_claimed)) {
    return Reject("accumulator overflow: total_claimed", out_error);
  }

  // 交互时惰性升档：先结算再换新权重。
  const int multiplier = entry.principal == 0
                             ? kMultiplierBpsScale
                             : MultiplierBps(TierFor(now_ms - entry.stake_start_ms));
  const u128 new_weighted =
      static_cast<u128>(entry.principal) * static_cast<u128>(multiplier);
  u128 new_total = 0;
  if (!AddNoOverflow(pool_.total_weighted_stake - entry.weighted_stake, new_weighted,
                     &new_total)) {
    return Reject("accumulator overflow: total_weighted_stake", out_error);
  }

  if (!Journal(RewardOp{.type = RewardOp::kClaim, .owner = owner, .ref = "",
                        .amount = 0, .ts_ms = now_ms},
               out_error)) {
    return false;
  }
  if (out_reward != nullptr) {
    *out_reward = settlement.settled;
  }
  entry.multiplier_bps = multiplier;
  entry.weighted_stake = new_weighted;
  entry.reward_snapshot = pool_.acc_reward_per_weight;
  entry.settled_unclaimed = 0;
  entry.last_interaction_ms = now_ms;
  pool_.total_weighted_stake = new_total;
  pool_.total_claimed = new_claimed;
  pool_.last_update_ms = now_ms;
  it->second = entry;
  return true;
}

bool RewardDistributor::DepositLocked(const std::string& ref,
                                      std::uint64_t amount,
                                      std::int64_t now_ms,
                                      std::string* out_error) {
  if (amount == 0) {
    return Reject("deposit amount must be > 0", out_error);
  }
  if (!ref.empty() && deposit_refs_.count(ref) > 0) {
    return Reject("deposit already recorded for " + ref, out_error);
  }
  if (ref.find_first_of("\t\r\n") != std::string::npos) {
    return Reject("deposit ref must not contain tab or newline", out_error);
  }
  if (pool_.total_weighted_stake == 0) {
    return Reject("no weighted stake to distribute to", out_error);
  }
  u128 scaled = 0;
  if (!MulNoOverflow(static_cast<u128>(amount), kRewardPrecision, &scaled)) {
    return Reject("accumulator overflow: amount * precision", out_error);
  }
  // 向下取整：余数不分配，留在池中作为 dust。
  const u128 increment = scaled / pool_.total_weighted_stake;
  u128 new_acc = 0;
  std::uint64_t new_deposited = 0;
  if (!AddNoOverflow(pool_.acc_reward_per_weight, increment, &new_acc)) {
    return Reject("accumulator overflow: acc_reward_per_weight", out_error);
  }
  if (!AddNoOverflow64(pool_.total_deposited, amount, &new_deposited)) {
    return Reject("accumulator overflow: total_deposited", out_error);
  }
  if (increment == 0) {
    LogWarn("REWARD_DUST: deposit " + std::to_string(amount) +
            " too small for total weighted stake " +
            U128ToString(pool_.total_weighted_stake) + "，全部计入 dust");
  }
  if (!Journal(RewardOp{.type = RewardOp::kDeposit, .owner = "", .ref = ref,
                        .amount = amount, .ts_ms = now_ms},
               out_error)) {
    return false;
  }
  pool_.acc_reward_per_weight = new_acc;
  pool_.total_deposited = new_deposited;
  pool_.last_update_ms = now_ms;
  if (!ref.empty()) {
    deposit_refs_.insert(ref);
  }
  return true;
}

bool RewardDistributor::Stake(const std::string& owner,
                              std::uint64_t amount,
                              std::int64_t now_ms,
                              std::string* out_error) {
  std::string error;
  bool ok = false;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ok = StakeLocked(owner, amount, now_ms, &error);
  }
  return ok || Fail("stake", error, now_ms, out_error);
}

bool RewardDistributor::Unstake(const std::string& owner,
                                std::uint64_t amount,
                                std::int64_t now_ms,
                                UnstakeReceipt* out_receipt,
                                std::string* out_error) {
  std::string error;
  bool ok = false;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ok = UnstakeLocked(owner, amount, now_ms, out_receipt, &error);
  }
  return ok || Fail("unstake", error, now_ms, out_error);
}

bool RewardDistributor::Claim(const std::string& owner,
                              std::int64_t now_ms,
                              std::uint64_t* out_reward,
                              std::string* out_error) {
  std::string error;
  bool ok = false;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ok = ClaimLocked(owner, now_ms, out_reward, &error);
  }
  return ok || Fail("claim", error, now_ms, out_error);
}

bool RewardDistributor::DepositReward(std::uint64_t amount,
                                      std::int64_t now_ms,
                                      std::string* out_error) {
  return DepositReward("", amount, now_ms, out_error);
}

bool RewardDistributor::DepositReward(const std::string& ref,
                                      std::uint64_t amount,
                                      std::int64_t now_ms,
                                      std::string* out_error) {
  std::string error;
  bool ok = false;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ok = DepositLocked(ref, amount, now_ms, &error);
  }
  return ok || Fail("deposit_reward", error, now_ms, out_error);
}

bool RewardDistributor::HasDeposit(const std::string& ref) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return deposit_refs_.count(ref) > 0;
}

bool RewardDistributor::Journal(const RewardOp& op, std::string* out_error) const {
  if (wal_ == nullptr || replaying_) {
    return true;
  }
  std::string error;
  if (!wal_->AppendRewardOp(op, &error)) {
    LogError("REWARD_PERSIST_FAILED: " + error);
    return Reject("persist reward op: " + error, out_error);
  }
  return true;
}

bool RewardDistributor::Restore(const std::vector<RewardOp>& ops, std::string* out_error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  pool_ = StakePool{};
  entries_.clear();
  deposit_refs_.clear();
  replaying_ = true;
  std::size_t index = 0;
  bool ok = true;
  std::string error;
  for (const auto& op : ops) {
    switch (op.type) {
      case RewardOp::kStake:
        ok = StakeLocked(op.owner, op.amount, op.ts_ms, &error);
        break;
      case RewardOp::kUnstake:
        ok = UnstakeLocked(op.owner, op.amount, op.ts_ms, nullptr, &error);
        break;
      case RewardOp::kClaim:
        ok = ClaimLocked(op.owner, op.ts_ms, nullptr, &error);
        break;
      case RewardOp::kDeposit:
        ok = DepositLocked(op.ref, op.amount, op.ts_ms, &error);
        break;
    }
    if (!ok) {
      break;
    }
    ++index;
  }
  replaying_ = false;
  if (!ok) {
    SetError(out_error, "reward replay failed at op " + std::to_string(index) + ": " + error);
    return false;
  }
  LogInfo("REWARD_RESTORED: ops=" + std::to_string(ops.size()) +
          ", participants=" + std::to_string(entries_.size()) +
          ", total_deposited=" + std::to_string(pool_.total_deposited));
  return true;
}

StakePoolView RewardDistributor::PoolView() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  StakePoolView view;
  view.pool = pool_;
  u128 outstanding = 0;
  for (const auto& [owner, entry] : entries_) {
    if (entry.principal > 0) {
      ++view.participants;
    }
    Settlement settlement;
    if (SettlePending(entry, &settlement, nullptr)) {
      outstanding += settlement.settled;
    }
  }
  view.outstanding_rewards = FitsU64(outstanding) ? static_cast<std::uint64_t>(outstanding)
                                                  : kU64Max;
  const u128 paid_or_owed = static_cast<u128>(pool_.total_claimed) + outstanding;
  view.dust = paid_or_owed >= pool_.total_deposited
                  ? 0
                  : static_cast<std::uint64_t>(pool_.total_deposited - paid_or_owed);
  return view;
}

std::optional<StakeEntryView> RewardDistributor::EntryView(const std::string& owner,
                                                           std::int64_t now_ms) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = entries_.find(owner);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  StakeEntryView view;
  view.entry = it->second;
  Settlement settlement;
  if (SettlePending(it->second, &settlement, nullptr)) {
    view.pending_reward = settlement.settled;
  }
  if (it->second.principal > 0) {
    const std::int64_t staked_ms = now_ms - it->second.stake_start_ms;
    view.stake_days = static_cast<int>(staked_ms / kDayMs);
    view.tier = TierFor(staked_ms);
    if (view.tier == RewardTier::kBase) {
      view.days_to_next_tier = config_.silver_days - view.stake_days;
    } else if (view.tier == RewardTier::kSilver) {
      view.days_to_next_tier = config_.gold_days - view.stake_days;
    }
  }
  return view;
}

bool RewardDistributor::CheckInvariant(std::string* out_error) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  u128 weighted = 0;
  std::uint64_t principal = 0;
  for (const auto& [owner, entry] : entries_) {
    weighted += entry.weighted_stake;
    principal += entry.principal;
  }
  if (weighted != pool_.total_weighted_stake) {
    SetError(out_error, "total_weighted_stake " + U128ToString(pool_.total_weighted_stake) +
                            " != sum " + U128ToString(weighted));
    return false;
  }
  if (principal != pool_.total_principal) {
    SetError(out_error, "total_principal mismatch");
    return false;
  }
  return true;
}

}  // namespace basket_engine
