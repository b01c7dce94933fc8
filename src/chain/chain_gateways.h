#pragma once

#include <cstdint>
#include <string>

#include "core/types.h"

namespace basket_engine {

/**
 * @brief 链上篮子状态读取接口
 *
 * 屏蔽 mock/live 差异：上层只依赖“读快照、读历史 NAV/价格”语义。
 * 实现需线程安全（决策周期与反思任务可能同时读取）。
 */
class MarketStateReader {
 public:
  virtual ~MarketStateReader() = default;

  /// @brief 当前篮子快照（权重、NAV、per-token 价格与流动性）。
  virtual bool ReadSnapshot(BasketSnapshot* out_snapshot, std::string* out_error) const = 0;
  /// @brief 分析师附加上下文（近期 NAV 序列、情绪指数、波动率）。
  virtual bool ReadMarketContext(MarketContext* out_context, std::string* out_error) const = 0;
  /// @brief 历史时刻的 NAV（反思引擎使用）。
  virtual bool NavAt(std::int64_t ts_ms, double* out_nav, std::string* out_error) const = 0;
  /// @brief 历史时刻的 token 价格。
  virtual bool PriceAt(const std::string& token,
                       std::int64_t ts_ms,
                       double* out_price,
                       std::string* out_error) const = 0;
};

/// 篮子合约：提交调仓与读取累计手续费。
class BasketContract {
 public:
  virtual ~BasketContract() = default;

  /// @brief 提交调仓；成功时写入链上交易引用。
  virtual bool SubmitRebalance(const std::string& decision_id,
                               const Weights& weights,
                               std::string* out_tx_ref,
                               std::string* out_error) = 0;
  /// @brief 先查后做：该决策是否已有链上提交（返回 true 并写入引用）。
  virtual bool FindSubmission(const std::string& decision_id, std::string* out_tx_ref) const = 0;
  /// @brief 尚未结算转出的累计手续费（USD）。
  virtual bool ReadAccruedFeesUsd(double* out_usd, std::string* out_error) const = 0;
};

/// 源链确认结果。
struct SourceConfirmation {
  bool confirmed{false};
  std::string message;  ///< 跨链消息原文；confirmed 时有效。
};

/**
 * @brief 源链网关（锁定/销毁一侧）
 *
 * `Lock` 不保证幂等，调用方必须先 `FindLock` 检查同一 job 是否已锁定。
 */
class SourceChain {
 public:
  virtual ~SourceChain() = default;

  virtual bool FindLock(const std::string& job_id, std::string* out_lock_ref) const = 0;
  virtual bool Lock(const std::string& job_id,
                    std::uint64_t amount_raw,
                    std::string* out_lock_ref,
                    std::string* out_error) = 0;
  /// @brief 查询锁定交易确认状态；未确认返回 true 且 confirmed=false。
  virtual bool Confirm(const std::string& lock_ref,
                       SourceConfirmation* out_confirmation,
                       std::string* out_error) const = 0;
  /// @brief 拥堵指标（越大越拥堵，单位由实现定义，与配置上限同口径）。
  virtual double CongestionLevel() const = 0;
};

/// attestation 轮询结果。
struct AttestationPoll {
  bool complete{false};
  std::string attestation;
};

/// 跨链证明服务：按消息哈希轮询，pending 不是错误。
class AttestationService {
 public:
  virtual ~AttestationService() = default;
  virtual bool Poll(const std::string& message_hash,
                    AttestationPoll* out_poll,
                    std::string* out_error) const = 0;
};

/// 目标链网关（铸造一侧）；`Mint` 前必须 `FindMint`。
class DestinationChain {
 public:
  virtual ~DestinationChain() = default;

  virtual bool FindMint(const std::string& message_hash, std::string* out_mint_ref) const = 0;
  virtual bool Mint(const std::string& message_hash,
                    const std::string& attestation,
                    std::string* out_mint_ref,
                    std::string* out_error) = 0;
};

/// 奖励金库：把结算到账金额注入质押奖励池；`DepositReward` 前必须 `FindDeposit`。
class RewardVault {
 public:
  virtual ~RewardVault() = default;

  virtual bool FindDeposit(const std::string& job_id, std::string* out_deposit_ref) const = 0;
  virtual bool DepositReward(const std::string& job_id,
                             std::uint64_t amount_raw,
                             std::int64_t now_ms,
                             std::string* out_deposit_ref,
                             std::string* out_error) = 0;
};

}  // namespace basket_engine
