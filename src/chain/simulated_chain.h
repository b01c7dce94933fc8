#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "chain/chain_gateways.h"

namespace basket_engine {

/// 毫秒时钟；mock 模式用墙钟，测试注入可控时钟。
using ClockFn = std::function<std::int64_t()>;

/// 模拟 token 参数：价格按正弦路径确定性波动。
struct SimulatedToken {
  std::string symbol;
  double base_price{1.0};
  double amplitude{0.0};  ///< 相对振幅，0.1 表示 ±10%。
  double period_hours{24.0};
  double liquidity_usd{1e6};
  double initial_weight{0.0};
};

/// 默认模拟篮子：锚定稳定币 + 四个波动资产。
std::vector<SimulatedToken> DefaultSimulatedTokens(const std::string& anchor_token);

/**
 * @brief 本地模拟篮子行情
 *
 * 特性：
 * 1. 价格是时间的确定性函数，可回看任意历史时刻（反思引擎依赖）；
 * 2. 持仓以“份额”保存，调仓时按当时价格重算份额，NAV 随价格自然漂移；
 * 3. 情绪指数与波动率同样由时间推导，无随机数。
 *
 * 场景：mock 运行模式、单元测试、无外网开发环境。
 */
class SimulatedMarket final : public MarketStateReader {
 public:
  SimulatedMarket(std::vector<SimulatedToken> tokens,
                  std::string anchor_token,
                  double initial_nav_usd,
                  ClockFn clock);

  bool ReadSnapshot(BasketSnapshot* out_snapshot, std::string* out_error) const override;
  bool ReadMarketContext(MarketContext* out_context, std::string* out_error) const override;
  bool NavAt(std::int64_t ts_ms, double* out_nav, std::string* out_error) const override;
  bool PriceAt(const std::string& token,
               std::int64_t ts_ms,
               double* out_price,
               std::string* out_error) const override;

  /// 按目标权重重算份额（调仓成交）。
  bool ApplyWeights(const Weights& weights, std::int64_t ts_ms, std::string* out_error);
  /// 测试用：整体价格冲击（乘以 factor，锚定币除外）。
  void ApplyShock(double factor);

 private:
  struct Holding {
    std::int64_t since_ms{0};
    std::map<std::string, double> units;
  };

  double PriceAtLocked(const SimulatedToken& token, std::int64_t ts_ms) const;
  double NavAtLocked(std::int64_t ts_ms) const;
  const SimulatedToken* FindToken(const std::string& symbol) const;

  std::vector<SimulatedToken> tokens_;
  std::string anchor_token_;
  ClockFn clock_;
  std::int64_t origin_ms_{0};
  std::vector<std::pair<std::int64_t, double>> shocks_;  ///< (生效时刻, 乘数)。
  mutable std::mutex mutex_;
  std::vector<Holding> holdings_;  ///< 按时间升序，最后一个为当前持仓。
};

/// 模拟篮子合约：调仓直接作用到 SimulatedMarket，手续费按固定速率线性累计。
class SimulatedBasketContract final : public BasketContract {
 public:
  SimulatedBasketContract(SimulatedMarket* market, double fee_usd_per_hour, ClockFn clock);

  bool SubmitRebalance(const std::string& decision_id,
                       const Weights& weights,
                       std::string* out_tx_ref,
                       std::string* out_error) override;
  bool FindSubmission(const std::string& decision_id, std::string* out_tx_ref) const override;
  bool ReadAccruedFeesUsd(double* out_usd, std::string* out_error) const override;

  /// 源链锁定时扣减已转出的手续费。
  void SweepFees(double usd);
  std::size_t submission_count() const;

 private:
  SimulatedMarket* market_{nullptr};
  double fee_usd_per_hour_{0.0};
  ClockFn clock_;
  std::int64_t origin_ms_{0};
  mutable std::mutex mutex_;
  double swept_usd_{0.0};
  std::map<std::string, std::string> submissions_;  ///< decision_id -> tx_ref。
};

/// 模拟源链：锁定后经过固定延迟确认，消息内容由 job 信息确定性生成。
class SimulatedSourceChain final : public SourceChain {
 public:
  SimulatedSourceChain(SimulatedBasketContract* contract, std::int64_t confirm_delay_ms, ClockFn clock);

  bool FindLock(const std::string& job_id, std::string* out_lock_ref) const override;
  bool Lock(const std::string& job_id,
            std::uint64_t amount_raw,
            std::string* out_lock_ref,
            std::string* out_error) override;
  bool Confirm(const std::string& lock_ref,
               SourceConfirmation* out_confirmation,
               std::string* out_error) const override;
  double CongestionLevel() const override;

  void SetCongestion(double level);
  std::size_t lock_count() const;

 private:
  struct LockRecord {
    std::string job_id;
    std::uint64_t amount_raw{0};
    std::int64_t locked_ms{0};
  };

  SimulatedBasketContract* contract_{nullptr};
  std::int64_t confirm_delay_ms_{0};
  ClockFn clock_;
  mutable std::mutex mutex_;
  double congestion_{10.0};
  std::map<std::string, std::string> lock_by_job_;
  std::map<std::string, LockRecord> locks_;
};

/// 模拟证明服务：消息哈希首次被查询后经过固定延迟完成。
class SimulatedAttestationService final : public AttestationService {
 public:
  SimulatedAttestationService(std::int64_t delay_ms, ClockFn clock);

  bool Poll(const std::string& message_hash,
            AttestationPoll* out_poll,
            std::string* out_error) const override;

 private:
  std::int64_t delay_ms_{0};
  ClockFn clock_;
  mutable std::mutex mutex_;
  mutable std::map<std::string, std::int64_t> first_seen_ms_;
};

/// 模拟目标链。
class SimulatedDestinationChain final : public DestinationChain {
 public:
  bool FindMint(const std::string& message_hash, std::string* out_mint_ref) const override;
  bool Mint(const std::string& message_hash,
            const std::string& attestation,
            std::string* out_mint_ref,
            std::string* out_error) override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> mints_;
};

}  // namespace basket_engine
