#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chain/chain_gateways.h"
#include "core/config.h"
#include "core/types.h"
#include "notify/notification_sink.h"
#include "safety/idempotency_guard.h"
#include "storage/wal_store.h"

namespace basket_engine {

/// 结算状态机依赖的外部网关（均不拥有所有权）。
struct BridgeCollaborators {
  SourceChain* source{nullptr};
  AttestationService* attestation{nullptr};
  DestinationChain* destination{nullptr};
  RewardVault* vault{nullptr};
};

/// 单次推进结果。
struct BridgeStepResult {
  std::string job_id;
  BridgeState from{BridgeState::kReady};
  BridgeState to{BridgeState::kReady};
  bool advanced{false};  ///< 发生了状态迁移。
  bool waiting{false};  ///< 等待外部条件（确认、证明、退避），不是错误。
  std::string error;
};

/**
 * @brief 跨链结算状态机
 *
 * `READY -> SOURCE_LOCKED -> SOURCE_CONFIRMED -> ATTESTATION_PENDING ->
 *  ATTESTATION_RECEIVED -> DEST_MINTED -> DEPOSITED`，FAILED/CANCELLED 为吸收态。
 *
 * 语义：
 * 1. `Advance` 每次最多推进一步，绝不阻塞等待（确认/证明未就绪时返回 waiting）；
 * 2. 每次迁移先写 WAL（整条快照，含本步产物），成功后才更新内存；
 * 3. 下一步由“已有哪些产物”决定，而不是信任状态字段；
 * 4. 有副作用的步骤先查后做（FindLock/FindMint/FindDeposit），崩溃后重放不会重复执行；
 * 5. 步骤失败在同一状态内指数退避重试，达到上限转 FAILED 并告警人工介入。
 *
 * 线程安全：推进/取消/重开由内部互斥串行化；查询接口可与推进并发。
 */
class BridgeController {
 public:
  BridgeController(SettlementConfig config,
                   BridgeCollaborators collaborators,
                   const WalStore* wal,
                   IdempotencyGuard* idempotency,
                   std::shared_ptr<NotificationSink> notifier);

  /// 重启恢复：按 WAL 中的最后快照重建任务表（保持创建顺序）。
  void Restore(const WalState& state);

  /// 新建 READY 任务（落盘后才可见）。
  bool CreateJob(std::uint64_t amount_raw,
                 std::int64_t now_ms,
                 BridgeJob* out_job,
                 std::string* out_error);

  BridgeStepResult Advance(const std::string& job_id, std::int64_t now_ms);
  /// 按创建顺序推进全部非终态任务，每个任务一步。
  std::vector<BridgeStepResult> AdvanceAllPending(std::int64_t now_ms);

  /// 人工重开 FAILED 任务：回到产物对应的状态，重置重试预算。
  bool RetryJob(const std::string& job_id, std::int64_t now_ms, std::string* out_error);
  /// 取消非终态任务。
  bool CancelJob(const std::string& job_id,
                 const std::string& reason,
                 std::int64_t now_ms,
                 std::string* out_error);

  std::optional<BridgeJob> GetJob(const std::string& job_id) const;
  /// 全部任务（创建顺序）。
  std::vector<BridgeJob> Jobs() const;
  /// 尚未锁定（READY）的任务金额合计，触发策略用来扣减可转出额度。
  std::uint64_t ReadyAmountRaw() const;
  /// 最近一次建任务时间；无任务返回 0。
  std::int64_t LastJobCreatedMs() const;

  /// 由产物推导应处于的状态。
  static BridgeState ResumeStateFor(const BridgeJob& job);

 private:
  enum class StepOutcome {
    kTransition,
    kWaiting,
    kRetryableError,  ///< 计入重试预算。
    kFatalError,  ///< 超时等不可重试错误，直接 FAILED。
  };

  /// 执行 `from` 状态对应的一步，成功时 out_next 为迁移后的快照。
  StepOutcome RunStep(const BridgeJob& job,
                      BridgeState from,
                      std::int64_t now_ms,
                      BridgeJob* out_next,
                      std::string* out_error);
  /// 先落盘再替换内存快照，并发布迁移事件。
  bool Commit(const BridgeJob& previous, const BridgeJob& next, std::string* out_error);
  /// 终止为 FAILED 并发送人工介入告警。
  BridgeStepResult FailJob(BridgeJob job,
                           BridgeState from,
                           const std::string& error,
                           std::int64_t now_ms);
  std::int64_t BackoffMs(int retry_count) const;

  SettlementConfig config_;
  BridgeCollaborators collaborators_;
  const WalStore* wal_{nullptr};
  IdempotencyGuard* idempotency_{nullptr};
  std::shared_ptr<NotificationSink> notifier_;

  std::mutex step_mutex_;  ///< 串行化所有修改操作。
  mutable std::mutex jobs_mutex_;  ///< 保护 jobs_/order_/last_poll_ms_。
  std::map<std::string, BridgeJob> jobs_;
  std::vector<std::string> order_;  ///< 创建顺序。
  std::map<std::string, std::int64_t> last_poll_ms_;  ///< attestation 最近一次轮询（仅内存）。
  std::uint64_t next_seq_{1};
};

}  // namespace basket_engine
