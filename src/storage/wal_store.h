#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/types.h"

namespace basket_engine {

/// 奖励池写操作（进程内质押账本的重放单元）。
struct RewardOp {
  enum Type { kStake, kUnstake, kClaim, kDeposit } type{kStake};
  std::string owner;  ///< kDeposit 时为空。
  std::string ref;  ///< kDeposit 的幂等引用（结算 job_id），可为空。
  std::uint64_t amount{0};  ///< kClaim 时为 0。
  std::int64_t ts_ms{0};
};

/// WAL 回放结果：重启恢复所需的全部持久状态。
struct WalState {
  std::vector<Decision> decisions;  ///< 按写入顺序。
  std::map<std::string, BridgeJob> latest_jobs;  ///< job_id -> 最后一次快照。
  std::vector<BridgeJob> job_history;  ///< 全部快照（按写入顺序）。
  std::vector<CalibrationHint> hints;
  std::unordered_set<std::string> reflected_ids;
  bool loss_halted{false};
  std::string halt_reason;
  std::vector<RewardOp> reward_ops;  ///< 按写入顺序。
};

/**
 * @brief 本地 WAL（Write-Ahead Log）
 *
 * 语义：
 * 1. 先落盘再推进内存状态（决策、结算迁移、校准提示、熔断事件、奖励池写操作）；
 * 2. 支持进程重启恢复：结算任务按 job_id 取最后快照，非终态任务继续推进；
 * 3. 文本 tab 分隔，首列为记录类型；DECISION 行第二列为单行 JSON。
 *
 * 线程安全：结算工作线程与主循环可同时追加，内部互斥串行化。
 */
class WalStore {
 public:
  explicit WalStore(std::string file_path) : file_path_(std::move(file_path)) {}

  /// 初始化 WAL：确保父目录存在并创建文件（若不存在）。
  bool Initialize(std::string* out_error) const;

  bool AppendDecision(const Decision& decision, std::string* out_error) const;
  /// 每次状态迁移追加一条完整快照。
  bool AppendJob(const BridgeJob& job, std::string* out_error) const;
  bool AppendHint(const CalibrationHint& hint, std::string* out_error) const;
  bool AppendReflected(const std::string& decision_id,
                       std::int64_t ts_ms,
                       std::string* out_error) const;
  /// 熔断事件：set=true 置位，false 人工解除。
  bool AppendSafetyEvent(bool halt_set,
                         const std::string& reason,
                         std::int64_t ts_ms,
                         std::string* out_error) const;

  /// 奖励池写操作：STAKE/UNSTAKE/CLAIM/DEPOSIT 各一行。
  bool AppendRewardOp(const RewardOp& op, std::string* out_error) const;

  /// 回放 WAL；文件不存在视为空历史。
  bool LoadState(WalState* out_state, std::string* out_error) const;

  const std::string& file_path() const { return file_path_; }

 private:
  /// 追加单行文本到 WAL 文件（append + flush）。
  bool AppendLine(const std::string& line, std::string* out_error) const;

  std::string file_path_;  ///< WAL 文件路径。
  mutable std::mutex mutex_;  ///< 串行化并发追加。
};

}  // namespace basket_engine
