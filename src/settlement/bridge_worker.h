#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "settlement/bridge_controller.h"

namespace basket_engine {

/**
 * @brief 结算后台执行器（单工作线程串行推进）
 *
 * 设计目的：
 * 1. 主循环只负责“投递推进任务”，不阻塞在链上调用与证明轮询；
 * 2. 结算步骤统一在单线程串行执行，避免同一任务被并发推进；
 * 3. 推进结果由主循环轮询消费（日志、查询视图刷新）；
 * 4. 投递合并：同一时刻最多排队一个 AdvanceAll、每个 job 最多排队一个 Advance，
 *    链上调用慢于 tick 时队列不会增长；时间在任务真正执行时读取。
 */
class BridgeWorker {
 public:
  using ClockFn = std::function<std::int64_t()>;

  /// @param controller 结算状态机，生命周期由外部管理（不持有所有权）
  /// @param clock 执行任务时读取的当前时间（毫秒）
  BridgeWorker(BridgeController* controller, ClockFn clock);
  ~BridgeWorker();

  /// 启动后台工作线程；重复调用无副作用。
  void Start();
  /// 投递 stop 任务并等待线程退出（幂等）。
  void Stop();

  /// 异步推进全部非终态任务（各一步）；已有未执行的 AdvanceAll 时合并，返回 false。
  bool SubmitAdvanceAll();
  /// 异步推进单个任务；该任务已在队列中时合并，返回 false。
  bool SubmitAdvance(const std::string& job_id);

  /// 非阻塞轮询推进结果；返回后 `out_results` 持有本轮所有结果。
  void PollResults(std::vector<BridgeStepResult>* out_results);
  /// 尚未完成的任务数（排队 + 正在执行）。
  std::size_t pending_tasks() const;

 private:
  void WorkerLoop();

  struct Task {
    enum Type { kAdvanceAll, kAdvance, kStop } type;
    std::string job_id;  ///< kAdvance 目标任务。
  };

  BridgeController* controller_{nullptr};  ///< 外部注入（不拥有所有权）。
  ClockFn clock_;
  std::thread worker_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::queue<Task> task_queue_;
  bool advance_all_queued_{false};
  std::set<std::string> queued_jobs_;
  bool in_flight_{false};

  std::mutex result_mutex_;
  std::vector<BridgeStepResult> results_;
};

}  // namespace basket_engine
