#include "settlement/bridge_worker.h"

#include <utility>

namespace basket_engine {

BridgeWorker::BridgeWorker(BridgeController* controller, ClockFn clock)
    : controller_(controller), clock_(std::move(clock)) {}

BridgeWorker::~BridgeWorker() {
  Stop();
}

void BridgeWorker::Start() {
  if (worker_.joinable()) {
    return;
  }
  worker_ = std::thread(&BridgeWorker::WorkerLoop, this);
}

void BridgeWorker::Stop() {
  if (!worker_.joinable()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    task_queue_.push(Task{.type = Task::kStop, .job_id = ""});
  }
  queue_cv_.notify_one();
  worker_.join();
}

bool BridgeWorker::SubmitAdvanceAll() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (advance_all_queued_) {
      return false;
    }
    advance_all_queued_ = true;
    task_queue_.push(Task{.type = Task::kAdvanceAll, .job_id = ""});
  }
  queue_cv_.notify_one();
  return true;
}

bool BridgeWorker::SubmitAdvance(const std::string& job_id) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!queued_jobs_.insert(job_id).second) {
      return false;
    }
    task_queue_.push(Task{.type = Task::kAdvance, .job_id = job_id});
  }
  queue_cv_.notify_one();
  return true;
}

void BridgeWorker::PollResults(std::vector<BridgeStepResult>* out_results) {
  if (out_results == nullptr) return;
  out_results->clear();
  std::lock_guard<std::mutex> lock(result_mutex_);
  if (results_.empty()) {
    return;
  }
  out_results->swap(results_);
}

std::size_t BridgeWorker::pending_tasks() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return task_queue_.size() + (in_flight_ ? 1 : 0);
}

void BridgeWorker::WorkerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !task_queue_.empty(); });
      task = std::move(task_queue_.front());
      task_queue_.pop();
      // 出队即解除合并标记：执行期间到来的投递会再排一次，保证不漏掉新任务。
      if (task.type == Task::kAdvanceAll) {
        advance_all_queued_ = false;
      } else if (task.type == Task::kAdvance) {
        queued_jobs_.erase(task.job_id);
      }
      in_flight_ = task.type != Task::kStop;
    }
    if (task.type == Task::kStop) {
      break;
    }

    std::vector<BridgeStepResult> batch;
    if (controller_ != nullptr) {
      const std::int64_t now_ms = clock_();
      if (task.type == Task::kAdvanceAll) {
        batch = controller_->AdvanceAllPending(now_ms);
      } else {
        batch.push_back(controller_->Advance(task.job_id, now_ms));
      }
    }

    if (!batch.empty()) {
      std::lock_guard<std::mutex> lock(result_mutex_);
      for (auto& result : batch) {
        results_.push_back(std::move(result));
      }
    }
    std::lock_guard<std::mutex> lock(queue_mutex_);
    in_flight_ = false;
  }
}

}  // namespace basket_engine
