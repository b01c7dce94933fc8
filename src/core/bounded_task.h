#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace basket_engine {

/// 协作式取消标记：超时后由等待方置位，执行方在阻塞调用间隙检查。
class CancelToken {
 public:
  CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  bool cancelled() const { return flag_->load(std::memory_order_acquire); }
  void Cancel() const { flag_->store(true, std::memory_order_release); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief 有界异步任务（一次性）
 *
 * 语义：
 * 1. `Launch` 在独立线程执行任务，线程 detach，结果写入共享状态；
 * 2. `WaitUntil` 最多等到 deadline；超时则置位取消标记并返回 false，
 *    调用方不再等待，迟到的结果被丢弃；
 * 3. 共享状态由 shared_ptr 持有，超时后工作线程仍可安全写入。
 *
 * 任务抛出的异常在工作线程内转换为错误文本，不会逃逸到 detach 线程之外。
 */
template <typename T>
class BoundedTask {
 public:
  using Fn = std::function<T(const CancelToken&)>;

  static BoundedTask Launch(Fn fn) {
    BoundedTask task;
    std::shared_ptr<State> state = task.state_;
    CancelToken token = task.token_;
    std::thread([state, token, fn = std::move(fn)]() {
      T value{};
      std::string error;
      try {
        value = fn(token);
      } catch (const std::exception& ex) {
        error = std::string("任务异常: ") + ex.what();
      }
      {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->value = std::move(value);
        state->error = std::move(error);
        state->done = true;
      }
      state->cv.notify_all();
    }).detach();
    return task;
  }

  /**
   * @param deadline 绝对截止时间（steady_clock）
   * @param out_value 成功时写入结果
   * @param out_error 超时或任务异常时写入原因
   * @return true 任务在截止前完成且未抛异常
   */
  bool WaitUntil(std::chrono::steady_clock::time_point deadline,
                 T* out_value,
                 std::string* out_error) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!state_->cv.wait_until(lock, deadline, [this] { return state_->done; })) {
      token_.Cancel();
      if (out_error != nullptr) {
        *out_error = "timeout";
      }
      return false;
    }
    if (!state_->error.empty()) {
      if (out_error != nullptr) {
        *out_error = state_->error;
      }
      return false;
    }
    if (out_value != nullptr) {
      *out_value = std::move(state_->value);
    }
    return true;
  }

  const CancelToken& token() const { return token_; }

 private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};
    T value{};
    std::string error;
  };

  BoundedTask() : state_(std::make_shared<State>()) {}

  std::shared_ptr<State> state_;
  CancelToken token_;
};

/// 便捷入口：同步执行带截止时间的调用（辩论每轮/软风控判断使用）。
template <typename T>
bool RunWithTimeout(typename BoundedTask<T>::Fn fn,
                    std::chrono::milliseconds timeout,
                    T* out_value,
                    std::string* out_error) {
  auto task = BoundedTask<T>::Launch(std::move(fn));
  return task.WaitUntil(std::chrono::steady_clock::now() + timeout, out_value,
                        out_error);
}

}  // namespace basket_engine
