#pragma once

#include <atomic>
#include <string>
#include <utility>

namespace basket_engine {

/**
 * @brief 全局急停开关
 *
 * 两个来源任一置位即生效：进程内标志（CLI/测试），或磁盘上的哨兵文件
 * （运维在进程外 `touch` 即可，无需重启）。置位时整个决策周期被跳过。
 */
class KillSwitch {
 public:
  explicit KillSwitch(std::string sentinel_path) : sentinel_path_(std::move(sentinel_path)) {}

  void Engage() { engaged_.store(true); }
  /// 解除进程内标志并删除哨兵文件。
  bool Release(std::string* out_error);
  bool engaged() const;

 private:
  std::string sentinel_path_;
  std::atomic<bool> engaged_{false};
};

}  // namespace basket_engine
