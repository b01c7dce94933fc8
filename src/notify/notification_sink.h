#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "core/http_transport.h"
#include "core/types.h"

namespace basket_engine {

/**
 * @brief 告警出口（fire-and-forget）
 *
 * `Notify` 不返回结果、不抛异常；投递失败只记日志，不影响调用方流程。
 */
class NotificationSink {
 public:
  virtual ~NotificationSink() = default;
  virtual void Notify(const Alert& alert) = 0;
};

/// 直接写日志：critical -> ERROR，warning -> WARN，info -> INFO。
class LogNotificationSink final : public NotificationSink {
 public:
  void Notify(const Alert& alert) override;
};

/**
 * @brief Webhook 告警出口
 *
 * 1. 主线程只入队，后台单线程串行 POST，不阻塞决策周期；
 * 2. 请求体为单行 JSON，`X-Signature` 头为 HMAC-SHA256(secret, body)；
 * 3. secret 为空时不签名（仅用于本地调试端点）。
 */
class WebhookNotificationSink final : public NotificationSink {
 public:
  WebhookNotificationSink(std::shared_ptr<const HttpTransport> transport,
                          std::string url,
                          std::string secret);
  ~WebhookNotificationSink() override;

  void Notify(const Alert& alert) override;

  /// 投递 stop 并等待队列排空后退出（幂等）。
  void Stop();

 private:
  void WorkerLoop();
  void Deliver(const Alert& alert) const;

  std::shared_ptr<const HttpTransport> transport_;
  std::string url_;
  std::string secret_;
  std::thread worker_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<Alert> queue_;
  bool stopping_{false};
};

/// 构造告警的便捷函数（统一打时间戳）。
Alert MakeAlert(AlertSeverity severity,
                std::string code,
                std::string message,
                std::int64_t ts_ms);

}  // namespace basket_engine
