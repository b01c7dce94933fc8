#include "notify/notification_sink.h"

#include <utility>

#include "core/hash_utils.h"
#include "core/json_utils.h"
#include "core/log.h"

namespace basket_engine {

namespace {

std::string FormatAlert(const Alert& alert) {
  return "ALERT[" + std::string(ToString(alert.severity)) + "] " + alert.code +
         ": " + alert.message;
}

}  // namespace

Alert MakeAlert(AlertSeverity severity,
                std::string code,
                std::string message,
                std::int64_t ts_ms) {
  Alert alert;
  alert.severity = severity;
  alert.code = std::move(code);
  alert.message = std::move(message);
  alert.ts_ms = ts_ms;
  return alert;
}

void LogNotificationSink::Notify(const Alert& alert) {
  switch (alert.severity) {
    case AlertSeverity::kCritical:
      LogError(FormatAlert(alert));
      break;
    case AlertSeverity::kWarning:
      LogWarn(FormatAlert(alert));
      break;
    case AlertSeverity::kInfo:
      LogInfo(FormatAlert(alert));
      break;
  }
}

WebhookNotificationSink::WebhookNotificationSink(
    std::shared_ptr<const HttpTransport> transport,
    std::string url,
    std::string secret)
    : transport_(std::move(transport)),
      url_(std::move(url)),
      secret_(std::move(secret)) {
  worker_ = std::thread(&WebhookNotificationSink::WorkerLoop, this);
}

WebhookNotificationSink::~WebhookNotificationSink() {
  Stop();
}

void WebhookNotificationSink::Notify(const Alert& alert) {
  // 本地日志始终保留一份，webhook 失败时仍可追溯。
  LogNotificationSink().Notify(alert);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    queue_.push(alert);
  }
  cv_.notify_one();
}

void WebhookNotificationSink::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void WebhookNotificationSink::WorkerLoop() {
  while (true) {
    Alert alert;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        break;
      }
      alert = std::move(queue_.front());
      queue_.pop();
    }
    Deliver(alert);
  }
}

void WebhookNotificationSink::Deliver(const Alert& alert) const {
  JsonWriter writer;
  writer.BeginObject()
      .Key("severity").String(ToString(alert.severity))
      .Key("code").String(alert.code)
      .Key("message").String(alert.message)
      .Key("ts_ms").Integer(alert.ts_ms)
      .EndObject();

  HttpRequest request;
  request.method = "POST";
  request.url = url_;
  request.body = writer.str();
  request.timeout_ms = 5000;
  request.headers.emplace_back("Content-Type", "application/json");
  if (!secret_.empty()) {
    std::string signature;
    std::string error;
    if (!HmacSha256Hex(secret_, request.body, &signature, &error)) {
      LogWarn("webhook 签名失败，告警未投递: " + error);
      return;
    }
    request.headers.emplace_back("X-Signature", signature);
  }

  const HttpResponse response = transport_->Send(request);
  if (!response.error.empty() || response.status_code < 200 ||
      response.status_code >= 300) {
    LogWarn("webhook 投递失败: code=" + alert.code +
            ", status=" + std::to_string(response.status_code) +
            ", error=" + response.error);
  }
}

}  // namespace basket_engine
