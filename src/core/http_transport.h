#pragma once

#include <string>
#include <utility>
#include <vector>

namespace basket_engine {

/// HTTP 响应统一结构，便于 mock 与真实传输层复用。
struct HttpResponse {
  int status_code{0};
  std::string body;
  std::string error;
};

/// HTTP 请求描述；timeout_ms 同时约束连接与整体传输。
struct HttpRequest {
  std::string method{"GET"};
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  long timeout_ms{10000};
};

/**
 * @brief HTTP 传输抽象
 *
 * 作用：
 * 1. 业务层（模型补全、attestation 轮询、告警 webhook）不直接依赖 libcurl；
 * 2. 单元测试可注入脚本化 transport。
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse Send(const HttpRequest& request) const = 0;
};

class CurlHttpTransport final : public HttpTransport {
 public:
  /// 使用 libcurl easy 接口同步发送；线程安全（每次请求独立 handle）。
  HttpResponse Send(const HttpRequest& request) const override;
};

}  // namespace basket_engine
