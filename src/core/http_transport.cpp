#include "core/http_transport.h"

#include <algorithm>

#include <curl/curl.h>

namespace basket_engine {

namespace {

std::size_t WriteToString(char* ptr, std::size_t size, std::size_t nmemb,
                          void* userdata) {
  if (ptr == nullptr || userdata == nullptr) {
    return 0;
  }
  std::string* out = static_cast<std::string*>(userdata);
  const std::size_t total = size * nmemb;
  out->append(ptr, total);
  return total;
}

}  // namespace

HttpResponse CurlHttpTransport::Send(const HttpRequest& request) const {
  // 进程级初始化一次；分析师并发扇出时多线程共享。
  static const bool kCurlGlobalInit = []() {
    return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
  }();

  HttpResponse out;
  if (!kCurlGlobalInit) {
    out.error = "curl_global_init 失败";
    return out;
  }

  CURL* curl = curl_easy_init();
  if (curl == nullptr) {
    out.error = "curl_easy_init 失败";
    return out;
  }

  struct curl_slist* header_list = nullptr;
  for (const auto& [key, value] : request.headers) {
    header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
  }

  const long timeout_ms = std::max(request.timeout_ms, 1L);
  std::string response_body;
  char curl_error[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min(timeout_ms, 5000L));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, curl_error);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "basket-engine/0.1");
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  if (request.method == "POST") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "POST");
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  } else {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  }

  const CURLcode code = curl_easy_perform(curl);
  long status_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

  out.status_code = static_cast<int>(status_code);
  out.body = std::move(response_body);
  if (code != CURLE_OK) {
    const std::string detailed = (curl_error[0] != '\0')
                                     ? std::string(curl_error)
                                     : std::string(curl_easy_strerror(code));
    out.error = "curl_easy_perform 失败: " + detailed;
  }

  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);
  return out;
}

}  // namespace basket_engine
