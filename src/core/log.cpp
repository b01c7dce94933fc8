#include "core/log.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>

namespace basket_engine {

namespace {

std::mutex g_log_mutex;

// 三个级别共享同一把锁，保证 stdout/stderr 交错时时序仍然可读。
void WriteLine(std::ostream& out, std::string_view level, std::string_view message) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  out << std::put_time(&tm, "%F %T") << " [" << level << "] " << message << '\n';
}

}  // namespace

void LogInfo(std::string_view message) {
  WriteLine(std::cout, "INFO", message);
}

void LogWarn(std::string_view message) {
  WriteLine(std::cout, "WARN", message);
}

void LogError(std::string_view message) {
  WriteLine(std::cerr, "ERROR", message);
}

}  // namespace basket_engine
