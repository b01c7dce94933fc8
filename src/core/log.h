#pragma once

#include <string_view>

namespace basket_engine {

/**
 * @brief 输出 INFO 级日志
 *
 * 行为：
 * 1. 线程安全串行写入（分析师并发扇出时同样安全）；
 * 2. 输出到 `stdout`；
 * 3. 自动附加本地时间戳和 `[INFO]` 前缀。
 */
void LogInfo(std::string_view message);

/// 输出 WARN 级日志（`stdout`），用于可恢复异常：分析师失败、软否决、结算重试等。
void LogWarn(std::string_view message);

/**
 * @brief 输出 ERROR 级日志
 *
 * 输出到 `stderr`；累加器溢出、结算步骤失败、安全熔断等必须走该级别。
 */
void LogError(std::string_view message);

}  // namespace basket_engine
