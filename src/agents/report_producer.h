#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "agents/completion_service.h"
#include "core/types.h"

namespace basket_engine {

/// 分析师输入：篮子状态 + 市场上下文 + 最近校准提示（只读）。
struct ProducerInput {
  BasketSnapshot snapshot;
  MarketContext market;
  std::vector<CalibrationHint> hints;
};

/// 构造分析师 payload（单行 JSON）。
std::string BuildProducerPayload(ProducerKind kind, const ProducerInput& input);

/**
 * @brief 按 schema 校验模型输出
 *
 * 要求：confidence ∈ [0,1]、direction 为枚举值、evidence 为字符串数组。
 * 任一不满足都返回 false，由调用方转成带错误标记的报告。
 */
bool ParseAnalystOutput(ProducerKind kind,
                        const std::string& text,
                        AnalystReport* out_report,
                        std::string* out_error);

/**
 * @brief 单个分析师
 *
 * 无状态；`Produce` 从不抛异常也不返回失败，错误写入 `AnalystReport::error`。
 */
class ReportProducer {
 public:
  ReportProducer(ProducerKind kind,
                 std::shared_ptr<const CompletionService> completion,
                 int timeout_ms);

  AnalystReport Produce(const ProducerInput& input, const CancelToken& cancel) const;
  ProducerKind kind() const { return kind_; }

 private:
  ProducerKind kind_;
  std::shared_ptr<const CompletionService> completion_;
  int timeout_ms_;
};

/**
 * @brief 四分析师并行扇出/汇合
 *
 * 1. 四个分析师各自在独立线程执行，互不共享可变状态；
 * 2. 共用一个截止时间，迟到者在截止时刻记为 `timeout` 失败，不阻塞周期；
 * 3. 返回顺序固定为 technical/sentiment/liquidity/macro，与完成顺序无关。
 */
class ReportFanout {
 public:
  ReportFanout(std::shared_ptr<const CompletionService> completion, int timeout_ms);

  std::vector<AnalystReport> Run(const ProducerInput& input) const;

  /// 失败报告计数（超时 + 输出非法 + 异常）。
  static int CountFailures(const std::vector<AnalystReport>& reports);

 private:
  std::vector<ReportProducer> producers_;
  int timeout_ms_;
};

}  // namespace basket_engine
