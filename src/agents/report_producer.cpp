#include "agents/report_producer.h"

#include <utility>

#include "core/json_utils.h"
#include "core/log.h"
#include "storage/record_codec.h"

namespace basket_engine {

namespace {

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

std::int64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

AnalystReport FailedReport(ProducerKind kind, std::string error, std::int64_t latency_ms) {
  AnalystReport report;
  report.producer = kind;
  report.error = std::move(error);
  report.latency_ms = latency_ms;
  return report;
}

}  // namespace

std::string BuildProducerPayload(ProducerKind kind, const ProducerInput& input) {
  JsonWriter writer;
  writer.BeginObject();
  writer.Key("producer").String(ToString(kind));
  writer.Key("basket");
  WriteSnapshotJson(input.snapshot, &writer);
  writer.Key("market").BeginObject();
  writer.Key("recent_nav").BeginArray();
  for (const double nav : input.market.recent_nav) {
    writer.Number(nav);
  }
  writer.EndArray();
  writer.Key("sentiment_index").Number(input.market.sentiment_index);
  writer.Key("realized_volatility").Number(input.market.realized_volatility);
  writer.EndObject();
  writer.Key("hints").BeginArray();
  for (const auto& hint : input.hints) {
    WriteCalibrationHintJson(hint, &writer);
  }
  writer.EndArray();
  writer.EndObject();
  return writer.str();
}

bool ParseAnalystOutput(ProducerKind kind,
                        const std::string& text,
                        AnalystReport* out_report,
                        std::string* out_error) {
  if (out_report == nullptr) {
    SetError(out_error, "out_report 为空");
    return false;
  }
  const auto object_text = ExtractJsonObject(text);
  if (!object_text.has_value()) {
    SetError(out_error, "malformed output: no JSON object");
    return false;
  }
  JsonValue root;
  std::string error;
  if (!ParseJson(*object_text, &root, &error)) {
    SetError(out_error, "malformed output: " + error);
    return false;
  }

  AnalystReport report;
  report.producer = kind;
  std::string direction;
  if (!JsonRequireNumber(&root, "confidence", 0.0, 1.0, &report.confidence, &error) ||
      !JsonRequireString(&root, "direction", &direction, &error) ||
      !JsonReadStringArray(&root, "evidence", &report.evidence, &error)) {
    SetError(out_error, "schema violation: " + error);
    return false;
  }
  if (!ParseSignalDirection(direction, &report.direction)) {
    SetError(out_error, "schema violation: direction=" + direction);
    return false;
  }
  report.high_volatility =
      JsonAsBool(JsonObjectField(&root, "high_volatility")).value_or(false);
  *out_report = std::move(report);
  return true;
}

ReportProducer::ReportProducer(ProducerKind kind,
                               std::shared_ptr<const CompletionService> completion,
                               int timeout_ms)
    : kind_(kind), completion_(std::move(completion)), timeout_ms_(timeout_ms) {}

AnalystReport ReportProducer::Produce(const ProducerInput& input,
                                      const CancelToken& cancel) const {
  const auto start = std::chrono::steady_clock::now();
  AgentRequest request;
  request.role = RoleForProducer(kind_);
  request.instructions = RoleInstructions(request.role);
  request.payload_json = BuildProducerPayload(kind_, input);
  request.timeout_ms = timeout_ms_;

  std::string text;
  std::string error;
  if (!completion_->Complete(request, cancel, &text, &error)) {
    return FailedReport(kind_, "completion failed: " + error, ElapsedMs(start));
  }
  AnalystReport report;
  if (!ParseAnalystOutput(kind_, text, &report, &error)) {
    return FailedReport(kind_, error, ElapsedMs(start));
  }
  report.latency_ms = ElapsedMs(start);
  return report;
}

ReportFanout::ReportFanout(std::shared_ptr<const CompletionService> completion,
                           int timeout_ms)
    : timeout_ms_(timeout_ms) {
  for (const ProducerKind kind : kAllProducerKinds) {
    producers_.emplace_back(kind, completion, timeout_ms);
  }
}

std::vector<AnalystReport> ReportFanout::Run(const ProducerInput& input) const {
  // 输入复制一份交给所有工作线程共享（只读），超时后线程仍可安全访问。
  const auto shared_input = std::make_shared<const ProducerInput>(input);
  const auto start = std::chrono::steady_clock::now();
  const auto deadline = start + std::chrono::milliseconds(timeout_ms_);

  std::vector<BoundedTask<AnalystReport>> tasks;
  tasks.reserve(producers_.size());
  for (const auto& producer : producers_) {
    tasks.push_back(BoundedTask<AnalystReport>::Launch(
        [producer, shared_input](const CancelToken& cancel) {
          return producer.Produce(*shared_input, cancel);
        }));
  }

  std::vector<AnalystReport> reports;
  reports.reserve(tasks.size());
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    AnalystReport report;
    std::string error;
    if (!tasks[i].WaitUntil(deadline, &report, &error)) {
      const std::string reason = error == "timeout"
                                     ? "timeout after " + std::to_string(timeout_ms_) + "ms"
                                     : error;
      report = FailedReport(producers_[i].kind(), reason, ElapsedMs(start));
    }
    if (!report.ok()) {
      LogWarn(std::string("PRODUCER_FAILED: producer=") + ToString(report.producer) +
              ", error=" + *report.error);
    }
    reports.push_back(std::move(report));
  }
  return reports;
}

int ReportFanout::CountFailures(const std::vector<AnalystReport>& reports) {
  int failures = 0;
  for (const auto& report : reports) {
    if (!report.ok()) {
      ++failures;
    }
  }
  return failures;
}

}  // namespace basket_engine
