#pragma once

#include <string>

#include "core/json_utils.h"
#include "core/types.h"

namespace basket_engine {

/**
 * @brief 决策审计记录编解码
 *
 * WAL 的 DECISION 行与查询接口共用同一份 JSON 结构，保证“落盘即可查询”。
 * 字段：id/created_at_ms/trigger/action/prior_weights/final_weights/confidence/
 * cost_estimate/nav_usd/rationale/tags/reports/debate/verdict/status/tx_ref/status_detail。
 */
void WriteDecisionJson(const Decision& decision, JsonWriter* writer);
std::string DecisionToJson(const Decision& decision);
bool DecisionFromJson(const JsonValue& value,
                      Decision* out_decision,
                      std::string* out_error);

// ---- 审计链各组成部分：模型 payload 与 WAL 共用 ----

void WriteWeightsJson(const Weights& weights, JsonWriter* writer);
/// 读取 `object[key]` 形式的权重对象；字段缺失视为空权重。
bool WeightsFromJson(const JsonValue* object,
                     const std::string& key,
                     Weights* out_weights,
                     std::string* out_error);
void WriteSnapshotJson(const BasketSnapshot& snapshot, JsonWriter* writer);
bool SnapshotFromJson(const JsonValue* value,
                      BasketSnapshot* out_snapshot,
                      std::string* out_error);
void WriteAnalystReportJson(const AnalystReport& report, JsonWriter* writer);
bool AnalystReportFromJson(const JsonValue& value,
                           AnalystReport* out_report,
                           std::string* out_error);
void WriteDebateThesisJson(const DebateThesis& thesis, JsonWriter* writer);
bool DebateThesisFromJson(const JsonValue* value,
                          DebateThesis* out_thesis,
                          std::string* out_error);
void WriteRiskVerdictJson(const RiskVerdict& verdict, JsonWriter* writer);
void WriteBridgeJobJson(const BridgeJob& job, JsonWriter* writer);
void WriteCalibrationHintJson(const CalibrationHint& hint, JsonWriter* writer);

}  // namespace basket_engine
