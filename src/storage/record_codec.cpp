#include "storage/record_codec.h"

#include <cmath>
#include <utility>
#include <vector>

namespace basket_engine {

namespace {

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

void WriteStringArray(const std::vector<std::string>& values, JsonWriter* writer) {
  writer->BeginArray();
  for (const auto& value : values) {
    writer->String(value);
  }
  writer->EndArray();
}

}  // namespace

void WriteAnalystReportJson(const AnalystReport& report, JsonWriter* writer) {
  writer->BeginObject();
  writer->Key("producer").String(ToString(report.producer));
  writer->Key("confidence").Number(report.confidence);
  writer->Key("direction").String(ToString(report.direction));
  writer->Key("evidence");
  WriteStringArray(report.evidence, writer);
  writer->Key("high_volatility").Bool(report.high_volatility);
  writer->Key("error");
  if (report.error.has_value()) {
    writer->String(*report.error);
  } else {
    writer->Null();
  }
  writer->Key("latency_ms").Integer(report.latency_ms);
  writer->EndObject();
}

void WriteDebateThesisJson(const DebateThesis& thesis, JsonWriter* writer) {
  writer->BeginObject();
  writer->Key("position").String(ToString(thesis.position));
  writer->Key("proposed_action").String(ToString(thesis.proposed_action));
  writer->Key("target_weights");
  WriteWeightsJson(thesis.target_weights, writer);
  writer->Key("confidence").Number(thesis.confidence);
  writer->Key("evidence");
  WriteStringArray(thesis.evidence, writer);
  writer->Key("round").Integer(thesis.round);
  writer->Key("rejected_attempts").Integer(thesis.rejected_attempts);
  writer->Key("carried_forward").Bool(thesis.carried_forward);
  writer->EndObject();
}

void WriteRiskVerdictJson(const RiskVerdict& verdict, JsonWriter* writer) {
  writer->BeginObject();
  writer->Key("approved").Bool(verdict.approved);
  writer->Key("violations");
  WriteStringArray(verdict.violations, writer);
  writer->Key("adjusted_weights");
  if (verdict.adjusted_weights.has_value()) {
    WriteWeightsJson(*verdict.adjusted_weights, writer);
  } else {
    writer->Null();
  }
  writer->Key("max_allowed_change").Number(verdict.max_allowed_change);
  writer->Key("soft_checked").Bool(verdict.soft_checked);
  writer->Key("soft_reason").String(verdict.soft_reason);
  writer->EndObject();
}

namespace {

bool ReadWeights(const JsonValue* object,
                 const std::string& key,
                 Weights* out_weights,
                 std::string* out_error) {
  std::vector<std::pair<std::string, double>> entries;
  if (!JsonReadNumberMap(object, key, &entries, out_error)) {
    return false;
  }
  out_weights->clear();
  for (const auto& [token, weight] : entries) {
    (*out_weights)[token] = weight;
  }
  return true;
}

std::int64_t ReadInt(const JsonValue* object, const std::string& key) {
  const auto number = JsonAsNumber(JsonObjectField(object, key));
  if (!number.has_value() || !std::isfinite(*number)) {
    return 0;
  }
  return static_cast<std::int64_t>(*number);
}

double ReadDouble(const JsonValue* object, const std::string& key) {
  return JsonAsNumber(JsonObjectField(object, key)).value_or(0.0);
}

}  // namespace

bool AnalystReportFromJson(const JsonValue& value,
                           AnalystReport* out_report,
                           std::string* out_error) {
  AnalystReport report;
  std::string text;
  if (!JsonRequireString(&value, "producer", &text, out_error) ||
      !ParseProducerKind(text, &report.producer)) {
    SetError(out_error, "report.producer 非法");
    return false;
  }
  if (!JsonRequireString(&value, "direction", &text, out_error) ||
      !ParseSignalDirection(text, &report.direction)) {
    SetError(out_error, "report.direction 非法");
    return false;
  }
  report.confidence = ReadDouble(&value, "confidence");
  if (!JsonReadStringArray(&value, "evidence", &report.evidence, out_error)) {
    return false;
  }
  report.high_volatility =
      JsonAsBool(JsonObjectField(&value, "high_volatility")).value_or(false);
  const auto error = JsonAsString(JsonObjectField(&value, "error"));
  if (error.has_value()) {
    report.error = *error;
  }
  report.latency_ms = ReadInt(&value, "latency_ms");
  *out_report = std::move(report);
  return true;
}

bool DebateThesisFromJson(const JsonValue* value,
                          DebateThesis* out_thesis,
                          std::string* out_error) {
  if (value == nullptr || value->type != JsonType::kObject) {
    SetError(out_error, "thesis 缺失");
    return false;
  }
  DebateThesis thesis;
  std::string text;
  if (!JsonRequireString(value, "position", &text, out_error)) {
    return false;
  }
  thesis.position = text == ToString(DebatePosition::kAdvocateForChange)
                        ? DebatePosition::kAdvocateForChange
                        : DebatePosition::kAdvocateForHold;
  if (!JsonRequireString(value, "proposed_action", &text, out_error) ||
      !ParseDecisionAction(text, &thesis.proposed_action)) {
    SetError(out_error, "thesis.proposed_action 非法");
    return false;
  }
  if (!ReadWeights(value, "target_weights", &thesis.target_weights, out_error) ||
      !JsonReadStringArray(value, "evidence", &thesis.evidence, out_error)) {
    return false;
  }
  thesis.confidence = ReadDouble(value, "confidence");
  thesis.round = static_cast<int>(ReadInt(value, "round"));
  thesis.rejected_attempts = static_cast<int>(ReadInt(value, "rejected_attempts"));
  thesis.carried_forward =
      JsonAsBool(JsonObjectField(value, "carried_forward")).value_or(false);
  *out_thesis = std::move(thesis);
  return true;
}

namespace {

bool ReadVerdict(const JsonValue* value,
                 RiskVerdict* out_verdict,
                 std::string* out_error) {
  RiskVerdict verdict;
  verdict.approved = JsonAsBool(JsonObjectField(value, "approved")).value_or(false);
  if (!JsonReadStringArray(value, "violations", &verdict.violations, out_error)) {
    return false;
  }
  const JsonValue* adjusted = JsonObjectField(value, "adjusted_weights");
  if (adjusted != nullptr && adjusted->type == JsonType::kObject) {
    Weights weights;
    if (!ReadWeights(value, "adjusted_weights", &weights, out_error)) {
      return false;
    }
    verdict.adjusted_weights = std::move(weights);
  }
  verdict.max_allowed_change = ReadDouble(value, "max_allowed_change");
  verdict.soft_checked =
      JsonAsBool(JsonObjectField(value, "soft_checked")).value_or(false);
  verdict.soft_reason =
      JsonAsString(JsonObjectField(value, "soft_reason")).value_or("");
  *out_verdict = std::move(verdict);
  return true;
}

}  // namespace

void WriteWeightsJson(const Weights& weights, JsonWriter* writer) {
  writer->BeginObject();
  for (const auto& [token, weight] : weights) {
    writer->Key(token).Number(weight);
  }
  writer->EndObject();
}

void WriteSnapshotJson(const BasketSnapshot& snapshot, JsonWriter* writer) {
  writer->BeginObject();
  writer->Key("ts_ms").Integer(snapshot.ts_ms);
  writer->Key("nav_usd").Number(snapshot.nav_usd);
  writer->Key("anchor_token").String(snapshot.anchor_token);
  writer->Key("tokens").BeginObject();
  for (const auto& [token, state] : snapshot.tokens) {
    writer->Key(token).BeginObject();
    writer->Key("weight").Number(state.weight);
    writer->Key("price_usd").Number(state.price_usd);
    writer->Key("liquidity_usd").Number(state.liquidity_usd);
    writer->Key("change_24h").Number(state.change_24h);
    writer->EndObject();
  }
  writer->EndObject();
  writer->EndObject();
}

bool SnapshotFromJson(const JsonValue* value,
                      BasketSnapshot* out_snapshot,
                      std::string* out_error) {
  const JsonValue* tokens = JsonObjectField(value, "tokens");
  if (out_snapshot == nullptr || tokens == nullptr ||
      tokens->type != JsonType::kObject) {
    SetError(out_error, "basket.tokens 缺失");
    return false;
  }
  BasketSnapshot snapshot;
  snapshot.ts_ms = ReadInt(value, "ts_ms");
  snapshot.nav_usd = ReadDouble(value, "nav_usd");
  snapshot.anchor_token =
      JsonAsString(JsonObjectField(value, "anchor_token")).value_or("");
  for (const auto& [token, item] : tokens->object_value) {
    TokenState state;
    state.weight = ReadDouble(&item, "weight");
    state.price_usd = ReadDouble(&item, "price_usd");
    state.liquidity_usd = ReadDouble(&item, "liquidity_usd");
    state.change_24h = ReadDouble(&item, "change_24h");
    snapshot.tokens[token] = state;
  }
  *out_snapshot = std::move(snapshot);
  return true;
}

bool WeightsFromJson(const JsonValue* object,
                     const std::string& key,
                     Weights* out_weights,
                     std::string* out_error) {
  if (out_weights == nullptr) {
    SetError(out_error, "out_weights 为空");
    return false;
  }
  return ReadWeights(object, key, out_weights, out_error);
}

void WriteDecisionJson(const Decision& decision, JsonWriter* writer) {
  writer->BeginObject();
  writer->Key("id").String(decision.id);
  writer->Key("created_at_ms").Integer(decision.created_at_ms);
  writer->Key("trigger").String(ToString(decision.trigger));
  writer->Key("action").String(ToString(decision.action));
  writer->Key("prior_weights");
  WriteWeightsJson(decision.prior_weights, writer);
  writer->Key("final_weights");
  WriteWeightsJson(decision.final_weights, writer);
  writer->Key("confidence").Number(decision.confidence);
  writer->Key("cost_estimate").Number(decision.cost_estimate);
  writer->Key("nav_usd").Number(decision.nav_usd);
  writer->Key("rationale").String(decision.rationale);
  writer->Key("tags");
  WriteStringArray(decision.tags, writer);
  writer->Key("reports").BeginArray();
  for (const auto& report : decision.reports) {
    WriteAnalystReportJson(report, writer);
  }
  writer->EndArray();
  writer->Key("debate").BeginArray();
  for (const auto& round : decision.debate) {
    writer->BeginObject();
    writer->Key("round").Integer(round.round);
    writer->Key("for_change");
    WriteDebateThesisJson(round.for_change, writer);
    writer->Key("for_hold");
    WriteDebateThesisJson(round.for_hold, writer);
    writer->EndObject();
  }
  writer->EndArray();
  writer->Key("verdict");
  if (decision.verdict.has_value()) {
    WriteRiskVerdictJson(*decision.verdict, writer);
  } else {
    writer->Null();
  }
  writer->Key("status").String(ToString(decision.status));
  writer->Key("tx_ref");
  if (decision.tx_ref.has_value()) {
    writer->String(*decision.tx_ref);
  } else {
    writer->Null();
  }
  writer->Key("status_detail").String(decision.status_detail);
  writer->EndObject();
}

std::string DecisionToJson(const Decision& decision) {
  JsonWriter writer;
  WriteDecisionJson(decision, &writer);
  return writer.str();
}

bool DecisionFromJson(const JsonValue& value,
                      Decision* out_decision,
                      std::string* out_error) {
  if (out_decision == nullptr || value.type != JsonType::kObject) {
    SetError(out_error, "决策记录不是 JSON 对象");
    return false;
  }
  Decision decision;
  std::string text;
  if (!JsonRequireString(&value, "id", &decision.id, out_error)) {
    return false;
  }
  decision.created_at_ms = ReadInt(&value, "created_at_ms");
  if (!JsonRequireString(&value, "trigger", &text, out_error) ||
      !ParseTriggerReason(text, &decision.trigger)) {
    SetError(out_error, "decision.trigger 非法");
    return false;
  }
  if (!JsonRequireString(&value, "action", &text, out_error) ||
      !ParseDecisionAction(text, &decision.action)) {
    SetError(out_error, "decision.action 非法");
    return false;
  }
  if (!JsonRequireString(&value, "status", &text, out_error) ||
      !ParseExecutionStatus(text, &decision.status)) {
    SetError(out_error, "decision.status 非法");
    return false;
  }
  if (!ReadWeights(&value, "prior_weights", &decision.prior_weights, out_error) ||
      !ReadWeights(&value, "final_weights", &decision.final_weights, out_error) ||
      !JsonReadStringArray(&value, "tags", &decision.tags, out_error)) {
    return false;
  }
  decision.confidence = ReadDouble(&value, "confidence");
  decision.cost_estimate = ReadDouble(&value, "cost_estimate");
  decision.nav_usd = ReadDouble(&value, "nav_usd");
  decision.rationale = JsonAsString(JsonObjectField(&value, "rationale")).value_or("");
  decision.status_detail =
      JsonAsString(JsonObjectField(&value, "status_detail")).value_or("");
  const auto tx_ref = JsonAsString(JsonObjectField(&value, "tx_ref"));
  if (tx_ref.has_value()) {
    decision.tx_ref = *tx_ref;
  }

  const JsonValue* reports = JsonObjectField(&value, "reports");
  if (reports != nullptr && reports->type == JsonType::kArray) {
    for (const auto& item : reports->array_value) {
      AnalystReport report;
      if (!AnalystReportFromJson(item, &report, out_error)) {
        return false;
      }
      decision.reports.push_back(std::move(report));
    }
  }
  const JsonValue* debate = JsonObjectField(&value, "debate");
  if (debate != nullptr && debate->type == JsonType::kArray) {
    for (const auto& item : debate->array_value) {
      DebateRound round;
      round.round = static_cast<int>(ReadInt(&item, "round"));
      if (!DebateThesisFromJson(JsonObjectField(&item, "for_change"),
                                &round.for_change, out_error) ||
          !DebateThesisFromJson(JsonObjectField(&item, "for_hold"),
                                &round.for_hold, out_error)) {
        return false;
      }
      decision.debate.push_back(std::move(round));
    }
  }
  const JsonValue* verdict = JsonObjectField(&value, "verdict");
  if (verdict != nullptr && verdict->type == JsonType::kObject) {
    RiskVerdict parsed;
    if (!ReadVerdict(verdict, &parsed, out_error)) {
      return false;
    }
    decision.verdict = std::move(parsed);
  }
  *out_decision = std::move(decision);
  return true;
}

void WriteBridgeJobJson(const BridgeJob& job, JsonWriter* writer) {
  writer->BeginObject();
  writer->Key("id").String(job.id);
  writer->Key("amount_raw").Unsigned(job.amount_raw);
  writer->Key("amount_usd").Number(RawToUsd(job.amount_raw));
  writer->Key("state").String(ToString(job.state));
  writer->Key("source_tx_ref").String(job.source_tx_ref);
  writer->Key("message_hash").String(job.message_hash);
  writer->Key("attestation_requested_ms").Integer(job.attestation_requested_ms);
  writer->Key("attestation").String(job.attestation);
  writer->Key("dest_tx_ref").String(job.dest_tx_ref);
  writer->Key("deposit_tx_ref").String(job.deposit_tx_ref);
  writer->Key("error").String(job.error);
  writer->Key("failed_step").String(job.failed_step);
  writer->Key("retry_count").Integer(job.retry_count);
  writer->Key("created_at_ms").Integer(job.created_at_ms);
  writer->Key("updated_at_ms").Integer(job.updated_at_ms);
  writer->EndObject();
}

void WriteCalibrationHintJson(const CalibrationHint& hint, JsonWriter* writer) {
  writer->BeginObject();
  writer->Key("decision_id").String(hint.decision_id);
  writer->Key("created_at_ms").Integer(hint.created_at_ms);
  writer->Key("accuracy").BeginObject();
  for (const auto& [producer, accuracy] : hint.accuracy) {
    writer->Key(ToString(producer)).Number(accuracy);
  }
  writer->EndObject();
  writer->Key("best_producer").String(hint.best_producer);
  writer->Key("worst_producer").String(hint.worst_producer);
  writer->Key("realized_nav_change").Number(hint.realized_nav_change);
  writer->Key("note").String(hint.note);
  writer->EndObject();
}

}  // namespace basket_engine
