#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

#include "agents/completion_service.h"
#include "core/json_utils.h"
#include "storage/record_codec.h"

namespace basket_engine {

namespace {

// 离线后端的判读阈值。
constexpr double kDirectionalMove = 0.01;
constexpr double kHighVolatility = 0.05;
constexpr double kIlliquidUsd = 100000.0;
constexpr double kAdvocateConcession = 0.05;

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

double Clamp01(double value) {
  return std::clamp(value, 0.0, 1.0);
}

std::string FormatPct(double value) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(2);
  oss << value * 100.0 << "%";
  return oss.str();
}

std::string FormatNumber(double value) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(2);
  oss << value;
  return oss.str();
}

SignalDirection DirectionOf(double signal) {
  if (signal > kDirectionalMove) {
    return SignalDirection::kBullish;
  }
  if (signal < -kDirectionalMove) {
    return SignalDirection::kBearish;
  }
  return SignalDirection::kNeutral;
}

/// 历史校准：该分析师近期平均准确率，无提示时返回 nullopt。
std::optional<double> MeanAccuracy(const JsonValue& payload, const std::string& producer) {
  const JsonValue* hints = JsonObjectField(&payload, "hints");
  if (hints == nullptr || hints->type != JsonType::kArray) {
    return std::nullopt;
  }
  double sum = 0.0;
  int count = 0;
  for (const auto& hint : hints->array_value) {
    const auto accuracy =
        JsonAsNumber(JsonObjectField(JsonObjectField(&hint, "accuracy"), producer));
    if (accuracy.has_value()) {
      sum += *accuracy;
      ++count;
    }
  }
  if (count == 0) {
    return std::nullopt;
  }
  return sum / count;
}

struct Signal {
  double value{0.0};
  double confidence{0.5};
  bool high_volatility{false};
  std::vector<std::string> evidence;
};

Signal TechnicalSignal(const BasketSnapshot& basket, const JsonValue& market) {
  Signal signal;
  const JsonValue* navs = JsonObjectField(&market, "recent_nav");
  double momentum = 0.0;
  if (navs != nullptr && navs->array_value.size() >= 2) {
    const double first = JsonAsNumber(&navs->array_value.front()).value_or(0.0);
    const double last = JsonAsNumber(&navs->array_value.back()).value_or(0.0);
    if (first > 0.0) {
      momentum = last / first - 1.0;
    }
  }
  double weighted_change = 0.0;
  for (const auto& [token, state] : basket.tokens) {
    weighted_change += state.weight * state.change_24h;
  }
  signal.value = 0.5 * momentum + 0.5 * weighted_change;
  signal.confidence = Clamp01(0.5 + std::fabs(signal.value) * 5.0);
  signal.confidence = std::min(signal.confidence, 0.9);
  signal.evidence.push_back("nav momentum " + FormatPct(momentum));
  signal.evidence.push_back("weighted 24h change " + FormatPct(weighted_change));
  return signal;
}

Signal SentimentSignal(const JsonValue& market) {
  Signal signal;
  const double index =
      JsonAsNumber(JsonObjectField(&market, "sentiment_index")).value_or(0.0);
  signal.value = index;
  signal.confidence = Clamp01(0.5 + 0.4 * std::fabs(index));
  signal.evidence.push_back("sentiment index " + FormatNumber(index));
  return signal;
}

Signal LiquiditySignal(const BasketSnapshot& basket) {
  Signal signal;
  double illiquid_weight = 0.0;
  double min_liquidity = 0.0;
  bool first = true;
  for (const auto& [token, state] : basket.tokens) {
    if (state.liquidity_usd < kIlliquidUsd) {
      illiquid_weight += state.weight;
    }
    if (first || state.liquidity_usd < min_liquidity) {
      min_liquidity = state.liquidity_usd;
      first = false;
    }
  }
  // 流动性不足的权重越多越偏空；全部充足时给出温和的看多。
  signal.value = illiquid_weight > 0.10 ? -illiquid_weight : 0.02;
  signal.confidence = Clamp01(0.55 + illiquid_weight);
  signal.evidence.push_back("illiquid weight " + FormatPct(illiquid_weight));
  signal.evidence.push_back("min token liquidity " + FormatNumber(min_liquidity));
  return signal;
}

Signal MacroSignal(const JsonValue& market) {
  Signal signal;
  const double volatility =
      JsonAsNumber(JsonObjectField(&market, "realized_volatility")).value_or(0.0);
  signal.high_volatility = volatility > kHighVolatility;
  signal.value = signal.high_volatility ? -volatility : kDirectionalMove / 2;
  signal.confidence = Clamp01(0.5 + volatility * 4.0);
  signal.evidence.push_back("realized volatility " + FormatPct(volatility));
  return signal;
}

bool CompleteProducer(const std::string& producer,
                      const JsonValue& payload,
                      std::string* out_text,
                      std::string* out_error) {
  BasketSnapshot basket;
  if (!SnapshotFromJson(JsonObjectField(&payload, "basket"), &basket, out_error)) {
    return false;
  }
  const JsonValue* market = JsonObjectField(&payload, "market");
  const JsonValue empty;
  const JsonValue& market_ref = market != nullptr ? *market : empty;

  Signal signal;
  if (producer == "technical") {
    signal = TechnicalSignal(basket, market_ref);
  } else if (producer == "sentiment") {
    signal = SentimentSignal(market_ref);
  } else if (producer == "liquidity") {
    signal = LiquiditySignal(basket);
  } else {
    signal = MacroSignal(market_ref);
  }

  // 用历史准确率衰减置信度：准确率 1.0 不衰减，0.0 减半。
  const auto accuracy = MeanAccuracy(payload, producer);
  if (accuracy.has_value()) {
    signal.confidence = Clamp01(signal.confidence * (0.5 + 0.5 * *accuracy));
    signal.evidence.push_back("calibrated by accuracy " + FormatNumber(*accuracy));
  }

  JsonWriter writer;
  writer.BeginObject();
  writer.Key("confidence").Number(signal.confidence);
  writer.Key("direction").String(ToString(DirectionOf(signal.value)));
  writer.Key("evidence").BeginArray();
  for (const auto& item : signal.evidence) {
    writer.String(producer + ": " + item);
  }
  writer.EndArray();
  writer.Key("high_volatility").Bool(signal.high_volatility);
  writer.EndObject();
  *out_text = writer.str();
  return true;
}

std::vector<AnalystReport> ReadReports(const JsonValue& payload) {
  std::vector<AnalystReport> reports;
  const JsonValue* items = JsonObjectField(&payload, "reports");
  if (items == nullptr || items->type != JsonType::kArray) {
    return reports;
  }
  for (const auto& item : items->array_value) {
    AnalystReport report;
    if (AnalystReportFromJson(item, &report, nullptr) && report.ok()) {
      reports.push_back(std::move(report));
    }
  }
  return reports;
}

/**
 * @brief 向上涨 token 倾斜的候选权重
 *
 * 1. 按 `1 + 4 * change_24h` 缩放并归一；
 * 2. 逐 token 截断到上限、锚定 token 补足下限，余量按比例回填；
 * 3. 换手超过 80% 上限时向当前权重线性收缩。
 */
Weights TiltWeights(const BasketSnapshot& basket,
                    double max_token_weight,
                    double anchor_floor,
                    double max_turnover) {
  Weights current = basket.weights();
  Weights target;
  double total = 0.0;
  for (const auto& [token, state] : basket.tokens) {
    const double scaled = std::max(0.0, state.weight * (1.0 + 4.0 * state.change_24h));
    target[token] = scaled;
    total += scaled;
  }
  if (total <= 0.0) {
    return current;
  }
  for (auto& [token, weight] : target) {
    weight /= total;
  }

  for (int pass = 0; pass < 8; ++pass) {
    double excess = 0.0;
    double free_weight = 0.0;
    for (auto& [token, weight] : target) {
      if (weight > max_token_weight) {
        excess += weight - max_token_weight;
        weight = max_token_weight;
      }
    }
    auto anchor = target.find(basket.anchor_token);
    if (anchor != target.end() && anchor->second < anchor_floor) {
      excess -= anchor_floor - anchor->second;
      anchor->second = anchor_floor;
    }
    if (std::fabs(excess) < 1e-12) {
      break;
    }
    for (const auto& [token, weight] : target) {
      if (weight < max_token_weight && token != basket.anchor_token) {
        free_weight += weight;
      }
    }
    if (free_weight <= 0.0) {
      break;
    }
    for (auto& [token, weight] : target) {
      if (weight < max_token_weight && token != basket.anchor_token) {
        weight += excess * weight / free_weight;
      }
    }
  }

  const double turnover = Turnover(current, target);
  const double budget = max_turnover * 0.8;
  if (turnover > budget && turnover > 0.0) {
    const double fraction = budget / turnover;
    for (auto& [token, weight] : target) {
      weight = current[token] + fraction * (weight - current[token]);
    }
  }
  // 归一消除浮点残差。
  const double sum = WeightSum(target);
  for (auto& [token, weight] : target) {
    weight /= sum;
  }
  return target;
}

bool CompleteAdvocate(bool for_change,
                      const JsonValue& payload,
                      std::string* out_text,
                      std::string* out_error) {
  BasketSnapshot basket;
  if (!SnapshotFromJson(JsonObjectField(&payload, "basket"), &basket, out_error)) {
    return false;
  }
  const JsonValue* limits = JsonObjectField(&payload, "limits");
  const double max_token_weight =
      JsonAsNumber(JsonObjectField(limits, "max_token_weight")).value_or(0.30);
  const double anchor_floor =
      JsonAsNumber(JsonObjectField(limits, "anchor_floor")).value_or(0.05);
  const double max_turnover =
      JsonAsNumber(JsonObjectField(limits, "max_turnover")).value_or(0.25);
  const int round =
      static_cast<int>(JsonAsNumber(JsonObjectField(&payload, "round")).value_or(1));

  const auto reports = ReadReports(payload);
  double directional_sum = 0.0;
  int directional = 0;
  int neutral = 0;
  int volatile_reports = 0;
  std::vector<std::string> evidence;
  for (const auto& report : reports) {
    if (report.direction == SignalDirection::kNeutral) {
      ++neutral;
    } else {
      directional_sum += report.confidence;
      ++directional;
    }
    if (report.high_volatility) {
      ++volatile_reports;
    }
  }
  const double report_count = std::max<std::size_t>(reports.size(), 1);
  const double change_confidence =
      directional > 0 ? directional_sum / directional : 0.3;
  const double hold_confidence =
      Clamp01(0.35 + 0.3 * neutral / report_count + 0.2 * volatile_reports / report_count);

  // 后续轮次双方各向对方让步固定幅度，保证确定性收敛。
  double confidence = for_change ? change_confidence : hold_confidence;
  const double opponent = for_change ? hold_confidence : change_confidence;
  for (int r = 1; r < round; ++r) {
    confidence += (opponent > confidence ? 1.0 : -1.0) *
                  std::min(kAdvocateConcession, std::fabs(opponent - confidence) / 2.0);
  }

  Weights target;
  DecisionAction action = DecisionAction::kHold;
  if (for_change) {
    action = DecisionAction::kRebalance;
    target = TiltWeights(basket, max_token_weight, anchor_floor, max_turnover);
    for (const auto& report : reports) {
      if (report.direction != SignalDirection::kNeutral) {
        evidence.push_back(std::string(ToString(report.producer)) + " " +
                           ToString(report.direction) + " " +
                           FormatNumber(report.confidence));
      }
    }
    evidence.push_back("turnover " + FormatPct(Turnover(basket.weights(), target)));
  } else {
    target = basket.weights();
    evidence.push_back(std::to_string(neutral) + " neutral reports");
    evidence.push_back(std::to_string(volatile_reports) + " high volatility flags");
  }

  JsonWriter writer;
  writer.BeginObject();
  writer.Key("proposed_action").String(ToString(action));
  writer.Key("target_weights");
  WriteWeightsJson(target, &writer);
  writer.Key("confidence").Number(Clamp01(confidence));
  writer.Key("evidence").BeginArray();
  for (const auto& item : evidence) {
    writer.String(item);
  }
  writer.EndArray();
  writer.EndObject();
  *out_text = writer.str();
  return true;
}

}  // namespace

bool RuleBasedCompletionService::Complete(const AgentRequest& request,
                                          const CancelToken& cancel,
                                          std::string* out_text,
                                          std::string* out_error) const {
  if (out_text == nullptr) {
    SetError(out_error, "out_text 为空");
    return false;
  }
  if (cancel.cancelled()) {
    SetError(out_error, "cancelled");
    return false;
  }
  JsonValue payload;
  if (!ParseJson(request.payload_json, &payload, out_error)) {
    return false;
  }

  switch (request.role) {
    case AgentRole::kTechnicalAnalyst:
      return CompleteProducer("technical", payload, out_text, out_error);
    case AgentRole::kSentimentAnalyst:
      return CompleteProducer("sentiment", payload, out_text, out_error);
    case AgentRole::kLiquidityAnalyst:
      return CompleteProducer("liquidity", payload, out_text, out_error);
    case AgentRole::kMacroAnalyst:
      return CompleteProducer("macro", payload, out_text, out_error);
    case AgentRole::kChangeAdvocate:
      return CompleteAdvocate(true, payload, out_text, out_error);
    case AgentRole::kHoldAdvocate:
      return CompleteAdvocate(false, payload, out_text, out_error);
    case AgentRole::kSoftRiskJudge:
      // 规则判断已在风控闸门内执行，离线后端不追加额外约束。
      *out_text = R"({"veto": false, "reason": "no additional concern", "max_change_fraction": 1.0})";
      return true;
    case AgentRole::kDecisionJudge: {
      // 离线后端直接采纳规则决策者给出的基线。
      const JsonValue* baseline = JsonObjectField(&payload, "baseline");
      JsonWriter writer;
      writer.BeginObject();
      writer.Key("action").String(
          JsonAsString(JsonObjectField(baseline, "action")).value_or("HOLD"));
      writer.Key("confidence").Number(
          JsonAsNumber(JsonObjectField(baseline, "confidence")).value_or(0.0));
      writer.Key("rationale").String(
          JsonAsString(JsonObjectField(baseline, "rationale")).value_or("baseline"));
      writer.EndObject();
      *out_text = writer.str();
      return true;
    }
  }
  SetError(out_error, "未知角色");
  return false;
}

}  // namespace basket_engine
