#include "core/config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <variant>

namespace basket_engine {

namespace {

// 以下工具函数用于“轻量 YAML 解析”：
// - 通过缩进识别 section；
// - 仅覆盖当前项目使用到的配置字段。
std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  while (begin < text.size() &&
         std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string StripInlineComment(const std::string& line) {
  // 仅剔除非引号上下文中的 `#` 注释，避免误伤 URL 片段等字符串内容。
  bool in_single_quotes = false;
  bool in_double_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '\'' && !in_double_quotes) {
      in_single_quotes = !in_single_quotes;
      continue;
    }
    if (ch == '"' && !in_single_quotes) {
      in_double_quotes = !in_double_quotes;
      continue;
    }
    if (ch == '#' && !in_single_quotes && !in_double_quotes) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& text) {
  if (text.size() < 2) {
    return text;
  }
  const bool single_quoted = text.front() == '\'' && text.back() == '\'';
  const bool double_quoted = text.front() == '"' && text.back() == '"';
  if (single_quoted || double_quoted) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

bool ParseDouble(const std::string& text, double* out_value) {
  std::istringstream iss(text);
  double value = 0.0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseInt(const std::string& text, int* out_value) {
  std::istringstream iss(text);
  int value = 0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseBool(const std::string& text, bool* out_value) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    *out_value = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    *out_value = false;
    return true;
  }
  return false;
}

// 字段绑定：section.key -> AppConfig 内某个成员。
using FieldRef = std::variant<double*, int*, bool*, std::string*>;

struct FieldBinding {
  const char* section;
  const char* key;
  FieldRef target;
};

std::vector<FieldBinding> BuildBindings(AppConfig* c) {
  return {
      {"storage", "data_path", &c->data_path},
      {"system", "mode", &c->system.mode},
      {"system", "cycle_interval_sec", &c->system.cycle_interval_sec},
      {"system", "tick_interval_ms", &c->system.tick_interval_ms},
      {"system", "decision_history_window", &c->system.decision_history_window},
      {"system", "anchor_token", &c->system.anchor_token},
      {"producers", "timeout_ms", &c->producers.timeout_ms},
      {"producers", "max_failures_before_degraded",
       &c->producers.max_failures_before_degraded},
      {"producers", "calibration_hint_window",
       &c->producers.calibration_hint_window},
      {"debate", "max_rounds", &c->debate.max_rounds},
      {"debate", "convergence_gap", &c->debate.convergence_gap},
      {"debate", "round_timeout_ms", &c->debate.round_timeout_ms},
      {"debate", "max_round_retries", &c->debate.max_round_retries},
      {"risk", "max_token_weight", &c->risk.max_token_weight},
      {"risk", "anchor_floor", &c->risk.anchor_floor},
      {"risk", "max_turnover", &c->risk.max_turnover},
      {"risk", "max_tokens_added_removed", &c->risk.max_tokens_added_removed},
      {"risk", "min_liquidity_usd", &c->risk.min_liquidity_usd},
      {"risk", "trivial_weight", &c->risk.trivial_weight},
      {"risk", "max_turnover_24h", &c->risk.max_turnover_24h},
      {"risk", "small_basket_nav_usd", &c->risk.small_basket_nav_usd},
      {"risk", "small_basket_max_rebalances_24h",
       &c->risk.small_basket_max_rebalances_24h},
      {"risk", "max_rebalances_24h", &c->risk.max_rebalances_24h},
      {"risk", "soft_turnover_cap", &c->risk.soft_turnover_cap},
      {"risk", "use_model_soft_judge", &c->risk.use_model_soft_judge},
      {"risk", "soft_judge_timeout_ms", &c->risk.soft_judge_timeout_ms},
      {"decision", "fixed_settlement_fee_usd",
       &c->decision.fixed_settlement_fee_usd},
      {"decision", "swap_fee_bps", &c->decision.swap_fee_bps},
      {"decision", "expected_edge_per_turnover",
       &c->decision.expected_edge_per_turnover},
      {"decision", "fee_benefit_tolerance", &c->decision.fee_benefit_tolerance},
      {"decision", "emergency_min_bearish_reports",
       &c->decision.emergency_min_bearish_reports},
      {"decision", "emergency_min_confidence",
       &c->decision.emergency_min_confidence},
      {"decision", "use_model_judge", &c->decision.use_model_judge},
      {"decision", "judge_timeout_ms", &c->decision.judge_timeout_ms},
      {"safety", "loss_halt_drawdown", &c->safety.loss_halt_drawdown},
      {"safety", "loss_window_sec", &c->safety.loss_window_sec},
      {"safety", "idempotency_ttl_sec", &c->safety.idempotency_ttl_sec},
      {"safety", "kill_switch_file", &c->safety.kill_switch_file},
      {"settlement", "enabled", &c->settlement.enabled},
      {"settlement", "dry_run", &c->settlement.dry_run},
      {"settlement", "trigger_threshold_usd",
       &c->settlement.trigger_threshold_usd},
      {"settlement", "fallback_interval_sec",
       &c->settlement.fallback_interval_sec},
      {"settlement", "min_job_usd", &c->settlement.min_job_usd},
      {"settlement", "max_job_usd", &c->settlement.max_job_usd},
      {"settlement", "max_bridged_24h_usd", &c->settlement.max_bridged_24h_usd},
      {"settlement", "max_source_congestion",
       &c->settlement.max_source_congestion},
      {"settlement", "attestation_poll_interval_ms",
       &c->settlement.attestation_poll_interval_ms},
      {"settlement", "attestation_timeout_ms",
       &c->settlement.attestation_timeout_ms},
      {"settlement", "confirm_timeout_ms", &c->settlement.confirm_timeout_ms},
      {"settlement", "max_retries", &c->settlement.max_retries},
      {"settlement", "attestation_base_url",
       &c->settlement.attestation_base_url},
      {"rewards", "silver_days", &c->rewards.silver_days},
      {"rewards", "gold_days", &c->rewards.gold_days},
      {"rewards", "base_multiplier_bps", &c->rewards.base_multiplier_bps},
      {"rewards", "silver_multiplier_bps", &c->rewards.silver_multiplier_bps},
      {"rewards", "gold_multiplier_bps", &c->rewards.gold_multiplier_bps},
      {"reflection", "delay_hours", &c->reflection.delay_hours},
      {"reflection", "neutral_band", &c->reflection.neutral_band},
      {"llm", "provider", &c->llm.provider},
      {"llm", "endpoint", &c->llm.endpoint},
      {"llm", "model", &c->llm.model},
      {"llm", "api_key_env", &c->llm.api_key_env},
      {"notify", "sink", &c->notify.sink},
      {"notify", "webhook_url", &c->notify.webhook_url},
      {"notify", "webhook_secret_env", &c->notify.webhook_secret_env},
  };
}

bool AssignField(const FieldRef& target, const std::string& value) {
  if (auto* p = std::get_if<double*>(&target)) {
    return ParseDouble(value, *p);
  }
  if (auto* p = std::get_if<int*>(&target)) {
    return ParseInt(value, *p);
  }
  if (auto* p = std::get_if<bool*>(&target)) {
    return ParseBool(value, *p);
  }
  if (auto* p = std::get_if<std::string*>(&target)) {
    **p = value;
    return true;
  }
  return false;
}

bool Reject(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

}  // namespace

bool LoadAppConfigFromYaml(const std::string& file_path,
                           AppConfig* out_config,
                           std::string* out_error) {
  if (out_config == nullptr) {
    return Reject(out_error, "out_config 为空");
  }

  std::ifstream input(file_path);
  if (!input.is_open()) {
    return Reject(out_error, "无法打开配置文件: " + file_path);
  }

  // 在副本上解析，任何错误都不污染调用方的配置。
  AppConfig config = *out_config;
  const std::vector<FieldBinding> bindings = BuildBindings(&config);
  std::string current_section;
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    const std::string no_comment = Trim(StripInlineComment(line));
    if (no_comment.empty()) {
      continue;
    }
    const std::size_t indent = line.find_first_not_of(' ');
    if (indent == std::string::npos) {
      continue;
    }
    if (indent == 0 && no_comment.back() == ':') {
      current_section = Trim(no_comment.substr(0, no_comment.size() - 1));
      continue;
    }

    const std::size_t colon_pos = no_comment.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }
    const std::string key = Trim(no_comment.substr(0, colon_pos));
    const std::string raw_value = Trim(no_comment.substr(colon_pos + 1));
    if (raw_value.empty()) {
      continue;
    }
    const std::string value = Unquote(raw_value);
    const std::string section = indent == 0 ? std::string() : current_section;

    const auto it = std::find_if(
        bindings.begin(), bindings.end(), [&](const FieldBinding& binding) {
          return section == binding.section && key == binding.key;
        });
    if (it == bindings.end()) {
      continue;
    }
    if (!AssignField(it->target, value)) {
      return Reject(out_error, section + "." + key + " 解析失败，行号: " +
                                   std::to_string(line_no));
    }
  }

  if (!ValidateAppConfig(config, out_error)) {
    return false;
  }
  *out_config = config;
  return true;
}

bool ValidateAppConfig(const AppConfig& config, std::string* out_error) {
  if (config.system.mode != "mock" && config.system.mode != "live") {
    return Reject(out_error, "system.mode 仅支持 mock/live");
  }
  if (config.system.cycle_interval_sec <= 0) {
    return Reject(out_error, "system.cycle_interval_sec 必须大于 0");
  }
  if (config.system.tick_interval_ms <= 0) {
    return Reject(out_error, "system.tick_interval_ms 必须大于 0");
  }
  if (config.system.decision_history_window <= 0) {
    return Reject(out_error, "system.decision_history_window 必须大于 0");
  }
  if (config.system.anchor_token.empty()) {
    return Reject(out_error, "system.anchor_token 不能为空");
  }
  if (config.producers.timeout_ms <= 0) {
    return Reject(out_error, "producers.timeout_ms 必须大于 0");
  }
  if (config.producers.max_failures_before_degraded < 1 ||
      config.producers.max_failures_before_degraded >
          static_cast<int>(kAllProducerKinds.size())) {
    return Reject(out_error, "producers.max_failures_before_degraded 必须在 [1,4]");
  }
  if (config.producers.calibration_hint_window < 0) {
    return Reject(out_error, "producers.calibration_hint_window 不能为负数");
  }
  if (config.debate.max_rounds < 1 || config.debate.max_rounds > kMaxDebateRounds) {
    return Reject(out_error, "debate.max_rounds 必须在 [1,3]");
  }
  if (config.debate.convergence_gap < 0.0 || config.debate.convergence_gap > 1.0) {
    return Reject(out_error, "debate.convergence_gap 必须在 [0,1]");
  }
  if (config.debate.round_timeout_ms <= 0 || config.debate.max_round_retries < 0) {
    return Reject(out_error, "debate 超时/重试参数非法");
  }

  const RiskLimits& risk = config.risk;
  if (risk.max_token_weight <= 0.0 || risk.max_token_weight > 1.0) {
    return Reject(out_error, "risk.max_token_weight 必须在 (0,1]");
  }
  if (risk.anchor_floor < 0.0 || risk.anchor_floor > risk.max_token_weight) {
    return Reject(out_error, "risk.anchor_floor 必须在 [0, max_token_weight]");
  }
  if (risk.max_turnover <= 0.0 || risk.max_turnover > 1.0 ||
      risk.max_turnover_24h < risk.max_turnover) {
    return Reject(out_error, "risk 换手上限非法（24h 上限不能小于单次上限）");
  }
  if (risk.max_tokens_added_removed < 0 || risk.min_liquidity_usd < 0.0 ||
      risk.trivial_weight < 0.0) {
    return Reject(out_error, "risk 数量/流动性参数不能为负数");
  }
  if (risk.small_basket_max_rebalances_24h < 0 || risk.max_rebalances_24h < 0) {
    return Reject(out_error, "risk 调仓频率参数不能为负数");
  }
  if (risk.soft_turnover_cap <= 0.0 || risk.soft_turnover_cap > risk.max_turnover) {
    return Reject(out_error, "risk.soft_turnover_cap 必须在 (0, max_turnover]");
  }

  if (config.decision.fixed_settlement_fee_usd < 0.0 ||
      config.decision.swap_fee_bps < 0.0 ||
      config.decision.expected_edge_per_turnover < 0.0 ||
      config.decision.fee_benefit_tolerance <= 0.0) {
    return Reject(out_error, "decision 费用参数非法");
  }
  if (config.decision.emergency_min_bearish_reports < 1 ||
      config.decision.emergency_min_confidence < 0.0 ||
      config.decision.emergency_min_confidence > 1.0) {
    return Reject(out_error, "decision 紧急退出参数非法");
  }

  if (config.safety.loss_halt_drawdown <= 0.0 ||
      config.safety.loss_halt_drawdown >= 1.0) {
    return Reject(out_error, "safety.loss_halt_drawdown 必须在 (0,1)");
  }
  if (config.safety.loss_window_sec <= 0 || config.safety.idempotency_ttl_sec <= 0) {
    return Reject(out_error, "safety 窗口/TTL 必须大于 0");
  }

  const SettlementConfig& s = config.settlement;
  if (s.min_job_usd <= 0.0 || s.max_job_usd < s.min_job_usd ||
      s.max_bridged_24h_usd < s.max_job_usd) {
    return Reject(out_error, "settlement 金额上下限非法");
  }
  if (s.trigger_threshold_usd < s.min_job_usd) {
    return Reject(out_error, "settlement.trigger_threshold_usd 不能小于 min_job_usd");
  }
  if (s.fallback_interval_sec <= 0 || s.attestation_poll_interval_ms <= 0 ||
      s.attestation_timeout_ms < s.attestation_poll_interval_ms ||
      s.confirm_timeout_ms <= 0) {
    return Reject(out_error, "settlement 轮询/超时参数非法");
  }
  if (s.max_retries < 0 || s.max_source_congestion < 0.0) {
    return Reject(out_error, "settlement 重试/拥堵参数不能为负数");
  }

  const RewardsConfig& r = config.rewards;
  if (r.silver_days <= 0 || r.gold_days <= r.silver_days) {
    return Reject(out_error, "rewards 档位天数必须满足 0 < silver < gold");
  }
  if (r.base_multiplier_bps <= 0 || r.silver_multiplier_bps < r.base_multiplier_bps ||
      r.gold_multiplier_bps < r.silver_multiplier_bps) {
    return Reject(out_error, "rewards 乘数必须单调不减且为正");
  }

  if (config.reflection.delay_hours < 24 || config.reflection.delay_hours > 72) {
    return Reject(out_error, "reflection.delay_hours 必须在 [24,72]");
  }
  if (config.reflection.neutral_band <= 0.0) {
    return Reject(out_error, "reflection.neutral_band 必须大于 0");
  }
  if (config.llm.provider != "rule_based" && config.llm.provider != "http") {
    return Reject(out_error, "llm.provider 仅支持 rule_based/http");
  }
  if (config.notify.sink != "log" && config.notify.sink != "webhook") {
    return Reject(out_error, "notify.sink 仅支持 log/webhook");
  }
  if (config.notify.sink == "webhook" && config.notify.webhook_url.empty()) {
    return Reject(out_error, "notify.webhook_url 不能为空");
  }
  return true;
}

}  // namespace basket_engine
