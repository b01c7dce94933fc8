#pragma once

#include <string>
#include <vector>

#include "core/types.h"

namespace basket_engine {

/// 运行参数：调度周期、历史窗口、运行模式。
struct SystemConfig {
  std::string mode{"mock"};  // mock | live
  int cycle_interval_sec{3600};
  int tick_interval_ms{1000};
  int decision_history_window{30};
  std::string anchor_token{"USDC"};
};

/// 分析师扇出参数。
struct ProducerConfig {
  int timeout_ms{8000};
  // 失败数达到该值时直接降级 HOLD，不进入辩论。
  int max_failures_before_degraded{2};
  // 注入给分析师的最近校准提示条数。
  int calibration_hint_window{10};
};

/// 对抗辩论参数。
struct DebateConfig {
  // 轮数上限；配置只能调低，不能超过 kMaxDebateRounds。
  int max_rounds{3};
  double convergence_gap{0.15};
  int round_timeout_ms{30000};
  // 单轮程序性拒绝后的最大重试次数（反附和规则/输出非法）。
  int max_round_retries{2};
};

/// 风控硬限制 + 软判断参数。
struct RiskLimits {
  double max_token_weight{0.30};
  double anchor_floor{0.05};
  double max_turnover{0.25};
  int max_tokens_added_removed{3};
  double min_liquidity_usd{100000.0};
  // 权重高于该值视为“非平凡持仓”，需要满足流动性下限。
  double trivial_weight{0.01};
  double max_turnover_24h{0.40};
  // 软判断：按篮子规模限制 24h 调仓次数。
  double small_basket_nav_usd{50000.0};
  int small_basket_max_rebalances_24h{1};
  int max_rebalances_24h{3};
  // 软判断：高波动时把换手缩到该值以内。
  double soft_turnover_cap{0.15};
  bool use_model_soft_judge{false};
  int soft_judge_timeout_ms{20000};
};

/// 决策者参数（费用/收益软门槛与紧急退出）。
struct DecisionConfig {
  double fixed_settlement_fee_usd{2.0};
  double swap_fee_bps{30.0};
  double expected_edge_per_turnover{0.10};
  double fee_benefit_tolerance{2.0};  // 费用超过收益该倍数才视为“明显超过”。
  int emergency_min_bearish_reports{3};
  double emergency_min_confidence{0.80};
  bool use_model_judge{false};
  int judge_timeout_ms{20000};
};

/// 安全系统参数。
struct SafetyConfig {
  double loss_halt_drawdown{0.15};
  int loss_window_sec{86400};
  int idempotency_ttl_sec{900};
  std::string kill_switch_file{"data/KILL_SWITCH"};
};

/// 跨链结算参数（触发策略 + 状态机超时）。
struct SettlementConfig {
  bool enabled{true};
  bool dry_run{false};
  double trigger_threshold_usd{100.0};
  int fallback_interval_sec{7 * 86400};
  double min_job_usd{1.0};
  double max_job_usd{5000.0};
  double max_bridged_24h_usd{20000.0};
  double max_source_congestion{50.0};
  int attestation_poll_interval_ms{15000};
  int attestation_timeout_ms{30 * 60 * 1000};
  int confirm_timeout_ms{10 * 60 * 1000};
  int max_retries{3};
  std::string attestation_base_url{"https://iris-api.circle.com"};
};

/// 质押奖励档位（时间加权乘数，基点表示）。
struct RewardsConfig {
  int silver_days{30};
  int gold_days{90};
  int base_multiplier_bps{10000};
  int silver_multiplier_bps{12500};
  int gold_multiplier_bps{15000};
};

/// 反思引擎参数。
struct ReflectionConfig {
  int delay_hours{24};
  double neutral_band{0.01};
};

/// 模型补全服务参数；密钥只从环境变量读取。
struct LlmConfig {
  std::string provider{"rule_based"};  // rule_based | http
  std::string endpoint{"https://api.openai.com/v1/chat/completions"};
  std::string model{"gpt-4o-mini"};
  std::string api_key_env{"BASKET_ENGINE_LLM_API_KEY"};
};

/// 告警出口参数。
struct NotifyConfig {
  std::string sink{"log"};  // log | webhook
  std::string webhook_url;
  std::string webhook_secret_env{"BASKET_ENGINE_WEBHOOK_SECRET"};
};

/// 应用主配置。
struct AppConfig {
  std::string data_path{"data"};
  SystemConfig system{};
  ProducerConfig producers{};
  DebateConfig debate{};
  RiskLimits risk{};
  DecisionConfig decision{};
  SafetyConfig safety{};
  SettlementConfig settlement{};
  RewardsConfig rewards{};
  ReflectionConfig reflection{};
  LlmConfig llm{};
  NotifyConfig notify{};
};

/// 辩论轮数的硬上限（活性要求，不是调参项）。
inline constexpr int kMaxDebateRounds = 3;

/**
 * @brief 轻量 YAML 配置加载器
 *
 * 仅解析当前项目运行所需字段（两级缩进：section / key）；未知字段忽略。
 * 解析或交叉校验失败返回 `false` 并写入 `out_error`（含行号）。
 */
bool LoadAppConfigFromYaml(const std::string& file_path,
                           AppConfig* out_config,
                           std::string* out_error);

/// 交叉字段校验（加载后自动执行；代码内构造的配置也可单独调用）。
bool ValidateAppConfig(const AppConfig& config, std::string* out_error);

}  // namespace basket_engine
