#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "app/engine_app.h"
#include "core/config.h"
#include "core/log.h"
#include "core/types.h"

namespace {

struct StakeRequest {
  std::string owner;
  double amount_usd{0.0};
};

struct RuntimeOptions {
  std::string config_path{"config/default.yaml"};
  std::optional<int> cycles;
  bool run_forever{false};
  basket_engine::TriggerReason trigger{basket_engine::TriggerReason::kScheduled};
  std::string retry_job;
  std::string cancel_job;
  bool clear_halt{false};
  std::vector<StakeRequest> stakes;
  std::string query;
  bool valid{true};
};

bool ParseNonNegativeInt(const std::string& raw, int* out_value) {
  if (out_value == nullptr || raw.empty()) {
    return false;
  }
  try {
    std::size_t consumed = 0;
    const int parsed = std::stoi(raw, &consumed);
    if (consumed != raw.size() || parsed < 0) {
      return false;
    }
    *out_value = parsed;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool ParseStake(const std::string& raw, StakeRequest* out_request) {
  const auto colon = raw.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= raw.size()) {
    return false;
  }
  try {
    std::size_t consumed = 0;
    const std::string amount_text = raw.substr(colon + 1);
    const double amount = std::stod(amount_text, &consumed);
    if (consumed != amount_text.size() || !(amount > 0.0)) {
      return false;
    }
    out_request->owner = raw.substr(0, colon);
    out_request->amount_usd = amount;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

// 命令行触发原因使用短名：scheduled | loss | sentiment。
bool ParseTrigger(const std::string& raw, basket_engine::TriggerReason* out_trigger) {
  if (raw == "scheduled") {
    *out_trigger = basket_engine::TriggerReason::kScheduled;
    return true;
  }
  if (raw == "loss") {
    *out_trigger = basket_engine::TriggerReason::kLossEvent;
    return true;
  }
  if (raw == "sentiment") {
    *out_trigger = basket_engine::TriggerReason::kSentimentEvent;
    return true;
  }
  return false;
}

std::int64_t CurrentTimestampMs() {
  const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  return now.time_since_epoch().count();
}

bool StartsWith(const std::string& arg, const std::string& prefix, std::string* out_value) {
  if (arg.rfind(prefix, 0) != 0) {
    return false;
  }
  *out_value = arg.substr(prefix.size());
  return true;
}

RuntimeOptions ParseOptions(int argc, char** argv) {
  RuntimeOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string value;
    if (StartsWith(arg, "--config=", &value)) {
      options.config_path = value;
      continue;
    }
    if (StartsWith(arg, "--cycles=", &value)) {
      int parsed = 0;
      if (!ParseNonNegativeInt(value, &parsed)) {
        basket_engine::LogError("--cycles 参数非法: " + value);
        options.valid = false;
        continue;
      }
      options.cycles = parsed;
      continue;
    }
    if (StartsWith(arg, "--trigger=", &value)) {
      if (!ParseTrigger(value, &options.trigger)) {
        basket_engine::LogError("--trigger 仅支持 scheduled/loss/sentiment: " + value);
        options.valid = false;
      }
      continue;
    }
    if (arg == "--run_forever" || arg == "--run-forever") {
      options.run_forever = true;
      continue;
    }
    if (StartsWith(arg, "--retry_job=", &value)) {
      options.retry_job = value;
      continue;
    }
    if (StartsWith(arg, "--cancel_job=", &value)) {
      options.cancel_job = value;
      continue;
    }
    if (arg == "--clear_halt") {
      options.clear_halt = true;
      continue;
    }
    if (StartsWith(arg, "--stake=", &value)) {
      StakeRequest request;
      if (!ParseStake(value, &request)) {
        basket_engine::LogError("--stake 格式应为 <owner>:<amount_usd>: " + value);
        options.valid = false;
        continue;
      }
      options.stakes.push_back(std::move(request));
      continue;
    }
    if (StartsWith(arg, "--query=", &value)) {
      options.query = value;
      continue;
    }
    basket_engine::LogWarn("未知参数，已忽略: " + arg);
  }
  return options;
}

bool RunQuery(basket_engine::EngineApp* app, const std::string& query) {
  if (query == "decisions") {
    std::cout << app->query().LatestDecisionsJson(
                     static_cast<std::size_t>(app->config().system.decision_history_window))
              << std::endl;
    return true;
  }
  if (query == "jobs") {
    std::cout << app->query().BridgeJobsJson(true) << std::endl;
    return true;
  }
  if (query == "pool") {
    std::cout << app->query().PoolJson() << std::endl;
    return true;
  }
  std::string owner;
  if (StartsWith(query, "stake:", &owner) && !owner.empty()) {
    std::cout << app->query().StakeEntryJson(owner, CurrentTimestampMs()) << std::endl;
    return true;
  }
  basket_engine::LogError("--query 仅支持 decisions/jobs/pool/stake:<owner>: " + query);
  return false;
}

// 运维命令：任一失败即以非零退出码结束，不进入主循环。
bool RunOperatorCommands(basket_engine::EngineApp* app, const RuntimeOptions& options) {
  std::string error;
  if (options.clear_halt) {
    if (!app->ClearHalt(&error)) {
      basket_engine::LogError("解除熔断失败: " + error);
      return false;
    }
    basket_engine::LogInfo("熔断已人工解除");
  }
  if (!options.retry_job.empty()) {
    if (!app->RetryJob(options.retry_job, &error)) {
      basket_engine::LogError("重开结算任务失败: " + error);
      return false;
    }
    basket_engine::LogInfo("结算任务已重开: " + options.retry_job);
  }
  if (!options.cancel_job.empty()) {
    if (!app->CancelJob(options.cancel_job, &error)) {
      basket_engine::LogError("取消结算任务失败: " + error);
      return false;
    }
    basket_engine::LogInfo("结算任务已取消: " + options.cancel_job);
  }
  if (!options.stakes.empty() && app->rewards() == nullptr) {
    basket_engine::LogError("--stake 仅适用于进程内奖励池，外部质押程序请直接调用链上接口");
    return false;
  }
  for (const auto& stake : options.stakes) {
    if (!app->rewards()->Stake(stake.owner,
                               basket_engine::UsdToRaw(stake.amount_usd),
                               CurrentTimestampMs(),
                               &error)) {
      basket_engine::LogError("质押失败: owner=" + stake.owner + ", " + error);
      return false;
    }
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  const RuntimeOptions options = ParseOptions(argc, argv);
  if (!options.valid) {
    return 2;
  }

  basket_engine::AppConfig config;
  std::string error;
  if (!basket_engine::LoadAppConfigFromYaml(options.config_path, &config, &error)) {
    basket_engine::LogError("配置加载失败: " + error);
    return 1;
  }
  basket_engine::LogInfo("配置加载成功: " + options.config_path + ", mode=" + config.system.mode);

  basket_engine::EngineApp app(config, CurrentTimestampMs);
  if (!app.Initialize(&error)) {
    basket_engine::LogError("引擎初始化失败: " + error);
    return 1;
  }

  if (!RunOperatorCommands(&app, options)) {
    app.Shutdown();
    return 1;
  }

  if (!options.query.empty()) {
    const bool ok = RunQuery(&app, options.query);
    app.Shutdown();
    return ok ? 0 : 1;
  }

  // 仅执行运维命令时不跑决策周期。
  const bool operator_only = !options.retry_job.empty() || !options.cancel_job.empty() ||
                             options.clear_halt;
  if (operator_only && !options.cycles.has_value() && !options.run_forever) {
    app.Shutdown();
    return 0;
  }

  basket_engine::LoopOptions loop;
  loop.max_cycles = options.cycles.value_or(1);
  loop.run_forever = options.run_forever;
  loop.first_trigger = options.trigger;
  app.RunLoop(loop);
  app.Shutdown();
  return 0;
}
