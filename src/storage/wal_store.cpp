#include "storage/wal_store.h"

#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "core/json_utils.h"
#include "storage/record_codec.h"

namespace basket_engine {

namespace {

constexpr std::size_t kJobFieldCount = 16;
constexpr std::size_t kHintFieldCount = 8;

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

// 自由文本字段（错误信息、备注）不允许破坏行/列结构。
std::string SanitizeField(const std::string& text) {
  std::string out = text;
  for (char& ch : out) {
    if (ch == '\t' || ch == '\n' || ch == '\r') {
      ch = ' ';
    }
  }
  return out;
}

// 与 getline 不同，保留末尾空字段（空 error 列）。
std::vector<std::string> SplitTab(const std::string& line) {
  std::vector<std::string> parts;
  std::size_t begin = 0;
  while (true) {
    const std::size_t pos = line.find('\t', begin);
    if (pos == std::string::npos) {
      parts.push_back(line.substr(begin));
      break;
    }
    parts.push_back(line.substr(begin, pos - begin));
    begin = pos + 1;
  }
  return parts;
}

std::string SerializeJob(const BridgeJob& job) {
  // 字段顺序固定：前 10 列为身份与产物，后 6 列为计数/时间/失败信息。
  std::ostringstream oss;
  oss << "JOB" << '\t' << job.id << '\t' << job.amount_raw << '\t'
      << ToString(job.state) << '\t' << job.source_tx_ref << '\t'
      << job.message_hash << '\t' << job.attestation_requested_ms << '\t'
      << job.attestation << '\t' << job.dest_tx_ref << '\t'
      << job.deposit_tx_ref << '\t' << job.retry_count << '\t'
      << job.created_at_ms << '\t' << job.updated_at_ms << '\t'
      << job.state_entered_ms << '\t' << SanitizeField(job.failed_step) << '\t'
      << SanitizeField(job.error);
  return oss.str();
}

bool ParseJob(const std::vector<std::string>& fields,
              BridgeJob* out_job,
              std::string* out_error) {
  if (fields.size() != kJobFieldCount) {
    SetError(out_error, "JOB WAL 字段数异常");
    return false;
  }
  BridgeJob job;
  job.id = fields[1];
  if (!ParseBridgeState(fields[3], &job.state)) {
    SetError(out_error, "JOB WAL state 非法: " + fields[3]);
    return false;
  }
  job.source_tx_ref = fields[4];
  job.message_hash = fields[5];
  job.attestation = fields[7];
  job.dest_tx_ref = fields[8];
  job.deposit_tx_ref = fields[9];
  job.failed_step = fields[14];
  job.error = fields[15];
  try {
    job.amount_raw = std::stoull(fields[2]);
    job.attestation_requested_ms = std::stoll(fields[6]);
    job.retry_count = std::stoi(fields[10]);
    job.created_at_ms = std::stoll(fields[11]);
    job.updated_at_ms = std::stoll(fields[12]);
    job.state_entered_ms = std::stoll(fields[13]);
  } catch (const std::exception&) {
    SetError(out_error, "JOB WAL 数值字段解析失败");
    return false;
  }
  *out_job = std::move(job);
  return true;
}

std::string SerializeHint(const CalibrationHint& hint) {
  // accuracy 列编码为 `producer=score,producer=score`。
  std::ostringstream accuracy;
  bool first = true;
  for (const auto& [producer, score] : hint.accuracy) {
    if (!first) {
      accuracy << ',';
    }
    first = false;
    accuracy << ToString(producer) << '=' << score;
  }
  std::ostringstream oss;
  oss << "HINT" << '\t' << hint.decision_id << '\t' << hint.created_at_ms << '\t'
      << accuracy.str() << '\t' << hint.best_producer << '\t'
      << hint.worst_producer << '\t' << hint.realized_nav_change << '\t'
      << SanitizeField(hint.note);
  return oss.str();
}

bool ParseHint(const std::vector<std::string>& fields,
               CalibrationHint* out_hint,
               std::string* out_error) {
  if (fields.size() != kHintFieldCount) {
    SetError(out_error, "HINT WAL 字段数异常");
    return false;
  }
  CalibrationHint hint;
  hint.decision_id = fields[1];
  hint.best_producer = fields[4];
  hint.worst_producer = fields[5];
  hint.note = fields[7];
  try {
    hint.created_at_ms = std::stoll(fields[2]);
    hint.realized_nav_change = std::stod(fields[6]);
    std::istringstream iss(fields[3]);
    std::string item;
    while (std::getline(iss, item, ',')) {
      const std::size_t eq = item.find('=');
      ProducerKind kind;
      if (eq == std::string::npos || !ParseProducerKind(item.substr(0, eq), &kind)) {
        SetError(out_error, "HINT WAL accuracy 字段非法: " + item);
        return false;
      }
      hint.accuracy[kind] = std::stod(item.substr(eq + 1));
    }
  } catch (const std::exception&) {
    SetError(out_error, "HINT WAL 数值字段解析失败");
    return false;
  }
  *out_hint = std::move(hint);
  return true;
}

std::string SerializeRewardOp(const RewardOp& op) {
  std::ostringstream oss;
  switch (op.type) {
    case RewardOp::kStake:
      oss << "STAKE\t" << op.owner << '\t' << op.amount << '\t' << op.ts_ms;
      break;
    case RewardOp::kUnstake:
      oss << "UNSTAKE\t" << op.owner << '\t' << op.amount << '\t' << op.ts_ms;
      break;
    case RewardOp::kClaim:
      oss << "CLAIM\t" << op.owner << '\t' << op.ts_ms;
      break;
    case RewardOp::kDeposit:
      oss << "DEPOSIT\t" << op.ref << '\t' << op.amount << '\t' << op.ts_ms;
      break;
  }
  return oss.str();
}

bool ParseRewardOp(const std::vector<std::string>& fields,
                   RewardOp* out_op,
                   std::string* out_error) {
  const std::string& type = fields[0];
  RewardOp op;
  try {
    if (type == "CLAIM") {
      if (fields.size() != 3) {
        SetError(out_error, "CLAIM WAL 字段数异常");
        return false;
      }
      op.type = RewardOp::kClaim;
      op.owner = fields[1];
      op.ts_ms = std::stoll(fields[2]);
    } else {
      if (fields.size() != 4) {
        SetError(out_error, type + " WAL 字段数异常");
        return false;
      }
      if (type == "STAKE") {
        op.type = RewardOp::kStake;
        op.owner = fields[1];
      } else if (type == "UNSTAKE") {
        op.type = RewardOp::kUnstake;
        op.owner = fields[1];
      } else {
        op.type = RewardOp::kDeposit;
        op.ref = fields[1];
      }
      op.amount = std::stoull(fields[2]);
      op.ts_ms = std::stoll(fields[3]);
    }
  } catch (const std::exception&) {
    SetError(out_error, type + " WAL 数值字段解析失败");
    return false;
  }
  *out_op = std::move(op);
  return true;
}

}  // namespace

bool WalStore::Initialize(std::string* out_error) const {
  const std::filesystem::path path(file_path_);
  const auto parent = path.parent_path();
  std::error_code ec;
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      SetError(out_error, "创建 WAL 目录失败: " + ec.message());
      return false;
    }
  }

  std::ofstream out(file_path_, std::ios::app);
  if (!out.is_open()) {
    SetError(out_error, "创建/打开 WAL 文件失败: " + file_path_);
    return false;
  }
  return true;
}

bool WalStore::AppendLine(const std::string& line, std::string* out_error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ofstream out(file_path_, std::ios::app);
  if (!out.is_open()) {
    SetError(out_error, "WAL 打开失败: " + file_path_);
    return false;
  }

  out << line << '\n';
  out.flush();
  if (!out.good()) {
    SetError(out_error, "WAL 写入失败");
    return false;
  }
  return true;
}

bool WalStore::AppendDecision(const Decision& decision,
                              std::string* out_error) const {
  return AppendLine("DECISION\t" + DecisionToJson(decision), out_error);
}

bool WalStore::AppendJob(const BridgeJob& job, std::string* out_error) const {
  return AppendLine(SerializeJob(job), out_error);
}

bool WalStore::AppendHint(const CalibrationHint& hint,
                          std::string* out_error) const {
  return AppendLine(SerializeHint(hint), out_error);
}

bool WalStore::AppendReflected(const std::string& decision_id,
                               std::int64_t ts_ms,
                               std::string* out_error) const {
  return AppendLine("REFLECTED\t" + decision_id + "\t" + std::to_string(ts_ms),
                    out_error);
}

bool WalStore::AppendSafetyEvent(bool halt_set,
                                 const std::string& reason,
                                 std::int64_t ts_ms,
                                 std::string* out_error) const {
  return AppendLine(std::string("SAFETY\t") + (halt_set ? "HALT_SET" : "HALT_CLEAR") +
                        "\t" + std::to_string(ts_ms) + "\t" + SanitizeField(reason),
                    out_error);
}

bool WalStore::AppendRewardOp(const RewardOp& op, std::string* out_error) const {
  return AppendLine(SerializeRewardOp(op), out_error);
}

bool WalStore::LoadState(WalState* out_state, std::string* out_error) const {
  if (out_state == nullptr) {
    SetError(out_error, "LoadState 输出参数为空");
    return false;
  }
  *out_state = WalState{};

  std::lock_guard<std::mutex> lock(mutex_);
  std::ifstream in(file_path_);
  if (!in.is_open()) {
    // 文件不存在或无法打开视为“无历史”，由 Initialize 负责创建。
    return true;
  }

  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    const auto fields = SplitTab(line);
    const std::string& type = fields[0];
    std::string parse_error;
    bool ok = true;

    if (type == "DECISION") {
      JsonValue value;
      Decision decision;
      ok = fields.size() == 2 && ParseJson(fields[1], &value, &parse_error) &&
           DecisionFromJson(value, &decision, &parse_error);
      if (ok) {
        out_state->decisions.push_back(std::move(decision));
      }
    } else if (type == "JOB") {
      BridgeJob job;
      ok = ParseJob(fields, &job, &parse_error);
      if (ok) {
        out_state->latest_jobs[job.id] = job;
        out_state->job_history.push_back(std::move(job));
      }
    } else if (type == "HINT") {
      CalibrationHint hint;
      ok = ParseHint(fields, &hint, &parse_error);
      if (ok) {
        // 提示已落盘即视为已反思，REFLECTED 标记丢失时不会重复产出。
        out_state->reflected_ids.insert(hint.decision_id);
        out_state->hints.push_back(std::move(hint));
      }
    } else if (type == "REFLECTED") {
      ok = fields.size() == 3;
      if (ok) {
        out_state->reflected_ids.insert(fields[1]);
      }
    } else if (type == "SAFETY") {
      ok = fields.size() == 4;
      if (ok) {
        // 熔断状态以最后一次事件为准。
        out_state->loss_halted = fields[1] == "HALT_SET";
        out_state->halt_reason = out_state->loss_halted ? fields[3] : "";
      }
    } else if (type == "STAKE" || type == "UNSTAKE" || type == "CLAIM" || type == "DEPOSIT") {
      RewardOp op;
      ok = ParseRewardOp(fields, &op, &parse_error);
      if (ok) {
        out_state->reward_ops.push_back(std::move(op));
      }
    } else {
      SetError(out_error, "未知 WAL 事件类型（line=" + std::to_string(line_no) + ")");
      return false;
    }

    if (!ok) {
      if (parse_error.empty()) {
        parse_error = type + " WAL 字段数异常";
      }
      SetError(out_error, "WAL 行解析失败（line=" + std::to_string(line_no) +
                              "）: " + parse_error);
      return false;
    }
  }
  return true;
}

}  // namespace basket_engine
