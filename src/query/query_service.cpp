#include "query/query_service.h"

#include <map>
#include <vector>

#include "core/json_utils.h"
#include "storage/record_codec.h"

namespace basket_engine {

std::string QueryService::LatestDecisionsJson(std::size_t n) const {
  JsonWriter writer;
  writer.BeginArray();
  if (orchestrator_ != nullptr) {
    for (const auto& decision : orchestrator_->RecentDecisions(n)) {
      WriteDecisionJson(decision, &writer);
    }
  }
  writer.EndArray();
  return writer.str();
}

std::string QueryService::BridgeJobsJson(bool include_history) const {
  std::map<std::string, std::vector<BridgeJob>> history;
  std::string history_error;
  if (include_history && wal_ != nullptr) {
    WalState state;
    if (wal_->LoadState(&state, &history_error)) {
      for (const auto& snapshot : state.job_history) {
        history[snapshot.id].push_back(snapshot);
      }
    }
  }

  JsonWriter writer;
  writer.BeginObject();
  writer.Key("jobs").BeginArray();
  if (bridge_ != nullptr) {
    for (const auto& job : bridge_->Jobs()) {
      if (!include_history) {
        WriteBridgeJobJson(job, &writer);
        continue;
      }
      writer.BeginObject();
      writer.Key("job");
      WriteBridgeJobJson(job, &writer);
      writer.Key("transitions").BeginArray();
      const auto it = history.find(job.id);
      if (it != history.end()) {
        for (const auto& snapshot : it->second) {
          writer.BeginObject();
          writer.Key("state").String(ToString(snapshot.state));
          writer.Key("updated_at_ms").Integer(snapshot.updated_at_ms);
          writer.Key("retry_count").Integer(snapshot.retry_count);
          writer.Key("error").String(snapshot.error);
          writer.EndObject();
        }
      }
      writer.EndArray();
      writer.EndObject();
    }
  }
  writer.EndArray();
  if (!history_error.empty()) {
    writer.Key("history_error").String(history_error);
  }
  writer.EndObject();
  return writer.str();
}

std::string QueryService::PoolJson() const {
  JsonWriter writer;
  writer.BeginObject();
  if (rewards_ != nullptr) {
    const StakePoolView view = rewards_->PoolView();
    writer.Key("participants").Unsigned(view.participants);
    writer.Key("total_principal").Unsigned(view.pool.total_principal);
    writer.Key("total_weighted_stake").String(U128ToString(view.pool.total_weighted_stake));
    writer.Key("acc_reward_per_weight").String(U128ToString(view.pool.acc_reward_per_weight));
    writer.Key("total_deposited").Unsigned(view.pool.total_deposited);
    writer.Key("total_claimed").Unsigned(view.pool.total_claimed);
    writer.Key("outstanding_rewards").Unsigned(view.outstanding_rewards);
    writer.Key("dust").Unsigned(view.dust);
    writer.Key("last_update_ms").Integer(view.pool.last_update_ms);
  }
  writer.EndObject();
  return writer.str();
}

std::string QueryService::StakeEntryJson(const std::string& owner, std::int64_t now_ms) const {
  if (rewards_ == nullptr) {
    return "null";
  }
  const auto view = rewards_->EntryView(owner, now_ms);
  if (!view.has_value()) {
    return "null";
  }
  JsonWriter writer;
  writer.BeginObject();
  writer.Key("owner").String(view->entry.owner);
  writer.Key("principal").Unsigned(view->entry.principal);
  writer.Key("stake_start_ms").Integer(view->entry.stake_start_ms);
  writer.Key("stake_days").Integer(view->stake_days);
  writer.Key("tier").String(ToString(view->tier));
  writer.Key("multiplier_bps").Integer(view->entry.multiplier_bps);
  writer.Key("days_to_next_tier").Integer(view->days_to_next_tier);
  writer.Key("weighted_stake").String(U128ToString(view->entry.weighted_stake));
  writer.Key("pending_reward").Unsigned(view->pending_reward);
  writer.Key("last_interaction_ms").Integer(view->entry.last_interaction_ms);
  writer.EndObject();
  return writer.str();
}

}  // namespace basket_engine
