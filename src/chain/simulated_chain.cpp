#include "chain/simulated_chain.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace basket_engine {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr std::int64_t kHourMs = 3600LL * 1000;

void SetError(std::string* out_error, const std::string& message) {
  if (out_error != nullptr) {
    *out_error = message;
  }
}

}  // namespace

std::vector<SimulatedToken> DefaultSimulatedTokens(const std::string& anchor_token) {
  return {
      {anchor_token, 1.0, 0.0, 24.0, 5e7, 0.10},
      {"WETH", 3000.0, 0.06, 30.0, 2e7, 0.28},
      {"WBTC", 60000.0, 0.04, 40.0, 3e7, 0.27},
      {"SOL", 150.0, 0.09, 20.0, 8e6, 0.20},
      {"AERO", 1.2, 0.15, 16.0, 6e5, 0.15},
  };
}

// ---------------- SimulatedMarket ----------------

SimulatedMarket::SimulatedMarket(std::vector<SimulatedToken> tokens,
                                 std::string anchor_token,
                                 double initial_nav_usd,
                                 ClockFn clock)
    : tokens_(std::move(tokens)),
      anchor_token_(std::move(anchor_token)),
      clock_(std::move(clock)) {
  origin_ms_ = clock_();
  Holding initial;
  initial.since_ms = origin_ms_;
  for (const auto& token : tokens_) {
    const double price = PriceAtLocked(token, origin_ms_);
    initial.units[token.symbol] =
        price > 0.0 ? token.initial_weight * initial_nav_usd / price : 0.0;
  }
  holdings_.push_back(std::move(initial));
}

const SimulatedToken* SimulatedMarket::FindToken(const std::string& symbol) const {
  for (const auto& token : tokens_) {
    if (token.symbol == symbol) {
      return &token;
    }
  }
  return nullptr;
}

double SimulatedMarket::PriceAtLocked(const SimulatedToken& token, std::int64_t ts_ms) const {
  if (token.symbol == anchor_token_) {
    return token.base_price;
  }
  // 相位按 token 符号错开，避免所有资产同涨同跌。
  const double phase = static_cast<double>(token.symbol.size() % 5) * 0.7;
  const double hours = static_cast<double>(ts_ms - origin_ms_) / static_cast<double>(kHourMs);
  double price =
      token.base_price * (1.0 + token.amplitude * std::sin(2.0 * kPi * hours / token.period_hours + phase));
  for (const auto& [shock_ms, factor] : shocks_) {
    if (ts_ms >= shock_ms) {
      price *= factor;
    }
  }
  return price;
}

double SimulatedMarket::NavAtLocked(std::int64_t ts_ms) const {
  // 找到 ts 时刻生效的持仓（早于首个持仓时按首个计算）。
  const Holding* holding = &holdings_.front();
  for (const auto& candidate : holdings_) {
    if (candidate.since_ms <= ts_ms) {
      holding = &candidate;
    }
  }
  double nav = 0.0;
  for (const auto& token : tokens_) {
    const auto it = holding->units.find(token.symbol);
    if (it != holding->units.end()) {
      nav += it->second * PriceAtLocked(token, ts_ms);
    }
  }
  return nav;
}

bool SimulatedMarket::ReadSnapshot(BasketSnapshot* out_snapshot, std::string* out_error) const {
  if (out_snapshot == nullptr) {
    SetError(out_error, "out_snapshot 为空");
    return false;
  }
  const std::int64_t now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  BasketSnapshot snapshot;
  snapshot.ts_ms = now;
  snapshot.anchor_token = anchor_token_;
  snapshot.nav_usd = NavAtLocked(now);
  if (snapshot.nav_usd <= 0.0) {
    SetError(out_error, "simulated NAV 非正");
    return false;
  }
  const Holding& holding = holdings_.back();
  for (const auto& token : tokens_) {
    TokenState state;
    state.price_usd = PriceAtLocked(token, now);
    const auto it = holding.units.find(token.symbol);
    const double units = it != holding.units.end() ? it->second : 0.0;
    state.weight = units * state.price_usd / snapshot.nav_usd;
    state.liquidity_usd = token.liquidity_usd;
    const double prev = PriceAtLocked(token, now - 24 * kHourMs);
    state.change_24h = prev > 0.0 ? state.price_usd / prev - 1.0 : 0.0;
    snapshot.tokens[token.symbol] = state;
  }
  *out_snapshot = std::move(snapshot);
  return true;
}

bool SimulatedMarket::ReadMarketContext(MarketContext* out_context, std::string* out_error) const {
  if (out_context == nullptr) {
    SetError(out_error, "out_context 为空");
    return false;
  }
  const std::int64_t now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  MarketContext context;
  for (int i = 23; i >= 0; --i) {
    context.recent_nav.push_back(NavAtLocked(now - i * kHourMs));
  }
  std::vector<double> returns;
  for (std::size_t i = 1; i < context.recent_nav.size(); ++i) {
    if (context.recent_nav[i - 1] > 0.0) {
      returns.push_back(context.recent_nav[i] / context.recent_nav[i - 1] - 1.0);
    }
  }
  if (!returns.empty()) {
    double mean = 0.0;
    for (double r : returns) mean += r;
    mean /= static_cast<double>(returns.size());
    double var = 0.0;
    for (double r : returns) var += (r - mean) * (r - mean);
    context.realized_volatility = std::sqrt(var / static_cast<double>(returns.size()));
  }
  const double hours = static_cast<double>(now - origin_ms_) / static_cast<double>(kHourMs);
  context.sentiment_index = 0.6 * std::sin(2.0 * kPi * hours / 36.0);
  *out_context = std::move(context);
  return true;
}

bool SimulatedMarket::NavAt(std::int64_t ts_ms, double* out_nav, std::string* out_error) const {
  if (out_nav == nullptr) {
    SetError(out_error, "out_nav 为空");
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_nav = NavAtLocked(ts_ms);
  return true;
}

bool SimulatedMarket::PriceAt(const std::string& token,
                              std::int64_t ts_ms,
                              double* out_price,
                              std::string* out_error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const SimulatedToken* found = FindToken(token);
  if (found == nullptr || out_price == nullptr) {
    SetError(out_error, "unknown token " + token);
    return false;
  }
  *out_price = PriceAtLocked(*found, ts_ms);
  return true;
}

bool SimulatedMarket::ApplyWeights(const Weights& weights,
                                   std::int64_t ts_ms,
                                   std::string* out_error) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [token, weight] : weights) {
    if (FindToken(token) == nullptr) {
      SetError(out_error, "unknown token " + token);
      return false;
    }
    if (weight < 0.0) {
      SetError(out_error, "negative weight for " + token);
      return false;
    }
  }
  const double nav = NavAtLocked(ts_ms);
  Holding next;
  next.since_ms = std::max(ts_ms, holdings_.back().since_ms);
  for (const auto& token : tokens_) {
    const auto it = weights.find(token.symbol);
    const double weight = it != weights.end() ? it->second : 0.0;
    const double price = PriceAtLocked(token, ts_ms);
    next.units[token.symbol] = price > 0.0 ? weight * nav / price : 0.0;
  }
  holdings_.push_back(std::move(next));
  return true;
}

void SimulatedMarket::ApplyShock(double factor) {
  const std::int64_t now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  shocks_.emplace_back(now, factor);
}

// ---------------- SimulatedBasketContract ----------------

SimulatedBasketContract::SimulatedBasketContract(SimulatedMarket* market,
                                                 double fee_usd_per_hour,
                                                 ClockFn clock)
    : market_(market), fee_usd_per_hour_(fee_usd_per_hour), clock_(std::move(clock)) {
  origin_ms_ = clock_();
}

bool SimulatedBasketContract::SubmitRebalance(const std::string& decision_id,
                                              const Weights& weights,
                                              std::string* out_tx_ref,
                                              std::string* out_error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (submissions_.count(decision_id) > 0) {
    SetError(out_error, "duplicate submission for " + decision_id);
    return false;
  }
  if (!market_->ApplyWeights(weights, clock_(), out_error)) {
    return false;
  }
  const std::string ref = "sim_rebalance_" + std::to_string(submissions_.size() + 1);
  submissions_[decision_id] = ref;
  if (out_tx_ref != nullptr) {
    *out_tx_ref = ref;
  }
  return true;
}

bool SimulatedBasketContract::FindSubmission(const std::string& decision_id,
                                             std::string* out_tx_ref) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = submissions_.find(decision_id);
  if (it == submissions_.end()) {
    return false;
  }
  if (out_tx_ref != nullptr) {
    *out_tx_ref = it->second;
  }
  return true;
}

bool SimulatedBasketContract::ReadAccruedFeesUsd(double* out_usd, std::string* out_error) const {
  if (out_usd == nullptr) {
    SetError(out_error, "out_usd 为空");
    return false;
  }
  const double hours =
      static_cast<double>(clock_() - origin_ms_) / static_cast<double>(kHourMs);
  std::lock_guard<std::mutex> lock(mutex_);
  *out_usd = std::max(0.0, fee_usd_per_hour_ * hours - swept_usd_);
  return true;
}

void SimulatedBasketContract::SweepFees(double usd) {
  std::lock_guard<std::mutex> lock(mutex_);
  swept_usd_ += usd;
}

std::size_t SimulatedBasketContract::submission_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return submissions_.size();
}

// ---------------- SimulatedSourceChain ----------------

SimulatedSourceChain::SimulatedSourceChain(SimulatedBasketContract* contract,
                                           std::int64_t confirm_delay_ms,
                                           ClockFn clock)
    : contract_(contract), confirm_delay_ms_(confirm_delay_ms), clock_(std::move(clock)) {}

bool SimulatedSourceChain::FindLock(const std::string& job_id, std::string* out_lock_ref) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = lock_by_job_.find(job_id);
  if (it == lock_by_job_.end()) {
    return false;
  }
  if (out_lock_ref != nullptr) {
    *out_lock_ref = it->second;
  }
  return true;
}

bool SimulatedSourceChain::Lock(const std::string& job_id,
                                std::uint64_t amount_raw,
                                std::string* out_lock_ref,
                                std::string* out_error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (lock_by_job_.count(job_id) > 0) {
      SetError(out_error, "job already locked: " + job_id);
      return false;
    }
    const std::string ref = "sim_lock_" + std::to_string(locks_.size() + 1);
    lock_by_job_[job_id] = ref;
    locks_[ref] = LockRecord{job_id, amount_raw, clock_()};
    if (out_lock_ref != nullptr) {
      *out_lock_ref = ref;
    }
  }
  if (contract_ != nullptr) {
    contract_->SweepFees(RawToUsd(amount_raw));
  }
  return true;
}

bool SimulatedSourceChain::Confirm(const std::string& lock_ref,
                                   SourceConfirmation* out_confirmation,
                                   std::string* out_error) const {
  if (out_confirmation == nullptr) {
    SetError(out_error, "out_confirmation 为空");
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = locks_.find(lock_ref);
  if (it == locks_.end()) {
    SetError(out_error, "unknown lock ref " + lock_ref);
    return false;
  }
  *out_confirmation = SourceConfirmation{};
  if (clock_() - it->second.locked_ms < confirm_delay_ms_) {
    return true;
  }
  out_confirmation->confirmed = true;
  out_confirmation->message = "burn|" + it->second.job_id + "|" +
                              std::to_string(it->second.amount_raw) + "|" + lock_ref;
  return true;
}

double SimulatedSourceChain::CongestionLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return congestion_;
}

void SimulatedSourceChain::SetCongestion(double level) {
  std::lock_guard<std::mutex> lock(mutex_);
  congestion_ = level;
}

std::size_t SimulatedSourceChain::lock_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return locks_.size();
}

// ---------------- SimulatedAttestationService ----------------

SimulatedAttestationService::SimulatedAttestationService(std::int64_t delay_ms, ClockFn clock)
    : delay_ms_(delay_ms), clock_(std::move(clock)) {}

bool SimulatedAttestationService::Poll(const std::string& message_hash,
                                       AttestationPoll* out_poll,
                                       std::string* out_error) const {
  if (out_poll == nullptr || message_hash.empty()) {
    SetError(out_error, "attestation poll 参数非法");
    return false;
  }
  const std::int64_t now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto [it, inserted] = first_seen_ms_.emplace(message_hash, now);
  *out_poll = AttestationPoll{};
  if (!inserted && now - it->second >= delay_ms_) {
    out_poll->complete = true;
    out_poll->attestation = "sim_attestation_" + message_hash.substr(0, 16);
  }
  return true;
}

// ---------------- SimulatedDestinationChain ----------------

bool SimulatedDestinationChain::FindMint(const std::string& message_hash,
                                         std::string* out_mint_ref) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = mints_.find(message_hash);
  if (it == mints_.end()) {
    return false;
  }
  if (out_mint_ref != nullptr) {
    *out_mint_ref = it->second;
  }
  return true;
}

bool SimulatedDestinationChain::Mint(const std::string& message_hash,
                                     const std::string& attestation,
                                     std::string* out_mint_ref,
                                     std::string* out_error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (attestation.empty()) {
    SetError(out_error, "mint requires attestation");
    return false;
  }
  if (mints_.count(message_hash) > 0) {
    SetError(out_error, "message already minted: " + message_hash);
    return false;
  }
  const std::string ref = "sim_mint_" + std::to_string(mints_.size() + 1);
  mints_[message_hash] = ref;
  if (out_mint_ref != nullptr) {
    *out_mint_ref = ref;
  }
  return true;
}

}  // namespace basket_engine
