#include "engine/risk_scorer.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

namespace muleguard {
namespace engine {

namespace {

double clip(double value) {
  return std::max(0.0, std::min(100.0, value));
}

}  // namespace

RiskScorer::RiskScorer(const ScoringConfig& config) : config_(config) {}

double RiskScorer::ringInvolvementScore(size_t ring_count, size_t total_rings,
                                        double average_ring_amount) const {
  if (ring_count == 0) return 0.0;

  const double base = std::min(100.0, 100.0 * static_cast<double>(ring_count) /
                                          static_cast<double>(std::max<size_t>(total_rings, 1)));
  const double amount_factor = std::min(config_.ring_amount_factor_cap,
                                        1.0 + average_ring_amount / config_.ring_amount_scale);
  return clip(base * amount_factor);
}

double RiskScorer::flowPatternScore(const AccountStats& stats) const {
  const size_t total = stats.transactionCount();
  if (total == 0) return 0.0;

  const double in = stats.total_in;
  const double out = stats.total_out;
  const size_t sources = stats.sources.size();
  const size_t destinations = stats.destinations.size();

  double imbalance = 0.0;
  if (in > 0.0 && out > 0.0) {
    imbalance = (1.0 - std::min(in, out) / std::max(in, out)) * 100.0;
  }

  // Many senders funnelling into fewer receivers, or the reverse.
  double shape = 0.0;
  if ((sources > destinations && in > out) || (destinations > sources && out > in)) {
    shape = 60.0;
  }

  const double average = (in + out) / static_cast<double>(total);
  const double connectivity =
      static_cast<double>(sources + destinations) / static_cast<double>(total);
  const double throughput =
      std::min(100.0, (average / 10000.0) * (1.0 / std::max(connectivity, 0.1)));

  return clip(imbalance * 0.3 + shape * 0.3 + throughput * 0.4);
}

double RiskScorer::velocityAnomalyScore(const AccountStats& stats) const {
  if (stats.transactionCount() < 3) return 0.0;

  const double span = hoursBetween(stats.first_seen, stats.last_seen);
  if (span <= 0.0) return 0.0;

  const double velocity = static_cast<double>(stats.transactionCount()) / span;
  if (velocity <= config_.velocity_anomaly_threshold) return 0.0;
  return clip(100.0 * velocity / (2.0 * config_.velocity_anomaly_threshold));
}

double RiskScorer::transactionPatternScore(const AccountStats& stats) const {
  return clip(config_.flow_weight * flowPatternScore(stats) +
              config_.velocity_weight * velocityAnomalyScore(stats));
}

double RiskScorer::combine(double ring, double smurfing, double shell, double pattern) const {
  return clip(config_.ring_weight * clip(ring) + config_.smurfing_weight * clip(smurfing) +
              config_.shell_weight * clip(shell) + config_.pattern_weight * clip(pattern));
}

AccountScore RiskScorer::score(const std::string& account_id, const AccountStats& stats,
                               const AccountSignals& signals) const {
  AccountScore result;
  result.account_id = account_id;
  result.ring_count = signals.ring_count;
  result.ring_involvement_score =
      ringInvolvementScore(signals.ring_count, signals.total_rings, signals.average_ring_amount);
  result.smurfing_score = signals.smurfing ? clip(signals.smurfing->risk_score) : 0.0;
  result.shell_score = signals.shell ? clip(signals.shell->shell_score) : 0.0;

  const double velocity = velocityAnomalyScore(stats);
  result.transaction_pattern_score = transactionPatternScore(stats);

  result.final_score = combine(result.ring_involvement_score, result.smurfing_score,
                               result.shell_score, result.transaction_pattern_score);
  result.risk_level = riskLevelFor(result.final_score);

  std::set<std::string> factors;
  if (result.ring_involvement_score > config_.factor_threshold) {
    factors.insert("ring_participation");
    if (signals.ring_count > 1) factors.insert("multiple_rings");
  }
  if (signals.smurfing && result.smurfing_score > config_.factor_threshold) {
    factors.insert(signals.smurfing->flags.begin(), signals.smurfing->flags.end());
    if (signals.smurfing->fan_in >= 5) factors.insert("high_fan_in");
    if (signals.smurfing->fan_out >= 5) factors.insert("high_fan_out");
  }
  if (signals.shell && result.shell_score > config_.factor_threshold) {
    factors.insert(signals.shell->flags.begin(), signals.shell->flags.end());
  }
  if (result.transaction_pattern_score > config_.factor_threshold) {
    factors.insert("suspicious_flow_pattern");
    if (velocity > 0.0) factors.insert("velocity_anomaly");
  }
  result.risk_factors.assign(factors.begin(), factors.end());

  return result;
}

std::vector<AccountScore> RiskScorer::scoreAll(const TransactionGraph& graph,
                                               const std::vector<Cycle>& cycles,
                                               const std::vector<SmurfingAlert>& smurfing_alerts,
                                               const std::vector<ShellProfile>& shell_candidates,
                                               const concurrent::PartitionedExecutor& executor) const {
  // Read-only lookups shared by all workers.
  std::unordered_map<std::string, AccountSignals> signals;
  std::unordered_map<std::string, double> ring_amounts;
  for (const auto& cycle : cycles) {
    for (const auto& account : cycle.accounts) {
      signals[account].ring_count += 1;
      ring_amounts[account] += cycle.total_amount;
    }
  }
  for (auto& entry : signals) {
    entry.second.total_rings = cycles.size();
    entry.second.average_ring_amount =
        ring_amounts[entry.first] / static_cast<double>(entry.second.ring_count);
  }
  for (const auto& alert : smurfing_alerts) {
    signals[alert.account_id].smurfing = &alert;
  }
  for (const auto& profile : shell_candidates) {
    signals[profile.account_id].shell = &profile;
  }

  const AccountSignals no_signal;
  auto scores = executor.collect<AccountScore>(
      graph.accountCount(), [&](size_t index, std::vector<AccountScore>& out) {
        const std::string& account_id = graph.accountAt(index);
        auto it = signals.find(account_id);
        out.push_back(score(account_id, graph.statsAt(index),
                            it == signals.end() ? no_signal : it->second));
      });

  LOG_BUILDER(observability::LogLevel::INFO, "Account scoring finished")
      .field("accounts", scores.size());

  return scores;
}

}  // namespace engine
}  // namespace muleguard
