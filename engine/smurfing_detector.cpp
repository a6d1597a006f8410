#include "engine/smurfing_detector.hpp"
#include "engine/errors.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <set>

namespace muleguard {
namespace engine {

double SlidingWindowSmurfingDetector::scoreWindow(size_t transaction_count, size_t fan_in,
                                                  size_t fan_out, double velocity,
                                                  double total_amount,
                                                  const SmurfingConfig& config) {
  double score = 0.0;

  if (transaction_count >= config.high_count_threshold) {
    score += 30.0;
  }

  score += 5.0 * static_cast<double>(fan_in);
  score += 5.0 * static_cast<double>(fan_out);

  if (velocity > 1.0) {
    score += 20.0;
  } else if (velocity > 0.5) {
    score += 10.0;
  }

  if (total_amount > config.amount_min) {
    score += std::min(config.amount_points_cap,
                      config.amount_points_per_scale * (total_amount / config.amount_scale));
  }

  return std::max(0.0, std::min(100.0, score));
}

double SlidingWindowSmurfingDetector::structuringFraction(const std::vector<double>& amounts,
                                                          const SmurfingConfig& config,
                                                          std::optional<double>* matched) {
  if (matched) matched->reset();
  if (amounts.empty()) return 0.0;

  size_t near_any = 0;
  std::vector<size_t> hits(config.structuring_thresholds.size(), 0);
  for (double amount : amounts) {
    bool near = false;
    for (size_t i = 0; i < config.structuring_thresholds.size(); ++i) {
      const double threshold = config.structuring_thresholds[i];
      if (amount >= threshold * (1.0 - config.structuring_tolerance) && amount < threshold) {
        hits[i] += 1;
        near = true;
      }
    }
    if (near) near_any += 1;
  }

  if (matched) {
    size_t best = 0;
    for (size_t i = 0; i < hits.size(); ++i) {
      if (hits[i] > best) {
        best = hits[i];
        *matched = config.structuring_thresholds[i];
      }
    }
  }

  return static_cast<double>(near_any) / static_cast<double>(amounts.size());
}

bool SlidingWindowSmurfingDetector::isConsolidation(size_t distinct_sources, double total_inbound,
                                                    std::vector<double> outbound_amounts,
                                                    const SmurfingConfig& config) {
  if (distinct_sources < config.consolidation_min_sources) return false;
  if (outbound_amounts.empty() || total_inbound <= 0.0) return false;

  std::sort(outbound_amounts.begin(), outbound_amounts.end(), std::greater<double>());
  const size_t limit = std::min(config.consolidation_max_outbound, outbound_amounts.size());

  double outbound = 0.0;
  for (size_t k = 0; k < limit; ++k) {
    outbound += outbound_amounts[k];
    if (std::abs(outbound - total_inbound) <= config.consolidation_tolerance * total_inbound) {
      return true;
    }
  }
  return false;
}

SlidingWindowSmurfingDetector::WindowStats SlidingWindowSmurfingDetector::measureWindow(
    const TransactionGraph& graph, const std::string& account_id,
    const std::vector<size_t>& transactions, size_t begin, size_t end,
    const SmurfingConfig& config) const {
  WindowStats window;
  std::set<std::string> senders;
  std::set<std::string> receivers;

  for (size_t i = begin; i < end; ++i) {
    const Transaction& tx = graph.transactions()[transactions[i]];
    if (tx.to_account == account_id) senders.insert(tx.from_account);
    if (tx.from_account == account_id) receivers.insert(tx.to_account);
    window.total_amount += tx.amount;
  }

  const Transaction& first = graph.transactions()[transactions[begin]];
  const Transaction& last = graph.transactions()[transactions[end - 1]];

  window.start = first.timestamp;
  window.end = first.timestamp + std::chrono::microseconds(
                                     static_cast<long long>(config.window_hours * 3600.0 * 1e6));
  window.transaction_count = end - begin;
  window.fan_in = senders.size();
  window.fan_out = receivers.size();
  window.elapsed_hours = std::max(1.0, hoursBetween(first.timestamp, last.timestamp));
  window.velocity = static_cast<double>(window.transaction_count) / window.elapsed_hours;
  window.score = scoreWindow(window.transaction_count, window.fan_in, window.fan_out,
                             window.velocity, window.total_amount, config);
  return window;
}

std::optional<SmurfingAlert> SlidingWindowSmurfingDetector::evaluateAccount(
    const TransactionGraph& graph, size_t account_index, const SmurfingConfig& config) const {
  const AccountStats& stats = graph.statsAt(account_index);
  const std::string& account_id = graph.accountAt(account_index);
  const auto& transactions = stats.transactions;

  if (transactions.size() < config.min_transactions) {
    return std::nullopt;
  }

  const auto window_length =
      std::chrono::microseconds(static_cast<long long>(config.window_hours * 3600.0 * 1e6));
  auto timestampAt = [&](size_t i) -> const Timestamp& {
    return graph.transactions()[transactions[i]].timestamp;
  };

  std::optional<WindowStats> best;
  size_t best_begin = 0;
  size_t best_end = 0;
  size_t end = 0;

  for (size_t begin = 0; begin < transactions.size(); ++begin) {
    // Same-instant starts describe the same window as the first of them.
    if (begin > 0 && timestampAt(begin) == timestampAt(begin - 1)) continue;

    const Timestamp limit = timestampAt(begin) + window_length;
    end = std::max(end, begin + 1);
    while (end < transactions.size() && timestampAt(end) <= limit) {
      ++end;
    }

    WindowStats window = measureWindow(graph, account_id, transactions, begin, end, config);
    if (!best || window.score > best->score) {
      best = window;
      best_begin = begin;
      best_end = end;
    }
  }

  if (!best) return std::nullopt;

  std::vector<double> amounts;
  std::vector<double> outbound;
  double inbound_total = 0.0;
  for (size_t i = best_begin; i < best_end; ++i) {
    const Transaction& tx = graph.transactions()[transactions[i]];
    amounts.push_back(tx.amount);
    if (tx.to_account == account_id) inbound_total += tx.amount;
    if (tx.from_account == account_id) outbound.push_back(tx.amount);
  }

  SmurfingAlert alert;
  alert.account_id = account_id;
  alert.window_start = best->start;
  alert.window_end = best->end;
  alert.fan_in = best->fan_in;
  alert.fan_out = best->fan_out;
  alert.transaction_count = best->transaction_count;
  alert.total_amount = best->total_amount;
  alert.average_transaction = best->total_amount / static_cast<double>(best->transaction_count);
  alert.elapsed_hours = best->elapsed_hours;
  alert.velocity = best->velocity;
  alert.risk_score = best->score;

  alert.structuring_fraction = structuringFraction(amounts, config, &alert.structuring_threshold);
  alert.structuring = alert.structuring_fraction > config.structuring_min_fraction;
  if (!alert.structuring) alert.structuring_threshold.reset();
  alert.consolidation = isConsolidation(best->fan_in, inbound_total, outbound, config);
  alert.high_frequency =
      best->transaction_count >= config.high_count_threshold || best->velocity > 1.0;

  if (alert.high_frequency) alert.flags.push_back("high_frequency");
  if (alert.structuring) alert.flags.push_back("structuring_detected");
  if (alert.consolidation) alert.flags.push_back("consolidation");

  if (alert.risk_score <= config.alert_threshold && !alert.structuring && !alert.consolidation) {
    return std::nullopt;
  }
  return alert;
}

std::vector<SmurfingAlert> SlidingWindowSmurfingDetector::detect(
    const TransactionGraph& graph, const SmurfingConfig& config,
    const concurrent::PartitionedExecutor& executor) const {
  auto alerts = executor.collect<SmurfingAlert>(
      graph.accountCount(), [&](size_t index, std::vector<SmurfingAlert>& out) {
        if (auto alert = evaluateAccount(graph, index, config)) {
          out.push_back(std::move(*alert));
        }
      });

  std::stable_sort(alerts.begin(), alerts.end(), [](const SmurfingAlert& a, const SmurfingAlert& b) {
    if (a.risk_score != b.risk_score) return a.risk_score > b.risk_score;
    return a.account_id < b.account_id;
  });

  LOG_BUILDER(observability::LogLevel::INFO, "Smurfing search finished")
      .field("accounts", graph.accountCount())
      .field("alerts", alerts.size());

  return alerts;
}

std::unique_ptr<SmurfingDetector> makeSmurfingDetector(const std::string& strategy) {
  if (strategy == SlidingWindowSmurfingDetector::kName) {
    return std::make_unique<SlidingWindowSmurfingDetector>();
  }
  throw ConfigError("smurfing.strategy", "unknown strategy '" + strategy + "'");
}

}  // namespace engine
}  // namespace muleguard
