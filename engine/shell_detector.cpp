#include "engine/shell_detector.hpp"
#include "engine/errors.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace muleguard {
namespace engine {

namespace {

double mean(const std::vector<double>& values) {
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// Sample standard deviation; callers guarantee at least two values.
double sampleStdDev(const std::vector<double>& values, double average) {
  double sum = 0.0;
  for (double v : values) {
    sum += (v - average) * (v - average);
  }
  return std::sqrt(sum / static_cast<double>(values.size() - 1));
}

}  // namespace

double SixFactorShellDetector::highValueScore(double average_value, const ShellConfig& config) {
  return std::min(100.0, 100.0 * average_value / config.high_value_baseline);
}

double SixFactorShellDetector::passThroughScore(double total_in, double total_out,
                                                const ShellConfig& config) {
  if (total_in <= 0.0 || total_out <= 0.0) return 0.0;

  const double larger = std::max(total_in, total_out);
  const double difference = std::abs(total_in - total_out) / larger;
  const double ratio = 1.0 - difference;

  if (difference < config.pass_through_tolerance) return 100.0;
  if (ratio > 0.90) return 60.0;
  if (ratio > 0.85) return 32.0;
  return 0.0;
}

double SixFactorShellDetector::connectionScore(size_t unique_sources, size_t unique_destinations,
                                               size_t inbound_count, size_t outbound_count,
                                               size_t transaction_count) {
  double score = 0.0;

  // Funnel in: everything arrives from one (or two) senders.
  if (inbound_count > 0) {
    if (unique_sources == 1) {
      score += 40.0;
    } else if (unique_sources <= 2 && inbound_count >= 4) {
      score += 32.0;
    }
  }

  // Funnel out.
  if (outbound_count > 0) {
    if (unique_destinations == 1) {
      score += 40.0;
    } else if (unique_destinations <= 2 && outbound_count >= 4) {
      score += 32.0;
    }
  }

  // Narrow connector between a handful of counterparties.
  if (unique_sources + unique_destinations <= 3 && transaction_count >= 2) {
    score += 35.0;
  }

  return std::min(score, 100.0);
}

double SixFactorShellDetector::dormancyScore(const std::vector<Timestamp>& timestamps,
                                             const ShellConfig& config) {
  if (timestamps.size() < 3) return 0.0;

  std::vector<Timestamp> sorted = timestamps;
  std::sort(sorted.begin(), sorted.end());

  std::vector<double> gaps;
  gaps.reserve(sorted.size() - 1);
  for (size_t i = 0; i + 1 < sorted.size(); ++i) {
    gaps.push_back(hoursBetween(sorted[i], sorted[i + 1]));
  }

  auto widest = std::max_element(gaps.begin(), gaps.end());
  if (*widest > config.dormancy_gap_hours) {
    std::vector<double> after(widest + 1, gaps.end());
    if (!after.empty() && mean(after) < config.burst_gap_hours) {
      return 100.0;
    }
  }

  const double average_gap = mean(gaps);
  if (average_gap > 0.0) {
    const double deviation = gaps.size() > 1 ? sampleStdDev(gaps, average_gap) : 0.0;
    if (deviation / average_gap < 0.5) {
      return 80.0;
    }
  }
  return 0.0;
}

double SixFactorShellDetector::directionalityScore(size_t inbound_count, size_t outbound_count) {
  const size_t total = inbound_count + outbound_count;
  if (total == 0) return 0.0;
  const double imbalance = std::abs(static_cast<double>(inbound_count) -
                                    static_cast<double>(outbound_count));
  return 100.0 * imbalance / static_cast<double>(total);
}

double SixFactorShellDetector::uniformityScore(const std::vector<double>& amounts) {
  if (amounts.size() < 3) return 0.0;

  const double average = mean(amounts);
  if (average <= 0.0) return 0.0;
  const double cv = sampleStdDev(amounts, average) / average;
  return 100.0 * std::max(0.0, std::min(1.0, 1.0 - cv));
}

ShellProfile SixFactorShellDetector::profile(const TransactionGraph& graph, size_t account_index,
                                             const ShellConfig& config) const {
  const AccountStats& stats = graph.statsAt(account_index);

  ShellProfile profile;
  profile.account_id = graph.accountAt(account_index);
  profile.total_transactions = stats.transactionCount();
  profile.inbound_count = stats.in_count;
  profile.outbound_count = stats.out_count;
  profile.unique_sources = stats.sources.size();
  profile.unique_destinations = stats.destinations.size();
  profile.total_in = stats.total_in;
  profile.total_out = stats.total_out;
  profile.total_throughput = stats.throughput();
  if (profile.total_transactions > 0) {
    profile.avg_transaction_value =
        profile.total_throughput / static_cast<double>(profile.total_transactions);
  }
  profile.in_out_ratio = stats.total_in > 0.0 ? stats.total_out / stats.total_in : 0.0;

  std::vector<Timestamp> timestamps;
  std::vector<double> amounts;
  timestamps.reserve(stats.transactions.size());
  amounts.reserve(stats.transactions.size());
  for (size_t t : stats.transactions) {
    timestamps.push_back(graph.transactions()[t].timestamp);
    amounts.push_back(graph.transactions()[t].amount);
  }

  profile.high_value_score = highValueScore(profile.avg_transaction_value, config);
  profile.pass_through_score = passThroughScore(stats.total_in, stats.total_out, config);
  profile.connection_score =
      connectionScore(profile.unique_sources, profile.unique_destinations, stats.in_count,
                      stats.out_count, profile.total_transactions);
  profile.dormancy_score = dormancyScore(timestamps, config);
  profile.directionality_score = directionalityScore(stats.in_count, stats.out_count);
  profile.uniformity_score = uniformityScore(amounts);

  const double composite = profile.high_value_score * config.high_value_weight +
                           profile.pass_through_score * config.pass_through_weight +
                           profile.connection_score * config.connection_weight +
                           profile.dormancy_score * config.dormancy_weight +
                           profile.directionality_score * config.directionality_weight +
                           profile.uniformity_score * config.uniformity_weight;
  profile.shell_score = std::max(0.0, std::min(100.0, composite));
  profile.risk_level = riskLevelFor(profile.shell_score);
  profile.is_pass_through = profile.pass_through_score >= 100.0;

  if (profile.shell_score >= 60.0) profile.flags.push_back("high_shell_score");
  if (profile.high_value_score >= 100.0) profile.flags.push_back("high_value_transactions");
  if (profile.is_pass_through) profile.flags.push_back("pass_through");
  if (stats.in_count > 0 && profile.unique_sources == 1) profile.flags.push_back("limited_sources");
  if (stats.out_count > 0 && profile.unique_destinations == 1) {
    profile.flags.push_back("limited_destinations");
  }
  if (profile.dormancy_score >= 100.0) profile.flags.push_back("dormant_then_active");
  if (profile.directionality_score >= 90.0 && profile.total_transactions > 1) {
    profile.flags.push_back("one_directional_flow");
  }
  if (profile.uniformity_score >= 80.0) profile.flags.push_back("uniform_amounts");

  return profile;
}

ShellReport SixFactorShellDetector::detect(const TransactionGraph& graph,
                                           const ShellConfig& config,
                                           const concurrent::PartitionedExecutor& executor) const {
  ShellReport report;
  report.candidates = executor.collect<ShellProfile>(
      graph.accountCount(), [&](size_t index, std::vector<ShellProfile>& out) {
        if (isCandidate(graph.statsAt(index), config)) {
          out.push_back(profile(graph, index, config));
        }
      });

  for (const auto& candidate : report.candidates) {
    if (candidate.shell_score >= config.report_threshold) {
      report.reported.push_back(candidate);
    }
  }
  std::stable_sort(report.reported.begin(), report.reported.end(),
                   [](const ShellProfile& a, const ShellProfile& b) {
                     return a.shell_score > b.shell_score;
                   });

  LOG_BUILDER(observability::LogLevel::INFO, "Shell scan finished")
      .field("candidates", report.candidates.size())
      .field("reported", report.reported.size());

  return report;
}

std::unique_ptr<ShellDetector> makeShellDetector(const std::string& strategy) {
  if (strategy == SixFactorShellDetector::kName) {
    return std::make_unique<SixFactorShellDetector>();
  }
  throw ConfigError("shell.strategy", "unknown strategy '" + strategy + "'");
}

}  // namespace engine
}  // namespace muleguard
