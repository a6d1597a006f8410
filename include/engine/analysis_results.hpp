#ifndef MULEGUARD_ANALYSIS_RESULTS_HPP_
#define MULEGUARD_ANALYSIS_RESULTS_HPP_

#include "engine/transaction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace muleguard {
namespace engine {

enum class RiskLevel {
  LOW,
  MEDIUM,
  HIGH,
  CRITICAL
};

/**
 * Tier for a 0-100 score: CRITICAL >= 80, HIGH >= 60, MEDIUM >= 40, else LOW.
 */
RiskLevel riskLevelFor(double score);
std::string toString(RiskLevel level);

/**
 * A closed directed walk of distinct accounts (a "ring").
 * `accounts` is the canonical rotation: smallest account id first,
 * direction preserved.
 */
struct Cycle {
  std::string ring_id;
  std::vector<std::string> accounts;
  std::vector<std::string> transaction_ids;
  double total_amount = 0.0;
  size_t transaction_count = 0;
  double average_transaction = 0.0;  // mean amount per hop
  double amount_spread = 0.0;  // coefficient of variation of per-hop amounts, capped at 1
  double uniformity = 0.0;     // 1 - amount_spread
  double strength = 0.0;
  std::string detection_type = "cycle";

  size_t length() const { return accounts.size(); }
};

/**
 * Two retained rings that share at least the configured number of accounts.
 */
struct CycleOverlap {
  std::string ring_a;
  std::string ring_b;
  std::vector<std::string> shared_accounts;
  bool nested = false;  // one ring's account set is a strict subset of the other's
};

/**
 * A connected group of overlapping rings.
 */
struct CycleCluster {
  std::vector<std::string> ring_ids;
  std::vector<std::string> accounts;
};

struct SmurfingAlert {
  std::string account_id;
  Timestamp window_start{};
  Timestamp window_end{};
  size_t fan_in = 0;
  size_t fan_out = 0;
  size_t transaction_count = 0;
  double total_amount = 0.0;
  double average_transaction = 0.0;
  double elapsed_hours = 0.0;
  double velocity = 0.0;
  double risk_score = 0.0;
  bool high_frequency = false;
  bool structuring = false;
  bool consolidation = false;
  double structuring_fraction = 0.0;
  std::optional<double> structuring_threshold;
  std::vector<std::string> flags;
};

struct ShellProfile {
  std::string account_id;

  double high_value_score = 0.0;
  double pass_through_score = 0.0;
  double connection_score = 0.0;
  double dormancy_score = 0.0;
  double directionality_score = 0.0;
  double uniformity_score = 0.0;
  double shell_score = 0.0;
  RiskLevel risk_level = RiskLevel::LOW;

  size_t total_transactions = 0;
  size_t inbound_count = 0;
  size_t outbound_count = 0;
  size_t unique_sources = 0;
  size_t unique_destinations = 0;
  double total_in = 0.0;
  double total_out = 0.0;
  double total_throughput = 0.0;
  double avg_transaction_value = 0.0;
  double in_out_ratio = 0.0;
  bool is_pass_through = false;
  std::vector<std::string> flags;
};

/**
 * Final per-account verdict handed to every downstream consumer.
 */
struct AccountScore {
  std::string account_id;
  double ring_involvement_score = 0.0;
  double smurfing_score = 0.0;
  double shell_score = 0.0;
  double transaction_pattern_score = 0.0;
  double final_score = 0.0;
  RiskLevel risk_level = RiskLevel::LOW;
  size_t ring_count = 0;
  std::vector<std::string> risk_factors;
};

struct AnalysisSummary {
  double total_volume = 0.0;
  double avg_transaction = 0.0;
  double median_transaction = 0.0;
  double min_transaction = 0.0;
  double max_transaction = 0.0;
  size_t cycles_detected = 0;
  double avg_cycle_length = 0.0;
  size_t accounts_in_rings = 0;
  size_t smurfing_alerts_count = 0;
  size_t shell_accounts_count = 0;
  size_t high_risk_accounts = 0;
  size_t critical_accounts = 0;
  size_t suspicious_accounts = 0;
  double suspicious_percent = 0.0;
};

struct AnalysisResults {
  size_t total_transactions = 0;
  size_t total_accounts = 0;
  std::vector<Cycle> rings_detected;
  std::vector<CycleOverlap> cycle_overlaps;
  std::vector<CycleCluster> cycle_clusters;
  std::vector<SmurfingAlert> smurfing_alerts;
  std::vector<ShellProfile> shell_accounts;
  std::vector<AccountScore> account_scores;  // ordered by account id
  std::vector<std::string> critical_accounts;
  std::vector<std::string> high_risk_accounts;
  AnalysisSummary summary;

  const AccountScore* findAccountScore(const std::string& account_id) const;
};

/**
 * Everything one analysis run says about a single account.
 */
struct AccountReport {
  AccountScore score;
  std::vector<Cycle> rings;
  std::optional<SmurfingAlert> smurfing;
  std::optional<ShellProfile> shell;
};

std::optional<AccountReport> accountReport(const AnalysisResults& results,
                                           const std::string& account_id);

}  // namespace engine
}  // namespace muleguard

#endif  // MULEGUARD_ANALYSIS_RESULTS_HPP_
