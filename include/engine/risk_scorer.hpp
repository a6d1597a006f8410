#ifndef MULEGUARD_RISK_SCORER_HPP_
#define MULEGUARD_RISK_SCORER_HPP_

#include "concurrent/partitioned_executor.hpp"
#include "engine/analysis_results.hpp"
#include "engine/config.hpp"
#include "engine/transaction_graph.hpp"

#include <string>
#include <vector>

namespace muleguard {
namespace engine {

/**
 * Per-account detector outputs feeding the composite score.
 */
struct AccountSignals {
  size_t ring_count = 0;
  size_t total_rings = 0;  // rings retained in the whole run
  double average_ring_amount = 0.0;
  const SmurfingAlert* smurfing = nullptr;
  const ShellProfile* shell = nullptr;
};

/**
 * Combines ring, smurfing, shell and transaction-pattern signals into one
 * AccountScore per account. Pure aggregation: no search, no windowing.
 */
class RiskScorer {
 public:
  explicit RiskScorer(const ScoringConfig& config);

  /**
   * One score per graph account, ordered by account id. Accounts named by
   * no detector keep zero ring, smurfing and shell components.
   */
  std::vector<AccountScore> scoreAll(const TransactionGraph& graph,
                                     const std::vector<Cycle>& cycles,
                                     const std::vector<SmurfingAlert>& smurfing_alerts,
                                     const std::vector<ShellProfile>& shell_candidates,
                                     const concurrent::PartitionedExecutor& executor) const;

  AccountScore score(const std::string& account_id, const AccountStats& stats,
                     const AccountSignals& signals) const;

  /**
   * Share of the run's rings the account joins (as 0-100), scaled by up to
   * ring_amount_factor_cap for high-value rings; 0 for accounts in no ring.
   */
  double ringInvolvementScore(size_t ring_count, size_t total_rings,
                              double average_ring_amount) const;

  /**
   * Blend of flowPatternScore and velocityAnomalyScore.
   */
  double transactionPatternScore(const AccountStats& stats) const;

  /**
   * In/out imbalance, consolidation or dispersal shape, and throughput per
   * distinct counterparty.
   */
  double flowPatternScore(const AccountStats& stats) const;

  /**
   * Lifetime rate above velocity_anomaly_threshold txn/hour (three or more
   * transactions), graded up to 100 at twice the threshold.
   */
  double velocityAnomalyScore(const AccountStats& stats) const;

  /**
   * Weighted sum of the four clipped components, clipped to [0, 100].
   */
  double combine(double ring, double smurfing, double shell, double pattern) const;

 private:
  ScoringConfig config_;
};

}  // namespace engine
}  // namespace muleguard

#endif  // MULEGUARD_RISK_SCORER_HPP_
