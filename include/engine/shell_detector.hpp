#ifndef MULEGUARD_SHELL_DETECTOR_HPP_
#define MULEGUARD_SHELL_DETECTOR_HPP_

#include "concurrent/partitioned_executor.hpp"
#include "engine/analysis_results.hpp"
#include "engine/config.hpp"
#include "engine/transaction_graph.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace muleguard {
namespace engine {

/**
 * Output of a population-wide shell scan.
 */
struct ShellReport {
  // Every account passing the pre-filter, ordered by account id.
  std::vector<ShellProfile> candidates;
  // Candidates at or above report_threshold, ordered by shell score (desc).
  std::vector<ShellProfile> reported;
};

/**
 * Shell / pass-through account profiling strategy.
 */
class ShellDetector {
 public:
  virtual ~ShellDetector() = default;

  virtual std::string name() const = 0;

  /**
   * Profiles any account, without pre-filters.
   */
  virtual ShellProfile profile(const TransactionGraph& graph, size_t account_index,
                               const ShellConfig& config) const = 0;

  virtual ShellReport detect(const TransactionGraph& graph, const ShellConfig& config,
                             const concurrent::PartitionedExecutor& executor) const = 0;

  /**
   * Bulk pre-filter: few transactions carrying a large total.
   */
  static bool isCandidate(const AccountStats& stats, const ShellConfig& config) {
    return stats.transactionCount() <= config.max_transactions &&
           stats.throughput() >= config.min_total_value;
  }
};

/**
 * Six weighted 0-100 dimensions: high value, pass-through, connection,
 * dormancy, directionality and amount uniformity.
 */
class SixFactorShellDetector : public ShellDetector {
 public:
  static constexpr const char* kName = "six_factor_v2";

  std::string name() const override { return kName; }

  ShellProfile profile(const TransactionGraph& graph, size_t account_index,
                       const ShellConfig& config) const override;

  ShellReport detect(const TransactionGraph& graph, const ShellConfig& config,
                     const concurrent::PartitionedExecutor& executor) const override;

  static double highValueScore(double average_value, const ShellConfig& config);

  /**
   * 100 iff |in - out| / max(in, out) < pass_through_tolerance; lower tiers
   * at in/out ratios above 0.90 and 0.85.
   */
  static double passThroughScore(double total_in, double total_out, const ShellConfig& config);

  static double connectionScore(size_t unique_sources, size_t unique_destinations,
                                size_t inbound_count, size_t outbound_count,
                                size_t transaction_count);

  /**
   * 100 for a gap longer than dormancy_gap_hours followed by activity whose
   * gaps average under burst_gap_hours; 80 for tightly clustered timing.
   */
  static double dormancyScore(const std::vector<Timestamp>& timestamps, const ShellConfig& config);

  static double directionalityScore(size_t inbound_count, size_t outbound_count);

  static double uniformityScore(const std::vector<double>& amounts);
};

/**
 * Throws ConfigError for an unknown strategy name.
 */
std::unique_ptr<ShellDetector> makeShellDetector(const std::string& strategy);

}  // namespace engine
}  // namespace muleguard

#endif  // MULEGUARD_SHELL_DETECTOR_HPP_
