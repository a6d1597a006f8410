#ifndef MULEGUARD_SMURFING_DETECTOR_HPP_
#define MULEGUARD_SMURFING_DETECTOR_HPP_

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
 * Smurfing (fan-in / fan-out burst) search strategy.
 */
class SmurfingDetector {
 public:
  virtual ~SmurfingDetector() = default;

  virtual std::string name() const = 0;

  /**
   * Alerts ordered by risk score (desc), then account id.
   */
  virtual std::vector<SmurfingAlert> detect(const TransactionGraph& graph,
                                            const SmurfingConfig& config,
                                            const concurrent::PartitionedExecutor& executor) const = 0;

  /**
   * Best-window evaluation of one account; empty when the account is below
   * min_transactions or nothing in its best window is suspicious.
   */
  virtual std::optional<SmurfingAlert> evaluateAccount(const TransactionGraph& graph,
                                                       size_t account_index,
                                                       const SmurfingConfig& config) const = 0;
};

/**
 * Every transaction touching an account opens a candidate window
 * [t, t + window_hours]; only the highest-scoring window is kept.
 */
class SlidingWindowSmurfingDetector : public SmurfingDetector {
 public:
  static constexpr const char* kName = "sliding_window_v2";

  /**
   * Activity of one account inside one window.
   */
  struct WindowStats {
    Timestamp start{};
    Timestamp end{};
    size_t transaction_count = 0;
    size_t fan_in = 0;
    size_t fan_out = 0;
    double total_amount = 0.0;
    double elapsed_hours = 1.0;
    double velocity = 0.0;
    double score = 0.0;
  };

  std::string name() const override { return kName; }

  std::vector<SmurfingAlert> detect(const TransactionGraph& graph, const SmurfingConfig& config,
                                    const concurrent::PartitionedExecutor& executor) const override;

  std::optional<SmurfingAlert> evaluateAccount(const TransactionGraph& graph, size_t account_index,
                                               const SmurfingConfig& config) const override;

  /**
   * 0-100: +30 for a high count, +5 per distinct source and destination,
   * +20/+10 for velocity above 1 / 0.5 txn per hour, and for totals above
   * amount_min, amount_points_per_scale per amount_scale up to
   * amount_points_cap. Clipped to [0, 100].
   */
  static double scoreWindow(size_t transaction_count, size_t fan_in, size_t fan_out,
                            double velocity, double total_amount, const SmurfingConfig& config);

  /**
   * Fraction of amounts within `structuring_tolerance` below any threshold.
   * `matched` receives the threshold with the most hits.
   */
  static double structuringFraction(const std::vector<double>& amounts,
                                    const SmurfingConfig& config,
                                    std::optional<double>* matched = nullptr);

  /**
   * True when inbound from at least consolidation_min_sources senders leaves
   * through one (or up to consolidation_max_outbound) outbound transfers of
   * roughly the same total.
   */
  static bool isConsolidation(size_t distinct_sources, double total_inbound,
                              std::vector<double> outbound_amounts,
                              const SmurfingConfig& config);

 private:
  WindowStats measureWindow(const TransactionGraph& graph, const std::string& account_id,
                            const std::vector<size_t>& transactions, size_t begin, size_t end,
                            const SmurfingConfig& config) const;
};

/**
 * Throws ConfigError for an unknown strategy name.
 */
std::unique_ptr<SmurfingDetector> makeSmurfingDetector(const std::string& strategy);

}  // namespace engine
}  // namespace muleguard

#endif  // MULEGUARD_SMURFING_DETECTOR_HPP_
