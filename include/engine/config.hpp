#ifndef MULEGUARD_CONFIG_HPP_
#define MULEGUARD_CONFIG_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace muleguard {
namespace engine {

/**
 * Tunables for the ring (cycle) search.
 */
struct CycleConfig {
  std::string strategy = "bounded_dfs_v2";
  size_t min_length = 3;
  size_t max_length = 5;
  size_t max_start_nodes = 50;  // K: DFS roots, ranked by out-degree
  size_t max_cycles = 100;

  // strength = volume_weight * (volume / volume_scale)
  //          + count_weight  * (txn_count / count_scale)
  //          + length_weight * (length / length_scale)
  double volume_scale = 100000.0;
  double count_scale = 10.0;
  double length_scale = 3.0;
  double volume_weight = 0.40;
  double count_weight = 0.35;
  double length_weight = 0.25;

  size_t cluster_min_shared_accounts = 2;
};

/**
 * Tunables for the sliding-window smurfing search.
 */
struct SmurfingConfig {
  std::string strategy = "sliding_window_v2";
  double window_hours = 72.0;
  size_t min_transactions = 6;
  size_t high_count_threshold = 10;
  double alert_threshold = 30.0;  // best-window score must exceed this

  std::vector<double> structuring_thresholds = {10000.0, 5000.0, 3000.0, 1000.0};
  // An amount is "just below" threshold t when t * (1 - tolerance) <= amount < t.
  double structuring_tolerance = 0.10;
  double structuring_min_fraction = 0.40;

  size_t consolidation_min_sources = 3;
  size_t consolidation_max_outbound = 2;
  double consolidation_tolerance = 0.10;

  // Window totals above amount_min earn amount_points_per_scale points per
  // amount_scale, up to amount_points_cap.
  double amount_min = 100000.0;
  double amount_scale = 100000.0;
  double amount_points_per_scale = 10.0;
  double amount_points_cap = 20.0;
};

/**
 * Weights and thresholds for the six-dimension shell profile.
 */
struct ShellConfig {
  std::string strategy = "six_factor_v2";
  size_t max_transactions = 5;
  double min_total_value = 50000.0;
  double report_threshold = 40.0;

  double high_value_baseline = 10000.0;
  double pass_through_tolerance = 0.05;
  double dormancy_gap_hours = 168.0;
  double burst_gap_hours = 24.0;

  double high_value_weight = 0.20;
  double pass_through_weight = 0.25;
  double connection_weight = 0.20;
  double dormancy_weight = 0.15;
  double directionality_weight = 0.15;
  double uniformity_weight = 0.05;
};

/**
 * Composite risk weights and the per-signal heuristics owned by the scorer.
 */
struct ScoringConfig {
  double ring_weight = 0.30;
  double smurfing_weight = 0.25;
  double shell_weight = 0.25;
  double pattern_weight = 0.20;

  // ring involvement = 100 * rings_joined / rings_retained, scaled by
  // min(ring_amount_factor_cap, 1 + average ring amount / ring_amount_scale)
  double ring_amount_scale = 1000000.0;
  double ring_amount_factor_cap = 1.5;

  double velocity_anomaly_threshold = 2.0;  // transactions per hour
  double flow_weight = 0.7;
  double velocity_weight = 0.3;

  double factor_threshold = 50.0;
};

struct ExecutionConfig {
  size_t worker_threads = 0;  // 0 selects std::thread::hardware_concurrency()
};

/**
 * Complete configuration for one analysis run.
 */
struct EngineConfig {
  CycleConfig cycles;
  SmurfingConfig smurfing;
  ShellConfig shell;
  ScoringConfig scoring;
  ExecutionConfig execution;

  static EngineConfig defaults() { return EngineConfig{}; }

  /**
   * Throws ConfigError naming the first offending key.
   */
  void validate() const;

  size_t resolvedWorkerThreads() const;
};

/**
 * Overlays the keys present in `j` onto the defaults and validates the result.
 */
EngineConfig configFromJson(const nlohmann::json& j);

/**
 * Reads a JSON configuration file. Throws ConfigError if unreadable.
 */
EngineConfig loadConfig(const std::string& path);

nlohmann::json configToJson(const EngineConfig& config);

}  // namespace engine
}  // namespace muleguard

#endif  // MULEGUARD_CONFIG_HPP_
