#include "engine/config.hpp"
#include "engine/errors.hpp"

#include <fstream>
#include <thread>
#include <type_traits>

namespace muleguard {
namespace engine {

namespace {

const char* const kCycleStrategies[] = {"bounded_dfs_v2"};
const char* const kSmurfingStrategies[] = {"sliding_window_v2"};
const char* const kShellStrategies[] = {"six_factor_v2"};

template <typename T>
void overlay(const nlohmann::json& section, const std::string& section_name,
             const char* key, T& field) {
  auto it = section.find(key);
  if (it == section.end()) return;
  if constexpr (std::is_unsigned<T>::value) {
    if (!it->is_number_integer() ||
        (!it->is_number_unsigned() && it->get<long long>() < 0)) {
      throw ConfigError(section_name + "." + key, "must be a non-negative integer");
    }
  }
  try {
    field = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(section_name + "." + key, e.what());
  }
}

template <size_t N>
void requireKnownStrategy(const std::string& key, const std::string& name,
                          const char* const (&known)[N]) {
  for (const char* candidate : known) {
    if (name == candidate) return;
  }
  throw ConfigError(key, "unknown strategy '" + name + "'");
}

void requirePositive(const std::string& key, double value) {
  if (!(value > 0.0)) throw ConfigError(key, "must be positive");
}

void requireNonNegative(const std::string& key, double value) {
  if (!(value >= 0.0)) throw ConfigError(key, "must not be negative");
}

void requireFraction(const std::string& key, double value) {
  if (!(value >= 0.0 && value < 1.0)) throw ConfigError(key, "must be in [0, 1)");
}

const nlohmann::json& sectionOf(const nlohmann::json& j, const char* name) {
  static const nlohmann::json empty = nlohmann::json::object();
  auto it = j.find(name);
  if (it == j.end()) return empty;
  if (!it->is_object()) throw ConfigError(name, "must be an object");
  return *it;
}

}  // namespace

void EngineConfig::validate() const {
  requireKnownStrategy("cycles.strategy", cycles.strategy, kCycleStrategies);
  if (cycles.min_length < 3) throw ConfigError("cycles.min_length", "must be at least 3");
  if (cycles.max_length < cycles.min_length) {
    throw ConfigError("cycles.max_length", "must not be below cycles.min_length");
  }
  if (cycles.max_start_nodes == 0) throw ConfigError("cycles.max_start_nodes", "must be positive");
  if (cycles.max_cycles == 0) throw ConfigError("cycles.max_cycles", "must be positive");
  requirePositive("cycles.volume_scale", cycles.volume_scale);
  requirePositive("cycles.count_scale", cycles.count_scale);
  requirePositive("cycles.length_scale", cycles.length_scale);
  requireNonNegative("cycles.volume_weight", cycles.volume_weight);
  requireNonNegative("cycles.count_weight", cycles.count_weight);
  requireNonNegative("cycles.length_weight", cycles.length_weight);
  if (cycles.cluster_min_shared_accounts == 0) {
    throw ConfigError("cycles.cluster_min_shared_accounts", "must be positive");
  }

  requireKnownStrategy("smurfing.strategy", smurfing.strategy, kSmurfingStrategies);
  requirePositive("smurfing.window_hours", smurfing.window_hours);
  if (smurfing.min_transactions == 0) {
    throw ConfigError("smurfing.min_transactions", "must be positive");
  }
  requireNonNegative("smurfing.alert_threshold", smurfing.alert_threshold);
  for (double threshold : smurfing.structuring_thresholds) {
    requirePositive("smurfing.structuring_thresholds", threshold);
  }
  requireFraction("smurfing.structuring_tolerance", smurfing.structuring_tolerance);
  requireFraction("smurfing.structuring_min_fraction", smurfing.structuring_min_fraction);
  if (smurfing.consolidation_max_outbound == 0) {
    throw ConfigError("smurfing.consolidation_max_outbound", "must be positive");
  }
  requireFraction("smurfing.consolidation_tolerance", smurfing.consolidation_tolerance);
  requireNonNegative("smurfing.amount_min", smurfing.amount_min);
  requirePositive("smurfing.amount_scale", smurfing.amount_scale);
  requireNonNegative("smurfing.amount_points_per_scale", smurfing.amount_points_per_scale);
  requireNonNegative("smurfing.amount_points_cap", smurfing.amount_points_cap);

  requireKnownStrategy("shell.strategy", shell.strategy, kShellStrategies);
  requireNonNegative("shell.min_total_value", shell.min_total_value);
  requirePositive("shell.high_value_baseline", shell.high_value_baseline);
  requireFraction("shell.pass_through_tolerance", shell.pass_through_tolerance);
  requirePositive("shell.dormancy_gap_hours", shell.dormancy_gap_hours);
  requirePositive("shell.burst_gap_hours", shell.burst_gap_hours);
  requireNonNegative("shell.high_value_weight", shell.high_value_weight);
  requireNonNegative("shell.pass_through_weight", shell.pass_through_weight);
  requireNonNegative("shell.connection_weight", shell.connection_weight);
  requireNonNegative("shell.dormancy_weight", shell.dormancy_weight);
  requireNonNegative("shell.directionality_weight", shell.directionality_weight);
  requireNonNegative("shell.uniformity_weight", shell.uniformity_weight);

  requireNonNegative("scoring.ring_weight", scoring.ring_weight);
  requireNonNegative("scoring.smurfing_weight", scoring.smurfing_weight);
  requireNonNegative("scoring.shell_weight", scoring.shell_weight);
  requireNonNegative("scoring.pattern_weight", scoring.pattern_weight);
  requirePositive("scoring.ring_amount_scale", scoring.ring_amount_scale);
  if (scoring.ring_amount_factor_cap < 1.0) {
    throw ConfigError("scoring.ring_amount_factor_cap", "must be at least 1");
  }
  requirePositive("scoring.velocity_anomaly_threshold", scoring.velocity_anomaly_threshold);
  requireNonNegative("scoring.flow_weight", scoring.flow_weight);
  requireNonNegative("scoring.velocity_weight", scoring.velocity_weight);
  requireNonNegative("scoring.factor_threshold", scoring.factor_threshold);
}

size_t EngineConfig::resolvedWorkerThreads() const {
  if (execution.worker_threads > 0) return execution.worker_threads;
  unsigned hardware = std::thread::hardware_concurrency();
  return hardware > 0 ? hardware : 1;
}

EngineConfig configFromJson(const nlohmann::json& j) {
  if (!j.is_object()) throw ConfigError("<root>", "configuration must be a JSON object");

  EngineConfig config = EngineConfig::defaults();

  const auto& cycles = sectionOf(j, "cycles");
  overlay(cycles, "cycles", "strategy", config.cycles.strategy);
  overlay(cycles, "cycles", "min_length", config.cycles.min_length);
  overlay(cycles, "cycles", "max_length", config.cycles.max_length);
  overlay(cycles, "cycles", "max_start_nodes", config.cycles.max_start_nodes);
  overlay(cycles, "cycles", "max_cycles", config.cycles.max_cycles);
  overlay(cycles, "cycles", "volume_scale", config.cycles.volume_scale);
  overlay(cycles, "cycles", "count_scale", config.cycles.count_scale);
  overlay(cycles, "cycles", "length_scale", config.cycles.length_scale);
  overlay(cycles, "cycles", "volume_weight", config.cycles.volume_weight);
  overlay(cycles, "cycles", "count_weight", config.cycles.count_weight);
  overlay(cycles, "cycles", "length_weight", config.cycles.length_weight);
  overlay(cycles, "cycles", "cluster_min_shared_accounts",
          config.cycles.cluster_min_shared_accounts);

  const auto& smurfing = sectionOf(j, "smurfing");
  overlay(smurfing, "smurfing", "strategy", config.smurfing.strategy);
  overlay(smurfing, "smurfing", "window_hours", config.smurfing.window_hours);
  overlay(smurfing, "smurfing", "min_transactions", config.smurfing.min_transactions);
  overlay(smurfing, "smurfing", "high_count_threshold", config.smurfing.high_count_threshold);
  overlay(smurfing, "smurfing", "alert_threshold", config.smurfing.alert_threshold);
  overlay(smurfing, "smurfing", "structuring_thresholds",
          config.smurfing.structuring_thresholds);
  overlay(smurfing, "smurfing", "structuring_tolerance", config.smurfing.structuring_tolerance);
  overlay(smurfing, "smurfing", "structuring_min_fraction",
          config.smurfing.structuring_min_fraction);
  overlay(smurfing, "smurfing", "consolidation_min_sources",
          config.smurfing.consolidation_min_sources);
  overlay(smurfing, "smurfing", "consolidation_max_outbound",
          config.smurfing.consolidation_max_outbound);
  overlay(smurfing, "smurfing", "consolidation_tolerance",
          config.smurfing.consolidation_tolerance);
  overlay(smurfing, "smurfing", "amount_min", config.smurfing.amount_min);
  overlay(smurfing, "smurfing", "amount_scale", config.smurfing.amount_scale);
  overlay(smurfing, "smurfing", "amount_points_per_scale",
          config.smurfing.amount_points_per_scale);
  overlay(smurfing, "smurfing", "amount_points_cap", config.smurfing.amount_points_cap);

  const auto& shell = sectionOf(j, "shell");
  overlay(shell, "shell", "strategy", config.shell.strategy);
  overlay(shell, "shell", "max_transactions", config.shell.max_transactions);
  overlay(shell, "shell", "min_total_value", config.shell.min_total_value);
  overlay(shell, "shell", "report_threshold", config.shell.report_threshold);
  overlay(shell, "shell", "high_value_baseline", config.shell.high_value_baseline);
  overlay(shell, "shell", "pass_through_tolerance", config.shell.pass_through_tolerance);
  overlay(shell, "shell", "dormancy_gap_hours", config.shell.dormancy_gap_hours);
  overlay(shell, "shell", "burst_gap_hours", config.shell.burst_gap_hours);
  overlay(shell, "shell", "high_value_weight", config.shell.high_value_weight);
  overlay(shell, "shell", "pass_through_weight", config.shell.pass_through_weight);
  overlay(shell, "shell", "connection_weight", config.shell.connection_weight);
  overlay(shell, "shell", "dormancy_weight", config.shell.dormancy_weight);
  overlay(shell, "shell", "directionality_weight", config.shell.directionality_weight);
  overlay(shell, "shell", "uniformity_weight", config.shell.uniformity_weight);

  const auto& scoring = sectionOf(j, "scoring");
  overlay(scoring, "scoring", "ring_weight", config.scoring.ring_weight);
  overlay(scoring, "scoring", "smurfing_weight", config.scoring.smurfing_weight);
  overlay(scoring, "scoring", "shell_weight", config.scoring.shell_weight);
  overlay(scoring, "scoring", "pattern_weight", config.scoring.pattern_weight);
  overlay(scoring, "scoring", "ring_amount_scale", config.scoring.ring_amount_scale);
  overlay(scoring, "scoring", "ring_amount_factor_cap", config.scoring.ring_amount_factor_cap);
  overlay(scoring, "scoring", "velocity_anomaly_threshold",
          config.scoring.velocity_anomaly_threshold);
  overlay(scoring, "scoring", "flow_weight", config.scoring.flow_weight);
  overlay(scoring, "scoring", "velocity_weight", config.scoring.velocity_weight);
  overlay(scoring, "scoring", "factor_threshold", config.scoring.factor_threshold);

  const auto& execution = sectionOf(j, "execution");
  overlay(execution, "execution", "worker_threads", config.execution.worker_threads);

  config.validate();
  return config;
}

EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError(path, "cannot open configuration file");

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(path, e.what());
  }
  return configFromJson(j);
}

nlohmann::json configToJson(const EngineConfig& config) {
  nlohmann::json j;
  j["cycles"] = {
      {"strategy", config.cycles.strategy},
      {"min_length", config.cycles.min_length},
      {"max_length", config.cycles.max_length},
      {"max_start_nodes", config.cycles.max_start_nodes},
      {"max_cycles", config.cycles.max_cycles},
      {"volume_scale", config.cycles.volume_scale},
      {"count_scale", config.cycles.count_scale},
      {"length_scale", config.cycles.length_scale},
      {"volume_weight", config.cycles.volume_weight},
      {"count_weight", config.cycles.count_weight},
      {"length_weight", config.cycles.length_weight},
      {"cluster_min_shared_accounts", config.cycles.cluster_min_shared_accounts}};
  j["smurfing"] = {
      {"strategy", config.smurfing.strategy},
      {"window_hours", config.smurfing.window_hours},
      {"min_transactions", config.smurfing.min_transactions},
      {"high_count_threshold", config.smurfing.high_count_threshold},
      {"alert_threshold", config.smurfing.alert_threshold},
      {"structuring_thresholds", config.smurfing.structuring_thresholds},
      {"structuring_tolerance", config.smurfing.structuring_tolerance},
      {"structuring_min_fraction", config.smurfing.structuring_min_fraction},
      {"consolidation_min_sources", config.smurfing.consolidation_min_sources},
      {"consolidation_max_outbound", config.smurfing.consolidation_max_outbound},
      {"consolidation_tolerance", config.smurfing.consolidation_tolerance},
      {"amount_min", config.smurfing.amount_min},
      {"amount_scale", config.smurfing.amount_scale},
      {"amount_points_per_scale", config.smurfing.amount_points_per_scale},
      {"amount_points_cap", config.smurfing.amount_points_cap}};
  j["shell"] = {
      {"strategy", config.shell.strategy},
      {"max_transactions", config.shell.max_transactions},
      {"min_total_value", config.shell.min_total_value},
      {"report_threshold", config.shell.report_threshold},
      {"high_value_baseline", config.shell.high_value_baseline},
      {"pass_through_tolerance", config.shell.pass_through_tolerance},
      {"dormancy_gap_hours", config.shell.dormancy_gap_hours},
      {"burst_gap_hours", config.shell.burst_gap_hours},
      {"high_value_weight", config.shell.high_value_weight},
      {"pass_through_weight", config.shell.pass_through_weight},
      {"connection_weight", config.shell.connection_weight},
      {"dormancy_weight", config.shell.dormancy_weight},
      {"directionality_weight", config.shell.directionality_weight},
      {"uniformity_weight", config.shell.uniformity_weight}};
  j["scoring"] = {
      {"ring_weight", config.scoring.ring_weight},
      {"smurfing_weight", config.scoring.smurfing_weight},
      {"shell_weight", config.scoring.shell_weight},
      {"pattern_weight", config.scoring.pattern_weight},
      {"ring_amount_scale", config.scoring.ring_amount_scale},
      {"ring_amount_factor_cap", config.scoring.ring_amount_factor_cap},
      {"velocity_anomaly_threshold", config.scoring.velocity_anomaly_threshold},
      {"flow_weight", config.scoring.flow_weight},
      {"velocity_weight", config.scoring.velocity_weight},
      {"factor_threshold", config.scoring.factor_threshold}};
  j["execution"] = {{"worker_threads", config.execution.worker_threads}};
  return j;
}

}  // namespace engine
}  // namespace muleguard
