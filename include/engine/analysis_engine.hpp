#ifndef MULEGUARD_ANALYSIS_ENGINE_HPP_
#define MULEGUARD_ANALYSIS_ENGINE_HPP_

#include "concurrent/partitioned_executor.hpp"
#include "engine/analysis_results.hpp"
#include "engine/config.hpp"
#include "engine/cycle_detector.hpp"
#include "engine/risk_scorer.hpp"
#include "engine/shell_detector.hpp"
#include "engine/smurfing_detector.hpp"
#include "engine/transaction_graph.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace muleguard {
namespace engine {

/**
 * Money-muling analysis: a pure, deterministic function from a transaction
 * set plus configuration to AnalysisResults.
 *
 * Pipeline: graph build -> {rings, smurfing, shells} -> risk scoring.
 * The graph is shared read-only by every stage; nothing survives between
 * calls to analyze().
 */
class AnalysisEngine {
 public:
  /**
   * Throws ConfigError if the configuration is invalid or names an unknown
   * detector strategy.
   */
  explicit AnalysisEngine(EngineConfig config = EngineConfig::defaults());

  // Non-copyable
  AnalysisEngine(const AnalysisEngine&) = delete;
  AnalysisEngine& operator=(const AnalysisEngine&) = delete;

  /**
   * Runs the full analysis. An empty input yields empty results, not an
   * error. Throws InvalidTransaction / DuplicateTransactionId for bad input.
   */
  AnalysisResults analyze(std::vector<Transaction> transactions) const;

  /**
   * Same as analyze() on a graph that has already been built.
   */
  AnalysisResults analyze(const TransactionGraph& graph) const;

  TransactionGraph buildGraph(std::vector<Transaction> transactions) const;

  /**
   * On-demand shell profile for one account, without the bulk pre-filter.
   */
  std::optional<ShellProfile> profileAccount(const TransactionGraph& graph,
                                             const std::string& account_id) const;

  const EngineConfig& config() const { return config_; }

  static AnalysisSummary summarize(const TransactionGraph& graph,
                                   const AnalysisResults& results);

 private:
  EngineConfig config_;
  GraphBuilder graph_builder_;
  std::unique_ptr<CycleDetector> cycle_detector_;
  std::unique_ptr<SmurfingDetector> smurfing_detector_;
  std::unique_ptr<ShellDetector> shell_detector_;
  RiskScorer risk_scorer_;
  concurrent::PartitionedExecutor executor_;
};

}  // namespace engine
}  // namespace muleguard

#endif  // MULEGUARD_ANALYSIS_ENGINE_HPP_
