#include "engine/analysis_engine.hpp"
#include "engine/errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>
#include <set>

namespace muleguard {
namespace engine {

namespace {

EngineConfig validated(EngineConfig config) {
  config.validate();
  return config;
}

void describeMetrics() {
  auto& metrics = observability::getGlobalMetrics();
  metrics.describe("muleguard_runs_total", "Analysis runs requested.");
  metrics.describe("muleguard_runs_rejected_total",
                   "Analysis runs rejected by input validation.");
  metrics.describe("muleguard_transactions_analyzed_total",
                   "Transactions in successfully analyzed batches.");
  metrics.describe("muleguard_run_seconds", "Wall time of a full analysis run.");
  metrics.describe("muleguard_stage_seconds_graph", "Wall time spent building the graph.");
  metrics.describe("muleguard_stage_seconds_cycles", "Wall time spent in cycle detection.");
  metrics.describe("muleguard_stage_seconds_smurfing",
                   "Wall time spent in smurfing detection.");
  metrics.describe("muleguard_stage_seconds_shell", "Wall time spent in shell detection.");
  metrics.describe("muleguard_stage_seconds_scoring", "Wall time spent scoring accounts.");
  metrics.describe("muleguard_last_run_rings", "Rings reported by the last run.");
  metrics.describe("muleguard_last_run_smurfing_alerts",
                   "Smurfing alerts reported by the last run.");
  metrics.describe("muleguard_last_run_shell_accounts",
                   "Shell profiles reported by the last run.");
  metrics.describe("muleguard_last_run_suspicious_accounts",
                   "Suspicious accounts reported by the last run.");
}

}  // namespace

AnalysisEngine::AnalysisEngine(EngineConfig config)
    : config_(validated(std::move(config))),
      cycle_detector_(makeCycleDetector(config_.cycles.strategy)),
      smurfing_detector_(makeSmurfingDetector(config_.smurfing.strategy)),
      shell_detector_(makeShellDetector(config_.shell.strategy)),
      risk_scorer_(config_.scoring),
      executor_(config_.resolvedWorkerThreads()) {
  describeMetrics();
}

TransactionGraph AnalysisEngine::buildGraph(std::vector<Transaction> transactions) const {
  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, "muleguard_stage_seconds_graph");
  return graph_builder_.build(std::move(transactions));
}

AnalysisResults AnalysisEngine::analyze(std::vector<Transaction> transactions) const {
  auto& metrics = observability::getGlobalMetrics();
  metrics.incrementCounter("muleguard_runs_total");

  try {
    TransactionGraph graph = buildGraph(std::move(transactions));
    return analyze(graph);
  } catch (const EngineError& e) {
    metrics.incrementCounter("muleguard_runs_rejected_total");
    LOG_BUILDER(observability::LogLevel::ERROR, "Analysis rejected")
        .field("reason", std::string(e.what()));
    throw;
  }
}

AnalysisResults AnalysisEngine::analyze(const TransactionGraph& graph) const {
  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer total_timer(metrics, "muleguard_run_seconds");

  LOG_BUILDER(observability::LogLevel::INFO, "Analysis started")
      .field("transactions", graph.transactions().size())
      .field("accounts", graph.accountCount())
      .field("workers", executor_.workerCount());

  AnalysisResults results;
  results.total_transactions = graph.transactions().size();
  results.total_accounts = graph.accountCount();

  CycleReport cycles;
  {
    observability::MetricsCollector::Timer timer(metrics, "muleguard_stage_seconds_cycles");
    cycles = cycle_detector_->detect(graph, config_.cycles, executor_);
  }

  std::vector<SmurfingAlert> smurfing;
  {
    observability::MetricsCollector::Timer timer(metrics, "muleguard_stage_seconds_smurfing");
    smurfing = smurfing_detector_->detect(graph, config_.smurfing, executor_);
  }

  ShellReport shells;
  {
    observability::MetricsCollector::Timer timer(metrics, "muleguard_stage_seconds_shell");
    shells = shell_detector_->detect(graph, config_.shell, executor_);
  }

  {
    observability::MetricsCollector::Timer timer(metrics, "muleguard_stage_seconds_scoring");
    results.account_scores =
        risk_scorer_.scoreAll(graph, cycles.cycles, smurfing, shells.candidates, executor_);
  }

  results.rings_detected = std::move(cycles.cycles);
  results.cycle_overlaps = std::move(cycles.overlaps);
  results.cycle_clusters = std::move(cycles.clusters);
  results.smurfing_alerts = std::move(smurfing);
  results.shell_accounts = std::move(shells.reported);

  for (const auto& score : results.account_scores) {
    if (score.risk_level == RiskLevel::CRITICAL) {
      results.critical_accounts.push_back(score.account_id);
    } else if (score.risk_level == RiskLevel::HIGH) {
      results.high_risk_accounts.push_back(score.account_id);
    }
  }
  results.summary = summarize(graph, results);

  metrics.incrementCounter("muleguard_transactions_analyzed_total",
                           static_cast<double>(results.total_transactions));
  metrics.setGauge("muleguard_last_run_rings", static_cast<double>(results.rings_detected.size()));
  metrics.setGauge("muleguard_last_run_smurfing_alerts",
                   static_cast<double>(results.smurfing_alerts.size()));
  metrics.setGauge("muleguard_last_run_shell_accounts",
                   static_cast<double>(results.shell_accounts.size()));
  metrics.setGauge("muleguard_last_run_suspicious_accounts",
                   static_cast<double>(results.summary.suspicious_accounts));

  LOG_BUILDER(observability::LogLevel::INFO, "Analysis finished")
      .field("rings", results.rings_detected.size())
      .field("smurfing_alerts", results.smurfing_alerts.size())
      .field("shell_accounts", results.shell_accounts.size())
      .field("critical", results.critical_accounts.size())
      .field("high", results.high_risk_accounts.size());

  return results;
}

std::optional<ShellProfile> AnalysisEngine::profileAccount(const TransactionGraph& graph,
                                                           const std::string& account_id) const {
  auto index = graph.indexOf(account_id);
  if (!index) return std::nullopt;
  return shell_detector_->profile(graph, *index, config_.shell);
}

AnalysisSummary AnalysisEngine::summarize(const TransactionGraph& graph,
                                          const AnalysisResults& results) {
  AnalysisSummary summary;

  std::vector<double> amounts;
  amounts.reserve(graph.transactions().size());
  for (const auto& tx : graph.transactions()) {
    amounts.push_back(tx.amount);
  }

  if (!amounts.empty()) {
    summary.total_volume = graph.totalVolume();
    summary.avg_transaction = summary.total_volume / static_cast<double>(amounts.size());
    std::sort(amounts.begin(), amounts.end());
    summary.median_transaction = amounts[amounts.size() / 2];
    summary.min_transaction = amounts.front();
    summary.max_transaction = amounts.back();
  }

  summary.cycles_detected = results.rings_detected.size();
  std::set<std::string> ring_accounts;
  size_t total_length = 0;
  for (const auto& ring : results.rings_detected) {
    ring_accounts.insert(ring.accounts.begin(), ring.accounts.end());
    total_length += ring.length();
  }
  summary.accounts_in_rings = ring_accounts.size();
  if (!results.rings_detected.empty()) {
    summary.avg_cycle_length =
        static_cast<double>(total_length) / static_cast<double>(results.rings_detected.size());
  }

  summary.smurfing_alerts_count = results.smurfing_alerts.size();
  summary.shell_accounts_count = results.shell_accounts.size();
  summary.high_risk_accounts = results.high_risk_accounts.size();
  summary.critical_accounts = results.critical_accounts.size();
  summary.suspicious_accounts = summary.high_risk_accounts + summary.critical_accounts;
  if (results.total_accounts > 0) {
    summary.suspicious_percent = 100.0 * static_cast<double>(summary.suspicious_accounts) /
                                 static_cast<double>(results.total_accounts);
  }
  return summary;
}

}  // namespace engine
}  // namespace muleguard
