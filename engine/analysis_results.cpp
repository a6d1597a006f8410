#include "engine/analysis_results.hpp"

#include <algorithm>

namespace muleguard {
namespace engine {

RiskLevel riskLevelFor(double score) {
  if (score >= 80.0) return RiskLevel::CRITICAL;
  if (score >= 60.0) return RiskLevel::HIGH;
  if (score >= 40.0) return RiskLevel::MEDIUM;
  return RiskLevel::LOW;
}

std::string toString(RiskLevel level) {
  switch (level) {
    case RiskLevel::LOW: return "LOW";
    case RiskLevel::MEDIUM: return "MEDIUM";
    case RiskLevel::HIGH: return "HIGH";
    case RiskLevel::CRITICAL: return "CRITICAL";
    default: return "UNKNOWN";
  }
}

const AccountScore* AnalysisResults::findAccountScore(const std::string& account_id) const {
  auto it = std::lower_bound(account_scores.begin(), account_scores.end(), account_id,
                             [](const AccountScore& score, const std::string& id) {
                               return score.account_id < id;
                             });
  if (it == account_scores.end() || it->account_id != account_id) return nullptr;
  return &*it;
}

std::optional<AccountReport> accountReport(const AnalysisResults& results,
                                           const std::string& account_id) {
  const AccountScore* score = results.findAccountScore(account_id);
  if (!score) return std::nullopt;

  AccountReport report;
  report.score = *score;

  for (const auto& ring : results.rings_detected) {
    if (std::find(ring.accounts.begin(), ring.accounts.end(), account_id) != ring.accounts.end()) {
      report.rings.push_back(ring);
    }
  }
  for (const auto& alert : results.smurfing_alerts) {
    if (alert.account_id == account_id) {
      report.smurfing = alert;
      break;
    }
  }
  for (const auto& profile : results.shell_accounts) {
    if (profile.account_id == account_id) {
      report.shell = profile;
      break;
    }
  }
  return report;
}

}  // namespace engine
}  // namespace muleguard
