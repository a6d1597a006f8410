#include "engine/errors.hpp"
#include "engine/shell_detector.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace muleguard::engine;
using muleguard::concurrent::PartitionedExecutor;
using muleguard::testing::atHours;
using muleguard::testing::contains;
using muleguard::testing::makeTx;

class ShellDetectorTest : public ::testing::Test {
 protected:
  void build(std::vector<Transaction> transactions) {
    graph_ = builder_.build(std::move(transactions));
  }

  ShellProfile profileOf(const std::string& account) {
    return detector_.profile(graph_, *graph_.indexOf(account), config_);
  }

  // Y receives $50,000 and forwards $49,800 the same day.
  static std::vector<Transaction> passThrough() {
    return {
        makeTx("T1", "S", "Y", 50000.0, atHours(0)),
        makeTx("T2", "Y", "D", 49800.0, atHours(3)),
    };
  }

  GraphBuilder builder_;
  TransactionGraph graph_;
  ShellConfig config_;
  SixFactorShellDetector detector_;
};

TEST_F(ShellDetectorTest, PassThroughAccountProfilesAsHighRisk) {
  build(passThrough());
  ShellProfile y = profileOf("Y");

  EXPECT_DOUBLE_EQ(y.pass_through_score, 100.0);
  EXPECT_DOUBLE_EQ(y.high_value_score, 100.0);
  EXPECT_DOUBLE_EQ(y.connection_score, 100.0);
  EXPECT_DOUBLE_EQ(y.dormancy_score, 0.0);
  EXPECT_DOUBLE_EQ(y.directionality_score, 0.0);
  EXPECT_DOUBLE_EQ(y.uniformity_score, 0.0);
  EXPECT_NEAR(y.shell_score, 65.0, 1e-9);
  EXPECT_EQ(y.risk_level, RiskLevel::HIGH);

  EXPECT_EQ(y.total_transactions, 2u);
  EXPECT_EQ(y.unique_sources, 1u);
  EXPECT_EQ(y.unique_destinations, 1u);
  EXPECT_DOUBLE_EQ(y.total_throughput, 99800.0);
  EXPECT_DOUBLE_EQ(y.avg_transaction_value, 49900.0);
  EXPECT_NEAR(y.in_out_ratio, 0.996, 1e-12);
  EXPECT_TRUE(y.is_pass_through);

  EXPECT_TRUE(contains(y.flags, std::string("pass_through")));
  EXPECT_TRUE(contains(y.flags, std::string("high_shell_score")));
  EXPECT_TRUE(contains(y.flags, std::string("limited_sources")));
  EXPECT_TRUE(contains(y.flags, std::string("limited_destinations")));
  EXPECT_FALSE(contains(y.flags, std::string("one_directional_flow")));
}

TEST_F(ShellDetectorTest, BulkScanAppliesCandidateFilter) {
  auto txs = passThrough();
  // Busy account: high value but too many transactions to be a candidate.
  for (int i = 0; i < 6; ++i) {
    txs.push_back(makeTx("B" + std::to_string(i), "BUSY", "Z" + std::to_string(i), 40000.0,
                         atHours(i)));
  }
  build(txs);

  PartitionedExecutor executor(2);
  ShellReport report = detector_.detect(graph_, config_, executor);

  std::vector<std::string> candidates;
  for (const auto& profile : report.candidates) candidates.push_back(profile.account_id);
  // D's throughput (49,800) is below the minimum.
  EXPECT_EQ(candidates, (std::vector<std::string>{"S", "Y"}));
  EXPECT_FALSE(contains(candidates, std::string("BUSY")));

  ASSERT_EQ(report.reported.size(), 2u);
  EXPECT_EQ(report.reported[0].account_id, "Y");
  EXPECT_GE(report.reported[0].shell_score, report.reported[1].shell_score);
  for (const auto& profile : report.reported) {
    EXPECT_GE(profile.shell_score, config_.report_threshold);
  }

  // On-demand profiling ignores the filter.
  ShellProfile busy = profileOf("BUSY");
  EXPECT_EQ(busy.total_transactions, 6u);
  EXPECT_DOUBLE_EQ(busy.high_value_score, 100.0);
}

TEST_F(ShellDetectorTest, PassThroughTiers) {
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::passThroughScore(100.0, 96.0, config_), 100.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::passThroughScore(100.0, 95.0, config_), 60.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::passThroughScore(100.0, 88.0, config_), 32.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::passThroughScore(100.0, 80.0, config_), 0.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::passThroughScore(0.0, 100.0, config_), 0.0);
}

TEST_F(ShellDetectorTest, HighValueScaledToBaseline) {
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::highValueScore(5000.0, config_), 50.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::highValueScore(25000.0, config_), 100.0);
}

TEST_F(ShellDetectorTest, ConnectionScoreRewardsNarrowCounterparties) {
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::connectionScore(1, 1, 1, 1, 2), 100.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::connectionScore(3, 3, 3, 3, 6), 0.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::connectionScore(2, 5, 4, 5, 9), 32.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::connectionScore(1, 0, 1, 0, 1), 40.0);
}

TEST_F(ShellDetectorTest, DirectionalityAndUniformity) {
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::directionalityScore(3, 0), 100.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::directionalityScore(2, 2), 0.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::directionalityScore(3, 1), 50.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::directionalityScore(0, 0), 0.0);

  EXPECT_DOUBLE_EQ(SixFactorShellDetector::uniformityScore({100.0, 100.0, 100.0}), 100.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::uniformityScore({100.0, 200.0}), 0.0);
}

TEST_F(ShellDetectorTest, DormancyDetectsGapThenBurst) {
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::dormancyScore(
                       {atHours(0), atHours(200), atHours(201), atHours(202)}, config_),
                   100.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::dormancyScore(
                       {atHours(0), atHours(10), atHours(20), atHours(30)}, config_),
                   80.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::dormancyScore(
                       {atHours(0), atHours(1), atHours(50), atHours(51)}, config_),
                   0.0);
  EXPECT_DOUBLE_EQ(SixFactorShellDetector::dormancyScore({atHours(0), atHours(500)}, config_),
                   0.0);
}

TEST(ShellDetectorFactoryTest, UnknownStrategyIsAConfigError) {
  EXPECT_EQ(makeShellDetector("six_factor_v2")->name(), "six_factor_v2");
  EXPECT_THROW(makeShellDetector("six_factor_v1"), ConfigError);
}
