#include "engine/errors.hpp"
#include "engine/smurfing_detector.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace muleguard::engine;
using muleguard::concurrent::PartitionedExecutor;
using muleguard::testing::atHours;
using muleguard::testing::atMinutes;
using muleguard::testing::contains;
using muleguard::testing::makeTx;

class SmurfingDetectorTest : public ::testing::Test {
 protected:
  std::vector<SmurfingAlert> detect(std::vector<Transaction> transactions, size_t workers = 1) {
    graph_ = builder_.build(std::move(transactions));
    PartitionedExecutor executor(workers);
    return detector_.detect(graph_, config_, executor);
  }

  // X splits $9,000 into ten $900 transfers to distinct accounts over three hours.
  static std::vector<Transaction> fanOutBurst() {
    std::vector<Transaction> txs;
    for (int i = 0; i < 10; ++i) {
      txs.push_back(makeTx("S" + std::to_string(i), "X", "R" + std::to_string(i), 900.0,
                           atMinutes(20 * i)));
    }
    return txs;
  }

  GraphBuilder builder_;
  TransactionGraph graph_;
  SmurfingConfig config_;
  SlidingWindowSmurfingDetector detector_;
};

TEST_F(SmurfingDetectorTest, FlagsStructuredFanOut) {
  auto alerts = detect(fanOutBurst());

  ASSERT_EQ(alerts.size(), 1u);
  const SmurfingAlert& alert = alerts[0];
  EXPECT_EQ(alert.account_id, "X");
  EXPECT_EQ(alert.fan_out, 10u);
  EXPECT_EQ(alert.fan_in, 0u);
  EXPECT_EQ(alert.transaction_count, 10u);
  EXPECT_DOUBLE_EQ(alert.total_amount, 9000.0);
  EXPECT_DOUBLE_EQ(alert.average_transaction, 900.0);
  EXPECT_DOUBLE_EQ(alert.elapsed_hours, 3.0);
  EXPECT_NEAR(alert.velocity, 10.0 / 3.0, 1e-9);
  EXPECT_DOUBLE_EQ(alert.risk_score, 100.0);
  EXPECT_EQ(alert.window_start, atMinutes(0));
  EXPECT_EQ(alert.window_end, atHours(72));

  EXPECT_TRUE(alert.structuring);
  EXPECT_DOUBLE_EQ(alert.structuring_fraction, 1.0);
  ASSERT_TRUE(alert.structuring_threshold.has_value());
  EXPECT_DOUBLE_EQ(*alert.structuring_threshold, 1000.0);
  EXPECT_TRUE(alert.high_frequency);
  EXPECT_FALSE(alert.consolidation);
  EXPECT_TRUE(contains(alert.flags, std::string("structuring_detected")));
  EXPECT_TRUE(contains(alert.flags, std::string("high_frequency")));
}

TEST_F(SmurfingDetectorTest, AccountsBelowMinimumAreNeverEvaluated) {
  std::vector<Transaction> txs;
  for (int i = 0; i < 5; ++i) {
    txs.push_back(makeTx("S" + std::to_string(i), "X", "R" + std::to_string(i), 9900.0,
                         atMinutes(i)));
  }
  EXPECT_TRUE(detect(txs).empty());
  EXPECT_FALSE(detector_.evaluateAccount(graph_, *graph_.indexOf("X"), config_).has_value());
}

TEST_F(SmurfingDetectorTest, PicksTheHighestScoringWindow) {
  std::vector<Transaction> txs;
  for (int i = 0; i < 3; ++i) {
    txs.push_back(makeTx("IN" + std::to_string(i), "S" + std::to_string(i), "A", 100.0,
                         atHours(100.0 * i)));
  }
  for (int i = 0; i < 8; ++i) {
    txs.push_back(makeTx("OUT" + std::to_string(i), "A", "R" + std::to_string(i), 100.0,
                         atHours(500.0) + std::chrono::minutes(10 * i)));
  }

  auto alerts = detect(txs);
  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].account_id, "A");
  EXPECT_EQ(alerts[0].window_start, atHours(500.0));
  EXPECT_EQ(alerts[0].transaction_count, 8u);
  EXPECT_EQ(alerts[0].fan_out, 8u);
  EXPECT_EQ(alerts[0].fan_in, 0u);
  EXPECT_FALSE(alerts[0].structuring);
}

TEST_F(SmurfingDetectorTest, FlagsConsolidation) {
  std::vector<Transaction> txs;
  for (int i = 0; i < 5; ++i) {
    txs.push_back(makeTx("IN" + std::to_string(i), "S" + std::to_string(i), "C", 2000.0,
                         atHours(i)));
  }
  txs.push_back(makeTx("OUT", "C", "D", 9900.0, atHours(5)));

  auto alerts = detect(txs);
  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].account_id, "C");
  EXPECT_EQ(alerts[0].fan_in, 5u);
  EXPECT_EQ(alerts[0].fan_out, 1u);
  EXPECT_TRUE(alerts[0].consolidation);
  EXPECT_FALSE(alerts[0].structuring);
  EXPECT_TRUE(contains(alerts[0].flags, std::string("consolidation")));
}

TEST_F(SmurfingDetectorTest, AlertsOrderedByScoreThenAccount) {
  auto txs = fanOutBurst();
  for (int i = 0; i < 6; ++i) {
    txs.push_back(makeTx("W" + std::to_string(i), "W", "Q" + std::to_string(i % 2), 10.0,
                         atHours(10.0 * i)));
  }
  for (int i = 0; i < 10; ++i) {
    txs.push_back(makeTx("V" + std::to_string(i), "V", "P" + std::to_string(i), 900.0,
                         atMinutes(20 * i)));
  }

  auto alerts = detect(txs);
  ASSERT_GE(alerts.size(), 2u);
  EXPECT_EQ(alerts[0].account_id, "V");
  EXPECT_EQ(alerts[1].account_id, "X");
  for (size_t i = 1; i < alerts.size(); ++i) {
    EXPECT_GE(alerts[i - 1].risk_score, alerts[i].risk_score);
  }
}

TEST_F(SmurfingDetectorTest, WorkerCountDoesNotChangeTheResult) {
  auto txs = fanOutBurst();
  for (int i = 0; i < 7; ++i) {
    txs.push_back(makeTx("IN" + std::to_string(i), "S" + std::to_string(i), "Y", 4800.0,
                         atHours(i)));
  }

  auto single = detect(txs, 1);
  auto parallel = detect(txs, 4);
  ASSERT_EQ(single.size(), parallel.size());
  for (size_t i = 0; i < single.size(); ++i) {
    EXPECT_EQ(single[i].account_id, parallel[i].account_id);
    EXPECT_DOUBLE_EQ(single[i].risk_score, parallel[i].risk_score);
  }
}

TEST_F(SmurfingDetectorTest, WindowScoreArithmetic) {
  EXPECT_DOUBLE_EQ(SlidingWindowSmurfingDetector::scoreWindow(10, 2, 3, 0.6, 50000.0, config_),
                   30.0 + 10.0 + 15.0 + 10.0);
  EXPECT_DOUBLE_EQ(SlidingWindowSmurfingDetector::scoreWindow(1, 0, 0, 0.1, 0.0, config_), 0.0);

  // Amount points start above $100k at 10 per $100k, capped at 20.
  EXPECT_DOUBLE_EQ(SlidingWindowSmurfingDetector::scoreWindow(1, 0, 0, 0.0, 50000.0, config_),
                   0.0);
  EXPECT_DOUBLE_EQ(SlidingWindowSmurfingDetector::scoreWindow(1, 0, 0, 0.0, 100000.0, config_),
                   0.0);
  EXPECT_DOUBLE_EQ(SlidingWindowSmurfingDetector::scoreWindow(1, 0, 0, 0.0, 150000.0, config_),
                   15.0);
  EXPECT_DOUBLE_EQ(SlidingWindowSmurfingDetector::scoreWindow(1, 0, 0, 0.0, 200000.0, config_),
                   20.0);
  EXPECT_DOUBLE_EQ(SlidingWindowSmurfingDetector::scoreWindow(1, 0, 0, 0.0, 250000.0, config_),
                   20.0);
  EXPECT_DOUBLE_EQ(SlidingWindowSmurfingDetector::scoreWindow(20, 10, 10, 5.0, 1e6, config_),
                   100.0);
}

TEST_F(SmurfingDetectorTest, StructuringBandIsBelowEachThreshold) {
  std::optional<double> matched;
  const double fraction = SlidingWindowSmurfingDetector::structuringFraction(
      {9500.0, 9000.0, 4999.0, 100.0, 950.0}, config_, &matched);
  EXPECT_DOUBLE_EQ(fraction, 0.8);
  ASSERT_TRUE(matched.has_value());
  EXPECT_DOUBLE_EQ(*matched, 10000.0);

  // The threshold itself is not "just below" it.
  EXPECT_DOUBLE_EQ(SlidingWindowSmurfingDetector::structuringFraction({10000.0}, config_), 0.0);
  EXPECT_DOUBLE_EQ(SlidingWindowSmurfingDetector::structuringFraction({}, config_), 0.0);
}

TEST_F(SmurfingDetectorTest, ConsolidationNeedsManySourcesAndMatchingOutflow) {
  EXPECT_TRUE(SlidingWindowSmurfingDetector::isConsolidation(3, 3000.0, {2950.0}, config_));
  EXPECT_FALSE(SlidingWindowSmurfingDetector::isConsolidation(2, 3000.0, {2950.0}, config_));
  EXPECT_FALSE(SlidingWindowSmurfingDetector::isConsolidation(3, 3000.0, {1000.0}, config_));
  EXPECT_TRUE(
      SlidingWindowSmurfingDetector::isConsolidation(3, 3000.0, {10.0, 1500.0, 1450.0}, config_));
  EXPECT_FALSE(SlidingWindowSmurfingDetector::isConsolidation(3, 3000.0, {}, config_));
}

TEST(SmurfingDetectorFactoryTest, UnknownStrategyIsAConfigError) {
  EXPECT_EQ(makeSmurfingDetector("sliding_window_v2")->name(), "sliding_window_v2");
  EXPECT_THROW(makeSmurfingDetector("sliding_window_v1"), ConfigError);
}
