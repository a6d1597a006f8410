#include "protocol/json_codec.hpp"
#include "engine/errors.hpp"
#include "test_support.hpp"

#include <sstream>

#include <gtest/gtest.h>

using namespace muleguard::engine;
using namespace muleguard::protocol;
using muleguard::testing::atHours;
using muleguard::testing::makeTx;

namespace {

std::string invalidField(const nlohmann::json& record) {
  try {
    transactionFromJson(record);
  } catch (const InvalidTransaction& e) {
    return e.field();
  }
  return "";
}

std::vector<Transaction> fromCsv(const std::string& text) {
  std::istringstream in(text);
  return transactionsFromCsv(in);
}

}  // namespace

TEST(TimestampTest, ParsesUtcAndOffsets) {
  const Timestamp expected = makeTimestamp(2025, 12, 15, 10, 30, 0);

  EXPECT_EQ(parseTimestamp("2025-12-15T10:30:00Z"), expected);
  EXPECT_EQ(parseTimestamp("2025-12-15T10:30:00"), expected);
  EXPECT_EQ(parseTimestamp("2025-12-15 10:30"), expected);
  EXPECT_EQ(parseTimestamp("2025-12-15t10:30:00z"), expected);
  EXPECT_EQ(parseTimestamp("2025-12-15T12:30:00+02:00"), expected);
  EXPECT_EQ(parseTimestamp("2025-12-15T05:00:00-0530"), expected);
  EXPECT_EQ(parseTimestamp("  2025-12-15T10:30:00Z  "), expected);
  EXPECT_EQ(parseTimestamp("2025-12-15"), makeTimestamp(2025, 12, 15));
}

TEST(TimestampTest, TruncatesFractionsToMicroseconds) {
  EXPECT_EQ(parseTimestamp("2025-12-15T10:30:00.5Z"),
            makeTimestamp(2025, 12, 15, 10, 30, 0, 500000));
  EXPECT_EQ(parseTimestamp("2025-12-15T10:30:00.123456789Z"),
            makeTimestamp(2025, 12, 15, 10, 30, 0, 123456));
  EXPECT_EQ(parseTimestamp("2025-12-15T10:30:00,25"),
            makeTimestamp(2025, 12, 15, 10, 30, 0, 250000));
}

TEST(TimestampTest, RejectsMalformedOrOutOfRangeText) {
  for (const char* text : {"", "yesterday", "2025-13-01", "2025-02-29", "2025-04-31",
                           "2025-12-15T24:00:00Z", "2025-12-15T10:60:00Z",
                           "2025-12-15T10:30:00.Z", "2025-12-15T10:30:00Q",
                           "2025/12/15", "12/15/2025", "2025-12-15T10"}) {
    EXPECT_FALSE(parseTimestamp(text).has_value()) << text;
  }
  EXPECT_TRUE(parseTimestamp("2024-02-29").has_value());
}

TEST(TimestampTest, FormatsWithMicrosecondsInUtc) {
  EXPECT_EQ(formatTimestamp(makeTimestamp(2025, 12, 15, 10, 30, 5, 42)),
            "2025-12-15T10:30:05.000042Z");
  EXPECT_EQ(formatTimestamp(makeTimestamp(1969, 12, 31, 23, 59, 59, 999999)),
            "1969-12-31T23:59:59.999999Z");

  const Timestamp instant = makeTimestamp(2024, 2, 29, 23, 0, 0, 1);
  EXPECT_EQ(parseTimestamp(formatTimestamp(instant)), instant);
}

TEST(TransactionDecodeTest, DecodesACompleteRecord) {
  Transaction tx = transactionFromJson({{"id", "T1"},
                                        {"from_account", "A"},
                                        {"to_account", "B"},
                                        {"amount", 1250.5},
                                        {"timestamp", "2025-12-15T10:00:00Z"},
                                        {"description", "rent"}});
  EXPECT_EQ(tx.id, "T1");
  EXPECT_EQ(tx.from_account, "A");
  EXPECT_EQ(tx.to_account, "B");
  EXPECT_DOUBLE_EQ(tx.amount, 1250.5);
  EXPECT_EQ(tx.timestamp, makeTimestamp(2025, 12, 15, 10));
  ASSERT_TRUE(tx.description.has_value());
  EXPECT_EQ(*tx.description, "rent");
}

TEST(TransactionDecodeTest, AcceptsNumericStringAmounts) {
  Transaction tx = transactionFromJson({{"id", "T1"},
                                        {"from_account", "A"},
                                        {"to_account", "B"},
                                        {"amount", " 99.95 "},
                                        {"timestamp", "2025-12-15T10:00:00Z"},
                                        {"description", nullptr}});
  EXPECT_DOUBLE_EQ(tx.amount, 99.95);
  EXPECT_FALSE(tx.description.has_value());
}

TEST(TransactionDecodeTest, ReportsTheOffendingField) {
  const nlohmann::json valid = {{"id", "T1"},
                                {"from_account", "A"},
                                {"to_account", "B"},
                                {"amount", 10},
                                {"timestamp", "2025-12-15T10:00:00Z"}};

  auto without = [&valid](const char* key) {
    nlohmann::json j = valid;
    j.erase(key);
    return j;
  };
  auto with = [&valid](const char* key, nlohmann::json value) {
    nlohmann::json j = valid;
    j[key] = std::move(value);
    return j;
  };

  EXPECT_EQ(invalidField(nlohmann::json::array()), "record");
  EXPECT_EQ(invalidField(without("id")), "id");
  EXPECT_EQ(invalidField(without("from_account")), "from_account");
  EXPECT_EQ(invalidField(with("to_account", nullptr)), "to_account");
  EXPECT_EQ(invalidField(without("amount")), "amount");
  EXPECT_EQ(invalidField(with("amount", "ten")), "amount");
  EXPECT_EQ(invalidField(with("amount", true)), "amount");
  EXPECT_EQ(invalidField(with("timestamp", "2025-02-30")), "timestamp");
  EXPECT_EQ(invalidField(with("timestamp", 1734256800)), "timestamp");
  EXPECT_EQ(invalidField(with("description", 7)), "description");
  EXPECT_EQ(invalidField(with("id", 42)), "id");
}

TEST(TransactionDecodeTest, ErrorCarriesThePartialRecord) {
  try {
    transactionFromJson({{"id", "T9"}, {"from_account", "A"}, {"to_account", "B"},
                         {"amount", "abc"}, {"timestamp", "2025-12-15"}});
    FAIL() << "expected InvalidTransaction";
  } catch (const InvalidTransaction& e) {
    EXPECT_EQ(e.transaction().id, "T9");
    EXPECT_EQ(e.transaction().from_account, "A");
    EXPECT_EQ(e.field(), "amount");
  }
}

TEST(TransactionDecodeTest, AcceptsBareAndWrappedArrays) {
  const std::string record =
      R"({"id":"T1","from_account":"A","to_account":"B","amount":5,"timestamp":"2025-12-15"})";

  EXPECT_EQ(parseTransactions("[" + record + "]").size(), 1u);
  EXPECT_EQ(parseTransactions(R"({"transactions":[)" + record + "," +
                              R"({"id":"T2","from_account":"B","to_account":"C","amount":5,)"
                              R"("timestamp":"2025-12-16"}]})")
                .size(),
            2u);
  EXPECT_TRUE(parseTransactions("[]").empty());

  EXPECT_THROW(parseTransactions("[" + record), EngineError);
  EXPECT_THROW(parseTransactions(R"({"records":[]})"), EngineError);
  EXPECT_THROW(parseTransactions(R"({"transactions":{}})"), EngineError);
  EXPECT_THROW(parseTransactions("42"), EngineError);
}

TEST(CsvDecodeTest, MatchesColumnsByName) {
  auto txs = fromCsv(
      "\xEF\xBB\xBFtimestamp,amount,to_account,from_account,id,description\r\n"
      "2025-12-15T10:00:00Z,100.00,B,A,T1,\r\n"
      "\r\n"
      "2025-12-15T11:00:00Z,250,C,B,T2,\"invoice, \"\"urgent\"\"\"\r\n");

  ASSERT_EQ(txs.size(), 2u);
  EXPECT_EQ(txs[0].id, "T1");
  EXPECT_EQ(txs[0].from_account, "A");
  EXPECT_EQ(txs[0].to_account, "B");
  EXPECT_DOUBLE_EQ(txs[0].amount, 100.0);
  EXPECT_FALSE(txs[0].description.has_value());
  EXPECT_EQ(txs[1].timestamp, makeTimestamp(2025, 12, 15, 11));
  ASSERT_TRUE(txs[1].description.has_value());
  EXPECT_EQ(*txs[1].description, "invoice, \"urgent\"");
}

TEST(CsvDecodeTest, RejectsStructuralProblems) {
  EXPECT_TRUE(fromCsv("").empty());
  EXPECT_TRUE(fromCsv("id,from_account,to_account,amount,timestamp\n").empty());

  EXPECT_THROW(fromCsv("id,from_account,amount,timestamp\nT1,A,5,2025-12-15\n"), EngineError);
  EXPECT_THROW(fromCsv("id,from_account,to_account,amount,timestamp\n"
                       "T1,A,B,5,2025-12-15,extra\n"),
               EngineError);
  EXPECT_THROW(fromCsv("id,from_account,to_account,amount,timestamp,description\n"
                       "T1,A,B,5,2025-12-15,\"open\n"),
               EngineError);
}

TEST(CsvDecodeTest, BadRowRejectsTheWholeInput) {
  try {
    fromCsv("id,from_account,to_account,amount,timestamp\n"
            "T1,A,B,5,2025-12-15\n"
            "T2,B,C,five,2025-12-15\n");
    FAIL() << "expected InvalidTransaction";
  } catch (const InvalidTransaction& e) {
    EXPECT_EQ(e.transaction().id, "T2");
    EXPECT_EQ(e.field(), "amount");
  }
}

TEST(CsvDecodeTest, RejectsTextThatIsNotUtf8) {
  try {
    fromCsv("id,from_account,to_account,amount,timestamp\n"
            "T1,A\xe9,B,10,2025-01-01T00:00:00Z\n");
    FAIL() << "expected InvalidTransaction";
  } catch (const InvalidTransaction& e) {
    EXPECT_EQ(e.field(), "from_account");
    EXPECT_EQ(e.transaction().id, "T1");
  }

  EXPECT_THROW(fromCsv("id,from_account,to_account,amount,timestamp,description\n"
                       "T1,A,B,10,2025-01-01T00:00:00Z,caf\xe9\n"),
               InvalidTransaction);
}

TEST(EncodeTest, TransactionRoundTrips) {
  Transaction tx = makeTx("T1", "A", "B", 12.5, atHours(1.5));
  tx.description = "note";

  nlohmann::json j = toJson(tx);
  EXPECT_EQ(j["timestamp"], "2025-12-15T11:30:00.000000Z");

  Transaction decoded = transactionFromJson(j);
  EXPECT_EQ(decoded.id, tx.id);
  EXPECT_EQ(decoded.timestamp, tx.timestamp);
  EXPECT_EQ(decoded.description, tx.description);
}

TEST(EncodeTest, OptionalFieldsBecomeNull) {
  SmurfingAlert alert;
  alert.account_id = "X";
  alert.window_start = atHours(0);
  alert.window_end = atHours(72);

  nlohmann::json j = toJson(alert);
  EXPECT_TRUE(j["structuring_threshold"].is_null());
  EXPECT_EQ(j["window_end"], "2025-12-18T10:00:00.000000Z");

  alert.structuring_threshold = 1000.0;
  EXPECT_EQ(toJson(alert)["structuring_threshold"], 1000.0);

  AccountReport report;
  report.score.account_id = "X";
  report.smurfing = alert;
  nlohmann::json r = toJson(report);
  EXPECT_EQ(r["account_id"], "X");
  EXPECT_TRUE(r["shell"].is_null());
  EXPECT_TRUE(r["rings"].is_array());
  EXPECT_EQ(r["smurfing"]["account_id"], "X");
}

TEST(EncodeTest, ResultsSerializeWithSortedKeysAndStableBytes) {
  AnalysisResults results;
  results.total_transactions = 3;
  results.total_accounts = 3;
  Cycle cycle;
  cycle.ring_id = "RING_001";
  cycle.accounts = {"A", "B", "C"};
  cycle.transaction_ids = {"T1", "T2", "T3"};
  results.rings_detected.push_back(cycle);

  const std::string text = serializeResults(results, -1);
  EXPECT_EQ(text, serializeResults(results, -1));

  AnalysisResults bad_bytes = results;
  bad_bytes.rings_detected[0].transaction_ids[0] = "T\xff";
  EXPECT_NO_THROW(serializeResults(bad_bytes, 2));
  EXPECT_EQ(text.find("\"account_scores\""), 1u);
  EXPECT_LT(text.find("\"cycle_clusters\""), text.find("\"rings_detected\""));
  EXPECT_LT(text.find("\"rings_detected\""), text.find("\"summary\""));

  nlohmann::json ring = nlohmann::json::parse(text)["rings_detected"][0];
  EXPECT_EQ(ring["length"], 3);
  EXPECT_EQ(ring["detection_type"], "cycle");
  EXPECT_EQ(ring["transactions"], nlohmann::json({"T1", "T2", "T3"}));
}
