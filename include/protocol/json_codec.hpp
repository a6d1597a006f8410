#ifndef MULEGUARD_JSON_CODEC_HPP_
#define MULEGUARD_JSON_CODEC_HPP_

#include "engine/analysis_results.hpp"
#include "engine/transaction.hpp"

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace muleguard {
namespace protocol {

/**
 * ISO-8601 instant: YYYY-MM-DD[(T| )HH:MM[:SS[.fraction]]][Z|+HH:MM|-HH:MM|+HHMM].
 * Times without an offset are UTC. Fractions beyond microseconds are
 * truncated. Returns nullopt on malformed text or out-of-range fields.
 */
std::optional<engine::Timestamp> parseTimestamp(const std::string& text);

// Always YYYY-MM-DDTHH:MM:SS.ffffffZ
std::string formatTimestamp(const engine::Timestamp& timestamp);

// Decoding. Undecodable records throw engine::InvalidTransaction.
engine::Transaction transactionFromJson(const nlohmann::json& j);

/**
 * Accepts either a bare array of records or {"transactions": [...]}.
 */
std::vector<engine::Transaction> transactionsFromJson(const nlohmann::json& j);

/**
 * Parses JSON text; a syntax error throws engine::EngineError.
 */
std::vector<engine::Transaction> parseTransactions(const std::string& json_text);

/**
 * Header row required; columns are matched by name:
 * id,from_account,to_account,amount,timestamp[,description].
 * Blank lines are skipped; quoted fields may contain commas and "".
 */
std::vector<engine::Transaction> transactionsFromCsv(std::istream& in);

// Encoding. Object keys are emitted in sorted order.
nlohmann::json toJson(const engine::Transaction& transaction);
nlohmann::json toJson(const engine::Cycle& cycle);
nlohmann::json toJson(const engine::CycleOverlap& overlap);
nlohmann::json toJson(const engine::CycleCluster& cluster);
nlohmann::json toJson(const engine::SmurfingAlert& alert);
nlohmann::json toJson(const engine::ShellProfile& profile);
nlohmann::json toJson(const engine::AccountScore& score);
nlohmann::json toJson(const engine::AnalysisSummary& summary);
nlohmann::json toJson(const engine::AnalysisResults& results);
nlohmann::json toJson(const engine::AccountReport& report);

// Identifiers that are not valid UTF-8 are written with U+FFFD replacements.
std::string serializeResults(const engine::AnalysisResults& results, int indent = 2);

}  // namespace protocol
}  // namespace muleguard

#endif  // MULEGUARD_JSON_CODEC_HPP_
