#include "protocol/json_codec.hpp"
#include "engine/errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>

namespace muleguard {
namespace protocol {

using engine::Timestamp;
using engine::Transaction;

namespace {

constexpr long long kMicrosPerDay = 86400LL * 1000000LL;
constexpr long long kMicrosPerHour = 3600LL * 1000000LL;
constexpr long long kMicrosPerMinute = 60LL * 1000000LL;
constexpr long long kMicrosPerSecond = 1000000LL;

const char* const kCsvRequiredColumns[] = {"id", "from_account", "to_account", "amount",
                                           "timestamp"};

std::string trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

bool readDigits(const std::string& s, size_t& pos, size_t count, int& out) {
  if (pos + count > s.size()) return false;
  int value = 0;
  for (size_t i = 0; i < count; ++i) {
    char c = s[pos + i];
    if (c < '0' || c > '9') return false;
    value = value * 10 + (c - '0');
  }
  out = value;
  pos += count;
  return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) return 29;
  return kDays[month - 1];
}

// Inverse of the civil-date mapping used by engine::makeTimestamp.
void civilFromDays(long long z, int& year, int& month, int& day) {
  z += 719468;
  const long long era = (z >= 0 ? z : z - 146096) / 146097;
  const long long doe = z - era * 146097;
  const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const long long mp = (5 * doy + 2) / 153;
  day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

long long floorDiv(long long a, long long b) {
  long long q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

std::optional<double> parseAmount(const std::string& raw) {
  std::string text = trim(raw);
  if (text.empty()) return std::nullopt;
  char* end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || !std::isfinite(value)) return std::nullopt;
  return value;
}

// CSV text reaches the decoder unvalidated; JSON text is checked by the parser.
bool isValidUtf8(const std::string& text) {
  try {
    nlohmann::json(text).dump();
  } catch (const nlohmann::json::type_error&) {
    return false;
  }
  return true;
}

std::string requireString(const nlohmann::json& j, const char* field, const Transaction& partial) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    throw engine::InvalidTransaction(partial, field, "missing field");
  }
  if (!it->is_string()) {
    throw engine::InvalidTransaction(partial, field, "must be a string");
  }
  std::string value = it->get<std::string>();
  if (!isValidUtf8(value)) {
    throw engine::InvalidTransaction(partial, field, "not valid UTF-8");
  }
  return value;
}

template <typename T>
nlohmann::json toJsonArray(const std::vector<T>& items) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& item : items) {
    array.push_back(toJson(item));
  }
  return array;
}

std::vector<std::string> splitCsvLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  bool quoted = false;
  bool was_quoted = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        current += c;
      }
    } else if (c == '"') {
      quoted = true;
      was_quoted = true;
    } else if (c == ',') {
      fields.push_back(was_quoted ? current : trim(current));
      current.clear();
      was_quoted = false;
    } else {
      current += c;
    }
  }
  if (quoted) {
    throw engine::EngineError("CSV line has an unterminated quoted field: " + line);
  }
  fields.push_back(was_quoted ? current : trim(current));
  return fields;
}

}  // namespace

std::optional<Timestamp> parseTimestamp(const std::string& raw) {
  const std::string text = trim(raw);
  const size_t size = text.size();
  size_t pos = 0;

  int year = 0, month = 0, day = 0;
  int hour = 0, minute = 0, second = 0;
  long micros = 0;
  long offset_minutes = 0;

  if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, day)) {
    return std::nullopt;
  }

  if (pos < size) {
    char separator = text[pos++];
    if (separator != 'T' && separator != 't' && separator != ' ') return std::nullopt;
    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, minute)) {
      return std::nullopt;
    }

    if (pos < size && text[pos] == ':') {
      ++pos;
      if (!readDigits(text, pos, 2, second)) return std::nullopt;

      if (pos < size && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        size_t digits = 0;
        long scale = 100000;
        while (pos < size && std::isdigit(static_cast<unsigned char>(text[pos]))) {
          if (digits < 6) {
            micros += (text[pos] - '0') * scale;
            scale /= 10;
          }
          ++digits;
          ++pos;
        }
        if (digits == 0) return std::nullopt;
      }
    }

    if (pos < size) {
      char zone = text[pos];
      if (zone == 'Z' || zone == 'z') {
        ++pos;
      } else if (zone == '+' || zone == '-') {
        ++pos;
        int offset_hours = 0;
        int offset_mins = 0;
        if (!readDigits(text, pos, 2, offset_hours)) return std::nullopt;
        if (pos < size && text[pos] == ':') ++pos;
        if (pos < size && !readDigits(text, pos, 2, offset_mins)) return std::nullopt;
        if (offset_hours > 23 || offset_mins > 59) return std::nullopt;
        offset_minutes = (zone == '-' ? -1 : 1) * (offset_hours * 60L + offset_mins);
      } else {
        return std::nullopt;
      }
    }

    if (pos != size) return std::nullopt;
  }

  if (month < 1 || month > 12) return std::nullopt;
  if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;
  if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

  Timestamp local = engine::makeTimestamp(year, month, day, hour, minute, second, micros);
  return Timestamp(local - std::chrono::minutes(offset_minutes));
}

std::string formatTimestamp(const Timestamp& timestamp) {
  const long long micros = timestamp.time_since_epoch().count();
  const long long days = floorDiv(micros, kMicrosPerDay);
  long long rem = micros - days * kMicrosPerDay;

  int year = 0, month = 0, day = 0;
  civilFromDays(days, year, month, day);

  const long long hour = rem / kMicrosPerHour;
  rem %= kMicrosPerHour;
  const long long minute = rem / kMicrosPerMinute;
  rem %= kMicrosPerMinute;
  const long long second = rem / kMicrosPerSecond;
  rem %= kMicrosPerSecond;

  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02lld:%02lld:%02lld.%06lldZ",
                year, month, day, hour, minute, second, rem);
  return buffer;
}

Transaction transactionFromJson(const nlohmann::json& j) {
  Transaction tx;
  if (!j.is_object()) {
    throw engine::InvalidTransaction(tx, "record", "must be a JSON object");
  }

  tx.id = requireString(j, "id", tx);
  tx.from_account = requireString(j, "from_account", tx);
  tx.to_account = requireString(j, "to_account", tx);

  auto amount = j.find("amount");
  if (amount == j.end() || amount->is_null()) {
    throw engine::InvalidTransaction(tx, "amount", "missing field");
  }
  if (amount->is_number()) {
    tx.amount = amount->get<double>();
  } else if (amount->is_string()) {
    auto parsed = parseAmount(amount->get<std::string>());
    if (!parsed) {
      throw engine::InvalidTransaction(tx, "amount",
                                       "not a number: '" + amount->get<std::string>() + "'");
    }
    tx.amount = *parsed;
  } else {
    throw engine::InvalidTransaction(tx, "amount", "must be a number");
  }

  std::string timestamp_text = requireString(j, "timestamp", tx);
  auto timestamp = parseTimestamp(timestamp_text);
  if (!timestamp) {
    throw engine::InvalidTransaction(tx, "timestamp",
                                     "not an ISO-8601 instant: '" + timestamp_text + "'");
  }
  tx.timestamp = *timestamp;

  auto description = j.find("description");
  if (description != j.end() && !description->is_null()) {
    if (!description->is_string()) {
      throw engine::InvalidTransaction(tx, "description", "must be a string");
    }
    std::string text = description->get<std::string>();
    if (!isValidUtf8(text)) {
      throw engine::InvalidTransaction(tx, "description", "not valid UTF-8");
    }
    tx.description = std::move(text);
  }
  return tx;
}

std::vector<Transaction> transactionsFromJson(const nlohmann::json& j) {
  const nlohmann::json* records = &j;
  if (j.is_object()) {
    auto it = j.find("transactions");
    if (it == j.end()) {
      throw engine::EngineError("input object has no \"transactions\" array");
    }
    records = &*it;
  }
  if (!records->is_array()) {
    throw engine::EngineError("transactions must be a JSON array");
  }

  std::vector<Transaction> transactions;
  transactions.reserve(records->size());
  for (const auto& record : *records) {
    transactions.push_back(transactionFromJson(record));
  }
  return transactions;
}

std::vector<Transaction> parseTransactions(const std::string& json_text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw engine::EngineError(std::string("malformed JSON input: ") + e.what());
  }
  return transactionsFromJson(j);
}

std::vector<Transaction> transactionsFromCsv(std::istream& in) {
  std::string line;
  std::vector<std::string> header;

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (header.empty() && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
    if (trim(line).empty()) continue;
    header = splitCsvLine(line);
    break;
  }

  std::vector<Transaction> transactions;
  if (header.empty()) return transactions;

  std::map<std::string, size_t> columns;
  for (size_t i = 0; i < header.size(); ++i) {
    columns[header[i]] = i;
  }
  for (const char* required : kCsvRequiredColumns) {
    if (columns.count(required) == 0) {
      throw engine::EngineError(std::string("CSV header is missing column '") + required + "'");
    }
  }

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;

    std::vector<std::string> fields = splitCsvLine(line);
    if (fields.size() > header.size()) {
      throw engine::EngineError("CSV row has more fields than the header: " + line);
    }

    nlohmann::json record = nlohmann::json::object();
    for (const auto& [name, index] : columns) {
      if (index >= fields.size()) continue;
      if (name == "description" && fields[index].empty()) continue;
      record[name] = fields[index];
    }
    transactions.push_back(transactionFromJson(record));
  }
  return transactions;
}

nlohmann::json toJson(const Transaction& transaction) {
  nlohmann::json j;
  j["id"] = transaction.id;
  j["from_account"] = transaction.from_account;
  j["to_account"] = transaction.to_account;
  j["amount"] = transaction.amount;
  j["timestamp"] = formatTimestamp(transaction.timestamp);
  if (transaction.description) {
    j["description"] = *transaction.description;
  }
  return j;
}

nlohmann::json toJson(const engine::Cycle& cycle) {
  nlohmann::json j;
  j["ring_id"] = cycle.ring_id;
  j["accounts"] = cycle.accounts;
  j["length"] = cycle.length();
  j["transactions"] = cycle.transaction_ids;
  j["transaction_count"] = cycle.transaction_count;
  j["total_amount"] = cycle.total_amount;
  j["average_transaction"] = cycle.average_transaction;
  j["amount_spread"] = cycle.amount_spread;
  j["uniformity"] = cycle.uniformity;
  j["strength"] = cycle.strength;
  j["detection_type"] = cycle.detection_type;
  return j;
}

nlohmann::json toJson(const engine::CycleOverlap& overlap) {
  nlohmann::json j;
  j["ring_a"] = overlap.ring_a;
  j["ring_b"] = overlap.ring_b;
  j["shared_accounts"] = overlap.shared_accounts;
  j["nested"] = overlap.nested;
  return j;
}

nlohmann::json toJson(const engine::CycleCluster& cluster) {
  nlohmann::json j;
  j["ring_ids"] = cluster.ring_ids;
  j["accounts"] = cluster.accounts;
  return j;
}

nlohmann::json toJson(const engine::SmurfingAlert& alert) {
  nlohmann::json j;
  j["account_id"] = alert.account_id;
  j["window_start"] = formatTimestamp(alert.window_start);
  j["window_end"] = formatTimestamp(alert.window_end);
  j["elapsed_hours"] = alert.elapsed_hours;
  j["fan_in"] = alert.fan_in;
  j["fan_out"] = alert.fan_out;
  j["transaction_count"] = alert.transaction_count;
  j["total_amount"] = alert.total_amount;
  j["average_transaction"] = alert.average_transaction;
  j["velocity"] = alert.velocity;
  j["risk_score"] = alert.risk_score;
  j["high_frequency"] = alert.high_frequency;
  j["structuring"] = alert.structuring;
  j["structuring_fraction"] = alert.structuring_fraction;
  j["structuring_threshold"] = alert.structuring_threshold
                                   ? nlohmann::json(*alert.structuring_threshold)
                                   : nlohmann::json(nullptr);
  j["consolidation"] = alert.consolidation;
  j["flags"] = alert.flags;
  return j;
}

nlohmann::json toJson(const engine::ShellProfile& profile) {
  nlohmann::json j;
  j["account_id"] = profile.account_id;
  j["high_value_score"] = profile.high_value_score;
  j["pass_through_score"] = profile.pass_through_score;
  j["connection_score"] = profile.connection_score;
  j["dormancy_score"] = profile.dormancy_score;
  j["directionality_score"] = profile.directionality_score;
  j["uniformity_score"] = profile.uniformity_score;
  j["shell_score"] = profile.shell_score;
  j["risk_level"] = engine::toString(profile.risk_level);
  j["total_transactions"] = profile.total_transactions;
  j["inbound_count"] = profile.inbound_count;
  j["outbound_count"] = profile.outbound_count;
  j["unique_sources"] = profile.unique_sources;
  j["unique_destinations"] = profile.unique_destinations;
  j["total_in"] = profile.total_in;
  j["total_out"] = profile.total_out;
  j["total_throughput"] = profile.total_throughput;
  j["avg_transaction_value"] = profile.avg_transaction_value;
  j["in_out_ratio"] = profile.in_out_ratio;
  j["is_pass_through"] = profile.is_pass_through;
  j["flags"] = profile.flags;
  return j;
}

nlohmann::json toJson(const engine::AccountScore& score) {
  nlohmann::json j;
  j["account_id"] = score.account_id;
  j["ring_involvement_score"] = score.ring_involvement_score;
  j["smurfing_score"] = score.smurfing_score;
  j["shell_score"] = score.shell_score;
  j["transaction_pattern_score"] = score.transaction_pattern_score;
  j["final_score"] = score.final_score;
  j["risk_level"] = engine::toString(score.risk_level);
  j["ring_count"] = score.ring_count;
  j["risk_factors"] = score.risk_factors;
  return j;
}

nlohmann::json toJson(const engine::AnalysisSummary& summary) {
  nlohmann::json j;
  j["total_volume"] = summary.total_volume;
  j["avg_transaction"] = summary.avg_transaction;
  j["median_transaction"] = summary.median_transaction;
  j["min_transaction"] = summary.min_transaction;
  j["max_transaction"] = summary.max_transaction;
  j["cycles_detected"] = summary.cycles_detected;
  j["avg_cycle_length"] = summary.avg_cycle_length;
  j["accounts_in_rings"] = summary.accounts_in_rings;
  j["smurfing_alerts_count"] = summary.smurfing_alerts_count;
  j["shell_accounts_count"] = summary.shell_accounts_count;
  j["high_risk_accounts"] = summary.high_risk_accounts;
  j["critical_accounts"] = summary.critical_accounts;
  j["suspicious_accounts"] = summary.suspicious_accounts;
  j["suspicious_percent"] = summary.suspicious_percent;
  return j;
}

nlohmann::json toJson(const engine::AnalysisResults& results) {
  nlohmann::json j;
  j["total_transactions"] = results.total_transactions;
  j["total_accounts"] = results.total_accounts;
  j["rings_detected"] = toJsonArray(results.rings_detected);
  j["cycle_overlaps"] = toJsonArray(results.cycle_overlaps);
  j["cycle_clusters"] = toJsonArray(results.cycle_clusters);
  j["smurfing_alerts"] = toJsonArray(results.smurfing_alerts);
  j["shell_accounts"] = toJsonArray(results.shell_accounts);
  j["account_scores"] = toJsonArray(results.account_scores);
  j["critical_accounts"] = results.critical_accounts;
  j["high_risk_accounts"] = results.high_risk_accounts;
  j["summary"] = toJson(results.summary);
  return j;
}

nlohmann::json toJson(const engine::AccountReport& report) {
  nlohmann::json j;
  j["account_id"] = report.score.account_id;
  j["score"] = toJson(report.score);
  j["rings"] = toJsonArray(report.rings);
  j["smurfing"] = report.smurfing ? toJson(*report.smurfing) : nlohmann::json(nullptr);
  j["shell"] = report.shell ? toJson(*report.shell) : nlohmann::json(nullptr);
  return j;
}

std::string serializeResults(const engine::AnalysisResults& results, int indent) {
  return toJson(results).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace protocol
}  // namespace muleguard
