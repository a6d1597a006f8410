#include "engine/analysis_engine.hpp"
#include "engine/errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"
#include "protocol/json_codec.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Options {
  std::string input_path;
  std::string config_path;
  std::optional<size_t> workers;
  std::string account_id;
  bool print_metrics = false;
  muleguard::observability::LogLevel log_level = muleguard::observability::LogLevel::INFO;
};

void printUsage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.json|transactions.csv>"
            << " [--config cfg.json] [--workers N] [--account ID] [--metrics]"
            << " [--log-level debug|info|warn|error]" << std::endl;
}

bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Returns false (after printing why) on a malformed command line.
bool parseArguments(int argc, char* argv[], Options& options) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](const char* flag) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << flag << " requires a value" << std::endl;
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "--config") {
      const char* value = next("--config");
      if (!value) return false;
      options.config_path = value;
    } else if (arg == "--workers") {
      const char* value = next("--workers");
      if (!value) return false;
      try {
        // std::stoul accepts a sign and would wrap "-1" to ULONG_MAX.
        const std::string text = value;
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
          throw std::invalid_argument(text);
        }
        options.workers = std::stoul(text);
      } catch (const std::exception&) {
        std::cerr << "--workers expects a non-negative integer, got '" << value << "'" << std::endl;
        return false;
      }
    } else if (arg == "--account") {
      const char* value = next("--account");
      if (!value) return false;
      options.account_id = value;
    } else if (arg == "--metrics") {
      options.print_metrics = true;
    } else if (arg == "--log-level") {
      const char* value = next("--log-level");
      if (!value) return false;
      auto level = muleguard::observability::parseLogLevel(value);
      if (!level) {
        std::cerr << "Unknown log level '" << value << "'" << std::endl;
        return false;
      }
      options.log_level = *level;
    } else if (arg == "--help" || arg == "-h") {
      return false;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option " << arg << std::endl;
      return false;
    } else if (options.input_path.empty()) {
      options.input_path = arg;
    } else {
      std::cerr << "Unexpected argument " << arg << std::endl;
      return false;
    }
  }

  if (options.input_path.empty()) {
    std::cerr << "No input file given" << std::endl;
    return false;
  }
  return true;
}

std::vector<muleguard::engine::Transaction> readTransactions(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw muleguard::engine::EngineError("cannot open input file " + path);
  }
  if (endsWith(path, ".csv") || endsWith(path, ".CSV")) {
    return muleguard::protocol::transactionsFromCsv(in);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return muleguard::protocol::parseTransactions(buffer.str());
}

}  // namespace

int main(int argc, char* argv[]) {
  using muleguard::observability::LogLevel;

  Options options;
  if (!parseArguments(argc, argv, options)) {
    printUsage(argv[0]);
    return 1;
  }

  auto& logger = muleguard::observability::Logger::getInstance();
  logger.setOutputStream(std::cerr);
  logger.setLogLevel(options.log_level);

  try {
    muleguard::engine::EngineConfig config = options.config_path.empty()
        ? muleguard::engine::EngineConfig::defaults()
        : muleguard::engine::loadConfig(options.config_path);
    if (options.workers) {
      config.execution.worker_threads = *options.workers;
    }
    LOG_BUILDER(LogLevel::DEBUG, "Effective configuration")
        .field("config", muleguard::engine::configToJson(config).dump());

    muleguard::engine::AnalysisEngine engine(std::move(config));

    auto transactions = readTransactions(options.input_path);
    LOG_BUILDER(LogLevel::INFO, "Input decoded")
        .field("path", options.input_path)
        .field("transactions", transactions.size());

    muleguard::engine::AnalysisResults results = engine.analyze(std::move(transactions));

    if (!options.account_id.empty()) {
      auto report = muleguard::engine::accountReport(results, options.account_id);
      if (!report) {
        LOG_BUILDER(LogLevel::ERROR, "Account not present in input")
            .field("account_id", options.account_id);
        return 1;
      }
      std::cout << muleguard::protocol::toJson(*report).dump(
                       2, ' ', false, nlohmann::json::error_handler_t::replace)
                << std::endl;
    } else {
      std::cout << muleguard::protocol::serializeResults(results) << std::endl;
    }

    if (options.print_metrics) {
      std::cerr << muleguard::observability::getGlobalMetrics().exportMetrics();
    }
  } catch (const muleguard::engine::InvalidTransaction& e) {
    LOG_BUILDER(LogLevel::ERROR, "Invalid transaction")
        .field("transaction_id", e.transaction().id)
        .field("field", e.field())
        .field("reason", std::string(e.what()));
    return 1;
  } catch (const muleguard::engine::ConfigError& e) {
    LOG_BUILDER(LogLevel::ERROR, "Invalid configuration")
        .field("key", e.key())
        .field("reason", std::string(e.what()));
    return 1;
  } catch (const muleguard::engine::EngineError& e) {
    LOG_BUILDER(LogLevel::ERROR, "Analysis failed")
        .field("reason", std::string(e.what()));
    return 1;
  } catch (const std::exception& e) {
    LOG_BUILDER(LogLevel::FATAL, "Unexpected failure")
        .field("reason", std::string(e.what()));
    return 1;
  }

  return 0;
}
