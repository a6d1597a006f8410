#ifndef MULEGUARD_LOGGER_HPP_
#define MULEGUARD_LOGGER_HPP_

#include <chrono>
#include <cstddef>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

namespace muleguard {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

std::string toString(LogLevel level);

// Case-insensitive; "warning" is accepted for WARN.
std::optional<LogLevel> parseLogLevel(const std::string& name);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe; the engine's worker slices log through the same instance.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Default: std::clog, so stdout stays free for analysis output
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message, const std::string& component = "",
             const std::string& correlation_id = "");
  void info(const std::string& message, const std::string& component = "",
            const std::string& correlation_id = "");
  void warn(const std::string& message, const std::string& component = "",
            const std::string& correlation_id = "");
  void error(const std::string& message, const std::string& component = "",
             const std::string& correlation_id = "");
  void fatal(const std::string& message, const std::string& component = "",
             const std::string& correlation_id = "");

  // Structured logging with key-value pairs, emitted on destruction
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, long value);
    LogBuilder& field(const std::string& key, std::size_t value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::string correlation_id_;
    std::map<std::string, std::string> fields_;  // values already JSON-encoded
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::string& correlation_id,
           const std::map<std::string, std::string>& fields = {});

  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) muleguard::observability::Logger::getInstance().debug(msg, __func__)
#define LOG_INFO(msg) muleguard::observability::Logger::getInstance().info(msg, __func__)
#define LOG_WARN(msg) muleguard::observability::Logger::getInstance().warn(msg, __func__)
#define LOG_ERROR(msg) muleguard::observability::Logger::getInstance().error(msg, __func__)
#define LOG_FATAL(msg) muleguard::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define LOG_BUILDER(level, msg) \
  muleguard::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace muleguard

#endif  // MULEGUARD_LOGGER_HPP_
