#ifndef MULEGUARD_ERRORS_HPP_
#define MULEGUARD_ERRORS_HPP_

#include "engine/transaction.hpp"

#include <stdexcept>
#include <string>

namespace muleguard {
namespace engine {

/**
 * Base class for every failure the engine reports to its caller.
 * A thrown EngineError always rejects the whole analysis run.
 */
class EngineError : public std::runtime_error {
 public:
  explicit EngineError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * A transaction record failed validation (bad amount, timestamp or a
 * missing field). Carries the offending record and the field name.
 */
class InvalidTransaction : public EngineError {
 public:
  InvalidTransaction(Transaction transaction, std::string field, const std::string& reason);

  const Transaction& transaction() const { return transaction_; }
  const std::string& field() const { return field_; }

 private:
  Transaction transaction_;
  std::string field_;
};

/**
 * Two input records share the same transaction id.
 */
class DuplicateTransactionId : public EngineError {
 public:
  explicit DuplicateTransactionId(std::string transaction_id);

  const std::string& transactionId() const { return transaction_id_; }

 private:
  std::string transaction_id_;
};

/**
 * A configuration value is out of range or names an unknown strategy.
 */
class ConfigError : public EngineError {
 public:
  ConfigError(std::string key, const std::string& reason);

  const std::string& key() const { return key_; }

 private:
  std::string key_;
};

}  // namespace engine
}  // namespace muleguard

#endif  // MULEGUARD_ERRORS_HPP_
