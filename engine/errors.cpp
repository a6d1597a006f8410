#include "engine/errors.hpp"

#include <utility>

namespace muleguard {
namespace engine {

InvalidTransaction::InvalidTransaction(Transaction transaction, std::string field,
                                       const std::string& reason)
    : EngineError("Invalid transaction '" + transaction.id + "': field '" + field +
                  "' " + reason),
      transaction_(std::move(transaction)),
      field_(std::move(field)) {}

DuplicateTransactionId::DuplicateTransactionId(std::string transaction_id)
    : EngineError("Duplicate transaction id '" + transaction_id + "'"),
      transaction_id_(std::move(transaction_id)) {}

ConfigError::ConfigError(std::string key, const std::string& reason)
    : EngineError("Invalid configuration '" + key + "': " + reason),
      key_(std::move(key)) {}

}  // namespace engine
}  // namespace muleguard
