#ifndef MULEGUARD_TEST_SUPPORT_HPP_
#define MULEGUARD_TEST_SUPPORT_HPP_

#include "engine/transaction.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace muleguard {
namespace testing {

// 2025-12-15T10:00:00Z
inline engine::Timestamp baseTime() {
  return engine::makeTimestamp(2025, 12, 15, 10, 0, 0);
}

inline engine::Timestamp atMinutes(long minutes) {
  return baseTime() + std::chrono::minutes(minutes);
}

inline engine::Timestamp atHours(double hours) {
  return baseTime() + std::chrono::microseconds(static_cast<long long>(hours * 3600.0 * 1e6));
}

inline engine::Transaction makeTx(const std::string& id, const std::string& from,
                                  const std::string& to, double amount,
                                  engine::Timestamp timestamp) {
  engine::Transaction tx;
  tx.id = id;
  tx.from_account = from;
  tx.to_account = to;
  tx.amount = amount;
  tx.timestamp = timestamp;
  return tx;
}

template <typename Container, typename Value>
bool contains(const Container& container, const Value& value) {
  return std::find(container.begin(), container.end(), value) != container.end();
}

}  // namespace testing
}  // namespace muleguard

#endif  // MULEGUARD_TEST_SUPPORT_HPP_
