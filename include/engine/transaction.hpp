#ifndef MULEGUARD_TRANSACTION_HPP_
#define MULEGUARD_TRANSACTION_HPP_

#include <chrono>
#include <optional>
#include <string>

namespace muleguard {
namespace engine {

/**
 * Instant with microsecond precision, UTC.
 */
using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::microseconds>;

/**
 * A single transfer between two accounts.
 * Immutable once decoded; the engine never mutates the records it is given.
 */
struct Transaction {
  std::string id;
  std::string from_account;
  std::string to_account;
  double amount = 0.0;
  Timestamp timestamp{};
  std::optional<std::string> description;

  bool isSelfLoop() const { return from_account == to_account; }
};

// Elapsed time between two instants in fractional hours (b - a).
double hoursBetween(const Timestamp& a, const Timestamp& b);

// Builds a timestamp from a civil UTC date/time plus microseconds.
Timestamp makeTimestamp(int year, int month, int day,
                        int hour = 0, int minute = 0, int second = 0,
                        long microseconds = 0);

}  // namespace engine
}  // namespace muleguard

#endif  // MULEGUARD_TRANSACTION_HPP_
