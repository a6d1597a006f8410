#ifndef MULEGUARD_TRANSACTION_GRAPH_HPP_
#define MULEGUARD_TRANSACTION_GRAPH_HPP_

#include "engine/transaction.hpp"

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace muleguard {
namespace engine {

/**
 * Per-account aggregates, recomputed for every run.
 * Self-loop transactions count on both the inbound and outbound side.
 */
struct AccountStats {
  double total_in = 0.0;
  double total_out = 0.0;
  size_t in_count = 0;
  size_t out_count = 0;
  std::set<std::string> sources;
  std::set<std::string> destinations;
  Timestamp first_seen{};
  Timestamp last_seen{};
  // Indices into TransactionGraph::transactions(), in time order.
  std::vector<size_t> transactions;

  size_t transactionCount() const { return transactions.size(); }
  double throughput() const { return total_in + total_out; }
};

/**
 * All parallel edges from one account to another, collapsed for path search.
 */
struct Link {
  size_t target;
  double amount = 0.0;
  std::vector<size_t> transactions;
};

/**
 * Directed multigraph of accounts (nodes) and transactions (edges).
 * Read-only once built; detectors share one instance across worker threads.
 */
class TransactionGraph {
 public:
  TransactionGraph() = default;

  // Sorted by (timestamp, id).
  const std::vector<Transaction>& transactions() const { return transactions_; }

  // Sorted ascending; an account's index is its position here.
  const std::vector<std::string>& accounts() const { return accounts_; }
  size_t accountCount() const { return accounts_.size(); }
  bool empty() const { return transactions_.empty(); }

  std::optional<size_t> indexOf(const std::string& account_id) const;
  const std::string& accountAt(size_t index) const { return accounts_[index]; }

  const AccountStats& statsAt(size_t index) const { return stats_[index]; }
  const AccountStats* findStats(const std::string& account_id) const;

  /**
   * Outgoing links of an account, excluding self-loops, ordered by target index.
   */
  const std::vector<Link>& outgoing(size_t index) const { return outgoing_[index]; }

  /**
   * Number of outgoing transactions, excluding self-loops.
   */
  size_t outDegree(size_t index) const { return out_degree_[index]; }

  const Link* findLink(size_t from, size_t to) const;

  double totalVolume() const { return total_volume_; }

 private:
  friend class GraphBuilder;

  std::vector<Transaction> transactions_;
  std::vector<std::string> accounts_;
  std::unordered_map<std::string, size_t> account_index_;
  std::vector<AccountStats> stats_;
  std::vector<std::vector<Link>> outgoing_;
  std::vector<size_t> out_degree_;
  double total_volume_ = 0.0;
};

/**
 * Validates the input set and builds the TransactionGraph.
 * Identical input (in any order) always yields an identical graph.
 */
class GraphBuilder {
 public:
  /**
   * Throws InvalidTransaction or DuplicateTransactionId; the run is rejected
   * as a whole.
   */
  TransactionGraph build(std::vector<Transaction> transactions) const;

  /**
   * Checks a single record: non-empty id and accounts, positive finite
   * amount, timestamp within years 1900..9999.
   */
  static void validate(const Transaction& transaction);
};

}  // namespace engine
}  // namespace muleguard

#endif  // MULEGUARD_TRANSACTION_GRAPH_HPP_
