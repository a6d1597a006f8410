#include "engine/transaction_graph.hpp"
#include "engine/errors.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace muleguard {
namespace engine {

std::optional<size_t> TransactionGraph::indexOf(const std::string& account_id) const {
  auto it = account_index_.find(account_id);
  if (it == account_index_.end()) return std::nullopt;
  return it->second;
}

const AccountStats* TransactionGraph::findStats(const std::string& account_id) const {
  auto index = indexOf(account_id);
  return index ? &stats_[*index] : nullptr;
}

const Link* TransactionGraph::findLink(size_t from, size_t to) const {
  const auto& links = outgoing_[from];
  auto it = std::lower_bound(links.begin(), links.end(), to,
                             [](const Link& link, size_t target) { return link.target < target; });
  if (it == links.end() || it->target != to) return nullptr;
  return &*it;
}

void GraphBuilder::validate(const Transaction& transaction) {
  static const Timestamp kEarliest = makeTimestamp(1900, 1, 1);
  static const Timestamp kLatest = makeTimestamp(10000, 1, 1);

  if (transaction.id.empty()) {
    throw InvalidTransaction(transaction, "id", "must not be empty");
  }
  if (transaction.from_account.empty()) {
    throw InvalidTransaction(transaction, "from_account", "must not be empty");
  }
  if (transaction.to_account.empty()) {
    throw InvalidTransaction(transaction, "to_account", "must not be empty");
  }
  if (!std::isfinite(transaction.amount) || transaction.amount <= 0.0) {
    throw InvalidTransaction(transaction, "amount", "must be a positive finite number");
  }
  if (transaction.timestamp < kEarliest || transaction.timestamp >= kLatest) {
    throw InvalidTransaction(transaction, "timestamp", "is outside the supported range");
  }
}

TransactionGraph GraphBuilder::build(std::vector<Transaction> transactions) const {
  std::unordered_set<std::string> seen_ids;
  seen_ids.reserve(transactions.size());
  for (const auto& tx : transactions) {
    validate(tx);
    if (!seen_ids.insert(tx.id).second) {
      throw DuplicateTransactionId(tx.id);
    }
  }

  // Canonical order makes every downstream sum and tie-break independent of
  // the order the caller supplied.
  std::sort(transactions.begin(), transactions.end(),
            [](const Transaction& a, const Transaction& b) {
              if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
              return a.id < b.id;
            });

  TransactionGraph graph;
  graph.transactions_ = std::move(transactions);

  std::set<std::string> account_set;
  for (const auto& tx : graph.transactions_) {
    account_set.insert(tx.from_account);
    account_set.insert(tx.to_account);
  }
  graph.accounts_.assign(account_set.begin(), account_set.end());
  graph.account_index_.reserve(graph.accounts_.size());
  for (size_t i = 0; i < graph.accounts_.size(); ++i) {
    graph.account_index_.emplace(graph.accounts_[i], i);
  }

  const size_t n = graph.accounts_.size();
  graph.stats_.assign(n, AccountStats{});
  graph.outgoing_.assign(n, {});
  graph.out_degree_.assign(n, 0);

  for (size_t t = 0; t < graph.transactions_.size(); ++t) {
    const auto& tx = graph.transactions_[t];
    const size_t from = graph.account_index_.at(tx.from_account);
    const size_t to = graph.account_index_.at(tx.to_account);
    graph.total_volume_ += tx.amount;

    AccountStats& sender = graph.stats_[from];
    sender.total_out += tx.amount;
    sender.out_count += 1;
    sender.destinations.insert(tx.to_account);

    AccountStats& receiver = graph.stats_[to];
    receiver.total_in += tx.amount;
    receiver.in_count += 1;
    receiver.sources.insert(tx.from_account);

    for (size_t account : {from, to}) {
      AccountStats& stats = graph.stats_[account];
      if (!stats.transactions.empty() && stats.transactions.back() == t) continue;
      if (stats.transactions.empty()) stats.first_seen = tx.timestamp;
      stats.last_seen = tx.timestamp;
      stats.transactions.push_back(t);
    }

    if (from == to) continue;  // self-loops never take part in path search

    graph.out_degree_[from] += 1;
    auto& links = graph.outgoing_[from];
    auto it = std::lower_bound(links.begin(), links.end(), to,
                               [](const Link& link, size_t target) { return link.target < target; });
    if (it == links.end() || it->target != to) {
      it = links.insert(it, Link{to, 0.0, {}});
    }
    it->amount += tx.amount;
    it->transactions.push_back(t);
  }

  LOG_BUILDER(observability::LogLevel::DEBUG, "Transaction graph built")
      .field("transactions", graph.transactions_.size())
      .field("accounts", graph.accounts_.size());

  return graph;
}

}  // namespace engine
}  // namespace muleguard
