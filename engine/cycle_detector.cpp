#include "engine/cycle_detector.hpp"
#include "engine/errors.hpp"
#include "observability/logger.hpp"

#include <cmath>
#include <deque>
#include <iomanip>
#include <iterator>
#include <limits>
#include <numeric>
#include <set>
#include <sstream>
#include <unordered_map>

namespace muleguard {
namespace engine {

namespace {

constexpr size_t kUnreachable = std::numeric_limits<size_t>::max();

std::string ringIdFor(size_t rank) {
  std::ostringstream ss;
  ss << "RING_" << std::setfill('0') << std::setw(3) << rank;
  return ss.str();
}

}  // namespace

std::vector<size_t> BoundedDfsCycleDetector::startNodes(const TransactionGraph& graph,
                                                        const CycleConfig& config) {
  std::vector<size_t> nodes;
  nodes.reserve(graph.accountCount());
  for (size_t i = 0; i < graph.accountCount(); ++i) {
    if (graph.outDegree(i) > 0) nodes.push_back(i);
  }

  // Account indices follow id order, so the index is the id tie-break.
  std::sort(nodes.begin(), nodes.end(), [&graph](size_t a, size_t b) {
    if (graph.outDegree(a) != graph.outDegree(b)) return graph.outDegree(a) > graph.outDegree(b);
    return a < b;
  });

  if (nodes.size() > config.max_start_nodes) nodes.resize(config.max_start_nodes);
  return nodes;
}

double BoundedDfsCycleDetector::strength(double volume, size_t transaction_count, size_t length,
                                         const CycleConfig& config) {
  const double volume_term = config.volume_weight * (volume / config.volume_scale);
  const double count_term =
      config.count_weight * (static_cast<double>(transaction_count) / config.count_scale);
  const double length_term =
      config.length_weight * (static_cast<double>(length) / config.length_scale);
  return volume_term + count_term + length_term;
}

CycleReport BoundedDfsCycleDetector::detect(const TransactionGraph& graph,
                                            const CycleConfig& config,
                                            const concurrent::PartitionedExecutor& executor) const {
  CycleReport report;
  if (graph.empty()) return report;

  std::vector<std::vector<size_t>> predecessors(graph.accountCount());
  for (size_t from = 0; from < graph.accountCount(); ++from) {
    for (const auto& link : graph.outgoing(from)) {
      predecessors[link.target].push_back(from);
    }
  }

  const auto roots = startNodes(graph, config);
  auto raw = executor.collect<std::vector<size_t>>(
      roots.size(), [&](size_t i, std::vector<std::vector<size_t>>& out) {
        searchFrom(roots[i], graph, config, predecessors, out);
      });

  // Serialized merge: one canonical representative per rotation class.
  std::set<std::vector<size_t>> unique;
  for (const auto& path : raw) {
    unique.insert(canonicalRotation(path));
  }
  report.unique_cycles_found = unique.size();

  std::vector<std::pair<std::vector<size_t>, Cycle>> ranked;
  ranked.reserve(unique.size());
  for (const auto& canonical : unique) {
    ranked.emplace_back(canonical, describe(canonical, graph, config));
  }

  std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
    if (a.second.strength != b.second.strength) return a.second.strength > b.second.strength;
    if (a.first.size() != b.first.size()) return a.first.size() < b.first.size();
    return a.first < b.first;
  });

  if (ranked.size() > config.max_cycles) ranked.resize(config.max_cycles);

  report.cycles.reserve(ranked.size());
  for (size_t rank = 0; rank < ranked.size(); ++rank) {
    Cycle cycle = std::move(ranked[rank].second);
    cycle.ring_id = ringIdFor(rank + 1);
    report.cycles.push_back(std::move(cycle));
  }

  report.overlaps = findCycleOverlaps(report.cycles, config.cluster_min_shared_accounts);
  report.clusters = clusterCycles(report.cycles, report.overlaps);

  LOG_BUILDER(observability::LogLevel::INFO, "Ring search finished")
      .field("roots", roots.size())
      .field("raw_paths", raw.size())
      .field("unique_cycles", report.unique_cycles_found)
      .field("retained_cycles", report.cycles.size())
      .field("clusters", report.clusters.size());

  return report;
}

void BoundedDfsCycleDetector::searchFrom(size_t start, const TransactionGraph& graph,
                                         const CycleConfig& config,
                                         const std::vector<std::vector<size_t>>& predecessors,
                                         std::vector<std::vector<size_t>>& found) const {
  // Hop distance from every account back to `start`, bounded by max_length.
  std::vector<size_t> distance_to_start(graph.accountCount(), kUnreachable);
  std::deque<size_t> frontier;
  distance_to_start[start] = 0;
  frontier.push_back(start);
  while (!frontier.empty()) {
    size_t node = frontier.front();
    frontier.pop_front();
    if (distance_to_start[node] >= config.max_length) continue;
    for (size_t previous : predecessors[node]) {
      if (distance_to_start[previous] != kUnreachable) continue;
      distance_to_start[previous] = distance_to_start[node] + 1;
      frontier.push_back(previous);
    }
  }

  std::vector<size_t> path{start};
  std::vector<char> on_path(graph.accountCount(), 0);
  on_path[start] = 1;
  extend(start, graph, config, distance_to_start, path, on_path, found);
}

void BoundedDfsCycleDetector::extend(size_t start, const TransactionGraph& graph,
                                     const CycleConfig& config,
                                     const std::vector<size_t>& distance_to_start,
                                     std::vector<size_t>& path, std::vector<char>& on_path,
                                     std::vector<std::vector<size_t>>& found) const {
  const auto& links = graph.outgoing(path.back());
  if (links.empty()) return;

  for (const auto& link : links) {
    const size_t next = link.target;
    if (next == start) {
      if (path.size() >= config.min_length) found.push_back(path);
      continue;
    }
    if (on_path[next] || path.size() >= config.max_length) continue;

    // Adding `next` uses path.size() edges; closing needs at least
    // distance_to_start[next] more.
    const size_t back = distance_to_start[next];
    if (back == kUnreachable || path.size() + back > config.max_length) continue;

    on_path[next] = 1;
    path.push_back(next);
    extend(start, graph, config, distance_to_start, path, on_path, found);
    path.pop_back();
    on_path[next] = 0;
  }
}

Cycle BoundedDfsCycleDetector::describe(const std::vector<size_t>& canonical,
                                        const TransactionGraph& graph,
                                        const CycleConfig& config) const {
  Cycle cycle;
  cycle.accounts.reserve(canonical.size());
  for (size_t index : canonical) {
    cycle.accounts.push_back(graph.accountAt(index));
  }

  std::vector<double> hop_amounts;
  hop_amounts.reserve(canonical.size());
  for (size_t i = 0; i < canonical.size(); ++i) {
    const Link* link = graph.findLink(canonical[i], canonical[(i + 1) % canonical.size()]);
    if (!link) continue;  // unreachable for paths produced by the search
    hop_amounts.push_back(link->amount);
    cycle.total_amount += link->amount;
    for (size_t t : link->transactions) {
      cycle.transaction_ids.push_back(graph.transactions()[t].id);
    }
  }
  cycle.transaction_count = cycle.transaction_ids.size();

  if (!hop_amounts.empty()) {
    const double mean = cycle.total_amount / static_cast<double>(hop_amounts.size());
    cycle.average_transaction = mean;
    double variance = 0.0;
    for (double amount : hop_amounts) {
      variance += (amount - mean) * (amount - mean);
    }
    variance /= static_cast<double>(hop_amounts.size());
    const double spread = mean > 0.0 ? std::sqrt(variance) / mean : 0.0;
    cycle.amount_spread = std::min(spread, 1.0);
    cycle.uniformity = 1.0 - cycle.amount_spread;
  }

  cycle.strength = strength(cycle.total_amount, cycle.transaction_count, cycle.length(), config);
  return cycle;
}

std::vector<CycleOverlap> findCycleOverlaps(const std::vector<Cycle>& cycles,
                                            size_t min_shared_accounts) {
  std::vector<std::vector<std::string>> sorted_accounts;
  sorted_accounts.reserve(cycles.size());
  for (const auto& cycle : cycles) {
    auto accounts = cycle.accounts;
    std::sort(accounts.begin(), accounts.end());
    sorted_accounts.push_back(std::move(accounts));
  }

  std::vector<CycleOverlap> overlaps;
  for (size_t i = 0; i < cycles.size(); ++i) {
    for (size_t j = i + 1; j < cycles.size(); ++j) {
      std::vector<std::string> shared;
      std::set_intersection(sorted_accounts[i].begin(), sorted_accounts[i].end(),
                            sorted_accounts[j].begin(), sorted_accounts[j].end(),
                            std::back_inserter(shared));
      if (shared.size() < min_shared_accounts) continue;

      CycleOverlap overlap;
      overlap.ring_a = cycles[i].ring_id;
      overlap.ring_b = cycles[j].ring_id;
      const size_t smaller = std::min(sorted_accounts[i].size(), sorted_accounts[j].size());
      overlap.nested = shared.size() == smaller &&
                       sorted_accounts[i].size() != sorted_accounts[j].size();
      overlap.shared_accounts = std::move(shared);
      overlaps.push_back(std::move(overlap));
    }
  }
  return overlaps;
}

std::vector<CycleCluster> clusterCycles(const std::vector<Cycle>& cycles,
                                        const std::vector<CycleOverlap>& overlaps) {
  std::unordered_map<std::string, size_t> position;
  for (size_t i = 0; i < cycles.size(); ++i) {
    position.emplace(cycles[i].ring_id, i);
  }

  std::vector<size_t> parent(cycles.size());
  std::iota(parent.begin(), parent.end(), 0);
  auto find = [&parent](size_t x) {
    while (parent[x] != x) {
      parent[x] = parent[parent[x]];
      x = parent[x];
    }
    return x;
  };

  for (const auto& overlap : overlaps) {
    auto a = position.find(overlap.ring_a);
    auto b = position.find(overlap.ring_b);
    if (a == position.end() || b == position.end()) continue;
    size_t root_a = find(a->second);
    size_t root_b = find(b->second);
    if (root_a == root_b) continue;
    // Lower rank becomes the root so cluster order follows ring rank.
    if (root_b < root_a) std::swap(root_a, root_b);
    parent[root_b] = root_a;
  }

  std::vector<std::vector<size_t>> members(cycles.size());
  for (size_t i = 0; i < cycles.size(); ++i) {
    members[find(i)].push_back(i);
  }

  std::vector<CycleCluster> clusters;
  for (const auto& group : members) {
    if (group.size() < 2) continue;
    CycleCluster cluster;
    std::set<std::string> accounts;
    for (size_t i : group) {
      cluster.ring_ids.push_back(cycles[i].ring_id);
      accounts.insert(cycles[i].accounts.begin(), cycles[i].accounts.end());
    }
    cluster.accounts.assign(accounts.begin(), accounts.end());
    clusters.push_back(std::move(cluster));
  }
  return clusters;
}

std::unique_ptr<CycleDetector> makeCycleDetector(const std::string& strategy) {
  if (strategy == BoundedDfsCycleDetector::kName) {
    return std::make_unique<BoundedDfsCycleDetector>();
  }
  throw ConfigError("cycles.strategy", "unknown strategy '" + strategy + "'");
}

}  // namespace engine
}  // namespace muleguard
