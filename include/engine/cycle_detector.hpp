#ifndef MULEGUARD_CYCLE_DETECTOR_HPP_
#define MULEGUARD_CYCLE_DETECTOR_HPP_

#include "concurrent/partitioned_executor.hpp"
#include "engine/analysis_results.hpp"
#include "engine/config.hpp"
#include "engine/transaction_graph.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace muleguard {
namespace engine {

/**
 * Output of one ring search.
 */
struct CycleReport {
  std::vector<Cycle> cycles;  // ranked by strength, at most max_cycles
  std::vector<CycleOverlap> overlaps;
  std::vector<CycleCluster> clusters;
  size_t unique_cycles_found = 0;  // before the top-N cut
};

/**
 * Ring search strategy. Implementations treat the graph as read-only and
 * return an empty report (never an error) when no ring exists.
 */
class CycleDetector {
 public:
  virtual ~CycleDetector() = default;

  virtual std::string name() const = 0;

  virtual CycleReport detect(const TransactionGraph& graph, const CycleConfig& config,
                             const concurrent::PartitionedExecutor& executor) const = 0;
};

/**
 * Depth-limited DFS from the K accounts with the highest out-degree.
 *
 * Branches are cut when the current account has no outgoing link or when the
 * shortest way back to the start would exceed max_length. Cycles found from
 * different roots are reduced to one canonical rotation, scored by strength
 * and cut to the top max_cycles.
 */
class BoundedDfsCycleDetector : public CycleDetector {
 public:
  static constexpr const char* kName = "bounded_dfs_v2";

  std::string name() const override { return kName; }

  CycleReport detect(const TransactionGraph& graph, const CycleConfig& config,
                     const concurrent::PartitionedExecutor& executor) const override;

  /**
   * DFS roots: accounts ordered by (out-degree desc, id asc), first K with at
   * least one outgoing link.
   */
  static std::vector<size_t> startNodes(const TransactionGraph& graph, const CycleConfig& config);

  static double strength(double volume, size_t transaction_count, size_t length,
                         const CycleConfig& config);

  /**
   * Rotates so the smallest element comes first; direction is preserved.
   */
  template <typename T>
  static std::vector<T> canonicalRotation(const std::vector<T>& cycle) {
    if (cycle.empty()) return cycle;
    auto smallest = std::min_element(cycle.begin(), cycle.end());
    std::vector<T> rotated(smallest, cycle.end());
    rotated.insert(rotated.end(), cycle.begin(), smallest);
    return rotated;
  }

 private:
  void searchFrom(size_t start, const TransactionGraph& graph, const CycleConfig& config,
                  const std::vector<std::vector<size_t>>& predecessors,
                  std::vector<std::vector<size_t>>& found) const;

  void extend(size_t start, const TransactionGraph& graph, const CycleConfig& config,
              const std::vector<size_t>& distance_to_start, std::vector<size_t>& path,
              std::vector<char>& on_path, std::vector<std::vector<size_t>>& found) const;

  Cycle describe(const std::vector<size_t>& canonical, const TransactionGraph& graph,
                 const CycleConfig& config) const;
};

/**
 * Pairs of rings sharing at least `min_shared_accounts` accounts.
 */
std::vector<CycleOverlap> findCycleOverlaps(const std::vector<Cycle>& cycles,
                                            size_t min_shared_accounts);

/**
 * Connected groups (two or more rings) joined by overlaps.
 */
std::vector<CycleCluster> clusterCycles(const std::vector<Cycle>& cycles,
                                        const std::vector<CycleOverlap>& overlaps);

/**
 * Throws ConfigError for an unknown strategy name.
 */
std::unique_ptr<CycleDetector> makeCycleDetector(const std::string& strategy);

}  // namespace engine
}  // namespace muleguard

#endif  // MULEGUARD_CYCLE_DETECTOR_HPP_
