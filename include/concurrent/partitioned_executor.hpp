#ifndef MULEGUARD_PARTITIONED_EXECUTOR_HPP_
#define MULEGUARD_PARTITIONED_EXECUTOR_HPP_

#include <cstddef>
#include <functional>
#include <iterator>
#include <vector>

namespace muleguard {
namespace concurrent {

/**
 * Runs index-range work across a fixed number of worker threads.
 *
 * [0, count) is split into contiguous, disjoint slices, one per worker. Each
 * worker writes only to its own slice of output, so no locking is needed; the
 * caller merges slice outputs in slice order after join, which keeps results
 * independent of the worker count.
 */
class PartitionedExecutor {
 public:
  using SliceTask = std::function<void(size_t slice, size_t begin, size_t end)>;

  explicit PartitionedExecutor(size_t num_worker_threads = 4);

  // Non-copyable
  PartitionedExecutor(const PartitionedExecutor&) = delete;
  PartitionedExecutor& operator=(const PartitionedExecutor&) = delete;

  size_t workerCount() const { return num_workers_; }

  /**
   * Number of slices `run` will use for `count` items.
   */
  size_t sliceCount(size_t count) const;

  /**
   * Blocks until every slice finishes. The first exception thrown by any
   * slice is rethrown here after all workers have joined. If a worker thread
   * cannot be started, the workers already running are joined before the
   * std::system_error propagates.
   */
  void run(size_t count, const SliceTask& task) const;

  /**
   * Calls `fn(index, out)` for every index; `out` is the calling slice's own
   * vector. Returns the slice outputs concatenated in index order.
   */
  template <typename T, typename Fn>
  std::vector<T> collect(size_t count, Fn fn) const {
    std::vector<std::vector<T>> per_slice(sliceCount(count));
    run(count, [&per_slice, &fn](size_t slice, size_t begin, size_t end) {
      auto& out = per_slice[slice];
      for (size_t i = begin; i < end; ++i) {
        fn(i, out);
      }
    });

    std::vector<T> merged;
    for (auto& part : per_slice) {
      merged.insert(merged.end(),
                    std::make_move_iterator(part.begin()),
                    std::make_move_iterator(part.end()));
    }
    return merged;
  }

 private:
  size_t num_workers_;
};

}  // namespace concurrent
}  // namespace muleguard

#endif  // MULEGUARD_PARTITIONED_EXECUTOR_HPP_
