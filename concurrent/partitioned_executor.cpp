#include "concurrent/partitioned_executor.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <thread>

namespace muleguard {
namespace concurrent {

PartitionedExecutor::PartitionedExecutor(size_t num_worker_threads)
    : num_workers_(std::max<size_t>(1, num_worker_threads)) {
}

size_t PartitionedExecutor::sliceCount(size_t count) const {
  if (count == 0) return 0;
  return std::min(num_workers_, count);
}

void PartitionedExecutor::run(size_t count, const SliceTask& task) const {
  const size_t slices = sliceCount(count);
  if (slices == 0) return;

  // Small inputs and single-worker configurations run inline.
  if (slices == 1) {
    task(0, 0, count);
    return;
  }

  const size_t base = count / slices;
  const size_t remainder = count % slices;

  std::vector<std::exception_ptr> errors(slices);
  std::vector<std::unique_ptr<std::thread>> worker_threads;
  worker_threads.reserve(slices);

  auto join_all = [&worker_threads]() {
    for (auto& thread : worker_threads) {
      if (thread && thread->joinable()) {
        thread->join();
      }
    }
  };

  // A failed spawn must not leave running threads referencing this frame.
  try {
    size_t begin = 0;
    for (size_t slice = 0; slice < slices; ++slice) {
      const size_t end = begin + base + (slice < remainder ? 1 : 0);
      worker_threads.emplace_back(std::make_unique<std::thread>(
          [&task, &errors, slice, begin, end]() {
            try {
              task(slice, begin, end);
            } catch (...) {
              errors[slice] = std::current_exception();
            }
          }));
      begin = end;
    }
  } catch (...) {
    join_all();
    throw;
  }

  join_all();

  for (const auto& error : errors) {
    if (error) std::rethrow_exception(error);
  }
}

}  // namespace concurrent
}  // namespace muleguard
