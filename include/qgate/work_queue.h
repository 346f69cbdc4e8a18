#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace qgate {

// 0 means one worker per hardware thread.
unsigned ResolveParallelism(unsigned requested);

// Runs `work(item)` for every item on at most `parallelism` workers pulling
// from a shared index. Results land at the item's position, so aggregation
// downstream stays deterministic. The first exception thrown by a worker is
// rethrown after all workers have joined.
template <typename Item, typename Result, typename Work>
std::vector<Result> ParallelMap(const std::vector<Item> &items,
                                unsigned parallelism, Work work) {
  std::vector<Result> results(items.size());
  const auto workers_wanted =
      std::min<std::size_t>(ResolveParallelism(parallelism), items.size());
  if (workers_wanted <= 1) {
    for (std::size_t i = 0; i < items.size(); ++i) {
      results[i] = work(items[i]);
    }
    return results;
  }

  std::mutex queue_mutex;
  std::size_t next_index = 0;
  std::exception_ptr first_error;
  const auto worker = [&]() {
    while (true) {
      std::size_t index = 0;
      {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (next_index >= items.size() || first_error) {
          return;
        }
        index = next_index++;
      }
      try {
        results[index] = work(items[index]);
      } catch (...) {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(workers_wanted);
  for (std::size_t i = 0; i < workers_wanted; ++i) {
    workers.emplace_back(worker);
  }
  for (auto &thread : workers) {
    thread.join();
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return results;
}

} // namespace qgate
