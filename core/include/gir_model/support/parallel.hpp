// gir_model/support/parallel.hpp - Per-item parallel execution
//
// A fixed number of workers pull item indices from a shared atomic counter.
// The call returns after every worker has joined; the first exception thrown
// by a task is rethrown on the calling thread.
//
#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace gir_model
{

/// Worker count for a configured job count (0 = hardware concurrency)
[[nodiscard]] inline unsigned effective_jobs(unsigned jobs) noexcept
{
  if (jobs != 0) {
    return jobs;
  }
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : hw;
}

/**
 * Call `fn(i)` for every i in [0, count) on up to `jobs` threads.
 *
 * Tasks must only touch state owned by item i (or immutable shared state).
 */
template <typename Fn>
void parallel_for_each(size_t count, unsigned jobs, Fn && fn)
{
  const size_t workers = std::min<size_t>(effective_jobs(jobs), count);
  if (workers <= 1) {
    for (size_t i = 0; i < count; ++i) {
      fn(i);
    }
    return;
  }

  std::atomic<size_t> next{0};
  std::exception_ptr failure;
  std::mutex failure_mutex;

  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
      try {
        fn(i);
      } catch (...) {
        const std::lock_guard<std::mutex> lock(failure_mutex);
        if (!failure) {
          failure = std::current_exception();
        }
        next.store(count);
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    threads.emplace_back(worker);
  }
  for (auto & t : threads) {
    t.join();
  }

  if (failure) {
    std::rethrow_exception(failure);
  }
}

}  // namespace gir_model
