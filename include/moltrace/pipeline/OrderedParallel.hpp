#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(MOLTRACE_HAS_OPENMP) && MOLTRACE_HAS_OPENMP
  #include <omp.h>
#endif

namespace moltrace::pipeline {

// Worker count for a requested value; 0 means all hardware threads.
inline int resolve_threads(int requested) {
#if defined(MOLTRACE_HAS_OPENMP) && MOLTRACE_HAS_OPENMP
  if (requested > 0) return requested;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<int>(hw) : omp_get_max_threads();
#else
  (void)requested;
  return 1;
#endif
}

// Applies fn to every item on up to `threads` workers and returns the results
// in item order, whatever order the workers finish in.
//
// Failure is fail-fast: once an item throws, items with a higher index that
// have not started are skipped. Lower-index items still run, so the exception
// rethrown after the batch is always that of the lowest-index failing item.
// fn must be safe to call concurrently.
template <class Item, class Fn>
auto parallel_map_ordered(const std::vector<Item>& items, Fn&& fn, int threads)
    -> std::vector<std::invoke_result_t<Fn&, const Item&>> {
  using Result = std::invoke_result_t<Fn&, const Item&>;
  const std::size_t n = items.size();
  std::vector<std::optional<Result>> slots(n);

#if defined(MOLTRACE_HAS_OPENMP) && MOLTRACE_HAS_OPENMP
  std::exception_ptr first_error;
  std::atomic<std::size_t> first_error_idx{n};
  const int nt = threads > 0 ? threads : 1;

  #pragma omp parallel for schedule(dynamic, 1) num_threads(nt)
  for (std::int64_t ii = 0; ii < static_cast<std::int64_t>(n); ++ii) {
    const std::size_t i = static_cast<std::size_t>(ii);
    if (i > first_error_idx.load(std::memory_order_relaxed)) continue;
    try {
      slots[i].emplace(fn(items[i]));
    } catch (...) {
      // Exceptions must not escape an OpenMP region; keep the earliest and rethrow below.
      #pragma omp critical(moltrace_first_error)
      {
        if (i < first_error_idx.load(std::memory_order_relaxed)) {
          first_error = std::current_exception();
          first_error_idx.store(i, std::memory_order_relaxed);
        }
      }
    }
  }
  if (first_error) std::rethrow_exception(first_error);
#else
  (void)threads;
  for (std::size_t i = 0; i < n; ++i) {
    slots[i].emplace(fn(items[i]));
  }
#endif

  std::vector<Result> out;
  out.reserve(n);
  for (auto& s : slots) out.push_back(std::move(*s));
  return out;
}

} // namespace moltrace::pipeline
