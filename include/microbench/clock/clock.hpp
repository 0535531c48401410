#pragma once

#include <chrono>
#include <utility>

#include "microbench/core/types.hpp"

namespace microbench {

// Monotonic source; unaffected by wall-clock adjustments.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

static_assert(Clock::is_steady, "benchmark clock must be monotonic");

inline TimePoint now() noexcept { return Clock::now(); }

inline Duration elapsed_between(TimePoint start, TimePoint end) noexcept {
  return std::chrono::duration_cast<Duration>(end - start);
}

// Runs block exactly once and returns its wall-clock elapsed time.
template <typename Block>
Duration measure(Block&& block) {
  const auto start = Clock::now();
  std::forward<Block>(block)();
  const auto end = Clock::now();
  return elapsed_between(start, end);
}

// Mean of the positive deltas between k+1 consecutive clock reads.
Duration estimate_resolution(int k);

// estimate_resolution(1000), computed once per process.
Duration clock_resolution();

}  // namespace microbench
