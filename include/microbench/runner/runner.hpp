#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <type_traits>

#include "microbench/clock/clock.hpp"
#include "microbench/core/types.hpp"
#include "microbench/runner/sink.hpp"

namespace microbench {

// Invokes fn n times inside a single timed region and returns the raw
// elapsed time of the whole batch. Overhead is not subtracted here.
// Each result is escaped inside the loop; the last one is kept in sink
// once the clock has been read.
template <typename Fn>
Duration run_batch(Fn& fn, uint64_t n, ResultSink& sink) {
  using R = std::invoke_result_t<Fn&>;
  if (n == 0) {
    return Duration{0.0};
  }

  if constexpr (std::is_void_v<R>) {
    const auto start = Clock::now();
    for (uint64_t i = 0; i < n; ++i) {
      std::invoke(fn);
      clobber_memory();
    }
    const auto end = Clock::now();
    sink.note_void(n);
    return elapsed_between(start, end);
  } else {
    const auto start = Clock::now();
    for (uint64_t i = 1; i < n; ++i) {
      decltype(auto) r = std::invoke(fn);
      escape(r);
    }
    decltype(auto) last = std::invoke(fn);
    escape(last);
    const auto end = Clock::now();
    sink.keep(last);
    return elapsed_between(start, end);
  }
}

// Overhead-corrected per-execution time of one batch, floored at zero.
inline Duration make_sample(Duration elapsed, Duration overhead_per_invocation, uint64_t n) noexcept {
  if (n == 0) {
    return Duration{0.0};
  }
  const double count = static_cast<double>(n);
  const double corrected = (elapsed.count() - overhead_per_invocation.count() * count) / count;
  return Duration{std::max(0.0, corrected)};
}

}  // namespace microbench
