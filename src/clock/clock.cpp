#include "microbench/clock/clock.hpp"

#include <cstdint>

namespace microbench {

Duration estimate_resolution(int k) {
  if (k < 1) {
    k = 1;
  }
  // A coarse clock repeats readings; keep reading until k ticks were seen.
  const uint64_t max_reads = static_cast<uint64_t>(k) * 1000;

  double sum = 0.0;
  int ticks = 0;
  auto prev = Clock::now();
  for (uint64_t reads = 0; ticks < k && reads < max_reads; ++reads) {
    const auto cur = Clock::now();
    const double delta = elapsed_between(prev, cur).count();
    if (delta > 0.0) {
      sum += delta;
      ++ticks;
    }
    prev = cur;
  }
  if (ticks == 0) {
    return Duration{1.0};
  }
  return Duration{sum / static_cast<double>(ticks)};
}

Duration clock_resolution() {
  static const Duration resolution = estimate_resolution(1000);
  return resolution;
}

}  // namespace microbench
