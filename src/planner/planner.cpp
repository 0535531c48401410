#include "microbench/planner/planner.hpp"

#include <cmath>

namespace microbench {

uint64_t plan_batch_size(Duration estimate, Duration target, const PlannerLimits& limits) {
  const uint64_t max_batch = std::max<uint64_t>(1, limits.max_batch);
  const double e = estimate.count();
  if (!std::isfinite(e) || e <= 0.0) {
    return std::min(std::max<uint64_t>(1, limits.min_batch), max_batch);
  }

  const double ratio = target.count() / e;
  if (!std::isfinite(ratio) || ratio >= static_cast<double>(max_batch)) {
    return max_batch;
  }
  const auto n = static_cast<uint64_t>(std::llround(std::max(0.0, ratio)));
  return std::min(std::max<uint64_t>(1, n), max_batch);
}

uint64_t plan_batch_size(Duration estimate, Duration target) {
  return plan_batch_size(estimate, target, PlannerLimits{});
}

bool cost_drifted(Duration planned, Duration observed, double factor) noexcept {
  const double p = planned.count();
  const double o = observed.count();
  if (p <= 0.0 || o <= 0.0 || factor <= 1.0) {
    return false;
  }
  return o > p * factor || o * factor < p;
}

}  // namespace microbench
