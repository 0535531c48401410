#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

#include "microbench/clock/clock.hpp"
#include "microbench/core/types.hpp"
#include "microbench/runner/runner.hpp"
#include "microbench/runner/sink.hpp"
#include "microbench/stats/stats.hpp"

namespace microbench {

struct PlannerLimits {
  uint64_t min_batch{1000};
  uint64_t max_batch{1ULL << 30};
};

// n = max(1, round(target / estimate)), clamped to limits.max_batch. An
// estimate that is zero, negative or not finite selects limits.min_batch.
uint64_t plan_batch_size(Duration estimate, Duration target, const PlannerLimits& limits);
uint64_t plan_batch_size(Duration estimate, Duration target);

// True when observed and planned per-execution costs differ by more than factor.
bool cost_drifted(Duration planned, Duration observed, double factor = 4.0) noexcept;

// Picks the batch size used for every sample of a run.
//
// The initial estimate is the median of initial_estimate_runs single
// executions, less one clock read and the per-invocation overhead. One probe
// batch of the resulting size refines it. When that probe cannot be told apart
// from the clock resolution, a second probe runs at min_batch_size; the plan is
// marked unmeasurable only if that one fails too.
template <typename Fn>
BatchPlan plan_batches(Fn& fn, const BenchmarkConfig& cfg, Duration overhead, ResultSink& sink) {
  const PlannerLimits limits{cfg.min_batch_size, cfg.max_batch_size};
  const Duration resolution = clock_resolution();
  const Duration target = cfg.target_sample_duration;

  std::vector<double> singles;
  singles.reserve(std::max<uint32_t>(1, cfg.initial_estimate_runs));
  for (uint32_t i = 0; i < std::max<uint32_t>(1, cfg.initial_estimate_runs); ++i) {
    const Duration elapsed = run_batch(fn, 1, sink);
    singles.push_back(std::max(0.0, elapsed.count() - resolution.count() - overhead.count()));
  }
  std::sort(singles.begin(), singles.end());

  BatchPlan plan{};
  plan.initial_estimate = Duration{quantile_sorted(singles, 0.5)};
  const uint64_t n0 = plan_batch_size(plan.initial_estimate, target, limits);

  const auto probe_corrected = [&](uint64_t n) {
    const Duration probe = run_batch(fn, n, sink);
    return probe.count() - resolution.count() - overhead.count() * static_cast<double>(n);
  };

  const double corrected = probe_corrected(n0);
  if (corrected > resolution.count()) {
    plan.refined_estimate = Duration{corrected / static_cast<double>(n0)};
    plan.batch_size = plan_batch_size(plan.refined_estimate, target, limits);
    return plan;
  }

  // n0 was too short to time. Fall back to min_batch, and only give up when
  // that is indistinguishable from the clock as well.
  const uint64_t fallback = std::min(std::max(n0, limits.min_batch), limits.max_batch);
  const double fallback_corrected = fallback == n0 ? corrected : probe_corrected(fallback);
  plan.refined_estimate = Duration{std::max(0.0, fallback_corrected) / static_cast<double>(fallback)};
  if (fallback_corrected <= resolution.count()) {
    plan.measurable = false;
    plan.batch_size = fallback;
    return plan;
  }
  // Batches shorter than the fallback already proved too short to time.
  plan.batch_size = std::min(std::max(plan_batch_size(plan.refined_estimate, target, limits), fallback),
                             limits.max_batch);
  return plan;
}

}  // namespace microbench
