#pragma once

#include <cstdint>

#include "microbench/core/types.hpp"
#include "microbench/runner/runner.hpp"
#include "microbench/runner/sink.hpp"

namespace microbench {

// Runs fn one execution at a time until the accumulated elapsed time reaches
// warmup_duration or max_executions have run. A zero duration skips the
// phase. A computation slower than the whole budget runs exactly once.
//
// Only lets caches, branch predictors and allocator pools settle; the
// timings are discarded. On ahead-of-time compiled code the effect is
// usually small.
template <typename Fn>
WarmupSummary warm_up(Fn& fn, Duration warmup_duration, uint64_t max_executions, ResultSink& sink) {
  WarmupSummary out{};
  if (warmup_duration.count() <= 0.0 || max_executions == 0) {
    return out;
  }
  while (out.elapsed < warmup_duration && out.executions < max_executions) {
    out.elapsed += run_batch(fn, 1, sink);
    ++out.executions;
  }
  return out;
}

}  // namespace microbench
