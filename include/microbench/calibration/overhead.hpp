#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>

#include "microbench/core/types.hpp"

namespace microbench {

struct CalibrationParams {
  uint64_t invocations_per_round{1'000'000};
  uint32_t rounds{10};
};

// Times params.rounds batches of no-op invocations through run_batch and
// returns the mean per-invocation cost. Never throws on a bad measurement;
// the estimate degrades to zero instead.
OverheadEstimate measure_overhead(const CalibrationParams& params);

// Process-wide, read-mostly cache of the per-invocation overhead.
//
// current() computes the estimate lazily on first use and hands out the same
// object until it is invalidated. set() pins a caller-chosen value; while
// pinned, invalidate() and recalibrate() leave the cache untouched and
// current() never recomputes. unpin() restores automatic recomputation.
class OverheadCalibrator {
 public:
  explicit OverheadCalibrator(CalibrationParams params = {});

  OverheadCalibrator(const OverheadCalibrator&) = delete;
  OverheadCalibrator& operator=(const OverheadCalibrator&) = delete;

  static OverheadCalibrator& instance();

  std::shared_ptr<const OverheadEstimate> current();
  std::shared_ptr<const OverheadEstimate> cached() const;

  bool invalidate();
  std::shared_ptr<const OverheadEstimate> recalibrate();

  std::shared_ptr<const OverheadEstimate> set(Duration per_invocation);
  void unpin();
  bool pinned() const;

  uint64_t calibrations() const;

 private:
  std::shared_ptr<const OverheadEstimate> calibrate_locked();

  CalibrationParams params_{};
  mutable std::shared_mutex mu_;
  std::shared_ptr<const OverheadEstimate> value_{};
  bool pinned_{false};
  uint64_t calibrations_{0};
};

// Shorthand for OverheadCalibrator::instance().current()->per_invocation.
Duration estimate_overhead();

}  // namespace microbench
