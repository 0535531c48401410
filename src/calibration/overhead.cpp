#include "microbench/calibration/overhead.hpp"

#include <cmath>
#include <format>
#include <mutex>

#include "microbench/core/log.hpp"
#include "microbench/runner/runner.hpp"
#include "microbench/runner/sink.hpp"

namespace microbench {
namespace {

uint64_t noop_value(uint64_t& state) noexcept { return ++state; }

}  // namespace

OverheadEstimate measure_overhead(const CalibrationParams& params) {
  OverheadEstimate out{};
  if (params.invocations_per_round == 0 || params.rounds == 0) {
    return out;
  }

  ResultSink sink(0);
  uint64_t state = 0;
  auto noop = [&state]() noexcept { return noop_value(state); };

  // One untimed pass so the first round does not pay for page faults.
  static_cast<void>(run_batch(noop, params.invocations_per_round, sink));

  Duration total{0.0};
  for (uint32_t r = 0; r < params.rounds; ++r) {
    total += run_batch(noop, params.invocations_per_round, sink);
  }

  const uint64_t invocations = params.invocations_per_round * params.rounds;
  out.invocations = invocations;
  out.calibration_elapsed = total;
  const double per = total.count() / static_cast<double>(invocations);
  if (!std::isfinite(per) || per < 0.0) {
    log_debug(std::format("overhead calibration produced {} ns; using 0", per));
    out.per_invocation = Duration{0.0};
  } else {
    out.per_invocation = Duration{per};
  }
  escape(sink);
  return out;
}

OverheadCalibrator::OverheadCalibrator(CalibrationParams params) : params_(params) {}

OverheadCalibrator& OverheadCalibrator::instance() {
  static OverheadCalibrator calibrator{};
  return calibrator;
}

std::shared_ptr<const OverheadEstimate> OverheadCalibrator::current() {
  {
    std::shared_lock lock(mu_);
    if (value_) {
      return value_;
    }
  }
  std::unique_lock lock(mu_);
  if (value_) {
    return value_;
  }
  return calibrate_locked();
}

std::shared_ptr<const OverheadEstimate> OverheadCalibrator::cached() const {
  std::shared_lock lock(mu_);
  return value_;
}

bool OverheadCalibrator::invalidate() {
  std::unique_lock lock(mu_);
  if (pinned_) {
    log_debug("overhead is pinned; invalidate ignored");
    return false;
  }
  value_.reset();
  return true;
}

std::shared_ptr<const OverheadEstimate> OverheadCalibrator::recalibrate() {
  std::unique_lock lock(mu_);
  if (pinned_) {
    log_debug("overhead is pinned; recalibrate ignored");
    return value_;
  }
  return calibrate_locked();
}

std::shared_ptr<const OverheadEstimate> OverheadCalibrator::set(Duration per_invocation) {
  OverheadEstimate e{};
  e.per_invocation = per_invocation.count() < 0.0 ? Duration{0.0} : per_invocation;
  e.pinned = true;
  auto value = std::make_shared<const OverheadEstimate>(e);

  std::unique_lock lock(mu_);
  value_ = value;
  pinned_ = true;
  return value;
}

void OverheadCalibrator::unpin() {
  std::unique_lock lock(mu_);
  pinned_ = false;
}

bool OverheadCalibrator::pinned() const {
  std::shared_lock lock(mu_);
  return pinned_;
}

uint64_t OverheadCalibrator::calibrations() const {
  std::shared_lock lock(mu_);
  return calibrations_;
}

std::shared_ptr<const OverheadEstimate> OverheadCalibrator::calibrate_locked() {
  const auto estimate = measure_overhead(params_);
  ++calibrations_;
  log_info(std::format("calibrated overhead: {:.4f} ns/invocation over {} invocations",
                       estimate.per_invocation.count(), estimate.invocations));
  value_ = std::make_shared<const OverheadEstimate>(estimate);
  return value_;
}

Duration estimate_overhead() { return OverheadCalibrator::instance().current()->per_invocation; }

}  // namespace microbench
