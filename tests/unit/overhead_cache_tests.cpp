#include <cstdint>
#include <format>
#include <iostream>
#include <thread>
#include <vector>

#include "microbench/calibration/overhead.hpp"

namespace {

using microbench::Duration;

microbench::CalibrationParams small_params() {
  microbench::CalibrationParams p{};
  p.invocations_per_round = 10'000;
  p.rounds = 3;
  return p;
}

bool test_lazy_and_shared() {
  microbench::OverheadCalibrator cal(small_params());
  if (cal.cached() || cal.calibrations() != 0) {
    std::cerr << std::format("calibrator should start empty\n");
    return false;
  }
  const auto a = cal.current();
  const auto b = cal.current();
  if (a.get() != b.get()) {
    std::cerr << std::format("repeated current() returned different objects\n");
    return false;
  }
  if (cal.calibrations() != 1) {
    std::cerr << std::format("calibrated {} times\n", cal.calibrations());
    return false;
  }
  if (a->per_invocation.count() < 0.0 || a->invocations != 30'000) {
    std::cerr << std::format("bad estimate: {} ns over {}\n", a->per_invocation.count(), a->invocations);
    return false;
  }
  return true;
}

bool test_concurrent_first_use() {
  microbench::OverheadCalibrator cal(small_params());
  std::vector<const microbench::OverheadEstimate*> seen(8, nullptr);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < seen.size(); ++i) {
    threads.emplace_back([&cal, &seen, i] { seen[i] = cal.current().get(); });
  }
  for (auto& t : threads) {
    t.join();
  }
  for (const auto* p : seen) {
    if (p != seen.front()) {
      std::cerr << std::format("threads observed different estimates\n");
      return false;
    }
  }
  return cal.calibrations() == 1;
}

bool test_invalidate_and_recalibrate() {
  microbench::OverheadCalibrator cal(small_params());
  const auto first = cal.current();
  if (!cal.invalidate() || cal.cached()) {
    std::cerr << std::format("invalidate did not clear the cache\n");
    return false;
  }
  const auto second = cal.current();
  if (second.get() == first.get() || cal.calibrations() != 2) {
    std::cerr << std::format("current() after invalidate did not recompute\n");
    return false;
  }
  const auto third = cal.recalibrate();
  if (third.get() == second.get() || cal.calibrations() != 3 || cal.current().get() != third.get()) {
    std::cerr << std::format("recalibrate did not replace the estimate\n");
    return false;
  }
  return true;
}

bool test_pinning() {
  microbench::OverheadCalibrator cal(small_params());
  const auto pinned = cal.set(Duration{3.5});
  if (!cal.pinned() || !pinned->pinned || pinned->per_invocation.count() != 3.5) {
    std::cerr << std::format("set did not pin 3.5 ns\n");
    return false;
  }
  if (cal.current().get() != pinned.get()) {
    std::cerr << std::format("current() ignored the pinned value\n");
    return false;
  }
  if (cal.invalidate()) {
    std::cerr << std::format("invalidate should be refused while pinned\n");
    return false;
  }
  if (cal.recalibrate().get() != pinned.get() || cal.calibrations() != 0) {
    std::cerr << std::format("recalibrate should be a no-op while pinned\n");
    return false;
  }

  cal.unpin();
  if (cal.pinned() || cal.current().get() != pinned.get()) {
    std::cerr << std::format("unpin should keep the value until invalidated\n");
    return false;
  }
  if (!cal.invalidate() || cal.current()->pinned || cal.calibrations() != 1) {
    std::cerr << std::format("invalidate after unpin should recalibrate\n");
    return false;
  }

  const auto clamped = cal.set(Duration{-1.0});
  return clamped->per_invocation.count() == 0.0;
}

bool test_process_wide_instance() {
  auto& a = microbench::OverheadCalibrator::instance();
  auto& b = microbench::OverheadCalibrator::instance();
  if (&a != &b) {
    std::cerr << std::format("instance() is not a singleton\n");
    return false;
  }
  a.set(Duration{1.25});
  if (microbench::estimate_overhead().count() != 1.25) {
    std::cerr << std::format("estimate_overhead does not read the process-wide cache\n");
    return false;
  }
  a.unpin();
  return true;
}

bool test_degenerate_params() {
  microbench::CalibrationParams p{};
  p.rounds = 0;
  const auto e = microbench::measure_overhead(p);
  return e.per_invocation.count() == 0.0 && e.invocations == 0;
}

}  // namespace

int main() {
  if (!test_lazy_and_shared()) {
    return 1;
  }
  if (!test_concurrent_first_use()) {
    return 1;
  }
  if (!test_invalidate_and_recalibrate()) {
    return 1;
  }
  if (!test_pinning()) {
    return 1;
  }
  if (!test_process_wide_instance()) {
    return 1;
  }
  if (!test_degenerate_params()) {
    return 1;
  }
  return 0;
}
