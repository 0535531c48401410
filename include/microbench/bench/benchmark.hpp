#pragma once

#include <any>
#include <exception>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "microbench/calibration/overhead.hpp"
#include "microbench/core/error.hpp"
#include "microbench/core/expected.hpp"
#include "microbench/core/types.hpp"
#include "microbench/planner/planner.hpp"
#include "microbench/quiescence/quiescence.hpp"
#include "microbench/runner/runner.hpp"
#include "microbench/runner/sink.hpp"
#include "microbench/warmup/warmup.hpp"

namespace microbench {

Expected<void> validate(const BenchmarkConfig& cfg) noexcept;

struct RawRun {
  SampleSet samples{};
  BatchPlan plan{};
  WarmupSummary warmup{};
  OverheadEstimate overhead{};
  Duration final_quiescence{};
  uint64_t sink_digest{};
};

// Runs the statistics engine over a completed run and assembles the result.
BenchmarkResult assemble_result(const BenchmarkConfig& cfg, RawRun run, std::any environment);

// One measurement of one computation:
//   Idle -> Calibrating (overhead unknown) -> WarmingUp -> Planning
//        -> Sampling -> Finalizing -> Done
// An instance runs once. The process-wide overhead estimate outlives it.
template <typename Fn>
class Benchmark {
 public:
  Benchmark(BenchmarkConfig cfg,
            Fn fn,
            IQuiescence* quiescence = nullptr,
            OverheadCalibrator* calibrator = nullptr)
      : cfg_(std::move(cfg)),
        fn_(std::move(fn)),
        quiescence_(quiescence),
        calibrator_(calibrator != nullptr ? calibrator : &OverheadCalibrator::instance()) {}

  Benchmark(const Benchmark&) = delete;
  Benchmark& operator=(const Benchmark&) = delete;

  Phase state() const noexcept { return state_; }

  // Throws Error{InvalidConfiguration} before measuring anything, and
  // Error{ComputationFailure} (original exception nested) if fn throws.
  BenchmarkResult run(std::any environment = {}) {
    if (state_ != Phase::Idle) {
      throw Error{ErrorCode::Internal, "benchmark instance has already run"};
    }
    if (auto ok = validate(cfg_); !ok) {
      throw ok.error();
    }

    std::unique_ptr<IQuiescence> owned_quiescence;
    if (quiescence_ == nullptr) {
      owned_quiescence = make_quiescence(cfg_.quiescence_settle);
    }
    IQuiescence& quiescence = quiescence_ != nullptr ? *quiescence_ : *owned_quiescence;

    RawRun raw{};
    raw.overhead = resolve_overhead();

    ResultSink sink(cfg_.bootstrap_seed);
    try {
      state_ = Phase::WarmingUp;
      raw.warmup = warm_up(fn_, cfg_.warmup_duration, cfg_.warmup_max_executions, sink);

      state_ = Phase::Planning;
      raw.plan = plan_batches(fn_, cfg_, raw.overhead.per_invocation, sink);

      state_ = Phase::Sampling;
      raw.samples.reserve(cfg_.sample_count);
      for (uint32_t i = 0; i < cfg_.sample_count; ++i) {
        if (cfg_.enable_quiescence_before_sample) {
          static_cast<void>(quiescence.request_quiescence());
        }
        const Duration elapsed = run_batch(fn_, raw.plan.batch_size, sink);
        raw.samples.push_back(make_sample(elapsed, raw.overhead.per_invocation, raw.plan.batch_size));
      }
    } catch (const std::exception& ex) {
      std::throw_with_nested(
          Error{ErrorCode::ComputationFailure,
                std::string("computation failed while ") + phase_name(state_) + ": " + ex.what()});
    }

    state_ = Phase::Finalizing;
    raw.final_quiescence = quiescence.request_quiescence();
    raw.sink_digest = sink.digest();

    auto result = assemble_result(cfg_, std::move(raw), std::move(environment));
    state_ = Phase::Done;
    return result;
  }

 private:
  OverheadEstimate resolve_overhead() {
    if (cfg_.pinned_overhead.has_value()) {
      OverheadEstimate pinned{};
      pinned.per_invocation = *cfg_.pinned_overhead;
      pinned.pinned = true;
      return pinned;
    }
    if (!calibrator_->cached()) {
      state_ = Phase::Calibrating;
    }
    return *calibrator_->current();
  }

  BenchmarkConfig cfg_{};
  Fn fn_;
  IQuiescence* quiescence_{nullptr};
  OverheadCalibrator* calibrator_{nullptr};
  Phase state_{Phase::Idle};
};

template <typename Fn>
BenchmarkResult run_benchmark(const BenchmarkConfig& cfg, Fn&& fn, std::any environment = {}) {
  Benchmark<std::decay_t<Fn>> bench(cfg, std::forward<Fn>(fn));
  return bench.run(std::move(environment));
}

}  // namespace microbench
