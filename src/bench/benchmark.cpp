#include "microbench/bench/benchmark.hpp"

#include <cmath>
#include <format>

#include "microbench/core/log.hpp"
#include "microbench/stats/stats.hpp"

namespace microbench {
namespace {

constexpr uint32_t kRecommendedResamples = 1000;

Error invalid(std::string message) { return Error{ErrorCode::InvalidConfiguration, std::move(message)}; }

bool finite_non_negative(Duration d) { return std::isfinite(d.count()) && d.count() >= 0.0; }

void add_warning(BenchmarkResult& result, Warning w, const std::string& detail) {
  if (!result.has_warning(w)) {
    result.warnings.push_back(w);
  }
  log_warn(std::format("{}: {}", warning_name(w), detail));
}

}  // namespace

Expected<void> validate(const BenchmarkConfig& cfg) noexcept {
  if (cfg.sample_count < 2) {
    return std::unexpected(invalid("sample_count must be >= 2"));
  }
  if (!std::isfinite(cfg.target_sample_duration.count()) || cfg.target_sample_duration.count() <= 0.0) {
    return std::unexpected(invalid("target_sample_duration must be > 0"));
  }
  if (!finite_non_negative(cfg.warmup_duration)) {
    return std::unexpected(invalid("warmup_duration must be >= 0"));
  }
  if (auto ok = validate_confidence(cfg.confidence_level); !ok) {
    return std::unexpected(ok.error());
  }
  if (cfg.bootstrap_resample_count == 0) {
    return std::unexpected(invalid("bootstrap_resample_count must be > 0"));
  }
  if (cfg.pinned_overhead.has_value() && !finite_non_negative(*cfg.pinned_overhead)) {
    return std::unexpected(invalid("pinned_overhead must be >= 0"));
  }
  if (cfg.warmup_max_executions == 0) {
    return std::unexpected(invalid("warmup_max_executions must be > 0"));
  }
  if (cfg.min_batch_size == 0) {
    return std::unexpected(invalid("min_batch_size must be > 0"));
  }
  if (cfg.max_batch_size < cfg.min_batch_size) {
    return std::unexpected(invalid("max_batch_size must be >= min_batch_size"));
  }
  if (cfg.initial_estimate_runs == 0) {
    return std::unexpected(invalid("initial_estimate_runs must be > 0"));
  }
  if (!finite_non_negative(cfg.quiescence_settle)) {
    return std::unexpected(invalid("quiescence_settle must be >= 0"));
  }
  return {};
}

BenchmarkResult assemble_result(const BenchmarkConfig& cfg, RawRun run, std::any environment) {
  BenchmarkResult result{};
  result.config = cfg;
  result.batch_size = run.plan.batch_size;
  result.warmup = run.warmup;
  result.overhead = run.overhead;
  result.final_quiescence = run.final_quiescence;
  result.sink_digest = run.sink_digest;
  result.environment = std::move(environment);

  const auto values = to_nanoseconds(run.samples);
  result.stats = describe(values);
  result.outliers = classify_outliers(values);

  auto mean_ci = bootstrap(values, Statistic::Mean, cfg.bootstrap_resample_count, cfg.confidence_level,
                           cfg.bootstrap_seed);
  auto var_ci = bootstrap(values, Statistic::Variance, cfg.bootstrap_resample_count, cfg.confidence_level,
                          cfg.bootstrap_seed);
  if (!mean_ci) {
    throw mean_ci.error();
  }
  if (!var_ci) {
    throw var_ci.error();
  }
  result.mean = *mean_ci;
  result.variance = *var_ci;
  result.outlier_variance = outlier_variance(result.stats.mean, result.stats.std_dev, values.size());
  result.samples = std::move(run.samples);

  if (!run.plan.measurable) {
    add_warning(result, Warning::UnmeasurableExecution,
                std::format("execution time not distinguishable from clock resolution at batch size {}",
                            result.batch_size));
  } else if (cost_drifted(run.plan.refined_estimate, Duration{result.stats.median})) {
    add_warning(result, Warning::CostDrift,
                std::format("planned for {:.3f} ns/exec, observed median {:.3f} ns/exec",
                            run.plan.refined_estimate.count(), result.stats.median));
  }
  if (cfg.bootstrap_resample_count < kRecommendedResamples) {
    add_warning(result, Warning::FewResamples,
                std::format("{} bootstrap resamples; at least {} recommended", cfg.bootstrap_resample_count,
                            kRecommendedResamples));
  }

  log_debug(std::format("benchmark done: batch={} mean={:.3f} ns var={:.3f} ns^2 final_quiescence={:.0f} ns",
                        result.batch_size, result.stats.mean, result.stats.variance,
                        result.final_quiescence.count()));
  return result;
}

}  // namespace microbench
