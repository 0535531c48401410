#pragma once

#include <any>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace microbench {

// All internal arithmetic is done in nanoseconds held as double.
using Duration = std::chrono::duration<double, std::nano>;
using SampleSet = std::vector<Duration>;

enum class Phase { Idle, Calibrating, WarmingUp, Planning, Sampling, Finalizing, Done };

enum class Warning : uint8_t {
  UnmeasurableExecution,
  CostDrift,
  FewResamples,
};

enum class NoiseClass { Unaffected, Slight, Moderate, Severe };

struct BenchmarkConfig {
  Duration warmup_duration{std::chrono::milliseconds(100)};
  Duration target_sample_duration{std::chrono::milliseconds(1)};
  uint32_t sample_count{100};
  bool enable_quiescence_before_sample{true};
  double confidence_level{0.95};
  uint32_t bootstrap_resample_count{10'000};
  std::optional<Duration> pinned_overhead{};

  uint64_t warmup_max_executions{1'000'000};
  uint64_t min_batch_size{1000};
  uint64_t max_batch_size{1ULL << 30};
  uint32_t initial_estimate_runs{10};
  Duration quiescence_settle{std::chrono::milliseconds(1)};
  uint64_t bootstrap_seed{1};
};

struct OverheadEstimate {
  Duration per_invocation{};
  uint64_t invocations{};
  Duration calibration_elapsed{};
  bool pinned{false};
};

struct WarmupSummary {
  uint64_t executions{};
  Duration elapsed{};
};

struct BatchPlan {
  uint64_t batch_size{1};
  Duration initial_estimate{};
  Duration refined_estimate{};
  bool measurable{true};
};

struct DescriptiveStats {
  double mean{};
  double variance{};
  double std_dev{};
  double min{};
  double q1{};
  double median{};
  double q3{};
  double max{};
};

struct OutlierCounts {
  uint32_t low_severe{};
  uint32_t low_mild{};
  uint32_t none{};
  uint32_t high_mild{};
  uint32_t high_severe{};

  uint32_t total() const noexcept { return low_severe + low_mild + none + high_mild + high_severe; }
  uint32_t outliers() const noexcept { return low_severe + low_mild + high_mild + high_severe; }
};

struct BootstrapEstimate {
  double point{};
  double lower_bound{};
  double upper_bound{};
  double confidence_level{};
};

struct BenchmarkResult {
  BenchmarkConfig config{};
  SampleSet samples{};
  uint64_t batch_size{};
  WarmupSummary warmup{};
  OverheadEstimate overhead{};

  DescriptiveStats stats{};
  OutlierCounts outliers{};
  BootstrapEstimate mean{};
  BootstrapEstimate variance{};
  double outlier_variance{};

  Duration final_quiescence{};
  uint64_t sink_digest{};
  std::vector<Warning> warnings{};
  std::any environment{};

  bool has_warning(Warning w) const noexcept {
    for (const auto x : warnings) {
      if (x == w) {
        return true;
      }
    }
    return false;
  }
};

const char* phase_name(Phase phase) noexcept;
const char* warning_name(Warning warning) noexcept;
const char* noise_class_name(NoiseClass noise) noexcept;

}  // namespace microbench
