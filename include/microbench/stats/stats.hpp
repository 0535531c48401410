#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "microbench/core/expected.hpp"
#include "microbench/core/types.hpp"

namespace microbench {

enum class Statistic { Mean, Variance };

uint64_t xorshift64(uint64_t& s) noexcept;

std::vector<double> to_nanoseconds(const SampleSet& samples);

double mean(std::span<const double> values) noexcept;

// Bessel-corrected (n - 1). Zero for fewer than two values.
double variance(std::span<const double> values) noexcept;
double std_dev(std::span<const double> values) noexcept;
double compute(Statistic statistic, std::span<const double> values) noexcept;

// Linear interpolation between the floor and ceil of p * (len - 1) over
// already sorted values. p is clamped to [0, 1]; empty input yields 0.
double quantile_sorted(std::span<const double> sorted, double p) noexcept;
double quantile(std::vector<double> values, double p);

DescriptiveStats describe(std::span<const double> values);

// Tukey fences at 1.5 and 3 IQR around Q1/Q3. Samples are only counted,
// never dropped.
OutlierCounts classify_outliers(std::span<const double> values);

// Fraction of the variance explained by outliers, in [0, 1].
double outlier_variance(double mean, double std_dev, size_t n) noexcept;
NoiseClass classify_noise(double outlier_variance_fraction) noexcept;

Expected<void> validate_confidence(double confidence_level) noexcept;

// Percentile bootstrap. Draws resamples with replacement, evaluates
// statistic on each, and reads the bounds at the (1-c)/2 and (1+c)/2
// quantiles of the sorted resampled values. The point estimate is statistic
// on the original data; the bounds are widened to contain it.
template <typename Stat>
Expected<BootstrapEstimate> bootstrap_with(std::span<const double> values,
                                           Stat&& statistic,
                                           uint32_t resamples,
                                           double confidence_level,
                                           uint64_t seed) {
  if (auto ok = validate_confidence(confidence_level); !ok) {
    return std::unexpected(ok.error());
  }
  if (values.empty()) {
    return std::unexpected(Error{ErrorCode::InvalidConfiguration, "bootstrap needs at least one sample"});
  }
  if (resamples == 0) {
    return std::unexpected(Error{ErrorCode::InvalidConfiguration, "bootstrap resample count must be > 0"});
  }

  uint64_t state = seed ^ 0x9e3779b97f4a7c15ULL;
  if (state == 0) {
    state = 1;
  }

  const size_t n = values.size();
  std::vector<double> scratch(n);
  std::vector<double> estimates;
  estimates.reserve(resamples);
  for (uint32_t b = 0; b < resamples; ++b) {
    for (size_t i = 0; i < n; ++i) {
      scratch[i] = values[static_cast<size_t>(xorshift64(state) % n)];
    }
    estimates.push_back(statistic(std::span<const double>(scratch)));
  }
  std::sort(estimates.begin(), estimates.end());

  BootstrapEstimate out{};
  out.point = statistic(values);
  out.confidence_level = confidence_level;
  out.lower_bound = std::min(out.point, quantile_sorted(estimates, (1.0 - confidence_level) / 2.0));
  out.upper_bound = std::max(out.point, quantile_sorted(estimates, (1.0 + confidence_level) / 2.0));
  return out;
}

Expected<BootstrapEstimate> bootstrap(std::span<const double> values,
                                      Statistic statistic,
                                      uint32_t resamples,
                                      double confidence_level,
                                      uint64_t seed);

}  // namespace microbench
