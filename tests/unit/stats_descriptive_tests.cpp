#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <iostream>
#include <vector>

#include "microbench/stats/stats.hpp"

namespace {

bool close(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps * std::max(1.0, std::fabs(b)); }

std::vector<double> random_set(uint64_t seed, size_t n) {
  std::vector<double> out;
  out.reserve(n);
  uint64_t s = seed;
  for (size_t i = 0; i < n; ++i) {
    out.push_back(static_cast<double>(microbench::xorshift64(s) % 100'000) / 7.0);
  }
  return out;
}

bool test_known_values() {
  const std::vector<double> v{2, 4, 4, 4, 5, 5, 7, 9};
  if (!close(microbench::mean(v), 5.0)) {
    std::cerr << std::format("mean mismatch: {}\n", microbench::mean(v));
    return false;
  }
  if (!close(microbench::variance(v), 32.0 / 7.0)) {
    std::cerr << std::format("bessel variance mismatch: {}\n", microbench::variance(v));
    return false;
  }
  if (!close(microbench::std_dev(v), std::sqrt(32.0 / 7.0))) {
    std::cerr << std::format("std_dev mismatch: {}\n", microbench::std_dev(v));
    return false;
  }
  return true;
}

bool test_variance_properties() {
  for (uint64_t seed = 1; seed <= 50; ++seed) {
    const auto v = random_set(seed * 7919, 2 + seed);
    const auto d = microbench::describe(v);
    if (d.variance < 0.0) {
      std::cerr << std::format("negative variance for seed {}\n", seed);
      return false;
    }
    if (!close(d.std_dev, std::sqrt(d.variance))) {
      std::cerr << std::format("std_dev != sqrt(variance) for seed {}\n", seed);
      return false;
    }
  }
  const std::vector<double> flat{3, 3, 3};
  if (microbench::variance(flat) != 0.0) {
    std::cerr << std::format("constant set must have zero variance\n");
    return false;
  }
  return true;
}

bool test_quantile_extremes() {
  for (uint64_t seed = 1; seed <= 30; ++seed) {
    const auto v = random_set(seed * 104729, 1 + seed);
    const auto d = microbench::describe(v);
    if (microbench::quantile(v, 0.0) != d.min || microbench::quantile(v, 1.0) != d.max) {
      std::cerr << std::format("quantile(0)/quantile(1) != min/max for seed {}\n", seed);
      return false;
    }
    if (d.min > d.q1 || d.q1 > d.median || d.median > d.q3 || d.q3 > d.max) {
      std::cerr << std::format("quantiles out of order for seed {}\n", seed);
      return false;
    }
  }
  return true;
}

bool test_median_odd_even() {
  if (!close(microbench::quantile({5, 1, 3}, 0.5), 3.0)) {
    std::cerr << std::format("odd median mismatch\n");
    return false;
  }
  if (!close(microbench::quantile({4, 1, 3, 2}, 0.5), 2.5)) {
    std::cerr << std::format("even median mismatch\n");
    return false;
  }
  // i = 0.25 * 4 = 1 -> exact index; i = 0.1 * 4 = 0.4 -> interpolated.
  const std::vector<double> sorted{10, 20, 30, 40, 50};
  if (!close(microbench::quantile_sorted(sorted, 0.25), 20.0) ||
      !close(microbench::quantile_sorted(sorted, 0.1), 14.0)) {
    std::cerr << std::format("linear interpolation mismatch\n");
    return false;
  }
  return true;
}

bool test_degenerate_inputs() {
  const std::vector<double> empty{};
  const std::vector<double> one{42.0};
  if (microbench::mean(empty) != 0.0 || microbench::quantile_sorted(empty, 0.5) != 0.0) {
    std::cerr << std::format("empty input must yield zero\n");
    return false;
  }
  if (microbench::variance(one) != 0.0 || microbench::quantile_sorted(one, 0.7) != 42.0) {
    std::cerr << std::format("single value mishandled\n");
    return false;
  }
  if (microbench::quantile_sorted(std::vector<double>{1, 2}, 2.0) != 2.0) {
    std::cerr << std::format("p above 1 must clamp to max\n");
    return false;
  }
  return true;
}

bool test_outlier_variance_bounds() {
  const std::vector<double> quiet{100, 100.1, 99.9, 100.05, 99.95, 100.02, 99.98, 100.01};
  const auto dq = microbench::describe(quiet);
  const double fq = microbench::outlier_variance(dq.mean, dq.std_dev, quiet.size());

  const std::vector<double> noisy{100, 101, 99, 100, 400, 100, 98, 102, 100, 900};
  const auto dn = microbench::describe(noisy);
  const double fn = microbench::outlier_variance(dn.mean, dn.std_dev, noisy.size());

  if (fq < 0.0 || fq > 1.0 || fn < 0.0 || fn > 1.0) {
    std::cerr << std::format("outlier variance out of [0,1]: {} {}\n", fq, fn);
    return false;
  }
  if (microbench::outlier_variance(5.0, 0.0, 10) != 0.0) {
    std::cerr << std::format("zero spread must yield zero outlier variance\n");
    return false;
  }
  if (microbench::classify_noise(0.005) != microbench::NoiseClass::Unaffected ||
      microbench::classify_noise(0.05) != microbench::NoiseClass::Slight ||
      microbench::classify_noise(0.3) != microbench::NoiseClass::Moderate ||
      microbench::classify_noise(0.9) != microbench::NoiseClass::Severe) {
    std::cerr << std::format("noise classification bands wrong\n");
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_known_values()) {
    return 1;
  }
  if (!test_variance_properties()) {
    return 1;
  }
  if (!test_quantile_extremes()) {
    return 1;
  }
  if (!test_median_odd_even()) {
    return 1;
  }
  if (!test_degenerate_inputs()) {
    return 1;
  }
  if (!test_outlier_variance_bounds()) {
    return 1;
  }
  return 0;
}
