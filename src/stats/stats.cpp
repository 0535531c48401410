#include "microbench/stats/stats.hpp"

#include <cmath>
#include <numeric>

namespace microbench {

uint64_t xorshift64(uint64_t& s) noexcept {
  s ^= s << 13;
  s ^= s >> 7;
  s ^= s << 17;
  return s;
}

std::vector<double> to_nanoseconds(const SampleSet& samples) {
  std::vector<double> out;
  out.reserve(samples.size());
  for (const auto& d : samples) {
    out.push_back(d.count());
  }
  return out;
}

double mean(std::span<const double> values) noexcept {
  if (values.empty()) {
    return 0.0;
  }
  const double sum = std::accumulate(values.begin(), values.end(), 0.0);
  return sum / static_cast<double>(values.size());
}

double variance(std::span<const double> values) noexcept {
  if (values.size() < 2) {
    return 0.0;
  }
  const double m = mean(values);
  double acc = 0.0;
  for (double v : values) {
    const double d = v - m;
    acc += d * d;
  }
  return acc / static_cast<double>(values.size() - 1);
}

double std_dev(std::span<const double> values) noexcept { return std::sqrt(variance(values)); }

double compute(Statistic statistic, std::span<const double> values) noexcept {
  switch (statistic) {
    case Statistic::Mean:
      return mean(values);
    case Statistic::Variance:
      return variance(values);
  }
  return 0.0;
}

double quantile_sorted(std::span<const double> sorted, double p) noexcept {
  if (sorted.empty()) {
    return 0.0;
  }
  p = std::clamp(p, 0.0, 1.0);
  const double idx = p * static_cast<double>(sorted.size() - 1);
  const auto lo = static_cast<size_t>(std::floor(idx));
  const auto hi = static_cast<size_t>(std::ceil(idx));
  if (lo == hi) {
    return sorted[lo];
  }
  const double frac = idx - static_cast<double>(lo);
  return sorted[lo] * (1.0 - frac) + sorted[hi] * frac;
}

double quantile(std::vector<double> values, double p) {
  std::sort(values.begin(), values.end());
  return quantile_sorted(values, p);
}

DescriptiveStats describe(std::span<const double> values) {
  DescriptiveStats out{};
  if (values.empty()) {
    return out;
  }
  std::vector<double> sorted(values.begin(), values.end());
  std::sort(sorted.begin(), sorted.end());

  out.mean = mean(values);
  out.variance = variance(values);
  out.std_dev = std::sqrt(out.variance);
  out.min = sorted.front();
  out.max = sorted.back();
  out.q1 = quantile_sorted(sorted, 0.25);
  out.median = quantile_sorted(sorted, 0.50);
  out.q3 = quantile_sorted(sorted, 0.75);
  return out;
}

OutlierCounts classify_outliers(std::span<const double> values) {
  OutlierCounts out{};
  if (values.empty()) {
    return out;
  }
  std::vector<double> sorted(values.begin(), values.end());
  std::sort(sorted.begin(), sorted.end());

  const double q1 = quantile_sorted(sorted, 0.25);
  const double q3 = quantile_sorted(sorted, 0.75);
  const double iqr = q3 - q1;
  const double los = q1 - 3.0 * iqr;
  const double lom = q1 - 1.5 * iqr;
  const double him = q3 + 1.5 * iqr;
  const double his = q3 + 3.0 * iqr;

  for (double v : values) {
    if (v < los) {
      ++out.low_severe;
    } else if (v < lom) {
      ++out.low_mild;
    } else if (v > his) {
      ++out.high_severe;
    } else if (v > him) {
      ++out.high_mild;
    } else {
      ++out.none;
    }
  }
  return out;
}

double outlier_variance(double mean, double std_dev, size_t n) noexcept {
  if (n == 0 || std_dev <= 0.0 || mean <= 0.0) {
    return 0.0;
  }
  const double count = static_cast<double>(n);
  const double sb = std_dev;
  const double mn = mean / count;
  const double mg_min = mn / 2.0;
  const double sg = std::min(mg_min / 4.0, sb / std::sqrt(count));
  const double sg2 = sg * sg;
  const double sb2 = sb * sb;

  const auto c_max = [count, mn, sb2, sg2](double x) {
    const double k = mn - x;
    const double d = k * k;
    const double nd = count * d;
    const double k0 = -count * nd;
    const double k1 = sb2 - count * sg2 + nd;
    const double det = k1 * k1 - 4.0 * sg2 * k0;
    return std::floor(-2.0 * k0 / (k1 + std::sqrt(det)));
  };
  const auto var_out = [count, sb2, sg2](double c) {
    const double nc = count - c;
    return (nc / count) * (sb2 - nc * sg2);
  };

  const double fraction = std::min(var_out(1.0), var_out(std::min(c_max(0.0), c_max(mg_min)))) / sb2;
  if (!std::isfinite(fraction)) {
    return 0.0;
  }
  return std::clamp(fraction, 0.0, 1.0);
}

NoiseClass classify_noise(double outlier_variance_fraction) noexcept {
  if (outlier_variance_fraction < 0.01) {
    return NoiseClass::Unaffected;
  }
  if (outlier_variance_fraction < 0.1) {
    return NoiseClass::Slight;
  }
  if (outlier_variance_fraction < 0.5) {
    return NoiseClass::Moderate;
  }
  return NoiseClass::Severe;
}

Expected<void> validate_confidence(double confidence_level) noexcept {
  if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
    return std::unexpected(Error{ErrorCode::InvalidConfiguration, "confidence_level must be in (0, 1)"});
  }
  return {};
}

Expected<BootstrapEstimate> bootstrap(std::span<const double> values,
                                      Statistic statistic,
                                      uint32_t resamples,
                                      double confidence_level,
                                      uint64_t seed) {
  return bootstrap_with(
      values, [statistic](std::span<const double> v) { return compute(statistic, v); }, resamples,
      confidence_level, seed);
}

}  // namespace microbench
