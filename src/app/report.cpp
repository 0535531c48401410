#include "app/report.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "app/config_types.hpp"
#include "microbench/stats/stats.hpp"

namespace microbench::app {
namespace {

std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += ' ';
        } else {
          out += c;
        }
    }
  }
  return out;
}

std::string estimate_json(const BootstrapEstimate& e) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(6) << "{\"point\":" << e.point << ",\"lower\":" << e.lower_bound
     << ",\"upper\":" << e.upper_bound << ",\"confidence\":" << e.confidence_level << "}";
  return os.str();
}

std::string root_or_zero(double v) { return format_duration(v > 0.0 ? std::sqrt(v) : 0.0); }

}  // namespace

std::string format_duration(double ns) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(3);
  const double a = std::fabs(ns);
  if (a < 1e3) {
    os << ns << " ns";
  } else if (a < 1e6) {
    os << ns / 1e3 << " us";
  } else if (a < 1e9) {
    os << ns / 1e6 << " ms";
  } else {
    os << ns / 1e9 << " s";
  }
  return os.str();
}

void print_human_summary(std::ostream& os, std::string_view name, const BenchmarkResult& result) {
  const auto& s = result.stats;
  const auto& o = result.outliers;
  const auto noise = classify_noise(result.outlier_variance);

  os << "benchmark " << name << "\n";
  if (const auto* env = std::any_cast<EnvironmentInfo>(&result.environment)) {
    os << "  host: " << env->hostname << " (" << env->logical_cpus << " cpus), " << env->compiler << ", "
       << env->build_type << ", " << env->clock << "\n";
  }
  os << "  " << result.samples.size() << " samples x " << result.batch_size << " executions, warm-up "
     << result.warmup.executions << " executions in " << format_duration(result.warmup.elapsed.count())
     << ", overhead " << format_duration(result.overhead.per_invocation.count()) << "/call"
     << (result.overhead.pinned ? " (pinned)" : "") << "\n";
  os << "  mean:    " << format_duration(result.mean.point) << "  [" << format_duration(result.mean.lower_bound)
     << ", " << format_duration(result.mean.upper_bound) << "] @ " << std::setprecision(1) << std::fixed
     << result.mean.confidence_level * 100.0 << "%\n";
  os << "  std dev: " << format_duration(s.std_dev) << "  [" << root_or_zero(result.variance.lower_bound) << ", "
     << root_or_zero(result.variance.upper_bound) << "]\n";
  os << "  min/q1/median/q3/max: " << format_duration(s.min) << " / " << format_duration(s.q1) << " / "
     << format_duration(s.median) << " / " << format_duration(s.q3) << " / " << format_duration(s.max) << "\n";
  os << "  outliers: " << o.outliers() << "/" << o.total() << " (low severe " << o.low_severe << ", low mild "
     << o.low_mild << ", high mild " << o.high_mild << ", high severe " << o.high_severe << ")\n";
  os << "  variance introduced by outliers: " << std::setprecision(2) << result.outlier_variance * 100.0 << "% ("
     << noise_class_name(noise) << ")\n";
  os << "  post-run quiescence: " << format_duration(result.final_quiescence.count()) << "\n";
  for (const auto w : result.warnings) {
    os << "  warning: " << warning_name(w) << "\n";
  }
}

std::string json_summary(std::string_view name, const BenchmarkResult& result) {
  const auto& s = result.stats;
  const auto& o = result.outliers;
  const auto& c = result.config;

  std::ostringstream out;
  out << std::fixed << std::setprecision(6);
  out << "{\n";
  out << "  \"name\": \"" << json_escape(name) << "\",\n";
  out << "  \"config\": {\"warmup_ns\": " << c.warmup_duration.count()
      << ", \"target_sample_ns\": " << c.target_sample_duration.count() << ", \"samples\": " << c.sample_count
      << ", \"quiescence_before_sample\": " << (c.enable_quiescence_before_sample ? "true" : "false")
      << ", \"confidence\": " << c.confidence_level << ", \"resamples\": " << c.bootstrap_resample_count
      << ", \"seed\": " << c.bootstrap_seed << "},\n";
  if (const auto* env = std::any_cast<EnvironmentInfo>(&result.environment)) {
    out << "  \"environment\": {\"hostname\": \"" << json_escape(env->hostname)
        << "\", \"logical_cpus\": " << env->logical_cpus << ", \"compiler\": \"" << json_escape(env->compiler)
        << "\", \"cxx_standard\": " << env->cxx_standard << ", \"build_type\": \""
        << json_escape(env->build_type) << "\", \"clock\": \"" << json_escape(env->clock)
        << "\", \"allocator_trim\": " << (env->allocator_trim ? "true" : "false") << "},\n";
  }
  out << "  \"batch_size\": " << result.batch_size << ",\n";
  out << "  \"warmup\": {\"executions\": " << result.warmup.executions
      << ", \"elapsed_ns\": " << result.warmup.elapsed.count() << "},\n";
  out << "  \"overhead_ns\": " << result.overhead.per_invocation.count()
      << ", \"overhead_pinned\": " << (result.overhead.pinned ? "true" : "false") << ",\n";
  out << "  \"stats\": {\"mean\": " << s.mean << ", \"variance\": " << s.variance << ", \"std_dev\": " << s.std_dev
      << ", \"min\": " << s.min << ", \"q1\": " << s.q1 << ", \"median\": " << s.median << ", \"q3\": " << s.q3
      << ", \"max\": " << s.max << "},\n";
  out << "  \"outliers\": {\"low_severe\": " << o.low_severe << ", \"low_mild\": " << o.low_mild
      << ", \"none\": " << o.none << ", \"high_mild\": " << o.high_mild << ", \"high_severe\": " << o.high_severe
      << "},\n";
  out << "  \"mean\": " << estimate_json(result.mean) << ",\n";
  out << "  \"variance\": " << estimate_json(result.variance) << ",\n";
  out << "  \"outlier_variance\": " << result.outlier_variance << ",\n";
  out << "  \"final_quiescence_ns\": " << result.final_quiescence.count() << ",\n";
  out << "  \"warnings\": [";
  for (size_t i = 0; i < result.warnings.size(); ++i) {
    out << (i == 0 ? "" : ", ") << "\"" << warning_name(result.warnings[i]) << "\"";
  }
  out << "],\n";
  out << "  \"samples_ns\": [";
  for (size_t i = 0; i < result.samples.size(); ++i) {
    out << (i == 0 ? "" : ", ") << result.samples[i].count();
  }
  out << "]\n";
  out << "}\n";
  return out.str();
}

Expected<void> write_json_summary(const std::filesystem::path& path,
                                  std::string_view name,
                                  const BenchmarkResult& result) {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    return std::unexpected(Error{ErrorCode::IoError, "failed to open JSON output path: " + path.string()});
  }
  out << json_summary(name, result);
  if (!out) {
    return std::unexpected(Error{ErrorCode::IoError, "failed to write JSON output: " + path.string()});
  }
  return {};
}

}  // namespace microbench::app
