#include "app/cli.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

#include <argparse/argparse.hpp>

#include "app/environment.hpp"
#include "app/presets.hpp"
#include "app/report.hpp"
#include "app/workload/workloads.hpp"
#include "microbench/bench/benchmark.hpp"
#include "microbench/core/error.hpp"
#include "microbench/core/log.hpp"

namespace microbench::app {
namespace {

using AppError = microbench::Error;

void add_options(argparse::ArgumentParser& program) {
  program.add_description("Statistically rigorous micro-benchmark of a built-in workload.");
  program.add_argument("--workload")
      .help("noop|spin|xxh64|lz4|zstd")
      .default_value(std::string("spin"));
  program.add_argument("--preset").help("default|quick|thorough").default_value(std::string("default"));
  program.add_argument("--warmup-ms").help("warm-up budget in ms (0 disables)").scan<'g', double>().default_value(100.0);
  program.add_argument("--target-us").help("target elapsed time per sample in us").scan<'g', double>().default_value(1000.0);
  program.add_argument("--samples").help("samples to collect (>= 2)").scan<'u', uint32_t>().default_value(uint32_t{100});
  program.add_argument("--resamples").help("bootstrap resamples").scan<'u', uint32_t>().default_value(uint32_t{10'000});
  program.add_argument("--confidence").help("confidence level in (0, 1)").scan<'g', double>().default_value(0.95);
  program.add_argument("--no-quiescence")
      .help("skip the memory reclamation request before each sample")
      .default_value(false)
      .implicit_value(true);
  program.add_argument("--pin-overhead-ns")
      .help("use this per-call overhead instead of calibrating")
      .scan<'g', double>()
      .default_value(-1.0);
  program.add_argument("--seed").help("payload and bootstrap seed").scan<'u', uint64_t>().default_value(uint64_t{1});
  program.add_argument("--spin-ns").help("delay of the spin workload").scan<'u', uint64_t>().default_value(uint64_t{1000});
  program.add_argument("--payload-size")
      .help("payload bytes for xxh64/lz4/zstd")
      .scan<'u', size_t>()
      .default_value(size_t{4096});
  program.add_argument("--zstd-level").scan<'i', int>().default_value(1);
  program.add_argument("--json").help("write a JSON summary to this path").default_value(std::string(""));
  program.add_argument("--log").help("debug|info|warn|off").default_value(std::string("warn"));
  program.add_argument("--verbose").help("same as --log info").default_value(false).implicit_value(true);
}

}  // namespace

Expected<Config> parse_args(int argc, char** argv) {
  Config cfg{};
  if (argc > 0) {
    cfg.executable_path = argv[0];
  }

  argparse::ArgumentParser program("microbench");
  add_options(program);
  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return std::unexpected(AppError{ErrorCode::InvalidConfiguration, "argument parsing failed"});
  }

  auto preset = parse_preset(program.get<std::string>("--preset"));
  if (!preset) {
    return std::unexpected(preset.error());
  }
  cfg.preset = *preset;
  apply_preset(cfg.preset, cfg.bench);

  auto kind = parse_workload(program.get<std::string>("--workload"));
  if (!kind) {
    return std::unexpected(kind.error());
  }
  cfg.workload.kind = *kind;
  cfg.workload.spin_ns = program.get<uint64_t>("--spin-ns");
  cfg.workload.payload_size = program.get<size_t>("--payload-size");
  cfg.workload.zstd_level = program.get<int>("--zstd-level");
  cfg.workload.seed = program.get<uint64_t>("--seed");

  // Explicit options win over the preset.
  if (program.is_used("--warmup-ms")) {
    cfg.bench.warmup_duration = std::chrono::duration<double, std::milli>(program.get<double>("--warmup-ms"));
  }
  if (program.is_used("--target-us")) {
    cfg.bench.target_sample_duration =
        std::chrono::duration<double, std::micro>(program.get<double>("--target-us"));
  }
  if (program.is_used("--samples")) {
    cfg.bench.sample_count = program.get<uint32_t>("--samples");
  }
  if (program.is_used("--resamples")) {
    cfg.bench.bootstrap_resample_count = program.get<uint32_t>("--resamples");
  }
  cfg.bench.confidence_level = program.get<double>("--confidence");
  cfg.bench.enable_quiescence_before_sample = !program.get<bool>("--no-quiescence");
  cfg.bench.bootstrap_seed = cfg.workload.seed;
  if (program.is_used("--pin-overhead-ns")) {
    const double pin = program.get<double>("--pin-overhead-ns");
    if (pin < 0.0) {
      return std::unexpected(AppError{ErrorCode::InvalidConfiguration, "--pin-overhead-ns must be >= 0"});
    }
    cfg.bench.pinned_overhead = Duration{pin};
  }

  const auto json = program.get<std::string>("--json");
  if (!json.empty()) {
    cfg.json_output = std::filesystem::path(json);
  }

  if (!parse_log_level(program.get<std::string>("--log"), cfg.log_level)) {
    return std::unexpected(AppError{ErrorCode::InvalidConfiguration, "invalid --log level"});
  }
  if (program.get<bool>("--verbose") && cfg.log_level > LogLevel::Info) {
    cfg.log_level = LogLevel::Info;
  }

  if (auto ok = validate(cfg.bench); !ok) {
    return std::unexpected(ok.error());
  }
  return cfg;
}

}  // namespace microbench::app

int run_cli_impl(int argc, char** argv) {
  using namespace microbench;

  auto cfg = app::parse_args(argc, argv);
  if (!cfg) {
    std::cerr << "error: " << cfg.error().message() << "\n";
    return 2;
  }
  set_log_level(cfg->log_level);

  auto workload = app::make_workload(cfg->workload);
  if (!workload) {
    std::cerr << "error: " << workload.error().message() << "\n";
    return 2;
  }

  BenchmarkResult result{};
  try {
    result = run_benchmark(cfg->bench, workload->fn, app::collect_environment());
  } catch (const Error& e) {
    std::cerr << "run error (" << error_code_name(e.code()) << "): " << describe_error(e) << "\n";
    return 1;
  }

  app::print_human_summary(std::cout, workload->name, result);
  if (cfg->json_output.has_value()) {
    auto json = app::write_json_summary(*cfg->json_output, workload->name, result);
    if (!json) {
      std::cerr << "error: " << json.error().message() << "\n";
      return 1;
    }
  }
  return 0;
}
