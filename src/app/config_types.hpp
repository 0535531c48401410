#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "app/workload/workloads.hpp"
#include "microbench/core/log.hpp"
#include "microbench/core/types.hpp"

namespace microbench::app {

enum class Preset { Default, Quick, Thorough };

struct Config {
  Preset preset{Preset::Default};
  WorkloadParams workload{};
  BenchmarkConfig bench{};

  std::optional<std::filesystem::path> json_output;
  LogLevel log_level{LogLevel::Warn};
  std::string executable_path;
};

struct EnvironmentInfo {
  std::string hostname{};
  uint32_t logical_cpus{};
  std::string compiler{};
  long cxx_standard{};
  std::string build_type{};
  std::string clock{};
  bool allocator_trim{false};
};

}  // namespace microbench::app
