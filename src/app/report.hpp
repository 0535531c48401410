#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

#include "microbench/core/expected.hpp"
#include "microbench/core/types.hpp"

namespace microbench::app {

// "12.345 ns", "1.234 us", ... chosen by magnitude.
std::string format_duration(double ns);

void print_human_summary(std::ostream& os, std::string_view name, const BenchmarkResult& result);
std::string json_summary(std::string_view name, const BenchmarkResult& result);
Expected<void> write_json_summary(const std::filesystem::path& path,
                                  std::string_view name,
                                  const BenchmarkResult& result);

}  // namespace microbench::app
