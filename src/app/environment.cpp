#include "app/environment.hpp"

#include <array>
#include <format>
#include <thread>

#include <unistd.h>

#include "microbench/clock/clock.hpp"
#include "microbench/quiescence/quiescence.hpp"

#ifndef MICROBENCH_BUILD_TYPE
#define MICROBENCH_BUILD_TYPE "unknown"
#endif

namespace microbench::app {
namespace {

std::string host_name() {
  std::array<char, 256> buf{};
  if (::gethostname(buf.data(), buf.size() - 1) != 0) {
    return "unknown";
  }
  return std::string(buf.data());
}

std::string compiler_id() {
#if defined(__clang__)
  return std::string("clang ") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc ") + __VERSION__;
#elif defined(_MSC_VER)
  return std::format("msvc {}", _MSC_VER);
#else
  return "unknown";
#endif
}

}  // namespace

EnvironmentInfo collect_environment() {
  EnvironmentInfo env{};
  env.hostname = host_name();
  env.logical_cpus = std::thread::hardware_concurrency();
  env.compiler = compiler_id();
  env.cxx_standard = __cplusplus;
  env.build_type = MICROBENCH_BUILD_TYPE;
  env.clock = std::format("steady_clock ({:.1f} ns resolution)", clock_resolution().count());
  env.allocator_trim = quiescence_trims_allocator();
  return env;
}

}  // namespace microbench::app
