#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <thread>

#include "microbench/runner/sink.hpp"
#include "microbench/warmup/warmup.hpp"

namespace {

using microbench::Duration;

bool test_zero_duration_skips() {
  uint64_t calls = 0;
  auto fn = [&calls] { return ++calls; };
  microbench::ResultSink sink;
  const auto w = microbench::warm_up(fn, Duration{0.0}, 1000, sink);
  if (calls != 0 || w.executions != 0 || w.elapsed.count() != 0.0) {
    std::cerr << std::format("zero warm-up ran {} executions\n", calls);
    return false;
  }
  return true;
}

bool test_execution_cap() {
  uint64_t calls = 0;
  auto fn = [&calls] { return ++calls; };
  microbench::ResultSink sink;
  const auto w = microbench::warm_up(fn, Duration{std::chrono::seconds(10)}, 25, sink);
  if (calls != 25 || w.executions != 25) {
    std::cerr << std::format("cap of 25 ran {} executions\n", calls);
    return false;
  }
  return true;
}

bool test_slow_computation_runs_once() {
  uint64_t calls = 0;
  auto fn = [&calls] {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    return ++calls;
  };
  microbench::ResultSink sink;
  const auto w = microbench::warm_up(fn, Duration{std::chrono::microseconds(100)}, 1000, sink);
  if (calls != 1 || w.executions != 1) {
    std::cerr << std::format("slow computation ran {} times\n", calls);
    return false;
  }
  return true;
}

bool test_runs_for_duration() {
  uint64_t calls = 0;
  auto fn = [&calls] { return ++calls; };
  microbench::ResultSink sink;
  const Duration budget{std::chrono::milliseconds(5)};
  const auto w = microbench::warm_up(fn, budget, 1'000'000'000ULL, sink);
  if (w.elapsed < budget) {
    std::cerr << std::format("warm-up stopped after {} ns of {}\n", w.elapsed.count(), budget.count());
    return false;
  }
  if (w.executions != calls || calls < 2) {
    std::cerr << std::format("warm-up reported {} executions, ran {}\n", w.executions, calls);
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_zero_duration_skips()) {
    return 1;
  }
  if (!test_execution_cap()) {
    return 1;
  }
  if (!test_slow_computation_runs_once()) {
    return 1;
  }
  if (!test_runs_for_duration()) {
    return 1;
  }
  return 0;
}
