#include <array>
#include <cstdint>
#include <format>
#include <iostream>
#include <string>
#include <vector>

#include "microbench/runner/runner.hpp"
#include "microbench/runner/sink.hpp"

namespace {

using microbench::Duration;

bool test_invocation_count() {
  uint64_t calls = 0;
  auto fn = [&calls] { return ++calls; };
  microbench::ResultSink sink;
  for (uint64_t n : {1ULL, 7ULL, 1000ULL}) {
    calls = 0;
    const Duration elapsed = microbench::run_batch(fn, n, sink);
    if (calls != n) {
      std::cerr << std::format("batch {} invoked {} times\n", n, calls);
      return false;
    }
    if (elapsed.count() < 0.0) {
      std::cerr << std::format("negative elapsed time\n");
      return false;
    }
  }
  return true;
}

bool test_empty_batch() {
  uint64_t calls = 0;
  auto fn = [&calls] { return ++calls; };
  microbench::ResultSink sink;
  const Duration elapsed = microbench::run_batch(fn, 0, sink);
  if (calls != 0 || elapsed.count() != 0.0 || sink.values() != 0) {
    std::cerr << std::format("empty batch should not run\n");
    return false;
  }
  return true;
}

bool test_void_computation() {
  uint64_t calls = 0;
  auto fn = [&calls] { ++calls; };
  microbench::ResultSink sink;
  static_cast<void>(microbench::run_batch(fn, 50, sink));
  if (calls != 50) {
    std::cerr << std::format("void batch invoked {} times\n", calls);
    return false;
  }
  if (sink.values() != 50) {
    std::cerr << std::format("void batch recorded {} executions\n", sink.values());
    return false;
  }
  return true;
}

bool test_make_sample() {
  const Duration s = microbench::make_sample(Duration{1000.0}, Duration{2.0}, 10);
  if (s.count() != 98.0) {
    std::cerr << std::format("make_sample: {} != 98\n", s.count());
    return false;
  }
  if (microbench::make_sample(Duration{10.0}, Duration{5.0}, 10).count() != 0.0) {
    std::cerr << std::format("overhead larger than elapsed should floor at zero\n");
    return false;
  }
  if (microbench::make_sample(Duration{10.0}, Duration{0.0}, 0).count() != 0.0) {
    std::cerr << std::format("zero batch should give zero\n");
    return false;
  }
  return true;
}

bool test_digest_tracks_values() {
  microbench::ResultSink a(1);
  microbench::ResultSink b(1);
  a.keep(uint64_t{42});
  b.keep(uint64_t{42});
  if (a.digest() != b.digest()) {
    std::cerr << std::format("same values must give the same digest\n");
    return false;
  }
  b.keep(uint64_t{43});
  if (a.digest() == b.digest()) {
    std::cerr << std::format("digest ignored a kept value\n");
    return false;
  }
  microbench::ResultSink c(2);
  c.keep(uint64_t{42});
  if (a.digest() == c.digest()) {
    std::cerr << std::format("digest ignored the seed\n");
    return false;
  }
  return true;
}

bool test_non_trivial_values() {
  microbench::ResultSink sink;
  sink.keep(std::string("payload"));
  sink.keep(std::vector<uint32_t>{1, 2, 3});
  sink.keep(std::array<uint8_t, 4>{1, 2, 3, 4});
  struct Opaque {
    std::vector<std::string> parts;
  };
  sink.keep(Opaque{{"a", "b"}});
  if (sink.values() != 4) {
    std::cerr << std::format("expected 4 kept values, got {}\n", sink.values());
    return false;
  }

  auto fn = [] { return std::string(16, 'x'); };
  static_cast<void>(microbench::run_batch(fn, 3, sink));
  if (sink.values() != 5) {
    std::cerr << std::format("run_batch should keep only the last result\n");
    return false;
  }
  return true;
}

bool test_reference_results() {
  std::vector<int> backing{1, 2, 3};
  auto fn = [&backing]() -> const std::vector<int>& { return backing; };
  microbench::ResultSink sink;
  static_cast<void>(microbench::run_batch(fn, 4, sink));
  return sink.values() == 1;
}

}  // namespace

int main() {
  if (!test_invocation_count()) {
    return 1;
  }
  if (!test_empty_batch()) {
    return 1;
  }
  if (!test_void_computation()) {
    return 1;
  }
  if (!test_make_sample()) {
    return 1;
  }
  if (!test_digest_tracks_values()) {
    return 1;
  }
  if (!test_non_trivial_values()) {
    return 1;
  }
  if (!test_reference_results()) {
    return 1;
  }
  return 0;
}
