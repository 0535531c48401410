#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "microbench/core/expected.hpp"

namespace microbench::app {

enum class WorkloadKind { Noop, Spin, Xxh64, Lz4, Zstd };

struct WorkloadParams {
  WorkloadKind kind{WorkloadKind::Noop};
  uint64_t spin_ns{1000};
  size_t payload_size{4096};
  int zstd_level{1};
  uint64_t seed{1};
};

struct Workload {
  std::string name{};
  std::function<uint64_t()> fn{};
};

const char* workload_name(WorkloadKind kind) noexcept;
Expected<WorkloadKind> parse_workload(std::string_view text);

// Deterministic text-like payload: words drawn from a fixed 16-entry
// vocabulary, separated by spaces and cut to exactly size bytes. About four
// bits of entropy per word, so lz4 and zstd always find matches.
std::vector<uint8_t> make_payload(uint64_t seed, size_t size);

// Busy-waits on the benchmark clock for at least ns nanoseconds; returns the
// number of clock polls.
uint64_t spin_for(uint64_t ns) noexcept;

Expected<Workload> make_workload(const WorkloadParams& params);

}  // namespace microbench::app
