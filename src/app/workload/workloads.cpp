#include "app/workload/workloads.hpp"

#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <lz4.h>
#include <xxhash.h>
#include <zstd.h>

#include "microbench/clock/clock.hpp"
#include "microbench/core/error.hpp"
#include "microbench/stats/stats.hpp"

namespace microbench::app {
namespace {

constexpr size_t kLz4MaxInputSize = static_cast<size_t>(std::numeric_limits<int>::max());

constexpr std::string_view kVocabulary[] = {
    "sample", "batch",  "clock", "median", "fence",   "resample", "warm",  "probe",
    "trim",   "settle", "cache", "spin",   "variance", "bound",   "seed",  "digest",
};

struct CodecState {
  std::vector<uint8_t> raw{};
  std::vector<uint8_t> out{};
  int level{1};
};

std::shared_ptr<CodecState> make_codec_state(const WorkloadParams& params, size_t bound) {
  auto state = std::make_shared<CodecState>();
  state->raw = make_payload(params.seed, params.payload_size);
  state->out.resize(bound);
  state->level = params.zstd_level;
  return state;
}

uint64_t lz4_compress(CodecState& s) {
  const int n = LZ4_compress_default(reinterpret_cast<const char*>(s.raw.data()),
                                     reinterpret_cast<char*>(s.out.data()),
                                     static_cast<int>(s.raw.size()),
                                     static_cast<int>(s.out.size()));
  if (n <= 0) {
    throw Error{ErrorCode::CodecError, "lz4 compress failed"};
  }
  return static_cast<uint64_t>(n);
}

uint64_t zstd_compress(CodecState& s) {
  const size_t n = ZSTD_compress(s.out.data(), s.out.size(), s.raw.data(), s.raw.size(), s.level);
  if (ZSTD_isError(n)) {
    throw Error{ErrorCode::CodecError, std::string("zstd compress failed: ") + ZSTD_getErrorName(n)};
  }
  return static_cast<uint64_t>(n);
}

}  // namespace

const char* workload_name(WorkloadKind kind) noexcept {
  switch (kind) {
    case WorkloadKind::Noop:
      return "noop";
    case WorkloadKind::Spin:
      return "spin";
    case WorkloadKind::Xxh64:
      return "xxh64";
    case WorkloadKind::Lz4:
      return "lz4";
    case WorkloadKind::Zstd:
      return "zstd";
  }
  return "unknown";
}

Expected<WorkloadKind> parse_workload(std::string_view text) {
  for (const auto kind : {WorkloadKind::Noop, WorkloadKind::Spin, WorkloadKind::Xxh64, WorkloadKind::Lz4,
                          WorkloadKind::Zstd}) {
    if (text == workload_name(kind)) {
      return kind;
    }
  }
  return std::unexpected(Error{ErrorCode::InvalidConfiguration, "invalid --workload: " + std::string(text)});
}

std::vector<uint8_t> make_payload(uint64_t seed, size_t size) {
  std::vector<uint8_t> out;
  out.reserve(size + 16);
  uint64_t s = seed == 0 ? 1 : seed;
  while (out.size() < size) {
    // Top bits: the low bits of xorshift64 are the weakest.
    const auto word = kVocabulary[xorshift64(s) >> 60];
    out.insert(out.end(), word.begin(), word.end());
    out.push_back(' ');
  }
  out.resize(size);
  return out;
}

uint64_t spin_for(uint64_t ns) noexcept {
  const auto start = now();
  const auto budget = Duration{static_cast<double>(ns)};
  uint64_t polls = 0;
  do {
    ++polls;
  } while (elapsed_between(start, now()) < budget);
  return polls;
}

Expected<Workload> make_workload(const WorkloadParams& params) {
  Workload w{};
  w.name = workload_name(params.kind);

  switch (params.kind) {
    case WorkloadKind::Noop: {
      w.fn = []() -> uint64_t { return 0; };
      return w;
    }
    case WorkloadKind::Spin: {
      if (params.spin_ns == 0) {
        return std::unexpected(Error{ErrorCode::InvalidConfiguration, "spin workload needs spin_ns > 0"});
      }
      const uint64_t ns = params.spin_ns;
      w.fn = [ns]() { return spin_for(ns); };
      return w;
    }
    case WorkloadKind::Xxh64: {
      auto payload = std::make_shared<const std::vector<uint8_t>>(make_payload(params.seed, params.payload_size));
      const uint64_t seed = params.seed;
      w.fn = [payload, seed]() -> uint64_t { return XXH64(payload->data(), payload->size(), seed); };
      return w;
    }
    case WorkloadKind::Lz4: {
      if (params.payload_size == 0 || params.payload_size > kLz4MaxInputSize) {
        return std::unexpected(Error{ErrorCode::InvalidConfiguration, "lz4 payload size out of range"});
      }
      const auto bound = static_cast<size_t>(LZ4_compressBound(static_cast<int>(params.payload_size)));
      auto state = make_codec_state(params, bound);
      w.fn = [state]() { return lz4_compress(*state); };
      return w;
    }
    case WorkloadKind::Zstd: {
      if (params.payload_size == 0) {
        return std::unexpected(Error{ErrorCode::InvalidConfiguration, "zstd payload size must be > 0"});
      }
      auto state = make_codec_state(params, ZSTD_compressBound(params.payload_size));
      w.fn = [state]() { return zstd_compress(*state); };
      return w;
    }
  }
  return std::unexpected(Error{ErrorCode::InvalidConfiguration, "unknown workload"});
}

}  // namespace microbench::app
