#include "microbench/runner/sink.hpp"

#include <array>

#include <xxhash.h>

namespace microbench {
namespace {

constexpr uint64_t kMixMul = 0x9e3779b97f4a7c15ULL;

}  // namespace

ResultSink::ResultSink(uint64_t seed) : seed_(seed), mix_lane_(seed) {}

void ResultSink::consume(std::span<const uint8_t> data) {
  const uint64_t size = static_cast<uint64_t>(data.size());
  const uint64_t h = XXH64(data.data(), data.size(), seed_);

  ++values_;
  bytes_ += size;
  xor_lane_ ^= h ^ (size * kMixMul);
  mix_lane_ += (h * kMixMul) + size + seed_;
}

void ResultSink::note_void(uint64_t executions) {
  values_ += executions;
  mix_lane_ += executions * kMixMul;
}

void ResultSink::note_opaque() {
  ++values_;
  xor_lane_ ^= values_ * kMixMul;
}

uint64_t ResultSink::digest() const {
  const std::array<uint64_t, 5> state{
      seed_, values_, bytes_, xor_lane_, mix_lane_,
  };
  return XXH64(state.data(), sizeof(state), seed_ ^ 0x243f6a8885a308d3ULL);
}

}  // namespace microbench
