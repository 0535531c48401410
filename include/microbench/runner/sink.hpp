#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>

namespace microbench {

// Tells the optimizer that the object at value is read and may be modified,
// so the computation that produced it cannot be elided.
template <typename T>
inline void escape(T&& value) noexcept {
#if defined(__GNUC__) || defined(__clang__)
  asm volatile("" : : "g"(&value) : "memory");
#else
  static const void* volatile sink_slot = nullptr;
  sink_slot = static_cast<const void*>(&value);
#endif
}

inline void clobber_memory() noexcept {
#if defined(__GNUC__) || defined(__clang__)
  asm volatile("" : : : "memory");
#endif
}

template <typename T>
concept ContiguousBytes = requires(const T& t) {
  { t.data() };
  { t.size() } -> std::convertible_to<size_t>;
} && std::is_trivially_copyable_v<std::remove_cvref_t<decltype(*std::declval<const T&>().data())>>;

// Accumulates the results a benchmarked computation returned. Every value
// kept is folded into an xxh64 digest, so it is referenced after the timed
// region ends.
class ResultSink {
 public:
  explicit ResultSink(uint64_t seed = 0);

  ResultSink(const ResultSink&) = delete;
  ResultSink& operator=(const ResultSink&) = delete;

  void consume(std::span<const uint8_t> data);

  template <typename T>
  void keep(const T& value) {
    if constexpr (std::is_trivially_copyable_v<T>) {
      consume(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(&value), sizeof(T)));
    } else if constexpr (ContiguousBytes<T>) {
      using Elem = std::remove_cvref_t<decltype(*value.data())>;
      consume(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()),
                                       static_cast<size_t>(value.size()) * sizeof(Elem)));
    } else {
      escape(value);
      note_opaque();
    }
  }

  // For computations returning void: only the number of executions is recorded.
  void note_void(uint64_t executions);

  uint64_t digest() const;
  uint64_t values() const { return values_; }

 private:
  void note_opaque();

  uint64_t seed_{0};
  uint64_t values_{0};
  uint64_t bytes_{0};
  uint64_t xor_lane_{0};
  uint64_t mix_lane_{0};
};

}  // namespace microbench
