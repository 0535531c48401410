#include "microbench/quiescence/quiescence.hpp"

#include <thread>

#include "microbench/clock/clock.hpp"

#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace microbench {
namespace {

class AllocatorQuiescence final : public IQuiescence {
 public:
  explicit AllocatorQuiescence(Duration settle) : settle_(settle.count() < 0.0 ? Duration{0.0} : settle) {}

  Duration request_quiescence() override {
    ++requests_;
    const Duration trim = measure([]() {
#if defined(__GLIBC__)
      static_cast<void>(::malloc_trim(0));
#endif
    });
    if (settle_.count() > 0.0) {
      std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::nanoseconds>(settle_));
    }
    return trim;
  }

  uint64_t requests() const noexcept override { return requests_; }

 private:
  Duration settle_{};
  uint64_t requests_{0};
};

}  // namespace

std::unique_ptr<IQuiescence> make_quiescence(Duration settle) {
  return std::make_unique<AllocatorQuiescence>(settle);
}

bool quiescence_trims_allocator() noexcept {
#if defined(__GLIBC__)
  return true;
#else
  return false;
#endif
}

}  // namespace microbench
