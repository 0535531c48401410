#pragma once

#include <cstdint>
#include <memory>

#include "microbench/core/types.hpp"

namespace microbench {

// Best-effort request to reclaim memory that is no longer referenced, then a
// short blocking pause so the work can progress. C++ has no managed
// collector: on glibc the request trims the malloc arenas, elsewhere it is
// only the pause. Nothing is guaranteed to complete and no error is ever
// reported. Returns the time spent in the reclamation request, excluding the
// pause.
class IQuiescence {
 public:
  virtual ~IQuiescence() = default;

  virtual Duration request_quiescence() = 0;
  virtual uint64_t requests() const noexcept = 0;
};

std::unique_ptr<IQuiescence> make_quiescence(Duration settle);

// Whether request_quiescence() issues an allocator trim on this platform.
bool quiescence_trims_allocator() noexcept;

}  // namespace microbench
