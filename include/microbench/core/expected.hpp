#pragma once

#include <expected>

#include "microbench/core/error.hpp"

namespace microbench {

template <class T>
using Expected = std::expected<T, Error>;

template <class E>
using unexpected = std::unexpected<E>;

}  // namespace microbench
