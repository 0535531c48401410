#include "microbench/core/error.hpp"

#include <exception>

namespace microbench {

const char* error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidConfiguration:
      return "invalid_configuration";
    case ErrorCode::ComputationFailure:
      return "computation_failure";
    case ErrorCode::CodecError:
      return "codec_error";
    case ErrorCode::IoError:
      return "io_error";
    case ErrorCode::Internal:
      return "internal";
  }
  return "unknown";
}

std::string describe_error(const std::exception& e) {
  std::string out = e.what();
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& inner) {
    out += "; caused by: ";
    out += describe_error(inner);
  }
  return out;
}

}  // namespace microbench
