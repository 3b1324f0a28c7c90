#include "common/types.h"

namespace repute {
namespace common {

const char *error_code_to_string(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::NONE:
    return "NONE";
  case ErrorCode::ALREADY_ACTIONED:
    return "ALREADY_ACTIONED";
  case ErrorCode::INVALID_INPUT:
    return "INVALID_INPUT";
  case ErrorCode::SELF_ENDORSEMENT:
    return "SELF_ENDORSEMENT";
  case ErrorCode::DUPLICATE_ENDORSEMENT:
    return "DUPLICATE_ENDORSEMENT";
  case ErrorCode::INSUFFICIENT_REPUTATION:
    return "INSUFFICIENT_REPUTATION";
  case ErrorCode::OUT_OF_RANGE:
    return "OUT_OF_RANGE";
  case ErrorCode::BADGE_LOCKED:
    return "BADGE_LOCKED";
  case ErrorCode::ALREADY_MINTED:
    return "ALREADY_MINTED";
  case ErrorCode::NOT_FOUND:
    return "NOT_FOUND";
  case ErrorCode::NON_TRANSFERABLE:
    return "NON_TRANSFERABLE";
  case ErrorCode::UNAUTHORIZED:
    return "UNAUTHORIZED";
  case ErrorCode::POINTS_OVERFLOW:
    return "POINTS_OVERFLOW";
  case ErrorCode::CONFIG_ERROR:
    return "CONFIG_ERROR";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

// Explicit template instantiations for the Result types the engine returns
template class Result<bool>;
template class Result<uint64_t>;
template class Result<std::string>;

} // namespace common
} // namespace repute
