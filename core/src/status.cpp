#include "attitude/core/common/status.hpp"

namespace attitude::core {

const char* statusToString(Status s) {
  switch (s) {
    case Status::Success: return "Success";
    case Status::Failure: return "Failure";
    case Status::InvalidParameter: return "InvalidParameter";
    case Status::InsufficientData: return "InsufficientData";
    case Status::OutOfRange: return "OutOfRange";
    case Status::InternalError: return "InternalError";
  }
  return "Unknown";
}

}  // namespace attitude::core
