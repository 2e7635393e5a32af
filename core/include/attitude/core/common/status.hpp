#pragma once
#include <cstdint>

namespace attitude::core {

enum class Status : std::uint8_t {
  Success = 0,
  Failure = 1,
  InvalidParameter = 2,
  InsufficientData = 3,  // not enough sample points for the requested filter
  OutOfRange = 4,        // query outside the covered time span
  InternalError = 5      // broken invariant; never expected for well-formed input
};

inline constexpr bool ok(Status s) { return s == Status::Success; }

const char* statusToString(Status s);

}  // namespace attitude::core
