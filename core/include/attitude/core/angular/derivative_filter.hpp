#pragma once
#include "attitude/core/common/status.hpp"

#include <cstdint>

namespace attitude::core {

// Which derivatives of the sample points are trusted during interpolation.
// Derivatives that are not trusted are synthesized by the interpolation.
enum class DerivativeFilter : std::uint8_t {
  UseR = 0,    // rotation only
  UseRR = 1,   // rotation + rate
  UseRRA = 2   // rotation + rate + acceleration
};

// Highest derivative order consumed from the samples (0, 1 or 2).
int derivativeOrder(DerivativeFilter filter);

Status filterFromOrder(int order, DerivativeFilter* out);

const char* derivativeFilterToString(DerivativeFilter filter);

}  // namespace attitude::core
