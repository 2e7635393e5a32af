#include "attitude/core/angular/derivative_filter.hpp"

#include "attitude/core/common/logger.hpp"

namespace attitude::core {

int derivativeOrder(DerivativeFilter filter) {
  switch (filter) {
    case DerivativeFilter::UseR: return 0;
    case DerivativeFilter::UseRR: return 1;
    case DerivativeFilter::UseRRA: return 2;
  }
  return 0;
}

Status filterFromOrder(int order, DerivativeFilter* out) {
  if (!out) {
    log(LogLevel::Error, "filterFromOrder: null output");
    return Status::InvalidParameter;
  }
  switch (order) {
    case 0: *out = DerivativeFilter::UseR; return Status::Success;
    case 1: *out = DerivativeFilter::UseRR; return Status::Success;
    case 2: *out = DerivativeFilter::UseRRA; return Status::Success;
    default:
      log(LogLevel::Error, "filterFromOrder: derivative order must be 0, 1 or 2");
      return Status::InvalidParameter;
  }
}

const char* derivativeFilterToString(DerivativeFilter filter) {
  switch (filter) {
    case DerivativeFilter::UseR: return "USE_R";
    case DerivativeFilter::UseRR: return "USE_RR";
    case DerivativeFilter::UseRRA: return "USE_RRA";
  }
  return "UNKNOWN";
}

}  // namespace attitude::core
