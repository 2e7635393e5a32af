#include "attitude/ephemeris/attitude_ephemeris.hpp"

#include "attitude/core/common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace attitude::ephemeris {

using attitude::core::AngularSample;
using attitude::core::DerivativeFilter;
using attitude::core::LogLevel;
using attitude::core::Status;
using attitude::core::TimeStampedAngularCoordinates;
using attitude::core::log;
using attitude::core::ok;
using attitude::core::shouldLog;

static inline bool isFiniteEntry(const TimeStampedAngularCoordinates& ac) {
  return std::isfinite(ac.time) &&
         ac.rotation().coeffs().allFinite() &&
         ac.rate().allFinite() &&
         ac.acceleration().allFinite();
}

Status AttitudeEphemeris::init(std::vector<TimeStampedAngularCoordinates> table,
                               const AttitudeEphemerisOptions& opt) {
  table_.clear();

  if (opt.interpolation_points < 1) {
    log(LogLevel::Error, "AttitudeEphemeris: interpolation_points must be positive");
    return Status::InvalidParameter;
  }
  if (opt.filter == DerivativeFilter::UseR && opt.interpolation_points < 2) {
    log(LogLevel::Error, "AttitudeEphemeris: USE_R needs at least 2 interpolation points");
    return Status::InvalidParameter;
  }
  if (!(opt.extrapolation_tolerance >= 0.0) || !std::isfinite(opt.extrapolation_tolerance)) {
    log(LogLevel::Error, "AttitudeEphemeris: extrapolation_tolerance must be >= 0");
    return Status::InvalidParameter;
  }
  if (table.size() < static_cast<std::size_t>(opt.interpolation_points)) {
    if (shouldLog(LogLevel::Error)) {
      std::ostringstream oss;
      oss << "AttitudeEphemeris: " << table.size() << " entries, at least "
          << opt.interpolation_points << " needed";
      log(LogLevel::Error, oss.str());
    }
    return Status::InsufficientData;
  }

  for (std::size_t i = 0; i < table.size(); ++i) {
    if (!isFiniteEntry(table[i])) {
      log(LogLevel::Error, "AttitudeEphemeris: NaN/Inf entry in table");
      return Status::InvalidParameter;
    }
    if (i > 0 && !(table[i].time > table[i - 1].time)) {
      log(LogLevel::Error, "AttitudeEphemeris: table times must be strictly increasing");
      return Status::InvalidParameter;
    }
  }

  table_ = std::move(table);
  opt_ = opt;
  return Status::Success;
}

Status AttitudeEphemeris::minTime(double* t) const {
  if (!t) {
    log(LogLevel::Error, "AttitudeEphemeris::minTime: null output");
    return Status::InvalidParameter;
  }
  if (table_.empty()) {
    log(LogLevel::Error, "AttitudeEphemeris::minTime: ephemeris not initialized");
    return Status::Failure;
  }
  *t = table_.front().time;
  return Status::Success;
}

Status AttitudeEphemeris::maxTime(double* t) const {
  if (!t) {
    log(LogLevel::Error, "AttitudeEphemeris::maxTime: null output");
    return Status::InvalidParameter;
  }
  if (table_.empty()) {
    log(LogLevel::Error, "AttitudeEphemeris::maxTime: ephemeris not initialized");
    return Status::Failure;
  }
  *t = table_.back().time;
  return Status::Success;
}

Status AttitudeEphemeris::neighbors(double t, AngularSample* out) const {
  if (!out) {
    log(LogLevel::Error, "AttitudeEphemeris::neighbors: null output");
    return Status::InvalidParameter;
  }
  if (table_.empty()) {
    log(LogLevel::Error, "AttitudeEphemeris::neighbors: ephemeris not initialized");
    return Status::Failure;
  }
  if (!std::isfinite(t)) {
    log(LogLevel::Error, "AttitudeEphemeris::neighbors: query time is non-finite");
    return Status::InvalidParameter;
  }
  const double t_min = table_.front().time;
  const double t_max = table_.back().time;
  if (t < t_min - opt_.extrapolation_tolerance ||
      t > t_max + opt_.extrapolation_tolerance) {
    if (shouldLog(LogLevel::Error)) {
      std::ostringstream oss;
      oss << "AttitudeEphemeris: t=" << t << " outside ephemeris range ["
          << t_min << ", " << t_max << "]";
      log(LogLevel::Error, oss.str());
    }
    return Status::OutOfRange;
  }

  const std::size_t n = table_.size();
  const std::size_t k = static_cast<std::size_t>(opt_.interpolation_points);

  // first entry strictly after t, then center the window on it
  const auto it = std::upper_bound(
      table_.begin(), table_.end(), t,
      [](double value, const TimeStampedAngularCoordinates& ac) { return value < ac.time; });
  const std::size_t after = static_cast<std::size_t>(it - table_.begin());
  std::size_t first = (after > k / 2) ? after - k / 2 : 0;
  first = std::min(first, n - k);

  out->assign(table_.begin() + static_cast<std::ptrdiff_t>(first),
              table_.begin() + static_cast<std::ptrdiff_t>(first + k));
  return Status::Success;
}

Status AttitudeEphemeris::getAttitude(double t, TimeStampedAngularCoordinates* out) const {
  if (!out) {
    log(LogLevel::Error, "AttitudeEphemeris::getAttitude: null output");
    return Status::InvalidParameter;
  }

  AngularSample window;
  const Status st = neighbors(t, &window);
  if (!ok(st)) {
    return st;
  }
  return attitude::core::interpolateAngular(t, opt_.filter, window, out, opt_.interpolation);
}

}  // namespace attitude::ephemeris
