#pragma once

#include "attitude/core/common/status.hpp"
#include "attitude/core/angular/derivative_filter.hpp"
#include "attitude/core/angular/timestamped_angular_coordinates.hpp"
#include "attitude/core/interpolation/angular_interpolation.hpp"

#include <cstddef>
#include <vector>

namespace attitude::ephemeris {

// Attitude playback from a time-ordered table of angular coordinates.
//
// Every query interpolates on the `interpolation_points` table entries closest
// to the requested time (the window is clamped at both ends of the table), so
// the cost of a query does not grow with the table size.
struct AttitudeEphemerisOptions {
  int interpolation_points = 4;
  attitude::core::DerivativeFilter filter{attitude::core::DerivativeFilter::UseRR};

  // Queries up to this many seconds outside [minTime(), maxTime()] are accepted.
  double extrapolation_tolerance = 0.0;

  attitude::core::AngularInterpolationOptions interpolation{};
};

class AttitudeEphemeris {
public:
  AttitudeEphemeris() = default;

  // Validates and stores the table. Entries must be finite and strictly
  // increasing in time; at least `interpolation_points` entries are needed.
  // A failed init leaves the ephemeris empty.
  attitude::core::Status init(std::vector<attitude::core::TimeStampedAngularCoordinates> table,
                              const AttitudeEphemerisOptions& opt = {});

  std::size_t size() const { return table_.size(); }
  bool empty() const { return table_.empty(); }

  // Time span covered by the table. Failure when the ephemeris is empty.
  attitude::core::Status minTime(double* t) const;
  attitude::core::Status maxTime(double* t) const;

  const AttitudeEphemerisOptions& options() const { return opt_; }
  const std::vector<attitude::core::TimeStampedAngularCoordinates>& table() const {
    return table_;
  }

  // Interpolated attitude at `t`.
  attitude::core::Status getAttitude(double t,
                                     attitude::core::TimeStampedAngularCoordinates* out) const;

  // Table entries used for a query at `t` (exposed for diagnostics).
  attitude::core::Status neighbors(double t, attitude::core::AngularSample* out) const;

private:
  std::vector<attitude::core::TimeStampedAngularCoordinates> table_;
  AttitudeEphemerisOptions opt_{};
};

}  // namespace attitude::ephemeris
