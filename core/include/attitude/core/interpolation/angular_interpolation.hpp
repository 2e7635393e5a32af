#pragma once
#include "attitude/core/export.hpp"
#include "attitude/core/common/status.hpp"
#include "attitude/core/common/constants.hpp"
#include "attitude/core/angular/derivative_filter.hpp"
#include "attitude/core/angular/timestamped_angular_coordinates.hpp"

namespace attitude::core {

// Hermite interpolation of angular coordinates on modified Rodrigues vectors.
//
// Sketch:
// - Build a linear offset model at the target time: identity rotation, mean
//   sample rate, zero acceleration.
// - Remove the offset from every sample; the residuals are small rotations.
// - Convert the residuals to modified Rodrigues vectors (+ derivatives per the
//   filter), keeping all of them on the same quaternion branch.
// - Interpolate at the target time, convert back and re-add the offset.
// If a residual gets close to the 2π singularity of the Rodrigues vector, the
// offset is rotated by 2π/n about `restart_axis` and the sample is rebuilt.
// At most n + 2 attempts are made for n sample points.
//
// Rates and accelerations of the result are always filled, also when the
// filter ignores them in the sample. `thr.small_angle` applies to every
// rotation exp/log taken along the way.
struct AngularInterpolationOptions {
  Vec3 restart_axis = Vec3::UnitX();
  Thresholds thr = kDefaultThresholds;
};

struct AngularInterpolationResult {
  Status status{Status::Failure};
  TimeStampedAngularCoordinates coordinates;

  // Number of offset models tried (1 when no restart was needed).
  int attempts{0};
};

AngularInterpolationResult interpolateAngular(double t,
                                              DerivativeFilter filter,
                                              const AngularSample& sample,
                                              const AngularInterpolationOptions& opt = {});

Status interpolateAngular(double t,
                          DerivativeFilter filter,
                          const AngularSample& sample,
                          TimeStampedAngularCoordinates* out,
                          const AngularInterpolationOptions& opt = {});

// Mean rotation rate of the sample: average of the sample rates when the filter
// trusts them, average of consecutive finite-difference estimates otherwise
// (at least two points needed).
Status estimateMeanRate(DerivativeFilter filter,
                        const AngularSample& sample,
                        Vec3* mean_rate,
                        const Thresholds& thr = kDefaultThresholds);

}  // namespace attitude::core
