// SO(3) utilities on unit quaternions.
// - `expSO3` maps a rotation vector to a unit quaternion, with a series
//   fallback below `thr.small_angle`.
// - `logSO3` works on the shortest representative (w >= 0) and uses atan2 so
//   that angles near pi stay well conditioned.
// - `rotationDistance(q1,q2)` is the quaternion chordal distance:
//     min(||q1 - q2||, ||q1 + q2||)
//   (useful for convergence checks; not the rotation angle in radians).
#include "attitude/core/math/so3.hpp"
#include <algorithm>
#include <cmath>

namespace attitude::core {

Quat expSO3(const Vec3& w, const Thresholds& thr) {
  const double theta = w.norm();
  if (theta < thr.small_angle) {
    // Small angle: q ~ [1, 0.5*w]
    return Quat(1.0, 0.5*w.x(), 0.5*w.y(), 0.5*w.z()).normalized();
  }
  const double half = 0.5 * theta;
  const Vec3 v = (std::sin(half) / theta) * w;
  return Quat(std::cos(half), v.x(), v.y(), v.z());
}

Vec3 logSO3(const Quat& q, const Thresholds& thr) {
  Quat a = q.normalized();
  if (a.w() < 0.0) a.coeffs() *= -1.0;

  const Vec3 v = a.vec();
  const double s = v.norm();
  if (2.0 * s < thr.small_angle) {
    // theta ~ 2 s, axis ~ v / s
    return (2.0 / a.w()) * v;
  }
  const double theta = 2.0 * std::atan2(s, a.w());
  return (theta / s) * v;
}

double rotationDistance(const Quat& q1, const Quat& q2) {
  const Quat a = q1.normalized();
  const Quat b = q2.normalized();

  const Eigen::Vector4d v1 = a.coeffs();
  const Eigen::Vector4d v2 = b.coeffs();
  const double d1 = (v1 - v2).norm();
  const double d2 = (v1 + v2).norm();
  return (d1 > d2) ? d2 : d1;
}

double rotationAngle(const Quat& q1, const Quat& q2) {
  const Quat rel = q2.normalized() * q1.normalized().conjugate();
  return std::min(M_PI, logSO3(rel).norm());
}

}  // namespace attitude::core
