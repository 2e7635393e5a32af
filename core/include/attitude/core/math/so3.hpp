#pragma once
#include "attitude/core/common/constants.hpp"
#include "attitude/core/math/types.hpp"

namespace attitude::core {

// SO(3) via unit quaternions. Rotations smaller than `thr.small_angle` use
// first-order series.
Quat expSO3(const Vec3& w, const Thresholds& thr = kDefaultThresholds);
Vec3 logSO3(const Quat& q, const Thresholds& thr = kDefaultThresholds);

// Rotation distance helpers
//
// `rotationDistance` is the quaternion chordal distance min(||q1 - q2||, ||q1 + q2||);
// it is insensitive to the antipodal sign but is not an angle.
// `rotationAngle` is the angle (rad, in [0, pi]) of the rotation q2 * q1^-1.
double rotationDistance(const Quat& q1, const Quat& q2);
double rotationAngle(const Quat& q1, const Quat& q2);

}  // namespace attitude::core
