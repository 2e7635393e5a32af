#pragma once
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace attitude::core {

// Fundamental math types and conventions used across the library.
// - `Quat` is a unit quaternion used as a vector operator: `q * v` rotates `v`.
//   Composition is by left-multiplication (a * b applies b, then a).
// - Rotation rates are expressed in the outer (destination) frame:
//     dR/dt = [w]x R,  dq/dt = 0.5 * (0, w) * q
// - Units are seconds and radians.
using Vec3 = Eigen::Vector3d;
using Mat3 = Eigen::Matrix3d;
using Quat = Eigen::Quaterniond;

// Modified Rodrigues vector with its first and second time derivatives,
// stored row-wise: row 0 = r, row 1 = dr/dt, row 2 = d2r/dt2.
using RodriguesTriple = Eigen::Matrix3d;

}  // namespace attitude::core
