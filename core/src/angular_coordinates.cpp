// Angular coordinates algebra and modified Rodrigues conversion.
//
// Quaternion kinematics with outer-frame rates:
//   dq/dt   = 0.5 * (0, w) * q
//   d2q/dt2 = 0.5 * ((0, dw/dt) * q + (0, w) * dq/dt)
// and conversely w = 2 vec(dq/dt * q^*), dw/dt = 2 vec(d2q/dt2 * q^*) for unit q.
//
// The modified Rodrigues vector is r = tan(theta/4) u = q_v / (1 + q_0);
// its derivatives follow from differentiating r (1 + q_0) = q_v.
#include "attitude/core/angular/angular_coordinates.hpp"

#include "attitude/core/math/so3.hpp"

#include <cmath>

namespace attitude::core {

AngularCoordinates::AngularCoordinates() = default;

AngularCoordinates::AngularCoordinates(const Quat& rotation,
                                       const Vec3& rate,
                                       const Vec3& acceleration)
  : rotation_(rotation.normalized()), rate_(rate), acceleration_(acceleration) {}

AngularCoordinates AngularCoordinates::identity() { return AngularCoordinates(); }

AngularCoordinates AngularCoordinates::revert() const {
  const Quat inv = rotation_.conjugate();
  return AngularCoordinates(inv, -(inv * rate_), -(inv * acceleration_));
}

AngularCoordinates AngularCoordinates::shiftedBy(double dt, const Thresholds& thr) const {
  const Vec3 increment = rate_ * dt + 0.5 * acceleration_ * dt * dt;
  return AngularCoordinates(expSO3(increment, thr) * rotation_,
                            rate_ + acceleration_ * dt,
                            acceleration_);
}

AngularCoordinates AngularCoordinates::addOffset(const AngularCoordinates& offset) const {
  return AngularCoordinates(rotation_ * offset.rotation_,
                            rate_ + rotation_ * offset.rate_,
                            acceleration_ + rotation_ * offset.acceleration_);
}

AngularCoordinates AngularCoordinates::subtractOffset(const AngularCoordinates& offset) const {
  return addOffset(offset.revert());
}

RodriguesTriple AngularCoordinates::modifiedRodrigues(double sign) const {
  const double q0 = sign * rotation_.w();
  const Vec3 q = sign * rotation_.vec();
  const Vec3& w = rate_;
  const Vec3& wDot = acceleration_;

  // first time derivatives of the quaternion
  const double q0Dot = -0.5 * w.dot(q);
  const Vec3 qDot = 0.5 * (q0 * w + w.cross(q));

  // second time derivatives of the quaternion
  const double q0DotDot = -0.5 * (wDot.dot(q) + w.dot(qDot));
  const Vec3 qDotDot = 0.5 * (q0 * wDot + wDot.cross(q) + q0Dot * w + w.cross(qDot));

  const double inv = 1.0 / (1.0 + q0);
  const Vec3 r = inv * q;
  const Vec3 rDot = inv * (qDot - q0Dot * r);
  const Vec3 rDotDot = inv * (qDotDot - 2.0 * q0Dot * rDot - q0DotDot * r);

  RodriguesTriple out;
  out.row(0) = r.transpose();
  out.row(1) = rDot.transpose();
  out.row(2) = rDotDot.transpose();
  return out;
}

AngularCoordinates AngularCoordinates::fromModifiedRodrigues(const RodriguesTriple& m) {
  const Vec3 r = m.row(0).transpose();
  const Vec3 rDot = m.row(1).transpose();
  const Vec3 rDotDot = m.row(2).transpose();

  // rotation: q_0 = k - 1, q_v = k r with k = 2 / (1 + |r|^2)
  const double k = 2.0 / (1.0 + r.squaredNorm());
  const double q0 = k - 1.0;
  const Vec3 q = k * r;

  // first derivatives (dk/dt = dq_0/dt)
  const double q0Dot = -k * k * r.dot(rDot);
  const Vec3 qDot = q0Dot * r + k * rDot;

  // second derivatives
  const double q0DotDot = 2.0 * q0Dot * q0Dot / k - k * k * (rDot.squaredNorm() + r.dot(rDotDot));
  const Vec3 qDotDot = q0DotDot * r + 2.0 * q0Dot * rDot + k * rDotDot;

  const Vec3 w = 2.0 * (q0 * qDot - q0Dot * q + q.cross(qDot));
  const Vec3 wDot = 2.0 * (q0 * qDotDot - q0DotDot * q + q.cross(qDotDot));

  return AngularCoordinates(Quat(q0, q.x(), q.y(), q.z()), w, wDot);
}

bool AngularCoordinates::isApprox(const AngularCoordinates& other, double tol) const {
  return rotationDistance(rotation_, other.rotation_) <= tol &&
         (rate_ - other.rate_).norm() <= tol &&
         (acceleration_ - other.acceleration_).norm() <= tol;
}

Vec3 estimateRate(const Quat& start, const Quat& end, double dt, const Thresholds& thr) {
  const Quat evolution = end * start.conjugate();
  return logSO3(evolution, thr) / dt;
}

}  // namespace attitude::core
