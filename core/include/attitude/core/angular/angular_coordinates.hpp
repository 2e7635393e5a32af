#pragma once
#include "attitude/core/export.hpp"
#include "attitude/core/common/constants.hpp"
#include "attitude/core/math/types.hpp"

namespace attitude::core {

// Rotation together with its first and second time derivatives.
//
//   rotation      unit quaternion (normalized on construction)
//   rate          rotation rate w (rad/s), outer-frame components
//   acceleration  rotation acceleration dw/dt (rad/s^2), outer-frame components
//
// Instances are immutable: every operation returns a new value.
class ATTITUDE_CORE_API AngularCoordinates {
public:
  AngularCoordinates();  // identity, zero rate and acceleration
  explicit AngularCoordinates(const Quat& rotation,
                              const Vec3& rate = Vec3::Zero(),
                              const Vec3& acceleration = Vec3::Zero());

  static AngularCoordinates identity();

  // Rebuild angular coordinates from a modified Rodrigues triple
  // (row 0 = r, row 1 = dr/dt, row 2 = d2r/dt2).
  static AngularCoordinates fromModifiedRodrigues(const RodriguesTriple& r);

  // Accessors
  const Quat& rotation() const { return rotation_; }
  const Vec3& rate() const { return rate_; }
  const Vec3& acceleration() const { return acceleration_; }

  // Rotate a vector.
  Vec3 applyTo(const Vec3& v) const { return rotation_ * v; }

  // Pair whose effect reverses the instance: q^-1, -(q^-1 w), -(q^-1 dw/dt).
  AngularCoordinates revert() const;

  // Time-shifted coordinates using a constant acceleration model:
  //   rotation      exp(w dt + 0.5 dw/dt dt^2) * q
  //   rate          w + dw/dt dt
  //   acceleration  unchanged
  // This is a local approximation, not an attitude propagation. It is meant for
  // small shifts or coarse accuracy.
  AngularCoordinates shiftedBy(double dt, const Thresholds& thr = kDefaultThresholds) const;

  // Compose with an offset applied first, the instance being applied afterwards:
  //   rotation      q * q_off
  //   rate          w + q * w_off
  //   acceleration  dw/dt + q * dw_off/dt
  // a.addOffset(b) and b.addOffset(a) differ in general.
  AngularCoordinates addOffset(const AngularCoordinates& offset) const;

  // a.subtractOffset(b) == a.addOffset(b.revert()).
  // Both a.addOffset(b).subtractOffset(b) and a.subtractOffset(b).addOffset(b)
  // give back a (to rounding).
  AngularCoordinates subtractOffset(const AngularCoordinates& offset) const;

  // Modified Rodrigues vector r = tan(theta/4) u and its two derivatives, computed
  // on the quaternion representative sign * q. Finite unless sign * q.w() == -1.
  RodriguesTriple modifiedRodrigues(double sign) const;

  bool isApprox(const AngularCoordinates& other, double tol = 1e-12) const;

private:
  Quat rotation_{Quat::Identity()};
  Vec3 rate_{Vec3::Zero()};
  Vec3 acceleration_{Vec3::Zero()};
};

// Finite-difference rate that turns `start` into `end` in `dt` seconds,
// assuming a fixed axis: angle/axis of (end * start^-1) divided by dt.
Vec3 estimateRate(const Quat& start, const Quat& end, double dt,
                  const Thresholds& thr = kDefaultThresholds);

}  // namespace attitude::core
