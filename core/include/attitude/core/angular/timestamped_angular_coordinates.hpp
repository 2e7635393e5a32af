#pragma once
#include "attitude/core/angular/angular_coordinates.hpp"

#include <vector>

namespace attitude::core {

// Angular coordinates tagged with the instant (s) they hold at.
struct TimeStampedAngularCoordinates {
  double time{0.0};
  AngularCoordinates coordinates;

  TimeStampedAngularCoordinates() = default;
  TimeStampedAngularCoordinates(double t, const AngularCoordinates& ac)
    : time(t), coordinates(ac) {}
  TimeStampedAngularCoordinates(double t,
                                const Quat& rotation,
                                const Vec3& rate = Vec3::Zero(),
                                const Vec3& acceleration = Vec3::Zero())
    : time(t), coordinates(rotation, rate, acceleration) {}

  const Quat& rotation() const { return coordinates.rotation(); }
  const Vec3& rate() const { return coordinates.rate(); }
  const Vec3& acceleration() const { return coordinates.acceleration(); }

  double durationFrom(double t) const { return time - t; }

  // Offset algebra keeps the instance time.
  TimeStampedAngularCoordinates revert() const {
    return {time, coordinates.revert()};
  }
  TimeStampedAngularCoordinates addOffset(const AngularCoordinates& offset) const {
    return {time, coordinates.addOffset(offset)};
  }
  TimeStampedAngularCoordinates subtractOffset(const AngularCoordinates& offset) const {
    return {time, coordinates.subtractOffset(offset)};
  }

  // Moves the time by dt as well (see AngularCoordinates::shiftedBy).
  TimeStampedAngularCoordinates shiftedBy(double dt,
                                          const Thresholds& thr = kDefaultThresholds) const {
    return {time + dt, coordinates.shiftedBy(dt, thr)};
  }
};

using AngularSample = std::vector<TimeStampedAngularCoordinates>;

}  // namespace attitude::core
