#pragma once

namespace attitude::core {

// Numerical thresholds shared by the angular algebra and the interpolation driver.
struct Thresholds {
  // Below this rotation angle (rad) exp/log use their series expansions.
  double small_angle = 1.0e-12;

  // Margin kept between the signed quaternion scalar part and -1 before the
  // modified Rodrigues vector is considered too close to its 2π singularity.
  double singularity_margin = 1.0e-4;

  // general numerical
  double axis_norm_eps = 1.0e-12;
};

inline constexpr Thresholds kDefaultThresholds{};

}  // namespace attitude::core
