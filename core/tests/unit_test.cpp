#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "attitude/core/angular/angular_coordinates.hpp"
#include "attitude/core/angular/derivative_filter.hpp"
#include "attitude/core/angular/timestamped_angular_coordinates.hpp"
#include "attitude/core/common/logger.hpp"
#include "attitude/core/interpolation/angular_interpolation.hpp"
#include "attitude/core/math/hermite.hpp"
#include "attitude/core/math/so3.hpp"

using attitude::core::AngularCoordinates;
using attitude::core::AngularInterpolationResult;
using attitude::core::AngularSample;
using attitude::core::DerivativeFilter;
using attitude::core::HermiteInterpolator;
using attitude::core::LogLevel;
using attitude::core::Quat;
using attitude::core::RodriguesTriple;
using attitude::core::Status;
using attitude::core::TimeStampedAngularCoordinates;
using attitude::core::Vec3;
using attitude::core::ok;
using attitude::core::rotationAngle;
using attitude::core::rotationDistance;

static bool near(double a, double b, double tol) {
  return std::abs(a - b) <= tol;
}

static bool vecNear(const Vec3& a, const Vec3& b, double tol) {
  return (a - b).norm() <= tol;
}

static Quat axisAngle(const Vec3& axis, double angle) {
  return Quat(Eigen::AngleAxisd(angle, axis.normalized()));
}

static AngularCoordinates sampleA() {
  return AngularCoordinates(axisAngle(Vec3(1.0, 0.5, -0.2), 0.7),
                            Vec3(0.01, -0.02, 0.03),
                            Vec3(1e-4, 2e-4, -3e-4));
}

static AngularCoordinates sampleB() {
  return AngularCoordinates(axisAngle(Vec3(-0.3, 1.0, 0.4), 1.9),
                            Vec3(-0.04, 0.015, 0.02),
                            Vec3(-2e-4, 5e-5, 1e-4));
}

static void test_offset_round_trip() {
  const AngularCoordinates a = sampleA();
  const AngularCoordinates b = sampleB();

  assert(a.addOffset(b).subtractOffset(b).isApprox(a, 1e-12));
  assert(a.subtractOffset(b).addOffset(b).isApprox(a, 1e-12));
  assert(b.addOffset(a).subtractOffset(a).isApprox(b, 1e-12));

  // an instance combined with its own reverse is the identity
  const AngularCoordinates id = a.addOffset(a.revert());
  assert(id.isApprox(AngularCoordinates::identity(), 1e-12));
}

static void test_revert_involution() {
  const AngularCoordinates a = sampleA();
  assert(a.revert().revert().isApprox(a, 1e-12));

  // reverse rotation undoes the instance on vectors
  const Vec3 u(0.3, -1.2, 2.0);
  assert(vecNear(a.revert().applyTo(a.applyTo(u)), u, 1e-12));
}

static void test_add_offset_not_commutative() {
  const AngularCoordinates a(axisAngle(Vec3::UnitX(), 0.5), Vec3(0.1, 0.0, 0.0));
  const AngularCoordinates b(axisAngle(Vec3::UnitY(), 0.8), Vec3(0.0, 0.2, 0.0));

  const AngularCoordinates ab = a.addOffset(b);
  const AngularCoordinates ba = b.addOffset(a);
  assert(rotationDistance(ab.rotation(), ba.rotation()) > 1e-3);
  assert(!vecNear(ab.rate(), ba.rate(), 1e-3));

  // offset applied first: ab.applyTo(u) == a.applyTo(b.applyTo(u))
  const Vec3 u(1.0, 2.0, 3.0);
  assert(vecNear(ab.applyTo(u), a.applyTo(b.applyTo(u)), 1e-12));
  assert(vecNear(ab.rate(), a.rate() + a.applyTo(b.rate()), 1e-15));
}

static void test_shifted_by() {
  const Quat q0 = axisAngle(Vec3::UnitZ(), 0.3);
  const AngularCoordinates ac(q0, Vec3(0.0, 0.0, 0.1));

  const AngularCoordinates s = ac.shiftedBy(2.0);
  assert(rotationAngle(s.rotation(), axisAngle(Vec3::UnitZ(), 0.5)) < 1e-12);
  assert(vecNear(s.rate(), ac.rate(), 0.0));

  // constant acceleration: angle = w dt + 0.5 a dt^2, rate = w + a dt
  const AngularCoordinates acc(q0, Vec3(0.0, 0.0, 0.1), Vec3(0.0, 0.0, 0.02));
  const AngularCoordinates s2 = acc.shiftedBy(3.0);
  assert(rotationAngle(s2.rotation(), axisAngle(Vec3::UnitZ(), 0.3 + 0.3 + 0.09)) < 1e-12);
  assert(vecNear(s2.rate(), Vec3(0.0, 0.0, 0.16), 1e-15));
  assert(vecNear(s2.acceleration(), acc.acceleration(), 0.0));

  const TimeStampedAngularCoordinates tac(100.0, acc);
  const TimeStampedAngularCoordinates ts = tac.shiftedBy(-3.0);
  assert(near(ts.time, 97.0, 0.0));
  assert(rotationAngle(ts.rotation(), axisAngle(Vec3::UnitZ(), 0.3 - 0.3 + 0.09)) < 1e-12);

  // offset algebra keeps the time
  assert(near(tac.addOffset(sampleB()).time, 100.0, 0.0));
  assert(near(tac.revert().time, 100.0, 0.0));
}

static void test_small_angle_threshold() {
  const Vec3 w(0.0, 0.0, 0.1);
  const Quat exact = axisAngle(Vec3::UnitZ(), 0.1);
  assert(rotationAngle(attitude::core::expSO3(w), exact) < 1e-14);
  assert(near(attitude::core::logSO3(exact).z(), 0.1, 1e-14));

  // a coarse threshold switches 0.1 rad rotations to the first-order series
  attitude::core::Thresholds coarse;
  coarse.small_angle = 1.0;
  assert(rotationAngle(attitude::core::expSO3(w, coarse), exact) > 1e-5);
  assert(std::abs(attitude::core::logSO3(exact, coarse).z() - 0.1) > 1e-5);

  const AngularCoordinates spin(Quat::Identity(), w);
  assert(rotationAngle(spin.shiftedBy(1.0).rotation(), exact) < 1e-14);
  assert(rotationAngle(spin.shiftedBy(1.0, coarse).rotation(), exact) > 1e-5);
  const TimeStampedAngularCoordinates stamped(5.0, spin);
  assert(rotationAngle(stamped.shiftedBy(1.0, coarse).rotation(), exact) > 1e-5);

  assert(vecNear(attitude::core::estimateRate(Quat::Identity(), exact, 1.0), w, 1e-14));
  assert(!vecNear(attitude::core::estimateRate(Quat::Identity(), exact, 1.0, coarse), w, 1e-5));
}

static void test_modified_rodrigues_round_trip() {
  const AngularCoordinates a = sampleA();
  const AngularCoordinates b = sampleB();
  for (double sign : {1.0, -1.0}) {
    assert(AngularCoordinates::fromModifiedRodrigues(a.modifiedRodrigues(sign)).isApprox(a, 1e-12));
    assert(AngularCoordinates::fromModifiedRodrigues(b.modifiedRodrigues(sign)).isApprox(b, 1e-12));
  }

  // r = tan(theta/4) u
  const RodriguesTriple m = AngularCoordinates(axisAngle(Vec3::UnitY(), 1.2)).modifiedRodrigues(1.0);
  assert(vecNear(m.row(0).transpose(), std::tan(0.3) * Vec3::UnitY(), 1e-14));
  assert(m.row(1).norm() == 0.0);
}

static void test_modified_rodrigues_derivatives() {
  // constant rate: shiftedBy is the exact trajectory, compare with finite differences
  const AngularCoordinates ac(axisAngle(Vec3(0.2, -1.0, 0.5), 1.1), Vec3(0.3, 0.1, -0.2));
  const double h = 1e-3;

  const RodriguesTriple m0 = ac.modifiedRodrigues(1.0);
  const Vec3 rp = ac.shiftedBy(h).modifiedRodrigues(1.0).row(0).transpose();
  const Vec3 rm = ac.shiftedBy(-h).modifiedRodrigues(1.0).row(0).transpose();
  const Vec3 r0 = m0.row(0).transpose();

  const Vec3 rDot = (rp - rm) / (2.0 * h);
  const Vec3 rDotDot = (rp - 2.0 * r0 + rm) / (h * h);
  assert(vecNear(rDot, m0.row(1).transpose(), 1e-6));
  assert(vecNear(rDotDot, m0.row(2).transpose(), 1e-5));
}

static void test_estimate_rate() {
  const Vec3 axis = Vec3(1.0, 2.0, 3.0).normalized();
  const Quat start = axisAngle(Vec3(0.0, 1.0, 1.0), 0.4);
  const Quat end = axisAngle(axis, 0.3) * start;

  const Vec3 w = attitude::core::estimateRate(start, end, 2.0);
  assert(vecNear(w, (0.3 / 2.0) * axis, 1e-14));

  AngularSample sample;
  sample.emplace_back(10.0, start);
  sample.emplace_back(12.0, end);
  Vec3 mean = Vec3::Zero();
  assert(ok(attitude::core::estimateMeanRate(DerivativeFilter::UseR, sample, &mean)));
  assert(vecNear(mean, (0.3 / 2.0) * axis, 1e-14));

  // trusted rates are averaged as given
  sample[0] = TimeStampedAngularCoordinates(10.0, start, Vec3(1.0, 0.0, 0.0));
  sample[1] = TimeStampedAngularCoordinates(12.0, end, Vec3(0.0, 1.0, 0.0));
  assert(ok(attitude::core::estimateMeanRate(DerivativeFilter::UseRR, sample, &mean)));
  assert(vecNear(mean, Vec3(0.5, 0.5, 0.0), 0.0));

  sample.resize(1);
  assert(attitude::core::estimateMeanRate(DerivativeFilter::UseR, sample, &mean) ==
         Status::InsufficientData);
}

static void test_derivative_filter() {
  assert(attitude::core::derivativeOrder(DerivativeFilter::UseR) == 0);
  assert(attitude::core::derivativeOrder(DerivativeFilter::UseRR) == 1);
  assert(attitude::core::derivativeOrder(DerivativeFilter::UseRRA) == 2);

  DerivativeFilter f = DerivativeFilter::UseR;
  assert(ok(attitude::core::filterFromOrder(2, &f)));
  assert(f == DerivativeFilter::UseRRA);
  assert(attitude::core::filterFromOrder(3, &f) == Status::InvalidParameter);

  assert(std::string(attitude::core::statusToString(Status::InsufficientData)) == "InsufficientData");
  assert(std::string(attitude::core::statusToString(Status::OutOfRange)) == "OutOfRange");
}

static Eigen::VectorXd scalar(double v) {
  Eigen::VectorXd out(1);
  out(0) = v;
  return out;
}

static void test_hermite_polynomial() {
  // p(x) = 1 + 2x - x^2 + 0.5x^3, p' = 2 - 2x + 1.5x^2, p'' = -2 + 3x
  auto p = [](double x) { return 1.0 + 2.0 * x - x * x + 0.5 * x * x * x; };
  auto dp = [](double x) { return 2.0 - 2.0 * x + 1.5 * x * x; };
  auto ddp = [](double x) { return -2.0 + 3.0 * x; };

  // values only
  {
    HermiteInterpolator interp;
    for (double x : {-1.0, 0.5, 2.0, 3.0}) {
      assert(ok(interp.addSamplePoint(x, scalar(p(x)))));
    }
    HermiteInterpolator::Evaluation e;
    assert(ok(interp.evaluate(1.3, &e)));
    assert(near(e.value(0), p(1.3), 1e-12));
    assert(near(e.first(0), dp(1.3), 1e-12));
    assert(near(e.second(0), ddp(1.3), 1e-12));
  }

  // value + derivatives at two points
  {
    HermiteInterpolator interp;
    assert(ok(interp.addSamplePoint(0.0, scalar(p(0.0)), scalar(dp(0.0)), scalar(ddp(0.0)))));
    assert(ok(interp.addSamplePoint(2.0, scalar(p(2.0)))));
    assert(interp.constraints() == 4);
    HermiteInterpolator::Evaluation e;
    assert(ok(interp.evaluate(-0.7, &e)));
    assert(near(e.value(0), p(-0.7), 1e-12));
    assert(near(e.first(0), dp(-0.7), 1e-12));
    assert(near(e.second(0), ddp(-0.7), 1e-12));
  }

  // vector valued, derivative-only at one node
  {
    HermiteInterpolator interp;
    assert(ok(interp.addSamplePoint(1.0, Eigen::Vector2d(1.0, -1.0), Eigen::Vector2d(3.0, 0.5))));
    HermiteInterpolator::Evaluation e;
    assert(ok(interp.evaluate(3.0, &e)));
    assert(near(e.value(0), 7.0, 1e-15));
    assert(near(e.value(1), 0.0, 1e-15));
    assert(near(e.first(1), 0.5, 1e-15));
    assert(near(e.second(0), 0.0, 0.0));
  }

  // errors
  {
    HermiteInterpolator interp;
    HermiteInterpolator::Evaluation e;
    assert(interp.evaluate(0.0, &e) == Status::InsufficientData);
    assert(ok(interp.addSamplePoint(1.0, scalar(2.0))));
    assert(interp.addSamplePoint(1.0, scalar(3.0)) == Status::InvalidParameter);
    assert(interp.addSamplePoint(2.0, Eigen::Vector2d(3.0, 1.0)) == Status::InvalidParameter);
    assert(interp.constraints() == 1);

    // cleared interpolators accept a new dimension and reuse abscissae
    interp.clear();
    assert(interp.empty());
    assert(interp.evaluate(0.0, &e) == Status::InsufficientData);
    assert(ok(interp.addSamplePoint(1.0, Eigen::Vector2d(3.0, 1.0))));
    assert(interp.dimension() == 2);
    assert(ok(interp.evaluate(4.0, &e)));
    assert(near(e.value(0), 3.0, 0.0));
    assert(near(e.value(1), 1.0, 0.0));
  }
}

static AngularSample arbitrarySample() {
  AngularSample sample;
  sample.emplace_back(0.0, axisAngle(Vec3(1.0, 0.0, 0.2), 0.3),
                      Vec3(0.01, 0.02, -0.01), Vec3(1e-3, 0.0, 2e-3));
  sample.emplace_back(1.0, axisAngle(Vec3(0.8, 0.3, 0.1), 0.35),
                      Vec3(0.02, 0.01, -0.015), Vec3(-1e-3, 1e-3, 0.0));
  sample.emplace_back(2.0, axisAngle(Vec3(0.7, 0.5, 0.0), 0.42),
                      Vec3(0.015, 0.03, -0.02), Vec3(0.0, 2e-3, -1e-3));
  sample.emplace_back(3.0, axisAngle(Vec3(0.6, 0.6, -0.1), 0.5),
                      Vec3(0.025, 0.02, -0.01), Vec3(5e-4, -5e-4, 1e-3));
  return sample;
}

static void test_interpolation_reproduces_samples() {
  const AngularSample sample = arbitrarySample();

  for (const auto& s : sample) {
    TimeStampedAngularCoordinates out;

    assert(ok(attitude::core::interpolateAngular(s.time, DerivativeFilter::UseRRA, sample, &out)));
    assert(near(out.time, s.time, 0.0));
    assert(rotationDistance(out.rotation(), s.rotation()) < 1e-10);
    assert(vecNear(out.rate(), s.rate(), 1e-10));
    assert(vecNear(out.acceleration(), s.acceleration(), 1e-9));

    assert(ok(attitude::core::interpolateAngular(s.time, DerivativeFilter::UseRR, sample, &out)));
    assert(rotationDistance(out.rotation(), s.rotation()) < 1e-10);
    assert(vecNear(out.rate(), s.rate(), 1e-10));

    assert(ok(attitude::core::interpolateAngular(s.time, DerivativeFilter::UseR, sample, &out)));
    assert(rotationDistance(out.rotation(), s.rotation()) < 1e-10);
  }
}

static void test_interpolation_synthesizes_derivatives() {
  // theta(t) = 0.1 t + 0.02 t^2 about Z, rates deliberately left at zero
  auto theta = [](double t) { return 0.1 * t + 0.02 * t * t; };
  AngularSample sample;
  for (double t : {0.0, 1.0, 2.0, 3.0, 4.0}) {
    sample.emplace_back(t, axisAngle(Vec3::UnitZ(), theta(t)));
  }

  const AngularInterpolationResult res =
      attitude::core::interpolateAngular(2.0, DerivativeFilter::UseR, sample);
  assert(ok(res.status));
  assert(res.attempts == 1);
  assert(rotationAngle(res.coordinates.rotation(), axisAngle(Vec3::UnitZ(), theta(2.0))) < 1e-9);
  assert(vecNear(res.coordinates.rate(), Vec3(0.0, 0.0, 0.18), 1e-5));
  assert(vecNear(res.coordinates.acceleration(), Vec3(0.0, 0.0, 0.04), 1e-3));

  // between sample points
  const AngularInterpolationResult mid =
      attitude::core::interpolateAngular(2.5, DerivativeFilter::UseR, sample);
  assert(ok(mid.status));
  assert(rotationAngle(mid.coordinates.rotation(), axisAngle(Vec3::UnitZ(), theta(2.5))) < 1e-6);
  assert(vecNear(mid.coordinates.rate(), Vec3(0.0, 0.0, 0.2), 1e-4));
}

static int g_restart_messages = 0;

static void quietSink(LogLevel, const std::string&) {}

static void countingSink(LogLevel level, const std::string& msg) {
  if (level == LogLevel::Debug && msg.find("restart") != std::string::npos) {
    ++g_restart_messages;
  }
}

static void test_interpolation_avoids_singularity() {
  // one full turn per second about -Z, sampled every quarter turn with rates
  // left at zero: without offset adaptation the sample at 2π hits the
  // Rodrigues singularity
  const double omega = 2.0 * M_PI;
  const TimeStampedAngularCoordinates reference(0.0, Quat::Identity(), Vec3(0.0, 0.0, -omega));

  AngularSample sample;
  for (double dt : {0.0, 0.25, 0.5, 0.75, 1.0, 1.25, 1.5}) {
    const TimeStampedAngularCoordinates shifted = reference.shiftedBy(dt);
    sample.emplace_back(shifted.time, shifted.rotation());
  }

  attitude::core::setLogLevel(LogLevel::Debug);
  attitude::core::setLogSink(&countingSink);

  for (const auto& s : sample) {
    const AngularInterpolationResult res =
        attitude::core::interpolateAngular(s.time, DerivativeFilter::UseRR, sample);
    assert(ok(res.status));
    assert(res.attempts >= 2);
    assert(res.attempts <= static_cast<int>(sample.size()) + 2);
    assert(rotationDistance(res.coordinates.rotation(), reference.shiftedBy(s.time).rotation()) < 1e-10);
    assert(res.coordinates.rate().norm() < 1e-9);
  }

  attitude::core::setLogSink(&quietSink);
  attitude::core::setLogLevel(LogLevel::Error);
  assert(g_restart_messages >= static_cast<int>(sample.size()));
}

static void test_interpolation_restart_between_samples() {
  // accelerating spin theta = (pi/2) t^2 about Z with consistent rates, 25
  // points on [0, 4]: with the mean-rate offset the residual at the middle of
  // the sample is a full turn away from the first one, so the fit needs a restart
  const double c = 0.5 * M_PI;
  auto reference = [c](double t) {
    return TimeStampedAngularCoordinates(t, axisAngle(Vec3::UnitZ(), c * t * t),
                                         Vec3(0.0, 0.0, 2.0 * c * t),
                                         Vec3(0.0, 0.0, 2.0 * c));
  };

  AngularSample sample;
  for (int i = 0; i <= 24; ++i) {
    sample.push_back(reference(4.0 * i / 24.0));
  }

  const double t = 1.66;
  const AngularInterpolationResult res =
      attitude::core::interpolateAngular(t, DerivativeFilter::UseRR, sample);
  assert(ok(res.status));
  assert(res.attempts >= 2);

  const TimeStampedAngularCoordinates expected = reference(t);
  assert(near(res.coordinates.time, t, 0.0));
  assert(rotationAngle(res.coordinates.rotation(), expected.rotation()) < 1e-4);
  assert(vecNear(res.coordinates.rate(), expected.rate(), 1e-2));
}

static void test_interpolation_errors() {
  TimeStampedAngularCoordinates out;
  AngularSample empty;
  assert(attitude::core::interpolateAngular(0.0, DerivativeFilter::UseRR, empty, &out) ==
         Status::InsufficientData);

  AngularSample one;
  one.emplace_back(0.0, Quat::Identity());
  assert(attitude::core::interpolateAngular(0.0, DerivativeFilter::UseR, one, &out) ==
         Status::InsufficientData);

  AngularSample duplicated = arbitrarySample();
  duplicated[2].time = duplicated[1].time;
  assert(attitude::core::interpolateAngular(1.5, DerivativeFilter::UseRR, duplicated, &out) ==
         Status::InvalidParameter);

  const AngularSample sample = arbitrarySample();
  assert(attitude::core::interpolateAngular(1.0, DerivativeFilter::UseRR, sample, nullptr) ==
         Status::InvalidParameter);
  assert(attitude::core::interpolateAngular(std::nan(""), DerivativeFilter::UseRR, sample, &out) ==
         Status::InvalidParameter);
}

int main() {
  // keep expected error paths quiet
  attitude::core::setLogLevel(LogLevel::Error);
  attitude::core::setLogSink(&quietSink);

  test_offset_round_trip();
  test_revert_involution();
  test_add_offset_not_commutative();
  test_shifted_by();
  test_small_angle_threshold();
  test_modified_rodrigues_round_trip();
  test_modified_rodrigues_derivatives();
  test_estimate_rate();
  test_derivative_filter();
  test_hermite_polynomial();
  test_interpolation_reproduces_samples();
  test_interpolation_synthesizes_derivatives();
  test_interpolation_avoids_singularity();
  test_interpolation_restart_between_samples();
  test_interpolation_errors();

  std::cout << "attitude_core_unit_test: PASS\n";
  return 0;
}
