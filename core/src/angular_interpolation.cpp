#include "attitude/core/interpolation/angular_interpolation.hpp"

#include "attitude/core/common/logger.hpp"
#include "attitude/core/math/hermite.hpp"

#include <algorithm>
#include <cstdint>
#include <cmath>
#include <sstream>
#include <vector>

namespace attitude::core {

namespace {

enum class AttemptOutcome : std::uint8_t {
  Converged = 0,
  NeedsRestart = 1,
  Failed = 2
};

// One pass over the sample with a fixed offset model. Fills `interpolator`
// with the Rodrigues vectors of the offset-free residuals, or reports that a
// residual came too close to the 2π singularity.
AttemptOutcome trySample(double t,
                         DerivativeFilter filter,
                         const AngularSample& sample,
                         const TimeStampedAngularCoordinates& offset,
                         double threshold,
                         const Thresholds& thr,
                         HermiteInterpolator* interpolator,
                         Status* status) {
  const int order = derivativeOrder(filter);

  // keep every residual on the same quaternion branch as its predecessor
  double sign = 1.0;
  Quat previous = Quat::Identity();

  for (const auto& ac : sample) {
    const double dt = ac.durationFrom(t);
    const TimeStampedAngularCoordinates fixed =
        ac.subtractOffset(offset.shiftedBy(dt, thr).coordinates);

    const double dot = fixed.rotation().coeffs().dot(previous.coeffs());
    sign = std::copysign(1.0, dot * sign);
    previous = fixed.rotation();

    if (fixed.rotation().w() * sign < threshold) {
      return AttemptOutcome::NeedsRestart;
    }

    const RodriguesTriple m = fixed.coordinates.modifiedRodrigues(sign);
    std::vector<Eigen::VectorXd> derivatives;
    derivatives.reserve(static_cast<std::size_t>(order) + 1);
    for (int k = 0; k <= order; ++k) {
      derivatives.emplace_back(m.row(k).transpose());
    }

    const Status st = interpolator->addSamplePoint(dt, derivatives);
    if (!ok(st)) {
      *status = st;
      return AttemptOutcome::Failed;
    }
  }

  return AttemptOutcome::Converged;
}

}  // namespace

Status estimateMeanRate(DerivativeFilter filter,
                        const AngularSample& sample,
                        Vec3* mean_rate,
                        const Thresholds& thr) {
  if (!mean_rate) {
    log(LogLevel::Error, "estimateMeanRate: null output");
    return Status::InvalidParameter;
  }
  if (sample.empty()) {
    log(LogLevel::Error, "estimateMeanRate: empty sample");
    return Status::InsufficientData;
  }

  if (derivativeOrder(filter) > 0) {
    Vec3 sum = Vec3::Zero();
    for (const auto& ac : sample) sum += ac.rate();
    *mean_rate = sum / static_cast<double>(sample.size());
    return Status::Success;
  }

  // rates are not trusted: use finite differences between consecutive points
  if (sample.size() < 2) {
    if (shouldLog(LogLevel::Error)) {
      std::ostringstream oss;
      oss << "estimateMeanRate: not enough data for interpolation (" << sample.size()
          << " point(s), " << derivativeFilterToString(filter) << " needs at least 2)";
      log(LogLevel::Error, oss.str());
    }
    return Status::InsufficientData;
  }

  Vec3 sum = Vec3::Zero();
  for (std::size_t i = 1; i < sample.size(); ++i) {
    const double dt = sample[i].durationFrom(sample[i - 1].time);
    if (dt == 0.0 || !std::isfinite(dt)) {
      log(LogLevel::Error, "estimateMeanRate: consecutive sample points share the same time");
      return Status::InvalidParameter;
    }
    sum += estimateRate(sample[i - 1].rotation(), sample[i].rotation(), dt, thr);
  }
  *mean_rate = sum / static_cast<double>(sample.size() - 1);
  return Status::Success;
}

AngularInterpolationResult interpolateAngular(double t,
                                              DerivativeFilter filter,
                                              const AngularSample& sample,
                                              const AngularInterpolationOptions& opt) {
  AngularInterpolationResult out;

  if (!std::isfinite(t)) {
    log(LogLevel::Error, "interpolateAngular: interpolation time is non-finite");
    out.status = Status::InvalidParameter;
    return out;
  }
  const double axis_norm = opt.restart_axis.norm();
  if (!(axis_norm > opt.thr.axis_norm_eps)) {
    log(LogLevel::Error, "interpolateAngular: restart axis norm too small");
    out.status = Status::InvalidParameter;
    return out;
  }

  // linear model canceling the mean rotation rate
  Vec3 mean_rate = Vec3::Zero();
  {
    const Status st = estimateMeanRate(filter, sample, &mean_rate, opt.thr);
    if (!ok(st)) {
      out.status = st;
      return out;
    }
  }
  TimeStampedAngularCoordinates offset(t, Quat::Identity(), mean_rate, Vec3::Zero());

  // safety elements for 2π singularity avoidance
  const double n = static_cast<double>(sample.size());
  const double epsilon = 2.0 * M_PI / n;
  const double threshold = std::min(-(1.0 - opt.thr.singularity_margin),
                                    -std::cos(epsilon / 4.0));
  const AngularCoordinates restart_step(
      Quat(Eigen::AngleAxisd(epsilon, opt.restart_axis / axis_norm)));

  const int max_attempts = static_cast<int>(sample.size()) + 2;
  HermiteInterpolator interpolator;
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    out.attempts = attempt;

    interpolator.clear();
    Status st = Status::Success;
    const AttemptOutcome outcome =
        trySample(t, filter, sample, offset, threshold, opt.thr, &interpolator, &st);

    if (outcome == AttemptOutcome::Failed) {
      if (shouldLog(LogLevel::Error)) {
        std::ostringstream oss;
        oss << "interpolateAngular: failed to build Hermite sample ("
            << statusToString(st) << ")";
        log(LogLevel::Error, oss.str());
      }
      out.status = st;
      return out;
    }

    if (outcome == AttemptOutcome::NeedsRestart) {
      // some residual rotation was too close to 2π: rotate the offset model
      if (shouldLog(LogLevel::Debug)) {
        std::ostringstream oss;
        oss << "interpolateAngular: restart " << attempt << "/" << max_attempts
            << " at t=" << t << " (Rodrigues singularity)";
        log(LogLevel::Debug, oss.str());
      }
      offset = offset.addOffset(restart_step);
      continue;
    }

    HermiteInterpolator::Evaluation p;
    st = interpolator.evaluate(0.0, &p);
    if (!ok(st)) {
      if (shouldLog(LogLevel::Error)) {
        std::ostringstream oss;
        oss << "interpolateAngular: Hermite evaluation failed (" << statusToString(st) << ")";
        log(LogLevel::Error, oss.str());
      }
      out.status = st;
      return out;
    }

    RodriguesTriple m;
    m.row(0) = p.value.transpose();
    m.row(1) = p.first.transpose();
    m.row(2) = p.second.transpose();
    const AngularCoordinates residual = AngularCoordinates::fromModifiedRodrigues(m);

    out.coordinates = TimeStampedAngularCoordinates(offset.time, residual)
                          .addOffset(offset.coordinates);
    out.status = Status::Success;
    return out;
  }

  if (shouldLog(LogLevel::Error)) {
    std::ostringstream oss;
    oss << "interpolateAngular: internal error, no offset model avoided the Rodrigues "
           "singularity after " << max_attempts << " attempts";
    log(LogLevel::Error, oss.str());
  }
  out.status = Status::InternalError;
  return out;
}

Status interpolateAngular(double t,
                          DerivativeFilter filter,
                          const AngularSample& sample,
                          TimeStampedAngularCoordinates* out,
                          const AngularInterpolationOptions& opt) {
  if (!out) {
    log(LogLevel::Error, "interpolateAngular: null output");
    return Status::InvalidParameter;
  }
  const AngularInterpolationResult res = interpolateAngular(t, filter, sample, opt);
  if (ok(res.status)) {
    *out = res.coordinates;
  }
  return res.status;
}

}  // namespace attitude::core
