#include "attitude/core/math/hermite.hpp"

#include "attitude/core/common/logger.hpp"

#include <cmath>
#include <sstream>

namespace attitude::core {

static double factorial(std::size_t k) {
  double f = 1.0;
  for (std::size_t i = 2; i <= k; ++i) f *= static_cast<double>(i);
  return f;
}

Status HermiteInterpolator::addSamplePoint(double x,
                                           const std::vector<Eigen::VectorXd>& derivatives) {
  if (!std::isfinite(x)) {
    log(LogLevel::Error, "HermiteInterpolator: abscissa is non-finite");
    return Status::InvalidParameter;
  }
  if (derivatives.empty()) {
    log(LogLevel::Error, "HermiteInterpolator: sample point without value");
    return Status::InvalidParameter;
  }

  const int dim = (dimension_ > 0) ? dimension_ : static_cast<int>(derivatives.front().size());
  if (dim <= 0) {
    log(LogLevel::Error, "HermiteInterpolator: empty value vector");
    return Status::InvalidParameter;
  }
  for (const auto& d : derivatives) {
    if (d.size() != dim) {
      log(LogLevel::Error, "HermiteInterpolator: inconsistent dimension");
      return Status::InvalidParameter;
    }
    if (!d.allFinite()) {
      log(LogLevel::Error, "HermiteInterpolator: NaN/Inf in sample point");
      return Status::InvalidParameter;
    }
  }
  for (const double a : abscissae_) {
    if (a == x) {
      if (shouldLog(LogLevel::Error)) {
        std::ostringstream oss;
        oss << "HermiteInterpolator: duplicated abscissa " << x;
        log(LogLevel::Error, oss.str());
      }
      return Status::InvalidParameter;
    }
  }
  dimension_ = dim;

  for (std::size_t i = 0; i < derivatives.size(); ++i) {
    Eigen::VectorXd y = derivatives[i];
    if (i > 1) {
      y /= factorial(i);
    }

    // Update the bottom diagonal of the divided differences table. The last
    // i abscissae are copies of x, so every divisor below is non-zero.
    const std::size_t n = abscissae_.size();
    bottom_diagonal_.insert(bottom_diagonal_.begin() + static_cast<std::ptrdiff_t>(n - i), y);
    const Eigen::VectorXd* bottom0 = &bottom_diagonal_[n - i];
    for (std::size_t j = i; j < n; ++j) {
      Eigen::VectorXd& bottom1 = bottom_diagonal_[n - (j + 1)];
      const double inv = 1.0 / (x - abscissae_[n - (j + 1)]);
      bottom1 = inv * (*bottom0 - bottom1);
      bottom0 = &bottom1;
    }

    // Update the top diagonal (Newton coefficients).
    top_diagonal_.push_back(*bottom0);
    abscissae_.push_back(x);
  }

  return Status::Success;
}

Status HermiteInterpolator::addSamplePoint(double x, const Eigen::VectorXd& value) {
  return addSamplePoint(x, std::vector<Eigen::VectorXd>{value});
}

Status HermiteInterpolator::addSamplePoint(double x, const Eigen::VectorXd& value,
                                           const Eigen::VectorXd& first) {
  return addSamplePoint(x, std::vector<Eigen::VectorXd>{value, first});
}

Status HermiteInterpolator::addSamplePoint(double x, const Eigen::VectorXd& value,
                                           const Eigen::VectorXd& first,
                                           const Eigen::VectorXd& second) {
  return addSamplePoint(x, std::vector<Eigen::VectorXd>{value, first, second});
}

Status HermiteInterpolator::evaluate(double x, Evaluation* out) const {
  if (!out) {
    log(LogLevel::Error, "HermiteInterpolator::evaluate: null output");
    return Status::InvalidParameter;
  }
  if (abscissae_.empty()) {
    log(LogLevel::Error, "HermiteInterpolator::evaluate: no sample points");
    return Status::InsufficientData;
  }
  if (!std::isfinite(x)) {
    log(LogLevel::Error, "HermiteInterpolator::evaluate: abscissa is non-finite");
    return Status::InvalidParameter;
  }

  out->value = Eigen::VectorXd::Zero(dimension_);
  out->first = Eigen::VectorXd::Zero(dimension_);
  out->second = Eigen::VectorXd::Zero(dimension_);

  // Newton form p(x) = sum_i top[i] * prod_{j<i} (x - a_j), with the product
  // and its two derivatives carried along.
  double c = 1.0;
  double c1 = 0.0;
  double c2 = 0.0;
  for (std::size_t i = 0; i < top_diagonal_.size(); ++i) {
    const Eigen::VectorXd& dd = top_diagonal_[i];
    out->value += c * dd;
    out->first += c1 * dd;
    out->second += c2 * dd;

    const double dx = x - abscissae_[i];
    c2 = c2 * dx + 2.0 * c1;
    c1 = c1 * dx + c;
    c = c * dx;
  }

  return Status::Success;
}

void HermiteInterpolator::clear() {
  dimension_ = 0;
  abscissae_.clear();
  top_diagonal_.clear();
  bottom_diagonal_.clear();
}

}  // namespace attitude::core
