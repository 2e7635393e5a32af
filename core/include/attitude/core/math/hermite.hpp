#pragma once
#include "attitude/core/export.hpp"
#include "attitude/core/common/status.hpp"

#include <Eigen/Core>

#include <vector>

namespace attitude::core {

// Vector-valued Hermite polynomial interpolator (Newton divided differences).
//
// Each sample point provides the value at an abscissa and, optionally, its
// first and second derivatives there. The resulting polynomial matches every
// provided value/derivative; its degree is (total number of constraints - 1).
//
// Points are added incrementally: the top and bottom diagonals of the divided
// difference table are updated in place so that adding a constraint costs
// O(n) per component.
class ATTITUDE_CORE_API HermiteInterpolator {
public:
  // Value and derivatives of the polynomial at one abscissa.
  struct Evaluation {
    Eigen::VectorXd value;
    Eigen::VectorXd first;
    Eigen::VectorXd second;
  };

  HermiteInterpolator() = default;

  // `derivatives[k]` is the k-th derivative at `x` (`derivatives[0]` is the value).
  // All vectors must have the same dimension (fixed by the first point added)
  // and `x` must differ from every abscissa already added.
  Status addSamplePoint(double x, const std::vector<Eigen::VectorXd>& derivatives);

  Status addSamplePoint(double x, const Eigen::VectorXd& value);
  Status addSamplePoint(double x, const Eigen::VectorXd& value,
                        const Eigen::VectorXd& first);
  Status addSamplePoint(double x, const Eigen::VectorXd& value,
                        const Eigen::VectorXd& first,
                        const Eigen::VectorXd& second);

  // Value, first and second derivative of the polynomial at `x`.
  Status evaluate(double x, Evaluation* out) const;

  int dimension() const { return dimension_; }
  std::size_t constraints() const { return abscissae_.size(); }
  bool empty() const { return abscissae_.empty(); }

  void clear();

private:
  int dimension_{0};
  std::vector<double> abscissae_;  // repeated once per constraint
  std::vector<Eigen::VectorXd> top_diagonal_;
  std::vector<Eigen::VectorXd> bottom_diagonal_;
};

}  // namespace attitude::core
