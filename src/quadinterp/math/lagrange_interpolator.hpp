#pragma once

#include <Eigen/Dense>

#include "quadinterp/sample_set.hpp"

namespace quadinterp {
namespace math {

/**
 * @brief Polynomial interpolant of degree N-1 through all N samples
 *
 * Evaluated with the second (true) barycentric formula,
 * see J-P. Berrut and L.N. Trefethen, Barycentric Lagrange interpolation,
 * SIAM Review 46(3):501-517, 2004.
 *
 *   p(t) = sum_i w_i y_i / (t - x_i)  /  sum_i w_i / (t - x_i)
 *   w_i  = 1 / prod_{j != i} (x_i - x_j)
 */
class LagrangeInterpolator {
 public:
  explicit LagrangeInterpolator(const SampleSet& samples);

  /**
   * @brief Value of the polynomial at t; returns y_i exactly at a node
   */
  double interpolate(double t) const;

  /**
   * @brief First derivative of the polynomial at t
   */
  double derivative(double t) const;

  const Eigen::VectorXd& getWeights() const { return weights_; }

 private:
  // index of the node within max(10*eps*|t|, DBL_MIN) of t, or -1
  Eigen::Index findNode(double t) const;

  Eigen::VectorXd x_;
  Eigen::VectorXd y_;
  Eigen::VectorXd weights_;
};

}  // namespace math
}  // namespace quadinterp
