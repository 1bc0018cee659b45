#pragma once

#include <array>

#include "quadinterp/sample_set.hpp"

namespace quadinterp {
namespace math {

/**
 * @brief Second-order Lagrange interpolant through exactly three samples
 *
 * f(t) = y0*L0(t) + y1*L1(t) + y2*L2(t), with
 * Li(t) = prod_{j != i} (t - xj) / (xi - xj).
 * Unlike LinearInterpolator there is no clamping: the parabola is evaluated
 * everywhere.
 */
class QuadraticInterpolator {
 public:
  /**
   * @param samples Sample set with exactly three points
   * @throws std::invalid_argument if samples.size() != 3
   */
  explicit QuadraticInterpolator(const SampleSet& samples);

  double interpolate(double t) const;

  /**
   * @brief Lagrange basis polynomial Li evaluated at t
   */
  double basis(int i, double t) const;

 private:
  std::array<double, 3> x_;
  std::array<double, 3> y_;
  // prod_{j != i} (xi - xj)
  std::array<double, 3> denom_;
};

}  // namespace math
}  // namespace quadinterp
