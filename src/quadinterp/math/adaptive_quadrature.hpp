#pragma once

#include <functional>
#include <utility>
#include <vector>

namespace quadinterp {
namespace math {

struct QuadratureOptions {
  // maximum number of interval bisections
  unsigned max_depth = 15;
  // relative tolerance on the estimate
  double tolerance = 1.49e-8;
};

struct QuadratureResult {
  double estimate = 0.;
  double error_estimate = 0.;

  std::pair<double, double> asPair() const {
    return std::make_pair(estimate, error_estimate);
  }
};

/**
 * @brief Adaptive Gauss-Kronrod (7/15 Gauss, 21 Kronrod point) quadrature
 *
 * Thin layer over boost::math::quadrature::gauss_kronrod. Each interval is
 * bisected until |Kronrod - Gauss| drops under tolerance * |estimate| or
 * max_depth is reached.
 *
 * Orientation: integrate(f, b, a) == -integrate(f, a, b), error estimate
 * unchanged. Equal bounds give {0, 0}. Infinite bounds are mapped onto a
 * finite interval by Boost.
 */
class AdaptiveQuadrature {
 public:
  explicit AdaptiveQuadrature(const QuadratureOptions& options = QuadratureOptions());

  /**
   * @brief Estimates the integral of f from a to b
   * @throws std::invalid_argument if f is empty
   * @throws std::domain_error if a bound is NaN or the estimate is not finite
   */
  QuadratureResult integrate(const std::function<double(double)>& f, double a,
                             double b) const;

  /**
   * @brief Same as integrate(f, a, b) but splits the interval at breakpoints
   *
   * Points outside the open interval between a and b are ignored. Used to
   * put the kinks of a piecewise integrand on piece boundaries.
   */
  QuadratureResult integrate(const std::function<double(double)>& f, double a,
                             double b, std::vector<double> breakpoints) const;

 private:
  QuadratureResult integratePiece(const std::function<double(double)>& f,
                                  double a, double b) const;

  QuadratureOptions options_;
};

}  // namespace math
}  // namespace quadinterp
