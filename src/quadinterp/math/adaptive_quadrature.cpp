#include "quadinterp/math/adaptive_quadrature.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include <boost/math/quadrature/gauss_kronrod.hpp>

namespace quadinterp {
namespace math {

AdaptiveQuadrature::AdaptiveQuadrature(const QuadratureOptions& options)
    : options_(options) {
  if (!(options_.tolerance > 0.)) {
    throw std::invalid_argument("quadrature tolerance must be positive got " +
                                std::to_string(options_.tolerance));
  }
}

QuadratureResult AdaptiveQuadrature::integratePiece(
    const std::function<double(double)>& f, double a, double b) const {
  QuadratureResult result;
  double error = 0.;
  result.estimate = boost::math::quadrature::gauss_kronrod<double, 21>::integrate(
      f, a, b, options_.max_depth, options_.tolerance, &error);
  result.error_estimate = std::fabs(error);

  if (!std::isfinite(result.estimate)) {
    throw std::domain_error("quadrature estimate is not finite on [" +
                            std::to_string(a) + ", " + std::to_string(b) + "]");
  }
  return result;
}

QuadratureResult AdaptiveQuadrature::integrate(const std::function<double(double)>& f,
                                               double a, double b) const {
  if (!f) {
    throw std::invalid_argument("quadrature needs a callable integrand");
  }
  if (std::isnan(a) || std::isnan(b)) {
    throw std::domain_error("quadrature bounds must not be NaN");
  }
  if (a == b) {
    return QuadratureResult();
  }
  return integratePiece(f, a, b);
}

QuadratureResult AdaptiveQuadrature::integrate(const std::function<double(double)>& f,
                                               double a, double b,
                                               std::vector<double> breakpoints) const {
  if (!f) {
    throw std::invalid_argument("quadrature needs a callable integrand");
  }
  if (std::isnan(a) || std::isnan(b)) {
    throw std::domain_error("quadrature bounds must not be NaN");
  }
  if (a == b) {
    return QuadratureResult();
  }

  double sign = 1.;
  if (b < a) {
    std::swap(a, b);
    sign = -1.;
  }

  // keep the sorted, distinct points strictly inside (a, b)
  breakpoints.erase(std::remove_if(breakpoints.begin(), breakpoints.end(),
                                   [a, b](double p) { return !(p > a && p < b); }),
                    breakpoints.end());
  std::sort(breakpoints.begin(), breakpoints.end());
  breakpoints.erase(std::unique(breakpoints.begin(), breakpoints.end()),
                    breakpoints.end());

  QuadratureResult total;
  double lo = a;
  for (double p : breakpoints) {
    QuadratureResult piece = integratePiece(f, lo, p);
    total.estimate += piece.estimate;
    total.error_estimate += piece.error_estimate;
    lo = p;
  }
  QuadratureResult last = integratePiece(f, lo, b);
  total.estimate += last.estimate;
  total.error_estimate += last.error_estimate;

  total.estimate *= sign;
  return total;
}

}  // namespace math
}  // namespace quadinterp
